#include <migration/compatibility/CompatibilityResolver.hpp>
#include <migration/listeners/StatsResolutionListener.hpp>
#include <migration/listeners/LoggingResolutionListener.hpp>
#include <migration/serialization/BinaryValueSerializer.hpp>
#include <migration/serialization/PlaceholderSerializer.hpp>

#include <iostream>
#include <sstream>
#include <chrono>
#include <vector>
#include <string>
#include <iomanip>

/**
 * @brief Бенчмарк разрешения совместимости
 *
 * Измеряем:
 * - Throughput resolve() для каждой ветки решения (ops/sec)
 * - Цену проверки заглушки по типу
 * - Влияние слушателей на производительность
 */

// ==================== Утилиты ====================

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return duration.count();
}

void printResult(const std::string& name, double timeMs, size_t operations) {
    double opsPerSec = (operations / timeMs) * 1000.0;
    std::cout << std::left << std::setw(45) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << timeMs << " ms"
              << std::setw(15) << std::fixed << std::setprecision(0)
              << opsPerSec << " ops/sec\n";
}

using SerializerPtr = std::shared_ptr<ITypeSerializer<int64_t>>;

// ==================== Ветки решения ====================

void benchmarkBranch(const std::string& name,
                     const PrecedingSerializer<int64_t>& preceding,
                     const std::optional<ConfigSnapshot>& snapshot,
                     const SerializerPtr& newSerializer,
                     size_t numOperations) {
    size_t migrations = 0;

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            auto resolution = resolveCompatibilityResult(preceding, snapshot, newSerializer);
            if (resolution && resolution.value().requiresMigration()) {
                ++migrations;
            }
        }
    });

    printResult(name, timeMs, numOperations);
    std::cout << "   Migrations: " << migrations << "\n";
}

void benchmarkPlaceholderCheck(size_t numOperations) {
    SerializerPtr newSerializer = std::make_shared<BinaryValueSerializer<int64_t>>(2);
    SerializerPtr placeholder = std::make_shared<PlaceholderSerializer<int64_t>>();
    auto snapshot = BinaryValueSerializer<int64_t>(1).snapshotConfiguration();

    size_t failures = 0;

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            auto resolution = resolveCompatibilityResult<int64_t>(
                placeholder, typeid(PlaceholderSerializer<int64_t>), snapshot, newSerializer);
            if (!resolution) {
                ++failures;
            }
        }
    });

    printResult("Placeholder via type tag", timeMs, numOperations);
    std::cout << "   Failures: " << failures << "\n";
}

// ==================== Слушатели ====================

void benchmarkListenerOverhead(size_t numOperations) {
    std::cout << "\n--- Listener overhead ---\n";

    SerializerPtr newSerializer = std::make_shared<BinaryValueSerializer<int64_t>>(2);
    SerializerPtr oldSerializer = std::make_shared<BinaryValueSerializer<int64_t>>(1);
    auto preceding = PrecedingSerializer<int64_t>::real(oldSerializer);
    auto snapshot = oldSerializer->snapshotConfiguration();

    {
        CompatibilityResolver<int64_t> resolver;
        double timeMs = measureMs([&]() {
            for (size_t i = 0; i < numOperations; ++i) {
                (void)resolver.resolve("state", preceding, snapshot, newSerializer);
            }
        });
        printResult("No listeners", timeMs, numOperations);
    }

    {
        CompatibilityResolver<int64_t> resolver;
        resolver.addListener(std::make_shared<StatsResolutionListener<int64_t>>());
        double timeMs = measureMs([&]() {
            for (size_t i = 0; i < numOperations; ++i) {
                (void)resolver.resolve("state", preceding, snapshot, newSerializer);
            }
        });
        printResult("StatsResolutionListener", timeMs, numOperations);
    }

    {
        std::ostringstream sink;
        CompatibilityResolver<int64_t> resolver;
        resolver.addListener(std::make_shared<LoggingResolutionListener<int64_t>>("bench", sink));
        double timeMs = measureMs([&]() {
            for (size_t i = 0; i < numOperations; ++i) {
                (void)resolver.resolve("state", preceding, snapshot, newSerializer);
            }
        });
        printResult("LoggingResolutionListener (ostringstream)", timeMs, numOperations);
    }
}

int main() {
    const size_t NUM_OPS = 1000000;

    SerializerPtr newSerializer = std::make_shared<BinaryValueSerializer<int64_t>>(2);
    SerializerPtr oldSerializer = std::make_shared<BinaryValueSerializer<int64_t>>(1);
    auto currentSnapshot = newSerializer->snapshotConfiguration();
    auto oldSnapshot = oldSerializer->snapshotConfiguration();

    std::cout << "=== Resolution Benchmark ===\n";
    std::cout << "Operations: " << NUM_OPS << "\n\n";

    std::cout << "--- Decision branches ---\n";
    benchmarkBranch("No snapshot",
                    PrecedingSerializer<int64_t>::absent(), std::nullopt,
                    newSerializer, NUM_OPS);
    benchmarkBranch("Compatible snapshot",
                    PrecedingSerializer<int64_t>::absent(), currentSnapshot,
                    newSerializer, NUM_OPS);
    benchmarkBranch("Migration via preceding serializer",
                    PrecedingSerializer<int64_t>::real(oldSerializer), oldSnapshot,
                    newSerializer, NUM_OPS);
    benchmarkBranch("Migration via self-supplied converter",
                    PrecedingSerializer<int64_t>::placeholder(), oldSnapshot,
                    newSerializer, NUM_OPS);
    benchmarkPlaceholderCheck(NUM_OPS);

    benchmarkListenerOverhead(NUM_OPS / 2);

    std::cout << "\n=== Benchmark complete ===\n";

    return 0;
}
