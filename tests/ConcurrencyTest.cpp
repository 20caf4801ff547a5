#include <gtest/gtest.h>
#include <migration/compatibility/CompatibilityResolver.hpp>
#include <migration/listeners/StatsResolutionListener.hpp>
#include <migration/serialization/BinaryValueSerializer.hpp>
#include <migration/serialization/PlaceholderSerializer.hpp>
#include <thread>
#include <vector>
#include <atomic>

/**
 * @brief Тесты конкурентного разрешения совместимости
 *
 * Резолвер не хранит состояния: одни и те же сериализаторы
 * можно сопоставлять из нескольких потоков без синхронизации.
 */

TEST(ConcurrencyTest, ParallelResolveGivesSameDecisions) {
    const int numThreads = 8;
    const int iterationsPerThread = 2000;

    std::shared_ptr<ITypeSerializer<int>> newSerializer =
        std::make_shared<BinaryValueSerializer<int>>(2);
    std::shared_ptr<ITypeSerializer<int>> oldSerializer =
        std::make_shared<BinaryValueSerializer<int>>(1);

    const auto currentSnapshot = newSerializer->snapshotConfiguration();
    const auto oldSnapshot = oldSerializer->snapshotConfiguration();
    const ConfigSnapshot foreignSnapshot("kryo", 3);

    std::atomic<int> wrongDecisions{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < iterationsPerThread; ++i) {
                switch ((t + i) % 4) {
                    case 0: {
                        auto r = resolveCompatibilityResult<int>(
                            PrecedingSerializer<int>::absent(), currentSnapshot, newSerializer);
                        if (!r || r.value().requiresMigration()) ++wrongDecisions;
                        break;
                    }
                    case 1: {
                        auto r = resolveCompatibilityResult<int>(
                            PrecedingSerializer<int>::real(oldSerializer), oldSnapshot, newSerializer);
                        if (!r || r.value().convertDeserializer() != oldSerializer) ++wrongDecisions;
                        break;
                    }
                    case 2: {
                        auto r = resolveCompatibilityResult<int>(
                            PrecedingSerializer<int>::placeholder(), oldSnapshot, newSerializer);
                        if (!r || !r.value().hasConvertDeserializer()) ++wrongDecisions;
                        break;
                    }
                    default: {
                        auto r = resolveCompatibilityResult<int>(
                            PrecedingSerializer<int>::absent(), foreignSnapshot, newSerializer);
                        if (r) ++wrongDecisions;
                        break;
                    }
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(wrongDecisions.load(), 0);
}

TEST(ConcurrencyTest, SharedStatsListenerCountsAllDecisions) {
    const int numThreads = 4;
    const int iterationsPerThread = 1000;

    CompatibilityResolver<int> resolver;
    auto stats = std::make_shared<StatsResolutionListener<int>>();
    resolver.addListener(stats);

    std::shared_ptr<ITypeSerializer<int>> newSerializer =
        std::make_shared<BinaryValueSerializer<int>>(2);
    const auto oldSnapshot = BinaryValueSerializer<int>(1).snapshotConfiguration();

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < iterationsPerThread; ++i) {
                (void)resolver.resolve("state", std::make_shared<PlaceholderSerializer<int>>(),
                                       typeid(PlaceholderSerializer<int>),
                                       oldSnapshot, newSerializer);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(stats->total(), static_cast<uint64_t>(numThreads * iterationsPerThread));
    EXPECT_EQ(stats->migrations(), static_cast<uint64_t>(numThreads * iterationsPerThread));
    EXPECT_EQ(stats->migrationsViaPreceding(), 0u);
}
