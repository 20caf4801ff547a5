#include <migration/compatibility/CompatibilityResolver.hpp>
#include <migration/listeners/LoggingResolutionListener.hpp>
#include <migration/listeners/StatsResolutionListener.hpp>
#include <migration/persistence/FileConfigSnapshotStore.hpp>
#include <migration/serialization/BinaryValueSerializer.hpp>
#include <migration/serialization/PlaceholderSerializer.hpp>

#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Демонстрация восстановления состояния после смены формата
 *
 * Сценарии:
 * 1. Первый запуск — снимков ещё нет, всё совместимо
 * 2. Обновление формата — старый сериализатор восстановлен и читает свои данные
 * 3. Старый сериализатор потерян — конвертер предлагает новый сериализатор
 * 4. Чужой формат без конвертера — восстановление невозможно
 */

using Bytes = std::vector<uint8_t>;
using SerializerPtr = std::shared_ptr<ITypeSerializer<int64_t>>;

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

/**
 * @brief Хранилище значений состояний (в памяти, для демо)
 */
struct StateBackend {
    std::map<std::string, Bytes> values;
    FileConfigSnapshotStore snapshots;

    explicit StateBackend(const std::string& path)
        : snapshots(path, true)
    {}

    void write(const std::string& name, int64_t value, const SerializerPtr& serializer) {
        values[name] = serializer->serialize(value);
        snapshots.put(name, serializer->snapshotConfiguration());
    }
};

/**
 * @brief Восстановить состояние и, если нужно, мигрировать его
 */
void restore(StateBackend& backend,
             CompatibilityResolver<int64_t>& resolver,
             const std::string& name,
             SerializerPtr restoredPreceding,
             const SerializerPtr& newSerializer) {
    auto resolution = resolver.resolve(name,
                                       std::move(restoredPreceding),
                                       typeid(PlaceholderSerializer<int64_t>),
                                       backend.snapshots.find(name),
                                       newSerializer);
    if (!resolution) {
        std::cout << "  Restore of '" << name << "' aborted: "
                  << resolution.error().message << "\n";
        return;
    }

    const auto& result = resolution.value();
    auto& stored = backend.values[name];
    int64_t value = 0;

    if (result.requiresMigration()) {
        if (!result.convertDeserializer()->deserialize(stored, value)) {
            std::cout << "  Converter failed to read '" << name << "'\n";
            return;
        }
        backend.write(name, value, newSerializer);
        std::cout << "  Migrated '" << name << "' = " << value << "\n";
    } else if (newSerializer->deserialize(stored, value)) {
        std::cout << "  Read '" << name << "' = " << value << "\n";
    } else {
        // Снимка не было: допущение о совместимости не подтвердилось
        std::cout << "  '" << name << "' assumed compatible but unreadable\n";
    }
}

int main() {
    auto path = (std::filesystem::temp_directory_path() / "state_migration_demo.bin").string();
    std::filesystem::remove(path);

    StateBackend backend(path);
    CompatibilityResolver<int64_t> resolver;
    auto stats = std::make_shared<StatsResolutionListener<int64_t>>();
    resolver.addListener(std::make_shared<LoggingResolutionListener<int64_t>>("restore"));
    resolver.addListener(stats);

    SerializerPtr v1 = std::make_shared<BinaryValueSerializer<int64_t>>(1);
    SerializerPtr v2 = std::make_shared<BinaryValueSerializer<int64_t>>(2);

    printSeparator("Demo 1: First run");
    backend.values["fresh"] = v2->serialize(7);
    restore(backend, resolver, "fresh", nullptr, v2);

    printSeparator("Demo 2: Format upgrade, preceding serializer restored");
    backend.write("orders", 1500, v1);
    restore(backend, resolver, "orders", v1, v2);
    restore(backend, resolver, "orders", v2, v2);

    printSeparator("Demo 3: Preceding serializer lost");
    backend.write("positions", 42, v1);
    auto placeholder = std::make_shared<PlaceholderSerializer<int64_t>>(
        *backend.snapshots.find("positions"));
    restore(backend, resolver, "positions", placeholder, v2);

    printSeparator("Demo 4: Foreign format, nothing can read it");
    backend.values["legacy"] = Bytes{0xCA, 0xFE};
    backend.snapshots.put("legacy", ConfigSnapshot("kryo", 3));
    restore(backend, resolver, "legacy", nullptr, v2);

    std::cout << "\nDecisions: " << stats->total()
              << " (compatible: " << stats->compatible()
              << ", migrations: " << stats->migrations()
              << ", unavailable: " << stats->unavailable() << ")\n";

    std::filesystem::remove(path);
    return 0;
}
