#pragma once

#include <migration/serialization/ConfigSnapshot.hpp>
#include <optional>
#include <string>

/**
 * @brief Интерфейс хранилища снимков конфигурации
 *
 * Хранит, каким сериализатором было записано каждое состояние.
 * При восстановлении find() возвращает снимок для резолвера;
 * std::nullopt означает, что снимок никогда не сохранялся.
 *
 * Реализации:
 * - FileConfigSnapshotStore — полный дамп таблицы в файл
 */
class IConfigSnapshotStore {
public:
    virtual ~IConfigSnapshotStore() = default;

    /**
     * @brief Загрузить все снимки
     * @throws std::runtime_error при ошибке чтения
     */
    virtual void load() = 0;

    /**
     * @brief Запомнить снимок состояния (заменяет прежний)
     */
    virtual void put(const std::string& stateName, const ConfigSnapshot& snapshot) = 0;

    /**
     * @brief Найти снимок состояния
     */
    virtual std::optional<ConfigSnapshot> find(const std::string& stateName) const = 0;

    /**
     * @return true если снимок был удалён
     */
    virtual bool remove(const std::string& stateName) = 0;

    /**
     * @brief Принудительно сбросить изменения на диск
     * @throws std::runtime_error при ошибке записи
     */
    virtual void flush() = 0;

    virtual bool exists() const = 0;
};
