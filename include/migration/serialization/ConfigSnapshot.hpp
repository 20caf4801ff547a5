#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <utility>

/**
 * @brief Снимок конфигурации сериализатора
 *
 * Описывает, как данные были записаны: какой сериализатор,
 * какая версия формата и его параметры. Сохраняется рядом с данными
 * и читается при восстановлении состояния.
 *
 * Для резолвера снимок непрозрачен — интерпретирует его только
 * сам сериализатор в ensureCompatibility().
 */
class ConfigSnapshot {
public:
    ConfigSnapshot() = default;

    /**
     * @brief Конструктор
     * @param serializerId Идентификатор сериализатора (например, "binary-value")
     * @param version Версия формата данных
     * @param parameters Параметры сериализатора (произвольные байты)
     */
    ConfigSnapshot(std::string serializerId,
                   uint32_t version,
                   std::vector<uint8_t> parameters = {})
        : serializerId_(std::move(serializerId))
        , version_(version)
        , parameters_(std::move(parameters))
    {}

    const std::string& serializerId() const { return serializerId_; }
    uint32_t version() const { return version_; }
    const std::vector<uint8_t>& parameters() const { return parameters_; }

    bool operator==(const ConfigSnapshot& other) const {
        return serializerId_ == other.serializerId_ &&
               version_ == other.version_ &&
               parameters_ == other.parameters_;
    }

    bool operator!=(const ConfigSnapshot& other) const {
        return !(*this == other);
    }

private:
    std::string serializerId_;
    uint32_t version_ = 0;
    std::vector<uint8_t> parameters_;
};
