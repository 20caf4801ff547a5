#pragma once

#include <migration/compatibility/CompatibilityResult.hpp>
#include <migration/serialization/ITypeSerializer.hpp>
#include <cstring>
#include <memory>
#include <string>
#include <type_traits>
#include <stdexcept>

/**
 * @brief Бинарный сериализатор значений с версией формата
 * @tparam T Тип значения (арифметический или std::string)
 *
 * Форматы:
 * - версия 1: [N байт: данные]
 * - версия 2: [4 байта: размер][N байт: данные]
 *
 * Данные арифметических типов копируются через memcpy,
 * std::string — побайтно. Целые поля заголовка — little-endian.
 *
 * Снимок конфигурации: id "binary-value", версия формата,
 * параметр — sizeof(T) для арифметических типов (пусто для строк).
 */
template<typename T>
class BinaryValueSerializer : public ITypeSerializer<T> {
    static_assert(std::is_arithmetic<T>::value || std::is_same<T, std::string>::value,
                  "BinaryValueSerializer supports arithmetic types and std::string");

public:
    static constexpr const char* ID = "binary-value";
    static constexpr uint32_t MIN_VERSION = 1;
    static constexpr uint32_t CURRENT_VERSION = 2;

    /**
     * @brief Конструктор
     * @param version Версия формата (MIN_VERSION..CURRENT_VERSION)
     * @throws std::invalid_argument при неподдерживаемой версии
     */
    explicit BinaryValueSerializer(uint32_t version = CURRENT_VERSION)
        : version_(version)
    {
        if (!isSupportedVersion(version_)) {
            throw std::invalid_argument("Unsupported binary-value format version: " +
                                        std::to_string(version_));
        }
    }

    static bool isSupportedVersion(uint32_t version) {
        return version >= MIN_VERSION && version <= CURRENT_VERSION;
    }

    uint32_t version() const { return version_; }

    std::vector<uint8_t> serialize(const T& value) override {
        auto payload = serializeValue(value);
        if (version_ == 1) {
            return payload;
        }

        std::vector<uint8_t> result;
        result.reserve(payload.size() + 4);
        appendUint32(result, static_cast<uint32_t>(payload.size()));
        result.insert(result.end(), payload.begin(), payload.end());
        return result;
    }

    bool deserialize(const std::vector<uint8_t>& data, T& value) override {
        if (version_ == 1) {
            return deserializeValue(data, value);
        }

        if (data.size() < 4) {
            return false;
        }
        uint32_t size = readUint32(data, 0);
        if (data.size() - 4 != size) {
            return false;
        }
        std::vector<uint8_t> payload(data.begin() + 4, data.end());
        return deserializeValue(payload, value);
    }

    ConfigSnapshot snapshotConfiguration() const override {
        std::vector<uint8_t> parameters;
        if (std::is_arithmetic<T>::value) {
            appendUint32(parameters, static_cast<uint32_t>(sizeof(T)));
        }
        return ConfigSnapshot(ID, version_, std::move(parameters));
    }

    /**
     * @brief Сопоставить со снимком
     *
     * - чужой сериализатор или другой размер значения — миграция без конвертера
     * - та же версия — совместим
     * - другая известная версия — миграция, конвертер читает старую версию
     * - неизвестная версия — миграция без конвертера
     */
    CompatibilityResult<T> ensureCompatibility(const ConfigSnapshot& snapshot) override {
        if (snapshot.serializerId() != ID ||
            snapshot.parameters() != snapshotConfiguration().parameters()) {
            return CompatibilityResult<T>::migrationRequired();
        }

        if (snapshot.version() == version_) {
            return CompatibilityResult<T>::compatible();
        }

        if (isSupportedVersion(snapshot.version())) {
            return CompatibilityResult<T>::migrationRequired(
                std::make_shared<BinaryValueSerializer<T>>(snapshot.version()));
        }

        return CompatibilityResult<T>::migrationRequired();
    }

private:
    // ==================== Утилиты ====================

    static void appendUint32(std::vector<uint8_t>& data, uint32_t value) {
        data.push_back(static_cast<uint8_t>(value & 0xFF));
        data.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        data.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
        data.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    }

    static uint32_t readUint32(const std::vector<uint8_t>& data, size_t offset) {
        return static_cast<uint32_t>(data[offset]) |
               (static_cast<uint32_t>(data[offset + 1]) << 8) |
               (static_cast<uint32_t>(data[offset + 2]) << 16) |
               (static_cast<uint32_t>(data[offset + 3]) << 24);
    }

    // ==================== Сериализация типов ====================

    template<typename U = T>
    static typename std::enable_if<std::is_arithmetic<U>::value, std::vector<uint8_t>>::type
    serializeValue(const U& value) {
        std::vector<uint8_t> result(sizeof(U));
        std::memcpy(result.data(), &value, sizeof(U));
        return result;
    }

    static std::vector<uint8_t> serializeValue(const std::string& value) {
        return std::vector<uint8_t>(value.begin(), value.end());
    }

    template<typename U = T>
    static typename std::enable_if<std::is_arithmetic<U>::value, bool>::type
    deserializeValue(const std::vector<uint8_t>& data, U& value) {
        if (data.size() != sizeof(U)) {
            return false;
        }
        std::memcpy(&value, data.data(), sizeof(U));
        return true;
    }

    static bool deserializeValue(const std::vector<uint8_t>& data, std::string& value) {
        value = std::string(data.begin(), data.end());
        return true;
    }

    uint32_t version_;
};
