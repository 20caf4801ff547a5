#pragma once

#include <migration/compatibility/CompatibilityResult.hpp>
#include <migration/serialization/ITypeSerializer.hpp>
#include <stdexcept>
#include <utility>

/**
 * @brief Заглушка вместо предыдущего сериализатора
 * @tparam T Тип значения
 *
 * Создаётся, когда настоящий сериализатор не удалось восстановить
 * (например, его класс больше не существует), но место в метаданных
 * состояния нужно чем-то заполнить. Помнит снимок, который заменяет.
 *
 * Читать и писать данные не умеет: любая попытка — std::logic_error.
 * Резолвер отличает её по точному типу через typeid(PlaceholderSerializer<T>).
 */
template<typename T>
class PlaceholderSerializer : public ITypeSerializer<T> {
public:
    explicit PlaceholderSerializer(ConfigSnapshot snapshot = ConfigSnapshot())
        : snapshot_(std::move(snapshot))
    {}

    std::vector<uint8_t> serialize(const T& value) override {
        (void)value;
        throw std::logic_error("Placeholder serializer cannot serialize data");
    }

    bool deserialize(const std::vector<uint8_t>& data, T& value) override {
        (void)data; (void)value;
        throw std::logic_error("Placeholder serializer cannot deserialize data");
    }

    ConfigSnapshot snapshotConfiguration() const override {
        return snapshot_;
    }

    CompatibilityResult<T> ensureCompatibility(const ConfigSnapshot& snapshot) override {
        (void)snapshot;
        return CompatibilityResult<T>::migrationRequired();
    }

private:
    ConfigSnapshot snapshot_;
};
