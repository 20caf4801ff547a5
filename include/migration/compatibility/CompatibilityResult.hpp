#pragma once

#include <migration/serialization/ITypeSerializer.hpp>
#include <memory>
#include <utility>

/**
 * @brief Результат проверки совместимости сериализаторов
 * @tparam T Тип значения
 *
 * Два варианта:
 * - compatible() — новый сериализатор читает старые данные как есть
 * - migrationRequired(converter) — нужна миграция; converter (может
 *   отсутствовать) умеет читать данные в старом формате
 */
template<typename T>
class CompatibilityResult {
public:
    using SerializerPtr = std::shared_ptr<ITypeSerializer<T>>;

    static CompatibilityResult compatible() {
        return CompatibilityResult(false, nullptr);
    }

    static CompatibilityResult migrationRequired(SerializerPtr converter = nullptr) {
        return CompatibilityResult(true, std::move(converter));
    }

    bool requiresMigration() const { return requiresMigration_; }

    /**
     * @brief Сериализатор для чтения данных в старом формате
     * @return nullptr если конвертер не предоставлен
     */
    const SerializerPtr& convertDeserializer() const { return convertDeserializer_; }

    bool hasConvertDeserializer() const { return convertDeserializer_ != nullptr; }

private:
    CompatibilityResult(bool requiresMigration, SerializerPtr converter)
        : requiresMigration_(requiresMigration)
        , convertDeserializer_(std::move(converter))
    {}

    bool requiresMigration_;
    SerializerPtr convertDeserializer_;
};
