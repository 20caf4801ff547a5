#pragma once

#include <migration/serialization/ConfigSnapshot.hpp>
#include <vector>
#include <cstdint>

template<typename T>
class CompatibilityResult;

/**
 * @brief Интерфейс сериализатора значений состояния
 * @tparam T Тип значения
 *
 * Отвечает за преобразование значений в байты и обратно,
 * а также умеет сам оценить, сможет ли он прочитать данные,
 * записанные по ранее сохранённому снимку конфигурации.
 *
 * Реализации:
 * - BinaryValueSerializer — бинарный формат с версиями
 * - PlaceholderSerializer — заглушка, ничего не читает
 */
template<typename T>
class ITypeSerializer {
public:
    virtual ~ITypeSerializer() = default;

    /**
     * @brief Сериализовать значение
     * @param value Значение
     * @return Байтовое представление
     */
    virtual std::vector<uint8_t> serialize(const T& value) = 0;

    /**
     * @brief Десериализовать значение
     * @param data Байтовое представление
     * @param[out] value Значение
     * @return true если десериализация успешна
     */
    virtual bool deserialize(const std::vector<uint8_t>& data, T& value) = 0;

    /**
     * @brief Снять снимок текущей конфигурации
     * @return Описание формата, которое сохраняется вместе с данными
     */
    virtual ConfigSnapshot snapshotConfiguration() const = 0;

    /**
     * @brief Сопоставить себя со снимком предыдущего сериализатора
     * @param snapshot Снимок конфигурации, с которой были записаны данные
     * @return Compatible или RequiresMigration (опционально с конвертером)
     *
     * Может читать внутреннюю конфигурацию сериализатора —
     * не модифицируйте сериализатор параллельно с вызовом.
     */
    virtual CompatibilityResult<T> ensureCompatibility(
        const ConfigSnapshot& snapshot) = 0;
};
