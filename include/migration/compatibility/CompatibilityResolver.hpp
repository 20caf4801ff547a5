#pragma once

#include <algorithm>
#include <migration/compatibility/CompatibilityResult.hpp>
#include <migration/compatibility/PrecedingSerializer.hpp>
#include <migration/compatibility/Resolution.hpp>
#include <migration/listeners/IResolutionListener.hpp>
#include <migration/serialization/ConfigSnapshot.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <vector>

/**
 * @brief Разрешить итоговую совместимость предыдущего и нового сериализаторов
 * @tparam T Тип значения
 * @param preceding Сериализатор, которым были записаны данные
 * @param precedingSnapshot Снимок конфигурации предыдущего сериализатора
 * @param newSerializer Новый сериализатор
 * @return Итоговый результат или ошибка MigrationUnavailable
 * @throws std::invalid_argument если newSerializer == nullptr
 *
 * Порядок принятия решения:
 * 1. Снимка нет — считаем новый сериализатор совместимым.
 *    Это допущение, а не доказательство: без описания старого формата
 *    утверждать несовместимость не на чем.
 * 2. Сопоставляем снимок с новым сериализатором.
 * 3. Совместим — возвращаем результат как есть.
 * 4. Нужна миграция:
 *    a. есть настоящий предыдущий сериализатор — он становится конвертером
 *       (даже если новый сериализатор предложил свой);
 *    b. иначе используем конвертер, предложенный новым сериализатором;
 *    c. иначе — MigrationUnavailable.
 *
 * Чистая функция: кроме вызова ensureCompatibility() побочных эффектов нет.
 */
template<typename T>
Resolution<T> resolveCompatibilityResult(
        const PrecedingSerializer<T>& preceding,
        const std::optional<ConfigSnapshot>& precedingSnapshot,
        const std::shared_ptr<ITypeSerializer<T>>& newSerializer) {
    if (!newSerializer) {
        throw std::invalid_argument("New serializer cannot be null");
    }

    if (!precedingSnapshot) {
        return Resolution<T>::success(CompatibilityResult<T>::compatible());
    }

    CompatibilityResult<T> initial = newSerializer->ensureCompatibility(*precedingSnapshot);

    if (!initial.requiresMigration()) {
        return Resolution<T>::success(std::move(initial));
    }

    if (preceding.isReal()) {
        return Resolution<T>::success(
            CompatibilityResult<T>::migrationRequired(preceding.serializer()));
    }

    if (initial.hasConvertDeserializer()) {
        return Resolution<T>::success(std::move(initial));
    }

    return Resolution<T>::failure(
        ResolutionErrorKind::MigrationUnavailable,
        "State migration required, but there is no available serializer "
        "capable of reading previous data.");
}

template<typename T>
bool isPlaceholderInstance(const ITypeSerializer<T>& serializer, std::type_index placeholderTag) {
    return std::type_index(typeid(serializer)) == placeholderTag;
}

/**
 * @brief Вариант с проверкой заглушки по типу
 * @param precedingSerializer Восстановленный сериализатор (может быть nullptr)
 * @param placeholderTag Точный тип заглушки, например typeid(PlaceholderSerializer<T>)
 *
 * Конвертер, предложенный новым сериализатором, тоже сверяется с тегом:
 * заглушка в этой роли считается отсутствующим конвертером.
 */
template<typename T>
Resolution<T> resolveCompatibilityResult(
        std::shared_ptr<ITypeSerializer<T>> precedingSerializer,
        std::type_index placeholderTag,
        const std::optional<ConfigSnapshot>& precedingSnapshot,
        const std::shared_ptr<ITypeSerializer<T>>& newSerializer) {
    auto preceding = PrecedingSerializer<T>::classify(std::move(precedingSerializer), placeholderTag);
    auto resolution = resolveCompatibilityResult(preceding, precedingSnapshot, newSerializer);

    if (resolution && !preceding.isReal()) {
        const auto& converter = resolution.value().convertDeserializer();
        if (converter && isPlaceholderInstance(*converter, placeholderTag)) {
            return Resolution<T>::failure(
                ResolutionErrorKind::MigrationUnavailable,
                "State migration required, but there is no available serializer "
                "capable of reading previous data.");
        }
    }

    return resolution;
}

/**
 * @brief Резолвер совместимости со слушателями
 * @tparam T Тип значения
 *
 * Обёртка над resolveCompatibilityResult(), которая сообщает слушателям
 * о каждом решении (логирование, статистика). Решение не хранит.
 *
 * Пример использования:
 * @code
 *   CompatibilityResolver<int> resolver;
 *   resolver.addListener(std::make_shared<LoggingResolutionListener<int>>("restore"));
 *
 *   auto resolution = resolver.resolve("counter", preceding, store.find("counter"), serializer);
 * @endcode
 *
 * @note Список слушателей не защищён mutex'ом: настраивайте его
 *       до того, как начнёте вызывать resolve() из нескольких потоков.
 */
template<typename T>
class CompatibilityResolver {
public:
    using SerializerPtr = std::shared_ptr<ITypeSerializer<T>>;

    Resolution<T> resolve(const std::string& stateName,
                          const PrecedingSerializer<T>& preceding,
                          const std::optional<ConfigSnapshot>& precedingSnapshot,
                          const SerializerPtr& newSerializer) const {
        auto resolution = resolveCompatibilityResult(preceding, precedingSnapshot, newSerializer);
        notify(stateName, preceding, resolution);
        return resolution;
    }

    Resolution<T> resolve(const std::string& stateName,
                          SerializerPtr precedingSerializer,
                          std::type_index placeholderTag,
                          const std::optional<ConfigSnapshot>& precedingSnapshot,
                          const SerializerPtr& newSerializer) const {
        auto preceding = PrecedingSerializer<T>::classify(precedingSerializer, placeholderTag);
        auto resolution = resolveCompatibilityResult(
            std::move(precedingSerializer), placeholderTag, precedingSnapshot, newSerializer);
        notify(stateName, preceding, resolution);
        return resolution;
    }

    // ==================== Управление слушателями ====================

    void addListener(std::shared_ptr<IResolutionListener<T>> listener) {
        if (listener) {
            listeners_.push_back(listener);
        }
    }

    void removeListener(std::shared_ptr<IResolutionListener<T>> listener) {
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), listener),
            listeners_.end()
        );
    }

private:
    void notify(const std::string& stateName,
                const PrecedingSerializer<T>& preceding,
                const Resolution<T>& resolution) const {
        if (listeners_.empty()) return;

        if (!resolution) {
            for (auto& listener : listeners_) {
                listener->onMigrationUnavailable(stateName, resolution.error().message);
            }
            return;
        }

        const auto& result = resolution.value();
        if (!result.requiresMigration()) {
            for (auto& listener : listeners_) {
                listener->onCompatible(stateName);
            }
            return;
        }

        bool viaPreceding = preceding.isReal() &&
                            result.convertDeserializer() == preceding.serializer();
        for (auto& listener : listeners_) {
            listener->onMigrationRequired(stateName, result.convertDeserializer(), viaPreceding);
        }
    }

    std::vector<std::shared_ptr<IResolutionListener<T>>> listeners_;
};
