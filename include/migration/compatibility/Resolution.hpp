#pragma once

#include <migration/compatibility/CompatibilityResult.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

/**
 * @brief Виды ошибок разрешения совместимости
 */
enum class ResolutionErrorKind {
    /// Миграция нужна, но нет сериализатора, способного прочитать старые данные
    MigrationUnavailable
};

struct ResolutionError {
    ResolutionErrorKind kind;
    std::string message;
};

/**
 * @brief Исключение для вызывающего кода, работающего через exceptions
 *
 * Бросается из Resolution::value() / valueOrThrow() при ошибке.
 */
class MigrationUnavailableError : public std::runtime_error {
public:
    explicit MigrationUnavailableError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/**
 * @brief Итоговое решение резолвера
 * @tparam T Тип значения
 *
 * Либо CompatibilityResult, либо ResolutionError.
 * Вызывающий код обязан проверить результат перед использованием:
 * @code
 *   auto resolution = resolveCompatibilityResult(preceding, snapshot, serializer);
 *   if (!resolution) {
 *       // resolution.error().kind == ResolutionErrorKind::MigrationUnavailable
 *   }
 * @endcode
 *
 * Инвариант: успешный RequiresMigration всегда несёт конвертер.
 * Вариант resolveCompatibilityResult() с тегом заглушки дополнительно
 * гарантирует, что конвертер не является заглушкой.
 */
template<typename T>
class [[nodiscard]] Resolution {
public:
    static Resolution success(CompatibilityResult<T> result) {
        return Resolution(std::move(result));
    }

    static Resolution failure(ResolutionErrorKind kind, std::string message) {
        return Resolution(ResolutionError{kind, std::move(message)});
    }

    bool ok() const { return std::holds_alternative<CompatibilityResult<T>>(outcome_); }
    explicit operator bool() const { return ok(); }

    /**
     * @brief Получить результат совместимости
     * @throws MigrationUnavailableError если разрешение завершилось ошибкой
     */
    const CompatibilityResult<T>& value() const {
        if (!ok()) {
            throw MigrationUnavailableError(error().message);
        }
        return std::get<CompatibilityResult<T>>(outcome_);
    }

    /**
     * @brief Явный переход к exception-стилю
     */
    CompatibilityResult<T> valueOrThrow() const {
        return value();
    }

    /**
     * @throws std::logic_error если разрешение успешно
     */
    const ResolutionError& error() const {
        if (ok()) {
            throw std::logic_error("Resolution has no error");
        }
        return std::get<ResolutionError>(outcome_);
    }

private:
    explicit Resolution(CompatibilityResult<T> result)
        : outcome_(std::move(result))
    {}

    explicit Resolution(ResolutionError error)
        : outcome_(std::move(error))
    {}

    std::variant<CompatibilityResult<T>, ResolutionError> outcome_;
};
