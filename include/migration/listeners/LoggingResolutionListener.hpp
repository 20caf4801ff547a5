#pragma once

#include "IResolutionListener.hpp"
#include <iostream>
#include <string>

/**
 * @brief Слушатель для логирования решений о совместимости
 * @tparam T Тип значения
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingResolutionListener<int>>("restore");
 *   resolver.addListener(logger);
 *
 * Формат строк:
 *   [restore] COMPATIBLE: counter
 *   [restore] MIGRATE: counter via preceding converter
 *   [restore] UNAVAILABLE: counter (State migration required, ...)
 */
template<typename T>
class LoggingResolutionListener : public IResolutionListener<T> {
public:
    /**
     * @brief Конструктор
     * @param prefix Префикс для всех сообщений (например, имя бэкенда)
     * @param os Поток вывода (по умолчанию std::cout)
     */
    explicit LoggingResolutionListener(const std::string& prefix = "Migration",
                                       std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onCompatible(const std::string& stateName) override {
        os_ << "[" << prefix_ << "] COMPATIBLE: " << stateName << "\n";
    }

    void onMigrationRequired(const std::string& stateName,
                             const std::shared_ptr<ITypeSerializer<T>>& converter,
                             bool viaPrecedingSerializer) override {
        (void)converter;
        os_ << "[" << prefix_ << "] MIGRATE: " << stateName << " via "
            << (viaPrecedingSerializer ? "preceding" : "self-supplied")
            << " converter\n";
    }

    void onMigrationUnavailable(const std::string& stateName,
                                const std::string& message) override {
        os_ << "[" << prefix_ << "] UNAVAILABLE: " << stateName
            << " (" << message << ")\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
};
