#pragma once

#include <migration/serialization/ITypeSerializer.hpp>
#include <memory>
#include <string>


/**
 * @brief Интерфейс слушателя решений о совместимости
 * @tparam T Тип значения
 */
template<typename T>
class IResolutionListener {
public:
    virtual ~IResolutionListener() = default;

    virtual void onCompatible(const std::string& stateName) { (void)stateName; }
    virtual void onMigrationRequired(const std::string& stateName,
                                     const std::shared_ptr<ITypeSerializer<T>>& converter,
                                     bool viaPrecedingSerializer) {
        (void)stateName; (void)converter; (void)viaPrecedingSerializer;
    }
    virtual void onMigrationUnavailable(const std::string& stateName,
                                        const std::string& message) {
        (void)stateName; (void)message;
    }
};
