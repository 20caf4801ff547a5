#pragma once

#include <migration/serialization/ITypeSerializer.hpp>
#include <memory>
#include <stdexcept>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>

/**
 * @brief Сериализатор, которым были записаны данные
 * @tparam T Тип значения
 *
 * Три взаимоисключающих состояния:
 * - Real — настоящий предыдущий сериализатор, гарантированно читает свои данные
 * - Placeholder — заглушка, которая занимает место типа, но ничего не читает
 * - Absent — сериализатор не восстановлен вовсе
 *
 * Заглушку нельзя использовать как конвертер: попытка чтения
 * приведёт к ошибке или повреждению данных.
 */
template<typename T>
class PrecedingSerializer {
public:
    using SerializerPtr = std::shared_ptr<ITypeSerializer<T>>;

    struct Real {
        SerializerPtr serializer;
    };
    struct Placeholder {};
    struct Absent {};

    using State = std::variant<Real, Placeholder, Absent>;

    /**
     * @throws std::invalid_argument если serializer == nullptr
     */
    static PrecedingSerializer real(SerializerPtr serializer) {
        if (!serializer) {
            throw std::invalid_argument("Real preceding serializer cannot be null");
        }
        return PrecedingSerializer(Real{std::move(serializer)});
    }

    static PrecedingSerializer placeholder() {
        return PrecedingSerializer(Placeholder{});
    }

    static PrecedingSerializer absent() {
        return PrecedingSerializer(Absent{});
    }

    /**
     * @brief Классифицировать восстановленный сериализатор
     * @param serializer Восстановленный экземпляр (может быть nullptr)
     * @param placeholderTag Точный тип заглушки
     *
     * Сравнение по точному динамическому типу: наследник типа
     * заглушки считается настоящим сериализатором.
     */
    static PrecedingSerializer classify(SerializerPtr serializer,
                                        std::type_index placeholderTag) {
        if (!serializer) {
            return absent();
        }
        const ITypeSerializer<T>& instance = *serializer;
        if (std::type_index(typeid(instance)) == placeholderTag) {
            return placeholder();
        }
        return real(std::move(serializer));
    }

    bool isReal() const { return std::holds_alternative<Real>(state_); }
    bool isPlaceholder() const { return std::holds_alternative<Placeholder>(state_); }
    bool isAbsent() const { return std::holds_alternative<Absent>(state_); }

    /**
     * @return Настоящий сериализатор или nullptr для Placeholder/Absent
     */
    SerializerPtr serializer() const {
        if (auto realState = std::get_if<Real>(&state_)) {
            return realState->serializer;
        }
        return nullptr;
    }

    const State& state() const { return state_; }

private:
    explicit PrecedingSerializer(State state)
        : state_(std::move(state))
    {}

    State state_;
};
