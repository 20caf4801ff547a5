#pragma once

#include <migration/listeners/IResolutionListener.hpp>
#include <cstdint>
#include <atomic>

/**
 * @brief Слушатель для сбора статистики решений
 * @tparam T Тип значения
 *
 * Собирает:
 * - compatible — сколько состояний читается без миграции
 * - migrations / migrationsViaPreceding — сколько требуют миграции
 *   и в скольких конвертером стал предыдущий сериализатор
 * - unavailable — сколько восстановлений невозможно
 *
 * Примечание: счётчики atomic для потокобезопасности.
 */
template<typename T>
class StatsResolutionListener : public IResolutionListener<T> {
public:
    void onCompatible(const std::string& stateName) override {
        (void)stateName;
        ++compatible_;
    }

    void onMigrationRequired(const std::string& stateName,
                             const std::shared_ptr<ITypeSerializer<T>>& converter,
                             bool viaPrecedingSerializer) override {
        (void)stateName; (void)converter;
        ++migrations_;
        if (viaPrecedingSerializer) {
            ++migrationsViaPreceding_;
        }
    }

    void onMigrationUnavailable(const std::string& stateName,
                                const std::string& message) override {
        (void)stateName; (void)message;
        ++unavailable_;
    }

    // ==================== Геттеры ====================

    uint64_t compatible() const { return compatible_; }
    uint64_t migrations() const { return migrations_; }
    uint64_t migrationsViaPreceding() const { return migrationsViaPreceding_; }
    uint64_t unavailable() const { return unavailable_; }

    uint64_t total() const {
        return compatible_ + migrations_ + unavailable_;
    }

    /**
     * @brief Доля решений, потребовавших миграции (0.0 - 1.0)
     */
    double migrationRate() const {
        uint64_t all = total();
        return all > 0 ? static_cast<double>(migrations_) / all : 0.0;
    }

    void reset() {
        compatible_ = 0;
        migrations_ = 0;
        migrationsViaPreceding_ = 0;
        unavailable_ = 0;
    }

private:
    std::atomic<uint64_t> compatible_{0};
    std::atomic<uint64_t> migrations_{0};
    std::atomic<uint64_t> migrationsViaPreceding_{0};
    std::atomic<uint64_t> unavailable_{0};
};
