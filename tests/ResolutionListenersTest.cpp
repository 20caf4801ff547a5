#include <gtest/gtest.h>
#include "migration/compatibility/CompatibilityResolver.hpp"
#include "migration/listeners/LoggingResolutionListener.hpp"
#include "migration/listeners/StatsResolutionListener.hpp"
#include "migration/serialization/PlaceholderSerializer.hpp"
#include "support/ScriptedSerializer.hpp"
#include <sstream>

/**
 * @brief Тесты для CompatibilityResolver и слушателей
 *
 * Проверяем:
 * - StatsResolutionListener корректно считает решения
 * - LoggingResolutionListener выводит сообщения
 * - Множественные слушатели работают вместе
 * - Удаление слушателей
 */

using SerializerPtr = std::shared_ptr<ITypeSerializer<int>>;

// ==================== Вспомогательные функции ====================

namespace {

const ConfigSnapshot kSnapshot("scripted", 1);

SerializerPtr makeCompatible() {
    return std::make_shared<ScriptedSerializer>(CompatibilityResult<int>::compatible());
}

SerializerPtr makeMigrating(SerializerPtr converter = nullptr) {
    return std::make_shared<ScriptedSerializer>(
        CompatibilityResult<int>::migrationRequired(std::move(converter)));
}

}  // namespace

// ==================== StatsResolutionListener ====================

TEST(StatsResolutionListenerTest, InitiallyZero) {
    StatsResolutionListener<int> stats;

    EXPECT_EQ(stats.compatible(), 0u);
    EXPECT_EQ(stats.migrations(), 0u);
    EXPECT_EQ(stats.migrationsViaPreceding(), 0u);
    EXPECT_EQ(stats.unavailable(), 0u);
    EXPECT_EQ(stats.total(), 0u);
    EXPECT_DOUBLE_EQ(stats.migrationRate(), 0.0);
}

TEST(StatsResolutionListenerTest, CountsEveryOutcome) {
    CompatibilityResolver<int> resolver;
    auto stats = std::make_shared<StatsResolutionListener<int>>();
    resolver.addListener(stats);

    auto preceding = PrecedingSerializer<int>::real(std::make_shared<ScriptedSerializer>());
    auto none = PrecedingSerializer<int>::absent();

    (void)resolver.resolve("a", none, std::nullopt, makeMigrating());
    (void)resolver.resolve("b", none, kSnapshot, makeCompatible());
    (void)resolver.resolve("c", preceding, kSnapshot, makeMigrating());
    (void)resolver.resolve("d", none, kSnapshot, makeMigrating(std::make_shared<ScriptedSerializer>()));
    (void)resolver.resolve("e", none, kSnapshot, makeMigrating());

    EXPECT_EQ(stats->compatible(), 2u);
    EXPECT_EQ(stats->migrations(), 2u);
    EXPECT_EQ(stats->migrationsViaPreceding(), 1u);
    EXPECT_EQ(stats->unavailable(), 1u);
    EXPECT_EQ(stats->total(), 5u);
    EXPECT_DOUBLE_EQ(stats->migrationRate(), 0.4);
}

TEST(StatsResolutionListenerTest, Reset) {
    CompatibilityResolver<int> resolver;
    auto stats = std::make_shared<StatsResolutionListener<int>>();
    resolver.addListener(stats);

    (void)resolver.resolve("a", PrecedingSerializer<int>::absent(), std::nullopt, makeCompatible());
    stats->reset();

    EXPECT_EQ(stats->total(), 0u);
}

// ==================== LoggingResolutionListener ====================

TEST(LoggingResolutionListenerTest, LogsCompatible) {
    std::ostringstream oss;
    CompatibilityResolver<int> resolver;
    resolver.addListener(std::make_shared<LoggingResolutionListener<int>>("Restore", oss));

    (void)resolver.resolve("counter", PrecedingSerializer<int>::absent(), std::nullopt, makeMigrating());

    EXPECT_EQ(oss.str(), "[Restore] COMPATIBLE: counter\n");
}

TEST(LoggingResolutionListenerTest, LogsPrecedingConverter) {
    std::ostringstream oss;
    CompatibilityResolver<int> resolver;
    resolver.addListener(std::make_shared<LoggingResolutionListener<int>>("Restore", oss));

    (void)resolver.resolve("counter",
                           PrecedingSerializer<int>::real(std::make_shared<ScriptedSerializer>()),
                           kSnapshot, makeMigrating());

    EXPECT_EQ(oss.str(), "[Restore] MIGRATE: counter via preceding converter\n");
}

TEST(LoggingResolutionListenerTest, LogsSelfSuppliedConverter) {
    std::ostringstream oss;
    CompatibilityResolver<int> resolver;
    resolver.addListener(std::make_shared<LoggingResolutionListener<int>>("Restore", oss));

    (void)resolver.resolve("counter", PrecedingSerializer<int>::placeholder(), kSnapshot,
                           makeMigrating(std::make_shared<ScriptedSerializer>()));

    EXPECT_EQ(oss.str(), "[Restore] MIGRATE: counter via self-supplied converter\n");
}

TEST(LoggingResolutionListenerTest, LogsUnavailable) {
    std::ostringstream oss;
    CompatibilityResolver<int> resolver;
    resolver.addListener(std::make_shared<LoggingResolutionListener<int>>("Restore", oss));

    auto resolution = resolver.resolve("counter", PrecedingSerializer<int>::absent(),
                                       kSnapshot, makeMigrating());

    EXPECT_FALSE(resolution);
    EXPECT_NE(oss.str().find("[Restore] UNAVAILABLE: counter ("), std::string::npos);
    EXPECT_NE(oss.str().find(resolution.error().message), std::string::npos);
}

// ==================== CompatibilityResolver ====================

TEST(CompatibilityResolverClassTest, SameDecisionAsFreeFunction) {
    CompatibilityResolver<int> resolver;
    SerializerPtr preceding = std::make_shared<ScriptedSerializer>();
    SerializerPtr converter = std::make_shared<ScriptedSerializer>();

    auto resolution = resolver.resolve("counter", PrecedingSerializer<int>::real(preceding),
                                       kSnapshot, makeMigrating(converter));

    ASSERT_TRUE(resolution);
    EXPECT_EQ(resolution.value().convertDeserializer(), preceding);
}

TEST(CompatibilityResolverClassTest, TagOverloadDetectsPlaceholder) {
    CompatibilityResolver<int> resolver;
    auto stats = std::make_shared<StatsResolutionListener<int>>();
    resolver.addListener(stats);

    auto resolution = resolver.resolve("counter",
                                       std::make_shared<PlaceholderSerializer<int>>(),
                                       typeid(PlaceholderSerializer<int>),
                                       kSnapshot, makeMigrating());

    EXPECT_FALSE(resolution);
    EXPECT_EQ(stats->unavailable(), 1u);
}

TEST(CompatibilityResolverClassTest, TagOverloadRejectsPlaceholderConverter) {
    CompatibilityResolver<int> resolver;
    auto stats = std::make_shared<StatsResolutionListener<int>>();
    resolver.addListener(stats);

    auto resolution = resolver.resolve("counter", nullptr,
                                       typeid(PlaceholderSerializer<int>), kSnapshot,
                                       makeMigrating(std::make_shared<PlaceholderSerializer<int>>()));

    EXPECT_FALSE(resolution);
    EXPECT_EQ(stats->unavailable(), 1u);
    EXPECT_EQ(stats->migrations(), 0u);
}

TEST(CompatibilityResolverClassTest, MultipleListeners) {
    std::ostringstream oss;
    CompatibilityResolver<int> resolver;
    auto stats = std::make_shared<StatsResolutionListener<int>>();
    resolver.addListener(stats);
    resolver.addListener(std::make_shared<LoggingResolutionListener<int>>("Restore", oss));

    (void)resolver.resolve("counter", PrecedingSerializer<int>::absent(), kSnapshot, makeCompatible());

    EXPECT_EQ(stats->compatible(), 1u);
    EXPECT_FALSE(oss.str().empty());
}

TEST(CompatibilityResolverClassTest, RemoveListener) {
    CompatibilityResolver<int> resolver;
    auto stats = std::make_shared<StatsResolutionListener<int>>();
    resolver.addListener(stats);

    (void)resolver.resolve("a", PrecedingSerializer<int>::absent(), std::nullopt, makeCompatible());
    resolver.removeListener(stats);
    (void)resolver.resolve("b", PrecedingSerializer<int>::absent(), std::nullopt, makeCompatible());

    EXPECT_EQ(stats->compatible(), 1u);
}

TEST(CompatibilityResolverClassTest, NullListenerIgnored) {
    CompatibilityResolver<int> resolver;
    resolver.addListener(nullptr);

    auto resolution = resolver.resolve("a", PrecedingSerializer<int>::absent(),
                                       std::nullopt, makeCompatible());

    EXPECT_TRUE(resolution);
}
