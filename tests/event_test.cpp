// tests/event_test.cpp
// TelemetryEvent field limits and serialization.

#include <gtest/gtest.h>
#include "beacon/error.hpp"
#include "beacon/event.hpp"
#include "beacon/telemetry.hpp"
#include "validation.hpp"

#include <string>

using namespace beacon;

// ==================== Validation helpers ====================

TEST(ValidationTest, CategoryLimits) {
    EXPECT_TRUE(validation::check_category("action"));
    EXPECT_FALSE(validation::check_category(""));
    EXPECT_TRUE(validation::check_category(std::string(30, 'c')));
    EXPECT_FALSE(validation::check_category(std::string(31, 'c')));
}

TEST(ValidationTest, MethodAndObjectLimits) {
    EXPECT_TRUE(validation::check_method(std::string(20, 'm')));
    EXPECT_FALSE(validation::check_method(std::string(21, 'm')));
    EXPECT_TRUE(validation::check_object(std::string(20, 'o')));
    EXPECT_FALSE(validation::check_object(""));
}

TEST(ValidationTest, Truncate) {
    EXPECT_EQ(validation::truncate("short", 80), "short");
    EXPECT_EQ(validation::truncate(std::string(100, 'x'), 80).size(), 80u);
}

// ==================== Creation ====================

TEST(EventTest, CreateWithoutValue) {
    auto e = TelemetryEvent::create("action", "click", "back_button");
    EXPECT_EQ(e.category(), "action");
    EXPECT_EQ(e.method(), "click");
    EXPECT_EQ(e.object(), "back_button");
    EXPECT_FALSE(e.has_value());
    EXPECT_TRUE(e.extras().empty());
}

TEST(EventTest, CreateWithValue) {
    auto e = TelemetryEvent::create("action", "change", "setting", "dark_mode");
    EXPECT_TRUE(e.has_value());
    EXPECT_EQ(e.value(), "dark_mode");
}

TEST(EventTest, LongCategoryRejected) {
    try {
        TelemetryEvent::create(std::string(31, 'c'), "click", "button");
        FAIL() << "expected BeaconError";
    } catch (const BeaconError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
        EXPECT_EQ(e.field(), "category");
    }
}

TEST(EventTest, EmptyMethodRejected) {
    EXPECT_THROW(TelemetryEvent::create("action", "", "button"), BeaconError);
}

TEST(EventTest, LongObjectRejected) {
    EXPECT_THROW(TelemetryEvent::create("action", "click", std::string(21, 'o')), BeaconError);
}

TEST(EventTest, LongValueTruncated) {
    auto e = TelemetryEvent::create("action", "type", "url", std::string(200, 'v'));
    EXPECT_EQ(e.value().size(), 80u);
}

TEST(EventTest, ExtrasLimits) {
    auto e = TelemetryEvent::create("action", "click", "button");
    for (int i = 0; i < 10; i++) {
        e.extra("k" + std::to_string(i), "v");
    }
    EXPECT_EQ(e.extras().size(), 10u);

    // Overwriting an existing key is still fine at the limit.
    e.extra("k0", "again");
    EXPECT_EQ(e.extras().at("k0"), "again");

    EXPECT_THROW(e.extra("k10", "v"), BeaconError);
    EXPECT_THROW(e.extra(std::string(16, 'k'), "v"), BeaconError);
}

TEST(EventTest, ExtraValueTruncated) {
    auto e = TelemetryEvent::create("action", "click", "button");
    e.extra("source", std::string(81, 's'));
    EXPECT_EQ(e.extras().at("source").size(), 80u);
}

TEST(EventTest, TimestampsDoNotGoBackwards) {
    auto a = TelemetryEvent::create("action", "click", "a");
    auto b = TelemetryEvent::create("action", "click", "b");
    EXPECT_LE(a.timestamp(), b.timestamp());
}

// ==================== Serialization ====================

TEST(EventTest, JsonWithoutValueOrExtras) {
    auto e = TelemetryEvent::create("action", "click", "back_button");
    EXPECT_EQ(e.to_json(),
              "[" + std::to_string(e.timestamp()) + R"(,"action","click","back_button"])");
}

TEST(EventTest, JsonWithValue) {
    auto e = TelemetryEvent::create("action", "change", "setting", "on");
    EXPECT_EQ(e.to_json(),
              "[" + std::to_string(e.timestamp()) + R"(,"action","change","setting","on"])");
}

TEST(EventTest, JsonExtrasWithoutValueUsesNull) {
    auto e = TelemetryEvent::create("action", "click", "button");
    e.extra("b", "2").extra("a", "1");
    EXPECT_EQ(e.to_json(),
              "[" + std::to_string(e.timestamp()) +
              R"(,"action","click","button",null,{"a":"1","b":"2"}])");
}

// ==================== Queue ====================

TEST(EventTest, QueueWithoutTelemetryIsDropped) {
    ASSERT_EQ(TelemetryHolder::global().state(), LifecycleState::Uninitialized);
    EXPECT_NO_THROW(TelemetryEvent::create("action", "click", "button").queue());
}
