// tests/measurement_test.cpp
// Unit tests for the measurements owned by ping builders.

#include <gtest/gtest.h>
#include "beacon/measurement.hpp"

#include <chrono>
#include <string>

using namespace beacon;

TEST(MeasurementTest, EventsCountAndFlushReset) {
    EventsMeasurement m;
    EXPECT_EQ(m.field_name(), "events");
    EXPECT_EQ(m.count(), 0u);

    auto e1 = TelemetryEvent::create("action", "click", "a");
    auto e2 = TelemetryEvent::create("action", "click", "b");
    m.add(e1);
    m.add(e2);
    EXPECT_EQ(m.count(), 2u);

    EXPECT_EQ(m.flush(), "[" + e1.to_json() + "," + e2.to_json() + "]");
    EXPECT_EQ(m.count(), 0u);
    EXPECT_EQ(m.flush(), "[]");
}

TEST(MeasurementTest, SessionCount) {
    SessionCountMeasurement m;
    m.count_session();
    m.count_session();
    EXPECT_EQ(m.count(), 2);
    EXPECT_EQ(m.flush(), "2");
    EXPECT_EQ(m.flush(), "0");
}

TEST(MeasurementTest, SessionDurationAccumulates) {
    auto now = std::chrono::steady_clock::time_point{};
    SessionDurationMeasurement m([&now] { return now; });

    EXPECT_TRUE(m.record_session_start());
    now += std::chrono::seconds(30);
    EXPECT_TRUE(m.record_session_end());

    EXPECT_TRUE(m.record_session_start());
    now += std::chrono::milliseconds(12500);
    EXPECT_TRUE(m.record_session_end());

    EXPECT_EQ(m.total_seconds(), 42);
    EXPECT_EQ(m.flush(), "42");
    EXPECT_EQ(m.flush(), "0");
}

TEST(MeasurementTest, SessionDurationOutOfOrder) {
    auto now = std::chrono::steady_clock::time_point{};
    SessionDurationMeasurement m([&now] { return now; });

    EXPECT_FALSE(m.record_session_end());
    EXPECT_TRUE(m.record_session_start());
    now += std::chrono::seconds(10);
    EXPECT_FALSE(m.record_session_start());  // first start kept
    now += std::chrono::seconds(5);
    EXPECT_TRUE(m.record_session_end());
    EXPECT_FALSE(m.session_running());
    EXPECT_EQ(m.total_seconds(), 15);
}

TEST(MeasurementTest, Searches) {
    SearchesMeasurement m;
    m.record_search(SearchesMeasurement::LOCATION_ACTIONBAR, "google");
    m.record_search(SearchesMeasurement::LOCATION_ACTIONBAR, "google");
    m.record_search(SearchesMeasurement::LOCATION_SUGGESTION, "duckduckgo");

    EXPECT_EQ(m.count("actionbar", "google"), 2);
    EXPECT_EQ(m.count("listitem", "google"), 0);
    EXPECT_EQ(m.flush(), R"({"duckduckgo.suggestion":1,"google.actionbar":2})");
    EXPECT_EQ(m.flush(), "{}");
}

TEST(MeasurementTest, DefaultSearch) {
    DefaultSearchMeasurement m;
    EXPECT_EQ(m.field_name(), "defaultSearch");
    EXPECT_EQ(m.flush(), "null");

    std::string engine;
    m.set_provider([&engine] { return engine; });
    EXPECT_EQ(m.flush(), "null");

    engine = "yahoo";
    EXPECT_EQ(m.flush(), R"("yahoo")");
}

TEST(MeasurementTest, ClientIdConfigured) {
    ClientIdMeasurement m("fixed-id");
    EXPECT_EQ(m.flush(), R"("fixed-id")");
    EXPECT_EQ(m.flush(), R"("fixed-id")");
}

TEST(MeasurementTest, ClientIdGeneratedOnce) {
    ClientIdMeasurement a("");
    ClientIdMeasurement b("");
    ASSERT_EQ(a.client_id().size(), 36u);
    EXPECT_EQ(a.client_id()[14], '4');
    EXPECT_NE(a.client_id(), b.client_id());
    EXPECT_EQ(a.flush(), a.flush());
}

TEST(MeasurementTest, SequenceIncrements) {
    SequenceMeasurement m;
    EXPECT_EQ(m.flush(), "0");
    EXPECT_EQ(m.flush(), "1");
    EXPECT_EQ(m.flush(), "2");
}

TEST(MeasurementTest, Constant) {
    ConstantMeasurement m("locale", "fr-FR");
    EXPECT_EQ(m.field_name(), "locale");
    EXPECT_EQ(m.flush(), R"("fr-FR")");
}

TEST(MeasurementTest, CreatedDateFormat) {
    CreatedDateMeasurement m;
    auto value = m.flush();
    ASSERT_EQ(value.size(), 12u);  // "YYYY-MM-DD"
    EXPECT_EQ(value[5], '-');
    EXPECT_EQ(value[8], '-');
}

TEST(MeasurementTest, TimezoneOffsetIsInteger) {
    TimezoneOffsetMeasurement m;
    auto value = m.flush();
    ASSERT_FALSE(value.empty());
    EXPECT_NO_THROW(std::stoi(value));
}
