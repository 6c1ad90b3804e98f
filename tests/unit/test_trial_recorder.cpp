/**
 * @file test_trial_recorder.cpp
 * @brief Unit tests for TrialEventRecorder and the NDJSON sinks.
 */

#include "telemetry/json_sink.hpp"
#include "telemetry/trial_recorder.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

using namespace autotune;

namespace {

TrialEvent completed_event(TrialId id, double metric) {
    return TrialEvent{.kind = TrialEventKind::Completed, .trial_id = id,
                      .message = "Update Completed Trial", .metric = metric,
                      .duration = Duration{250}};
}

}  // namespace

// ─── TrialEventRecorder ──────────────────────

TEST(TrialEventRecorderTest, RecordsPublishedEvents) {
    EventChannel channel;
    auto sink = std::make_unique<MemorySink>();
    auto* sink_ptr = sink.get();
    TrialEventRecorder recorder(channel, std::move(sink));
    EXPECT_EQ(channel.subscriber_count(), 1u);

    channel.publish(completed_event(3, 0.5));

    auto lines = sink_ptr->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(R"("event":"trial_completed")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("trial":3)"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("metric":0.5)"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("duration_ms":250)"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("msg":"Update Completed Trial")"), std::string::npos);
    EXPECT_EQ(recorder.events_recorded(), 1u);
}

TEST(TrialEventRecorderTest, NonFiniteMetricWrittenAsNull) {
    EventChannel channel;
    auto sink = std::make_unique<MemorySink>();
    auto* sink_ptr = sink.get();
    TrialEventRecorder recorder(channel, std::move(sink));

    channel.publish(completed_event(1, std::numeric_limits<double>::quiet_NaN()));
    TrialResult best{
        .settings = std::make_shared<const TrialSettings>(TrialSettings{.trial_id = 1, .parameters = {}}),
        .duration = Duration{10},
        .metric = std::numeric_limits<double>::infinity()
    };
    recorder.record_summary("deadline", 1, best, Duration{10});

    auto lines = sink_ptr->lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find(R"("metric":null)"), std::string::npos);
    EXPECT_NE(lines[1].find(R"("best_metric":null)"), std::string::npos);
    EXPECT_FALSE(sink_ptr->contains("nan"));
    EXPECT_FALSE(sink_ptr->contains("inf"));
}

TEST(TrialEventRecorderTest, OmitsAbsentFields) {
    EventChannel channel;
    auto sink = std::make_unique<MemorySink>();
    auto* sink_ptr = sink.get();
    TrialEventRecorder recorder(channel, std::move(sink));

    channel.publish(TrialEvent{.kind = TrialEventKind::Running, .trial_id = 0,
                               .message = {}, .metric = std::nullopt,
                               .duration = Duration{0}});
    auto lines = sink_ptr->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], R"({"event":"trial_running","trial":0})");
}

TEST(TrialEventRecorderTest, DetachesOnDestruction) {
    EventChannel channel;
    {
        TrialEventRecorder recorder(channel, std::make_unique<NullSink>());
        EXPECT_EQ(channel.subscriber_count(), 1u);
    }
    EXPECT_EQ(channel.subscriber_count(), 0u);
    EXPECT_NO_THROW(channel.publish(completed_event(0, 1.0)));
}

TEST(TrialEventRecorderTest, SummaryWithBest) {
    EventChannel channel;
    auto sink = std::make_unique<MemorySink>();
    auto* sink_ptr = sink.get();
    TrialEventRecorder recorder(channel, std::move(sink));

    TrialResult best{
        .settings = std::make_shared<const TrialSettings>(
            TrialSettings{.trial_id = 2, .parameters = {{"x", 0.25}}}),
        .duration = Duration{100},
        .metric = 0.75
    };
    recorder.record_summary("deadline", 3, best, Duration{1500});

    auto lines = sink_ptr->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0],
              R"({"event":"experiment_summary","outcome":"deadline","completed":3,)"
              R"("elapsed_ms":1500,"best_trial":2,"best_metric":0.75,"parameters":{"x":0.25}})");
}

TEST(TrialEventRecorderTest, SummaryWithoutBest) {
    EventChannel channel;
    auto sink = std::make_unique<MemorySink>();
    auto* sink_ptr = sink.get();
    TrialEventRecorder recorder(channel, std::move(sink));

    recorder.record_summary("cancelled", 0, std::nullopt, Duration{20});
    EXPECT_TRUE(sink_ptr->contains(R"("outcome":"cancelled")"));
    EXPECT_FALSE(sink_ptr->contains("best_trial"));
}

// ─── JsonFileSink ────────────────────────────

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "autotune_test_sink";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    static size_t count_lines(const std::filesystem::path& path) {
        std::ifstream in(path);
        size_t n = 0;
        std::string line;
        while (std::getline(in, line)) ++n;
        return n;
    }
};

TEST_F(JsonFileSinkTest, CreatesDirectoryAndWrites) {
    {
        JsonFileSink sink(temp_dir_, "trials");
        sink.write(R"({"a":1})");
        sink.write(R"({"a":2})");
        sink.flush();
        EXPECT_EQ(sink.current_path(), temp_dir_ / "trials.ndjson");
    }
    EXPECT_EQ(count_lines(temp_dir_ / "trials.ndjson"), 2u);
}

TEST_F(JsonFileSinkTest, RotatesWhenFull) {
    {
        JsonFileSink sink(temp_dir_, "trials", 50, 2);
        sink.set_max_file_size_bytes(32);
        for (int i = 0; i < 10; ++i) {
            sink.write(R"({"line":"0123456789"})");
        }
        sink.flush();
    }
    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "trials.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "trials.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "trials.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "trials.3.ndjson"));
}

// ─── MemorySink ──────────────────────────────

TEST(MemorySinkTest, Contains) {
    MemorySink sink;
    sink.write("alpha");
    sink.write("beta");
    EXPECT_TRUE(sink.contains("bet"));
    EXPECT_FALSE(sink.contains("gamma"));
    EXPECT_EQ(sink.lines().size(), 2u);
}
