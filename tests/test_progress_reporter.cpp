#include "test_helpers.hpp"
#include <transfer/progress_reporter.hpp>
#include <condition_variable>
#include <stdexcept>

TEST(ProgressSample, SpeedAndEta) {
    auto s = compute_sample(500, 1500, 2.0);
    EXPECT_DOUBLE_EQ(s.speed_bytes_per_sec, 250.0);
    EXPECT_EQ(s.eta_seconds, 4u);
}

TEST(ProgressSample, ZeroElapsedMeansZeroSpeedAndEta) {
    auto s = compute_sample(500, 1500, 0.0);
    EXPECT_DOUBLE_EQ(s.speed_bytes_per_sec, 0.0);
    EXPECT_EQ(s.eta_seconds, 0u);
}

TEST(ProgressSample, NothingDoneYet) {
    auto s = compute_sample(0, 1500, 3.0);
    EXPECT_DOUBLE_EQ(s.speed_bytes_per_sec, 0.0);
    EXPECT_EQ(s.eta_seconds, 0u);
}

TEST(ProgressSample, OvershootSaturatesRemaining) {
    auto s = compute_sample(2000, 1500, 1.0);
    EXPECT_DOUBLE_EQ(s.speed_bytes_per_sec, 2000.0);
    EXPECT_EQ(s.eta_seconds, 0u);
}

class ProgressReporterTest : public ScratchTest {};

TEST_F(ProgressReporterTest, DeliversInOrder) {
    RecordingSink sink;
    ProgressReporter reporter(&sink, 1000);

    for (uint64_t i = 1; i <= 100; ++i) {
        ProgressEvent ev;
        ev.job_id = "job";
        ev.current_file_index = i;
        ev.bytes_done = i * 10;
        reporter.emit(ev);
    }
    reporter.emit_error("job", "boom");
    reporter.flush();

    auto events = sink.events();
    ASSERT_EQ(events.size(), 100u);
    for (std::size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(events[i].current_file_index, i + 1);
    }
    ASSERT_EQ(sink.errors().size(), 1u);
    EXPECT_EQ(sink.errors()[0].second, "boom");
    EXPECT_EQ(reporter.dropped(), 0u);
}

TEST_F(ProgressReporterTest, NullSinkIsFine) {
    ProgressReporter reporter(nullptr, 4);
    reporter.emit(ProgressEvent{});
    reporter.emit_error("job", "ignored");
    reporter.flush();
    EXPECT_EQ(reporter.dropped(), 0u);
}

namespace {

class ThrowingSink : public ProgressSink {
public:
    int calls = 0;
    void emit(const ProgressEvent&) override {
        ++calls;
        throw std::runtime_error("observer went away");
    }
    void emit_error(const std::string&, const std::string&) override {
        ++calls;
        throw std::runtime_error("observer went away");
    }
};

// Throws something that is not a std::exception.
class RawThrowingSink : public ProgressSink {
public:
    int calls = 0;
    void emit(const ProgressEvent&) override {
        ++calls;
        throw 42;
    }
    void emit_error(const std::string&, const std::string&) override {
        ++calls;
        throw "observer went away";
    }
};

// Blocks inside emit() until released, so the queue backs up.
class GatedSink : public ProgressSink {
public:
    void emit(const ProgressEvent& ev) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
        received.push_back(ev.current_file_index);
    }
    void emit_error(const std::string&, const std::string&) override {}

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    std::vector<uint64_t> received;

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

} // namespace

TEST_F(ProgressReporterTest, SinkExceptionsAreSwallowed) {
    ThrowingSink sink;
    ProgressReporter reporter(&sink, 16);
    reporter.emit(ProgressEvent{});
    reporter.emit_error("job", "x");
    reporter.emit(ProgressEvent{});
    reporter.flush();
    EXPECT_EQ(sink.calls, 3);
}

TEST_F(ProgressReporterTest, NonStandardSinkExceptionsAreSwallowed) {
    RawThrowingSink sink;
    ProgressReporter reporter(&sink, 16);
    reporter.emit(ProgressEvent{});
    reporter.emit_error("job", "x");
    reporter.emit(ProgressEvent{});
    reporter.flush();
    EXPECT_EQ(sink.calls, 3);
}

TEST_F(ProgressReporterTest, SlowSinkNeverBlocksEmitAndDropsOldest) {
    GatedSink sink;
    ProgressReporter reporter(&sink, 4);

    auto start = std::chrono::steady_clock::now();
    for (uint64_t i = 1; i <= 50; ++i) {
        ProgressEvent ev;
        ev.current_file_index = i;
        reporter.emit(ev);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::seconds(1));

    sink.open();
    reporter.flush();

    // At most one event in the sink's hands plus a full queue got through
    EXPECT_GT(reporter.dropped(), 0u);
    ASSERT_FALSE(sink.received.empty());
    EXPECT_LE(sink.received.size(), 5u);
    EXPECT_EQ(sink.received.back(), 50u);
    for (std::size_t i = 1; i < sink.received.size(); ++i) {
        EXPECT_LT(sink.received[i - 1], sink.received[i]);
    }
}
