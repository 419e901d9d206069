#include "termbar/core/progress_bar.hpp"
#include "termbar/core/error_codes.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <limits>
#include <thread>
#include <vector>

using termbar::core::BarError;
using termbar::core::BarErrorCode;
using termbar::core::BarOptions;
using termbar::core::ProgressBar;
using termbar::testing::CapturingSink;
using termbar::testing::ManualClock;

class ProgressBarTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<CapturingSink>();
        clock_ = std::make_shared<ManualClock>();
        terminal_ = std::make_shared<termbar::io::FixedTerminalSize>(80);
    }
    
    std::unique_ptr<ProgressBar> makeBar(int64_t max, BarOptions options = BarOptions{}) {
        return std::make_unique<ProgressBar>(max, std::move(options), sink_, terminal_, clock_);
    }
    
    static BarOptions hashTheme() {
        BarOptions options;
        options.width = 10;
        options.theme = termbar::core::Theme{"#", "", "-", "[", "]"};
        return options;
    }
    
    std::shared_ptr<CapturingSink> sink_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<termbar::io::FixedTerminalSize> terminal_;
};

TEST_F(ProgressBarTest, HalfAndFullRenderWithCustomTheme) {
    int completions = 0;
    BarOptions options = hashTheme();
    options.on_completion = [&completions]() { ++completions; };
    auto bar = makeBar(200, options);
    
    bar->add(100);
    EXPECT_NE(sink_->lastWrite().find(" 50% [#####-----]"), std::string::npos) << sink_->lastWrite();
    EXPECT_FALSE(bar->isFinished());
    
    bar->add(100);
    EXPECT_NE(sink_->lastWrite().find("100% [##########]"), std::string::npos) << sink_->lastWrite();
    EXPECT_TRUE(bar->isFinished());
    EXPECT_EQ(completions, 1);
}

TEST_F(ProgressBarTest, DeltasSummingToMaxCompleteExactlyOnce) {
    const std::vector<std::vector<int64_t>> sequences = {
        {100},
        {1, 2, 3, 4, 90},
        {0, 50, 0, 50},
        {33, 33, 33, 1},
    };
    
    for (const auto& deltas : sequences) {
        sink_ = std::make_shared<CapturingSink>();
        int completions = 0;
        BarOptions options;
        options.on_completion = [&completions]() { ++completions; };
        auto bar = makeBar(100, options);
        
        for (int64_t delta : deltas) {
            bar->add(delta);
        }
        
        EXPECT_TRUE(bar->isFinished());
        EXPECT_EQ(completions, 1);
        EXPECT_NE(sink_->lastWrite().find("100%"), std::string::npos);
    }
}

TEST_F(ProgressBarTest, ZeroMaxAlwaysRejectsAdd) {
    auto bar = makeBar(0);
    
    for (int64_t delta : {-5, 0, 1, 1000}) {
        try {
            bar->add(delta);
            FAIL() << "add(" << delta << ") did not throw";
        } catch (const BarError& e) {
            EXPECT_EQ(e.code(), BarErrorCode::INVALID_CONFIGURATION);
        }
    }
    EXPECT_EQ(sink_->writeCount(), 0u);
}

TEST_F(ProgressBarTest, OverflowLeavesStateUntouched) {
    auto bar = makeBar(10);
    bar->add(8);
    
    auto before = bar->snapshot();
    size_t writes_before = sink_->writeCount();
    
    try {
        bar->add(5);
        FAIL() << "overflow was accepted";
    } catch (const BarError& e) {
        EXPECT_EQ(e.code(), BarErrorCode::COUNTER_OVERFLOW);
    }
    
    auto after = bar->snapshot();
    EXPECT_EQ(bar->current(), 8);
    EXPECT_DOUBLE_EQ(after.percent_complete, before.percent_complete);
    EXPECT_DOUBLE_EQ(after.bytes_processed, before.bytes_processed);
    EXPECT_EQ(sink_->writeCount(), writes_before);
    EXPECT_FALSE(bar->isFinished());
    
    bar->add(2);
    EXPECT_TRUE(bar->isFinished());
}

TEST_F(ProgressBarTest, IndeterminateCounterWraps) {
    BarOptions options;
    options.width = 40;
    auto bar = makeBar(termbar::constants::bar::UNKNOWN_LENGTH, options);
    
    EXPECT_TRUE(bar->isIndeterminate());
    EXPECT_EQ(bar->getMax(), 40);
    
    bar->add(45);
    EXPECT_EQ(bar->current(), 5);
    bar->add(1000);
    EXPECT_EQ(bar->current(), 5);
    bar->add(-10);
    EXPECT_EQ(bar->current(), 35);
    EXPECT_FALSE(bar->isFinished());
}

TEST_F(ProgressBarTest, IndeterminateFinishCompletes) {
    int completions = 0;
    BarOptions options;
    options.on_completion = [&completions]() { ++completions; };
    auto bar = makeBar(termbar::constants::bar::UNKNOWN_LENGTH, options);
    
    bar->add(3);
    bar->finish();
    
    EXPECT_TRUE(bar->isFinished());
    EXPECT_EQ(completions, 1);
}

TEST_F(ProgressBarTest, PercentThrottleWritesOnlyOnBoundary) {
    auto bar = makeBar(1000);
    
    for (int i = 0; i < 9; ++i) {
        bar->add(1);
    }
    EXPECT_EQ(sink_->writeCount(), 0u);
    
    bar->add(1);
    EXPECT_EQ(sink_->writeCount(), 1u);
    
    bar->add(1);
    EXPECT_EQ(sink_->writeCount(), 1u);
}

TEST_F(ProgressBarTest, TimeThrottleSpacesWrites) {
    BarOptions options;
    options.show_iterations_count = true;
    options.throttle = std::chrono::milliseconds(100);
    auto bar = makeBar(100, options);
    
    bar->add(1);
    EXPECT_EQ(sink_->writeCount(), 0u);
    
    clock_->advance(std::chrono::milliseconds(150));
    bar->add(1);
    EXPECT_EQ(sink_->writeCount(), 1u);
    
    bar->add(1);
    EXPECT_EQ(sink_->writeCount(), 1u);
    
    clock_->advance(std::chrono::milliseconds(100));
    bar->add(1);
    EXPECT_EQ(sink_->writeCount(), 2u);
    
    // completion is never throttled
    bar->add(96);
    EXPECT_EQ(sink_->writeCount(), 3u);
    EXPECT_TRUE(bar->isFinished());
}

TEST_F(ProgressBarTest, NothingRenderedAfterFinish) {
    int completions = 0;
    BarOptions options;
    options.show_iterations_count = true;
    options.on_completion = [&completions]() { ++completions; };
    auto bar = makeBar(10, options);
    
    bar->add(10);
    size_t writes = sink_->writeCount();
    
    bar->finish();
    bar->add(0);
    bar->renderBlank();
    
    EXPECT_EQ(sink_->writeCount(), writes);
    EXPECT_EQ(completions, 1);
}

TEST_F(ProgressBarTest, ClearOnFinishErasesLine) {
    BarOptions options;
    options.clear_on_finish = true;
    auto bar = makeBar(100, options);
    
    bar->add(50);
    bar->add(50);
    
    std::string last = sink_->lastWrite();
    ASSERT_FALSE(last.empty());
    EXPECT_EQ(last.find_first_not_of("\r "), std::string::npos);
    EXPECT_GE(last.size(), 2u);
    EXPECT_TRUE(bar->isFinished());
}

TEST_F(ProgressBarTest, ClearDoesNotTouchCounters) {
    auto bar = makeBar(100);
    bar->add(50);
    
    auto before = bar->snapshot();
    bar->clear();
    auto after = bar->snapshot();
    
    EXPECT_DOUBLE_EQ(after.percent_complete, before.percent_complete);
    EXPECT_DOUBLE_EQ(after.bytes_processed, before.bytes_processed);
    EXPECT_EQ(bar->current(), 50);
}

TEST_F(ProgressBarTest, SnapshotReportsTiming) {
    auto bar = makeBar(100);
    clock_->advance(std::chrono::seconds(10));
    bar->add(25);
    
    auto snapshot = bar->snapshot();
    EXPECT_DOUBLE_EQ(snapshot.percent_complete, 0.25);
    EXPECT_DOUBLE_EQ(snapshot.bytes_processed, 25.0);
    EXPECT_DOUBLE_EQ(snapshot.seconds_elapsed, 10.0);
    EXPECT_DOUBLE_EQ(snapshot.seconds_remaining, 30.0);
    EXPECT_DOUBLE_EQ(snapshot.throughput_kbps, 25.0 / 1024.0 / 10.0);
}

TEST_F(ProgressBarTest, ResetStartsOver) {
    int completions = 0;
    BarOptions options;
    options.on_completion = [&completions]() { ++completions; };
    auto bar = makeBar(100, options);
    
    bar->add(100);
    ASSERT_TRUE(bar->isFinished());
    
    bar->reset();
    EXPECT_FALSE(bar->isFinished());
    EXPECT_EQ(bar->current(), 0);
    EXPECT_DOUBLE_EQ(bar->snapshot().bytes_processed, 0.0);
    
    bar->add(100);
    EXPECT_TRUE(bar->isFinished());
    EXPECT_EQ(completions, 2);
}

TEST_F(ProgressBarTest, SetMovesToAbsoluteValue) {
    auto bar = makeBar(100);
    
    bar->set(30);
    EXPECT_EQ(bar->current(), 30);
    bar->set(10);
    EXPECT_EQ(bar->current(), 10);
    
    EXPECT_THROW(bar->set(101), BarError);
    EXPECT_EQ(bar->current(), 10);
}

TEST_F(ProgressBarTest, ChangeMaxRescales) {
    auto bar = makeBar(100);
    bar->add(50);
    
    bar->changeMax(200);
    EXPECT_EQ(bar->getMax(), 200);
    EXPECT_DOUBLE_EQ(bar->snapshot().percent_complete, 0.25);
    EXPECT_FALSE(bar->isFinished());
    
    bar->changeMax(50);
    EXPECT_TRUE(bar->isFinished());
}

TEST_F(ProgressBarTest, ChangeMaxBelowCountRejected) {
    BarOptions options = hashTheme();
    options.show_iterations_count = true;
    auto bar = makeBar(100, options);
    bar->add(80);
    
    size_t writes_before = sink_->writeCount();
    try {
        bar->changeMax(50);
        FAIL() << "max shrank below the current count";
    } catch (const BarError& e) {
        EXPECT_EQ(e.code(), BarErrorCode::COUNTER_OVERFLOW);
    }
    
    EXPECT_EQ(bar->getMax(), 100);
    EXPECT_EQ(bar->current(), 80);
    EXPECT_FALSE(bar->isFinished());
    EXPECT_EQ(sink_->writeCount(), writes_before);
    EXPECT_NE(sink_->lastWrite().find(" 80% [########--] (80/100)"), std::string::npos) << sink_->lastWrite();
    
    EXPECT_THROW(bar->changeMax(0), BarError);
    EXPECT_THROW(bar->changeMax(-5), BarError);
    EXPECT_EQ(bar->getMax(), 100);
}

TEST_F(ProgressBarTest, NegativeCountRejected) {
    BarOptions options = hashTheme();
    options.show_iterations_count = true;
    auto bar = makeBar(100, options);
    bar->add(20);
    
    size_t writes_before = sink_->writeCount();
    try {
        bar->add(-50);
        FAIL() << "count dropped below zero";
    } catch (const BarError& e) {
        EXPECT_EQ(e.code(), BarErrorCode::COUNTER_UNDERFLOW);
    }
    EXPECT_EQ(bar->current(), 20);
    EXPECT_EQ(sink_->writeCount(), writes_before);
    
    bar->add(-20);
    EXPECT_EQ(bar->current(), 0);
}

TEST_F(ProgressBarTest, SetRejectsExtremeValues) {
    auto bar = makeBar(100);
    bar->set(60);
    
    try {
        bar->set(std::numeric_limits<int64_t>::min());
        FAIL() << "set accepted INT64_MIN";
    } catch (const BarError& e) {
        EXPECT_EQ(e.code(), BarErrorCode::COUNTER_UNDERFLOW);
    }
    try {
        bar->set(std::numeric_limits<int64_t>::max());
        FAIL() << "set accepted INT64_MAX";
    } catch (const BarError& e) {
        EXPECT_EQ(e.code(), BarErrorCode::COUNTER_OVERFLOW);
    }
    EXPECT_EQ(bar->current(), 60);
    
    bar->set(0);
    EXPECT_EQ(bar->current(), 0);
}

TEST_F(ProgressBarTest, IndeterminateSetWraps) {
    BarOptions options;
    options.width = 40;
    auto bar = makeBar(termbar::constants::bar::UNKNOWN_LENGTH, options);
    
    bar->set(45);
    EXPECT_EQ(bar->current(), 5);
    bar->set(-1);
    EXPECT_EQ(bar->current(), 39);
    bar->set(std::numeric_limits<int64_t>::min());
    EXPECT_GE(bar->current(), 0);
    EXPECT_LT(bar->current(), 40);
}

TEST_F(ProgressBarTest, RenderedRateFollowsRecentWindow) {
    BarOptions options;
    options.show_iterations_per_second = true;
    options.predict_time = false;
    auto bar = makeBar(100000, options);
    
    // slow start: three one-second windows at 10 it/s
    for (int i = 0; i < 3; ++i) {
        clock_->advance(std::chrono::seconds(1));
        bar->add(10);
    }
    EXPECT_NE(sink_->lastWrite().find("(10 it/s)"), std::string::npos) << sink_->lastWrite();
    
    // ten fast windows push the slow samples out; the overall rate would be 1030/13
    for (int i = 0; i < 10; ++i) {
        clock_->advance(std::chrono::seconds(1));
        bar->add(100);
    }
    std::string frame = sink_->lastWrite();
    EXPECT_NE(frame.find("(100 it/s)"), std::string::npos) << frame;
    EXPECT_EQ(frame.find("(79 it/s)"), std::string::npos) << frame;
}

TEST_F(ProgressBarTest, DescribeShowsOnNextRender) {
    auto bar = makeBar(100);
    bar->describe("downloading");
    bar->add(10);
    
    EXPECT_NE(sink_->lastWrite().find("downloading"), std::string::npos);
}

TEST_F(ProgressBarTest, RenderBlankDrawsEmptyBar) {
    BarOptions options = hashTheme();
    options.render_blank_state = true;
    auto bar = makeBar(100, options);
    
    ASSERT_EQ(sink_->writeCount(), 1u);
    EXPECT_NE(sink_->lastWrite().find("  0% [----------]"), std::string::npos) << sink_->lastWrite();
}

TEST_F(ProgressBarTest, FinishFillsToMax) {
    auto bar = makeBar(100);
    bar->add(20);
    bar->finish();
    
    EXPECT_EQ(bar->current(), 100);
    EXPECT_TRUE(bar->isFinished());
    EXPECT_NE(sink_->lastWrite().find("100%"), std::string::npos);
}

TEST_F(ProgressBarTest, SinkFailurePropagates) {
    auto bar = makeBar(100);
    sink_->failWrites(true);
    
    try {
        bar->add(10);
        FAIL() << "sink failure was swallowed";
    } catch (const BarError& e) {
        EXPECT_EQ(e.code(), BarErrorCode::SINK_WRITE_FAILED);
    }
}

TEST_F(ProgressBarTest, InvalidSpinnerRejectedAtConstruction) {
    BarOptions options;
    options.spinner_type = 76;
    
    try {
        makeBar(10, options);
        FAIL() << "spinner 76 was accepted";
    } catch (const BarError& e) {
        EXPECT_EQ(e.code(), BarErrorCode::INVALID_CONFIGURATION);
    }
}

TEST_F(ProgressBarTest, ByteWriteAdvances) {
    auto bar = makeBar(10);
    const char data[] = "abcd";
    
    EXPECT_EQ(bar->write(data, 4), 4u);
    EXPECT_EQ(bar->current(), 4);
}

TEST_F(ProgressBarTest, ConcurrentAddsCompleteOnce) {
    std::atomic<int> completions{0};
    BarOptions options;
    options.show_iterations_count = true;
    options.on_completion = [&completions]() { ++completions; };
    auto bar = makeBar(1000, options);
    
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&bar]() {
            for (int i = 0; i < 250; ++i) {
                bar->add(1);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    
    EXPECT_EQ(bar->current(), 1000);
    EXPECT_TRUE(bar->isFinished());
    EXPECT_EQ(completions.load(), 1);
}
