#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "speakd/stream_writer.hpp"

using namespace speakd;
using namespace speakd::testing;
using namespace std::chrono_literals;

namespace {

class StreamWriterTest : public MarkerDirTest {
protected:
    StreamWriter::Options options(size_t blockFrames = 4) {
        StreamWriter::Options opts;
        opts.format.blockFrames = blockFrames;
        opts.pollInterval = 2ms;
        return opts;
    }

    StreamWriter::StateCallback recorder() {
        return [this](PlaybackState s) {
            std::lock_guard<std::mutex> lk(statesMutex_);
            states_.push_back(s);
        };
    }

    std::vector<PlaybackState> states() {
        std::lock_guard<std::mutex> lk(statesMutex_);
        return states_;
    }

    PlaybackState lastState() {
        std::lock_guard<std::mutex> lk(statesMutex_);
        return states_.empty() ? PlaybackState::Idle : states_.back();
    }

    std::shared_ptr<OutputLog> log_ = std::make_shared<OutputLog>();
    std::atomic<bool> stop_{false};

private:
    std::mutex statesMutex_;
    std::vector<PlaybackState> states_;
};

} // namespace

TEST_F(StreamWriterTest, WritesWholeBufferInBlocksAndDrains) {
    StreamWriter writer(fakeOutputs(log_), *signals_, options(4));
    auto samples = ramp(10);

    EXPECT_EQ(writer.run(samples, stop_, recorder()), SessionOutcome::Completed);

    EXPECT_EQ(log_->written, samples);
    EXPECT_EQ(log_->blockSizes, (std::vector<size_t>{4, 4, 2}));
    ASSERT_EQ(log_->closedWithDrain.size(), 1u);
    EXPECT_TRUE(log_->closedWithDrain[0]);
    EXPECT_EQ(states(), (std::vector<PlaybackState>{PlaybackState::Playing, PlaybackState::Idle}));
    EXPECT_FALSE(stop_.load());
}

TEST_F(StreamWriterTest, StaleStopMarkerIsIgnored) {
    signals_->set(Marker::Stop);
    StreamWriter writer(fakeOutputs(log_), *signals_, options(4));
    auto samples = ramp(8);

    EXPECT_EQ(writer.run(samples, stop_, recorder()), SessionOutcome::Completed);
    EXPECT_EQ(log_->written.size(), 8u);
}

TEST_F(StreamWriterTest, StopSignalBeforeFirstBlock) {
    stop_ = true;
    StreamWriter writer(fakeOutputs(log_), *signals_, options(4));
    auto samples = ramp(8);

    EXPECT_EQ(writer.run(samples, stop_, recorder()), SessionOutcome::Stopped);
    EXPECT_TRUE(log_->written.empty());
    ASSERT_EQ(log_->closedWithDrain.size(), 1u);
    EXPECT_FALSE(log_->closedWithDrain[0]);
    EXPECT_EQ(lastState(), PlaybackState::Idle);
}

TEST_F(StreamWriterTest, ExternalStopMarkerEndsAtBlockBoundary) {
    FakeOutputConfig cfg;
    cfg.onWrite = [this](int index) {
        if (index == 1) signals_->set(Marker::Stop);
    };
    StreamWriter writer(fakeOutputs(log_, cfg), *signals_, options(4));
    auto samples = ramp(40);

    EXPECT_EQ(writer.run(samples, stop_, recorder()), SessionOutcome::Stopped);
    // The block in flight when the marker appeared still completes
    EXPECT_EQ(log_->written.size(), 8u);
    EXPECT_TRUE(stop_.load());
    EXPECT_FALSE(signals_->exists(Marker::Stop));
    EXPECT_FALSE(signals_->exists(Marker::Pause));
}

TEST_F(StreamWriterTest, PauseAndResumeKeepCursor) {
    FakeOutputConfig cfg;
    cfg.onWrite = [this](int index) {
        if (index == 2) signals_->set(Marker::Pause);
    };
    StreamWriter writer(fakeOutputs(log_, cfg), *signals_, options(4));
    auto samples = ramp(40);

    std::thread resumer([this]() {
        ASSERT_TRUE(waitFor([this]() { return lastState() == PlaybackState::Paused; }));
        // Nothing reaches the device while paused
        const size_t before = log_->writtenCount();
        std::this_thread::sleep_for(20ms);
        EXPECT_EQ(log_->writtenCount(), before);
        signals_->clear(Marker::Pause);
    });

    EXPECT_EQ(writer.run(samples, stop_, recorder()), SessionOutcome::Completed);
    resumer.join();

    EXPECT_EQ(log_->written, samples);
    EXPECT_EQ(states(), (std::vector<PlaybackState>{PlaybackState::Playing, PlaybackState::Paused,
                                                    PlaybackState::Playing, PlaybackState::Idle}));
}

TEST_F(StreamWriterTest, StopMarkerWhilePausedNeverResumes) {
    FakeOutputConfig cfg;
    cfg.onWrite = [this](int index) {
        if (index == 0) signals_->set(Marker::Pause);
    };
    StreamWriter writer(fakeOutputs(log_, cfg), *signals_, options(4));
    auto samples = ramp(40);

    std::thread stopper([this]() {
        ASSERT_TRUE(waitFor([this]() { return lastState() == PlaybackState::Paused; }));
        signals_->set(Marker::Stop);
    });

    EXPECT_EQ(writer.run(samples, stop_, recorder()), SessionOutcome::Stopped);
    stopper.join();

    EXPECT_EQ(log_->written.size(), 4u);
    EXPECT_EQ(states(), (std::vector<PlaybackState>{PlaybackState::Playing, PlaybackState::Paused,
                                                    PlaybackState::Idle}));
    EXPECT_FALSE(signals_->exists(Marker::Pause));
    EXPECT_FALSE(signals_->exists(Marker::Stop));
}

TEST_F(StreamWriterTest, StopThatClearsPauseDoesNotLeakABlock) {
    FakeOutputConfig cfg;
    cfg.onWrite = [this](int index) {
        if (index == 0) signals_->set(Marker::Pause);
    };
    StreamWriter writer(fakeOutputs(log_, cfg), *signals_, options(4));
    auto samples = ramp(40);

    std::thread stopper([this]() {
        ASSERT_TRUE(waitFor([this]() { return lastState() == PlaybackState::Paused; }));
        // What speakd-ctl stop does
        signals_->set(Marker::Stop);
        signals_->clear(Marker::Pause);
    });

    EXPECT_EQ(writer.run(samples, stop_, recorder()), SessionOutcome::Stopped);
    stopper.join();

    EXPECT_EQ(log_->written.size(), 4u);
    EXPECT_EQ(lastState(), PlaybackState::Idle);
}

TEST_F(StreamWriterTest, StopSignalWakesPausedWorker) {
    FakeOutputConfig cfg;
    cfg.onWrite = [this](int index) {
        if (index == 0) signals_->set(Marker::Pause);
    };
    StreamWriter writer(fakeOutputs(log_, cfg), *signals_, options(4));
    auto samples = ramp(40);

    std::thread stopper([this]() {
        ASSERT_TRUE(waitFor([this]() { return lastState() == PlaybackState::Paused; }));
        stop_ = true;
    });

    EXPECT_EQ(writer.run(samples, stop_, recorder()), SessionOutcome::Stopped);
    stopper.join();
    EXPECT_EQ(log_->written.size(), 4u);
    // Leftover pause marker is cleaned up on exit
    EXPECT_FALSE(signals_->exists(Marker::Pause));
}

TEST_F(StreamWriterTest, OpenFailureEndsIdle) {
    signals_->set(Marker::Pause);
    FakeOutputConfig cfg;
    cfg.failOpen = true;
    StreamWriter writer(fakeOutputs(log_, cfg), *signals_, options(4));
    auto samples = ramp(8);

    EXPECT_EQ(writer.run(samples, stop_, recorder()), SessionOutcome::DeviceFailed);
    EXPECT_EQ(log_->opened, 0);
    EXPECT_EQ(states(), (std::vector<PlaybackState>{PlaybackState::Idle}));
    EXPECT_FALSE(signals_->exists(Marker::Pause));
}

TEST_F(StreamWriterTest, WriteFailureReleasesDevice) {
    FakeOutputConfig cfg;
    cfg.failOnWrite = 1;
    StreamWriter writer(fakeOutputs(log_, cfg), *signals_, options(4));
    auto samples = ramp(40);

    EXPECT_EQ(writer.run(samples, stop_, recorder()), SessionOutcome::DeviceFailed);
    EXPECT_EQ(log_->written.size(), 4u);
    EXPECT_EQ(log_->openNow, 0);
    ASSERT_EQ(log_->closedWithDrain.size(), 1u);
    EXPECT_FALSE(log_->closedWithDrain[0]);
    EXPECT_EQ(lastState(), PlaybackState::Idle);
}

TEST_F(StreamWriterTest, MissingOutputIsADeviceFailure) {
    StreamWriter writer([]() { return std::unique_ptr<AudioOutput>(); }, *signals_, options(4));
    auto samples = ramp(8);

    EXPECT_EQ(writer.run(samples, stop_, recorder()), SessionOutcome::DeviceFailed);
    EXPECT_EQ(lastState(), PlaybackState::Idle);
}

TEST_F(StreamWriterTest, EmptyBufferCompletesImmediately) {
    StreamWriter writer(fakeOutputs(log_), *signals_, options(4));
    std::vector<float> samples;

    EXPECT_EQ(writer.run(samples, stop_, recorder()), SessionOutcome::Completed);
    EXPECT_TRUE(log_->blockSizes.empty());
    EXPECT_EQ(log_->opened, 1);
}
