#include <catch2/catch_test_macros.hpp>

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"
#include "session.hpp"

#include <vector>

class MockAudioCapture : public AudioCapture {
public:
    bool start() override {
        ++starts;
        capturing_ = !fail_start;
        return capturing_;
    }
    void stop() override { capturing_ = false; }
    bool is_capturing() const override { return capturing_; }

    bool fail_start = false;
    int starts = 0;

private:
    bool capturing_ = false;
};

TEST_CASE("Session state machine", "[session]") {
    RingBuffer ring(1024);
    MockAudioCapture capture;
    Session session(ring, capture, 16000);

    SECTION("InitialStateIdle") {
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE(session.recording_duration() == 0.0);
    }

    SECTION("StopWhenIdleReturnsEmpty") {
        REQUIRE(session.stop_recording().empty());
        REQUIRE(session.state() == SessionState::Idle);
    }

    SECTION("RecordThenStopReturnsSamples") {
        REQUIRE(session.start_recording());
        REQUIRE(session.state() == SessionState::Recording);
        REQUIRE(capture.is_capturing());

        std::vector<float> samples = {0.1f, -0.2f, 0.3f};
        ring.write(samples.data(), samples.size() * sizeof(float));

        auto recorded = session.stop_recording();
        REQUIRE(recorded == samples);
        REQUIRE_FALSE(capture.is_capturing());
        REQUIRE(session.state() == SessionState::Transcribing);

        session.set_idle();
        REQUIRE(session.state() == SessionState::Idle);
    }

    SECTION("StartDiscardsStaleAudio") {
        std::vector<float> stale(8, 1.0f);
        ring.write(stale.data(), stale.size() * sizeof(float));

        REQUIRE(session.start_recording());
        REQUIRE(session.stop_recording().empty());
    }

    SECTION("CannotStartTwice") {
        REQUIRE(session.start_recording());
        REQUIRE_FALSE(session.start_recording());
        REQUIRE(capture.starts == 1);
    }

    SECTION("CaptureFailureStaysIdle") {
        capture.fail_start = true;
        REQUIRE_FALSE(session.start_recording());
        REQUIRE(session.state() == SessionState::Idle);
    }

    SECTION("BufferFullAndBufferedSeconds") {
        REQUIRE(session.start_recording());
        std::vector<float> fill(256, 0.0f);
        ring.write(fill.data(), fill.size() * sizeof(float));
        REQUIRE(session.buffer_full());
        REQUIRE(session.buffered_seconds() == 256.0 / 16000);
    }
}
