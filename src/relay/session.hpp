#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

enum class SessionState { Idle, Recording, Transcribing };

// Recording lifecycle for one utterance: Idle -> Recording -> Transcribing -> Idle.
class Session {
public:
    Session(RingBuffer& ring_buf, AudioCapture& capture, uint32_t sample_rate);

    bool start_recording();
    // Returns captured samples if recording was active, empty if not.
    std::vector<float> stop_recording();
    void set_idle();

    SessionState state() const { return state_; }
    double recording_duration() const;
    // Buffered audio in seconds.
    double buffered_seconds() const;
    bool buffer_full() const { return ring_buf_.available() >= ring_buf_.capacity(); }

private:
    RingBuffer& ring_buf_;
    AudioCapture& capture_;
    uint32_t sample_rate_;
    SessionState state_ = SessionState::Idle;
    std::chrono::steady_clock::time_point record_start_;
};
