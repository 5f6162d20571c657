#pragma once

// Microphone source feeding the ring buffer with mono F32 samples.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
};
