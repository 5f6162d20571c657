#pragma once

#include "settings.hpp"
#include "stt/client.hpp"
#include "stt/error.hpp"

#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// One transcription attempt on a worker thread. The job owns its settings
// snapshot and samples; cancel() aborts the in-flight request and the result
// becomes SttErrorKind::Cancelled without invoking the completion callback.
//
// The completion callback runs on the worker after the result is published,
// so it may call wait() or result(). wait() can return before the callback
// has finished. A std::exception thrown by the callback is logged.
class TranscriptionJob {
public:
    using Result = std::expected<std::string, SttError>;
    using CompletionCallback = std::function<void(const Result&)>;

    explicit TranscriptionJob(SttClient& client);
    ~TranscriptionJob();

    TranscriptionJob(const TranscriptionJob&) = delete;
    TranscriptionJob& operator=(const TranscriptionJob&) = delete;

    // Returns false if a previous start() has not finished, or when called
    // from the completion callback.
    bool start(Settings snapshot, std::vector<float> samples,
               CompletionCallback on_complete = {});
    void cancel();

    // True once the attempt has finished (successfully, with an error, or cancelled).
    bool wait_for(std::chrono::milliseconds timeout);
    void wait();

    bool running() const;
    std::optional<Result> result() const;

private:
    void finish(Result result);

    SttClient& client_;

    mutable std::mutex mutex_;
    std::condition_variable done_cv_;
    bool running_ = false;
    std::optional<Result> result_;

    std::jthread worker_;
};
