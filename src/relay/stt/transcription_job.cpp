#include "stt/transcription_job.hpp"

#include <exception>
#include <print>

TranscriptionJob::TranscriptionJob(SttClient& client) : client_(client) {}

TranscriptionJob::~TranscriptionJob() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool TranscriptionJob::start(Settings snapshot, std::vector<float> samples,
                             CompletionCallback on_complete) {
    // A completion callback runs on the worker, which cannot join itself.
    if (worker_.get_id() == std::this_thread::get_id()) return false;
    {
        std::lock_guard lock(mutex_);
        if (running_) return false;
        running_ = true;
        result_.reset();
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    worker_ = std::jthread([this, snapshot = std::move(snapshot), samples = std::move(samples),
                            on_complete = std::move(on_complete)](std::stop_token stop) {
        auto result = client_.transcribe_with_settings(snapshot, samples, stop);

        if (stop.stop_requested()) {
            finish(std::unexpected(SttError::cancelled()));
            return;
        }

        finish(result);
        if (!on_complete) return;
        try {
            on_complete(result);
        } catch (const std::exception& e) {
            std::println(stderr, "stt: completion callback failed: {}", e.what());
        }
    });
    return true;
}

void TranscriptionJob::cancel() {
    worker_.request_stop();
}

bool TranscriptionJob::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return !running_; });
}

void TranscriptionJob::wait() {
    std::unique_lock lock(mutex_);
    done_cv_.wait(lock, [this] { return !running_; });
}

bool TranscriptionJob::running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

std::optional<TranscriptionJob::Result> TranscriptionJob::result() const {
    std::lock_guard lock(mutex_);
    return result_;
}

void TranscriptionJob::finish(Result result) {
    {
        std::lock_guard lock(mutex_);
        result_ = std::move(result);
        running_ = false;
    }
    done_cv_.notify_all();
}
