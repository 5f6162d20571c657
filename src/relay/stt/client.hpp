#pragma once

#include "settings.hpp"
#include "stt/error.hpp"
#include "stt/http_transport.hpp"
#include "stt/provider.hpp"

#include <expected>
#include <span>
#include <stop_token>
#include <string>

// Extracts the transcript from a completed exchange: non-2xx is an error with
// the raw body, the body must be a JSON object with a string "text", and the
// trimmed text must not be empty.
std::expected<std::string, SttError> parse_transcription_response(const HttpResponse& response);

// Client for OpenAI-compatible /audio/transcriptions endpoints. Holds no
// per-request state; every call is a single attempt.
class SttClient {
public:
    explicit SttClient(HttpTransport& transport, bool verbose = false);

    std::expected<std::string, SttError>
        transcribe(const ResolvedProvider& resolved, std::span<const float> samples,
                   std::stop_token stop = {});

    // Resolves the active provider from `settings`, then transcribes.
    std::expected<std::string, SttError>
        transcribe_with_settings(const Settings& settings, std::span<const float> samples,
                                 std::stop_token stop = {});

private:
    void log(const std::string& msg);

    HttpTransport& transport_;
    bool verbose_;
};
