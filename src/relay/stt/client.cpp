#include "stt/client.hpp"
#include "stt/request.hpp"
#include "wav_encoder.hpp"

#include <format>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    constexpr const char* ws = " \t\n\r\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

} // namespace

std::expected<std::string, SttError> parse_transcription_response(const HttpResponse& response) {
    if (!response.is_success()) {
        return std::unexpected(SttError::http_status(response.status, response.body));
    }

    std::string text;
    try {
        auto j = json::parse(response.body);
        if (!j.is_object()) {
            return std::unexpected(SttError::parse("expected a JSON object", response.body));
        }
        text = j.at("text").get<std::string>();
    } catch (const json::exception& e) {
        return std::unexpected(SttError::parse(e.what(), response.body));
    }

    text = trim(text);
    if (text.empty()) {
        return std::unexpected(SttError::empty_transcription());
    }
    return text;
}

SttClient::SttClient(HttpTransport& transport, bool verbose)
    : transport_(transport), verbose_(verbose) {}

std::expected<std::string, SttError>
SttClient::transcribe(const ResolvedProvider& resolved, std::span<const float> samples,
                      std::stop_token stop) {
    auto request = build_transcription_request(resolved.provider, resolved.api_key,
                                               resolved.model, samples, resolved.language);
    if (!request) {
        std::println(stderr, "stt: {}", request.error().message);
        return std::unexpected(request.error());
    }

    log(std::format("Sending STT request to {} (model: {}, language: {}, {:.1f}s audio)",
                    request->url, resolved.model, resolved.language.value_or("auto"),
                    static_cast<double>(samples.size()) / wav::kSampleRate));

    auto response = transport_.send(*request, stop);
    if (!response) {
        if (response.error().kind != SttErrorKind::Cancelled) {
            std::println(stderr, "stt: {}", response.error().message);
        }
        return std::unexpected(response.error());
    }

    if (!response->is_success()) {
        std::println(stderr, "stt: API error ({}): {}", response->status, response->body);
    } else {
        log("STT API response: " + response->body);
    }

    auto text = parse_transcription_response(*response);
    if (text) {
        log(std::format("STT transcription successful: {} chars", text->size()));
    }
    return text;
}

std::expected<std::string, SttError>
SttClient::transcribe_with_settings(const Settings& settings, std::span<const float> samples,
                                    std::stop_token stop) {
    auto resolved = resolve_provider(settings);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    return transcribe(*resolved, samples, stop);
}

void SttClient::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[stt-relay] {}", msg);
    }
}
