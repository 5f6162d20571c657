#include "stt/error.hpp"

#include <format>

std::string_view to_string(SttErrorKind kind) {
    switch (kind) {
        case SttErrorKind::NotEnabled: return "not_enabled";
        case SttErrorKind::NoProviderConfigured: return "no_provider_configured";
        case SttErrorKind::RequestBuild: return "request_build";
        case SttErrorKind::Network: return "network";
        case SttErrorKind::ResponseRead: return "response_read";
        case SttErrorKind::HttpStatus: return "http_status";
        case SttErrorKind::Parse: return "parse";
        case SttErrorKind::EmptyTranscription: return "empty_transcription";
        case SttErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

SttError SttError::not_enabled() {
    return {.kind = SttErrorKind::NotEnabled, .message = "STT API is not enabled"};
}

SttError SttError::no_provider_configured() {
    return {.kind = SttErrorKind::NoProviderConfigured,
            .message = "No STT API provider configured"};
}

SttError SttError::request_build(const std::string& cause) {
    return {.kind = SttErrorKind::RequestBuild,
            .message = "Failed to build STT request: " + cause};
}

SttError SttError::network(const std::string& cause) {
    return {.kind = SttErrorKind::Network, .message = "Failed to send STT request: " + cause};
}

SttError SttError::response_read(const std::string& cause) {
    return {.kind = SttErrorKind::ResponseRead,
            .message = "Failed to read response body: " + cause};
}

SttError SttError::http_status(long status, std::string body) {
    auto message = std::format("STT API error ({}): {}", status, body);
    return {.kind = SttErrorKind::HttpStatus, .message = std::move(message),
            .status = status, .body = std::move(body)};
}

SttError SttError::parse(const std::string& cause, std::string body) {
    auto message = std::format("Failed to parse STT response: {}. Body: {}", cause, body);
    return {.kind = SttErrorKind::Parse, .message = std::move(message),
            .body = std::move(body)};
}

SttError SttError::empty_transcription() {
    return {.kind = SttErrorKind::EmptyTranscription,
            .message = "STT API returned empty transcription"};
}

SttError SttError::cancelled() {
    return {.kind = SttErrorKind::Cancelled, .message = "STT request cancelled"};
}
