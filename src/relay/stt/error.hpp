#pragma once

#include <string>
#include <string_view>

enum class SttErrorKind {
    NotEnabled,
    NoProviderConfigured,
    RequestBuild,
    Network,
    ResponseRead,
    HttpStatus,
    Parse,
    EmptyTranscription,
    Cancelled,
};

std::string_view to_string(SttErrorKind kind);

// Failure of one transcription attempt. `message` is user-facing; status and
// body are set for HttpStatus and Parse so the raw response can be inspected.
struct SttError {
    SttErrorKind kind;
    std::string message;
    long status = 0;
    std::string body;

    static SttError not_enabled();
    static SttError no_provider_configured();
    static SttError request_build(const std::string& cause);
    static SttError network(const std::string& cause);
    static SttError response_read(const std::string& cause);
    static SttError http_status(long status, std::string body);
    static SttError parse(const std::string& cause, std::string body);
    static SttError empty_transcription();
    static SttError cancelled();
};
