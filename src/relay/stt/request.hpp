#pragma once

#include "settings.hpp"
#include "stt/error.hpp"

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

// One part of a multipart/form-data body. File parts carry a filename and a
// media type; text parts leave both empty.
struct FormPart {
    std::string name;
    std::string data;
    std::string filename;
    std::string content_type;

    bool is_file() const { return !filename.empty(); }
};

// Transport-independent description of a POST with a multipart body.
struct TranscriptionRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::vector<FormPart> parts;

    const FormPart* find_part(const std::string& name) const;
    std::optional<std::string> header(const std::string& name) const;

    void add_text(std::string name, std::string value);
    std::expected<void, SttError> add_file(std::string name, std::string data,
                                           std::string filename, std::string content_type);
};

// "type/subtype" with RFC 7230 token characters on both sides.
bool is_valid_media_type(const std::string& media_type);

// Strips every trailing '/' from the base URL and appends /audio/transcriptions.
std::string transcription_endpoint(const std::string& base_url);

// Builds POST {base_url}/audio/transcriptions carrying the WAV-encoded samples.
// `language` is dropped when empty or "auto". Authorization is attached only
// for a non-blank API key.
std::expected<TranscriptionRequest, SttError>
build_transcription_request(const SttApiProvider& provider, const std::string& api_key,
                            const std::string& model, std::span<const float> samples,
                            const std::optional<std::string>& language);
