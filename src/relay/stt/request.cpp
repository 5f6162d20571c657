#include "stt/request.hpp"
#include "wav_encoder.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace {

bool is_token_char(unsigned char c) {
    if (std::isalnum(c)) return true;
    return std::string_view("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) !=
           std::string_view::npos;
}

bool is_token(std::string_view s) {
    return !s.empty() && std::ranges::all_of(s, [](char c) {
        return is_token_char(static_cast<unsigned char>(c));
    });
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\n\r\f\v") == std::string::npos;
}

} // namespace

const FormPart* TranscriptionRequest::find_part(const std::string& name) const {
    for (auto& p : parts) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

std::optional<std::string> TranscriptionRequest::header(const std::string& name) const {
    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), ::tolower);
        return s;
    };
    auto wanted = lower(name);
    for (auto& [key, value] : headers) {
        if (lower(key) == wanted) return value;
    }
    return std::nullopt;
}

void TranscriptionRequest::add_text(std::string name, std::string value) {
    parts.push_back(FormPart{.name = std::move(name), .data = std::move(value)});
}

std::expected<void, SttError> TranscriptionRequest::add_file(std::string name, std::string data,
                                                             std::string filename,
                                                             std::string content_type) {
    if (!is_valid_media_type(content_type)) {
        return std::unexpected(SttError::request_build("invalid media type '" + content_type + "'"));
    }
    if (filename.empty()) {
        return std::unexpected(SttError::request_build("file part '" + name + "' has no filename"));
    }
    parts.push_back(FormPart{
        .name = std::move(name),
        .data = std::move(data),
        .filename = std::move(filename),
        .content_type = std::move(content_type),
    });
    return {};
}

bool is_valid_media_type(const std::string& media_type) {
    auto slash = media_type.find('/');
    if (slash == std::string::npos) return false;
    std::string_view view(media_type);
    return is_token(view.substr(0, slash)) && is_token(view.substr(slash + 1));
}

std::string transcription_endpoint(const std::string& base_url) {
    auto end = base_url.find_last_not_of('/');
    std::string base = end == std::string::npos ? std::string() : base_url.substr(0, end + 1);
    return base + "/audio/transcriptions";
}

std::expected<TranscriptionRequest, SttError>
build_transcription_request(const SttApiProvider& provider, const std::string& api_key,
                            const std::string& model, std::span<const float> samples,
                            const std::optional<std::string>& language) {
    TranscriptionRequest req;
    req.url = transcription_endpoint(provider.base_url);

    auto wav_data = wav::encode(samples);
    auto file = req.add_file("file", std::string(wav_data.begin(), wav_data.end()),
                             "audio.wav", "audio/wav");
    if (!file) {
        return std::unexpected(file.error());
    }

    req.add_text("model", model);

    if (language && !language->empty() && *language != "auto") {
        req.add_text("language", *language);
    }

    req.add_text("response_format", "json");

    if (!is_blank(api_key)) {
        req.headers.emplace_back("Authorization", "Bearer " + api_key);
    }

    return req;
}
