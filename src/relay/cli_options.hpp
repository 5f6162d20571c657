#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Ten minutes of 16 kHz 16-bit WAV stays below the 25 MB upload limit of
// the hosted transcription APIs.
constexpr uint32_t kMaxRecordSeconds = 600;
constexpr long kMaxTimeoutSeconds = 3600;

struct CliOptions {
    bool verbose = false;
    bool help = false;
    std::string config_path;
    // Command name followed by its arguments.
    std::vector<std::string> args;
};

std::expected<CliOptions, std::string> parse_cli(int argc, const char* const* argv);

struct TranscribeOptions {
    std::string file;
    uint32_t max_seconds = 120;
    long timeout_s = 0;
};

// Arguments after "transcribe".
std::expected<TranscribeOptions, std::string>
parse_transcribe_options(std::span<const std::string> args);

// A whole decimal number in [min, max]; signs and trailing text are rejected
// rather than wrapped or truncated.
std::expected<long long, std::string> parse_bounded(std::string_view text, long long min,
                                                    long long max);
