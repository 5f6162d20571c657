#include "cli_options.hpp"

#include <charconv>
#include <format>

std::expected<long long, std::string> parse_bounded(std::string_view text, long long min,
                                                    long long max) {
    long long value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value < min || value > max) {
        return std::unexpected(
            std::format("expected a whole number between {} and {}, got '{}'", min, max, text));
    }
    return value;
}

std::expected<CliOptions, std::string> parse_cli(int argc, const char* const* argv) {
    CliOptions opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                return std::unexpected(arg + ": expected a settings file path");
            }
            opts.config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            opts.args.push_back(std::move(arg));
        }
    }
    return opts;
}

std::expected<TranscribeOptions, std::string>
parse_transcribe_options(std::span<const std::string> args) {
    TranscribeOptions opts;
    for (size_t i = 0; i < args.size(); i++) {
        const auto& arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "--file") {
            if (!has_value) return std::unexpected("--file: expected a path");
            opts.file = args[++i];
        } else if (arg == "--max-seconds") {
            if (!has_value) return std::unexpected("--max-seconds: expected a value");
            auto n = parse_bounded(args[++i], 1, kMaxRecordSeconds);
            if (!n) return std::unexpected("--max-seconds: " + n.error());
            opts.max_seconds = static_cast<uint32_t>(*n);
        } else if (arg == "--timeout") {
            if (!has_value) return std::unexpected("--timeout: expected a value");
            auto n = parse_bounded(args[++i], 0, kMaxTimeoutSeconds);
            if (!n) return std::unexpected("--timeout: " + n.error());
            opts.timeout_s = static_cast<long>(*n);
        } else {
            return std::unexpected("unknown argument " + arg);
        }
    }
    return opts;
}
