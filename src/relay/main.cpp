#include "cli_options.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "ring_buffer.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "settings_commands.hpp"
#include "stt/client.hpp"
#include "stt/curl_transport.hpp"
#include "stt/transcription_job.hpp"
#include "wav_encoder.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <expected>
#include <fstream>
#include <poll.h>
#include <print>
#include <span>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
    g_interrupted = 1;
}

void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <command> [args]", prog);
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH   Settings file path");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "  -h, --help          Show this help");
    std::println(stderr, "Commands:");
    std::println(stderr, "  settings                     Show STT API settings");
    std::println(stderr, "  enable | disable             Turn the STT API on or off");
    std::println(stderr, "  provider <id>                Select the active provider");
    std::println(stderr, "  base-url <id> <url>          Set the base URL of the custom provider");
    std::println(stderr, "  api-key <id> <key>           Set a provider's API key");
    std::println(stderr, "  model <id> <model>           Set a provider's model");
    std::println(stderr, "  language <code|auto>         Set the transcription language");
    std::println(stderr, "  transcribe [--file PATH] [--max-seconds N] [--timeout S]");
    std::println(stderr, "                               N in 1..{}, S in 0..{} (0 = no limit)",
                 kMaxRecordSeconds, kMaxTimeoutSeconds);
    std::println(stderr, "                               Record (or read raw f32le samples) and transcribe");
}

std::string mask_key(const std::string& key) {
    if (key.empty()) return "(none)";
    if (key.size() <= 8) return std::string(key.size(), '*');
    return key.substr(0, 3) + "..." + key.substr(key.size() - 4);
}

int report(const std::expected<void, std::string>& result) {
    if (!result) {
        std::println(stderr, "Error: {}", result.error());
        return 1;
    }
    std::println("OK");
    return 0;
}

int print_settings(const SettingsStore& store) {
    auto snapshot = store.get();
    const auto& stt = snapshot.stt_api;

    std::println("Enabled:  {}", stt.enabled ? "yes" : "no");
    std::println("Provider: {}", stt.provider_id);
    std::println("Language: {}", snapshot.selected_language);
    std::println("Providers:");
    for (auto& p : stt.providers) {
        auto key = stt.api_keys.find(p.id);
        auto model = stt.models.find(p.id);
        std::println("  {} {} ({}){}", p.id == stt.provider_id ? '*' : ' ', p.id, p.label,
                     p.allow_base_url_edit ? " [editable]" : "");
        std::println("      url:   {}", p.base_url);
        std::println("      key:   {}", key != stt.api_keys.end() ? mask_key(key->second) : "(none)");
        std::println("      model: {}", model != stt.models.end() ? model->second : kDefaultSttModel);
    }
    return 0;
}

// Raw 32-bit float little-endian mono samples at 16 kHz.
std::expected<std::vector<float>, std::string> read_raw_samples(const std::string& path) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path);
    }
    auto size = static_cast<size_t>(f.tellg());
    if (size % sizeof(float) != 0) {
        std::println(stderr, "transcribe: {} has {} trailing bytes, ignoring them",
                     path, size % sizeof(float));
    }

    std::vector<float> samples(size / sizeof(float));
    f.seekg(0);
    if (!f.read(reinterpret_cast<char*>(samples.data()),
                static_cast<std::streamsize>(samples.size() * sizeof(float)))) {
        return std::unexpected("read failed: " + path);
    }
    return samples;
}

// Records until Enter, Ctrl-C, or the ring buffer is full.
std::expected<std::vector<float>, std::string> record_from_microphone(uint32_t max_seconds,
                                                                       bool verbose) {
    RingBuffer ring(RingBuffer::bytes_for(max_seconds, wav::kSampleRate));
    PipeWireCapture capture(ring, wav::kSampleRate);
    Session session(ring, capture, wav::kSampleRate);

    if (!session.start_recording()) {
        return std::unexpected("failed to start recording");
    }
    std::println(stderr, "Recording... press Enter to stop ({}s max)", max_seconds);

    while (!g_interrupted && !session.buffer_full()) {
        pollfd pfd{.fd = STDIN_FILENO, .events = POLLIN, .revents = 0};
        int ret = poll(&pfd, 1, 100);
        if (ret > 0) {
            char line[256];
            [[maybe_unused]] auto n = ::read(STDIN_FILENO, line, sizeof(line));
            break;
        }
        if (ret < 0 && errno != EINTR) {
            std::println(stderr, "transcribe: poll failed: {}", std::strerror(errno));
            break;
        }
    }

    auto samples = session.stop_recording();
    session.set_idle();

    if (capture.overflowed()) {
        std::println(stderr, "audio: recording reached {}s, later audio was dropped", max_seconds);
    }
    if (g_interrupted) {
        return std::unexpected("recording interrupted");
    }
    if (verbose) {
        std::println(stderr, "[stt-relay] Recorded {:.1f}s audio",
                     static_cast<double>(samples.size()) / wav::kSampleRate);
    }
    return samples;
}

int run_transcribe(const SettingsStore& store, const TranscribeOptions& opts, bool verbose) {
    // One snapshot for the whole attempt; later edits do not affect it.
    auto snapshot = store.get();

    auto samples = opts.file.empty() ? record_from_microphone(opts.max_seconds, verbose)
                                     : read_raw_samples(opts.file);
    if (!samples) {
        std::println(stderr, "Error: {}", samples.error());
        return 1;
    }
    if (samples->empty()) {
        std::println(stderr, "Error: no audio captured");
        return 1;
    }

    CurlTransport transport(0, opts.timeout_s);
    SttClient client(transport, verbose);
    TranscriptionJob job(client);
    job.start(std::move(snapshot), std::move(*samples));

    while (!job.wait_for(std::chrono::milliseconds(100))) {
        if (g_interrupted) {
            job.cancel();
            job.wait();
            break;
        }
    }

    auto result = job.result();
    if (!result || !result->has_value()) {
        std::println(stderr, "Error: {}",
                     result ? result->error().message : SttError::cancelled().message);
        return 1;
    }

    std::println("{}", result->value());
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto cli = parse_cli(argc, argv);
    if (!cli) {
        std::println(stderr, "Error: {}", cli.error());
        usage(argv[0]);
        return 1;
    }
    if (cli->help) {
        usage(argv[0]);
        return 0;
    }

    bool verbose = cli->verbose;
    std::string config_path = cli->config_path;
    const auto& args = cli->args;

    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    if (config_path.empty()) {
        config_path = Settings::default_path();
        if (config_path.empty()) {
            std::println(stderr, "Error: cannot determine settings path, pass --config");
            return 1;
        }
    }
    if (verbose) {
        std::println(stderr, "[stt-relay] Using settings {}", config_path);
    }

    SettingsStore store(config_path);
    const auto& command = args[0];
    auto need = [&](size_t n) {
        if (args.size() == n + 1) return true;
        std::println(stderr, "{}: expected {} argument(s)", command, n);
        usage(argv[0]);
        return false;
    };

    if (command == "settings") {
        return print_settings(store);
    } else if (command == "enable" || command == "disable") {
        return report(settings_cmd::set_stt_api_enabled(store, command == "enable"));
    } else if (command == "provider") {
        if (!need(1)) return 1;
        return report(settings_cmd::set_stt_api_provider(store, args[1]));
    } else if (command == "base-url") {
        if (!need(2)) return 1;
        return report(settings_cmd::set_stt_api_base_url(store, args[1], args[2]));
    } else if (command == "api-key") {
        if (!need(2)) return 1;
        return report(settings_cmd::set_stt_api_key(store, args[1], args[2]));
    } else if (command == "model") {
        if (!need(2)) return 1;
        return report(settings_cmd::set_stt_api_model(store, args[1], args[2]));
    } else if (command == "language") {
        if (!need(1)) return 1;
        return report(settings_cmd::set_selected_language(store, args[1]));
    } else if (command == "transcribe") {
        auto opts = parse_transcribe_options(std::span(args).subspan(1));
        if (!opts) {
            std::println(stderr, "transcribe: {}", opts.error());
            return 1;
        }

        struct sigaction sa {};
        sa.sa_handler = on_interrupt;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);

        return run_transcribe(store, *opts, verbose);
    }

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
