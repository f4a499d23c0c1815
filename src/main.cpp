#include "asr_router.h"
#include "audio_capture.h"
#include "config.h"
#include "continuous_listener.h"
#include "embedding_extractor.h"
#include "llm_backend.h"
#include "logger.h"
#include "metrics.h"
#include "path_utils.h"
#include "pcm_file_source.h"
#include "tool_gate.h"
#include "tools/log_note_tool.h"
#include "voice_agent.h"
#include "voiceprint_store.h"
#include "wake_detector.h"
#include "whisper_recognizer.h"
#include <atomic>
#include <csignal>
#include <iostream>
#include <map>
#include <sstream>

namespace voxgate {

static std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

namespace {

constexpr int64_t METRICS_LOG_INTERVAL_MS = 30000;

void print_usage() {
    std::cerr << "Usage:\n"
              << "  voxgate enroll --audio FILE.raw --owner NAME [--config FILE]\n"
              << "  voxgate listen [--config FILE] [--audio FILE.raw]\n"
              << "  voxgate --list-devices\n"
              << "Audio files are headerless 16-bit little-endian mono PCM.\n";
}

/// --flag value pairs after the subcommand; returns false on a dangling flag
bool parse_flags(int argc, char* argv[], int first, std::map<std::string, std::string>& flags) {
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return false;
        }
        flags[arg.substr(2)] = argv[++i];
    }
    return true;
}

std::string flag_or(const std::map<std::string, std::string>& flags, const std::string& name,
                    const std::string& fallback) {
    auto it = flags.find(name);
    return it == flags.end() ? fallback : it->second;
}

Config load_config(const std::map<std::string, std::string>& flags) {
    Config config = Config::load_from_file(flag_or(flags, "config", "config/voxgate.json"));
    // Re-open the logger with the configured level and file sink
    Logger::shutdown();
    Logger::initialize(Logger::parse_level(config.logging.level), expand_path(config.logging.file));
    return config;
}

/// Report every missing required variable before anything touches the key
bool audit_environment(const Config& config) {
    auto missing = missing_env_vars({config.verification.key_env_var});
    for (const auto& name : missing) {
        Logger::error("Required environment variable not set: " + name);
    }
    return missing.empty();
}

std::shared_ptr<EmbeddingExtractor> make_extractor(const Config& config) {
    return std::make_shared<DigestEmbeddingExtractor>(config.verification.embedding_length,
                                                      config.verification.embedding_chunk_samples,
                                                      config.verification.min_extract_samples);
}

int run_enroll(const std::map<std::string, std::string>& flags) {
    Config config = load_config(flags);
    std::string audio_path = flag_or(flags, "audio", "");
    std::string owner = flag_or(flags, "owner", config.verification.owner_id);
    if (audio_path.empty()) {
        print_usage();
        return 2;
    }
    if (!audit_environment(config)) {
        return 1;
    }

    auto key = VoiceKey::from_env(config.verification.key_env_var);
    if (!key) {
        Logger::error("Cannot enroll: " + key.error().message);
        return 1;
    }

    auto samples = read_pcm_file(expand_path(audio_path));
    if (!samples) {
        Logger::error(samples.error().message);
        return 1;
    }

    auto extractor = make_extractor(config);
    auto embedding = extractor->extract(samples.value());
    if (!embedding) {
        Logger::error("Embedding extraction failed: " + embedding.error().message);
        return 1;
    }

    VoiceprintStore store(config.verification.voiceprint_path);
    auto enrolled = store.enroll(owner, embedding.value(), key.value());
    if (!enrolled) {
        Logger::error("Enrollment failed: " + enrolled.error().message);
        return 1;
    }
    Logger::info("Enrolled " + owner + " at " + store.path() + " (key " + key.value().fingerprint() + ")");
    return 0;
}

std::shared_ptr<SpeechRecognizer> make_recognizer(const Config& config, std::shared_ptr<MetricsSink> metrics) {
    auto primary = std::make_shared<WhisperRecognizer>(config.asr, config.asr.model_path, "whisper");
    std::shared_ptr<SpeechRecognizer> fallback;
    if (!config.asr.fallback_model_path.empty()) {
        fallback = std::make_shared<WhisperRecognizer>(config.asr, config.asr.fallback_model_path, "whisper_fallback");
    }
    return std::make_shared<AsrRouter>(primary, fallback, config.asr, metrics);
}

std::shared_ptr<ToolRegistry> make_registry(const Config& config) {
    auto registry = std::make_shared<ToolRegistry>();
    for (const auto& name : config.tools.enabled) {
        if (name == "log_note") {
            if (!register_log_note_tool(*registry, config.tools.notes_path)) {
                Logger::warn("Tool registered twice: " + name);
            }
        } else {
            Logger::warn("Unknown tool in tools.enabled: " + name);
        }
    }
    for (const auto& name : config.tools.confirm) {
        if (!registry->require_confirmation(name)) {
            Logger::warn("tools.confirm names a tool that is not enabled: " + name);
        }
    }
    return registry;
}

void log_response(const Result<AgentResponse>& response) {
    if (!response) {
        Logger::warn("[Agent] Utterance dropped: " + std::string(error_type_name(response.error_type())) +
                     ": " + response.error().message);
        return;
    }
    const auto& r = response.value();
    std::ostringstream oss;
    oss << "[Agent] intent=" << r.intent.label << " tier=" << model_tier_name(r.decision.model_tier)
        << " model=" << r.decision.model_name << " reply=\"" << r.reply_text << "\"";
    Logger::info(oss.str());
    for (const auto& outcome : r.tool_outcomes) {
        if (outcome.dispatched) {
            Logger::info("[Agent] tool " + outcome.call.name + (outcome.result.success ? " ok" : " failed"));
        } else {
            Logger::warn("[Agent] tool " + outcome.call.name + " denied: " + outcome.error.message);
        }
    }
}

int run_listen(const std::map<std::string, std::string>& flags) {
    Config config = load_config(flags);
    auto valid = config.validate();
    if (!valid) {
        Logger::error("Invalid config: " + valid.error().message);
        return 1;
    }
    if (!audit_environment(config)) {
        return 1;
    }
    if (!config.verification.allow_placeholder_extractor) {
        Logger::error("The digest embedding extractor does not discriminate voices; set "
                      "verification.allow_placeholder_extractor to listen with it anyway");
        return 1;
    }
    Logger::warn("Using the digest embedding extractor: a different phrase from the owner is rejected "
                 "and only a replay of the enrollment audio verifies");

    auto key = VoiceKey::from_env(config.verification.key_env_var);
    if (!key) {
        Logger::error(key.error().message);
        return 1;
    }

    VoiceprintStore store(config.verification.voiceprint_path);
    auto voiceprint = store.read();
    if (!voiceprint) {
        Logger::error("No usable voiceprint at " + store.path() + ": " + voiceprint.error().message);
        return 1;
    }
    auto enrolled = VoiceprintStore::open(voiceprint.value(), key.value());
    if (!enrolled) {
        Logger::error("Cannot unlock voiceprint: " + enrolled.error().message);
        return 1;
    }
    const std::string owner = voiceprint.value().owner_id;

    auto metrics = std::make_shared<InMemoryMetrics>();
    auto tokens = std::make_shared<TokenAuthority>(config.tool_gate.token_ttl_ms);
    auto recognizer = make_recognizer(config, metrics);

    std::shared_ptr<WakeDetector> wake;
    std::shared_ptr<UdpWakeDetector> udp_wake;
    if (config.wake.backend == "udp") {
        udp_wake = std::make_shared<UdpWakeDetector>(config.wake.udp_bind_ip, config.wake.udp_port);
        auto started = udp_wake->start();
        if (!started) {
            Logger::error(started.error().message);
            return 1;
        }
        wake = udp_wake;
    } else {
        wake = std::make_shared<EnergyWakeDetector>(config.wake.energy_threshold, config.wake.frames_required);
    }

    ListenerDeps listener_deps;
    listener_deps.wake_detector = wake;
    listener_deps.extractor = make_extractor(config);
    listener_deps.verifier = std::make_shared<SpeakerVerifier>(*config.verification.threshold);
    listener_deps.tokens = tokens;
    if (!config.guardrail.challenge_phrase.empty()) {
        listener_deps.challenge_recognizer = recognizer;
    }
    listener_deps.metrics = metrics;
    listener_deps.enrolled_embedding = enrolled.value();
    ContinuousListener listener(config, listener_deps);

    auto registry = make_registry(config);
    AgentDeps agent_deps;
    agent_deps.recognizer = recognizer;
    agent_deps.llm = std::make_shared<HttpLlmBackend>(config.llm);
    agent_deps.registry = registry;
    auto gate = std::make_shared<ToolGate>(registry, tokens, owner, metrics);
    gate->set_confirmation_prompt([](const std::string& question) {
        std::cout << question << " " << std::flush;
        std::string answer;
        std::getline(std::cin, answer);
        return answer;
    });
    agent_deps.gate = gate;
    agent_deps.metrics = metrics;
    VoiceAgent agent(config, agent_deps);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::info("Listening for " + owner + " (wake backend: " + config.wake.backend + ")");

    std::string audio_path = flag_or(flags, "audio", "");
    int result = 0;
    if (!audio_path.empty()) {
        // Offline replay: frames go through the listener synchronously, in order
        PcmFileSource source(expand_path(audio_path), config.audio.sample_rate, config.audio.frame_ms);
        auto opened = source.open();
        if (!opened) {
            Logger::error(opened.error().message);
            result = 1;
        } else {
            AudioFrame frame;
            while (g_running && source.read_frame(frame)) {
                ListenerEvent event = listener.process_frame(frame);
                if (event.type == ListenerEventType::Verified && event.utterance) {
                    log_response(agent.handle(*event.utterance));
                }
            }
        }
    } else {
        AudioCapture capture;
        auto started = capture.start(config.audio.input_device, config.audio.sample_rate, config.audio.frame_ms);
        if (!started) {
            Logger::error(started.error().message);
            result = 1;
        } else {
            listener.start(
                [&agent](const VerifiedUtterance& utterance) { log_response(agent.handle(utterance)); },
                [](const Rejection& rejection) {
                    Logger::info(std::string("[Listener] Rejected (") + error_type_name(rejection.reason) +
                                 "), cooldown " + std::to_string(rejection.cooldown_ms) + " ms");
                });

            TimePoint last_summary = Clock::now();
            AudioFrame frame;
            while (g_running) {
                if (!capture.read_frame(frame)) {
                    Logger::error("Audio capture stopped");
                    result = 1;
                    break;
                }
                listener.push_frame(frame);
                if (ms_since(last_summary) >= METRICS_LOG_INTERVAL_MS) {
                    Logger::info("Metrics:\n" + metrics->summary());
                    last_summary = Clock::now();
                }
            }
            listener.stop();
            capture.stop();
        }
    }

    if (udp_wake) udp_wake->stop();
    Logger::info("Shutting down\nMetrics:\n" + metrics->summary());
    return result;
}

} // anonymous namespace

} // namespace voxgate

int main(int argc, char* argv[]) {
    voxgate::Logger::initialize(voxgate::LogLevel::INFO);

    if (argc < 2) {
        voxgate::print_usage();
        voxgate::Logger::shutdown();
        return 2;
    }

    std::string command = argv[1];
    int result = 2;
    if (command == "--list-devices") {
        voxgate::AudioCapture::list_devices();
        result = 0;
    } else {
        std::map<std::string, std::string> flags;
        if (!voxgate::parse_flags(argc, argv, 2, flags)) {
            voxgate::print_usage();
        } else if (command == "enroll") {
            result = voxgate::run_enroll(flags);
        } else if (command == "listen") {
            result = voxgate::run_listen(flags);
        } else {
            voxgate::print_usage();
        }
    }

    voxgate::Logger::shutdown();
    return result;
}
