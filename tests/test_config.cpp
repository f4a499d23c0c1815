/**
 * Configuration, logging and audio front-end plumbing.
 * Asserts:
 * - Config loads section by section, keeps defaults for missing fields and
 *   refuses to validate without an explicit verification threshold.
 * - Secrets never survive log redaction.
 * - PCM files, wake detectors and guardrail accounting behave on raw frames.
 *
 * Run from build dir: ./test_config
 */

#include "audio_guardrail.h"
#include "config.h"
#include "logger.h"
#include "metrics.h"
#include "path_utils.h"
#include "pcm_file_source.h"
#include "utils.h"
#include "wake_detector.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace voxgate;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static AudioFrame make_frame(Sample amplitude) {
    AudioFrame f;
    f.samples.assign(SAMPLES_PER_FRAME, amplitude);
    f.sample_rate = DEFAULT_SAMPLE_RATE;
    return f;
}

int main() {
    // --- Defaults and validation ---
    Config defaults;
    ASSERT(!defaults.verification.threshold.has_value());
    ASSERT(defaults.validate().error_type() == ErrorType::ConfigError);
    ASSERT(defaults.conversation.max_turns == 6);
    ASSERT(defaults.wake.threshold == 0.8f);
    ASSERT(defaults.verification.key_env_var == "VOXGATE_VOICE_KEY");
    ASSERT(!defaults.verification.allow_placeholder_extractor);

    Config loaded = Config::load_from_string(R"({
        "logging": {"level": "debug"},
        "wake": {"backend": "udp", "threshold": 0.6, "udp_port": 9999},
        "guardrail": {"min_speech_ms": 300, "challenge_phrase": "open sesame"},
        "verification": {"threshold": 0.8, "owner_id": "alice", "voiceprint_path": "~/vp.json",
                         "allow_placeholder_extractor": true},
        "cooldown": {"base_ms": 500},
        "tools": {"enabled": ["log_note", 7, "other"]},
        "conversation": {"max_turns": 4},
        "unknown_section": {"ignored": true}
    })");
    ASSERT(loaded.logging.level == "debug");
    ASSERT(loaded.wake.backend == "udp");
    ASSERT(loaded.wake.threshold == 0.6f);
    ASSERT(loaded.wake.udp_port == 9999);
    ASSERT(loaded.wake.frames_required == 3);
    ASSERT(loaded.guardrail.min_speech_ms == 300);
    ASSERT(loaded.guardrail.max_silence_ms == 1500);
    ASSERT(loaded.guardrail.challenge_phrase == "open sesame");
    ASSERT(loaded.verification.threshold.has_value() && *loaded.verification.threshold == 0.8f);
    ASSERT(loaded.verification.owner_id == "alice");
    ASSERT(loaded.verification.allow_placeholder_extractor);
    ASSERT(loaded.cooldown.base_ms == 500);
    ASSERT(loaded.tools.enabled.size() == 2);
    ASSERT(loaded.conversation.max_turns == 4);
    ASSERT(loaded.validate().is_ok());

    const char* home = std::getenv("HOME");
    if (home) {
        ASSERT(loaded.verification.voiceprint_path == std::string(home) + "/vp.json");
    }

    // Unparsable JSON falls back to defaults
    Config broken = Config::load_from_string("{ not json");
    ASSERT(!broken.verification.threshold.has_value());
    ASSERT(broken.wake.backend == "energy");

    // Missing file falls back to defaults
    Config missing = Config::load_from_file("/nonexistent/voxgate.json");
    ASSERT(missing.audio.sample_rate == 16000);

    // Invariants
    Config bad = loaded;
    bad.verification.threshold = 1.5f;
    ASSERT(bad.validate().error_type() == ErrorType::ConfigError);
    bad = loaded;
    bad.wake.threshold = -0.1f;
    ASSERT(bad.validate().error_type() == ErrorType::ConfigError);
    bad = loaded;
    bad.guardrail.min_speech_ms = 0;
    ASSERT(bad.validate().error_type() == ErrorType::ConfigError);
    bad = loaded;
    bad.cooldown.max_ms = bad.cooldown.base_ms - 1;
    ASSERT(bad.validate().error_type() == ErrorType::ConfigError);
    bad = loaded;
    bad.timeouts.extraction_ms = 0;
    ASSERT(bad.validate().error_type() == ErrorType::ConfigError);
    bad = loaded;
    bad.timeouts.transient_retries = 3;
    ASSERT(bad.validate().error_type() == ErrorType::ConfigError);
    bad = loaded;
    bad.audio.frame_queue_capacity = 0;
    ASSERT(bad.validate().error_type() == ErrorType::ConfigError);

    // --- Paths and environment ---
    ASSERT(expand_path("") == "");
    ASSERT(expand_path("/abs/path") == "/abs/path");
    ASSERT(expand_path("~user/x") == "~user/x");
    ::setenv("VOXGATE_TEST_PRESENT", "value", 1);
    ::setenv("VOXGATE_TEST_EMPTY", "", 1);
    ::unsetenv("VOXGATE_TEST_ABSENT");
    auto missing_vars = missing_env_vars({"VOXGATE_TEST_PRESENT", "VOXGATE_TEST_EMPTY", "VOXGATE_TEST_ABSENT"});
    ASSERT(missing_vars.size() == 2);
    ASSERT(missing_vars[0] == "VOXGATE_TEST_EMPTY");
    ASSERT(missing_vars[1] == "VOXGATE_TEST_ABSENT");

    // --- Log redaction ---
    ASSERT(Logger::redact("secret=hunter2").find("hunter2") == std::string::npos);
    ASSERT(Logger::redact("VOXGATE_VOICE_KEY=abc123 started").find("abc123") == std::string::npos);
    ASSERT(Logger::redact("token: 0011aabb, owner alice").find("0011aabb") == std::string::npos);
    ASSERT(Logger::redact("token: 0011aabb, owner alice").find("owner alice") != std::string::npos);
    ASSERT(Logger::redact(R"({"ciphertext": "QUJDRA==", "owner_id": "alice"})").find("QUJDRA==") == std::string::npos);
    ASSERT(Logger::redact("Wake confidence 0.9") == "Wake confidence 0.9");
    ASSERT(Logger::parse_level("DEBUG") == LogLevel::DEBUG);
    ASSERT(Logger::parse_level("warning") == LogLevel::WARN);
    ASSERT(Logger::parse_level("nonsense") == LogLevel::INFO);

    // --- Metrics ---
    InMemoryMetrics metrics;
    metrics.increment("wake_detected");
    metrics.record("rejection_latency_ms", 120.0, {{"reason", "Timeout"}});
    metrics.record("rejection_latency_ms", 80.0, {{"reason", "GuardrailRejected"}});
    ASSERT(metrics.count("wake_detected") == 1);
    ASSERT(metrics.count("rejection_latency_ms") == 2);
    ASSERT(metrics.get("rejection_latency_ms").total == 200.0);
    ASSERT(metrics.get("rejection_latency_ms{reason=Timeout}").last == 120.0);
    ASSERT(metrics.count("never_recorded") == 0);
    ASSERT(metrics.summary().find("wake_detected count=1") != std::string::npos);

    // --- Blank transcripts ---
    ASSERT(utils::is_blank_transcript("", "[BLANK_AUDIO]"));
    ASSERT(utils::is_blank_transcript("  [BLANK_AUDIO]  ", "[BLANK_AUDIO]"));
    ASSERT(!utils::is_blank_transcript("take a note", "[BLANK_AUDIO]"));
    ASSERT(utils::contains_phrase("Open, Sesame!", "open sesame"));
    ASSERT(!utils::contains_phrase("reopen sesame", "open sesame"));

    // --- PCM files ---
    fs::path dir = fs::temp_directory_path() / ("voxgate_config_test_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    std::string pcm_path = (dir / "clip.raw").string();
    {
        std::ofstream out(pcm_path, std::ios::binary);
        // 1.5 frames: 320 samples of 0x0102, then 160 samples of -2
        for (int i = 0; i < SAMPLES_PER_FRAME; ++i) {
            out.put(static_cast<char>(0x02));
            out.put(static_cast<char>(0x01));
        }
        for (int i = 0; i < SAMPLES_PER_FRAME / 2; ++i) {
            out.put(static_cast<char>(0xFE));
            out.put(static_cast<char>(0xFF));
        }
    }
    auto pcm = read_pcm_file(pcm_path);
    ASSERT(pcm.is_ok());
    ASSERT(pcm.value().size() == static_cast<size_t>(SAMPLES_PER_FRAME + SAMPLES_PER_FRAME / 2));
    ASSERT(pcm.value().front() == 0x0102);
    ASSERT(pcm.value().back() == -2);
    ASSERT(read_pcm_file((dir / "absent.raw").string()).error_type() == ErrorType::IOError);
    {
        std::ofstream odd((dir / "odd.raw").string(), std::ios::binary);
        odd.put('x');
    }
    ASSERT(read_pcm_file((dir / "odd.raw").string()).error_type() == ErrorType::ParseError);

    PcmFileSource source(pcm_path, DEFAULT_SAMPLE_RATE, FRAME_SIZE_MS);
    ASSERT(source.open().is_ok());
    ASSERT(source.frames_remaining() == 2);
    AudioFrame frame;
    ASSERT(source.read_frame(frame));
    ASSERT(frame.samples.size() == static_cast<size_t>(SAMPLES_PER_FRAME));
    TimePoint first_timestamp = frame.timestamp;
    ASSERT(source.read_frame(frame));
    ASSERT(frame.samples.size() == static_cast<size_t>(SAMPLES_PER_FRAME));
    ASSERT(frame.samples[SAMPLES_PER_FRAME / 2 - 1] == -2);
    ASSERT(frame.samples[SAMPLES_PER_FRAME / 2] == 0);
    ASSERT(ms_between(first_timestamp, frame.timestamp) == FRAME_SIZE_MS);
    ASSERT(!source.read_frame(frame));
    fs::remove_all(dir);

    // --- Energy wake detector ---
    EnergyWakeDetector energy(0.05f, 3);
    AudioFrame loud = make_frame(8000);     // rms ~0.24
    AudioFrame quiet = make_frame(100);
    ASSERT(!energy.process(loud));
    ASSERT(!energy.process(loud));
    ASSERT(!energy.process(quiet));          // debounce restarts
    ASSERT(!energy.process(loud));
    ASSERT(!energy.process(loud));
    auto fired = energy.process(loud);
    ASSERT(fired.has_value());
    ASSERT(fired->confidence == 1.0f);
    ASSERT(!energy.process(loud));           // resets after firing

    AudioFrame medium = make_frame(2458);    // rms ~0.075 -> confidence ~0.75
    EnergyWakeDetector medium_detector(0.05f, 1);
    auto partial = medium_detector.process(medium);
    ASSERT(partial.has_value());
    ASSERT(partial->confidence > 0.7f && partial->confidence < 0.8f);

    // --- UDP wake payloads ---
    ASSERT(UdpWakeDetector::parse_confidence(R"({"event":"wake","confidence":0.92})") == 0.92f);
    ASSERT(UdpWakeDetector::parse_confidence("0.5") == 0.5f);
    ASSERT(UdpWakeDetector::parse_confidence("wake") == 1.0f);
    ASSERT(UdpWakeDetector::parse_confidence(R"({"confidence": 7})") == 1.0f);
    ASSERT(UdpWakeDetector::parse_confidence("-3") == 0.0f);

    // --- Guardrail accounting on raw frames ---
    GuardrailConfig guard_config;
    guard_config.min_speech_ms = 100;
    guard_config.max_silence_ms = 60;
    guard_config.end_of_utterance_silence_ms = 40;
    guard_config.max_segment_ms = 1000;
    guard_config.silence_rms_threshold = 0.01f;
    AudioGuardrail guardrail(guard_config);

    AudioFrame speech = make_frame(8000);
    AudioFrame silence = make_frame(0);
    ASSERT(guardrail.process(silence) == GuardrailStatus::Accumulating);
    ASSERT(guardrail.process(silence) == GuardrailStatus::Accumulating);
    ASSERT(guardrail.process(silence) == GuardrailStatus::Accumulating);
    ASSERT(guardrail.state().silence_ms == 60);
    ASSERT(guardrail.process(silence) == GuardrailStatus::Rejected);
    ASSERT(!guardrail.rejection_reason().empty());
    guardrail.reset();
    ASSERT(guardrail.state().is_zero());
    ASSERT(guardrail.segment().empty());

    for (int i = 0; i < 4; ++i) {
        ASSERT(guardrail.process(speech) == GuardrailStatus::Accumulating);
    }
    ASSERT(!guardrail.min_speech_met());
    ASSERT(guardrail.process(speech) == GuardrailStatus::Accumulating);
    ASSERT(guardrail.min_speech_met());
    ASSERT(guardrail.process(silence) == GuardrailStatus::Accumulating);
    ASSERT(guardrail.state().trailing_silence_ms == 20);
    ASSERT(guardrail.process(silence) == GuardrailStatus::Ready);
    AudioBuffer segment = guardrail.take_segment();
    ASSERT(segment.size() == static_cast<size_t>(7 * SAMPLES_PER_FRAME));
    ASSERT(guardrail.state().is_zero());

    ASSERT(!guardrail.has_challenge());
    ASSERT(guardrail.check_challenge("anything").is_ok());

    GuardrailConfig capped = guard_config;
    capped.max_segment_ms = 60;
    capped.max_silence_ms = 1000;
    AudioGuardrail short_cap(capped);
    short_cap.process(speech);
    short_cap.process(silence);
    ASSERT(short_cap.process(silence) == GuardrailStatus::Rejected);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
