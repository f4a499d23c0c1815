#pragma once

#include "errors.h"
#include <string>
#include <cstdint>
#include <vector>
#include <optional>

namespace voxgate {

struct LoggingConfig {
    std::string level = "info";  ///< "debug" | "info" | "warn" | "error"
    std::string file;            ///< Empty = console only
};

struct AudioConfig {
    std::string input_device = "default";
    int sample_rate = 16000;
    int frame_ms = 20;
    /// Bounded capture -> pipeline queue; frames beyond this are dropped and counted
    size_t frame_queue_capacity = 64;
};

struct WakeConfig {
    std::string backend = "energy";    ///< "energy" | "udp"
    float threshold = 0.8f;            ///< Minimum WakeEvent confidence to leave ListeningForWake
    float energy_threshold = 0.05f;    ///< energy backend: RMS that counts as a hot frame
    int frames_required = 3;           ///< energy backend: consecutive hot frames before firing
    std::string udp_bind_ip = "127.0.0.1";
    int udp_port = 9730;
};

struct GuardrailConfig {
    int min_speech_ms = 400;                 ///< Speech required before verification is attempted
    int max_silence_ms = 1500;               ///< Silence tolerated before min_speech_ms is reached
    int end_of_utterance_silence_ms = 600;   ///< Trailing silence that closes the segment (0 = verify at min speech)
    int max_segment_ms = 15000;              ///< Hard cap on captured segment length
    float silence_rms_threshold = 0.01f;     ///< Frames below this RMS count as silence
    std::string challenge_phrase;            ///< Empty = disabled
};

struct VerificationConfig {
    /// Required; validate() refuses a config that leaves it unset
    std::optional<float> threshold;
    std::string owner_id = "owner";
    std::string voiceprint_path = "~/.voxgate/owner.voiceprint";
    std::string key_env_var = "VOXGATE_VOICE_KEY";
    int embedding_length = 32;
    int embedding_chunk_samples = 512;
    int min_extract_samples = 1600;          ///< Shorter segments fail extraction (100 ms @ 16 kHz)
    /// The digest extractor does not model voices; listening with it needs an explicit opt-in
    bool allow_placeholder_extractor = false;
};

struct CooldownConfig {
    int base_ms = 2000;
    int max_ms = 60000;
    int escalate_after = 3;           ///< Consecutive rejections before the duration starts doubling
    int rejection_window_ms = 60000;  ///< Rejections further apart than this restart the count
};

struct TimeoutsConfig {
    int extraction_ms = 2000;
    int asr_ms = 5000;
    int llm_ms = 8000;
    int transient_retries = 1;
};

struct ASRConfig {
    std::string model_path;
    std::string fallback_model_path;   ///< Optional second whisper model used below fallback_threshold
    std::string language = "en";
    bool use_gpu = true;
    float fallback_threshold = 0.7f;
    float min_confidence = 0.0f;       ///< Below this: LowConfidence (0 = disabled)
    std::string blank_sentinel = "[BLANK_AUDIO]";
};

struct RouterConfig {
    std::string fast_model = "haiku";
    std::string capable_model = "sonnet";
    float complexity_cutoff = 0.5f;
    float clarification_threshold = 0.5f;
    std::string system_prompt = "You are Jarvis, a helpful assistant.";
    std::string clarification_prompt = "Could you tell me a bit more about what you'd like me to do?";
};

struct LLMConfig {
    std::string endpoint = "http://localhost:11434/api/chat";
    float temperature = 0.7f;
    int connect_timeout_ms = 1000;
};

struct ToolGateConfig {
    int token_ttl_ms = 30000;
};

struct ToolsConfig {
    std::vector<std::string> enabled = {"log_note"};
    std::string notes_path = "~/.voxgate/notes.txt";
    std::vector<std::string> confirm;    ///< Tools that need a spoken yes before running
};

struct ConversationConfig {
    size_t max_turns = 6;
};

struct Config {
    LoggingConfig logging;
    AudioConfig audio;
    WakeConfig wake;
    GuardrailConfig guardrail;
    VerificationConfig verification;
    CooldownConfig cooldown;
    TimeoutsConfig timeouts;
    ASRConfig asr;
    RouterConfig router;
    LLMConfig llm;
    ToolGateConfig tool_gate;
    ToolsConfig tools;
    ConversationConfig conversation;

    /**
     * @brief Load config from a JSON file
     *
     * Missing or unparsable files log a warning and yield defaults; unset
     * fields keep their defaults. Paths beginning with ~ are expanded.
     */
    static Config load_from_file(const std::string& path);

    /// Same as load_from_file, from an in-memory JSON document
    static Config load_from_string(const std::string& json_text);

    /**
     * @brief Check invariants the pipeline relies on
     * @return ConfigError naming the first offending field
     */
    VoidResult validate() const;
};

} // namespace voxgate
