#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

/// Apply full JSON config (all sections) into cfg. Unknown keys are ignored.
void apply_json_to_config(voxgate::Config& cfg, const json& j) {
    if (j.contains("logging")) {
        auto& l = j["logging"];
        if (l.contains("level")) cfg.logging.level = l["level"];
        if (l.contains("file")) cfg.logging.file = l["file"];
    }

    if (j.contains("audio")) {
        auto& a = j["audio"];
        if (a.contains("input_device")) cfg.audio.input_device = a["input_device"];
        if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"];
        if (a.contains("frame_ms")) cfg.audio.frame_ms = a["frame_ms"];
        if (a.contains("frame_queue_capacity")) cfg.audio.frame_queue_capacity = a["frame_queue_capacity"];
    }

    if (j.contains("wake")) {
        auto& w = j["wake"];
        if (w.contains("backend")) cfg.wake.backend = w["backend"];
        if (w.contains("threshold")) cfg.wake.threshold = w["threshold"];
        if (w.contains("energy_threshold")) cfg.wake.energy_threshold = w["energy_threshold"];
        if (w.contains("frames_required")) cfg.wake.frames_required = w["frames_required"];
        if (w.contains("udp_bind_ip")) cfg.wake.udp_bind_ip = w["udp_bind_ip"];
        if (w.contains("udp_port")) cfg.wake.udp_port = w["udp_port"];
    }

    if (j.contains("guardrail")) {
        auto& g = j["guardrail"];
        if (g.contains("min_speech_ms")) cfg.guardrail.min_speech_ms = g["min_speech_ms"];
        if (g.contains("max_silence_ms")) cfg.guardrail.max_silence_ms = g["max_silence_ms"];
        if (g.contains("end_of_utterance_silence_ms"))
            cfg.guardrail.end_of_utterance_silence_ms = g["end_of_utterance_silence_ms"];
        if (g.contains("max_segment_ms")) cfg.guardrail.max_segment_ms = g["max_segment_ms"];
        if (g.contains("silence_rms_threshold")) cfg.guardrail.silence_rms_threshold = g["silence_rms_threshold"];
        if (g.contains("challenge_phrase") && g["challenge_phrase"].is_string())
            cfg.guardrail.challenge_phrase = g["challenge_phrase"].get<std::string>();
    }

    if (j.contains("verification")) {
        auto& v = j["verification"];
        if (v.contains("threshold") && v["threshold"].is_number())
            cfg.verification.threshold = v["threshold"].get<float>();
        if (v.contains("owner_id")) cfg.verification.owner_id = v["owner_id"];
        if (v.contains("voiceprint_path")) cfg.verification.voiceprint_path = v["voiceprint_path"];
        if (v.contains("key_env_var")) cfg.verification.key_env_var = v["key_env_var"];
        if (v.contains("embedding_length")) cfg.verification.embedding_length = v["embedding_length"];
        if (v.contains("embedding_chunk_samples"))
            cfg.verification.embedding_chunk_samples = v["embedding_chunk_samples"];
        if (v.contains("min_extract_samples")) cfg.verification.min_extract_samples = v["min_extract_samples"];
        if (v.contains("allow_placeholder_extractor"))
            cfg.verification.allow_placeholder_extractor = v["allow_placeholder_extractor"];
    }

    if (j.contains("cooldown")) {
        auto& c = j["cooldown"];
        if (c.contains("base_ms")) cfg.cooldown.base_ms = c["base_ms"];
        if (c.contains("max_ms")) cfg.cooldown.max_ms = c["max_ms"];
        if (c.contains("escalate_after")) cfg.cooldown.escalate_after = c["escalate_after"];
        if (c.contains("rejection_window_ms")) cfg.cooldown.rejection_window_ms = c["rejection_window_ms"];
    }

    if (j.contains("timeouts")) {
        auto& t = j["timeouts"];
        if (t.contains("extraction_ms")) cfg.timeouts.extraction_ms = t["extraction_ms"];
        if (t.contains("asr_ms")) cfg.timeouts.asr_ms = t["asr_ms"];
        if (t.contains("llm_ms")) cfg.timeouts.llm_ms = t["llm_ms"];
        if (t.contains("transient_retries")) cfg.timeouts.transient_retries = t["transient_retries"];
    }

    if (j.contains("asr")) {
        auto& s = j["asr"];
        if (s.contains("model_path")) cfg.asr.model_path = s["model_path"];
        if (s.contains("fallback_model_path")) cfg.asr.fallback_model_path = s["fallback_model_path"];
        if (s.contains("language")) cfg.asr.language = s["language"];
        if (s.contains("use_gpu")) cfg.asr.use_gpu = s["use_gpu"];
        if (s.contains("fallback_threshold")) cfg.asr.fallback_threshold = s["fallback_threshold"];
        if (s.contains("min_confidence")) cfg.asr.min_confidence = s["min_confidence"];
        if (s.contains("blank_sentinel")) cfg.asr.blank_sentinel = s["blank_sentinel"];
    }

    if (j.contains("router")) {
        auto& r = j["router"];
        if (r.contains("fast_model")) cfg.router.fast_model = r["fast_model"];
        if (r.contains("capable_model")) cfg.router.capable_model = r["capable_model"];
        if (r.contains("complexity_cutoff")) cfg.router.complexity_cutoff = r["complexity_cutoff"];
        if (r.contains("clarification_threshold")) cfg.router.clarification_threshold = r["clarification_threshold"];
        if (r.contains("system_prompt")) cfg.router.system_prompt = r["system_prompt"];
        if (r.contains("clarification_prompt")) cfg.router.clarification_prompt = r["clarification_prompt"];
    }

    if (j.contains("llm")) {
        auto& l = j["llm"];
        if (l.contains("endpoint")) cfg.llm.endpoint = l["endpoint"];
        if (l.contains("temperature")) cfg.llm.temperature = l["temperature"];
        if (l.contains("connect_timeout_ms")) cfg.llm.connect_timeout_ms = l["connect_timeout_ms"];
    }

    if (j.contains("tool_gate")) {
        auto& g = j["tool_gate"];
        if (g.contains("token_ttl_ms")) cfg.tool_gate.token_ttl_ms = g["token_ttl_ms"];
    }

    if (j.contains("tools")) {
        auto& tools = j["tools"];
        if (tools.contains("notes_path")) cfg.tools.notes_path = tools["notes_path"];
        if (tools.contains("confirm") && tools["confirm"].is_array()) {
            cfg.tools.confirm.clear();
            for (const auto& tool_name : tools["confirm"]) {
                if (tool_name.is_string()) {
                    cfg.tools.confirm.push_back(tool_name.get<std::string>());
                }
            }
        }
        if (tools.contains("enabled") && tools["enabled"].is_array()) {
            cfg.tools.enabled.clear();
            for (const auto& tool_name : tools["enabled"]) {
                if (tool_name.is_string()) {
                    cfg.tools.enabled.push_back(tool_name.get<std::string>());
                }
            }
        }
    }

    if (j.contains("conversation")) {
        auto& c = j["conversation"];
        if (c.contains("max_turns")) cfg.conversation.max_turns = c["max_turns"];
    }
}

void expand_paths(voxgate::Config& cfg) {
    cfg.verification.voiceprint_path = voxgate::expand_path(cfg.verification.voiceprint_path);
    cfg.tools.notes_path = voxgate::expand_path(cfg.tools.notes_path);
    if (!cfg.asr.model_path.empty()) cfg.asr.model_path = voxgate::expand_path(cfg.asr.model_path);
    if (!cfg.asr.fallback_model_path.empty())
        cfg.asr.fallback_model_path = voxgate::expand_path(cfg.asr.fallback_model_path);
    if (!cfg.logging.file.empty()) cfg.logging.file = voxgate::expand_path(cfg.logging.file);
}

voxgate::Error config_error(const std::string& field, const std::string& problem) {
    return voxgate::make_error(voxgate::ErrorType::ConfigError, field + ": " + problem);
}

} // anonymous namespace

namespace voxgate {

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        Config cfg;
        expand_paths(cfg);
        return cfg;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    Config cfg = load_from_string(contents.str());
    Logger::info("Loaded config from " + path);
    return cfg;
}

Config Config::load_from_string(const std::string& json_text) {
    Config cfg;
    try {
        json j = json::parse(json_text);
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
    }
    expand_paths(cfg);
    return cfg;
}

VoidResult Config::validate() const {
    if (!verification.threshold.has_value()) {
        return config_error("verification.threshold",
                            "must be set explicitly");
    }
    if (*verification.threshold < -1.0f || *verification.threshold > 1.0f) {
        return config_error("verification.threshold", "must be within [-1, 1]");
    }
    if (wake.threshold < 0.0f || wake.threshold > 1.0f) {
        return config_error("wake.threshold", "must be within [0, 1]");
    }
    if (router.clarification_threshold < 0.0f || router.clarification_threshold > 1.0f) {
        return config_error("router.clarification_threshold", "must be within [0, 1]");
    }
    if (audio.sample_rate <= 0 || audio.frame_ms <= 0) {
        return config_error("audio", "sample_rate and frame_ms must be positive");
    }
    if (audio.frame_queue_capacity == 0) {
        return config_error("audio.frame_queue_capacity", "must be positive");
    }
    if (guardrail.min_speech_ms <= 0 || guardrail.max_silence_ms <= 0 || guardrail.max_segment_ms <= 0) {
        return config_error("guardrail", "durations must be positive");
    }
    if (guardrail.end_of_utterance_silence_ms < 0) {
        return config_error("guardrail.end_of_utterance_silence_ms", "must not be negative");
    }
    if (verification.owner_id.empty()) {
        return config_error("verification.owner_id", "must not be empty");
    }
    if (verification.embedding_length <= 0 || verification.embedding_length > 32) {
        return config_error("verification.embedding_length", "must be within [1, 32]");
    }
    if (cooldown.base_ms <= 0 || cooldown.max_ms < cooldown.base_ms || cooldown.escalate_after <= 0) {
        return config_error("cooldown", "base_ms must be positive, max_ms >= base_ms, escalate_after > 0");
    }
    if (timeouts.extraction_ms <= 0 || timeouts.asr_ms <= 0 || timeouts.llm_ms <= 0) {
        return config_error("timeouts", "every timeout must be positive");
    }
    if (timeouts.transient_retries < 0 || timeouts.transient_retries > 1) {
        return config_error("timeouts.transient_retries", "must be 0 or 1");
    }
    if (tool_gate.token_ttl_ms <= 0) {
        return config_error("tool_gate.token_ttl_ms", "must be positive");
    }
    return {};
}

} // namespace voxgate
