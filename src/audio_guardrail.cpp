#include "audio_guardrail.h"
#include "logger.h"
#include "utils.h"

namespace voxgate {

AudioGuardrail::AudioGuardrail(const GuardrailConfig& config) : config_(config) {}

GuardrailStatus AudioGuardrail::process(const AudioFrame& frame) {
    int64_t frame_ms = frame.duration_ms();
    bool silent = frame_rms(frame.samples) < config_.silence_rms_threshold;

    segment_.insert(segment_.end(), frame.samples.begin(), frame.samples.end());
    state_.segment_ms += frame_ms;

    if (!min_speech_met()) {
        if (silent) {
            state_.silence_ms += frame_ms;
            if (state_.silence_ms > config_.max_silence_ms) {
                rejection_reason_ = "silence " + std::to_string(state_.silence_ms) +
                                    " ms before " + std::to_string(config_.min_speech_ms) +
                                    " ms of speech (had " + std::to_string(state_.speech_duration_ms) + " ms)";
                return GuardrailStatus::Rejected;
            }
        } else {
            state_.speech_duration_ms += frame_ms;
            state_.silence_ms = 0;
        }

        if (!min_speech_met()) {
            if (state_.segment_ms >= config_.max_segment_ms) {
                rejection_reason_ = "segment reached " + std::to_string(config_.max_segment_ms) +
                                    " ms without enough speech";
                return GuardrailStatus::Rejected;
            }
            return GuardrailStatus::Accumulating;
        }

        LOG_AUDIO("Minimum speech reached (" + std::to_string(state_.speech_duration_ms) + " ms)");
        if (config_.end_of_utterance_silence_ms == 0) {
            return GuardrailStatus::Ready;
        }
        return state_.segment_ms >= config_.max_segment_ms ? GuardrailStatus::Ready
                                                           : GuardrailStatus::Accumulating;
    }

    if (silent) {
        state_.trailing_silence_ms += frame_ms;
    } else {
        state_.speech_duration_ms += frame_ms;
        state_.trailing_silence_ms = 0;
    }

    if (state_.trailing_silence_ms >= config_.end_of_utterance_silence_ms ||
        state_.segment_ms >= config_.max_segment_ms) {
        return GuardrailStatus::Ready;
    }
    return GuardrailStatus::Accumulating;
}

AudioBuffer AudioGuardrail::take_segment() {
    AudioBuffer out = std::move(segment_);
    reset();
    return out;
}

void AudioGuardrail::reset() {
    state_ = GuardrailState{};
    segment_.clear();
    rejection_reason_.clear();
}

VoidResult AudioGuardrail::check_challenge(const std::string& transcript) const {
    if (!has_challenge()) return {};
    if (utils::contains_phrase(transcript, config_.challenge_phrase)) {
        return {};
    }
    return make_error(ErrorType::GuardrailRejected, "challenge phrase not spoken");
}

} // namespace voxgate
