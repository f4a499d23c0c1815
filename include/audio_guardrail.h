#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include <string>

namespace voxgate {

/**
 * @brief Speech/silence accounting since the last wake
 *
 * silence_ms is the current run of consecutive silent frames; any speech
 * frame clears it. Everything resets to zero on rejection or after a
 * verification attempt.
 */
struct GuardrailState {
    int64_t speech_duration_ms = 0;
    int64_t silence_ms = 0;
    int64_t trailing_silence_ms = 0;   ///< Silence since minimum speech was met
    int64_t segment_ms = 0;

    bool is_zero() const {
        return speech_duration_ms == 0 && silence_ms == 0 &&
               trailing_silence_ms == 0 && segment_ms == 0;
    }
};

enum class GuardrailStatus {
    Accumulating,   ///< Need more audio
    Ready,          ///< Segment qualifies; attempt verification
    Rejected        ///< Too much silence / no speech; discard
};

/**
 * @brief Minimum-speech / maximum-silence gate run before verification
 *
 * Frames are classified by RMS against silence_rms_threshold. Before
 * min_speech_ms of speech, a silence run longer than max_silence_ms rejects.
 * After it, capture continues until end_of_utterance_silence_ms of trailing
 * silence (0 = immediately) or max_segment_ms total.
 */
class AudioGuardrail {
public:
    explicit AudioGuardrail(const GuardrailConfig& config);

    /// Account for one frame (in arrival order) and append it to the segment
    GuardrailStatus process(const AudioFrame& frame);

    const GuardrailState& state() const { return state_; }
    bool min_speech_met() const { return state_.speech_duration_ms >= config_.min_speech_ms; }

    /// Why the last process() returned Rejected
    const std::string& rejection_reason() const { return rejection_reason_; }

    const AudioBuffer& segment() const { return segment_; }

    /// Move the captured segment out and reset all counters
    AudioBuffer take_segment();

    void reset();

    bool has_challenge() const { return !config_.challenge_phrase.empty(); }

    /**
     * @brief Check a transcript for the configured challenge phrase
     * @return GuardrailRejected when the normalized phrase is not present
     */
    VoidResult check_challenge(const std::string& transcript) const;

private:
    GuardrailConfig config_;
    GuardrailState state_;
    AudioBuffer segment_;
    std::string rejection_reason_;
};

} // namespace voxgate
