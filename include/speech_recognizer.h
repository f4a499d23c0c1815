#pragma once

#include "common.h"
#include "errors.h"
#include <string>

namespace voxgate {

/**
 * @brief Speech-to-text capability
 *
 * Used for the guardrail challenge-phrase pre-check and for transcribing
 * verified utterances. Callers bound every call with a timeout.
 */
class SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;

    /**
     * @brief Transcribe a PCM segment
     * @return Transcript with a confidence in [0, 1], or an error
     *         (IOError if no model is loaded, LowConfidence, Timeout)
     */
    virtual Result<Transcript> transcribe(const AudioBuffer& segment, int sample_rate) = 0;

    /// Short identifier recorded as Transcript::source and metric tag
    virtual std::string name() const = 0;
};

} // namespace voxgate
