#pragma once

#include "config.h"
#include "metrics.h"
#include "speech_recognizer.h"
#include <memory>

namespace voxgate {

/**
 * @brief Primary recognizer first, fallback when it is unsure or fails
 *
 * The fallback runs when the primary errors or its confidence is below
 * fallback_threshold. LowConfidence is returned when the final confidence is
 * below min_confidence (0 disables the check).
 */
class AsrRouter : public SpeechRecognizer {
public:
    AsrRouter(std::shared_ptr<SpeechRecognizer> primary,
              std::shared_ptr<SpeechRecognizer> fallback,
              const ASRConfig& config,
              std::shared_ptr<MetricsSink> metrics = nullptr);

    Result<Transcript> transcribe(const AudioBuffer& segment, int sample_rate) override;
    std::string name() const override { return "asr_router"; }

private:
    Result<Transcript> run(SpeechRecognizer& recognizer, const AudioBuffer& segment, int sample_rate);

    std::shared_ptr<SpeechRecognizer> primary_;
    std::shared_ptr<SpeechRecognizer> fallback_;
    float fallback_threshold_;
    float min_confidence_;
    std::shared_ptr<MetricsSink> metrics_;
};

} // namespace voxgate
