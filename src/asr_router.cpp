#include "asr_router.h"
#include "logger.h"
#include <sstream>
#include <stdexcept>

namespace voxgate {

AsrRouter::AsrRouter(std::shared_ptr<SpeechRecognizer> primary,
                     std::shared_ptr<SpeechRecognizer> fallback,
                     const ASRConfig& config,
                     std::shared_ptr<MetricsSink> metrics)
    : primary_(std::move(primary)),
      fallback_(std::move(fallback)),
      fallback_threshold_(config.fallback_threshold),
      min_confidence_(config.min_confidence),
      metrics_(metrics ? std::move(metrics) : std::make_shared<NullMetrics>()) {
    if (!primary_) {
        throw std::invalid_argument("AsrRouter requires a primary recognizer");
    }
}

Result<Transcript> AsrRouter::run(SpeechRecognizer& recognizer, const AudioBuffer& segment, int sample_rate) {
    metrics_->increment("asr_calls", {{"source", recognizer.name()}});
    auto result = recognizer.transcribe(segment, sample_rate);
    if (result && result.value().source.empty()) {
        result.value().source = recognizer.name();
    }
    return result;
}

Result<Transcript> AsrRouter::transcribe(const AudioBuffer& segment, int sample_rate) {
    auto result = run(*primary_, segment, sample_rate);

    if (fallback_) {
        if (!result) {
            LOG_STT("Primary failed (" + result.error().message + "); trying " + fallback_->name());
            result = run(*fallback_, segment, sample_rate);
        } else if (result.value().confidence < fallback_threshold_) {
            std::ostringstream oss;
            oss << "Primary confidence " << result.value().confidence << " below "
                << fallback_threshold_ << "; trying " << fallback_->name();
            LOG_STT(oss.str());
            auto second = run(*fallback_, segment, sample_rate);
            if (second) {
                result = second;
            }
        }
    }

    if (result && min_confidence_ > 0.0f && result.value().confidence < min_confidence_) {
        std::ostringstream oss;
        oss << "transcript confidence " << result.value().confidence << " below " << min_confidence_;
        return make_error(ErrorType::LowConfidence, oss.str());
    }
    return result;
}

} // namespace voxgate
