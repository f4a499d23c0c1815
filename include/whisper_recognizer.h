#pragma once

#include "config.h"
#include "speech_recognizer.h"
#include <memory>
#include <string>

namespace voxgate {

/**
 * @brief whisper.cpp speech recognizer
 *
 * Confidence is the mean token probability. Calls are serialized on the
 * model context.
 */
class WhisperRecognizer : public SpeechRecognizer {
public:
    /**
     * @param config Language / GPU settings
     * @param model_path ggml model file; a recognizer with no model reports IOError
     * @param name Identifier used as Transcript::source
     */
    WhisperRecognizer(const ASRConfig& config, const std::string& model_path, std::string name = "whisper");
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    Result<Transcript> transcribe(const AudioBuffer& segment, int sample_rate) override;
    std::string name() const override;

    bool is_ready() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxgate
