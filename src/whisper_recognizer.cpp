#include "whisper_recognizer.h"
#include "logger.h"
#include <whisper.h>
#include <chrono>
#include <mutex>
#include <sstream>
#include <vector>

namespace voxgate {

class WhisperRecognizer::Impl {
public:
    Impl(const ASRConfig& config, const std::string& model_path, std::string name)
        : config_(config), name_(std::move(name)), ctx_(nullptr) {
        if (model_path.empty()) {
            LOG_STT(name_ + ": no model path specified");
            return;
        }

        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
        if (!ctx_) {
            Logger::error("[STT] " + name_ + ": failed to load whisper model: " + model_path);
            return;
        }
        LOG_STT(name_ + ": model loaded (" + model_path + ")");
    }

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    Result<Transcript> transcribe(const AudioBuffer& segment, int sample_rate) {
        if (!ctx_) {
            return make_io_error(name_ + ": whisper model not loaded");
        }
        if (sample_rate != WHISPER_SAMPLE_RATE) {
            return make_error(ErrorType::InvalidArgs,
                              "whisper expects " + std::to_string(WHISPER_SAMPLE_RATE) +
                              " Hz audio, got " + std::to_string(sample_rate));
        }

        Transcript result;
        result.source = name_;
        if (segment.empty()) {
            return result;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto start = std::chrono::steady_clock::now();

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.translate = false;
        params.language = config_.language.c_str();
        params.n_threads = 4;
        params.offset_ms = 0;
        params.no_context = true;
        params.single_segment = true;

        std::vector<float> pcmf32(segment.size());
        for (size_t i = 0; i < segment.size(); i++) {
            pcmf32[i] = static_cast<float>(segment[i]) / 32768.0f;
        }

        int ret = whisper_full(ctx_, params, pcmf32.data(), static_cast<int>(pcmf32.size()));
        if (ret != 0) {
            return make_error(ErrorType::Unknown, name_ + ": whisper_full failed: " + std::to_string(ret));
        }

        int n_segments = whisper_full_n_segments(ctx_);
        int total_tokens = 0;
        float total_prob = 0.0f;
        std::string text;
        for (int i = 0; i < n_segments; i++) {
            text += whisper_full_get_segment_text(ctx_, i);
            int n_tokens = whisper_full_n_tokens(ctx_, i);
            total_tokens += n_tokens;
            for (int j = 0; j < n_tokens; j++) {
                total_prob += whisper_full_get_token_p(ctx_, i, j);
            }
        }

        result.text = text;
        result.confidence = total_tokens > 0 ? (total_prob / total_tokens) : 0.0f;
        result.token_count = total_tokens;
        result.processing_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        std::ostringstream oss;
        oss << name_ << ": " << result.token_count << " tokens, confidence " << result.confidence
            << ", " << result.processing_ms << " ms";
        LOG_STT(oss.str());
        return result;
    }

    const std::string& name() const { return name_; }
    bool is_ready() const { return ctx_ != nullptr; }

private:
    ASRConfig config_;
    std::string name_;
    whisper_context* ctx_;
    std::mutex mutex_;
};

WhisperRecognizer::WhisperRecognizer(const ASRConfig& config, const std::string& model_path, std::string name)
    : pimpl_(std::make_unique<Impl>(config, model_path, std::move(name))) {}

WhisperRecognizer::~WhisperRecognizer() = default;

Result<Transcript> WhisperRecognizer::transcribe(const AudioBuffer& segment, int sample_rate) {
    return pimpl_->transcribe(segment, sample_rate);
}

std::string WhisperRecognizer::name() const {
    return pimpl_->name();
}

bool WhisperRecognizer::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace voxgate
