#include "voice_agent.h"
#include "logger.h"
#include "timeout.h"
#include "utils.h"
#include <optional>
#include <sstream>
#include <stdexcept>

namespace voxgate {

class VoiceAgent::Impl {
public:
    Impl(const Config& config, AgentDeps deps)
        : timeouts_(config.timeouts),
          asr_config_(config.asr),
          deps_(std::move(deps)),
          classifier_(config.asr.blank_sentinel),
          router_(config.router),
          history_(config.conversation.max_turns) {
        if (!deps_.recognizer || !deps_.llm || !deps_.registry || !deps_.gate) {
            throw std::invalid_argument("VoiceAgent requires recognizer, LLM backend, registry and tool gate");
        }
        if (!deps_.metrics) deps_.metrics = std::make_shared<NullMetrics>();
    }

    Result<AgentResponse> handle(const VerifiedUtterance& utterance) {
        AgentResponse response;

        auto transcript = transcribe(utterance);
        if (!transcript) {
            Logger::warn("[Agent] Transcription failed: " + transcript.error().message);
            return transcript.error();
        }
        response.transcript = transcript.value();
        const std::string& text = response.transcript.text;
        LOG_STT("Transcript: \"" + text + "\"");

        response.intent = classifier_.classify(text);
        response.decision = router_.route(response.intent, *deps_.registry);

        if (response.decision.clarification_needed) {
            response.reply_text = response.decision.clarification_prompt;
            if (!utils::is_blank_transcript(text, asr_config_.blank_sentinel)) {
                history_.add_user_message(text);
                history_.add_assistant_message(response.reply_text);
            }
            return response;
        }

        nlohmann::json payload = router_.build_payload(response.decision, text, history_, *deps_.registry);
        history_.add_user_message(text);

        auto reply = complete(payload);
        if (!reply) {
            Logger::warn("[Agent] LLM call failed: " + reply.error().message);
            return reply.error();
        }

        std::optional<VerificationToken> token = utterance.token;
        for (const auto& call : reply.value().tool_calls) {
            response.tool_outcomes.push_back(dispatch(response.decision, token, call));
            // Single-use: whatever happened, later calls in this reply carry no token
            token.reset();
        }

        response.reply_text = reply.value().content;
        if (response.reply_text.empty()) {
            response.reply_text = summarize_outcomes(response.tool_outcomes);
        }
        history_.add_assistant_message(response.reply_text);
        return response;
    }

    const ConversationHistory& history() const { return history_; }

private:
    Result<Transcript> transcribe(const VerifiedUtterance& utterance) {
        auto recognizer = deps_.recognizer;
        auto segment = std::make_shared<const AudioBuffer>(utterance.audio_segment);
        int sample_rate = utterance.sample_rate;

        Result<Transcript> result = make_error(ErrorType::Unknown, "transcription not attempted");
        for (int attempt = 0; attempt <= timeouts_.transient_retries; ++attempt) {
            result = call_with_timeout<Transcript>(
                [recognizer, segment, sample_rate]() { return recognizer->transcribe(*segment, sample_rate); },
                timeouts_.asr_ms, "transcription");
            if (result || !is_transient(result.error_type())) {
                break;
            }
        }
        return result;
    }

    Result<LlmReply> complete(const nlohmann::json& payload) {
        auto llm = deps_.llm;
        auto shared_payload = std::make_shared<const nlohmann::json>(payload);
        int timeout_ms = timeouts_.llm_ms;

        Result<LlmReply> result = make_error(ErrorType::Unknown, "LLM not called");
        for (int attempt = 0; attempt <= timeouts_.transient_retries; ++attempt) {
            result = call_with_timeout<LlmReply>(
                [llm, shared_payload, timeout_ms]() { return llm->complete(*shared_payload, timeout_ms); },
                timeout_ms, "LLM completion", ErrorType::NetworkError);
            if (result || !is_transient(result.error_type())) {
                break;
            }
        }
        return result;
    }

    ToolOutcome dispatch(const RoutingDecision& decision,
                         const std::optional<VerificationToken>& token,
                         const ToolCall& call) {
        ToolOutcome outcome;
        outcome.call = call;
        auto result = deps_.gate->authorize_and_dispatch(decision, token, call);
        if (result) {
            outcome.dispatched = true;
            outcome.result = result.value();
        } else {
            outcome.error = result.error();
        }
        return outcome;
    }

    static std::string summarize_outcomes(const std::vector<ToolOutcome>& outcomes) {
        if (outcomes.empty()) {
            return "";
        }
        std::ostringstream oss;
        for (size_t i = 0; i < outcomes.size(); ++i) {
            const auto& outcome = outcomes[i];
            if (i > 0) oss << " ";
            if (!outcome.dispatched) {
                oss << outcome.call.name << " was not run (" << error_type_name(outcome.error.type) << ").";
            } else if (outcome.result.success) {
                oss << outcome.result.content << ".";
            } else {
                oss << outcome.call.name << " failed: " << outcome.result.error << ".";
            }
        }
        return oss.str();
    }

    TimeoutsConfig timeouts_;
    ASRConfig asr_config_;
    AgentDeps deps_;
    IntentClassifier classifier_;
    LLMRouter router_;
    ConversationHistory history_;
};

VoiceAgent::VoiceAgent(const Config& config, AgentDeps deps)
    : pimpl_(std::make_unique<Impl>(config, std::move(deps))) {}

VoiceAgent::~VoiceAgent() = default;

Result<AgentResponse> VoiceAgent::handle(const VerifiedUtterance& utterance) {
    return pimpl_->handle(utterance);
}

const ConversationHistory& VoiceAgent::history() const {
    return pimpl_->history();
}

} // namespace voxgate
