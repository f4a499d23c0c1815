#pragma once

#include "config.h"
#include "continuous_listener.h"
#include "conversation_history.h"
#include "errors.h"
#include "intent_classifier.h"
#include "llm_backend.h"
#include "llm_router.h"
#include "metrics.h"
#include "speech_recognizer.h"
#include "tool_gate.h"
#include "tool_registry.h"
#include <memory>
#include <string>
#include <vector>

namespace voxgate {

/// What happened to one tool call requested by the LLM
struct ToolOutcome {
    ToolCall call;
    bool dispatched = false;   ///< ToolGate authorized it and the tool ran
    ToolResult result;         ///< Valid when dispatched
    Error error;               ///< Valid when !dispatched
};

/**
 * @brief Everything produced for one verified utterance
 */
struct AgentResponse {
    Transcript transcript;
    ClassifiedIntent intent;
    RoutingDecision decision;
    std::string reply_text;               ///< LLM text, or the clarification prompt
    std::vector<ToolOutcome> tool_outcomes;
};

struct AgentDeps {
    std::shared_ptr<SpeechRecognizer> recognizer;
    std::shared_ptr<LlmBackend> llm;
    std::shared_ptr<ToolRegistry> registry;
    std::shared_ptr<ToolGate> gate;
    std::shared_ptr<MetricsSink> metrics;
};

/**
 * @brief Verified utterance -> ASR -> classify -> route -> LLM -> ToolGate
 *
 * Keeps the rolling conversation history. The utterance's token is handed
 * to the first tool call only; any further calls in the same reply go to the
 * gate without one.
 */
class VoiceAgent {
public:
    VoiceAgent(const Config& config, AgentDeps deps);
    ~VoiceAgent();

    // Non-copyable
    VoiceAgent(const VoiceAgent&) = delete;
    VoiceAgent& operator=(const VoiceAgent&) = delete;

    /**
     * @brief Run the downstream pipeline for one utterance
     * @return Timeout / LowConfidence / NetworkError when ASR or the LLM
     *         fails after its single retry; tool denials are reported in
     *         AgentResponse::tool_outcomes instead
     */
    Result<AgentResponse> handle(const VerifiedUtterance& utterance);

    const ConversationHistory& history() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxgate
