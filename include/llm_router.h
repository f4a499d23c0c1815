#pragma once

#include "config.h"
#include "conversation_history.h"
#include "intent_classifier.h"
#include "tool_registry.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace voxgate {

enum class ModelTier {
    Fast,      ///< Low-cost model for simple requests
    Capable    ///< High-capability model
};

const char* model_tier_name(ModelTier tier);

/**
 * @brief Where a classified request goes and what it may use
 *
 * tool_schema_refs names tools only; nothing is instantiated until ToolGate
 * authorizes a call.
 */
struct RoutingDecision {
    std::string intent_label;
    float complexity_score = 0.0f;
    float confidence = 0.0f;
    std::string complexity_tier;          ///< "simple" | "complex"
    ModelTier model_tier = ModelTier::Fast;
    std::string model_name;
    std::vector<std::string> tool_schema_refs;
    bool clarification_needed = false;
    std::string clarification_prompt;

    bool allows_tool(const std::string& name) const;
};

/**
 * @brief Picks a model tier, attaches relevant tools, builds the chat payload
 */
class LLMRouter {
public:
    explicit LLMRouter(const RouterConfig& config);

    /**
     * @brief Decide tier and tool set for an intent
     *
     * Requests clarification (and attaches no tools) when confidence is
     * below clarification_threshold or the label is unknown.
     */
    RoutingDecision route(const ClassifiedIntent& intent, const ToolRegistry& catalog) const;

    /**
     * @brief Chat payload: {model, messages: [system, history..., user], tools}
     *
     * "tools" is present only when the decision attaches any.
     */
    nlohmann::json build_payload(const RoutingDecision& decision,
                                 const std::string& transcript,
                                 const ConversationHistory& history,
                                 const ToolRegistry& catalog) const;

private:
    RouterConfig config_;
};

} // namespace voxgate
