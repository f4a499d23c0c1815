#include "llm_router.h"
#include "logger.h"
#include <algorithm>
#include <sstream>

using json = nlohmann::json;

namespace voxgate {

const char* model_tier_name(ModelTier tier) {
    switch (tier) {
        case ModelTier::Fast: return "fast";
        case ModelTier::Capable: return "capable";
    }
    return "unknown";
}

bool RoutingDecision::allows_tool(const std::string& name) const {
    return std::find(tool_schema_refs.begin(), tool_schema_refs.end(), name) != tool_schema_refs.end();
}

LLMRouter::LLMRouter(const RouterConfig& config) : config_(config) {}

RoutingDecision LLMRouter::route(const ClassifiedIntent& intent, const ToolRegistry& catalog) const {
    RoutingDecision decision;
    decision.intent_label = intent.label;
    decision.complexity_score = intent.complexity_score;
    decision.confidence = intent.confidence;

    if (intent.complexity_score < config_.complexity_cutoff) {
        decision.complexity_tier = "simple";
        decision.model_tier = ModelTier::Fast;
        decision.model_name = config_.fast_model;
    } else {
        decision.complexity_tier = "complex";
        decision.model_tier = ModelTier::Capable;
        decision.model_name = config_.capable_model;
    }

    if (intent.label == intent::UNKNOWN || intent.confidence < config_.clarification_threshold) {
        decision.clarification_needed = true;
        decision.clarification_prompt = config_.clarification_prompt;
    } else {
        decision.tool_schema_refs = catalog.tools_for_intent(intent.label);
    }

    std::ostringstream oss;
    oss << "intent=" << decision.intent_label << " confidence=" << decision.confidence
        << " complexity=" << decision.complexity_score << " model=" << decision.model_name
        << " tools=" << decision.tool_schema_refs.size()
        << (decision.clarification_needed ? " clarification" : "");
    LOG_ROUTER(oss.str());
    return decision;
}

json LLMRouter::build_payload(const RoutingDecision& decision,
                              const std::string& transcript,
                              const ConversationHistory& history,
                              const ToolRegistry& catalog) const {
    json messages = json::array();
    messages.push_back({{"role", "system"}, {"content", config_.system_prompt}});
    for (const auto& msg : history.to_json()) {
        messages.push_back(msg);
    }
    messages.push_back({{"role", "user"}, {"content", transcript}});

    json payload;
    payload["model"] = decision.model_name;
    payload["messages"] = messages;
    if (!decision.clarification_needed && !decision.tool_schema_refs.empty()) {
        payload["tools"] = catalog.describe_json(decision.tool_schema_refs);
    }
    return payload;
}

} // namespace voxgate
