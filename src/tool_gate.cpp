#include "tool_gate.h"
#include "logger.h"
#include "schema_validator.h"
#include "utils.h"
#include <stdexcept>

namespace voxgate {

ToolGate::ToolGate(std::shared_ptr<ToolRegistry> registry,
                   std::shared_ptr<TokenAuthority> tokens,
                   std::string enrolled_owner,
                   std::shared_ptr<MetricsSink> metrics)
    : registry_(std::move(registry)),
      tokens_(std::move(tokens)),
      enrolled_owner_(std::move(enrolled_owner)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<NullMetrics>()) {
    if (!registry_ || !tokens_) {
        throw std::invalid_argument("ToolGate requires a registry and a token authority");
    }
}

Error ToolGate::deny(const std::string& tool, Error error) {
    metrics_->increment("tool_denied", {{"reason", error_type_name(error.type)}});
    if (is_security_error(error.type)) {
        Logger::warn("[ToolGate] Denied '" + tool + "': " + error.message);
    } else {
        LOG_GATE("Denied '" + tool + "': " + error.message);
    }
    return error;
}

VoidResult ToolGate::confirm(const std::string& tool) {
    if (!confirm_) {
        return make_error(ErrorType::NotConfirmed, "tool '" + tool + "' needs confirmation and no prompt is set");
    }
    std::string answer = utils::normalize_phrase(confirm_("Do you want to run " + tool + "? (yes/no)"));
    if (answer == "yes" || answer == "y") {
        return {};
    }
    return make_error(ErrorType::NotConfirmed, "owner declined to run '" + tool + "'");
}

Result<ToolResult> ToolGate::authorize_and_dispatch(const RoutingDecision& decision,
                                                    const std::optional<VerificationToken>& token,
                                                    const ToolCall& call) {
    // Consume the token before anything else so it can never be replayed
    VoidResult redeemed = token
        ? tokens_->redeem(*token, enrolled_owner_)
        : VoidResult(make_unverified_error("no verification token presented"));

    // An unverified caller learns nothing about which tools exist
    const ToolSpec* spec = registry_->find(call.name);
    if (!spec) {
        if (!redeemed) {
            return deny(call.name, redeemed.error());
        }
        return deny(call.name, make_error(ErrorType::UnknownTool, "unknown tool: " + call.name));
    }
    if (spec->requires_verification && !redeemed) {
        return deny(call.name, redeemed.error());
    }

    if (decision.clarification_needed) {
        return deny(call.name, make_error(ErrorType::InvalidState,
                                          "clarification pending; no tool may run"));
    }
    if (!decision.allows_tool(call.name)) {
        return deny(call.name, make_error(ErrorType::InvalidArgs,
                                          "tool '" + call.name + "' is not offered for intent '" +
                                          decision.intent_label + "'"));
    }

    auto valid = validate_arguments(spec->input_schema, call.arguments);
    if (!valid) {
        return deny(call.name, valid.error());
    }

    if (spec->requires_confirmation) {
        auto confirmed = confirm(call.name);
        if (!confirmed) {
            return deny(call.name, confirmed.error());
        }
    }

    auto tool = registry_->instantiate(call.name);
    if (!tool) {
        return deny(call.name, tool.error());
    }

    ToolResult result;
    try {
        result = tool.value()->execute(call.arguments);
    } catch (const std::exception& e) {
        Logger::error("[ToolGate] Tool '" + call.name + "' threw: " + e.what());
        result = ToolResult::error_result(std::string("tool execution error: ") + e.what());
    }

    metrics_->increment("tool_dispatched", {{"tool", call.name}});
    LOG_GATE("Dispatched '" + call.name + "' (" + (result.success ? "ok" : "failed") + ")");
    return result;
}

} // namespace voxgate
