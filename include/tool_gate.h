#pragma once

#include "errors.h"
#include "llm_router.h"
#include "metrics.h"
#include "tool.h"
#include "tool_registry.h"
#include "verification_token.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace voxgate {

/**
 * @brief The single point where tools are built and run
 *
 * Order of checks for every call:
 *  1. the presented token is redeemed (consumed) first, whatever follows
 *  2. unregistered tool -> Unverified without a redeemed token, else UnknownTool
 *  3. requires_verification and the token did not redeem -> Unverified
 *  4. clarification-pending decision -> InvalidState
 *  5. tool not attached to the decision -> InvalidArgs
 *  6. arguments rejected by the input schema -> InvalidArgs
 *  7. requires_confirmation and the owner did not answer yes -> NotConfirmed
 *  8. lazy instantiation and execution; a throwing tool yields a failed ToolResult
 */
class ToolGate {
public:
    /// Ask the owner a yes/no question and return their answer
    using ConfirmationPrompt = std::function<std::string(const std::string& question)>;

    ToolGate(std::shared_ptr<ToolRegistry> registry,
             std::shared_ptr<TokenAuthority> tokens,
             std::string enrolled_owner,
             std::shared_ptr<MetricsSink> metrics = nullptr);

    Result<ToolResult> authorize_and_dispatch(const RoutingDecision& decision,
                                              const std::optional<VerificationToken>& token,
                                              const ToolCall& call);

    /// Without a prompt, tools that require confirmation are always refused
    void set_confirmation_prompt(ConfirmationPrompt prompt) { confirm_ = std::move(prompt); }

    const ToolRegistry& registry() const { return *registry_; }

private:
    Error deny(const std::string& tool, Error error);
    VoidResult confirm(const std::string& tool);

    std::shared_ptr<ToolRegistry> registry_;
    std::shared_ptr<TokenAuthority> tokens_;
    std::string enrolled_owner_;
    std::shared_ptr<MetricsSink> metrics_;
    ConfirmationPrompt confirm_;
};

} // namespace voxgate
