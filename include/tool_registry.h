#pragma once

#include "errors.h"
#include "tool.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voxgate {

/// Builds a tool on first authorized use
using ToolFactory = std::function<std::unique_ptr<Tool>()>;

/**
 * @brief Everything the router and gate need to know about a tool without building it
 */
struct ToolSpec {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
    std::vector<std::string> intents;     ///< Intent labels this tool is offered for
    bool requires_verification = true;
    bool requires_confirmation = false;   ///< Owner must answer yes before each run

    bool serves(const std::string& intent_label) const;
};

/**
 * @brief Lazy factory table of tools keyed by name
 *
 * Specs are public; instances are not. instantiate() is reachable only from
 * ToolGate, so no code path can run a tool without passing authorization.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool spec with its factory
     * @return false if the name is taken or the ToolSpec is unusable
     */
    bool register_tool(ToolSpec spec, ToolFactory factory);

    bool has_tool(const std::string& name) const;

    /// Make a registered tool ask for a yes/no before every run; false if unknown
    bool require_confirmation(const std::string& name);

    /// Spec by name, or nullptr
    const ToolSpec* find(const std::string& name) const;

    std::vector<std::string> get_tool_names() const;

    /// Names of tools whose spec lists intent_label, in name order
    std::vector<std::string> tools_for_intent(const std::string& intent_label) const;

    /**
     * @brief Tool definitions in Ollama/OpenAI function format
     * @param names Tools to describe; unknown names are skipped
     */
    nlohmann::json describe_json(const std::vector<std::string>& names) const;

    size_t size() const { return tools_.size(); }

    /// Number of tools built so far
    size_t instantiated_count() const;

private:
    friend class ToolGate;

    /// Build (once) and return the named tool
    Result<Tool*> instantiate(const std::string& name);

    struct Entry {
        ToolSpec spec;
        ToolFactory factory;
        std::unique_ptr<Tool> instance;
    };

    std::map<std::string, Entry> tools_;
    mutable std::mutex instance_mutex_;
};

} // namespace voxgate
