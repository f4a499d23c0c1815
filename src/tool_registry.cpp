#include "tool_registry.h"
#include "logger.h"
#include <algorithm>

using json = nlohmann::json;

namespace voxgate {

bool ToolSpec::serves(const std::string& intent_label) const {
    return std::find(intents.begin(), intents.end(), intent_label) != intents.end();
}

bool ToolRegistry::register_tool(ToolSpec spec, ToolFactory factory) {
    if (spec.name.empty() || !factory) {
        Logger::error("Attempted to register a tool without a name or factory");
        return false;
    }
    if (!spec.input_schema.is_object()) {
        Logger::error("Tool '" + spec.name + "' input schema must be a JSON object");
        return false;
    }
    if (tools_.find(spec.name) != tools_.end()) {
        Logger::warn("Tool '" + spec.name + "' is already registered. Skipping.");
        return false;
    }

    std::string name = spec.name;
    tools_[name] = Entry{std::move(spec), std::move(factory), nullptr};
    Logger::info("Registered tool: " + name);
    return true;
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

bool ToolRegistry::require_confirmation(const std::string& name) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return false;
    }
    it->second.spec.requires_confirmation = true;
    return true;
}

const ToolSpec* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    if (it != tools_.end()) {
        return &it->second.spec;
    }
    return nullptr;
}

std::vector<std::string> ToolRegistry::get_tool_names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, entry] : tools_) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> ToolRegistry::tools_for_intent(const std::string& intent_label) const {
    std::vector<std::string> names;
    for (const auto& [name, entry] : tools_) {
        if (entry.spec.serves(intent_label)) {
            names.push_back(name);
        }
    }
    return names;
}

json ToolRegistry::describe_json(const std::vector<std::string>& names) const {
    json tools_array = json::array();

    for (const auto& name : names) {
        const ToolSpec* spec = find(name);
        if (!spec) continue;

        json function_def;
        function_def["name"] = spec->name;
        function_def["description"] = spec->description;
        function_def["parameters"] = spec->input_schema;

        json tool_def;
        tool_def["type"] = "function";
        tool_def["function"] = function_def;
        tools_array.push_back(tool_def);
    }

    return tools_array;
}

size_t ToolRegistry::instantiated_count() const {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    size_t count = 0;
    for (const auto& [name, entry] : tools_) {
        if (entry.instance) count++;
    }
    return count;
}

Result<Tool*> ToolRegistry::instantiate(const std::string& name) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return make_error(ErrorType::UnknownTool, "unknown tool: " + name);
    }

    std::lock_guard<std::mutex> lock(instance_mutex_);
    Entry& entry = it->second;
    if (!entry.instance) {
        try {
            entry.instance = entry.factory();
        } catch (const std::exception& e) {
            return make_error(ErrorType::Unknown, "tool '" + name + "' failed to construct: " + e.what());
        }
        if (!entry.instance) {
            return make_error(ErrorType::Unknown, "tool '" + name + "' factory returned nothing");
        }
        Logger::debug("Lazily instantiated tool " + name);
    }
    return entry.instance.get();
}

} // namespace voxgate
