#pragma once

#include "tool.h"
#include "tool_registry.h"
#include <string>

namespace voxgate {

/**
 * @brief Appends a timestamped note (with optional tags) to a text file
 *
 * Registered with requires_verification: notes persist on the owner's disk.
 */
class LogNoteTool : public Tool {
public:
    explicit LogNoteTool(std::string notes_path);

    std::string name() const override { return "log_note"; }

    ToolResult execute(const nlohmann::json& args) override;

    /// Registration metadata: description, input schema, intents
    static ToolSpec spec();

private:
    std::string notes_path_;
};

/// Register log_note with a factory bound to notes_path
bool register_log_note_tool(ToolRegistry& registry, const std::string& notes_path);

} // namespace voxgate
