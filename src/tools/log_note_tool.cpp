#include "tools/log_note_tool.h"
#include "intent_classifier.h"
#include "logger.h"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

using json = nlohmann::json;

namespace voxgate {

LogNoteTool::LogNoteTool(std::string notes_path) : notes_path_(std::move(notes_path)) {}

ToolSpec LogNoteTool::spec() {
    ToolSpec spec;
    spec.name = "log_note";
    spec.description = "Save a note the owner dictated for later reference. "
                       "Use this when the owner asks to remember something or make a note.";
    spec.input_schema = {
        {"type", "object"},
        {"properties", {
            {"content", {{"type", "string"}, {"minLength", 1},
                         {"description", "The note text"}}},
            {"tags", {{"type", "array"}, {"items", {{"type", "string"}}},
                      {"description", "Optional tags to categorize the note"}}}
        }},
        {"required", json::array({"content"})},
        {"additionalProperties", false}
    };
    spec.intents = {intent::TOOL_NEEDED, intent::CHAT};
    spec.requires_verification = true;
    return spec;
}

ToolResult LogNoteTool::execute(const json& args) {
    std::string content = args.at("content").get<std::string>();
    std::vector<std::string> tags;
    if (args.contains("tags")) {
        for (const auto& tag : args["tags"]) {
            tags.push_back(tag.get<std::string>());
        }
    }

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");

    std::error_code ec;
    std::filesystem::path path(notes_path_);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(notes_path_, std::ios::app);
    if (!file.is_open()) {
        Logger::error("LogNoteTool: failed to open notes file: " + notes_path_);
        return ToolResult::error_result("Failed to write notes file");
    }

    std::string tag_list;
    for (size_t i = 0; i < tags.size(); ++i) {
        if (i > 0) tag_list += ", ";
        tag_list += tags[i];
    }

    file << "[" << timestamp.str() << "] ";
    if (!tag_list.empty()) {
        file << "[" << tag_list << "] ";
    }
    file << content << "\n";
    if (!file) {
        return ToolResult::error_result("Failed to write notes file");
    }

    std::string result_msg = "Note saved";
    if (!tag_list.empty()) {
        result_msg += " with tags: " + tag_list;
    }
    ToolResult result = ToolResult::success_result(result_msg);
    result.metadata["path"] = notes_path_;
    return result;
}

bool register_log_note_tool(ToolRegistry& registry, const std::string& notes_path) {
    return registry.register_tool(LogNoteTool::spec(), [notes_path]() {
        return std::make_unique<LogNoteTool>(notes_path);
    });
}

} // namespace voxgate
