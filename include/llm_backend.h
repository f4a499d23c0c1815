#pragma once

#include "config.h"
#include "errors.h"
#include "tool.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace voxgate {

/**
 * @brief LLM response that may contain text or tool calls
 */
struct LlmReply {
    std::string content;
    std::vector<ToolCall> tool_calls;
    bool has_tool_calls() const { return !tool_calls.empty(); }
    bool has_content() const { return !content.empty(); }
};

/**
 * @brief Consumes a routing payload, returns text and/or tool-call intent
 */
class LlmBackend {
public:
    virtual ~LlmBackend() = default;

    /**
     * @param payload {model, messages, tools?} as built by LLMRouter
     * @return Timeout, NetworkError or ParseError on failure
     */
    virtual Result<LlmReply> complete(const nlohmann::json& payload, int timeout_ms) = 0;
};

/**
 * @brief Chat-completions over HTTP with libcurl (Ollama /api/chat or OpenAI-style)
 */
class HttpLlmBackend : public LlmBackend {
public:
    explicit HttpLlmBackend(const LLMConfig& config);
    ~HttpLlmBackend() override;

    HttpLlmBackend(const HttpLlmBackend&) = delete;
    HttpLlmBackend& operator=(const HttpLlmBackend&) = delete;

    Result<LlmReply> complete(const nlohmann::json& payload, int timeout_ms) override;

    /// Parse an Ollama ({"message": ...}) or OpenAI ({"choices": [...]}) response body
    static Result<LlmReply> parse_reply(const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxgate
