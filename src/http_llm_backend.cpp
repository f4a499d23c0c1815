#include "llm_backend.h"
#include "logger.h"
#include <curl/curl.h>
#include <sstream>

using json = nlohmann::json;

namespace voxgate {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

ToolCall parse_tool_call(const json& tool_call, int index) {
    ToolCall tc;
    if (tool_call.contains("id") && tool_call["id"].is_string() &&
        !tool_call["id"].get<std::string>().empty()) {
        tc.id = tool_call["id"].get<std::string>();
    } else {
        // Ollama omits ids
        tc.id = "call_" + std::to_string(index);
    }

    if (tool_call.contains("function")) {
        const json& func = tool_call["function"];
        if (func.contains("name") && func["name"].is_string()) {
            tc.name = func["name"].get<std::string>();
        }
        if (func.contains("arguments")) {
            // Ollama returns an object, OpenAI a JSON string
            if (func["arguments"].is_string()) {
                tc.arguments = json::parse(func["arguments"].get<std::string>(), nullptr, false);
                if (tc.arguments.is_discarded()) {
                    tc.arguments = json::object();
                }
            } else {
                tc.arguments = func["arguments"];
            }
        }
    }
    return tc;
}

} // anonymous namespace

class HttpLlmBackend::Impl {
public:
    explicit Impl(const LLMConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<LlmReply> complete(const json& payload, int timeout_ms) {
        json request = payload;
        request["temperature"] = config_.temperature;
        request["stream"] = false;
        if (request.contains("tools")) {
            request["tool_choice"] = "auto";
        }
        std::string request_json = request.dump();

        std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
        if (!curl) {
            return make_error(ErrorType::NetworkError, "Failed to initialize CURL");
        }
        std::unique_ptr<curl_slist, SlistDeleter> headers(
            curl_slist_append(nullptr, "Content-Type: application/json"));

        std::string response_buffer;
        curl_easy_setopt(curl.get(), CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

        LOG_LLM("Sending chat request to " + config_.endpoint + " (model " +
                payload.value("model", std::string("?")) + ")");
        CURLcode res = curl_easy_perform(curl.get());

        if (res == CURLE_OPERATION_TIMEDOUT) {
            return make_timeout_error("LLM request timed out after " + std::to_string(timeout_ms) + " ms");
        }
        if (res != CURLE_OK) {
            return make_error(ErrorType::NetworkError, std::string("LLM request failed: ") + curl_easy_strerror(res));
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (status >= 400) {
            return make_error(ErrorType::NetworkError, "LLM endpoint returned HTTP " + std::to_string(status));
        }

        return parse_reply(response_buffer);
    }

private:
    LLMConfig config_;
};

HttpLlmBackend::HttpLlmBackend(const LLMConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

HttpLlmBackend::~HttpLlmBackend() = default;

Result<LlmReply> HttpLlmBackend::complete(const json& payload, int timeout_ms) {
    return pimpl_->complete(payload, timeout_ms);
}

Result<LlmReply> HttpLlmBackend::parse_reply(const std::string& body) {
    LlmReply reply;
    try {
        json response_json = json::parse(body);

        json message;
        if (response_json.contains("message")) {
            message = response_json["message"];
        } else if (response_json.contains("choices") && response_json["choices"].is_array() &&
                   !response_json["choices"].empty() && response_json["choices"][0].contains("message")) {
            message = response_json["choices"][0]["message"];
        } else {
            return make_parse_error("LLM response has no message");
        }

        if (message.contains("content") && message["content"].is_string()) {
            reply.content = message["content"].get<std::string>();
        }
        if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
            int index = 0;
            for (const auto& tool_call : message["tool_calls"]) {
                reply.tool_calls.push_back(parse_tool_call(tool_call, ++index));
            }
        }
    } catch (const json::exception& e) {
        return make_parse_error("JSON parse error: " + std::string(e.what()));
    }

    std::ostringstream oss;
    oss << "Reply: " << reply.content.size() << " chars, " << reply.tool_calls.size() << " tool call(s)";
    LOG_LLM(oss.str());
    return reply;
}

} // namespace voxgate
