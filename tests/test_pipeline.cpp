/**
 * Deterministic harness for the post-verification pipeline.
 * Asserts:
 * - A verified utterance flows ASR -> intent -> routing -> LLM -> tool gate.
 * - The verification token reaches at most one tool call.
 * - Vague and blank transcripts get a clarification and never reach the LLM.
 * - ASR and LLM failures surface as errors; transient ones are retried once.
 * - Collaborators that never return cannot accumulate unbounded worker threads.
 * - ASR routing falls back on low confidence; LLM replies parse in both formats.
 *
 * Run from build dir: ./test_pipeline
 * No whisper, PortAudio or network required.
 */

#include "asr_router.h"
#include "config.h"
#include "llm_backend.h"
#include "metrics.h"
#include "timeout.h"
#include "tool_gate.h"
#include "tools/log_note_tool.h"
#include "voice_agent.h"
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

using namespace voxgate;
using json = nlohmann::json;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

class ScriptedRecognizer : public SpeechRecognizer {
public:
    explicit ScriptedRecognizer(std::string name) : name_(std::move(name)) {}

    Result<Transcript> transcribe(const AudioBuffer&, int) override {
        calls++;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!errors.empty()) {
            Error e = errors.front();
            errors.pop_front();
            return e;
        }
        Transcript t;
        t.text = text;
        t.confidence = confidence;
        return t;
    }

    std::string name() const override { return name_; }

    std::string text;
    float confidence = 0.9f;
    std::deque<Error> errors;
    std::atomic<int> calls{0};

private:
    std::string name_;
    std::mutex mutex_;
};

class ScriptedLlm : public LlmBackend {
public:
    Result<LlmReply> complete(const json& payload, int) override {
        calls++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_payload = payload;
        }
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        return reply;
    }

    LlmReply reply;
    json last_payload;
    int delay_ms = 0;
    std::atomic<int> calls{0};

private:
    std::mutex mutex_;
};

ToolCall note_call(const std::string& id, const std::string& content) {
    ToolCall call;
    call.id = id;
    call.name = "log_note";
    call.arguments = {{"content", content}};
    return call;
}

} // anonymous namespace

int main() {
    fs::path dir = fs::temp_directory_path() / ("voxgate_pipeline_test_" + std::to_string(::getpid()));
    fs::remove_all(dir);

    Config config;
    config.verification.threshold = 0.75f;
    config.timeouts.asr_ms = 1000;
    config.timeouts.llm_ms = 1000;
    config.timeouts.transient_retries = 1;
    config.router.fast_model = "fast-model";
    config.router.capable_model = "capable-model";
    config.router.clarification_prompt = "Could you say more?";

    auto recognizer = std::make_shared<ScriptedRecognizer>("fake_asr");
    auto llm = std::make_shared<ScriptedLlm>();
    auto tokens = std::make_shared<TokenAuthority>(30000);
    auto registry = std::make_shared<ToolRegistry>();
    auto metrics = std::make_shared<InMemoryMetrics>();
    ASSERT(register_log_note_tool(*registry, (dir / "notes.txt").string()));

    AgentDeps deps;
    deps.recognizer = recognizer;
    deps.llm = llm;
    deps.registry = registry;
    deps.gate = std::make_shared<ToolGate>(registry, tokens, "alice", metrics);
    deps.metrics = metrics;
    VoiceAgent agent(config, deps);

    auto utterance_for = [&tokens](const std::string& owner) {
        VerifiedUtterance u;
        u.owner_id = owner;
        u.audio_segment.assign(16000, 1000);
        u.sample_rate = DEFAULT_SAMPLE_RATE;
        u.confidence = 0.9f;
        u.token = tokens->issue(owner).value();
        return u;
    };

    // --- Verified request that needs a tool ---
    recognizer->text = "run a tool to note that I need milk";
    llm->reply.content = "";
    llm->reply.tool_calls = {note_call("call_1", "need milk")};
    VerifiedUtterance first = utterance_for("alice");
    auto response = agent.handle(first);
    ASSERT(response.is_ok());
    ASSERT(response.value().transcript.text == "run a tool to note that I need milk");
    ASSERT(response.value().intent.label == intent::TOOL_NEEDED);
    ASSERT(!response.value().decision.clarification_needed);
    ASSERT(response.value().decision.model_name == "fast-model");
    ASSERT(response.value().tool_outcomes.size() == 1);
    ASSERT(response.value().tool_outcomes[0].dispatched);
    ASSERT(response.value().tool_outcomes[0].result.success);
    ASSERT(response.value().reply_text == "Note saved.");
    ASSERT(llm->calls == 1);
    ASSERT(llm->last_payload["model"] == "fast-model");
    ASSERT(llm->last_payload.contains("tools"));
    ASSERT(llm->last_payload["messages"].size() == 2);
    ASSERT(tokens->outstanding() == 0);
    ASSERT(agent.history().message_count() == 2);
    ASSERT(metrics->count("tool_dispatched{tool=log_note}") == 1);

    // --- Same utterance again: its token is spent ---
    auto replay = agent.handle(first);
    ASSERT(replay.is_ok());
    ASSERT(replay.value().tool_outcomes.size() == 1);
    ASSERT(!replay.value().tool_outcomes[0].dispatched);
    ASSERT(replay.value().tool_outcomes[0].error.type == ErrorType::Unverified);
    ASSERT(replay.value().reply_text.find("was not run (Unverified)") != std::string::npos);
    // Previous turn is now part of the prompt
    ASSERT(llm->last_payload["messages"].size() == 4);

    // --- Two tool calls: only the first gets the token ---
    llm->reply.tool_calls = {note_call("call_1", "first"), note_call("call_2", "second")};
    auto two_calls = agent.handle(utterance_for("alice"));
    ASSERT(two_calls.is_ok());
    ASSERT(two_calls.value().tool_outcomes.size() == 2);
    ASSERT(two_calls.value().tool_outcomes[0].dispatched);
    ASSERT(!two_calls.value().tool_outcomes[1].dispatched);
    ASSERT(two_calls.value().tool_outcomes[1].error.type == ErrorType::Unverified);

    // --- Plain chat reply ---
    recognizer->text = "what is the capital of France?";
    llm->reply.tool_calls.clear();
    llm->reply.content = "Paris.";
    auto chat = agent.handle(utterance_for("alice"));
    ASSERT(chat.is_ok());
    ASSERT(chat.value().intent.label == intent::CHAT);
    ASSERT(chat.value().reply_text == "Paris.");
    ASSERT(chat.value().tool_outcomes.empty());

    // --- Vague request: clarification, no LLM call ---
    int llm_calls_before = llm->calls;
    recognizer->text = "do something";
    auto vague = agent.handle(utterance_for("alice"));
    ASSERT(vague.is_ok());
    ASSERT(vague.value().decision.clarification_needed);
    ASSERT(vague.value().decision.tool_schema_refs.empty());
    ASSERT(vague.value().reply_text == "Could you say more?");
    ASSERT(vague.value().tool_outcomes.empty());
    ASSERT(llm->calls == llm_calls_before);

    // --- Blank transcript: clarification, history untouched ---
    size_t history_before = agent.history().message_count();
    recognizer->text = "[BLANK_AUDIO]";
    auto blank = agent.handle(utterance_for("alice"));
    ASSERT(blank.is_ok());
    ASSERT(blank.value().intent.label == intent::UNKNOWN);
    ASSERT(blank.value().decision.clarification_needed);
    ASSERT(agent.history().message_count() == history_before);
    ASSERT(llm->calls == llm_calls_before);

    // --- ASR failures ---
    recognizer->text = "what is the weather?";
    recognizer->calls = 0;
    recognizer->errors = {make_error(ErrorType::NetworkError, "model unavailable")};
    auto asr_down = agent.handle(utterance_for("alice"));
    ASSERT(asr_down.error_type() == ErrorType::NetworkError);
    ASSERT(recognizer->calls == 1);

    recognizer->calls = 0;
    recognizer->errors = {make_timeout_error("slow")};
    auto asr_retry = agent.handle(utterance_for("alice"));
    ASSERT(asr_retry.is_ok());
    ASSERT(recognizer->calls == 2);

    // --- LLM timeout is bounded and retried once ---
    {
        Config slow_config = config;
        slow_config.timeouts.llm_ms = 40;
        auto slow_llm = std::make_shared<ScriptedLlm>();
        slow_llm->delay_ms = 300;
        AgentDeps slow_deps = deps;
        slow_deps.llm = slow_llm;
        VoiceAgent slow_agent(slow_config, slow_deps);

        auto started = std::chrono::steady_clock::now();
        auto timed_out = slow_agent.handle(utterance_for("alice"));
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        ASSERT(timed_out.error_type() == ErrorType::Timeout);
        ASSERT(elapsed < 250);
        // Let the abandoned calls finish before their fakes go away
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        ASSERT(slow_llm->calls == 2);
    }

    // --- Hung calls are capped ---
    {
        auto drained = [](int deadline_ms) {
            for (int waited = 0; waited < deadline_ms; waited += 10) {
                if (bounded_calls_in_flight().load() == 0) return true;
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            return bounded_calls_in_flight().load() == 0;
        };
        ASSERT(drained(2000));

        auto release = std::make_shared<std::promise<void>>();
        std::shared_future<void> released = release->get_future().share();
        for (int i = 0; i < MAX_BOUNDED_CALLS_IN_FLIGHT; ++i) {
            auto hung = call_with_timeout<int>([released]() -> Result<int> {
                released.wait();
                return 1;
            }, 5, "hung call");
            ASSERT(hung.error_type() == ErrorType::Timeout);
        }
        ASSERT(bounded_calls_in_flight().load() == MAX_BOUNDED_CALLS_IN_FLIGHT);

        auto ran = std::make_shared<std::atomic<int>>(0);
        auto refused = call_with_timeout<int>([ran]() -> Result<int> {
            ran->fetch_add(1);
            return 2;
        }, 1000, "extra call");
        ASSERT(refused.error_type() == ErrorType::Timeout);
        ASSERT(ran->load() == 0);
        ASSERT(bounded_calls_in_flight().load() == MAX_BOUNDED_CALLS_IN_FLIGHT);

        release->set_value();
        ASSERT(drained(2000));
        auto recovered = call_with_timeout<int>([ran]() -> Result<int> {
            ran->fetch_add(1);
            return 3;
        }, 1000, "recovered call");
        ASSERT(recovered.is_ok() && recovered.value() == 3);
        ASSERT(ran->load() == 1);
    }

    // --- Missing collaborators ---
    {
        AgentDeps incomplete;
        incomplete.recognizer = recognizer;
        bool threw = false;
        try {
            VoiceAgent broken(config, incomplete);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT(threw);
    }

    // --- ASR routing ---
    {
        auto primary = std::make_shared<ScriptedRecognizer>("primary");
        auto fallback = std::make_shared<ScriptedRecognizer>("fallback");
        auto asr_metrics = std::make_shared<InMemoryMetrics>();
        ASRConfig asr_config;
        asr_config.fallback_threshold = 0.7f;
        asr_config.min_confidence = 0.0f;
        AsrRouter router(primary, fallback, asr_config, asr_metrics);
        AudioBuffer audio(16000, 0);

        primary->text = "confident";
        primary->confidence = 0.9f;
        fallback->text = "fallback";
        fallback->confidence = 0.8f;
        auto confident = router.transcribe(audio, DEFAULT_SAMPLE_RATE);
        ASSERT(confident.is_ok() && confident.value().text == "confident");
        ASSERT(confident.value().source == "primary");
        ASSERT(fallback->calls == 0);

        primary->confidence = 0.4f;
        auto unsure = router.transcribe(audio, DEFAULT_SAMPLE_RATE);
        ASSERT(unsure.is_ok() && unsure.value().text == "fallback");
        ASSERT(unsure.value().source == "fallback");
        ASSERT(fallback->calls == 1);

        // Fallback failing keeps the primary transcript
        fallback->errors = {make_io_error("no model")};
        auto kept = router.transcribe(audio, DEFAULT_SAMPLE_RATE);
        ASSERT(kept.is_ok() && kept.value().text == "confident");

        primary->errors = {make_io_error("no model")};
        auto rescued = router.transcribe(audio, DEFAULT_SAMPLE_RATE);
        ASSERT(rescued.is_ok() && rescued.value().text == "fallback");

        ASSERT(asr_metrics->count("asr_calls{source=primary}") == 4);
        ASSERT(asr_metrics->count("asr_calls{source=fallback}") == 3);

        asr_config.min_confidence = 0.5f;
        AsrRouter strict(primary, nullptr, asr_config);
        primary->confidence = 0.3f;
        ASSERT(strict.transcribe(audio, DEFAULT_SAMPLE_RATE).error_type() == ErrorType::LowConfidence);
        primary->confidence = 0.6f;
        ASSERT(strict.transcribe(audio, DEFAULT_SAMPLE_RATE).is_ok());
    }

    // --- LLM reply parsing ---
    {
        auto ollama = HttpLlmBackend::parse_reply(
            R"({"model":"m","message":{"role":"assistant","content":"",)"
            R"("tool_calls":[{"function":{"name":"log_note","arguments":{"content":"hi"}}}]},"done":true})");
        ASSERT(ollama.is_ok());
        ASSERT(ollama.value().has_tool_calls());
        ASSERT(ollama.value().tool_calls[0].id == "call_1");
        ASSERT(ollama.value().tool_calls[0].name == "log_note");
        ASSERT(ollama.value().tool_calls[0].arguments["content"] == "hi");

        auto openai = HttpLlmBackend::parse_reply(
            R"({"choices":[{"message":{"role":"assistant","content":null,)"
            R"("tool_calls":[{"id":"abc","type":"function","function":{"name":"log_note","arguments":"{\"content\":\"x\"}"}}]}}]})");
        ASSERT(openai.is_ok());
        ASSERT(!openai.value().has_content());
        ASSERT(openai.value().tool_calls[0].id == "abc");
        ASSERT(openai.value().tool_calls[0].arguments["content"] == "x");

        auto text = HttpLlmBackend::parse_reply(R"({"message":{"role":"assistant","content":"Hello"}})");
        ASSERT(text.is_ok() && text.value().content == "Hello" && !text.value().has_tool_calls());

        ASSERT(HttpLlmBackend::parse_reply("not json").error_type() == ErrorType::ParseError);
        ASSERT(HttpLlmBackend::parse_reply(R"({"error":"model not found"})").error_type() == ErrorType::ParseError);
    }

    fs::remove_all(dir);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All pipeline tests passed.\n";
    return 0;
}
