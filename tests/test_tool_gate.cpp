/**
 * Authorization at the tool boundary.
 * Asserts:
 * - Tools that require verification never run without a fresh, unused token
 *   issued to the enrolled owner.
 * - Tokens are consumed by the first dispatch attempt, successful or not.
 * - Schema violations are InvalidArgs and happen before the tool is built.
 * - Without a valid token, a verified tool call is Unverified no matter what
 *   else is wrong with it, and unknown names do not reveal the catalog.
 * - Tools marked for confirmation run only after the owner answers yes.
 * - Tools are built lazily, once, and only through the gate.
 *
 * Run from build dir: ./test_tool_gate
 */

#include "llm_router.h"
#include "metrics.h"
#include "schema_validator.h"
#include "tool_gate.h"
#include "tool_registry.h"
#include "tools/log_note_tool.h"
#include "verification_token.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

using namespace voxgate;
using json = nlohmann::json;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

int g_timer_builds = 0;
int g_timer_runs = 0;

class TimerTool : public Tool {
public:
    TimerTool() { g_timer_builds++; }
    std::string name() const override { return "set_timer"; }
    ToolResult execute(const json& args) override {
        g_timer_runs++;
        return ToolResult::success_result("Timer set for " + std::to_string(args["minutes"].get<int>()) + " minutes");
    }
};

class ClockTool : public Tool {
public:
    std::string name() const override { return "get_time"; }
    ToolResult execute(const json&) override { return ToolResult::success_result("It is noon"); }
};

int g_call_builds = 0;

class CallTool : public Tool {
public:
    CallTool() { g_call_builds++; }
    std::string name() const override { return "place_call"; }
    ToolResult execute(const json& args) override {
        return ToolResult::success_result("Calling " + args["contact"].get<std::string>());
    }
};

class ExplodingTool : public Tool {
public:
    std::string name() const override { return "explode"; }
    ToolResult execute(const json&) override { throw std::runtime_error("boom"); }
};

ToolSpec make_spec(const std::string& name, json schema, bool requires_verification) {
    ToolSpec spec;
    spec.name = name;
    spec.description = name;
    spec.input_schema = std::move(schema);
    spec.intents = {intent::TOOL_NEEDED};
    spec.requires_verification = requires_verification;
    return spec;
}

} // anonymous namespace

int main() {
    // --- Schema validation ---
    json timer_schema = {
        {"type", "object"},
        {"properties", {
            {"minutes", {{"type", "integer"}}},
            {"label", {{"type", "string"}, {"maxLength", 8}}},
            {"unit", {{"type", "string"}, {"enum", json::array({"min", "sec"})}}},
            {"options", {{"type", "object"},
                         {"properties", {{"loud", {{"type", "boolean"}}}}},
                         {"additionalProperties", false}}}
        }},
        {"required", json::array({"minutes"})},
        {"additionalProperties", false}
    };
    ASSERT(validate_arguments(timer_schema, {{"minutes", 5}}).is_ok());
    ASSERT(validate_arguments(timer_schema, {{"minutes", 5}, {"unit", "sec"}, {"options", {{"loud", true}}}}).is_ok());
    ASSERT(validate_arguments(timer_schema, json::object()).error_type() == ErrorType::InvalidArgs);
    ASSERT(validate_arguments(timer_schema, {{"minutes", "five"}}).error_type() == ErrorType::InvalidArgs);
    ASSERT(validate_arguments(timer_schema, {{"minutes", 1.5}}).error_type() == ErrorType::InvalidArgs);
    ASSERT(validate_arguments(timer_schema, {{"minutes", 5}, {"extra", 1}}).error_type() == ErrorType::InvalidArgs);
    ASSERT(validate_arguments(timer_schema, {{"minutes", 5}, {"unit", "hour"}}).error_type() == ErrorType::InvalidArgs);
    ASSERT(validate_arguments(timer_schema, {{"minutes", 5}, {"label", "far too long"}}).error_type() == ErrorType::InvalidArgs);
    ASSERT(validate_arguments(timer_schema, {{"minutes", 5}, {"options", {{"loud", "yes"}}}}).error_type() == ErrorType::InvalidArgs);
    ASSERT(validate_arguments(timer_schema, {{"minutes", 5}, {"options", {{"quiet", true}}}}).error_type() == ErrorType::InvalidArgs);
    ASSERT(validate_arguments(timer_schema, json::array()).error_type() == ErrorType::InvalidArgs);
    ASSERT(validate_arguments(timer_schema, "minutes=5").error_type() == ErrorType::InvalidArgs);

    json open_schema = {{"type", "object"}, {"properties", {{"tags", {{"type", "array"}, {"items", {{"type", "string"}}}}}}}};
    ASSERT(validate_arguments(open_schema, {{"anything", 1}}).is_ok());
    ASSERT(validate_arguments(open_schema, {{"tags", json::array({"a", "b"})}}).is_ok());
    ASSERT(validate_arguments(open_schema, {{"tags", json::array({"a", 2})}}).error_type() == ErrorType::InvalidArgs);

    // --- Gate setup ---
    TimePoint now = Clock::now();
    auto tokens = std::make_shared<TokenAuthority>(1000, [&now]() { return now; });
    auto registry = std::make_shared<ToolRegistry>();
    auto metrics = std::make_shared<InMemoryMetrics>();
    ASSERT(registry->register_tool(make_spec("set_timer", timer_schema, true),
                                   []() { return std::make_unique<TimerTool>(); }));
    ASSERT(registry->register_tool(make_spec("get_time", {{"type", "object"}}, false),
                                   []() { return std::make_unique<ClockTool>(); }));
    ASSERT(registry->register_tool(make_spec("explode", {{"type", "object"}}, true),
                                   []() { return std::make_unique<ExplodingTool>(); }));
    json call_schema = {
        {"type", "object"},
        {"properties", {{"contact", {{"type", "string"}}}}},
        {"required", json::array({"contact"})}
    };
    ASSERT(registry->register_tool(make_spec("place_call", call_schema, true),
                                   []() { return std::make_unique<CallTool>(); }));
    ASSERT(registry->require_confirmation("place_call"));
    ASSERT(!registry->require_confirmation("no_such_tool"));
    ASSERT(!registry->find("set_timer")->requires_confirmation);
    ASSERT(!registry->register_tool(make_spec("", {{"type", "object"}}, true),
                                    []() { return std::make_unique<ClockTool>(); }));
    ASSERT(!registry->register_tool(make_spec("bad_schema", "not an object", true),
                                    []() { return std::make_unique<ClockTool>(); }));

    fs::path dir = fs::temp_directory_path() / ("voxgate_gate_test_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    std::string notes_path = (dir / "notes.txt").string();
    ASSERT(register_log_note_tool(*registry, notes_path));
    ASSERT(registry->instantiated_count() == 0);

    ToolGate gate(registry, tokens, "alice", metrics);

    RoutingDecision decision;
    decision.intent_label = intent::TOOL_NEEDED;
    decision.confidence = 0.9f;
    decision.tool_schema_refs = {"set_timer", "get_time", "explode", "log_note", "place_call"};

    ToolCall timer{"call_1", "set_timer", {{"minutes", 10}}};

    // --- No token ---
    auto no_token = gate.authorize_and_dispatch(decision, std::nullopt, timer);
    ASSERT(no_token.error_type() == ErrorType::Unverified);
    ASSERT(is_security_error(no_token.error_type()));
    ASSERT(metrics->count("tool_denied{reason=Unverified}") == 1);

    // --- Bad arguments with a good token: rejected before the tool exists ---
    auto token = tokens->issue("alice").value();
    ToolCall bad_timer{"call_2", "set_timer", {{"minutes", "ten"}}};
    ASSERT(gate.authorize_and_dispatch(decision, token, bad_timer).error_type() == ErrorType::InvalidArgs);
    ASSERT(g_timer_builds == 0);
    ASSERT(registry->instantiated_count() == 0);
    // ... and the token is gone
    ASSERT(gate.authorize_and_dispatch(decision, token, timer).error_type() == ErrorType::Unverified);
    ASSERT(g_timer_builds == 0);

    ToolCall extra_field{"call_3", "set_timer", {{"minutes", 1}, {"rm", "-rf"}}};
    ASSERT(gate.authorize_and_dispatch(decision, tokens->issue("alice").value(), extra_field).error_type() ==
           ErrorType::InvalidArgs);
    ASSERT(g_timer_builds == 0);

    // --- Valid token, valid arguments ---
    token = tokens->issue("alice").value();
    auto ran = gate.authorize_and_dispatch(decision, token, timer);
    ASSERT(ran.is_ok());
    ASSERT(ran.value().success);
    ASSERT(ran.value().content == "Timer set for 10 minutes");
    ASSERT(g_timer_builds == 1);
    ASSERT(g_timer_runs == 1);
    ASSERT(metrics->count("tool_dispatched{tool=set_timer}") == 1);

    // --- Replay ---
    ASSERT(gate.authorize_and_dispatch(decision, token, timer).error_type() == ErrorType::Unverified);
    ASSERT(g_timer_runs == 1);

    // --- Expired ---
    auto expiring = tokens->issue("alice").value();
    now += std::chrono::milliseconds(1001);
    ASSERT(gate.authorize_and_dispatch(decision, expiring, timer).error_type() == ErrorType::Unverified);
    ASSERT(g_timer_runs == 1);

    // --- Issued to someone else ---
    auto for_bob = tokens->issue("bob").value();
    ASSERT(gate.authorize_and_dispatch(decision, for_bob, timer).error_type() == ErrorType::Unverified);
    ASSERT(g_timer_runs == 1);

    // --- Forged ---
    VerificationToken forged;
    forged.id = "00112233445566778899aabbccddeeff";
    forged.owner_id = "alice";
    ASSERT(gate.authorize_and_dispatch(decision, forged, timer).error_type() == ErrorType::Unverified);

    // --- Second run reuses the cached instance ---
    ASSERT(gate.authorize_and_dispatch(decision, tokens->issue("alice").value(), timer).is_ok());
    ASSERT(g_timer_builds == 1);
    ASSERT(g_timer_runs == 2);

    // --- Unknown tool ---
    ToolCall unknown{"call_4", "delete_everything", json::object()};
    auto unknown_result = gate.authorize_and_dispatch(decision, tokens->issue("alice").value(), unknown);
    ASSERT(unknown_result.error_type() == ErrorType::UnknownTool);
    // Without a token the caller cannot tell unknown names from real ones
    ASSERT(gate.authorize_and_dispatch(decision, std::nullopt, unknown).error_type() == ErrorType::Unverified);
    auto stale_token = tokens->issue("alice").value();
    ASSERT(gate.authorize_and_dispatch(decision, stale_token, timer).is_ok());
    ASSERT(gate.authorize_and_dispatch(decision, stale_token, unknown).error_type() == ErrorType::Unverified);
    ASSERT(g_timer_runs == 3);

    // --- Registered but not offered for this decision ---
    RoutingDecision narrow = decision;
    narrow.tool_schema_refs = {"get_time"};
    ASSERT(gate.authorize_and_dispatch(narrow, tokens->issue("alice").value(), timer).error_type() ==
           ErrorType::InvalidArgs);
    ASSERT(gate.authorize_and_dispatch(narrow, std::nullopt, timer).error_type() == ErrorType::Unverified);
    ASSERT(g_timer_runs == 3);

    // --- Clarification pending: nothing runs, token still consumed ---
    RoutingDecision unclear = decision;
    unclear.clarification_needed = true;
    auto pending_token = tokens->issue("alice").value();
    ASSERT(gate.authorize_and_dispatch(unclear, pending_token, timer).error_type() == ErrorType::InvalidState);
    ASSERT(gate.authorize_and_dispatch(decision, pending_token, timer).error_type() == ErrorType::Unverified);
    // A missing token outranks the pending clarification
    auto unclear_no_token = gate.authorize_and_dispatch(unclear, std::nullopt, timer);
    ASSERT(unclear_no_token.error_type() == ErrorType::Unverified);
    ASSERT(is_security_error(unclear_no_token.error_type()));
    ToolCall clock_call{"call_4b", "get_time", json::object()};
    ASSERT(gate.authorize_and_dispatch(unclear, std::nullopt, clock_call).error_type() == ErrorType::InvalidState);
    ASSERT(g_timer_runs == 3);

    // --- Tool without requires_verification runs without a token ---
    ToolCall what_time{"call_5", "get_time", json::object()};
    auto time_result = gate.authorize_and_dispatch(decision, std::nullopt, what_time);
    ASSERT(time_result.is_ok() && time_result.value().content == "It is noon");

    // --- A throwing tool becomes a failed result ---
    ToolCall explode{"call_6", "explode", json::object()};
    auto exploded = gate.authorize_and_dispatch(decision, tokens->issue("alice").value(), explode);
    ASSERT(exploded.is_ok());
    ASSERT(!exploded.value().success);
    ASSERT(exploded.value().error.find("boom") != std::string::npos);

    // --- Confirmation ---
    ToolCall call_mum{"call_9", "place_call", {{"contact", "mum"}}};
    auto unconfirmed = gate.authorize_and_dispatch(decision, tokens->issue("alice").value(), call_mum);
    ASSERT(unconfirmed.error_type() == ErrorType::NotConfirmed);
    ASSERT(metrics->count("tool_denied{reason=NotConfirmed}") == 1);
    ASSERT(g_call_builds == 0);

    std::vector<std::string> questions;
    std::string answer = "no";
    gate.set_confirmation_prompt([&questions, &answer](const std::string& question) {
        questions.push_back(question);
        return answer;
    });

    auto declined_token = tokens->issue("alice").value();
    ASSERT(gate.authorize_and_dispatch(decision, declined_token, call_mum).error_type() == ErrorType::NotConfirmed);
    ASSERT(questions.size() == 1);
    ASSERT(questions[0].find("place_call") != std::string::npos);
    ASSERT(g_call_builds == 0);
    // Declining still spends the token
    answer = "yes";
    ASSERT(gate.authorize_and_dispatch(decision, declined_token, call_mum).error_type() == ErrorType::Unverified);
    ASSERT(questions.size() == 1);

    // Bad arguments are refused before the owner is asked
    ToolCall call_nobody{"call_10", "place_call", json::object()};
    ASSERT(gate.authorize_and_dispatch(decision, tokens->issue("alice").value(), call_nobody).error_type() ==
           ErrorType::InvalidArgs);
    ASSERT(questions.size() == 1);

    answer = "  Yes. ";
    auto confirmed = gate.authorize_and_dispatch(decision, tokens->issue("alice").value(), call_mum);
    ASSERT(confirmed.is_ok() && confirmed.value().content == "Calling mum");
    ASSERT(questions.size() == 2);
    ASSERT(g_call_builds == 1);

    // Tools without the flag never prompt
    ASSERT(gate.authorize_and_dispatch(decision, tokens->issue("alice").value(), timer).is_ok());
    ASSERT(questions.size() == 2);

    // --- log_note end to end ---
    ToolCall empty_note{"call_7", "log_note", {{"content", ""}}};
    ASSERT(gate.authorize_and_dispatch(decision, tokens->issue("alice").value(), empty_note).error_type() ==
           ErrorType::InvalidArgs);
    ToolCall note{"call_8", "log_note", {{"content", "buy milk"}, {"tags", json::array({"errands", "home"})}}};
    auto noted = gate.authorize_and_dispatch(decision, tokens->issue("alice").value(), note);
    ASSERT(noted.is_ok() && noted.value().success);
    ASSERT(noted.value().content == "Note saved with tags: errands, home");
    {
        std::ifstream in(notes_path);
        std::ostringstream oss;
        oss << in.rdbuf();
        std::string contents = oss.str();
        ASSERT(contents.find("[errands, home] buy milk") != std::string::npos);
    }
    ASSERT(registry->instantiated_count() == 5);

    fs::remove_all(dir);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All tool gate tests passed.\n";
    return 0;
}
