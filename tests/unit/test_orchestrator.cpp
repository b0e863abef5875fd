#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "orchestrator.hpp"
#include "tool_registry.hpp"
#include "tools/local_tools.hpp"
#include "fake_generation_service.hpp"
#include "test_support.hpp"

namespace {

using bashbuddy::AskResult;
using bashbuddy::Config;
using bashbuddy::ConversationTurn;
using bashbuddy::LocalToolExecutor;
using bashbuddy::Orchestrator;
using bashbuddy::ToolContext;
using bashbuddy::ToolRegistry;
using bashbuddy_test::ScriptedService;
using bashbuddy_test::TempDir;
using bashbuddy_test::text_turn;
using bashbuddy_test::tool_turn;
using nlohmann::json;

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest() : executor_(registry_, make_config()) {
        bashbuddy::register_local_tools(registry_);
    }

    static Config make_config() {
        Config cfg;
        cfg.max_retries = 0;
        return cfg;
    }

    AskResult ask(const std::string& query, const Config& cfg = make_config()) {
        Orchestrator orchestrator(service_, registry_, executor_, cfg);
        std::vector<ConversationTurn> history = {{"user", query}};
        return orchestrator.run(history, ToolContext{workspace_.root().string()});
    }

    ToolRegistry registry_;
    LocalToolExecutor executor_;
    ScriptedService service_;
    TempDir workspace_{"bb_orch"};
};

TEST_F(OrchestratorTest, ToolThenFinalAnswer) {
    workspace_.write("a.txt", "a");
    service_.push(tool_turn("list_files", {{"path", "."}}));
    service_.push(tool_turn("suggested_command", {{"command", "ls"}, {"explanation", "lists files"}}));

    auto result = ask("list files here");

    EXPECT_TRUE(result.is_command);
    EXPECT_EQ(result.command, "ls");
    EXPECT_EQ(result.explanation, "lists files");
    EXPECT_EQ(result.function_calls_json(),
              json::parse(R"([{"name": "list_files", "args": {"path": "."}}])"));
    EXPECT_EQ(result.recorded_turn, "Command: ls\nExplanation: lists files");
    EXPECT_EQ(result.iterations, 2);

    // Second request carries the tool call and its result
    ASSERT_EQ(service_.call_count(), 2u);
    auto second = service_.call(1);
    ASSERT_EQ(second.size(), 4u);
    EXPECT_EQ(second[2].role, "assistant");
    ASSERT_EQ(second[2].tool_calls.size(), 1u);
    EXPECT_EQ(second[2].tool_calls[0].name, "list_files");
    EXPECT_EQ(second[3].role, "tool");
    EXPECT_EQ(second[3].tool_call_id, second[2].tool_calls[0].id);
    auto tool_result = json::parse(second[3].content);
    EXPECT_EQ(tool_result["result"][0], "a.txt");
}

TEST_F(OrchestratorTest, ContextStartsWithSystemInstructionAndHistory) {
    service_.push(tool_turn("suggested_command", {{"command", "pwd"}, {"explanation", "e"}}));
    Orchestrator orchestrator(service_, registry_, executor_, make_config());
    std::vector<ConversationTurn> history = {
        {"user", "list files"},
        {"assistant", "Command: ls\nExplanation: e"},
        {"user", "where am I"}
    };
    orchestrator.run(history);

    auto first = service_.call(0);
    ASSERT_EQ(first.size(), 4u);
    EXPECT_EQ(first[0].role, "system");
    EXPECT_EQ(first[0].content, bashbuddy::SYSTEM_INSTRUCTION);
    EXPECT_EQ(first[1].role, "user");
    EXPECT_EQ(first[2].role, "assistant");
    EXPECT_EQ(first[3].content, "where am I");
    EXPECT_EQ(service_.last_tools().size(), 5u);
}

TEST_F(OrchestratorTest, PlainTextIsRetriedExactlyOnce) {
    service_.push(text_turn("You could use ls."));
    service_.push(text_turn("Really, just use ls."));

    auto result = ask("list files");

    EXPECT_FALSE(result.is_command);
    EXPECT_EQ(result.message, "Really, just use ls.");
    EXPECT_EQ(result.recorded_turn, "Really, just use ls.");
    EXPECT_TRUE(result.function_calls.empty());
    ASSERT_EQ(service_.call_count(), 2u);

    auto retry = service_.call(1);
    ASSERT_GE(retry.size(), 2u);
    EXPECT_EQ(retry[retry.size() - 2].role, "assistant");
    EXPECT_EQ(retry[retry.size() - 2].content, "You could use ls.");
    EXPECT_EQ(retry.back().role, "user");
    EXPECT_EQ(retry.back().content, bashbuddy::CORRECTIVE_INSTRUCTION);
}

TEST_F(OrchestratorTest, CorrectiveTurnCanRecoverFinalAnswer) {
    service_.push(text_turn("Use du -sh."));
    service_.push(tool_turn("suggested_command", {{"command", "du -sh ."}, {"explanation", "size"}}));

    auto result = ask("how big is this folder");
    EXPECT_TRUE(result.is_command);
    EXPECT_EQ(result.command, "du -sh .");
    EXPECT_EQ(service_.call_count(), 2u);
}

TEST_F(OrchestratorTest, IterationCapEndsWithWarning) {
    service_.set_fallback([](const std::vector<bashbuddy::Message>&) {
        return tool_turn("get_current_directory", json::object());
    });

    auto result = ask("loop forever");

    EXPECT_EQ(service_.call_count(), 10u);
    EXPECT_EQ(result.iterations, 10);
    EXPECT_TRUE(result.exhausted);
    EXPECT_FALSE(result.is_command);
    EXPECT_EQ(result.function_calls.size(), 10u);
    EXPECT_EQ(result.message,
              "[Warning: Exceeded function call limit after 10 function calls]\n\nNo response generated");
    EXPECT_EQ(result.recorded_turn, "No response generated");
}

TEST_F(OrchestratorTest, IterationCapKeepsLastText) {
    service_.push(text_turn("Thinking about it."));
    service_.set_fallback([](const std::vector<bashbuddy::Message>&) {
        return tool_turn("check_command_exists", {{"command", "git"}});
    });

    auto result = ask("loop");
    EXPECT_TRUE(result.exhausted);
    EXPECT_EQ(result.function_calls.size(), 9u);
    EXPECT_EQ(result.recorded_turn, "Thinking about it.");
    EXPECT_NE(result.message.find("after 9 function calls]\n\nThinking about it."), std::string::npos);
}

TEST_F(OrchestratorTest, UnknownToolIsFedBackAsError) {
    service_.push(tool_turn("format_disk", {{"device", "/dev/sda"}}));
    service_.push(tool_turn("suggested_command", {{"command", "lsblk"}, {"explanation", "e"}}));

    auto result = ask("show disks");
    EXPECT_TRUE(result.is_command);
    ASSERT_EQ(result.function_calls.size(), 1u);
    EXPECT_EQ(result.function_calls[0].name, "format_disk");

    auto second = service_.call(1);
    EXPECT_EQ(json::parse(second.back().content)["error"], "Unknown function: format_disk");
}

TEST_F(OrchestratorTest, FinalAnswerMissingCommandIsNotTerminal) {
    service_.push(tool_turn("suggested_command", {{"explanation", "no command"}}));
    service_.push(tool_turn("suggested_command", {{"command", "echo hi"}, {"explanation", "e"}}));

    auto result = ask("say hi");
    EXPECT_TRUE(result.is_command);
    EXPECT_EQ(result.command, "echo hi");
    EXPECT_EQ(result.iterations, 2);
}

TEST_F(OrchestratorTest, ProviderFailurePropagates) {
    service_.push_error("Provider returned status 401: API key not valid");
    EXPECT_THROW(ask("anything"), std::runtime_error);
    EXPECT_EQ(service_.call_count(), 1u);
}

TEST_F(OrchestratorTest, TransientProviderErrorIsRetried) {
    Config cfg = make_config();
    cfg.max_retries = 1;
    service_.push_error("Provider returned status 429: RESOURCE_EXHAUSTED");
    service_.push(tool_turn("suggested_command", {{"command", "ls"}, {"explanation", "e"}}));

    auto result = ask("list files", cfg);
    EXPECT_TRUE(result.is_command);
    EXPECT_EQ(service_.call_count(), 2u);
}

} // namespace
