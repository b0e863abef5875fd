#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "daemon_service.hpp"
#include "orchestrator.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include "tools/local_tools.hpp"
#include "framing.hpp"
#include "fake_generation_service.hpp"
#include "test_support.hpp"

namespace {

using bashbuddy::Config;
using bashbuddy::DaemonService;
using bashbuddy::LocalToolExecutor;
using bashbuddy::Message;
using bashbuddy::Orchestrator;
using bashbuddy::SessionState;
using bashbuddy::ToolRegistry;
using bashbuddy_test::ScriptedService;
using bashbuddy_test::TempDir;
using bashbuddy_test::tool_turn;
using nlohmann::json;

ToolRegistry& with_local_tools(ToolRegistry& reg) {
    bashbuddy::register_local_tools(reg);
    return reg;
}

Config test_config() {
    Config cfg;
    cfg.max_retries = 0;
    return cfg;
}

class DaemonServiceTest : public ::testing::Test {
protected:
    DaemonServiceTest()
        : cfg_(test_config())
        , executor_(registry_, cfg_)
        , orchestrator_(service_, with_local_tools(registry_), executor_, cfg_)
        , daemon_(orchestrator_, session_) {}

    json ask(const std::string& message, bool force_fresh = false) {
        return daemon_.handle({{"command", "ask"}, {"message", message}, {"force_fresh", force_fresh}});
    }

    Config cfg_;
    ToolRegistry registry_;
    LocalToolExecutor executor_;
    ScriptedService service_;
    Orchestrator orchestrator_;
    SessionState session_;
    DaemonService daemon_;
};

TEST_F(DaemonServiceTest, PingAndStatus) {
    EXPECT_EQ(daemon_.handle({{"command", "ping"}}),
              json({{"status", "ok"}, {"message", "pong"}}));
    EXPECT_EQ(daemon_.handle({{"command", "status"}}),
              json({{"status", "ok"}, {"message", "Daemon is running"}}));
}

TEST_F(DaemonServiceTest, UnknownAndMalformedCommands) {
    auto unknown = daemon_.handle({{"command", "explode"}});
    EXPECT_EQ(unknown["status"], "error");
    EXPECT_EQ(unknown["message"], "Unknown command: explode");

    EXPECT_EQ(daemon_.handle({{"message", "hi"}})["status"], "error");
    EXPECT_EQ(daemon_.handle({{"command", "ask"}})["status"], "error");
    EXPECT_EQ(daemon_.handle({{"command", "ask"}, {"message", 42}})["status"], "error");
    EXPECT_EQ(service_.call_count(), 0u);
}

TEST_F(DaemonServiceTest, AskReturnsStructuredAnswer) {
    service_.push(tool_turn("list_files", {{"path", "/"}}));
    service_.push(tool_turn("suggested_command", {{"command", "ls"}, {"explanation", "E"}}));

    auto resp = ask("list files here");
    EXPECT_EQ(resp["status"], "ok");
    EXPECT_EQ(resp["command"], "ls");
    EXPECT_EQ(resp["explanation"], "E");
    EXPECT_EQ(resp["history_length"], 2);
    EXPECT_FALSE(resp.contains("cached"));
    ASSERT_EQ(resp["function_calls"].size(), 1u);
    EXPECT_EQ(resp["function_calls"][0]["name"], "list_files");
    EXPECT_EQ(resp["function_calls"][0]["args"]["path"], "/");
}

TEST_F(DaemonServiceTest, NonUtf8FileNameDoesNotSinkAsk) {
    TempDir dir("bb_utf8");
    dir.write("caf\xe9.txt", "x");
    service_.push(tool_turn("list_files", {{"path", "."}}));
    service_.push(tool_turn("suggested_command", {{"command", "ls"}, {"explanation", "E"}}));

    auto resp = daemon_.handle({{"command", "ask"}, {"message", "list files here"},
                                {"cwd", dir.root().string()}});
    EXPECT_EQ(resp["status"], "ok") << resp.value("message", "");
    EXPECT_EQ(resp["command"], "ls");
    EXPECT_EQ(session_.size(), 2u);

    // The tool result reached the model as valid JSON with the byte replaced
    auto second = service_.call(1);
    auto listing = json::parse(second.back().content);
    ASSERT_EQ(listing["result"].size(), 1u);
    EXPECT_EQ(listing["result"][0], "caf\xEF\xBF\xBD.txt");
    EXPECT_NO_THROW(bashbuddy::encode_frame(resp));
}

TEST_F(DaemonServiceTest, RepeatedQueryIsServedFromCache) {
    service_.push(tool_turn("suggested_command", {{"command", "ls"}, {"explanation", "E"}}));
    ask("list files");
    ASSERT_EQ(service_.call_count(), 1u);

    auto cached = ask("  LIST FILES ");
    EXPECT_EQ(cached["status"], "ok");
    EXPECT_EQ(cached["cached"], true);
    EXPECT_EQ(cached["type"], "command");
    EXPECT_EQ(cached["command"], "ls");
    EXPECT_EQ(cached["explanation"], "E");
    EXPECT_EQ(service_.call_count(), 1u);
    EXPECT_EQ(session_.size(), 2u);
}

TEST_F(DaemonServiceTest, ForceFreshBypassesCache) {
    service_.push(tool_turn("suggested_command", {{"command", "ls"}, {"explanation", "E"}}));
    service_.push(tool_turn("suggested_command", {{"command", "ls -1"}, {"explanation", "E2"}}));
    ask("list files");

    auto fresh = ask("LIST FILES", true);
    EXPECT_EQ(fresh["status"], "ok");
    EXPECT_FALSE(fresh.contains("cached"));
    EXPECT_EQ(fresh["command"], "ls -1");
    EXPECT_EQ(service_.call_count(), 2u);
    EXPECT_EQ(session_.size(), 4u);
}

TEST_F(DaemonServiceTest, PlainAnswerCarriesMessage) {
    service_.push(bashbuddy_test::text_turn("first"));
    service_.push(bashbuddy_test::text_turn("A pipe connects stdout to stdin."));

    auto resp = ask("what is a pipe");
    EXPECT_EQ(resp["status"], "ok");
    EXPECT_EQ(resp["message"], "A pipe connects stdout to stdin.");
    EXPECT_FALSE(resp.contains("command"));
    EXPECT_TRUE(resp["function_calls"].empty());
}

TEST_F(DaemonServiceTest, ProviderFailureKeepsUserTurn) {
    service_.push_error("Provider returned status 401: API key not valid");

    auto resp = ask("list files");
    EXPECT_EQ(resp["status"], "error");
    EXPECT_EQ(resp["message"].get<std::string>().rfind("Failed to generate response: ", 0), 0u);

    auto history = daemon_.handle({{"command", "history"}});
    EXPECT_EQ(history["count"], 1);
    EXPECT_EQ(history["history"][0]["role"], "user");
    EXPECT_EQ(history["history"][0]["content"], "list files");
}

TEST_F(DaemonServiceTest, ResetClearsHistory) {
    service_.push(tool_turn("suggested_command", {{"command", "ls"}, {"explanation", "E"}}));
    ask("list files");

    auto reset = daemon_.handle({{"command", "reset"}});
    EXPECT_EQ(reset["status"], "ok");
    EXPECT_EQ(reset["message"], "Conversation history cleared");

    auto history = daemon_.handle({{"command", "history"}});
    EXPECT_EQ(history["status"], "ok");
    EXPECT_EQ(history["count"], 0);
    EXPECT_TRUE(history["history"].empty());
}

TEST_F(DaemonServiceTest, ConcurrentAsksKeepTurnsPaired) {
    // Each answer echoes the query it was generated for
    service_.set_fallback([](const std::vector<Message>& messages) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return tool_turn("suggested_command",
                         {{"command", "echo " + messages.back().content}, {"explanation", "e"}});
    });

    const int kAsks = 8;
    std::vector<std::thread> threads;
    for (int i = 0; i < kAsks; i++) {
        threads.emplace_back([this, i] { ask("query " + std::to_string(i)); });
    }
    for (auto& t : threads) t.join();

    auto turns = session_.history();
    ASSERT_EQ(turns.size(), static_cast<size_t>(2 * kAsks));
    for (size_t i = 0; i < turns.size(); i += 2) {
        EXPECT_EQ(turns[i].role, "user");
        EXPECT_EQ(turns[i + 1].role, "assistant");
        EXPECT_EQ(turns[i + 1].content,
                  bashbuddy::format_command_turn("echo " + turns[i].content, "e"));
    }
}

TEST_F(DaemonServiceTest, PendingAskLimitRejectsInsteadOfQueueing) {
    DaemonService limited(orchestrator_, session_, 1);
    std::promise<void> entered;
    std::promise<void> release;
    auto entered_future = entered.get_future();
    auto release_future = release.get_future().share();

    service_.push_step([&entered, release_future](const std::vector<Message>&) {
        entered.set_value();
        release_future.wait();
        return tool_turn("suggested_command", {{"command", "ls"}, {"explanation", "E"}});
    });
    service_.push(tool_turn("suggested_command", {{"command", "pwd"}, {"explanation", "E"}}));

    auto pending = std::async(std::launch::async, [&limited] {
        return limited.handle({{"command", "ask"}, {"message", "list files"}});
    });
    entered_future.wait();

    auto busy = limited.handle({{"command", "ask"}, {"message", "where am I"}});
    EXPECT_EQ(busy["status"], "error");
    EXPECT_EQ(busy["message"].get<std::string>().rfind("Daemon busy", 0), 0u);
    EXPECT_EQ(limited.handle({{"command", "ping"}})["status"], "ok");

    release.set_value();
    EXPECT_EQ(pending.get()["command"], "ls");

    // The slot is free again once the first ask finished
    auto next = limited.handle({{"command", "ask"}, {"message", "where am I"}});
    EXPECT_EQ(next["status"], "ok");
    EXPECT_EQ(next["command"], "pwd");
}

TEST_F(DaemonServiceTest, ResetDuringAskDiscardsStaleAnswer) {
    std::promise<void> entered;
    std::promise<void> release;
    auto entered_future = entered.get_future();
    auto release_future = release.get_future().share();

    service_.push_step([&entered, release_future](const std::vector<Message>&) {
        entered.set_value();
        release_future.wait();
        return tool_turn("suggested_command", {{"command", "ls"}, {"explanation", "E"}});
    });

    auto pending = std::async(std::launch::async, [this] { return ask("list files"); });
    entered_future.wait();

    // History and reset do not wait for the in-flight ask
    EXPECT_EQ(daemon_.handle({{"command", "history"}})["count"], 1);
    EXPECT_EQ(daemon_.handle({{"command", "reset"}})["status"], "ok");
    release.set_value();

    auto resp = pending.get();
    EXPECT_EQ(resp["status"], "ok");
    EXPECT_EQ(resp["command"], "ls");
    EXPECT_EQ(session_.size(), 0u);
    EXPECT_EQ(resp["history_length"], 0);
}

} // namespace
