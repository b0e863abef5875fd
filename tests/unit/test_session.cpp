#include <string>
#include <gtest/gtest.h>
#include "session.hpp"

namespace {

using bashbuddy::SessionState;
using bashbuddy::format_command_turn;
using bashbuddy::parse_command_turn;

TEST(Session, AskAppendsUserThenAssistant) {
    SessionState session;
    auto ticket = session.begin_ask("list files");
    EXPECT_EQ(ticket.snapshot.size(), 1u);
    EXPECT_EQ(session.size(), 1u);

    EXPECT_TRUE(session.complete_ask(ticket, format_command_turn("ls", "lists files")));

    auto turns = session.history();
    ASSERT_EQ(turns.size(), 2u);
    EXPECT_EQ(turns[0].role, "user");
    EXPECT_EQ(turns[0].content, "list files");
    EXPECT_EQ(turns[1].role, "assistant");
    EXPECT_EQ(turns[1].content, "Command: ls\nExplanation: lists files");
}

TEST(Session, LookupIgnoresCaseAndSurroundingWhitespace) {
    SessionState session;
    auto ticket = session.begin_ask("list files");
    session.complete_ask(ticket, format_command_turn("ls", "E"));

    auto hit = session.lookup("  LIST FILES \n");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->command, "ls");
    EXPECT_EQ(hit->explanation, "E");

    EXPECT_FALSE(session.lookup("list all files").has_value());
}

TEST(Session, PlainTextAnswersAreNotCached) {
    SessionState session;
    auto ticket = session.begin_ask("what is a shell");
    session.complete_ask(ticket, "A shell is a command interpreter.");
    EXPECT_FALSE(session.lookup("what is a shell").has_value());
}

TEST(Session, UnansweredQueryIsNotCached) {
    SessionState session;
    session.begin_ask("list files");
    EXPECT_FALSE(session.lookup("list files").has_value());
}

TEST(Session, ResetInvalidatesInFlightAsk) {
    SessionState session;
    auto ticket = session.begin_ask("list files");
    session.reset();

    EXPECT_FALSE(session.complete_ask(ticket, format_command_turn("ls", "E")));
    EXPECT_EQ(session.size(), 0u);
    EXPECT_EQ(session.epoch(), 1u);
}

TEST(Session, MultiLineExplanationSurvivesParsing) {
    auto parsed = parse_command_turn(format_command_turn("tar -xzf a.tgz", "-x extract\n-z gzip\n-f file"));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->command, "tar -xzf a.tgz");
    EXPECT_EQ(parsed->explanation, "-x extract\n-z gzip\n-f file");

    EXPECT_FALSE(parse_command_turn("Command:\nExplanation: nothing").has_value());
    EXPECT_FALSE(parse_command_turn("just text").has_value());
}

} // namespace
