#pragma once
#include "message.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <cstdint>

namespace bashbuddy {

struct CachedAnswer {
    std::string command;
    std::string explanation;
};

// Handed out by begin_ask(); carries the reset epoch the ask started in
// and the history the orchestrator should build its context from.
struct AskTicket {
    uint64_t epoch = 0;
    std::vector<ConversationTurn> snapshot;
};

// Formats a structured answer the way it is stored as an assistant turn.
std::string format_command_turn(const std::string& command, const std::string& explanation);

// Inverse of format_command_turn. Returns nullopt for plain-text turns.
std::optional<CachedAnswer> parse_command_turn(const std::string& content);

// The daemon's single conversation. Every method takes the history lock for
// the duration of its own read or mutation only.
class SessionState {
public:
    // Exact match (trimmed, case-folded) against prior user turns whose
    // following turn is a structured assistant answer.
    std::optional<CachedAnswer> lookup(const std::string& query) const;

    AskTicket begin_ask(const std::string& query);

    // Appends the assistant turn unless a reset happened since begin_ask.
    bool complete_ask(const AskTicket& ticket, const std::string& content);

    void reset();
    std::vector<ConversationTurn> history() const;
    size_t size() const;
    uint64_t epoch() const;

private:
    mutable std::mutex mu_;
    std::vector<ConversationTurn> turns_;
    uint64_t epoch_ = 0;
};

} // namespace bashbuddy
