#include "session.hpp"
#include "utils.hpp"

namespace bashbuddy {

static const char* COMMAND_PREFIX = "Command: ";
static const char* EXPLANATION_PREFIX = "Explanation: ";

std::string format_command_turn(const std::string& command, const std::string& explanation) {
    return std::string(COMMAND_PREFIX) + command + "\n" + EXPLANATION_PREFIX + explanation;
}

std::optional<CachedAnswer> parse_command_turn(const std::string& content) {
    if (content.compare(0, 8, "Command:") != 0) return std::nullopt;

    size_t nl = content.find('\n');
    if (nl == std::string::npos) return std::nullopt;
    size_t expl = content.find("Explanation:", nl + 1);
    if (expl != nl + 1) return std::nullopt;

    CachedAnswer answer;
    answer.command = trim(content.substr(8, nl - 8));
    answer.explanation = trim(content.substr(expl + 12));
    if (answer.command.empty()) return std::nullopt;
    return answer;
}

std::optional<CachedAnswer> SessionState::lookup(const std::string& query) const {
    std::string key = to_lower(trim(query));
    std::lock_guard<std::mutex> lock(mu_);
    for (size_t i = 0; i + 1 < turns_.size(); i++) {
        if (turns_[i].role != "user") continue;
        if (to_lower(trim(turns_[i].content)) != key) continue;
        if (turns_[i + 1].role != "assistant") continue;
        auto answer = parse_command_turn(turns_[i + 1].content);
        if (answer) return answer;
    }
    return std::nullopt;
}

AskTicket SessionState::begin_ask(const std::string& query) {
    std::lock_guard<std::mutex> lock(mu_);
    turns_.push_back({"user", query});
    return {epoch_, turns_};
}

bool SessionState::complete_ask(const AskTicket& ticket, const std::string& content) {
    std::lock_guard<std::mutex> lock(mu_);
    if (ticket.epoch != epoch_) return false;
    turns_.push_back({"assistant", content});
    return true;
}

void SessionState::reset() {
    std::lock_guard<std::mutex> lock(mu_);
    turns_.clear();
    epoch_++;
}

std::vector<ConversationTurn> SessionState::history() const {
    std::lock_guard<std::mutex> lock(mu_);
    return turns_;
}

size_t SessionState::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return turns_.size();
}

uint64_t SessionState::epoch() const {
    std::lock_guard<std::mutex> lock(mu_);
    return epoch_;
}

} // namespace bashbuddy
