#pragma once
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "provider.hpp"

namespace bashbuddy_test {

inline bashbuddy::ProviderResponse text_turn(const std::string& text) {
    bashbuddy::ProviderResponse r;
    r.content = text;
    return r;
}

inline bashbuddy::ProviderResponse tool_turn(const std::string& name, const nlohmann::json& args) {
    static int next_id = 0;
    bashbuddy::ProviderResponse r;
    r.tool_calls.push_back({"call_" + std::to_string(++next_id), name, args.dump()});
    return r;
}

// Plays back a fixed script of model turns and records every request.
// When the script runs dry, `fallback` (if set) produces the turn.
class ScriptedService : public bashbuddy::GenerationService {
public:
    using Step = std::function<bashbuddy::ProviderResponse(const std::vector<bashbuddy::Message>&)>;

    void push(bashbuddy::ProviderResponse resp) {
        std::lock_guard<std::mutex> lock(mu_);
        script_.push_back([resp](const std::vector<bashbuddy::Message>&) { return resp; });
    }

    void push_error(const std::string& what) {
        std::lock_guard<std::mutex> lock(mu_);
        script_.push_back([what](const std::vector<bashbuddy::Message>&) -> bashbuddy::ProviderResponse {
            throw std::runtime_error(what);
        });
    }

    void push_step(Step step) {
        std::lock_guard<std::mutex> lock(mu_);
        script_.push_back(std::move(step));
    }

    void set_fallback(Step step) {
        std::lock_guard<std::mutex> lock(mu_);
        fallback_ = std::move(step);
    }

    bashbuddy::ProviderResponse generate(const std::vector<bashbuddy::Message>& messages,
                                         const nlohmann::json& tools_spec) override {
        Step step;
        {
            std::lock_guard<std::mutex> lock(mu_);
            calls_.push_back(messages);
            last_tools_ = tools_spec;
            if (!script_.empty()) {
                step = std::move(script_.front());
                script_.pop_front();
            } else if (fallback_) {
                step = fallback_;
            } else {
                throw std::runtime_error("script exhausted");
            }
        }
        return step(messages);
    }

    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mu_);
        return calls_.size();
    }

    std::vector<bashbuddy::Message> call(size_t i) const {
        std::lock_guard<std::mutex> lock(mu_);
        return calls_.at(i);
    }

    nlohmann::json last_tools() const {
        std::lock_guard<std::mutex> lock(mu_);
        return last_tools_;
    }

private:
    mutable std::mutex mu_;
    std::deque<Step> script_;
    Step fallback_;
    std::vector<std::vector<bashbuddy::Message>> calls_;
    nlohmann::json last_tools_;
};

} // namespace bashbuddy_test
