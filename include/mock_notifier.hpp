#pragma once

#include "notifier.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// Scriptable in-memory notifier for host tests.
// Records every message it is asked to send and answers from a script
// (falling back to a default outcome once the script runs out).
class MockNotifier : public Notifier {
public:
    enum class Outcome {
        Succeed,
        Fail,
        Throw,
    };

    explicit MockNotifier(Outcome fallback = Outcome::Succeed) : fallback_(fallback) {}

    SendResult send_message(const std::string& text) override {
        Outcome outcome;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            sent_.push_back(text);
            if (gate_closed_) {
                blocked_ = true;
                cv_.notify_all();
                cv_.wait(lock, [this] { return !gate_closed_; });
                blocked_ = false;
            }
            if (!script_.empty()) {
                outcome = script_.front();
                script_.pop_front();
            } else {
                outcome = fallback_;
            }
        }
        switch (outcome) {
            case Outcome::Throw:
                throw std::runtime_error("mock transport fault");
            case Outcome::Fail:
                return send_failed("mock failure");
            case Outcome::Succeed:
            default:
                return send_ok();
        }
    }

    void set_fallback(Outcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        fallback_ = outcome;
    }

    void script(Outcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(outcome);
    }

    // While closed, send_message parks after recording the message.
    void close_gate() {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_closed_ = true;
    }

    void open_gate() {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_closed_ = false;
        cv_.notify_all();
    }

    void wait_until_blocked() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return blocked_; });
    }

    std::size_t sent_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }

    std::vector<std::string> sent_messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::string last_message() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.empty() ? std::string() : sent_.back();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> sent_;
    std::deque<Outcome> script_;
    Outcome fallback_;
    bool gate_closed_ = false;
    bool blocked_ = false;
};
