#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "config.hpp"
#include "notifier.hpp"

struct RouterMetrics {
    uint32_t dispatches;
    uint32_t delivered;
    uint32_t undelivered;
    uint32_t channel_attempts;
    uint32_t channel_failures;
};

// Delivers a message over the first enabled channel that accepts it.
// Try order: configured default channel (if enabled), then the remaining
// enabled channels in enumerated order. Each channel is tried at most once
// per send(); no retries, no backoff.
class NotificationRouter {
public:
    using ConfigProvider = std::function<NotifyConfig()>;
    using NotifierFactory = std::function<std::shared_ptr<Notifier>(NotifyChannel, const NotifyConfig&)>;

    explicit NotificationRouter(ConfigProvider config, NotifierFactory factory = make_notifier);

    NotificationRouter(const NotificationRouter&) = delete;
    NotificationRouter& operator=(const NotificationRouter&) = delete;

    bool send(const std::string& message);

    RouterMetrics metrics() const;
    void reset_metrics();

private:
    std::shared_ptr<Notifier> notifier_for(NotifyChannel channel, const NotifyConfig& cfg);
    SendResult attempt(NotifyChannel channel, const NotifyConfig& cfg, const std::string& message);

    ConfigProvider config_;
    NotifierFactory factory_;

    mutable std::mutex mutex_;
    std::array<std::shared_ptr<Notifier>, kNotifyChannelCount> notifiers_{};
    RouterMetrics metrics_{};
};
