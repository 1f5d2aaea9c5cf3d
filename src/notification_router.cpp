#include "notification_router.hpp"
#include "logging.hpp"

#include <exception>
#include <utility>

namespace {
std::size_t channel_index(NotifyChannel channel) {
    return static_cast<std::size_t>(channel);
}

std::string describe_order(const std::vector<NotifyChannel>& order) {
    std::string out = "[";
    for (std::size_t i = 0; i < order.size(); ++i) {
        if (i > 0) out += ", ";
        out += notify_channel_name(order[i]);
    }
    out += "]";
    return out;
}
} // namespace

NotificationRouter::NotificationRouter(ConfigProvider config, NotifierFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {}

std::shared_ptr<Notifier> NotificationRouter::notifier_for(NotifyChannel channel, const NotifyConfig& cfg) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = notifiers_[channel_index(channel)];
    if (!slot && factory_) {
        slot = factory_(channel, cfg);
    }
    return slot;
}

SendResult NotificationRouter::attempt(NotifyChannel channel, const NotifyConfig& cfg, const std::string& message) {
    std::shared_ptr<Notifier> notifier;
    try {
        notifier = notifier_for(channel, cfg);
    } catch (const std::exception& e) {
        return send_failed(std::string("notifier setup fault: ") + e.what());
    } catch (...) {
        return send_failed("notifier setup fault: unknown");
    }
    if (!notifier) {
        return send_failed("notifier unavailable");
    }
    try {
        return notifier->send_message(message);
    } catch (const std::exception& e) {
        return send_failed(std::string("fault: ") + e.what());
    } catch (...) {
        // Non-standard exception types are still a channel failure.
        return send_failed("unknown fault");
    }
}

bool NotificationRouter::send(const std::string& message) {
    const NotifyConfig cfg = config_ ? config_() : NotifyConfig{};
    const std::vector<NotifyChannel> order = notification_try_order(cfg);
    const auto preferred = default_channel(cfg);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.dispatches++;
    }

    log_debug("NOTIFY", "default=%s try_order=%s",
              preferred ? notify_channel_name(*preferred) : "none",
              describe_order(order).c_str());

    if (order.empty()) {
        log_debug("NOTIFY", "no notification channel enabled, message dropped");
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.undelivered++;
        return false;
    }

    for (const auto channel : order) {
        log_debug("NOTIFY", "trying %s", notify_channel_name(channel));
        const SendResult result = attempt(channel, cfg, message);

        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.channel_attempts++;
        if (result.ok) {
            metrics_.delivered++;
            log_debug("NOTIFY", "delivered via %s", notify_channel_name(channel));
            return true;
        }
        metrics_.channel_failures++;
        log_warn("NOTIFY", "%s failed (%s), trying next channel",
                 notify_channel_name(channel), result.reason.c_str());
    }

    log_warn("NOTIFY", "all %zu channel(s) failed, message undelivered", order.size());
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.undelivered++;
    return false;
}

RouterMetrics NotificationRouter::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

void NotificationRouter::reset_metrics() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_ = {};
}
