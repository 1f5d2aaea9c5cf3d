#include "watchdog.hpp"
#include "mock_clock.hpp"
#include "mock_notifier.hpp"

#include <cassert>
#include <memory>
#include <string>

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

int main() {
    NotifyConfig cfg{};
    cfg.wechat_webhook_key = "key";

    ManualClock clock;
    auto wechat = std::make_shared<MockNotifier>();
    NotificationRouter router([&] { return cfg; },
                              [&](NotifyChannel, const NotifyConfig&) -> std::shared_ptr<Notifier> { return wechat; });
    Watchdog watchdog(clock, router);

    // Idle: no-op, no alert, no state change.
    const WatchdogStatus before = watchdog.status();
    assert(!watchdog.manual_stop("nothing to stop"));
    assert(wechat->sent_count() == 0);
    assert(router.metrics().dispatches == 0);
    const WatchdogStatus after = watchdog.status();
    assert(before.running == after.running);
    assert(before.timeout_ms == after.timeout_ms);
    assert(before.alerts_sent == after.alerts_sent);

    // Running: stop reports the reason.
    assert(watchdog.feed(1000u, "job"));
    assert(watchdog.manual_stop("maintenance"));
    assert(!watchdog.is_running());
    assert(starts_with(wechat->last_message(), "[WATCHDOG] Auto-Stopped\n\nReason: Manual stop - maintenance\n\nTime: "));
    assert(!watchdog.manual_stop("again"));

    // Stop clears the timeout latch.
    assert(watchdog.feed(100u));
    clock.advance_ms(150);
    assert(watchdog.poll());
    assert(watchdog.timeout_occurred());
    assert(watchdog.manual_stop());
    assert(!watchdog.timeout_occurred());
    assert(starts_with(wechat->last_message(), "[WATCHDOG] Auto-Stopped\n\nReason: Manual stop - \n\nTime: "));

    // Delivery failure does not change the result.
    wechat->set_fallback(MockNotifier::Outcome::Throw);
    assert(watchdog.feed());
    assert(watchdog.manual_stop("channel down"));
    assert(!watchdog.is_running());

    return 0;
}
