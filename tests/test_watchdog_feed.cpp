#include "watchdog.hpp"
#include "mock_clock.hpp"
#include "mock_notifier.hpp"

#include <cassert>
#include <memory>
#include <string>

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

static NotifyConfig telegram_only() {
    NotifyConfig cfg{};
    cfg.telegram_bot_token = "token";
    cfg.telegram_chat_id = "42";
    return cfg;
}

int main() {
    ManualClock clock;
    auto telegram = std::make_shared<MockNotifier>();
    NotifyConfig cfg = telegram_only();
    NotificationRouter router([&] { return cfg; },
                              [&](NotifyChannel, const NotifyConfig&) -> std::shared_ptr<Notifier> { return telegram; });
    Watchdog watchdog(clock, router);

    assert(!watchdog.is_running());
    assert(watchdog.current_timeout_ms() == 0);

    // First feed without arguments arms with the default threshold.
    assert(watchdog.feed());
    assert(watchdog.is_running());
    assert(!watchdog.timeout_occurred());
    assert(watchdog.current_timeout_ms() == Watchdog::kDefaultTimeoutMs);
    assert(watchdog.current_timeout_ms() == 30000);
    assert(telegram->sent_count() == 1);
    assert(starts_with(telegram->last_message(), "[WATCHDOG] Auto-Started\n\nTimeout: 30000ms\n\nInfo: \n\nTime: "));

    // Plain feed while running: timer reset only, no alert, threshold kept.
    clock.advance_ms(1000);
    assert(watchdog.feed());
    assert(watchdog.is_running());
    assert(watchdog.current_timeout_ms() == 30000);
    assert(telegram->sent_count() == 1);

    // Explicit timeout while running updates the threshold and reports it.
    assert(watchdog.feed(5000u, "faster cadence"));
    assert(watchdog.current_timeout_ms() == 5000);
    assert(telegram->sent_count() == 2);
    const std::string update = telegram->last_message();
    assert(starts_with(update, "[WATCHDOG] Timeout Updated\n\n"));
    assert(contains(update, "Old Timeout: 30000ms\n\nNew Timeout: 5000ms\n\nInfo: faster cadence\n\nTime: "));

    // Info on a plain feed is not an update.
    assert(watchdog.feed(std::nullopt, "ignored"));
    assert(watchdog.current_timeout_ms() == 5000);
    assert(telegram->sent_count() == 2);

    WatchdogStatus s = watchdog.status();
    assert(s.running);
    assert(s.alerts_sent == 2);
    assert(s.alerts_failed == 0);

    // Arming with an explicit threshold and info.
    {
        ManualClock clock2;
        auto notifier = std::make_shared<MockNotifier>();
        NotificationRouter router2([&] { return cfg; },
                                   [&](NotifyChannel, const NotifyConfig&) -> std::shared_ptr<Notifier> { return notifier; });
        Watchdog wd(clock2, router2);
        assert(wd.feed(1500u, "nightly batch"));
        assert(wd.current_timeout_ms() == 1500);
        assert(contains(notifier->last_message(), "Timeout: 1500ms\n\nInfo: nightly batch\n\nTime: "));
    }

    // A zero threshold is accepted as-is.
    {
        ManualClock clock3;
        auto notifier = std::make_shared<MockNotifier>();
        NotificationRouter router3([&] { return cfg; },
                                   [&](NotifyChannel, const NotifyConfig&) -> std::shared_ptr<Notifier> { return notifier; });
        Watchdog wd(clock3, router3);
        assert(wd.feed(0u));
        assert(wd.current_timeout_ms() == 0);
        assert(!wd.poll());
    }

    // Delivery failure never fails feed().
    {
        ManualClock clock4;
        auto failing = std::make_shared<MockNotifier>(MockNotifier::Outcome::Fail);
        NotificationRouter router4([&] { return cfg; },
                                   [&](NotifyChannel, const NotifyConfig&) -> std::shared_ptr<Notifier> { return failing; });
        Watchdog wd(clock4, router4);
        assert(wd.feed());
        assert(wd.is_running());
        assert(wd.feed(100u));
        assert(wd.status().alerts_failed == 2);
        assert(wd.status().alerts_sent == 0);
    }

    // No channels configured at all: still armed.
    {
        ManualClock clock5;
        NotificationRouter router5([] { return NotifyConfig{}; });
        Watchdog wd(clock5, router5);
        assert(wd.feed(2000u, "no channels"));
        assert(wd.is_running());
        assert(router5.metrics().undelivered == 1);
        assert(router5.metrics().channel_attempts == 0);
    }

    return 0;
}
