#include <cstdio>
#include <iostream>
#include <string>

#include "config.hpp"
#include "host_command.hpp"
#include "logging.hpp"
#include "notification_router.hpp"
#include "watchdog.hpp"
#include "watchdog_monitor.hpp"

namespace {
void print_status(const Watchdog& watchdog, const NotificationRouter& router) {
    const WatchdogStatus s = watchdog.status();
    const RouterMetrics m = router.metrics();
    std::printf(
        "[STATUS] running=%d timeout_ms=%u timeout_occurred=%d episodes=%u alerts_sent=%u alerts_failed=%u "
        "dispatches=%u channel_attempts=%u channel_failures=%u\n",
        s.running ? 1 : 0,
        static_cast<unsigned>(s.timeout_ms),
        s.timeout_occurred ? 1 : 0,
        static_cast<unsigned>(s.episodes),
        static_cast<unsigned>(s.alerts_sent),
        static_cast<unsigned>(s.alerts_failed),
        static_cast<unsigned>(m.dispatches),
        static_cast<unsigned>(m.channel_attempts),
        static_cast<unsigned>(m.channel_failures)
    );
    std::fflush(stdout);
}
} // namespace

int main() {
    init_logging();
    const NotifyConfig boot_cfg = load_config();
    set_log_level(boot_cfg.log_level);
    log_info("HOST", "livewatch starting, log level %s", log_level_name(boot_cfg.log_level));

    const std::vector<NotifyChannel> channels = enabled_channels(boot_cfg);
    if (channels.empty()) {
        log_warn("HOST", "no notification channel configured; alerts will only be logged");
    }
    for (const auto channel : channels) {
        log_info("HOST", "channel enabled: %s", notify_channel_name(channel));
    }

    SystemClock clock;
    NotificationRouter router([] { return load_config(); });
    Watchdog watchdog(clock, router);
    WatchdogMonitor monitor(watchdog, boot_cfg.poll_interval_ms);
    monitor.start();

    std::string line;
    while (std::getline(std::cin, line)) {
        std::string error;
        const auto cmd = parse_host_command(line, &error);
        if (!cmd) {
            if (error != "empty line") {
                log_warn("HOST", "%s", error.c_str());
            }
            continue;
        }
        if (cmd->type == HostCommandType::Quit) {
            break;
        }
        switch (cmd->type) {
            case HostCommandType::Feed:
                watchdog.feed(cmd->timeout_ms, cmd->info);
                break;
            case HostCommandType::Stop:
                if (!watchdog.manual_stop(cmd->info)) {
                    log_info("HOST", "watchdog is not running");
                }
                break;
            case HostCommandType::Status:
                print_status(watchdog, router);
                break;
            case HostCommandType::Quit:
                break;
        }
    }

    monitor.stop();
    log_info("HOST", "livewatch exiting");
    return 0;
}
