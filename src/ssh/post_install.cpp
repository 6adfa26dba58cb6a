#include "post_install.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <chrono>

bool PostInstallReport::ok() const {
    if (!connected) return false;
    for (const auto& c : commands) {
        if (!c.ok()) return false;
    }
    return true;
}

PostInstallReport run_post_install(CommandRunner& runner, const PostInstallConfig& config,
                                   const Settings& settings, StatusCallback callback) {
    PostInstallReport report;
    const int attempts = settings.retries + 1;
    const int delay_ms = static_cast<int>(settings.retry_delay.count());

    for (int i = 0; i < attempts; i++) {
        if (i > 0) platform::sleep_ms(delay_ms);
        auto r = runner.connect(callback);
        if (r.is_ok()) {
            report.connected = true;
            break;
        }
        report.error = r.error;
        rprov_log(fmt::format("post_install: connect attempt {}/{} failed: {}", i + 1, attempts, r.error));
    }
    if (!report.connected) return report;
    report.error.clear();

    for (const auto& cmd : config.commands) {
        CommandReport cr;
        cr.command = cmd;
        auto start = std::chrono::steady_clock::now();

        for (int i = 0; i < attempts; i++) {
            if (i > 0) {
                if (callback) callback(fmt::format("Retrying '{}' ({}/{})", cmd, i, settings.retries));
                platform::sleep_ms(delay_ms);
            }
            cr.attempts++;
            auto result = runner.run(cmd, SSH_CMD_TIMEOUT_SECS);
            cr.exit_code = result.exit_code;
            cr.output = result.get_output();
            if (result.success()) break;
            rprov_log(fmt::format("post_install: '{}' exited {} ({})", cmd, result.exit_code, cr.output));
        }

        cr.elapsed = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);
        if (callback) {
            callback(fmt::format("{} '{}' exit {} in {}ms", cr.ok() ? "ok" : "failed",
                                 cmd, cr.exit_code, cr.elapsed.count()));
        }
        report.commands.push_back(std::move(cr));
    }

    runner.close();
    return report;
}
