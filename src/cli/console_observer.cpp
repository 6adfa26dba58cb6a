#include "console_observer.hpp"
#include "theme.hpp"
#include <core/time_utils.hpp>

ConsoleObserver::ConsoleObserver(Verbosity verbosity, bool tag_lines, std::ostream& out)
    : verbosity_(verbosity), tag_lines_(tag_lines), out_(out) {}

void ConsoleObserver::on_transition(const ProgressEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    // Terminal states are covered by print_outcome
    if (is_terminal(event.state)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << theme::tagged(tag(event.target),
                          theme::step(fmt::format("{} {}", pipeline_state_name(event.state),
                                                  theme::dim(format_elapsed(event.elapsed)))));
    out_.flush();
}

void ConsoleObserver::on_status(const ProgressEvent& event) {
    if (verbosity_ != Verbosity::Verbose) return;
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << theme::tagged(tag(event.target), theme::log(event.message));
    out_.flush();
}

void ConsoleObserver::on_warning(const std::string& target, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << theme::tagged(tag(target), theme::warn(message));
    out_.flush();
}

void ConsoleObserver::print_line(const std::string& target, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << theme::tagged(tag(target), line);
    out_.flush();
}

void ConsoleObserver::print_ports(const std::string& target, const std::vector<ProbeResult>& ports) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : ports) {
        std::string label = fmt::format("port {:<5}", p.port);
        if (p.reachable) {
            out_ << theme::tagged(tag(target),
                                  theme::ok(fmt::format("{} up {}", label, theme::dim(format_elapsed(p.latency)))));
        } else {
            out_ << theme::tagged(tag(target),
                                  theme::fail(fmt::format("{} down {}", label, theme::dim(p.error.value_or("")))));
        }
    }
    out_.flush();
}

void ConsoleObserver::print_outcome(const std::string& target, const RunOutcome& outcome) {
    std::string ports;
    for (const auto& p : outcome.ports) {
        if (!ports.empty()) ports += " ";
        ports += fmt::format("{}:{}", p.port, p.reachable ? "up" : "down");
    }

    if (verbosity_ == Verbosity::Quiet) {
        std::string line = outcome.succeeded()
            ? fmt::format("{} Succeeded in {} [{}]\n", target, format_elapsed(outcome.elapsed), ports)
            : fmt::format("{} Failed in {} ({}) [{}]: {}\n", target,
                          pipeline_state_name(outcome.failed_in), error_kind_name(outcome.error_kind),
                          ports, outcome.cause_chain());
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << line;
        out_.flush();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string t = tag(target);
        if (outcome.succeeded()) {
            out_ << theme::tagged(t, theme::ok(fmt::format("Succeeded in {}", format_elapsed(outcome.elapsed))));
        } else {
            out_ << theme::tagged(t, theme::fail(fmt::format("Failed in {} after {}",
                                                             pipeline_state_name(outcome.failed_in),
                                                             format_elapsed(outcome.elapsed))));
            out_ << theme::tagged(t, theme::kv("error", error_kind_name(outcome.error_kind)));
            out_ << theme::tagged(t, theme::kv("cause", outcome.cause_chain()));
        }
        out_ << theme::tagged(t, theme::kv("token", outcome.used_cached_token ? "cached" : "fresh"));
        if (verbosity_ == Verbosity::Verbose) {
            out_ << theme::tagged(t, theme::kv("rounds", std::to_string(outcome.probe_rounds)));
        }
    }
    print_ports(target, outcome.ports);
}

void ConsoleObserver::print_post_install(const std::string& target, const PostInstallReport& report) {
    if (verbosity_ == Verbosity::Quiet && report.ok()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    std::string t = tag(target);
    if (!report.connected) {
        out_ << theme::tagged(t, theme::fail("post-install: " + report.error));
        return;
    }
    for (const auto& c : report.commands) {
        std::string line = fmt::format("{} {}", c.command,
                                       theme::dim(fmt::format("exit {}, {} attempt(s), {}",
                                                              c.exit_code, c.attempts, format_elapsed(c.elapsed))));
        out_ << theme::tagged(t, c.ok() ? theme::ok(line) : theme::fail(line));
        if (verbosity_ == Verbosity::Verbose && !c.output.empty()) {
            out_ << theme::tagged(t, theme::log(c.output));
        }
    }
    out_.flush();
}
