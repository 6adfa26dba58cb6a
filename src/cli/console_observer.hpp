#pragma once

#include <iostream>
#include <mutex>
#include <string>
#include <vector>
#include <pipeline/progress.hpp>
#include <ssh/post_install.hpp>
#include "args.hpp"

// Prints run progress with the theme helpers. Shared by every run in a
// batch, so each write takes the observer's lock.
//
//   Quiet    one summary line per run
//   Normal   transitions + summary
//   Verbose  transitions, in-state detail, full summary
class ConsoleObserver : public ProgressObserver {
public:
    ConsoleObserver(Verbosity verbosity, bool tag_lines, std::ostream& out = std::cout);

    void on_transition(const ProgressEvent& event) override;
    void on_status(const ProgressEvent& event) override;
    void on_warning(const std::string& target, const std::string& message) override;

    void print_outcome(const std::string& target, const RunOutcome& outcome);
    void print_ports(const std::string& target, const std::vector<ProbeResult>& ports);
    void print_post_install(const std::string& target, const PostInstallReport& report);
    void print_line(const std::string& target, const std::string& line);

private:
    Verbosity verbosity_;
    bool tag_lines_;
    std::ostream& out_;
    std::mutex mutex_;

    std::string tag(const std::string& target) const { return tag_lines_ ? target : ""; }
};
