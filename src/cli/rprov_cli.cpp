#include "rprov_cli.hpp"
#include "exit_codes.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <net/http_transport.hpp>
#include <pipeline/http_device_endpoint.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <probe/service_prober.hpp>
#include <probe/tcp_prober.hpp>
#include <ssh/post_install.hpp>
#include <ssh/remote_shell.hpp>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <thread>

RprovCLI::RprovCLI(CliOptions opts) : opts_(std::move(opts)) {}

// ── Configuration ───────────────────────────────────────────

Result<void> RprovCLI::load_config() {
    auto loaded = opts_.config_path ? Config::load(*opts_.config_path) : Config::load_default();
    if (loaded.is_err()) return Result<void>::Err(loaded.error);
    config_ = loaded.value;
    return Result<void>::Ok();
}

Result<Settings> RprovCLI::resolve_settings() const {
    std::string preset = opts_.preset ? *opts_.preset : config_.preset();

    SettingsOverrides overrides = config_.overrides();
    overrides.merge(opts_.overrides);
    return make_settings(preset, overrides);
}

Result<Target> RprovCLI::make_target(const std::string& host) const {
    Target t;
    t.host = host;
    t.http_port = config_.endpoint().port;

    if (opts_.ports) {
        t.ports = *opts_.ports;
    } else if (!config_.ports().empty()) {
        t.ports = config_.ports();
    } else {
        auto defaults = parse_port_list(DEFAULT_PORTS);
        if (defaults.is_err()) return Result<Target>::Err(defaults.error);
        t.ports = defaults.value;
    }

    std::string user = opts_.user ? *opts_.user : config_.user();
    std::string password = opts_.password ? *opts_.password : config_.password();
    if (!user.empty()) t.credentials = Credentials{user, password};

    t.account = opts_.account ? *opts_.account : "";
    return Result<Target>::Ok(t);
}

std::shared_ptr<CredentialCache> RprovCLI::open_cache(ConsoleObserver* observer) const {
    fs::path path = opts_.cache_path ? *opts_.cache_path
                  : config_.cache_file() ? *config_.cache_file()
                  : CredentialCache::default_path();
    auto cache = std::make_shared<CredentialCache>(path);
    if (observer) {
        cache->set_warning_callback([observer](const CacheError& e) {
            observer->on_warning("", fmt::format("credential cache: {}", e.what()));
        });
    }
    return cache;
}

// ── Cancellation ────────────────────────────────────────────

void RprovCLI::track(Orchestrator* o) {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    runs_.push_back(o);
    if (platform::interrupted()) o->cancel();
}

void RprovCLI::untrack(Orchestrator* o) {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    runs_.erase(std::remove(runs_.begin(), runs_.end(), o), runs_.end());
}

void RprovCLI::cancel_all() {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    for (auto* o : runs_) o->cancel();
}

// ── Dispatch ────────────────────────────────────────────────

int RprovCLI::run() {
    auto cfg = load_config();
    if (cfg.is_err()) {
        std::cout << theme::fail(cfg.error);
        return EXIT_USAGE;
    }

    if (opts_.command == "run") return cmd_run();
    if (opts_.command == "probe") return cmd_probe();
    if (opts_.command == "cache") return cmd_cache();

    std::cout << theme::fail("Unknown command: " + opts_.command);
    return EXIT_USAGE;
}

// ── run ─────────────────────────────────────────────────────

int RprovCLI::run_target(const std::string& host, const Settings& settings,
                         const std::shared_ptr<CredentialCache>& cache, ConsoleObserver& observer) {
    auto target = make_target(host);
    if (target.is_err()) {
        observer.print_line(host, theme::fail(target.error));
        return EXIT_USAGE;
    }
    const Target& t = target.value;

    if (opts_.token) {
        cache->put(t.identity(), *opts_.token, settings.credential_ttl);
    }

    auto pool = std::make_shared<ConnectionPool>();
    auto transport = std::make_shared<HttpTransport>(t.host, t.http_port, settings, pool);

    PipelineDeps deps;
    deps.cache = cache;
    deps.endpoint = std::make_shared<HttpDeviceEndpoint>(transport, config_.endpoint());
    deps.payload = std::make_shared<DirectoryPayloadSource>(
        opts_.payload_dir ? *opts_.payload_dir : *config_.payload_dir(), settings.max_payload_bytes);
    deps.prober = std::make_shared<ServiceProber>(std::make_shared<TcpProber>());

    Orchestrator orchestrator(t, settings, deps, &observer);
    RunOutcome outcome;
    {
        TrackedRun tracked(*this, &orchestrator);
        outcome = orchestrator.run();
    }

    observer.print_outcome(t.identity(), outcome);

    const auto& post = config_.post_install();
    if (outcome.succeeded() && post.enabled() && !opts_.no_post && !platform::interrupted()) {
        ShellTarget st;
        st.host = t.host;
        st.port = post.port;
        st.user = post.user;
        st.password = post.password;
        st.timeout_secs = static_cast<int>(
            std::max<int64_t>(1, std::chrono::duration_cast<std::chrono::seconds>(settings.timeout).count()));

        RemoteShell shell(st);
        auto report = run_post_install(shell, post, settings, [&](const std::string& msg) {
            observer.on_status({t.identity(), PipelineState::Succeeded, outcome.elapsed, msg});
        });
        observer.print_post_install(t.identity(), report);
    }

    return exit_code_for(outcome);
}

int RprovCLI::cmd_run() {
    auto settings = resolve_settings();
    if (settings.is_err()) {
        std::cout << theme::fail(settings.error);
        return EXIT_USAGE;
    }
    if (!opts_.payload_dir && !config_.payload_dir()) {
        std::cout << theme::fail("No payload directory (use --payload-dir or payload.dir in the config)");
        return EXIT_USAGE;
    }

    platform::init_networking();
    platform::install_interrupt_handler();

    bool batch = opts_.targets.size() > 1;
    ConsoleObserver observer(opts_.verbosity, batch);
    auto cache = open_cache(&observer);

    if (opts_.verbosity != Verbosity::Quiet) {
        observer.print_line("", theme::info(fmt::format("preset {}, {} target(s), log at {}",
                                                        settings.value.preset, opts_.targets.size(),
                                                        rprov_log_path())));
    }

    // Turns SIGINT into cancel() on every live run
    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        while (!finished.load()) {
            if (platform::interrupted()) {
                cancel_all();
            }
            platform::sleep_ms(100);
        }
    });

    std::vector<int> codes(opts_.targets.size(), EXIT_OK);
    auto run_index = [&](size_t i) {
        try {
            codes[i] = run_target(opts_.targets[i], settings.value, cache, observer);
        } catch (const std::exception& e) {
            observer.print_line(opts_.targets[i], theme::fail(e.what()));
            codes[i] = EXIT_USAGE;
        }
    };

    if (!batch) {
        run_index(0);
    } else {
        std::vector<std::thread> workers;
        for (size_t i = 0; i < opts_.targets.size(); i++) {
            workers.emplace_back(run_index, i);
        }
        for (auto& w : workers) w.join();
    }

    finished = true;
    watcher.join();

    return *std::max_element(codes.begin(), codes.end());
}

// ── probe ───────────────────────────────────────────────────

int RprovCLI::cmd_probe() {
    auto settings = resolve_settings();
    if (settings.is_err()) {
        std::cout << theme::fail(settings.error);
        return EXIT_USAGE;
    }
    auto target = make_target(opts_.targets[0]);
    if (target.is_err()) {
        std::cout << theme::fail(target.error);
        return EXIT_USAGE;
    }

    platform::init_networking();
    ConsoleObserver observer(opts_.verbosity, false);
    ServiceProber prober(std::make_shared<TcpProber>());

    auto results = prober.probe_once(target.value, target.value.ports, settings.value);
    observer.print_ports(target.value.host, results);

    bool all_up = std::all_of(results.begin(), results.end(),
                              [](const ProbeResult& r) { return r.reachable; });
    return all_up ? EXIT_OK : EXIT_TIMEOUT;
}

// ── cache ───────────────────────────────────────────────────

int RprovCLI::cmd_cache() {
    ConsoleObserver observer(opts_.verbosity, false);
    auto cache = open_cache(&observer);
    const std::string& sub = opts_.positional[0];

    if (sub == "list") {
        auto entries = cache->list();
        std::cout << theme::section(fmt::format("Credential cache ({})", cache->path().string()));
        if (entries.empty()) {
            std::cout << theme::info("empty");
            return EXIT_OK;
        }

        auto now = CredentialCache::Clock::now();
        for (const auto& c : entries) {
            auto issued = std::chrono::duration_cast<std::chrono::seconds>(
                c.issued_at.time_since_epoch()).count();
            auto left = std::chrono::duration_cast<std::chrono::seconds>(
                c.issued_at + c.ttl - now).count();
            std::string state = c.valid_at(now)
                ? theme::green("valid") + theme::dim(", expires in " + format_duration(left))
                : theme::dim("expired");
            std::cout << theme::kv(c.identity, fmt::format("issued {}  {}", format_timestamp(issued), state));
        }
        return EXIT_OK;
    }

    if (opts_.positional.size() == 2) {
        const std::string& identity = opts_.positional[1];
        cache->invalidate(identity);
        std::cout << theme::ok("Removed cached token for " + identity);
    } else {
        size_t n = cache->clear();
        std::cout << theme::ok(fmt::format("Removed {} cached token(s)", n));
    }
    return EXIT_OK;
}
