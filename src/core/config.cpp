#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <sstream>

fs::path get_config_path() {
    return platform::rprov_home() / CONFIG_FILE_NAME;
}

// Durations are seconds when numeric ("30", "0.5") or carry a unit ("250ms").
static Result<Millis> read_duration(const YAML::Node& node, const std::string& key) {
    auto r = parse_duration(node.as<std::string>());
    if (r.is_err()) return Result<Millis>::Err(fmt::format("settings.{}: {}", key, r.error));
    return r;
}

static Result<SettingsOverrides> parse_settings(const YAML::Node& node) {
    SettingsOverrides o;
    if (!node.IsMap()) return Result<SettingsOverrides>::Err("settings must be a mapping");

    for (const auto& kv : node) {
        const std::string key = kv.first.as<std::string>();
        const YAML::Node& v = kv.second;

        std::optional<Millis>* duration_field = nullptr;
        if (key == "timeout") duration_field = &o.timeout;
        else if (key == "connect_timeout") duration_field = &o.connect_timeout;
        else if (key == "read_timeout") duration_field = &o.read_timeout;
        else if (key == "retry_delay" || key == "delay") duration_field = &o.retry_delay;
        else if (key == "max_service_wait" || key == "max_wait") duration_field = &o.max_service_wait;
        else if (key == "probe_base_delay") duration_field = &o.probe_base_delay;
        else if (key == "probe_backoff_cap") duration_field = &o.probe_backoff_cap;

        if (duration_field) {
            auto d = read_duration(v, key);
            if (d.is_err()) return Result<SettingsOverrides>::Err(d.error);
            *duration_field = d.value;
        } else if (key == "retries") {
            o.retries = v.as<int>();
        } else if (key == "auth_retries") {
            o.auth_retries = v.as<int>();
        } else if (key == "max_concurrency" || key == "concurrency") {
            o.max_concurrency = v.as<int>();
        } else if (key == "probe_jitter") {
            o.probe_jitter = v.as<double>();
        } else if (key == "max_payload_bytes") {
            o.max_payload_bytes = v.as<int64_t>();
        } else if (key == "credential_ttl") {
            auto d = read_duration(v, key);
            if (d.is_err()) return Result<SettingsOverrides>::Err(d.error);
            o.credential_ttl = std::chrono::duration_cast<std::chrono::seconds>(d.value);
        } else {
            return Result<SettingsOverrides>::Err(fmt::format("unknown setting '{}'", key));
        }
    }
    return Result<SettingsOverrides>::Ok(o);
}

static Result<std::vector<int>> parse_ports(const YAML::Node& node) {
    std::vector<int> ports;
    auto add = [&](int p) -> bool {
        if (p < 1 || p > 65535) return false;
        if (std::find(ports.begin(), ports.end(), p) == ports.end()) ports.push_back(p);
        return true;
    };

    if (node.IsScalar()) {
        if (!add(node.as<int>())) return Result<std::vector<int>>::Err("target.ports: port out of range");
    } else if (node.IsSequence()) {
        for (const auto& p : node) {
            if (!add(p.as<int>())) return Result<std::vector<int>>::Err("target.ports: port out of range");
        }
    } else {
        return Result<std::vector<int>>::Err("target.ports must be a list");
    }
    return Result<std::vector<int>>::Ok(ports);
}

Result<Config> Config::parse(const std::string& text, const std::string& origin) {
    Config config;
    try {
        YAML::Node root = YAML::Load(text);
        if (root.IsNull()) return Result<Config>::Ok(config);
        if (!root.IsMap()) return Result<Config>::Err(origin + ": top level must be a mapping");

        config.preset_ = root["preset"].as<std::string>("");

        if (root["settings"]) {
            auto s = parse_settings(root["settings"]);
            if (s.is_err()) return Result<Config>::Err(origin + ": " + s.error);
            config.overrides_ = s.value;
        }

        if (root["target"] && root["target"].IsMap()) {
            const auto& t = root["target"];
            if (t["ports"]) {
                auto p = parse_ports(t["ports"]);
                if (p.is_err()) return Result<Config>::Err(origin + ": " + p.error);
                config.ports_ = p.value;
            }
            config.user_ = t["user"].as<std::string>("");
            config.password_ = t["password"].as<std::string>("");
        }

        if (root["endpoint"] && root["endpoint"].IsMap()) {
            const auto& e = root["endpoint"];
            config.endpoint_.port = e["scheme_port"].as<int>(config.endpoint_.port);
            config.endpoint_.auth_path = e["auth_path"].as<std::string>(config.endpoint_.auth_path);
            config.endpoint_.deliver_path = e["deliver_path"].as<std::string>(config.endpoint_.deliver_path);
            if (config.endpoint_.port < 1 || config.endpoint_.port > 65535) {
                return Result<Config>::Err(origin + ": endpoint.scheme_port out of range");
            }
        }

        if (root["payload"] && root["payload"]["dir"]) {
            config.payload_dir_ = platform::expand_home(root["payload"]["dir"].as<std::string>());
        }
        if (root["cache_file"]) {
            config.cache_file_ = platform::expand_home(root["cache_file"].as<std::string>());
        }

        if (root["post_install"] && root["post_install"].IsMap()) {
            const auto& p = root["post_install"];
            auto& pi = config.post_install_;
            pi.user = p["user"].as<std::string>(pi.user);
            pi.password = p["password"].as<std::string>("");
            pi.port = p["port"].as<int>(SSH_DEFAULT_PORT);
            if (p["commands"]) {
                if (!p["commands"].IsSequence()) {
                    return Result<Config>::Err(origin + ": post_install.commands must be a list");
                }
                pi.commands = p["commands"].as<std::vector<std::string>>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("{}: {}", origin, e.what()));
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return Result<Config>::Err("Cannot read config file " + path.string());
    std::stringstream buf;
    buf << in.rdbuf();
    return parse(buf.str(), path.string());
}

Result<Config> Config::load_default() {
    fs::path path = get_config_path();
    std::error_code ec;
    if (!fs::exists(path, ec)) return Result<Config>::Ok(Config{});
    return load(path);
}
