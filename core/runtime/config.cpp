#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <set>
#include <sstream>

#include "../logging/logger.hpp"
#include "../provider/provider_descriptor.hpp"

namespace trellico {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            if (section.empty()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN("[Config] Unknown key '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}

std::vector<std::string> as_string_list(const YAML::Node &node) {
    std::vector<std::string> values;
    if (node.IsSequence()) {
        for (const auto &item : node) {
            values.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
    }
    return values;
}

// Parses one providers: entry on top of the built-in with the same id, if any
bool load_provider(const YAML::Node &node, provider::ProviderConfig &provider, std::string &error) {
    if (!node["id"]) {
        error = "Provider missing 'id' field";
        return false;
    }

    const std::string id = node["id"].as<std::string>();
    auto builtin = provider::builtin_provider_config(id);
    if (builtin) {
        provider = *builtin;
    } else {
        provider = provider::ProviderConfig{};
        provider.id = id;
    }

    warn_unknown_keys(node, "providers[" + id + "]",
                      {"id", "display_name", "event_prefix", "binary_name", "search_paths", "auth_files",
                       "auth_error_markers", "arg_style", "install_url", "auth_instructions",
                       "not_logged_in_message"});

    if (node["display_name"]) {
        provider.display_name = node["display_name"].as<std::string>();
    }
    if (node["event_prefix"]) {
        provider.event_prefix = node["event_prefix"].as<std::string>();
    }
    if (node["binary_name"]) {
        provider.binary_name = node["binary_name"].as<std::string>();
    }
    if (node["search_paths"]) {
        provider.search_paths = as_string_list(node["search_paths"]);
    }
    if (node["auth_files"]) {
        provider.auth_files = as_string_list(node["auth_files"]);
    }
    if (node["auth_error_markers"]) {
        provider.auth_error_markers = as_string_list(node["auth_error_markers"]);
    }
    if (node["arg_style"]) {
        const auto style = node["arg_style"].as<std::string>();
        if (!provider::parse_arg_style(style, provider.arg_style)) {
            error = "Provider '" + id + "' has invalid arg_style '" + style + "': must be claude or amp";
            return false;
        }
    }
    if (node["install_url"]) {
        provider.install_url = node["install_url"].as<std::string>();
    }
    if (node["auth_instructions"]) {
        provider.auth_instructions = node["auth_instructions"].as<std::string>();
    }
    if (node["not_logged_in_message"]) {
        provider.not_logged_in_message = node["not_logged_in_message"].as<std::string>();
    }

    if (provider.event_prefix.empty()) {
        provider.event_prefix = provider.id;
    }
    if (provider.display_name.empty()) {
        provider.display_name = provider.id;
    }
    return true;
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.enabled) {
        // 0 binds an ephemeral port
        if (config.http.port < 0 || config.http.port > 65535) {
            error = "HTTP port must be between 0 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
    }

    // Validate process settings
    if (config.processes.read_chunk_bytes < 16 || config.processes.read_chunk_bytes > 65536) {
        error = "processes.read_chunk_bytes must be between 16 and 65536";
        return false;
    }
    if (config.processes.cancel_poll_ms < 10 || config.processes.cancel_poll_ms > 5000) {
        error = "processes.cancel_poll_ms must be between 10 and 5000";
        return false;
    }
    if (config.processes.pty_rows < 1 || config.processes.pty_rows > 65535 || config.processes.pty_cols < 1 ||
        config.processes.pty_cols > 65535) {
        error = "processes.pty_rows and processes.pty_cols must be between 1 and 65535";
        return false;
    }

    // Validate Provider settings
    std::set<std::string> seen;
    for (const auto &provider : config.providers) {
        if (provider.id.empty()) {
            error = "Provider missing 'id' field";
            return false;
        }
        if (!seen.insert(provider.id).second) {
            error = "Duplicate provider id: " + provider.id;
            return false;
        }
        if (provider.binary_name.empty() && provider.search_paths.empty()) {
            error = "Provider '" + provider.id + "' needs 'binary_name' or 'search_paths'";
            return false;
        }
    }

    // Validate watch layout
    if (config.watch.state_dir.empty() || config.watch.plans_dir.empty() || config.watch.prd_dir.empty() ||
        config.watch.prd_manifest.empty() || config.watch.iterations_file.empty()) {
        error = "watch directory and file names must not be empty";
        return false;
    }
    if (config.watch.plan_extension.size() < 2 || config.watch.plan_extension[0] != '.') {
        error = "watch.plan_extension must start with '.', e.g. .md";
        return false;
    }

    // Validate events settings
    if (config.events.queue_size < 1) {
        error = "events.queue_size must be at least 1";
        return false;
    }
    if (config.events.max_subscribers < 0) {
        error = "events.max_subscribers must be >= 0";
        return false;
    }

    // Validate Logging settings
    logging::Level level;
    if (!logging::try_parse_level(config.logging.level, level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        warn_unknown_keys(yaml, "", {"http", "processes", "providers", "watch", "events", "logging"});

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            warn_unknown_keys(http, "http",
                              {"enabled", "bind", "port", "cors_allowed_origins", "cors_allow_credentials",
                               "thread_pool_size"});

            if (http["enabled"]) {
                config.http.enabled = http["enabled"].as<bool>();
            }
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                config.http.cors_allowed_origins = as_string_list(http["cors_allowed_origins"]);
                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (http["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
        }

        // Load process config
        if (yaml["processes"]) {
            const auto &proc = yaml["processes"];
            warn_unknown_keys(proc, "processes",
                              {"mode", "read_chunk_bytes", "cancel_poll_ms", "utf8_policy", "pty_rows", "pty_cols"});

            if (proc["mode"]) {
                const auto mode = proc["mode"].as<std::string>();
                if (!process::parse_process_mode(mode, config.processes.mode)) {
                    error = "Invalid processes.mode '" + mode + "': must be multi or single";
                    return false;
                }
            }
            if (proc["read_chunk_bytes"]) {
                config.processes.read_chunk_bytes = proc["read_chunk_bytes"].as<int>();
            }
            if (proc["cancel_poll_ms"]) {
                config.processes.cancel_poll_ms = proc["cancel_poll_ms"].as<int>();
            }
            if (proc["utf8_policy"]) {
                const auto policy = proc["utf8_policy"].as<std::string>();
                if (!process::parse_utf8_policy(policy, config.processes.utf8_policy)) {
                    error = "Invalid processes.utf8_policy '" + policy + "': must be drop or buffer";
                    return false;
                }
            }
            if (proc["pty_rows"]) {
                config.processes.pty_rows = proc["pty_rows"].as<int>();
            }
            if (proc["pty_cols"]) {
                config.processes.pty_cols = proc["pty_cols"].as<int>();
            }
        }

        // Load providers
        if (yaml["providers"]) {
            config.providers.clear();  // Ensure idempotent parsing
            for (const auto &provider_node : yaml["providers"]) {
                provider::ProviderConfig provider;
                if (!load_provider(provider_node, provider, error)) {
                    return false;
                }
                config.providers.push_back(provider);
            }
        }

        // Load watch layout
        if (yaml["watch"]) {
            const auto &w = yaml["watch"];
            warn_unknown_keys(w, "watch",
                              {"state_dir", "plans_dir", "plan_extension", "prd_dir", "prd_manifest",
                               "iterations_file"});

            if (w["state_dir"]) {
                config.watch.state_dir = w["state_dir"].as<std::string>();
            }
            if (w["plans_dir"]) {
                config.watch.plans_dir = w["plans_dir"].as<std::string>();
            }
            if (w["plan_extension"]) {
                config.watch.plan_extension = w["plan_extension"].as<std::string>();
            }
            if (w["prd_dir"]) {
                config.watch.prd_dir = w["prd_dir"].as<std::string>();
            }
            if (w["prd_manifest"]) {
                config.watch.prd_manifest = w["prd_manifest"].as<std::string>();
            }
            if (w["iterations_file"]) {
                config.watch.iterations_file = w["iterations_file"].as<std::string>();
            }
        }

        // Load events config
        if (yaml["events"]) {
            warn_unknown_keys(yaml["events"], "events", {"queue_size", "max_subscribers"});
            if (yaml["events"]["queue_size"]) {
                config.events.queue_size = yaml["events"]["queue_size"].as<int>();
            }
            if (yaml["events"]["max_subscribers"]) {
                config.events.max_subscribers = yaml["events"]["max_subscribers"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Loaded " << config.providers.size() << " provider override(s)");

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Processes: mode=" << process::process_mode_to_string(config.processes.mode)
                                             << ", chunk=" << config.processes.read_chunk_bytes
                                             << "B, cancel poll=" << config.processes.cancel_poll_ms
                                             << "ms, utf8=" << process::utf8_policy_to_string(config.processes.utf8_policy));
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

process::SupervisorConfig to_supervisor_config(const ProcessesConfig &config) {
    process::SupervisorConfig result;
    result.mode = config.mode;
    result.read_chunk_bytes = static_cast<size_t>(config.read_chunk_bytes);
    result.cancel_poll_ms = config.cancel_poll_ms;
    result.utf8_policy = config.utf8_policy;
    result.pty_rows = static_cast<unsigned short>(config.pty_rows);
    result.pty_cols = static_cast<unsigned short>(config.pty_cols);
    return result;
}

}  // namespace runtime
}  // namespace trellico
