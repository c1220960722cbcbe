#include "provider_descriptor.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>

#include "logging/logger.hpp"

namespace trellico {
namespace provider {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<std::string> common_auth_markers() {
    return {"not logged in", "authentication", "invalid api key", "unauthorized"};
}

}  // namespace

bool parse_arg_style(const std::string &value, ArgStyle &out) {
    const std::string lower = to_lower(value);
    if (lower == "claude") {
        out = ArgStyle::CLAUDE;
        return true;
    }
    if (lower == "amp") {
        out = ArgStyle::AMP;
        return true;
    }
    return false;
}

const char *arg_style_to_string(ArgStyle style) {
    switch (style) {
        case ArgStyle::CLAUDE:
            return "claude";
        case ArgStyle::AMP:
            return "amp";
        default:
            return "claude";
    }
}

std::string expand_home(const std::string &path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        // "~user" forms are not supported
        return path;
    }
    const char *home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return path;
    }
    return std::string(home) + path.substr(1);
}

bool is_executable_file(const std::string &path) {
    struct stat st {};
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> search_path_env(const std::string &name) {
    if (name.empty()) {
        return std::nullopt;
    }
    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }

    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

ConfiguredProviderDescriptor::ConfiguredProviderDescriptor(ProviderConfig config) : config_(std::move(config)) {
    if (config_.event_prefix.empty()) {
        config_.event_prefix = config_.id;
    }
    if (config_.display_name.empty()) {
        config_.display_name = config_.id;
    }
}

std::optional<std::string> ConfiguredProviderDescriptor::find_binary() const {
    for (const auto &candidate : config_.search_paths) {
        std::string path = expand_home(candidate);
        if (is_executable_file(path)) {
            LOG_DEBUG("[Provider] " << config_.id << " binary found at " << path);
            return path;
        }
    }

    auto from_env = search_path_env(config_.binary_name);
    if (from_env) {
        LOG_DEBUG("[Provider] " << config_.id << " binary found on PATH: " << *from_env);
    }
    return from_env;
}

std::vector<std::string> ConfiguredProviderDescriptor::build_args(
    const std::string &message, const std::optional<std::string> &resume_session) const {
    std::vector<std::string> args;

    switch (config_.arg_style) {
        case ArgStyle::AMP:
            if (resume_session) {
                args = {"threads", "continue", *resume_session, "-x"};
            } else {
                args = {"-x"};
            }
            args.push_back(message);
            args.push_back("--stream-json");
            args.push_back("--dangerously-allow-all");
            break;

        case ArgStyle::CLAUDE:
        default:
            args = {"-p", "--output-format", "stream-json", "--verbose", "--dangerously-skip-permissions"};
            if (resume_session) {
                args.push_back("--resume");
                args.push_back(*resume_session);
            }
            args.push_back(message);
            break;
    }

    return args;
}

bool ConfiguredProviderDescriptor::check_authenticated(std::string &error) const {
    const char *home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        error = "Cannot find home directory";
        return false;
    }

    // No auth files configured means the CLI manages its own login state
    if (config_.auth_files.empty()) {
        return true;
    }

    for (const auto &file : config_.auth_files) {
        struct stat st {};
        if (stat(expand_home(file).c_str(), &st) == 0) {
            return true;
        }
    }

    error = not_logged_in_message();
    return false;
}

bool ConfiguredProviderDescriptor::is_auth_error(const std::string &output) const {
    const std::string lower = to_lower(output);
    for (const auto &marker : config_.auth_error_markers) {
        if (!marker.empty() && lower.find(to_lower(marker)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string ConfiguredProviderDescriptor::not_installed_message() const {
    if (config_.install_url.empty()) {
        return config_.display_name + " is not installed.";
    }
    return config_.display_name + " is not installed. Please install it from " + config_.install_url;
}

std::string ConfiguredProviderDescriptor::not_logged_in_message() const {
    if (config_.not_logged_in_message.empty()) {
        return config_.display_name + " is not logged in.";
    }
    return config_.not_logged_in_message;
}

std::string ConfiguredProviderDescriptor::auth_instructions() const { return config_.auth_instructions; }

ProviderConfig claude_code_config() {
    ProviderConfig config;
    config.id = "claude_code";
    config.display_name = "Claude Code";
    config.event_prefix = "claude";
    config.binary_name = "claude";
    config.search_paths = {"~/.local/bin/claude", "/usr/local/bin/claude", "/opt/homebrew/bin/claude",
                           "/usr/bin/claude"};
    config.auth_files = {"~/.claude/.credentials.json", "~/.claude.json"};
    config.auth_error_markers = common_auth_markers();
    config.auth_error_markers.push_back("please run 'claude'");
    config.arg_style = ArgStyle::CLAUDE;
    config.install_url = "https://claude.com/product/claude-code";
    config.auth_instructions = "Run 'claude' in your terminal to authenticate";
    config.not_logged_in_message =
        "Claude Code is not logged in. Please run 'claude' in your terminal to authenticate.";
    return config;
}

ProviderConfig amp_config() {
    ProviderConfig config;
    config.id = "amp";
    config.display_name = "Amp";
    config.event_prefix = "amp";
    config.binary_name = "amp";
    config.search_paths = {"~/.amp/bin/amp", "~/.local/bin/amp", "/usr/local/bin/amp", "/opt/homebrew/bin/amp",
                           "/usr/bin/amp"};
    config.auth_files = {"~/.config/amp/settings.json"};
    config.auth_error_markers = common_auth_markers();
    config.auth_error_markers.push_back("amp login");
    config.auth_error_markers.push_back("please login");
    config.arg_style = ArgStyle::AMP;
    config.install_url = "https://ampcode.com";
    config.auth_instructions = "Run 'amp login' to authenticate";
    config.not_logged_in_message = "Amp is not logged in. Please run 'amp login' to authenticate.";
    return config;
}

std::vector<ProviderConfig> builtin_provider_configs() { return {claude_code_config(), amp_config()}; }

std::optional<ProviderConfig> builtin_provider_config(const std::string &id) {
    for (auto &config : builtin_provider_configs()) {
        if (config.id == id) {
            return config;
        }
    }
    return std::nullopt;
}

}  // namespace provider
}  // namespace trellico
