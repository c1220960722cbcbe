#pragma once

#include <optional>
#include <string>
#include <vector>

#include "provider_config.hpp"

namespace trellico {
namespace provider {

/**
 * @brief Static knowledge about one provider CLI
 *
 * A descriptor never spawns the agent itself: it locates the executable, lays
 * out the argument vector for a new or resumed conversation, and answers the
 * cheap "is it logged in" question from files on disk. Implementations must be
 * safe to call from any thread.
 */
class IProviderDescriptor {
public:
    virtual ~IProviderDescriptor() = default;

    virtual const std::string &id() const = 0;
    virtual const std::string &display_name() const = 0;
    virtual const std::string &event_prefix() const = 0;

    virtual std::optional<std::string> find_binary() const = 0;

    /**
     * @brief Build argv (without argv[0]) for one invocation
     *
     * @param message User prompt, passed as a single argument
     * @param resume_session Opaque session id, passed through unvalidated
     */
    virtual std::vector<std::string> build_args(const std::string &message,
                                                const std::optional<std::string> &resume_session) const = 0;

    virtual bool check_authenticated(std::string &error) const = 0;

    // Case-insensitive scan of CLI output for authentication failures
    virtual bool is_auth_error(const std::string &output) const = 0;

    virtual std::string not_installed_message() const = 0;
    virtual std::string not_logged_in_message() const = 0;
    virtual std::string auth_instructions() const = 0;
};

/**
 * @brief Descriptor driven entirely by a ProviderConfig
 *
 * Both built-in providers are instances of this class; config entries with
 * the same id override them field by field.
 */
class ConfiguredProviderDescriptor : public IProviderDescriptor {
public:
    explicit ConfiguredProviderDescriptor(ProviderConfig config);

    const std::string &id() const override { return config_.id; }
    const std::string &display_name() const override { return config_.display_name; }
    const std::string &event_prefix() const override { return config_.event_prefix; }

    std::optional<std::string> find_binary() const override;
    std::vector<std::string> build_args(const std::string &message,
                                        const std::optional<std::string> &resume_session) const override;
    bool check_authenticated(std::string &error) const override;
    bool is_auth_error(const std::string &output) const override;
    std::string not_installed_message() const override;
    std::string not_logged_in_message() const override;
    std::string auth_instructions() const override;

    const ProviderConfig &config() const { return config_; }

private:
    ProviderConfig config_;
};

// Built-in provider definitions
ProviderConfig claude_code_config();
ProviderConfig amp_config();
std::vector<ProviderConfig> builtin_provider_configs();

// Returns the built-in config for id, if any
std::optional<ProviderConfig> builtin_provider_config(const std::string &id);

// "~" and "~/..." expand to $HOME; other paths are returned unchanged
std::string expand_home(const std::string &path);

bool is_executable_file(const std::string &path);

// First executable "<dir>/<name>" over the $PATH entries
std::optional<std::string> search_path_env(const std::string &name);

}  // namespace provider
}  // namespace trellico
