#pragma once

#include <string>
#include <vector>

namespace trellico {
namespace provider {

// Argument-vector layout understood by the descriptor
enum class ArgStyle { CLAUDE, AMP };

struct ProviderConfig {
    std::string id;                               // e.g., "claude_code"
    std::string display_name;                     // e.g., "Claude Code"
    std::string event_prefix;                     // Event name prefix, e.g., "claude" -> "claude-output"
    std::string binary_name;                      // Looked up on $PATH after search_paths
    std::vector<std::string> search_paths;        // Candidate executables, "~" expands to $HOME
    std::vector<std::string> auth_files;          // Any existing file means authenticated
    std::vector<std::string> auth_error_markers;  // Lowercase substrings that flag an auth failure
    ArgStyle arg_style = ArgStyle::CLAUDE;
    std::string install_url;
    std::string auth_instructions;
    std::string not_logged_in_message;
};

bool parse_arg_style(const std::string &value, ArgStyle &out);
const char *arg_style_to_string(ArgStyle style);

}  // namespace provider
}  // namespace trellico
