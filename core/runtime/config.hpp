#pragma once

#include <string>
#include <vector>

#include "../process/process_supervisor.hpp"
#include "../process/utf8.hpp"
#include "../provider/provider_config.hpp"
#include "../watch/watch_types.hpp"

namespace trellico {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error, none
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 7420;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 16;                           // Worker thread pool size
};

// processes: section
struct ProcessesConfig {
    process::ProcessMode mode = process::ProcessMode::MULTI;
    int read_chunk_bytes = 256;                                // Fixed terminal read size (16-65536)
    int cancel_poll_ms = 100;                                  // Max wait between cancellation checks (10-5000)
    process::Utf8Policy utf8_policy = process::Utf8Policy::DROP;
    int pty_rows = 24;
    int pty_cols = 80;
};

struct EventsConfig {
    int queue_size = 256;      // Per-subscriber queue depth
    int max_subscribers = 32;  // 0 = unlimited
};

struct RuntimeConfig {
    HttpConfig http;
    ProcessesConfig processes;
    std::vector<provider::ProviderConfig> providers;  // Overrides/extensions of the built-ins
    watch::WatchLayout watch;
    EventsConfig events;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

// Converts the processes: section for the supervisor
process::SupervisorConfig to_supervisor_config(const ProcessesConfig &config);

}  // namespace runtime
}  // namespace trellico
