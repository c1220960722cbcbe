#include "provider_probe.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <vector>

#include "logging/logger.hpp"

namespace trellico {
namespace provider {

namespace {

struct CommandOutput {
    bool ran = false;       // fork/exec reached the point of producing an exit status
    int exit_code = -1;
    std::string output;     // stdout and stderr interleaved
    std::string error;
};

// Runs binary with args, collecting combined output until exit or timeout
CommandOutput run_command(const std::string &binary, const std::vector<std::string> &args, int timeout_ms) {
    CommandOutput result;

    // Built before fork; only async-signal-safe calls run in the child
    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(binary.c_str()));
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // Close-on-exec so a provider forked concurrently cannot hold the write end open
    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("Failed to create pipe: ") + std::strerror(errno);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("Fork failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    if (pid == 0) {
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);

        int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        execv(binary.c_str(), argv.data());
        _exit(127);
    }

    close(out_pipe[1]);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    bool timed_out = false;
    char buffer[512];

    while (true) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        struct pollfd pfd {};
        pfd.fd = out_pipe[0];
        pfd.events = POLLIN;
        int rc = poll(&pfd, 1, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (rc == 0) {
            continue;
        }

        ssize_t n = read(out_pipe[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    close(out_pipe[0]);

    if (timed_out) {
        kill(pid, SIGKILL);
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        result.error = std::string("Failed to wait for process: ") + std::strerror(errno);
        return result;
    }
    if (timed_out) {
        result.error = "Timed out after " + std::to_string(timeout_ms) + "ms";
        return result;
    }

    result.ran = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

}  // namespace

const char *availability_error_to_string(AvailabilityError type) {
    switch (type) {
        case AvailabilityError::NOT_INSTALLED:
            return "not_installed";
        case AvailabilityError::NOT_LOGGED_IN:
            return "not_logged_in";
        case AvailabilityError::UNKNOWN:
            return "unknown";
        case AvailabilityError::NONE:
        default:
            return "";
    }
}

ProviderStatus check_availability(const IProviderDescriptor &descriptor, int timeout_ms) {
    ProviderStatus status;

    auto binary = descriptor.find_binary();
    if (!binary) {
        status.error = descriptor.not_installed_message();
        status.error_type = AvailabilityError::NOT_INSTALLED;
        return status;
    }

    CommandOutput version = run_command(*binary, {"--version"}, timeout_ms);
    if (!version.ran) {
        status.error = "Failed to run " + descriptor.display_name() + ": " + version.error;
        status.error_type = AvailabilityError::UNKNOWN;
        LOG_WARN("[Provider] " << descriptor.id() << " probe failed: " << version.error);
        return status;
    }

    if (version.exit_code == 127) {
        status.error = "Failed to run " + descriptor.display_name() + ": exec failed";
        status.error_type = AvailabilityError::NOT_INSTALLED;
        return status;
    }

    if (version.exit_code != 0) {
        if (descriptor.is_auth_error(version.output)) {
            status.error = descriptor.not_logged_in_message();
            status.error_type = AvailabilityError::NOT_LOGGED_IN;
            status.auth_instructions = descriptor.auth_instructions();
        } else {
            status.error = descriptor.display_name() + " error: " + version.output;
            status.error_type = AvailabilityError::UNKNOWN;
        }
        return status;
    }

    std::string auth_error;
    if (!descriptor.check_authenticated(auth_error)) {
        status.error = auth_error;
        status.error_type = AvailabilityError::NOT_LOGGED_IN;
        status.auth_instructions = descriptor.auth_instructions();
        return status;
    }

    status.available = true;
    return status;
}

}  // namespace provider
}  // namespace trellico
