#pragma once

#include <sys/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace trellico {
namespace pty {

// PtyChannel owns one pseudo-terminal pair and the child attached to it.
// Responsibilities:
// - Allocate master/slave with a fixed window size
// - Spawn the child as session leader with the slave as controlling terminal
// - Bounded-wait reads on the master end
// - Forced kill and blocking reap
//
// Not thread-safe: one execution context owns a channel for its lifetime.
class PtyChannel {
public:
    enum class ReadStatus {
        DATA,     // bytes > 0
        TIMEOUT,  // nothing readable within timeout_ms
        END,      // terminal closed (EOF or EIO on the master)
        ERROR     // error_code holds errno
    };

    struct ReadResult {
        ReadStatus status = ReadStatus::TIMEOUT;
        size_t bytes = 0;
        int error_code = 0;
    };

    PtyChannel() = default;
    ~PtyChannel();

    PtyChannel(const PtyChannel &) = delete;
    PtyChannel &operator=(const PtyChannel &) = delete;

    // Allocate the terminal pair. Returns false on failure (sets error)
    bool open(unsigned short rows, unsigned short cols, std::string &error);

    // Fork and exec binary with args (argv[0] is binary) in cwd.
    // The child exits with 127 if chdir or exec fails.
    bool spawn(const std::string &binary, const std::vector<std::string> &args, const std::string &cwd,
               std::string &error);

    // Read up to n bytes from the master, waiting at most timeout_ms
    ReadResult read(char *buf, size_t n, int timeout_ms);

    // SIGKILL the child (no-op if not running)
    void kill();

    // Block until the child exits. Exit status, 128+signal, or -1.
    // Returns nullopt and sets error if waitpid fails.
    std::optional<int> wait(std::string &error);

    bool is_open() const { return master_fd_ >= 0; }
    bool has_child() const { return pid_ > 0; }
    pid_t pid() const { return pid_; }

private:
    void close_master();
    void close_slave();

    int master_fd_ = -1;
    int slave_fd_ = -1;
    pid_t pid_ = -1;
};

// Maps a waitpid status to the integer exit code reported to observers
int exit_code_from_status(int status);

}  // namespace pty
}  // namespace trellico
