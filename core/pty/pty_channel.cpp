#include "pty_channel.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

#include "logging/logger.hpp"

namespace trellico {
namespace pty {

int exit_code_from_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

PtyChannel::~PtyChannel() {
    if (pid_ > 0) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        pid_ = -1;
    }
    close_slave();
    close_master();
}

bool PtyChannel::open(unsigned short rows, unsigned short cols, std::string &error) {
    if (master_fd_ >= 0) {
        error = "Terminal already open";
        return false;
    }

    struct winsize ws {};
    ws.ws_row = rows;
    ws.ws_col = cols;

    // Both ends are close-on-exec from creation; children forked on other
    // threads must never hold a copy of the slave
    int master = posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (master < 0) {
        error = std::string("Failed to allocate pseudo-terminal: ") + std::strerror(errno);
        return false;
    }

    char slave_name[PATH_MAX];
    if (grantpt(master) != 0 || unlockpt(master) != 0 || ptsname_r(master, slave_name, sizeof(slave_name)) != 0) {
        error = std::string("Failed to allocate pseudo-terminal: ") + std::strerror(errno);
        ::close(master);
        return false;
    }

    int slave = ::open(slave_name, O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (slave < 0) {
        error = std::string("Failed to open ") + slave_name + ": " + std::strerror(errno);
        ::close(master);
        return false;
    }

    if (ioctl(master, TIOCSWINSZ, &ws) != 0) {
        LOG_WARN("[PTY] Failed to set window size on " << slave_name << ": " << std::strerror(errno));
    }

    master_fd_ = master;
    slave_fd_ = slave;
    return true;
}

bool PtyChannel::spawn(const std::string &binary, const std::vector<std::string> &args, const std::string &cwd,
                       std::string &error) {
    if (master_fd_ < 0 || slave_fd_ < 0) {
        error = "Terminal not open";
        return false;
    }
    if (pid_ > 0) {
        error = "Child already spawned";
        return false;
    }

    // Everything the child touches is prepared before fork
    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(binary.c_str()));
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const int slave = slave_fd_;
    const int master = master_fd_;

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("Failed to spawn child: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // Child process
        setsid();
        ioctl(slave, TIOCSCTTY, 0);

        dup2(slave, STDIN_FILENO);
        dup2(slave, STDOUT_FILENO);
        dup2(slave, STDERR_FILENO);
        if (slave > STDERR_FILENO) {
            ::close(slave);
        }
        ::close(master);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(127);
        }

        execv(binary.c_str(), argv.data());
        _exit(127);
    }

    // Parent: only the child holds the slave from here on
    pid_ = pid;
    close_slave();

    LOG_DEBUG("[PTY] Spawned " << binary << " (PID=" << pid_ << ") in " << cwd);
    return true;
}

PtyChannel::ReadResult PtyChannel::read(char *buf, size_t n, int timeout_ms) {
    ReadResult result;
    if (master_fd_ < 0) {
        result.status = ReadStatus::END;
        return result;
    }

    while (true) {
        struct pollfd pfd {};
        pfd.fd = master_fd_;
        pfd.events = POLLIN;

        int rc = poll(&pfd, 1, timeout_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.status = ReadStatus::ERROR;
            result.error_code = errno;
            return result;
        }
        if (rc == 0) {
            result.status = ReadStatus::TIMEOUT;
            return result;
        }

        // POLLIN or POLLHUP/POLLERR: read() reports which
        ssize_t got = ::read(master_fd_, buf, n);
        if (got > 0) {
            result.status = ReadStatus::DATA;
            result.bytes = static_cast<size_t>(got);
            return result;
        }
        if (got == 0) {
            result.status = ReadStatus::END;
            return result;
        }

        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            result.status = ReadStatus::TIMEOUT;
            return result;
        }
        // Linux reports a closed slave side as EIO on the master
        if (errno == EIO) {
            result.status = ReadStatus::END;
            return result;
        }

        result.status = ReadStatus::ERROR;
        result.error_code = errno;
        return result;
    }
}

void PtyChannel::kill() {
    if (pid_ > 0) {
        ::kill(pid_, SIGKILL);
    }
}

std::optional<int> PtyChannel::wait(std::string &error) {
    if (pid_ <= 0) {
        error = "No child to wait for";
        return std::nullopt;
    }

    int status = 0;
    while (true) {
        pid_t result = waitpid(pid_, &status, 0);
        if (result == pid_) {
            break;
        }
        if (result < 0 && errno == EINTR) {
            continue;
        }
        error = std::string("Failed to wait for exit: ") + std::strerror(errno);
        pid_ = -1;
        return std::nullopt;
    }

    pid_ = -1;
    close_master();
    return exit_code_from_status(status);
}

void PtyChannel::close_master() {
    if (master_fd_ >= 0) {
        ::close(master_fd_);
        master_fd_ = -1;
    }
}

void PtyChannel::close_slave() {
    if (slave_fd_ >= 0) {
        ::close(slave_fd_);
        slave_fd_ = -1;
    }
}

}  // namespace pty
}  // namespace trellico
