#include "jobs/transfer_process.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <system_error>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr size_t READ_CHUNK_SIZE = 4096;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

class PosixTransferProcess : public TransferProcess {
public:
    PosixTransferProcess(pid_t pid, int stdoutFd, int stderrFd)
        : pid_(pid)
        , stdoutFd_(stdoutFd)
        , stderrFd_(stderrFd) {
    }

    ~PosixTransferProcess() override {
        closeFd(stdoutFd_);
        closeFd(stderrFd_);
        if (!reaped_) {
            ::kill(-pid_, SIGKILL);
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
        }
    }

    pid_t pid() const override { return pid_; }

    bool readChunk(OutputChunk& chunk) override {
        while (stdoutFd_ >= 0 || stderrFd_ >= 0) {
            struct pollfd fds[2];
            nfds_t count = 0;
            if (stdoutFd_ >= 0) {
                fds[count++] = {stdoutFd_, POLLIN, 0};
            }
            if (stderrFd_ >= 0) {
                fds[count++] = {stderrFd_, POLLIN, 0};
            }

            int ready = ::poll(fds, count, -1);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "poll on transfer output failed");
            }

            for (nfds_t i = 0; i < count; ++i) {
                if (fds[i].revents == 0) {
                    continue;
                }
                int& fd = fds[i].fd == stdoutFd_ ? stdoutFd_ : stderrFd_;
                LogStream stream = fds[i].fd == stdoutFd_ ? LogStream::STDOUT : LogStream::STDERR;

                char buffer[READ_CHUNK_SIZE];
                ssize_t n = ::read(fd, buffer, sizeof(buffer));
                if (n < 0) {
                    if (errno == EINTR || errno == EAGAIN) {
                        continue;
                    }
                    throw std::system_error(errno, std::generic_category(), "read from transfer output failed");
                }
                if (n == 0) {
                    closeFd(fd);
                    continue;
                }
                chunk.stream = stream;
                chunk.data.assign(buffer, static_cast<size_t>(n));
                return true;
            }
        }
        return false;
    }

    void terminate() override {
        if (!reaped_) {
            ::kill(-pid_, SIGTERM);
        }
    }

    void forceKill() override {
        if (!reaped_) {
            ::kill(-pid_, SIGKILL);
        }
    }

    ProcessExit wait() override {
        ProcessExit result;
        if (reaped_) {
            return exit_;
        }

        int status = 0;
        pid_t rc;
        do {
            rc = ::waitpid(pid_, &status, 0);
        } while (rc < 0 && errno == EINTR);

        if (rc < 0) {
            throw std::system_error(errno, std::generic_category(), "waitpid failed");
        }

        if (WIFEXITED(status)) {
            result.exited = true;
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
        }
        exit_ = result;
        reaped_ = true;
        return result;
    }

private:
    pid_t pid_;
    int stdoutFd_;
    int stderrFd_;
    std::atomic<bool> reaped_{false};
    ProcessExit exit_;
};

} // namespace

std::unique_ptr<TransferProcess> PosixProcessSpawner::spawn(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0].empty()) {
        throw ProcessSpawnError("empty command line");
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) < 0 || ::pipe2(errPipe, O_CLOEXEC) < 0 ||
        ::pipe2(execPipe, O_CLOEXEC) < 0) {
        int err = errno;
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1], execPipe[0], execPipe[1]}) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
        throw ProcessSpawnError(std::string("pipe: ") + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1], execPipe[0], execPipe[1]}) {
            ::close(fd);
        }
        throw ProcessSpawnError(std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(args[0], args.data());

        int err = errno;
        ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Also set from the parent so signalling the group cannot race the child's setpgid.
    ::setpgid(pid, pid);
    ::close(outPipe[1]);
    ::close(errPipe[1]);
    ::close(execPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    ::close(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        ::close(outPipe[0]);
        ::close(errPipe[0]);
        throw ProcessSpawnError(argv[0] + ": " + std::strerror(childErrno));
    }

    Logger::debug("Spawned " + argv[0] + " with PID " + std::to_string(pid));
    return std::make_unique<PosixTransferProcess>(pid, outPipe[0], errPipe[0]);
}
