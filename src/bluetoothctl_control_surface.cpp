#include "bluetoothctl_control_surface.hpp"

#include "errors.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

class PipeReader {
public:
    explicit PipeReader(int fd)
        : fd_(fd)
    {
    }

    ~PipeReader()
    {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    PipeReader(const PipeReader&) = delete;
    PipeReader& operator=(const PipeReader&) = delete;

    // True once EOF is reached before the deadline.
    bool readUntil(std::chrono::steady_clock::time_point deadline, std::string& output)
    {
        char buffer[512];
        while (true) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return false;
            }

            pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = POLLIN;
            const int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            if (ret == 0) {
                return false;
            }

            const ssize_t received = ::read(fd_, buffer, sizeof(buffer));
            if (received > 0) {
                output.append(buffer, static_cast<std::size_t>(received));
            } else if (received == 0) {
                return true;
            } else if (errno != EINTR && errno != EAGAIN) {
                return true;
            }
        }
    }

private:
    int fd_;
};

} // namespace

std::vector<std::string> splitCommandLine(const std::string& command)
{
    std::vector<std::string> words;
    std::istringstream iss(command);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::optional<ProcessResult> runProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout)
{
    if (argv.empty()) {
        throw AdapterError("Empty control command");
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        throw AdapterError(std::string("Unable to create pipe: ") + std::strerror(errno));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        throw AdapterError(std::string("Unable to fork '") + argv[0] + "': " + std::strerror(errno));
    }

    if (pid == 0) {
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        const int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(fds[1]);

    ProcessResult result;
    bool finished = false;
    {
        PipeReader reader(fds[0]);
        finished = reader.readUntil(deadline, result.output);
    }

    if (!finished) {
        ::kill(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
        return std::nullopt;
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return result;
        }
    }
    if (WIFEXITED(status)) {
        result.exitStatus = WEXITSTATUS(status);
    }
    return result;
}

BluetoothctlControlSurface::BluetoothctlControlSurface(AdapterControlConfig config)
    : config_(std::move(config))
{
}

std::optional<std::string> BluetoothctlControlSurface::run(const std::string& command, std::chrono::milliseconds timeout)
{
    auto argv = splitCommandLine(command);
    argv.insert(argv.begin(), config_.tool);

    auto result = runProcess(argv, timeout);
    if (!result) {
        return std::nullopt;
    }
    if (result->exitStatus != 0) {
        std::cerr << "[btmouse] '" << config_.tool << " " << command << "' exited with status " << result->exitStatus << std::endl;
    }
    return std::move(result->output);
}

bool BluetoothctlControlSurface::restartService(std::chrono::milliseconds timeout)
{
    std::cout << "[btmouse] Running '" << config_.restartCommand << "'" << std::endl;
    const auto result = runProcess(splitCommandLine(config_.restartCommand), timeout);
    return result && result->exitStatus == 0;
}
