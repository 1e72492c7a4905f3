// =================================================================
// src/Persona/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "Persona/SysInteraction.hpp"
#include "Persona/Logger.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Persona {

namespace {

// Reads whatever is currently available on a non-blocking descriptor.
void drainPipe(int fd, std::string& output) {
    std::array<char, 4096> buffer{};
    while (true) {
        const ssize_t bytes = read(fd, buffer.data(), buffer.size());
        if (bytes <= 0) {
            break;
        }
        output.append(buffer.data(), static_cast<size_t>(bytes));
    }
}

std::string describeCommand(const std::string& command, const std::vector<std::string>& args) {
    std::ostringstream oss;
    oss << command;
    for (const auto& arg : args) {
        oss << " " << arg;
    }
    return oss.str();
}

} // namespace

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    return buffer.str();
}

bool SysInteraction::writeFileAtomic(const std::string& file_path, const std::string& content, std::string& error) {
    const std::filesystem::path target(file_path);
    std::error_code ec;

    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "cannot create directory " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::filesystem::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            error = "cannot open " + tmp.string() + " for writing";
            return false;
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (!ofs) {
            ofs.close();
            std::filesystem::remove(tmp, ec);
            error = "write to " + tmp.string() + " failed";
            return false;
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        error = "cannot replace " + target.string() + ": " + ec.message();
        std::error_code cleanup_ec;
        std::filesystem::remove(tmp, cleanup_ec);
        return false;
    }
    return true;
}

bool SysInteraction::fileExists(const std::string& file_path) {
    struct stat buffer;
    return (stat(file_path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

bool SysInteraction::directoryExists(const std::string& dir_path) {
    struct stat buffer;
    return (stat(dir_path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

bool SysInteraction::createDirectory(const std::string& dir_path) {
    std::error_code ec;
    std::filesystem::create_directories(dir_path, ec);
    return !ec && directoryExists(dir_path);
}

std::pair<std::string, int> SysInteraction::executeCommand(const std::string& command, const std::vector<std::string>& args) {
    CommandResult result = executeCommand(command, args, std::chrono::milliseconds::zero());
    return {result.output, result.exit_code};
}

CommandResult SysInteraction::executeCommand(const std::string& command,
                                             const std::vector<std::string>& args,
                                             std::chrono::milliseconds timeout) {
    const std::string description = describeCommand(command, args);
    LOG_DEBUG("SysInteraction", "Running: " + description);

    // Build argv before forking; the child must not allocate
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(command);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int pipefd[2] = {-1, -1};
    if (pipe(pipefd) != 0) {
        throw std::runtime_error("Failed to create pipe for: " + description);
    }

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::runtime_error("Failed to fork for: " + description);
    }

    if (pid == 0) {
        close(pipefd[0]);
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[1]);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    close(pipefd[1]);
    const int flags = fcntl(pipefd[0], F_GETFL, 0);
    fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

    CommandResult result;
    const auto started = std::chrono::steady_clock::now();
    int status = 0;
    bool reaped = false;

    while (!reaped) {
        if (timeout.count() > 0 && std::chrono::steady_clock::now() - started > timeout) {
            kill(pid, SIGKILL);
            result.timed_out = true;
            break;
        }

        struct pollfd pfd {};
        pfd.fd = pipefd[0];
        pfd.events = POLLIN;
        (void)poll(&pfd, 1, 50);
        drainPipe(pipefd[0], result.output);

        const pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            reaped = true;
        } else if (done < 0 && errno != EINTR) {
            close(pipefd[0]);
            throw std::runtime_error("waitpid failed for: " + description);
        }
    }

    if (!reaped) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }
    drainPipe(pipefd[0], result.output);
    close(pipefd[0]);

    if (result.timed_out) {
        result.exit_code = -1;
        LOG_WARNING("SysInteraction", "Command timed out after " +
                    std::to_string(timeout.count()) + "ms: " + description);
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        // Process terminated abnormally
        result.exit_code = -1;
    }

    LOG_DEBUG("SysInteraction", "Exit code " + std::to_string(result.exit_code) + ": " + description);
    return result;
}

} // namespace Persona
