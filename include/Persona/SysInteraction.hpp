// =================================================================
// include/Persona/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations like file I/O
// and running external processes.

#pragma once

#include <chrono>
#include <string>
#include <utility> // For std::pair
#include <vector>

namespace Persona {

/**
 * @brief Outcome of a child process run
 */
struct CommandResult {
    std::string output;   ///< Combined stdout and stderr
    int exit_code;        ///< Exit status, -1 if killed by a signal or timed out
    bool timed_out;       ///< True if the process was killed at the deadline

    CommandResult() : exit_code(-1), timed_out(false) {}

    bool succeeded() const { return !timed_out && exit_code == 0; }
};

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    std::string readFile(const std::string& file_path);

    /**
     * @brief Replaces a file so readers see either the old or the new content.
     *
     * Content goes to "<file_path>.tmp" first, is flushed, then renamed over
     * the target. Parent directories are created as needed.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @param error Receives a description of the failure, if any.
     * @return True on success. On failure the previous file is left intact.
     */
    bool writeFileAtomic(const std::string& file_path, const std::string& content, std::string& error);

    /**
     * @brief Checks if a file exists.
     */
    bool fileExists(const std::string& file_path);

    /**
     * @brief Checks if a directory exists.
     */
    bool directoryExists(const std::string& dir_path);

    /**
     * @brief Creates a directory and any missing parents.
     */
    bool createDirectory(const std::string& dir_path);

    /**
     * @brief Executes an external command and captures its output.
     * @param command The command to execute.
     * @param args A vector of arguments for the command.
     * @return A pair containing the stdout and the exit code.
     */
    std::pair<std::string, int> executeCommand(const std::string& command, const std::vector<std::string>& args);

    /**
     * @brief Executes an external command with a deadline.
     *
     * The command is run directly (no shell), so arguments need no quoting.
     * If the deadline passes the child is killed and reaped.
     * @param command Program name, looked up on PATH.
     * @param args Arguments for the command.
     * @param timeout Deadline; zero means wait indefinitely.
     * @return Output, exit code and timeout flag. A program that cannot be
     *         executed reports exit code 127.
     * @throws std::runtime_error if the process cannot be spawned.
     */
    CommandResult executeCommand(const std::string& command,
                                 const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout);
};

} // namespace Persona
