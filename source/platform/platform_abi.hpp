#ifndef MCPLINK_PLATFORM_ABI_HPP
#define MCPLINK_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstddef>
#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process whose stdin and stdout are pipes owned by the caller.
// The child's stderr is inherited.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_fd = -1;   // write end, feeds the child's stdin
    int stdout_fd = -1;  // read end, drains the child's stdout
    std::string error_message;
};

// Spawn a child process with the given executable path and arguments,
// connected to the caller through two pipes.
SpawnResult spawn_process_with_pipes(const std::string &executable_path,
                                     const std::vector<std::string> &arguments);

// Result of a bounded read from a file descriptor.
struct ReadResult {
    bool success = false;
    bool end_of_file = false;
    bool timed_out = false;
    std::string data;
    std::string error_message;
};

// Wait up to timeout_milliseconds for data on fd and read what is available.
ReadResult read_available(int fd, int timeout_milliseconds);

// Write the whole buffer to fd, retrying on partial writes and EINTR.
// Returns false (with error_message set) if the peer went away.
bool write_all(int fd, const std::string &data, std::string &error_message);

// Close a descriptor if it is open and reset it to -1.
void close_descriptor(int &fd);

// Wait until the process exits, up to timeout_milliseconds. Reaps it on success.
bool wait_for_exit(int process_id, int timeout_milliseconds);

// Ask a process to terminate (SIGTERM).
bool kill_process(int process_id);

// Terminate a process unconditionally (SIGKILL) and reap it.
bool force_kill_process(int process_id);

// True if path names an existing regular file the current user may execute.
bool is_executable_file(const std::string &path);

// Directory containing the running executable, or empty on failure.
std::string executable_directory();

} // namespace platform

#endif // MCPLINK_PLATFORM_ABI_HPP
