#ifndef WEBMCPS_PLATFORM_ABI_HPP
#define WEBMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    std::string error_message;
};

// Spawn a child process with the given executable path and arguments.
// The child's stdout is redirected to stderr so it never mixes with the
// JSON-RPC stream.
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Wait (poll) until a file exists and is non-empty, up to timeout_milliseconds.
// Returns true if the file appeared, false if timed out.
bool wait_for_file(const std::string &file_path, int timeout_milliseconds);

// Ask a child process to exit (SIGTERM), escalate to SIGKILL after
// grace_milliseconds, and reap it. Returns false if the process id is invalid.
bool terminate_process(int process_id, int grace_milliseconds);

// True while the child process has not exited. Reaps it if it has.
bool is_process_running(int process_id);

// Whether the current process runs as root (Chrome then needs --no-sandbox).
bool is_running_as_root();

} // namespace platform

#endif // WEBMCPS_PLATFORM_ABI_HPP
