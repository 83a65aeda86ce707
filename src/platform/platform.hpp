#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Creates a fresh, empty directory under the temp dir. Returns its path.
std::filesystem::path make_temp_dir(const std::string& prefix);

// Entries of `dir` whose file name starts with `prefix`, sorted by name.
// Missing or unreadable directories yield an empty list.
std::vector<std::filesystem::path> list_prefixed(const std::filesystem::path& dir,
                                                 const std::string& prefix);

// Id of the running process.
int current_pid();

// True while a process with this id exists. Ids <= 0 are never alive.
bool process_alive(int pid);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
