#pragma once

#include <string>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>
#include <core/constants.hpp>

namespace fs = std::filesystem;

// A whole JSON object kept in one file.
using Document = nlohmann::json;

// Load a JSON object from `path`. A missing file yields {}. A file that does
// not parse as a JSON object is renamed to a numbered backup (see
// create_numbered_backup) and {} is returned; the contents are never dropped.
Document load_json_with_backup(const fs::path& path);

// Next "<path with .bak suffix>_N" name: one past the highest existing N,
// starting at 1.
fs::path create_numbered_backup(const fs::path& path);

// Serialize `doc` to `path` atomically (temp file + rename).
void save_json(const Document& doc, const fs::path& path);

// Lock-guarded key/value JSON document. Every read and write goes through the
// sibling "<name>.lock" file with a bounded wait, so several processes may
// share one file. Writes are shallow merges: top-level keys in the partial
// document replace the stored ones.
class StateStore {
public:
    explicit StateStore(const fs::path& json_file,
                        std::chrono::milliseconds lock_timeout =
                            std::chrono::seconds(LOCK_TIMEOUT_SECS),
                        Document defaults = Document::object());

    // Load from disk, overlaying the file contents on the defaults.
    // Throws LockTimeout.
    Document read();

    // Merge `partial` into the current on-disk document and save it whole.
    // Throws LockTimeout.
    void write(const Document& partial);

    // Locked read-modify-write. `mutate` may add, replace or erase keys;
    // the result is saved and returned. Throws LockTimeout.
    Document update(const std::function<void(Document&)>& mutate);

    // Reset the file to the defaults. Throws LockTimeout.
    void clear();

    // Last document seen by read/write/update (no disk access).
    Document snapshot() const;

    // ── Device liveness ───────────────────────────────────────
    // Keys are "<identification string>_last_alive"; values are epoch
    // seconds, or null while the device is absent.
    static std::string last_alive_key(const std::string& device_id);
    std::optional<double> get_device_last_alive(const std::string& device_id);
    void set_device_last_alive(const std::string& device_id, std::optional<double> when);

    // Time since this store object was created, "H:MM:SS".
    std::string uptime() const;

    const fs::path& path() const { return json_file_; }
    const fs::path& lock_path() const { return lock_file_; }

private:
    fs::path json_file_;
    fs::path lock_file_;
    std::chrono::milliseconds lock_timeout_;
    Document defaults_;
    Document data_;
    std::chrono::steady_clock::time_point birth_;
    mutable std::mutex mutex_;

    Document load_locked();
};
