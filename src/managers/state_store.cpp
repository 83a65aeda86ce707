#include "state_store.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <platform/file_lock.hpp>
#include <platform/platform.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

// ── File helpers ───────────────────────────────────────────

fs::path create_numbered_backup(const fs::path& path) {
    fs::path backup_base = path;
    backup_base.replace_extension(BACKUP_SUFFIX);
    std::string prefix = backup_base.filename().string() + "_";

    fs::path dir = backup_base.has_parent_path() ? backup_base.parent_path() : fs::path(".");
    int highest = 0;
    for (const auto& existing : platform::list_prefixed(dir, prefix)) {
        std::string tail = existing.filename().string().substr(prefix.size());
        if (tail.empty() || tail.find_first_not_of("0123456789") != std::string::npos) continue;
        highest = std::max(highest, safe_stoi(tail, 0));
    }
    return fs::path(backup_base.string() + "_" + std::to_string(highest + 1));
}

Document load_json_with_backup(const fs::path& path) {
    if (!fs::exists(path)) {
        return Document::object();
    }

    std::ifstream in(path);
    if (!in) {
        log_error(fmt::format("Cannot open {} for reading", path.string()));
        return Document::object();
    }
    std::stringstream buf;
    buf << in.rdbuf();
    in.close();

    Document doc = Document::parse(buf.str(), nullptr, false);
    if (!doc.is_discarded() && doc.is_object()) {
        return doc;
    }

    fs::path backup = create_numbered_backup(path);
    std::error_code ec;
    fs::rename(path, backup, ec);
    if (ec) {
        log_error(fmt::format("Corrupt JSON file {} could not be moved to {}: {}",
                              path.string(), backup.string(), ec.message()));
    } else {
        log_warn(fmt::format("Corrupt JSON file {} moved to {}, starting empty",
                             path.string(), backup.string()));
    }
    return Document::object();
}

void save_json(const Document& doc, const fs::path& path) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write " + tmp.string());
        }
        out << doc.dump(4) << "\n";
        if (!out.good()) {
            throw std::runtime_error("Short write to " + tmp.string());
        }
    }
    fs::rename(tmp, path);
}

// ── StateStore ─────────────────────────────────────────────

StateStore::StateStore(const fs::path& json_file,
                       std::chrono::milliseconds lock_timeout,
                       Document defaults)
    : json_file_(json_file),
      lock_timeout_(lock_timeout),
      defaults_(defaults.is_object() ? std::move(defaults) : Document::object()),
      data_(defaults_),
      birth_(std::chrono::steady_clock::now()) {
    lock_file_ = json_file_;
    lock_file_.replace_extension(LOCK_SUFFIX);
}

Document StateStore::load_locked() {
    Document doc = defaults_;
    doc.update(load_json_with_backup(json_file_));
    return doc;
}

Document StateStore::read() {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_file_.string(), lock_timeout_);
    data_ = load_locked();
    return data_;
}

void StateStore::write(const Document& partial) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_file_.string(), lock_timeout_);
    Document doc = load_locked();
    if (partial.is_object()) {
        doc.update(partial);
    }
    save_json(doc, json_file_);
    data_ = std::move(doc);
}

Document StateStore::update(const std::function<void(Document&)>& mutate) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_file_.string(), lock_timeout_);
    Document doc = load_locked();
    mutate(doc);
    if (!doc.is_object()) {
        doc = defaults_;
    }
    save_json(doc, json_file_);
    data_ = doc;
    return doc;
}

void StateStore::clear() {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_file_.string(), lock_timeout_);
    save_json(defaults_, json_file_);
    data_ = defaults_;
}

Document StateStore::snapshot() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return data_;
}

std::string StateStore::last_alive_key(const std::string& device_id) {
    return device_id + LAST_ALIVE_SUFFIX;
}

std::optional<double> StateStore::get_device_last_alive(const std::string& device_id) {
    Document doc = read();
    auto it = doc.find(last_alive_key(device_id));
    if (it == doc.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

void StateStore::set_device_last_alive(const std::string& device_id, std::optional<double> when) {
    Document partial = Document::object();
    partial[last_alive_key(device_id)] = when ? Document(*when) : Document(nullptr);
    write(partial);
}

std::string StateStore::uptime() const {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - birth_).count();
    return format_elapsed(secs);
}
