#ifndef FILE_REGISTRY_H
#define FILE_REGISTRY_H

// =============================================================================
// FileBridge Hub: Managed Storage Directory and File Registry
// =============================================================================
// Provides:
//   - safe_filename / file_extension: untrusted name -> storable name
//   - StorageDir: the managed upload directory (write/read/contain checks)
//   - FileRegistry: file_id -> FileRecord, TTL purge then capacity eviction
//     (evicted files are deleted from disk)
// =============================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

#include "hub_common.h"

namespace fs = std::filesystem;

// =============================================================================
// FILE NAME SANITIZING
// =============================================================================
// Basename only, control chars and /\:*?"<>| replaced by '_', every ".."
// removed, leading/trailing dots and blanks stripped. Never returns empty.
// =============================================================================
inline std::string safe_filename(const std::string& filename) {
    std::string name = filename;
    while (!name.empty() && name.back() == '/') name.pop_back();
    size_t slash = name.rfind('/');
    if (slash != std::string::npos) name = name.substr(slash + 1);

    static const std::string forbidden = "/\\:*?\"<>|";
    for (char& c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || forbidden.find(c) != std::string::npos) c = '_';
    }

    size_t pos;
    while ((pos = name.find("..")) != std::string::npos) {
        std::string next;
        size_t start = 0;
        while ((pos = name.find("..", start)) != std::string::npos) {
            next.append(name, start, pos - start);
            start = pos + 2;
        }
        next.append(name, start, std::string::npos);
        name.swap(next);
    }

    size_t first = name.find_first_not_of(". ");
    if (first == std::string::npos) return "unnamed";
    size_t last = name.find_last_not_of(". ");
    return name.substr(first, last - first + 1);
}

// Lowercase extension without the dot; "" for "name", ".hidden" or "name."
inline std::string file_extension(const std::string& filename) {
    size_t dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == filename.size()) return "";
    std::string ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// =============================================================================
// STORAGE DIRECTORY
// =============================================================================
class StorageDir {
public:
    explicit StorageDir(const std::string& root) : root_(root) {}

    // Creates the directory and pins its canonical absolute form
    bool ensure(std::string& err) {
        std::error_code ec;
        fs::create_directories(root_, ec);
        if (ec) { err = "cannot create " + root_.string() + ": " + ec.message(); return false; }
        fs::path canon = fs::weakly_canonical(fs::absolute(root_, ec), ec);
        if (ec) { err = "cannot resolve " + root_.string() + ": " + ec.message(); return false; }
        root_ = canon;
        return true;
    }

    const fs::path& root() const { return root_; }

    // Absolute destination for an already sanitized name
    fs::path path_for(const std::string& safe_name) const { return root_ / safe_name; }

    // True when `p` resolves to a location strictly inside the root
    bool contains(const fs::path& p) const {
        std::error_code ec;
        fs::path resolved = fs::weakly_canonical(p, ec);
        if (ec) return false;
        fs::path root = fs::weakly_canonical(root_, ec);
        if (ec) return false;
        auto r = root.begin();
        auto q = resolved.begin();
        for (; r != root.end(); ++r, ++q) {
            if (r->empty()) continue;      // trailing separator element
            if (q == resolved.end() || *q != *r) return false;
        }
        return q != resolved.end();
    }

    bool write_file(const fs::path& p, const std::string& bytes, std::string& err) const {
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) { err = "cannot open " + p.string() + " for writing"; return false; }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) { err = "short write to " + p.string(); return false; }
        return true;
    }

    bool read_file(const fs::path& p, std::string& out, std::string& err) const {
        std::ifstream in(p, std::ios::binary);
        if (!in.is_open()) { err = "cannot open " + p.string(); return false; }
        out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad()) { err = "read error on " + p.string(); return false; }
        return true;
    }

private:
    fs::path root_;
};

// =============================================================================
// FILE RECORD
// =============================================================================
struct FileRecord {
    std::string file_id;
    std::string file_name;
    uint64_t    size = 0;
    std::string sha256;
    std::string path;            // absolute, inside the storage root
    double      registered_at = 0;

    FileRecord() = default;
    FileRecord(std::string id, std::string name, uint64_t sz, std::string hash, std::string abs_path)
        : file_id(std::move(id)), file_name(std::move(name)), size(sz),
          sha256(std::move(hash)), path(std::move(abs_path)) {}
};

// =============================================================================
// FILE REGISTRY
// =============================================================================
class FileRegistry {
public:
    FileRegistry(size_t capacity, double ttl_sec, const HubClock* clock, AsyncLogger* logger)
        : capacity_(capacity), ttl_(ttl_sec), clock_(clock), logger_(logger) {}

    FileRegistry(const FileRegistry&) = delete;
    FileRegistry& operator=(const FileRegistry&) = delete;

    // Stamps registered_at, inserts or overwrites, then evicts. Files of
    // dropped entries are deleted from disk unless a live entry shares them.
    void register_file(FileRecord rec) {
        std::vector<std::string> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            rec.registered_at = clock_->now();
            std::string id = rec.file_id;
            auto old = files_.find(id);
            if (old != files_.end() && old->second.rec.path != rec.path) dropped.push_back(old->second.rec.path);
            files_[id] = Entry{ std::move(rec), next_seq_++ };
            evict_locked(dropped);
            dropped.erase(std::remove_if(dropped.begin(), dropped.end(),
                                         [this](const std::string& p) { return path_in_use_locked(p); }),
                          dropped.end());
        }
        for (const auto& p : dropped) remove_from_disk(p);
    }

    std::optional<FileRecord> get(const std::string& file_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(file_id);
        if (it == files_.end()) return std::nullopt;
        return it->second.rec;
    }

    // true only for the caller that actually removed the entry
    bool erase(const std::string& file_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_.erase(file_id) > 0;
    }

    std::vector<FileRecord> list() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<FileRecord> out;
        out.reserve(files_.size());
        for (const auto& kv : files_) out.push_back(kv.second.rec);
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    void evict_locked(std::vector<std::string>& dropped) {
        double now = clock_->now();
        size_t expired = 0;
        for (auto it = files_.begin(); it != files_.end(); ) {
            if (now - it->second.rec.registered_at > ttl_) {
                dropped.push_back(it->second.rec.path);
                it = files_.erase(it);
                expired++;
            } else {
                ++it;
            }
        }
        if (expired > 0)
            hub_log(logger_, AsyncLogger::DEBUG, "File registry: purged " + std::to_string(expired) + " expired");

        if (files_.size() <= capacity_) return;

        // Oldest first; registration order breaks ties on equal timestamps
        std::vector<std::tuple<double, uint64_t, std::string>> by_age;
        by_age.reserve(files_.size());
        for (const auto& kv : files_) by_age.emplace_back(kv.second.rec.registered_at, kv.second.seq, kv.first);
        std::sort(by_age.begin(), by_age.end());

        size_t excess = files_.size() - capacity_;
        for (size_t i = 0; i < excess; i++) {
            auto it = files_.find(std::get<2>(by_age[i]));
            dropped.push_back(it->second.rec.path);
            files_.erase(it);
        }
        hub_log(logger_, AsyncLogger::DEBUG, "File registry: evicted " + std::to_string(excess) + " oldest");
    }

    bool path_in_use_locked(const std::string& path) const {
        for (const auto& kv : files_) {
            if (kv.second.rec.path == path) return true;
        }
        return false;
    }

    void remove_from_disk(const std::string& path) {
        if (path.empty()) return;
        std::error_code ec;
        if (fs::remove(path, ec))
            hub_log(logger_, AsyncLogger::DEBUG, "File registry: deleted " + path);
        else if (ec)
            hub_log(logger_, AsyncLogger::WARN, "File registry: cannot delete " + path + ": " + ec.message());
    }

    struct Entry {
        FileRecord rec;
        uint64_t   seq = 0;
    };

    size_t capacity_;
    double ttl_;
    const HubClock* clock_;
    AsyncLogger* logger_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> files_;
    uint64_t next_seq_ = 0;
};

#endif
