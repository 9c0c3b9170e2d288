#ifndef HUB_COMMON_H
#define HUB_COMMON_H

#ifndef NOMINMAX
#define NOMINMAX
#endif

// =============================================================================
// FileBridge Hub: Common Runtime Pieces
// =============================================================================
// Provides:
//   - Version / default constants
//   - AppConfig: key=value configuration file with typed getters
//   - CliArgs: command line parsing (-c, -s, -h, -v)
//   - HubClock: wall clock seam (tests substitute a manual clock)
//   - AsyncLogger: queued logger with size-based rotation
//   - DynamicThreadPool: grows under backlog, reaps idle workers
// =============================================================================

#include <cstdint>
#include <cstdio>
#include <cctype>
#include <algorithm>
#include <string>
#include <fstream>
#include <map>
#include <vector>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <functional>
#include <stdexcept>

// =============================================================================
// CONSTANTS
// =============================================================================
constexpr const char* HUB_VERSION         = "1.2.0";
constexpr int         DEFAULT_PORT        = 8080;
constexpr const char* DEFAULT_CONFIG_PATH = "filebridge.conf";
constexpr const char* HUB_SERVER_ID       = "bridge";   // server_id stamped on hub packets

// =============================================================================
// CONFIGURATION MANAGEMENT
// =============================================================================
struct AppConfig {
    std::map<std::string, std::string> data;

    bool has(const std::string& key) const { return data.count(key) > 0; }

    std::string get(const std::string& key, const std::string& def) const {
        auto it = data.find(key);
        return it != data.end() ? it->second : def;
    }

    int get_int(const std::string& key, int def) const {
        auto it = data.find(key);
        if (it == data.end()) return def;
        try { return std::stoi(it->second); }
        catch (const std::logic_error&) { return def; }
    }

    size_t get_size(const std::string& key, size_t def) const {
        auto it = data.find(key);
        if (it == data.end()) return def;
        try { return static_cast<size_t>(std::stoull(it->second)); }
        catch (const std::logic_error&) { return def; }
    }

    double get_double(const std::string& key, double def) const {
        auto it = data.find(key);
        if (it == data.end()) return def;
        try { return std::stod(it->second); }
        catch (const std::logic_error&) { return def; }
    }

    bool get_bool(const std::string& key, bool def) const {
        auto it = data.find(key);
        if (it == data.end()) return def;
        std::string v = it->second;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "true" || v == "1" || v == "yes") return true;
        if (v == "false" || v == "0" || v == "no") return false;
        return def;
    }

    // Comma separated list, entries trimmed, empty entries dropped
    std::vector<std::string> get_list(const std::string& key,
                                      const std::vector<std::string>& def) const {
        auto it = data.find(key);
        if (it == data.end()) return def;
        std::vector<std::string> out;
        std::istringstream iss(it->second);
        std::string tok;
        while (std::getline(iss, tok, ',')) {
            tok.erase(0, tok.find_first_not_of(" \t"));
            tok.erase(tok.find_last_not_of(" \t") + 1);
            if (!tok.empty()) out.push_back(tok);
        }
        return out;
    }

    // All keys sharing a prefix, with the prefix stripped ("server_name.x" -> "x")
    std::map<std::string, std::string> get_prefixed(const std::string& prefix) const {
        std::map<std::string, std::string> out;
        for (auto it = data.lower_bound(prefix); it != data.end(); ++it) {
            if (it->first.compare(0, prefix.size(), prefix) != 0) break;
            if (it->first.size() > prefix.size())
                out[it->first.substr(prefix.size())] = it->second;
        }
        return out;
    }

    void set(const std::string& key, const std::string& val) { data[key] = val; }
};

inline AppConfig parse_config_text(std::istream& in) {
    AppConfig config;
    std::string line;
    while (std::getline(in, line)) {
        size_t comment = line.find('#');
        if (comment != std::string::npos) line = line.substr(0, comment);
        line.erase(0, line.find_first_not_of(" \t\r\n"));
        line.erase(line.find_last_not_of(" \t\r\n") + 1);
        if (line.empty()) continue;
        size_t sep = line.find('=');
        if (sep == std::string::npos) continue;
        std::string key = line.substr(0, sep);
        std::string val = line.substr(sep + 1);
        key.erase(key.find_last_not_of(" \t") + 1);
        val.erase(0, val.find_first_not_of(" \t"));
        if (!key.empty()) config.data[key] = val;
    }
    return config;
}

// Missing file yields an empty config (all defaults apply)
inline AppConfig load_config(const std::string& filename, bool* found = nullptr) {
    std::ifstream file(filename);
    if (found) *found = file.is_open();
    if (!file.is_open()) return AppConfig{};
    return parse_config_text(file);
}

// =============================================================================
// CLI ARGUMENT PARSING
// =============================================================================
struct CliArgs {
    std::string config_path;
    std::map<std::string, std::string> overrides;
    std::vector<std::string> unknown;
    bool show_help = false;
    bool show_version = false;

    void apply_overrides(AppConfig& conf) const {
        for (const auto& [k, v] : overrides) conf.set(k, v);
    }
};

inline void print_hub_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [OPTIONS]\n"
        << "\nOptions:\n"
        << "  -c, --config <path>    Path to filebridge.conf (default: ./filebridge.conf)\n"
        << "  -s, --set <key=value>  Override a config value (repeatable)\n"
        << "  -h, --help             Show this help message\n"
        << "  -v, --version          Show version\n"
        << "\nListener:\n"
        << "  bind_address / port / ws_path / file_path\n"
        << "  tls_enabled / server_crt / server_key / ca_path / crl_path\n"
        << "\nProtocol:\n"
        << "  token / hmac_window_s / dedup_window_s / heartbeat_interval_s\n"
        << "  handshake_timeout_s / max_connections / ws_max_size\n"
        << "\nFiles:\n"
        << "  upload_dir / upload_max_mb / allowed_extensions (comma list)\n"
        << "  transfer_timeout_s / registry_capacity / registry_ttl_s\n"
        << "  server_name.<id> = <display name>\n"
        << "\nRuntime:\n"
        << "  pool_min / pool_max / pool_idle_timeout_s / io_threads / diagnostics_interval_s\n"
        << "  log_file / log_max_bytes / log_max_files / log_debug\n";
}

inline CliArgs parse_hub_cli(int argc, char* argv[]) {
    CliArgs args;
    args.config_path = DEFAULT_CONFIG_PATH;
    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        if (arg == "-h" || arg == "--help") { args.show_help = true; }
        else if (arg == "-v" || arg == "--version") { args.show_version = true; }
        else if ((arg == "-c" || arg == "--config") && i + 1 < argc) { args.config_path = argv[++i]; }
        else if ((arg == "-s" || arg == "--set") && i + 1 < argc) {
            std::string kv = argv[++i];
            size_t eq = kv.find('=');
            if (eq != std::string::npos) args.overrides[kv.substr(0, eq)] = kv.substr(eq + 1);
            else args.unknown.push_back(kv);
        }
        else { args.unknown.push_back(arg); }
    }
    return args;
}

// =============================================================================
// CLOCK
// =============================================================================
// Unix time in fractional seconds. Components never read the system clock
// directly so liveness and expiry logic can run against a manual clock.
// =============================================================================
class HubClock {
public:
    virtual ~HubClock() = default;
    virtual double now() const {
        return std::chrono::duration<double>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

// =============================================================================
// ASYNC LOGGER WITH LOG ROTATION
// =============================================================================
class AsyncLogger {
public:
    enum Level { INFO, WARN, ERROR_LOG, DEBUG };

    struct Options {
        std::string file;                        // empty = console only
        size_t max_file_size = 10 * 1024 * 1024;
        int    max_files     = 5;
        bool   echo_console  = true;
        bool   debug         = false;            // DEBUG lines dropped unless set
    };

    explicit AsyncLogger(const Options& opts)
        : opts_(opts)
    {
        if (!opts_.file.empty()) {
            log_file_.open(opts_.file, std::ios::app);
            if (log_file_.is_open()) {
                log_file_.seekp(0, std::ios::end);
                current_file_size_ = static_cast<size_t>(log_file_.tellp());
            } else {
                std::cerr << "[WARN] cannot open log file " << opts_.file << ", console only\n";
            }
        }
        worker_ = std::thread(&AsyncLogger::worker_loop, this);
    }

    ~AsyncLogger() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            running_ = false;
        }
        cv_.notify_one();
        if (worker_.joinable()) worker_.join();
    }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void log(Level level, const std::string& msg) {
        if (level == DEBUG && !opts_.debug) return;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!running_) return;
            queue_.push({ level, msg, std::chrono::system_clock::now() });
        }
        cv_.notify_one();
    }

private:
    struct LogEntry {
        Level level;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
    };

    static const char* level_str(Level l) {
        switch (l) {
            case WARN:      return "[WARN] ";
            case ERROR_LOG: return "[ERROR] ";
            case DEBUG:     return "[DEBUG] ";
            default:        return "[INFO] ";
        }
    }

    std::string format_entry(const LogEntry& entry) const {
        std::time_t t = std::chrono::system_clock::to_time_t(entry.timestamp);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
        std::ostringstream ss;
        ss << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "] "
           << level_str(entry.level) << entry.message;
        return ss.str();
    }

    void rotate_logs() {
        log_file_.close();
        const std::string& base = opts_.file;
        std::remove((base + "." + std::to_string(opts_.max_files)).c_str());
        for (int i = opts_.max_files - 1; i >= 1; i--) {
            std::rename((base + "." + std::to_string(i)).c_str(),
                        (base + "." + std::to_string(i + 1)).c_str());
        }
        std::rename(base.c_str(), (base + ".1").c_str());
        log_file_.open(base, std::ios::app);
        current_file_size_ = 0;
    }

    void worker_loop() {
        while (true) {
            std::queue<LogEntry> batch;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
                if (!running_ && queue_.empty()) return;
                std::swap(batch, queue_);
            }
            while (!batch.empty()) {
                std::string formatted = format_entry(batch.front());
                batch.pop();
                if (opts_.echo_console) std::cout << formatted << "\n";
                if (!log_file_.is_open()) continue;
                log_file_ << formatted << "\n";
                log_file_.flush();
                current_file_size_ += formatted.size() + 1;
                if (opts_.max_files > 0 && current_file_size_ >= opts_.max_file_size) rotate_logs();
            }
        }
    }

    Options opts_;
    std::queue<LogEntry> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool running_ = true;
    std::thread worker_;
    std::ofstream log_file_;
    size_t current_file_size_ = 0;
};

// Null-tolerant logging helper shared by the hub components
inline void hub_log(AsyncLogger* logger, AsyncLogger::Level level, const std::string& msg) {
    if (logger) logger->log(level, msg);
}

// =============================================================================
// DYNAMIC THREAD POOL
// =============================================================================
// Long-lived tasks (one WebSocket session each) occupy a worker for their
// whole lifetime, so max_threads must cover max_connections plus HTTP load.
// =============================================================================
class DynamicThreadPool {
public:
    struct Config {
        size_t min_threads = 4;
        size_t max_threads = 64;
        int    idle_timeout_seconds = 30;
    };

    explicit DynamicThreadPool(const Config& cfg) : config_(cfg) {
        if (config_.min_threads == 0) config_.min_threads = 1;
        if (config_.max_threads < config_.min_threads) config_.max_threads = config_.min_threads;
        for (size_t i = 0; i < config_.min_threads; i++) spawn_worker();
        monitor_ = std::thread(&DynamicThreadPool::monitor_func, this);
    }

    ~DynamicThreadPool() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        monitor_cv_.notify_all();
        if (monitor_.joinable()) monitor_.join();
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto& w : workers_) if (w.joinable()) w.join();
    }

    DynamicThreadPool(const DynamicThreadPool&) = delete;
    DynamicThreadPool& operator=(const DynamicThreadPool&) = delete;

    // Returns false once the pool is stopping; the task is not queued then.
    template <class F>
    bool enqueue(F&& f) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) return false;
            tasks_.emplace(std::forward<F>(f));
            pending_tasks_++;
        }
        cv_.notify_one();
        return true;
    }

    size_t active_count() const  { return active_workers_.load(); }
    size_t total_count() const   { return total_workers_.load(); }
    size_t pending_count() const { return pending_tasks_.load(); }

private:
    void worker_func() {
        total_workers_++;
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                bool got_work = cv_.wait_for(lock, std::chrono::seconds(config_.idle_timeout_seconds),
                                             [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) { total_workers_--; return; }
                if (!got_work) {
                    if (total_workers_.load() > config_.min_threads) { total_workers_--; return; }
                    continue;
                }
                if (tasks_.empty()) continue;
                task = std::move(tasks_.front());
                tasks_.pop();
                pending_tasks_--;
            }
            active_workers_++;
            task();
            active_workers_--;
        }
    }

    void spawn_worker() {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.emplace_back(&DynamicThreadPool::worker_func, this);
    }

    void monitor_func() {
        while (true) {
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                if (monitor_cv_.wait_for(lock, std::chrono::milliseconds(200), [this] { return stop_; })) return;
            }
            size_t pending = pending_tasks_.load();
            size_t total   = total_workers_.load();
            size_t active  = active_workers_.load();
            if (pending > 0 && active >= total && total < config_.max_threads) {
                size_t to_spawn = std::min({ pending, config_.max_threads - total, static_cast<size_t>(4) });
                for (size_t i = 0; i < to_spawn; i++) spawn_worker();
            }
        }
    }

    Config config_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable monitor_cv_;
    bool stop_ = false;
    std::atomic<size_t> active_workers_{ 0 }, total_workers_{ 0 }, pending_tasks_{ 0 };
    std::vector<std::thread> workers_;
    std::mutex workers_mutex_;
    std::thread monitor_;
};

#endif
