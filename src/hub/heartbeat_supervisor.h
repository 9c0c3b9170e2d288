#ifndef HEARTBEAT_SUPERVISOR_H
#define HEARTBEAT_SUPERVISOR_H

// =============================================================================
// FileBridge Hub: Per-Connection Heartbeat Supervisor
// =============================================================================
// One thread per authenticated connection. Every interval it compares the
// connection's last liveness time against 3x the interval and force-closes
// a silent peer. It ends on its own once the connection is no longer the
// registered one for its server_id.
// =============================================================================

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "hub_common.h"
#include "connection_registry.h"

class HeartbeatSupervisor {
public:
    static constexpr double TIMEOUT_FACTOR = 3.0;

    HeartbeatSupervisor(ConnectionRegistry& registry, std::shared_ptr<Connection> conn,
                        double interval_sec, const HubClock* clock, AsyncLogger* logger)
        : registry_(registry), conn_(std::move(conn)), interval_(interval_sec),
          clock_(clock), logger_(logger) {}

    ~HeartbeatSupervisor() { stop(); }

    HeartbeatSupervisor(const HeartbeatSupervisor&) = delete;
    HeartbeatSupervisor& operator=(const HeartbeatSupervisor&) = delete;

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (thread_.joinable() || stopping_) return;
        thread_ = std::thread(&HeartbeatSupervisor::run, this);
    }

    // Wakes the sleeping thread and joins it
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    // -------------------------------------------------------------------------
    // One liveness check. Returns false when supervision is over, either
    // because the peer was reaped or because it was superseded/removed.
    // -------------------------------------------------------------------------
    bool check_once() {
        const std::string& id = conn_->server_id();
        if (registry_.get(id).get() != conn_.get()) return false;

        double idle = clock_->now() - conn_->last_seen();
        if (idle <= interval_ * TIMEOUT_FACTOR) return true;

        hub_log(logger_, AsyncLogger::WARN, "Heartbeat timeout, disconnecting: " + id
            + " (silent " + std::to_string(static_cast<int64_t>(idle)) + "s)");
        conn_->close();
        registry_.remove_if_same(id, conn_.get());
        return false;
    }

private:
    void run() {
        auto period = std::chrono::duration<double>(interval_);
        while (true) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (cv_.wait_for(lock, period, [this] { return stopping_; })) return;
            }
            if (!check_once()) return;
        }
    }

    ConnectionRegistry&         registry_;
    std::shared_ptr<Connection> conn_;
    double                      interval_;
    const HubClock*             clock_;
    AsyncLogger*                logger_;

    std::mutex              mutex_;
    std::condition_variable cv_;
    bool                    stopping_ = false;
    std::thread             thread_;
};

#endif
