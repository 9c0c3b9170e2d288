#ifndef CONNECTION_REGISTRY_H
#define CONNECTION_REGISTRY_H

// =============================================================================
// FileBridge Hub: Connections and Connection Registry
// =============================================================================
// Provides:
//   - PeerChannel: text-frame transport seam (WebSocket in production,
//     in-memory channel in tests)
//   - Connection: one authenticated game server, serialized sends
//   - ConnectionRegistry: server_id -> Connection, broadcast fan-out,
//     admission reservations (AdmissionSlot)
// =============================================================================

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "hub_common.h"
#include "bridge_packet.h"

// =============================================================================
// PEER CHANNEL
// =============================================================================
// read_frame blocks until a full frame arrives; false on close or error.
// close() must be idempotent and callable from any thread while another
// thread is blocked in read_frame or write_frame.
// =============================================================================
class PeerChannel {
public:
    virtual ~PeerChannel() = default;
    virtual bool read_frame(std::string& out) = 0;
    virtual bool write_frame(const std::string& text) = 0;
    virtual void close() = 0;
    virtual bool is_closed() const = 0;
};

// =============================================================================
// CONNECTION
// =============================================================================
class Connection {
public:
    Connection(std::string server_id, std::shared_ptr<PeerChannel> channel, double now)
        : server_id_(std::move(server_id)),
          channel_(std::move(channel)),
          connected_at_(now),
          last_seen_(now) {}

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const std::string& server_id() const { return server_id_; }
    PeerChannel& channel() { return *channel_; }

    double connected_at() const { return connected_at_; }
    double last_seen() const { return last_seen_.load(); }
    void   touch(double now) { last_seen_.store(now); }
    double alive_seconds(double now) const { return now - connected_at_; }

    bool authenticated() const { return authenticated_.load(); }
    void set_authenticated(bool v) { authenticated_.store(v); }

    // All outbound frames for this peer pass through send_mutex_
    bool send_packet(const BridgePacket& pkt) {
        std::string frame = pkt.encode();
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (channel_->is_closed()) return false;
        return channel_->write_frame(frame);
    }

    void close() { channel_->close(); }

private:
    std::string                  server_id_;
    std::shared_ptr<PeerChannel> channel_;
    double                       connected_at_;
    std::atomic<double>          last_seen_;
    std::atomic<bool>            authenticated_{ false };
    std::mutex                   send_mutex_;
};

// =============================================================================
// CONNECTION REGISTRY
// =============================================================================
class ConnectionRegistry {
public:
    ConnectionRegistry(const HubClock* clock, AsyncLogger* logger)
        : clock_(clock), logger_(logger) {}

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Last writer wins on server_id collision. The superseded connection is
    // dropped from the map but its socket is left to its own session.
    std::shared_ptr<Connection> add(const std::string& server_id,
                                    std::shared_ptr<PeerChannel> channel) {
        return insert(server_id, std::move(channel), false);
    }

    // -------------------------------------------------------------------------
    // ADMISSION
    // -------------------------------------------------------------------------
    // A slot is reserved before the handshake and either committed into a
    // registered connection or released. Registered plus reserved never
    // exceeds the limit passed to try_reserve.
    // -------------------------------------------------------------------------
    bool try_reserve(size_t limit) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (conns_.size() + reserved_ >= limit) return false;
        reserved_++;
        return true;
    }

    void release_reservation() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reserved_ > 0) reserved_--;
    }

    // Registers and consumes one reservation under the same lock
    std::shared_ptr<Connection> commit_reservation(const std::string& server_id,
                                                   std::shared_ptr<PeerChannel> channel) {
        return insert(server_id, std::move(channel), true);
    }

    size_t reserved() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reserved_;
    }

    void remove(const std::string& server_id) {
        bool erased = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            erased = conns_.erase(server_id) > 0;
        }
        if (erased) hub_log(logger_, AsyncLogger::INFO, "Server disconnected: " + server_id);
    }

    // Removes server_id only while it still maps to `expected`
    bool remove_if_same(const std::string& server_id, const Connection* expected) {
        bool erased = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = conns_.find(server_id);
            if (it != conns_.end() && it->second.get() == expected) {
                conns_.erase(it);
                erased = true;
            }
        }
        if (erased) hub_log(logger_, AsyncLogger::INFO, "Server disconnected: " + server_id);
        return erased;
    }

    std::shared_ptr<Connection> get(const std::string& server_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = conns_.find(server_id);
        return it != conns_.end() ? it->second : nullptr;
    }

    bool contains(const std::string& server_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return conns_.count(server_id) > 0;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return conns_.size();
    }

    std::vector<std::shared_ptr<Connection>> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::shared_ptr<Connection>> out;
        out.reserve(conns_.size());
        for (const auto& kv : conns_) out.push_back(kv.second);
        return out;
    }

    // -------------------------------------------------------------------------
    // BROADCAST
    // -------------------------------------------------------------------------
    // Sends to every authenticated connection except `exclude`, outside the
    // registry lock. A failed send removes only that recipient.
    // Returns the number of peers the packet reached.
    // -------------------------------------------------------------------------
    size_t broadcast(const BridgePacket& pkt, const std::string& exclude = "") {
        size_t delivered = 0;
        for (const auto& conn : snapshot()) {
            if (conn->server_id() == exclude || !conn->authenticated()) continue;
            if (conn->send_packet(pkt)) {
                delivered++;
                continue;
            }
            hub_log(logger_, AsyncLogger::ERROR_LOG, "Broadcast to " + conn->server_id() + " failed");
            remove_if_same(conn->server_id(), conn.get());
        }
        return delivered;
    }

private:
    std::shared_ptr<Connection> insert(const std::string& server_id,
                                       std::shared_ptr<PeerChannel> channel, bool reserved) {
        auto conn = std::make_shared<Connection>(server_id, std::move(channel), clock_->now());
        bool replaced = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            replaced = conns_.count(server_id) > 0;
            conns_[server_id] = conn;
            if (reserved && reserved_ > 0) reserved_--;
        }
        if (replaced) hub_log(logger_, AsyncLogger::WARN, "Replacing existing connection: " + server_id);
        hub_log(logger_, AsyncLogger::INFO, "Server connected: " + server_id);
        return conn;
    }

    const HubClock* clock_;
    AsyncLogger*    logger_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Connection>> conns_;
    size_t reserved_ = 0;
};

// Holds one admission slot for the duration of a handshake
class AdmissionSlot {
public:
    AdmissionSlot(ConnectionRegistry& registry, size_t limit)
        : registry_(registry), held_(registry.try_reserve(limit)) {}

    ~AdmissionSlot() {
        if (held_) registry_.release_reservation();
    }

    AdmissionSlot(const AdmissionSlot&) = delete;
    AdmissionSlot& operator=(const AdmissionSlot&) = delete;

    bool held() const { return held_; }

    std::shared_ptr<Connection> commit(const std::string& server_id, std::shared_ptr<PeerChannel> channel) {
        held_ = false;
        return registry_.commit_reservation(server_id, std::move(channel));
    }

private:
    ConnectionRegistry& registry_;
    bool                held_;
};

#endif
