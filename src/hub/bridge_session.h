#ifndef BRIDGE_SESSION_H
#define BRIDGE_SESSION_H

// =============================================================================
// FileBridge Hub: Session Engine
// =============================================================================
// Provides:
//   - Collaborator events (FileArrival, TransferResult, UploadStart) and the
//     SessionHandlers dispatch table
//   - ReadDeadline: watchdog that closes a channel when a read overstays
//   - SessionEngine: admission, handshake, authenticated message loop
//
// Per connection:  CONNECTING --greeting ok--> AUTHENTICATED --read fails--> CLOSED
//                       \--bad greeting / deadline------------------------->/
// =============================================================================

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "hub_common.h"
#include "crypto_utils.h"
#include "bridge_packet.h"
#include "hub_config.h"
#include "dedup_window.h"
#include "connection_registry.h"
#include "chunk_assembler.h"
#include "heartbeat_supervisor.h"

// =============================================================================
// COLLABORATOR EVENTS
// =============================================================================
struct FileArrival {
    std::string server_id;
    std::string channel;
    std::string file_id;
    std::string file_name;
    int64_t     size = 0;
    std::string sha256;
    std::optional<std::string> url;     // pull location announced by the peer
    std::optional<std::string> data;    // inline base64 body
};

struct TransferResult {
    std::string server_id;
    bool        ok = false;
    std::string file_name;
    std::string size_mb;
    std::string speed;
    std::string err_msg;
    std::optional<bool>        extracted;
    std::optional<std::string> extract_time;
    std::string channel;
};

struct UploadStart {
    std::string server_id;
    std::string channel;
    std::string file_name;
};

struct SessionHandlers {
    std::vector<std::function<void(const FileArrival&)>>    on_file;
    std::vector<std::function<void(const TransferResult&)>> on_result;
    std::vector<std::function<void(const UploadStart&)>>    on_upload_start;
};

// =============================================================================
// READ DEADLINE
// =============================================================================
// Closes the channel if cancel() has not been called within `seconds`, which
// makes a blocked read_frame return false.
// =============================================================================
class ReadDeadline {
public:
    ReadDeadline(std::shared_ptr<PeerChannel> channel, double seconds)
        : channel_(std::move(channel))
    {
        thread_ = std::thread([this, seconds] {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, std::chrono::duration<double>(seconds),
                             [this] { return cancelled_; })) return;
            expired_ = true;
            lock.unlock();
            channel_->close();
        });
    }

    ~ReadDeadline() { cancel(); }

    ReadDeadline(const ReadDeadline&) = delete;
    ReadDeadline& operator=(const ReadDeadline&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    bool expired() const { return expired_.load(); }

private:
    std::shared_ptr<PeerChannel> channel_;
    std::mutex                   mutex_;
    std::condition_variable      cv_;
    bool                         cancelled_ = false;
    std::atomic<bool>            expired_{ false };
    std::thread                  thread_;
};

// -----------------------------------------------------------------------------
// Decodes one well-formed UTF-8 sequence at raw[i]. Returns its byte length,
// or 0 for a malformed, overlong or surrogate sequence.
// -----------------------------------------------------------------------------
inline size_t utf8_sequence(const std::string& raw, size_t i, uint32_t& cp) {
    unsigned char b0 = static_cast<unsigned char>(raw[i]);
    size_t len;
    uint32_t min;
    if (b0 >= 0xC2 && b0 <= 0xDF)      { len = 2; cp = b0 & 0x1F; min = 0x80; }
    else if (b0 >= 0xE0 && b0 <= 0xEF) { len = 3; cp = b0 & 0x0F; min = 0x800; }
    else if (b0 >= 0xF0 && b0 <= 0xF4) { len = 4; cp = b0 & 0x07; min = 0x10000; }
    else return 0;
    if (i + len > raw.size()) return 0;
    for (size_t k = 1; k < len; k++) {
        unsigned char bk = static_cast<unsigned char>(raw[i + k]);
        if ((bk & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (bk & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return len;
}

// Letters and digits outside ASCII: everything except the Latin-1 symbol
// range, the punctuation/symbol blocks, CJK punctuation, variation
// selectors, fullwidth ASCII punctuation and the specials block
inline bool is_id_codepoint(uint32_t cp) {
    if (cp < 0xC0) return false;
    if (cp == 0xD7 || cp == 0xF7) return false;
    if (cp >= 0x2000 && cp <= 0x2BFF) return false;
    if (cp >= 0x3000 && cp <= 0x303F) return false;
    if (cp >= 0xE000 && cp <= 0xF8FF) return false;
    if (cp >= 0xFE00 && cp <= 0xFE6F) return false;
    if (cp >= 0xFF00 && cp <= 0xFF0F) return false;
    if (cp >= 0xFFF0) return cp >= 0x10000 && cp < 0xF0000;
    return true;
}

// Up to 64 characters of [A-Za-z0-9_.-] or non-ASCII letters, kept as whole
// UTF-8 sequences. Any other character (or stray byte) becomes '_'; an empty
// result becomes "unknown".
inline std::string sanitize_server_id(const std::string& raw) {
    std::string id;
    size_t chars = 0;
    for (size_t i = 0; i < raw.size() && chars < 64; chars++) {
        unsigned char uc = static_cast<unsigned char>(raw[i]);
        if (uc < 0x80) {
            id += (std::isalnum(uc) || uc == '_' || uc == '.' || uc == '-') ? raw[i] : '_';
            i++;
            continue;
        }
        uint32_t cp = 0;
        size_t len = utf8_sequence(raw, i, cp);
        if (len == 0) {
            id += '_';
            i++;
            continue;
        }
        if (is_id_codepoint(cp)) id.append(raw, i, len);
        else id += '_';
        i += len;
    }
    return id.empty() ? "unknown" : id;
}

// =============================================================================
// SESSION ENGINE
// =============================================================================
class SessionEngine {
public:
    SessionEngine(const HubConfig& cfg, ConnectionRegistry& conns, DedupWindow& dedup,
                  ChunkAssembler& chunks, SessionHandlers handlers,
                  const HubClock* clock, AsyncLogger* logger)
        : cfg_(cfg), conns_(conns), dedup_(dedup), chunks_(chunks),
          handlers_(std::move(handlers)), clock_(clock), logger_(logger) {}

    SessionEngine(const SessionEngine&) = delete;
    SessionEngine& operator=(const SessionEngine&) = delete;

    // -------------------------------------------------------------------------
    // Runs one accepted channel to completion on the calling thread.
    // -------------------------------------------------------------------------
    void serve(std::shared_ptr<PeerChannel> channel) {
        AdmissionSlot slot(conns_, cfg_.max_connections);
        if (!slot.held()) {
            log(AsyncLogger::WARN, "Connection limit reached (" + std::to_string(cfg_.max_connections)
                + "), rejecting new peer");
            channel->close();
            return;
        }

        std::string server_id;
        try {
            server_id = handshake(channel);
            if (server_id.empty()) {
                channel->close();
                return;
            }

            auto conn = slot.commit(server_id, channel);
            conn->set_authenticated(true);

            HeartbeatSupervisor heartbeat(conns_, conn, cfg_.heartbeat_interval_s, clock_, logger_);
            heartbeat.start();
            try {
                message_loop(*conn);
            } catch (const std::exception& e) {
                log(AsyncLogger::ERROR_LOG, "Session error (" + server_id + "): " + e.what());
            }
            heartbeat.stop();
            conns_.remove_if_same(server_id, conn.get());
        } catch (const std::exception& e) {
            log(AsyncLogger::ERROR_LOG, "Session setup error (" + server_id + "): " + e.what());
        }
        channel->close();
    }

    // -------------------------------------------------------------------------
    // HANDSHAKE: exactly one greeting frame before the deadline.
    // Returns the sanitized server_id, or "" after at most one error reply.
    // -------------------------------------------------------------------------
    std::string handshake(const std::shared_ptr<PeerChannel>& channel) {
        std::string raw;
        bool got = false;
        {
            ReadDeadline deadline(channel, cfg_.handshake_timeout_s);
            got = channel->read_frame(raw);
            deadline.cancel();
            if (deadline.expired()) {
                log(AsyncLogger::WARN, "Handshake timeout");
                return "";
            }
        }
        if (!got) {
            log(AsyncLogger::INFO, "Peer closed before greeting");
            return "";
        }

        const std::string& token = cfg_.token;
        BridgePacket pkt;
        std::string err;
        if (!BridgePacket::decode(raw, pkt, err, clock_->now())) {
            log(AsyncLogger::WARN, "Handshake decode failed: " + err);
            send_raw(*channel, make_error(ErrCode::INVALID_PAYLOAD, "malformed greeting", token));
            return "";
        }
        if (pkt.type != MsgType::MSG_HELLO) {
            log(AsyncLogger::WARN, "Handshake rejected: expected greeting, got " + pkt.wire_type());
            send_raw(*channel, make_error(ErrCode::AUTH_FAILED, "expected greeting", token));
            return "";
        }
        if (!constant_time_equals(payload_str(pkt.payload, "token"), token)) {
            log(AsyncLogger::WARN, "Handshake rejected: bad token from " + pkt.server_id);
            send_raw(*channel, make_error(ErrCode::AUTH_FAILED, "bad token", token));
            return "";
        }
        if (!pkt.verify_sig(token)) {
            log(AsyncLogger::WARN, "Handshake rejected: bad signature from " + pkt.server_id);
            send_raw(*channel, make_error(ErrCode::INVALID_SIG, "signature mismatch", token));
            return "";
        }
        if (!pkt.verify_ts(cfg_.hmac_window_s, clock_->now())) {
            log(AsyncLogger::WARN, "Handshake rejected: stale timestamp from " + pkt.server_id);
            send_raw(*channel, make_error(ErrCode::EXPIRED, "timestamp expired", token));
            return "";
        }

        std::string server_id = sanitize_server_id(pkt.server_id);
        if (!send_raw(*channel, make_hello_ack(server_id, token))) return "";
        log(AsyncLogger::INFO, "Authenticated: " + server_id);
        return server_id;
    }

private:
    // -------------------------------------------------------------------------
    // MESSAGE LOOP: read, decode, verify, dedup, dispatch. Only a failed read
    // ends it; every per-packet failure is answered or logged and skipped.
    // -------------------------------------------------------------------------
    void message_loop(Connection& conn) {
        const std::string& id = conn.server_id();
        std::string raw;
        while (conn.channel().read_frame(raw)) {
            BridgePacket pkt;
            std::string err;
            if (!BridgePacket::decode(raw, pkt, err, clock_->now())) {
                log(AsyncLogger::WARN, "Packet decode failed (" + id + "): " + err);
                continue;
            }
            if (!pkt.verify_sig(cfg_.token)) {
                reply(conn, make_error(ErrCode::INVALID_SIG, "signature mismatch", cfg_.token, pkt.msg_id));
                continue;
            }
            if (pkt.type != MsgType::MSG_PING && pkt.type != MsgType::MSG_ACK && dedup_.is_dup(pkt.msg_id)) {
                log(AsyncLogger::DEBUG, "Duplicate skipped: " + pkt.msg_id);
                reply(conn, make_ack(pkt.msg_id, cfg_.token));
                continue;
            }
            conn.touch(clock_->now());
            dispatch(conn, pkt);
        }
        log(AsyncLogger::INFO, "Connection closed: " + id);
    }

    void dispatch(Connection& conn, const BridgePacket& pkt) {
        switch (pkt.type) {
            case MsgType::MSG_PING:
                reply(conn, make_pong(cfg_.token));
                break;
            case MsgType::MSG_FILE_OUT:
                handle_file_out(conn, pkt);
                break;
            case MsgType::MSG_FILE_CHUNK:
                handle_file_chunk(conn, pkt);
                break;
            case MsgType::MSG_RESULT:
                handle_result(conn, pkt);
                break;
            case MsgType::MSG_ACK:
                log(AsyncLogger::DEBUG, "ACK from " + conn.server_id() + ": "
                    + payload_str(pkt.payload, "ref_msg_id"));
                break;
            case MsgType::MSG_HELLO:
            case MsgType::MSG_HELLO_ACK:
            case MsgType::MSG_PONG:
            case MsgType::MSG_FILE_IN_NOTICE:
            case MsgType::MSG_ERROR:
            case MsgType::MSG_UNKNOWN:
                log(AsyncLogger::WARN, "Unexpected message type " + pkt.wire_type()
                    + " (" + conn.server_id() + ")");
                break;
        }
    }

    void handle_file_out(Connection& conn, const BridgePacket& pkt) {
        const json& p = pkt.payload;
        FileArrival ev;
        if (!payload_int(p, "size", 0, ev.size)) {
            reply(conn, make_error(ErrCode::INVALID_PAYLOAD, "size must be an integer", cfg_.token, pkt.msg_id));
            return;
        }
        reply(conn, make_ack(pkt.msg_id, cfg_.token));

        ev.server_id = conn.server_id();
        ev.channel   = pkt.channel;
        ev.file_id   = payload_str(p, "file_id");
        ev.file_name = payload_str(p, "file_name");
        ev.sha256    = payload_str(p, "sha256");
        std::string url  = payload_str(p, "url");
        std::string data = payload_str(p, "data");
        if (!url.empty())  ev.url = url;
        if (!data.empty()) ev.data = data;
        invoke_handlers(handlers_.on_file, ev, "file");
    }

    void handle_file_chunk(Connection& conn, const BridgePacket& pkt) {
        ChunkPiece piece;
        std::string err;
        if (!ChunkPiece::from_payload(pkt.payload, pkt.channel, piece, err)) {
            reply(conn, make_error(ErrCode::INVALID_PAYLOAD, err, cfg_.token, pkt.msg_id));
            return;
        }
        reply(conn, make_ack(pkt.msg_id, cfg_.token));

        ChunkOutcome out = chunks_.accept(piece);
        if (out.started) {
            invoke_handlers(handlers_.on_upload_start,
                            UploadStart{ conn.server_id(), piece.channel, piece.file_name }, "upload-start");
        }
        if (out.oversized) {
            reply(conn, make_error(ErrCode::FILE_TOO_LARGE, "transfer exceeds upload limit",
                                   cfg_.token, pkt.msg_id));
        }
        if (out.completed) {
            FileArrival ev;
            ev.server_id = conn.server_id();
            ev.channel   = out.channel;
            ev.file_id   = out.record.file_id;
            ev.file_name = out.file_name;
            ev.size      = out.declared_size;
            ev.sha256    = out.declared_sha256;
            invoke_handlers(handlers_.on_file, ev, "file");
        }
    }

    void handle_result(Connection& conn, const BridgePacket& pkt) {
        const json& p = pkt.payload;
        TransferResult ev;
        ev.server_id = conn.server_id();
        ev.ok        = payload_flag(p, "ok");
        ev.file_name = payload_str(p, "file_name");
        ev.size_mb   = payload_str(p, "size_mb");
        ev.speed     = payload_str(p, "speed");
        ev.err_msg   = payload_str(p, "err_msg");
        if (p.contains("extracted"))    ev.extracted = payload_flag(p, "extracted");
        if (p.contains("extract_time")) ev.extract_time = payload_str(p, "extract_time");
        ev.channel   = pkt.channel;
        invoke_handlers(handlers_.on_result, ev, "result");
    }

    template <class Event>
    void invoke_handlers(const std::vector<std::function<void(const Event&)>>& list,
                         const Event& ev, const char* what) {
        for (const auto& handler : list) {
            try {
                handler(ev);
            } catch (const std::exception& e) {
                log(AsyncLogger::ERROR_LOG, std::string("Handler error (") + what + "): " + e.what());
            }
        }
    }

    void reply(Connection& conn, const BridgePacket& pkt) {
        if (!conn.send_packet(pkt))
            log(AsyncLogger::WARN, "Send to " + conn.server_id() + " failed (" + pkt.wire_type() + ")");
    }

    bool send_raw(PeerChannel& channel, const BridgePacket& pkt) {
        if (channel.write_frame(pkt.encode())) return true;
        log(AsyncLogger::WARN, "Send failed during handshake (" + pkt.wire_type() + ")");
        return false;
    }

    void log(AsyncLogger::Level level, const std::string& msg) { hub_log(logger_, level, msg); }

    const HubConfig&    cfg_;
    ConnectionRegistry& conns_;
    DedupWindow&        dedup_;
    ChunkAssembler&     chunks_;
    SessionHandlers     handlers_;
    const HubClock*     clock_;
    AsyncLogger*        logger_;
};

#endif
