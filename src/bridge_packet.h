#ifndef BRIDGE_PACKET_H
#define BRIDGE_PACKET_H

// =============================================================================
// FileBridge Hub: Packet Envelope, Codec and Signer
// =============================================================================
// Wire format: one JSON object per WebSocket text frame
//   { "v":1, "type":"<wire name>", "msg_id":"..", "server_id":"..",
//     "ts":<unix s>, "channel":"..", "payload":{..}, "sig":"<hex>" }
//
// Signature: HMAC-SHA256(secret, "v|type|msg_id|server_id|ts|channel"),
// lowercase hex. The payload object is NOT covered.
// =============================================================================

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cerrno>
#include <ctime>
#include <string>

#include <nlohmann/json.hpp>

#include "hub_common.h"
#include "crypto_utils.h"

using json = nlohmann::json;

// =============================================================================
// MESSAGE TYPES
// =============================================================================
enum class MsgType {
    MSG_HELLO,            // peer -> hub  {token}
    MSG_HELLO_ACK,        // hub  -> peer {accepted_server}
    MSG_PING,
    MSG_PONG,
    MSG_FILE_OUT,         // peer -> hub  file ready for pickup or inline
    MSG_FILE_CHUNK,       // peer -> hub  one base64 piece of a transfer
    MSG_FILE_IN_NOTICE,   // hub  -> peer push
    MSG_ACK,
    MSG_RESULT,           // peer -> hub  download outcome
    MSG_ERROR,
    MSG_UNKNOWN,          // decoded but not a known wire name
};

inline const char* msg_type_str(MsgType t) {
    switch (t) {
        case MsgType::MSG_HELLO:          return "greeting";
        case MsgType::MSG_HELLO_ACK:      return "welcome";
        case MsgType::MSG_PING:           return "are_you_there";
        case MsgType::MSG_PONG:           return "still_here";
        case MsgType::MSG_FILE_OUT:       return "deliver_file";
        case MsgType::MSG_FILE_CHUNK:     return "file_piece";
        case MsgType::MSG_FILE_IN_NOTICE: return "incoming_file";
        case MsgType::MSG_ACK:            return "understood";
        case MsgType::MSG_RESULT:         return "mission_complete";
        case MsgType::MSG_ERROR:          return "something_wrong";
        case MsgType::MSG_UNKNOWN:        return "unknown";
    }
    return "unknown";
}

inline MsgType parse_msg_type(const std::string& s) {
    static const MsgType known[] = {
        MsgType::MSG_HELLO, MsgType::MSG_HELLO_ACK, MsgType::MSG_PING, MsgType::MSG_PONG,
        MsgType::MSG_FILE_OUT, MsgType::MSG_FILE_CHUNK, MsgType::MSG_FILE_IN_NOTICE,
        MsgType::MSG_ACK, MsgType::MSG_RESULT, MsgType::MSG_ERROR,
    };
    for (MsgType t : known) {
        if (s == msg_type_str(t)) return t;
    }
    return MsgType::MSG_UNKNOWN;
}

// =============================================================================
// ERROR CODES (carried in error packets)
// =============================================================================
enum class ErrCode : int {
    OK               = 0,
    AUTH_FAILED      = 1001,
    INVALID_SIG      = 1002,
    EXPIRED          = 1003,
    DUPLICATE        = 1004,
    INVALID_PAYLOAD  = 2001,
    FILE_TOO_LARGE   = 3001,
    FILE_EXT_DENIED  = 3002,
    FILE_NOT_FOUND   = 3003,
    INTERNAL         = 5000,
};

inline int64_t unix_now() { return static_cast<int64_t>(std::time(nullptr)); }

// Dumps never throw on bad UTF-8 coming from peers or file names
inline std::string dump_json(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// =============================================================================
// PACKET
// =============================================================================
struct BridgePacket {
    int64_t     v = 1;
    MsgType     type = MsgType::MSG_UNKNOWN;
    std::string raw_type;          // wire text for MSG_UNKNOWN
    std::string msg_id;
    std::string server_id;
    int64_t     ts = 0;
    std::string channel;
    json        payload = json::object();
    std::string sig;

    BridgePacket() = default;

    // Fresh outbound packet: random msg_id, current timestamp
    explicit BridgePacket(MsgType t, const std::string& sender = HUB_SERVER_ID)
        : type(t), msg_id(random_hex_id(8)), server_id(sender), ts(unix_now()) {}

    std::string wire_type() const {
        return type == MsgType::MSG_UNKNOWN ? raw_type : std::string(msg_type_str(type));
    }

    std::string canonical() const {
        return std::to_string(v) + "|" + wire_type() + "|" + msg_id + "|" + server_id
             + "|" + std::to_string(ts) + "|" + channel;
    }

    std::string compute_sig(const std::string& secret) const {
        return hmac_sha256_hex(secret, canonical());
    }

    BridgePacket& sign(const std::string& secret) {
        sig = compute_sig(secret);
        return *this;
    }

    bool verify_sig(const std::string& secret) const {
        std::string expected = compute_sig(secret);
        if (expected.empty()) return false;
        return constant_time_equals(sig, expected);
    }

    // Inclusive window: |now - ts| <= window_sec
    bool verify_ts(double window_sec, double now) const {
        return std::fabs(now - static_cast<double>(ts)) <= window_sec;
    }

    std::string encode() const {
        json j;
        j["v"]         = v;
        j["type"]      = wire_type();
        j["msg_id"]    = msg_id;
        j["server_id"] = server_id;
        j["ts"]        = ts;
        j["channel"]   = channel;
        j["payload"]   = payload;
        j["sig"]       = sig;
        return dump_json(j);
    }

    // -------------------------------------------------------------------------
    // DECODE
    // -------------------------------------------------------------------------
    // Requires an object with a string "type". Missing optional fields take the
    // outbound defaults (random msg_id, ts = now). Wrong field types fail.
    // -------------------------------------------------------------------------
    static bool decode(const std::string& raw, BridgePacket& out, std::string& err, double now) {
        json j;
        try {
            j = json::parse(raw);
        } catch (const json::parse_error& e) {
            err = std::string("malformed JSON: ") + e.what();
            return false;
        }
        if (!j.is_object()) { err = "envelope is not an object"; return false; }

        BridgePacket p;

        auto type_it = j.find("type");
        if (type_it == j.end() || !type_it->is_string()) { err = "missing type"; return false; }
        const std::string& type_name = type_it->get_ref<const std::string&>();
        p.type = parse_msg_type(type_name);
        if (p.type == MsgType::MSG_UNKNOWN) p.raw_type = type_name;

        if (!read_int(j, "v", p.v, 1, err)) return false;
        if (!read_int(j, "ts", p.ts, static_cast<int64_t>(now), err)) return false;
        if (!read_str(j, "server_id", p.server_id, err)) return false;
        if (!read_str(j, "channel", p.channel, err)) return false;
        if (!read_str(j, "sig", p.sig, err)) return false;

        auto id_it = j.find("msg_id");
        if (id_it == j.end()) {
            p.msg_id = random_hex_id(8);
        } else if (!read_str(j, "msg_id", p.msg_id, err)) {
            return false;
        }

        auto pl = j.find("payload");
        if (pl != j.end()) {
            if (!pl->is_object()) { err = "payload is not an object"; return false; }
            p.payload = *pl;
        }

        out = std::move(p);
        return true;
    }

private:
    static bool read_str(const json& j, const char* key, std::string& out, std::string& err) {
        auto it = j.find(key);
        if (it == j.end()) return true;
        if (!it->is_string()) { err = std::string("field '") + key + "' must be a string"; return false; }
        out = it->get<std::string>();
        return true;
    }

    static bool read_int(const json& j, const char* key, int64_t& out, int64_t def, std::string& err) {
        auto it = j.find(key);
        if (it == j.end()) { out = def; return true; }
        if (!it->is_number_integer()) { err = std::string("field '") + key + "' must be an integer"; return false; }
        out = it->get<int64_t>();
        return true;
    }
};

// =============================================================================
// PAYLOAD FIELD READERS
// =============================================================================
// Peers are loosely typed: numbers arrive as strings and vice versa.
// =============================================================================
inline std::string payload_str(const json& p, const char* key, const std::string& def = "") {
    auto it = p.find(key);
    if (it == p.end() || it->is_null()) return def;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_boolean()) return it->get<bool>() ? "true" : "false";
    return dump_json(*it);
}

// false when the field is present but not an integer-like value
inline bool payload_int(const json& p, const char* key, int64_t def, int64_t& out) {
    auto it = p.find(key);
    if (it == p.end() || it->is_null()) { out = def; return true; }
    if (it->is_number_unsigned()) {
        uint64_t u = it->get<uint64_t>();
        if (u > static_cast<uint64_t>(INT64_MAX)) return false;
        out = static_cast<int64_t>(u);
        return true;
    }
    if (it->is_number_integer()) { out = it->get<int64_t>(); return true; }
    if (it->is_number_float()) {
        // 2^63 is exactly representable; anything at or above it is out of range
        double d = it->get<double>();
        if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) return false;
        out = static_cast<int64_t>(d);
        return true;
    }
    if (!it->is_string()) return false;

    std::string s = it->get<std::string>();
    s.erase(0, s.find_first_not_of(" \t"));
    s.erase(s.find_last_not_of(" \t") + 1);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') return false;
    out = static_cast<int64_t>(v);
    return true;
}

inline bool payload_flag(const json& p, const char* key) {
    auto it = p.find(key);
    if (it == p.end()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number_integer()) return it->get<int64_t>() == 1;
    if (it->is_string()) {
        const std::string& s = it->get_ref<const std::string&>();
        return s == "true" || s == "1";
    }
    return false;
}

// =============================================================================
// SYSTEM PACKET FACTORIES (pre-signed, sender "bridge")
// =============================================================================
inline BridgePacket make_hello_ack(const std::string& server_id, const std::string& secret) {
    BridgePacket p(MsgType::MSG_HELLO_ACK);
    p.payload["accepted_server"] = server_id;
    return p.sign(secret);
}

inline BridgePacket make_pong(const std::string& secret) {
    BridgePacket p(MsgType::MSG_PONG);
    return p.sign(secret);
}

inline BridgePacket make_ack(const std::string& ref_msg_id, const std::string& secret) {
    BridgePacket p(MsgType::MSG_ACK);
    p.payload["ref_msg_id"] = ref_msg_id;
    return p.sign(secret);
}

inline BridgePacket make_error(ErrCode code, const std::string& message,
                               const std::string& secret, const std::string& ref_msg_id = "") {
    BridgePacket p(MsgType::MSG_ERROR);
    p.payload["code"]       = static_cast<int>(code);
    p.payload["message"]    = message;
    p.payload["ref_msg_id"] = ref_msg_id;
    return p.sign(secret);
}

inline BridgePacket make_file_in_notice(const std::string& channel, const std::string& file_name,
                                        const std::string& secret,
                                        const std::string& url = "", const std::string& file_id = "",
                                        int64_t size = 0, const std::string& sha256 = "") {
    BridgePacket p(MsgType::MSG_FILE_IN_NOTICE);
    p.channel = channel;
    p.payload["file_name"] = file_name;
    if (!url.empty())     p.payload["url"] = url;
    if (!file_id.empty()) p.payload["file_id"] = file_id;
    if (size > 0)         p.payload["size"] = size;
    if (!sha256.empty())  p.payload["sha256"] = sha256;
    return p.sign(secret);
}

#endif
