#include "bridge_packet.h"
#include "crypto_utils.h"

#include <cassert>
#include <cstdint>
#include <string>

namespace {

const std::string kSecret = "s3cret-token";

BridgePacket sample() {
    BridgePacket p(MsgType::MSG_FILE_OUT, "srv-1");
    p.channel = "qq_group:42";
    p.payload["file_name"] = "map.vpk";
    return p.sign(kSecret);
}

void test_signature_covers_envelope_fields() {
    BridgePacket p = sample();
    assert(p.verify_sig(kSecret));
    assert(p.sig.size() == 64);
    assert(p.sig == hmac_sha256_hex(kSecret, p.canonical()));
    assert(!p.verify_sig("other-secret"));

    BridgePacket m = p; m.v = 2;                     assert(!m.verify_sig(kSecret));
    m = p; m.msg_id += "x";                          assert(!m.verify_sig(kSecret));
    m = p; m.server_id = "srv-2";                    assert(!m.verify_sig(kSecret));
    m = p; m.ts += 1;                                assert(!m.verify_sig(kSecret));
    m = p; m.channel = "qq_group:43";                assert(!m.verify_sig(kSecret));
    m = p; m.type = MsgType::MSG_RESULT;             assert(!m.verify_sig(kSecret));

    // Payload is outside the signature
    m = p; m.payload["file_name"] = "evil.vpk";      assert(m.verify_sig(kSecret));
}

void test_canonical_layout() {
    BridgePacket p;
    p.type = MsgType::MSG_PING;
    p.msg_id = "abc";
    p.server_id = "s";
    p.ts = 100;
    p.channel = "c";
    assert(p.canonical() == "1|are_you_there|abc|s|100|c");
}

void test_timestamp_window_is_inclusive() {
    BridgePacket p;
    p.ts = 1000;
    assert(p.verify_ts(30, 1030));
    assert(p.verify_ts(30, 970));
    assert(!p.verify_ts(30, 1031));
    assert(!p.verify_ts(30, 969));
}

void test_defaults_for_outbound_packets() {
    BridgePacket a(MsgType::MSG_PONG);
    BridgePacket b(MsgType::MSG_PONG);
    assert(a.server_id == "bridge");
    assert(a.msg_id.size() == 16);
    assert(a.msg_id != b.msg_id);
    assert(a.v == 1);
    assert(a.payload.is_object());
}

void test_decode_roundtrip_keeps_signature_valid() {
    BridgePacket p = sample();
    BridgePacket q;
    std::string err;
    assert(BridgePacket::decode(p.encode(), q, err, 0));
    assert(q.type == MsgType::MSG_FILE_OUT);
    assert(q.channel == "qq_group:42");
    assert(q.payload["file_name"] == "map.vpk");
    assert(q.verify_sig(kSecret));
}

void test_decode_rejects_bad_envelopes() {
    BridgePacket q;
    std::string err;
    assert(!BridgePacket::decode("not json", q, err, 0));
    assert(!BridgePacket::decode("[1,2]", q, err, 0));
    assert(!BridgePacket::decode(R"({"v":1})", q, err, 0));
    assert(!BridgePacket::decode(R"({"type":5})", q, err, 0));
    assert(!BridgePacket::decode(R"({"type":"are_you_there","ts":"now"})", q, err, 0));
    assert(!BridgePacket::decode(R"({"type":"are_you_there","payload":[1]})", q, err, 0));
    assert(!BridgePacket::decode(R"({"type":"are_you_there","server_id":7})", q, err, 0));
    assert(!err.empty());
}

void test_decode_fills_missing_fields() {
    BridgePacket q;
    std::string err;
    assert(BridgePacket::decode(R"({"type":"are_you_there"})", q, err, 1234.9));
    assert(q.type == MsgType::MSG_PING);
    assert(q.v == 1);
    assert(q.ts == 1234);
    assert(q.msg_id.size() == 16);
    assert(q.payload.is_object() && q.payload.empty());
}

void test_unknown_type_keeps_wire_name() {
    BridgePacket q;
    std::string err;
    assert(BridgePacket::decode(R"({"type":"reboot_now","msg_id":"m1","ts":5})", q, err, 0));
    assert(q.type == MsgType::MSG_UNKNOWN);
    assert(q.wire_type() == "reboot_now");
    assert(q.canonical() == "1|reboot_now|m1||5|");
}

void test_wire_names() {
    assert(parse_msg_type("greeting") == MsgType::MSG_HELLO);
    assert(parse_msg_type("welcome") == MsgType::MSG_HELLO_ACK);
    assert(parse_msg_type("still_here") == MsgType::MSG_PONG);
    assert(parse_msg_type("deliver_file") == MsgType::MSG_FILE_OUT);
    assert(parse_msg_type("file_piece") == MsgType::MSG_FILE_CHUNK);
    assert(parse_msg_type("incoming_file") == MsgType::MSG_FILE_IN_NOTICE);
    assert(parse_msg_type("understood") == MsgType::MSG_ACK);
    assert(parse_msg_type("mission_complete") == MsgType::MSG_RESULT);
    assert(parse_msg_type("something_wrong") == MsgType::MSG_ERROR);
    assert(parse_msg_type("unknown") == MsgType::MSG_UNKNOWN);
}

void test_factories() {
    BridgePacket ack = make_hello_ack("srv-1", kSecret);
    assert(ack.type == MsgType::MSG_HELLO_ACK);
    assert(ack.payload["accepted_server"] == "srv-1");
    assert(ack.verify_sig(kSecret));

    BridgePacket err = make_error(ErrCode::DUPLICATE, "dup", kSecret, "m9");
    assert(err.payload["code"] == 1004);
    assert(err.payload["ref_msg_id"] == "m9");
    assert(err.server_id == "bridge");

    BridgePacket bare = make_file_in_notice("", "a.vpk", kSecret);
    assert(bare.payload.size() == 1);
    assert(!bare.payload.contains("size"));

    BridgePacket full = make_file_in_notice("qq_group:1", "a.vpk", kSecret, "http://x/a", "f00d", 12, "ab");
    assert(full.channel == "qq_group:1");
    assert(full.payload["url"] == "http://x/a");
    assert(full.payload["file_id"] == "f00d");
    assert(full.payload["size"] == 12);
    assert(full.payload["sha256"] == "ab");
    assert(full.verify_sig(kSecret));
}

void test_payload_readers() {
    json p = json::parse(R"({"a":5,"b":"17","c":2.9,"d":"x7","e":true,"f":"1","g":0,"s":"txt","n":3})");
    int64_t v = 0;
    assert(payload_int(p, "a", 0, v) && v == 5);
    assert(payload_int(p, "b", 0, v) && v == 17);
    assert(payload_int(p, "c", 0, v) && v == 2);
    assert(!payload_int(p, "d", 0, v));
    assert(payload_int(p, "missing", 9, v) && v == 9);

    assert(payload_flag(p, "e"));
    assert(payload_flag(p, "f"));
    assert(!payload_flag(p, "g"));
    assert(!payload_flag(p, "missing"));

    assert(payload_str(p, "s") == "txt");
    assert(payload_str(p, "n") == "3");
    assert(payload_str(p, "missing", "dflt") == "dflt");
}

void test_payload_int_rejects_out_of_range_numbers() {
    json p = json::parse(R"({"huge":1e300,"neg":-1e300,"edge":9223372036854775808.0,
                             "wrap":18446744073709551615,"max":9223372036854775807,
                             "min":-9223372036854775808,"inf_str":"99999999999999999999"})");
    int64_t v = 7;
    assert(!payload_int(p, "huge", 0, v));
    assert(!payload_int(p, "neg", 0, v));
    assert(!payload_int(p, "edge", 0, v));
    assert(!payload_int(p, "wrap", 0, v));
    assert(!payload_int(p, "inf_str", 0, v));
    assert(v == 7);
    assert(payload_int(p, "max", 0, v) && v == INT64_MAX);
    assert(payload_int(p, "min", 0, v) && v == INT64_MIN);
}

void test_crypto_helpers() {
    assert(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(constant_time_equals("abc", "abc"));
    assert(!constant_time_equals("abc", "abd"));
    assert(!constant_time_equals("ab", "abc"));

    std::string out;
    assert(base64_decode(base64_encode("hello world"), out) && out == "hello world");
    assert(base64_decode("aGk=", out) && out == "hi");
    assert(!base64_decode("aGk", out));
    assert(!base64_decode("@@@@", out));
}

}  // namespace

int main() {
    test_signature_covers_envelope_fields();
    test_canonical_layout();
    test_timestamp_window_is_inclusive();
    test_defaults_for_outbound_packets();
    test_decode_roundtrip_keeps_signature_valid();
    test_decode_rejects_bad_envelopes();
    test_decode_fills_missing_fields();
    test_unknown_type_keeps_wire_name();
    test_wire_names();
    test_factories();
    test_payload_readers();
    test_payload_int_rejects_out_of_range_numbers();
    test_crypto_helpers();
    return 0;
}
