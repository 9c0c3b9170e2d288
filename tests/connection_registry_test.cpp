#include "connection_registry.h"
#include "test_support.h"

#include <cassert>
#include <memory>

using testing_support::FakeChannel;
using testing_support::ManualClock;
using testing_support::parse_frame;

namespace {

void test_add_get_remove() {
    ManualClock clock(50.0);
    ConnectionRegistry reg(&clock, nullptr);

    auto ch = std::make_shared<FakeChannel>();
    auto conn = reg.add("srv-a", ch);
    assert(reg.count() == 1);
    assert(reg.contains("srv-a"));
    assert(reg.get("srv-a") == conn);
    assert(conn->connected_at() == 50.0);
    assert(conn->last_seen() == 50.0);
    assert(!conn->authenticated());

    clock.advance(7);
    conn->touch(clock.now());
    assert(conn->last_seen() == 57.0);
    assert(conn->alive_seconds(clock.now()) == 7.0);

    reg.remove("missing");
    assert(reg.count() == 1);
    reg.remove("srv-a");
    assert(reg.count() == 0);
    assert(reg.get("srv-a") == nullptr);
}

void test_overwrite_and_identity_checked_removal() {
    ManualClock clock;
    ConnectionRegistry reg(&clock, nullptr);

    auto first_ch = std::make_shared<FakeChannel>();
    auto second_ch = std::make_shared<FakeChannel>();
    auto first = reg.add("srv", first_ch);
    auto second = reg.add("srv", second_ch);

    assert(reg.count() == 1);
    assert(reg.get("srv") == second);
    assert(!first_ch->is_closed());      // superseded socket is left to its session

    // The superseded session unwinding must not evict its replacement
    assert(!reg.remove_if_same("srv", first.get()));
    assert(reg.get("srv") == second);
    assert(reg.remove_if_same("srv", second.get()));
    assert(reg.count() == 0);
}

void test_send_is_refused_after_close() {
    ManualClock clock;
    ConnectionRegistry reg(&clock, nullptr);
    auto ch = std::make_shared<FakeChannel>();
    auto conn = reg.add("srv", ch);

    assert(conn->send_packet(make_pong("k")));
    conn->close();
    conn->close();
    assert(ch->is_closed());
    assert(!conn->send_packet(make_pong("k")));
    assert(ch->sent().size() == 1);
}

void test_broadcast_fan_out() {
    ManualClock clock;
    ConnectionRegistry reg(&clock, nullptr);

    auto a = std::make_shared<FakeChannel>();
    auto b = std::make_shared<FakeChannel>();
    auto c = std::make_shared<FakeChannel>();
    auto d = std::make_shared<FakeChannel>();
    reg.add("a", a)->set_authenticated(true);
    reg.add("b", b)->set_authenticated(true);
    reg.add("c", c)->set_authenticated(true);
    reg.add("pending", d);                     // never authenticated

    b->fail_writes(true);

    BridgePacket notice = make_file_in_notice("qq_group:1", "m.vpk", "k", "", "f1", 10);
    size_t reached = reg.broadcast(notice, "c");

    assert(reached == 1);
    assert(a->sent().size() == 1);
    assert(parse_frame(a->sent()[0]).type == MsgType::MSG_FILE_IN_NOTICE);
    assert(c->sent().empty());                  // excluded
    assert(d->sent().empty());                  // unauthenticated
    assert(!reg.contains("b"));                 // failed recipient dropped
    assert(reg.contains("a") && reg.contains("c") && reg.contains("pending"));
    assert(reg.snapshot().size() == 3);
}

void test_admission_reservations() {
    ManualClock clock;
    ConnectionRegistry reg(&clock, nullptr);

    assert(reg.try_reserve(2));
    assert(reg.try_reserve(2));
    assert(!reg.try_reserve(2));              // both slots pending a handshake
    assert(reg.reserved() == 2);

    reg.release_reservation();                // failed handshake
    assert(reg.reserved() == 1);

    reg.commit_reservation("a", std::make_shared<FakeChannel>());
    assert(reg.count() == 1 && reg.reserved() == 0);
    assert(reg.try_reserve(2));
    assert(!reg.try_reserve(2));

    {
        AdmissionSlot slot(reg, 2);
        assert(!slot.held());
    }
    reg.release_reservation();
    {
        AdmissionSlot slot(reg, 2);
        assert(slot.held());
        assert(reg.reserved() == 1);
    }
    assert(reg.reserved() == 0);               // released on scope exit
    {
        AdmissionSlot slot(reg, 2);
        auto conn = slot.commit("b", std::make_shared<FakeChannel>());
        assert(reg.get("b") == conn);
    }
    assert(reg.count() == 2 && reg.reserved() == 0);
}

}  // namespace

int main() {
    test_add_get_remove();
    test_overwrite_and_identity_checked_removal();
    test_send_is_refused_after_close();
    test_broadcast_fan_out();
    test_admission_reservations();
    return 0;
}
