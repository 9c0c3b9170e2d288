#include "dedup_window.h"
#include "test_support.h"

#include <cassert>

using testing_support::ManualClock;

int main() {
    ManualClock clock(1000.0);
    DedupWindow dedup(600, &clock);

    assert(!dedup.is_dup("m1"));
    assert(dedup.is_dup("m1"));
    assert(!dedup.is_dup("m2"));

    clock.advance(600);
    assert(dedup.is_dup("m1"));          // exactly at the window edge: still remembered

    clock.advance(1);
    assert(!dedup.is_dup("m1"));         // pruned, recorded afresh
    assert(dedup.size() == 1);           // m2 pruned alongside
    assert(dedup.is_dup("m1"));

    DedupWindow tiny(0, &clock);
    assert(!tiny.is_dup("x"));
    assert(tiny.is_dup("x"));            // same instant is inside a zero window
    clock.advance(0.5);
    assert(!tiny.is_dup("x"));
    return 0;
}
