// binary_tree_set_test.cpp
// Functional tests for the actor-backed integer set.
// Build: see CMakeLists.txt (target binary_tree_set_test)

// checks below call into the set from inside assert()
#undef NDEBUG
#include <cassert>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <random>
#include <set>
#include <vector>

#include "actor/actor_system.hpp"
#include "binary_tree_set.hpp"
#include "reply_probe.hpp"

using namespace abt;
using namespace std::chrono_literals;

namespace
{

constexpr auto kIdle = 10s;

SystemConfig test_config()
{
    SystemConfig config;
    config.worker_threads = 4;
    return config;
}

bool is_finished(const std::optional<OperationReply>& reply, int id)
{
    return reply && std::holds_alternative<OperationFinished>(*reply) && id_of(*reply) == id;
}

bool is_contains(const std::optional<OperationReply>& reply, int id, bool expected)
{
    if (!reply) return false;
    auto* r = std::get_if<ContainsResult>(&*reply);
    return r != nullptr && r->id == id && r->result == expected;
}

}  // namespace

void test_basic_scenario() {
    std::cout << "test_basic_scenario... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    probe.insert(set, 1, 5);
    assert(is_finished(probe.expect(), 1));
    probe.insert(set, 2, 3);
    assert(is_finished(probe.expect(), 2));
    probe.insert(set, 3, 8);
    assert(is_finished(probe.expect(), 3));

    probe.contains(set, 4, 3);
    assert(is_contains(probe.expect(), 4, true));
    probe.remove(set, 5, 3);
    assert(is_finished(probe.expect(), 5));
    probe.contains(set, 6, 3);
    assert(is_contains(probe.expect(), 6, false));
    probe.contains(set, 7, 5);
    assert(is_contains(probe.expect(), 7, true));
    probe.contains(set, 8, 8);
    assert(is_contains(probe.expect(), 8, true));

    std::cout << "PASSED\n";
}

void test_empty_set() {
    std::cout << "test_empty_set... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    assert(probe.ask_contains(set, 1, 7) == false);
    assert(probe.ask_contains(set, 2, -7) == false);
    // the root's own value is not a member until inserted
    assert(probe.ask_contains(set, 3, kRootElem) == false);

    std::cout << "PASSED\n";
}

void test_root_value_is_an_ordinary_element() {
    std::cout << "test_root_value_is_an_ordinary_element... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    assert(probe.ask_insert(set, 1, kRootElem));
    assert(probe.ask_contains(set, 2, kRootElem) == true);
    assert(probe.ask_remove(set, 3, kRootElem));
    assert(probe.ask_contains(set, 4, kRootElem) == false);

    // survives a collection as well
    assert(probe.ask_insert(set, 5, kRootElem));
    set.tell(GC{});
    assert(system.await_idle(kIdle));
    assert(probe.ask_contains(set, 6, kRootElem) == true);

    std::cout << "PASSED\n";
}

void test_insert_is_idempotent() {
    std::cout << "test_insert_is_idempotent... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    for (int id = 1; id <= 5; ++id)
        assert(probe.ask_insert(set, id, 42));
    assert(system.await_idle(kIdle));

    // coordinator + root + probe + exactly one node for 42
    assert(system.live_actors() == 4);
    assert(probe.ask_contains(set, 10, 42) == true);

    // a single remove undoes any number of inserts
    assert(probe.ask_remove(set, 11, 42));
    assert(probe.ask_contains(set, 12, 42) == false);

    std::cout << "PASSED\n";
}

void test_remove_absent_element() {
    std::cout << "test_remove_absent_element... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    assert(probe.ask_remove(set, 1, 99));
    assert(probe.ask_insert(set, 2, 10));
    assert(probe.ask_remove(set, 3, 20));   // missing child below 10
    assert(probe.ask_remove(set, 4, 10));
    assert(probe.ask_remove(set, 5, 10));   // already tombstoned
    assert(probe.ask_contains(set, 6, 10) == false);

    std::cout << "PASSED\n";
}

void test_every_operation_gets_one_reply() {
    std::cout << "test_every_operation_gets_one_reply... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    constexpr int kOps = 600;
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> key(-50, 50);
    for (int id = 0; id < kOps; ++id) {
        switch (id % 3) {
            case 0: probe.insert(set, id, key(rng)); break;
            case 1: probe.contains(set, id, key(rng)); break;
            default: probe.remove(set, id, key(rng)); break;
        }
    }

    std::map<int, int> seen;
    for (int n = 0; n < kOps; ++n) {
        auto reply = probe.expect();
        assert(reply);
        ++seen[id_of(*reply)];
        // contains ops and only contains ops get a ContainsResult
        assert(std::holds_alternative<ContainsResult>(*reply) == (id_of(*reply) % 3 == 1));
    }
    assert(seen.size() == static_cast<size_t>(kOps));
    assert(probe.received() == static_cast<size_t>(kOps));
    for (const auto& [id, count] : seen) {
        assert(id >= 0 && id < kOps);
        assert(count == 1);
    }
    assert(probe.expect_no_reply(100ms));

    std::cout << "PASSED\n";
}

void test_gc_preserves_membership() {
    std::cout << "test_gc_preserves_membership... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    int id = 0;
    for (int x = -30; x <= 30; ++x)
        assert(probe.ask_insert(set, ++id, x * 7));
    for (int x = -30; x <= 30; x += 2)
        assert(probe.ask_remove(set, ++id, x * 7));

    std::vector<bool> before;
    for (int x = -31; x <= 31; ++x) {
        auto present = probe.ask_contains(set, ++id, x * 7);
        assert(present);
        before.push_back(*present);
    }

    set.tell(GC{});
    assert(system.await_idle(kIdle));

    std::vector<bool> after;
    for (int x = -31; x <= 31; ++x) {
        auto present = probe.ask_contains(set, ++id, x * 7);
        assert(present);
        after.push_back(*present);
    }
    assert(before == after);

    std::cout << "PASSED\n";
}

void test_gc_discards_tombstoned_nodes() {
    std::cout << "test_gc_discards_tombstoned_nodes... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    const std::vector<int> elems = {50, 20, 80, 10, 30, 70, 90, 25, 35, 85};
    int id = 0;
    for (int x : elems)
        assert(probe.ask_insert(set, ++id, x));
    assert(system.await_idle(kIdle));
    assert(system.live_actors() == 3 + elems.size());

    for (int x : {20, 30, 90, 25})
        assert(probe.ask_remove(set, ++id, x));
    assert(system.await_idle(kIdle));
    assert(system.live_actors() == 3 + elems.size());  // tombstones still occupy nodes

    set.tell(GC{});
    assert(system.await_idle(kIdle));
    assert(system.live_actors() == 3 + elems.size() - 4);

    for (int x : {50, 80, 10, 70, 35, 85})
        assert(probe.ask_contains(set, ++id, x) == true);
    for (int x : {20, 30, 90, 25})
        assert(probe.ask_contains(set, ++id, x) == false);

    std::cout << "PASSED\n";
}

void test_gc_on_empty_tree() {
    std::cout << "test_gc_on_empty_tree... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    set.tell(GC{});
    assert(system.await_idle(kIdle));
    set.tell(GC{});
    assert(system.await_idle(kIdle));
    assert(system.live_actors() == 3);

    assert(probe.ask_insert(set, 1, 4));
    assert(probe.ask_contains(set, 2, 4) == true);

    std::cout << "PASSED\n";
}

void test_gc_with_only_tombstones() {
    std::cout << "test_gc_with_only_tombstones... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    int id = 0;
    for (int x = 1; x <= 20; ++x)
        assert(probe.ask_insert(set, ++id, x));
    for (int x = 1; x <= 20; ++x)
        assert(probe.ask_remove(set, ++id, x));

    set.tell(GC{});
    assert(system.await_idle(kIdle));
    assert(system.live_actors() == 3);
    for (int x = 1; x <= 20; ++x)
        assert(probe.ask_contains(set, ++id, x) == false);

    std::cout << "PASSED\n";
}

void test_operations_answered_during_gc() {
    std::cout << "test_operations_answered_during_gc... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    std::set<int> reference;
    std::mt19937 rng(11);
    std::uniform_int_distribution<int> key(-5000, 5000);
    int id = 0;
    for (int n = 0; n < 400; ++n) {
        int x = key(rng);
        probe.insert(set, ++id, x);
        reference.insert(x);
    }
    for (int n = 0; n < 400; ++n)
        assert(probe.expect());

    // reads issued right behind the trigger are served by the old tree
    set.tell(GC{});
    std::map<int, bool> expected;
    for (int x = -5000; x <= 5000; x += 13) {
        probe.contains(set, ++id, x);
        expected[id] = reference.count(x) != 0;
    }
    // replies for different keys may come back in any order
    for (const auto& [rid, present] : expected) {
        auto reply = probe.expect_id(rid);
        assert(reply);
        assert(*reply == OperationReply(ContainsResult{rid, present}));
    }

    assert(system.await_idle(kIdle));
    assert(system.live_actors() == 3 + reference.size() - reference.count(kRootElem));
    for (int x : reference)
        assert(probe.ask_contains(set, ++id, x) == true);

    std::cout << "PASSED\n";
}

void test_repeated_gc_cycles() {
    std::cout << "test_repeated_gc_cycles... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    std::set<int> reference;
    std::mt19937 rng(3);
    std::uniform_int_distribution<int> key(-200, 200);
    std::uniform_int_distribution<int> coin(0, 2);
    int id = 0;

    for (int round = 0; round < 6; ++round) {
        for (int n = 0; n < 150; ++n) {
            int x = key(rng);
            if (coin(rng) == 0) {
                assert(probe.ask_remove(set, ++id, x));
                reference.erase(x);
            } else {
                assert(probe.ask_insert(set, ++id, x));
                reference.insert(x);
            }
        }
        // back to back: the second trigger is ignored if it arrives while the
        // first cycle is running, otherwise it runs a cycle of its own
        set.tell(GC{});
        set.tell(GC{});
        assert(system.await_idle(kIdle));
        assert(system.live_actors() == 3 + reference.size() - reference.count(kRootElem));

        for (int x = -200; x <= 200; ++x)
            assert(probe.ask_contains(set, ++id, x) == (reference.count(x) != 0));
    }

    std::cout << "PASSED\n";
}

void test_terminate_stops_the_whole_tree() {
    std::cout << "test_terminate_stops_the_whole_tree... ";

    ActorSystem system(test_config());
    ActorRef set = make_tree_set(system);
    ReplyProbe probe(system);

    for (int x = 1; x <= 8; ++x)
        assert(probe.ask_insert(set, x, x * 3));
    assert(system.await_idle(kIdle));
    assert(system.live_actors() == 3 + 8);

    set.tell(Terminate{});
    assert(system.await_idle(kIdle));
    assert(system.live_actors() == 1);  // only the probe is left

    const size_t dead_before = system.dead_letters();
    probe.contains(set, 100, 3);
    assert(probe.expect_no_reply(100ms));
    assert(system.dead_letters() == dead_before + 1);

    std::cout << "PASSED\n";
}

void test_dropped_set_ref_keeps_the_tree() {
    std::cout << "test_dropped_set_ref_keeps_the_tree... ";

    ActorSystem system(test_config());
    ReplyProbe probe(system);

    // sorted keys: every node has one right child, one chain kDepth long
    constexpr int kDepth = 1500;
    {
        ActorRef set = make_tree_set(system);
        for (int x = 1; x <= kDepth; ++x)
            probe.insert(set, x, x);
        for (int x = 1; x <= kDepth; ++x)
            assert(probe.expect());
        assert(system.await_idle(kIdle));
        assert(system.live_actors() == 3 + kDepth);
    }

    // only Terminate or shutdown take a tree down
    assert(system.await_idle(kIdle));
    assert(system.live_actors() == 3 + kDepth);

    system.shutdown();
    assert(system.live_actors() == 0);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "==== Binary Tree Set Tests ====\n";

    test_basic_scenario();
    test_empty_set();
    test_root_value_is_an_ordinary_element();
    test_insert_is_idempotent();
    test_remove_absent_element();
    test_every_operation_gets_one_reply();
    test_gc_preserves_membership();
    test_gc_discards_tombstoned_nodes();
    test_gc_on_empty_tree();
    test_gc_with_only_tombstones();
    test_operations_answered_during_gc();
    test_repeated_gc_cycles();
    test_terminate_stops_the_whole_tree();
    test_dropped_set_ref_keeps_the_tree();

    std::cout << "ALL TESTS PASSED\n";
    return EXIT_SUCCESS;
}
