#include <chrono>
#include <cstdlib>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "actor/actor_system.hpp"
#include "binary_tree_set.hpp"
#include "print.hpp"
#include "reply_probe.hpp"

namespace
{

std::string describe(const std::optional<abt::OperationReply> &reply)
{
    if (!reply)
        return "no reply";
    std::ostringstream oss;
    oss << *reply;
    return oss.str();
}

} // namespace

int main()
{
    constexpr int NKEYS = 500;     // random workload size
    constexpr int KEY_SPAN = 2'000;
    constexpr auto IDLE_TIMEOUT = std::chrono::seconds(30);

    abt::SystemConfig config;
    config.trace = true;
    abt::ActorSystem system(config);
    abt::ActorRef set = abt::make_tree_set(system, "demo-set");
    abt::ReplyProbe probe(system, "demo-client");

    // ── 1. request / reply walkthrough ──────────────────────────────────
    util::println("[phase-1] request / reply");
    probe.insert(set, 1, 5);
    util::println("  Insert(id=1, 5)    -> {}", describe(probe.expect()));
    probe.insert(set, 2, 3);
    util::println("  Insert(id=2, 3)    -> {}", describe(probe.expect()));
    probe.insert(set, 3, 8);
    util::println("  Insert(id=3, 8)    -> {}", describe(probe.expect()));
    probe.contains(set, 4, 3);
    util::println("  Contains(id=4, 3)  -> {}", describe(probe.expect()));
    probe.remove(set, 5, 3);
    util::println("  Remove(id=5, 3)    -> {}", describe(probe.expect()));
    probe.contains(set, 6, 3);
    util::println("  Contains(id=6, 3)  -> {}", describe(probe.expect()));
    probe.contains(set, 7, 5);
    util::println("  Contains(id=7, 5)  -> {}", describe(probe.expect()));
    probe.contains(set, 8, 8);
    util::println("  Contains(id=8, 8)  -> {}", describe(probe.expect()));

    // ── 2. random workload, pipelined ───────────────────────────────────
    util::println("[phase-2] {} random inserts, a third of them removed", NKEYS);
    std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> key(-KEY_SPAN, KEY_SPAN);
    std::set<int> reference{5, 8};
    std::vector<int> keys;
    int id = 100;
    for (int i = 0; i < NKEYS; ++i)
    {
        int k = key(rng);
        keys.push_back(k);
        probe.insert(set, id++, k);
        reference.insert(k);
    }
    for (int i = 0; i < NKEYS; i += 3)
    {
        probe.remove(set, id++, keys[i]);
        reference.erase(keys[i]);
    }
    if (!system.await_idle(IDLE_TIMEOUT))
    {
        util::eprintln("workload did not settle");
        return EXIT_FAILURE;
    }
    for (int i = 100; i < id; ++i)
        (void)probe.expect();
    util::println("  live actors before gc: {}", system.live_actors());

    // ── 3. compaction ───────────────────────────────────────────────────
    util::println("[phase-3] garbage collection");
    set.tell(abt::GC{});
    if (!system.await_idle(IDLE_TIMEOUT))
    {
        util::eprintln("gc did not settle");
        return EXIT_FAILURE;
    }
    util::println("  live actors after gc: {} ({} members)", system.live_actors(), reference.size());

    // ── 4. verify ───────────────────────────────────────────────────────
    size_t mismatches = 0;
    for (int k = -KEY_SPAN; k <= KEY_SPAN; k += 7)
    {
        auto present = probe.ask_contains(set, id++, k);
        if (!present || *present != (reference.count(k) != 0))
            ++mismatches;
    }
    util::println("[phase-4] {} mismatches against the reference set", mismatches);

    return mismatches == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
