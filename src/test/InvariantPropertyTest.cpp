#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "domain/services/InvariantGuard.hpp"

using namespace taskwalker::test;

static void testGuardDetectsViolations() {
    std::cout << "[Test] Guard rejects inconsistent facts..." << std::endl;
    FactSet facts;
    Task a;
    a.id = 1;
    a.queuePosition = 0;
    Task b;
    b.id = 2;
    b.queuePosition = 2;
    facts.tasks[1] = a;
    facts.tasks[2] = b;
    assert(!InvariantGuard::FindViolations(facts).empty());

    facts.tasks[2].queuePosition = 1;
    assert(InvariantGuard::FindViolations(facts).empty());

    facts.sessions[1] = WorkSession{1, 1, 100, std::nullopt};
    facts.sessions[2] = WorkSession{2, 2, 200, std::nullopt};
    auto violations = InvariantGuard::FindViolations(facts);
    assert(!violations.empty());
    assert(ThrowsKind([&] { InvariantGuard::Validate(facts); }, ErrorKind::InvariantViolation));

    facts.sessions.erase(2);
    facts.tasks[1].lifecycle = Lifecycle::Closed;
    assert(!InvariantGuard::FindViolations(facts).empty());
}

static void checkState(const FactSet& facts) {
    const auto violations = InvariantGuard::FindViolations(facts);
    if (!violations.empty()) {
        for (const auto& v : violations) std::cerr << "  violation: " << v << std::endl;
    }
    assert(violations.empty());

    int open = 0;
    for (const auto& [id, s] : facts.sessions) {
        if (s.isOpen()) ++open;
    }
    assert(open <= 1);

    const std::vector<TaskId> order = facts.queue();
    for (std::size_t i = 0; i < order.size(); ++i) {
        assert(*facts.task(order[i]).queuePosition == static_cast<int>(i));
    }
}

static void testRandomSequences(unsigned seed) {
    Tracker t;
    std::mt19937 rng(seed);
    auto roll = [&](int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(rng); };

    Timestamp now = 1000;
    for (int i = 0; i < 4; ++i) t.add("seed " + std::to_string(i), now);

    int accepted = 0;
    for (int step = 0; step < 400; ++step) {
        now += roll(0, 60);
        const FactSet before = t.facts();
        const TaskId id = roll(1, static_cast<int>(before.tasks.size()) + 1);
        const int commits = t.store->commitCount();

        try {
            switch (roll(0, 17)) {
                case 0: t.add("task " + std::to_string(step), now); break;
                case 1: case 2: t.service.enqueue(id, now); break;
                case 3: t.service.promoteToFront(id, now); break;
                case 4: t.service.rotate(roll(-3, 3), now); break;
                case 5: t.service.remove(QueueIndex{roll(-1, 5)}, now); break;
                case 6: t.service.pick(roll(-1, 5), now); break;
                case 7: t.service.startDefault(now); break;
                case 8: case 9: t.service.startFor(id, now); break;
                case 10: t.service.stop(now); break;
                case 11: t.service.next(roll(-2, 2), now); break;
                case 12: t.service.interval(id, now - roll(-5, 300), now - roll(0, 100), now); break;
                case 13: t.service.send(id, "peer", std::nullopt, now); break;
                case 14: t.service.recall(id, roll(-1, 4), now); break;
                case 15: t.service.complete(id, now); break;
                case 16: t.service.cancel(id, now); break;
                case 17: t.service.completeCurrent(roll(0, 1) == 1, now); break;
            }
            ++accepted;
        } catch (const TaskError& e) {
            assert(!e.isSystemFault());
            // Nothing was committed
            assert(t.store->commitCount() == commits);
        }

        const FactSet after = t.facts();
        checkState(after);

        for (const auto& [taskId, task] : after.tasks) {
            // Classification is total over reachable states
            Classify(after.factsFor(taskId), t.service.classificationTable());
        }
    }
    assert(accepted > 0);
}

int main() {
    std::cout << "[Test] Starting Invariant Property Test..." << std::endl;

    testGuardDetectsViolations();
    for (unsigned seed = 1; seed <= 25; ++seed) {
        std::cout << "[Test] Random sequence, seed " << seed << "..." << std::endl;
        testRandomSequences(seed);
    }

    std::cout << "[PASS] Invariant Property Test" << std::endl;
    return 0;
}
