#include <cassert>
#include <iostream>

#include "TestSupport.hpp"
#include "domain/services/Classification.hpp"

using namespace taskwalker::test;

static TaskFacts Facts(Lifecycle lifecycle, bool queued, bool history, bool timer, bool external) {
    TaskFacts f;
    f.lifecycle = lifecycle;
    f.queued = queued;
    f.hasHistory = history;
    f.timerOn = timer;
    f.externalWaiting = external;
    return f;
}

static void testTotality() {
    std::cout << "[Test] Every fact combination classifies..." << std::endl;
    const ClassificationTable table = ClassificationTable::Defaults();
    assert(table.size() == 20);

    int combinations = 0;
    for (Lifecycle lifecycle : {Lifecycle::Open, Lifecycle::Closed, Lifecycle::Cancelled}) {
        for (bool queued : {false, true}) {
            for (bool history : {false, true}) {
                for (bool timer : {false, true}) {
                    for (bool external : {false, true}) {
                        const Classification& c = Classify(Facts(lifecycle, queued, history, timer, external), table);
                        assert(!c.label.empty());
                        ++combinations;
                    }
                }
            }
        }
    }
    assert(combinations == 48);
}

static void testPrecedence() {
    std::cout << "[Test] Default precedence..." << std::endl;
    const ClassificationTable table = ClassificationTable::Defaults();
    auto status = [&](const TaskFacts& f) { return Classify(f, table).status; };

    assert(status(Facts(Lifecycle::Closed, true, true, true, true)) == Status::Completed);
    assert(status(Facts(Lifecycle::Cancelled, false, true, true, true)) == Status::Cancelled);
    assert(status(Facts(Lifecycle::Open, true, false, true, true)) == Status::Active);
    assert(status(Facts(Lifecycle::Open, false, true, false, true)) == Status::External);
    assert(status(Facts(Lifecycle::Open, false, false, false, false)) == Status::Proposed);
    assert(status(Facts(Lifecycle::Open, true, false, false, false)) == Status::Planned);
    assert(status(Facts(Lifecycle::Open, true, true, false, false)) == Status::InProgress);
    assert(status(Facts(Lifecycle::Open, false, true, false, false)) == Status::Suspended);

    const Classification& planned = Classify(Facts(Lifecycle::Open, true, false, false, false), table);
    assert(planned.label == "planned" && planned.sortOrder == 1 && planned.color == "blue");

    for (Status s : {Status::Proposed, Status::Planned, Status::InProgress, Status::Suspended,
                     Status::External, Status::Active, Status::Completed, Status::Cancelled}) {
        assert(StatusFromString(StatusToString(s)) == s);
    }
    assert(!StatusFromString("blocked").has_value());
    assert(PrecedenceTierFromString("external") == PrecedenceTier::External);
}

static void testOverride() {
    std::cout << "[Test] Override table replaces single rows..." << std::endl;
    ClassificationTable table = ClassificationTable::Defaults();
    table.set(ClassificationKey{PrecedenceTier::Open, false, false}, Classification{Status::Planned, "inbox", 9, "white"});
    assert(table.size() == 20);

    const Classification& inbox = Classify(Facts(Lifecycle::Open, false, false, false, false), table);
    assert(inbox.status == Status::Planned && inbox.label == "inbox" && inbox.sortOrder == 9);
    assert(Classify(Facts(Lifecycle::Open, true, false, false, false), table).label == "planned");

    // External tier can tell queued-while-timed tasks apart after the timer stops
    table.set(ClassificationKey{PrecedenceTier::External, false, true}, Classification{Status::External, "delegated", 3, "magenta"});
    assert(Classify(Facts(Lifecycle::Open, false, true, false, true), table).label == "delegated");

    Tracker t(MicroSessionPolicy{}, table);
    TaskId a = t.add("a");
    assert(t.service.classify(a).label == "inbox");
}

static void testHandoffScenario() {
    std::cout << "[Test] Send / start / stop classification scenario..." << std::endl;
    Tracker t;
    t.addQueued("one");
    t.addQueued("two");
    TaskId three = t.addQueued("three");
    assert(t.service.classify(three).status == Status::Planned);

    t.service.send(three, "alice", std::nullopt, 100);
    assert(t.service.classify(three).status == Status::External);
    assert(!t.position(three));

    t.service.startFor(three, 200);
    assert(t.service.classify(three).status == Status::Active);
    assert(t.position(three) == 0);

    t.service.stop(300);
    assert(t.service.classify(three).status == Status::External);
    assert(!t.position(three));

    t.service.recall(three, 0, 400);
    assert(t.service.classify(three).status == Status::InProgress);

    t.service.complete(three, 500);
    assert(t.service.classify(three).status == Status::Completed);

    auto snap = t.service.snapshot();
    assert(snap.queue.size() == 2);
    assert(snap.tasks.size() == 3);
    assert(!snap.running);
    assert(snap.tasks[2].classification.status == Status::Completed);
}

int main() {
    std::cout << "[Test] Starting Classification Test..." << std::endl;

    testTotality();
    testPrecedence();
    testOverride();
    testHandoffScenario();

    std::cout << "[PASS] Classification Test" << std::endl;
    return 0;
}
