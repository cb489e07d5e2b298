#include <cassert>
#include <iostream>
#include <string>

#include "TestSupport.hpp"

using namespace taskwalker::test;

static WorkSession Closed(TaskId task, Timestamp start, Timestamp end) {
    WorkSession s;
    s.id = 1;
    s.taskId = task;
    s.startTs = start;
    s.endTs = end;
    return s;
}

static void testDecide() {
    std::cout << "[Test] Policy decisions..." << std::endl;
    MicroSessionPolicy policy;
    const WorkSession shortOne = Closed(1, 0, 10);
    const WorkSession longOne = Closed(1, 0, 100);

    auto merged = policy.decide(shortOne, 1, 20);
    assert(merged.resolution == MicroResolution::Merged && merged.gapSecs == 10);
    assert(policy.decide(shortOne, 1, 45).resolution == MicroResolution::None);
    assert(policy.decide(longOne, 1, 110).resolution == MicroResolution::Merged);

    auto purged = policy.decide(shortOne, 2, 20);
    assert(purged.resolution == MicroResolution::Purged && purged.durationSecs == 10);
    assert(policy.decide(shortOne, 2, 100).resolution == MicroResolution::None);
    assert(policy.decide(longOne, 2, 110).resolution == MicroResolution::None);

    // Starting before the previous close never resolves
    assert(policy.decide(shortOne, 1, 5).resolution == MicroResolution::None);

    MicroSessionPolicy byDuration;
    byDuration.purgeTrigger = PurgeTrigger::Duration;
    assert(byDuration.decide(shortOne, 2, 100).resolution == MicroResolution::Purged);
    assert(byDuration.decide(longOne, 2, 110).resolution == MicroResolution::None);

    MicroSessionPolicy byGap;
    byGap.purgeTrigger = PurgeTrigger::Gap;
    assert(byGap.decide(longOne, 2, 110).resolution == MicroResolution::Purged);
    assert(byGap.decide(shortOne, 2, 100).resolution == MicroResolution::None);

    MicroSessionPolicy off;
    off.mergeEnabled = false;
    off.purgeEnabled = false;
    assert(off.decide(shortOne, 1, 20).resolution == MicroResolution::None);
    assert(off.decide(shortOne, 2, 20).resolution == MicroResolution::None);

    assert(PurgeTriggerFromString("gap") == PurgeTrigger::Gap);
    assert(!PurgeTriggerFromString("sometimes").has_value());
}

static void testMergeIdempotence() {
    std::cout << "[Test] Stop/start of the same task within the threshold merges..." << std::endl;
    Tracker t;
    TaskId a = t.addQueued("a");

    t.service.startFor(a, 1000);
    t.service.stop(1040);
    auto resumed = t.service.startFor(a, 1050);
    assert(resumed.resolution == MicroResolution::Merged);
    assert(resumed.opened && resumed.opened->startTs == 1000);
    assert(!resumed.closed);

    t.service.stop(1100);
    assert(t.service.startDefault(1110).resolution == MicroResolution::Merged);
    t.service.stop(1200);

    auto history = t.service.sessions(a);
    assert(history.size() == 1);
    assert(history[0].startTs == 1000 && history[0].endTs == 1200);
    assert(t.countEvents<MicroSessionMerged>() == 2);
}

static void testPurgeOnSwitch() {
    std::cout << "[Test] Short session followed by another task is purged..." << std::endl;
    Tracker t;
    TaskId a = t.addQueued("a");
    TaskId b = t.addQueued("b");

    t.service.startFor(a, 2000);
    auto stopped = t.service.stop(2010);
    assert(stopped.notices.size() == 1);
    assert(stopped.notices[0].find("Micro-session") != std::string::npos);
    // Provisionally kept
    assert(t.service.sessions(a).size() == 1);

    auto next = t.service.startFor(b, 2020);
    assert(next.resolution == MicroResolution::Purged);
    assert(t.service.sessions(a).empty());
    assert(t.countEvents<MicroSessionPurged>() == 1);

    // Implicit stop inside a switch is also a candidate
    t.service.stop(2100);
    t.service.startFor(a, 3000);
    auto switched = t.service.startFor(b, 3010);
    assert(switched.resolution == MicroResolution::Purged);
    // The discarded session is not reported as closed
    assert(!switched.closed);
    assert(switched.opened && switched.opened->taskId == b);
    assert(t.service.sessions(a).empty());
}

static void testSwitchWarnsAboutShortSession() {
    std::cout << "[Test] Short session ended by a switch is reported..." << std::endl;
    MicroSessionPolicy noPurge;
    noPurge.purgeEnabled = false;
    Tracker t(noPurge);
    TaskId a = t.addQueued("a");
    TaskId b = t.addQueued("b");

    t.service.startFor(a, 1000);
    auto switched = t.service.startFor(b, 1005);
    assert(switched.resolution == MicroResolution::None);
    assert(switched.closed && switched.closed->taskId == a);
    assert(switched.notices.size() == 1);
    assert(switched.notices[0].find("Micro-session") != std::string::npos);
    assert(t.service.sessions(a).size() == 1);

    // Long sessions pass silently
    auto back = t.service.startFor(a, 1100);
    assert(back.notices.empty());
}

static void testShortSessionStands() {
    std::cout << "[Test] Short session without a resolving start is kept..." << std::endl;
    Tracker t;
    TaskId a = t.addQueued("a");
    TaskId b = t.addQueued("b");

    t.service.startFor(a, 1000);
    t.service.stop(1010);
    auto later = t.service.startFor(b, 1100);
    assert(later.resolution == MicroResolution::None);
    assert(t.service.sessions(a).size() == 1);

    // Same situation purges when the trigger is duration alone
    MicroSessionPolicy byDuration;
    byDuration.purgeTrigger = PurgeTrigger::Duration;
    Tracker d(byDuration);
    TaskId x = d.addQueued("x");
    TaskId y = d.addQueued("y");
    d.service.startFor(x, 1000);
    d.service.stop(1010);
    assert(d.service.startFor(y, 1100).resolution == MicroResolution::Purged);
    assert(d.service.sessions(x).empty());
}

static void testFinalCloseIsNotCorrected() {
    std::cout << "[Test] Sessions closed by completion are final..." << std::endl;
    Tracker t;
    TaskId a = t.addQueued("a");
    TaskId b = t.addQueued("b");

    t.service.startFor(a, 4000);
    t.service.complete(a, 4010);
    auto next = t.service.startFor(b, 4015);
    assert(next.resolution == MicroResolution::None);
    assert(t.service.sessions(a).size() == 1);
    assert(t.service.sessions(a)[0].endTs == 4010);
}

static void testStoppedThenFinishedIsNotCorrected() {
    std::cout << "[Test] Stopped session of a finished task is final..." << std::endl;
    Tracker t;
    TaskId a = t.addQueued("a");
    TaskId b = t.addQueued("b");

    t.service.startFor(a, 5000);
    t.service.stop(5010);
    t.service.complete(a, 5012);
    auto next = t.service.startFor(b, 5020);
    assert(next.resolution == MicroResolution::None);
    assert(t.service.sessions(a).size() == 1);
    assert(t.service.sessions(a)[0].endTs == 5010);
    assert(t.countEvents<MicroSessionPurged>() == 0);

    Tracker c;
    TaskId x = c.addQueued("x");
    TaskId y = c.addQueued("y");
    c.service.startFor(x, 5000);
    c.service.stop(5010);
    c.service.cancel(x, 5012);
    assert(!c.facts().lastBoundary);
    assert(c.service.startFor(y, 5020).resolution == MicroResolution::None);
    assert(c.service.sessions(x).size() == 1);
}

static void testBackfillDoesNotMergeIntoStop() {
    std::cout << "[Test] Overwritten boundary is forgotten..." << std::endl;
    Tracker t;
    TaskId a = t.addQueued("a");
    TaskId b = t.add("b");

    t.service.startFor(a, 1000);
    t.service.stop(1010);
    // The stopped session is replaced by a backfilled one
    t.service.interval(b, 990, 1020, 1020);
    auto resumed = t.service.startFor(a, 1025);
    assert(resumed.resolution == MicroResolution::None);
    assert(t.service.sessions(a).size() == 1);
    assert(t.service.sessions(a)[0].isOpen());
}

int main() {
    std::cout << "[Test] Starting Micro-Session Policy Test..." << std::endl;

    testDecide();
    testMergeIdempotence();
    testPurgeOnSwitch();
    testShortSessionStands();
    testSwitchWarnsAboutShortSession();
    testFinalCloseIsNotCorrected();
    testStoppedThenFinishedIsNotCorrected();
    testBackfillDoesNotMergeIntoStop();

    std::cout << "[PASS] Micro-Session Policy Test" << std::endl;
    return 0;
}
