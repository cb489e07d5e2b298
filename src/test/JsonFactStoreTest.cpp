#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "TestSupport.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonFactStore.hpp"

using namespace taskwalker::test;
using taskwalker::application::TaskTrackerService;
using taskwalker::infrastructure::ConfigLoader;
using taskwalker::infrastructure::JsonFactStore;

namespace fs = std::filesystem;

static fs::path MakeTestRoot(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path root = fs::temp_directory_path() / ("taskwalker_" + name + "_" + std::to_string(stamp));
    fs::create_directories(root);
    return root;
}

static void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

static void testRoundTrip(const fs::path& root) {
    std::cout << "[Test] Facts survive a reload..." << std::endl;
    const fs::path dataDir = root / "data";

    TaskId a = 0;
    TaskId b = 0;
    {
        auto store = std::make_shared<JsonFactStore>(dataDir);
        TaskTrackerService service(store, MicroSessionPolicy{}, ClassificationTable::Defaults());

        TaskDetails details;
        details.description = "prepare slides";
        details.project = std::string("talk");
        details.tags = {"deck"};
        details.allocSecs = 3600;
        a = service.createTask(details, 10);
        b = service.createTask(TaskDetails{"book venue"}, 11);
        service.enqueue(a, 12);
        service.enqueue(b, 13);
        service.startDefault(100);
        service.stop(200);
        service.annotate(a, "first pass", 210);
        service.send(b, "frank", std::string("quote"), 220);
        service.startFor(a, 300);
    }

    auto reopened = std::make_shared<JsonFactStore>(dataDir);
    FactSet facts = reopened->load();
    assert(facts.tasks.size() == 2);
    assert(facts.task(a).details.description == "prepare slides");
    assert(facts.task(a).details.project == std::string("talk"));
    assert(facts.task(a).details.allocSecs == 3600);
    assert(facts.task(a).queuePosition == 0);
    assert(!facts.task(b).isQueued());
    assert(facts.waitingRecord(b) && facts.waitingRecord(b)->note == std::string("quote"));
    assert(facts.openSession() && facts.openSession()->taskId == a);
    assert(facts.sessionsFor(a).size() == 2);
    assert(facts.annotations.size() == 1);
    assert(facts.nextTaskId == 3);

    TaskTrackerService service(reopened, MicroSessionPolicy{}, ClassificationTable::Defaults());
    assert(service.classify(a).status == Status::Active);
    assert(service.classify(b).status == Status::External);
    TaskId c = service.createTask(TaskDetails{"third"}, 400);
    assert(c == 3);

    // Journal: one JSON object per line
    std::ifstream journal(reopened->journalPath());
    std::string line;
    int lines = 0;
    bool sawSend = false;
    while (std::getline(journal, line)) {
        auto j = nlohmann::json::parse(line);
        assert(j.contains("type") && j.contains("task") && j.contains("ts") && j.contains("data"));
        if (j["type"] == "ExternalSent") {
            sawSend = true;
            assert(j["data"]["recipient"] == "frank");
        }
        ++lines;
    }
    assert(lines > 0);
    assert(sawSend);
}

static void testCorruptStore(const fs::path& root) {
    std::cout << "[Test] Corrupt facts file is a system fault..." << std::endl;
    const fs::path dataDir = root / "corrupt";
    fs::create_directories(dataDir);
    WriteFile(dataDir / "facts.json", "{ not json");

    auto store = std::make_shared<JsonFactStore>(dataDir);
    assert(ThrowsKind([&] { store->load(); }, ErrorKind::StoreUnavailable));

    TaskTrackerService service(store, MicroSessionPolicy{}, ClassificationTable::Defaults());
    try {
        service.createTask(TaskDetails{"x"}, 1);
        assert(false && "createTask should fail on a corrupt store");
    } catch (const TaskError& e) {
        assert(e.isSystemFault());
    }

    WriteFile(dataDir / "facts.json", R"({"version": 7})");
    assert(ThrowsKind([&] { store->load(); }, ErrorKind::StoreUnavailable));

    // Well-formed JSON, but two sessions are running at once.
    WriteFile(dataDir / "facts.json", R"({
        "version": 1,
        "tasks": [
            {"id": 1, "lifecycle": "open", "queue_position": 0, "description": "a", "created": 10},
            {"id": 2, "lifecycle": "open", "queue_position": 1, "description": "b", "created": 10}
        ],
        "sessions": [
            {"id": 1, "task": 1, "start": 100, "end": null},
            {"id": 2, "task": 2, "start": 200, "end": null}
        ]
    })");
    try {
        store->load();
        assert(false && "load should reject two open sessions");
    } catch (const TaskError& e) {
        assert(e.kind() == ErrorKind::StoreUnavailable);
        assert(std::string(e.what()).find("at most one may run") != std::string::npos);
    }
}

static void testLockIsReleased(const fs::path& root) {
    std::cout << "[Test] Write lock is released on scope exit..." << std::endl;
    JsonFactStore store(root / "locked");
    { auto lock = store.acquireWriteLock(); }
    { auto lock = store.acquireWriteLock(); }
    assert(fs::exists(store.lockPath()));
}

static void testConfig(const fs::path& root) {
    std::cout << "[Test] Settings file..." << std::endl;

    auto defaults = ConfigLoader::Load(root / "missing.json");
    assert(defaults.policy.thresholdSecs == 30);
    assert(defaults.policy.purgeTrigger == PurgeTrigger::DurationAndGap);
    assert(defaults.classification.size() == 20);

    const fs::path settings = root / "settings.json";
    WriteFile(settings, R"({
        "data_location": "/tmp/taskwalker-data",
        "micro_session_seconds": 60,
        "micro_merge": false,
        "purge_trigger": "gap",
        "classification": [
            {"tier": "open", "queued": false, "history": false, "status": "planned", "label": "inbox", "color": "white"},
            {"tier": "bogus", "status": "planned"}
        ]
    })");
    auto loaded = ConfigLoader::Load(settings);
    assert(loaded.dataLocation == fs::path("/tmp/taskwalker-data"));
    assert(loaded.policy.thresholdSecs == 60);
    assert(!loaded.policy.mergeEnabled);
    assert(loaded.policy.purgeEnabled);
    assert(loaded.policy.purgeTrigger == PurgeTrigger::Gap);

    TaskFacts fresh;
    const Classification& row = Classify(fresh, loaded.classification);
    assert(row.status == Status::Planned && row.label == "inbox" && row.color == "white");
    assert(row.sortOrder == 0);

    WriteFile(settings, R"({"purge_trigger": "sometimes", "micro_session_seconds": 45})");
    auto unknownTrigger = ConfigLoader::Load(settings);
    assert(unknownTrigger.policy.purgeTrigger == PurgeTrigger::DurationAndGap);
    assert(unknownTrigger.policy.thresholdSecs == 45);

    WriteFile(settings, "{ broken");
    auto malformed = ConfigLoader::Load(settings);
    assert(malformed.policy.thresholdSecs == 30);

    WriteFile(settings, R"({"micro_session_seconds": "soon"})");
    auto wrongType = ConfigLoader::Load(settings);
    assert(wrongType.policy.thresholdSecs == 30);
}

int main() {
    std::cout << "[Test] Starting JSON Fact Store Test..." << std::endl;

    const fs::path root = MakeTestRoot("store");
    testRoundTrip(root);
    testCorruptStore(root);
    testLockIsReleased(root);
    testConfig(root);

    std::error_code ec;
    fs::remove_all(root, ec);

    std::cout << "[PASS] JSON Fact Store Test" << std::endl;
    return 0;
}
