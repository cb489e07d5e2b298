/**
 * @file JsonFactStore.cpp
 * @brief Implementation of JsonFactStore.
 */

#include "infrastructure/JsonFactStore.hpp"

#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>
#include <system_error>
#include <type_traits>

#include "domain/TaskError.hpp"
#include "domain/services/InvariantGuard.hpp"
#include "infrastructure/FileLock.hpp"

namespace taskwalker::infrastructure {

using json = nlohmann::json;
using namespace taskwalker::domain;

namespace {

constexpr int kFormatVersion = 1;

template <typename T>
json Optional(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> OptionalFrom(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<T>();
}

json TaskToJson(const Task& t) {
    return {
        {"id", t.id},
        {"lifecycle", LifecycleToString(t.lifecycle)},
        {"queue_position", Optional(t.queuePosition)},
        {"description", t.details.description},
        {"project", Optional(t.details.project)},
        {"tags", t.details.tags},
        {"due", Optional(t.details.dueTs)},
        {"scheduled", Optional(t.details.scheduledTs)},
        {"wait", Optional(t.details.waitTs)},
        {"alloc_secs", Optional(t.details.allocSecs)},
        {"created", t.createdTs},
        {"modified", t.modifiedTs}
    };
}

Task TaskFromJson(const json& j) {
    Task t;
    t.id = j.at("id").get<TaskId>();
    t.lifecycle = LifecycleFromString(j.value("lifecycle", "open"));
    t.queuePosition = OptionalFrom<int>(j, "queue_position");
    t.details.description = j.value("description", "");
    t.details.project = OptionalFrom<std::string>(j, "project");
    t.details.tags = j.value("tags", std::vector<std::string>{});
    t.details.dueTs = OptionalFrom<Timestamp>(j, "due");
    t.details.scheduledTs = OptionalFrom<Timestamp>(j, "scheduled");
    t.details.waitTs = OptionalFrom<Timestamp>(j, "wait");
    t.details.allocSecs = OptionalFrom<std::int64_t>(j, "alloc_secs");
    t.createdTs = j.value("created", Timestamp{0});
    t.modifiedTs = j.value("modified", t.createdTs);
    return t;
}

json SessionToJson(const WorkSession& s) {
    return {
        {"id", s.id},
        {"task", s.taskId},
        {"start", s.startTs},
        {"end", Optional(s.endTs)}
    };
}

WorkSession SessionFromJson(const json& j) {
    WorkSession s;
    s.id = j.at("id").get<SessionId>();
    s.taskId = j.at("task").get<TaskId>();
    s.startTs = j.at("start").get<Timestamp>();
    s.endTs = OptionalFrom<Timestamp>(j, "end");
    return s;
}

json ExternalToJson(const ExternalRecord& r) {
    return {
        {"id", r.id},
        {"task", r.taskId},
        {"recipient", r.recipient},
        {"note", Optional(r.note)},
        {"sent_at", r.sentAt},
        {"status", ExternalStatusToString(r.status)},
        {"returned_at", Optional(r.returnedAt)}
    };
}

ExternalRecord ExternalFromJson(const json& j) {
    ExternalRecord r;
    r.id = j.at("id").get<std::int64_t>();
    r.taskId = j.at("task").get<TaskId>();
    r.recipient = j.value("recipient", "");
    r.note = OptionalFrom<std::string>(j, "note");
    r.sentAt = j.value("sent_at", Timestamp{0});
    r.status = ExternalStatusFromString(j.value("status", "waiting"));
    r.returnedAt = OptionalFrom<Timestamp>(j, "returned_at");
    return r;
}

json AnnotationToJson(const Annotation& a) {
    return {
        {"id", a.id},
        {"task", a.taskId},
        {"session", Optional(a.sessionId)},
        {"note", a.note},
        {"entry", a.entryTs}
    };
}

Annotation AnnotationFromJson(const json& j) {
    Annotation a;
    a.id = j.at("id").get<std::int64_t>();
    a.taskId = j.at("task").get<TaskId>();
    a.sessionId = OptionalFrom<SessionId>(j, "session");
    a.note = j.value("note", "");
    a.entryTs = j.value("entry", Timestamp{0});
    return a;
}

json FactsToJson(const FactSet& facts) {
    json j;
    j["version"] = kFormatVersion;
    j["next_ids"] = {
        {"task", facts.nextTaskId},
        {"session", facts.nextSessionId},
        {"external", facts.nextExternalId},
        {"annotation", facts.nextAnnotationId}
    };

    j["tasks"] = json::array();
    for (const auto& [id, t] : facts.tasks) j["tasks"].push_back(TaskToJson(t));
    j["sessions"] = json::array();
    for (const auto& [id, s] : facts.sessions) j["sessions"].push_back(SessionToJson(s));
    j["externals"] = json::array();
    for (const auto& [id, r] : facts.externals) j["externals"].push_back(ExternalToJson(r));
    j["annotations"] = json::array();
    for (const auto& [id, a] : facts.annotations) j["annotations"].push_back(AnnotationToJson(a));

    if (facts.lastBoundary) {
        j["last_boundary"] = {
            {"session", facts.lastBoundary->sessionId},
            {"task", facts.lastBoundary->taskId},
            {"closed_at", facts.lastBoundary->closedAt}
        };
    } else {
        j["last_boundary"] = nullptr;
    }
    return j;
}

FactSet FactsFromJson(const json& j) {
    const int version = j.value("version", 0);
    if (version != kFormatVersion) {
        throw TaskError(ErrorKind::StoreUnavailable,
                        "Unsupported facts.json version " + std::to_string(version));
    }

    FactSet facts;
    for (const auto& item : j.value("tasks", json::array())) {
        Task t = TaskFromJson(item);
        facts.tasks[t.id] = t;
    }
    for (const auto& item : j.value("sessions", json::array())) {
        WorkSession s = SessionFromJson(item);
        facts.sessions[s.id] = s;
    }
    for (const auto& item : j.value("externals", json::array())) {
        ExternalRecord r = ExternalFromJson(item);
        facts.externals[r.id] = r;
    }
    for (const auto& item : j.value("annotations", json::array())) {
        Annotation a = AnnotationFromJson(item);
        facts.annotations[a.id] = a;
    }

    const json ids = j.value("next_ids", json::object());
    facts.nextTaskId = ids.value("task", TaskId{1});
    facts.nextSessionId = ids.value("session", SessionId{1});
    facts.nextExternalId = ids.value("external", std::int64_t{1});
    facts.nextAnnotationId = ids.value("annotation", std::int64_t{1});

    // Never hand out an id that is already taken, even if next_ids is stale.
    if (!facts.tasks.empty()) facts.nextTaskId = std::max(facts.nextTaskId, facts.tasks.rbegin()->first + 1);
    if (!facts.sessions.empty()) facts.nextSessionId = std::max(facts.nextSessionId, facts.sessions.rbegin()->first + 1);
    if (!facts.externals.empty()) facts.nextExternalId = std::max(facts.nextExternalId, facts.externals.rbegin()->first + 1);
    if (!facts.annotations.empty()) facts.nextAnnotationId = std::max(facts.nextAnnotationId, facts.annotations.rbegin()->first + 1);

    if (j.contains("last_boundary") && !j["last_boundary"].is_null()) {
        const json& b = j["last_boundary"];
        facts.lastBoundary = SessionBoundary{
            b.at("session").get<SessionId>(),
            b.at("task").get<TaskId>(),
            b.at("closed_at").get<Timestamp>()
        };
    }
    return facts;
}

json EventToJson(const TaskEvent& event) {
    return std::visit([](auto&& e) -> json {
        using T = std::decay_t<decltype(e)>;
        json data = json::object();

        if constexpr (std::is_same_v<T, TaskCreated> || std::is_same_v<T, TaskDetailsUpdated>) {
            data = {{"description", e.description}};
        }
        else if constexpr (std::is_same_v<T, TaskQueued>) {
            data = {{"position", e.position}};
        }
        else if constexpr (std::is_same_v<T, QueueReordered>) {
            data = {{"order", e.order}};
        }
        else if constexpr (std::is_same_v<T, SessionOpened>) {
            data = {{"session", e.sessionId}, {"start", e.startTs}};
        }
        else if constexpr (std::is_same_v<T, SessionClosed>) {
            data = {{"session", e.sessionId}, {"start", e.startTs}, {"end", e.endTs}};
        }
        else if constexpr (std::is_same_v<T, SessionAmended>) {
            data = {
                {"session", e.sessionId},
                {"old_start", e.oldStartTs},
                {"old_end", Optional(e.oldEndTs)},
                {"new_start", e.newStartTs},
                {"new_end", Optional(e.newEndTs)}
            };
        }
        else if constexpr (std::is_same_v<T, SessionRemoved>) {
            data = {{"session", e.sessionId}};
        }
        else if constexpr (std::is_same_v<T, MicroSessionMerged>) {
            data = {{"session", e.sessionId}, {"gap_secs", e.gapSecs}};
        }
        else if constexpr (std::is_same_v<T, MicroSessionPurged>) {
            data = {{"session", e.sessionId}, {"duration_secs", e.durationSecs}};
        }
        else if constexpr (std::is_same_v<T, ExternalSent>) {
            data = {{"recipient", e.recipient}, {"note", Optional(e.note)}};
        }
        else if constexpr (std::is_same_v<T, ExternalReturned>) {
            data = {{"recipient", e.recipient}};
        }
        else if constexpr (std::is_same_v<T, LifecycleChanged>) {
            data = {
                {"old", LifecycleToString(e.oldLifecycle)},
                {"new", LifecycleToString(e.newLifecycle)}
            };
        }
        else if constexpr (std::is_same_v<T, TaskAnnotated>) {
            data = {{"annotation", e.annotationId}, {"session", Optional(e.sessionId)}};
        }

        return {{"type", T::Type}, {"task", e.taskId}, {"ts", e.timestamp}, {"data", data}};
    }, event);
}

} // namespace

JsonFactStore::JsonFactStore(std::filesystem::path dataDir)
    : m_dataDir(std::move(dataDir)) {}

void JsonFactStore::ensureDataDir() const {
    std::error_code ec;
    std::filesystem::create_directories(m_dataDir, ec);
    if (ec) {
        throw TaskError(ErrorKind::StoreUnavailable,
                        "Cannot create data directory " + m_dataDir.string() + ": " + ec.message());
    }
}

std::unique_ptr<WriteLock> JsonFactStore::acquireWriteLock() {
    ensureDataDir();
    return std::make_unique<FileLock>(lockPath());
}

FactSet JsonFactStore::load() {
    const auto path = factsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            throw TaskError(ErrorKind::StoreUnavailable, "Cannot stat " + path.string() + ": " + ec.message());
        }
        return FactSet{};
    }

    const std::string text = m_persistence.readText(path);
    FactSet facts;
    try {
        facts = FactsFromJson(json::parse(text));
    } catch (const json::exception& e) {
        throw TaskError(ErrorKind::StoreUnavailable, "Corrupt " + path.string() + ": " + e.what());
    }

    const std::vector<std::string> violations = InvariantGuard::FindViolations(facts);
    if (!violations.empty()) {
        std::cerr << "[JsonFactStore] " << violations.size() << " invariant violation(s) in " << path << std::endl;
        throw TaskError(ErrorKind::StoreUnavailable, "Corrupt " + path.string() + ": " + violations.front());
    }
    return facts;
}

void JsonFactStore::commit(const FactSet& facts, const EventLog& events) {
    m_persistence.writeAtomic(factsPath(), FactsToJson(facts).dump(2));

    if (events.empty()) return;
    std::string lines;
    for (const auto& event : events) {
        lines += EventToJson(event).dump();
        lines += '\n';
    }
    // The snapshot is already durable; a journal gap is reported, not rolled back.
    if (!m_persistence.appendText(journalPath(), lines)) {
        std::cerr << "[JsonFactStore] " << events.size() << " event(s) missing from "
                  << journalPath() << std::endl;
    }
}

} // namespace taskwalker::infrastructure
