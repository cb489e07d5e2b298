#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/TaskTrackerService.hpp"
#include "domain/TaskError.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonFactStore.hpp"

using namespace taskwalker;
using application::TaskTrackerService;
using domain::ErrorKind;
using domain::QueueClock;
using domain::TaskError;

namespace {

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void PrintUsage() {
    std::cout <<
        "Usage: taskwalker <command> [args]\n"
        "  add <description...>            create a task\n"
        "  annotate <id> <text...>         attach a note\n"
        "  enqueue <id>                    append to the queue\n"
        "  pick <index> [CLOCK]            move queue entry to the front\n"
        "  promote <id>                    move task to the front\n"
        "  roll [n] [CLOCK]                rotate the queue\n"
        "  drop <index|id:N> [CLOCK]       remove from the queue\n"
        "  clear [CLOCK]                   empty the queue\n"
        "  on [id]                         start timing (queue front by default)\n"
        "  off                             stop timing\n"
        "  next [n]                        rotate and keep timing the new front\n"
        "  interval <id> <start> <end>     record a past session (epoch seconds)\n"
        "  send <id> <recipient> [note...] hand off to a third party\n"
        "  collect <id> [position]         take a handed-off task back\n"
        "  done [id] | done --next         complete a task, or the timed one\n"
        "  cancel <id>                     cancel a task\n"
        "  list                            queue and task states\n"
        "  sessions [id]                   recorded sessions, newest first\n"
        "  waiting                         handed-off tasks\n"
        "  show <id>                       one task with its notes\n"
        "\n"
        "CLOCK: --clock-in times the new front, --clock-out stops the timer.\n"
        "Without it a running timer follows the front of the queue.\n";
}

std::int64_t ParseNumber(const std::string& text, const char* what) {
    try {
        std::size_t used = 0;
        std::int64_t value = std::stoll(text, &used);
        if (used == text.size()) return value;
    } catch (const std::logic_error&) {
    }
    throw UsageError(std::string("Invalid ") + what + ": '" + text + "'");
}

int ParseIndex(const std::string& text, const char* what) {
    return domain::QueueEngine::SaturateIndex(ParseNumber(text, what));
}

// Removes --clock-in / --clock-out from @p args.
QueueClock TakeClockFlag(std::vector<std::string>& args) {
    QueueClock clock = QueueClock::Follow;
    std::vector<std::string> rest;
    for (const auto& arg : args) {
        if (arg == "--clock-in") {
            clock = QueueClock::ClockIn;
        } else if (arg == "--clock-out") {
            clock = QueueClock::ClockOut;
        } else {
            rest.push_back(arg);
        }
    }
    args.swap(rest);
    return clock;
}

std::string Join(const std::vector<std::string>& args, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < args.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += args[i];
    }
    return out;
}

const std::string& Arg(const std::vector<std::string>& args, std::size_t i, const char* what) {
    if (i >= args.size()) throw UsageError(std::string("Missing ") + what);
    return args[i];
}

void PrintOutcome(const domain::TimerOutcome& outcome) {
    if (outcome.closed) {
        std::cout << "Stopped task " << outcome.closed->taskId << " ("
                  << outcome.closed->duration(outcome.closed->startTs) << "s)" << std::endl;
    }
    if (outcome.opened) {
        std::cout << "Timing task " << outcome.opened->taskId << std::endl;
    }
}

void PrintSnapshot(const application::TrackerSnapshot& snap) {
    std::cout << "Queue:" << std::endl;
    int position = 0;
    for (const auto& view : snap.queue) {
        std::cout << "  " << position++ << ". [" << view.task.id << "] " << view.task.details.description
                  << " (" << view.classification.label << ")" << std::endl;
    }
    std::cout << "Tasks:" << std::endl;
    for (const auto& view : snap.tasks) {
        std::cout << "  [" << view.task.id << "] " << view.classification.label << " - "
                  << view.task.details.description;
        if (view.waiting) std::cout << " (with " << view.waiting->recipient << ")";
        std::cout << std::endl;
    }
}

void Run(TaskTrackerService& tracker, std::vector<std::string> args) {
    const std::string cmd = args[0];
    const domain::Timestamp now = domain::NowSeconds();

    if (cmd == "add") {
        domain::TaskDetails details;
        details.description = Join(args, 1);
        std::cout << "Created task " << tracker.createTask(details, now) << std::endl;
    } else if (cmd == "annotate") {
        tracker.annotate(ParseNumber(Arg(args, 1, "task id"), "task id"), Join(args, 2), now);
    } else if (cmd == "enqueue") {
        tracker.enqueue(ParseNumber(Arg(args, 1, "task id"), "task id"), now);
    } else if (cmd == "pick") {
        const QueueClock clock = TakeClockFlag(args);
        int index = ParseIndex(Arg(args, 1, "index"), "index");
        PrintOutcome(tracker.pickWithClock(index, clock, now));
        std::cout << "Task " << tracker.select(0) << " is now at the front" << std::endl;
    } else if (cmd == "promote") {
        tracker.promoteToFront(ParseNumber(Arg(args, 1, "task id"), "task id"), now);
    } else if (cmd == "roll") {
        const QueueClock clock = TakeClockFlag(args);
        int n = args.size() > 1 ? ParseIndex(args[1], "count") : 1;
        PrintOutcome(tracker.rotateWithClock(n, clock, now));
    } else if (cmd == "drop") {
        const QueueClock clock = TakeClockFlag(args);
        const std::string& ref = Arg(args, 1, "index or id:N");
        domain::QueueRef target = ref.rfind("id:", 0) == 0
            ? domain::QueueRef{ParseNumber(ref.substr(3), "task id")}
            : domain::QueueRef{domain::QueueIndex{ParseIndex(ref, "index")}};
        PrintOutcome(tracker.removeWithClock(target, clock, now));
    } else if (cmd == "clear") {
        PrintOutcome(tracker.clearWithClock(TakeClockFlag(args), now));
    } else if (cmd == "on") {
        PrintOutcome(args.size() > 1 ? tracker.startFor(ParseNumber(args[1], "task id"), now)
                                     : tracker.startDefault(now));
    } else if (cmd == "off") {
        PrintOutcome(tracker.stop(now));
    } else if (cmd == "next") {
        int n = args.size() > 1 ? ParseIndex(args[1], "count") : 1;
        PrintOutcome(tracker.next(n, now));
    } else if (cmd == "interval") {
        auto id = ParseNumber(Arg(args, 1, "task id"), "task id");
        auto start = ParseNumber(Arg(args, 2, "start"), "start");
        auto end = ParseNumber(Arg(args, 3, "end"), "end");
        auto session = tracker.interval(id, start, end, now);
        std::cout << "Recorded session " << session.id << " (" << session.duration(end) << "s)" << std::endl;
    } else if (cmd == "send") {
        auto id = ParseNumber(Arg(args, 1, "task id"), "task id");
        const std::string& recipient = Arg(args, 2, "recipient");
        std::optional<std::string> note;
        if (args.size() > 3) note = Join(args, 3);
        tracker.send(id, recipient, note, now);
    } else if (cmd == "collect") {
        auto id = ParseNumber(Arg(args, 1, "task id"), "task id");
        int position = args.size() > 2 ? ParseIndex(args[2], "position") : 0;
        tracker.recall(id, position, now);
    } else if (cmd == "done") {
        if (args.size() > 1 && args[1] != "--next") {
            PrintOutcome(tracker.complete(ParseNumber(args[1], "task id"), now));
        } else {
            PrintOutcome(tracker.completeCurrent(args.size() > 1, now));
        }
    } else if (cmd == "cancel") {
        PrintOutcome(tracker.cancel(ParseNumber(Arg(args, 1, "task id"), "task id"), now));
    } else if (cmd == "list") {
        PrintSnapshot(tracker.snapshot());
    } else if (cmd == "sessions") {
        std::optional<domain::TaskId> id;
        if (args.size() > 1) id = ParseNumber(args[1], "task id");
        for (const auto& s : tracker.sessions(id)) {
            std::cout << "  #" << s.id << " task " << s.taskId << " " << s.startTs << " - ";
            if (s.endTs) std::cout << *s.endTs; else std::cout << "running";
            std::cout << " (" << s.duration(now) << "s)" << std::endl;
        }
    } else if (cmd == "waiting") {
        for (const auto& r : tracker.waitingExternals()) {
            std::cout << "  task " << r.taskId << " with " << r.recipient;
            if (r.note) std::cout << ": " << *r.note;
            std::cout << std::endl;
        }
    } else if (cmd == "show") {
        auto id = ParseNumber(Arg(args, 1, "task id"), "task id");
        auto t = tracker.task(id);
        std::cout << "[" << t.id << "] " << t.details.description << " ("
                  << tracker.classify(id).label << ")" << std::endl;
        for (const auto& a : tracker.annotations(id)) {
            std::cout << "  " << a.entryTs << " " << a.note << std::endl;
        }
    } else {
        throw UsageError("Unknown command '" + cmd + "'");
    }
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "help" || args[0] == "--help") {
        PrintUsage();
        return args.empty() ? 1 : 0;
    }

    try {
        auto settings = infrastructure::ConfigLoader::LoadDefault();
        auto store = std::make_shared<infrastructure::JsonFactStore>(settings.dataLocation);
        TaskTrackerService tracker(store, settings.policy, settings.classification);
        Run(tracker, args);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        PrintUsage();
        return 1;
    } catch (const TaskError& e) {
        if (e.isSystemFault()) {
            std::cerr << "Internal error: " << e.what() << std::endl;
            return 2;
        }
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Internal error: " << e.what() << std::endl;
        return 2;
    }
    return 0;
}
