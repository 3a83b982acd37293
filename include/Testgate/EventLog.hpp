// =================================================================
// include/Testgate/EventLog.hpp
// =================================================================
// Task progress events and the append-only sinks that record them.

#pragma once

#include <string>
#include <vector>

namespace Testgate {

enum class EventType {
    STARTED,
    LOG,
    FILE_WRITE,
    COMPLETED
};

enum class EventLevel {
    INFO,
    WARN,
    ERROR
};

std::string eventTypeName(EventType type);
std::string eventLevelName(EventLevel level);

/**
 * @brief A single progress event of a task
 *
 * Which fields are meaningful depends on `type`:
 * STARTED uses label/detail, LOG uses level/message, FILE_WRITE uses
 * path, COMPLETED uses exit_code (has_exit_code is false when the
 * process ended without one).
 */
struct TaskEvent {
    EventType type;
    std::string task_id;
    long long timestamp_ms;
    EventLevel level;
    std::string message;
    std::string path;
    int exit_code;
    bool has_exit_code;
    std::string label;
    std::string detail;

    TaskEvent() : type(EventType::LOG), timestamp_ms(0), level(EventLevel::INFO),
                  exit_code(0), has_exit_code(false) {}

    static TaskEvent started(const std::string& task_id, const std::string& label,
                             const std::string& detail = "");
    static TaskEvent log(const std::string& task_id, EventLevel level, const std::string& message);
    static TaskEvent fileWrite(const std::string& task_id, const std::string& path);
    static TaskEvent completed(const std::string& task_id, int exit_code, bool has_exit_code = true);
};

long long nowMs();

/**
 * @brief Append-only event sink. Calls are fire-and-forget.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void append(const TaskEvent& event) = 0;

    /**
     * @brief Shorthand for appending a LOG event
     */
    void log(const std::string& task_id, EventLevel level, const std::string& message) {
        append(TaskEvent::log(task_id, level, message));
    }
};

/**
 * @brief Writes one JSON object per line to <storage>/events/<taskId>.jsonl
 *
 * Every event is mirrored to the Logger. Write failures are logged and
 * otherwise ignored.
 */
class JsonlEventSink : public EventSink {
public:
    explicit JsonlEventSink(const std::string& storage_dir = ".testgate");

    void append(const TaskEvent& event) override;

    std::string eventLogPath(const std::string& task_id) const;

    /**
     * @brief Serialize an event to a single-line JSON string
     */
    static std::string toJsonLine(const TaskEvent& event);

private:
    std::string m_storage_dir;

    void mirrorToLogger(const TaskEvent& event) const;
};

/**
 * @brief Keeps events in memory, used where no persistent log is wanted
 */
class MemoryEventSink : public EventSink {
public:
    void append(const TaskEvent& event) override { m_events.push_back(event); }

    const std::vector<TaskEvent>& getEvents() const { return m_events; }
    void clear() { m_events.clear(); }

private:
    std::vector<TaskEvent> m_events;
};

} // namespace Testgate
