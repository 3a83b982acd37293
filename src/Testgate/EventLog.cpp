// =================================================================
// src/Testgate/EventLog.cpp
// =================================================================

#include "Testgate/EventLog.hpp"
#include "Testgate/Logger.hpp"
#include "Testgate/StringUtils.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace Testgate {

std::string eventTypeName(EventType type) {
    switch (type) {
        case EventType::STARTED: return "started";
        case EventType::LOG: return "log";
        case EventType::FILE_WRITE: return "fileWrite";
        case EventType::COMPLETED: return "completed";
    }
    return "unknown";
}

std::string eventLevelName(EventLevel level) {
    switch (level) {
        case EventLevel::INFO: return "info";
        case EventLevel::WARN: return "warn";
        case EventLevel::ERROR: return "error";
    }
    return "info";
}

long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

TaskEvent TaskEvent::started(const std::string& task_id, const std::string& label, const std::string& detail) {
    TaskEvent event;
    event.type = EventType::STARTED;
    event.task_id = task_id;
    event.timestamp_ms = nowMs();
    event.label = label;
    event.detail = detail;
    return event;
}

TaskEvent TaskEvent::log(const std::string& task_id, EventLevel level, const std::string& message) {
    TaskEvent event;
    event.type = EventType::LOG;
    event.task_id = task_id;
    event.timestamp_ms = nowMs();
    event.level = level;
    event.message = message;
    return event;
}

TaskEvent TaskEvent::fileWrite(const std::string& task_id, const std::string& path) {
    TaskEvent event;
    event.type = EventType::FILE_WRITE;
    event.task_id = task_id;
    event.timestamp_ms = nowMs();
    event.path = path;
    return event;
}

TaskEvent TaskEvent::completed(const std::string& task_id, int exit_code, bool has_exit_code) {
    TaskEvent event;
    event.type = EventType::COMPLETED;
    event.task_id = task_id;
    event.timestamp_ms = nowMs();
    event.exit_code = exit_code;
    event.has_exit_code = has_exit_code;
    return event;
}

JsonlEventSink::JsonlEventSink(const std::string& storage_dir)
    : m_storage_dir(storage_dir.empty() ? ".testgate" : storage_dir) {
}

std::string JsonlEventSink::eventLogPath(const std::string& task_id) const {
    return (fs::path(m_storage_dir) / "events" / (sanitizeTaskId(task_id) + ".jsonl")).string();
}

std::string JsonlEventSink::toJsonLine(const TaskEvent& event) {
    nlohmann::json line = {
        {"type", eventTypeName(event.type)},
        {"taskId", event.task_id},
        {"timestampMs", event.timestamp_ms}
    };

    switch (event.type) {
        case EventType::STARTED:
            line["label"] = event.label;
            if (!event.detail.empty()) {
                line["detail"] = event.detail;
            }
            break;
        case EventType::LOG:
            line["level"] = eventLevelName(event.level);
            line["message"] = event.message;
            break;
        case EventType::FILE_WRITE:
            line["path"] = event.path;
            break;
        case EventType::COMPLETED:
            if (event.has_exit_code) {
                line["exitCode"] = event.exit_code;
            } else {
                line["exitCode"] = nullptr;
            }
            break;
    }

    // Invalid UTF-8 in agent output must not abort serialization
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void JsonlEventSink::append(const TaskEvent& event) {
    mirrorToLogger(event);

    try {
        std::string path = eventLogPath(event.task_id);
        fs::create_directories(fs::path(path).parent_path());

        std::ofstream out(path, std::ios::binary | std::ios::app);
        if (!out) {
            TESTGATE_LOG_WARNING("EventLog", "Cannot open event log: " + path);
            return;
        }
        out << toJsonLine(event) << "\n";
    } catch (const std::exception& e) {
        TESTGATE_LOG_WARNING("EventLog", std::string("Failed to append event: ") + e.what());
    }
}

void JsonlEventSink::mirrorToLogger(const TaskEvent& event) const {
    Logger& logger = Logger::getInstance();
    const std::string context = "Task: " + event.task_id;

    switch (event.type) {
        case EventType::STARTED:
            logger.info("Task", "Started " + event.label, context);
            break;
        case EventType::LOG:
            if (event.level == EventLevel::ERROR) {
                logger.error("Task", event.message, context);
            } else if (event.level == EventLevel::WARN) {
                logger.warning("Task", event.message, context);
            } else {
                logger.info("Task", event.message, context);
            }
            break;
        case EventType::FILE_WRITE:
            logger.debug("Task", "Wrote " + event.path, context);
            break;
        case EventType::COMPLETED:
            logger.info("Task", "Completed with exit code " +
                        (event.has_exit_code ? std::to_string(event.exit_code) : std::string("none")),
                        context);
            break;
    }
}

} // namespace Testgate
