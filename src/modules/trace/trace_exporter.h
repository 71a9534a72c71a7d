// modules/trace/trace_exporter.h
#ifndef AGENTRT_MODULES_TRACE_TRACE_EXPORTER_H
#define AGENTRT_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/value.h"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentrt {

struct TraceRecord {
    std::string trace_id;       // invocation id
    std::string agent_name;
    std::string agent_kind;
    std::string branch;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status;         // running, success, skipped, cancelled, failed
    std::optional<std::string> error_message;
    int event_count = 0;
    Value budget_snapshot = Value::object();
};

// One exporter per invocation, shared by every derived context. Parallel
// branches report concurrently.
class TraceExporter {
public:
    explicit TraceExporter(std::string trace_id = "t-default");

    // Returns the record index used to close it
    size_t on_agent_start(const std::string& agent_name, const std::string& agent_kind, const std::string& branch);

    void on_agent_end(size_t index,
                      const std::string& status,
                      int event_count,
                      const std::optional<std::string>& error_message = std::nullopt,
                      const Value& budget_snapshot = Value::object());

    std::vector<TraceRecord> get_traces() const;

private:
    std::string trace_id_;
    mutable std::mutex mutex_;
    std::vector<TraceRecord> traces_;
};

Value traces_to_json(const std::vector<TraceRecord>& traces);

} // namespace agentrt

#endif // AGENTRT_MODULES_TRACE_TRACE_EXPORTER_H
