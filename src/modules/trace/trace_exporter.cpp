// modules/trace/trace_exporter.cpp
#include "trace/trace_exporter.h"

namespace agentrt {

namespace {

double to_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

} // namespace

TraceExporter::TraceExporter(std::string trace_id) : trace_id_(std::move(trace_id)) {}

size_t TraceExporter::on_agent_start(const std::string& agent_name, const std::string& agent_kind, const std::string& branch) {
    TraceRecord record;
    record.trace_id = trace_id_;
    record.agent_name = agent_name;
    record.agent_kind = agent_kind;
    record.branch = branch;
    record.start_time = std::chrono::system_clock::now();
    record.status = "running"; // updated in on_agent_end

    std::lock_guard<std::mutex> lock(mutex_);
    traces_.push_back(std::move(record));
    return traces_.size() - 1;
}

void TraceExporter::on_agent_end(size_t index,
                                 const std::string& status,
                                 int event_count,
                                 const std::optional<std::string>& error_message,
                                 const Value& budget_snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= traces_.size()) return;
    TraceRecord& record = traces_[index];
    record.end_time = std::chrono::system_clock::now();
    record.status = status;
    record.event_count = event_count;
    record.error_message = error_message;
    record.budget_snapshot = budget_snapshot;
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

Value traces_to_json(const std::vector<TraceRecord>& traces) {
    Value arr = Value::array();
    for (const auto& r : traces) {
        Value obj;
        obj["trace_id"] = r.trace_id;
        obj["agent"] = r.agent_name;
        obj["kind"] = r.agent_kind;
        obj["branch"] = r.branch;
        obj["status"] = r.status;
        obj["start_time"] = to_seconds(r.start_time);
        obj["end_time"] = to_seconds(r.end_time);
        obj["event_count"] = r.event_count;
        obj["budget"] = r.budget_snapshot;
        if (r.error_message) obj["error"] = *r.error_message;
        arr.push_back(std::move(obj));
    }
    return arr;
}

} // namespace agentrt
