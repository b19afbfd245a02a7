// ==============================================================================
// monitoring.cpp - Отслеживание операций и аудит
// ==============================================================================

#include <fireup/firestore.hpp>
#include <fireup/monitoring.hpp>
#include <fireup/output.hpp>
#include <fireup/platform.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>

namespace fireup::monitoring {

namespace {

void write_string_field(rapidjson::Writer<rapidjson::StringBuffer>& writer, const char* key,
                        const std::string& value) {
    writer.Key(key);
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

}  // namespace

// ============================================================================
// Перечисления и форматирование
// ============================================================================

const char* operation_status_to_string(OperationStatus status) {
    switch (status) {
    case OperationStatus::Started:
        return "started";
    case OperationStatus::InProgress:
        return "in_progress";
    case OperationStatus::Completed:
        return "completed";
    case OperationStatus::Failed:
        return "failed";
    }
    return "unknown";
}

const char* audit_result_to_string(AuditResult result) {
    switch (result) {
    case AuditResult::Success:
        return "success";
    case AuditResult::PartialSuccess:
        return "partial_success";
    case AuditResult::Failure:
        return "failure";
    }
    return "unknown";
}

AuditResult classify_audit_result(std::uint64_t documents, std::uint64_t errors) {
    if (errors == 0) {
        return AuditResult::Success;
    }
    return documents > 0 ? AuditResult::PartialSuccess : AuditResult::Failure;
}

std::string format_timestamp(Clock::time_point tp) {
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    return firestore::DateTime::from_unix_micros(static_cast<std::int64_t>(micros)).to_string();
}

std::string audit_entry_to_json(const AuditEntry& entry) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    write_string_field(writer, "timestamp", format_timestamp(entry.timestamp));
    write_string_field(writer, "operation", entry.operation);
    write_string_field(writer, "resource", entry.resource);
    write_string_field(writer, "result", audit_result_to_string(entry.result));
    if (!entry.message.empty()) {
        write_string_field(writer, "message", entry.message);
    }
    writer.Key("details");
    writer.StartObject();
    for (const auto& [key, value] : entry.details) {
        write_string_field(writer, key.c_str(), value);
    }
    writer.EndObject();
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

// ============================================================================
// WriterProgressSink
// ============================================================================

WriterProgressSink::WriterProgressSink(output::Writer& log,
                                       std::optional<std::filesystem::path> audit_log_path)
    : log_(log), audit_log_path_(std::move(audit_log_path)) {}

std::string WriterProgressSink::operation_started(const std::string& name,
                                                  const Metadata& metadata) {
    OperationMetrics metrics;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics.operation_id = "op-" + std::to_string(next_id_++);
        metrics.operation_name = name;
        metrics.start_time = Clock::now();
        metrics.metadata = metadata;
        active_[metrics.operation_id] = metrics;
    }

    std::string line = "started " + name + " [" + metrics.operation_id + "]";
    for (const auto& [key, value] : metadata) {
        line += " " + key + "=" + value;
    }
    log_.debug(line);
    return metrics.operation_id;
}

void WriterProgressSink::operation_progress(const std::string& operation_id,
                                            std::uint64_t records) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(operation_id);
        if (it == active_.end()) {
            return;
        }
        it->second.records_processed = records;
        it->second.status = OperationStatus::InProgress;
    }
    log_.trace("[" + operation_id + "] processed " + std::to_string(records) + " records");
}

void WriterProgressSink::operation_finished(const std::string& operation_id, bool success,
                                            const std::string& message) {
    OperationMetrics metrics;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(operation_id);
        if (it == active_.end()) {
            return;
        }
        metrics = std::move(it->second);
        active_.erase(it);

        metrics.end_time = Clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            *metrics.end_time - metrics.start_time);
        metrics.duration_ms = static_cast<std::uint64_t>(elapsed.count());
        if (metrics.records_processed && *metrics.duration_ms > 0) {
            metrics.throughput = static_cast<double>(*metrics.records_processed) * 1000.0 /
                                 static_cast<double>(*metrics.duration_ms);
        }
        metrics.status = success ? OperationStatus::Completed : OperationStatus::Failed;
        metrics.message = message;
        completed_.push_back(metrics);
    }

    std::string line = metrics.operation_name + " [" + operation_id + "] " +
                        operation_status_to_string(metrics.status) + " in " +
                        std::to_string(*metrics.duration_ms) + " ms";
    if (!message.empty()) {
        line += " - " + message;
    }
    if (success) {
        log_.debug(line);
    } else {
        log_.warn(line);
    }
}

void WriterProgressSink::audit(const AuditEntry& entry) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        audit_log_.push_back(entry);
        append_audit_line(entry);
    }
    log_.debug("audit " + entry.operation + " '" + entry.resource +
               "': " + audit_result_to_string(entry.result));
}

void WriterProgressSink::on_progress(const std::string& step, std::uint64_t current,
                                     std::uint64_t total) {
    log_.debug("[" + std::to_string(current) + "/" + std::to_string(total) + "] " + step);
}

void WriterProgressSink::append_audit_line(const AuditEntry& entry) {
    if (!audit_log_path_) {
        return;
    }
    std::ofstream file(*audit_log_path_, std::ios::binary | std::ios::app);
    if (!file.is_open()) {
        log_.error("could not open audit log '" + platform::path_to_utf8(*audit_log_path_) + "'");
        return;
    }
    file << audit_entry_to_json(entry) << '\n';
    if (!file) {
        log_.error("failed to write audit log '" + platform::path_to_utf8(*audit_log_path_) +
                   "'");
    }
}

std::optional<OperationMetrics> WriterProgressSink::active_operation(
    const std::string& operation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(operation_id);
    if (it == active_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<OperationMetrics> WriterProgressSink::completed_operations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

std::vector<AuditEntry> WriterProgressSink::audit_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return audit_log_;
}

// ============================================================================
// RecordingProgressSink
// ============================================================================

std::string RecordingProgressSink::operation_started(const std::string& name,
                                                     const Metadata& metadata) {
    std::string id = "op-" + std::to_string(started.size() + 1);
    started.push_back(Started{id, name, metadata});
    return id;
}

void RecordingProgressSink::operation_progress(const std::string& operation_id,
                                               std::uint64_t records) {
    progress.push_back(Progress{operation_id, records});
}

void RecordingProgressSink::operation_finished(const std::string& operation_id, bool success,
                                               const std::string& message) {
    finished.push_back(Finished{operation_id, success, message});
}

void RecordingProgressSink::audit(const AuditEntry& entry) {
    audits.push_back(entry);
}

void RecordingProgressSink::on_progress(const std::string& step, std::uint64_t current,
                                        std::uint64_t total) {
    steps.push_back(Step{step, current, total});
}

}  // namespace fireup::monitoring
