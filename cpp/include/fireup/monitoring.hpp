// ==============================================================================
// fireup/monitoring.hpp - Отслеживание операций и аудит
// ==============================================================================
//
// Назначение:
// - ProgressSink: интерфейс, через который парсер сообщает о ходе работы
//   (начало операции, прогресс, завершение, запись аудита)
// - WriterProgressSink: пишет события через output::Writer, хранит метрики
//   операций и дописывает записи аудита в JSON Lines файл
// - RecordingProgressSink: хранит события в памяти
//
// Глобального состояния нет: sink передаётся парсеру явно.
//
// ==============================================================================

#ifndef FIREUP_MONITORING_HPP
#define FIREUP_MONITORING_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fireup::output {
class Writer;
}

namespace fireup::monitoring {

using Clock = std::chrono::system_clock;
using Metadata = std::map<std::string, std::string>;

// ============================================================================
// Операции
// ============================================================================

enum class OperationStatus { Started, InProgress, Completed, Failed };

const char* operation_status_to_string(OperationStatus status);

struct OperationMetrics {
    std::string operation_id;
    std::string operation_name;
    Clock::time_point start_time;
    std::optional<Clock::time_point> end_time;
    std::optional<std::uint64_t> duration_ms;
    std::optional<std::uint64_t> records_processed;
    std::optional<double> throughput;  // записей в секунду
    OperationStatus status = OperationStatus::Started;
    Metadata metadata;
    std::string message;
};

// ============================================================================
// Аудит
// ============================================================================

enum class AuditResult { Success, PartialSuccess, Failure };

const char* audit_result_to_string(AuditResult result);

struct AuditEntry {
    std::string operation;  // "parse_backup"
    std::string resource;   // путь к файлу
    Metadata details;
    AuditResult result = AuditResult::Success;
    std::string message;
    Clock::time_point timestamp = Clock::now();
};

/// Успех без ошибок; частичный успех если есть ошибки и хотя бы один документ;
/// иначе неудача
AuditResult classify_audit_result(std::uint64_t documents, std::uint64_t errors);

/// ISO 8601 в UTC
std::string format_timestamp(Clock::time_point tp);

/// Запись аудита одной JSON строкой (без перевода строки)
std::string audit_entry_to_json(const AuditEntry& entry);

// ============================================================================
// ProgressSink
// ============================================================================

class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    /// @return Идентификатор операции
    virtual std::string operation_started(const std::string& name, const Metadata& metadata) = 0;

    virtual void operation_progress(const std::string& operation_id, std::uint64_t records) = 0;

    virtual void operation_finished(const std::string& operation_id, bool success,
                                    const std::string& message) = 0;

    virtual void audit(const AuditEntry& entry) = 0;

    /// Шаг многошаговой проверки (валидатор)
    virtual void on_progress(const std::string& step, std::uint64_t current,
                             std::uint64_t total) {
        (void)step;
        (void)current;
        (void)total;
    }
};

// ----------------------------------------------------------------------------
// WriterProgressSink
// ----------------------------------------------------------------------------

class WriterProgressSink : public ProgressSink {
public:
    /// @param log Журнал (должен пережить sink)
    /// @param audit_log_path JSON Lines файл для аудита
    explicit WriterProgressSink(output::Writer& log,
                                std::optional<std::filesystem::path> audit_log_path = std::nullopt);

    WriterProgressSink(const WriterProgressSink&) = delete;
    WriterProgressSink& operator=(const WriterProgressSink&) = delete;

    std::string operation_started(const std::string& name, const Metadata& metadata) override;
    void operation_progress(const std::string& operation_id, std::uint64_t records) override;
    void operation_finished(const std::string& operation_id, bool success,
                            const std::string& message) override;
    void audit(const AuditEntry& entry) override;
    void on_progress(const std::string& step, std::uint64_t current, std::uint64_t total) override;

    /// Метрики активной операции (nullopt если не найдена)
    std::optional<OperationMetrics> active_operation(const std::string& operation_id) const;

    std::vector<OperationMetrics> completed_operations() const;
    std::vector<AuditEntry> audit_entries() const;

private:
    output::Writer& log_;
    std::optional<std::filesystem::path> audit_log_path_;

    mutable std::mutex mutex_;
    std::uint64_t next_id_ = 1;
    std::map<std::string, OperationMetrics> active_;
    std::vector<OperationMetrics> completed_;
    std::vector<AuditEntry> audit_log_;

    void append_audit_line(const AuditEntry& entry);
};

// ----------------------------------------------------------------------------
// RecordingProgressSink
// ----------------------------------------------------------------------------

class RecordingProgressSink : public ProgressSink {
public:
    struct Started {
        std::string id;
        std::string name;
        Metadata metadata;
    };

    struct Progress {
        std::string id;
        std::uint64_t records = 0;
    };

    struct Finished {
        std::string id;
        bool success = false;
        std::string message;
    };

    struct Step {
        std::string step;
        std::uint64_t current = 0;
        std::uint64_t total = 0;
    };

    std::string operation_started(const std::string& name, const Metadata& metadata) override;
    void operation_progress(const std::string& operation_id, std::uint64_t records) override;
    void operation_finished(const std::string& operation_id, bool success,
                            const std::string& message) override;
    void audit(const AuditEntry& entry) override;
    void on_progress(const std::string& step, std::uint64_t current, std::uint64_t total) override;

    std::vector<Started> started;
    std::vector<Progress> progress;
    std::vector<Finished> finished;
    std::vector<AuditEntry> audits;
    std::vector<Step> steps;
};

}  // namespace fireup::monitoring

#endif  // FIREUP_MONITORING_HPP
