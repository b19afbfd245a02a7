// ==============================================================================
// fireup/fragment.hpp - Сборка логических записей из фрагментов
// ==============================================================================
//
// Логическая запись либо целиком лежит в одной физической записи (Full),
// либо разбита на First, ноль или более Middle и Last.
//
// Правила:
// - Full / First при открытом фрагменте: фрагмент отбрасывается с предупреждением
// - Middle / Last без открытого фрагмента: фатальная ошибка
// - Фрагмент, открытый в конце файла: отбрасывается с предупреждением
//
// ==============================================================================

#ifndef FIREUP_FRAGMENT_HPP
#define FIREUP_FRAGMENT_HPP

#include <fireup/leveldb_log.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fireup::output {
class Writer;
}

namespace fireup::leveldb {

/// Собранная логическая запись
struct LogicalRecord {
    std::vector<std::uint8_t> payload;
    std::uint64_t block_index = 0;  // блок первого фрагмента
    std::size_t offset = 0;         // смещение первого фрагмента в блоке
    std::size_t fragments = 1;
};

/// Нарушение протокола фрагментации (Middle/Last без First)
struct FragmentError {
    RecordType type = RecordType::Middle;
    std::uint64_t block_index = 0;
    std::size_t offset = 0;
    std::string message;
};

class FragmentReconstructor {
public:
    /// @param log Куда писать предупреждения (может быть nullptr)
    explicit FragmentReconstructor(output::Writer* log = nullptr);

    /// Принять физическую запись
    /// @param record Запись (данные перемещаются)
    /// @param out Собранные записи добавляются сюда
    /// @return false при фатальной ошибке (см. last_error())
    bool push(RawRecord record, std::vector<LogicalRecord>& out);

    /// Конец входа: незавершённый фрагмент отбрасывается
    void finish();

    bool accumulating() const { return std::holds_alternative<Accumulating>(state_); }

    /// Фрагменты, прерванные новой Full/First записью
    std::size_t abandoned_fragments() const { return abandoned_; }

    /// Фрагменты, незавершённые к концу файла
    std::size_t dropped_fragments() const { return dropped_; }

    const std::optional<FragmentError>& last_error() const { return error_; }

private:
    struct Idle {};

    struct Accumulating {
        std::vector<std::uint8_t> payload;
        std::uint64_t block_index = 0;
        std::size_t offset = 0;
        std::size_t fragments = 0;
    };

    void abandon(const RawRecord& interrupting);
    void start(RawRecord& record);

    output::Writer* log_;
    std::variant<Idle, Accumulating> state_;
    std::optional<FragmentError> error_;
    std::size_t abandoned_ = 0;
    std::size_t dropped_ = 0;
};

}  // namespace fireup::leveldb

#endif  // FIREUP_FRAGMENT_HPP
