// ==============================================================================
// fragment.cpp - Сборка логических записей
// ==============================================================================

#include <fireup/fragment.hpp>
#include <fireup/output.hpp>

namespace fireup::leveldb {

namespace {

std::string position(std::uint64_t block_index, std::size_t offset) {
    return "block " + std::to_string(block_index) + ", offset " + std::to_string(offset);
}

}  // namespace

FragmentReconstructor::FragmentReconstructor(output::Writer* log) : log_(log), state_(Idle{}) {}

void FragmentReconstructor::abandon(const RawRecord& interrupting) {
    auto& acc = std::get<Accumulating>(state_);
    ++abandoned_;
    if (log_ != nullptr) {
        log_->warn("discarding incomplete fragment started at " +
                   position(acc.block_index, acc.offset) + " (" +
                   std::to_string(acc.fragments) + " pieces), interrupted by " +
                   record_type_to_string(interrupting.header.type) + " record at " +
                   position(interrupting.block_index, interrupting.offset));
    }
    state_ = Idle{};
}

void FragmentReconstructor::start(RawRecord& record) {
    Accumulating acc;
    acc.payload = std::move(record.payload);
    acc.block_index = record.block_index;
    acc.offset = record.offset;
    acc.fragments = 1;
    state_ = std::move(acc);
}

bool FragmentReconstructor::push(RawRecord record, std::vector<LogicalRecord>& out) {
    if (error_) {
        return false;
    }

    switch (record.header.type) {
    case RecordType::Full: {
        if (accumulating()) {
            abandon(record);
        }
        LogicalRecord complete;
        complete.payload = std::move(record.payload);
        complete.block_index = record.block_index;
        complete.offset = record.offset;
        complete.fragments = 1;
        out.push_back(std::move(complete));
        return true;
    }

    case RecordType::First:
        if (accumulating()) {
            abandon(record);
        }
        start(record);
        return true;

    case RecordType::Middle:
    case RecordType::Last: {
        auto* acc = std::get_if<Accumulating>(&state_);
        if (acc == nullptr) {
            error_ = FragmentError{record.header.type, record.block_index, record.offset,
                                   std::string(record_type_to_string(record.header.type)) +
                                       " record without preceding FIRST at " +
                                       position(record.block_index, record.offset)};
            return false;
        }

        acc->payload.insert(acc->payload.end(), record.payload.begin(), record.payload.end());
        ++acc->fragments;

        if (record.header.type == RecordType::Last) {
            LogicalRecord complete;
            complete.payload = std::move(acc->payload);
            complete.block_index = acc->block_index;
            complete.offset = acc->offset;
            complete.fragments = acc->fragments;
            out.push_back(std::move(complete));
            state_ = Idle{};
        }
        return true;
    }
    }
    return true;
}

void FragmentReconstructor::finish() {
    auto* acc = std::get_if<Accumulating>(&state_);
    if (acc == nullptr) {
        return;
    }
    ++dropped_;
    if (log_ != nullptr) {
        log_->warn("dropping incomplete fragment at end of input, started at " +
                   position(acc->block_index, acc->offset) + " (" +
                   std::to_string(acc->payload.size()) + " bytes)");
    }
    state_ = Idle{};
}

}  // namespace fireup::leveldb
