// ==============================================================================
// parser.cpp - Разбор резервной копии Firestore
// ==============================================================================

#include <fireup/discovery.hpp>
#include <fireup/fragment.hpp>
#include <fireup/leveldb_log.hpp>
#include <fireup/monitoring.hpp>
#include <fireup/output.hpp>
#include <fireup/parser.hpp>
#include <fireup/platform.hpp>

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fireup::parser {

namespace {

constexpr const char* OPERATION_NAME = "parse_backup";

ParseError make_error(ParseErrorKind kind, std::string message,
                      const std::filesystem::path& path) {
    return ParseError{kind, std::move(message), platform::path_to_utf8(path)};
}

bool is_blank(const std::string& line) {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '\f' && c != '\v') {
            return false;
        }
    }
    return true;
}

std::string_view as_text(const std::vector<std::uint8_t>& bytes) {
    return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

}  // namespace

BackupParser::BackupParser(config::ParserConfig cfg, monitoring::ProgressSink* sink,
                           output::Writer* log)
    : config_(std::move(cfg)), sink_(sink), log_(log) {}

// ============================================================================
// parse
// ============================================================================

ParseOutcome BackupParser::parse(const std::filesystem::path& path) const {
    ParseOutcome outcome;
    const std::string path_text = platform::path_to_utf8(path);

    std::string operation_id;
    if (sink_ != nullptr) {
        operation_id = sink_->operation_started(OPERATION_NAME, {{"file_path", path_text}});
    }

    auto fail = [&](ParseError error) {
        if (log_ != nullptr) {
            log_->error(error.message + " - " + error.path);
        }
        if (sink_ != nullptr) {
            sink_->operation_finished(operation_id, false, error.message);
            monitoring::AuditEntry entry;
            entry.operation = OPERATION_NAME;
            entry.resource = path_text;
            entry.details = {{"file_path", path_text},
                             {"error_kind", parse_error_kind_to_string(error.kind)}};
            entry.result = monitoring::AuditResult::Failure;
            entry.message = error.message;
            sink_->audit(entry);
        }
        outcome.error = std::move(error);
        return std::move(outcome);
    };

    // Директория экспорта → файл журнала
    std::filesystem::path file = path;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return fail(make_error(ParseErrorKind::FileNotFound, "file does not exist", path));
    }
    if (std::filesystem::is_directory(path, ec)) {
        try {
            file = io::resolve_backup_file(path, log_);
        } catch (const std::runtime_error& e) {
            return fail(make_error(ParseErrorKind::FileNotFound, e.what(), path));
        }
    }

    ParseResult& result = outcome.result;
    result.source = file;
    result.format =
        detect_file_format(file, config_.detect_sample_bytes, config_.printable_ratio);
    if (log_ != nullptr) {
        log_->debug("parsing '" + platform::path_to_utf8(file) + "' as " +
                    input_format_to_string(result.format));
    }

    ParseError error;
    const bool ok = result.format == InputFormat::JsonLines
                        ? parse_json_lines(file, result, error)
                        : parse_log(file, result, error);
    if (!ok) {
        outcome.result = ParseResult{};
        return fail(std::move(error));
    }

    result.metadata.document_count = result.documents.size();
    result.metadata.collection_count = result.collections.size();

    if (log_ != nullptr) {
        log_->info("parsed " + std::to_string(result.metadata.document_count) +
                   " documents from " + std::to_string(result.metadata.collection_count) +
                   " collections (" + std::to_string(result.errors.size()) + " errors)");
        for (const auto& err : result.errors) {
            log_->debug(err.format());
        }
    }

    if (sink_ != nullptr) {
        sink_->operation_progress(operation_id, result.metadata.document_count);
        sink_->operation_finished(operation_id, true, {});

        monitoring::AuditEntry entry;
        entry.operation = OPERATION_NAME;
        entry.resource = path_text;
        entry.details = {
            {"file_path", platform::path_to_utf8(file)},
            {"documents_parsed", std::to_string(result.metadata.document_count)},
            {"collections_found", std::to_string(result.metadata.collection_count)},
            {"blocks_processed", std::to_string(result.metadata.blocks_processed)},
            {"file_size", std::to_string(result.metadata.file_size)},
        };
        entry.result =
            monitoring::classify_audit_result(result.metadata.document_count, result.errors.size());
        if (!result.errors.empty()) {
            entry.message = std::to_string(result.errors.size()) + " records failed to decode";
        }
        sink_->audit(entry);
    }

    outcome.ok = true;
    return outcome;
}

// ============================================================================
// Журнал LevelDB
// ============================================================================

bool BackupParser::parse_log(const std::filesystem::path& file, ParseResult& result,
                             ParseError& error) const {
    leveldb::BlockReader reader(config_.block_size);
    if (!reader.open(file)) {
        const auto& read_error = *reader.last_error();
        const auto kind = read_error.kind == leveldb::ReadErrorKind::FileNotFound
                              ? ParseErrorKind::FileNotFound
                              : ParseErrorKind::Io;
        error = make_error(kind, read_error.message, file);
        return false;
    }
    result.metadata.file_size = reader.file_size();

    const auto options = firestore::DecoderOptions::from_config(config_);
    leveldb::FragmentReconstructor fragments(log_);
    std::vector<leveldb::LogicalRecord> complete;

    leveldb::RawBlock block;
    while (reader.next(block)) {
        ++result.metadata.blocks_processed;

        leveldb::BlockScan scan = leveldb::parse_block(block);
        result.stats.physical_records += scan.records.size();
        result.stats.corrupted_records += scan.errors.size();
        result.stats.skipped_bytes += scan.skipped_bytes;
        for (auto& err : scan.errors) {
            if (err.kind == DecodeErrorKind::ChecksumMismatch) {
                ++result.stats.checksum_failures;
            }
            result.errors.push_back(std::move(err));
        }

        for (auto& record : scan.records) {
            if (!fragments.push(std::move(record), complete)) {
                error = make_error(ParseErrorKind::Structure, fragments.last_error()->message, file);
                return false;
            }
        }

        for (auto& logical : complete) {
            const std::uint64_t index = result.metadata.records_processed++;
            auto outcome = firestore::decode_record(as_text(logical.payload), index,
                                                    firestore::DecodeMode::Binary, options);
            if (outcome.error) {
                outcome.error->block_index = logical.block_index;
                outcome.error->offset = logical.offset;
            }
            accept(std::move(outcome), result);
        }
        complete.clear();
    }

    if (reader.last_error()) {
        error = make_error(ParseErrorKind::Io, reader.last_error()->message, file);
        return false;
    }

    fragments.finish();
    result.stats.abandoned_fragments = fragments.abandoned_fragments();
    result.stats.dropped_fragments = fragments.dropped_fragments();
    return true;
}

// ============================================================================
// JSON Lines
// ============================================================================

bool BackupParser::parse_json_lines(const std::filesystem::path& file, ParseResult& result,
                                    ParseError& error) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        error = make_error(ParseErrorKind::Io, "could not stat file: " + ec.message(), file);
        return false;
    }
    result.metadata.file_size = size;

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        error = make_error(ParseErrorKind::Io, "could not open file", file);
        return false;
    }

    const auto options = firestore::DecoderOptions::from_config(config_);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_blank(line)) {
            continue;
        }
        const std::uint64_t index = result.metadata.records_processed++;
        accept(firestore::decode_record(line, index, firestore::DecodeMode::JsonLines, options),
               result);
    }

    if (in.bad()) {
        error = make_error(ParseErrorKind::Io, "read failed", file);
        return false;
    }
    return true;
}

// ============================================================================
// Накопление результата
// ============================================================================

void BackupParser::accept(firestore::DecodeOutcome outcome, ParseResult& result) const {
    if (outcome.document) {
        result.collections.insert(outcome.document->collection);
        result.documents.push_back(std::move(*outcome.document));
        return;
    }
    if (outcome.error) {
        ++result.stats.decode_failures;
        result.errors.push_back(std::move(*outcome.error));
        return;
    }
    ++result.stats.skipped_records;
}

}  // namespace fireup::parser
