// ==============================================================================
// discovery.cpp - Поиск файла резервной копии
// ==============================================================================

#include <fireup/discovery.hpp>
#include <fireup/output.hpp>
#include <fireup/platform.hpp>

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace fireup::io {

namespace {

/// Ошибка обхода: предупреждение при skip_errors, иначе исключение
void report(const std::string& message, bool skip_errors, output::Writer* log) {
    if (!skip_errors) {
        throw std::runtime_error(message);
    }
    if (log != nullptr) {
        log->warn(message);
    }
}

void collect_files_recursive(const std::filesystem::path& path, bool skip_errors,
                             output::Writer* log, std::vector<std::filesystem::path>& result) {
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        report("failed to check path existence - " + ec.message(), skip_errors, log);
        return;
    }
    if (!exists) {
        report("backup path does not exist - " + platform::path_to_utf8(path), skip_errors, log);
        return;
    }

    const std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (ec) {
        report("failed to get metadata for file - " + ec.message(), skip_errors, log);
        return;
    }

    if (std::filesystem::is_directory(status)) {
        std::filesystem::directory_iterator dir_iter(path, ec);
        if (ec) {
            report("failed to read directory - " + ec.message(), skip_errors, log);
            return;
        }
        for (auto it = dir_iter; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            collect_files_recursive(it->path(), skip_errors, log, result);
        }
        if (ec) {
            report("failed to enter directory - " + ec.message(), skip_errors, log);
        }
    } else if (std::filesystem::is_regular_file(status)) {
        result.push_back(path);
    }
    // Символьные ссылки на несуществующее, сокеты и т.п. пропускаются
}

}  // namespace

std::vector<std::filesystem::path> discover_files(const std::filesystem::path& root,
                                                  bool skip_errors, output::Writer* log) {
    std::vector<std::filesystem::path> result;
    collect_files_recursive(root, skip_errors, log, result);

    // Сравнение path поэлементное: отсортированный список совпадает
    // с обходом в глубину при упорядоченных именах
    std::sort(result.begin(), result.end());
    return result;
}

std::filesystem::path resolve_backup_file(const std::filesystem::path& path,
                                          output::Writer* log) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw std::runtime_error("backup path does not exist - " + platform::path_to_utf8(path));
    }
    if (!std::filesystem::is_directory(path, ec)) {
        return path;
    }

    auto files = discover_files(path, true, log);
    if (files.empty()) {
        throw std::runtime_error("no backup files found in directory - " +
                                 platform::path_to_utf8(path));
    }

    auto preferred = std::find_if(files.begin(), files.end(), [](const auto& file) {
        return file.filename() == PREFERRED_BACKUP_NAME;
    });
    const std::filesystem::path& chosen = preferred != files.end() ? *preferred : files.front();

    if (log != nullptr) {
        log->debug("resolved backup directory '" + platform::path_to_utf8(path) + "' to '" +
                   platform::path_to_utf8(chosen) + "'");
    }
    return chosen;
}

}  // namespace fireup::io
