// ==============================================================================
// fireup/discovery.hpp - Поиск файла резервной копии
// ==============================================================================
//
// Экспорт Firestore: директория вида
//   <export>/all_namespaces/all_kinds/output-0
//   <export>/all_namespaces/all_kinds/all_namespaces_all_kinds.export_metadata
// Парсер принимает либо сам файл журнала, либо директорию экспорта.
//
// ==============================================================================

#ifndef FIREUP_DISCOVERY_HPP
#define FIREUP_DISCOVERY_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace fireup::output {
class Writer;
}

namespace fireup::io {

/// Имя файла журнала в экспорте
constexpr const char* PREFERRED_BACKUP_NAME = "output-0";

/// Найти обычные файлы под root (depth-first)
///
/// @param root Файл или директория
/// @param skip_errors true: ошибки доступа пишутся предупреждениями в log
/// @param log Куда писать предупреждения (может быть nullptr)
/// @return Отсортированный список (порядок обхода в глубину с сортировкой имён)
/// @throws std::runtime_error при ошибке (если skip_errors=false)
std::vector<std::filesystem::path> discover_files(const std::filesystem::path& root,
                                                  bool skip_errors = false,
                                                  output::Writer* log = nullptr);

/// Привести путь к файлу журнала.
/// Файл возвращается как есть. Для директории: файл с именем output-0,
/// иначе первый найденный.
/// @throws std::runtime_error если путь не существует или файлов нет
std::filesystem::path resolve_backup_file(const std::filesystem::path& path,
                                          output::Writer* log = nullptr);

}  // namespace fireup::io

#endif  // FIREUP_DISCOVERY_HPP
