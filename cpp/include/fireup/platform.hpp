// ==============================================================================
// fireup/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
//
// Пути в отчётах и конфигурации всегда UTF-8, независимо от ОС.
//
// ==============================================================================

#ifndef FIREUP_PLATFORM_HPP
#define FIREUP_PLATFORM_HPP

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

namespace fireup::platform {

/// Построить путь из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути (для сообщений и отчётов)
std::string path_to_utf8(const std::filesystem::path& p);

/// Поток подключён к терминалу (nullptr -> false)
bool is_tty(std::FILE* stream);

}  // namespace fireup::platform

#endif  // FIREUP_PLATFORM_HPP
