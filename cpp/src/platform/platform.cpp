// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================

#include <fireup/platform.hpp>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace fireup::platform {

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // u8path сам выбирает native-кодировку (UTF-16 на Windows)
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.u8string();
}

bool is_tty(std::FILE* stream) {
    if (stream == nullptr) {
        return false;
    }
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

}  // namespace fireup::platform
