// ==============================================================================
// config.cpp - Загрузка конфигурации (yaml-cpp)
// ==============================================================================

#include <fireup/config.hpp>
#include <fireup/platform.hpp>

#include <yaml-cpp/yaml.h>

namespace fireup::config {

namespace {

/// Минимальный блок: заголовок записи (7 байт) + хотя бы один байт данных
constexpr std::size_t MIN_BLOCK_SIZE = 8;

void apply_parser_section(const YAML::Node& node, ParserConfig& cfg) {
    if (!node || !node.IsMap()) {
        return;
    }
    if (node["block_size"]) {
        cfg.block_size = node["block_size"].as<std::size_t>();
    }
    if (node["detect_sample_bytes"]) {
        cfg.detect_sample_bytes = node["detect_sample_bytes"].as<std::size_t>();
    }
    if (node["printable_ratio"]) {
        cfg.printable_ratio = node["printable_ratio"].as<double>();
    }
    if (node["min_record_bytes"]) {
        cfg.min_record_bytes = node["min_record_bytes"].as<std::size_t>();
    }
    if (node["metadata_markers"]) {
        cfg.metadata_markers = node["metadata_markers"].as<std::vector<std::string>>();
    }
}

void apply_output_section(const YAML::Node& node, ParserConfig& cfg) {
    if (!node || !node.IsMap()) {
        return;
    }
    if (node["quiet"]) {
        cfg.output.quiet = node["quiet"].as<bool>();
    }
    if (node["verbose"]) {
        cfg.output.verbose = node["verbose"].as<int>();
    }
    if (node["log_path"]) {
        cfg.output.log_path = platform::path_from_utf8(node["log_path"].as<std::string>());
    }
}

ConfigResult from_root(const YAML::Node& root, const std::string& source) {
    ConfigResult result;

    // Пустой документ: конфигурация по умолчанию
    if (root && !root.IsNull()) {
        if (!root.IsMap()) {
            result.error = ConfigError{"config root must be a mapping", source};
            return result;
        }
        apply_parser_section(root["parser"], result.config);
        apply_output_section(root["output"], result.config);
        if (root["audit_log_path"]) {
            result.config.audit_log_path =
                platform::path_from_utf8(root["audit_log_path"].as<std::string>());
        }
    }

    std::string problem = validate_config(result.config);
    if (!problem.empty()) {
        result.error = ConfigError{problem, source};
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace

std::string ConfigError::format() const {
    return "[!] failed to load config '" + path + "' - " + message;
}

std::string validate_config(const ParserConfig& cfg) {
    if (cfg.block_size < MIN_BLOCK_SIZE) {
        return "block_size must be at least " + std::to_string(MIN_BLOCK_SIZE);
    }
    if (cfg.detect_sample_bytes == 0) {
        return "detect_sample_bytes must be positive";
    }
    if (!(cfg.printable_ratio > 0.0 && cfg.printable_ratio <= 1.0)) {
        return "printable_ratio must be in (0, 1]";
    }
    if (cfg.output.verbose < 0) {
        return "verbose must not be negative";
    }
    for (const auto& marker : cfg.metadata_markers) {
        if (marker.empty()) {
            return "metadata_markers must not contain empty strings";
        }
    }
    return {};
}

ConfigResult load_config(const std::filesystem::path& path) {
    std::string source = platform::path_to_utf8(path);
    try {
        return from_root(YAML::LoadFile(source), source);
    } catch (const YAML::Exception& e) {
        ConfigResult result;
        result.error = ConfigError{e.what(), source};
        return result;
    }
}

ConfigResult parse_config(const std::string& yaml_text) {
    try {
        return from_root(YAML::Load(yaml_text), "<string>");
    } catch (const YAML::Exception& e) {
        ConfigResult result;
        result.error = ConfigError{e.what(), "<string>"};
        return result;
    }
}

}  // namespace fireup::config
