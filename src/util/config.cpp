#include <declscan/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace declscan {

// Read a TOML array of strings; any non-string element is an error.
static Result<std::vector<std::string>> string_array(const toml::array& arr,
                                                     const char* key) {
    std::vector<std::string> out;
    for (const auto& elem : arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return DeclscanError{ErrorCode::Config,
                std::string("[scan] ") + key + " must contain only strings"};
        }
        out.push_back(std::move(*s));
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return DeclscanError{ErrorCode::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [scan] section
    const toml::table* scan = nullptr;
    if (auto node = doc.get("scan")) {
        scan = node->as_table();
        if (!scan) {
            return DeclscanError{ErrorCode::Config, "[scan] must be a table"};
        }
    }
    if (scan) {
        if (auto node = scan->get("extensions")) {
            auto arr = node->as_array();
            if (!arr) {
                return DeclscanError{ErrorCode::Config,
                    "[scan] extensions must be an array"};
            }
            auto exts = string_array(*arr, "extensions");
            DECLSCAN_TRY(exts);
            cfg.scan.extensions = std::move(exts).value();
            cfg.extensions_set = true;
        }
        if (auto node = scan->get("exclude")) {
            auto arr = node->as_array();
            if (!arr) {
                return DeclscanError{ErrorCode::Config,
                    "[scan] exclude must be an array"};
            }
            auto dirs = string_array(*arr, "exclude");
            DECLSCAN_TRY(dirs);
            cfg.scan.exclude = std::move(dirs).value();
            cfg.exclude_set = true;
        }
        if (auto node = scan->get("max-file-bytes")) {
            auto v = node->value<int64_t>();
            if (!v || *v < 0) {
                return DeclscanError{ErrorCode::Config,
                    "[scan] max-file-bytes must be a non-negative integer",
                    "use 0 for no limit"};
            }
            cfg.scan.max_file_bytes = static_cast<size_t>(*v);
            cfg.max_file_bytes_set = true;
        }
    }

    // [log] section
    const toml::table* lg = nullptr;
    if (auto node = doc.get("log")) {
        lg = node->as_table();
        if (!lg) {
            return DeclscanError{ErrorCode::Config, "[log] must be a table"};
        }
    }
    if (lg) {
        if (auto node = lg->get("level")) {
            auto v = node->value<std::string>();
            if (!v) {
                return DeclscanError{ErrorCode::Config,
                    "[log] level must be a string"};
            }
            log::Level lvl;
            if (!log::parse_level(*v, lvl)) {
                return DeclscanError{ErrorCode::Config,
                    "unknown log level '" + *v + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = lvl;
        }
        if (auto node = lg->get("color")) {
            auto v = node->value<bool>();
            if (!v) {
                return DeclscanError{ErrorCode::Config,
                    "[log] color must be a boolean"};
            }
            cfg.log_color = *v;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return DeclscanError{ErrorCode::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str()).at(path);
}

void Config::merge(const Config& other) {
    if (other.extensions_set) {
        scan.extensions = other.scan.extensions;
        extensions_set = true;
    }
    if (other.exclude_set) {
        scan.exclude = other.scan.exclude;
        exclude_set = true;
    }
    if (other.max_file_bytes_set) {
        scan.max_file_bytes = other.scan.max_file_bytes;
        max_file_bytes_set = true;
    }
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.declscan/config.toml";
}

} // namespace declscan
