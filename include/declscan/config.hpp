#pragma once

#include <declscan/log.hpp>
#include <declscan/result.hpp>
#include <declscan/source.hpp>
#include <optional>
#include <string>

namespace declscan {

// Layered configuration: global (~/.declscan/config.toml) then local.
// A later layer overrides only the fields it sets explicitly.
struct Config {
    ScanOptions scan;
    bool extensions_set = false;
    bool exclude_set = false;
    bool max_file_bytes_set = false;

    std::optional<log::Level> log_level;
    std::optional<bool> log_color;

    static Result<Config> load(const std::string& path);

    static Result<Config> parse(const std::string& toml_str);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push [log] settings into the process-wide logger
    void apply_logging() const;
};

std::string global_config_path();

} // namespace declscan
