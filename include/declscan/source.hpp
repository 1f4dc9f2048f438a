#pragma once

#include <declscan/result.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace declscan {

// Which files a tree walk picks up and how much of each it will read
struct ScanOptions {
    std::vector<std::string> extensions = {".cpp", ".h", ".hpp"};
    std::vector<std::string> exclude = {"third-party", "vendor", "build", "scripts"};
    size_t max_file_bytes = 8 * 1024 * 1024;  // 0 = unlimited
};

// Recursively list source files under root, sorted. Directories named in
// opts.exclude and hidden directories are not entered.
Result<std::vector<std::filesystem::path>> collect_sources(
    const std::filesystem::path& root,
    const ScanOptions& opts = {});

// Valid UTF-8 is returned unchanged; anything else is treated as Latin-1
// and re-encoded as UTF-8.
std::string decode_source(const std::string& bytes);

bool is_valid_utf8(const std::string& bytes);

// Read and decode one file, enforcing opts.max_file_bytes.
Result<std::string> read_source(const std::filesystem::path& path,
                                const ScanOptions& opts = {});

} // namespace declscan
