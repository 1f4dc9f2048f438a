#include <declscan/source.hpp>
#include <declscan/log.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace declscan {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Tree walk
// ---------------------------------------------------------------------------

static bool is_excluded_dir(const fs::path& dir, const ScanOptions& opts) {
    std::string name = dir.filename().string();
    if (!name.empty() && name[0] == '.') return true;
    return std::find(opts.exclude.begin(), opts.exclude.end(), name) != opts.exclude.end();
}

static bool has_source_extension(const fs::path& file, const ScanOptions& opts) {
    std::string ext = file.extension().string();
    return std::find(opts.extensions.begin(), opts.extensions.end(), ext) != opts.extensions.end();
}

Result<std::vector<fs::path>> collect_sources(const fs::path& root,
                                              const ScanOptions& opts) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return DeclscanError{ErrorCode::NotFound,
            "source directory does not exist: " + root.string(),
            "pass an existing directory or a single file"};
    }

    std::vector<fs::path> files;
    std::error_code walk_ec;
    fs::recursive_directory_iterator it(root, walk_ec);
    for (; !walk_ec && it != fs::recursive_directory_iterator(); it.increment(walk_ec)) {
        const auto& entry = *it;
        if (entry.is_directory(ec)) {
            if (is_excluded_dir(entry.path(), opts)) {
                log::trace("excluded directory %s", entry.path().string().c_str());
                it.disable_recursion_pending();
            }
            continue;
        }
        if (entry.is_regular_file(ec) && has_source_extension(entry.path(), opts)) {
            files.push_back(entry.path());
        }
    }
    if (walk_ec) {
        return DeclscanError{ErrorCode::IO,
            "cannot walk " + root.string() + ": " + walk_ec.message()};
    }

    std::sort(files.begin(), files.end());
    return Result<std::vector<fs::path>>::ok(std::move(files));
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

bool is_valid_utf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(bytes[i]);
        size_t len;
        unsigned int cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

static std::string latin1_to_utf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() + bytes.size() / 4);
    for (char ch : bytes) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(ch);
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

std::string decode_source(const std::string& bytes) {
    if (is_valid_utf8(bytes)) return bytes;
    return latin1_to_utf8(bytes);
}

Result<std::string> read_source(const fs::path& path, const ScanOptions& opts) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return DeclscanError{ErrorCode::IO,
            "cannot stat " + path.string() + ": " + ec.message()}.at(path.string());
    }
    if (opts.max_file_bytes > 0 && size > opts.max_file_bytes) {
        return DeclscanError{ErrorCode::TooLarge,
            "file exceeds max-file-bytes (" + std::to_string(size) + " > " +
                std::to_string(opts.max_file_bytes) + ")",
            "raise [scan] max-file-bytes or exclude the file"}.at(path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return DeclscanError{ErrorCode::IO,
            "cannot open source file: " + path.string()}.at(path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    std::string bytes = ss.str();

    if (is_valid_utf8(bytes)) {
        return Result<std::string>::ok(std::move(bytes));
    }
    log::debug("%s is not valid UTF-8, reading as Latin-1", path.string().c_str());
    return Result<std::string>::ok(latin1_to_utf8(bytes));
}

} // namespace declscan
