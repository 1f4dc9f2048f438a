#pragma once

#include <declscan/lang/extractor.hpp>
#include <declscan/lang/lexer.hpp>
#include <declscan/result.hpp>
#include <declscan/source.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace declscan {

// Tokenize and extract in one call. Pure: no I/O, no logging, no errors.
std::vector<Declaration> analyze(const std::string& source);

ExtractResult analyze_scoped(const std::string& source);

// "Line N: type name[ = init];"
std::string format_declaration(const Declaration& decl);

struct FileAnalysis {
    std::filesystem::path path;
    std::vector<Declaration> declarations;
    std::vector<Scope> scopes;
};

struct TreeAnalysis {
    std::vector<FileAnalysis> files;
    std::vector<DeclscanError> failures;  // per-file errors, walk continued
};

Result<FileAnalysis> analyze_file(const std::filesystem::path& path,
                                  const ScanOptions& opts = {});

// Analyze every file collect_sources() finds under root. Only a failure to
// walk root itself is returned as an error.
Result<TreeAnalysis> analyze_tree(const std::filesystem::path& root,
                                  const ScanOptions& opts = {});

} // namespace declscan
