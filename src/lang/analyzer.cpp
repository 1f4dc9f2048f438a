#include <declscan/analyzer.hpp>
#include <declscan/log.hpp>

namespace declscan {

std::vector<Declaration> analyze(const std::string& source) {
    return extract(tokenize(source));
}

ExtractResult analyze_scoped(const std::string& source) {
    return extract_scopes(tokenize(source));
}

std::string format_declaration(const Declaration& decl) {
    std::string line = "Line " + std::to_string(decl.line) + ": " + decl.type +
                       " " + decl.name;
    if (decl.has_initializer) line += " = " + decl.initializer;
    line += ';';
    return line;
}

Result<FileAnalysis> analyze_file(const std::filesystem::path& path,
                                  const ScanOptions& opts) {
    return read_source(path, opts).map([&](std::string& text) {
        auto extracted = analyze_scoped(text);
        log::debug("%s: %zu declarations in %zu scopes", path.string().c_str(),
                   extracted.declarations.size(), extracted.scopes.size());
        FileAnalysis fa;
        fa.path = path;
        fa.declarations = std::move(extracted.declarations);
        fa.scopes = std::move(extracted.scopes);
        return fa;
    });
}

Result<TreeAnalysis> analyze_tree(const std::filesystem::path& root,
                                  const ScanOptions& opts) {
    auto files = collect_sources(root, opts);
    DECLSCAN_TRY(files);

    log::info("analyzing %zu files under %s", files.value().size(),
              root.string().c_str());

    TreeAnalysis tree;
    for (const auto& path : files.value()) {
        auto r = analyze_file(path, opts);
        if (r.is_err()) {
            log::warn("failed to analyze %s: %s", path.string().c_str(),
                      r.error().message.c_str());
            tree.failures.push_back(std::move(r).error().at(path.string()));
            continue;
        }
        tree.files.push_back(std::move(r).value());
    }
    return Result<TreeAnalysis>::ok(std::move(tree));
}

} // namespace declscan
