#include <declscan/analyzer.hpp>
#include <declscan/config.hpp>
#include <declscan/log.hpp>
#include <filesystem>
#include <iostream>

using namespace declscan;

static const char* scope_kind_str(ScopeKind k) {
    switch (k) {
    case ScopeKind::Global: return "global";
    case ScopeKind::Block:  return "block";
    }
    return "?";
}

static void print_usage() {
    std::cerr << "Usage: declscan-dump <file|dir> [--tokens] [--scopes]"
                 " [--config <path>] [--verbose]\n";
}

static void print_file(const FileAnalysis& fa, bool show_scopes) {
    std::cout << "--- " << fa.path.string() << " ---\n";
    for (const auto& d : fa.declarations) {
        std::cout << "  " << format_declaration(d) << "\n";
    }
    if (show_scopes) {
        std::cout << "  -- Scopes --\n";
        for (size_t i = 0; i < fa.scopes.size(); ++i) {
            const auto& s = fa.scopes[i];
            std::cout << "  #" << i << " " << scope_kind_str(s.kind)
                      << " lines " << s.start_line << "-" << s.end_line
                      << " depth " << s.depth << " parent " << s.parent
                      << " decls " << s.declarations.size() << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    std::string target;
    std::string config_path;
    bool show_tokens = false;
    bool show_scopes = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--tokens") {
            show_tokens = true;
        } else if (arg == "--scopes") {
            show_scopes = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                print_usage();
                return 1;
            }
            config_path = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "error: unknown option " << arg << "\n";
            print_usage();
            return 1;
        } else if (target.empty()) {
            target = arg;
        } else {
            print_usage();
            return 1;
        }
    }
    if (target.empty()) {
        print_usage();
        return 1;
    }

    // Global config, then --config on top
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && std::filesystem::exists(global_path, ec)) {
        auto r = Config::load(global_path);
        if (r.is_err()) {
            std::cerr << r.error().format() << "\n";
            return 1;
        }
        global = std::move(r).value();
    }
    std::optional<Config> local;
    if (!config_path.empty()) {
        auto r = Config::load(config_path);
        if (r.is_err()) {
            std::cerr << r.error().format() << "\n";
            return 1;
        }
        local = std::move(r).value();
    }
    Config cfg = Config::effective(global, local);
    cfg.apply_logging();
    if (verbose) log::set_level(log::Debug);

    if (std::filesystem::is_directory(target, ec)) {
        if (show_tokens) {
            std::cerr << "error: --tokens needs a single file, not a directory\n";
            print_usage();
            return 1;
        }
        auto r = analyze_tree(target, cfg.scan);
        if (r.is_err()) {
            std::cerr << r.error().format() << "\n";
            return 1;
        }
        size_t total = 0;
        for (const auto& fa : r.value().files) {
            if (fa.declarations.empty() && !show_scopes) continue;
            print_file(fa, show_scopes);
            total += fa.declarations.size();
        }
        std::cout << "\nFiles: " << r.value().files.size()
                  << "  Declarations: " << total
                  << "  Failed: " << r.value().failures.size() << "\n";
        return 0;
    }

    auto src = read_source(target, cfg.scan);
    if (src.is_err()) {
        std::cerr << src.error().format() << "\n";
        return 1;
    }

    if (show_tokens) {
        std::cout << "-- Tokens --\n";
        for (const auto& t : tokenize(src.value())) {
            std::cout << "  " << t.pos.line << ":" << t.pos.col
                      << "  " << token_kind_name(t.kind)
                      << "  \"" << t.text << "\"\n";
        }
    }

    auto extracted = analyze_scoped(src.value());
    FileAnalysis fa;
    fa.path = target;
    fa.declarations = std::move(extracted.declarations);
    fa.scopes = std::move(extracted.scopes);
    print_file(fa, show_scopes);
    return 0;
}
