#include <declscan/log.hpp>
#include <cstdarg>
#include <cstdio>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace declscan::log {

namespace {

struct LevelStyle {
    const char* name;
    const char* color;
};

// Indexed by Level
const LevelStyle kStyles[] = {
    {"trace", "\033[90m"},
    {"debug", "\033[36m"},
    {"info",  "\033[32m"},
    {"warn",  "\033[33m"},
    {"error", "\033[31m"},
};

const char* const kReset = "\033[0m";

struct Sink {
    Level level = Info;
    std::FILE* stream = nullptr;  // nullptr = stderr
    int color = -1;               // -1 = not yet detected

    std::FILE* out() const { return stream ? stream : stderr; }

    bool use_color() {
        if (color < 0) color = isatty(fileno(out())) ? 1 : 0;
        return color == 1;
    }
};

Sink& sink() {
    static Sink s;
    return s;
}

// Build the whole line first so concurrent writers never interleave mid-line
void emit(Level lvl, const char* fmt, va_list args) {
    Sink& s = sink();
    if (lvl < s.level) return;

    std::string line;
    if (s.use_color()) {
        line += kStyles[lvl].color;
        line += kStyles[lvl].name;
        line += kReset;
    } else {
        line += kStyles[lvl].name;
    }
    line += ": ";

    va_list sized;
    va_copy(sized, args);
    int n = std::vsnprintf(nullptr, 0, fmt, sized);
    va_end(sized);
    if (n > 0) {
        size_t head = line.size();
        line.resize(head + static_cast<size_t>(n) + 1);
        std::vsnprintf(&line[head], static_cast<size_t>(n) + 1, fmt, args);
        line.pop_back();
    }
    line += '\n';

    std::fputs(line.c_str(), s.out());
}

} // anonymous namespace

void set_level(Level lvl) { sink().level = lvl; }

Level get_level() { return sink().level; }

void set_stream(std::FILE* stream) {
    sink().stream = stream;
    sink().color = -1;
}

void set_color_enabled(bool enabled) { sink().color = enabled ? 1 : 0; }

bool is_color_enabled() { return sink().use_color(); }

const char* level_name(Level lvl) {
    if (lvl < Trace || lvl > Error) return "unknown";
    return kStyles[lvl].name;
}

bool parse_level(const std::string& name, Level& out) {
    for (int i = Trace; i <= Error; ++i) {
        if (name == kStyles[i].name) {
            out = static_cast<Level>(i);
            return true;
        }
    }
    return false;
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Error, fmt, args);
    va_end(args);
}

} // namespace declscan::log
