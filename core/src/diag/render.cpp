// core/src/diag/render.cpp
#include <juggl/diag/Render.hpp>

#include <cstdio>
#include <cstdlib>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif


namespace juggl::diag {

    namespace {

        constexpr const char* kAnsiReset = "\033[0m";
        constexpr const char* kAnsiRed = "\033[31m";
        constexpr const char* kAnsiCyan = "\033[36m";

        std::string paint_(std::string_view text, const char* color, bool enabled) {
            if (!enabled) return std::string(text);
            return std::string(color) + std::string(text) + kAnsiReset;
        }

    } // namespace

    bool stderr_color_enabled(ColorMode mode) {
        if (mode == ColorMode::kNever) return false;
        if (mode == ColorMode::kAlways) return true;
        if (std::getenv("NO_COLOR") != nullptr) return false;
#if defined(_WIN32)
        return _isatty(_fileno(stderr)) != 0;
#else
        return isatty(fileno(stderr)) != 0;
#endif
    }

    std::string render_error(const Error& e, bool color) {
        std::string head = "error[";
        head += code_name(e.code);
        head += "]:";

        std::string out = paint_(head, kAnsiRed, color);
        out += " ";
        out += e.message;
        out += "\n";
        return out;
    }

    std::string render_note(std::string_view message, bool color) {
        std::string out = paint_("note:", kAnsiCyan, color);
        out += " ";
        out += message;
        out += "\n";
        return out;
    }

} // namespace juggl::diag
