#include <juggl_tool/cli/Options.hpp>

#include <charconv>
#include <string_view>
#include <vector>

namespace juggl_tool::cli {

namespace {

// Accepts "key value" and "key=value". An empty value is returned as-is: the
// delimiter decoder owns the empty-delimiter error.
bool parse_opt_value(const std::vector<std::string_view>& args,
                     size_t& i,
                     std::string_view key,
                     std::string& out,
                     std::string& err) {
    const auto a = args[i];
    const auto pref = std::string(key) + "=";
    if (a.rfind(pref, 0) == 0) {
        out = std::string(a.substr(pref.size()));
        return true;
    }

    if (i + 1 >= args.size()) {
        err = std::string(key) + " requires a value";
        return false;
    }
    ++i;
    out = std::string(args[i]);
    return true;
}

bool is_flag(std::string_view a, std::string_view short_key, std::string_view long_key) {
    if (a == short_key || a == long_key) return true;
    return a.size() > long_key.size() && a.rfind(long_key, 0) == 0 && a[long_key.size()] == '=';
}

bool parse_color(std::string_view v, juggl::diag::ColorMode& out) {
    if (v == "auto") { out = juggl::diag::ColorMode::kAuto; return true; }
    if (v == "always") { out = juggl::diag::ColorMode::kAlways; return true; }
    if (v == "never") { out = juggl::diag::ColorMode::kNever; return true; }
    return false;
}

Options fail(Options out, juggl::diag::Code code, std::string msg) {
    out.ok = false;
    out.error_code = code;
    out.error = std::move(msg);
    return out;
}

} // namespace

bool parse_u64(std::string_view s, uint64_t& out) {
    if (s.empty()) return false;
    for (const char c : s) {
        if (c < '0' || c > '9') return false;
    }
    uint64_t v = 0;
    const auto* first = s.data();
    const auto* last = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last) return false;
    out = v;
    return true;
}

void print_usage(std::ostream& os) {
    os
        << "juggl <input> -d <delimiter> [options]\n"
        << "  shuffle the delimiter-separated chunks of <input> and write them to stdout\n"
        << "  <input> may be '-' for standard input\n"
        << "\n"
        << "Options:\n"
        << "  -d, --delimiter <D>   chunk delimiter (required)\n"
        << "                        escapes: \\n \\r \\t \\0 \\\\ \\xHH\n"
        << "  -s, --seed <N>        unsigned 64-bit seed for a reproducible order\n"
        << "  -v, --verbose         print input/chunk/seed notes to stderr\n"
        << "  --color <auto|always|never>\n"
        << "  -h, --help\n"
        << "  --version\n";
}

Options parse_options(int argc, char** argv) {
    Options out{};

    if (argc <= 1) {
        out.mode = Mode::kUsage;
        return out;
    }

    std::vector<std::string_view> args{};
    args.reserve(static_cast<size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    bool have_input = false;
    bool have_delim = false;
    bool only_positional = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto a = args[i];

        if (!only_positional) {
            if (a == "-h" || a == "--help") {
                out.mode = Mode::kUsage;
                return out;
            }
            if (a == "--version") {
                out.mode = Mode::kVersion;
                return out;
            }
            if (a == "--") {
                only_positional = true;
                continue;
            }
            if (is_flag(a, "-d", "--delimiter")) {
                std::string err;
                if (!parse_opt_value(args, i, a == "-d" ? "-d" : "--delimiter", out.delimiter, err)) {
                    return fail(std::move(out), juggl::diag::Code::A_INVALID_ARGUMENT, std::move(err));
                }
                have_delim = true;
                continue;
            }
            if (is_flag(a, "-s", "--seed")) {
                std::string v;
                std::string err;
                if (!parse_opt_value(args, i, a == "-s" ? "-s" : "--seed", v, err)) {
                    return fail(std::move(out), juggl::diag::Code::A_INVALID_ARGUMENT, std::move(err));
                }
                uint64_t seed = 0;
                if (!parse_u64(v, seed)) {
                    return fail(std::move(out), juggl::diag::Code::A_INVALID_SEED,
                                "invalid seed '" + v + "': expected an unsigned 64-bit integer");
                }
                out.seed = seed;
                continue;
            }
            if (a == "-v" || a == "--verbose") {
                out.verbose = true;
                continue;
            }
            if (a == "--color" || a.rfind("--color=", 0) == 0) {
                std::string v;
                std::string err;
                if (!parse_opt_value(args, i, "--color", v, err)) {
                    return fail(std::move(out), juggl::diag::Code::A_INVALID_ARGUMENT, std::move(err));
                }
                if (!parse_color(v, out.color)) {
                    return fail(std::move(out), juggl::diag::Code::A_INVALID_ARGUMENT,
                                "--color must be one of auto, always, never (got '" + v + "')");
                }
                continue;
            }
            if (a.size() > 1 && a[0] == '-') {
                return fail(std::move(out), juggl::diag::Code::A_INVALID_ARGUMENT,
                            "unknown option: " + std::string(a));
            }
        }

        if (have_input) {
            return fail(std::move(out), juggl::diag::Code::A_INVALID_ARGUMENT,
                        "unexpected extra argument: " + std::string(a));
        }
        out.input = std::string(a);
        have_input = true;
    }

    if (!have_input) {
        return fail(std::move(out), juggl::diag::Code::A_INVALID_ARGUMENT, "missing input file");
    }
    if (!have_delim) {
        return fail(std::move(out), juggl::diag::Code::A_INVALID_ARGUMENT,
                    "missing required option -d/--delimiter");
    }

    out.mode = Mode::kShuffle;
    return out;
}

} // namespace juggl_tool::cli
