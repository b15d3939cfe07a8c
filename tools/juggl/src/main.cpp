#include <juggl/Version.hpp>
#include <juggl/diag/Render.hpp>
#include <juggl_tool/cli/Options.hpp>
#include <juggl_tool/driver/Runner.hpp>

#include <csignal>
#include <iostream>

int main(int argc, char** argv) {
#if !defined(_WIN32)
    // a closed downstream pipe surfaces as EPIPE on write, reported as O_OUTPUT_WRITE_FAILED
    std::signal(SIGPIPE, SIG_IGN);
#endif

    const auto opt = juggl_tool::cli::parse_options(argc, argv);

    if (!opt.ok) {
        const bool color = juggl::diag::stderr_color_enabled(opt.color);
        std::cerr << juggl::diag::render_error(juggl::diag::Error{opt.error_code, opt.error}, color);
        if (opt.error_code == juggl::diag::Code::A_INVALID_ARGUMENT) {
            juggl_tool::cli::print_usage(std::cerr);
        }
        return 1;
    }

    if (opt.mode == juggl_tool::cli::Mode::kVersion) {
        std::cout << juggl::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == juggl_tool::cli::Mode::kUsage) {
        juggl_tool::cli::print_usage(std::cout);
        return 0;
    }

    return juggl_tool::driver::run(opt);
}
