#include <juggl_tool/driver/Runner.hpp>

#include <juggl/diag/Render.hpp>
#include <juggl/emit/Emitter.hpp>
#include <juggl/os/MappedFile.hpp>
#include <juggl/scan/Scanner.hpp>
#include <juggl/shuffle/IndexSource.hpp>
#include <juggl/shuffle/Shuffle.hpp>
#include <juggl/text/Delimiter.hpp>

#include <llvm/Support/raw_ostream.h>

#include <iostream>
#include <string>

namespace juggl_tool::driver {

namespace {

int report(std::ostream& log, const juggl::diag::Error& e, bool color) {
    log << juggl::diag::render_error(e, color);
    return 1;
}

} // namespace

int run(const cli::Options& opt, llvm::raw_fd_ostream& out, std::ostream& log) {
    const bool color = juggl::diag::stderr_color_enabled(opt.color);
    auto note = [&](const std::string& msg) {
        if (opt.verbose) log << juggl::diag::render_note(msg, color);
    };

    const auto delim = juggl::decode_delimiter(opt.delimiter);
    if (!delim.ok) return report(log, delim.err, color);

    auto mapped = juggl::os::map_file(opt.input);
    if (!mapped.ok) return report(log, mapped.err, color);

    const std::string_view data = mapped.file.bytes();
    note("input '" + opt.input + "': " + std::to_string(data.size()) + " byte(s)");
    note("delimiter: " + std::to_string(delim.delim.size()) + " byte(s)");

    juggl::Scanner scanner(data, delim.delim.view());
    auto spans = scanner.scan_all();
    note("chunks: " + std::to_string(spans.size()));

    auto rng = juggl::shuffle::make_index_source(opt.seed);
    if (opt.seed.has_value()) {
        note("seed: " + std::to_string(rng->seed()));
    } else {
        note("seed: " + std::to_string(rng->seed()) + " (from entropy; pass -s to reproduce)");
    }
    juggl::shuffle::shuffle_spans(spans, *rng);

    const juggl::Emitter emitter(data, delim.delim.view());
    const auto res = emitter.emit(spans, out);
    if (!res.ok) return report(log, res.err, color);

    note("wrote " + std::to_string(res.bytes_written) + " byte(s)");
    return 0;
}

int run(const cli::Options& opt) {
    return run(opt, llvm::outs(), std::cerr);
}

} // namespace juggl_tool::driver
