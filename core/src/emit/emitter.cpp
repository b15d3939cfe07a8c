// core/src/emit/emitter.cpp
#include <juggl/emit/Emitter.hpp>

#include <llvm/Support/raw_ostream.h>

#include <string>


namespace juggl {

    namespace {

        EmitResult write_failed_(llvm::raw_fd_ostream& os, uint64_t written) {
            EmitResult r{};
            r.ok = false;
            r.bytes_written = written;
            r.err = diag::Error{
                diag::Code::O_OUTPUT_WRITE_FAILED,
                "failed to write output: " + os.error().message()
            };
            // drop whatever is still buffered: a later flush would fail again,
            // and raw_fd_ostream aborts on a pending error at destruction
            os.flush();
            os.clear_error();
            return r;
        }

    } // namespace

    uint64_t Emitter::write_chunk_(llvm::raw_ostream& os, const Span& sp, bool last) const {
        const std::string_view bytes = sp.slice(data_);
        os.write(bytes.data(), bytes.size());
        if (last) return bytes.size();

        os.write(delim_.data(), delim_.size());
        return bytes.size() + delim_.size();
    }

    uint64_t Emitter::emit(std::span<const Span> spans, llvm::raw_ostream& os) const {
        uint64_t n = 0;
        for (size_t i = 0; i < spans.size(); ++i) {
            n += write_chunk_(os, spans[i], i + 1 == spans.size());
        }
        return n;
    }

    EmitResult Emitter::emit(std::span<const Span> spans, llvm::raw_fd_ostream& os) const {
        uint64_t n = 0;
        for (size_t i = 0; i < spans.size(); ++i) {
            n += write_chunk_(os, spans[i], i + 1 == spans.size());
            if (os.has_error()) return write_failed_(os, n);
        }

        os.flush();
        if (os.has_error()) return write_failed_(os, n);

        EmitResult r{};
        r.bytes_written = n;
        return r;
    }

} // namespace juggl
