// core/src/os/mapped_file.cpp
#include <juggl/os/MappedFile.hpp>

#include <llvm/Support/ErrorOr.h>
#include <llvm/Support/MemoryBuffer.h>

#include <string>
#include <utility>


namespace juggl::os {

    MappedFile::MappedFile() = default;

    MappedFile::MappedFile(std::unique_ptr<llvm::MemoryBuffer> buf)
        : buf_(std::move(buf)) {}

    MappedFile::~MappedFile() = default;

    MappedFile::MappedFile(MappedFile&&) noexcept = default;
    MappedFile& MappedFile::operator=(MappedFile&&) noexcept = default;

    std::string_view MappedFile::bytes() const {
        if (!buf_) return {};
        const llvm::StringRef s = buf_->getBuffer();
        return std::string_view(s.data(), s.size());
    }

    MappedFileResult map_file(std::string_view path) {
        MappedFileResult r{};

        // binary (IsText=false), no trailing NUL needed so large files stay mmap'd
        auto mb = llvm::MemoryBuffer::getFileOrSTDIN(
            llvm::StringRef(path.data(), path.size()),
            /*IsText=*/false,
            /*RequiresNullTerminator=*/false);
        if (!mb) {
            const std::string shown = (path == "-") ? std::string("<stdin>") : std::string(path);
            r.err = diag::Error{
                diag::Code::I_FILE_OPEN_FAILED,
                "cannot open input '" + shown + "': " + mb.getError().message()
            };
            return r;
        }

        r.ok = true;
        r.file = MappedFile(std::move(*mb));
        return r;
    }

} // namespace juggl::os
