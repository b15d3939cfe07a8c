// core/include/juggl/os/MappedFile.hpp
#pragma once
#include <juggl/diag/DiagCode.hpp>

#include <memory>
#include <string_view>

namespace llvm {
    class MemoryBuffer;
} // namespace llvm


namespace juggl::os {

    /// @brief 입력 파일 전체에 대한 읽기 전용 바이트 뷰.
    /// 큰 파일은 mmap, 작은 파일/파이프는 메모리로 읽는다 (llvm::MemoryBuffer 정책).
    /// 뷰는 MappedFile이 살아 있는 동안만 유효하다.
    class MappedFile {
    public:
        MappedFile();
        explicit MappedFile(std::unique_ptr<llvm::MemoryBuffer> buf);
        ~MappedFile();

        MappedFile(MappedFile&&) noexcept;
        MappedFile& operator=(MappedFile&&) noexcept;

        MappedFile(const MappedFile&) = delete;
        MappedFile& operator=(const MappedFile&) = delete;

        std::string_view bytes() const;
        size_t size() const { return bytes().size(); }

    private:
        std::unique_ptr<llvm::MemoryBuffer> buf_{};
    };

    struct MappedFileResult {
        bool ok = false;
        MappedFile file{};
        diag::Error err{};
    };

    /// @brief path를 읽기 전용으로 연다. "-"는 표준 입력이다.
    MappedFileResult map_file(std::string_view path);

} // namespace juggl::os
