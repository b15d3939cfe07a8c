// core/include/juggl/emit/Emitter.hpp
#pragma once
#include <juggl/diag/DiagCode.hpp>
#include <juggl/text/Span.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace llvm {
    class raw_ostream;
    class raw_fd_ostream;
} // namespace llvm


namespace juggl {

    struct EmitResult {
        bool ok = true;
        uint64_t bytes_written = 0;
        diag::Error err{};
    };

    /// @brief 섞인 span 순서대로 원본 바이트를 내보낸다.
    /// 청크 사이에만 구분자를 쓰고, 마지막 청크 뒤에는 쓰지 않는다.
    class Emitter {
    public:
        Emitter(std::string_view data, std::string_view delim)
            : data_(data), delim_(delim) {}

        /// @brief 실패하지 않는 sink(문자열/벡터 스트림 등)용.
        uint64_t emit(std::span<const Span> spans, llvm::raw_ostream& os) const;

        /// @brief 파일/파이프 출력용. 청크마다 스트림 오류를 확인하고
        /// 오류가 나면 즉시 중단한다. 이미 쓴 출력은 되돌리지 않는다.
        EmitResult emit(std::span<const Span> spans, llvm::raw_fd_ostream& os) const;

    private:
        uint64_t write_chunk_(llvm::raw_ostream& os, const Span& sp, bool last) const;

        std::string_view data_;
        std::string_view delim_;
    };

} // namespace juggl
