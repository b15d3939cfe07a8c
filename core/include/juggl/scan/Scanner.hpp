// core/include/juggl/scan/Scanner.hpp
#pragma once
#include <juggl/text/Span.hpp>

#include <cstddef>
#include <string_view>
#include <vector>


namespace juggl {

    /// @brief 입력 버퍼를 한 번 훑어 구분자 경계로 청크 span 목록을 만든다.
    /// 구분자는 왼쪽 우선, 서로 겹치지 않게 매칭한다.
    class Scanner {
    public:
        Scanner(std::string_view data, std::string_view delim);

        /// @brief 전체 버퍼를 스캔한다. 결과는 항상 1개 이상이며
        /// 마지막 구분자 뒤의 (빈) 청크도 포함한다.
        std::vector<Span> scan_all();

    private:
        // match start at or after pos_, or npos
        size_t next_match();

        size_t next_match_byte();
        size_t next_match_kmp();

        void build_prefix_table();

        std::string_view data_;
        std::string_view delim_;
        size_t pos_ = 0;

        std::vector<size_t> prefix_{}; // KMP failure function, multi-byte only
    };

} // namespace juggl
