// core/include/juggl/text/Delimiter.hpp
#pragma once
#include <juggl/diag/DiagCode.hpp>

#include <string>
#include <string_view>


namespace juggl {

    /// @brief 청크 사이에 끼워 넣는 구분자 바이트열. 항상 1바이트 이상이다.
    struct Delimiter {
        std::string bytes{};

        std::string_view view() const { return bytes; }
        std::size_t size() const { return bytes.size(); }
    };

    struct DelimiterResult {
        bool ok = false;
        Delimiter delim{};
        diag::Error err{};
    };

    /// @brief 사용자 입력 문자열을 구분자 바이트열로 변환한다.
    /// 지원 escape: \n \r \t \0 \\ \xHH
    /// 그 외 backslash 조합은 두 글자 그대로 유지한다.
    DelimiterResult decode_delimiter(std::string_view text);

} // namespace juggl
