// core/include/juggl/diag/Render.hpp
#pragma once
#include <juggl/diag/DiagCode.hpp>

#include <string>
#include <string_view>


namespace juggl::diag {

    enum class ColorMode : uint8_t {
        kAuto,
        kAlways,
        kNever,
    };

    /// @brief color mode와 NO_COLOR, stderr tty 여부로 색상 사용 여부를 결정한다.
    bool stderr_color_enabled(ColorMode mode);

    /// @brief `error[CODE]: message` 한 줄을 만든다. (개행 포함)
    std::string render_error(const Error& e, bool color);

    /// @brief verbose 출력용 `note: message` 한 줄을 만든다. (개행 포함)
    std::string render_note(std::string_view message, bool color);

} // namespace juggl::diag
