#pragma once

#include <juggl/diag/DiagCode.hpp>
#include <juggl/diag/Render.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace juggl_tool::cli {

enum class Mode : uint8_t {
    kUsage,
    kVersion,
    kShuffle,
};

struct Options {
    Mode mode = Mode::kUsage;

    std::string input{};
    std::string delimiter{};           // raw, decoded by the driver
    std::optional<uint64_t> seed{};
    bool verbose = false;
    juggl::diag::ColorMode color = juggl::diag::ColorMode::kAuto;

    bool ok = true;
    juggl::diag::Code error_code = juggl::diag::Code::A_INVALID_ARGUMENT;
    std::string error{};
};

void print_usage(std::ostream& os);
Options parse_options(int argc, char** argv);

/// Strict unsigned 64-bit decimal parse: no sign, no spaces, no overflow.
bool parse_u64(std::string_view s, uint64_t& out);

} // namespace juggl_tool::cli
