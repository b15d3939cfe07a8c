// core/include/juggl/diag/DiagCode.hpp
#pragma once
#include <cstdint>
#include <string>


namespace juggl::diag {

    enum class Code : uint16_t {
        // argument / decode
        A_INVALID_ARGUMENT = 1,
        A_INVALID_DELIMITER,    // empty delimiter, malformed \x escape
        A_INVALID_SEED,         // seed is not an unsigned 64-bit decimal

        // input
        I_FILE_OPEN_FAILED = 100,

        // output
        O_OUTPUT_WRITE_FAILED = 200,
    };

    inline const char* code_name(Code c) {
        switch (c) {
            case Code::A_INVALID_ARGUMENT: return "A_INVALID_ARGUMENT";
            case Code::A_INVALID_DELIMITER: return "A_INVALID_DELIMITER";
            case Code::A_INVALID_SEED: return "A_INVALID_SEED";
            case Code::I_FILE_OPEN_FAILED: return "I_FILE_OPEN_FAILED";
            case Code::O_OUTPUT_WRITE_FAILED: return "O_OUTPUT_WRITE_FAILED";
        }
        return "UNKNOWN";
    }

    struct Error {
        Code code = Code::A_INVALID_ARGUMENT;
        std::string message{};
    };

} // namespace juggl::diag
