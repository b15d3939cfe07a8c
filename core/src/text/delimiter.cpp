// core/src/text/delimiter.cpp
#include <juggl/text/Delimiter.hpp>


namespace juggl {

    namespace {

        int hex_value_(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        DelimiterResult fail_(std::string message) {
            DelimiterResult r{};
            r.err = diag::Error{diag::Code::A_INVALID_DELIMITER, std::move(message)};
            return r;
        }

    } // namespace

    DelimiterResult decode_delimiter(std::string_view text) {
        if (text.empty()) {
            return fail_("delimiter must not be empty");
        }

        std::string out;
        out.reserve(text.size());

        size_t i = 0;
        while (i < text.size()) {
            const char c = text[i];
            if (c != '\\' || i + 1 >= text.size()) {
                // plain byte, or a lone trailing backslash
                out.push_back(c);
                ++i;
                continue;
            }

            const char e = text[i + 1];
            switch (e) {
                case 'n':  out.push_back('\n'); i += 2; break;
                case 'r':  out.push_back('\r'); i += 2; break;
                case 't':  out.push_back('\t'); i += 2; break;
                case '0':  out.push_back('\0'); i += 2; break;
                case '\\': out.push_back('\\'); i += 2; break;
                case 'x': {
                    const int hi = (i + 2 < text.size()) ? hex_value_(text[i + 2]) : -1;
                    const int lo = (i + 3 < text.size()) ? hex_value_(text[i + 3]) : -1;
                    if (hi < 0 || lo < 0) {
                        return fail_("malformed hex escape at offset " + std::to_string(i) +
                                     " in delimiter '" + std::string(text) +
                                     "' (expected \\xHH with two hex digits)");
                    }
                    out.push_back(static_cast<char>((hi << 4) | lo));
                    i += 4;
                    break;
                }
                default:
                    out.push_back('\\');
                    out.push_back(e);
                    i += 2;
                    break;
            }
        }

        DelimiterResult r{};
        r.ok = true;
        r.delim.bytes = std::move(out);
        return r;
    }

} // namespace juggl
