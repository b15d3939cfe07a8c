// core/include/juggl/text/Span.hpp
#pragma once
#include <cstddef>
#include <string_view>


namespace juggl {

    struct Span {
        std::size_t lo = 0;   // byte offset inclusive
        std::size_t hi = 0;   // byte offset exclusive

        std::size_t size() const { return hi - lo; }
        bool empty() const { return hi == lo; }

        std::string_view slice(std::string_view data) const {
            return data.substr(lo, hi - lo);
        }

        friend bool operator==(const Span&, const Span&) = default;
    };

} // namespace juggl
