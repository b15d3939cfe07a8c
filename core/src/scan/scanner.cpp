// core/src/scan/scanner.cpp
#include <juggl/scan/Scanner.hpp>

#include <cstring>


namespace juggl {

    Scanner::Scanner(std::string_view data, std::string_view delim)
        : data_(data), delim_(delim) {
        if (delim_.size() > 1) build_prefix_table();
    }

    void Scanner::build_prefix_table() {
        prefix_.assign(delim_.size(), 0);
        size_t k = 0;
        for (size_t i = 1; i < delim_.size(); ++i) {
            while (k > 0 && delim_[i] != delim_[k]) k = prefix_[k - 1];
            if (delim_[i] == delim_[k]) ++k;
            prefix_[i] = k;
        }
    }

    size_t Scanner::next_match_byte() {
        if (pos_ >= data_.size()) return std::string_view::npos;
        const void* hit = std::memchr(data_.data() + pos_, delim_[0], data_.size() - pos_);
        if (hit == nullptr) return std::string_view::npos;
        return static_cast<size_t>(static_cast<const char*>(hit) - data_.data());
    }

    size_t Scanner::next_match_kmp() {
        // matcher state restarts at zero after every hit, so hits never overlap
        size_t k = 0;
        for (size_t i = pos_; i < data_.size(); ++i) {
            while (k > 0 && data_[i] != delim_[k]) k = prefix_[k - 1];
            if (data_[i] == delim_[k]) ++k;
            if (k == delim_.size()) return i + 1 - k;
        }
        return std::string_view::npos;
    }

    size_t Scanner::next_match() {
        if (delim_.empty() || data_.size() < delim_.size()) return std::string_view::npos;
        return (delim_.size() == 1) ? next_match_byte() : next_match_kmp();
    }

    std::vector<Span> Scanner::scan_all() {
        std::vector<Span> out;
        pos_ = 0;

        size_t boundary = 0;
        for (;;) {
            const size_t at = next_match();
            if (at == std::string_view::npos) break;
            out.push_back(Span{boundary, at});
            boundary = at + delim_.size();
            pos_ = boundary;
        }

        // trailing chunk is always emitted, even when empty
        out.push_back(Span{boundary, data_.size()});
        return out;
    }

} // namespace juggl
