// core/src/shuffle/shuffle.cpp
#include <juggl/shuffle/Shuffle.hpp>

#include <utility>


namespace juggl::shuffle {

    void shuffle_spans(std::vector<Span>& spans, IndexSource& rng) {
        if (spans.size() <= 1) return;

        for (size_t i = spans.size() - 1; i > 0; --i) {
            const size_t j = static_cast<size_t>(rng.next_below(static_cast<uint64_t>(i) + 1));
            if (i != j) std::swap(spans[i], spans[j]);
        }
    }

} // namespace juggl::shuffle
