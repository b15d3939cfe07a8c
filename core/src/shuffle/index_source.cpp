// core/src/shuffle/index_source.cpp
#include <juggl/shuffle/IndexSource.hpp>


namespace juggl::shuffle {

    namespace {

        uint64_t draw_entropy_seed_() {
            std::random_device rd;
            const uint64_t hi = static_cast<uint64_t>(rd());
            const uint64_t lo = static_cast<uint64_t>(rd());
            return (hi << 32) ^ lo;
        }

    } // namespace

    SeededSource::SeededSource(uint64_t seed)
        : seed_(seed), engine_(seed) {}

    uint64_t SeededSource::next_below(uint64_t bound) {
        if (bound <= 1) return 0;

        // reject the low (2^64 mod bound) outputs so the modulo is unbiased
        const uint64_t threshold = (0 - bound) % bound;
        for (;;) {
            const uint64_t x = engine_();
            if (x >= threshold) return x % bound;
        }
    }

    EntropySource::EntropySource()
        : SeededSource(draw_entropy_seed_()) {}

    std::unique_ptr<IndexSource> make_index_source(std::optional<uint64_t> seed) {
        if (seed.has_value()) return std::make_unique<SeededSource>(*seed);
        return std::make_unique<EntropySource>();
    }

} // namespace juggl::shuffle
