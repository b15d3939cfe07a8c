#include <juggl/shuffle/IndexSource.hpp>
#include <juggl/shuffle/Shuffle.hpp>

#include <algorithm>
#include <array>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    // span i labelled by lo == i
    static std::vector<juggl::Span> labelled_(size_t n) {
        std::vector<juggl::Span> v;
        v.reserve(n);
        for (size_t i = 0; i < n; ++i) v.push_back(juggl::Span{i, i + 1});
        return v;
    }

    static std::vector<size_t> labels_(const std::vector<juggl::Span>& v) {
        std::vector<size_t> out;
        out.reserve(v.size());
        for (const auto& sp : v) out.push_back(sp.lo);
        return out;
    }

    static std::vector<size_t> seeded_order_(uint64_t seed, size_t n) {
        auto spans = labelled_(n);
        juggl::shuffle::SeededSource rng(seed);
        juggl::shuffle::shuffle_spans(spans, rng);
        return labels_(spans);
    }

    // counts draws so the n <= 1 cases can prove nothing was consumed
    class CountingSource final : public juggl::shuffle::IndexSource {
    public:
        uint64_t next_below(uint64_t bound) override {
            ++calls;
            bounds.push_back(bound);
            return 0;
        }
        uint64_t seed() const override { return 0; }

        size_t calls = 0;
        std::vector<uint64_t> bounds{};
    };

    static bool test_pinned_sequence_seed_42_() {
        juggl::shuffle::SeededSource rng(42);
        const std::array<uint64_t, 8> expected = {0, 2, 4, 0, 5, 2, 4, 0};
        bool ok = true;
        for (const auto e : expected) {
            ok &= require_(rng.next_below(6) == e, "seed 42 must reproduce the pinned draw sequence");
        }
        ok &= require_(rng.seed() == 42, "seed() must report the construction seed");
        return ok;
    }

    static bool test_pinned_permutations_() {
        bool ok = true;
        ok &= require_(seeded_order_(42, 3) == std::vector<size_t>({1, 2, 0}),
                       "seed 42 over three chunks must give b,c,a");
        ok &= require_(seeded_order_(0, 3) == std::vector<size_t>({2, 1, 0}),
                       "seed 0 over three chunks must give c,b,a");
        ok &= require_(seeded_order_(42, 10) == std::vector<size_t>({1, 7, 9, 0, 3, 8, 4, 2, 5, 6}),
                       "seed 42 over ten chunks must match the pinned order");
        ok &= require_(seeded_order_(12345, 10) == std::vector<size_t>({3, 1, 7, 4, 9, 2, 0, 8, 5, 6}),
                       "seed 12345 over ten chunks must match the pinned order");
        return ok;
    }

    static bool test_same_seed_same_order_() {
        bool ok = true;
        for (uint64_t seed : {0ull, 1ull, 99ull, 0xFFFFFFFFFFFFFFFFull}) {
            ok &= require_(seeded_order_(seed, 257) == seeded_order_(seed, 257),
                           "identical seed and length must give identical order");
        }
        return ok;
    }

    static bool test_result_is_permutation_() {
        bool ok = true;
        for (size_t n : {2u, 3u, 17u, 1000u}) {
            auto order = seeded_order_(7, n);
            std::sort(order.begin(), order.end());
            std::vector<size_t> ident(n);
            for (size_t i = 0; i < n; ++i) ident[i] = i;
            ok &= require_(order == ident, "shuffle must only reorder, never drop or duplicate");
        }
        return ok;
    }

    static bool test_small_lists_untouched_() {
        bool ok = true;

        std::vector<juggl::Span> none{};
        CountingSource c0;
        juggl::shuffle::shuffle_spans(none, c0);
        ok &= require_(none.empty(), "empty list must stay empty");
        ok &= require_(c0.calls == 0, "empty list must not draw");

        auto one = labelled_(1);
        CountingSource c1;
        juggl::shuffle::shuffle_spans(one, c1);
        ok &= require_(one.size() == 1 && one[0].lo == 0, "single element must stay in place");
        ok &= require_(c1.calls == 0, "single element must not draw");
        return ok;
    }

    static bool test_fisher_yates_bounds_() {
        auto spans = labelled_(5);
        CountingSource c;
        juggl::shuffle::shuffle_spans(spans, c);

        bool ok = true;
        ok &= require_(c.bounds == std::vector<uint64_t>({5, 4, 3, 2}),
                       "draws must cover [0, i] for i = n-1 down to 1");
        // always picking 0 rotates element 0 through each tail slot
        ok &= require_(labels_(spans) == std::vector<size_t>({1, 2, 3, 4, 0}),
                       "swap(i, 0) sequence must produce the expected arrangement");
        return ok;
    }

    static bool test_next_below_range_() {
        juggl::shuffle::SeededSource rng(2024);
        bool ok = true;
        for (uint64_t bound : {1ull, 2ull, 3ull, 10ull, 1000003ull, 0x8000000000000001ull}) {
            for (int k = 0; k < 200; ++k) {
                if (rng.next_below(bound) >= bound) {
                    ok &= require_(false, "next_below must stay below bound");
                    return ok;
                }
            }
        }
        return ok;
    }

    static bool test_roughly_uniform_() {
        juggl::shuffle::SeededSource rng(7);
        std::map<std::vector<size_t>, int> seen;
        for (int k = 0; k < 60000; ++k) {
            auto spans = labelled_(3);
            juggl::shuffle::shuffle_spans(spans, rng);
            ++seen[labels_(spans)];
        }

        bool ok = true;
        ok &= require_(seen.size() == 6, "all six permutations of three chunks must be reachable");
        for (const auto& [perm, count] : seen) {
            (void)perm;
            ok &= require_(count > 9000 && count < 11000, "each permutation must occur about 1/6 of the time");
        }
        return ok;
    }

    static bool test_entropy_runs_differ_() {
        auto a = labelled_(64);
        auto b = labelled_(64);
        juggl::shuffle::EntropySource ra;
        juggl::shuffle::EntropySource rb;
        juggl::shuffle::shuffle_spans(a, ra);
        juggl::shuffle::shuffle_spans(b, rb);

        bool ok = true;
        ok &= require_(ra.seed() != rb.seed(), "entropy seeds must differ between sources");
        ok &= require_(labels_(a) != labels_(b), "two unseeded shuffles of 64 chunks must differ");
        return ok;
    }

    static bool test_entropy_seed_reproduces_() {
        auto a = labelled_(40);
        juggl::shuffle::EntropySource ra;
        juggl::shuffle::shuffle_spans(a, ra);

        return require_(labels_(a) == seeded_order_(ra.seed(), 40),
                        "reported entropy seed must reproduce the same order");
    }

    static bool test_factory_() {
        auto seeded = juggl::shuffle::make_index_source(uint64_t{5});
        auto random = juggl::shuffle::make_index_source(std::nullopt);

        bool ok = true;
        ok &= require_(seeded != nullptr && random != nullptr, "factory must return a source");
        ok &= require_(seeded->seed() == 5, "seeded source must keep the given seed");
        ok &= require_(dynamic_cast<juggl::shuffle::EntropySource*>(random.get()) != nullptr,
                       "missing seed must select the entropy source");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"pinned_sequence_seed_42", test_pinned_sequence_seed_42_},
        {"pinned_permutations", test_pinned_permutations_},
        {"same_seed_same_order", test_same_seed_same_order_},
        {"result_is_permutation", test_result_is_permutation_},
        {"small_lists_untouched", test_small_lists_untouched_},
        {"fisher_yates_bounds", test_fisher_yates_bounds_},
        {"next_below_range", test_next_below_range_},
        {"roughly_uniform", test_roughly_uniform_},
        {"entropy_runs_differ", test_entropy_runs_differ_},
        {"entropy_seed_reproduces", test_entropy_seed_reproduces_},
        {"factory", test_factory_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
