// core/include/juggl/shuffle/IndexSource.hpp
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <random>


namespace juggl::shuffle {

    /// @brief Fisher-Yates가 소비하는 균등 난수 인덱스 공급원.
    class IndexSource {
    public:
        virtual ~IndexSource() = default;

        /// @brief [0, bound) 범위의 균등 난수를 반환한다. bound >= 1.
        virtual uint64_t next_below(uint64_t bound) = 0;

        /// @brief 생성기를 초기화한 seed. 재현용으로 노출한다.
        virtual uint64_t seed() const = 0;
    };

    /// @brief 고정 seed 기반 결정적 공급원.
    /// 엔진(mt19937_64)과 rejection sampling 모두 표준에 고정된 동작이라
    /// 같은 seed는 어느 플랫폼에서나 같은 인덱스 시퀀스를 만든다.
    class SeededSource : public IndexSource {
    public:
        explicit SeededSource(uint64_t seed);

        uint64_t next_below(uint64_t bound) override;
        uint64_t seed() const override { return seed_; }

    private:
        uint64_t seed_ = 0;
        std::mt19937_64 engine_;
    };

    /// @brief OS 엔트로피(std::random_device)로 seed를 뽑는 비결정적 공급원.
    class EntropySource : public SeededSource {
    public:
        EntropySource();
    };

    /// @brief seed가 있으면 SeededSource, 없으면 EntropySource를 만든다.
    std::unique_ptr<IndexSource> make_index_source(std::optional<uint64_t> seed);

} // namespace juggl::shuffle
