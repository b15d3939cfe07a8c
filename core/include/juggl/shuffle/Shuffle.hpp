// core/include/juggl/shuffle/Shuffle.hpp
#pragma once
#include <juggl/shuffle/IndexSource.hpp>
#include <juggl/text/Span.hpp>

#include <vector>


namespace juggl::shuffle {

    /// @brief Fisher-Yates로 span 목록을 제자리에서 섞는다.
    /// 원소가 1개 이하이면 난수를 뽑지 않고 그대로 둔다.
    void shuffle_spans(std::vector<Span>& spans, IndexSource& rng);

} // namespace juggl::shuffle
