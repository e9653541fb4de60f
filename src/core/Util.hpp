//
// Util.hpp
//

#ifndef GIFTSIEGE_UTIL_HPP
#define GIFTSIEGE_UTIL_HPP

#include <algorithm>
#include <cstdint>
#include <functional>
#include <vector>

namespace siege::core::util
{
    inline auto InRange(std::int64_t const idx, std::size_t const size) -> bool
    {
        return idx >= 0 && static_cast<std::size_t>(idx) < size;
    }

    // Tracks indices seen so far; a repeat marks the whole selection as invalid.
    class IndexUniqueChecker
    {
    public:
        explicit IndexUniqueChecker(std::size_t const size):
            seen_(size, false), contains_dup_(false) {}

        // Caller guarantees idx is in range.
        auto Add(std::size_t const idx) -> void
        {
            contains_dup_ |= static_cast<bool>(seen_[idx]);
            seen_[idx] = true;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
    private:
        std::vector<bool> seen_;
        bool contains_dup_;
    };

    // Highest index first so earlier removals do not shift later ones.
    template <typename T>
    inline auto EraseIndices(std::vector<T>& v, std::vector<std::size_t> idxs) -> std::vector<T>
    {
        std::ranges::sort(idxs, std::greater<>{});
        std::vector<T> removed;
        removed.reserve(idxs.size());
        for (std::size_t const i : idxs)
        {
            removed.push_back(std::move(v[i]));
            v.erase(v.begin() + static_cast<std::ptrdiff_t>(i));
        }
        return removed;
    }
}

#endif //GIFTSIEGE_UTIL_HPP
