/**
 * @file tranche_chunker.hpp
 * @brief Splitting ordered tranches into capacity-bounded stage groups.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/pipeline_errors.hpp"

#include <deque>
#include <iterator>

namespace cdplan
{

/**
 * @brief Group ordered tranches into blocks of at most `capacity` items.
 *
 * @details
 * Tranches are taken greedily from the front. A tranche that fits in the
 * remaining capacity of the current group is added whole. A tranche that
 * does not fit is split: its largest prefix that fits closes the current
 * group, and the remainder is treated as the first tranche of what is left.
 *
 * Concatenating the groups in order reproduces the input items in their
 * original order. A group is closed without an empty trailing piece when the
 * capacity is used up exactly.
 *
 * @tparam T Item type.
 * @param capacity Maximum number of items per group; must be at least 1.
 * @param tranches Ordered tranches, consumed.
 * @return Ordered groups, each an ordered sequence of tranches.
 * @throw ValidationError if `capacity` is 0.
 */
template <typename T>
std::vector<std::vector<std::vector<T>>> chunk_tranches(size_t capacity, std::vector<std::vector<T>> tranches)
{
    if (capacity == 0)
    {
        throw ValidationError("Stage capacity must be at least 1");
    }

    std::deque<std::vector<T>> pending;
    for (auto& tranche : tranches)
    {
        pending.push_back(std::move(tranche));
    }

    std::vector<std::vector<std::vector<T>>> groups;
    while (!pending.empty())
    {
        std::vector<std::vector<T>> group;
        size_t count = 0;

        while (!pending.empty())
        {
            auto& head = pending.front();
            const size_t space_remaining = capacity - count;
            if (head.size() <= space_remaining)
            {
                count += head.size();
                group.push_back(std::move(head));
                pending.pop_front();
                continue;
            }

            if (space_remaining > 0)
            {
                auto split = head.begin() + static_cast<std::ptrdiff_t>(space_remaining);
                group.emplace_back(std::make_move_iterator(head.begin()), std::make_move_iterator(split));
                head.erase(head.begin(), split);
            }
            break;
        }

        groups.push_back(std::move(group));
    }
    return groups;
}

/**
 * @brief Total number of items across a sequence of tranches.
 */
template <typename T>
size_t item_count(const std::vector<std::vector<T>>& tranches) noexcept
{
    size_t count = 0;
    for (const auto& tranche : tranches)
    {
        count += tranche.size();
    }
    return count;
}

} // namespace cdplan
