/**
 * @file run_order_allocator.hpp
 */
#pragma once
#include "cdplan/common/common.hpp"

namespace cdplan
{

/**
 * @brief Assigns run orders to the tranches of one stage.
 *
 * @details
 * The cursor starts at 1. Every node of a tranche is given the cursor's
 * current value, so all of them run concurrently. When the tranche is done
 * the cursor advances by the largest number of run orders any of its nodes
 * consumed. An empty tranche consumes nothing and does not advance it.
 *
 * @par Usage
 * @code
 * RunOrderAllocator runs;
 * for (const auto& tranche : tranches)
 * {
 *     runs.begin_tranche();
 *     for (auto node : tranche)
 *     {
 *         int consumed = schedule(node, runs.current());
 *         runs.record(consumed);
 *     }
 *     runs.end_tranche();
 * }
 * @endcode
 */
class RunOrderAllocator
{
public:
    RunOrderAllocator() = default;

    /**
     * @brief Run order for nodes of the tranche in progress.
     */
    int current() const noexcept { return m_cursor; }

    void begin_tranche() noexcept;

    /**
     * @brief Record how many run orders one node of the tranche consumed.
     * @throw ValidationError if `runs_consumed` is negative.
     */
    void record(int runs_consumed);

    /**
     * @brief Advance past the tranche in progress.
     * @return The run order of the next tranche.
     */
    int end_tranche() noexcept;

private:
    int m_cursor{1};
    int m_tranche_max{0};
};

} // namespace cdplan
