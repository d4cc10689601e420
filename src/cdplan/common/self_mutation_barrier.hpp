/**
 * @file self_mutation_barrier.hpp
 */
#pragma once
#include "cdplan/common/common.hpp"

namespace cdplan
{

/**
 * @brief Tracks whether actions still run before the pipeline updates itself.
 *
 * @details
 * Starts out true when self-mutation is enabled and false otherwise. The
 * first scheduled self-update clears it for the rest of the compile; it is
 * never set again. Producers only read it; it has no effect on stage layout
 * or run orders.
 */
class SelfMutationBarrier
{
public:
    explicit SelfMutationBarrier(bool self_mutation_enabled) noexcept
        : m_before_self_mutation{self_mutation_enabled}
    {}

    bool before_self_mutation() const noexcept { return m_before_self_mutation; }

    /**
     * @brief Record that a self-update node has been scheduled.
     * @return True if this call cleared the barrier.
     */
    bool mark_self_update_scheduled() noexcept
    {
        bool was_set = m_before_self_mutation;
        m_before_self_mutation = false;
        return was_set;
    }

private:
    bool m_before_self_mutation;
};

} // namespace cdplan
