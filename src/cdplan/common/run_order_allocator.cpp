#include "cdplan/common/run_order_allocator.hpp"
#include "cdplan/common/pipeline_errors.hpp"

#include <algorithm>

namespace cdplan
{

void RunOrderAllocator::begin_tranche() noexcept
{
    m_tranche_max = 0;
}

void RunOrderAllocator::record(int runs_consumed)
{
    if (runs_consumed < 0)
    {
        throw ValidationError(
            "Run orders consumed must not be negative, got " + std::to_string(runs_consumed));
    }
    m_tranche_max = std::max(m_tranche_max, runs_consumed);
}

int RunOrderAllocator::end_tranche() noexcept
{
    m_cursor += m_tranche_max;
    m_tranche_max = 0;
    return m_cursor;
}

} // namespace cdplan
