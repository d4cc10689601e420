/**
 * @file run_order_allocator_tests.cpp
 * Unit tests for cdplan::RunOrderAllocator
 */
#include <gtest/gtest.h>
#include "cdplan/common/run_order_allocator.hpp"
#include "cdplan/common/pipeline_errors.hpp"

using namespace cdplan;

TEST(RunOrderAllocatorTests, Construction_StartsAtOne)
{
    RunOrderAllocator runs;
    EXPECT_EQ(runs.current(), 1);
}

TEST(RunOrderAllocatorTests, Tranche_AdvancesByMaximumConsumed)
{
    RunOrderAllocator runs;
    runs.begin_tranche();
    runs.record(1);
    runs.record(2);
    runs.record(1);
    EXPECT_EQ(runs.current(), 1);
    EXPECT_EQ(runs.end_tranche(), 3);
    EXPECT_EQ(runs.current(), 3);
}

TEST(RunOrderAllocatorTests, Tranche_EmptyDoesNotAdvance)
{
    RunOrderAllocator runs;
    runs.begin_tranche();
    EXPECT_EQ(runs.end_tranche(), 1);
}

TEST(RunOrderAllocatorTests, Tranche_ZeroConsumedDoesNotAdvance)
{
    RunOrderAllocator runs;
    runs.begin_tranche();
    runs.record(0);
    EXPECT_EQ(runs.end_tranche(), 1);
}

TEST(RunOrderAllocatorTests, Tranche_SequenceIsMonotonic)
{
    RunOrderAllocator runs;
    runs.begin_tranche();
    runs.record(1);
    runs.end_tranche();
    runs.begin_tranche();
    runs.record(3);
    runs.end_tranche();
    runs.begin_tranche();
    runs.record(1);
    EXPECT_EQ(runs.current(), 5);
    EXPECT_EQ(runs.end_tranche(), 6);
}

TEST(RunOrderAllocatorTests, Record_NegativeThrows)
{
    RunOrderAllocator runs;
    runs.begin_tranche();
    EXPECT_THROW(runs.record(-1), ValidationError);
}
