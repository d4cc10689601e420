/**
 * @file pipeline_plan_tests.cpp
 * Unit tests for cdplan::PipelinePlan and cdplan::PlannedStage
 */
#include <gtest/gtest.h>
#include "cdplan/common/pipeline_errors.hpp"
#include "cdplan/engine/pipeline_plan.hpp"

using namespace cdplan;

namespace
{

PipelinePlan make_plan()
{
    return PipelinePlan(std::string("Test"), false, "arn:aws:s3:::artifacts");
}

} // namespace

// ============================================================================
// PlannedStage
// ============================================================================

TEST(PlannedStageTests, AddAction_KeepsOrder)
{
    PlannedStage stage("Build");
    stage.add_action(PlannedAction{"A", 1, ManualApprovalActionConfig{}});
    stage.add_action(PlannedAction{"B", 1, ManualApprovalActionConfig{}});
    ASSERT_EQ(stage.actions().size(), 2u);
    EXPECT_EQ(stage.actions()[1].name, "B");
    ASSERT_NE(stage.find_action("A"), nullptr);
    EXPECT_EQ(stage.find_action("C"), nullptr);
}

TEST(PlannedStageTests, AddAction_DuplicateNameThrows)
{
    PlannedStage stage("Build");
    stage.add_action(PlannedAction{"A", 1, ManualApprovalActionConfig{}});
    EXPECT_THROW(stage.add_action(PlannedAction{"A", 2, ManualApprovalActionConfig{}}), ValidationError);
}

TEST(PlannedStageTests, AddAction_RunOrderBelowOneThrows)
{
    PlannedStage stage("Build");
    EXPECT_THROW(stage.add_action(PlannedAction{"A", 0, ManualApprovalActionConfig{}}), ValidationError);
}

// ============================================================================
// PipelinePlan
// ============================================================================

TEST(PipelinePlanTests, AddStage_UniqueNames)
{
    auto plan = make_plan();
    PlannedStage& build = plan.add_stage("Build");
    plan.add_stage("Deploy");
    EXPECT_EQ(&build, plan.find_stage("Build"));
    EXPECT_EQ(plan.stages().size(), 2u);
    EXPECT_THROW(plan.add_stage("Build"), ValidationError);
}

TEST(PipelinePlanTests, StageReferencesStayValid)
{
    auto plan = make_plan();
    PlannedStage& first = plan.add_stage("S0");
    for (int i = 1; i < 20; ++i)
    {
        plan.add_stage("S" + std::to_string(i));
    }
    first.add_action(PlannedAction{"A", 1, ManualApprovalActionConfig{}});
    EXPECT_EQ(plan.find_stage("S0")->actions().size(), 1u);
    EXPECT_EQ(plan.action_count(), 1u);
}

TEST(PipelinePlanTests, RegisterRole_Deduplicates)
{
    auto plan = make_plan();
    auto role = std::make_shared<Role>("R", std::vector<std::string>{});
    plan.register_role(role);
    plan.register_role(role);
    EXPECT_EQ(plan.roles().size(), 1u);
    EXPECT_EQ(plan.find_role("R"), role);
    EXPECT_EQ(plan.find_role("Missing"), nullptr);
}

TEST(PipelinePlanTests, GrantArtifactRead_CoversBucketAndObjects)
{
    auto plan = make_plan();
    Role role("R", {});
    EXPECT_TRUE(plan.grant_artifact_read(role));
    ASSERT_EQ(role.statements().size(), 1u);
    EXPECT_EQ(role.statements()[0].resources,
              (std::vector<std::string>{"arn:aws:s3:::artifacts", "arn:aws:s3:::artifacts/*"}));
}

TEST(PipelinePlanTests, Finalize_ResolvesDeferredStatements)
{
    auto plan = make_plan();
    auto arns = std::make_shared<std::vector<std::string>>();
    auto role = std::make_shared<Role>("R", std::vector<std::string>{});
    PolicyStatement assume;
    assume.actions = {"sts:AssumeRole"};
    assume.lazy_resources = [arns]() { return *arns; };
    role->add_to_policy(assume);
    plan.register_role(role);

    arns->push_back("arn:aws:iam::1:role/late");
    plan.finalize();

    ASSERT_EQ(plan.resolved_roles().size(), 1u);
    EXPECT_EQ(plan.resolved_roles()[0].statements[0].resources,
              (std::vector<std::string>{"arn:aws:iam::1:role/late"}));
}

TEST(PipelinePlanTests, Finalize_Lifecycle)
{
    auto plan = make_plan();
    EXPECT_THROW(plan.resolved_roles(), NotBuiltError);
    plan.finalize();
    EXPECT_TRUE(plan.is_finalized());
    EXPECT_THROW(plan.finalize(), AlreadyBuiltError);
    EXPECT_THROW(plan.add_stage("Late"), AlreadyBuiltError);
}

TEST(PipelinePlanTests, RestartExecutionOnUpdate)
{
    EXPECT_TRUE(make_plan().restart_execution_on_update());
}
