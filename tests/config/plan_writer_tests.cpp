/**
 * @file plan_writer_tests.cpp
 * Unit tests for cdplan::plan_to_yaml
 */
#include <gtest/gtest.h>
#include "cdplan/common/graph_builder.hpp"
#include "cdplan/common/pipeline_errors.hpp"
#include "cdplan/config/plan_writer.hpp"
#include "cdplan/engine/custom_action_step.hpp"
#include "cdplan/engine/pipeline_engine.hpp"

#include <yaml-cpp/yaml.h>

using namespace cdplan;

namespace
{

class PlanWriterTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        CustomActionStep::Props source;
        source.category = "Source";
        source.provider = "S3";
        source.output = "Source";
        ScriptStep::Props synth;
        synth.commands = {"npx cdk synth"};
        synth.primary_output_directory = "cdk.out";
        auto synth_step = std::make_shared<ScriptStep>("Synth", synth);

        auto stack = std::make_shared<StackDeployment>();
        stack->stack_artifact_id = "App";
        stack->stack_name = "App";
        stack->assume_role_arn = "arn:aws:iam::1:role/deploy";
        stack->template_path = "App.template.json";

        StackAsset asset;
        asset.asset_id = "abc";
        asset.asset_selector = "abc:1-us-east-1";
        asset.asset_manifest_path = "App.assets.json";
        asset.publishing_role_arn = "arn:aws:iam::1:role/file-publishing";

        GraphBuilder builder;
        builder.add_group("", "Source");
        builder.add_node("Source", "Bucket", StepData{std::make_shared<CustomActionStep>("Bucket", source), false});
        builder.add_tranche("Source", {"Bucket"});
        builder.add_group("", "Build");
        builder.add_node("Build", "Synth", StepData{synth_step, true});
        builder.add_tranche("Build", {"Synth"});
        builder.add_group("", "Assets");
        builder.add_node("Assets", "FileAsset1", PublishAssetsData{{asset}});
        builder.add_tranche("Assets", {"FileAsset1"});
        builder.add_group("", "Prod");
        builder.add_node("Prod", "Prepare", PrepareData{stack});
        builder.add_node("Prod", "Approve", StepData{std::make_shared<ManualApprovalStep>("Approve", "ok?"), false});
        builder.add_node("Prod", "Deploy", ExecuteData{stack, false});
        builder.add_tranche("Prod", {"Prepare"});
        builder.add_tranche("Prod", {"Approve"});
        builder.add_tranche("Prod", {"Deploy"});
        builder.set_cloud_assembly_file_set(synth_step->primary_output());

        EngineProps props;
        props.pipeline_name = "Demo";
        props.account = "1";
        props.region = "us-east-1";
        engine = std::make_unique<PipelineEngine>(props);
        engine->build_deployment(builder.build());

        document = YAML::Load(plan_to_yaml(engine->pipeline(), engine->synth_project()))["pipeline"];
    }

    YAML::Node find_named(const YAML::Node& list, const std::string& name) const
    {
        for (YAML::Node entry : list)
        {
            if (entry["name"].as<std::string>() == name)
            {
                return entry;
            }
        }
        return YAML::Node();
    }

    std::unique_ptr<PipelineEngine> engine;
    YAML::Node document;
};

} // namespace

TEST_F(PlanWriterTests, Write_PipelineProperties)
{
    ASSERT_TRUE(document.IsMap());
    EXPECT_EQ(document["name"].as<std::string>(), "Demo");
    EXPECT_FALSE(document["cross_account_keys"].as<bool>());
    EXPECT_TRUE(document["restart_execution_on_update"].as<bool>());
    EXPECT_EQ(document["synth_project"].as<std::string>(), "CdkBuildProject");
    EXPECT_EQ(document["artifacts"].as<std::vector<std::string>>(),
              (std::vector<std::string>{"Bucket_Source", "Synth_Output"}));
}

TEST_F(PlanWriterTests, Write_StagesInOrder)
{
    const YAML::Node stages = document["stages"];
    ASSERT_EQ(stages.size(), 4u);
    EXPECT_EQ(stages[0]["name"].as<std::string>(), "Source");
    EXPECT_EQ(stages[3]["name"].as<std::string>(), "Prod");

    const YAML::Node prod = stages[3]["actions"];
    ASSERT_EQ(prod.size(), 3u);
    EXPECT_EQ(prod[0]["type"].as<std::string>(), "create-change-set");
    EXPECT_EQ(prod[0]["template_path"].as<std::string>(), "Synth_Output::App.template.json");
    EXPECT_EQ(prod[0]["run_order"].as<int>(), 1);
    EXPECT_FALSE(prod[0]["region"]);
    EXPECT_FALSE(prod[0]["account"]);
    EXPECT_EQ(prod[1]["type"].as<std::string>(), "manual-approval");
    EXPECT_EQ(prod[1]["comment"].as<std::string>(), "ok?");
    EXPECT_EQ(prod[1]["run_order"].as<int>(), 2);
    EXPECT_EQ(prod[2]["type"].as<std::string>(), "execute-change-set");
    EXPECT_EQ(prod[2]["change_set_name"].as<std::string>(), "PipelineChange");
    EXPECT_EQ(prod[2]["run_order"].as<int>(), 3);
}

TEST_F(PlanWriterTests, Write_BuildAndCustomActions)
{
    const YAML::Node source = document["stages"][0]["actions"][0];
    EXPECT_EQ(source["type"].as<std::string>(), "custom");
    EXPECT_EQ(source["provider"].as<std::string>(), "S3");
    EXPECT_EQ(source["outputs"][0].as<std::string>(), "Bucket_Source");
    EXPECT_FALSE(source["configuration"]);

    const YAML::Node synth = document["stages"][1]["actions"][0];
    EXPECT_EQ(synth["type"].as<std::string>(), "build");
    EXPECT_EQ(synth["project"].as<std::string>(), "CdkBuildProject");
    EXPECT_EQ(synth["input"].as<std::string>(), "Bucket_Source");
    EXPECT_TRUE(synth["before_self_mutation"].as<bool>());
}

TEST_F(PlanWriterTests, Write_Projects)
{
    const YAML::Node projects = document["projects"];
    ASSERT_TRUE(projects.IsSequence());

    YAML::Node publish;
    for (YAML::Node project : projects)
    {
        if (project["construct_id"].as<std::string>() == "FileAsset1")
        {
            publish = project;
        }
    }
    ASSERT_TRUE(publish.IsMap());
    EXPECT_EQ(publish["role"].as<std::string>(), "FileRole");
    EXPECT_EQ(publish["build_image"].as<std::string>(), "aws/codebuild/standard:5.0");
    EXPECT_FALSE(publish["privileged"].as<bool>());
    EXPECT_EQ(publish["commands"][0].as<std::string>(),
              "cdk-assets --path \"App.assets.json\" --verbose publish \"abc:1-us-east-1\"");
    EXPECT_FALSE(publish["vpc"]);
}

TEST_F(PlanWriterTests, Write_RolesWithResolvedStatements)
{
    const YAML::Node file_role = find_named(document["roles"], "FileRole");
    ASSERT_TRUE(file_role.IsMap());
    EXPECT_EQ(file_role["assumed_by"][0].as<std::string>(), "codebuild.amazonaws.com");

    bool found_assume = false;
    for (YAML::Node statement : file_role["statements"])
    {
        if (statement["actions"][0].as<std::string>() == "sts:AssumeRole")
        {
            found_assume = true;
            EXPECT_EQ(statement["resources"].as<std::vector<std::string>>(),
                      (std::vector<std::string>{"arn:aws:iam::1:role/file-publishing"}));
        }
    }
    EXPECT_TRUE(found_assume);
}

TEST(PlanWriterStandaloneTests, Write_UnfinalizedPlanThrows)
{
    PipelinePlan plan{std::string("Draft"), false, "arn:aws:s3:::bucket"};
    plan.add_stage("Empty");
    EXPECT_THROW(plan_to_yaml(plan), NotBuiltError);
}

TEST(PlanWriterStandaloneTests, Write_EmptyPlan)
{
    PipelinePlan plan{std::nullopt, true, "arn:aws:s3:::bucket"};
    plan.finalize();
    const YAML::Node document = YAML::Load(plan_to_yaml(plan))["pipeline"];
    EXPECT_FALSE(document["name"]);
    EXPECT_TRUE(document["cross_account_keys"].as<bool>());
    EXPECT_EQ(document["stages"].size(), 0u);
    EXPECT_FALSE(document["synth_project"]);
}

TEST(PlanWriterStandaloneTests, Write_ChangeSetTargetAccount)
{
    PipelinePlan plan{std::string("Remote"), true, "arn:aws:s3:::bucket"};
    CreateChangeSetActionConfig create;
    create.change_set_name = "PipelineChange";
    create.stack_name = "App";
    create.template_path = "Synth_Output::App.template.json";
    create.role_arn = "arn:aws:iam::2:role/deploy";
    create.region = "eu-west-1";
    create.account = "2";
    ExecuteChangeSetActionConfig execute;
    execute.change_set_name = "PipelineChange";
    execute.stack_name = "App";
    execute.role_arn = "arn:aws:iam::2:role/deploy";
    execute.account = "2";
    PlannedStage& stage = plan.add_stage("Prod");
    stage.add_action(PlannedAction{"Prepare", 1, create});
    stage.add_action(PlannedAction{"Deploy", 2, execute});
    plan.finalize();

    const YAML::Node actions = YAML::Load(plan_to_yaml(plan))["pipeline"]["stages"][0]["actions"];
    EXPECT_EQ(actions[0]["account"].as<std::string>(), "2");
    EXPECT_EQ(actions[0]["region"].as<std::string>(), "eu-west-1");
    EXPECT_EQ(actions[1]["account"].as<std::string>(), "2");
    EXPECT_FALSE(actions[1]["region"]);
}
