/**
 * @file pipeline_config_tests.cpp
 * Unit tests for cdplan::parse_pipeline_config
 */
#include <gtest/gtest.h>
#include "cdplan/common/pipeline_errors.hpp"
#include "cdplan/config/pipeline_config.hpp"
#include "cdplan/engine/custom_action_step.hpp"

#include <string>

using namespace cdplan;

namespace
{

const char* const full_description = R"(
pipeline:
  name: MyPipeline
  cli_version: "2.50.0"
  account: "111111111111"
  region: us-east-1
  single_publisher_per_asset_type: true
  build_defaults:
    compute_type: BUILD_GENERAL1_MEDIUM
    environment_variables: { STAGE: prod }
    role_policy:
      - actions: ["s3:GetObject"]
        resources: ["arn:aws:s3:::config/*"]
        conditions:
          StringEquals: { "aws:RequestedRegion": us-east-1 }
  asset_publishing_build_defaults:
    privileged: true
  docker_credentials:
    - { registry: docker.io, secret_arn: "arn:aws:secretsmanager:us-east-1:111111111111:secret:hub", usages: [synth, asset-publishing] }
    - { ecr: ["arn:aws:ecr:us-east-1:222222222222:repository/base"] }
stacks:
  - id: App
    stack_name: Prod-App
    region: eu-west-1
    assume_role_arn: "arn:aws:iam::111111111111:role/deploy"
    execution_role_arn: "arn:aws:iam::111111111111:role/exec"
    template_path: App.template.json
    tags: { team: platform }
graph:
  cloud_assembly: Synth
  nodes:
    - id: Source
      kind: group
      children:
        - id: GitHub
          kind: step
          step: { type: action, category: Source, provider: CodeStarSourceConnection, output: Source,
                  configuration: { FullRepositoryId: org/repo } }
      tranches: [[GitHub]]
    - id: Build
      kind: group
      children:
        - id: Synth
          kind: step
          build_step: true
          step:
            type: script
            input: GitHub
            commands: [npm ci, npx cdk synth]
            primary_output_directory: cdk.out
      tranches: [[Synth]]
    - id: UpdatePipeline
      kind: group
      children:
        - { id: SelfMutate, kind: self-update }
      tranches: [[SelfMutate]]
    - id: Assets
      kind: group
      children:
        - id: FileAsset1
          kind: publish-assets
          assets:
            - { asset_id: abc, selector: "abc:111111111111-eu-west-1", manifest_path: App.assets.json,
                publishing_role_arn: "arn:aws:iam::111111111111:role/file-publishing" }
      tranches: [[FileAsset1]]
    - id: Prod
      kind: group
      children:
        - id: App
          kind: stack-group
          stack: App
          children:
            - { id: Prepare, kind: prepare, stack: App }
            - { id: Deploy, kind: execute, stack: App, capture_outputs: true }
        - id: Approve
          kind: step
          step: { type: approval, comment: "Ship it?" }
      tranches: [[Approve], [App/Prepare], [App/Deploy]]
)";

std::string with_graph(const std::string& nodes)
{
    return "stacks:\n"
           "  - { id: App, assume_role_arn: arn, template_path: App.template.json }\n"
           "graph:\n"
           "  nodes:\n" + nodes;
}

} // namespace

// ============================================================================
// Valid descriptions
// ============================================================================

TEST(PipelineConfigTests, Parse_EngineProps)
{
    PipelineConfig config = parse_pipeline_config(full_description);
    const EngineProps& engine = config.engine;

    EXPECT_EQ(engine.pipeline_name, "MyPipeline");
    EXPECT_EQ(engine.cli_version, "2.50.0");
    EXPECT_EQ(engine.account, "111111111111");
    EXPECT_TRUE(engine.single_publisher_per_asset_type);
    EXPECT_TRUE(engine.self_mutation);
    EXPECT_FALSE(engine.cross_account_keys);

    ASSERT_TRUE(engine.build_defaults.has_value());
    EXPECT_EQ(engine.build_defaults->build_environment.compute_type, "BUILD_GENERAL1_MEDIUM");
    EXPECT_EQ(engine.build_defaults->build_environment.environment_variables.at("STAGE"), "prod");
    ASSERT_EQ(engine.build_defaults->role_policy.size(), 1u);
    EXPECT_EQ(engine.build_defaults->role_policy[0].conditions.at("StringEquals").at("aws:RequestedRegion"),
              (std::vector<std::string>{"us-east-1"}));
    ASSERT_TRUE(engine.asset_publishing_build_defaults.has_value());
    EXPECT_EQ(engine.asset_publishing_build_defaults->build_environment.privileged, true);

    ASSERT_EQ(engine.docker_credentials.size(), 2u);
    EXPECT_FALSE(engine.docker_credentials[0].is_ecr());
    EXPECT_TRUE(engine.docker_credentials[0].applies_to(CredentialUsage::Synth));
    EXPECT_FALSE(engine.docker_credentials[0].applies_to(CredentialUsage::SelfUpdate));
    EXPECT_TRUE(engine.docker_credentials[1].is_ecr());
    EXPECT_EQ(engine.docker_credentials[1].registries(),
              (std::vector<std::string>{"222222222222.dkr.ecr.us-east-1.amazonaws.com"}));
}

TEST(PipelineConfigTests, Parse_StacksAndSteps)
{
    PipelineConfig config = parse_pipeline_config(full_description);

    ASSERT_EQ(config.stacks.count("App"), 1u);
    const StackDeployment& stack = *config.stacks.at("App");
    EXPECT_EQ(stack.stack_name, "Prod-App");
    EXPECT_EQ(stack.region, "eu-west-1");
    EXPECT_EQ(stack.execution_role_arn, "arn:aws:iam::111111111111:role/exec");
    EXPECT_EQ(stack.tags.at("team"), "platform");

    ASSERT_EQ(config.steps.size(), 3u);
    auto synth = std::dynamic_pointer_cast<ScriptStep>(config.steps.at("Synth"));
    ASSERT_NE(synth, nullptr);
    EXPECT_EQ(synth->input(), config.steps.at("GitHub")->primary_output());
    EXPECT_EQ(synth->commands(), (std::vector<std::string>{"npm ci", "npx cdk synth"}));
    EXPECT_NE(std::dynamic_pointer_cast<CustomActionStep>(config.steps.at("GitHub")), nullptr);

    auto approval = std::dynamic_pointer_cast<ManualApprovalStep>(config.steps.at("Approve"));
    ASSERT_NE(approval, nullptr);
    EXPECT_EQ(approval->comment(), "Ship it?");
}

TEST(PipelineConfigTests, Parse_Graph)
{
    PipelineConfig config = parse_pipeline_config(full_description);
    const PipelineGraph& graph = *config.graph;

    EXPECT_EQ(graph.top_level().size(), 5u);
    EXPECT_EQ(graph.cloud_assembly_file_set(), config.steps.at("Synth")->primary_output());

    auto prod = graph.find_path(graph.root(), "Prod");
    ASSERT_TRUE(prod.has_value());
    const auto& tranches = graph.sorted_leaves(*prod);
    ASSERT_EQ(tranches.size(), 3u);
    EXPECT_EQ(graph.node(tranches[1][0]).id, "Prepare");

    auto deploy = graph.find_path(graph.root(), "Prod/App/Deploy");
    ASSERT_TRUE(deploy.has_value());
    const auto& execute = std::get<ExecuteData>(graph.node(*deploy).data);
    EXPECT_TRUE(execute.capture_outputs);
    EXPECT_EQ(execute.stack, config.stacks.at("App"));

    auto synth = graph.find_path(graph.root(), "Build/Synth");
    ASSERT_TRUE(synth.has_value());
    EXPECT_TRUE(std::get<StepData>(graph.node(*synth).data).is_build_step);

    auto asset = graph.find_path(graph.root(), "Assets/FileAsset1");
    ASSERT_TRUE(asset.has_value());
    const auto& publish = std::get<PublishAssetsData>(graph.node(*asset).data);
    ASSERT_EQ(publish.assets.size(), 1u);
    EXPECT_EQ(publish.assets[0].asset_type, AssetType::File);
    EXPECT_EQ(publish.assets[0].publishing_role_arn, "arn:aws:iam::111111111111:role/file-publishing");
}

TEST(PipelineConfigTests, Parse_DescriptionCompiles)
{
    PipelineConfig config = parse_pipeline_config(full_description);
    PipelineEngine engine(config.engine);
    engine.build_deployment(config.graph);

    const PipelinePlan& plan = engine.pipeline();
    ASSERT_EQ(plan.stages().size(), 5u);
    const PlannedStage* prod = plan.find_stage("Prod");
    ASSERT_NE(prod, nullptr);
    ASSERT_NE(prod->find_action("App.Deploy"), nullptr);
    EXPECT_EQ(prod->find_action("App.Deploy")->run_order, 3);
}

TEST(PipelineConfigTests, Parse_StackNameDefaultsToId)
{
    PipelineConfig config = parse_pipeline_config(with_graph("    - { id: Empty, kind: group }\n"));
    EXPECT_EQ(config.stacks.at("App")->stack_name, "App");
    EXPECT_FALSE(config.engine.pipeline_name.has_value());
}

// ============================================================================
// Errors
// ============================================================================

TEST(PipelineConfigTests, Error_MalformedDocument)
{
    EXPECT_THROW(parse_pipeline_config("graph: [unclosed"), ConfigurationError);
}

TEST(PipelineConfigTests, Error_MissingGraph)
{
    EXPECT_THROW(parse_pipeline_config("pipeline: { name: P }\n"), ConfigurationError);
}

TEST(PipelineConfigTests, Error_MissingRequiredKey)
{
    EXPECT_THROW(parse_pipeline_config(with_graph("    - { kind: group }\n")), ConfigurationError);
}

TEST(PipelineConfigTests, Error_UnknownKind)
{
    EXPECT_THROW(parse_pipeline_config(with_graph("    - { id: X, kind: stage }\n")), ConfigurationError);
}

TEST(PipelineConfigTests, Error_UnknownStack)
{
    const std::string nodes =
        "    - id: Prod\n"
        "      kind: group\n"
        "      children:\n"
        "        - { id: Prepare, kind: prepare, stack: Other }\n";
    EXPECT_THROW(parse_pipeline_config(with_graph(nodes)), ConfigurationError);
}

TEST(PipelineConfigTests, Error_StepReferencedBeforeDeclaration)
{
    const std::string nodes =
        "    - id: Build\n"
        "      kind: group\n"
        "      children:\n"
        "        - { id: Test, kind: step, step: { type: script, input: Synth, commands: [make test] } }\n"
        "        - { id: Synth, kind: step, step: { type: script, primary_output_directory: out } }\n";
    EXPECT_THROW(parse_pipeline_config(with_graph(nodes)), ConfigurationError);
}

TEST(PipelineConfigTests, Error_TranchesOnNestedNode)
{
    const std::string nodes =
        "    - id: Prod\n"
        "      kind: group\n"
        "      children:\n"
        "        - id: Inner\n"
        "          kind: group\n"
        "          children:\n"
        "            - { id: Approve, kind: step, step: { type: approval } }\n"
        "          tranches: [[Approve]]\n";
    EXPECT_THROW(parse_pipeline_config(with_graph(nodes)), ConfigurationError);
}

TEST(PipelineConfigTests, Error_TrancheNamesUnknownNode)
{
    const std::string nodes =
        "    - id: Prod\n"
        "      kind: group\n"
        "      tranches: [[Missing]]\n";
    EXPECT_THROW(parse_pipeline_config(with_graph(nodes)), ConfigurationError);
}

TEST(PipelineConfigTests, Error_DuplicateNodeId)
{
    const std::string nodes =
        "    - { id: Prod, kind: group }\n"
        "    - { id: Prod, kind: group }\n";
    EXPECT_THROW(parse_pipeline_config(with_graph(nodes)), ConfigurationError);
}

TEST(PipelineConfigTests, Error_UnknownCredentialUsage)
{
    const std::string text =
        "pipeline:\n"
        "  docker_credentials:\n"
        "    - { registry: docker.io, secret_arn: arn, usages: [deploy] }\n" + with_graph("    - { id: E, kind: group }\n");
    EXPECT_THROW(parse_pipeline_config(text), ConfigurationError);
}

TEST(PipelineConfigTests, Error_InvalidActionStep)
{
    const std::string nodes =
        "    - id: Test\n"
        "      kind: group\n"
        "      children:\n"
        "        - { id: Invoke, kind: step, step: { type: action, category: Invoke, provider: Lambda, run_orders: 0 } }\n";
    EXPECT_THROW(parse_pipeline_config(with_graph(nodes)), ConfigurationError);
}

TEST(PipelineConfigTests, Error_ErrorNamesYamlPath)
{
    try
    {
        parse_pipeline_config(with_graph("    - { id: X, kind: stage }\n"));
        FAIL() << "Expected ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_NE(std::string(e.what()).find("graph.nodes[0].kind"), std::string::npos);
    }
}

TEST(PipelineConfigTests, Load_MissingFile)
{
    EXPECT_THROW(load_pipeline_config("/nonexistent/pipeline.yaml"), ConfigurationError);
}
