#include "cdplan/engine/pipeline_engine.hpp"
#include "cdplan/common/action_names.hpp"
#include "cdplan/common/pipeline_errors.hpp"
#include "cdplan/common/run_order_allocator.hpp"
#include "cdplan/common/tranche_chunker.hpp"
#include "cdplan/engine/build_action_factory.hpp"
#include "cdplan/engine/deployment_actions.hpp"

#include <spdlog/spdlog.h>

namespace cdplan
{

namespace
{

const char* const change_set_name = "PipelineChange";

} // namespace

PipelineEngine::PipelineEngine(EngineProps props)
    : m_props{std::move(props)}
{}

// ============================================================================
// Accessors
// ============================================================================

const PipelinePlan& PipelineEngine::pipeline() const
{
    if (!m_pipeline)
    {
        throw NotBuiltError("Pipeline not created yet; call build_deployment() first");
    }
    return *m_pipeline;
}

BuildProjectPtr PipelineEngine::synth_project() const
{
    if (!m_synth_project)
    {
        throw NotBuiltError("Call build_deployment() with a graph containing a synth step before reading this property");
    }
    return m_synth_project;
}

const ResourceCache& PipelineEngine::resources() const
{
    if (!m_resources)
    {
        throw NotBuiltError("Pipeline not created yet; call build_deployment() first");
    }
    return *m_resources;
}

// ============================================================================
// Compilation
// ============================================================================

void PipelineEngine::build_deployment(std::shared_ptr<const PipelineGraph> graph)
{
    if (m_build_started)
    {
        throw AlreadyBuiltError("Pipeline already created");
    }
    m_build_started = true;

    if (!graph)
    {
        throw StructuralError("Cannot build a pipeline without a graph");
    }

    auto plan = std::make_unique<PipelinePlan>(
        m_props.pipeline_name, m_props.cross_account_keys, "arn:aws:s3:::" + m_props.artifact_bucket);

    ResourceCache::Props cache_props;
    cache_props.account = m_props.account;
    cache_props.region = m_props.region;
    cache_props.docker_credentials = m_props.docker_credentials;
    cache_props.asset_vpc = build_defaults_for(BuildProjectType::Assets).vpc;
    auto resources = std::make_unique<ResourceCache>(std::move(cache_props));

    CompilerState state{*graph, *plan, *resources, nullptr, SelfMutationBarrier{m_props.self_mutation}, nullptr};
    stages_and_actions_from_graph(state);
    plan->finalize();

    m_graph = std::move(graph);
    m_pipeline = std::move(plan);
    m_resources = std::move(resources);
    m_synth_project = state.synth_project;

    spdlog::info("Built pipeline {}: {} stages, {} actions, {} roles",
        m_pipeline->name().value_or("(unnamed)"),
        m_pipeline->stages().size(),
        m_pipeline->action_count(),
        m_pipeline->roles().size());
}

void PipelineEngine::stages_and_actions_from_graph(CompilerState& state) const
{
    const PipelineGraph& graph = state.graph;

    for (NodeIdx stage_idx : graph.top_level())
    {
        const GraphNode& stage_node = graph.node(stage_idx);
        if (!stage_node.is_container())
        {
            throw StructuralError(
                "Top-level children must be graphs, got '" + stage_node.id + "' (" +
                node_kind_name(stage_node.data) + ")");
        }

        auto chunks = chunk_tranches(max_actions_per_stage, graph.sorted_leaves(stage_idx));
        const bool overflow = chunks.size() > 1;

        for (size_t chunk_no = 0; chunk_no < chunks.size(); ++chunk_no)
        {
            const auto& tranches = chunks[chunk_no];
            const std::string stage_name =
                overflow ? stage_node.id + "." + std::to_string(chunk_no + 1) : stage_node.id;
            PlannedStage& stage = state.pipeline.add_stage(stage_name);

            std::vector<NodeIdx> stage_leaves;
            for (const auto& tranche : tranches)
            {
                stage_leaves.insert(stage_leaves.end(), tranche.begin(), tranche.end());
            }
            if (stage_leaves.empty())
            {
                continue;
            }
            const NodeIdx shared_parent = graph.common_ancestor(stage_leaves);

            SPDLOG_DEBUG("Stage {}: {} actions in {} tranches, shared parent {}",
                stage_name, stage_leaves.size(), tranches.size(), graph.path_string(shared_parent));

            RunOrderAllocator run_orders;
            for (const auto& tranche : tranches)
            {
                run_orders.begin_tranche();
                for (NodeIdx leaf : tranche)
                {
                    const GraphNode& node = graph.node(leaf);
                    ActionProducerPtr producer = action_from_node(leaf, state);
                    const auto node_type = node_type_from_node(node);

                    ProduceContext context{
                        stage,
                        action_name(graph, leaf, shared_parent),
                        run_orders.current(),
                        state.pipeline,
                        state.pipeline.artifacts(),
                        state.fallback_artifact,
                        node_type ? std::optional<BuildOptions>{build_defaults_for(*node_type)} : std::nullopt,
                        state.barrier.before_self_mutation(),
                        state.resources,
                    };
                    ProduceResult result = producer->produce(context);

                    if (std::holds_alternative<SelfUpdateData>(node.data) &&
                        state.barrier.mark_self_update_scheduled())
                    {
                        SPDLOG_DEBUG("Self-update scheduled at {}", graph.path_string(leaf));
                    }

                    post_process_node(leaf, result, state);
                    run_orders.record(result.run_orders_consumed);

                    SPDLOG_DEBUG("  {} -> {} (run order {}, {} consumed)",
                        graph.path_string(leaf), context.action_name, context.run_order,
                        result.run_orders_consumed);
                }
                run_orders.end_tranche();
            }
        }
    }
}

ActionProducerPtr PipelineEngine::action_from_node(NodeIdx idx, CompilerState& state) const
{
    const GraphNode& node = state.graph.node(idx);

    struct Dispatch
    {
        const PipelineEngine& engine;
        CompilerState& state;
        NodeIdx idx;

        ActionProducerPtr not_schedulable(const char* kind) const
        {
            throw StructuralError(
                "Cannot turn '" + state.graph.path_string(idx) + "' (" + kind + ") into an action");
        }

        ActionProducerPtr operator()(const std::monostate&) const { return not_schedulable("none"); }
        ActionProducerPtr operator()(const GroupData&) const { return not_schedulable("group"); }
        ActionProducerPtr operator()(const StackGroupData&) const { return not_schedulable("stack-group"); }

        ActionProducerPtr operator()(const SelfUpdateData&) const
        {
            return engine.self_mutate_action(state);
        }

        ActionProducerPtr operator()(const PublishAssetsData& data) const
        {
            return engine.publish_assets_action(idx, data, state);
        }

        ActionProducerPtr operator()(const PrepareData& data) const
        {
            return engine.create_change_set_action(data, state);
        }

        ActionProducerPtr operator()(const ExecuteData& data) const
        {
            return engine.execute_change_set_action(data);
        }

        ActionProducerPtr operator()(const StepData& data) const
        {
            return engine.action_from_step(idx, data, state);
        }
    };

    return std::visit(Dispatch{*this, state, idx}, node.data);
}

ActionProducerPtr PipelineEngine::action_from_step(NodeIdx idx, const StepData& data, const CompilerState& state) const
{
    const StepPtr& step = data.step;
    if (!step)
    {
        throw StructuralError("Step node '" + state.graph.path_string(idx) + "' has no step");
    }

    // Steps that produce their own actions.
    if (auto native = std::dynamic_pointer_cast<IActionProducer>(step))
    {
        return native;
    }

    if (auto script = std::dynamic_pointer_cast<const ScriptStep>(step))
    {
        std::string construct_id = data.is_build_step ? "CdkBuildProject" : script->id();
        return BuildActionFactory::from_script_step(std::move(construct_id), std::move(script));
    }

    if (auto approval = std::dynamic_pointer_cast<const ManualApprovalStep>(step))
    {
        return std::make_shared<ManualApprovalProducer>(std::move(approval));
    }

    throw UnsupportedStepError(
        "Deployment step '" + step->describe() + "' is not supported by the pipeline engine");
}

ActionProducerPtr PipelineEngine::self_mutate_action(CompilerState& state) const
{
    ScriptStep::Props script;
    script.input = state.graph.cloud_assembly_file_set();
    script.install_commands = {"npm install -g aws-cdk" + cli_install_suffix()};
    script.commands = {
        "cdk -a " + m_props.assembly_path + " deploy " + m_props.pipeline_stack_name +
        " --require-approval=never --verbose"};

    BuildStep::BuildProps build;
    if (m_props.pipeline_name)
    {
        build.project_name = *m_props.pipeline_name + "-selfupdate";
    }
    if (m_props.pipeline_uses_docker_assets)
    {
        build.build_environment.privileged = true;
    }

    PolicyStatement assume_bootstrap_roles;
    assume_bootstrap_roles.actions = {"sts:AssumeRole"};
    assume_bootstrap_roles.resources = {"arn:*:iam::" + m_props.account + ":role/*"};
    assume_bootstrap_roles.conditions["ForAnyValue:StringEquals"]["iam:ResourceTag/aws-cdk:bootstrap-role"] = {
        "image-publishing", "file-publishing", "deploy"};

    PolicyStatement describe_stacks;
    describe_stacks.actions = {"cloudformation:DescribeStacks"};
    describe_stacks.resources = {"*"};

    // The deploy command checks the bootstrap version via the bucket.
    PolicyStatement list_bucket;
    list_bucket.actions = {"s3:ListBucket"};
    list_bucket.resources = {"*"};

    build.role_policy_statements = {
        std::move(assume_bootstrap_roles), std::move(describe_stacks), std::move(list_bucket)};

    std::shared_ptr<const ScriptStep> step =
        std::make_shared<BuildStep>("SelfMutate", std::move(script), std::move(build));
    return BuildActionFactory::from_script_step("SelfMutation", std::move(step));
}

ActionProducerPtr PipelineEngine::publish_assets_action(
    NodeIdx idx, const PublishAssetsData& data, CompilerState& state) const
{
    const GraphNode& node = state.graph.node(idx);
    if (data.assets.empty())
    {
        throw ValidationError("Publish node '" + state.graph.path_string(idx) + "' has no assets");
    }

    const AssetType asset_type = data.assets.front().asset_type;
    bool any_docker = false;
    std::vector<std::string> commands;
    for (const auto& asset : data.assets)
    {
        if (asset.asset_type != asset_type)
        {
            throw ValidationError(
                "All assets in a single publishing step must be of the same type (node '" +
                state.graph.path_string(idx) + "' mixes " + to_string(asset_type) + " and " +
                to_string(asset.asset_type) + ")");
        }
        any_docker = any_docker || asset.asset_type == AssetType::DockerImage;
        commands.push_back(
            "cdk-assets --path \"" + asset.asset_manifest_path + "\" --verbose publish \"" +
            asset.asset_selector + "\"");
    }

    state.resources.register_publishing_roles(asset_type, data.assets);
    const SharedResource shared = state.resources.obtain(asset_type, state.pipeline);

    ScriptStep::Props script;
    script.input = state.graph.cloud_assembly_file_set();
    script.install_commands = {"npm install -g cdk-assets" + cli_install_suffix()};
    script.commands = std::move(commands);

    BuildStep::BuildProps build;
    build.role = shared.role;
    if (any_docker)
    {
        build.build_environment.privileged = true;
    }

    std::shared_ptr<const ScriptStep> step =
        std::make_shared<BuildStep>(node.id, std::move(script), std::move(build));

    BuildActionFactory::Options options;
    options.additional_dependable = shared.dependable;
    options.build_spec_via_assembly = m_props.single_publisher_per_asset_type;
    return BuildActionFactory::from_script_step(node.id, std::move(step), std::move(options));
}

ActionProducerPtr PipelineEngine::create_change_set_action(const PrepareData& data, CompilerState& state) const
{
    if (!data.stack)
    {
        throw ValidationError("Prepare node has no stack");
    }
    const StackDeployment& stack = *data.stack;

    const FileSetPtr& assembly = state.graph.cloud_assembly_file_set();
    if (!assembly)
    {
        throw ValidationError(
            "Cannot deploy stack '" + stack.stack_name + "': the graph has no cloud assembly file set");
    }

    CreateChangeSetProducer::Props props;
    props.stack = data.stack;
    props.change_set_name = change_set_name;
    props.template_artifact = state.pipeline.artifacts().to_pipeline(assembly);
    if (!stack.tags.empty())
    {
        props.template_configuration_path = stack.template_path + ".config.json";
    }
    if (stack.region && *stack.region != m_props.region)
    {
        props.region = stack.region;
    }
    if (stack.account && *stack.account != m_props.account)
    {
        props.account = stack.account;
    }
    return std::make_shared<CreateChangeSetProducer>(std::move(props));
}

ActionProducerPtr PipelineEngine::execute_change_set_action(const ExecuteData& data) const
{
    if (!data.stack)
    {
        throw ValidationError("Execute node has no stack");
    }
    const StackDeployment& stack = *data.stack;

    ExecuteChangeSetProducer::Props props;
    props.stack = data.stack;
    props.change_set_name = change_set_name;
    if (stack.region && *stack.region != m_props.region)
    {
        props.region = stack.region;
    }
    if (stack.account && *stack.account != m_props.account)
    {
        props.account = stack.account;
    }
    if (data.capture_outputs)
    {
        props.variables_namespace = stack.stack_artifact_id;
    }
    return std::make_shared<ExecuteChangeSetProducer>(std::move(props));
}

void PipelineEngine::post_process_node(NodeIdx idx, const ProduceResult& result, CompilerState& state) const
{
    const GraphNode& node = state.graph.node(idx);
    const auto node_type = node_type_from_node(node);

    if (result.project && node_type)
    {
        if (const auto usage = credential_usage_for(*node_type))
        {
            for (const auto& credential : m_props.docker_credentials)
            {
                if (credential.applies_to(*usage) && !credential.grant_read(*result.project->role(), *usage))
                {
                    SPDLOG_DEBUG("Role {} did not take {} registry credentials",
                        result.project->role()->name(), to_string(*usage));
                }
            }
        }
        if (*node_type == BuildProjectType::Synth)
        {
            state.synth_project = result.project;
        }
    }

    const auto* step_data = std::get_if<StepData>(&node.data);
    if (step_data && step_data->step && step_data->step->primary_output() && !state.fallback_artifact)
    {
        state.fallback_artifact = state.pipeline.artifacts().to_pipeline(step_data->step->primary_output());
        SPDLOG_DEBUG("Fallback artifact is {}", state.fallback_artifact->name);
    }
}

// ============================================================================
// Build defaults
// ============================================================================

std::optional<BuildProjectType> PipelineEngine::node_type_from_node(const GraphNode& node)
{
    if (const auto* step = std::get_if<StepData>(&node.data))
    {
        return step->is_build_step ? BuildProjectType::Synth : BuildProjectType::Step;
    }
    if (std::holds_alternative<PublishAssetsData>(node.data))
    {
        return BuildProjectType::Assets;
    }
    if (std::holds_alternative<SelfUpdateData>(node.data))
    {
        return BuildProjectType::SelfMutate;
    }
    return std::nullopt;
}

BuildOptions PipelineEngine::build_defaults_for(BuildProjectType type) const
{
    BuildOptions builtin;
    builtin.build_environment.build_image = "aws/codebuild/standard:5.0";
    builtin.build_environment.compute_type = "BUILD_GENERAL1_SMALL";

    std::optional<BuildOptions> type_defaults;
    switch (type)
    {
        case BuildProjectType::Assets:
            type_defaults = m_props.asset_publishing_build_defaults;
            break;
        case BuildProjectType::SelfMutate:
            type_defaults = m_props.self_mutation_build_defaults;
            break;
        case BuildProjectType::Synth:
        case BuildProjectType::Step:
            break;
    }

    std::optional<BuildOptions> docker_logins;
    if (const auto usage = credential_usage_for(type))
    {
        auto registries = registries_for_usage(m_props.docker_credentials, *usage);
        if (!registries.empty())
        {
            BuildOptions logins;
            logins.partial_build_spec.docker_login_registries = std::move(registries);
            docker_logins = std::move(logins);
        }
    }

    return merge_build_options({builtin, m_props.build_defaults, type_defaults, docker_logins});
}

std::string PipelineEngine::cli_install_suffix() const
{
    return m_props.cli_version ? "@" + *m_props.cli_version : "";
}

} // namespace cdplan
