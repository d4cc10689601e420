#include "cdplan/engine/build_action_factory.hpp"
#include "cdplan/common/pipeline_errors.hpp"

#include <spdlog/spdlog.h>

namespace cdplan
{

std::shared_ptr<BuildActionFactory> BuildActionFactory::from_script_step(
    std::string construct_id,
    std::shared_ptr<const ScriptStep> step,
    Options options)
{
    return std::make_shared<BuildActionFactory>(std::move(construct_id), std::move(step), std::move(options));
}

BuildActionFactory::BuildActionFactory(std::string construct_id, std::shared_ptr<const ScriptStep> step, Options options)
    : m_construct_id{std::move(construct_id)}
    , m_step{std::move(step)}
    , m_options{std::move(options)}
{
    if (!m_step)
    {
        throw ValidationError("Build action '" + m_construct_id + "' has no step");
    }
}

ProduceResult BuildActionFactory::produce(const ProduceContext& context)
{
    BuildOptions options = context.build_defaults.value_or(BuildOptions{});

    const auto* build_step = dynamic_cast<const BuildStep*>(m_step.get());
    if (build_step)
    {
        BuildOptions step_options;
        step_options.build_environment = build_step->build_environment();
        step_options.role_policy = build_step->role_policy_statements();
        step_options.partial_build_spec = build_step->partial_build_spec();
        options = merge_build_options(options, step_options);
    }
    for (const auto& [key, value] : m_step->env())
    {
        options.build_environment.environment_variables[key] = value;
    }

    // Inputs and outputs
    ArtifactPtr input = m_step->input()
        ? context.artifacts.to_pipeline(m_step->input())
        : context.fallback_artifact;
    if (!input)
    {
        throw ValidationError(
            "Build action '" + m_construct_id + "' requires an input (and the pipeline "
            "doesn't have a Source to fall back to). Add an input or a pipeline source.");
    }

    BuildActionConfig config;
    config.input = input;
    config.before_self_mutation = context.before_self_mutation;
    for (const auto& [directory, file_set] : m_step->additional_inputs())
    {
        config.extra_inputs.push_back(context.artifacts.to_pipeline(file_set));
    }
    if (m_step->primary_output())
    {
        config.outputs.push_back(context.artifacts.to_pipeline(m_step->primary_output()));
    }

    // Role
    RolePtr role = build_step ? build_step->role() : nullptr;
    if (!role)
    {
        role = std::make_shared<Role>(m_construct_id + "Role", std::vector<std::string>{"codebuild.amazonaws.com"});
        context.pipeline.grant_artifact_read(*role);
    }
    for (const auto& statement : options.role_policy)
    {
        if (!role->add_to_policy(statement))
        {
            SPDLOG_DEBUG("Build action {}: role {} did not take a role policy statement",
                m_construct_id, role->name());
        }
    }

    BuildProject::Props props;
    props.construct_id = m_construct_id;
    props.project_name = build_step ? build_step->project_name() : std::nullopt;
    props.role = role;
    props.environment = options.build_environment;
    props.install_commands = m_step->install_commands();
    props.commands = m_step->commands();
    props.partial_build_spec = options.partial_build_spec;
    props.vpc = options.vpc;
    props.additional_dependable = m_options.additional_dependable;
    props.build_spec_via_assembly = m_options.build_spec_via_assembly;

    auto project = std::make_shared<BuildProject>(std::move(props));
    context.pipeline.register_project(project);
    config.project = project;

    context.stage.add_action(PlannedAction{context.action_name, context.run_order, std::move(config)});

    ProduceResult result;
    result.run_orders_consumed = 1;
    result.project = project;
    return result;
}

} // namespace cdplan
