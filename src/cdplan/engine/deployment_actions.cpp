#include "cdplan/engine/deployment_actions.hpp"
#include "cdplan/common/pipeline_errors.hpp"

namespace cdplan
{

// ============================================================================
// ManualApprovalProducer
// ============================================================================

ManualApprovalProducer::ManualApprovalProducer(std::shared_ptr<const ManualApprovalStep> step)
    : m_step{std::move(step)}
{}

ProduceResult ManualApprovalProducer::produce(const ProduceContext& context)
{
    context.stage.add_action(PlannedAction{
        context.action_name,
        context.run_order,
        ManualApprovalActionConfig{m_step->comment()}});
    return ProduceResult{1, nullptr};
}

// ============================================================================
// CreateChangeSetProducer
// ============================================================================

CreateChangeSetProducer::CreateChangeSetProducer(Props props)
    : m_props{std::move(props)}
{
    if (!m_props.stack || !m_props.template_artifact)
    {
        throw ValidationError("Create change set action needs a stack and a template artifact");
    }
}

ProduceResult CreateChangeSetProducer::produce(const ProduceContext& context)
{
    const StackDeployment& stack = *m_props.stack;

    CreateChangeSetActionConfig config;
    config.change_set_name = m_props.change_set_name;
    config.stack_name = stack.stack_name;
    config.template_path = m_props.template_artifact->at_path(stack.template_path);
    if (m_props.template_configuration_path)
    {
        config.template_configuration = m_props.template_artifact->at_path(*m_props.template_configuration_path);
    }
    config.admin_permissions = true;
    config.role_arn = stack.assume_role_arn;
    config.deployment_role_arn = stack.execution_role_arn;
    config.region = m_props.region;
    config.account = m_props.account;

    context.stage.add_action(PlannedAction{context.action_name, context.run_order, std::move(config)});
    return ProduceResult{1, nullptr};
}

// ============================================================================
// ExecuteChangeSetProducer
// ============================================================================

ExecuteChangeSetProducer::ExecuteChangeSetProducer(Props props)
    : m_props{std::move(props)}
{
    if (!m_props.stack)
    {
        throw ValidationError("Execute change set action needs a stack");
    }
}

ProduceResult ExecuteChangeSetProducer::produce(const ProduceContext& context)
{
    const StackDeployment& stack = *m_props.stack;

    ExecuteChangeSetActionConfig config;
    config.change_set_name = m_props.change_set_name;
    config.stack_name = stack.stack_name;
    config.role_arn = stack.assume_role_arn;
    config.region = m_props.region;
    config.account = m_props.account;
    config.variables_namespace = m_props.variables_namespace;

    context.stage.add_action(PlannedAction{context.action_name, context.run_order, std::move(config)});
    return ProduceResult{1, nullptr};
}

} // namespace cdplan
