#include "cdplan/engine/pipeline_plan.hpp"
#include "cdplan/common/pipeline_errors.hpp"

#include <algorithm>

namespace cdplan
{

// ============================================================================
// PlannedStage
// ============================================================================

void PlannedStage::add_action(PlannedAction action)
{
    if (action.run_order < 1)
    {
        throw ValidationError(
            "Action '" + action.name + "' in stage '" + m_name + "' has run order " +
            std::to_string(action.run_order) + "; run orders start at 1");
    }
    if (find_action(action.name))
    {
        throw ValidationError(
            "Stage '" + m_name + "' already contains an action named '" + action.name + "'");
    }
    m_actions.push_back(std::move(action));
}

const PlannedAction* PlannedStage::find_action(const std::string& name) const
{
    for (const auto& action : m_actions)
    {
        if (action.name == name)
        {
            return &action;
        }
    }
    return nullptr;
}

// ============================================================================
// PipelinePlan
// ============================================================================

PipelinePlan::PipelinePlan(std::optional<std::string> name, bool cross_account_keys, std::string artifact_bucket_arn)
    : m_name{std::move(name)}
    , m_cross_account_keys{cross_account_keys}
    , m_artifact_bucket_arn{std::move(artifact_bucket_arn)}
{}

PlannedStage& PipelinePlan::add_stage(const std::string& name)
{
    if (m_finalized)
    {
        throw AlreadyBuiltError("Cannot add stage '" + name + "' to a finalized pipeline");
    }
    if (find_stage(name))
    {
        throw ValidationError("Pipeline already contains a stage named '" + name + "'");
    }
    m_stages.push_back(std::make_unique<PlannedStage>(name));
    return *m_stages.back();
}

const PlannedStage* PipelinePlan::find_stage(const std::string& name) const
{
    for (const auto& stage : m_stages)
    {
        if (stage->name() == name)
        {
            return stage.get();
        }
    }
    return nullptr;
}

void PipelinePlan::register_role(const RolePtr& role)
{
    if (std::find(m_roles.begin(), m_roles.end(), role) == m_roles.end())
    {
        m_roles.push_back(role);
    }
}

void PipelinePlan::register_project(const BuildProjectPtr& project)
{
    m_projects.push_back(project);
    register_role(project->role());
}

RolePtr PipelinePlan::find_role(const std::string& name) const
{
    for (const auto& role : m_roles)
    {
        if (role->name() == name)
        {
            return role;
        }
    }
    return nullptr;
}

bool PipelinePlan::grant_artifact_read(Role& role) const
{
    PolicyStatement statement;
    statement.actions = {"s3:GetObject*", "s3:GetBucket*", "s3:List*"};
    statement.resources = {m_artifact_bucket_arn, m_artifact_bucket_arn + "/*"};
    return role.add_to_policy(std::move(statement));
}

void PipelinePlan::finalize()
{
    if (m_finalized)
    {
        throw AlreadyBuiltError("Pipeline has already been finalized");
    }

    m_resolved_roles.clear();
    m_resolved_roles.reserve(m_roles.size());
    for (const auto& role : m_roles)
    {
        ResolvedRole resolved{role, {}};
        resolved.statements.reserve(role->statements().size());
        for (const auto& statement : role->statements())
        {
            resolved.statements.push_back(statement.resolve());
        }
        m_resolved_roles.push_back(std::move(resolved));
    }
    m_finalized = true;
}

const std::vector<ResolvedRole>& PipelinePlan::resolved_roles() const
{
    if (!m_finalized)
    {
        throw NotBuiltError("Call finalize() before reading resolved roles");
    }
    return m_resolved_roles;
}

size_t PipelinePlan::action_count() const noexcept
{
    size_t count = 0;
    for (const auto& stage : m_stages)
    {
        count += stage->actions().size();
    }
    return count;
}

} // namespace cdplan
