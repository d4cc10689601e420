/**
 * @file pipeline_plan.hpp
 * @brief The compiled pipeline: stages, actions and the resources they use.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/identity.hpp"
#include "cdplan/engine/artifact_map.hpp"
#include "cdplan/engine/build_project.hpp"

namespace cdplan
{

// ============================================================================
// Action configurations
// ============================================================================

/// Run a build project.
struct BuildActionConfig
{
    BuildProjectPtr project;
    ArtifactPtr input;
    std::vector<ArtifactPtr> extra_inputs;
    std::vector<ArtifactPtr> outputs;

    /// The build runs before the pipeline updates itself.
    bool before_self_mutation{false};
};

/// Wait for a human approval.
struct ManualApprovalActionConfig
{
    std::optional<std::string> comment;
};

/// Create or replace a change set for a stack.
struct CreateChangeSetActionConfig
{
    std::string change_set_name;
    std::string stack_name;
    std::string template_path;
    std::optional<std::string> template_configuration;
    bool admin_permissions{true};
    std::string role_arn;
    std::optional<std::string> deployment_role_arn;
    std::optional<std::string> region;
    std::optional<std::string> account;
};

/// Execute a previously created change set.
struct ExecuteChangeSetActionConfig
{
    std::string change_set_name;
    std::string stack_name;
    std::string role_arn;
    std::optional<std::string> region;
    std::optional<std::string> account;
    std::optional<std::string> variables_namespace;
};

/// An action defined entirely by a step that produces its own actions.
struct CustomActionConfig
{
    std::string category;
    std::string provider;
    std::map<std::string, std::string> configuration;
    std::vector<ArtifactPtr> inputs;
    std::vector<ArtifactPtr> outputs;
};

using ActionConfig = std::variant<
    BuildActionConfig,
    ManualApprovalActionConfig,
    CreateChangeSetActionConfig,
    ExecuteChangeSetActionConfig,
    CustomActionConfig>;

/**
 * @brief One scheduled action.
 */
struct PlannedAction
{
    std::string name;
    int run_order{1};
    ActionConfig config;
};

// ============================================================================
// PlannedStage
// ============================================================================

/**
 * @brief A named stage holding actions.
 *
 * @details
 * Actions are kept in the order they were added. Action names are unique
 * within a stage, and run orders start at 1.
 */
class PlannedStage
{
public:
    explicit PlannedStage(std::string name)
        : m_name{std::move(name)}
    {}

    const std::string& name() const noexcept { return m_name; }

    /**
     * @brief Append an action.
     * @throw ValidationError if the name is taken in this stage or the run
     *        order is below 1.
     */
    void add_action(PlannedAction action);

    const std::vector<PlannedAction>& actions() const noexcept { return m_actions; }

    /**
     * @brief Find an action by name.
     * @return The action, or nullptr.
     */
    const PlannedAction* find_action(const std::string& name) const;

private:
    std::string m_name;
    std::vector<PlannedAction> m_actions;
};

// ============================================================================
// PipelinePlan
// ============================================================================

/**
 * @brief A role with every deferred statement evaluated.
 */
struct ResolvedRole
{
    RolePtr role;
    std::vector<PolicyStatement> statements;
};

/**
 * @brief The pipeline produced by compilation.
 *
 * @details
 * The plan owns the stages, the artifact map, and every role and build
 * project created while compiling. Stages run strictly one after another;
 * within a stage, actions sharing a run order run concurrently.
 *
 * @par Finalization
 * Role statements may carry resource lists that are only known once the
 * whole graph has been compiled. finalize() evaluates them exactly once; the
 * snapshot is available through resolved_roles() afterwards.
 *
 * @par Thread Safety
 * - No internal synchronization.
 * - Once finalized, concurrent reads are safe.
 */
class PipelinePlan
{
public:
    PipelinePlan(std::optional<std::string> name, bool cross_account_keys, std::string artifact_bucket_arn);

    const std::optional<std::string>& name() const noexcept { return m_name; }
    bool cross_account_keys() const noexcept { return m_cross_account_keys; }
    bool restart_execution_on_update() const noexcept { return true; }
    const std::string& artifact_bucket_arn() const noexcept { return m_artifact_bucket_arn; }

    /**
     * @brief Append a stage.
     * @throw ValidationError if the name is taken.
     * @throw AlreadyBuiltError after finalize().
     */
    PlannedStage& add_stage(const std::string& name);

    /**
     * @brief All stages in order.
     *
     * @details
     * Stages are held by unique_ptr so references returned by add_stage()
     * stay valid as more stages are added.
     */
    const std::vector<std::unique_ptr<PlannedStage>>& stages() const noexcept { return m_stages; }

    /**
     * @brief Find a stage by name.
     * @return The stage, or nullptr.
     */
    const PlannedStage* find_stage(const std::string& name) const;

    ArtifactMap& artifacts() noexcept { return m_artifacts; }
    const ArtifactMap& artifacts() const noexcept { return m_artifacts; }

    /**
     * @brief Track a role used by the pipeline. Registering twice is a no-op.
     */
    void register_role(const RolePtr& role);

    /**
     * @brief Track a build project used by the pipeline.
     */
    void register_project(const BuildProjectPtr& project);

    const std::vector<RolePtr>& roles() const noexcept { return m_roles; }
    const std::vector<BuildProjectPtr>& projects() const noexcept { return m_projects; }

    /**
     * @brief Find a role by name.
     * @return The role, or nullptr.
     */
    RolePtr find_role(const std::string& name) const;

    /**
     * @brief Grant read access on the artifact bucket to a role.
     * @return False if the role refused the statement.
     */
    bool grant_artifact_read(Role& role) const;

    /**
     * @brief Evaluate every deferred statement.
     * @throw AlreadyBuiltError on a second call.
     */
    void finalize();

    bool is_finalized() const noexcept { return m_finalized; }

    /**
     * @brief Roles with resolved statements, in registration order.
     * @throw NotBuiltError before finalize().
     */
    const std::vector<ResolvedRole>& resolved_roles() const;

    /**
     * @brief Total number of actions across all stages.
     */
    size_t action_count() const noexcept;

private:
    std::optional<std::string> m_name;
    bool m_cross_account_keys;
    std::string m_artifact_bucket_arn;
    std::vector<std::unique_ptr<PlannedStage>> m_stages;
    ArtifactMap m_artifacts;
    std::vector<RolePtr> m_roles;
    std::vector<BuildProjectPtr> m_projects;
    std::vector<ResolvedRole> m_resolved_roles;
    bool m_finalized{false};
};

} // namespace cdplan
