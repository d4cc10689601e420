/**
 * @file blueprint.hpp
 * @brief Deployment blueprint items referenced by graph nodes: file sets,
 *        steps, stack assets and stack deployments.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/build_options.hpp"
#include "cdplan/common/identity.hpp"
#include "cdplan/common/pipeline_enums.hpp"

namespace cdplan
{

/**
 * @brief A set of files produced by one step and consumed by others.
 *
 * @details
 * File sets are compared by identity: two distinct FileSet objects with the
 * same id are different file sets.
 */
struct FileSet
{
    std::string id;
    std::string producer_id;
};

using FileSetPtr = std::shared_ptr<const FileSet>;

/**
 * @brief Base class of everything a pipeline can run.
 *
 * @details
 * A step has an id and optionally a primary output. The engine recognizes
 * three step capabilities:
 * - steps that produce their own actions (they also implement
 *   `IActionProducer`),
 * - scripted builds (`ScriptStep` and `BuildStep`),
 * - manual approvals (`ManualApprovalStep`).
 *
 * Any other subclass is rejected by the engine.
 *
 * @par Lifecycle
 * - Created by user code and referenced from graph nodes.
 * - Object lifetime managed via shared_ptr.
 */
class Step
{
public:
    virtual ~Step() = 0;

    const std::string& id() const noexcept { return m_id; }

    /**
     * @brief The step's main output, or nullptr if it has none.
     */
    const FileSetPtr& primary_output() const noexcept { return m_primary_output; }

    /**
     * @brief Human-readable description for error messages.
     */
    virtual std::string describe() const;

protected:
    explicit Step(std::string id);

    /**
     * @brief Declare the primary output of this step.
     * @param file_set_id Id of the produced file set.
     * @return The new file set.
     */
    FileSetPtr configure_primary_output(std::string file_set_id);

private:
    Step(const Step&) = delete;
    Step(Step&&) = delete;
    Step& operator=(const Step&) = delete;
    Step& operator=(Step&&) = delete;

    std::string m_id;
    FileSetPtr m_primary_output;
};

using StepPtr = std::shared_ptr<Step>;

/**
 * @brief A step that runs shell commands in a build project.
 */
class ScriptStep : public Step
{
public:
    struct Props
    {
        /// Main input, checked out as the working directory.
        FileSetPtr input;

        /// Additional inputs keyed by the directory they are placed in.
        std::map<std::string, FileSetPtr> additional_inputs;

        std::vector<std::string> install_commands;
        std::vector<std::string> commands;
        std::map<std::string, std::string> env;

        /// Directory whose contents become the primary output, if any.
        std::optional<std::string> primary_output_directory;
    };

    ScriptStep(std::string id, Props props);

    const FileSetPtr& input() const noexcept { return m_props.input; }
    const std::map<std::string, FileSetPtr>& additional_inputs() const noexcept { return m_props.additional_inputs; }
    const std::vector<std::string>& install_commands() const noexcept { return m_props.install_commands; }
    const std::vector<std::string>& commands() const noexcept { return m_props.commands; }
    const std::map<std::string, std::string>& env() const noexcept { return m_props.env; }
    const std::optional<std::string>& primary_output_directory() const noexcept { return m_props.primary_output_directory; }

    std::string describe() const override;

private:
    Props m_props;
};

/**
 * @brief A scripted step with control over its build project.
 */
class BuildStep : public ScriptStep
{
public:
    struct BuildProps
    {
        std::optional<std::string> project_name;
        BuildEnvironment build_environment;
        PartialBuildSpec partial_build_spec;
        std::vector<PolicyStatement> role_policy_statements;

        /// Existing role to run under; a new role is created when null.
        RolePtr role;
    };

    BuildStep(std::string id, Props props, BuildProps build_props);

    const std::optional<std::string>& project_name() const noexcept { return m_build_props.project_name; }
    const BuildEnvironment& build_environment() const noexcept { return m_build_props.build_environment; }
    const PartialBuildSpec& partial_build_spec() const noexcept { return m_build_props.partial_build_spec; }
    const std::vector<PolicyStatement>& role_policy_statements() const noexcept { return m_build_props.role_policy_statements; }
    const RolePtr& role() const noexcept { return m_build_props.role; }

    std::string describe() const override;

private:
    BuildProps m_build_props;
};

/**
 * @brief A step that waits for a human to approve.
 */
class ManualApprovalStep : public Step
{
public:
    explicit ManualApprovalStep(std::string id, std::optional<std::string> comment = std::nullopt);

    const std::optional<std::string>& comment() const noexcept { return m_comment; }

    std::string describe() const override;

private:
    std::optional<std::string> m_comment;
};

/**
 * @brief An asset that must be published before a stack can be deployed.
 */
struct StackAsset
{
    std::string asset_id;

    /// Selector passed to the publishing tool, `<asset id>:<destination>`.
    std::string asset_selector;

    /// Manifest path, relative to the cloud assembly root.
    std::string asset_manifest_path;

    AssetType asset_type{AssetType::File};

    /// Role the publishing build must assume, if any.
    std::optional<std::string> publishing_role_arn;
};

/**
 * @brief A stack to be deployed through a change set.
 */
struct StackDeployment
{
    std::string stack_artifact_id;
    std::string stack_name;

    /// Target region and account; unset means the pipeline's own.
    std::optional<std::string> region;
    std::optional<std::string> account;

    /// Role the pipeline assumes to manage the change set.
    std::string assume_role_arn;

    /// Role the deployment service runs the change set under, if any.
    std::optional<std::string> execution_role_arn;

    /// Template path, relative to the cloud assembly root.
    std::string template_path;

    std::map<std::string, std::string> tags;
};

using StackDeploymentPtr = std::shared_ptr<const StackDeployment>;

} // namespace cdplan
