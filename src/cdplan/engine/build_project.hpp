/**
 * @file build_project.hpp
 * @brief BuildProject: the compute identity behind a build action.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/build_options.hpp"
#include "cdplan/common/identity.hpp"
#include "cdplan/engine/artifact_map.hpp"

namespace cdplan
{

/**
 * @brief A build project run by a build action.
 *
 * @details
 * A project runs under a role. Permission grants made on the project go to
 * that role, and are silently refused when the role is frozen (shared asset
 * roles are).
 */
class BuildProject
{
public:
    struct Props
    {
        /// Identifier of the project within the pipeline.
        std::string construct_id;

        /// Physical project name, if fixed.
        std::optional<std::string> project_name;

        RolePtr role;
        BuildEnvironment environment;
        std::vector<std::string> install_commands;
        std::vector<std::string> commands;
        PartialBuildSpec partial_build_spec;
        std::optional<VpcConfig> vpc;

        /// Resource the project must be created after, if any.
        PolicyPtr additional_dependable;

        /// Pass the build spec through the cloud assembly instead of inline.
        bool build_spec_via_assembly{false};
    };

    explicit BuildProject(Props props);

    const std::string& construct_id() const noexcept { return m_props.construct_id; }
    const std::optional<std::string>& project_name() const noexcept { return m_props.project_name; }
    const RolePtr& role() const noexcept { return m_props.role; }
    const BuildEnvironment& environment() const noexcept { return m_props.environment; }
    const std::vector<std::string>& install_commands() const noexcept { return m_props.install_commands; }
    const std::vector<std::string>& commands() const noexcept { return m_props.commands; }
    const PartialBuildSpec& partial_build_spec() const noexcept { return m_props.partial_build_spec; }
    const std::optional<VpcConfig>& vpc() const noexcept { return m_props.vpc; }
    const PolicyPtr& additional_dependable() const noexcept { return m_props.additional_dependable; }
    bool build_spec_via_assembly() const noexcept { return m_props.build_spec_via_assembly; }

private:
    Props m_props;
};

using BuildProjectPtr = std::shared_ptr<BuildProject>;

} // namespace cdplan
