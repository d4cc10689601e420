/**
 * @file build_options.hpp
 * @brief Partial build project settings and their merge rules.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/identity.hpp"

namespace cdplan
{

/**
 * @brief Network placement of a build project.
 */
struct VpcConfig
{
    std::string vpc_id;
    std::vector<std::string> subnet_ids;
    std::vector<std::string> security_group_ids;
};

/**
 * @brief Partial build environment.
 *
 * @details
 * Unset fields inherit from whatever environment this one is merged onto.
 */
struct BuildEnvironment
{
    std::optional<std::string> build_image;
    std::optional<std::string> compute_type;
    std::optional<bool> privileged;
    std::map<std::string, std::string> environment_variables;
};

/**
 * @brief Partial build specification.
 *
 * @details
 * Only the pre-build phase is modeled. `docker_login_registries` lists the
 * registries whose credentials must be installed before the build runs; the
 * install commands themselves are generated elsewhere.
 */
struct PartialBuildSpec
{
    std::vector<std::string> pre_build_commands;
    std::vector<std::string> docker_login_registries;

    bool empty() const noexcept
    {
        return pre_build_commands.empty() && docker_login_registries.empty();
    }
};

/**
 * @brief Customizations for a build project.
 */
struct BuildOptions
{
    BuildEnvironment build_environment;
    std::vector<PolicyStatement> role_policy;
    PartialBuildSpec partial_build_spec;
    std::optional<VpcConfig> vpc;
};

/**
 * @brief Merge two build environments; values set in `overlay` win.
 */
BuildEnvironment merge_build_environment(const BuildEnvironment& base, const BuildEnvironment& overlay);

/**
 * @brief Merge two sets of build options.
 *
 * @details
 * Scalars set in `overlay` replace those in `base`, environment variables are
 * merged key by key, and lists (policy statements, pre-build commands,
 * registries) are concatenated with `base` first. A VPC in `overlay`
 * replaces the one in `base`.
 */
BuildOptions merge_build_options(const BuildOptions& base, const BuildOptions& overlay);

/**
 * @brief Merge a sequence of optional build options left to right.
 */
BuildOptions merge_build_options(const std::vector<std::optional<BuildOptions>>& layers);

} // namespace cdplan
