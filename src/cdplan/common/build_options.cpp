#include "cdplan/common/build_options.hpp"

namespace cdplan
{

namespace
{

template <typename T>
void append(std::vector<T>& to, const std::vector<T>& from)
{
    to.insert(to.end(), from.begin(), from.end());
}

} // namespace

BuildEnvironment merge_build_environment(const BuildEnvironment& base, const BuildEnvironment& overlay)
{
    BuildEnvironment merged = base;
    if (overlay.build_image)
    {
        merged.build_image = overlay.build_image;
    }
    if (overlay.compute_type)
    {
        merged.compute_type = overlay.compute_type;
    }
    if (overlay.privileged)
    {
        merged.privileged = overlay.privileged;
    }
    for (const auto& [key, value] : overlay.environment_variables)
    {
        merged.environment_variables[key] = value;
    }
    return merged;
}

BuildOptions merge_build_options(const BuildOptions& base, const BuildOptions& overlay)
{
    BuildOptions merged;
    merged.build_environment = merge_build_environment(base.build_environment, overlay.build_environment);

    merged.role_policy = base.role_policy;
    append(merged.role_policy, overlay.role_policy);

    merged.partial_build_spec = base.partial_build_spec;
    append(merged.partial_build_spec.pre_build_commands, overlay.partial_build_spec.pre_build_commands);
    append(merged.partial_build_spec.docker_login_registries,
           overlay.partial_build_spec.docker_login_registries);

    merged.vpc = overlay.vpc ? overlay.vpc : base.vpc;
    return merged;
}

BuildOptions merge_build_options(const std::vector<std::optional<BuildOptions>>& layers)
{
    BuildOptions merged;
    for (const auto& layer : layers)
    {
        if (layer)
        {
            merged = merge_build_options(merged, *layer);
        }
    }
    return merged;
}

} // namespace cdplan
