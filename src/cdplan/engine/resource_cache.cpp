#include "cdplan/engine/resource_cache.hpp"

#include <spdlog/spdlog.h>

namespace cdplan
{

ResourceCache::ResourceCache(Props props)
    : m_props{std::move(props)}
{}

SharedResource ResourceCache::obtain(AssetType type, PipelinePlan& plan)
{
    auto it = m_resources.find(type);
    if (it != m_resources.end())
    {
        return it->second;
    }
    SharedResource resource = build(type, plan);
    m_resources.emplace(type, resource);
    return resource;
}

std::shared_ptr<ResourceCache::RoleArnSet> ResourceCache::arn_set(AssetType type)
{
    auto& set = m_publishing_roles[type];
    if (!set)
    {
        set = std::make_shared<RoleArnSet>();
    }
    return set;
}

void ResourceCache::register_publishing_roles(AssetType type, const std::vector<StackAsset>& assets)
{
    auto set = arn_set(type);
    for (const auto& asset : assets)
    {
        if (asset.publishing_role_arn && set->seen.insert(*asset.publishing_role_arn).second)
        {
            set->ordered.push_back(*asset.publishing_role_arn);
        }
    }
}

std::vector<std::string> ResourceCache::publishing_roles(AssetType type) const
{
    auto it = m_publishing_roles.find(type);
    if (it == m_publishing_roles.end())
    {
        return {};
    }
    return it->second->ordered;
}

RolePtr ResourceCache::role_for(AssetType type) const
{
    auto it = m_resources.find(type);
    return it == m_resources.end() ? nullptr : it->second.role;
}

PolicyPtr ResourceCache::dependable_for(AssetType type) const
{
    auto it = m_resources.find(type);
    return it == m_resources.end() ? nullptr : it->second.dependable;
}

SharedResource ResourceCache::build(AssetType type, PipelinePlan& plan)
{
    const std::string& account = m_props.account;
    const std::string& region = m_props.region;

    const std::string role_prefix = type == AssetType::DockerImage ? "Docker" : "File";
    auto role = std::make_shared<Role>(
        role_prefix + "Role",
        std::vector<std::string>{"codebuild.amazonaws.com", "arn:aws:iam::" + account + ":root"});

    // Logging
    PolicyStatement logs;
    logs.actions = {"logs:CreateLogGroup", "logs:CreateLogStream", "logs:PutLogEvents"};
    logs.resources = {"arn:aws:logs:" + region + ":" + account + ":log-group:/aws/codebuild/*"};
    role->add_to_policy(std::move(logs));

    // Report groups
    PolicyStatement reports;
    reports.actions = {
        "codebuild:CreateReportGroup",
        "codebuild:CreateReport",
        "codebuild:UpdateReport",
        "codebuild:BatchPutTestCases",
        "codebuild:BatchPutCodeCoverages",
    };
    reports.resources = {"arn:aws:codebuild:" + region + ":" + account + ":report-group/*"};
    role->add_to_policy(std::move(reports));

    // Start/stop
    PolicyStatement builds;
    builds.actions = {"codebuild:BatchGetBuilds", "codebuild:StartBuild", "codebuild:StopBuild"};
    builds.resources = {"*"};
    role->add_to_policy(std::move(builds));

    // Publishing roles; evaluated at finalization so that every publish group
    // of this type is included.
    PolicyStatement assume;
    assume.actions = {"sts:AssumeRole"};
    std::shared_ptr<const RoleArnSet> arns = arn_set(type);
    assume.lazy_resources = [arns]() { return arns->ordered; };
    role->add_to_policy(std::move(assume));

    if (type == AssetType::DockerImage)
    {
        for (const auto& cred : m_props.docker_credentials)
        {
            cred.grant_read(*role, CredentialUsage::AssetPublishing);
        }
    }

    plan.grant_artifact_read(*role);

    PolicyPtr dependable;
    if (m_props.asset_vpc)
    {
        const auto& vpc = *m_props.asset_vpc;
        PolicyStatement eni_permission;
        eni_permission.actions = {"ec2:CreateNetworkInterfacePermission"};
        eni_permission.resources = {"arn:aws:ec2:" + region + ":" + account + ":network-interface/*"};
        std::vector<std::string> subnet_arns;
        for (const auto& subnet : vpc.subnet_ids)
        {
            subnet_arns.push_back("arn:aws:ec2:" + region + ":" + account + ":subnet/" + subnet);
        }
        eni_permission.conditions["StringEquals"]["ec2:Subnet"] = subnet_arns;
        eni_permission.conditions["StringEquals"]["ec2:AuthorizedService"] = {"codebuild.amazonaws.com"};

        PolicyStatement eni_management;
        eni_management.actions = {
            "ec2:CreateNetworkInterface",
            "ec2:DescribeNetworkInterfaces",
            "ec2:DeleteNetworkInterface",
            "ec2:DescribeSubnets",
            "ec2:DescribeSecurityGroups",
            "ec2:DescribeDhcpOptions",
            "ec2:DescribeVpcs",
        };
        eni_management.resources = {"*"};

        dependable = std::make_shared<Policy>(
            role_prefix + "RoleVpcPolicy",
            std::vector<PolicyStatement>{std::move(eni_permission), std::move(eni_management)});
        role->attach_inline_policy(dependable);
    }

    role->freeze();
    plan.register_role(role);

    SPDLOG_DEBUG("Created shared {} asset role {}", to_string(type), role->name());
    return SharedResource{role, dependable};
}

} // namespace cdplan
