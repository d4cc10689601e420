#include "cdplan/common/docker_credential.hpp"
#include "cdplan/common/pipeline_errors.hpp"

#include <algorithm>
#include <sstream>

namespace cdplan
{

namespace
{

/// Split an ARN into its colon-separated fields.
std::vector<std::string> arn_fields(const std::string& arn)
{
    std::vector<std::string> fields;
    std::stringstream ss(arn);
    std::string field;
    while (std::getline(ss, field, ':'))
    {
        fields.push_back(field);
    }
    return fields;
}

/// `<account>.dkr.ecr.<region>.amazonaws.com` for an ECR repository ARN.
std::string ecr_registry_of(const std::string& repository_arn)
{
    auto fields = arn_fields(repository_arn);
    if (fields.size() < 6 || fields[0] != "arn" || fields[2] != "ecr")
    {
        throw ValidationError("Not an ECR repository ARN: '" + repository_arn + "'");
    }
    return fields[4] + ".dkr.ecr." + fields[3] + ".amazonaws.com";
}

} // namespace

DockerCredential DockerCredential::custom_registry(std::string registry_domain,
                                                   std::string secret_arn,
                                                   std::set<CredentialUsage> usages)
{
    DockerCredential cred;
    cred.m_registry_domain = std::move(registry_domain);
    cred.m_secret_arn = std::move(secret_arn);
    cred.m_usages = std::move(usages);
    return cred;
}

DockerCredential DockerCredential::ecr(std::vector<std::string> repository_arns,
                                       std::set<CredentialUsage> usages)
{
    if (repository_arns.empty())
    {
        throw ValidationError("An ECR credential needs at least one repository");
    }
    for (const auto& arn : repository_arns)
    {
        ecr_registry_of(arn);
    }
    DockerCredential cred;
    cred.m_repository_arns = std::move(repository_arns);
    cred.m_usages = std::move(usages);
    return cred;
}

std::vector<std::string> DockerCredential::registries() const
{
    if (!is_ecr())
    {
        return {m_registry_domain};
    }
    std::vector<std::string> result;
    for (const auto& arn : m_repository_arns)
    {
        auto registry = ecr_registry_of(arn);
        if (std::find(result.begin(), result.end(), registry) == result.end())
        {
            result.push_back(std::move(registry));
        }
    }
    return result;
}

bool DockerCredential::applies_to(CredentialUsage usage) const
{
    return m_usages.empty() || m_usages.count(usage) > 0;
}

bool DockerCredential::grant_read(Role& role, CredentialUsage usage) const
{
    if (!applies_to(usage))
    {
        return false;
    }

    if (!is_ecr())
    {
        PolicyStatement statement;
        statement.actions = {"secretsmanager:GetSecretValue", "secretsmanager:DescribeSecret"};
        statement.resources = {m_secret_arn};
        return role.add_to_policy(std::move(statement));
    }

    PolicyStatement pull;
    pull.actions = {"ecr:BatchCheckLayerAvailability", "ecr:GetDownloadUrlForLayer", "ecr:BatchGetImage"};
    pull.resources = m_repository_arns;

    PolicyStatement token;
    token.actions = {"ecr:GetAuthorizationToken"};
    token.resources = {"*"};

    bool added = role.add_to_policy(std::move(pull));
    return role.add_to_policy(std::move(token)) && added;
}

std::vector<std::string> registries_for_usage(const std::vector<DockerCredential>& credentials,
                                              CredentialUsage usage)
{
    std::vector<std::string> result;
    for (const auto& cred : credentials)
    {
        if (!cred.applies_to(usage))
        {
            continue;
        }
        for (auto& registry : cred.registries())
        {
            result.push_back(std::move(registry));
        }
    }
    return result;
}

} // namespace cdplan
