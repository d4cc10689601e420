/**
 * @file docker_credential.hpp
 * @brief Credentials for Docker registries used inside the pipeline.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/identity.hpp"
#include "cdplan/common/pipeline_enums.hpp"

namespace cdplan
{

/**
 * @brief A Docker registry credential.
 *
 * @details
 * Two flavors exist:
 * - A custom registry (e.g. Docker Hub) whose username and password are kept
 *   in a secret; reading it requires access to the secret.
 * - One or more ECR repositories; reading them requires pull access on the
 *   repositories and the account-wide authorization token.
 *
 * A credential applies to a subset of usages. Roles of build projects whose
 * usage is not in that subset are never granted access.
 */
class DockerCredential
{
public:
    /**
     * @brief Credential for a custom registry backed by a secret.
     * @param registry_domain Registry host name, e.g. `index.docker.io`.
     * @param secret_arn ARN of the secret holding the login.
     * @param usages Usages the credential applies to; empty means all.
     */
    static DockerCredential custom_registry(std::string registry_domain,
                                            std::string secret_arn,
                                            std::set<CredentialUsage> usages = {});

    /**
     * @brief Credential for pulling from ECR repositories.
     * @param repository_arns ARNs of the repositories; must not be empty.
     * @param usages Usages the credential applies to; empty means all.
     * @throws ValidationError if `repository_arns` is empty.
     */
    static DockerCredential ecr(std::vector<std::string> repository_arns,
                                std::set<CredentialUsage> usages = {});

    /**
     * @brief Registry host names the credential logs into.
     */
    std::vector<std::string> registries() const;

    /**
     * @brief Whether the credential applies to a usage.
     */
    bool applies_to(CredentialUsage usage) const;

    /**
     * @brief Grant the role read access if the usage applies.
     * @return True if every statement was added; false if the usage does not
     *         apply or the role refused the statements.
     */
    bool grant_read(Role& role, CredentialUsage usage) const;

    bool is_ecr() const noexcept { return !m_repository_arns.empty(); }
    const std::string& secret_arn() const noexcept { return m_secret_arn; }
    const std::vector<std::string>& repository_arns() const noexcept { return m_repository_arns; }
    const std::set<CredentialUsage>& usages() const noexcept { return m_usages; }

private:
    DockerCredential() = default;

    std::string m_registry_domain;
    std::string m_secret_arn;
    std::vector<std::string> m_repository_arns;
    std::set<CredentialUsage> m_usages;
};

/**
 * @brief Registries whose credentials apply to a usage, in credential order.
 */
std::vector<std::string> registries_for_usage(const std::vector<DockerCredential>& credentials,
                                              CredentialUsage usage);

} // namespace cdplan
