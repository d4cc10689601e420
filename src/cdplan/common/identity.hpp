/**
 * @file identity.hpp
 * @brief Execution identities: policy statements, inline policies and roles.
 */
#pragma once
#include "cdplan/common/common.hpp"

namespace cdplan
{

/**
 * @brief Producer of a resource list that is only known after compilation.
 */
using LazyResourceList = std::function<std::vector<std::string>()>;

/**
 * @brief A single permission statement.
 *
 * @details
 * A statement grants `actions` on `resources`, optionally restricted by
 * `conditions` (operator -> key -> values).
 *
 * A statement may carry a deferred resource list. Its value is not read when
 * the statement is added to a role; it is evaluated once, when the plan is
 * finalized, so that resources registered later in the compile are included.
 */
struct PolicyStatement
{
    std::vector<std::string> actions;
    std::vector<std::string> resources;
    std::map<std::string, std::map<std::string, std::vector<std::string>>> conditions;

    /// Deferred resources, appended to `resources` on resolve().
    LazyResourceList lazy_resources;

    bool is_deferred() const noexcept
    {
        return static_cast<bool>(lazy_resources);
    }

    /**
     * @brief Produce a copy with the deferred resources evaluated.
     * @return A statement without deferred resources.
     */
    PolicyStatement resolve() const;
};

/**
 * @brief A named inline policy attached to a role.
 *
 * @details
 * Consumers of a role that has an attached policy must depend on the policy,
 * since the permissions it carries only exist once it is created.
 */
class Policy
{
public:
    Policy(std::string name, std::vector<PolicyStatement> statements)
        : m_name{std::move(name)}
        , m_statements{std::move(statements)}
    {}

    const std::string& name() const noexcept { return m_name; }
    const std::vector<PolicyStatement>& statements() const noexcept { return m_statements; }

private:
    std::string m_name;
    std::vector<PolicyStatement> m_statements;
};

using PolicyPtr = std::shared_ptr<Policy>;

/**
 * @brief An execution role assumed by build projects and actions.
 *
 * @details
 * A role accumulates policy statements until it is frozen. Once frozen,
 * add_to_policy() refuses new statements and returns false; the role's
 * baseline permissions never change after that point. Additional permission
 * needs must then be expressed as a separate attached `Policy`.
 *
 * @par Thread Safety
 * - No internal synchronization.
 */
class Role
{
public:
    /**
     * @brief Construct a role.
     * @param name Role name, unique within a plan.
     * @param assumed_by Principals allowed to assume the role.
     */
    Role(std::string name, std::vector<std::string> assumed_by);

    const std::string& name() const noexcept { return m_name; }
    const std::vector<std::string>& assumed_by() const noexcept { return m_assumed_by; }

    /**
     * @brief Add a statement to the role's default policy.
     * @return True if the statement was added, false if the role is frozen.
     */
    bool add_to_policy(PolicyStatement statement);

    /**
     * @brief Attach a separately managed inline policy.
     * @note Attaching is allowed on frozen roles; the policy is its own resource.
     */
    void attach_inline_policy(PolicyPtr policy);

    /**
     * @brief Stop accepting new statements.
     */
    void freeze() noexcept { m_frozen = true; }

    bool is_frozen() const noexcept { return m_frozen; }

    const std::vector<PolicyStatement>& statements() const noexcept { return m_statements; }
    const std::vector<PolicyPtr>& attached_policies() const noexcept { return m_attached_policies; }

private:
    std::string m_name;
    std::vector<std::string> m_assumed_by;
    std::vector<PolicyStatement> m_statements;
    std::vector<PolicyPtr> m_attached_policies;
    bool m_frozen{false};
};

using RolePtr = std::shared_ptr<Role>;

} // namespace cdplan
