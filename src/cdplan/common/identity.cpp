#include "cdplan/common/identity.hpp"

#include <spdlog/spdlog.h>

namespace cdplan
{

PolicyStatement PolicyStatement::resolve() const
{
    PolicyStatement resolved;
    resolved.actions = actions;
    resolved.resources = resources;
    resolved.conditions = conditions;
    if (lazy_resources)
    {
        auto late = lazy_resources();
        resolved.resources.insert(resolved.resources.end(), late.begin(), late.end());
    }
    return resolved;
}

Role::Role(std::string name, std::vector<std::string> assumed_by)
    : m_name{std::move(name)}
    , m_assumed_by{std::move(assumed_by)}
{}

bool Role::add_to_policy(PolicyStatement statement)
{
    if (m_frozen)
    {
        SPDLOG_DEBUG("Role {} is frozen; statement not added", m_name);
        return false;
    }
    m_statements.push_back(std::move(statement));
    return true;
}

void Role::attach_inline_policy(PolicyPtr policy)
{
    m_attached_policies.push_back(std::move(policy));
}

} // namespace cdplan
