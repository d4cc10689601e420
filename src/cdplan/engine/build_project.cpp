#include "cdplan/engine/build_project.hpp"
#include "cdplan/common/pipeline_errors.hpp"

namespace cdplan
{

BuildProject::BuildProject(Props props)
    : m_props{std::move(props)}
{
    if (!m_props.role)
    {
        throw ValidationError("Build project '" + m_props.construct_id + "' needs a role");
    }
}

} // namespace cdplan
