#include "cdplan/common/blueprint.hpp"

namespace cdplan
{

Step::~Step() = default;

Step::Step(std::string id)
    : m_id{std::move(id)}
{}

std::string Step::describe() const
{
    return "Step(" + m_id + ")";
}

FileSetPtr Step::configure_primary_output(std::string file_set_id)
{
    m_primary_output = std::make_shared<const FileSet>(FileSet{std::move(file_set_id), m_id});
    return m_primary_output;
}

ScriptStep::ScriptStep(std::string id, Props props)
    : Step(std::move(id))
    , m_props{std::move(props)}
{
    if (m_props.primary_output_directory)
    {
        configure_primary_output("Output");
    }
}

std::string ScriptStep::describe() const
{
    return "ScriptStep(" + id() + ")";
}

BuildStep::BuildStep(std::string id, Props props, BuildProps build_props)
    : ScriptStep(std::move(id), std::move(props))
    , m_build_props{std::move(build_props)}
{}

std::string BuildStep::describe() const
{
    return "BuildStep(" + id() + ")";
}

ManualApprovalStep::ManualApprovalStep(std::string id, std::optional<std::string> comment)
    : Step(std::move(id))
    , m_comment{std::move(comment)}
{}

std::string ManualApprovalStep::describe() const
{
    return "ManualApprovalStep(" + id() + ")";
}

} // namespace cdplan
