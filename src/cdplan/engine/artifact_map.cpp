#include "cdplan/engine/artifact_map.hpp"
#include "cdplan/common/pipeline_errors.hpp"

namespace cdplan
{

namespace
{

std::string sanitize_artifact_name(const std::string& name)
{
    std::string result = name;
    for (char& c : result)
    {
        bool allowed = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
            || c == '@' || c == '-' || c == '_';
        if (!allowed)
        {
            c = '_';
        }
    }
    return result;
}

} // namespace

ArtifactPtr ArtifactMap::to_pipeline(const FileSetPtr& file_set)
{
    if (!file_set)
    {
        throw ValidationError("Cannot map an empty file set to an artifact");
    }

    auto it = m_by_file_set.find(file_set.get());
    if (it != m_by_file_set.end())
    {
        return it->second;
    }

    std::string name = make_unique_name(sanitize_artifact_name(file_set->producer_id + "." + file_set->id));
    auto artifact = std::make_shared<const Artifact>(Artifact{name});
    m_used_names.insert(name);
    m_by_file_set.emplace(file_set.get(), artifact);
    m_file_sets.push_back(file_set);
    m_artifacts.push_back(artifact);
    return artifact;
}

std::string ArtifactMap::make_unique_name(const std::string& base_name) const
{
    std::string name = base_name;
    int i = 1;
    while (m_used_names.count(name) > 0)
    {
        name = base_name + std::to_string(++i);
    }
    return name;
}

} // namespace cdplan
