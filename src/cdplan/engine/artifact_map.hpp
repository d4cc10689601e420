/**
 * @file artifact_map.hpp
 * @brief Mapping of file sets onto named pipeline artifacts.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/blueprint.hpp"

namespace cdplan
{

/**
 * @brief A named artifact passed between pipeline actions.
 */
struct Artifact
{
    std::string name;

    /**
     * @brief Reference to a file inside the artifact.
     */
    std::string at_path(const std::string& path) const
    {
        return name + "::" + path;
    }
};

using ArtifactPtr = std::shared_ptr<const Artifact>;

/**
 * @brief Assigns one artifact to every file set used in the pipeline.
 *
 * @details
 * The artifact name is derived from `<producer id>.<file set id>`, with every
 * character outside `[A-Za-z0-9@_-]` replaced by '_'. Names are kept unique
 * by appending a counter starting at 2. Repeated lookups of the same file
 * set return the same artifact.
 */
class ArtifactMap
{
public:
    /**
     * @brief Get or create the artifact for a file set.
     * @throw ValidationError if `file_set` is null.
     */
    ArtifactPtr to_pipeline(const FileSetPtr& file_set);

    size_t size() const noexcept { return m_artifacts.size(); }

    /**
     * @brief All artifacts in creation order.
     */
    const std::vector<ArtifactPtr>& artifacts() const noexcept { return m_artifacts; }

private:
    std::string make_unique_name(const std::string& base_name) const;

    std::unordered_map<const FileSet*, ArtifactPtr> m_by_file_set;
    std::vector<FileSetPtr> m_file_sets;
    std::vector<ArtifactPtr> m_artifacts;
    std::unordered_set<std::string> m_used_names;
};

} // namespace cdplan
