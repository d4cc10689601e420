/**
 * @file pipeline_enums.hpp
 */
#pragma once
#include "cdplan/common/common.hpp"

namespace cdplan
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for node indices in a PipelineGraph.
 *
 * @details
 * `NodeIdx` is a type alias for `size_t` used to identify nodes in the graph
 * arena. Parent links are stored as indices, never as pointers.
 * This alias exists for clarity in API signatures and documentation, not for
 * compile-time type safety.
 */
using NodeIdx = size_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Kind of asset published by an asset publishing action.
 *
 * @details
 * The asset type is the category key of the ResourceCache: all publishing
 * actions of one asset type share one execution role.
 */
enum class AssetType
{
    File,
    DockerImage
};

/**
 * @brief Kind of build project an action may produce.
 *
 * @details
 * Determines which build defaults apply to the project and which Docker
 * credential usage (if any) its role is granted.
 */
enum class BuildProjectType
{
    Synth,
    Assets,
    SelfMutate,
    Step
};

/**
 * @brief Purpose for which a Docker registry credential is used.
 */
enum class CredentialUsage
{
    Synth,
    SelfUpdate,
    AssetPublishing
};

inline const char* to_string(AssetType type) noexcept
{
    switch (type)
    {
        case AssetType::File: return "file";
        case AssetType::DockerImage: return "docker-image";
    }
    return "unknown";
}

inline const char* to_string(BuildProjectType type) noexcept
{
    switch (type)
    {
        case BuildProjectType::Synth: return "SYNTH";
        case BuildProjectType::Assets: return "ASSETS";
        case BuildProjectType::SelfMutate: return "SELF_MUTATE";
        case BuildProjectType::Step: return "STEP";
    }
    return "UNKNOWN";
}

inline const char* to_string(CredentialUsage usage) noexcept
{
    switch (usage)
    {
        case CredentialUsage::Synth: return "synth";
        case CredentialUsage::SelfUpdate: return "self-update";
        case CredentialUsage::AssetPublishing: return "asset-publishing";
    }
    return "unknown";
}

/**
 * @brief Map a build project type to the Docker credential usage it needs.
 * @return The usage, or nullopt for generic steps.
 */
inline std::optional<CredentialUsage> credential_usage_for(BuildProjectType type) noexcept
{
    switch (type)
    {
        case BuildProjectType::Assets: return CredentialUsage::AssetPublishing;
        case BuildProjectType::SelfMutate: return CredentialUsage::SelfUpdate;
        case BuildProjectType::Synth: return CredentialUsage::Synth;
        case BuildProjectType::Step: return std::nullopt;
    }
    return std::nullopt;
}

} // namespace cdplan
