/**
 * @file resource_cache.hpp
 * @brief One shared execution role per asset type.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/blueprint.hpp"
#include "cdplan/common/build_options.hpp"
#include "cdplan/common/docker_credential.hpp"
#include "cdplan/common/identity.hpp"
#include "cdplan/common/pipeline_enums.hpp"
#include "cdplan/engine/pipeline_plan.hpp"

namespace cdplan
{

/**
 * @brief The shared role of an asset type, and what users of it depend on.
 */
struct SharedResource
{
    RolePtr role;

    /// Policy attached to the role after construction; may be null.
    PolicyPtr dependable;
};

/**
 * @brief Memoizes one publishing role per asset type.
 *
 * @details
 * All asset publishing actions of one asset type run under the same role.
 * The first obtain() for a type builds the role with its baseline
 * permissions and freezes it; later calls return the same objects.
 *
 * Every publish group also registers the roles its assets must assume. The
 * role's `sts:AssumeRole` statement reads that collection lazily, so roles
 * registered after the shared role was first handed out are still covered
 * once the plan is finalized.
 *
 * @par Thread Safety
 * - No internal synchronization; used from the single compile walk only.
 */
class ResourceCache
{
public:
    struct Props
    {
        /// Account of the pipeline, used in ARNs and as a trusted principal.
        std::string account{"${AWS::AccountId}"};

        /// Region of the pipeline, used in ARNs.
        std::string region{"${AWS::Region}"};

        std::vector<DockerCredential> docker_credentials;

        /// Network placement of asset publishing builds, if any.
        std::optional<VpcConfig> asset_vpc;
    };

    explicit ResourceCache(Props props);

    /**
     * @brief Get or build the shared resource of an asset type.
     * @param type Asset type (the category key).
     * @param plan Pipeline the role is registered with and reads artifacts from.
     */
    SharedResource obtain(AssetType type, PipelinePlan& plan);

    /**
     * @brief Record the publishing roles of a group of assets.
     * @details Assets without a publishing role are skipped. Repeated ARNs are
     *          kept once, in first-seen order.
     */
    void register_publishing_roles(AssetType type, const std::vector<StackAsset>& assets);

    /**
     * @brief Publishing roles registered so far for a type.
     */
    std::vector<std::string> publishing_roles(AssetType type) const;

    /**
     * @brief The shared role of a type, or nullptr if not built yet.
     */
    RolePtr role_for(AssetType type) const;

    /**
     * @brief The dependable of a type, or nullptr.
     */
    PolicyPtr dependable_for(AssetType type) const;

    /**
     * @brief Number of asset types with a built role.
     */
    size_t size() const noexcept { return m_resources.size(); }

private:
    /// Insertion-ordered set of role ARNs, shared with the lazy statement.
    struct RoleArnSet
    {
        std::vector<std::string> ordered;
        std::unordered_set<std::string> seen;
    };

    SharedResource build(AssetType type, PipelinePlan& plan);
    std::shared_ptr<RoleArnSet> arn_set(AssetType type);

    Props m_props;
    std::map<AssetType, SharedResource> m_resources;
    std::map<AssetType, std::shared_ptr<RoleArnSet>> m_publishing_roles;
};

} // namespace cdplan
