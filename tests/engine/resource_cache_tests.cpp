/**
 * @file resource_cache_tests.cpp
 * Unit tests for cdplan::ResourceCache
 */
#include <gtest/gtest.h>
#include "cdplan/engine/resource_cache.hpp"

#include <algorithm>

using namespace cdplan;

namespace
{

StackAsset asset(const std::string& id, AssetType type, std::optional<std::string> role_arn)
{
    StackAsset result;
    result.asset_id = id;
    result.asset_selector = id + ":current_account-current_region";
    result.asset_manifest_path = "App.assets.json";
    result.asset_type = type;
    result.publishing_role_arn = std::move(role_arn);
    return result;
}

const PolicyStatement* find_statement(const std::vector<PolicyStatement>& statements, const std::string& action)
{
    for (const auto& statement : statements)
    {
        if (std::find(statement.actions.begin(), statement.actions.end(), action) != statement.actions.end())
        {
            return &statement;
        }
    }
    return nullptr;
}

} // namespace

class ResourceCacheTests : public ::testing::Test
{
protected:
    ResourceCacheTests()
        : plan{std::nullopt, false, "arn:aws:s3:::artifacts"}
    {}

    PipelinePlan plan;
};

TEST_F(ResourceCacheTests, Obtain_SameTypeSameRole)
{
    ResourceCache cache{ResourceCache::Props{}};
    auto first = cache.obtain(AssetType::File, plan);
    auto second = cache.obtain(AssetType::File, plan);
    EXPECT_EQ(first.role, second.role);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(plan.roles().size(), 1u);
}

TEST_F(ResourceCacheTests, Obtain_DifferentTypesDifferentRoles)
{
    ResourceCache cache{ResourceCache::Props{}};
    auto file = cache.obtain(AssetType::File, plan);
    auto docker = cache.obtain(AssetType::DockerImage, plan);
    EXPECT_NE(file.role, docker.role);
    EXPECT_EQ(file.role->name(), "FileRole");
    EXPECT_EQ(docker.role->name(), "DockerRole");
    EXPECT_EQ(cache.role_for(AssetType::File), file.role);
}

TEST_F(ResourceCacheTests, Obtain_RoleIsFrozenWithBaseline)
{
    ResourceCache::Props props;
    props.account = "111111111111";
    ResourceCache cache{props};
    auto shared = cache.obtain(AssetType::File, plan);

    EXPECT_TRUE(shared.role->is_frozen());
    EXPECT_EQ(shared.dependable, nullptr);
    EXPECT_NE(find_statement(shared.role->statements(), "logs:CreateLogGroup"), nullptr);
    EXPECT_NE(find_statement(shared.role->statements(), "codebuild:CreateReport"), nullptr);
    EXPECT_NE(find_statement(shared.role->statements(), "codebuild:StartBuild"), nullptr);
    EXPECT_NE(find_statement(shared.role->statements(), "s3:GetObject*"), nullptr);
    EXPECT_EQ(shared.role->assumed_by(),
              (std::vector<std::string>{"codebuild.amazonaws.com", "arn:aws:iam::111111111111:root"}));
}

TEST_F(ResourceCacheTests, Obtain_VpcAddsDependablePolicy)
{
    ResourceCache::Props props;
    props.asset_vpc = VpcConfig{"vpc-1", {"subnet-a"}, {"sg-1"}};
    ResourceCache cache{props};
    auto shared = cache.obtain(AssetType::DockerImage, plan);

    ASSERT_NE(shared.dependable, nullptr);
    EXPECT_EQ(shared.dependable->name(), "DockerRoleVpcPolicy");
    ASSERT_EQ(shared.role->attached_policies().size(), 1u);
    EXPECT_EQ(shared.role->attached_policies()[0], shared.dependable);
    EXPECT_EQ(cache.dependable_for(AssetType::DockerImage), shared.dependable);
}

TEST_F(ResourceCacheTests, Obtain_DockerRoleReadsAssetCredentials)
{
    ResourceCache::Props props;
    props.docker_credentials.push_back(DockerCredential::custom_registry("docker.io", "arn:hub"));
    props.docker_credentials.push_back(
        DockerCredential::custom_registry("quay.io", "arn:quay", {CredentialUsage::Synth}));
    ResourceCache cache{props};

    auto docker = cache.obtain(AssetType::DockerImage, plan);
    const auto* secret = find_statement(docker.role->statements(), "secretsmanager:GetSecretValue");
    ASSERT_NE(secret, nullptr);
    EXPECT_EQ(secret->resources, (std::vector<std::string>{"arn:hub"}));

    auto file = cache.obtain(AssetType::File, plan);
    EXPECT_EQ(find_statement(file.role->statements(), "secretsmanager:GetSecretValue"), nullptr);
}

TEST_F(ResourceCacheTests, RegisterPublishingRoles_DeduplicatesInOrder)
{
    ResourceCache cache{ResourceCache::Props{}};
    cache.register_publishing_roles(AssetType::File, {
        asset("a", AssetType::File, "arn:roleB"),
        asset("b", AssetType::File, std::nullopt),
        asset("c", AssetType::File, "arn:roleA"),
        asset("d", AssetType::File, "arn:roleB"),
    });
    EXPECT_EQ(cache.publishing_roles(AssetType::File), (std::vector<std::string>{"arn:roleB", "arn:roleA"}));
    EXPECT_TRUE(cache.publishing_roles(AssetType::DockerImage).empty());
}

TEST_F(ResourceCacheTests, AssumeStatement_SeesRolesRegisteredAfterObtain)
{
    ResourceCache cache{ResourceCache::Props{}};
    cache.register_publishing_roles(AssetType::File, {asset("a", AssetType::File, "arn:roleA")});
    auto shared = cache.obtain(AssetType::File, plan);

    // A later publish group of the same type reuses the role.
    cache.register_publishing_roles(AssetType::File, {asset("b", AssetType::File, "arn:roleB")});
    EXPECT_EQ(cache.obtain(AssetType::File, plan).role, shared.role);

    plan.finalize();
    ASSERT_EQ(plan.resolved_roles().size(), 1u);
    const auto* assume = find_statement(plan.resolved_roles()[0].statements, "sts:AssumeRole");
    ASSERT_NE(assume, nullptr);
    EXPECT_EQ(assume->resources, (std::vector<std::string>{"arn:roleA", "arn:roleB"}));
}
