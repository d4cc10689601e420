/**
 * @file build_options_tests.cpp
 * Unit tests for cdplan::merge_build_options
 */
#include <gtest/gtest.h>
#include "cdplan/common/build_options.hpp"

using namespace cdplan;

namespace
{

BuildOptions with_image(const std::string& image)
{
    BuildOptions options;
    options.build_environment.build_image = image;
    return options;
}

} // namespace

TEST(BuildOptionsTests, Merge_OverlayWinsForScalars)
{
    BuildOptions base = with_image("standard:5.0");
    base.build_environment.compute_type = "SMALL";

    BuildOptions overlay = with_image("standard:7.0");
    overlay.build_environment.privileged = true;

    BuildOptions merged = merge_build_options(base, overlay);
    EXPECT_EQ(merged.build_environment.build_image, "standard:7.0");
    EXPECT_EQ(merged.build_environment.compute_type, "SMALL");
    EXPECT_EQ(merged.build_environment.privileged, true);
}

TEST(BuildOptionsTests, Merge_EnvironmentVariablesCombine)
{
    BuildOptions base;
    base.build_environment.environment_variables = {{"A", "1"}, {"B", "1"}};
    BuildOptions overlay;
    overlay.build_environment.environment_variables = {{"B", "2"}, {"C", "2"}};

    auto merged = merge_build_options(base, overlay).build_environment.environment_variables;
    EXPECT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged["A"], "1");
    EXPECT_EQ(merged["B"], "2");
    EXPECT_EQ(merged["C"], "2");
}

TEST(BuildOptionsTests, Merge_ListsConcatenate)
{
    BuildOptions base;
    base.partial_build_spec.pre_build_commands = {"echo base"};
    base.role_policy.push_back(PolicyStatement{{"s3:GetObject"}, {"*"}, {}, {}});

    BuildOptions overlay;
    overlay.partial_build_spec.pre_build_commands = {"echo overlay"};
    overlay.partial_build_spec.docker_login_registries = {"docker.io"};
    overlay.role_policy.push_back(PolicyStatement{{"s3:PutObject"}, {"*"}, {}, {}});

    BuildOptions merged = merge_build_options(base, overlay);
    EXPECT_EQ(merged.partial_build_spec.pre_build_commands,
              (std::vector<std::string>{"echo base", "echo overlay"}));
    EXPECT_EQ(merged.partial_build_spec.docker_login_registries, (std::vector<std::string>{"docker.io"}));
    ASSERT_EQ(merged.role_policy.size(), 2u);
    EXPECT_EQ(merged.role_policy[1].actions, (std::vector<std::string>{"s3:PutObject"}));
}

TEST(BuildOptionsTests, Merge_VpcFromOverlayOrBase)
{
    BuildOptions base;
    base.vpc = VpcConfig{"vpc-base", {"subnet-1"}, {}};
    BuildOptions overlay;

    EXPECT_EQ(merge_build_options(base, overlay).vpc->vpc_id, "vpc-base");

    overlay.vpc = VpcConfig{"vpc-overlay", {}, {}};
    EXPECT_EQ(merge_build_options(base, overlay).vpc->vpc_id, "vpc-overlay");
}

TEST(BuildOptionsTests, MergeLayers_SkipsMissingAndAppliesInOrder)
{
    BuildOptions merged = merge_build_options({with_image("one"), std::nullopt, with_image("three")});
    EXPECT_EQ(merged.build_environment.build_image, "three");
}

TEST(BuildOptionsTests, MergeLayers_EmptyIsDefault)
{
    BuildOptions merged = merge_build_options(std::vector<std::optional<BuildOptions>>{});
    EXPECT_FALSE(merged.build_environment.build_image.has_value());
    EXPECT_TRUE(merged.partial_build_spec.empty());
}
