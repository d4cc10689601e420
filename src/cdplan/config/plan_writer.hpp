/**
 * @file plan_writer.hpp
 * @brief Writing a compiled pipeline as YAML.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/engine/pipeline_plan.hpp"

namespace cdplan
{

/**
 * @brief Render a finalized plan as a YAML document.
 *
 * @details
 * The document lists the stages with their actions, the artifacts, the build
 * projects and the roles with resolved statements. When `synth_project` is
 * given, its construct id is recorded as `synth_project`.
 *
 * @throw NotBuiltError if the plan has not been finalized.
 */
std::string plan_to_yaml(const PipelinePlan& plan, const BuildProjectPtr& synth_project = nullptr);

} // namespace cdplan
