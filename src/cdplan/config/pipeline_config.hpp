/**
 * @file pipeline_config.hpp
 * @brief Loading pipeline descriptions from YAML.
 *
 * @details
 * A description has three top-level sections:
 *
 * @code{.yaml}
 * pipeline:            # EngineProps
 *   name: MyPipeline
 *   cli_version: "2.0.0"
 *   build_defaults: { compute_type: BUILD_GENERAL1_MEDIUM }
 *   docker_credentials:
 *     - { registry: docker.io, secret_arn: "arn:...", usages: [synth] }
 * stacks:              # StackDeployment, referenced by id
 *   - { id: App, assume_role_arn: "arn:...", template_path: App.template.json }
 * graph:
 *   cloud_assembly: Synth        # step whose primary output is the assembly
 *   nodes:
 *     - id: Build
 *       kind: group
 *       children:
 *         - { id: Synth, kind: step, build_step: true,
 *             step: { type: script, commands: [...], primary_output_directory: cdk.out } }
 *       tranches: [[Synth]]
 * @endcode
 *
 * Node kinds are `group`, `stack-group`, `self-update`, `publish-assets`,
 * `prepare`, `execute` and `step`. Step types are `script`, `build`,
 * `approval` and `action`. Steps refer to the outputs of earlier steps by
 * step id.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/blueprint.hpp"
#include "cdplan/common/pipeline_graph.hpp"
#include "cdplan/engine/pipeline_engine.hpp"

namespace cdplan
{

/**
 * @brief A loaded pipeline description.
 */
struct PipelineConfig
{
    EngineProps engine;
    std::shared_ptr<const PipelineGraph> graph;

    /// Stacks by id.
    std::map<std::string, StackDeploymentPtr> stacks;

    /// Steps by id.
    std::map<std::string, StepPtr> steps;
};

/**
 * @brief Parse a pipeline description.
 * @param yaml_text The YAML document.
 * @throw ConfigurationError for malformed YAML, missing keys, unknown kinds
 *        or unknown references; the message names the offending YAML path.
 */
PipelineConfig parse_pipeline_config(const std::string& yaml_text);

/**
 * @brief Load a pipeline description from a file.
 * @throw ConfigurationError as parse_pipeline_config(), or if the file
 *        cannot be read.
 */
PipelineConfig load_pipeline_config(const std::string& filename);

} // namespace cdplan
