/**
 * @file deployment_engine.hpp
 * @brief IDeploymentEngine interface.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/pipeline_graph.hpp"

namespace cdplan
{

/**
 * @brief Interface for engines that turn a layered graph into a pipeline.
 *
 * @details
 * An engine is built once. Implementations own the pipeline they produce and
 * expose it through their own accessors.
 */
class IDeploymentEngine
{
public:
    virtual ~IDeploymentEngine() = default;

    /**
     * @brief Compile the graph into the engine's pipeline.
     * @param graph The layered graph to compile.
     * @throw AlreadyBuiltError if called more than once.
     */
    virtual void build_deployment(std::shared_ptr<const PipelineGraph> graph) = 0;

    /**
     * @brief Whether build_deployment() has completed successfully.
     */
    virtual bool is_built() const noexcept = 0;
};

} // namespace cdplan
