#include "cdplan/common/logging.hpp"
#include "cdplan/common/pipeline_errors.hpp"
#include "cdplan/config/pipeline_config.hpp"
#include "cdplan/config/plan_writer.hpp"
#include "cdplan/engine/pipeline_engine.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace
{

struct CommandLine
{
    std::string input;
    std::optional<std::string> output;
    std::string log_level{"info"};
};

const char* const usage = "usage: cdplan <pipeline.yaml> [--output <plan.yaml>] [--log-level <level>]";

CommandLine parse_command_line(int argc, char** argv)
{
    CommandLine cmd;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--output" || arg == "--log-level")
        {
            if (i + 1 >= argc)
            {
                throw cdplan::ConfigurationError("Missing value for " + arg + "\n" + usage);
            }
            if (arg == "--output")
            {
                cmd.output = argv[++i];
            }
            else
            {
                cmd.log_level = argv[++i];
            }
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw cdplan::ConfigurationError("Unknown option " + arg + "\n" + usage);
        }
        else if (cmd.input.empty())
        {
            cmd.input = arg;
        }
        else
        {
            throw cdplan::ConfigurationError("Unexpected argument " + arg + "\n" + usage);
        }
    }
    if (cmd.input.empty())
    {
        throw cdplan::ConfigurationError(usage);
    }
    return cmd;
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        const CommandLine cmd = parse_command_line(argc, argv);
        cdplan::configure_logging(cmd.log_level);

        cdplan::PipelineConfig config = cdplan::load_pipeline_config(cmd.input);

        cdplan::PipelineEngine engine(config.engine);
        engine.build_deployment(config.graph);

        cdplan::BuildProjectPtr synth = engine.has_synth_project() ? engine.synth_project() : nullptr;
        const std::string yaml = cdplan::plan_to_yaml(engine.pipeline(), synth);

        if (cmd.output)
        {
            std::ofstream file(*cmd.output);
            if (!file)
            {
                throw std::runtime_error("Cannot open " + *cmd.output + " for writing");
            }
            file << yaml << "\n";
            if (!file)
            {
                throw std::runtime_error("Failed to write " + *cmd.output);
            }
            spdlog::info("Wrote plan to {}", *cmd.output);
        }
        else
        {
            std::cout << yaml << "\n" << std::flush;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "\nError:\n" << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
