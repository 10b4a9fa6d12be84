#include "TrainRunner.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/brains/Genome.h"
#include "core/evolution/TrainingConfig.h"
#include "core/sim/Episode.h"
#include <args.hxx>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace DashSim;

namespace {

constexpr const char* kLoggingConfigFile = "logging-config.json";
constexpr const char* kTrainingConfigFile = "training.json";

struct CliCommandInfo {
    std::string name;
    std::string description;
};

const std::vector<CliCommandInfo> CLI_COMMANDS = {
    { "example", "Print the default training config as JSON" },
    { "simulate", "Run one episode for a policy: simulate [--] <w1> <w2> <b>" },
    { "train", "Run evolution training, optionally with an inline JSON config override" },
};

std::string getCommandListHelp()
{
    std::string help = "Command to run:\n";
    for (const auto& info : CLI_COMMANDS) {
        help += "  " + info.name + " - " + info.description + "\n";
    }
    return help;
}

std::string getExamplesHelp()
{
    return "Examples:\n"
           "  dashsim-cli train\n"
           "  dashsim-cli train '{\"evolution\": {\"populationSize\": 100}}' --seed 7\n"
           "  dashsim-cli simulate --seed 3 --trace -- 0.4 -0.2 0.1\n"
           "  dashsim-cli example > config/training.json\n";
}

// Defaults, then training.json from the config search path when one exists.
Result<TrainingConfig, std::string> loadTrainingConfig()
{
    return ConfigLoader::loadOrDefault(kTrainingConfigFile, TrainingConfig{});
}

Result<double, std::string> parseGene(const std::string& name, const std::string& text)
{
    try {
        size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return Result<double, std::string>::error(
                "Invalid " + name + ": '" + text + "' is not a number");
        }
        return Result<double, std::string>::okay(value);
    }
    catch (const std::invalid_argument&) {
        return Result<double, std::string>::error(
            "Invalid " + name + ": '" + text + "' is not a number");
    }
    catch (const std::out_of_range&) {
        return Result<double, std::string>::error(
            "Invalid " + name + ": '" + text + "' is out of range");
    }
}

nlohmann::json traceStep(const Episode& episode)
{
    const Agent& agent = episode.getAgent();
    const SensoryData& sensory = episode.getLastSensoryData();

    nlohmann::json obstacles = nlohmann::json::array();
    for (const auto& obstacle : episode.getObstacles()) {
        obstacles.push_back({ { "x", obstacle.x },
                              { "y", obstacle.y },
                              { "width", obstacle.width },
                              { "height", obstacle.height } });
    }

    return nlohmann::json{
        { "step", episode.getStepCount() },
        { "time", episode.getElapsedTime() },
        { "state", toString(episode.getState()) },
        { "agent",
          { { "x", agent.x },
            { "y", agent.y },
            { "velocityY", agent.velocityY },
            { "grounded", agent.grounded } } },
        { "jumped", episode.didJumpLastStep() },
        { "sensory",
          { { "normalizedDistance", sensory.normalizedDistance },
            { "normalizedHeight", sensory.normalizedHeight },
            { "obstacleAhead", sensory.obstacleAhead } } },
        { "obstacles", obstacles },
    };
}

int runTrain(
    const std::optional<std::string>& inlineConfig,
    const std::optional<uint32_t>& seed,
    const std::optional<int>& threads)
{
    auto configResult = loadTrainingConfig();
    if (configResult.isError()) {
        std::cerr << "Error: " << configResult.errorValue() << std::endl;
        return 1;
    }
    TrainingConfig config = configResult.value();

    if (inlineConfig.has_value()) {
        auto overrideResult = ConfigLoader::parseOverride(inlineConfig.value(), config);
        if (overrideResult.isError()) {
            std::cerr << "Error parsing JSON config: " << overrideResult.errorValue() << std::endl;
            std::cerr << "\nExample config:\n"
                      << nlohmann::json(TrainingConfig{}).dump(2) << std::endl;
            return 1;
        }
        config = overrideResult.value();
    }
    if (seed.has_value()) {
        config.seed = seed;
    }
    if (threads.has_value()) {
        config.evolution.maxParallelEvaluations = threads.value();
    }

    Client::TrainRunner runner;

    // SIGINT stops training after the current generation. std::signal needs a plain function
    // pointer, hence the captureless lambda.
    static Client::TrainRunner* g_runner = nullptr;
    static auto sigintHandler = +[](int) -> void {
        if (g_runner) {
            g_runner->requestStop();
        }
    };

    g_runner = &runner;
    auto oldHandler = std::signal(SIGINT, sigintHandler);

    auto result = runner.run(config);

    // Restore old signal handler.
    std::signal(SIGINT, oldHandler);
    g_runner = nullptr;

    if (result.isError()) {
        std::cerr << "Error: " << result.errorValue() << std::endl;
        return 1;
    }

    // Output results as JSON to stdout.
    nlohmann::json output = result.value();
    std::cout << output.dump(2) << std::endl;

    return result.value().completed ? 0 : 1;
}

int runSimulate(
    const std::vector<std::string>& params, const std::optional<uint32_t>& seed, bool trace)
{
    if (params.size() != Genome::GENE_COUNT) {
        std::cerr << "Error: simulate needs exactly 3 numbers: <w1> <w2> <b>\n";
        return 1;
    }

    const char* geneNames[Genome::GENE_COUNT] = { "w1", "w2", "b" };
    Genome policy;
    for (size_t i = 0; i < Genome::GENE_COUNT; ++i) {
        auto gene = parseGene(geneNames[i], params[i]);
        if (gene.isError()) {
            std::cerr << "Error: " << gene.errorValue() << std::endl;
            return 1;
        }
        policy.weights[i] = gene.value();
    }

    auto configResult = loadTrainingConfig();
    if (configResult.isError()) {
        std::cerr << "Error: " << configResult.errorValue() << std::endl;
        return 1;
    }
    const TrainingConfig& config = configResult.value();
    const uint32_t spawnSeed = seed.value_or(config.seed.value_or(0));

    Episode::StepObserver observer;
    if (trace) {
        observer = [](const Episode& episode) {
            std::cout << traceStep(episode).dump() << "\n";
        };
    }

    auto result = simulate(policy, config.episode, spawnSeed, observer);
    if (result.isError()) {
        std::cerr << "Error: " << result.errorValue() << std::endl;
        return 1;
    }

    nlohmann::json output = {
        { "policy", policy },
        { "seed", spawnSeed },
        { "result", result.value() },
    };
    std::cout << output.dump(trace ? -1 : 2) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    // Parse command line arguments.
    args::ArgumentParser parser(
        "DashSim CLI",
        "Train and replay jump policies for the side-scroller simulation.\n\n"
            + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Look for training.json in this directory first", { "config-dir" });
    args::ValueFlag<uint32_t> seed(
        parser, "seed", "Seed for training streams or the simulated episode", { 's', "seed" });
    args::ValueFlag<int> threads(
        parser, "threads", "Parallel evaluations (0 = one per core)", { 't', "threads" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "levels",
        "Per-channel log levels, e.g. 'evolution:debug,physics:trace'",
        { "log-channels" });
    args::Flag trace(parser, "trace", "Simulate: print one JSON line per step", { "trace" });

    args::Positional<std::string> command(parser, "command", getCommandListHelp());
    args::PositionalList<std::string> params(
        parser, "params", "train: optional JSON object; simulate: <w1> <w2> <b>");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }
    catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // setConfigDir() only records the directory; nothing may log before the channels below are
    // installed or the auto-initialized defaults would write to stdout.
    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }

    // Initialize logging channels (default logger named "cli", console on stderr so stdout
    // stays clean JSON). The train progress bar covers the per-generation info lines.
    if (const auto loggingConfig = ConfigLoader::findConfigFile(kLoggingConfigFile)) {
        LoggingChannels::initializeFromConfig(loggingConfig->string(), "cli", true);
    }
    else {
        LoggingChannels::initialize(spdlog::level::warn, spdlog::level::debug, "cli", true);
    }
    if (verbose) {
        LoggingChannels::setConsoleLevel(spdlog::level::debug);
        LoggingChannels::configureFromString("*:debug");
    }
    if (configDir) {
        LOG_DEBUG(Config, "Config directory set to {}", args::get(configDir));
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }

    if (!command) {
        std::cerr << "Error: command is required\n\n";
        std::cerr << parser;
        return 1;
    }

    const std::string commandName = args::get(command);
    const std::vector<std::string> paramValues = args::get(params);
    const std::optional<uint32_t> seedValue =
        seed ? std::optional<uint32_t>(args::get(seed)) : std::nullopt;

    if (commandName == "example") {
        std::cout << nlohmann::json(TrainingConfig{}).dump(2) << std::endl;
        return 0;
    }

    if (commandName == "train") {
        if (paramValues.size() > 1) {
            std::cerr << "Error: train takes at most one JSON argument\n";
            return 1;
        }
        const std::optional<std::string> inlineConfig = paramValues.empty()
            ? std::nullopt
            : std::optional<std::string>(paramValues.front());
        const std::optional<int> threadCount =
            threads ? std::optional<int>(args::get(threads)) : std::nullopt;
        return runTrain(inlineConfig, seedValue, threadCount);
    }

    if (commandName == "simulate") {
        return runSimulate(paramValues, seedValue, static_cast<bool>(trace));
    }

    std::cerr << "Error: unknown command '" << commandName << "'\n\n";
    std::cerr << getCommandListHelp();
    return 1;
}
