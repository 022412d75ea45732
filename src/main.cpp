#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "app/Analyzer.hpp"
#include "app/AnalyzerConfig.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"

// -------------------------
// CLI
// -------------------------
struct CliOptions
{
    std::optional<std::string> configFile;
    bool verbose = false;
    bool help = false;
    std::string error;
};

static CliOptions parseArgs(int argc, char *argv[])
{
    CliOptions opts;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" || arg == "-c")
        {
            if (++i < argc)
                opts.configFile = argv[i];
            else
                opts.error = "--config requires a file path";
        }
        else if (arg.rfind("--config=", 0) == 0)
        {
            opts.configFile = arg.substr(9);
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            opts.verbose = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            opts.help = true;
        }
        else
        {
            opts.error = "Unknown argument: " + arg;
        }
    }

    return opts;
}

static void printUsage(const char *progName)
{
    std::cout
        << "Usage: " << progName << " [OPTIONS]\n\n"
        << "Builds an HTML report of the slowest URLs from the latest\n"
        << "nginx-access-ui.log-YYYYMMDD[.gz] file in LOG_DIR.\n\n"
        << "OPTIONS:\n"
        << "  -c, --config FILE        Config file (key = value; defaults apply otherwise)\n"
        << "  -v, --verbose            Debug logging\n"
        << "  -h, --help               Show this help\n";
}

int main(int argc, char *argv[])
{
    using namespace LogAnalyzer;

    const auto opts = parseArgs(argc, argv);
    if (opts.help)
    {
        printUsage(argv[0]);
        return 0;
    }
    if (!opts.error.empty())
    {
        std::cerr << "Error: " << opts.error << "\n\n";
        printUsage(argv[0]);
        return 2;
    }

    App::AnalyzerConfig config;
    try
    {
        config = App::AnalyzerConfig::load(opts.configFile);
    }
    catch (const core::ConfigError &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    Utils::Logger logger(config.logFile, config.logLevel);
    if (!config.logFile.empty() && !logger.fileEnabled())
        logger.warn("Cannot open log file " + config.logFile + ", logging to stderr");
    if (opts.verbose)
        logger.setLevel(Utils::LogLevel::DEBUG);

    try
    {
        App::runAnalysis(config, logger);
    }
    catch (const core::AnalyzerError &e)
    {
        logger.error(e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        logger.critical(std::string("Unexpected failure: ") + e.what());
        return 1;
    }

    return 0;
}
