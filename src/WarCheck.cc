#include "main/Config.hh"
#include "validation/TranscriptValidator.hh"
#include "IoUtility.hh"
#include "Logging.hh"

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace WarCheck;

struct Options {
    std::string configPath;
    std::string transcriptPath {"-"};
    int verbosity {0};
};

Options parseOptions(int argc, char* argv[])
{
    auto options = Options {};

    const auto short_opt = "vf:";
    auto long_opt = std::array {
        option { "verbose", no_argument, 0, 'v' },
        option { "config", required_argument, 0, 'f' },
        option { nullptr, 0, 0, 0 },
    };
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1) {
            break;
        } else if (c == 'v') {
            ++options.verbosity;
        } else if (c == 'f') {
            options.configPath = optarg;
        } else {
            std::cerr << "usage: " << argv[0] <<
                " [-v]... [-f config.lua] [transcript|-]" << std::endl;
            std::exit(EXIT_FAILURE);
        }
    }
    if (optind < argc) {
        options.transcriptPath = argv[optind];
    }

    setupLogging(getLogLevel(options.verbosity), std::cerr);

    return options;
}

}

int warcheck_main(int argc, char* argv[])
{
    const auto options = parseOptions(argc, argv);
    const auto config = Main::configFromPath(options.configPath);
    if (const auto log_level = config.getLogLevel();
        log_level && options.verbosity == 0) {
        setupLogging(*log_level, std::cerr);
    }

    const auto lines = processStreamFromPath(
        options.transcriptPath,
        [&options](auto& in)
        {
            if (!in) {
                throw std::runtime_error {
                    "Failed to open transcript: " + options.transcriptPath};
            }
            return readLines(in);
        });
    log(LogLevel::INFO, "Read %d lines from %s", lines.size(),
        options.transcriptPath);

    const auto result = Validation::validateTranscript(
        lines, config.getClassifierConfig());
    std::cout << result << std::endl;
    return result.error ? EXIT_FAILURE : EXIT_SUCCESS;
}
