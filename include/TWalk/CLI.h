#ifndef TWALK_CLI_H
#define TWALK_CLI_H

#include <iostream>
#include <optional>
#include <string>

namespace TW {

// A "usage" function for the t-walk calibration CLI
// @param cmd the name of the executable
// @param msg an optional message to print before the usage
// @param status if non-zero, will exit with this status
void usage(
    const std::string &cmd,
    const std::string &msg = "",
    const int status = 0
);

// Container for the parsed command line arguments; options given here
// override the matching members of the configuration file
// @var config_file the path to the configuration file
// @var help if true, usage was printed and nothing else should happen
// @var seed RNG seed for the sampler
// @var iterations number of t-walk iterations per chain
// @var chains number of independent chains
// @var output_file where to write the trace as text
// @var verbose the verbosity level (0 = quiet, 1 = progress and summaries, 2 = every model failure)
struct CLIArgs {
    CLIArgs() = delete;
    CLIArgs(const std::string & cf) : config_file(cf) {};

    std::string config_file;
    bool help = false;
    std::optional<unsigned long int> seed;
    std::optional<long int> iterations;
    std::optional<size_t> chains;
    std::optional<std::string> output_file;
    size_t verbose = 0;
};

// parses the args passed to a typical main() function for a t-walk program
// @param argc the number of arguments (per typical main() signature)
// @param argv the arguments (per typical main() signature)
// invalid arguments print usage and exit
CLIArgs parse_args(const size_t argc, const char * argv[]);

}

#endif // TWALK_CLI_H
