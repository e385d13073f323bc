#include <TWalk/CLI.h>

#include <cstdlib>
#include <cstring>
#include <string>

using std::cerr;
using std::endl;
using std::string;

namespace TW {

void usage(
    const string &cmd,
    const string &msg,
    const int status
) {
    const string ident = "\t";
    cerr << msg << endl;
    cerr << "Usage: " << cmd << " config.json [-option|--option (each space separated)]" << endl << endl;
    cerr << "Run options (override the configuration file):" << endl;
    cerr << ident << "-n 1234      : number of t-walk iterations per chain." << endl;
    cerr << ident << "-s 5678      : seed for the sampler; chain i uses seed + i." << endl;
    cerr << ident << "-c 4         : number of independent chains, run in parallel." << endl;
    cerr << ident << "-o trace.txt : write the trace as text, one record per line." << endl;
    cerr << endl;
    cerr << "Auxilary options:" << endl;
    cerr << ident << "-(-h)elp     : print this message; ignore all other options." << endl;
    cerr << ident << "-(-v)erbose  : when working, be effusive; repeat for more detail." << endl;
    cerr << endl;
    cerr << "Example uses:" << endl;
    cerr << endl;
    cerr << "$ " << cmd << " config.json -v # use the configuration as is" << endl;
    cerr << "$ " << cmd << " config.json -n 50000 -s 1 -o trace.txt # short reproducible run, trace to a file" << endl;
    cerr << "$ " << cmd << " config.json -c 4 -v # four chains, with convergence report" << endl;
    if (status != 0) { exit(status); }
}

// non-exported helper function for finding argument flags
bool argcheck(const char * arg, const char * short_arg, const char * long_arg) {
    return (strcmp(arg, short_arg) == 0) or (strcmp(arg, long_arg) == 0);
}

// non-exported helper: the value following option argv[i], as a non-negative integer
unsigned long long int _count_arg(
    const string &cmd, const size_t argc, const char * argv[], size_t &i, const string &err
) {
    // this will occur if the option is the last argument, i.e. no number provided after
    if (i == (argc - 1)) { usage(cmd, err, 103); }
    const char * val = argv[++i];
    char * end = nullptr;
    const unsigned long long int n = strtoull(val, &end, 10);
    // this will occur if provided a negative number or a non-integer
    if ((val[0] == '-') or (end == val) or (*end != '\0')) { usage(cmd, err, 103); }
    return n;
}

CLIArgs parse_args(const size_t argc, const char * argv[]) {

    // assert argv[0] = this program
    const string cmd = string(argv[0]);

    // check for help requested
    for (size_t i = 1; i < argc; i++) {
        if (argcheck(argv[i], "-h", "--help")) {
            usage(cmd);
            auto args = CLIArgs("");
            args.help = true;
            return args;
        }
    }

    if (argc < 2) { usage(cmd, "Error: a configuration file is required.", 101); }

    // assert argv[1] = config file, if not in "help" mode
    auto args = CLIArgs(string(argv[1]));

    for (size_t i = 2; i < argc; i++) {
        if (strcmp(argv[i], "-n") == 0) {
            args.iterations.emplace(_count_arg(cmd, argc, argv, i, "Error: -n must be followed by a non-negative integer."));
        } else if (strcmp(argv[i], "-s") == 0) {
            args.seed.emplace(_count_arg(cmd, argc, argv, i, "Error: -s must be followed by a non-negative integer."));
        } else if (strcmp(argv[i], "-c") == 0) {
            args.chains.emplace(_count_arg(cmd, argc, argv, i, "Error: -c must be followed by a positive integer."));
            if (args.chains.value() < 1) { usage(cmd, "Error: -c must be followed by a positive integer.", 103); }
        } else if (strcmp(argv[i], "-o") == 0) {
            if (i == (argc - 1)) { usage(cmd, "Error: -o must be followed by a file name.", 103); }
            args.output_file.emplace(argv[++i]);
        } else if (argcheck(argv[i], "-v", "--verbose")) {
            args.verbose += 1;
        } else {
            usage(cmd, "Error: unrecognized argument: " + string(argv[i]), 104);
        }
    }

    return args;
};

} // namespace TW
