#include <algorithm>
#include <ctime>
#include <fstream>
#include <iostream>
#include <unistd.h>

#include <TWalk/CLI.h>
#include <TWalk/Config.h>
#include <TWalk/FitzhughNagumo.h>
#include <TWalk/TWalk.h>
#include <TWalk/TWalkLog.h>
#include <TWalk/TWalkUtil.h>
#include <TWalk/TraceDB.h>

using namespace std;
using namespace TW;

// this program demonstrates:
//  - calibrating theta of the Fitzhugh-Nagumo equation with the t-walk
//  - comparing the numerical forward map against the exact one
//  - running several chains in parallel, and storing them

int main(int argc, char* argv[]) {

    const CLIArgs args = parse_args(argc, const_cast<const char **>(argv));
    if (args.help) { return 0; }

    RunConfig run;
    try {
        run = parse_run(prepare(args.config_file));
    } catch (const std::invalid_argument &e) {
        cerr << "ERROR: " << e.what() << endl;
        return 1;
    }

    if (args.iterations.has_value()) { run.iterations = args.iterations.value(); }
    if (args.chains.has_value()) { run.chains = args.chains.value(); }
    if (args.output_file.has_value()) { run.output_file = args.output_file.value(); }
    if (args.seed.has_value()) { run.seed.emplace(args.seed.value()); }
    if (not run.seed.has_value()) {
        run.seed.emplace(time(NULL) * getpid()); // seed the rng using sys time and the process id
    }
    run.sampler.verbose = args.verbose;
    if ((args.verbose > 0) and (run.sampler.progress_interval == 0)) {
        run.sampler.progress_interval = std::max(run.iterations / 10, 1L);
    }

    const FNConfig &fn = run.model;
    if (args.verbose > 0) {
        cerr << "Fitzhugh-Nagumo: theta_true = " << fn.theta_true << ", sigma = " << fn.sigma
             << ", n_obs = " << fn.n_obs << ", nx = " << fn.nx() << ", dt = " << fn.dt()
             << ", forward map = " << (fn.numeric ? "numeric" : "exact") << endl;
        cerr << "Sampler: " << run.iterations << " iterations, " << run.chains << " chain(s), seed "
             << run.seed.value() << ", model failures: " << run.sampler.model_failure << endl;
    }

    // synthetic data from its own generator
    RNG data_rng(fn.data_seed);
    const Row data = make_data(fn, data_rng);

    if (not TWalkLog::error_bound_check(fn)) { return 2; }

    const FNExactMap exact(fn);
    const FNNumericMap numeric(fn);

    const ForwardMapProvider &fmap = fn.numeric ? static_cast<const ForwardMapProvider &>(numeric) : exact;
    const FNPosterior posterior(fn, fmap, data);

    vector<ChainResult> chains;
    try {
        if (run.chains == 1) {
            RNG rng(run.seed.value());
            TWalk sampler(posterior, run.sampler);
            Trace trace = sampler.run(run.iterations, rng);
            chains.push_back(ChainResult{ std::move(trace), sampler.kernel_stats(), run.seed.value() });
        } else {
            chains = run_chains(posterior, run.sampler, run.chains, run.iterations, run.seed.value());
        }
    } catch (const std::invalid_argument &e) {
        cerr << "ERROR: " << e.what() << endl;
        return 3;
    } catch (const ModelEvaluationError &e) {
        cerr << "ERROR: model evaluation failed: " << e.what() << endl;
        return 4;
    }

    const vector<string> names = { "theta" };
    for (size_t c = 0; c < chains.size(); ++c) {
        const ChainResult &cr = chains[c];
        cerr << TWalkLog::double_bar << endl << "Chain " << c << " (seed " << cr.seed << ")" << endl;
        TWalkLog::kernel_table(cr.stats);
        TWalkLog::summary_report(summarize(cr.trace, run.burn_in), names);
    }
    if (chains.size() > 1) {
        try {
            TWalkLog::convergence_report(chains, run.burn_in, names);
        } catch (const std::invalid_argument &e) {
            cerr << "WARNING: no convergence report: " << e.what() << endl;
        }
    }

    if (not run.output_file.empty()) {
        ofstream out(run.output_file);
        if (not out) {
            cerr << "ERROR: could not open " << run.output_file << " for writing." << endl;
            return 5;
        }
        chains.front().trace.write_text(out);
        if (args.verbose > 0) { cerr << "Wrote trace of chain 0 to " << run.output_file << endl; }
    }

    if (not run.database_filename.empty()) {
        try {
            TraceDB db(run.database_filename);
            db.setup(posterior.dim(), args.verbose);
            for (size_t c = 0; c < chains.size(); ++c) {
                db.write_trace(chains[c].trace, c, chains[c].seed);
                db.write_kernel_stats(chains[c].stats, c);
            }
        } catch (const std::exception &e) {
            cerr << "ERROR: could not store traces: " << e.what() << endl;
            return 6;
        }
        if (args.verbose > 0) { cerr << "Stored " << chains.size() << " chain(s) in " << run.database_filename << endl; }
    }

    return 0;
}
