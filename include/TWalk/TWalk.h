#ifndef TWALK_H
#define TWALK_H

#include <array>
#include <atomic>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <vector>

#include <TWalk/TypeDefs.h>
#include <TWalk/RNG.h>
#include <TWalk/Posterior.h>
#include <TWalk/Kernels.h>
#include <TWalk/ChainState.h>
#include <TWalk/Trace.h>

namespace TW {

    // what to do when the model fails (or gives a non-finite energy) inside the support
    enum MODEL_FAILURE { REJECT, ABORT };

    std::ostream& operator<<(std::ostream &os, const MODEL_FAILURE &mf);

    // @var kernel_weights probability of each KERNEL, in KERNEL order; must sum to 1
    // @var kernel_pars tuning constants of the kernels
    // @var model_failure REJECT: count it and keep the chain going; ABORT: rethrow
    // @var progress_interval if > 0 and verbose > 0, report every this many iterations
    // @var verbose 0 = quiet, 1 = progress, 2 = every model failure
    struct SamplerConfig {
        std::array<float_type, NUM_KERNELS> kernel_weights = { 0.4918, 0.4918, 0.0082, 0.0082 };
        KernelPars kernel_pars;
        MODEL_FAILURE model_failure = REJECT;
        size_t progress_interval = 0;
        size_t verbose = 0;
    };

    // throws std::invalid_argument on malformed weights or tuning constants
    void validate(const SamplerConfig &cfg);

    struct KernelStats {
        size_t proposed = 0;
        size_t accepted = 0;
        size_t out_of_support = 0;  // rejected by the support predicate, energy never evaluated
        size_t degenerate = 0;      // rejected by the kernel itself, energy never evaluated
        size_t model_failures = 0;  // model threw or gave a non-finite energy

        float_type acceptance_rate() const { return (proposed > 0) ? static_cast<float_type>(accepted) / proposed : 0.0; }
    };

    typedef std::array<KernelStats, NUM_KERNELS> KernelStatsArray;

    // what happened during one iteration
    struct StepInfo {
        size_t iteration;
        KERNEL kernel;
        WALKER moving;
        bool evaluated = false;
        bool accepted = false;
        float_type log_alpha = -std::numeric_limits<float_type>::infinity();
    };

    // called after each iteration, with the updated chain state
    typedef std::function<void(const StepInfo &, const ChainState &)> StepObserver;

// A `TWalk` is the sampling engine: it owns the chain state and the trace of
// one run, and advances the pair of walkers one kernel application at a time.
//
// Conventions:
//  - internal state fields: _field_name
//  - private methods: _method_name()
class TWalk {
    public:
        enum STATE { INITIALIZING, ITERATING, TERMINATED };

        // @throws std::invalid_argument if the config is malformed
        TWalk(const PosteriorModel &model, const SamplerConfig &cfg = SamplerConfig());
        ~TWalk();

        TWalk(const TWalk &) = delete;
        TWalk & operator=(const TWalk &) = delete;

        // Run the chain for T iterations from the two initial points.
        //
        // @param T number of iterations; 0 gives the initial record only
        // @param x0, xp0 initial primary and secondary walkers; both in the
        //        support and different in every coordinate
        // @param rng all randomness of the run is drawn from here
        // @return the trace of the primary walker, T + 1 records (fewer if stopped)
        // @throws std::invalid_argument on configuration errors, before any iteration
        Trace run(const long int T, const Row &x0, const Row &xp0, RNG &rng);

        // as above, drawing both initial points with the model's sim_init
        Trace run(const long int T, RNG &rng);

        // ask a running chain to stop at the next iteration boundary; thread safe.
        // A request made before run() starts ends that run after its initial
        // record. The request is cleared when a run finishes.
        void request_stop() { _stop_requested = true; }

        STATE state() const { return _state; }

        const KernelStatsArray & kernel_stats() const { return _stats; }
        KernelStats total_stats() const;
        float_type acceptance_rate() const { return total_stats().acceptance_rate(); }

        // @throws std::logic_error before the first run
        const ChainState & chain_state() const;

        void set_observer(const StepObserver &observer) { _observer = observer; }

        const SamplerConfig & config() const { return _cfg; }

    private:
        const PosteriorModel &_model;
        const SamplerConfig _cfg;
        std::array<std::unique_ptr<Kernel>, NUM_KERNELS> _kernels;
        gsl_ran_discrete_t *_kernel_table;

        STATE _state = INITIALIZING;
        std::optional<ChainState> _chain;
        KernelStatsArray _stats;
        std::atomic<bool> _stop_requested{false};
        StepObserver _observer;

        void _initialize(const Row &x0, const Row &xp0);
        StepInfo _step(RNG &rng);
        // @return false if the model failed, per the MODEL_FAILURE policy
        bool _evaluate(const Row &y, float_type &energy, KernelStats &ks) const;
        void _print_progress(const long int iter, const long int T) const;
};

    // the result of one of several independent chains
    struct ChainResult {
        Trace trace;
        KernelStatsArray stats;
        unsigned long int seed;
    };

    // Run `num_chains` independent chains in parallel, one thread each.
    // Chain i draws from its own RNG seeded with `seed + i` and its own initial
    // points from the model's sim_init; the model is shared and must be safe
    // to evaluate concurrently.
    //
    // @throws the first exception raised by any chain, after all have finished
    std::vector<ChainResult> run_chains(
        const PosteriorModel &model,
        const SamplerConfig &cfg,
        const size_t num_chains,
        const long int T,
        const unsigned long int seed
    );

}

#endif // TWALK_H
