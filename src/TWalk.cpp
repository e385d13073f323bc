#include <TWalk/TWalk.h>

#include <cmath>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <gsl/gsl_randist.h>

using std::cerr;
using std::endl;
using std::string;
using std::to_string;
using std::vector;

namespace TW {

std::ostream& operator<<(std::ostream &os, const MODEL_FAILURE &mf) {
    switch (mf) {
        case REJECT: os << "REJECT"; break;
        case ABORT: os << "ABORT"; break;
        default: os << "UNDEFINED TW::MODEL_FAILURE"; break;
    }
    return os;
}

void validate(const SamplerConfig &cfg) {
    float_type total = 0.0;
    for (size_t k = 0; k < NUM_KERNELS; ++k) {
        const float_type w = cfg.kernel_weights[k];
        if (not (std::isfinite(w) and (w >= 0.0))) {
            std::ostringstream msg;
            msg << "kernel weight for " << static_cast<KERNEL>(k) << " must be finite and non-negative, got " << w;
            throw std::invalid_argument(msg.str());
        }
        total += w;
    }
    if (std::fabs(total - 1.0) > 1e-6) {
        throw std::invalid_argument("kernel weights must sum to 1, got " + to_string(total));
    }
    validate(cfg.kernel_pars);
}

TWalk::TWalk(
    const PosteriorModel &model,
    const SamplerConfig &cfg
) : _model(model), _cfg(cfg), _kernel_table(nullptr) {
    validate(_cfg);
    for (size_t k = 0; k < NUM_KERNELS; ++k) { _kernels[k] = make_kernel(static_cast<KERNEL>(k), _cfg.kernel_pars); }
    _kernel_table = gsl_ran_discrete_preproc(NUM_KERNELS, _cfg.kernel_weights.data());
}

TWalk::~TWalk() {
    if (_kernel_table) { gsl_ran_discrete_free(_kernel_table); }
}

KernelStats TWalk::total_stats() const {
    KernelStats total;
    for (const KernelStats &ks : _stats) {
        total.proposed += ks.proposed;
        total.accepted += ks.accepted;
        total.out_of_support += ks.out_of_support;
        total.degenerate += ks.degenerate;
        total.model_failures += ks.model_failures;
    }
    return total;
}

const ChainState & TWalk::chain_state() const {
    if (not _chain.has_value()) throw std::logic_error("TWalk: no chain state before the first run");
    return _chain.value();
}

// energy of an initial point; any failure here is a configuration error
float_type _initial_energy(const PosteriorModel &model, const Row &theta, const string &which) {
    float_type energy;
    try {
        energy = model.energy(theta);
    } catch (const ModelEvaluationError &e) {
        throw std::invalid_argument("energy evaluation failed at initial point " + which + ": " + e.what());
    }
    if (not std::isfinite(energy)) {
        throw std::invalid_argument("non-finite energy at initial point " + which);
    }
    return energy;
}

void TWalk::_initialize(const Row &x0, const Row &xp0) {
    const size_t d = _model.dim();
    if ((static_cast<size_t>(x0.size()) != d) or (static_cast<size_t>(xp0.size()) != d)) {
        throw std::invalid_argument(
            "initial points must have dimension " + to_string(d) + ", got " + to_string(x0.size()) + " and " + to_string(xp0.size())
        );
    }
    if (not _model.supp(x0)) { throw std::invalid_argument("initial point x0 is outside the support"); }
    if (not _model.supp(xp0)) { throw std::invalid_argument("initial point xp0 is outside the support"); }
    if ((x0.array() == xp0.array()).any()) {
        throw std::invalid_argument("initial points x0 and xp0 must differ in every coordinate");
    }

    const float_type ux = _initial_energy(_model, x0, "x0");
    const float_type uxp = _initial_energy(_model, xp0, "xp0");
    _chain.emplace(Walker{ x0, ux }, Walker{ xp0, uxp });
}

bool TWalk::_evaluate(const Row &y, float_type &energy, KernelStats &ks) const {
    try {
        energy = _model.energy(y);
    } catch (const ModelEvaluationError &e) {
        if (_cfg.model_failure == ABORT) throw;
        ++ks.model_failures;
        if (_cfg.verbose > 1) { cerr << "WARNING: model evaluation failed; rejecting candidate: " << e.what() << endl; }
        return false;
    }
    if (not std::isfinite(energy)) {
        if (_cfg.model_failure == ABORT) { throw ModelEvaluationError("non-finite energy inside the support"); }
        ++ks.model_failures;
        if (_cfg.verbose > 1) { cerr << "WARNING: non-finite energy inside the support; rejecting candidate." << endl; }
        return false;
    }
    return true;
}

StepInfo TWalk::_step(RNG &rng) {
    StepInfo info;
    info.kernel = static_cast<KERNEL>(gsl_ran_discrete(rng.rng(), _kernel_table));
    info.moving = (rng.uniform() < 0.5) ? SECONDARY : PRIMARY;

    KernelStats &ks = _stats[info.kernel];
    ++ks.proposed;

    const Walker &mover = _chain->get(info.moving);
    const Walker &reference = _chain->get(other(info.moving));
    Proposal prop = _kernels[info.kernel]->propose(mover.theta, reference.theta, rng);

    float_type energy = std::numeric_limits<float_type>::infinity();
    if (not prop.admissible) {
        ++ks.degenerate;
    } else if (not _model.supp(prop.y)) {
        ++ks.out_of_support; // never evaluate the energy outside the support
    } else if (_evaluate(prop.y, energy, ks)) {
        info.evaluated = true;
        info.log_alpha = (mover.energy - energy) + prop.log_correction;
    }

    // always drawn, so the sequence of draws does not depend on the outcome above
    const float_type u = rng.uniform();
    // min(1, exp(log_alpha)) without overflow; NaN compares false => reject
    if (info.evaluated and ((info.log_alpha >= 0.0) or (std::log(u) < info.log_alpha))) {
        _chain->update(info.moving, std::move(prop.y), energy);
        ++ks.accepted;
        info.accepted = true;
    }
    return info;
}

void TWalk::_print_progress(const long int iter, const long int T) const {
    if ((_cfg.verbose > 0) and (_cfg.progress_interval > 0) and ((iter + 1) % _cfg.progress_interval == 0)) {
        cerr << "TWalk: computed " << iter + 1 << " of " << T << " iterations, acceptance rate "
             << acceptance_rate() << ", current energy " << _chain->primary().energy << endl;
    }
}

Trace TWalk::run(const long int T, const Row &x0, const Row &xp0, RNG &rng) {
    _state = INITIALIZING;
    _stats = KernelStatsArray();
    _chain.reset();

    if (T < 0) { throw std::invalid_argument("number of iterations must be non-negative, got " + to_string(T)); }
    _initialize(x0, xp0);

    Trace trace(_model.dim());
    trace.reserve(T + 1);
    trace.append(_chain->primary().theta, _chain->primary().energy);

    _state = ITERATING;
    try {
        for (long int it = 0; it < T; ++it) {
            if (_stop_requested) {
                if (_cfg.verbose > 0) { cerr << "TWalk: stop requested; ending after " << it << " iterations." << endl; }
                break;
            }
            StepInfo info = _step(rng);
            info.iteration = it + 1;
            trace.append(_chain->primary().theta, _chain->primary().energy);
            if (_observer) { _observer(info, *_chain); }
            _print_progress(it, T);
        }
    } catch (const std::exception &e) {
        _state = TERMINATED;
        _stop_requested = false;
        if (_cfg.verbose > 0) { cerr << "ERROR: chain aborted after " << trace.size() - 1 << " iterations: " << e.what() << endl; }
        throw;
    }
    _state = TERMINATED;
    _stop_requested = false;
    return trace;
}

Trace TWalk::run(const long int T, RNG &rng) {
    if (T < 0) { throw std::invalid_argument("number of iterations must be non-negative, got " + to_string(T)); }
    const Row x0 = _model.sim_init(rng);
    const Row xp0 = _model.sim_init(rng);
    return run(T, x0, xp0, rng);
}

vector<ChainResult> run_chains(
    const PosteriorModel &model,
    const SamplerConfig &cfg,
    const size_t num_chains,
    const long int T,
    const unsigned long int seed
) {
    validate(cfg);
    if (num_chains == 0) { throw std::invalid_argument("number of chains must be positive"); }
    if (T < 0) { throw std::invalid_argument("number of iterations must be non-negative, got " + to_string(T)); }

    vector<std::unique_ptr<ChainResult>> results(num_chains);
    vector<std::exception_ptr> errors(num_chains);
    vector<std::thread> workers;
    workers.reserve(num_chains);

    for (size_t c = 0; c < num_chains; ++c) {
        workers.emplace_back([&, c]() {
            try {
                RNG rng(seed + c);
                TWalk sampler(model, cfg);
                Trace trace = sampler.run(T, rng);
                results[c] = std::make_unique<ChainResult>(ChainResult{ std::move(trace), sampler.kernel_stats(), seed + c });
            } catch (...) {
                errors[c] = std::current_exception();
            }
        });
    }
    for (std::thread &w : workers) { w.join(); }

    for (const std::exception_ptr &e : errors) {
        if (e) { std::rethrow_exception(e); }
    }

    vector<ChainResult> out;
    out.reserve(num_chains);
    for (auto &r : results) { out.push_back(std::move(*r)); }
    return out;
}

}
