#include "testing.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <TWalk/TWalk.h>
#include <TWalk/TWalkUtil.h>

using namespace TW;
using namespace std;

Row row1(const float_type v) { Row r(1); r[0] = v; return r; }

// 1-D standard gaussian
PosteriorFun gaussian_model() {
    return PosteriorFun(
        1,
        [](const Row &theta) { return 0.5 * theta.squaredNorm(); },
        [](const Row &) { return true; },
        [](RNG &rng) { return row1(rng.gaussian()); }
    );
}

SamplerConfig only(const KERNEL k) {
    SamplerConfig cfg;
    cfg.kernel_weights = { 0.0, 0.0, 0.0, 0.0 };
    cfg.kernel_weights[k] = 1.0;
    return cfg;
}

bool same_trace(const Trace &a, const Trace &b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if ((a.at(i).theta != b.at(i).theta) or (a.energy_at(i) != b.energy_at(i))) return false;
    }
    return true;
}

void test_reproducible() {
    const PosteriorFun model = gaussian_model();
    TWalk sampler(model);
    RNG rng1(42), rng2(42);
    const Trace t1 = sampler.run(2000, row1(0.5), row1(-1.0), rng1);
    const Trace t2 = sampler.run(2000, row1(0.5), row1(-1.0), rng2);
    IS_TRUE(same_trace(t1, t2));
    RNG rng3(43);
    const Trace t3 = sampler.run(2000, row1(0.5), row1(-1.0), rng3);
    IS_TRUE(not same_trace(t1, t3));
}

void test_zero_iterations() {
    const PosteriorFun model = gaussian_model();
    TWalk sampler(model);
    RNG rng(1);
    const Trace trace = sampler.run(0, row1(0.5), row1(-1.0), rng);
    IS_TRUE(trace.size() == 1);
    IS_TRUE(trace.at(0).theta[0] == 0.5);
    IS_TRUE(trace.energy_at(0) == 0.125);
    IS_TRUE(sampler.total_stats().proposed == 0);
    IS_TRUE(sampler.state() == TWalk::TERMINATED);
}

void test_configuration_errors() {
    const PosteriorFun model = gaussian_model();
    TWalk sampler(model);
    RNG rng(1);
    IS_THROWN(sampler.chain_state(), std::logic_error);
    IS_THROWN(sampler.run(-1, row1(0.5), row1(-1.0), rng), std::invalid_argument);
    IS_THROWN(sampler.run(10, row1(0.5), row1(0.5), rng), std::invalid_argument);
    IS_THROWN(sampler.run(10, Row::Zero(2), Row::Ones(2), rng), std::invalid_argument);

    const PosteriorFun positive(
        1,
        [](const Row &theta) { return theta[0]; },
        [](const Row &theta) { return theta[0] > 0.0; }
    );
    TWalk psampler(positive);
    IS_THROWN(psampler.run(10, row1(-1.0), row1(1.0), rng), std::invalid_argument);
    IS_THROWN(psampler.run(10, row1(1.0), row1(-1.0), rng), std::invalid_argument);
    // no initial-point sampler
    IS_THROWN(psampler.run(10, rng), std::invalid_argument);

    const PosteriorFun nan_energy(
        1,
        [](const Row &) { return std::nan(""); },
        [](const Row &) { return true; }
    );
    TWalk nsampler(nan_energy);
    IS_THROWN(nsampler.run(10, row1(1.0), row1(2.0), rng), std::invalid_argument);
}

void test_bad_sampler_config() {
    const PosteriorFun model = gaussian_model();
    SamplerConfig cfg;
    cfg.kernel_weights = { 0.5, 0.5, 0.5, -0.5 };
    IS_THROWN(TWalk(model, cfg), std::invalid_argument);
    cfg.kernel_weights = { 0.5, 0.4, 0.0, 0.0 };
    IS_THROWN(TWalk(model, cfg), std::invalid_argument);
    cfg.kernel_weights = { std::nan(""), 1.0, 0.0, 0.0 };
    IS_THROWN(TWalk(model, cfg), std::invalid_argument);
    cfg = SamplerConfig();
    cfg.kernel_pars.at = 0.5;
    IS_THROWN(TWalk(model, cfg), std::invalid_argument);
    IS_THROWN(PosteriorFun(0, [](const Row &) { return 0.0; }, [](const Row &) { return true; }), std::invalid_argument);
    IS_THROWN(run_chains(model, SamplerConfig(), 0, 10, 1), std::invalid_argument);
}

void test_energy_never_called_outside_support() {
    size_t calls = 0, outside = 0;
    const PosteriorFun half_normal(
        1,
        [&](const Row &theta) { ++calls; if (theta[0] <= 0.0) { ++outside; } return 0.5 * theta.squaredNorm(); },
        [](const Row &theta) { return theta[0] > 0.0; }
    );
    TWalk sampler(half_normal);
    RNG rng(5);
    const Trace trace = sampler.run(20000, row1(0.5), row1(1.5), rng);
    IS_TRUE(calls > 0);
    IS_TRUE(outside == 0);
    IS_TRUE(sampler.total_stats().out_of_support > 0);
    // no recorded sample leaves the support
    bool inside = true;
    for (size_t i = 0; i < trace.size(); ++i) { inside = inside and (trace.at(i).theta[0] > 0.0); }
    IS_TRUE(inside);
}

void test_one_walker_moves() {
    const PosteriorFun model = gaussian_model();
    TWalk sampler(model);
    RNG rng(6);

    Walker last_x{ row1(0.5), 0.125 }, last_xp{ row1(-1.0), 0.5 };
    size_t violations = 0, accepted = 0;
    sampler.set_observer([&](const StepInfo &info, const ChainState &cs) {
        const Walker &other_now = cs.get(other(info.moving));
        const Walker &other_before = (other(info.moving) == PRIMARY) ? last_x : last_xp;
        // the reference walker is bit-identical
        if ((other_now.theta != other_before.theta) or (other_now.energy != other_before.energy)) { ++violations; }
        // a rejected proposal changes nothing
        const Walker &mover_now = cs.get(info.moving);
        const Walker &mover_before = (info.moving == PRIMARY) ? last_x : last_xp;
        if ((not info.accepted) and (mover_now.theta != mover_before.theta)) { ++violations; }
        if (info.accepted) { ++accepted; }
        last_x = cs.primary();
        last_xp = cs.secondary();
    });
    sampler.run(5000, row1(0.5), row1(-1.0), rng);
    IS_TRUE(violations == 0);
    IS_TRUE(accepted > 0);
    size_t total_accepted = sampler.total_stats().accepted;
    IS_TRUE(total_accepted == accepted);
}

void test_model_failure_policy() {
    // forward solver stand-in that fails far from the mode
    const PosteriorFun flaky(
        1,
        [](const Row &theta) {
            if (fabs(theta[0]) > 1.5) { throw ModelEvaluationError("diverged"); }
            return 0.5 * theta.squaredNorm();
        },
        [](const Row &) { return true; }
    );
    RNG rng(12);
    TWalk rejecting(flaky);
    const Trace trace = rejecting.run(5000, row1(0.5), row1(-0.5), rng);
    IS_TRUE(trace.size() == 5001);
    IS_TRUE(rejecting.total_stats().model_failures > 0);

    SamplerConfig cfg;
    cfg.model_failure = ABORT;
    TWalk aborting(flaky, cfg);
    RNG rng2(12);
    IS_THROWN(aborting.run(5000, row1(0.5), row1(-0.5), rng2), ModelEvaluationError);
    IS_TRUE(aborting.state() == TWalk::TERMINATED);
}

void test_nonfinite_energy_rejected() {
    // infinite energy to the right, NaN to the left, both inside the support
    const PosteriorFun holes(
        1,
        [](const Row &theta) {
            if (theta[0] > 2.0) { return std::numeric_limits<float_type>::infinity(); }
            if (theta[0] < -2.0) { return std::nan(""); }
            return 0.5 * theta.squaredNorm();
        },
        [](const Row &) { return true; }
    );
    TWalk sampler(holes);
    RNG rng(21);
    const Trace trace = sampler.run(20000, row1(0.5), row1(-0.5), rng);
    IS_TRUE(trace.size() == 20001);
    IS_TRUE(sampler.total_stats().model_failures > 0);
    bool finite = true, inside = true;
    for (size_t i = 0; i < trace.size(); ++i) {
        finite = finite and std::isfinite(trace.energy_at(i));
        inside = inside and (fabs(trace.at(i).theta[0]) <= 2.0);
    }
    IS_TRUE(finite);
    IS_TRUE(inside);
    IS_TRUE(sampler.chain_state().secondary().theta[0] >= -2.0);
    IS_TRUE(sampler.chain_state().secondary().theta[0] <= 2.0);
}

void test_request_stop() {
    const PosteriorFun model = gaussian_model();
    TWalk sampler(model);
    RNG rng(13);
    sampler.set_observer([&](const StepInfo &info, const ChainState &) {
        if (info.iteration == 10) { sampler.request_stop(); }
    });
    const Trace trace = sampler.run(1000, row1(0.5), row1(-1.0), rng);
    IS_TRUE(trace.size() == 11);

    // a request made before the run starts is not lost
    TWalk early(model);
    early.request_stop();
    IS_TRUE(early.run(1000, row1(0.5), row1(-1.0), rng).size() == 1);
    // and it does not carry over to the next run
    IS_TRUE(early.run(1000, row1(0.5), row1(-1.0), rng).size() == 1001);
}

void test_run_chains() {
    const PosteriorFun model = gaussian_model();
    const vector<ChainResult> chains = run_chains(model, SamplerConfig(), 3, 1000, 77);
    IS_TRUE(chains.size() == 3);
    bool sized = true;
    for (size_t c = 0; c < chains.size(); ++c) {
        sized = sized and (chains[c].trace.size() == 1001) and (chains[c].seed == 77 + c);
    }
    IS_TRUE(sized);

    // chain 0 is the run a single sampler makes from the same seed
    TWalk sampler(model);
    RNG rng(77);
    IS_TRUE(same_trace(sampler.run(1000, rng), chains[0].trace));
    IS_TRUE(not same_trace(chains[0].trace, chains[1].trace));
}

void test_run_chains_rethrows() {
    const PosteriorFun broken(
        1,
        [](const Row &theta) { if (theta[0] > 0.0) { throw ModelEvaluationError("broken"); } return 0.5 * theta.squaredNorm(); },
        [](const Row &) { return true; },
        [](RNG &rng) { return row1(-1.0 - rng.uniform()); }
    );
    SamplerConfig cfg;
    cfg.model_failure = ABORT;
    IS_THROWN(run_chains(broken, cfg, 2, 10000, 3), ModelEvaluationError);
}

// first two moments of N(0, 1) from one chain, within 5 Monte Carlo standard errors
// (inflated by the autocorrelation time of each series)
bool close_to_standard_gaussian(const Col &samples) {
    const float_type n = samples.size();
    const Col squares = samples.array().square();
    const float_type iat1 = integrated_autocorrelation_time(samples);
    const float_type iat2 = integrated_autocorrelation_time(squares);
    cout << "autocorrelation times " << iat1 << ", " << iat2 << endl;
    // the chain must mix well enough for the check to mean something
    if (not ((iat1 < 500) and (iat2 < 500))) { return false; }
    const float_type tol_mean = std::max(5.0 * sqrt(iat1 / n), 0.05);
    const float_type tol_var = std::max(5.0 * sqrt(2.0 * iat2 / n), 0.1);
    return (fabs(mean(samples)) < tol_mean) and (fabs(mean(squares) - 1.0) < tol_var);
}

// One step of a single kernel from two independent N(0, 1) walkers must leave
// them independent N(0, 1). A chain of one kernel need not be ergodic: a Walk
// move never changes the sign of x - xp, so the walkers keep their order.
void test_kernel_step_invariance(const KERNEL k) {
    const PosteriorFun model = gaussian_model();
    TWalk sampler(model, only(k));
    size_t accepted = 0;
    sampler.set_observer([&](const StepInfo &info, const ChainState &) { if (info.accepted) { ++accepted; } });

    RNG rng(2024 + k);
    const size_t n = 200000;
    Col x(n), xp(n);
    for (size_t i = 0; i < n; ++i) {
        const float_type x0 = rng.gaussian();
        const float_type xp0 = rng.gaussian();
        sampler.run(1, row1(x0), row1(xp0), rng);
        x[i] = sampler.chain_state().primary().theta[0];
        xp[i] = sampler.chain_state().secondary().theta[0];
    }
    const Col cross = x.array() * xp.array();
    cout << k << ": E[x] " << mean(x) << ", E[x^2] " << x.squaredNorm() / n
         << ", E[x xp] " << mean(cross) << ", accepted " << accepted << endl;

    // independent samples: 5 standard errors
    const float_type tol_mean = 5.0 / sqrt(static_cast<float_type>(n));
    const float_type tol_square = 5.0 * sqrt(2.0 / n);
    IS_TRUE(accepted > 0);
    IS_TRUE(fabs(mean(x)) < tol_mean);
    IS_TRUE(fabs(mean(xp)) < tol_mean);
    IS_TRUE(fabs(x.squaredNorm() / n - 1.0) < tol_square);
    IS_TRUE(fabs(xp.squaredNorm() / n - 1.0) < tol_square);
    IS_TRUE(fabs(mean(cross)) < tol_mean);
}

void test_mixture_targets_gaussian() {
    const PosteriorFun model = gaussian_model();
    TWalk sampler(model);
    RNG rng(99);
    const Trace trace = sampler.run(100000, row1(0.3), row1(-0.7), rng);
    const Col samples = trace.coordinate(0, trace.burn_in_size(0.1));
    IS_TRUE(close_to_standard_gaussian(samples));
}

int main() {
    test_reproducible();
    test_zero_iterations();
    test_configuration_errors();
    test_bad_sampler_config();
    test_energy_never_called_outside_support();
    test_one_walker_moves();
    test_model_failure_policy();
    test_nonfinite_energy_rejected();
    test_request_stop();
    test_run_chains();
    test_run_chains_rethrows();
    for (size_t k = 0; k < NUM_KERNELS; ++k) { test_kernel_step_invariance(static_cast<KERNEL>(k)); }
    test_mixture_targets_gaussian();
    return TEST_STATUS();
}
