#include "testing.h"

#include <cmath>
#include <stdexcept>

#include <TWalk/Kernels.h>

using namespace TW;
using namespace std;

const float_type TOL = 1e-12;

Row row(std::initializer_list<float_type> vals) {
    Row r(vals.size());
    size_t i = 0;
    for (auto v : vals) { r[i++] = v; }
    return r;
}

void test_walk_z() {
    const float_type aw = 1.5;
    IS_TRUE(fabs(walk_z(0.0, aw) - (-aw / (1.0 + aw))) < TOL);
    IS_TRUE(fabs(walk_z(1.0, aw) - aw) < TOL);
    // monotone on [0, 1]
    bool increasing = true;
    for (size_t i = 1; i <= 100; ++i) { increasing = increasing and (walk_z(i / 100.0, aw) > walk_z((i - 1) / 100.0, aw)); }
    IS_TRUE(increasing);
}

void test_sim_beta() {
    RNG rng(101);
    const float_type at = 6.0;
    const size_t n = 200000;
    size_t below = 0;
    bool positive = true;
    for (size_t i = 0; i < n; ++i) {
        const float_type beta = sim_beta(rng, at);
        positive = positive and (beta > 0.0) and std::isfinite(beta);
        if (beta < 1.0) { ++below; }
    }
    IS_TRUE(positive);
    // P(beta < 1) = (at - 1) / (2 at)
    IS_TRUE(fabs(static_cast<float_type>(below) / n - (at - 1.0) / (2.0 * at)) < 0.005);
}

void test_neg_log_densities() {
    const Row x = row({ 0.0 }), xp = row({ 1.0 });
    const Phi phi = { true };
    const float_type log_2pi = log(2.0 * M_PI);
    // blow: centred at xp, sigma = |xp - x|
    IS_TRUE(fabs(blow_neg_log_density(xp, x, xp, phi) - 0.5 * log_2pi) < TOL);
    IS_TRUE(fabs(blow_neg_log_density(row({ 3.0 }), x, xp, phi) - (0.5 * log_2pi + 2.0)) < TOL);
    // hop: centred at x, sigma = |xp - x| / 3
    IS_TRUE(fabs(hop_neg_log_density(x, x, xp, phi) - (0.5 * log_2pi + log(1.0 / 3.0))) < TOL);
    IS_TRUE(fabs(hop_neg_log_density(row({ 1.0 }), x, xp, phi) - (0.5 * log_2pi + log(1.0 / 3.0) + 4.5)) < TOL);
    // coordinates outside phi do not count
    const Row x2 = row({ 0.0, 5.0 }), xp2 = row({ 1.0, -5.0 });
    IS_TRUE(fabs(blow_neg_log_density(row({ 1.0, 100.0 }), x2, xp2, { true, false }) - 0.5 * log_2pi) < TOL);
    IS_TRUE(blow_neg_log_density(x2, x2, xp2, { false, false }) == 0.0);
}

void test_moved_coordinates() {
    RNG rng(7);
    KernelPars kp;
    WalkKernel walk(kp);
    const size_t d = 10, n = 20000;
    Row x = Row::Zero(d), xp = Row::Ones(d);
    size_t total_nphi = 0;
    bool consistent = true;
    for (size_t i = 0; i < n; ++i) {
        const Proposal prop = walk.propose(x, xp, rng);
        total_nphi += prop.nphi;
        size_t changed = 0;
        for (size_t c = 0; c < d; ++c) { if (prop.y[c] != x[c]) { ++changed; } }
        // a walk step can land back on x only with probability zero
        consistent = consistent and (changed == prop.nphi);
        consistent = consistent and (prop.admissible == (prop.nphi > 0));
    }
    IS_TRUE(consistent);
    // on average n1phi coordinates move
    IS_TRUE(fabs(static_cast<float_type>(total_nphi) / n - kp.n1phi) < 0.05);
}

void test_one_dimension_moves_everything() {
    RNG rng(8);
    KernelPars kp;
    const Row x = row({ 0.2 }), xp = row({ -0.4 });
    bool all_moved = true;
    for (size_t k = 0; k < NUM_KERNELS; ++k) {
        auto kernel = make_kernel(static_cast<KERNEL>(k), kp);
        IS_TRUE(kernel->type() == static_cast<KERNEL>(k));
        for (size_t i = 0; i < 1000; ++i) {
            all_moved = all_moved and (kernel->propose(x, xp, rng).nphi == 1);
        }
    }
    IS_TRUE(all_moved);
}

void test_traverse_correction() {
    RNG rng(9);
    TraverseKernel traverse{KernelPars()};
    const Row x = row({ 0.5 }), xp = row({ 2.0 });
    bool matches = true;
    for (size_t i = 0; i < 1000; ++i) {
        const Proposal prop = traverse.propose(x, xp, rng);
        // y = xp + beta (xp - x)
        const float_type beta = (prop.y[0] - xp[0]) / (xp[0] - x[0]);
        matches = matches and (fabs(prop.log_correction - (1.0 - 2.0) * log(beta)) < 1e-9);
        // beta > 0: x and y are on opposite sides of xp
        matches = matches and (prop.y[0] > xp[0]);
    }
    IS_TRUE(matches);
}

void test_blow_hop_corrections() {
    RNG rng(10);
    const Row x = row({ 0.5, 1.0 }), xp = row({ 2.0, -1.0 });
    const Phi both = { true, true };
    BlowKernel blow{KernelPars()};
    HopKernel hop{KernelPars()};
    bool matches = true;
    for (size_t i = 0; i < 200; ++i) {
        const Proposal pb = blow.propose(x, xp, rng);
        if (pb.nphi == 2) {
            const float_type expected = blow_neg_log_density(pb.y, x, xp, both) - blow_neg_log_density(x, pb.y, xp, both);
            matches = matches and (fabs(pb.log_correction - expected) < 1e-9);
        }
        const Proposal ph = hop.propose(x, xp, rng);
        if (ph.nphi == 2) {
            const float_type expected = hop_neg_log_density(ph.y, x, xp, both) - hop_neg_log_density(x, ph.y, xp, both);
            matches = matches and (fabs(ph.log_correction - expected) < 1e-9);
        }
    }
    IS_TRUE(matches);
}

void test_inadmissible_when_equal_to_reference() {
    RNG rng(11);
    // walkers share a coordinate, which a walk step leaves tied
    WalkKernel walk{KernelPars()};
    const Row x = row({ 1.0, 0.0 }), xp = row({ 1.0, 2.0 });
    bool rejected = true;
    for (size_t i = 0; i < 100; ++i) { rejected = rejected and not walk.propose(x, xp, rng).admissible; }
    IS_TRUE(rejected);
}

void test_validate_pars() {
    KernelPars kp;
    kp.aw = 0.0;
    IS_THROWN(validate(kp), std::invalid_argument);
    kp = KernelPars();
    kp.at = 1.0;
    IS_THROWN(validate(kp), std::invalid_argument);
    kp = KernelPars();
    kp.n1phi = -1.0;
    IS_THROWN(validate(kp), std::invalid_argument);
    bool ok = true;
    try { validate(KernelPars()); } catch (const std::invalid_argument &) { ok = false; }
    IS_TRUE(ok);
}

// draws advance the stream; a seed replays it
void test_rng_stream() {
    RNG a(314), b(314);
    const float_type u1 = a.uniform(), u2 = a.uniform();
    IS_TRUE(u1 != u2);
    IS_TRUE((b.uniform() == u1) and (b.uniform() == u2));
    const float_type g = a.gaussian();
    IS_TRUE(b.gaussian() == g);
    a.reseed(314);
    IS_TRUE(a.uniform() == u1);
    IS_TRUE(a.seed() == 314);
}

int main() {
    test_rng_stream();
    test_walk_z();
    test_sim_beta();
    test_neg_log_densities();
    test_moved_coordinates();
    test_one_dimension_moves_everything();
    test_traverse_correction();
    test_blow_hop_corrections();
    test_inadmissible_when_equal_to_reference();
    test_validate_pars();
    return TEST_STATUS();
}
