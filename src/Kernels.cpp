#include <TWalk/Kernels.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

using std::string;

namespace TW {

const float_type LOG_2PI = std::log(2.0 * M_PI);

std::ostream& operator<<(std::ostream &os, const KERNEL &kernel) {
    switch (kernel) {
        case WALK: os << "WALK"; break;
        case TRAVERSE: os << "TRAVERSE"; break;
        case BLOW: os << "BLOW"; break;
        case HOP: os << "HOP"; break;
        default: os << "UNDEFINED TW::KERNEL"; break;
    }
    return os;
}

void validate(const KernelPars &kp) {
    if (not (kp.aw > 0 and std::isfinite(kp.aw))) {
        throw std::invalid_argument("kernel parameter aw must be positive, got " + std::to_string(kp.aw));
    }
    if (not (kp.at > 1 and std::isfinite(kp.at))) {
        throw std::invalid_argument("kernel parameter at must be > 1, got " + std::to_string(kp.at));
    }
    if (not (kp.n1phi > 0 and std::isfinite(kp.n1phi))) {
        throw std::invalid_argument("kernel parameter n1phi must be positive, got " + std::to_string(kp.n1phi));
    }
}

Phi Kernel::select(const size_t d, RNG &rng, size_t &nphi) const {
    const float_type pphi = std::min(static_cast<float_type>(d), pars.n1phi) / d;
    Phi phi(d, false);
    nphi = 0;
    for (size_t i = 0; i < d; ++i) {
        phi[i] = rng.uniform() < pphi;
        if (phi[i]) { ++nphi; }
    }
    return phi;
}

void Kernel::check_admissible(Proposal &prop, const Row &xp) const {
    prop.admissible = (prop.nphi > 0) and ((prop.y.array() != xp.array()).all());
}

float_type walk_z(const float_type u, const float_type aw) {
    return (aw / (1.0 + aw)) * (aw * u * u + 2.0 * u - 1.0);
}

float_type sim_beta(RNG &rng, const float_type at) {
    if (rng.uniform() < (at - 1.0) / (2.0 * at)) {
        return std::exp(std::log(rng.uniform_pos()) / (at + 1.0));
    } else {
        return std::exp(std::log(rng.uniform_pos()) / (1.0 - at));
    }
}

// largest distance between the walkers over the moving coordinates
float_type _max_spread(const Row &x, const Row &xp, const Phi &phi) {
    float_type spread = 0.0;
    for (size_t i = 0; i < phi.size(); ++i) {
        if (phi[i]) { spread = std::max(spread, std::fabs(xp[i] - x[i])); }
    }
    return spread;
}

// -log of an isotropic gaussian over the moving coordinates
float_type _gaussian_neg_log_density(
    const Row &h, const Row &center, const float_type sigma, const Phi &phi
) {
    size_t nphi = 0;
    float_type sq = 0.0;
    for (size_t i = 0; i < phi.size(); ++i) {
        if (phi[i]) {
            ++nphi;
            sq += (h[i] - center[i]) * (h[i] - center[i]);
        }
    }
    if (nphi == 0) { return 0.0; }
    return 0.5 * nphi * LOG_2PI + nphi * std::log(sigma) + 0.5 * sq / (sigma * sigma);
}

float_type blow_neg_log_density(const Row &h, const Row &x, const Row &xp, const Phi &phi) {
    return _gaussian_neg_log_density(h, xp, _max_spread(x, xp, phi), phi);
}

float_type hop_neg_log_density(const Row &h, const Row &x, const Row &xp, const Phi &phi) {
    return _gaussian_neg_log_density(h, x, _max_spread(x, xp, phi) / 3.0, phi);
}

Proposal WalkKernel::propose(const Row &x, const Row &xp, RNG &rng) const {
    Proposal prop;
    const Phi phi = select(x.size(), rng, prop.nphi);
    prop.y = x;
    for (size_t i = 0; i < phi.size(); ++i) {
        if (phi[i]) { prop.y[i] = x[i] + (x[i] - xp[i]) * walk_z(rng.uniform(), pars.aw); }
    }
    // the walk is its own reverse move: no correction
    prop.log_correction = 0.0;
    check_admissible(prop, xp);
    return prop;
}

Proposal TraverseKernel::propose(const Row &x, const Row &xp, RNG &rng) const {
    Proposal prop;
    const float_type beta = sim_beta(rng, pars.at);
    const Phi phi = select(x.size(), rng, prop.nphi);
    prop.y = x;
    for (size_t i = 0; i < phi.size(); ++i) {
        if (phi[i]) { prop.y[i] = xp[i] + beta * (xp[i] - x[i]); }
    }
    // (x, beta) => (y, 1/beta) has jacobian beta^(nphi - 2), and f(beta) == f(1/beta)
    prop.log_correction = (prop.nphi > 0) ? (static_cast<float_type>(prop.nphi) - 2.0) * std::log(beta) : 0.0;
    check_admissible(prop, xp);
    return prop;
}

Proposal BlowKernel::propose(const Row &x, const Row &xp, RNG &rng) const {
    Proposal prop;
    const Phi phi = select(x.size(), rng, prop.nphi);
    const float_type sigma = _max_spread(x, xp, phi);
    prop.y = x;
    for (size_t i = 0; i < phi.size(); ++i) {
        if (phi[i]) { prop.y[i] = xp[i] + rng.gaussian(sigma); }
    }
    check_admissible(prop, xp);
    if (prop.admissible) {
        // log g(x | y) - log g(y | x)
        prop.log_correction = blow_neg_log_density(prop.y, x, xp, phi) - blow_neg_log_density(x, prop.y, xp, phi);
    }
    return prop;
}

Proposal HopKernel::propose(const Row &x, const Row &xp, RNG &rng) const {
    Proposal prop;
    const Phi phi = select(x.size(), rng, prop.nphi);
    const float_type sigma = _max_spread(x, xp, phi) / 3.0;
    prop.y = x;
    for (size_t i = 0; i < phi.size(); ++i) {
        if (phi[i]) { prop.y[i] = x[i] + rng.gaussian(sigma); }
    }
    check_admissible(prop, xp);
    if (prop.admissible) {
        // the hop scale depends on the moving walker, so the proposal is not symmetric
        prop.log_correction = hop_neg_log_density(prop.y, x, xp, phi) - hop_neg_log_density(x, prop.y, xp, phi);
    }
    return prop;
}

std::unique_ptr<Kernel> make_kernel(const KERNEL k, const KernelPars &kp) {
    switch (k) {
        case WALK: return std::make_unique<WalkKernel>(kp);
        case TRAVERSE: return std::make_unique<TraverseKernel>(kp);
        case BLOW: return std::make_unique<BlowKernel>(kp);
        case HOP: return std::make_unique<HopKernel>(kp);
        default: throw std::invalid_argument("make_kernel: unknown kernel " + std::to_string(static_cast<int>(k)));
    }
}

} // namespace TW
