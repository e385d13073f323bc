#include <TWalk/FitzhughNagumo.h>

#include <cmath>
#include <sstream>
#include <stdexcept>

#include <gsl/gsl_math.h>
#include <gsl/gsl_sf_gamma.h>

using std::string;

namespace TW {

Row FNConfig::x_obs() const {
    Row x(n_obs);
    for (size_t k = 1; k <= n_obs; ++k) { x[k - 1] = k * n_m * dx(); }
    return x;
}

float_type FNConfig::error_bound() const {
    return std::sqrt(2.0 * M_PI) / 20.0 / n_obs * sigma;
}

void FNConfig::validate() const {
    std::ostringstream msg;
    if (n_obs < 1) { msg << "n_obs must be at least 1"; }
    else if (n_m < 1) { msg << "n_m must be at least 1"; }
    else if (not (std::isfinite(alpha) and alpha > 0.0)) { msg << "alpha must be positive, got " << alpha; }
    else if (not (std::isfinite(tau) and tau > 0.0)) { msg << "tau must be positive, got " << tau; }
    else if (not (std::isfinite(sigma) and sigma > 0.0)) { msg << "sigma must be positive, got " << sigma; }
    else if (not ((0.0 < theta_true) and (theta_true < 1.0))) { msg << "theta_true must be in (0, 1), got " << theta_true; }
    else if (not (std::isfinite(prior_alpha) and prior_alpha > 0.0 and std::isfinite(prior_beta) and prior_beta > 0.0)) {
        msg << "Beta prior parameters must be positive, got " << prior_alpha << ", " << prior_beta;
    }
    if (not msg.str().empty()) { throw std::invalid_argument("Fitzhugh-Nagumo: " + msg.str()); }
}

float_type fn_exact(const float_type x, const float_type t, const float_type theta) {
    const float_type c = (1.0 - 2.0 * theta) / M_SQRT2;
    return 0.5 * (1.0 - std::tanh((x - c * t) / (2.0 * M_SQRT2)));
}

Row FNExactMap::operator()(const float_type theta) const {
    Row u(_x_obs.size());
    for (Eigen::Index k = 0; k < _x_obs.size(); ++k) { u[k] = fn_exact(_x_obs[k], _cfg.tau, theta); }
    return u;
}

// right hand side of the semi-discrete system on nodes 0..nx; the boundary
// entries are left at zero, boundary values are imposed by the caller
void _fn_rhs(const Col &u, const float_type theta, const float_type inv_dx2, Col &du) {
    const Eigen::Index n = u.size();
    du[0] = 0.0;
    du[n - 1] = 0.0;
    for (Eigen::Index j = 1; j < n - 1; ++j) {
        du[j] = (u[j - 1] - 2.0 * u[j] + u[j + 1]) * inv_dx2 + u[j] * (1.0 - u[j]) * (u[j] - theta);
    }
}

void _fn_boundary(Col &u, const float_type t, const float_type theta) {
    u[0] = fn_exact(0.0, t, theta);
    u[u.size() - 1] = fn_exact(1.0, t, theta);
}

Col FNNumericMap::solve(const float_type theta) const {
    const size_t nx = _cfg.nx();
    const float_type dx = _cfg.dx();
    const float_type inv_dx2 = 1.0 / (dx * dx);
    const size_t M = static_cast<size_t>(std::ceil(_cfg.tau / _cfg.dt()));
    const float_type h = _cfg.tau / M;

    Col u(nx + 1);
    for (size_t j = 0; j <= nx; ++j) { u[j] = fn_exact(j * dx, 0.0, theta); }

    Col k1(nx + 1), k2(nx + 1), k3(nx + 1), k4(nx + 1), stage(nx + 1);
    for (size_t m = 0; m < M; ++m) {
        const float_type t = m * h;

        _fn_rhs(u, theta, inv_dx2, k1);

        stage = u + 0.5 * h * k1;
        _fn_boundary(stage, t + 0.5 * h, theta);
        _fn_rhs(stage, theta, inv_dx2, k2);

        stage = u + 0.5 * h * k2;
        _fn_boundary(stage, t + 0.5 * h, theta);
        _fn_rhs(stage, theta, inv_dx2, k3);

        stage = u + h * k3;
        _fn_boundary(stage, t + h, theta);
        _fn_rhs(stage, theta, inv_dx2, k4);

        u += h / 6.0 * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
        _fn_boundary(u, t + h, theta);

        if (not u.allFinite()) {
            std::ostringstream msg;
            msg << "Fitzhugh-Nagumo solver diverged at t = " << t + h << " for theta = " << theta
                << " (dt = " << h << ", dx = " << dx << ")";
            throw ForwardMapError(msg.str());
        }
    }
    return u;
}

Row FNNumericMap::operator()(const float_type theta) const {
    const Col u = solve(theta);
    Row obs(_cfg.n_obs);
    for (size_t k = 1; k <= _cfg.n_obs; ++k) { obs[k - 1] = u[k * _cfg.n_m]; }
    return obs;
}

std::unique_ptr<ForwardMapProvider> make_forward_map(const FNConfig & cfg) {
    if (cfg.numeric) {
        return std::make_unique<FNNumericMap>(cfg);
    } else {
        return std::make_unique<FNExactMap>(cfg);
    }
}

float_type max_abs_difference(const ForwardMapProvider & a, const ForwardMapProvider & b, const float_type theta) {
    return (a(theta) - b(theta)).cwiseAbs().maxCoeff();
}

Row make_data(const FNConfig & cfg, RNG & rng) {
    const Row x = cfg.x_obs();
    Row data(cfg.n_obs);
    for (size_t k = 0; k < cfg.n_obs; ++k) {
        data[k] = fn_exact(x[k], cfg.tau, cfg.theta_true) + rng.gaussian(cfg.sigma);
    }
    return data;
}

FNPosterior::FNPosterior(
    const FNConfig & cfg,
    const ForwardMapProvider & fmap,
    const Row & data
) : _cfg(cfg), _fmap(fmap), _data(data),
    _prior_const(-gsl_sf_lnbeta(cfg.prior_alpha, cfg.prior_beta)),
    _like_const(-0.5 * cfg.n_obs * std::log(2.0 * M_PI) - cfg.n_obs * std::log(cfg.sigma)) {
    if (static_cast<size_t>(data.size()) != cfg.n_obs) {
        throw std::invalid_argument(
            "FNPosterior: expected " + std::to_string(cfg.n_obs) + " observations, got " + std::to_string(data.size())
        );
    }
}

float_type FNPosterior::log_prior(const float_type theta) const {
    return _prior_const + (_cfg.prior_alpha - 1.0) * std::log(theta) + (_cfg.prior_beta - 1.0) * std::log1p(-theta);
}

float_type FNPosterior::log_likelihood(const float_type theta) const {
    const Row resid = (_data - _fmap(theta)) / _cfg.sigma;
    return _like_const - 0.5 * resid.squaredNorm();
}

float_type FNPosterior::energy(const Row & theta) const {
    return -log_likelihood(theta[0]) - log_prior(theta[0]);
}

bool FNPosterior::supp(const Row & theta) const {
    return (0.0 < theta[0]) and (theta[0] < 1.0);
}

Row FNPosterior::sim_init(RNG & rng) const {
    Row theta(1);
    theta[0] = rng.beta(_cfg.prior_alpha, _cfg.prior_beta);
    return theta;
}

}
