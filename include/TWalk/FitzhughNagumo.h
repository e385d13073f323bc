#ifndef TWALK_FITZHUGHNAGUMO_H
#define TWALK_FITZHUGHNAGUMO_H

#include <memory>
#include <string>

#include <TWalk/TypeDefs.h>
#include <TWalk/RNG.h>
#include <TWalk/Posterior.h>

// Calibration of theta in the Fitzhugh-Nagumo (Nagumo) equation
//
//     u_t = u_xx + u (1 - u) (u - theta),   x in (0, 1), t in (0, tau]
//
// observed with gaussian noise at n_obs points at time tau.
//
// Initial and boundary values come from the travelling wave solution
//
//     u(x, t) = 1/2 (1 - tanh((x - c t) / (2 sqrt(2)))),   c = (1 - 2 theta) / sqrt(2)
//
// which also serves as the exact forward map.

namespace TW {

// Every constant of the problem, fixed once at startup and passed by reference.
//
// Grid: nx = n_m (n_obs + 2) cells of width dx = 1 / nx; time step dt = dx^2 / alpha
// (adjusted down so that tau is hit exactly); data observed at x_k = k n_m dx, k = 1..n_obs.
struct FNConfig {
    size_t n_obs = 8;
    size_t n_m = 8;
    float_type alpha = 2.0;
    float_type tau = 0.4;
    float_type theta_true = 0.3;
    float_type sigma = 0.007;      // noise in the data
    float_type prior_alpha = 2.0;  // Beta prior
    float_type prior_beta = 3.5;
    bool numeric = true;           // numerical (true) or exact (false) forward map in the likelihood
    unsigned long int data_seed = 23;

    size_t nx() const { return n_m * (n_obs + 2); }
    float_type dx() const { return 1.0 / nx(); }
    float_type dt() const { return dx() * dx() / alpha; }
    Row x_obs() const;

    // bound on the forward map error for which the numerical posterior is
    // indistinguishable from the exact one: sqrt(2 pi) / 20 / n_obs * sigma
    float_type error_bound() const;

    // @throws std::invalid_argument
    void validate() const;
};

// travelling wave solution
float_type fn_exact(const float_type x, const float_type t, const float_type theta);

// the forward solver diverged
struct ForwardMapError : public ModelEvaluationError {
    ForwardMapError(const std::string & what) : ModelEvaluationError(what) {}
};

// defines the forward map: theta => solution values at the observation points at time tau
// implementations are deterministic and have no state
struct ForwardMapProvider {
    virtual ~ForwardMapProvider() {}
    virtual Row operator()(const float_type theta) const = 0;
    virtual std::string name() const = 0;
};

struct FNExactMap : public ForwardMapProvider {
    FNExactMap(const FNConfig & cfg) : _cfg(cfg), _x_obs(cfg.x_obs()) {}
    Row operator()(const float_type theta) const override;
    std::string name() const override { return "exact"; }

    private:
        const FNConfig & _cfg;
        const Row _x_obs;
};

// Method of lines: central differences in x on the interior nodes, classic
// Runge-Kutta 4 in t.
// @throws ForwardMapError if the solution stops being finite
struct FNNumericMap : public ForwardMapProvider {
    FNNumericMap(const FNConfig & cfg) : _cfg(cfg) {}
    Row operator()(const float_type theta) const override;
    std::string name() const override { return "numeric"; }

    // the whole solution at time tau on nodes 0..nx (boundaries included)
    Col solve(const float_type theta) const;

    private:
        const FNConfig & _cfg;
};

// selected by FNConfig::numeric
std::unique_ptr<ForwardMapProvider> make_forward_map(const FNConfig & cfg);

// largest absolute difference between two forward maps at theta
float_type max_abs_difference(const ForwardMapProvider & a, const ForwardMapProvider & b, const float_type theta);

// Synthetic data: exact solution at theta_true plus N(0, sigma^2) noise.
// The RNG belongs to this call only; seed it with cfg.data_seed for the
// reference data set.
Row make_data(const FNConfig & cfg, RNG & rng);

// Beta(prior_alpha, prior_beta) prior, gaussian likelihood with known sigma,
// support 0 < theta < 1; initial points drawn from the prior.
class FNPosterior : public PosteriorModel {
    public:
        // @throws std::invalid_argument if data does not have n_obs values
        FNPosterior(const FNConfig & cfg, const ForwardMapProvider & fmap, const Row & data);

        size_t dim() const override { return 1; }
        float_type energy(const Row & theta) const override;
        bool supp(const Row & theta) const override;
        Row sim_init(RNG & rng) const override;

        float_type log_prior(const float_type theta) const;
        float_type log_likelihood(const float_type theta) const;

        const Row & data() const { return _data; }

    private:
        const FNConfig & _cfg;
        const ForwardMapProvider & _fmap;
        const Row _data;
        const float_type _prior_const;
        const float_type _like_const;
};

}

#endif // TWALK_FITZHUGHNAGUMO_H
