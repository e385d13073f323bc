#ifndef TWALK_POSTERIOR_H
#define TWALK_POSTERIOR_H

#include <functional>
#include <stdexcept>
#include <string>

#include <TWalk/TypeDefs.h>
#include <TWalk/RNG.h>

// Design goals for `PosteriorModel`s:
//  - has no state (i.e. any chain state is managed by the sampler)
//  - has no knowledge of the sampler
//  - uniform interface whether implemented by subclassing or from plain functions
//
// Requirements
// From the sampler, must expose:
// - dimension of the parameter space
// - energy (-log of the unnormalized posterior density)
// - support predicate
// - a sampler for initial points
//
// `energy` is only trusted inside the support; callers check `supp` first.

namespace TW {

// Distinguished failure of a model evaluation, e.g. a forward solver that
// diverged. Never report these as a number.
struct ModelEvaluationError : public std::runtime_error {
    ModelEvaluationError(const std::string & what) : std::runtime_error(what) {}
};

struct PosteriorModel {
    virtual ~PosteriorModel() {}

    virtual size_t dim() const = 0;

    // -log(unnormalized posterior density) at theta; may throw ModelEvaluationError
    virtual float_type energy(const Row & theta) const = 0;

    // true if theta is in the support of the posterior
    virtual bool supp(const Row & theta) const = 0;

    // draw one point from a reference distribution covering the support;
    // this side-effects the RNG *not* the model
    virtual Row sim_init(RNG & rng) const = 0;
};

typedef std::function<float_type(const Row &)> EnergyFun;
typedef std::function<bool(const Row &)> SuppFun;
typedef std::function<Row(RNG &)> SimInitFun;

// a PosteriorModel built around plain callables; `sim_init` may be left unset,
// in which case initial points must be supplied to the sampler.
struct PosteriorFun : public PosteriorModel {
    PosteriorFun(
        const size_t d,
        const EnergyFun & U,
        const SuppFun & Supp,
        const SimInitFun & SimInit = SimInitFun()
    ) : _dim(d), _energy(U), _supp(Supp), _sim_init(SimInit) {
        if (d == 0) { throw std::invalid_argument("PosteriorFun: dimension must be positive"); }
        if (not (_energy and _supp)) { throw std::invalid_argument("PosteriorFun: energy and support functions are required"); }
    }

    size_t dim() const override { return _dim; }
    float_type energy(const Row & theta) const override { return _energy(theta); }
    bool supp(const Row & theta) const override { return _supp(theta); }

    Row sim_init(RNG & rng) const override {
        if (not _sim_init) {
            throw std::invalid_argument("PosteriorFun: no initial-point sampler; supply initial points explicitly");
        }
        return _sim_init(rng);
    }

    private:
        const size_t _dim;
        const EnergyFun _energy;
        const SuppFun _supp;
        const SimInitFun _sim_init;
};

} // namespace TW

#endif // TWALK_POSTERIOR_H
