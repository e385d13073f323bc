#ifndef TWALK_RNG_H
#define TWALK_RNG_H

#include <memory>
#include <gsl/gsl_rng.h>
#include <gsl/gsl_randist.h>

#include <TWalk/TypeDefs.h>

namespace TW {

// RNG: the single seedable source of randomness for one chain.
// Owns a gsl_rng stream; must be passed around by reference.
//
// Every draw a chain makes (kernel choice, moving walker, kernel internals,
// Metropolis test) comes from one RNG, so that a run is replayable given the
// seed and the initial points. Independent chains each own their own RNG.
class RNG {
    public:
        RNG(
            const unsigned long int seed,
            const gsl_rng_type * type = gsl_rng_taus2
        ) : _rng(gsl_rng_alloc(type)), _seed(seed) {
            gsl_rng_set(_rng.get(), seed);
        }

        RNG(const RNG &) = delete;
        RNG & operator=(const RNG &) = delete;

        const gsl_rng * rng() const { return _rng.get(); }
        unsigned long int seed() const { return _seed; }

        void reseed(const unsigned long int seed) { _seed = seed; gsl_rng_set(_rng.get(), seed); }

        // on [0, 1)
        float_type uniform() { return gsl_rng_uniform(_rng.get()); }
        // on (0, 1)
        float_type uniform_pos() { return gsl_rng_uniform_pos(_rng.get()); }
        float_type gaussian(const float_type sigma = 1.0) { return gsl_ran_gaussian(_rng.get(), sigma); }
        float_type beta(const float_type a, const float_type b) { return gsl_ran_beta(_rng.get(), a, b); }

    private:
        struct GslRngFree {
            void operator()(gsl_rng * r) const { gsl_rng_free(r); }
        };

        std::unique_ptr<gsl_rng, GslRngFree> _rng;
        unsigned long int _seed;
};

} // namespace TW

#endif // TWALK_RNG_H
