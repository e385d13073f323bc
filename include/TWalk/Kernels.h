#ifndef TWALK_KERNELS_H
#define TWALK_KERNELS_H

#include <array>
#include <iostream>
#include <memory>
#include <vector>

#include <TWalk/TypeDefs.h>
#include <TWalk/RNG.h>

namespace TW {

// The t-walk move kernels. Order matters: it is the order of the kernel weights.
enum KERNEL { WALK, TRAVERSE, BLOW, HOP, NUM_KERNELS };

std::ostream& operator<<(std::ostream &os, const KERNEL &kernel);

// Tuning constants shared by the kernels.
// @var aw scale of the walk kernel
// @var at shape of the traverse scale density
// @var n1phi expected number of coordinates moved per proposal
struct KernelPars {
    float_type aw = 1.5;
    float_type at = 6.0;
    float_type n1phi = 4.0;
};

// throws std::invalid_argument on out of range tuning constants
void validate(const KernelPars &kp);

// which coordinates a proposal moves
typedef std::vector<bool> Phi;

// A candidate for the moving walker.
//
// @var y the candidate point
// @var log_correction log of the proposal-density (or Jacobian) part of the
//      Metropolis-Hastings ratio; the energy difference is added by the sampler
// @var nphi number of coordinates moved
// @var admissible if false, reject without evaluating the energy
struct Proposal {
    Row y;
    float_type log_correction = 0.0;
    size_t nphi = 0;
    bool admissible = true;
};

// A Kernel proposes a new value for the moving walker `x`, using the
// reference walker `xp`. Kernels have no state; all randomness comes from
// the RNG passed in.
struct Kernel {
    Kernel(const KernelPars &kp) : pars(kp) {}
    virtual ~Kernel() {}

    virtual KERNEL type() const = 0;
    virtual Proposal propose(const Row &x, const Row &xp, RNG &rng) const = 0;

    const KernelPars pars;

    protected:
        // each coordinate moves with probability min(d, n1phi) / d
        Phi select(const size_t d, RNG &rng, size_t &nphi) const;
        // a candidate must differ from the reference in every coordinate,
        // and a proposal moving nothing is a no-op
        void check_admissible(Proposal &prop, const Row &xp) const;
};

struct WalkKernel : public Kernel {
    WalkKernel(const KernelPars &kp) : Kernel(kp) {}
    KERNEL type() const override { return WALK; }
    Proposal propose(const Row &x, const Row &xp, RNG &rng) const override;
};

struct TraverseKernel : public Kernel {
    TraverseKernel(const KernelPars &kp) : Kernel(kp) {}
    KERNEL type() const override { return TRAVERSE; }
    Proposal propose(const Row &x, const Row &xp, RNG &rng) const override;
};

struct BlowKernel : public Kernel {
    BlowKernel(const KernelPars &kp) : Kernel(kp) {}
    KERNEL type() const override { return BLOW; }
    Proposal propose(const Row &x, const Row &xp, RNG &rng) const override;
};

struct HopKernel : public Kernel {
    HopKernel(const KernelPars &kp) : Kernel(kp) {}
    KERNEL type() const override { return HOP; }
    Proposal propose(const Row &x, const Row &xp, RNG &rng) const override;
};

std::unique_ptr<Kernel> make_kernel(const KERNEL k, const KernelPars &kp);

// building blocks, exposed for testing

// walk step factor from a uniform draw u; on [-aw/(1+aw), aw]
float_type walk_z(const float_type u, const float_type aw);

// traverse scale; density f satisfies f(beta) == f(1/beta)
float_type sim_beta(RNG &rng, const float_type at);

// -log density of a blow proposal h, made from `x` with reference `xp`
float_type blow_neg_log_density(const Row &h, const Row &x, const Row &xp, const Phi &phi);

// -log density of a hop proposal h, made from `x` with reference `xp`
float_type hop_neg_log_density(const Row &h, const Row &x, const Row &xp, const Phi &phi);

} // namespace TW

#endif // TWALK_KERNELS_H
