#ifndef TWALK_CHAINSTATE_H
#define TWALK_CHAINSTATE_H

#include <array>
#include <utility>

#include <TWalk/TypeDefs.h>

namespace TW {

// PRIMARY is reported in the trace; SECONDARY only helps to make proposals
enum WALKER { PRIMARY, SECONDARY };

inline WALKER other(const WALKER w) { return (w == PRIMARY) ? SECONDARY : PRIMARY; }

// a point and its cached energy
struct Walker {
    Row theta;
    float_type energy;
};

// The pair of walkers of one chain.
// Invariant (maintained by the sampler): both walkers are in the support, and
// each cached energy belongs to its current point.
class ChainState {
    public:
        ChainState(const Walker &x, const Walker &xp) : _walkers{ x, xp } {}

        const Walker & get(const WALKER w) const { return _walkers[w]; }
        const Walker & primary() const { return _walkers[PRIMARY]; }
        const Walker & secondary() const { return _walkers[SECONDARY]; }

        // replace one walker; the other is left untouched
        void update(const WALKER w, Row theta, const float_type energy) {
            _walkers[w].theta = std::move(theta);
            _walkers[w].energy = energy;
        }

    private:
        std::array<Walker, 2> _walkers;
};

} // namespace TW

#endif // TWALK_CHAINSTATE_H
