#ifndef TWALK_TRACE_H
#define TWALK_TRACE_H

#include <iostream>
#include <vector>

#include <TWalk/TypeDefs.h>

namespace TW {

struct TraceRecord {
    Row theta;
    float_type energy;
};

// The output of a chain: an append-only sequence of (theta, energy) records
// of the primary walker, one per iteration plus the initial state.
//
// Records are never modified once appended. Summaries (burn-in, MAP, etc)
// work on copies or views; the full trace is always kept.
class Trace {
    public:
        Trace(const size_t dim);

        size_t dim() const { return _dim; }
        size_t size() const { return _energies.size(); }
        bool empty() const { return _energies.empty(); }

        void reserve(const size_t n);

        // @throws std::invalid_argument if theta has the wrong dimension
        void append(const Row &theta, const float_type energy);

        // @throws std::out_of_range
        TraceRecord at(const size_t i) const;
        float_type energy_at(const size_t i) const;

        // the record with the smallest energy (first one, on ties)
        // @throws std::out_of_range if the trace is empty
        TraceRecord map() const;

        // number of leading records dropped by a burn-in fraction
        // @throws std::invalid_argument unless 0 <= fraction < 1
        size_t burn_in_size(const float_type fraction) const;

        // a copy of the trace without its first `fraction` of records
        Trace burn_in(const float_type fraction) const;

        // rows = records from `first` on; cols = coordinates
        Mat2D samples(const size_t first = 0) const;
        Col energies(const size_t first = 0) const;
        Col coordinate(const size_t c, const size_t first = 0) const;

        // one line per record: coordinates, then energy
        void write_text(std::ostream &os) const;

    private:
        size_t _dim;
        std::vector<float_type> _thetas; // row major, _dim per record
        std::vector<float_type> _energies;
};

} // namespace TW

#endif // TWALK_TRACE_H
