#ifndef TWALK_UTIL_H
#define TWALK_UTIL_H

#include <string>
#include <vector>

#include <TWalk/TypeDefs.h>
#include <TWalk/Trace.h>

namespace TW {

    std::string slurp(const std::string &filename);

    bool file_exists(const std::string &filename);

    float_type mean(const Col &data);

    float_type variance(const Col &data);

    float_type median(const Col &data);

    // q in [0, 1]; linear interpolation between order statistics
    float_type quantile(const Col &data, const float_type q);

    // lag-k autocorrelation, normalized by the lag-0 autocovariance
    Col autocorrelation(const Col &data, const size_t max_lag);

    // Integrated autocorrelation time, by Geyer's initial positive sequence:
    // sum pairs rho(2k) + rho(2k+1) while they stay positive.
    // ~1 for independent draws; infinite for a series that never moves.
    // @param max_lag if 0, use data.size() - 1
    float_type integrated_autocorrelation_time(const Col &data, size_t max_lag = 0);

    // Gelman-Rubin potential scale reduction factor for one scalar quantity
    // followed by several independent chains; chains are cut to the shortest.
    // @throws std::invalid_argument if fewer than 2 chains or 2 draws per chain
    float_type potential_scale_reduction(const std::vector<Col> &chains);

    // Posterior summary of a trace after burn-in.
    // @var n number of records summarized
    // @var mean, sd, median, lower, upper per coordinate; [lower, upper] is the
    //      central interval of probability `level`
    // @var iat integrated autocorrelation time of the energy series
    // @var map minimum-energy record of the *full* trace
    struct Summary {
        size_t n;
        float_type level;
        Row mean;
        Row sd;
        Row median;
        Row lower;
        Row upper;
        float_type iat;
        TraceRecord map;
    };

    Summary summarize(const Trace &trace, const float_type burn_in, const float_type level = 0.95);

}

#endif // TWALK_UTIL_H
