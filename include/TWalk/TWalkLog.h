#ifndef TWALK_LOG_H
#define TWALK_LOG_H

#include <iostream>
#include <string>
#include <vector>

#include <TWalk/FitzhughNagumo.h>
#include <TWalk/TWalk.h>
#include <TWalk/TWalkUtil.h>

namespace TW {

struct TWalkLog {

    // one row per kernel: proposed, accepted, acceptance rate and rejections
    static void kernel_table(
        const KernelStatsArray & stats,
        std::ostream & os = std::cerr
    );

    // mean, sd, median and central interval per coordinate, plus the MAP
    static void summary_report(
        const Summary & s,
        const std::vector<std::string> & names,
        std::ostream & os = std::cerr
    );

    // per coordinate potential scale reduction across chains, after burn-in
    static void convergence_report(
        const std::vector<ChainResult> & chains,
        const float_type burn_in,
        const std::vector<std::string> & names,
        std::ostream & os = std::cerr
    );

    // the forward map error against its bound
    static void error_bound_report(
        const float_type max_error,
        const float_type bound,
        std::ostream & os = std::cerr
    );

    // compares the numerical forward map with the exact one at theta_true.
    // @return false when the numerical map diverges and the run would use it;
    //         with the exact map selected a divergence is only a warning
    static bool error_bound_check(
        const FNConfig & fn,
        std::ostream & os = std::cerr
    );

    inline static const int WIDTH = 12;
    inline static const std::string double_bar = "=========================================================================================";

    private:
        TWalkLog() {};

        static void _print_table_header(
            const std::vector<std::string> & names,
            const std::string & row_label,
            std::ostream & os
        );
};

}

#endif // TWALK_LOG_H
