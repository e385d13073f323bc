#include <TWalk/TWalkLog.h>

#include <iomanip>
#include <sstream>

using std::endl;
using std::setw;
using std::string;
using std::vector;

namespace TW {

void TWalkLog::_print_table_header(
    const vector<string> & names,
    const string & row_label,
    std::ostream & os
) {
    os << setw(WIDTH) << row_label;
    for (const string & name : names) { os << setw(WIDTH) << name; }
    os << endl;
}

void TWalkLog::kernel_table(
    const KernelStatsArray & stats,
    std::ostream & os
) {
    os << double_bar << endl << "Kernel statistics:" << endl;
    _print_table_header({ "proposed", "accepted", "rate", "support", "degenerate", "failed" }, "kernel", os);

    KernelStats total;
    for (size_t k = 0; k < NUM_KERNELS; ++k) {
        const KernelStats & ks = stats[k];
        std::ostringstream name;
        name << static_cast<KERNEL>(k);
        os << setw(WIDTH) << name.str()
           << setw(WIDTH) << ks.proposed << setw(WIDTH) << ks.accepted << setw(WIDTH) << ks.acceptance_rate()
           << setw(WIDTH) << ks.out_of_support << setw(WIDTH) << ks.degenerate << setw(WIDTH) << ks.model_failures << endl;
        total.proposed += ks.proposed;
        total.accepted += ks.accepted;
        total.out_of_support += ks.out_of_support;
        total.degenerate += ks.degenerate;
        total.model_failures += ks.model_failures;
    }
    os << setw(WIDTH) << "ALL"
       << setw(WIDTH) << total.proposed << setw(WIDTH) << total.accepted << setw(WIDTH) << total.acceptance_rate()
       << setw(WIDTH) << total.out_of_support << setw(WIDTH) << total.degenerate << setw(WIDTH) << total.model_failures << endl;
}

void TWalkLog::summary_report(
    const Summary & s,
    const vector<string> & names,
    std::ostream & os
) {
    os << double_bar << endl
       << "Posterior summary (" << s.n << " records after burn-in, "
       << 100 * s.level << "% central interval):" << endl;
    _print_table_header(names, "", os);
    os << setw(WIDTH) << "mean";   for (auto v : s.mean)   { os << setw(WIDTH) << v; } os << endl;
    os << setw(WIDTH) << "sd";     for (auto v : s.sd)     { os << setw(WIDTH) << v; } os << endl;
    os << setw(WIDTH) << "median"; for (auto v : s.median) { os << setw(WIDTH) << v; } os << endl;
    os << setw(WIDTH) << "lower";  for (auto v : s.lower)  { os << setw(WIDTH) << v; } os << endl;
    os << setw(WIDTH) << "upper";  for (auto v : s.upper)  { os << setw(WIDTH) << v; } os << endl;
    os << setw(WIDTH) << "MAP";    for (auto v : s.map.theta) { os << setw(WIDTH) << v; } os << endl;
    os << "MAP energy: " << s.map.energy << endl;
    os << "Integrated autocorrelation time (energy): " << s.iat << endl;
}

void TWalkLog::convergence_report(
    const vector<ChainResult> & chains,
    const float_type burn_in,
    const vector<string> & names,
    std::ostream & os
) {
    os << double_bar << endl << "Convergence across " << chains.size() << " chains:" << endl;
    if (chains.size() < 2) {
        os << "  needs at least 2 chains" << endl;
        return;
    }
    _print_table_header(names, "", os);
    os << setw(WIDTH) << "R-hat";
    const size_t d = chains.front().trace.dim();
    for (size_t c = 0; c < d; ++c) {
        vector<Col> series;
        for (const ChainResult & cr : chains) {
            series.push_back(cr.trace.coordinate(c, cr.trace.burn_in_size(burn_in)));
        }
        os << setw(WIDTH) << potential_scale_reduction(series);
    }
    os << endl;
    os << setw(WIDTH) << "seed";
    for (const ChainResult & cr : chains) { os << setw(WIDTH) << cr.seed; }
    os << endl;
}

void TWalkLog::error_bound_report(
    const float_type max_error,
    const float_type bound,
    std::ostream & os
) {
    os << "Forward map error at the true parameter: " << max_error << " (bound " << bound << ")" << endl;
    if (max_error > bound) {
        os << "WARNING: numerical forward map error exceeds the bound; the numerical posterior may differ from the exact one." << endl;
    }
}

bool TWalkLog::error_bound_check(
    const FNConfig & fn,
    std::ostream & os
) {
    const FNExactMap exact(fn);
    const FNNumericMap numeric(fn);
    try {
        error_bound_report(max_abs_difference(numeric, exact, fn.theta_true), fn.error_bound(), os);
    } catch (const ForwardMapError &e) {
        if (fn.numeric) {
            os << "ERROR: " << e.what() << endl;
            return false;
        }
        os << "WARNING: numerical forward map failed (" << e.what() << "); sampling uses the exact map." << endl;
    }
    return true;
}

}
