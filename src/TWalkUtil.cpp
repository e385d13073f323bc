#include <TWalk/TWalkUtil.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <gsl/gsl_statistics_double.h>

using std::string;
using std::vector;
using std::ifstream;
using std::stringstream;

namespace TW {

    string slurp(const string &filename) {
        ifstream ifs(filename.c_str());
        stringstream sstr;
        sstr << ifs.rdbuf();
        return sstr.str();
    }

    bool file_exists(const string &filename) {
        ifstream infile(filename.c_str());
        return infile.good();
    }

    float_type mean(const Col &data) {
        if (data.size() == 0) throw std::invalid_argument("mean of empty data");
        return gsl_stats_mean(data.data(), 1, data.size());
    }

    float_type variance(const Col &data) {
        if (data.size() < 2) throw std::invalid_argument("variance needs at least 2 values");
        return gsl_stats_variance(data.data(), 1, data.size());
    }

    float_type median(const Col &data) {
        return quantile(data, 0.5);
    }

    float_type quantile(const Col &data, const float_type q) {
        if (data.size() == 0) throw std::invalid_argument("quantile of empty data");
        if (not ((0.0 <= q) and (q <= 1.0))) throw std::invalid_argument("quantile must be in [0, 1]");
        // copy & sort data
        vector<float_type> vdata(data.data(), data.data() + data.size());
        std::sort(vdata.begin(), vdata.end());
        return gsl_stats_quantile_from_sorted_data(vdata.data(), 1, vdata.size(), q);
    }

    Col autocorrelation(const Col &data, const size_t max_lag) {
        const size_t n = data.size();
        if (n < 2) throw std::invalid_argument("autocorrelation needs at least 2 values");
        const size_t lags = std::min(max_lag, n - 1);
        const Col centered = data.array() - data.mean();
        const float_type c0 = centered.squaredNorm() / n;
        Col rho = Col::Zero(lags + 1);
        if (c0 == 0.0) {
            rho.setConstant(std::numeric_limits<float_type>::quiet_NaN());
            return rho;
        }
        for (size_t k = 0; k <= lags; ++k) {
            rho[k] = centered.head(n - k).dot(centered.tail(n - k)) / n / c0;
        }
        return rho;
    }

    float_type integrated_autocorrelation_time(const Col &data, size_t max_lag) {
        const size_t n = data.size();
        if (n < 2) throw std::invalid_argument("autocorrelation time needs at least 2 values");
        if (max_lag == 0 or max_lag > n - 1) { max_lag = n - 1; }

        const Col centered = data.array() - data.mean();
        const float_type c0 = centered.squaredNorm() / n;
        if (c0 == 0.0) { return std::numeric_limits<float_type>::infinity(); }

        auto rho = [&](const size_t k) { return centered.head(n - k).dot(centered.tail(n - k)) / n / c0; };

        float_type sum = 0.0;
        for (size_t k = 0; 2 * k + 1 <= max_lag; ++k) {
            const float_type gamma = rho(2 * k) + rho(2 * k + 1);
            if (gamma <= 0.0) break;
            sum += gamma;
        }
        return -1.0 + 2.0 * sum;
    }

    float_type potential_scale_reduction(const vector<Col> &chains) {
        if (chains.size() < 2) throw std::invalid_argument("potential scale reduction needs at least 2 chains");
        size_t n = std::numeric_limits<size_t>::max();
        for (const Col &c : chains) { n = std::min(n, static_cast<size_t>(c.size())); }
        if (n < 2) throw std::invalid_argument("potential scale reduction needs at least 2 draws per chain");

        const size_t m = chains.size();
        Col means(m), vars(m);
        for (size_t j = 0; j < m; ++j) {
            const Col c = chains[j].head(n);
            means[j] = mean(c);
            vars[j] = variance(c);
        }
        const float_type W = vars.mean();
        const float_type B = n * variance(means);
        if (W == 0.0) { return std::numeric_limits<float_type>::quiet_NaN(); }
        const float_type var_hat = (n - 1.0) / n * W + B / n;
        return std::sqrt(var_hat / W);
    }

    Summary summarize(const Trace &trace, const float_type burn_in, const float_type level) {
        if (not ((0.0 < level) and (level < 1.0))) throw std::invalid_argument("summary level must be in (0, 1)");
        const size_t first = trace.burn_in_size(burn_in);
        const size_t d = trace.dim();

        Summary s;
        s.n = trace.size() - first;
        s.level = level;
        s.map = trace.map();
        s.mean = Row::Zero(d);
        s.sd = Row::Zero(d);
        s.median = Row::Zero(d);
        s.lower = Row::Zero(d);
        s.upper = Row::Zero(d);
        s.iat = std::numeric_limits<float_type>::quiet_NaN();

        if (s.n == 0) { return s; }

        const float_type tail = (1.0 - level) / 2.0;
        for (size_t c = 0; c < d; ++c) {
            const Col values = trace.coordinate(c, first);
            s.mean[c] = mean(values);
            s.sd[c] = (s.n > 1) ? std::sqrt(variance(values)) : 0.0;
            s.median[c] = median(values);
            s.lower[c] = quantile(values, tail);
            s.upper[c] = quantile(values, 1.0 - tail);
        }
        if (s.n > 1) { s.iat = integrated_autocorrelation_time(trace.energies(first)); }
        return s;
    }

}
