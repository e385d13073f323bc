#include <TWalk/Config.h>
#include <TWalk/TWalkUtil.h>

#include <algorithm>
#include <stdexcept>

using std::string;
using std::vector;

namespace TW {

Json::Value parse_json(const string & json_text) {
    Json::Value par;   // will contain the par value after parsing.
    Json::Reader reader;
    if ( !reader.parse( json_text, par ) ) {
        throw std::invalid_argument("Failed to parse configuration\n" + reader.getFormattedErrorMessages());
    }
    if (not par.isObject()) {
        throw std::invalid_argument("configuration must be a JSON object");
    }
    return par;
}

Json::Value prepare(const string & configfile) {
    if (not file_exists(configfile)) {
        throw std::invalid_argument("File does not exist: " + configfile);
    }
    return parse_json(slurp(configfile));
}

SamplerConfig parse_sampler(const Json::Value & par) {
    SamplerConfig cfg;

    if (par.isMember("kernel_weights")) {
        const Json::Value & kw = par["kernel_weights"];
        if (kw.isObject()) {
            const vector<string> names = { "walk", "traverse", "blow", "hop" };
            for (const string & key : kw.getMemberNames()) {
                if (std::find(names.begin(), names.end(), key) == names.end()) {
                    throw std::invalid_argument("unknown kernel in `kernel_weights`: " + key);
                }
            }
            for (size_t k = 0; k < NUM_KERNELS; ++k) {
                cfg.kernel_weights[k] = kw.get(names[k], 0.0).asDouble();
            }
        } else if (kw.isArray()) {
            const vector<float_type> w = as_vector<float_type>(kw);
            if (w.size() != NUM_KERNELS) {
                throw std::invalid_argument("`kernel_weights` array must have " + std::to_string(NUM_KERNELS) + " values");
            }
            std::copy(w.begin(), w.end(), cfg.kernel_weights.begin());
        } else {
            throw std::invalid_argument("`kernel_weights` must be an object or an array");
        }
    }

    cfg.kernel_pars.aw = par.get("aw", cfg.kernel_pars.aw).asDouble();
    cfg.kernel_pars.at = par.get("at", cfg.kernel_pars.at).asDouble();
    cfg.kernel_pars.n1phi = par.get("n1phi", cfg.kernel_pars.n1phi).asDouble();

    const string failure = par.get("model_failure", "REJECT").asString();
    if (failure == "REJECT") {
        cfg.model_failure = REJECT;
    } else if (failure == "ABORT") {
        cfg.model_failure = ABORT;
    } else {
        throw std::invalid_argument("`model_failure` must be REJECT or ABORT, got " + failure);
    }

    cfg.progress_interval = par.get("progress_interval", Json::UInt64(cfg.progress_interval)).asUInt64();

    validate(cfg);
    return cfg;
}

FNConfig parse_model(const Json::Value & mpar) {
    FNConfig cfg;
    if (mpar.isNull()) { return cfg; }
    if (not mpar.isObject()) { throw std::invalid_argument("`model` must be an object"); }

    cfg.numeric = mpar.get("numeric", cfg.numeric).asBool();
    cfg.theta_true = mpar.get("theta_true", cfg.theta_true).asDouble();
    cfg.sigma = mpar.get("sigma", cfg.sigma).asDouble();
    cfg.n_obs = mpar.get("n_obs", Json::UInt64(cfg.n_obs)).asUInt64();
    cfg.n_m = mpar.get("n_m", Json::UInt64(cfg.n_m)).asUInt64();
    cfg.alpha = mpar.get("alpha", cfg.alpha).asDouble();
    cfg.tau = mpar.get("tau", cfg.tau).asDouble();
    cfg.prior_alpha = mpar.get("prior_alpha", cfg.prior_alpha).asDouble();
    cfg.prior_beta = mpar.get("prior_beta", cfg.prior_beta).asDouble();
    cfg.data_seed = mpar.get("data_seed", Json::UInt64(cfg.data_seed)).asUInt64();

    cfg.validate();
    return cfg;
}

RunConfig parse_run(const Json::Value & par) {
    RunConfig cfg;
    try {
        cfg.sampler = parse_sampler(par);
        cfg.model = parse_model(par["model"]);

        if (par.isMember("seed")) { cfg.seed.emplace(par["seed"].asUInt64()); }

        cfg.iterations = par.get("iterations", Json::Int64(cfg.iterations)).asInt64();
        if (cfg.iterations < 0) {
            throw std::invalid_argument("`iterations` must be non-negative, got " + std::to_string(cfg.iterations));
        }

        cfg.chains = par.get("chains", Json::UInt64(cfg.chains)).asUInt64();
        if (cfg.chains < 1) { throw std::invalid_argument("`chains` must be at least 1"); }

        cfg.burn_in = par.get("burn_in", cfg.burn_in).asDouble();
        if (not ((0.0 <= cfg.burn_in) and (cfg.burn_in < 1.0))) {
            throw std::invalid_argument("`burn_in` must be in [0, 1), got " + std::to_string(cfg.burn_in));
        }

        cfg.output_file = par.get("output_file", cfg.output_file).asString();
        cfg.database_filename = par.get("database_filename", cfg.database_filename).asString();
    } catch (const Json::Exception & e) {
        // wrong JSON type for some member, e.g. a string where a number belongs
        throw std::invalid_argument(string("invalid configuration value: ") + e.what());
    }
    return cfg;
}

}
