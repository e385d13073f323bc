#ifndef TWALK_CONFIG_H
#define TWALK_CONFIG_H

#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include <TWalk/TypeDefs.h>
#include <TWalk/TWalk.h>
#include <TWalk/FitzhughNagumo.h>

namespace TW {

// a scalar or an array of scalars, as a vector
template <NumericType T>
std::vector<T> as_vector(const Json::Value & val) {
    std::vector<T> extracted_vals;
    if (val.isArray()) { for (const Json::Value & jv : val) {
        extracted_vals.push_back( jv.as<T>() ); // NB, jsoncpp handles cast failures
    } } else {
        extracted_vals.push_back( val.as<T>() );
    }
    return extracted_vals;
}

// Everything a calibration run needs, as read from a JSON configuration file.
// Any member left out of the file keeps the default below.
//
// @var seed if unset, the driver picks one and reports it
// @var iterations number of t-walk iterations per chain
// @var chains number of independent chains
// @var burn_in fraction of each trace dropped before summaries
// @var output_file if non-empty, write the trace as text here
// @var database_filename if non-empty, store traces and kernel statistics here
struct RunConfig {
    SamplerConfig sampler;
    std::optional<unsigned long int> seed;
    long int iterations = 100000;
    size_t chains = 1;
    float_type burn_in = 0.1;
    std::string output_file = "";
    std::string database_filename = "";
    FNConfig model;
};

// read and parse a configuration file
// @throws std::invalid_argument if the file is missing or not valid JSON
Json::Value prepare(const std::string & configfile);

// @throws std::invalid_argument if the text is not valid JSON
Json::Value parse_json(const std::string & json_text);

// kernel weights, tuning constants and failure policy from the top level
// of the configuration; `kernel_weights` may be an object keyed by kernel
// name (missing kernels get weight 0) or an array in walk, traverse, blow,
// hop order
SamplerConfig parse_sampler(const Json::Value & par);

// the `model` object of the configuration
FNConfig parse_model(const Json::Value & mpar);

// the whole configuration, validated
// @throws std::invalid_argument on any invalid value
RunConfig parse_run(const Json::Value & par);

}

#endif // TWALK_CONFIG_H
