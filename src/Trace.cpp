#include <TWalk/Trace.h>

#include <cmath>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <string>

using std::string;
using std::to_string;

namespace TW {

Trace::Trace(const size_t dim) : _dim(dim) {
    if (dim == 0) { throw std::invalid_argument("Trace: dimension must be positive"); }
}

void Trace::reserve(const size_t n) {
    _thetas.reserve(n * _dim);
    _energies.reserve(n);
}

void Trace::append(const Row &theta, const float_type energy) {
    if (static_cast<size_t>(theta.size()) != _dim) {
        throw std::invalid_argument(
            "Trace: appending a point of dimension " + to_string(theta.size()) + " to a trace of dimension " + to_string(_dim)
        );
    }
    _thetas.insert(_thetas.end(), theta.data(), theta.data() + _dim);
    _energies.push_back(energy);
}

TraceRecord Trace::at(const size_t i) const {
    if (i >= size()) throw std::out_of_range("Trace: record " + to_string(i) + " out of range");
    Row theta(_dim);
    for (size_t c = 0; c < _dim; ++c) { theta[c] = _thetas[i * _dim + c]; }
    return { theta, _energies[i] };
}

float_type Trace::energy_at(const size_t i) const {
    if (i >= size()) throw std::out_of_range("Trace: record " + to_string(i) + " out of range");
    return _energies[i];
}

TraceRecord Trace::map() const {
    if (empty()) throw std::out_of_range("Trace: MAP of an empty trace");
    size_t best = 0;
    for (size_t i = 1; i < size(); ++i) {
        if (_energies[i] < _energies[best]) { best = i; }
    }
    return at(best);
}

size_t Trace::burn_in_size(const float_type fraction) const {
    if (not ((0.0 <= fraction) and (fraction < 1.0))) {
        throw std::invalid_argument("Trace: burn-in fraction must be in [0, 1), got " + to_string(fraction));
    }
    return static_cast<size_t>(std::floor(fraction * size()));
}

Trace Trace::burn_in(const float_type fraction) const {
    const size_t first = burn_in_size(fraction);
    Trace trimmed(_dim);
    trimmed._thetas.assign(_thetas.begin() + first * _dim, _thetas.end());
    trimmed._energies.assign(_energies.begin() + first, _energies.end());
    return trimmed;
}

Mat2D Trace::samples(const size_t first) const {
    const size_t n = (first < size()) ? size() - first : 0;
    Mat2D res(n, _dim);
    for (size_t r = 0; r < n; ++r) {
        for (size_t c = 0; c < _dim; ++c) { res(r, c) = _thetas[(first + r) * _dim + c]; }
    }
    return res;
}

Col Trace::energies(const size_t first) const {
    const size_t n = (first < size()) ? size() - first : 0;
    Col res(n);
    for (size_t r = 0; r < n; ++r) { res[r] = _energies[first + r]; }
    return res;
}

Col Trace::coordinate(const size_t c, const size_t first) const {
    if (c >= _dim) throw std::out_of_range("Trace: coordinate " + to_string(c) + " out of range");
    const size_t n = (first < size()) ? size() - first : 0;
    Col res(n);
    for (size_t r = 0; r < n; ++r) { res[r] = _thetas[(first + r) * _dim + c]; }
    return res;
}

void Trace::write_text(std::ostream &os) const {
    const auto prec = os.precision(std::numeric_limits<float_type>::max_digits10);
    for (size_t r = 0; r < size(); ++r) {
        for (size_t c = 0; c < _dim; ++c) { os << _thetas[r * _dim + c] << " "; }
        os << _energies[r] << "\n";
    }
    os.precision(prec);
}

} // namespace TW
