#ifndef TWALK_TYPEDEFS_H
#define TWALK_TYPEDEFS_H

#include <concepts> // let's us declare concepts for template constraints
#include <Eigen/Core>

namespace TW {

typedef double float_type;

// a Row is about one point in parameter space (a ParameterVector)
// a Col is about one feature of many points (e.g. an energy series)
typedef Eigen::Matrix<float_type, 1, Eigen::Dynamic> Row;
typedef Eigen::Matrix<float_type, Eigen::Dynamic, 1> Col;
typedef Eigen::Matrix<float_type, Eigen::Dynamic, Eigen::Dynamic> Mat2D;

template <typename T>
concept NumericType = std::integral<T> or std::floating_point<T>;

}

#endif // TWALK_TYPEDEFS_H
