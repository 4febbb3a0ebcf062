#pragma once
/**
 * @file common.hpp
 * @brief Common type aliases, utility functions, and third-party includes
 *        for the Vlasov–Ampère solver.
 *
 * @details
 * This header centralizes:
 *  - Standard library and third-party includes.
 *  - Type aliases for reals, complex numbers, and vectors/matrices.
 *  - OpenMP header enabled via compile-time flag.
 *  - Shared numerical utility functions (approximate equality checks,
 *    phase-space transposition, a small least-squares fit).
 *
 * It is intended to be included across the project for consistent types
 * and helper functions.
 */

// ========== Standard Library ==========
#include <iostream>
#include <iomanip>
#include <cmath>
#include <complex>
#include <vector>
#include <algorithm>
#include <numeric>
#include <limits>
#include <stdexcept>
#include <functional>
#include <memory>
#include <string>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <cassert>

// ========== Third-Party Libraries ==========
#include <nlohmann/json.hpp> ///< JSON for Modern C++

// ========== LAPACK ==========
#include <lapacke.h>        ///< LAPACK C interface

// ========== FFTW ==========
#include <fftw3.h>          ///< FFTW3 for spectral transforms

// ========== Parallelism ==========
#ifdef USE_OPENMP
#include <omp.h>            ///< OpenMP parallelism
#endif

// ========== ENUM CLASSES ==========
/**
 * @enum Layout
 * @brief Storage layout of a phase-space array.
 *
 * - VelocityLines: f[ix][iv], one contiguous velocity line per spatial point.
 * - SpatialLines : f[iv][ix], one contiguous spatial line per velocity point.
 */
enum class Layout { VelocityLines, SpatialLines };

// ========== Aliases ===============
using real_t     = double;                     ///< Floating point type used globally.
using complex_t  = std::complex<real_t>;       ///< Complex number type.
using vec_real   = std::vector<real_t>;        ///< Vector of real values.
using vec_complex= std::vector<complex_t>;     ///< Vector of complex values.
using mat_real   = std::vector<std::vector<real_t>>;   ///< Matrix of real values.
using mat_complex= std::vector<std::vector<complex_t>>;///< Matrix of complex values.
using json       = nlohmann::json;             ///< JSON type alias.

// ============ Common Functions =======

/**
 * @brief Check approximate equality of two complex numbers.
 * @param a First number.
 * @param b Second number.
 * @param tol Absolute tolerance (default 1e-15).
 * @return true if both components differ by less than tol.
 */
bool almost_equal(complex_t a, complex_t b, double tol = 1e-15);

/**
 * @brief Check approximate equality of two real numbers.
 * @param a First number.
 * @param b Second number.
 * @param tol Absolute tolerance (default 1e-15).
 * @return true if |a-b| < tol.
 */
bool almost_equal(double a, double b, double tol = 1e-15);

/**
 * @brief Transpose a rectangular 2D complex array.
 * @param in  Input array of shape [rows][cols].
 * @param out Output array, resized to [cols][rows].
 *
 * @throws std::invalid_argument if the rows of `in` have unequal length.
 */
void transpose(const mat_complex& in, mat_complex& out);

/**
 * @brief Fit a straight line y ≈ a + bx in the least squares sense.
 *
 * @param x_vals Vector of x-samples.
 * @param y_vals Vector of y-samples (same length as x_vals).
 * @return Coefficients [a, b] minimizing the least squares error.
 *
 * @throws std::invalid_argument if input sizes mismatch or fewer than 2 points.
 * @throws std::runtime_error if LAPACK reports a failure.
 */
vec_real fit_linear_least_squares(const vec_real& x_vals, const vec_real& y_vals);
