//==============================================================================
// common.cpp
// Utility functions: approximate equality, phase-space transposition and a
// small linear least-squares helper via LAPACK.
//==============================================================================

#include "common.hpp"

//------------------------------------------------------------------------------
// Return true if complex numbers are equal within absolute tolerance `tol`.
// Uses component-wise check on real/imag parts to avoid NaN issues.
//------------------------------------------------------------------------------
bool almost_equal(complex_t a, complex_t b, double tol)
{
    return std::abs(a.real() - b.real()) < tol && std::abs(a.imag() - b.imag()) < tol;
}

//------------------------------------------------------------------------------
// Return true if |a - b| < tol (absolute tolerance).
//------------------------------------------------------------------------------
bool almost_equal(double a, double b, double tol)
{
    return std::abs(a - b) < tol;
}

//------------------------------------------------------------------------------
// Transpose [rows][cols] → [cols][rows]. Used to switch between the
// velocity-line and spatial-line layouts of the distribution function.
//------------------------------------------------------------------------------
void transpose(const mat_complex& in, mat_complex& out)
{
    size_t rows = in.size();
    size_t cols = rows > 0 ? in[0].size() : 0;

    for (size_t i=0; i<rows; ++i)
    {
        if (in[i].size() != cols)
        {
            throw std::invalid_argument("transpose: ragged input array!");
        }
    }

    out.resize(cols);

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (size_t j=0; j<cols; ++j)
    {
        out[j].resize(rows);
        for (size_t i=0; i<rows; ++i)
        {
            out[j][i] = in[i][j];
        }
    }
}

//------------------------------------------------------------------------------
// Fit y ≈ a + b x over all samples via LAPACK least squares (dgels).
// Design matrix rows are [1, x_i] (row-major). Returns {a, b}.
//------------------------------------------------------------------------------
vec_real fit_linear_least_squares(const vec_real& x_vals, const vec_real& y_vals)
{
    if (x_vals.size() != y_vals.size() || x_vals.size() < 2)
    {
        throw std::invalid_argument("Linear fit needs at least two (x, y) pairs of equal count!");
    }

    const lapack_int m = static_cast<lapack_int>(x_vals.size());  // rows
    const lapack_int n = 2;                                          // cols
    const lapack_int nrhs = 1;
    const lapack_int lda = n;
    const lapack_int ldb = nrhs;

    vec_real A(2*x_vals.size());
    for (size_t i=0; i<x_vals.size(); ++i)
    {
        A[2*i]   = 1.0;
        A[2*i+1] = x_vals[i];
    }

    vec_real b = y_vals;        // LAPACK overwrites b with solution

    // Solve min ||A * coeffs - b||. On success, b[0..1] = {a,b}.
    lapack_int info = LAPACKE_dgels(LAPACK_ROW_MAJOR, 'N', m, n, nrhs, A.data(), lda, b.data(), ldb);
    if (info != 0)
    {
        throw std::runtime_error("LAPACKE_dgels failed with info = " + std::to_string(info));
    }

    return {b[0], b[1]};
}
