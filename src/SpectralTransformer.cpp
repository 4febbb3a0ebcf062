//==============================================================================
// SpectralTransformer.cpp
// Thin wrapper around FFTW for periodic spectral transforms and utilities.
// Features:
//   • Forward/backward FFTs for real/complex data (FFTW complex-to-complex).
//   • Batched in-place row transforms for 2D phase-space arrays.
//   • Angular wavenumbers 2π/period in FFT output order.
//   • Spectral differentiation (Nyquist-safe).
// Notes:
//   • Row plans are created with FFTW_UNALIGNED so they can be executed on
//     std::vector storage through fftw_execute_dft, which is thread safe.
//==============================================================================

#include "SpectralTransformer.hpp"

//------------------------------------------------------------------------------
// Ctor: allocate FFTW work buffers, build forward/backward plans and the
// wavenumber vector.
//------------------------------------------------------------------------------
SpectralTransformer::SpectralTransformer(size_t N_, real_t period_)
    : N(N_), period(period_), k0(2.0*M_PI / period_), k(N_)
{
    if (N_ < 1 || !(period_ > 0.0))
    {
        throw std::invalid_argument("SpectralTransformer needs N >= 1 and a positive period!");
    }

    forward_data = fftw_alloc_complex(N_);
    backward_data = fftw_alloc_complex(N_);

    const int n = static_cast<int>(N_);

    #ifdef USE_OPENMP
    // Guard FFTW planner (not thread-safe) with a critical section
    #pragma omp critical(fftw_planner)
    #endif
    {
        forward_plan      = fftw_plan_dft_1d(n, forward_data, backward_data, FFTW_FORWARD,  FFTW_ESTIMATE);
        backward_plan     = fftw_plan_dft_1d(n, backward_data, forward_data, FFTW_BACKWARD, FFTW_ESTIMATE);
        row_forward_plan  = fftw_plan_dft_1d(n, forward_data, forward_data, FFTW_FORWARD,  FFTW_ESTIMATE | FFTW_UNALIGNED);
        row_backward_plan = fftw_plan_dft_1d(n, forward_data, forward_data, FFTW_BACKWARD, FFTW_ESTIMATE | FFTW_UNALIGNED);
    }

    // m = j for j < ceil(N/2), m = j - N otherwise (numpy fftfreq order)
    for (size_t j=0; j<N_; ++j)
    {
        int m = (j < (N_+1)/2) ? static_cast<int>(j) : static_cast<int>(j) - n;
        k[j] = m*k0;
    }
}

//------------------------------------------------------------------------------
// Dtor: free plans and work arrays.
//------------------------------------------------------------------------------
SpectralTransformer::~SpectralTransformer()
{
    fftw_destroy_plan(forward_plan);
    fftw_destroy_plan(backward_plan);
    fftw_destroy_plan(row_forward_plan);
    fftw_destroy_plan(row_backward_plan);
    fftw_free(forward_data);
    fftw_free(backward_data);
}

void SpectralTransformer::checkSize(size_t size, const char* where) const
{
    if (size != N)
    {
        throw std::invalid_argument(std::string(where) + ": expected " + std::to_string(N)
                                    + " samples, got " + std::to_string(size) + "!");
    }
}

//------------------------------------------------------------------------------
// forwardFFT (real → complex): pack real input into complex buffer, execute,
// and scale by 1/N.
//------------------------------------------------------------------------------
void SpectralTransformer::forwardFFT(const vec_real& in, vec_complex& out)
{
    checkSize(in.size(), "forwardFFT");

    for (size_t i=0; i<N; ++i)
    {
        forward_data[i][0] = in[i];
        forward_data[i][1] = 0.0;
    }

    fftw_execute(forward_plan);

    out.resize(N);
    for (size_t i=0; i<N; ++i)
    {
        out[i] = complex_t(backward_data[i][0], backward_data[i][1]) / static_cast<real_t>(N);
    }
}

//------------------------------------------------------------------------------
// backwardFFT (complex → real): inverse transform and extract real part.
//------------------------------------------------------------------------------
void SpectralTransformer::backwardFFT(const vec_complex& in, vec_real& out)
{
    checkSize(in.size(), "backwardFFT");

    for (size_t i=0; i<N; ++i)
    {
        backward_data[i][0] = in[i].real();
        backward_data[i][1] = in[i].imag();
    }

    fftw_execute(backward_plan);

    out.resize(N);
    for (size_t i=0; i<N; ++i)
    {
        out[i] = forward_data[i][0];
    }
}

//------------------------------------------------------------------------------
// forwardFFT (complex → complex): complex-to-complex forward with 1/N scaling.
//------------------------------------------------------------------------------
void SpectralTransformer::forwardFFT(const vec_complex& in, vec_complex& out)
{
    checkSize(in.size(), "forwardFFT");

    for (size_t i=0; i<N; ++i)
    {
        forward_data[i][0] = in[i].real();
        forward_data[i][1] = in[i].imag();
    }

    fftw_execute(forward_plan);

    out.resize(N);
    for (size_t i=0; i<N; ++i)
    {
        out[i] = complex_t(backward_data[i][0], backward_data[i][1]) / static_cast<real_t>(N);
    }
}

//------------------------------------------------------------------------------
// backwardFFT (complex → complex): inverse complex transform.
//------------------------------------------------------------------------------
void SpectralTransformer::backwardFFT(const vec_complex& in, vec_complex& out)
{
    checkSize(in.size(), "backwardFFT");

    for (size_t i=0; i<N; ++i)
    {
        backward_data[i][0] = in[i].real();
        backward_data[i][1] = in[i].imag();
    }

    fftw_execute(backward_plan);

    out.resize(N);
    for (size_t i=0; i<N; ++i)
    {
        out[i] = complex_t(forward_data[i][0], forward_data[i][1]);
    }
}

//------------------------------------------------------------------------------
// forwardRows: in-place forward transform of each row, scaled by 1/N.
// std::complex<double> is layout-compatible with fftw_complex (double[2]),
// as guaranteed by C++11 [complex.numbers] and the FFTW manual section
// "Complex numbers", so vector storage is passed to FFTW directly.
//------------------------------------------------------------------------------
void SpectralTransformer::forwardRows(mat_complex& rows) const
{
    for (const auto& row : rows) checkSize(row.size(), "forwardRows");

    const real_t scale = 1.0 / static_cast<real_t>(N);
    const long nrows = static_cast<long>(rows.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (long r=0; r<nrows; ++r)
    {
        fftw_complex* data = reinterpret_cast<fftw_complex*>(rows[r].data());
        fftw_execute_dft(row_forward_plan, data, data);
        for (auto& c : rows[r]) c *= scale;
    }
}

//------------------------------------------------------------------------------
// backwardRows: in-place inverse transform of each row (unscaled).
//------------------------------------------------------------------------------
void SpectralTransformer::backwardRows(mat_complex& rows) const
{
    for (const auto& row : rows) checkSize(row.size(), "backwardRows");

    const long nrows = static_cast<long>(rows.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (long r=0; r<nrows; ++r)
    {
        fftw_complex* data = reinterpret_cast<fftw_complex*>(rows[r].data());
        fftw_execute_dft(row_backward_plan, data, data);
    }
}

//------------------------------------------------------------------------------
// differentiate: spectral derivative, multiplies by i k. For even N the
// Nyquist mode (k=N/2) has no consistent derivative and is set to 0.
//------------------------------------------------------------------------------
void SpectralTransformer::differentiate(const vec_complex& in, vec_complex& out) const
{
    checkSize(in.size(), "differentiate");

    out.resize(N);
    for (size_t j=0; j<N; ++j)
    {
        if (N%2 == 0 && j == N/2)
        {
            out[j] = complex_t(0.0);
        }
        else
        {
            out[j] = complex_t(0.0, k[j]) * in[j];
        }
    }
}
