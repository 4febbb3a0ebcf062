#pragma once
/**
 * @file SpectralTransformer.hpp
 * @brief Thin wrapper around FFTW to perform Fourier transforms and spectral operations.
 *
 * @details
 * Provides Fourier transforms (real/complex, forward/backward) on a periodic
 * 1D grid and the utilities needed by the Vlasov–Ampère solver:
 * - Batched in-place transforms of every row of a 2D array.
 * - The discrete angular wavenumbers in FFT output order.
 * - Differentiate in spectral space.
 *
 * Conventions: forward uses e^{-i k x} and is scaled by 1/N, backward is
 * unscaled, so backward(forward(u)) = u.
 *
 * This class owns FFTW plans and work arrays. RAII ensures cleanup.
 */

#include "common.hpp"

/**
 * @class SpectralTransformer
 * @brief Encapsulates Fourier-based spectral operations.
 *
 * @section usage Usage
 * Construct with number of points and period, then call forwardFFT/backwardFFT
 * to convert between physical space and frequency space. Use forwardRows/
 * backwardRows to transform all lines of a phase-space array along this axis.
 */
class SpectralTransformer
{
  private:
    size_t N;               ///< Number of real-space grid points.
    real_t period;          ///< Period of the domain.
    real_t k0;              ///< Fundamental wavenumber (2π/period).
    vec_real k;             ///< Angular wavenumbers in FFT output order.
    fftw_plan forward_plan {nullptr};   ///< FFTW plan: forward, out-of-place on work arrays.
    fftw_plan backward_plan {nullptr};  ///< FFTW plan: backward, out-of-place on work arrays.
    fftw_plan row_forward_plan {nullptr};  ///< FFTW plan: forward, in-place, unaligned rows.
    fftw_plan row_backward_plan {nullptr}; ///< FFTW plan: backward, in-place, unaligned rows.
    fftw_complex *forward_data {nullptr}, *backward_data {nullptr}; ///< Work arrays.

    /// Throw if a row does not hold N samples.
    void checkSize(size_t size, const char* where) const;

  public:
    /**
     * @brief Construct transformer for N points with given period.
     * @param N      Number of real-space samples.
     * @param period Period of the signal.
     */
    explicit SpectralTransformer(size_t N, real_t period);

    /// Destructor: destroys FFTW plans and frees memory.
    ~SpectralTransformer();

    SpectralTransformer(const SpectralTransformer&) = delete;
    SpectralTransformer& operator=(const SpectralTransformer&) = delete;

    /// Number of grid points.
    size_t size() const { return N; }

    /**
     * @brief Angular wavenumbers 2π/period · {0, 1, …, ⌈N/2⌉−1, −⌊N/2⌋, …, −1}.
     */
    const vec_real& wavenumbers() const { return k; }

    /// Forward FFT (real → complex).
    void forwardFFT(const vec_real& in, vec_complex& out);

    /// Backward FFT (complex → real part).
    void backwardFFT(const vec_complex& in, vec_real& out);

    /// Forward FFT (complex → complex).
    void forwardFFT(const vec_complex& in, vec_complex& out);

    /// Backward FFT (complex → complex).
    void backwardFFT(const vec_complex& in, vec_complex& out);

    /**
     * @brief Forward transform every row of `rows` in place.
     * @param rows 2D array, each row holding N samples along this axis.
     *
     * @details
     * Rows are independent; with USE_OPENMP they are distributed over threads
     * and joined before returning.
     */
    void forwardRows(mat_complex& rows) const;

    /// Backward transform every row of `rows` in place.
    void backwardRows(mat_complex& rows) const;

    /**
     * @brief Differentiate a Fourier series.
     * @param in  Input Fourier coefficients.
     * @param out Output differentiated Fourier coefficients (Nyquist zeroed).
     */
    void differentiate(const vec_complex& in, vec_complex& out) const;
};
