//==============================================================================
// SpectralAdvector.cpp
// Spectral (phase-shift) advection kernels for the split-step scheme.
//   • transportHalfStep: row-wise exact translation at a per-row speed.
//   • coupledAdvectAndUpdateField: x-translation at speed v, new density
//     read off the already transformed array, spectral field solve, and
//     superposition of the external field.
// Parallel notes:
//   • With USE_OPENMP, rows (and the density reduction over columns) are
//     split over threads; every loop joins before the next stage reads it.
//==============================================================================

#include "SpectralAdvector.hpp"

SpectralAdvector::SpectralAdvector(const PeriodicMesh& mesh_)
    : mesh(mesh_), fft(mesh_.length, mesh_.period()), k(fft.wavenumbers())
{
}

void SpectralAdvector::checkShape(const mat_complex& f, size_t rows, const char* where) const
{
    if (f.size() != rows)
    {
        throw std::invalid_argument(std::string(where) + ": expected " + std::to_string(rows)
                                    + " rows, got " + std::to_string(f.size()) + "!");
    }
    for (const auto& row : f)
    {
        if (row.size() != mesh.length)
        {
            throw std::invalid_argument(std::string(where) + ": row length does not match the mesh!");
        }
    }
}

//------------------------------------------------------------------------------
// transportHalfStep: FFT along the rows, phase shift by the row's drift,
// inverse FFT. Overwrites f.
//------------------------------------------------------------------------------
void SpectralAdvector::transportHalfStep(mat_complex& f, const vec_real& drift, real_t dt) const
{
    checkShape(f, drift.size(), "transportHalfStep");

    fft.forwardRows(f);

    const long nrows = static_cast<long>(f.size());
    const size_t N = mesh.length;

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (long r=0; r<nrows; ++r)
    {
        for (size_t j=0; j<N; ++j)
        {
            f[r][j] *= std::polar(1.0, -dt*k[j]*drift[r]);
        }
    }

    fft.backwardRows(f);
}

//------------------------------------------------------------------------------
// coupledAdvectAndUpdateField
// The forward transform used for the advection also yields the density
// coefficients of the advected distribution, so no second transform of f
// is needed for the field solve.
//------------------------------------------------------------------------------
void SpectralAdvector::coupledAdvectAndUpdateField(mat_complex& f, vec_real& e, const PeriodicMesh& vMesh,
                                                   real_t dt, const vec_complex& eExt) const
{
    const size_t Nx = mesh.length;
    const size_t Nv = vMesh.length;

    checkShape(f, Nv, "coupledAdvectAndUpdateField");
    if (e.size() != Nx || eExt.size() != Nx)
    {
        throw std::invalid_argument("coupledAdvectAndUpdateField: field length does not match the spatial mesh!");
    }

    const vec_real& v = vMesh.points;

    // Step 1: advection in spectral space
    fft.forwardRows(f);

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (long iv=0; iv<static_cast<long>(Nv); ++iv)
    {
        for (size_t j=0; j<Nx; ++j)
        {
            f[iv][j] *= std::polar(1.0, -dt*k[j]*v[iv]);
        }
    }

    // Step 2: density coefficients of the advected distribution
    vec_complex rho_hat(Nx, complex_t(0.0));

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (long j=0; j<static_cast<long>(Nx); ++j)
    {
        complex_t sum(0.0);
        for (size_t iv=0; iv<Nv; ++iv)
        {
            sum += f[iv][j];
        }
        rho_hat[j] = sum * vMesh.step;
    }

    // Step 3: spectral Gauss solve, zero mode forced to 0
    vec_complex e_hat(Nx);
    const complex_t minus_i(0.0, -1.0);
    for (size_t j=1; j<Nx; ++j)
    {
        e_hat[j] = minus_i * rho_hat[j] / k[j];
    }
    e_hat[0] = complex_t(0.0);

    // Step 4: back to physical space
    fft.backwardRows(f);

    mat_complex e_rows(1, e_hat);
    fft.backwardRows(e_rows);

    // Step 5: total field, residual imaginary parts dropped
    for (size_t i=0; i<Nx; ++i)
    {
        e[i] = e_rows[0][i].real() + eExt[i].real();
    }
}
