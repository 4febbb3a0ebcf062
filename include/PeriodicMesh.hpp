#pragma once
/**
 * @file PeriodicMesh.hpp
 * @brief Uniform 1D grid over a periodic interval [start, stop).
 *
 * @details
 * Used for both phase-space axes. The spatial axis is physically periodic;
 * the velocity axis is bounded but treated as periodic by the spectral
 * advection in v. The endpoint `stop` is identified with `start` and is
 * never part of `points`.
 */

#include "common.hpp"

/**
 * @struct PeriodicMesh
 * @brief Immutable description of one phase-space axis.
 *
 * @section fields Key Fields
 * - `start/stop` : Domain bounds (stop excluded).
 * - `length`     : Number of grid points N.
 * - `step`       : Grid spacing (stop − start)/N.
 * - `points`     : Samples start + i·step, i ∈ [0, N).
 */
struct PeriodicMesh
{
    const real_t start;
    const real_t stop;
    const size_t length;
    const real_t step;
    const vec_real points;

    /**
     * @brief Construct a mesh with `length` points on [start, stop).
     * @throws std::invalid_argument if length < 1 or stop <= start.
     */
    PeriodicMesh(real_t start, real_t stop, size_t length);

    /// Length of one period, stop − start.
    real_t period() const { return stop - start; }
};
