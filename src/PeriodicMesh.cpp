//==============================================================================
// PeriodicMesh.cpp
// Construction and validation of the uniform periodic grids.
//==============================================================================

#include "PeriodicMesh.hpp"

namespace
{
//------------------------------------------------------------------------------
// Validate the bounds before any member depending on them is computed.
//------------------------------------------------------------------------------
size_t checkedLength(real_t start, real_t stop, size_t length)
{
    if (length < 1)
    {
        throw std::invalid_argument("PeriodicMesh needs at least one point!");
    }
    if (!(stop > start))
    {
        throw std::invalid_argument("PeriodicMesh needs stop > start, got ["
                                    + std::to_string(start) + ", " + std::to_string(stop) + ")!");
    }
    return length;
}

vec_real samplePoints(real_t start, real_t step, size_t length)
{
    vec_real points(length);
    for (size_t i=0; i<length; ++i)
    {
        points[i] = start + static_cast<real_t>(i)*step;
    }
    return points;
}
}

PeriodicMesh::PeriodicMesh(real_t start_, real_t stop_, size_t length_)
    : start(start_), stop(stop_), length(checkedLength(start_, stop_, length_)),
      step((stop_ - start_) / static_cast<real_t>(length_)),
      points(samplePoints(start_, (stop_ - start_) / static_cast<real_t>(length_), length_))
{
}
