#include "kernels.hh"
#include "../utils/math_utils.hh"
#include <cmath>

namespace TideSim
{

SmoothingKernels::SmoothingKernels(float smoothing_radius)
    : radius(0.0f), poly6_scale(0.0f), spiky_pow2_scale(0.0f), spiky_pow3_scale(0.0f),
      spiky_pow2_derivative_scale(0.0f), spiky_pow3_derivative_scale(0.0f)
{
    setRadius(smoothing_radius);
}

void SmoothingKernels::setRadius(float smoothing_radius)
{
    using MathUtils::PI;

    radius = smoothing_radius;

    float h2 = radius * radius;
    float h4 = h2 * h2;
    float h5 = h4 * radius;
    float h8 = h4 * h4;

    // Each factor makes the kernel integrate to 1 over the disc of radius h
    poly6_scale = 4.0f / (PI * h8);
    spiky_pow3_scale = 10.0f / (PI * h5);
    spiky_pow2_scale = 6.0f / (PI * h4);
    spiky_pow3_derivative_scale = 30.0f / (PI * h5);
    spiky_pow2_derivative_scale = 12.0f / (PI * h4);
}

float SmoothingKernels::densityKernel(float dst) const
{
    if (dst >= radius)
        return 0.0f;

    float v = radius - dst;
    return v * v * spiky_pow2_scale;
}

float SmoothingKernels::nearDensityKernel(float dst) const
{
    if (dst >= radius)
        return 0.0f;

    float v = radius - dst;
    return v * v * v * spiky_pow3_scale;
}

float SmoothingKernels::densityDerivative(float dst) const
{
    if (dst >= radius)
        return 0.0f;

    float v = radius - dst;
    return -v * spiky_pow2_derivative_scale;
}

float SmoothingKernels::nearDensityDerivative(float dst) const
{
    if (dst >= radius)
        return 0.0f;

    float v = radius - dst;
    return -v * v * spiky_pow3_derivative_scale;
}

float SmoothingKernels::viscosityKernel(float dst) const
{
    if (dst >= radius)
        return 0.0f;

    float v = radius * radius - dst * dst;
    return v * v * v * poly6_scale;
}

} // namespace TideSim
