#pragma once

namespace TideSim
{

/**
 * 2D SPH smoothing kernels for a fixed smoothing radius h.
 * Every kernel is zero for dst >= h. Normalization factors depend only on h and are
 * recomputed by setRadius().
 *
 *   density       spiky (h - r)^2
 *   near density  spiky (h - r)^3, steeper, keeps particles from clumping
 *   viscosity     poly6 (h^2 - r^2)^3
 */
class SmoothingKernels
{
  private:
    float radius;
    float poly6_scale;
    float spiky_pow2_scale;
    float spiky_pow3_scale;
    float spiky_pow2_derivative_scale;
    float spiky_pow3_derivative_scale;

  public:
    explicit SmoothingKernels(float smoothing_radius = 1.0f);

    void setRadius(float smoothing_radius);
    float getRadius() const
    {
        return radius;
    }

    float densityKernel(float dst) const;
    float nearDensityKernel(float dst) const;
    float densityDerivative(float dst) const;
    float nearDensityDerivative(float dst) const;
    float viscosityKernel(float dst) const;

    // Density normalization factor, exposed for diagnostics
    float getSpikyPow2Scale() const
    {
        return spiky_pow2_scale;
    }
};

} // namespace TideSim
