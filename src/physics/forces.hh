#pragma once
#include "../utils/config.hh"
#include "../utils/parallel.hh"
#include "kernels.hh"
#include <glm/glm.hpp>
#include <vector>

namespace TideSim
{

// Forward declarations
class ParticleStore;
class SpatialHashIndex;

/**
 * A point force acting on fluid within radius. Positive strength pulls particles
 * toward the point, negative strength pushes them away.
 */
struct InteractionInput
{
    glm::vec2 point;
    float strength; // 0 disables the interactor
    float radius;
    glm::vec2 velocity;      // Velocity of the source, used by velocity transfer
    float velocity_transfer; // 0 = no drag along with the source

    InteractionInput() : point(0.0f), strength(0.0f), radius(0.0f), velocity(0.0f), velocity_transfer(0.0f)
    {
    }

    InteractionInput(glm::vec2 p, float s, float r, glm::vec2 v = glm::vec2(0.0f), float transfer = 0.0f)
        : point(p), strength(s), radius(r), velocity(v), velocity_transfer(transfer)
    {
    }

    bool isActive() const
    {
        return strength != 0.0f && radius > 0.0f;
    }
};

/**
 * All interactors for one substep. The grab interactor is the strong pointer-driven
 * mode; nudges only add their falloff force.
 */
struct InteractionInputs
{
    InteractionInput grab;
    std::vector<InteractionInput> nudges;
};

/**
 * State of an externally simulated player body coupled to the fluid
 */
struct PlayerCoupling
{
    glm::vec2 position;
    glm::vec2 velocity;
    bool mirrored;

    PlayerCoupling() : position(0.0f), velocity(0.0f), mirrored(false)
    {
    }

    PlayerCoupling(glm::vec2 pos, glm::vec2 vel, bool is_mirrored) : position(pos), velocity(vel), mirrored(is_mirrored)
    {
    }
};

/**
 * External force generators (gravity and interactors)
 */
class ExternalForces
{
  public:
    // Predicted positions look this far ahead regardless of the substep dt
    static constexpr float PREDICTION_LOOKAHEAD = 1.0f / 120.0f;

    // Acceleration on one particle from gravity and every active interactor
    static glm::vec2 calculateAcceleration(glm::vec2 position, glm::vec2 velocity, float gravity,
                                           const InteractionInputs &inputs);

    // Nudge interactor representing the player this substep
    static InteractionInput playerInteraction(const PlayerCoupling &player, const PlayerInteractionSettings &settings);

    // Stage 1: integrate external acceleration and predict positions
    static void applyExternalForces(ParticleStore &store, const SimulationParameters &params,
                                    const InteractionInputs &inputs, const ParallelExecutor &executor);
};

/**
 * SPH density, pressure and viscosity stages.
 *
 * Every stage reads the particle arrays left by the previous stage and writes only
 * its own particle's slot. Neighbours come from the spatial hash built on the
 * predicted positions, so the store must have been reordered with that index.
 */
class ForceSolver
{
  private:
    SimulationParameters params;
    SmoothingKernels kernels;

  public:
    ForceSolver();
    ~ForceSolver() = default;

    // Kernel factors are recomputed when the smoothing radius changes
    void setParameters(const SimulationParameters &parameters);
    const SimulationParameters &getParameters() const
    {
        return params;
    }
    const SmoothingKernels &getKernels() const
    {
        return kernels;
    }

    // Equation of state
    float pressureFromDensity(float density) const;
    float nearPressureFromDensity(float near_density) const;

    // (density, near density) at an arbitrary point, self term included
    glm::vec2 densityAt(glm::vec2 position, const std::vector<glm::vec2> &predicted_positions,
                        const SpatialHashIndex &index) const;

    // Pressure force on a particle from one neighbour, offset pointing at the neighbour.
    // Shared pressure is the pair average, divided by the neighbour's own density.
    glm::vec2 pairPressureForce(glm::vec2 offset, float dst, glm::vec2 own_density,
                                glm::vec2 neighbour_density) const;

    glm::vec2 pressureAcceleration(size_t index, const ParticleStore &store, const SpatialHashIndex &hash) const;
    glm::vec2 viscosityAcceleration(size_t index, const ParticleStore &store, const SpatialHashIndex &hash) const;

    // Stages
    void calculateDensities(ParticleStore &store, const SpatialHashIndex &hash, const ParallelExecutor &executor) const;
    void applyPressureForces(ParticleStore &store, const SpatialHashIndex &hash,
                             const ParallelExecutor &executor) const;
    void applyViscosity(ParticleStore &store, const SpatialHashIndex &hash, const ParallelExecutor &executor) const;
    void updatePositions(ParticleStore &store, const ParallelExecutor &executor) const;
};

} // namespace TideSim
