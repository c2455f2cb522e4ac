#pragma once
#include "../physics/collision.hh"
#include "../physics/forces.hh"
#include "../utils/config.hh"
#include "../utils/math_utils.hh"
#include "../utils/parallel.hh"
#include "particle.hh"
#include "particle_store.hh"
#include "spatial_hash.hh"
#include <functional>
#include <glm/glm.hpp>
#include <memory>
#include <vector>

namespace TideSim
{

/**
 * Result of sampling the density field at an arbitrary point
 */
struct DensitySample
{
    bool valid; // false until the first substep has built the spatial index
    float density;
    float near_density;

    DensitySample() : valid(false), density(0.0f), near_density(0.0f)
    {
    }
};

/**
 * Main fluid simulation class using 2D SPH (Smoothed Particle Hydrodynamics).
 *
 * update() splits each rendered frame into iterations_per_frame substeps. A substep
 * runs, separated by full barriers:
 *   external forces + prediction, boundary collision, spatial hash rebuild,
 *   reorder, density, pressure, viscosity, position update
 * and then notifies the step listeners.
 *
 * Numerical divergence is not detected: keep viscosity_strength * dt and the
 * pressure multipliers in a stable range.
 */
class FluidSimulator
{
  public:
    using StepListener = std::function<void()>;

  private:
    SimulationConfig config;
    ParallelExecutor executor;

    std::unique_ptr<ParticleStore> particle_store;
    std::unique_ptr<SpatialHashIndex> spatial_hash;
    CollisionHandler collision_handler;
    ForceSolver force_solver;

    // Interaction state, pushed to the stages once per substep
    InteractionInput grab_interaction;
    std::vector<InteractionInput> nudge_interactions;
    PlayerCoupling player_coupling;
    bool has_player;

    std::vector<StepListener> step_listeners;

    // Timing
    bool is_paused;
    float current_time;
    int frame_count;
    long long step_count;

    // Statistics
    MathUtils::Timer physics_timer;
    MathUtils::MovingAverage<float> step_time_average;
    RuntimeStats stats;

  public:
    // Throws ConfigurationError on invalid settings, empty spawn data, or a boundary
    // with fewer than 2 points while boundary collision is enabled
    FluidSimulator(const SimulationConfig &sim_config, const SpawnData &spawn,
                   const BoundaryPolygon &boundary = BoundaryPolygon());
    ~FluidSimulator() = default;

    FluidSimulator(const FluidSimulator &) = delete;
    FluidSimulator &operator=(const FluidSimulator &) = delete;

    // Simulation control
    void update(float delta_time);    // one rendered frame, skipped while paused
    void stepFrame(float delta_time); // one rendered frame, even while paused
    void step(float substep_dt);      // a single substep
    void reset();
    void pause();
    void resume();

    // Configuration, validated; throws ConfigurationError
    void setConfig(const SimulationConfig &sim_config);
    const SimulationConfig &getConfig() const
    {
        return config;
    }

    // Boundary replacement takes effect at the start of the next substep
    void setBoundary(const BoundaryPolygon &boundary);
    const BoundaryPolygon &getBoundary() const
    {
        return collision_handler.getBoundary();
    }

    // Interaction inputs
    void setGrabInteraction(glm::vec2 point, float strength);
    void setGrabInteraction(const InteractionInput &input);
    void clearGrabInteraction();
    void addNudgeInteraction(const InteractionInput &input);
    void clearNudgeInteractions();
    void setPlayerCoupling(const PlayerCoupling &player);
    void clearPlayerCoupling();

    // Called after every substep
    void addStepListener(StepListener listener);

    // Consumer queries
    size_t getParticleCount() const
    {
        return particle_store->size();
    }
    Particle getParticle(size_t index) const
    {
        return particle_store->getParticle(index);
    }
    std::vector<Particle> snapshot() const
    {
        return particle_store->snapshot();
    }
    const ParticleStore &getParticleStore() const
    {
        return *particle_store;
    }
    const SpatialHashIndex &getSpatialHash() const
    {
        return *spatial_hash;
    }
    bool hasStepped() const
    {
        return step_count > 0;
    }
    std::vector<size_t> queryParticlesInRadius(glm::vec2 point, float radius) const;
    DensitySample sampleDensity(glm::vec2 point) const;
    float averageDensity() const;

    // Simulation state
    bool isPaused() const
    {
        return is_paused;
    }
    float getCurrentTime() const
    {
        return current_time;
    }
    int getFrameCount() const
    {
        return frame_count;
    }
    long long getStepCount() const
    {
        return step_count;
    }
    const ParallelExecutor &getExecutor() const
    {
        return executor;
    }

    // Statistics
    float getAverageStepTime() const;
    const RuntimeStats &getStats() const
    {
        return stats;
    }

  private:
    void runFrame(float frame_time);
    InteractionInputs gatherInteractions() const;
    void printFrameStats(float frame_ms) const;
};

} // namespace TideSim
