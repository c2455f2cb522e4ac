#pragma once
#include "../utils/parallel.hh"
#include "particle.hh"
#include <cstdint>
#include <glm/glm.hpp>
#include <vector>

namespace TideSim
{

/**
 * Structure-of-arrays particle storage.
 *
 * Allocated once from spawn data and never resized. Every substep the spatial hash
 * permutation is applied through reorder(), so slot i always holds the particle that
 * sits at position i of the sorted cell order. Particle identity therefore moves with
 * the data, not with the index.
 *
 * Positions, predicted positions and velocities each have a scratch twin: reorder
 * gathers into the twins and swaps, and the viscosity stage writes its result into
 * the velocity twin while the other workers still read the current velocities.
 */
class ParticleStore
{
  private:
    SpawnData spawn_data;

    std::vector<glm::vec2> positions;
    std::vector<glm::vec2> predicted_positions;
    std::vector<glm::vec2> velocities;
    std::vector<glm::vec2> densities; // (density, near density)

    std::vector<glm::vec2> sort_target_positions;
    std::vector<glm::vec2> sort_target_predicted_positions;
    std::vector<glm::vec2> sort_target_velocities;

  public:
    // Throws ConfigurationError for empty or inconsistent spawn data
    explicit ParticleStore(const SpawnData &spawn);

    size_t size() const
    {
        return positions.size();
    }

    // Restore the spawn state
    void reset();

    // Slot i receives the particle previously stored at permutation[i]
    void reorder(const std::vector<std::uint32_t> &permutation, const ParallelExecutor &executor);

    // Publish the velocity scratch buffer as the live velocities
    void swapVelocityBuffers();

    Particle getParticle(size_t index) const;
    std::vector<Particle> snapshot() const;

    std::vector<glm::vec2> &getPositions()
    {
        return positions;
    }
    const std::vector<glm::vec2> &getPositions() const
    {
        return positions;
    }
    std::vector<glm::vec2> &getPredictedPositions()
    {
        return predicted_positions;
    }
    const std::vector<glm::vec2> &getPredictedPositions() const
    {
        return predicted_positions;
    }
    std::vector<glm::vec2> &getVelocities()
    {
        return velocities;
    }
    const std::vector<glm::vec2> &getVelocities() const
    {
        return velocities;
    }
    std::vector<glm::vec2> &getDensities()
    {
        return densities;
    }
    const std::vector<glm::vec2> &getDensities() const
    {
        return densities;
    }
    std::vector<glm::vec2> &getVelocityScratch()
    {
        return sort_target_velocities;
    }
};

} // namespace TideSim
