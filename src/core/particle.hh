#pragma once
#include <cstdint>
#include <glm/glm.hpp>
#include <vector>

namespace TideSim
{

/**
 * Per-particle snapshot handed to consumers after a substep
 */
struct Particle
{
    glm::vec2 position;
    glm::vec2 velocity;
    float density;      // Spiky (h - r)^2 density
    float near_density; // Spiky (h - r)^3 density

    Particle() : position(0.0f), velocity(0.0f), density(0.0f), near_density(0.0f)
    {
    }

    Particle(glm::vec2 pos, glm::vec2 vel = glm::vec2(0.0f))
        : position(pos), velocity(vel), density(0.0f), near_density(0.0f)
    {
    }
};

/**
 * Initial particle state. Its size fixes the particle count for the lifetime of a simulator.
 */
struct SpawnData
{
    std::vector<glm::vec2> positions;
    std::vector<glm::vec2> velocities;

    size_t size() const
    {
        return positions.size();
    }

    void add(glm::vec2 position, glm::vec2 velocity = glm::vec2(0.0f))
    {
        positions.push_back(position);
        velocities.push_back(velocity);
    }
};

// Bulk particle creation
SpawnData createParticleGrid(glm::vec2 start, glm::vec2 end, float spacing, float jitter = 0.0f,
                             std::uint32_t seed = 0);
SpawnData createParticleBlock(glm::vec2 center, glm::vec2 size, size_t count, float jitter = 0.0f,
                              std::uint32_t seed = 0);

} // namespace TideSim
