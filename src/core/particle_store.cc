#include "particle_store.hh"
#include "../utils/errors.hh"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <string>

namespace TideSim
{

ParticleStore::ParticleStore(const SpawnData &spawn) : spawn_data(spawn)
{
    if (spawn.positions.empty())
    {
        throw ConfigurationError("spawn data contains no particles");
    }
    if (spawn.velocities.size() != spawn.positions.size())
    {
        throw ConfigurationError("spawn data has " + std::to_string(spawn.positions.size()) + " positions but " +
                                 std::to_string(spawn.velocities.size()) + " velocities");
    }

    size_t count = spawn.positions.size();
    densities.resize(count);
    sort_target_positions.resize(count);
    sort_target_predicted_positions.resize(count);
    sort_target_velocities.resize(count);

    reset();

    std::cout << "ParticleStore initialized with " << count << " particles\n";
}

void ParticleStore::reset()
{
    positions = spawn_data.positions;
    predicted_positions = spawn_data.positions;
    velocities = spawn_data.velocities;
    std::fill(densities.begin(), densities.end(), glm::vec2(0.0f));
}

void ParticleStore::reorder(const std::vector<std::uint32_t> &permutation, const ParallelExecutor &executor)
{
    // Gather into the scratch arrays, then commit them as the new order
    executor.forEach(size(), [&](size_t i) {
        std::uint32_t source = permutation[i];
        sort_target_positions[i] = positions[source];
        sort_target_predicted_positions[i] = predicted_positions[source];
        sort_target_velocities[i] = velocities[source];
    });

    positions.swap(sort_target_positions);
    predicted_positions.swap(sort_target_predicted_positions);
    velocities.swap(sort_target_velocities);
}

void ParticleStore::swapVelocityBuffers()
{
    velocities.swap(sort_target_velocities);
}

Particle ParticleStore::getParticle(size_t index) const
{
    Particle p(positions[index], velocities[index]);
    p.density = densities[index].x;
    p.near_density = densities[index].y;
    return p;
}

std::vector<Particle> ParticleStore::snapshot() const
{
    std::vector<Particle> particles;
    particles.reserve(size());

    for (size_t i = 0; i < size(); i++)
    {
        particles.push_back(getParticle(i));
    }
    return particles;
}

// Spawn helpers

SpawnData createParticleGrid(glm::vec2 start, glm::vec2 end, float spacing, float jitter, std::uint32_t seed)
{
    SpawnData spawn;
    if (spacing <= 0.0f)
        return spawn;

    std::mt19937 generator(seed);
    std::uniform_real_distribution<float> offset(-1.0f, 1.0f);

    int columns = static_cast<int>(std::floor((end.x - start.x) / spacing)) + 1;
    int rows = static_cast<int>(std::floor((end.y - start.y) / spacing)) + 1;

    for (int y = 0; y < rows; y++)
    {
        for (int x = 0; x < columns; x++)
        {
            glm::vec2 pos = start + glm::vec2(x, y) * spacing;

            // Small random offset for a more natural distribution
            if (jitter > 0.0f)
            {
                pos += glm::vec2(offset(generator), offset(generator)) * jitter;
            }

            spawn.add(pos);
        }
    }

    return spawn;
}

SpawnData createParticleBlock(glm::vec2 center, glm::vec2 size, size_t count, float jitter, std::uint32_t seed)
{
    SpawnData spawn;
    if (count == 0 || size.x <= 0.0f || size.y <= 0.0f)
        return spawn;

    std::mt19937 generator(seed);
    std::uniform_real_distribution<float> angle(0.0f, 2.0f * 3.14159265359f);

    // Column count that makes the block spacing as square as possible
    float aspect_term = (size.x - size.y) / (2.0f * size.y);
    float per_row = std::sqrt(size.x / size.y * static_cast<float>(count) + aspect_term * aspect_term) - aspect_term;
    size_t columns = std::max<size_t>(1, static_cast<size_t>(std::ceil(per_row)));
    size_t rows = (count + columns - 1) / columns;

    for (size_t i = 0; i < count; i++)
    {
        size_t x = i % columns;
        size_t y = i / columns;

        float tx = columns <= 1 ? 0.5f : static_cast<float>(x) / static_cast<float>(columns - 1);
        float ty = rows <= 1 ? 0.5f : static_cast<float>(y) / static_cast<float>(rows - 1);

        glm::vec2 pos = center + glm::vec2((tx - 0.5f) * size.x, (ty - 0.5f) * size.y);
        if (jitter > 0.0f)
        {
            float a = angle(generator);
            pos += glm::vec2(std::cos(a), std::sin(a)) * jitter;
        }

        spawn.add(pos);
    }

    return spawn;
}

} // namespace TideSim
