#include "spatial_hash.hh"
#include "../utils/errors.hh"
#include <cmath>
#include <limits>

namespace TideSim
{

SpatialHashIndex::SpatialHashIndex(size_t count) : particle_count(count), cell_size(1.0f), built(false)
{
    if (count == 0)
    {
        throw ConfigurationError("spatial hash needs at least one particle");
    }
    if (count >= std::numeric_limits<std::uint32_t>::max())
    {
        throw ConfigurationError("particle count exceeds the 32-bit key range");
    }

    particle_keys.resize(count);
    sorted_keys.resize(count);
    sorted_indices.resize(count);
    offsets.resize(count);
    bucket_counts.resize(count);
    bucket_cursors = std::make_unique<std::atomic<std::uint32_t>[]>(count);
}

glm::ivec2 SpatialHashIndex::cellCoord(glm::vec2 position, float cell_size)
{
    return glm::ivec2(static_cast<int>(std::floor(position.x / cell_size)),
                      static_cast<int>(std::floor(position.y / cell_size)));
}

std::uint32_t SpatialHashIndex::hashCell(glm::ivec2 cell)
{
    // Unsigned arithmetic wraps, negative cells hash like any other
    std::uint32_t a = static_cast<std::uint32_t>(cell.x) * HASH_K1;
    std::uint32_t b = static_cast<std::uint32_t>(cell.y) * HASH_K2;
    return a + b;
}

void SpatialHashIndex::build(const std::vector<glm::vec2> &positions, float cell, const ParallelExecutor &executor)
{
    cell_size = cell;
    const std::uint32_t count = static_cast<std::uint32_t>(particle_count);

    // 1. Key per particle
    executor.forEach(particle_count, [&](size_t i) { particle_keys[i] = keyForPosition(positions[i]); });

    // 2. Histogram
    executor.forEach(particle_count, [&](size_t k) { bucket_cursors[k].store(0, std::memory_order_relaxed); });
    executor.forEach(particle_count, [&](size_t i) {
        bucket_cursors[particle_keys[i]].fetch_add(1, std::memory_order_relaxed);
    });

    // 3. Exclusive prefix sum over key space. Each cursor starts at its own bucket.
    std::uint32_t running = 0;
    for (std::uint32_t k = 0; k < count; k++)
    {
        std::uint32_t bucket = bucket_cursors[k].load(std::memory_order_relaxed);
        bucket_counts[k] = bucket;
        offsets[k] = bucket > 0 ? running : count;
        bucket_cursors[k].store(running, std::memory_order_relaxed);
        running += bucket;
    }

    // 4. Scatter
    executor.forEach(particle_count, [&](size_t i) {
        std::uint32_t key = particle_keys[i];
        std::uint32_t slot = bucket_cursors[key].fetch_add(1, std::memory_order_relaxed);
        sorted_indices[slot] = static_cast<std::uint32_t>(i);
        sorted_keys[slot] = key;
    });

    built = true;
}

} // namespace TideSim
