#pragma once
#include "../utils/parallel.hh"
#include <atomic>
#include <cstdint>
#include <glm/glm.hpp>
#include <memory>
#include <vector>

namespace TideSim
{

/**
 * Counting-sort spatial hash over quantized cells, rebuilt every substep.
 *
 * Keys live in [0, N) (cell hash mod particle count); distinct cells may share a key,
 * neighbour loops filter those out by distance. After build():
 *   - getSortedIndices() is a permutation of [0, N) grouping equal keys
 *   - getSortedKeys()[s] is the key of sorted slot s
 *   - getOffsets()[k] is the first sorted slot with key k, or N when k is empty
 * Each key therefore owns one contiguous run starting at getOffsets()[k] and ending
 * where getSortedKeys() changes.
 *
 * Construction is histogram -> exclusive prefix sum -> scatter. The prefix sum seeds
 * every bucket cursor with the start of its own run; the scatter then claims slots
 * with an atomic increment on that cursor.
 */
class SpatialHashIndex
{
  public:
    static constexpr std::uint32_t HASH_K1 = 15823;
    static constexpr std::uint32_t HASH_K2 = 9737333;

  private:
    size_t particle_count;
    float cell_size;
    bool built;

    std::vector<std::uint32_t> particle_keys; // key of each particle in input order
    std::vector<std::uint32_t> sorted_keys;
    std::vector<std::uint32_t> sorted_indices;
    std::vector<std::uint32_t> offsets;
    std::vector<std::uint32_t> bucket_counts;
    std::unique_ptr<std::atomic<std::uint32_t>[]> bucket_cursors;

  public:
    explicit SpatialHashIndex(size_t count);

    SpatialHashIndex(const SpatialHashIndex &) = delete;
    SpatialHashIndex &operator=(const SpatialHashIndex &) = delete;

    static glm::ivec2 cellCoord(glm::vec2 position, float cell_size);
    static std::uint32_t hashCell(glm::ivec2 cell);
    std::uint32_t keyFromHash(std::uint32_t hash) const
    {
        return hash % static_cast<std::uint32_t>(particle_count);
    }
    std::uint32_t keyForPosition(glm::vec2 position) const
    {
        return keyFromHash(hashCell(cellCoord(position, cell_size)));
    }

    // cell_size must be at least the smoothing radius for neighbour queries to be complete
    void build(const std::vector<glm::vec2> &positions, float cell, const ParallelExecutor &executor);

    // Drop the index, e.g. after a reset
    void invalidate()
    {
        built = false;
    }

    bool isBuilt() const
    {
        return built;
    }
    size_t size() const
    {
        return particle_count;
    }
    float getCellSize() const
    {
        return cell_size;
    }
    const std::vector<std::uint32_t> &getSortedIndices() const
    {
        return sorted_indices;
    }
    const std::vector<std::uint32_t> &getSortedKeys() const
    {
        return sorted_keys;
    }
    const std::vector<std::uint32_t> &getOffsets() const
    {
        return offsets;
    }
    const std::vector<std::uint32_t> &getBucketCounts() const
    {
        return bucket_counts;
    }

    /**
     * Calls fn(slot) for every sorted slot whose key matches one of the 3x3 cells around
     * position. Keys shared by several of the nine cells are walked once, so every slot
     * is reported at most once. Callers still have to check the distance.
     */
    template <typename Fn> void forEachCandidate(glm::vec2 position, Fn &&fn) const
    {
        if (!built)
            return;

        const glm::ivec2 origin = cellCoord(position, cell_size);
        const std::uint32_t count = static_cast<std::uint32_t>(particle_count);

        std::uint32_t visited[9];
        int visited_count = 0;

        for (int dy = -1; dy <= 1; dy++)
        {
            for (int dx = -1; dx <= 1; dx++)
            {
                const std::uint32_t key = keyFromHash(hashCell(origin + glm::ivec2(dx, dy)));

                bool seen = false;
                for (int v = 0; v < visited_count; v++)
                {
                    if (visited[v] == key)
                    {
                        seen = true;
                        break;
                    }
                }
                if (seen)
                    continue;
                visited[visited_count++] = key;

                for (std::uint32_t slot = offsets[key]; slot < count; slot++)
                {
                    if (sorted_keys[slot] != key)
                        break;
                    fn(static_cast<size_t>(slot));
                }
            }
        }
    }
};

} // namespace TideSim
