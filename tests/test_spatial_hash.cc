#include "core/spatial_hash.hh"
#include "utils/errors.hh"
#include <algorithm>
#include <gtest/gtest.h>
#include <random>
#include <set>
#include <vector>

using namespace TideSim;

namespace
{

std::vector<glm::vec2> randomPositions(size_t count, float extent, unsigned seed)
{
    std::mt19937 generator(seed);
    std::uniform_real_distribution<float> coord(-extent, extent);

    std::vector<glm::vec2> positions;
    for (size_t i = 0; i < count; i++)
    {
        positions.emplace_back(coord(generator), coord(generator));
    }
    return positions;
}

} // namespace

TEST(SpatialHashTest, RejectsEmptyParticleSet)
{
    EXPECT_THROW(SpatialHashIndex(0), ConfigurationError);
}

TEST(SpatialHashTest, CellCoordFloorsNegativePositions)
{
    EXPECT_EQ(SpatialHashIndex::cellCoord(glm::vec2(0.1f, 0.1f), 0.5f), glm::ivec2(0, 0));
    EXPECT_EQ(SpatialHashIndex::cellCoord(glm::vec2(-0.1f, 1.2f), 0.5f), glm::ivec2(-1, 2));
    EXPECT_EQ(SpatialHashIndex::cellCoord(glm::vec2(-1.0f, -0.5f), 0.5f), glm::ivec2(-2, -1));
}

TEST(SpatialHashTest, HashUsesBothAxes)
{
    EXPECT_EQ(SpatialHashIndex::hashCell(glm::ivec2(0, 0)), 0u);
    EXPECT_EQ(SpatialHashIndex::hashCell(glm::ivec2(1, 0)), SpatialHashIndex::HASH_K1);
    EXPECT_EQ(SpatialHashIndex::hashCell(glm::ivec2(0, 1)), SpatialHashIndex::HASH_K2);
    EXPECT_NE(SpatialHashIndex::hashCell(glm::ivec2(-1, 0)), SpatialHashIndex::hashCell(glm::ivec2(1, 0)));
}

TEST(SpatialHashTest, SortedIndicesArePermutation)
{
    const size_t count = 500;
    std::vector<glm::vec2> positions = randomPositions(count, 3.0f, 7);

    SpatialHashIndex index(count);
    index.build(positions, 0.35f, ParallelExecutor::serial());

    std::vector<std::uint32_t> indices = index.getSortedIndices();
    std::sort(indices.begin(), indices.end());
    for (size_t i = 0; i < count; i++)
    {
        EXPECT_EQ(indices[i], i);
    }
}

TEST(SpatialHashTest, EqualKeysFormContiguousRuns)
{
    const size_t count = 400;
    std::vector<glm::vec2> positions = randomPositions(count, 2.0f, 11);

    SpatialHashIndex index(count);
    index.build(positions, 0.35f, ParallelExecutor::serial());

    const auto &keys = index.getSortedKeys();
    const auto &sorted = index.getSortedIndices();
    const auto &offsets = index.getOffsets();
    const auto &bucket_counts = index.getBucketCounts();

    std::set<std::uint32_t> finished;
    for (size_t s = 0; s < count; s++)
    {
        EXPECT_LT(keys[s], count);
        EXPECT_EQ(keys[s], index.keyForPosition(positions[sorted[s]]));

        if (s > 0 && keys[s] != keys[s - 1])
        {
            EXPECT_EQ(finished.count(keys[s]), 0u) << "key " << keys[s] << " appears in two runs";
            finished.insert(keys[s - 1]);
        }
    }

    for (std::uint32_t k = 0; k < count; k++)
    {
        if (bucket_counts[k] == 0)
        {
            EXPECT_EQ(offsets[k], count);
            continue;
        }

        std::uint32_t start = offsets[k];
        ASSERT_LT(start, count);
        EXPECT_EQ(keys[start], k);
        EXPECT_TRUE(start == 0 || keys[start - 1] != k);
        EXPECT_TRUE(start + bucket_counts[k] == count || keys[start + bucket_counts[k]] != k);
    }
}

TEST(SpatialHashTest, CandidatesContainEveryNeighbourOnce)
{
    const size_t count = 300;
    const float radius = 0.35f;
    std::vector<glm::vec2> positions = randomPositions(count, 1.5f, 3);

    SpatialHashIndex index(count);
    index.build(positions, radius, ParallelExecutor::serial());
    const auto &sorted = index.getSortedIndices();

    for (size_t i = 0; i < count; i += 17)
    {
        std::multiset<std::uint32_t> candidates;
        index.forEachCandidate(positions[i], [&](size_t slot) { candidates.insert(sorted[slot]); });

        for (std::uint32_t c : candidates)
        {
            EXPECT_EQ(candidates.count(c), 1u);
        }

        for (size_t j = 0; j < count; j++)
        {
            if (glm::dot(positions[j] - positions[i], positions[j] - positions[i]) <= radius * radius)
            {
                EXPECT_EQ(candidates.count(static_cast<std::uint32_t>(j)), 1u) << i << " misses " << j;
            }
        }
    }
}

TEST(SpatialHashTest, SmallCountsDoNotRepeatSharedKeys)
{
    // With two particles every cell maps to key 0 or 1, so the 3x3 block repeats keys
    std::vector<glm::vec2> positions = {glm::vec2(0.0f), glm::vec2(0.1f, 0.0f)};

    SpatialHashIndex index(positions.size());
    index.build(positions, 1.0f, ParallelExecutor::serial());

    int visits = 0;
    index.forEachCandidate(glm::vec2(0.05f, 0.0f), [&](size_t) { visits++; });
    EXPECT_EQ(visits, 2);
}

TEST(SpatialHashTest, ParallelBuildMatchesSerialBuckets)
{
    const size_t count = 2000;
    std::vector<glm::vec2> positions = randomPositions(count, 5.0f, 21);

    SpatialHashIndex serial_index(count);
    SpatialHashIndex parallel_index(count);
    serial_index.build(positions, 0.35f, ParallelExecutor::serial());
    parallel_index.build(positions, 0.35f, ParallelExecutor(true, 4));

    EXPECT_EQ(serial_index.getSortedKeys(), parallel_index.getSortedKeys());
    EXPECT_EQ(serial_index.getOffsets(), parallel_index.getOffsets());
    EXPECT_EQ(serial_index.getBucketCounts(), parallel_index.getBucketCounts());

    // Order inside a bucket depends on thread timing, the bucket contents do not
    const auto &keys = serial_index.getSortedKeys();
    size_t run_start = 0;
    for (size_t s = 1; s <= count; s++)
    {
        if (s < count && keys[s] == keys[run_start])
            continue;

        std::multiset<std::uint32_t> a(serial_index.getSortedIndices().begin() + run_start,
                                       serial_index.getSortedIndices().begin() + s);
        std::multiset<std::uint32_t> b(parallel_index.getSortedIndices().begin() + run_start,
                                       parallel_index.getSortedIndices().begin() + s);
        EXPECT_EQ(a, b);
        run_start = s;
    }
}

TEST(SpatialHashTest, UnbuiltIndexReportsNothing)
{
    SpatialHashIndex index(10);
    EXPECT_FALSE(index.isBuilt());

    int visits = 0;
    index.forEachCandidate(glm::vec2(0.0f), [&](size_t) { visits++; });
    EXPECT_EQ(visits, 0);
}
