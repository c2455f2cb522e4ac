#pragma once
#include "../utils/config.hh"
#include "../utils/parallel.hh"
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace TideSim
{

// Forward declarations
class ParticleStore;

/**
 * Closed polygon in world space. The last point connects back to the first.
 */
class BoundaryPolygon
{
  public:
    // Nearest-edge query result
    struct EdgeHit
    {
        bool found;              // false when the polygon has no usable edge
        size_t edge_index;       // edge from point[edge_index] to point[edge_index + 1]
        glm::vec2 closest_point; // projection clamped onto the segment
        float distance;
        glm::vec2 outward_normal; // unit normal of that edge, pointing out of the polygon

        EdgeHit() : found(false), edge_index(0), closest_point(0.0f), distance(0.0f), outward_normal(0.0f)
        {
        }
    };

  private:
    std::vector<glm::vec2> points;
    float orientation;              // +1 counter-clockwise, -1 clockwise
    size_t degenerate_edge_count;   // zero-length edges, skipped by nearestEdge

  public:
    BoundaryPolygon();
    explicit BoundaryPolygon(std::vector<glm::vec2> polygon_points);

    static BoundaryPolygon makeRectangle(glm::vec2 min_corner, glm::vec2 max_corner);

    // Reads "x y" pairs, one per line; '#' starts a comment
    static bool loadFromFile(const std::string &filename, BoundaryPolygon &out);

    const std::vector<glm::vec2> &getPoints() const
    {
        return points;
    }
    size_t size() const
    {
        return points.size();
    }
    bool empty() const
    {
        return points.empty();
    }
    size_t getDegenerateEdgeCount() const
    {
        return degenerate_edge_count;
    }

    // Even-odd ray cast
    bool contains(glm::vec2 point) const;

    // Globally nearest non-degenerate edge
    EdgeHit nearestEdge(glm::vec2 point) const;

    float signedArea() const;
};

/**
 * Keeps particles on the fluid side of a BoundaryPolygon.
 *
 * The fluid side is the polygon interior, or the exterior when invert_boundary is set.
 * A particle reacts when it is on the wrong side or closer than boundary_margin to the
 * nearest edge: it is pushed back to the margin (scaled by boundary_collision_strength),
 * an inbound velocity is reflected and damped, and the predicted position is rebuilt
 * from the corrected state.
 */
class CollisionHandler
{
  private:
    BoundaryPolygon boundary;
    BoundaryPolygon pending_boundary;
    bool has_pending_boundary;

  public:
    CollisionHandler();
    ~CollisionHandler() = default;

    // Staged, takes effect on the next commitPendingBoundary()
    void setBoundary(BoundaryPolygon polygon);
    void commitPendingBoundary();
    bool hasPendingBoundary() const
    {
        return has_pending_boundary;
    }

    const BoundaryPolygon &getBoundary() const
    {
        return boundary;
    }

    // Fewer than 2 points means there is nothing to collide with
    bool isActive() const
    {
        return boundary.size() >= 2;
    }

    // Whether a point lies on the fluid side of the boundary
    bool isInFluidRegion(glm::vec2 point, bool invert) const;

    // Single particle response, returns true when the particle was corrected
    bool resolveParticle(glm::vec2 &position, glm::vec2 &velocity, glm::vec2 &predicted_position,
                         const SimulationParameters &params) const;

    // Stage entry point, one worker per particle
    void handleCollisions(ParticleStore &store, const SimulationParameters &params,
                          const ParallelExecutor &executor) const;
};

} // namespace TideSim
