#include "collision.hh"
#include "../core/particle_store.hh"
#include "../utils/math_utils.hh"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace TideSim
{

// BoundaryPolygon Implementation
BoundaryPolygon::BoundaryPolygon() : orientation(1.0f), degenerate_edge_count(0)
{
}

BoundaryPolygon::BoundaryPolygon(std::vector<glm::vec2> polygon_points)
    : points(std::move(polygon_points)), orientation(1.0f), degenerate_edge_count(0)
{
    orientation = signedArea() < 0.0f ? -1.0f : 1.0f;

    for (size_t i = 0; i < points.size(); i++)
    {
        const glm::vec2 &a = points[i];
        const glm::vec2 &b = points[(i + 1) % points.size()];
        if (MathUtils::distanceSquared(a, b) <= MathUtils::EPSILON * MathUtils::EPSILON)
        {
            degenerate_edge_count++;
        }
    }
}

BoundaryPolygon BoundaryPolygon::makeRectangle(glm::vec2 min_corner, glm::vec2 max_corner)
{
    return BoundaryPolygon({min_corner, glm::vec2(max_corner.x, min_corner.y), max_corner,
                            glm::vec2(min_corner.x, max_corner.y)});
}

bool BoundaryPolygon::loadFromFile(const std::string &filename, BoundaryPolygon &out)
{
    std::ifstream file(filename);
    if (!file)
    {
        std::cerr << "Could not open boundary file: " << filename << std::endl;
        return false;
    }

    std::vector<glm::vec2> loaded;
    std::string line;
    int line_number = 0;

    while (std::getline(file, line))
    {
        line_number++;

        size_t comment = line.find('#');
        if (comment != std::string::npos)
            line.erase(comment);

        std::istringstream stream(line);
        glm::vec2 point;
        if (!(stream >> point.x))
            continue; // blank line

        if (!(stream >> point.y))
        {
            std::cerr << filename << ":" << line_number << ": expected 'x y'" << std::endl;
            return false;
        }
        loaded.push_back(point);
    }

    out = BoundaryPolygon(std::move(loaded));
    std::cout << "Loaded " << out.size() << " boundary points from " << filename << std::endl;
    return true;
}

float BoundaryPolygon::signedArea() const
{
    float area = 0.0f;
    for (size_t i = 0; i < points.size(); i++)
    {
        const glm::vec2 &a = points[i];
        const glm::vec2 &b = points[(i + 1) % points.size()];
        area += a.x * b.y - b.x * a.y;
    }
    return 0.5f * area;
}

bool BoundaryPolygon::contains(glm::vec2 point) const
{
    if (points.size() < 3)
        return false;

    bool inside = false;
    for (size_t i = 0, j = points.size() - 1; i < points.size(); j = i++)
    {
        const glm::vec2 &pi = points[i];
        const glm::vec2 &pj = points[j];

        // Edge straddles the horizontal ray and crosses it right of the point
        if ((pi.y > point.y) != (pj.y > point.y))
        {
            float cross_x = pj.x + (point.y - pj.y) * (pi.x - pj.x) / (pi.y - pj.y);
            if (point.x < cross_x)
            {
                inside = !inside;
            }
        }
    }
    return inside;
}

BoundaryPolygon::EdgeHit BoundaryPolygon::nearestEdge(glm::vec2 point) const
{
    EdgeHit hit;
    float min_distance_squared = std::numeric_limits<float>::max();

    for (size_t i = 0; i < points.size(); i++)
    {
        const glm::vec2 &a = points[i];
        const glm::vec2 &b = points[(i + 1) % points.size()];
        glm::vec2 edge = b - a;
        float edge_length_squared = glm::dot(edge, edge);

        if (edge_length_squared <= MathUtils::EPSILON * MathUtils::EPSILON)
            continue;

        float t = MathUtils::saturate(glm::dot(point - a, edge) / edge_length_squared);
        glm::vec2 projection = a + t * edge;
        float distance_squared = MathUtils::distanceSquared(point, projection);

        if (distance_squared < min_distance_squared)
        {
            min_distance_squared = distance_squared;
            hit.found = true;
            hit.edge_index = i;
            hit.closest_point = projection;

            // Right-hand perpendicular points outward for a counter-clockwise polygon
            glm::vec2 edge_dir = edge / std::sqrt(edge_length_squared);
            hit.outward_normal = -MathUtils::perpendicular(edge_dir) * orientation;
        }
    }

    if (hit.found)
    {
        hit.distance = std::sqrt(min_distance_squared);

        // An open segment has no interior, its "outside" is whichever side the point is on
        if (points.size() < 3)
        {
            hit.outward_normal = MathUtils::safeNormalize(point - hit.closest_point, hit.outward_normal);
        }
    }
    return hit;
}

// CollisionHandler Implementation
CollisionHandler::CollisionHandler() : has_pending_boundary(false)
{
}

void CollisionHandler::setBoundary(BoundaryPolygon polygon)
{
    pending_boundary = std::move(polygon);
    has_pending_boundary = true;
}

void CollisionHandler::commitPendingBoundary()
{
    if (!has_pending_boundary)
        return;

    boundary = std::move(pending_boundary);
    pending_boundary = BoundaryPolygon();
    has_pending_boundary = false;

    if (!isActive())
    {
        std::cerr << "Boundary has " << boundary.size() << " point(s), polygon collision disabled" << std::endl;
        return;
    }

    std::cout << "Boundary loaded: " << boundary.size() << " points";
    if (boundary.getDegenerateEdgeCount() > 0)
    {
        std::cout << " (" << boundary.getDegenerateEdgeCount() << " zero-length edges ignored)";
    }
    std::cout << "\n";
}

bool CollisionHandler::isInFluidRegion(glm::vec2 point, bool invert) const
{
    // An open wall segment has no inside, both sides hold fluid
    if (!isActive() || boundary.size() < 3)
        return true;

    bool inside = boundary.contains(point);
    return invert ? !inside : inside;
}

bool CollisionHandler::resolveParticle(glm::vec2 &position, glm::vec2 &velocity, glm::vec2 &predicted_position,
                                       const SimulationParameters &params) const
{
    if (!isActive())
        return false;

    BoundaryPolygon::EdgeHit hit = boundary.nearestEdge(predicted_position);
    if (!hit.found)
        return false;

    // A two-point boundary is a wall segment, particles only keep their distance to it
    bool open_segment = boundary.size() < 3;
    bool inside = boundary.contains(predicted_position);
    bool on_fluid_side = open_segment || (params.invert_boundary ? !inside : inside);
    bool within_margin = hit.distance < params.boundary_margin;
    bool collided = false;

    if (!on_fluid_side || within_margin)
    {
        // Normal pointing into the fluid region
        glm::vec2 normal = (open_segment || params.invert_boundary) ? hit.outward_normal : -hit.outward_normal;

        // Signed distance into the fluid region, negative once the particle has crossed
        float fluid_side_distance = on_fluid_side ? hit.distance : -hit.distance;
        float penetration = params.boundary_margin - fluid_side_distance;

        position += normal * penetration * params.boundary_collision_strength;

        float normal_speed = glm::dot(velocity, normal);
        if (normal_speed < 0.0f)
        {
            velocity = MathUtils::reflect(velocity, normal) * params.collision_damping;
        }
        collided = true;
    }

    predicted_position = position + velocity * params.delta_time;
    return collided;
}

void CollisionHandler::handleCollisions(ParticleStore &store, const SimulationParameters &params,
                                        const ParallelExecutor &executor) const
{
    if (!isActive())
        return;

    auto &positions = store.getPositions();
    auto &velocities = store.getVelocities();
    auto &predicted = store.getPredictedPositions();

    executor.forEach(store.size(), [&](size_t i) { resolveParticle(positions[i], velocities[i], predicted[i], params); });
}

} // namespace TideSim
