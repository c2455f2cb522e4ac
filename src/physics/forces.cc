#include "forces.hh"
#include "../core/particle_store.hh"
#include "../core/spatial_hash.hh"
#include "../utils/math_utils.hh"
#include <cmath>

namespace TideSim
{

namespace
{

// Falloff and direction of an interactor at a particle, false when out of range
bool interactorFalloff(const InteractionInput &input, glm::vec2 position, float &centre_t, glm::vec2 &dir_to_centre)
{
    glm::vec2 offset = input.point - position;
    float sqr_dst = glm::dot(offset, offset);
    if (sqr_dst >= input.radius * input.radius)
        return false;

    float dst = std::sqrt(sqr_dst);
    centre_t = 1.0f - dst / input.radius;
    dir_to_centre = dst > MathUtils::EPSILON ? offset / dst : glm::vec2(0.0f);
    return true;
}

} // namespace

// External Forces Implementation
glm::vec2 ExternalForces::calculateAcceleration(glm::vec2 position, glm::vec2 velocity, float gravity,
                                                const InteractionInputs &inputs)
{
    glm::vec2 gravity_accel(0.0f, gravity);
    glm::vec2 accel = gravity_accel;

    float centre_t;
    glm::vec2 dir;

    const InteractionInput &grab = inputs.grab;
    if (grab.isActive() && interactorFalloff(grab, position, centre_t, dir))
    {
        float falloff = centre_t * centre_t;

        // Near the centre gravity fades out and sideways motion is damped so the fluid
        // collects at the pointer instead of orbiting it
        float gravity_weight = 1.0f - centre_t * MathUtils::saturate(grab.strength / 10.0f);
        glm::vec2 tangential = velocity - dir * glm::dot(velocity, dir);

        accel = gravity_accel * gravity_weight + dir * falloff * grab.strength;
        accel -= tangential * centre_t;
        accel += (grab.velocity - velocity) * falloff * grab.velocity_transfer;
    }

    for (const InteractionInput &nudge : inputs.nudges)
    {
        if (!nudge.isActive() || !interactorFalloff(nudge, position, centre_t, dir))
            continue;

        float falloff = centre_t * centre_t;
        accel += dir * falloff * nudge.strength;
        accel += (nudge.velocity - velocity) * falloff * nudge.velocity_transfer;
    }

    return accel;
}

InteractionInput ExternalForces::playerInteraction(const PlayerCoupling &player,
                                                   const PlayerInteractionSettings &settings)
{
    float speed = glm::length(player.velocity);
    float movement_factor = speed > 0.1f ? settings.movement_multiplier : 1.0f;

    float strength;
    if (player.mirrored)
    {
        // Mirrored: draws fluid in while still, throws it off while moving fast
        strength = settings.mirrored_strength * movement_factor * (speed > 1.0f ? -1.0f : 1.0f);
    }
    else
    {
        strength = -settings.displacement_strength * movement_factor;
    }
    strength *= 2.0f;

    return InteractionInput(player.position, strength, settings.radius, player.velocity, settings.velocity_transfer);
}

void ExternalForces::applyExternalForces(ParticleStore &store, const SimulationParameters &params,
                                         const InteractionInputs &inputs, const ParallelExecutor &executor)
{
    auto &positions = store.getPositions();
    auto &velocities = store.getVelocities();
    auto &predicted = store.getPredictedPositions();

    executor.forEach(store.size(), [&](size_t i) {
        velocities[i] += calculateAcceleration(positions[i], velocities[i], params.gravity, inputs) * params.delta_time;
        predicted[i] = positions[i] + velocities[i] * PREDICTION_LOOKAHEAD;
    });
}

// ForceSolver Implementation
ForceSolver::ForceSolver() : params(), kernels(params.smoothing_radius)
{
}

void ForceSolver::setParameters(const SimulationParameters &parameters)
{
    if (parameters.smoothing_radius != kernels.getRadius())
    {
        kernels.setRadius(parameters.smoothing_radius);
    }
    params = parameters;
}

float ForceSolver::pressureFromDensity(float density) const
{
    return (density - params.target_density) * params.pressure_multiplier;
}

float ForceSolver::nearPressureFromDensity(float near_density) const
{
    return near_density * params.near_pressure_multiplier;
}

glm::vec2 ForceSolver::densityAt(glm::vec2 position, const std::vector<glm::vec2> &predicted_positions,
                                 const SpatialHashIndex &index) const
{
    const float sqr_radius = params.smoothing_radius * params.smoothing_radius;
    float density = 0.0f;
    float near_density = 0.0f;

    index.forEachCandidate(position, [&](size_t j) {
        glm::vec2 offset = predicted_positions[j] - position;
        float sqr_dst = glm::dot(offset, offset);
        if (sqr_dst > sqr_radius)
            return;

        float dst = std::sqrt(sqr_dst);
        density += kernels.densityKernel(dst);
        near_density += kernels.nearDensityKernel(dst);
    });

    return glm::vec2(density, near_density);
}

glm::vec2 ForceSolver::pairPressureForce(glm::vec2 offset, float dst, glm::vec2 own_density,
                                         glm::vec2 neighbour_density) const
{
    // Coincident particles still need a direction
    glm::vec2 dir = dst > 0.0f ? offset / dst : glm::vec2(0.0f, 1.0f);

    float shared_pressure = (pressureFromDensity(own_density.x) + pressureFromDensity(neighbour_density.x)) * 0.5f;
    float shared_near_pressure =
        (nearPressureFromDensity(own_density.y) + nearPressureFromDensity(neighbour_density.y)) * 0.5f;

    glm::vec2 force(0.0f);
    if (neighbour_density.x > 0.0f)
    {
        force += dir * kernels.densityDerivative(dst) * shared_pressure / neighbour_density.x;
    }
    if (neighbour_density.y > 0.0f)
    {
        force += dir * kernels.nearDensityDerivative(dst) * shared_near_pressure / neighbour_density.y;
    }
    return force;
}

glm::vec2 ForceSolver::pressureAcceleration(size_t index, const ParticleStore &store,
                                            const SpatialHashIndex &hash) const
{
    const auto &predicted = store.getPredictedPositions();
    const auto &densities = store.getDensities();
    const float sqr_radius = params.smoothing_radius * params.smoothing_radius;

    const glm::vec2 pos = predicted[index];
    const glm::vec2 own_density = densities[index];
    glm::vec2 pressure_force(0.0f);

    hash.forEachCandidate(pos, [&](size_t j) {
        if (j == index)
            return;

        glm::vec2 offset = predicted[j] - pos;
        float sqr_dst = glm::dot(offset, offset);
        if (sqr_dst > sqr_radius)
            return;

        pressure_force += pairPressureForce(offset, std::sqrt(sqr_dst), own_density, densities[j]);
    });

    if (own_density.x <= 0.0f)
        return glm::vec2(0.0f);
    return pressure_force / own_density.x;
}

glm::vec2 ForceSolver::viscosityAcceleration(size_t index, const ParticleStore &store,
                                             const SpatialHashIndex &hash) const
{
    const auto &predicted = store.getPredictedPositions();
    const auto &velocities = store.getVelocities();
    const float sqr_radius = params.smoothing_radius * params.smoothing_radius;

    const glm::vec2 pos = predicted[index];
    const glm::vec2 velocity = velocities[index];
    glm::vec2 viscosity_force(0.0f);

    hash.forEachCandidate(pos, [&](size_t j) {
        if (j == index)
            return;

        glm::vec2 offset = predicted[j] - pos;
        float sqr_dst = glm::dot(offset, offset);
        if (sqr_dst > sqr_radius)
            return;

        viscosity_force += (velocities[j] - velocity) * kernels.viscosityKernel(std::sqrt(sqr_dst));
    });

    return viscosity_force * params.viscosity_strength;
}

void ForceSolver::calculateDensities(ParticleStore &store, const SpatialHashIndex &hash,
                                     const ParallelExecutor &executor) const
{
    const auto &predicted = store.getPredictedPositions();
    auto &densities = store.getDensities();

    executor.forEach(store.size(), [&](size_t i) { densities[i] = densityAt(predicted[i], predicted, hash); });
}

void ForceSolver::applyPressureForces(ParticleStore &store, const SpatialHashIndex &hash,
                                      const ParallelExecutor &executor) const
{
    // Reads only positions and densities, so velocities can be updated in place
    auto &velocities = store.getVelocities();

    executor.forEach(store.size(), [&](size_t i) {
        velocities[i] += pressureAcceleration(i, store, hash) * params.delta_time;
    });
}

void ForceSolver::applyViscosity(ParticleStore &store, const SpatialHashIndex &hash,
                                 const ParallelExecutor &executor) const
{
    // Neighbour velocities are read, so results go to the scratch buffer first
    const auto &velocities = store.getVelocities();
    auto &next_velocities = store.getVelocityScratch();

    executor.forEach(store.size(), [&](size_t i) {
        next_velocities[i] = velocities[i] + viscosityAcceleration(i, store, hash) * params.delta_time;
    });

    store.swapVelocityBuffers();
}

void ForceSolver::updatePositions(ParticleStore &store, const ParallelExecutor &executor) const
{
    auto &positions = store.getPositions();
    const auto &velocities = store.getVelocities();

    executor.forEach(store.size(), [&](size_t i) { positions[i] += velocities[i] * params.delta_time; });
}

} // namespace TideSim
