#include "fluid_sim.hh"
#include "../utils/errors.hh"
#include <iostream>
#include <string>
#include <utility>

namespace TideSim
{

FluidSimulator::FluidSimulator(const SimulationConfig &sim_config, const SpawnData &spawn,
                               const BoundaryPolygon &boundary)
    : config(sim_config), executor(sim_config.enable_parallel_processing, sim_config.cpu_thread_count),
      has_player(false), is_paused(false), current_time(0.0f), frame_count(0), step_count(0), step_time_average(60)
{
    std::string reason;
    if (!config.validate(&reason))
    {
        throw ConfigurationError(reason);
    }
    if (config.enable_boundary_collision && boundary.size() < 2)
    {
        throw ConfigurationError("boundary collision is enabled but the boundary has " +
                                 std::to_string(boundary.size()) + " point(s)");
    }

    particle_store = std::make_unique<ParticleStore>(spawn);
    spatial_hash = std::make_unique<SpatialHashIndex>(particle_store->size());

    // Running without walls needs no boundary at all
    if (boundary.size() > 0)
    {
        collision_handler.setBoundary(boundary);
        collision_handler.commitPendingBoundary();
    }

    force_solver.setParameters(config.toParameters(config.clampFrameTime(1.0f / 60.0f) /
                                                   static_cast<float>(config.iterations_per_frame)));

    std::cout << "FluidSimulator initialized (" << particle_store->size() << " particles, "
              << (executor.isParallel() ? "OpenMP " + std::to_string(executor.getThreadCount()) + " threads"
                                        : std::string("serial"))
              << ")\n";
    std::cout << "  Smoothing radius: " << config.smoothing_radius << "\n";
    std::cout << "  Target density: " << config.target_density << "\n";
    std::cout << "  Iterations per frame: " << config.iterations_per_frame << "\n";
}

void FluidSimulator::update(float delta_time)
{
    if (is_paused)
        return;

    runFrame(config.clampFrameTime(delta_time));
}

void FluidSimulator::stepFrame(float delta_time)
{
    runFrame(config.clampFrameTime(delta_time));
}

void FluidSimulator::runFrame(float frame_time)
{
    MathUtils::Timer frame_timer;
    frame_timer.start();

    float time_step = frame_time / static_cast<float>(config.iterations_per_frame);
    for (int i = 0; i < config.iterations_per_frame; i++)
    {
        step(time_step);
    }

    frame_count++;
    stats.total_frames = frame_count;
    stats.last_frame_physics_ms = frame_timer.stop();

    if (config.print_performance_stats && frame_count % config.stats_update_frequency == 0)
    {
        printFrameStats(stats.last_frame_physics_ms);
    }
}

void FluidSimulator::step(float substep_dt)
{
    physics_timer.start();

    // Parameters and inputs may change between substeps of the same frame
    collision_handler.commitPendingBoundary();
    SimulationParameters params = config.toParameters(substep_dt);
    force_solver.setParameters(params);
    InteractionInputs inputs = gatherInteractions();

    ExternalForces::applyExternalForces(*particle_store, params, inputs, executor);

    if (config.enable_boundary_collision)
    {
        collision_handler.handleCollisions(*particle_store, params, executor);
    }

    spatial_hash->build(particle_store->getPredictedPositions(), params.smoothing_radius, executor);
    particle_store->reorder(spatial_hash->getSortedIndices(), executor);

    force_solver.calculateDensities(*particle_store, *spatial_hash, executor);
    force_solver.applyPressureForces(*particle_store, *spatial_hash, executor);
    force_solver.applyViscosity(*particle_store, *spatial_hash, executor);
    force_solver.updatePositions(*particle_store, executor);

    step_count++;
    current_time += substep_dt;
    stats.total_steps = step_count;
    stats.accumulated_time = current_time;

    step_time_average.addValue(physics_timer.stop());
    stats.average_step_ms = step_time_average.getAverage();

    if (config.debug_mode && step_count % config.stats_update_frequency == 0)
    {
        std::cout << "Step " << step_count << " - mean density " << averageDensity() << " (target "
                  << config.target_density << ")\n";
    }

    for (const StepListener &listener : step_listeners)
    {
        listener();
    }
}

void FluidSimulator::reset()
{
    particle_store->reset();
    spatial_hash->invalidate();

    current_time = 0.0f;
    frame_count = 0;
    step_count = 0;
    stats.reset();
    step_time_average.clear();
}

void FluidSimulator::pause()
{
    is_paused = true;
}

void FluidSimulator::resume()
{
    is_paused = false;
}

void FluidSimulator::setConfig(const SimulationConfig &sim_config)
{
    std::string reason;
    if (!sim_config.validate(&reason))
    {
        throw ConfigurationError(reason);
    }

    size_t boundary_points = collision_handler.getBoundary().size();
    if (sim_config.enable_boundary_collision && boundary_points < 2 && !collision_handler.hasPendingBoundary())
    {
        throw ConfigurationError("boundary collision is enabled but the boundary has " +
                                 std::to_string(boundary_points) + " point(s)");
    }

    config = sim_config;
    executor = ParallelExecutor(config.enable_parallel_processing, config.cpu_thread_count);
}

void FluidSimulator::setBoundary(const BoundaryPolygon &boundary)
{
    collision_handler.setBoundary(boundary);
}

void FluidSimulator::setGrabInteraction(glm::vec2 point, float strength)
{
    grab_interaction = InteractionInput(point, strength, config.interaction_radius);
}

void FluidSimulator::setGrabInteraction(const InteractionInput &input)
{
    grab_interaction = input;
}

void FluidSimulator::clearGrabInteraction()
{
    grab_interaction = InteractionInput();
}

void FluidSimulator::addNudgeInteraction(const InteractionInput &input)
{
    nudge_interactions.push_back(input);
}

void FluidSimulator::clearNudgeInteractions()
{
    nudge_interactions.clear();
}

void FluidSimulator::setPlayerCoupling(const PlayerCoupling &player)
{
    player_coupling = player;
    has_player = true;
}

void FluidSimulator::clearPlayerCoupling()
{
    has_player = false;
}

void FluidSimulator::addStepListener(StepListener listener)
{
    step_listeners.push_back(std::move(listener));
}

InteractionInputs FluidSimulator::gatherInteractions() const
{
    InteractionInputs inputs;
    inputs.grab = grab_interaction;
    inputs.nudges = nudge_interactions;

    // The player only stirs the fluid while it is in the fluid region
    if (has_player && collision_handler.isInFluidRegion(player_coupling.position, config.invert_boundary))
    {
        inputs.nudges.push_back(ExternalForces::playerInteraction(player_coupling, config.player));
    }

    return inputs;
}

std::vector<size_t> FluidSimulator::queryParticlesInRadius(glm::vec2 point, float radius) const
{
    std::vector<size_t> result;
    if (!hasStepped())
        return result;

    const auto &positions = particle_store->getPositions();
    const float sqr_radius = radius * radius;

    for (size_t i = 0; i < positions.size(); i++)
    {
        if (MathUtils::distanceSquared(positions[i], point) <= sqr_radius)
        {
            result.push_back(i);
        }
    }
    return result;
}

DensitySample FluidSimulator::sampleDensity(glm::vec2 point) const
{
    DensitySample sample;
    if (!hasStepped() || !spatial_hash->isBuilt())
        return sample;

    glm::vec2 density = force_solver.densityAt(point, particle_store->getPredictedPositions(), *spatial_hash);
    sample.valid = true;
    sample.density = density.x;
    sample.near_density = density.y;
    return sample;
}

float FluidSimulator::averageDensity() const
{
    if (!hasStepped())
        return 0.0f;

    const auto &densities = particle_store->getDensities();
    double sum = 0.0;
    for (const glm::vec2 &d : densities)
    {
        sum += d.x;
    }
    return static_cast<float>(sum / static_cast<double>(densities.size()));
}

float FluidSimulator::getAverageStepTime() const
{
    return step_time_average.getAverage();
}

void FluidSimulator::printFrameStats(float frame_ms) const
{
    std::cout << "Frame " << frame_count << " - Physics update: " << frame_ms << "ms (avg substep "
              << step_time_average.getAverage() << "ms)\n";
}

} // namespace TideSim
