#include "core/particle_store.hh"
#include "core/spatial_hash.hh"
#include "physics/forces.hh"
#include "utils/math_utils.hh"
#include <cmath>
#include <gtest/gtest.h>

using namespace TideSim;

namespace
{

SimulationParameters solverParameters()
{
    SimulationParameters params;
    params.delta_time = 1.0f / 180.0f;
    params.smoothing_radius = 0.35f;
    return params;
}

// Store, index and solver wired the way a substep uses them
struct SolverFixture
{
    ParticleStore store;
    SpatialHashIndex hash;
    ForceSolver solver;

    SolverFixture(const SpawnData &spawn, const SimulationParameters &params)
        : store(spawn), hash(spawn.size())
    {
        solver.setParameters(params);
    }

    void prepare(const ParallelExecutor &executor)
    {
        hash.build(store.getPredictedPositions(), solver.getParameters().smoothing_radius, executor);
        store.reorder(hash.getSortedIndices(), executor);
        solver.calculateDensities(store, hash, executor);
    }
};

SpawnData pair(glm::vec2 a, glm::vec2 b)
{
    SpawnData spawn;
    spawn.add(a);
    spawn.add(b);
    return spawn;
}

} // namespace

TEST(ExternalForcesTest, GravityOnlyWithoutInteractors)
{
    InteractionInputs inputs;
    glm::vec2 accel = ExternalForces::calculateAcceleration(glm::vec2(1.0f), glm::vec2(3.0f, 0.0f), -12.0f, inputs);
    EXPECT_EQ(accel, glm::vec2(0.0f, -12.0f));
}

TEST(ExternalForcesTest, GrabPullsTowardPointAndCancelsGravityAtCentre)
{
    InteractionInputs inputs;
    inputs.grab = InteractionInput(glm::vec2(0.0f), 90.0f, 2.0f);

    glm::vec2 centre = ExternalForces::calculateAcceleration(glm::vec2(0.0f), glm::vec2(0.0f), -12.0f, inputs);
    EXPECT_NEAR(centre.x, 0.0f, 1e-5f);
    EXPECT_NEAR(centre.y, 0.0f, 1e-5f);

    glm::vec2 side = ExternalForces::calculateAcceleration(glm::vec2(1.0f, 0.0f), glm::vec2(0.0f), 0.0f, inputs);
    EXPECT_NEAR(side.x, -90.0f * 0.25f, 1e-3f);
    EXPECT_NEAR(side.y, 0.0f, 1e-5f);

    glm::vec2 outside = ExternalForces::calculateAcceleration(glm::vec2(3.0f, 0.0f), glm::vec2(0.0f), -12.0f, inputs);
    EXPECT_EQ(outside, glm::vec2(0.0f, -12.0f));
}

TEST(ExternalForcesTest, NegativeGrabPushesAway)
{
    InteractionInputs inputs;
    inputs.grab = InteractionInput(glm::vec2(0.0f), -90.0f, 2.0f);

    glm::vec2 accel = ExternalForces::calculateAcceleration(glm::vec2(1.0f, 0.0f), glm::vec2(0.0f), 0.0f, inputs);
    EXPECT_GT(accel.x, 0.0f);
}

TEST(ExternalForcesTest, GrabDampsTangentialVelocity)
{
    InteractionInputs inputs;
    inputs.grab = InteractionInput(glm::vec2(0.0f), 5.0f, 2.0f);

    // Moving sideways across the pull direction
    glm::vec2 accel = ExternalForces::calculateAcceleration(glm::vec2(1.0f, 0.0f), glm::vec2(0.0f, 4.0f), 0.0f, inputs);
    EXPECT_NEAR(accel.y, -4.0f * 0.5f, 1e-4f);
}

TEST(ExternalForcesTest, NudgesAddFalloffAndVelocityTransfer)
{
    InteractionInputs inputs;
    inputs.nudges.push_back(InteractionInput(glm::vec2(0.0f), 10.0f, 2.0f));
    inputs.nudges.push_back(InteractionInput(glm::vec2(0.0f), 0.0f, 2.0f, glm::vec2(2.0f, 0.0f), 1.0f));

    glm::vec2 accel = ExternalForces::calculateAcceleration(glm::vec2(0.0f, 1.0f), glm::vec2(0.0f), -12.0f, inputs);

    // Only the first nudge is active: gravity plus 10 * 0.25 toward the point
    EXPECT_NEAR(accel.x, 0.0f, 1e-5f);
    EXPECT_NEAR(accel.y, -12.0f - 2.5f, 1e-4f);

    inputs.nudges[1].strength = 1.0f;
    accel = ExternalForces::calculateAcceleration(glm::vec2(0.0f, 1.0f), glm::vec2(0.0f), -12.0f, inputs);
    EXPECT_NEAR(accel.x, 2.0f * 0.25f, 1e-4f);
}

TEST(ExternalForcesTest, PlayerInteractionMapping)
{
    PlayerInteractionSettings settings;

    InteractionInput idle = ExternalForces::playerInteraction(PlayerCoupling(glm::vec2(1.0f), glm::vec2(0.0f), false),
                                                              settings);
    EXPECT_FLOAT_EQ(idle.strength, -settings.displacement_strength * 2.0f);
    EXPECT_FLOAT_EQ(idle.radius, settings.radius);
    EXPECT_FLOAT_EQ(idle.velocity_transfer, settings.velocity_transfer);
    EXPECT_EQ(idle.point, glm::vec2(1.0f));

    InteractionInput moving =
        ExternalForces::playerInteraction(PlayerCoupling(glm::vec2(0.0f), glm::vec2(0.5f, 0.0f), false), settings);
    EXPECT_FLOAT_EQ(moving.strength, -settings.displacement_strength * settings.movement_multiplier * 2.0f);

    InteractionInput mirrored_idle =
        ExternalForces::playerInteraction(PlayerCoupling(glm::vec2(0.0f), glm::vec2(0.0f), true), settings);
    EXPECT_FLOAT_EQ(mirrored_idle.strength, settings.mirrored_strength * 2.0f);

    InteractionInput mirrored_slow =
        ExternalForces::playerInteraction(PlayerCoupling(glm::vec2(0.0f), glm::vec2(0.5f, 0.0f), true), settings);
    EXPECT_FLOAT_EQ(mirrored_slow.strength, settings.mirrored_strength * settings.movement_multiplier * 2.0f);

    InteractionInput mirrored_fast =
        ExternalForces::playerInteraction(PlayerCoupling(glm::vec2(0.0f), glm::vec2(0.0f, 3.0f), true), settings);
    EXPECT_FLOAT_EQ(mirrored_fast.strength, -settings.mirrored_strength * settings.movement_multiplier * 2.0f);
    EXPECT_EQ(mirrored_fast.velocity, glm::vec2(0.0f, 3.0f));
}

TEST(ExternalForcesTest, ApplyIntegratesGravityAndPredicts)
{
    SpawnData spawn = pair(glm::vec2(0.0f), glm::vec2(5.0f));
    spawn.velocities[1] = glm::vec2(1.0f, 0.0f);

    ParticleStore store(spawn);
    SimulationParameters params = solverParameters();
    ExternalForces::applyExternalForces(store, params, InteractionInputs(), ParallelExecutor::serial());

    glm::vec2 v0(0.0f, params.gravity * params.delta_time);
    EXPECT_NEAR(store.getVelocities()[0].y, v0.y, 1e-6f);
    EXPECT_NEAR(store.getPredictedPositions()[0].y, v0.y * ExternalForces::PREDICTION_LOOKAHEAD, 1e-6f);
    EXPECT_NEAR(store.getPredictedPositions()[1].x, 5.0f + ExternalForces::PREDICTION_LOOKAHEAD, 1e-5f);

    // Positions only move in the final stage
    EXPECT_EQ(store.getPositions(), spawn.positions);
}

TEST(ForceSolverTest, IsolatedParticleHasOnlySelfDensity)
{
    SpawnData spawn = pair(glm::vec2(0.0f), glm::vec2(10.0f));
    SolverFixture fixture(spawn, solverParameters());
    fixture.prepare(ParallelExecutor::serial());

    const SmoothingKernels &kernels = fixture.solver.getKernels();
    for (const glm::vec2 &density : fixture.store.getDensities())
    {
        EXPECT_FLOAT_EQ(density.x, kernels.densityKernel(0.0f));
        EXPECT_FLOAT_EQ(density.y, kernels.nearDensityKernel(0.0f));
    }
}

TEST(ForceSolverTest, DensityGrowsWithNeighbourCount)
{
    SimulationParameters params = solverParameters();
    float previous = 0.0f;

    for (int neighbours = 0; neighbours <= 6; neighbours++)
    {
        SpawnData spawn;
        spawn.add(glm::vec2(0.0f));
        for (int k = 0; k < neighbours; k++)
        {
            float angle = k * MathUtils::PI / 3.0f;
            spawn.add(glm::vec2(std::cos(angle), std::sin(angle)) * 0.15f);
        }

        SpatialHashIndex hash(spawn.size());
        hash.build(spawn.positions, params.smoothing_radius, ParallelExecutor::serial());

        ForceSolver solver;
        solver.setParameters(params);
        float density = solver.densityAt(glm::vec2(0.0f), spawn.positions, hash).x;

        if (neighbours > 0)
        {
            EXPECT_GT(density, previous) << neighbours << " neighbours";
        }
        previous = density;
    }
}

TEST(ForceSolverTest, EquationOfState)
{
    SimulationParameters params = solverParameters();
    params.target_density = 55.0f;
    params.pressure_multiplier = 500.0f;
    params.near_pressure_multiplier = 18.0f;

    ForceSolver solver;
    solver.setParameters(params);

    EXPECT_FLOAT_EQ(solver.pressureFromDensity(55.0f), 0.0f);
    EXPECT_FLOAT_EQ(solver.pressureFromDensity(60.0f), 2500.0f);
    EXPECT_LT(solver.pressureFromDensity(50.0f), 0.0f);
    EXPECT_FLOAT_EQ(solver.nearPressureFromDensity(2.0f), 36.0f);
}

TEST(ForceSolverTest, PairForceDividesByNeighbourDensity)
{
    SimulationParameters params = solverParameters();
    params.target_density = 0.0f;

    ForceSolver solver;
    solver.setParameters(params);

    glm::vec2 offset(0.1f, 0.0f);
    glm::vec2 dense(40.0f, 10.0f);
    glm::vec2 sparse(20.0f, 5.0f);

    glm::vec2 on_dense = solver.pairPressureForce(offset, 0.1f, dense, sparse);
    glm::vec2 on_sparse = solver.pairPressureForce(-offset, 0.1f, sparse, dense);

    // Both point away from the other particle but are not equal and opposite
    EXPECT_LT(on_dense.x, 0.0f);
    EXPECT_GT(on_sparse.x, 0.0f);
    EXPECT_GT(std::abs(on_dense.x + on_sparse.x), 1e-3f);
    EXPECT_GT(std::abs(on_dense.x), std::abs(on_sparse.x));
}

TEST(ForceSolverTest, CoincidentParticlesStayFinite)
{
    SpawnData spawn = pair(glm::vec2(0.5f), glm::vec2(0.5f));
    SolverFixture fixture(spawn, solverParameters());
    ParallelExecutor executor = ParallelExecutor::serial();

    fixture.prepare(executor);
    fixture.solver.applyPressureForces(fixture.store, fixture.hash, executor);
    fixture.solver.applyViscosity(fixture.store, fixture.hash, executor);
    fixture.solver.updatePositions(fixture.store, executor);

    glm::vec2 direction = fixture.solver.pairPressureForce(glm::vec2(0.0f), 0.0f, glm::vec2(1.0f), glm::vec2(1.0f));
    EXPECT_EQ(direction.x, 0.0f);
    EXPECT_TRUE(MathUtils::isFinite(direction));

    for (size_t i = 0; i < fixture.store.size(); i++)
    {
        EXPECT_TRUE(MathUtils::isFinite(fixture.store.getVelocities()[i]));
        EXPECT_TRUE(MathUtils::isFinite(fixture.store.getPositions()[i]));
        EXPECT_TRUE(std::isfinite(fixture.store.getDensities()[i].x));
    }
}

TEST(ForceSolverTest, OverdensePairIsPushedApart)
{
    SimulationParameters params = solverParameters();
    params.target_density = 0.0f;

    SpawnData spawn = pair(glm::vec2(0.0f), glm::vec2(0.1f, 0.0f));
    SolverFixture fixture(spawn, params);
    fixture.prepare(ParallelExecutor::serial());
    fixture.solver.applyPressureForces(fixture.store, fixture.hash, ParallelExecutor::serial());

    const auto &positions = fixture.store.getPositions();
    const auto &velocities = fixture.store.getVelocities();
    size_t left = positions[0].x < positions[1].x ? 0 : 1;
    size_t right = 1 - left;

    EXPECT_LT(velocities[left].x, 0.0f);
    EXPECT_GT(velocities[right].x, 0.0f);
}

TEST(ForceSolverTest, ViscosityPullsVelocitiesTogether)
{
    SimulationParameters params = solverParameters();
    params.viscosity_strength = 1.0f;

    SpawnData spawn = pair(glm::vec2(0.0f), glm::vec2(0.1f, 0.0f));
    spawn.velocities[0] = glm::vec2(0.0f, 1.0f);
    spawn.velocities[1] = glm::vec2(0.0f, -1.0f);

    SolverFixture fixture(spawn, params);
    fixture.prepare(ParallelExecutor::serial());
    fixture.solver.applyViscosity(fixture.store, fixture.hash, ParallelExecutor::serial());

    const auto &velocities = fixture.store.getVelocities();
    EXPECT_LT(std::abs(velocities[0].y), 1.0f);
    EXPECT_LT(std::abs(velocities[1].y), 1.0f);
    EXPECT_NEAR(velocities[0].y + velocities[1].y, 0.0f, 1e-5f);
}

TEST(ForceSolverTest, StagesMatchAcrossExecutors)
{
    SpawnData spawn = createParticleBlock(glm::vec2(0.0f), glm::vec2(2.0f, 1.0f), 600, 0.01f, 5);
    SimulationParameters params = solverParameters();

    SolverFixture serial(spawn, params);
    SolverFixture parallel(spawn, params);
    ParallelExecutor serial_executor = ParallelExecutor::serial();
    ParallelExecutor parallel_executor(true, 4);

    serial.prepare(serial_executor);
    parallel.prepare(parallel_executor);

    // Slot order inside a bucket may differ, so compare per-particle results by position
    serial.solver.applyPressureForces(serial.store, serial.hash, serial_executor);
    parallel.solver.applyPressureForces(parallel.store, parallel.hash, parallel_executor);

    for (size_t i = 0; i < serial.store.size(); i++)
    {
        glm::vec2 pos = serial.store.getPositions()[i];
        bool matched = false;
        for (size_t j = 0; j < parallel.store.size() && !matched; j++)
        {
            if (parallel.store.getPositions()[j] != pos)
                continue;
            matched = true;
            EXPECT_NEAR(serial.store.getDensities()[i].x, parallel.store.getDensities()[j].x, 1e-3f);
            EXPECT_NEAR(serial.store.getVelocities()[i].x, parallel.store.getVelocities()[j].x, 1e-2f);
            EXPECT_NEAR(serial.store.getVelocities()[i].y, parallel.store.getVelocities()[j].y, 1e-2f);
        }
        EXPECT_TRUE(matched);
    }
}

TEST(ForceSolverTest, SetParametersRebuildsKernels)
{
    ForceSolver solver;
    SimulationParameters params = solverParameters();
    params.smoothing_radius = 0.8f;
    solver.setParameters(params);

    EXPECT_FLOAT_EQ(solver.getKernels().getRadius(), 0.8f);
    EXPECT_FLOAT_EQ(solver.getParameters().smoothing_radius, 0.8f);
}
