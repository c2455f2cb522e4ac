#pragma once
#include <string>
#include <vector>

namespace TideSim
{

/**
 * Read-only parameter block handed to every stage of a substep.
 * Derived from SimulationConfig once per substep.
 */
struct SimulationParameters
{
    float gravity = -12.0f;
    float delta_time = 1.0f / 180.0f; // substep dt
    float smoothing_radius = 0.35f;
    float target_density = 55.0f;
    float pressure_multiplier = 500.0f;
    float near_pressure_multiplier = 18.0f;
    float viscosity_strength = 0.06f;
    float collision_damping = 0.95f;
    float boundary_margin = 0.2f;
    float boundary_collision_strength = 1.5f;
    bool invert_boundary = false;
};

/**
 * How a coupled player body is turned into a nudge interactor
 */
struct PlayerInteractionSettings
{
    float radius = 3.0f;                 // Area of influence around the player
    float displacement_strength = 5.0f;  // Normal state, pushes fluid away
    float mirrored_strength = 8.0f;      // Mirrored state, pulls or pushes depending on speed
    float movement_multiplier = 1.5f;    // Applied while the player is moving
    float velocity_transfer = 2.0f;      // How much of the player's velocity drags nearby fluid
};

/**
 * Global simulation configuration
 * Contains all parameters for physics, timing, interaction and diagnostics
 */
struct SimulationConfig
{
    // === PHYSICS PARAMETERS ===

    // SPH Core Parameters
    float gravity = -12.0f;
    float smoothing_radius = 0.35f;
    float target_density = 55.0f;
    float pressure_multiplier = 500.0f;
    float near_pressure_multiplier = 18.0f;
    float viscosity_strength = 0.06f;

    // Boundary Parameters
    bool enable_boundary_collision = true;
    float collision_damping = 0.95f;          // Velocity kept after a bounce (0-1)
    float boundary_margin = 0.2f;             // Distance at which particles start reacting
    float boundary_collision_strength = 1.5f; // Stronger response prevents leaking
    bool invert_boundary = false;             // true = fluid lives outside the polygon

    // === TIMING ===
    float time_scale = 1.0f;
    float max_timestep_fps = 60.0f; // Frame dt never exceeds 1/max_timestep_fps (<= 0 disables)
    int iterations_per_frame = 3;

    // === INTERACTION ===
    float interaction_radius = 2.0f;
    float interaction_strength = 90.0f;
    PlayerInteractionSettings player;

    // === PERFORMANCE PARAMETERS ===
    bool enable_parallel_processing = true;
    int cpu_thread_count = -1; // -1 for auto-detect

    // === DEBUG PARAMETERS ===
    bool debug_mode = false;
    bool print_performance_stats = true;
    int stats_update_frequency = 60; // frames

    // === PRESETS ===

    static SimulationConfig getDefaultConfig()
    {
        return SimulationConfig{};
    }

    static SimulationConfig getViscousConfig()
    {
        SimulationConfig config;
        config.viscosity_strength = 0.4f;
        config.collision_damping = 0.6f;
        config.near_pressure_multiplier = 12.0f;
        return config;
    }

    static SimulationConfig getSplashyConfig()
    {
        SimulationConfig config;
        config.viscosity_strength = 0.01f;
        config.pressure_multiplier = 600.0f;
        config.collision_damping = 0.98f;
        config.iterations_per_frame = 4;
        return config;
    }

    static SimulationConfig getDebugConfig()
    {
        SimulationConfig config;
        config.debug_mode = true;
        config.enable_parallel_processing = false;
        config.print_performance_stats = true;
        config.stats_update_frequency = 10;
        return config;
    }

    static SimulationConfig fromPreset(const std::string &preset_name);
    static std::vector<std::string> presetNames();

    // Configuration validation, fills reason when given
    bool validate(std::string *reason = nullptr) const;

    // Substep parameter block for the given substep dt
    SimulationParameters toParameters(float substep_dt) const;

    // Effective frame dt after time scaling and the max-timestep clamp
    float clampFrameTime(float frame_dt) const;

    // Configuration I/O (key = value text)
    bool loadFromFile(const std::string &filename);
    bool saveToFile(const std::string &filename) const;
    bool applySetting(const std::string &key, const std::string &value);
    void printConfiguration() const;
};

/**
 * Runtime statistics gathered by the simulator
 */
struct RuntimeStats
{
    float accumulated_time;
    int total_frames;
    long long total_steps;
    float last_frame_physics_ms;
    float average_step_ms;

    RuntimeStats()
    {
        reset();
    }

    void reset()
    {
        accumulated_time = 0.0f;
        total_frames = 0;
        total_steps = 0;
        last_frame_physics_ms = 0.0f;
        average_step_ms = 0.0f;
    }
};

} // namespace TideSim
