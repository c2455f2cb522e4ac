#include "config.hh"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace TideSim
{

namespace
{

std::string trim(const std::string &text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        end--;
    return text.substr(begin, end - begin);
}

bool parseFloat(const std::string &value, float &out)
{
    std::istringstream stream(value);
    float parsed;
    if (!(stream >> parsed))
        return false;
    stream >> std::ws;
    if (!stream.eof())
        return false;
    out = parsed;
    return true;
}

bool parseInt(const std::string &value, int &out)
{
    std::istringstream stream(value);
    int parsed;
    if (!(stream >> parsed))
        return false;
    stream >> std::ws;
    if (!stream.eof())
        return false;
    out = parsed;
    return true;
}

bool parseBool(const std::string &value, bool &out)
{
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
    {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
    {
        out = false;
        return true;
    }
    return false;
}

enum class SettingType
{
    FLOAT,
    INT,
    BOOL
};

struct SettingEntry
{
    const char *key;
    SettingType type;
    void *target;
};

// Keys understood by loadFromFile/saveToFile, in file order
std::vector<SettingEntry> settingTable(SimulationConfig &config)
{
    return {
        {"gravity", SettingType::FLOAT, &config.gravity},
        {"smoothing_radius", SettingType::FLOAT, &config.smoothing_radius},
        {"target_density", SettingType::FLOAT, &config.target_density},
        {"pressure_multiplier", SettingType::FLOAT, &config.pressure_multiplier},
        {"near_pressure_multiplier", SettingType::FLOAT, &config.near_pressure_multiplier},
        {"viscosity_strength", SettingType::FLOAT, &config.viscosity_strength},
        {"enable_boundary_collision", SettingType::BOOL, &config.enable_boundary_collision},
        {"collision_damping", SettingType::FLOAT, &config.collision_damping},
        {"boundary_margin", SettingType::FLOAT, &config.boundary_margin},
        {"boundary_collision_strength", SettingType::FLOAT, &config.boundary_collision_strength},
        {"invert_boundary", SettingType::BOOL, &config.invert_boundary},
        {"time_scale", SettingType::FLOAT, &config.time_scale},
        {"max_timestep_fps", SettingType::FLOAT, &config.max_timestep_fps},
        {"iterations_per_frame", SettingType::INT, &config.iterations_per_frame},
        {"interaction_radius", SettingType::FLOAT, &config.interaction_radius},
        {"interaction_strength", SettingType::FLOAT, &config.interaction_strength},
        {"player_radius", SettingType::FLOAT, &config.player.radius},
        {"player_displacement_strength", SettingType::FLOAT, &config.player.displacement_strength},
        {"player_mirrored_strength", SettingType::FLOAT, &config.player.mirrored_strength},
        {"player_movement_multiplier", SettingType::FLOAT, &config.player.movement_multiplier},
        {"player_velocity_transfer", SettingType::FLOAT, &config.player.velocity_transfer},
        {"enable_parallel_processing", SettingType::BOOL, &config.enable_parallel_processing},
        {"cpu_thread_count", SettingType::INT, &config.cpu_thread_count},
        {"debug_mode", SettingType::BOOL, &config.debug_mode},
        {"print_performance_stats", SettingType::BOOL, &config.print_performance_stats},
        {"stats_update_frequency", SettingType::INT, &config.stats_update_frequency},
    };
}

} // namespace

SimulationConfig SimulationConfig::fromPreset(const std::string &preset_name)
{
    if (preset_name == "default")
        return getDefaultConfig();
    if (preset_name == "viscous")
        return getViscousConfig();
    if (preset_name == "splashy")
        return getSplashyConfig();
    if (preset_name == "debug")
        return getDebugConfig();

    std::cerr << "Unknown preset '" << preset_name << "', using default configuration" << std::endl;
    return getDefaultConfig();
}

std::vector<std::string> SimulationConfig::presetNames()
{
    return {"default", "viscous", "splashy", "debug"};
}

bool SimulationConfig::validate(std::string *reason) const
{
    auto fail = [reason](const std::string &message) {
        if (reason)
            *reason = message;
        return false;
    };

    if (!(smoothing_radius > 0.0f))
        return fail("smoothing_radius must be positive");
    if (iterations_per_frame <= 0)
        return fail("iterations_per_frame must be positive");
    if (target_density < 0.0f)
        return fail("target_density must not be negative");
    if (time_scale < 0.0f)
        return fail("time_scale must not be negative");
    if (boundary_margin < 0.0f)
        return fail("boundary_margin must not be negative");
    if (collision_damping < 0.0f || collision_damping > 1.0f)
        return fail("collision_damping must be within [0, 1]");
    if (interaction_radius < 0.0f || player.radius < 0.0f)
        return fail("interaction radii must not be negative");
    if (stats_update_frequency <= 0)
        return fail("stats_update_frequency must be positive");
    return true;
}

SimulationParameters SimulationConfig::toParameters(float substep_dt) const
{
    SimulationParameters params;
    params.gravity = gravity;
    params.delta_time = substep_dt;
    params.smoothing_radius = smoothing_radius;
    params.target_density = target_density;
    params.pressure_multiplier = pressure_multiplier;
    params.near_pressure_multiplier = near_pressure_multiplier;
    params.viscosity_strength = viscosity_strength;
    params.collision_damping = collision_damping;
    params.boundary_margin = boundary_margin;
    params.boundary_collision_strength = boundary_collision_strength;
    params.invert_boundary = invert_boundary;
    return params;
}

float SimulationConfig::clampFrameTime(float frame_dt) const
{
    float max_delta_time =
        max_timestep_fps > 0.0f ? 1.0f / max_timestep_fps : std::numeric_limits<float>::infinity();
    return std::min(frame_dt * time_scale, max_delta_time);
}

bool SimulationConfig::applySetting(const std::string &key, const std::string &value)
{
    for (const SettingEntry &entry : settingTable(*this))
    {
        if (key != entry.key)
            continue;

        switch (entry.type)
        {
        case SettingType::FLOAT:
            return parseFloat(value, *static_cast<float *>(entry.target));
        case SettingType::INT:
            return parseInt(value, *static_cast<int *>(entry.target));
        case SettingType::BOOL:
            return parseBool(value, *static_cast<bool *>(entry.target));
        }
    }

    std::cerr << "Ignoring unknown configuration key: " << key << std::endl;
    return true;
}

bool SimulationConfig::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file)
    {
        std::cerr << "Could not open configuration file: " << filename << std::endl;
        return false;
    }

    // Parse into a copy so a failed load leaves this config untouched
    SimulationConfig loaded = *this;
    std::string line;
    int line_number = 0;

    while (std::getline(file, line))
    {
        line_number++;

        size_t comment = line.find('#');
        if (comment != std::string::npos)
            line.erase(comment);

        line = trim(line);
        if (line.empty())
            continue;

        size_t equals = line.find('=');
        if (equals == std::string::npos)
        {
            std::cerr << filename << ":" << line_number << ": expected 'key = value'" << std::endl;
            return false;
        }

        std::string key = trim(line.substr(0, equals));
        std::string value = trim(line.substr(equals + 1));

        if (!loaded.applySetting(key, value))
        {
            std::cerr << filename << ":" << line_number << ": invalid value '" << value << "' for " << key
                      << std::endl;
            return false;
        }
    }

    *this = loaded;
    std::cout << "Loaded configuration from " << filename << std::endl;
    return true;
}

bool SimulationConfig::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file)
    {
        std::cerr << "Could not write configuration file: " << filename << std::endl;
        return false;
    }

    SimulationConfig copy = *this;
    file << "# TideSim configuration\n";
    for (const SettingEntry &entry : settingTable(copy))
    {
        file << entry.key << " = ";
        switch (entry.type)
        {
        case SettingType::FLOAT:
            file << std::setprecision(9) << *static_cast<const float *>(entry.target);
            break;
        case SettingType::INT:
            file << *static_cast<const int *>(entry.target);
            break;
        case SettingType::BOOL:
            file << (*static_cast<const bool *>(entry.target) ? "true" : "false");
            break;
        }
        file << "\n";
    }

    return static_cast<bool>(file);
}

void SimulationConfig::printConfiguration() const
{
    std::cout << "=== Configuration Summary ===" << std::endl;
    std::cout << "Smoothing radius: " << smoothing_radius << std::endl;
    std::cout << "Target density: " << target_density << std::endl;
    std::cout << "Pressure: " << pressure_multiplier << " (near " << near_pressure_multiplier << ")" << std::endl;
    std::cout << "Viscosity: " << viscosity_strength << std::endl;
    std::cout << "Gravity: " << gravity << std::endl;
    std::cout << "Iterations per frame: " << iterations_per_frame << std::endl;
    std::cout << "Boundary collision: " << (enable_boundary_collision ? "Yes" : "No")
              << (invert_boundary ? " (inverted)" : "") << std::endl;
    std::cout << "Parallel: " << (enable_parallel_processing ? "Yes" : "No") << std::endl;
}

} // namespace TideSim
