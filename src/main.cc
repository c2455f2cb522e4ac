#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

// Our simulation components
#include "core/fluid_sim.hh"
#include "core/particle.hh"
#include "physics/collision.hh"
#include "utils/config.hh"
#include "utils/math_utils.hh"

// Namespace usage
using namespace TideSim;

// === COMMAND LINE ARGUMENT PARSING ===
struct CommandLineArgs
{
    std::string config_preset = "default";
    std::string config_file;
    std::string save_config_file;
    std::string boundary_file;
    std::string dump_file;
    int frames = 600;
    int particles = 1200;
    int threads = -1;
    bool serial = false;
    bool help = false;
    bool list_presets = false;
    bool valid = true;

    void parse(int argc, char *argv[])
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--help" || arg == "-h")
            {
                help = true;
            }
            else if (arg == "--list-presets")
            {
                list_presets = true;
            }
            else if (arg == "--serial")
            {
                serial = true;
            }
            else if ((arg == "--preset" || arg == "-p") && has_value)
            {
                config_preset = argv[++i];
            }
            else if (arg == "--config" && has_value)
            {
                config_file = argv[++i];
            }
            else if (arg == "--save-config" && has_value)
            {
                save_config_file = argv[++i];
            }
            else if (arg == "--boundary" && has_value)
            {
                boundary_file = argv[++i];
            }
            else if (arg == "--dump" && has_value)
            {
                dump_file = argv[++i];
            }
            else if (arg == "--frames" && has_value)
            {
                frames = std::atoi(argv[++i]);
            }
            else if (arg == "--particles" && has_value)
            {
                particles = std::atoi(argv[++i]);
            }
            else if (arg == "--threads" && has_value)
            {
                threads = std::atoi(argv[++i]);
            }
            else
            {
                std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
                valid = false;
            }
        }

        if (frames < 0 || particles <= 0)
        {
            std::cerr << "--frames must be >= 0 and --particles > 0" << std::endl;
            valid = false;
        }
    }

    void printHelp() const
    {
        std::cout << "Usage: tidesim_headless [OPTIONS]\n" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --preset, -p <name>    Use configuration preset (default: default)" << std::endl;
        std::cout << "  --config <file>        Load settings from a key = value file" << std::endl;
        std::cout << "  --save-config <file>   Write the effective settings and continue" << std::endl;
        std::cout << "  --boundary <file>      Boundary polygon, one 'x y' point per line" << std::endl;
        std::cout << "  --frames <n>           Frames to simulate at 60 Hz (default: 600)" << std::endl;
        std::cout << "  --particles <n>        Particle count (default: 1200)" << std::endl;
        std::cout << "  --threads <n>          OpenMP worker threads (default: auto)" << std::endl;
        std::cout << "  --serial               Run every stage on the calling thread" << std::endl;
        std::cout << "  --dump <file>          Write the final particle state as CSV" << std::endl;
        std::cout << "  --list-presets         List available configuration presets" << std::endl;
        std::cout << "  --help, -h             Show this help message" << std::endl;
        std::cout << "\nExamples:" << std::endl;
        std::cout << "  ./tidesim_headless                         # Dam break with default settings" << std::endl;
        std::cout << "  ./tidesim_headless -p viscous --frames 300 # Thick fluid, 5 seconds" << std::endl;
        std::cout << "  ./tidesim_headless --dump final.csv        # Keep the final state" << std::endl;
    }

    void printPresets() const
    {
        std::cout << "Available Configuration Presets:\n" << std::endl;
        std::cout << "default" << std::endl;
        std::cout << "   - Balanced water-like settings, 3 substeps per frame\n" << std::endl;
        std::cout << "viscous" << std::endl;
        std::cout << "   - High viscosity, soft bounces\n" << std::endl;
        std::cout << "splashy" << std::endl;
        std::cout << "   - Low viscosity, stiffer pressure, 4 substeps per frame\n" << std::endl;
        std::cout << "debug" << std::endl;
        std::cout << "   - Serial execution with frequent diagnostics\n" << std::endl;
    }
};

// === APPLICATION ===
class FluidSimulationApp
{
  private:
    std::unique_ptr<FluidSimulator> simulator;
    SimulationConfig config;
    BoundaryPolygon boundary;

    MathUtils::MovingAverage<float> frame_time_average;
    MathUtils::Timer run_timer;
    int frame_count;
    float wall_time_ms;

  public:
    FluidSimulationApp() : frame_time_average(60), frame_count(0), wall_time_ms(0.0f)
    {
    }

    bool initialize(const CommandLineArgs &args)
    {
        printHeader();

        if (!loadConfiguration(args))
            return false;
        if (!loadBoundary(args))
            return false;

        createInitialScene(args);
        printInitializationSummary();
        return true;
    }

    void run(int frames)
    {
        const float frame_dt = 1.0f / 60.0f;
        std::cout << "\nStarting simulation loop (" << frames << " frames)...\n" << std::endl;

        run_timer.start();
        for (int i = 0; i < frames; i++)
        {
            MathUtils::Timer frame_timer;
            frame_timer.start();

            simulator->update(frame_dt);

            frame_time_average.addValue(frame_timer.stop());
            frame_count++;

            if (frame_count % 120 == 0)
            {
                printRuntimeStatus();
            }
        }
        wall_time_ms = run_timer.stop();

        printShutdownSummary();
    }

    bool dumpParticles(const std::string &filename) const
    {
        std::ofstream file(filename);
        if (!file)
        {
            std::cerr << "Could not write particle dump: " << filename << std::endl;
            return false;
        }

        file << "x,y,vx,vy,density,near_density\n";
        for (const Particle &p : simulator->snapshot())
        {
            file << p.position.x << "," << p.position.y << "," << p.velocity.x << "," << p.velocity.y << ","
                 << p.density << "," << p.near_density << "\n";
        }

        std::cout << "Wrote " << simulator->getParticleCount() << " particles to " << filename << std::endl;
        return static_cast<bool>(file);
    }

  private:
    bool loadConfiguration(const CommandLineArgs &args)
    {
        std::cout << "Loading configuration preset: '" << args.config_preset << "'" << std::endl;
        config = SimulationConfig::fromPreset(args.config_preset);

        if (!args.config_file.empty() && !config.loadFromFile(args.config_file))
        {
            std::cerr << "Failed to load configuration: " << args.config_file << std::endl;
            return false;
        }

        if (args.serial)
            config.enable_parallel_processing = false;
        if (args.threads > 0)
            config.cpu_thread_count = args.threads;

        std::string reason;
        if (!config.validate(&reason))
        {
            std::cerr << "Configuration validation failed: " << reason << std::endl;
            return false;
        }

        if (!args.save_config_file.empty())
        {
            if (!config.saveToFile(args.save_config_file))
                return false;
            std::cout << "Saved configuration to " << args.save_config_file << std::endl;
        }

        return true;
    }

    bool loadBoundary(const CommandLineArgs &args)
    {
        if (args.boundary_file.empty())
        {
            // Default tank
            boundary = BoundaryPolygon::makeRectangle(glm::vec2(-8.0f, -4.5f), glm::vec2(8.0f, 4.5f));
            return true;
        }

        return BoundaryPolygon::loadFromFile(args.boundary_file, boundary);
    }

    void createInitialScene(const CommandLineArgs &args)
    {
        std::cout << "Creating dam break scene..." << std::endl;

        // Column of fluid against the left wall, spaced for the target density
        float area = static_cast<float>(args.particles) / config.target_density;
        float height = 6.0f;
        float width = area / height;
        glm::vec2 center(-7.5f + width * 0.5f, -4.0f + height * 0.5f);

        SpawnData spawn = createParticleBlock(center, glm::vec2(width, height), static_cast<size_t>(args.particles),
                                              0.02f, 42u);

        simulator = std::make_unique<FluidSimulator>(config, spawn, boundary);
        std::cout << "   Created " << simulator->getParticleCount() << " particles" << std::endl;
    }

    void printRuntimeStatus() const
    {
        std::cout << "\n=== Runtime Status === (Frame " << frame_count << ")" << std::endl;
        std::cout << "   Frame time: " << std::fixed << std::setprecision(2) << frame_time_average.getAverage()
                  << "ms | Substep: " << simulator->getAverageStepTime() << "ms" << std::endl;
        std::cout << "   Mean density: " << simulator->averageDensity() << " (target " << config.target_density
                  << ")" << std::endl;
        std::cout << "   Simulated time: " << std::setprecision(1) << simulator->getCurrentTime() << "s" << std::endl;
    }

    void printHeader() const
    {
        std::cout << "\n";
        std::cout << "==============================================" << std::endl;
        std::cout << "   TideSim - 2D SPH fluid (headless runner)" << std::endl;
        std::cout << "==============================================" << std::endl;
    }

    void printInitializationSummary() const
    {
        std::cout << "\n=== Initialization Summary ===" << std::endl;
        config.printConfiguration();
        std::cout << "Boundary points: " << boundary.size() << std::endl;
        std::cout << "\nAll systems ready!" << std::endl;
    }

    void printShutdownSummary() const
    {
        std::cout << "\n=== Simulation Summary ===" << std::endl;
        std::cout << "   Total Frames: " << frame_count << std::endl;
        std::cout << "   Total Substeps: " << simulator->getStepCount() << std::endl;
        std::cout << "   Wall Time: " << std::fixed << std::setprecision(1) << wall_time_ms << " ms" << std::endl;
        std::cout << "   Simulated Time: " << std::setprecision(2) << simulator->getCurrentTime() << " s" << std::endl;
        std::cout << "   Final Mean Density: " << simulator->averageDensity() << std::endl;
    }
};

// === MAIN FUNCTION ===
int main(int argc, char *argv[])
{
    CommandLineArgs args;
    args.parse(argc, argv);

    if (args.help)
    {
        args.printHelp();
        return 0;
    }

    if (args.list_presets)
    {
        args.printPresets();
        return 0;
    }

    if (!args.valid)
    {
        args.printHelp();
        return 1;
    }

    try
    {
        FluidSimulationApp app;

        if (!app.initialize(args))
        {
            std::cerr << "Failed to initialize application!" << std::endl;
            return 1;
        }

        app.run(args.frames);

        if (!args.dump_file.empty() && !app.dumpParticles(args.dump_file))
        {
            return 1;
        }

        std::cout << "\nApplication exited successfully" << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nException caught: " << e.what() << std::endl;
        return 1;
    }
}
