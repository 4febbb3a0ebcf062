//==============================================================================
// main.cpp
// Entry point for running Vlasov–Ampère simulations.
// Modes:
//   - Single run (default) over one JSON config.
//   - Benchmark mode (repeat runs and write timing summary).
//
// Parallel backend (compile-time):
//   USE_OPENMP : shared-memory threading inside each step
//==============================================================================

#include "common.hpp"
#include "SimulationConfig.hpp"
#include "VlasovSimulation.hpp"

int main(int argc, char* argv[])
{
    //--------------------------------------------------------------------------
    // CLI flags (defaults)
    //   -i/--input-path <path>      : JSON input
    //   -b/--benchmark              : enable benchmark mode
    //   --benchmark-repetitions <n> : repetitions for benchmark (default 3)
    //--------------------------------------------------------------------------
    bool benchmark = false;
    int  benchmark_repetitions = 3;
    std::string inputPath{"data/landau_damping.json"};

    try
    {
        // Parse CLI args (very lightweight; no error if unknown flag)
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--input-path" || arg == "-i")
            {
                // Expect a path argument right after the flag
                if (i+1 < argc) { inputPath = std::string(argv[++i]); }
            }
            else if (arg == "--benchmark" || arg == "-b")
            {
                benchmark = true;
            }
            else if (arg == "--benchmark-repetitions")
            {
                benchmark = true;
                if (i+1 < argc) { benchmark_repetitions = std::stoi(argv[++i]); }
            }
        }

        // Fail fast if file does not exist
        if (!std::filesystem::exists(inputPath))
        {
            throw std::invalid_argument("Invalid simulation input path: " + inputPath);
        }

        //--------------------------------------------------------------------------
        // Derive data directory from input file (absolute path, parent folder).
        // Used to store outputs (results, snapshots, benchmark_*.json).
        //--------------------------------------------------------------------------
        std::filesystem::path dataPath(inputPath);
        dataPath = std::filesystem::absolute(dataPath);
        dataPath = dataPath.parent_path();

        SimulationConfig config = SimulationConfig::loadFromJson(inputPath);

        //======================================================================
        // BENCHMARK MODE
        // Repeat runs to collect timing statistics into a JSON file.
        // Output filename encodes backend and resources (threads).
        //======================================================================
        if (benchmark)
        {
            json benchmark_results;

            // Header metadata
            benchmark_results["Nx"] = config.Nx;
            benchmark_results["Nv"] = config.Nv;
            benchmark_results["NSteps"] = config.NSteps;
            benchmark_results["Repetitions"] = benchmark_repetitions;

            #if defined(USE_OPENMP)
            benchmark_results["Kind"] = "OpenMP";
            benchmark_results["Threads"] = omp_get_max_threads();
            auto benchmarkOutputPath = dataPath / ("benchmark_" + std::to_string(config.Nx) + "x"
                                       + std::to_string(config.Nv) + "_OpenMP_"
                                       + std::to_string(omp_get_max_threads()) + ".json");
            #else
            benchmark_results["Kind"] = "Serial";
            benchmark_results["Threads"] = 1;
            auto benchmarkOutputPath = dataPath / ("benchmark_" + std::to_string(config.Nx) + "x"
                                       + std::to_string(config.Nv) + "_Serial.json");
            #endif

            std::cout << "Starting benchmark run for " << config.Nx << "x" << config.Nv << " mesh.\n\n";

            // Repetitions: collect per-run data under stringified index keys
            for (int i=0; i<benchmark_repetitions; ++i)
            {
                std::cout << "Repetition " << i+1 << "/" << benchmark_repetitions << "\n\n";

                VlasovSimulation simulation(config, dataPath, benchmark);
                Diagnostics diagnostics(simulation.spatialMesh(), simulation.velocityMesh());
                simulation.run(diagnostics, &benchmark_results[std::to_string(i)]);
            }

            std::cout << "Benchmark result stored in file: " << benchmarkOutputPath << "\n\n";
            OutputWriter::writeJsonToFile(benchmarkOutputPath.string(), benchmark_results);
        }
        //======================================================================
        // SINGLE RUN
        // Load one SimulationConfig, run it, and write the diagnostics JSON
        // next to the input file.
        //======================================================================
        else
        {
            if (config.Verbose) config.print_config();
            std::cout << "Starting single run.\n\n";

            VlasovSimulation simulation(config, dataPath);
            Diagnostics diagnostics(simulation.spatialMesh(), simulation.velocityMesh());
            json result = simulation.run(diagnostics);

            auto resultPath = dataPath / config.ResultFile;
            std::cout << "Result stored in file: " << resultPath << "\n\n";
            OutputWriter::writeJsonToFile(resultPath.string(), result);
        }

        std::cout << "Simulation finished successfully.\n\n";
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return 1;
    }
}
