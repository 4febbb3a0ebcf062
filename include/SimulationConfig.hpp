#pragma once
/**
 * @file SimulationConfig.hpp
 * @brief Lightweight data structure for loading simulation parameters.
 *
 * @details
 * **SimulationConfig**: POD-style container that initializes itself from a JSON
 * object (or file) and exposes all parameters required by the solver stack
 * (meshes, time stepping, initial condition, external drive, output).
 */

#include "common.hpp"
#include "InitialConditionGenerator.hpp"
#include "ExternalField.hpp"

/**
 * @struct SimulationConfig
 * @brief Single-simulation configuration.
 *
 * @section fields Key Fields
 * - `Nx/XMin/XMax`   : Spatial mesh (periodic, XMax excluded).
 * - `Nv/VMin/VMax`   : Velocity mesh (VMax excluded).
 * - `FinalTime`      : Total simulated time.
 * - `NSteps`         : Number of time steps, dt = FinalTime/NSteps.
 * - `Verbose`        : Progress printing.
 * - `InitialProfile/Epsilon/Wavenumber/Drift` : Initial distribution.
 * - `ExternalFieldType/Drive` : External field ("None" or "Drive").
 * - `ResultFile`     : Diagnostics JSON, relative to the input file folder.
 * - `SnapshotEvery`  : Write E and f every n steps (0 disables snapshots).
 * - `FitStart/FitEnd`: Time window of the damping-rate fit.
 */
struct SimulationConfig
{
    size_t Nx, Nv;
    real_t XMin, XMax, VMin, VMax;
    real_t FinalTime;
    size_t NSteps;
    bool   Verbose;
    Profile InitialProfile;
    real_t Epsilon, Wavenumber, Drift;
    std::string ExternalFieldType {"None"};
    DriveParameters Drive;
    std::string ResultFile {"result.json"};
    size_t SnapshotEvery {0};
    real_t FitStart {0.0};
    real_t FitEnd {std::numeric_limits<real_t>::max()};

    /**
     * @brief Construct from a JSON object.
     *
     * Expected layout ("External_Field", "Output", "Analysis" are optional):
     * ```
     * {
     *   "Nx": ..., "XMin": ..., "XMax": ...,
     *   "Nv": ..., "VMin": ..., "VMax": ...,
     *   "FinalTime": ..., "NSteps": ..., "Verbose": ...,
     *   "Initial_Conditions": {
     *     "Type": "Landau" | "TwoStream", "Epsilon": ..., "Wavenumber": ..., "Drift": ...
     *   },
     *   "External_Field": {
     *     "Type": "None" | "Drive", "Amplitude": ..., "Wavenumber": ..., "Frequency": ...,
     *     "RampOn": ..., "RampOff": ..., "RampWidth": ...
     *   },
     *   "Output": { "ResultFile": ..., "SnapshotEvery": ... },
     *   "Analysis": { "FitStart": ..., "FitEnd": ... }
     * }
     * ```
     * @throws nlohmann::json::exception on missing or ill-typed keys.
     * @throws std::invalid_argument on out-of-range values.
     */
    SimulationConfig(json simConfigIn)
    {
        long nx = simConfigIn["Nx"];
        long nv = simConfigIn["Nv"];
        long nsteps = simConfigIn["NSteps"];

        if (nx < 1 || nv < 1)
        {
            throw std::invalid_argument("Nx and Nv must be positive!");
        }
        if (nsteps < 1)
        {
            throw std::invalid_argument("NSteps must be positive!");
        }

        Nx = static_cast<size_t>(nx);
        Nv = static_cast<size_t>(nv);
        NSteps = static_cast<size_t>(nsteps);
        XMin = simConfigIn["XMin"];
        XMax = simConfigIn["XMax"];
        VMin = simConfigIn["VMin"];
        VMax = simConfigIn["VMax"];
        FinalTime = simConfigIn["FinalTime"];
        Verbose = simConfigIn["Verbose"];

        json& ic = simConfigIn["Initial_Conditions"];
        InitialProfile = InitialConditionGenerator::parseProfile(ic["Type"].get<std::string>());
        Epsilon = ic["Epsilon"];
        Wavenumber = ic["Wavenumber"];
        Drift = ic.contains("Drift") ? ic["Drift"].get<real_t>() : 0.0;

        if (simConfigIn.contains("External_Field"))
        {
            json& ext = simConfigIn["External_Field"];
            ExternalFieldType = ext["Type"].get<std::string>();

            if (ExternalFieldType == "Drive")
            {
                Drive.Amplitude = ext["Amplitude"];
                Drive.Wavenumber = ext["Wavenumber"];
                Drive.Frequency = ext["Frequency"];
                Drive.RampOn = ext["RampOn"];
                Drive.RampOff = ext["RampOff"];
                Drive.RampWidth = ext["RampWidth"];
            }
        }

        if (simConfigIn.contains("Output"))
        {
            json& out = simConfigIn["Output"];
            if (out.contains("ResultFile")) ResultFile = out["ResultFile"].get<std::string>();
            if (out.contains("SnapshotEvery"))
            {
                long every = out["SnapshotEvery"];
                if (every < 0)
                {
                    throw std::invalid_argument("SnapshotEvery must not be negative!");
                }
                SnapshotEvery = static_cast<size_t>(every);
            }
        }

        if (simConfigIn.contains("Analysis"))
        {
            json& analysis = simConfigIn["Analysis"];
            if (analysis.contains("FitStart")) FitStart = analysis["FitStart"];
            if (analysis.contains("FitEnd")) FitEnd = analysis["FitEnd"];
        }

        validate();
    }

    /**
     * @brief Check domain extents, time parameters and the external field.
     * @throws std::invalid_argument on the first violated constraint.
     */
    void validate() const
    {
        if (!(XMax > XMin)) throw std::invalid_argument("XMax must be larger than XMin!");
        if (!(VMax > VMin)) throw std::invalid_argument("VMax must be larger than VMin!");
        if (!(FinalTime > 0.0)) throw std::invalid_argument("FinalTime must be positive!");
        // Rejects unknown types and drive ramps that are on at t = 0
        ExternalField::fromName(ExternalFieldType, Drive);
    }

    /// Time step FinalTime/NSteps.
    real_t timeStep() const { return FinalTime / static_cast<real_t>(NSteps); }

    /**
     * @brief Load configuration from a JSON file.
     * @throws std::runtime_error if file cannot be opened.
     */
    static SimulationConfig loadFromJson(const std::string& filename)
    {
        std::ifstream inFile(filename);
        if (!inFile)
        {
            throw std::runtime_error("Could not open config file: " + filename);
        }

        json j;
        inFile >> j;

        return SimulationConfig(j);
    }

    /// Print a human-readable configuration summary to stdout.
    void print_config() const
    {
        std::cout << "Simulation configuration:" << std::endl;
        std::cout << "Nx: " << Nx << " on [" << XMin << ", " << XMax << ")" << std::endl;
        std::cout << "Nv: " << Nv << " on [" << VMin << ", " << VMax << ")" << std::endl;
        std::cout << "FinalTime: " << FinalTime << std::endl;
        std::cout << "NSteps: " << NSteps << " (dt = " << timeStep() << ")" << std::endl;
        std::cout << "InitialProfile: " << (InitialProfile == Profile::Landau ? "Landau" : "TwoStream") << std::endl;
        std::cout << "Epsilon: " << Epsilon << std::endl;
        std::cout << "Wavenumber: " << Wavenumber << std::endl;
        std::cout << "Drift: " << Drift << std::endl;
        std::cout << "ExternalField: " << ExternalFieldType << std::endl;
        if (ExternalFieldType == "Drive")
        {
            std::cout << "  Amplitude: " << Drive.Amplitude << ", k: " << Drive.Wavenumber
                      << ", omega: " << Drive.Frequency << std::endl;
            std::cout << "  Ramp: [" << Drive.RampOn << ", " << Drive.RampOff
                      << "], width " << Drive.RampWidth << std::endl;
        }
        std::cout << "ResultFile: " << ResultFile << std::endl;
        std::cout << "SnapshotEvery: " << SnapshotEvery << std::endl;
    }
};
