//==============================================================================
// test_driver.cpp
// Driver-side collaborators:
//   1) SimulationConfig parsing, defaults and validation.
//   2) InitialConditionGenerator profiles.
//   3) External drive ramp and waveform.
//   4) Diagnostics of a uniform Maxwellian and JSON export.
//   5) VlasovSimulation single run returns diagnostics and a damping fit.
//   6) Snapshot output every n steps and OutputWriter failures.
//==============================================================================

#include "common.hpp"
#include "SimulationConfig.hpp"
#include "InitialConditionGenerator.hpp"
#include "ExternalField.hpp"
#include "Diagnostics.hpp"
#include "VlasovSimulation.hpp"
#include "OutputWriter.hpp"

namespace
{
size_t countLines(const std::filesystem::path& path)
{
    std::ifstream in(path);
    size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) ++lines;
    return lines;
}

json baseConfig()
{
    return json::parse(R"({
        "Nx": 16, "XMin": 0.0, "XMax": 12.566370614359172,
        "Nv": 32, "VMin": -6.0, "VMax": 6.0,
        "FinalTime": 20.0, "NSteps": 200, "Verbose": false,
        "Initial_Conditions": { "Type": "Landau", "Epsilon": 0.001, "Wavenumber": 0.5 }
    })");
}
}

int main()
{
    // -------------------------------------------------------------------------
    // 1) Configuration
    // -------------------------------------------------------------------------
    {
        SimulationConfig config(baseConfig());
        assert(config.Nx == 16 && config.Nv == 32 && config.NSteps == 200);
        assert(almost_equal(config.timeStep(), 0.1, 1e-15));
        assert(config.InitialProfile == Profile::Landau);
        assert(almost_equal(config.Drift, 0.0));
        assert(config.ExternalFieldType == "None");
        assert(config.ResultFile == "result.json");
        assert(config.SnapshotEvery == 0);

        json withDrive = baseConfig();
        withDrive["External_Field"] = {{"Type", "Drive"}, {"Amplitude", 0.2}, {"Wavenumber", 0.5},
                                       {"Frequency", 0.37}, {"RampOn", 5.0}, {"RampOff", 15.0},
                                       {"RampWidth", 1.0}};
        withDrive["Output"] = {{"ResultFile", "out.json"}, {"SnapshotEvery", 10}};
        SimulationConfig driven(withDrive);
        assert(driven.ExternalFieldType == "Drive");
        assert(almost_equal(driven.Drive.Frequency, 0.37));
        assert(driven.ResultFile == "out.json");
        assert(driven.SnapshotEvery == 10);

        auto expectInvalid = [](json j)
        {
            bool thrown = false;
            try { SimulationConfig c(j); } catch (const std::invalid_argument&) { thrown = true; }
            return thrown;
        };

        json bad = baseConfig(); bad["Nx"] = 0;
        assert(expectInvalid(bad));
        bad = baseConfig(); bad["NSteps"] = -3;
        assert(expectInvalid(bad));
        bad = baseConfig(); bad["VMax"] = -6.0;
        assert(expectInvalid(bad));
        bad = baseConfig(); bad["FinalTime"] = 0.0;
        assert(expectInvalid(bad));
        bad = baseConfig(); bad["Initial_Conditions"]["Type"] = "Bump";
        assert(expectInvalid(bad));
        bad = baseConfig(); bad["External_Field"] = {{"Type", "Laser"}};
        assert(expectInvalid(bad));
        bad = baseConfig(); bad["Output"] = {{"SnapshotEvery", -1}};
        assert(expectInvalid(bad));

        // Drive switched on long before t = 0
        bad = withDrive; bad["External_Field"]["RampOn"] = -100.0; bad["External_Field"]["RampOff"] = 300.0;
        assert(expectInvalid(bad));

        bool thrownMissing = false;
        json missing = baseConfig(); missing.erase("Nv");
        try { SimulationConfig c(missing); } catch (const json::exception&) { thrownMissing = true; }
        assert(thrownMissing);
    }

    PeriodicMesh xMesh(0.0, 4*M_PI, 16);
    PeriodicMesh vMesh(-6.0, 6.0, 32);

    // -------------------------------------------------------------------------
    // 2) Initial conditions
    // -------------------------------------------------------------------------
    {
        InitialConditionGenerator landau(Profile::Landau, 0.1, 0.5);
        assert(almost_equal(landau.evaluate(0.0, 0.0), 1.1/std::sqrt(2*M_PI), 1e-14));
        assert(almost_equal(landau.evaluate(2*M_PI, 1.0), 0.9*std::exp(-0.5)/std::sqrt(2*M_PI), 1e-14));

        InitialConditionGenerator twoStream(Profile::TwoStream, 0.0, 0.2, 2.4);
        assert(almost_equal(twoStream.evaluate(1.0, 2.4), twoStream.evaluate(3.0, -2.4), 1e-15));
        assert(twoStream.evaluate(0.0, 2.4) > twoStream.evaluate(0.0, 0.0));

        mat_complex f0 = landau.generate(xMesh, vMesh);
        assert(f0.size() == xMesh.length && f0[0].size() == vMesh.length);
        assert(almost_equal(f0[3][5].real(), landau.evaluate(xMesh.points[3], vMesh.points[5]), 1e-15));
        assert(f0[3][5].imag() == 0.0);

        bool thrown = false;
        try { InitialConditionGenerator::parseProfile("Maxwell"); } catch (const std::invalid_argument&) { thrown = true; }
        assert(thrown);
    }

    // -------------------------------------------------------------------------
    // 3) External field
    // -------------------------------------------------------------------------
    {
        DriveParameters params;
        params.Amplitude = 0.2;
        params.Wavenumber = 0.5;
        params.Frequency = 0.37;
        params.RampOn = 10.0;
        params.RampOff = 40.0;
        params.RampWidth = 2.0;

        assert(almost_equal(ExternalField::rampFactor(params, 0.0), 0.0, 1e-15));
        assert(almost_equal(ExternalField::rampFactor(params, 25.0), 1.0, 1e-5));
        assert(ExternalField::rampFactor(params, 80.0) < 1e-5);

        ExternalFieldGenerator drive = ExternalField::drive(params);
        vec_complex atStart = drive(xMesh.points, 0, 0.1);
        for (auto val : atStart) assert(almost_equal(val, complex_t(0.0), 1e-15));

        const size_t step = 250;
        const real_t t = step*0.1;
        vec_complex mid = drive(xMesh.points, step, 0.1);
        for (size_t i=0; i<xMesh.length; ++i)
        {
            real_t ref = ExternalField::rampFactor(params, t) * 0.2 * std::cos(0.5*xMesh.points[i] - 0.37*t);
            assert(almost_equal(mid[i].real(), ref, 1e-14));
        }

        vec_complex zeros = ExternalField::fromName("None", params)(xMesh.points, 7, 0.1);
        assert(zeros.size() == xMesh.length);
        for (auto val : zeros) assert(val == complex_t(0.0));

        auto rejected = [](const DriveParameters& p)
        {
            bool thrown = false;
            try { ExternalField::drive(p); } catch (const std::invalid_argument&) { thrown = true; }
            return thrown;
        };

        bool thrownName = false;
        try { ExternalField::fromName("Laser", params); } catch (const std::invalid_argument&) { thrownName = true; }
        assert(thrownName);

        DriveParameters noWidth = params;
        noWidth.RampWidth = 0.0;
        assert(rejected(noWidth));

        DriveParameters reversed = params;
        reversed.RampOn = 40.0;
        reversed.RampOff = 10.0;
        assert(rejected(reversed));

        // tanh(100) rounds to 1, g(0) = 1 and the ramp would be 0/0
        DriveParameters alreadyOn = params;
        alreadyOn.RampOn = -100.0;
        alreadyOn.RampOff = 300.0;
        alreadyOn.RampWidth = 1.0;
        assert(rejected(alreadyOn));
        bool thrownByName = false;
        try { ExternalField::fromName("Drive", alreadyOn); } catch (const std::invalid_argument&) { thrownByName = true; }
        assert(thrownByName);

        // Barely on at t = 0 is still a valid ramp
        DriveParameters lateEnough = params;
        lateEnough.RampOn = 5.0;
        lateEnough.RampWidth = 2.0;
        assert(!rejected(lateEnough));
        vec_complex later = ExternalField::drive(lateEnough)(xMesh.points, 100, 0.1);
        for (auto val : later) assert(std::isfinite(val.real()));
    }

    // -------------------------------------------------------------------------
    // 4) Diagnostics of a uniform Maxwellian: mass L, kinetic L/2, no field
    // -------------------------------------------------------------------------
    {
        InitialConditionGenerator uniform(Profile::Landau, 0.0, 0.5);
        mat_complex f0 = uniform.generate(xMesh, vMesh);
        vec_real e(xMesh.length, 0.0);

        Diagnostics diagnostics(xMesh, vMesh);
        diagnostics.record(0, 0.0, e, f0);
        diagnostics.record(1, 0.1, e, f0);

        const real_t L = 4*M_PI;
        assert(diagnostics.size() == 2);
        assert(almost_equal(diagnostics.massSeries()[0], L, 1e-7));
        assert(almost_equal(diagnostics.kineticEnergySeries()[0], 0.5*L, 1e-5));
        assert(diagnostics.fieldEnergySeries()[0] == 0.0);
        assert(almost_equal(diagnostics.totalEnergySeries()[1], diagnostics.kineticEnergySeries()[1]));

        assert((diagnostics.stepSeries() == std::vector<size_t>{0, 1}));

        // ∫ M² dv = 1/(2√π) for the unit Maxwellian M
        assert(almost_equal(diagnostics.l2NormSeries()[0], std::sqrt(L/(2*std::sqrt(M_PI))), 1e-6));

        // Entropy of a Maxwellian: L·(½ ln(2π) + ½)
        assert(almost_equal(diagnostics.entropySeries()[0], L*(0.5*std::log(2*M_PI) + 0.5), 1e-5));

        json out = diagnostics.toJson();
        assert(out["Time"].size() == 2);
        assert(out["Step"][1] == 1);

        bool thrown = false;
        try { diagnostics.record(2, 0.2, vec_real(3, 0.0), f0); } catch (const std::invalid_argument&) { thrown = true; }
        assert(thrown);
        assert(diagnostics.size() == 2);
    }

    // -------------------------------------------------------------------------
    // 5) Full driver run
    // -------------------------------------------------------------------------
    {
        SimulationConfig config(baseConfig());
        VlasovSimulation simulation(config, std::filesystem::temp_directory_path());
        Diagnostics diagnostics(simulation.spatialMesh(), simulation.velocityMesh());
        json result = simulation.run(diagnostics);

        assert(diagnostics.size() == config.NSteps + 1);
        assert(result["NSteps"] == 200);
        assert(result["Diagnostics"]["FieldNorm"].size() == config.NSteps + 1);
        assert(!result["DampingFit"].is_null());
        real_t gamma = result["DampingFit"]["GrowthRate"];
        assert(gamma < 0.0);
    }

    // -------------------------------------------------------------------------
    // 6) Snapshots every 50 steps into a fresh folder
    // -------------------------------------------------------------------------
    {
        auto folder = std::filesystem::temp_directory_path() / "vlasov_ampere_snapshots";
        std::filesystem::remove_all(folder);
        std::filesystem::create_directories(folder);

        json j = baseConfig();
        j["Output"] = {{"SnapshotEvery", 50}};
        SimulationConfig config(j);
        VlasovSimulation simulation(config, folder);
        Diagnostics diagnostics(simulation.spatialMesh(), simulation.velocityMesh());
        simulation.run(diagnostics);

        for (size_t step : {0, 50, 100, 150, 200})
        {
            auto fieldPath = folder / ("field_" + std::to_string(step) + ".txt");
            auto distPath  = folder / ("distribution_" + std::to_string(step) + ".csv");
            assert(std::filesystem::exists(fieldPath));
            assert(std::filesystem::exists(distPath));
            assert(countLines(fieldPath) == config.Nx);
            assert(countLines(distPath) == config.Nx);
        }
        assert(!std::filesystem::exists(folder / "field_25.txt"));

        // Initial field value written with full precision
        std::ifstream fieldFile(folder / "field_0.txt");
        real_t e0 = 0.0;
        fieldFile >> e0;
        assert(std::isfinite(e0));

        std::ifstream distFile(folder / "distribution_0.csv");
        std::string firstRow;
        std::getline(distFile, firstRow);
        assert(static_cast<size_t>(std::count(firstRow.begin(), firstRow.end(), ',')) == config.Nv - 1);

        std::filesystem::remove_all(folder);

        // Writers report folders that do not exist
        auto missing = folder / "does_not_exist";
        bool thrownVector = false, thrownMatrix = false, thrownJson = false;
        try { OutputWriter::writeVector((missing / "e.txt").string(), vec_real(4, 0.0)); }
        catch (const std::runtime_error&) { thrownVector = true; }
        try { OutputWriter::writeMatrix((missing / "f.csv").string(), mat_complex(2, vec_complex(2))); }
        catch (const std::runtime_error&) { thrownMatrix = true; }
        try { OutputWriter::writeJsonToFile((missing / "r.json").string(), json::object()); }
        catch (const std::runtime_error&) { thrownJson = true; }
        assert(thrownVector);
        assert(thrownMatrix);
        assert(thrownJson);
    }

    return 0;
}
