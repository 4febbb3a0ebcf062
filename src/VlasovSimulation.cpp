//==============================================================================
// VlasovSimulation.cpp
// Driver of a single Vlasov–Ampère run.
// Responsibilities:
//   • Build meshes, initial distribution and external field from the config.
//   • Run the TimeStepper, recording diagnostics through the observer.
//   • Write optional snapshots and fit the field damping rate.
//   • Report wall-clock timings in benchmark mode.
//==============================================================================

#include "VlasovSimulation.hpp"

VlasovSimulation::VlasovSimulation(SimulationConfig configIn, std::filesystem::path dataPathIn, bool benchmarkIn)
    : config(configIn), xMesh(configIn.XMin, configIn.XMax, configIn.Nx),
      vMesh(configIn.VMin, configIn.VMax, configIn.Nv), baseFolder(dataPathIn), benchmark(benchmarkIn)
{
}

void VlasovSimulation::writeSnapshot(size_t step, const vec_real& e, const mat_complex& f) const
{
    auto fieldPath = baseFolder / ("field_" + std::to_string(step) + ".txt");
    auto distPath  = baseFolder / ("distribution_" + std::to_string(step) + ".csv");
    OutputWriter::writeVector(fieldPath.string(), e);
    OutputWriter::writeMatrix(distPath.string(), f);
}

//------------------------------------------------------------------------------
// run: initial state → diagnostics at t=0 → stepper loop with observer →
// damping fit on the field norm.
//------------------------------------------------------------------------------
json VlasovSimulation::run(Diagnostics& diagnostics, json* benchmark_result)
{
    using clock = std::chrono::steady_clock;
    auto overallTimeStart = clock::now();

    InitialConditionGenerator initGen(config.InitialProfile, config.Epsilon, config.Wavenumber, config.Drift);
    ExternalFieldGenerator extField = ExternalField::fromName(config.ExternalFieldType, config.Drive);

    TimeStepper stepper(xMesh, vMesh, config.FinalTime, config.NSteps, extField);
    stepper.initialize(initGen.generate(xMesh, vMesh));

    diagnostics.record(0, 0.0, stepper.field(), stepper.distribution());
    if (config.SnapshotEvery > 0 && !benchmark)
    {
        writeSnapshot(0, stepper.field(), stepper.distribution());
    }

    const size_t reportEvery = std::max<size_t>(1, config.NSteps/10);

    auto stepTimeStart = clock::now();
    stepper.run([&](size_t step, real_t time, const vec_real& e, const mat_complex& f, const vec_complex&)
    {
        diagnostics.record(step, time, e, f);

        if (config.Verbose && (step % reportEvery == 0 || step == config.NSteps))
        {
            std::cout << "Step " << step << "/" << config.NSteps
                      << "  t = " << time
                      << "  |E| = " << diagnostics.fieldNormSeries().back()
                      << "  mass = " << diagnostics.massSeries().back() << std::endl;
        }

        if (config.SnapshotEvery > 0 && !benchmark && step % config.SnapshotEvery == 0)
        {
            writeSnapshot(step, e, f);
        }
    });
    auto stepTimeEnd = clock::now();

    json result;
    result["Nx"] = config.Nx;
    result["Nv"] = config.Nv;
    result["FinalTime"] = config.FinalTime;
    result["NSteps"] = config.NSteps;
    result["dt"] = stepper.timeStep();
    result["Diagnostics"] = diagnostics.toJson();

    try
    {
        DampingFit fit = DampingAnalyzer::fit(diagnostics.timeSeries(), diagnostics.fieldNormSeries(),
                                              config.FitStart, config.FitEnd);
        result["DampingFit"] = fit.toJson();

        if (config.Verbose)
        {
            std::cout << "Fitted growth rate: " << fit.GrowthRate
                      << ", frequency: " << fit.Frequency << std::endl;
        }
    }
    catch (const std::runtime_error& err)
    {
        // A run without enough oscillations still produces valid diagnostics
        result["DampingFit"] = nullptr;
        if (config.Verbose) std::cout << "No damping fit: " << err.what() << std::endl;
    }

    auto overallTimeEnd = clock::now();

    if (benchmark && benchmark_result != nullptr)
    {
        (*benchmark_result)["SteppingTime"] = std::chrono::duration<real_t>(stepTimeEnd - stepTimeStart).count();
        (*benchmark_result)["OverallTime"] = std::chrono::duration<real_t>(overallTimeEnd - overallTimeStart).count();
        (*benchmark_result)["TimePerStep"] = std::chrono::duration<real_t>(stepTimeEnd - stepTimeStart).count()
                                             / static_cast<real_t>(config.NSteps);
    }

    return result;
}
