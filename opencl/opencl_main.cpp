///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include "errors.hpp"
#include "formatting.hpp"
#include "logging.hpp"
#include "model.hpp"
#include "opencl_evaluator.hpp"
#include "pipeline.hpp"
#include <chrono>
#include <iostream>
#include <memory>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the pipeline with OpenCL fitness scoring.
 *
 * Builds a demo snapshot and runs the full pipeline; the population refiner
 * scores each generation in one kernel launch on the OpenCL device.
 */
int main(int argc, char** argv) {
    // No CLI arguments are used yet; silence unused parameter warnings.
    (void)argc;
    (void)argv;

    ProblemInstance inst = makeDemoInstance(DemoSize::L);

    PipelineConfig config;
    config.progress.intervalMs = 0;
    config.refiner.populationSize = 64;
    int numThreads = config.resolvedWorkerThreads();

    std::cout << "========================================\n";
    std::cout << "OPENCL TIMETABLING PIPELINE\n";
    std::cout << "Courses: " << inst.courses.size() << "\n";
    std::cout << "Population per kernel launch: " << config.refiner.populationSize << "\n";
    std::cout << "========================================\n";

    EvaluatorFactory evaluators = [numThreads](const SessionCatalog& catalog, const FitnessWeights& weights) {
        return std::unique_ptr<IFitnessEvaluator>(new OpenCLFitnessEvaluator(catalog, weights, numThreads));
    };

    try {
        GenerationPipeline pipeline(config, nullptr, evaluators);
        ProgressCoordinator progress(config.progress);
        CancellationToken cancel;
        progress.start();

        auto start = std::chrono::high_resolution_clock::now();
        PipelineOutcome outcome = pipeline.run(inst, progress, cancel);
        auto end = std::chrono::high_resolution_clock::now();
        progress.complete();
        double elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "Pipeline time: " << elapsedMs << " ms\n";
        printFacultySchedules(inst, outcome.assignment);
        printConflictReport(inst, outcome.conflicts);
        printSummary(outcome.summary);
    } catch (const TimetableError& e) {
        logError(std::string("OpenCL demo failed: ") + e.what());
        return 1;
    }

    std::cout << "========================================\n";
    return 0;
}
