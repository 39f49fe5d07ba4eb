///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include "demo_instances.hpp"
#include "formatting.hpp"
#include "logging.hpp"
#include "model.hpp"
#include "mpi_cluster_stage.hpp"
#include "pipeline.hpp"
#include <mpi.h>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////

/**
 * @brief MPI entry point for the hybrid MPI + threads timetabling demo.
 *
 * Every rank builds the same demo snapshot. Rank 0 runs the pipeline with the
 * MPI cluster stage and prints the result; the other ranks only serve cluster
 * solving requests until rank 0 releases them. A failure on any rank aborts
 * the whole communicator, since the other ranks would otherwise block in a
 * pending receive or broadcast.
 *
 * Usage: mpirun -n <ranks> timetabler_mpi [S|M|L] [populationSize]
 */
int main(int argc, char** argv) {
    // Worker threads never call MPI; only the main thread communicates.
    int provided = 0;
    MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, &provided);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    if (rank == 0) {
        std::cout << "========================================\n";
        std::cout << "MPI+THREADS TIMETABLING PIPELINE\n";
        std::cout << "Processes: " << size << "\n";
        std::cout << "========================================\n";
    }

    DemoSize demoSize = DemoSize::M;
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "S") demoSize = DemoSize::S;
        else if (arg == "L") demoSize = DemoSize::L;
    }

    // The synthetic snapshot is replicated on all ranks.
    ProblemInstance inst = makeDemoInstance(demoSize);
    PipelineConfig config;
    config.progress.intervalMs = 0;
    if (argc > 2) config.refiner.populationSize = std::atoi(argv[2]);
    auto stage = std::make_shared<MPIClusterStage>(config.resolvedWorkerThreads());

    try {
        if (rank == 0) {
            ProgressCoordinator progress(config.progress);
            CancellationToken cancel;
            progress.start();
            GenerationPipeline pipeline(config, stage);
            PipelineOutcome outcome = pipeline.run(inst, progress, cancel);
            stage->shutdown();
            progress.complete();

            std::cout << "Courses: " << inst.courses.size() << "\n";
            printFacultySchedules(inst, outcome.assignment);
            printConflictReport(inst, outcome.conflicts);
            printSummary(outcome.summary);
            std::cout << "========================================\n";
        } else {
            SessionCatalog catalog(inst);
            stage->serve(catalog, config.solver, config.seed);
        }
    } catch (const std::exception& e) {
        logError("Rank " + std::to_string(rank) + ": " + e.what());
        MPI_Abort(MPI_COMM_WORLD, 1);
        return 1;
    }

    MPI_Finalize();
    return 0;
}
