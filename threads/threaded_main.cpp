///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cluster_worker_pool.hpp"
#include "demo_instances.hpp"
#include "errors.hpp"
#include "formatting.hpp"
#include "logging.hpp"
#include "model.hpp"
#include "timetable_service.hpp"
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the threaded timetabling pipeline.
 *
 * Builds a demo snapshot, submits it to the job service, polls the smoothed
 * progress until the job is terminal, and prints the per-faculty schedules
 * and the conflict report.
 *
 * Usage: timetabler_threaded [S|M|L] [threads]
 */
int main(int argc, char** argv) {
    DemoSize size = DemoSize::M;
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "S") size = DemoSize::S;
        else if (arg == "L") size = DemoSize::L;
    }

    PipelineConfig config;
    if (argc > 2) config.workerThreads = std::atoi(argv[2]);
    int numThreads = config.resolvedWorkerThreads();

    ProblemInstance inst = makeDemoInstance(size);

    std::cout << "========================================\n";
    std::cout << "THREADED TIMETABLING PIPELINE\n";
    std::cout << "Courses: " << inst.courses.size() << "  Rooms: " << inst.rooms.size()
              << "  Threads: " << numThreads << "\n";

    try {
        TimetableService service(config, std::make_shared<ThreadedClusterStage>(numThreads));
        std::string jobId = service.submit(inst);

        while (!service.waitFor(jobId, std::chrono::milliseconds(500))) {
            std::optional<ProgressSnapshot> progress = service.getProgress(jobId);
            if (!progress) break;
            std::cout << "  [" << formatStage(progress->stage) << "] " << std::fixed << std::setprecision(1)
                      << progress->percent << "%";
            if (progress->etaSeconds) std::cout << "  eta " << *progress->etaSeconds << " s";
            std::cout << "\n";
        }

        std::optional<JobResult> result = service.getResult(jobId);
        if (!result) {
            std::optional<JobResult> job = service.getJob(jobId);
            std::cout << "Job " << jobId << " did not complete: "
                      << (job ? formatJobStatus(job->status) + " " + job->message : std::string("unknown job")) << "\n";
            std::cout << "========================================\n";
            return 1;
        }

        std::cout << "\nPer-faculty schedules:\n";
        printFacultySchedules(inst, result->assignment);
        printConflictReport(inst, result->conflicts);
        printSummary(result->summary);
    } catch (const TimetableError& e) {
        logError(std::string("Demo aborted: ") + e.what());
        return 1;
    }

    std::cout << "========================================\n";
    return 0;
}
