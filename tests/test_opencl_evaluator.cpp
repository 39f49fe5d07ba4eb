///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include "errors.hpp"
#include "fitness.hpp"
#include "greedy_scheduler.hpp"
#include "logging.hpp"
#include "opencl_evaluator.hpp"
#include "test_instances.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <numeric>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static Chromosome stackedChromosome(const SessionCatalog& catalog) {
    Chromosome chromosome(catalog.sessionCount());
    for (int s = 0; s < catalog.sessionCount(); ++s) {
        chromosome[s] = Placement{0, catalog.fittingRooms(catalog.session(s).courseIndex).front()};
    }
    return chromosome;
}

static Chromosome greedyChromosome(const SessionCatalog& catalog) {
    std::vector<int> courses(catalog.courseCount());
    std::iota(courses.begin(), courses.end(), 0);
    GreedyResult greedy = GreedyScheduler(catalog, SolverConfig()).schedule(courses, 1);
    Chromosome chromosome(catalog.sessionCount());
    for (const auto& entry : greedy.placements) chromosome[entry.first] = entry.second;
    return chromosome;
}

/// Null when the machine has no usable OpenCL platform or device.
static std::unique_ptr<OpenCLFitnessEvaluator> makeDeviceEvaluator(const SessionCatalog& catalog) {
    try {
        return std::unique_ptr<OpenCLFitnessEvaluator>(new OpenCLFitnessEvaluator(catalog, FitnessWeights(), 2));
    } catch (const TimetableError& e) {
        logWarning(std::string("OpenCL unavailable: ") + e.what());
        return nullptr;
    }
}

static void expectSameScores(const std::vector<FitnessBreakdown>& device, const std::vector<FitnessBreakdown>& cpu) {
    ASSERT_EQ(device.size(), cpu.size());
    for (size_t i = 0; i < cpu.size(); ++i) {
        EXPECT_EQ(device[i].conflicts, cpu[i].conflicts) << "candidate " << i;
        EXPECT_EQ(device[i].capacityViolations, cpu[i].capacityViolations) << "candidate " << i;
        EXPECT_NEAR(device[i].value, cpu[i].value, 1e-3) << "candidate " << i;
    }
}


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(OpenCLFitnessEvaluatorTest, MatchesCpuScores) {
    ProblemInstance inst = cohortInstance();
    SessionCatalog catalog(inst);
    std::unique_ptr<OpenCLFitnessEvaluator> device = makeDeviceEvaluator(catalog);
    if (!device) GTEST_SKIP() << "no OpenCL device";
    ASSERT_TRUE(device->deviceUsable());

    CpuFitnessEvaluator cpu(catalog, FitnessWeights(), 2);
    Chromosome stacked = stackedChromosome(catalog);
    Chromosome spread = greedyChromosome(catalog);
    std::vector<const Chromosome*> batch{&stacked, &spread, &stacked};
    expectSameScores(device->evaluateBatch(batch), cpu.evaluateBatch(batch));
}

TEST(OpenCLFitnessEvaluatorTest, RejectedBatchLeavesTheEvaluatorUsable) {
    ProblemInstance inst = cohortInstance();
    SessionCatalog catalog(inst);
    std::unique_ptr<OpenCLFitnessEvaluator> device = makeDeviceEvaluator(catalog);
    if (!device) GTEST_SKIP() << "no OpenCL device";

    Chromosome shortOne(catalog.sessionCount() - 1);
    Chromosome stacked = stackedChromosome(catalog);
    std::vector<const Chromosome*> bad{&stacked, &shortOne};
    EXPECT_THROW(device->evaluateBatch(bad), ValidationError);

    CpuFitnessEvaluator cpu(catalog, FitnessWeights(), 2);
    std::vector<const Chromosome*> good{&stacked};
    for (int round = 0; round < 50; ++round) expectSameScores(device->evaluateBatch(good), cpu.evaluateBatch(good));
}

TEST(OpenCLFitnessEvaluatorTest, WideGridsAreScoredOnTheCpu) {
    // 5 x 14 = 70 slots, beyond the kernel's 64-bit slot masks.
    ProblemInstance inst = emptyInstance(5, 14);
    inst.rooms.push_back({1, "R1", 40, RoomType::LECTURE});
    inst.faculty.push_back({1, "F1"});
    inst.courses.push_back(makeCourse(1, 0, 1, 2, RoomType::LECTURE, 10, studentRange(1, 10)));
    inst.courses.push_back(makeCourse(2, 0, 1, 1, RoomType::LECTURE, 10, studentRange(5, 15)));
    SessionCatalog catalog(inst);
    std::unique_ptr<OpenCLFitnessEvaluator> device = makeDeviceEvaluator(catalog);
    if (!device) GTEST_SKIP() << "no OpenCL device";
    EXPECT_FALSE(device->deviceUsable());

    CpuFitnessEvaluator cpu(catalog, FitnessWeights(), 1);
    Chromosome stacked = stackedChromosome(catalog);
    std::vector<const Chromosome*> batch{&stacked};
    std::vector<FitnessBreakdown> scores = device->evaluateBatch(batch);
    expectSameScores(scores, cpu.evaluateBatch(batch));
}
