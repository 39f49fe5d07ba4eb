#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <vector>
#include "catalog.hpp"
#include "fitness.hpp"


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief Batched chromosome scoring on an OpenCL device.
 *
 * Owns the OpenCL platform/device/context/queue, a compiled program and the
 * device copies of the static instance data (session -> course, course ->
 * faculty, course -> students in CSR layout, room fit matrix, preference
 * table). Each evaluateBatch() launches one work item per chromosome; every
 * work item marks its faculty, room and student cells in a 64-bit slot mask
 * and counts a conflict whenever a bit is already set.
 *
 * Instances with more than 64 slots, or batches whose occupancy scratch would
 * exceed the device budget, are scored by the CPU evaluator instead.
 */
class OpenCLFitnessEvaluator : public IFitnessEvaluator {
public:
    /**
     * @brief Initialize OpenCL and upload the static instance data.
     *
     * Prefers a GPU device and falls back to a CPU device. Throws
     * TimetableError if no platform or device is available or the program
     * fails to build.
     */
    OpenCLFitnessEvaluator(const SessionCatalog& catalog, const FitnessWeights& weights, int numThreads = 1);

    /**
     * @brief Release all OpenCL resources owned by this evaluator.
     *
     * Destroys buffers, program, queue and context in the correct order.
     */
    ~OpenCLFitnessEvaluator() override;

    OpenCLFitnessEvaluator(const OpenCLFitnessEvaluator&) = delete;
    OpenCLFitnessEvaluator& operator=(const OpenCLFitnessEvaluator&) = delete;

    std::vector<FitnessBreakdown> evaluateBatch(const std::vector<const Chromosome*>& batch) override;

    /// Whether the instance fits the kernel's limits (otherwise every batch goes to the CPU).
    bool deviceUsable() const { return deviceUsable_; }

private:
    const SessionCatalog& catalog_;
    FitnessWeights weights_;
    CpuFitnessEvaluator fallback_; ///< Used beyond the kernel's limits.
    bool deviceUsable_ = false;

    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;

    cl_mem d_sessionCourse = nullptr; ///< size: sessions
    cl_mem d_courseFaculty = nullptr; ///< size: courses
    cl_mem d_courseStudentOffsets = nullptr; ///< size: courses + 1
    cl_mem d_courseStudents = nullptr; ///< flat dense student indices
    cl_mem d_roomFits = nullptr; ///< size: courses * rooms
    cl_mem d_preference = nullptr; ///< size: courses * slots

    void initDevice();
    void releaseAll();
    cl_program buildProgram(const char* src);
    void uploadInstance();
    cl_mem createBuffer(cl_mem_flags flags, size_t bytes, const void* data, const char* name);
};
