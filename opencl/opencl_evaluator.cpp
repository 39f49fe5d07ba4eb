///////////////////////////
///   IMPORTS SECTION   ///
///////////////////////////
#include "opencl_evaluator.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cstring>
#include <exception>
#include <sstream>
#include <vector>

///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkError(cl_int err, const char* operation) {
    if (err != CL_SUCCESS) {
        std::stringstream ss;
        ss << "OpenCL error during " << operation << ": " << err;
        throw TimetableError(ss.str());
    }
}

namespace {

/// Kernel and buffers of one batch, released on every exit path.
struct BatchResources {
    cl_kernel kernel = nullptr;
    std::vector<cl_mem> buffers;

    BatchResources() { buffers.reserve(6); }
    BatchResources(const BatchResources&) = delete;
    BatchResources& operator=(const BatchResources&) = delete;
    ~BatchResources() {
        if (kernel) clReleaseKernel(kernel);
        for (cl_mem buffer : buffers) clReleaseMemObject(buffer);
    }

    cl_mem keep(cl_mem buffer) {
        buffers.push_back(buffer);
        return buffer;
    }
};

}  // namespace

///////////////////////////
///   OPENCL KERNELS    ///
///////////////////////////
static const char* FITNESS_KERNEL_SRC = R"(
__kernel void score_chromosomes(
    __global const int* slots,                 // size: numCandidates * numSessions
    __global const int* rooms,                 // size: numCandidates * numSessions
    const int numCandidates,
    const int numSessions,
    const int numRooms,
    const int numFaculty,
    const int numStudents,
    const int numSlots,
    __global const int* sessionCourse,         // size: numSessions
    __global const int* courseFaculty,         // size: numCourses
    __global const int* courseStudentOffsets,  // size: numCourses+1
    __global const int* courseStudents,        // flat dense student indices
    __global const int* roomFits,              // size: numCourses * numRooms
    __global const float* preference,          // size: numCourses * numSlots
    __global ulong* scratch,                   // size: numCandidates * (numFaculty + numRooms + numStudents)
    __global int* conflictsOut,
    __global int* capacityOut,
    __global float* preferenceOut
) {
    int cid = get_global_id(0);
    if (cid >= numCandidates) return;

    // One 64-bit slot mask per faculty, room and student cell row.
    int cells = numFaculty + numRooms + numStudents;
    __global ulong* facultyMask = scratch + (size_t)cid * cells;
    __global ulong* roomMask = facultyMask + numFaculty;
    __global ulong* studentMask = roomMask + numRooms;
    for (int i = 0; i < cells; ++i) facultyMask[i] = 0;

    int base = cid * numSessions;
    int conflicts = 0;
    int capacity = 0;
    float pref = 0.0f;

    for (int s = 0; s < numSessions; ++s) {
        int t = slots[base + s];
        int r = rooms[base + s];
        if (t < 0 || t >= numSlots || r < 0 || r >= numRooms) continue;

        int c = sessionCourse[s];
        ulong bit = ((ulong)1) << t;

        // A set bit means the cell is already taken: one more unit of excess.
        int f = courseFaculty[c];
        if (facultyMask[f] & bit) ++conflicts; else facultyMask[f] |= bit;
        if (roomMask[r] & bit) ++conflicts; else roomMask[r] |= bit;

        int start = courseStudentOffsets[c];
        int end   = courseStudentOffsets[c + 1];
        for (int k = start; k < end; ++k) {
            int st = courseStudents[k];
            if (studentMask[st] & bit) ++conflicts; else studentMask[st] |= bit;
        }

        if (!roomFits[c * numRooms + r]) ++capacity;
        pref += preference[c * numSlots + t];
    }

    conflictsOut[cid] = conflicts;
    capacityOut[cid] = capacity;
    preferenceOut[cid] = pref;
}
)";

/// Scratch budget of one launch; larger batches go to the CPU.
static const size_t kMaxScratchBytes = (size_t)256 * 1024 * 1024;

///////////////////////////
///  CONTEXT CTOR/DTOR  ///
///////////////////////////
OpenCLFitnessEvaluator::OpenCLFitnessEvaluator(const SessionCatalog& catalog, const FitnessWeights& weights,
                                               int numThreads)
        : catalog_(catalog), weights_(weights), fallback_(catalog, weights, numThreads) {
    try {
        initDevice();
    } catch (const std::exception&) {
        // The destructor does not run for a throwing constructor.
        releaseAll();
        throw;
    }
}

void OpenCLFitnessEvaluator::initDevice() {
    cl_int err = CL_SUCCESS;

    cl_uint numPlatforms = 0;
    err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    checkError(err, "getting platform count");
    if (numPlatforms == 0)
        throw TimetableError("No OpenCL platforms found.");

    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), nullptr);
    checkError(err, "getting platform IDs");
    platform = platforms[0];

    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        logInfo("No GPU found, trying CPU OpenCL device");
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    err = clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
    checkError(err, "querying device name");
    logInfo(std::string("Using OpenCL device: ") + name);

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

    queue = clCreateCommandQueue(context, device, 0, &err);
    checkError(err, "creating command queue");

    program = buildProgram(FITNESS_KERNEL_SRC);

    // The kernel keeps one bit per slot in a 64-bit mask.
    deviceUsable_ = catalog_.slotCount() <= 64;
    if (deviceUsable_) {
        uploadInstance();
    } else {
        logWarning("OpenCL evaluator: " + std::to_string(catalog_.slotCount()) +
                   " slots exceed the kernel limit of 64; scoring on the CPU");
    }
}

OpenCLFitnessEvaluator::~OpenCLFitnessEvaluator() {
    releaseAll();
}

void OpenCLFitnessEvaluator::releaseAll() {
    cl_mem* buffers[] = {&d_sessionCourse, &d_courseFaculty, &d_courseStudentOffsets,
                         &d_courseStudents, &d_roomFits, &d_preference};
    for (cl_mem* buffer : buffers) {
        if (*buffer) clReleaseMemObject(*buffer);
        *buffer = nullptr;
    }
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
    queue = nullptr;
    program = nullptr;
    context = nullptr;
}

///////////////////////////
///   BUILD PROGRAM     ///
///////////////////////////
cl_program OpenCLFitnessEvaluator::buildProgram(const char* src) {
    cl_int err = CL_SUCCESS;
    size_t len = std::strlen(src);
    const char* srcs[1] = { src };
    size_t lens[1] = { len };

    cl_program prog = clCreateProgramWithSource(context, 1, srcs, lens, &err);
    checkError(err, "creating program from source");

    err = clBuildProgram(prog, 1, &device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> log(logSize + 1, '\0');
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, logSize, log.data(), nullptr);
        logError(std::string("OpenCL build log:\n") + log.data());
        clReleaseProgram(prog);
        throw TimetableError("Failed to build OpenCL program");
    }

    return prog;
}

///////////////////////////
///   STATIC UPLOADS    ///
///////////////////////////
cl_mem OpenCLFitnessEvaluator::createBuffer(cl_mem_flags flags, size_t bytes, const void* data, const char* name) {
    cl_int err = CL_SUCCESS;
    // Zero-sized buffers are invalid; empty arrays get one padding element.
    if (bytes == 0) bytes = sizeof(int);
    cl_mem buffer = clCreateBuffer(context, flags, bytes, data ? const_cast<void*>(data) : nullptr, &err);
    checkError(err, name);
    return buffer;
}

void OpenCLFitnessEvaluator::uploadInstance() {
    int numSessions = catalog_.sessionCount();
    int numCourses = catalog_.courseCount();
    int numRooms = catalog_.roomCount();
    int numSlots = catalog_.slotCount();

    std::vector<int> sessionCourse(numSessions + 1, 0);
    for (int s = 0; s < numSessions; ++s) sessionCourse[s] = catalog_.session(s).courseIndex;

    // Course -> students (CSR layout), faculty, fitting rooms and preference costs.
    std::vector<int> courseFaculty(numCourses + 1, 0);
    std::vector<int> offsets(numCourses + 1, 0);
    std::vector<int> students;
    std::vector<int> roomFits((size_t)numCourses * numRooms + 1, 0);
    std::vector<float> preference((size_t)numCourses * numSlots + 1, 0.0f);
    for (int c = 0; c < numCourses; ++c) {
        courseFaculty[c] = catalog_.facultyOf(c);
        offsets[c] = (int)students.size();
        for (int st : catalog_.studentsOf(c)) students.push_back(st);
        for (int r : catalog_.fittingRooms(c)) roomFits[(size_t)c * numRooms + r] = 1;
        for (int t = 0; t < numSlots; ++t) preference[(size_t)c * numSlots + t] = (float)catalog_.preferencePenalty(c, t);
    }
    offsets[numCourses] = (int)students.size();
    students.push_back(0);

    cl_mem_flags flags = CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR;
    d_sessionCourse = createBuffer(flags, sessionCourse.size() * sizeof(int), sessionCourse.data(), "creating d_sessionCourse");
    d_courseFaculty = createBuffer(flags, courseFaculty.size() * sizeof(int), courseFaculty.data(), "creating d_courseFaculty");
    d_courseStudentOffsets = createBuffer(flags, offsets.size() * sizeof(int), offsets.data(), "creating d_courseStudentOffsets");
    d_courseStudents = createBuffer(flags, students.size() * sizeof(int), students.data(), "creating d_courseStudents");
    d_roomFits = createBuffer(flags, roomFits.size() * sizeof(int), roomFits.data(), "creating d_roomFits");
    d_preference = createBuffer(flags, preference.size() * sizeof(float), preference.data(), "creating d_preference");
}

///////////////////////////
///   EVALUATE BATCH    ///
///////////////////////////
std::vector<FitnessBreakdown> OpenCLFitnessEvaluator::evaluateBatch(const std::vector<const Chromosome*>& batch) {
    int numCandidates = (int)batch.size();
    if (numCandidates == 0) return {};

    int numSessions = catalog_.sessionCount();
    int numRooms = catalog_.roomCount();
    int numFaculty = catalog_.facultyCount();
    int numStudents = catalog_.studentCount();
    int numSlots = catalog_.slotCount();
    size_t cells = (size_t)numFaculty + numRooms + numStudents;
    size_t scratchBytes = (size_t)numCandidates * cells * sizeof(cl_ulong);
    if (!deviceUsable_ || scratchBytes > kMaxScratchBytes) return fallback_.evaluateBatch(batch);

    cl_int err = CL_SUCCESS;

    // Flatten placements
    std::vector<int> slots((size_t)numCandidates * numSessions + 1, -1);
    std::vector<int> rooms((size_t)numCandidates * numSessions + 1, -1);
    for (int c = 0; c < numCandidates; ++c) {
        const Chromosome& chromosome = *batch[c];
        if ((int)chromosome.size() != numSessions) {
            throw ValidationError("chromosome has " + std::to_string(chromosome.size()) + " genes, expected " +
                                  std::to_string(numSessions));
        }
        for (int s = 0; s < numSessions; ++s) {
            size_t idx = (size_t)c * numSessions + s;
            slots[idx] = chromosome[s].slot;
            rooms[idx] = chromosome[s].roomIndex;
        }
    }

    BatchResources res;
    cl_mem_flags input = CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR;
    cl_mem d_slots = res.keep(createBuffer(input, slots.size() * sizeof(int), slots.data(), "creating d_slots"));
    cl_mem d_rooms = res.keep(createBuffer(input, rooms.size() * sizeof(int), rooms.data(), "creating d_rooms"));
    cl_mem d_scratch = res.keep(createBuffer(CL_MEM_READ_WRITE, scratchBytes, nullptr, "creating d_scratch"));
    cl_mem d_conflicts = res.keep(createBuffer(CL_MEM_WRITE_ONLY, numCandidates * sizeof(int), nullptr, "creating d_conflicts"));
    cl_mem d_capacity = res.keep(createBuffer(CL_MEM_WRITE_ONLY, numCandidates * sizeof(int), nullptr, "creating d_capacity"));
    cl_mem d_pref = res.keep(createBuffer(CL_MEM_WRITE_ONLY, numCandidates * sizeof(float), nullptr, "creating d_pref"));

    // Kernel + args
    res.kernel = clCreateKernel(program, "score_chromosomes", &err);
    checkError(err, "creating kernel");
    cl_kernel kernel = res.kernel;

    int arg = 0;
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_slots); checkError(err, "arg slots");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_rooms); checkError(err, "arg rooms");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &numCandidates); checkError(err, "arg numCandidates");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &numSessions); checkError(err, "arg numSessions");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &numRooms); checkError(err, "arg numRooms");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &numFaculty); checkError(err, "arg numFaculty");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &numStudents); checkError(err, "arg numStudents");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &numSlots); checkError(err, "arg numSlots");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_sessionCourse); checkError(err, "arg sessionCourse");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_courseFaculty); checkError(err, "arg courseFaculty");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_courseStudentOffsets); checkError(err, "arg courseStudentOffsets");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_courseStudents); checkError(err, "arg courseStudents");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_roomFits); checkError(err, "arg roomFits");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_preference); checkError(err, "arg preference");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_scratch); checkError(err, "arg scratch");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_conflicts); checkError(err, "arg conflictsOut");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_capacity); checkError(err, "arg capacityOut");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_pref); checkError(err, "arg preferenceOut");

    size_t global = (size_t)numCandidates;
    err = clEnqueueNDRangeKernel(queue, kernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
    checkError(err, "enqueuing score_chromosomes");
    err = clFinish(queue);
    checkError(err, "finishing queue");

    std::vector<int> conflicts(numCandidates);
    std::vector<int> capacity(numCandidates);
    std::vector<float> pref(numCandidates);
    err = clEnqueueReadBuffer(queue, d_conflicts, CL_TRUE, 0, numCandidates * sizeof(int), conflicts.data(), 0, nullptr, nullptr);
    checkError(err, "reading conflicts");
    err = clEnqueueReadBuffer(queue, d_capacity, CL_TRUE, 0, numCandidates * sizeof(int), capacity.data(), 0, nullptr, nullptr);
    checkError(err, "reading capacity");
    err = clEnqueueReadBuffer(queue, d_pref, CL_TRUE, 0, numCandidates * sizeof(float), pref.data(), 0, nullptr, nullptr);
    checkError(err, "reading preference");

    std::vector<FitnessBreakdown> results(numCandidates);
    for (int c = 0; c < numCandidates; ++c) {
        FitnessBreakdown& out = results[c];
        out.conflicts = conflicts[c];
        out.capacityViolations = capacity[c];
        out.preferencePenalty = pref[c];
        out.value = weightedFitness(weights_, out.conflicts, out.capacityViolations, out.preferencePenalty);
    }
    return results;
}
