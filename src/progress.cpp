///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "progress.hpp"
#include <algorithm>


///////////////////////////
///       HELPERS       ///
///////////////////////////
std::string formatJobStatus(JobStatus status) {
    switch (status) {
        case JobStatus::QUEUED:    return "queued";
        case JobStatus::RUNNING:   return "running";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED:    return "failed";
        case JobStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string formatStage(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::CLUSTERING: return "clustering";
        case PipelineStage::SOLVING:    return "solving";
        case PipelineStage::REFINING:   return "refining";
        case PipelineStage::REPAIRING:  return "repairing";
        case PipelineStage::FINALIZING: return "finalizing";
    }
    return "unknown";
}


///////////////////////////
///    STAGE REPORTER   ///
///////////////////////////
void StageReporter::setTotal(long total) {
    total_.store(std::max(1L, total));
}

void StageReporter::report(long done) {
    done = std::max(0L, std::min(done, total_.load()));
    long seen = done_.load();
    while (done > seen && !done_.compare_exchange_weak(seen, done)) {}
}

void StageReporter::increment(long amount) {
    long seen = done_.load();
    long next;
    do {
        next = std::min(seen + amount, total_.load());
        if (next <= seen) return;
    } while (!done_.compare_exchange_weak(seen, next));
}

double StageReporter::fraction() const {
    double f = (double)done_.load() / (double)total_.load();
    return std::max(0.0, std::min(1.0, f));
}


///////////////////////////
///     COORDINATOR     ///
///////////////////////////
ProgressCoordinator::ProgressCoordinator(const ProgressConfig& config) : config_(config) {}

ProgressCoordinator::~ProgressCoordinator() {
    stopLoop();
}

void ProgressCoordinator::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != JobStatus::QUEUED) return;
        status_ = JobStatus::RUNNING;
        startedAt_ = std::chrono::steady_clock::now();
    }
    if (config_.intervalMs > 0) loop_ = std::thread(&ProgressCoordinator::runLoop, this);
}

StageReporter& ProgressCoordinator::beginStage(PipelineStage stage) {
    int wanted = (int)stage;
    int current = activeStage_.load();
    while (wanted > current && !activeStage_.compare_exchange_weak(current, wanted)) {}
    return reporters_[wanted];
}

std::pair<double, double> ProgressCoordinator::stageBounds(PipelineStage stage) const {
    switch (stage) {
        case PipelineStage::CLUSTERING: return {0.0, config_.clusteringEnd};
        case PipelineStage::SOLVING:    return {config_.clusteringEnd, config_.solvingEnd};
        case PipelineStage::REFINING:   return {config_.solvingEnd, config_.refiningEnd};
        case PipelineStage::REPAIRING:  return {config_.refiningEnd, config_.repairingEnd};
        case PipelineStage::FINALIZING: return {config_.repairingEnd, 100.0};
    }
    return {0.0, 100.0};
}

double ProgressCoordinator::targetPercent() const {
    PipelineStage stage = (PipelineStage)activeStage_.load();
    auto bounds = stageBounds(stage);
    return bounds.first + reporters_[(int)stage].fraction() * (bounds.second - bounds.first);
}

void ProgressCoordinator::step() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != JobStatus::RUNNING) return;

    PipelineStage stage = (PipelineStage)activeStage_.load();
    double stageEnd = stageBounds(stage).second;
    double target = targetPercent();
    double gap = target - displayed_;

    double next = displayed_;
    if (gap > 0.0) {
        next += std::min(gap, std::max(config_.minStep, gap * config_.catchUpFactor));
    } else {
        double ceiling = std::min(stageEnd, target + config_.creepHeadroom);
        next = std::min(displayed_ + config_.creep, ceiling);
    }
    // 100 is reserved for completion.
    next = std::min(next, 99.9);
    displayed_ = std::max(displayed_, next);

    if (displayed_ > 0.0) {
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startedAt_).count();
        double estimate = elapsed / displayed_ * (100.0 - displayed_);
        double smoothed = eta_ ? config_.etaSmoothing * estimate + (1.0 - config_.etaSmoothing) * *eta_ : estimate;
        eta_ = std::max(1.0, smoothed);
    }
}

void ProgressCoordinator::complete() {
    stopLoop();
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != JobStatus::RUNNING) return;
    status_ = JobStatus::COMPLETED;
    activeStage_ = (int)PipelineStage::FINALIZING;
    displayed_ = 100.0;
    eta_ = 0.0;
}

void ProgressCoordinator::fail(const std::string& message) {
    finish(JobStatus::FAILED, message);
}

void ProgressCoordinator::cancel() {
    finish(JobStatus::CANCELLED, "");
}

void ProgressCoordinator::finish(JobStatus status, const std::string& message) {
    stopLoop();
    std::lock_guard<std::mutex> lock(mutex_);
    if (isTerminal(status_)) return;
    status_ = status;
    message_ = message;
    eta_ = 0.0;
}

ProgressSnapshot ProgressCoordinator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProgressSnapshot snap;
    snap.status = status_;
    snap.stage = (PipelineStage)activeStage_.load();
    snap.percent = displayed_;
    snap.etaSeconds = eta_;
    snap.message = message_;
    return snap;
}

double ProgressCoordinator::displayedPercent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return displayed_;
}


///////////////////////////
///   REPORTING LOOP    ///
///////////////////////////
void ProgressCoordinator::runLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopLoop_) {
        wake_.wait_for(lock, std::chrono::milliseconds(config_.intervalMs));
        if (stopLoop_) break;
        lock.unlock();
        step();
        lock.lock();
    }
}

void ProgressCoordinator::stopLoop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopLoop_ = true;
    }
    wake_.notify_all();
    if (loop_.joinable() && loop_.get_id() != std::this_thread::get_id()) loop_.join();
}
