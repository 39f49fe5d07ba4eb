#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <atomic>


///////////////////////////
///    CANCELLATION     ///
///////////////////////////
/**
 * @brief Cooperative job-level cancellation flag.
 *
 * Stages poll it between clusters, generations and repair iterations; the
 * exact solver polls it together with its wall-clock budget.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};
