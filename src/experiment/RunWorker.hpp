#pragma once

#include <string>
#include "ExperimentService.hpp"
#include "../game/Tournament.hpp"
#include "../parallel/WorkerPool.hpp"

namespace axiom::experiment {

// Executes experiment runs
//
// A run moves pending -> running before any computation, then to completed
// with the tournament result or to failed with the captured error. Errors
// during execution are written onto the run record, never rethrown, so one
// failing run cannot affect another.
//
// The worker must outlive every task it has dispatched (wait on the
// dispatcher before destroying it).
class RunWorker {
public:
    RunWorker(ExperimentService& service, const game::TournamentRunner& runner, parallel::Dispatcher& dispatcher);

    // Run to completion on the calling thread and return the final record.
    // Throws RunNotFound, or InvalidRunState if the run is not pending.
    ExperimentRun execute_run(const std::string& run_id);

    // Validate, then queue execute_run on the dispatcher and return.
    // Throws RunNotFound or InvalidRunState.
    void dispatch(const std::string& run_id);

    // Queue every pending run of the experiment; returns how many were queued.
    // Throws ExperimentNotFound.
    int dispatch_pending(const std::string& experiment_id);

private:
    void record_failure(const std::string& run_id, const std::string& message, const std::string& category);

    ExperimentService& service_;
    const game::TournamentRunner& runner_;
    parallel::Dispatcher& dispatcher_;
};

} // namespace axiom::experiment
