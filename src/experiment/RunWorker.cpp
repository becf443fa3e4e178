#include "RunWorker.hpp"
#include "../core/Errors.hpp"
#include "../core/Logging.hpp"

namespace axiom::experiment {

namespace {

ExperimentRun require_pending(const ExperimentService& service, const std::string& run_id) {
    ExperimentRun run = service.get_run(run_id);
    if (run.status != RunStatus::Pending) {
        throw InvalidRunState("Run " + run_id + " is " + to_string(run.status) + ", expected pending");
    }
    return run;
}

} // namespace

RunWorker::RunWorker(
    ExperimentService& service,
    const game::TournamentRunner& runner,
    parallel::Dispatcher& dispatcher
)
    : service_(service), runner_(runner), dispatcher_(dispatcher) {}

ExperimentRun RunWorker::execute_run(const std::string& run_id) {
    auto log = logging::get_logger("axiom.worker");

    require_pending(service_, run_id);
    ExperimentRun run = service_.start_run(run_id);
    log->info("[WORKER] Starting run {} (#{}) for experiment {}",
              run_id, run.run_number, run.experiment_id);

    try {
        const ExperimentConfig& config = run.config_snapshot;
        if (config.classical_strategies.empty()) {
            throw InvalidTournament("Run has no strategies configured");
        }

        log->info("[WORKER] Running tournament: {} strategies, {} turns, {} repetitions",
                  config.classical_strategies.size(), config.turns, config.repetitions);

        game::TournamentResult result = runner_.run_tournament(
            config.classical_strategies, config.turns, config.repetitions);

        ExperimentRun done = service_.complete_run(run_id, result);
        log->info("[WORKER] Run {} completed in {:.3f}s, winner {}",
                  run_id, done.duration_seconds().value_or(0.0), result.winner);
        return done;
    } catch (const Error& e) {
        log->error("[WORKER] Run {} failed: {}", run_id, e.what());
        record_failure(run_id, e.what(), e.category());
    } catch (const std::exception& e) {
        log->error("[WORKER] Run {} failed: {}", run_id, e.what());
        record_failure(run_id, e.what(), error_kind_name(ErrorKind::ComputationFailure));
    }

    return service_.get_run(run_id);
}

void RunWorker::record_failure(
    const std::string& run_id,
    const std::string& message,
    const std::string& category
) {
    RunError error;
    error.message = message;
    error.category = category;
    error.timestamp = now();

    try {
        service_.fail_run(run_id, error);
    } catch (const Error& e) {
        // The run left running some other way (e.g. storage failed after
        // completing it); nothing more can be recorded on it.
        logging::get_logger("axiom.worker")->error(
            "[WORKER] Could not record failure of run {}: {}", run_id, e.what());
    }
}

void RunWorker::dispatch(const std::string& run_id) {
    require_pending(service_, run_id);

    dispatcher_.submit([this, run_id] {
        try {
            execute_run(run_id);
        } catch (const InvalidRunState& e) {
            // Another dispatch of the same run got there first
            logging::get_logger("axiom.worker")->warn("[WORKER] Skipping run {}: {}", run_id, e.what());
        }
    });

    logging::get_logger("axiom.worker")->debug("[WORKER] Dispatched run {}", run_id);
}

int RunWorker::dispatch_pending(const std::string& experiment_id) {
    int dispatched = 0;
    for (const auto& run : service_.list_runs(experiment_id)) {
        if (run.status != RunStatus::Pending) continue;
        try {
            dispatch(run.id);
            dispatched++;
        } catch (const InvalidRunState& e) {
            logging::get_logger("axiom.worker")->warn("[WORKER] Skipping run {}: {}", run.id, e.what());
        }
    }
    logging::get_logger("axiom.worker")->info(
        "[WORKER] Dispatched {} pending runs for experiment {}", dispatched, experiment_id);
    return dispatched;
}

} // namespace axiom::experiment
