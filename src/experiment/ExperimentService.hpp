#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Repository.hpp"
#include "RunAnalysis.hpp"

namespace axiom::experiment {

// Experiment and run bookkeeping over the repository contract
//
// All run status changes go through the run repository's compare-and-set
// operations, so concurrent callers cannot move a run twice.
class ExperimentService {
public:
    ExperimentService(
        std::shared_ptr<ExperimentRepository> experiments,
        std::shared_ptr<ExperimentRunRepository> runs
    );

    // Stores a new draft experiment. An empty id gets a generated one and
    // both timestamps are set to now. Throws InvalidTurnCount if the config
    // has turns or repetitions below 1.
    Experiment create_experiment(Experiment experiment);

    // Throws ExperimentNotFound
    Experiment get_experiment(const std::string& experiment_id) const;

    std::vector<Experiment> list_experiments(
        std::optional<ExperimentStatus> status = std::nullopt,
        const std::vector<std::string>& tags = {}) const;

    // Throws ExperimentNotFound, or InvalidTurnCount for a bad new config
    Experiment update_experiment(const std::string& experiment_id, const ExperimentUpdate& update);

    // Removes the experiment and all of its runs; returns the number of runs
    // removed. Throws ExperimentNotFound.
    int delete_experiment(const std::string& experiment_id);

    // New pending run carrying a snapshot of the experiment's current config.
    // Throws ExperimentNotFound.
    ExperimentRun create_run(const std::string& experiment_id);

    // count pending runs, numbered consecutively unless other callers
    // interleave. Throws std::invalid_argument for count < 1.
    std::vector<ExperimentRun> create_runs(const std::string& experiment_id, int count);

    // Throws RunNotFound
    ExperimentRun get_run(const std::string& run_id) const;

    // Sorted by run number. Throws ExperimentNotFound.
    std::vector<ExperimentRun> list_runs(const std::string& experiment_id) const;

    // pending -> running. Throws RunNotFound, or InvalidRunState if the run
    // is not pending (including losing a race to another caller).
    ExperimentRun start_run(const std::string& run_id);

    // running -> completed / failed. Throw RunNotFound or InvalidRunState.
    ExperimentRun complete_run(const std::string& run_id, const game::TournamentResult& results);
    ExperimentRun fail_run(const std::string& run_id, const RunError& error);

    // Statistics over the experiment's completed runs. Throws ExperimentNotFound.
    ExperimentAnalysis analyze_experiment(const std::string& experiment_id) const;

private:
    // A delete that raced run creation leaves runs with no experiment;
    // remove them and throw ExperimentNotFound
    void discard_orphaned_runs(const std::string& experiment_id);

    // Throws RunNotFound, else InvalidRunState naming the expected status
    void throw_transition_failure(const std::string& run_id, RunStatus expected) const;

    std::shared_ptr<ExperimentRepository> experiments_;
    std::shared_ptr<ExperimentRunRepository> runs_;
};

} // namespace axiom::experiment
