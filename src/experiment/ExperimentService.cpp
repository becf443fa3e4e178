#include "ExperimentService.hpp"
#include "../core/Errors.hpp"
#include "../core/Ids.hpp"
#include "../core/Logging.hpp"

#include <stdexcept>

namespace axiom::experiment {

namespace {

void validate_config(const ExperimentConfig& config) {
    if (config.turns < 1) {
        throw InvalidTurnCount("turns must be at least 1, got " + std::to_string(config.turns));
    }
    if (config.repetitions < 1) {
        throw InvalidTurnCount(
            "repetitions must be at least 1, got " + std::to_string(config.repetitions));
    }
}

} // namespace

ExperimentService::ExperimentService(
    std::shared_ptr<ExperimentRepository> experiments,
    std::shared_ptr<ExperimentRunRepository> runs
)
    : experiments_(std::move(experiments)), runs_(std::move(runs))
{
    if (!experiments_ || !runs_) {
        throw std::invalid_argument("ExperimentService requires both repositories");
    }
}

// ============================================================================
// Experiments
// ============================================================================

Experiment ExperimentService::create_experiment(Experiment experiment) {
    validate_config(experiment.config);

    if (experiment.id.empty()) {
        experiment.id = generate_id();
    }
    experiment.status = ExperimentStatus::Draft;
    experiment.created_at = now();
    experiment.updated_at = experiment.created_at;

    Experiment stored = experiments_->create(experiment);
    logging::get_logger("axiom.experiment")->info(
        "Created experiment {} ({})", stored.id, stored.name);
    return stored;
}

Experiment ExperimentService::get_experiment(const std::string& experiment_id) const {
    auto experiment = experiments_->get(experiment_id);
    if (!experiment) {
        throw ExperimentNotFound(experiment_id);
    }
    return *experiment;
}

std::vector<Experiment> ExperimentService::list_experiments(
    std::optional<ExperimentStatus> status,
    const std::vector<std::string>& tags
) const {
    return experiments_->list_all(status, tags);
}

Experiment ExperimentService::update_experiment(
    const std::string& experiment_id,
    const ExperimentUpdate& update
) {
    if (update.config) {
        validate_config(*update.config);
    }
    auto updated = experiments_->update(experiment_id, update);
    if (!updated) {
        throw ExperimentNotFound(experiment_id);
    }
    return *updated;
}

int ExperimentService::delete_experiment(const std::string& experiment_id) {
    if (!experiments_->remove(experiment_id)) {
        throw ExperimentNotFound(experiment_id);
    }
    int removed = runs_->remove_by_experiment(experiment_id);
    logging::get_logger("axiom.experiment")->info(
        "Deleted experiment {} and {} runs", experiment_id, removed);
    return removed;
}

// ============================================================================
// Runs
// ============================================================================

ExperimentRun ExperimentService::create_run(const std::string& experiment_id) {
    Experiment experiment = get_experiment(experiment_id);
    ExperimentRun run = runs_->create_next(generate_id(), experiment_id, experiment.config);
    discard_orphaned_runs(experiment_id);
    logging::get_logger("axiom.experiment")->debug(
        "Created run {} (#{}) for experiment {}", run.id, run.run_number, experiment_id);
    return run;
}

std::vector<ExperimentRun> ExperimentService::create_runs(const std::string& experiment_id, int count) {
    if (count < 1) {
        throw std::invalid_argument("count must be at least 1, got " + std::to_string(count));
    }
    Experiment experiment = get_experiment(experiment_id);

    std::vector<ExperimentRun> created;
    created.reserve(count);
    for (int i = 0; i < count; ++i) {
        created.push_back(runs_->create_next(generate_id(), experiment_id, experiment.config));
    }
    discard_orphaned_runs(experiment_id);
    logging::get_logger("axiom.experiment")->info(
        "Created {} runs for experiment {}", count, experiment_id);
    return created;
}

void ExperimentService::discard_orphaned_runs(const std::string& experiment_id) {
    if (experiments_->exists(experiment_id)) return;

    int removed = runs_->remove_by_experiment(experiment_id);
    logging::get_logger("axiom.experiment")->warn(
        "Experiment {} was deleted during run creation; discarded {} runs", experiment_id, removed);
    throw ExperimentNotFound(experiment_id);
}

ExperimentRun ExperimentService::get_run(const std::string& run_id) const {
    auto run = runs_->get(run_id);
    if (!run) {
        throw RunNotFound(run_id);
    }
    return *run;
}

std::vector<ExperimentRun> ExperimentService::list_runs(const std::string& experiment_id) const {
    if (!experiments_->exists(experiment_id)) {
        throw ExperimentNotFound(experiment_id);
    }
    return runs_->list_by_experiment(experiment_id);
}

ExperimentRun ExperimentService::start_run(const std::string& run_id) {
    if (!runs_->transition(run_id, RunStatus::Pending, RunStatus::Running)) {
        throw_transition_failure(run_id, RunStatus::Pending);
    }
    return get_run(run_id);
}

ExperimentRun ExperimentService::complete_run(
    const std::string& run_id,
    const game::TournamentResult& results
) {
    if (!runs_->complete(run_id, results)) {
        throw_transition_failure(run_id, RunStatus::Running);
    }
    return get_run(run_id);
}

ExperimentRun ExperimentService::fail_run(const std::string& run_id, const RunError& error) {
    if (!runs_->fail(run_id, error)) {
        throw_transition_failure(run_id, RunStatus::Running);
    }
    return get_run(run_id);
}

void ExperimentService::throw_transition_failure(const std::string& run_id, RunStatus expected) const {
    ExperimentRun run = get_run(run_id);
    throw InvalidRunState("Run " + run_id + " is " + to_string(run.status) +
                          ", expected " + to_string(expected));
}

ExperimentAnalysis ExperimentService::analyze_experiment(const std::string& experiment_id) const {
    return analyze_runs(experiment_id, list_runs(experiment_id));
}

} // namespace axiom::experiment
