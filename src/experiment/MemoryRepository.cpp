#include "MemoryRepository.hpp"
#include "../core/Errors.hpp"

#include <algorithm>

namespace axiom::experiment {

// ============================================================================
// Experiments
// ============================================================================

Experiment InMemoryExperimentRepository::create(const Experiment& experiment) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (experiments_.count(experiment.id)) {
        throw StorageFailure("Experiment id already exists: " + experiment.id);
    }
    experiments_[experiment.id] = experiment;
    persist_locked();
    return experiment;
}

std::optional<Experiment> InMemoryExperimentRepository::get(const std::string& experiment_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = experiments_.find(experiment_id);
    if (it == experiments_.end()) return std::nullopt;
    return it->second;
}

std::vector<Experiment> InMemoryExperimentRepository::list_all(
    std::optional<ExperimentStatus> status,
    const std::vector<std::string>& tags
) const {
    std::vector<Experiment> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, e] : experiments_) {
            if (status && e.status != *status) continue;
            if (!tags.empty() && !e.has_any_tag(tags)) continue;
            out.push_back(e);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const Experiment& a, const Experiment& b) {
        return a.created_at > b.created_at;
    });
    return out;
}

std::optional<Experiment> InMemoryExperimentRepository::update(
    const std::string& experiment_id,
    const ExperimentUpdate& update
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = experiments_.find(experiment_id);
    if (it == experiments_.end()) return std::nullopt;

    Experiment& e = it->second;
    if (update.name) e.name = *update.name;
    if (update.hypothesis) e.hypothesis = *update.hypothesis;
    if (update.description) e.description = *update.description;
    if (update.config) e.config = *update.config;
    if (update.tags) e.tags = *update.tags;
    if (update.status) e.status = *update.status;
    e.updated_at = now();

    persist_locked();
    return e;
}

bool InMemoryExperimentRepository::remove(const std::string& experiment_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (experiments_.erase(experiment_id) == 0) return false;
    persist_locked();
    return true;
}

bool InMemoryExperimentRepository::exists(const std::string& experiment_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return experiments_.count(experiment_id) > 0;
}

// ============================================================================
// Runs
// ============================================================================

ExperimentRun InMemoryExperimentRunRepository::create_next(
    const std::string& run_id,
    const std::string& experiment_id,
    const ExperimentConfig& config_snapshot
) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (runs_.count(run_id)) {
        throw StorageFailure("Run id already exists: " + run_id);
    }

    ExperimentRun run;
    run.id = run_id;
    run.experiment_id = experiment_id;
    run.run_number = ++last_run_number_[experiment_id];
    run.status = RunStatus::Pending;
    run.config_snapshot = config_snapshot;
    run.created_at = now();

    runs_[run_id] = run;
    persist_locked();
    return run;
}

std::optional<ExperimentRun> InMemoryExperimentRunRepository::get(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) return std::nullopt;
    return it->second;
}

std::vector<ExperimentRun> InMemoryExperimentRunRepository::list_by_experiment(
    const std::string& experiment_id
) const {
    std::vector<ExperimentRun> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, run] : runs_) {
            if (run.experiment_id == experiment_id) out.push_back(run);
        }
    }
    std::sort(out.begin(), out.end(), [](const ExperimentRun& a, const ExperimentRun& b) {
        return a.run_number < b.run_number;
    });
    return out;
}

int InMemoryExperimentRunRepository::run_count(const std::string& experiment_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::count_if(runs_.begin(), runs_.end(),
        [&](const auto& entry) { return entry.second.experiment_id == experiment_id; }));
}

bool InMemoryExperimentRunRepository::transition(
    const std::string& run_id,
    RunStatus from,
    RunStatus to
) {
    // Terminal states are entered only through complete() and fail()
    if (from != RunStatus::Pending || to != RunStatus::Running) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end() || it->second.status != from) return false;

    ExperimentRun& run = it->second;
    run.status = to;
    run.started_at = now();

    persist_locked();
    return true;
}

bool InMemoryExperimentRunRepository::complete(
    const std::string& run_id,
    const game::TournamentResult& results
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end() || it->second.status != RunStatus::Running) return false;

    ExperimentRun& run = it->second;
    run.status = RunStatus::Completed;
    run.results = results;
    run.completed_at = now();

    persist_locked();
    return true;
}

bool InMemoryExperimentRunRepository::fail(const std::string& run_id, const RunError& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end() || it->second.status != RunStatus::Running) return false;

    ExperimentRun& run = it->second;
    run.status = RunStatus::Failed;
    run.error = error;
    run.completed_at = now();

    persist_locked();
    return true;
}

int InMemoryExperimentRunRepository::remove_by_experiment(const std::string& experiment_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    int removed = 0;
    for (auto it = runs_.begin(); it != runs_.end();) {
        if (it->second.experiment_id == experiment_id) {
            it = runs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) persist_locked();
    return removed;
}

} // namespace axiom::experiment
