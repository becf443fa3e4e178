#pragma once

#include <map>
#include <mutex>
#include "Repository.hpp"

namespace axiom::experiment {

// Experiments kept in a map guarded by one mutex. Lost on exit.
class InMemoryExperimentRepository : public ExperimentRepository {
public:
    Experiment create(const Experiment& experiment) override;
    std::optional<Experiment> get(const std::string& experiment_id) const override;
    std::vector<Experiment> list_all(
        std::optional<ExperimentStatus> status = std::nullopt,
        const std::vector<std::string>& tags = {}) const override;
    std::optional<Experiment> update(
        const std::string& experiment_id, const ExperimentUpdate& update) override;
    bool remove(const std::string& experiment_id) override;
    bool exists(const std::string& experiment_id) const override;

protected:
    // Called with mutex_ held after every successful mutation
    virtual void persist_locked() {}

    mutable std::mutex mutex_;
    std::map<std::string, Experiment> experiments_;
};

// Runs kept in a map guarded by one mutex. Lost on exit.
class InMemoryExperimentRunRepository : public ExperimentRunRepository {
public:
    ExperimentRun create_next(
        const std::string& run_id,
        const std::string& experiment_id,
        const ExperimentConfig& config_snapshot) override;
    std::optional<ExperimentRun> get(const std::string& run_id) const override;
    std::vector<ExperimentRun> list_by_experiment(const std::string& experiment_id) const override;
    int run_count(const std::string& experiment_id) const override;
    bool transition(const std::string& run_id, RunStatus from, RunStatus to) override;
    bool complete(const std::string& run_id, const game::TournamentResult& results) override;
    bool fail(const std::string& run_id, const RunError& error) override;
    int remove_by_experiment(const std::string& experiment_id) override;

protected:
    // Called with mutex_ held after every successful mutation
    virtual void persist_locked() {}

    mutable std::mutex mutex_;
    std::map<std::string, ExperimentRun> runs_;
    std::map<std::string, int> last_run_number_;   // experiment id -> highest issued
};

} // namespace axiom::experiment
