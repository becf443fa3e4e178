#pragma once

#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

namespace axiom::experiment {

// Storage contract for experiments. Every operation is atomic per entity.
class ExperimentRepository {
public:
    virtual ~ExperimentRepository() = default;

    // Stores the experiment as given. Throws StorageFailure if the id exists.
    virtual Experiment create(const Experiment& experiment) = 0;

    virtual std::optional<Experiment> get(const std::string& experiment_id) const = 0;

    // Newest first. status filters exactly; tags match if any one is present
    // (an empty list matches everything).
    virtual std::vector<Experiment> list_all(
        std::optional<ExperimentStatus> status = std::nullopt,
        const std::vector<std::string>& tags = {}) const = 0;

    // Applies the set fields and refreshes updated_at; nullopt if not found
    virtual std::optional<Experiment> update(
        const std::string& experiment_id, const ExperimentUpdate& update) = 0;

    virtual bool remove(const std::string& experiment_id) = 0;

    virtual bool exists(const std::string& experiment_id) const = 0;
};

// Storage contract for runs. Every operation is atomic per entity; run
// numbers are allocated under the same lock as the insert.
class ExperimentRunRepository {
public:
    virtual ~ExperimentRunRepository() = default;

    // Insert a pending run with the next run number for the experiment
    // (1, 2, 3, ... never reused). Throws StorageFailure if run_id exists.
    virtual ExperimentRun create_next(
        const std::string& run_id,
        const std::string& experiment_id,
        const ExperimentConfig& config_snapshot) = 0;

    virtual std::optional<ExperimentRun> get(const std::string& run_id) const = 0;

    // Sorted by run_number
    virtual std::vector<ExperimentRun> list_by_experiment(const std::string& experiment_id) const = 0;

    // Runs currently stored for the experiment
    virtual int run_count(const std::string& experiment_id) const = 0;

    // Compare-and-set status change; false if missing or not in `from`.
    // Only pending -> running is accepted here, and it stamps started_at.
    virtual bool transition(const std::string& run_id, RunStatus from, RunStatus to) = 0;

    // running -> completed with results, stamps completed_at.
    // False if missing or not running.
    virtual bool complete(const std::string& run_id, const game::TournamentResult& results) = 0;

    // running -> failed with error, stamps completed_at.
    // False if missing or not running.
    virtual bool fail(const std::string& run_id, const RunError& error) = 0;

    // Drop all runs of an experiment, returning how many were removed
    virtual int remove_by_experiment(const std::string& experiment_id) = 0;
};

} // namespace axiom::experiment
