#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/Time.hpp"
#include "../game/Tournament.hpp"

namespace axiom::experiment {

enum class ExperimentStatus {
    Draft,
    Running,
    Completed,
    Failed
};

// pending -> running -> completed | failed
enum class RunStatus {
    Pending,
    Running,
    Completed,
    Failed
};

std::string to_string(ExperimentStatus status);
std::string to_string(RunStatus status);

// Throw std::invalid_argument on an unknown name
ExperimentStatus parse_experiment_status(const std::string& text);
RunStatus parse_run_status(const std::string& text);

inline bool is_terminal(RunStatus status) {
    return status == RunStatus::Completed || status == RunStatus::Failed;
}

// What every run of an experiment executes
struct ExperimentConfig {
    std::vector<std::string> classical_strategies;
    int turns = 200;         // Per match
    int repetitions = 10;    // Per pairing
    int target_runs = 30;    // Runs wanted for statistical validity

    bool operator==(const ExperimentConfig& other) const {
        return classical_strategies == other.classical_strategies &&
               turns == other.turns && repetitions == other.repetitions &&
               target_runs == other.target_runs;
    }

    nlohmann::json to_json() const;
    static ExperimentConfig from_json(const nlohmann::json& j);
};

struct Experiment {
    std::string id;
    std::string name;
    std::string hypothesis;
    std::string description;
    ExperimentConfig config;
    std::vector<std::string> tags;
    ExperimentStatus status = ExperimentStatus::Draft;
    Timestamp created_at;
    Timestamp updated_at;

    bool has_any_tag(const std::vector<std::string>& wanted) const;

    nlohmann::json to_json() const;
    static Experiment from_json(const nlohmann::json& j);
};

// Fields to change on an experiment; unset fields are left alone
struct ExperimentUpdate {
    std::optional<std::string> name;
    std::optional<std::string> hypothesis;
    std::optional<std::string> description;
    std::optional<ExperimentConfig> config;
    std::optional<std::vector<std::string>> tags;
    std::optional<ExperimentStatus> status;
};

// Why a run failed
struct RunError {
    std::string message;
    std::string category;   // error_kind_name() or "ComputationFailure"
    Timestamp timestamp;

    bool operator==(const RunError& other) const {
        return message == other.message && category == other.category &&
               timestamp == other.timestamp;
    }

    nlohmann::json to_json() const;
    static RunError from_json(const nlohmann::json& j);
};

// One execution of an experiment's configuration
//
// config_snapshot is copied when the run is created; later edits to the
// experiment do not reach it.
struct ExperimentRun {
    std::string id;
    std::string experiment_id;
    int run_number = 0;                      // 1-based, per experiment
    RunStatus status = RunStatus::Pending;
    ExperimentConfig config_snapshot;
    std::optional<game::TournamentResult> results;
    std::optional<RunError> error;
    Timestamp created_at;
    std::optional<Timestamp> started_at;     // Set on entering running
    std::optional<Timestamp> completed_at;   // Set on entering a terminal state

    // completed_at - started_at, when both are known
    std::optional<double> duration_seconds() const;

    bool operator==(const ExperimentRun& other) const;

    nlohmann::json to_json() const;
    static ExperimentRun from_json(const nlohmann::json& j);
};

} // namespace axiom::experiment
