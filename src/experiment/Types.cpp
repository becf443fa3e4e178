#include "Types.hpp"

#include <algorithm>
#include <stdexcept>

namespace axiom::experiment {

namespace {

nlohmann::json optional_time(const std::optional<Timestamp>& t) {
    return t ? nlohmann::json(to_iso8601(*t)) : nlohmann::json(nullptr);
}

std::optional<Timestamp> parse_optional_time(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return from_iso8601(j.at(key).get<std::string>());
}

} // namespace

std::string to_string(ExperimentStatus status) {
    switch (status) {
        case ExperimentStatus::Draft:     return "draft";
        case ExperimentStatus::Running:   return "running";
        case ExperimentStatus::Completed: return "completed";
        case ExperimentStatus::Failed:    return "failed";
    }
    return "unknown";
}

std::string to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Pending:   return "pending";
        case RunStatus::Running:   return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed:    return "failed";
    }
    return "unknown";
}

ExperimentStatus parse_experiment_status(const std::string& text) {
    if (text == "draft") return ExperimentStatus::Draft;
    if (text == "running") return ExperimentStatus::Running;
    if (text == "completed") return ExperimentStatus::Completed;
    if (text == "failed") return ExperimentStatus::Failed;
    throw std::invalid_argument("Unknown experiment status: " + text);
}

RunStatus parse_run_status(const std::string& text) {
    if (text == "pending") return RunStatus::Pending;
    if (text == "running") return RunStatus::Running;
    if (text == "completed") return RunStatus::Completed;
    if (text == "failed") return RunStatus::Failed;
    throw std::invalid_argument("Unknown run status: " + text);
}

nlohmann::json ExperimentConfig::to_json() const {
    return {
        {"classical_strategies", classical_strategies},
        {"turns", turns},
        {"repetitions", repetitions},
        {"target_runs", target_runs}
    };
}

ExperimentConfig ExperimentConfig::from_json(const nlohmann::json& j) {
    ExperimentConfig c;
    c.classical_strategies =
        j.value("classical_strategies", std::vector<std::string>{});
    c.turns = j.value("turns", c.turns);
    c.repetitions = j.value("repetitions", c.repetitions);
    c.target_runs = j.value("target_runs", c.target_runs);
    return c;
}

bool Experiment::has_any_tag(const std::vector<std::string>& wanted) const {
    return std::any_of(wanted.begin(), wanted.end(), [this](const std::string& t) {
        return std::find(tags.begin(), tags.end(), t) != tags.end();
    });
}

nlohmann::json Experiment::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"hypothesis", hypothesis},
        {"description", description},
        {"config", config.to_json()},
        {"tags", tags},
        {"status", to_string(status)},
        {"created_at", to_iso8601(created_at)},
        {"updated_at", to_iso8601(updated_at)}
    };
}

Experiment Experiment::from_json(const nlohmann::json& j) {
    Experiment e;
    e.id = j.at("id").get<std::string>();
    e.name = j.at("name").get<std::string>();
    e.hypothesis = j.at("hypothesis").get<std::string>();
    e.description = j.value("description", std::string());
    e.config = ExperimentConfig::from_json(j.at("config"));
    e.tags = j.value("tags", std::vector<std::string>{});
    e.status = parse_experiment_status(j.at("status").get<std::string>());
    e.created_at = from_iso8601(j.at("created_at").get<std::string>());
    e.updated_at = from_iso8601(j.at("updated_at").get<std::string>());
    return e;
}

nlohmann::json RunError::to_json() const {
    return {
        {"message", message},
        {"type", category},
        {"timestamp", to_iso8601(timestamp)}
    };
}

RunError RunError::from_json(const nlohmann::json& j) {
    RunError e;
    e.message = j.at("message").get<std::string>();
    e.category = j.at("type").get<std::string>();
    e.timestamp = from_iso8601(j.at("timestamp").get<std::string>());
    return e;
}

std::optional<double> ExperimentRun::duration_seconds() const {
    if (!started_at || !completed_at) return std::nullopt;
    return seconds_between(*started_at, *completed_at);
}

bool ExperimentRun::operator==(const ExperimentRun& other) const {
    return id == other.id && experiment_id == other.experiment_id &&
           run_number == other.run_number && status == other.status &&
           config_snapshot == other.config_snapshot && results == other.results &&
           error == other.error && created_at == other.created_at &&
           started_at == other.started_at && completed_at == other.completed_at;
}

nlohmann::json ExperimentRun::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["experiment_id"] = experiment_id;
    j["run_number"] = run_number;
    j["status"] = to_string(status);
    j["config_snapshot"] = config_snapshot.to_json();
    j["results"] = results ? results->to_json() : nlohmann::json(nullptr);
    j["error"] = error ? error->to_json() : nlohmann::json(nullptr);
    j["created_at"] = to_iso8601(created_at);
    j["started_at"] = optional_time(started_at);
    j["completed_at"] = optional_time(completed_at);

    auto duration = duration_seconds();
    j["duration_seconds"] = duration ? nlohmann::json(*duration) : nlohmann::json(nullptr);
    return j;
}

ExperimentRun ExperimentRun::from_json(const nlohmann::json& j) {
    ExperimentRun r;
    r.id = j.at("id").get<std::string>();
    r.experiment_id = j.at("experiment_id").get<std::string>();
    r.run_number = j.at("run_number").get<int>();
    r.status = parse_run_status(j.at("status").get<std::string>());
    r.config_snapshot = ExperimentConfig::from_json(j.at("config_snapshot"));
    if (j.contains("results") && !j.at("results").is_null()) {
        r.results = game::TournamentResult::from_json(j.at("results"));
    }
    if (j.contains("error") && !j.at("error").is_null()) {
        r.error = RunError::from_json(j.at("error"));
    }
    r.created_at = from_iso8601(j.at("created_at").get<std::string>());
    r.started_at = parse_optional_time(j, "started_at");
    r.completed_at = parse_optional_time(j, "completed_at");
    return r;
}

} // namespace axiom::experiment
