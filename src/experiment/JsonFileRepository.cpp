#include "JsonFileRepository.hpp"
#include "../core/Errors.hpp"
#include "../core/JsonFile.hpp"
#include "../core/Logging.hpp"

#include <algorithm>

namespace axiom::experiment {

namespace {

constexpr int kFormatVersion = 1;

// Rethrow a malformed record as a storage error naming the file
template <typename Fn>
void parse_or_throw(const std::filesystem::path& path, Fn&& fn) {
    try {
        fn();
    } catch (const nlohmann::json::exception& e) {
        throw StorageFailure("Malformed record in " + path.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw StorageFailure("Malformed record in " + path.string() + ": " + e.what());
    }
}

} // namespace

// ============================================================================
// Experiments
// ============================================================================

JsonFileExperimentRepository::JsonFileExperimentRepository(std::filesystem::path path)
    : path_(std::move(path))
{
    if (!std::filesystem::exists(path_)) {
        return;
    }

    nlohmann::json doc = read_json_file(path_);
    parse_or_throw(path_, [&] {
        for (const auto& item : doc.at("experiments")) {
            Experiment e = Experiment::from_json(item);
            experiments_[e.id] = e;
        }
    });

    logging::get_logger("axiom.storage")->debug(
        "Loaded {} experiments from {}", experiments_.size(), path_.string());
}

void JsonFileExperimentRepository::persist_locked() {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& [id, e] : experiments_) {
        items.push_back(e.to_json());
    }
    write_json_atomic(path_, {{"version", kFormatVersion}, {"experiments", items}});
}

// ============================================================================
// Runs
// ============================================================================

JsonFileExperimentRunRepository::JsonFileExperimentRunRepository(std::filesystem::path path)
    : path_(std::move(path))
{
    if (!std::filesystem::exists(path_)) {
        return;
    }

    nlohmann::json doc = read_json_file(path_);
    parse_or_throw(path_, [&] {
        for (const auto& item : doc.at("runs")) {
            ExperimentRun run = ExperimentRun::from_json(item);
            int& last = last_run_number_[run.experiment_id];
            last = std::max(last, run.run_number);
            runs_[run.id] = run;
        }
        if (doc.contains("run_counters")) {
            for (const auto& [experiment_id, counter] : doc.at("run_counters").items()) {
                int& last = last_run_number_[experiment_id];
                last = std::max(last, counter.get<int>());
            }
        }
    });

    logging::get_logger("axiom.storage")->debug(
        "Loaded {} runs from {}", runs_.size(), path_.string());
}

void JsonFileExperimentRunRepository::persist_locked() {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& [id, run] : runs_) {
        items.push_back(run.to_json());
    }
    nlohmann::json counters = nlohmann::json::object();
    for (const auto& [experiment_id, last] : last_run_number_) {
        counters[experiment_id] = last;
    }
    write_json_atomic(path_, {
        {"version", kFormatVersion},
        {"runs", items},
        {"run_counters", counters}
    });
}

} // namespace axiom::experiment
