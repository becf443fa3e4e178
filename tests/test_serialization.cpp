// JSON round trips of the result and record types, including through text

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <nlohmann/json.hpp>

#include "solver/Equilibrium.hpp"
#include "game/Tournament.hpp"
#include "experiment/Types.hpp"
#include "core/Time.hpp"

using namespace axiom;
using Catch::Matchers::WithinAbs;

namespace {

// Serialize to text and back, as storage does
nlohmann::json through_text(const nlohmann::json& j) {
    return nlohmann::json::parse(j.dump());
}

game::TournamentResult sample_tournament() {
    auto registry = game::StrategyRegistry::with_defaults();
    game::TournamentOptions options;
    options.seed = 99;
    game::TournamentRunner runner(registry, options);
    return runner.run_tournament({"TitForTat", "Random", "Defector", "GTFT"}, 30, 2);
}

} // namespace

TEST_CASE("EquilibriumResult survives a JSON round trip", "[serialization]") {
    solver::EquilibriumCalculator calc;
    auto original = calc.compute_equilibria({{0, 3}, {1, 2}});

    auto j = through_text(original.to_json());
    REQUIRE(j["num_equilibria"] == 3);
    REQUIRE(j["equilibria"][0].contains("player1_strategy"));
    REQUIRE(j["equilibria"][0].contains("player2_strategy"));

    auto restored = solver::EquilibriumResult::from_json(j);
    REQUIRE(restored.equilibria == original.equilibria);
    REQUIRE(restored.pure_equilibria == original.pure_equilibria);
    REQUIRE(restored.is_unique == original.is_unique);
    REQUIRE(restored.num_equilibria() == original.num_equilibria());
}

TEST_CASE("TournamentResult survives a JSON round trip", "[serialization]") {
    auto original = sample_tournament();

    auto restored = game::TournamentResult::from_json(through_text(original.to_json()));
    REQUIRE(restored == original);
    REQUIRE(restored.winner == original.rankings.front().strategy);
}

TEST_CASE("Timestamps keep microsecond precision", "[serialization][time]") {
    Timestamp t = now();
    REQUIRE(from_iso8601(to_iso8601(t)) == t);

    Timestamp fixed = from_iso8601("2026-01-02T03:04:05.123456Z");
    REQUIRE(to_iso8601(fixed) == "2026-01-02T03:04:05.123456Z");
    REQUIRE(to_iso8601(from_iso8601("2026-01-02T03:04:05Z")) == "2026-01-02T03:04:05.000000Z");

    REQUIRE_THROWS_AS(from_iso8601("yesterday"), std::invalid_argument);
    REQUIRE_THROWS_AS(from_iso8601("2026-01-02T03:04:05.Z"), std::invalid_argument);
}

TEST_CASE("Completed ExperimentRun survives a JSON round trip", "[serialization][experiment]") {
    experiment::ExperimentRun run;
    run.id = "run-1";
    run.experiment_id = "exp-1";
    run.run_number = 4;
    run.status = experiment::RunStatus::Completed;
    run.config_snapshot.classical_strategies = {"TitForTat", "Random", "Defector", "GTFT"};
    run.config_snapshot.turns = 30;
    run.config_snapshot.repetitions = 2;
    run.results = sample_tournament();
    run.created_at = now();
    run.started_at = run.created_at + std::chrono::milliseconds(5);
    run.completed_at = *run.started_at + std::chrono::milliseconds(1500);

    auto j = through_text(run.to_json());
    REQUIRE(j["status"] == "completed");
    REQUIRE(j["error"].is_null());
    REQUIRE_THAT(j["duration_seconds"].get<double>(), WithinAbs(1.5, 1e-9));

    auto restored = experiment::ExperimentRun::from_json(j);
    REQUIRE(restored == run);
    REQUIRE_THAT(*restored.duration_seconds(), WithinAbs(1.5, 1e-9));
}

TEST_CASE("Failed and pending runs survive a JSON round trip", "[serialization][experiment]") {
    experiment::ExperimentRun failed;
    failed.id = "run-2";
    failed.experiment_id = "exp-1";
    failed.run_number = 1;
    failed.status = experiment::RunStatus::Failed;
    failed.created_at = now();
    failed.started_at = failed.created_at;
    failed.completed_at = failed.created_at;
    failed.error = experiment::RunError{"Strategy 'Nobody' not found", "StrategyNotFound", now()};

    auto j = through_text(failed.to_json());
    REQUIRE(j["error"]["type"] == "StrategyNotFound");
    REQUIRE(j["results"].is_null());
    REQUIRE(experiment::ExperimentRun::from_json(j) == failed);

    experiment::ExperimentRun pending;
    pending.id = "run-3";
    pending.experiment_id = "exp-1";
    pending.run_number = 2;
    pending.created_at = now();

    auto pj = through_text(pending.to_json());
    REQUIRE(pj["started_at"].is_null());
    REQUIRE(pj["duration_seconds"].is_null());
    auto restored = experiment::ExperimentRun::from_json(pj);
    REQUIRE(restored == pending);
    REQUIRE_FALSE(restored.duration_seconds().has_value());
}

TEST_CASE("Experiment survives a JSON round trip", "[serialization][experiment]") {
    experiment::Experiment e;
    e.id = "exp-9";
    e.name = "Forgiveness";
    e.hypothesis = "Generous strategies outscore strict ones";
    e.config.classical_strategies = {"GTFT", "TitForTat"};
    e.config.target_runs = 12;
    e.tags = {"forgiveness", "baseline"};
    e.status = experiment::ExperimentStatus::Running;
    e.created_at = now();
    e.updated_at = e.created_at;

    auto restored = experiment::Experiment::from_json(through_text(e.to_json()));
    REQUIRE(restored.id == e.id);
    REQUIRE(restored.name == e.name);
    REQUIRE(restored.hypothesis == e.hypothesis);
    REQUIRE(restored.config == e.config);
    REQUIRE(restored.tags == e.tags);
    REQUIRE(restored.status == e.status);
    REQUIRE(restored.created_at == e.created_at);
}

TEST_CASE("Unknown status names are rejected", "[serialization][experiment]") {
    REQUIRE(experiment::parse_run_status("running") == experiment::RunStatus::Running);
    REQUIRE(experiment::parse_experiment_status("draft") == experiment::ExperimentStatus::Draft);
    REQUIRE_THROWS_AS(experiment::parse_run_status("paused"), std::invalid_argument);
    REQUIRE_THROWS_AS(experiment::parse_experiment_status(""), std::invalid_argument);
}
