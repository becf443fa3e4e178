// Tests for the in-memory and JSON file repositories

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <thread>

#include "experiment/MemoryRepository.hpp"
#include "experiment/JsonFileRepository.hpp"
#include "core/Errors.hpp"
#include "core/Ids.hpp"

using namespace axiom;
using namespace axiom::experiment;

namespace {

Experiment make_experiment(const std::string& id, const std::vector<std::string>& tags = {}) {
    Experiment e;
    e.id = id;
    e.name = "experiment " + id;
    e.hypothesis = "h";
    e.config.classical_strategies = {"TitForTat", "Defector"};
    e.tags = tags;
    e.created_at = now();
    e.updated_at = e.created_at;
    return e;
}

// Fresh directory under the system temp dir, removed on scope exit
struct TempDir {
    std::filesystem::path path;

    TempDir() : path(std::filesystem::temp_directory_path() / ("axiom-test-" + generate_id())) {
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // namespace

TEST_CASE("Experiments are listed newest first and filtered", "[repository]") {
    InMemoryExperimentRepository repo;

    auto a = make_experiment("a", {"baseline"});
    auto b = make_experiment("b", {"noise", "baseline"});
    auto c = make_experiment("c", {"noise"});
    b.created_at = a.created_at + std::chrono::seconds(1);
    c.created_at = a.created_at + std::chrono::seconds(2);
    c.status = ExperimentStatus::Completed;
    repo.create(a);
    repo.create(b);
    repo.create(c);

    auto all = repo.list_all();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].id == "c");
    REQUIRE(all[1].id == "b");
    REQUIRE(all[2].id == "a");

    auto noise = repo.list_all(std::nullopt, {"noise"});
    REQUIRE(noise.size() == 2);

    auto any_of = repo.list_all(std::nullopt, {"missing", "baseline"});
    REQUIRE(any_of.size() == 2);

    auto done = repo.list_all(ExperimentStatus::Completed);
    REQUIRE(done.size() == 1);
    REQUIRE(done[0].id == "c");

    REQUIRE(repo.list_all(ExperimentStatus::Draft, {"noise"}).size() == 1);
}

TEST_CASE("Experiment ids are unique", "[repository]") {
    InMemoryExperimentRepository repo;
    repo.create(make_experiment("x"));
    REQUIRE_THROWS_AS(repo.create(make_experiment("x")), StorageFailure);
}

TEST_CASE("Partial update touches only the given fields", "[repository]") {
    InMemoryExperimentRepository repo;
    auto original = repo.create(make_experiment("u", {"t"}));

    ExperimentUpdate update;
    update.name = "renamed";
    update.status = ExperimentStatus::Running;
    auto updated = repo.update("u", update);

    REQUIRE(updated);
    REQUIRE(updated->name == "renamed");
    REQUIRE(updated->status == ExperimentStatus::Running);
    REQUIRE(updated->hypothesis == original.hypothesis);
    REQUIRE(updated->tags == original.tags);
    REQUIRE(updated->updated_at >= original.updated_at);

    REQUIRE_FALSE(repo.update("missing", update));
    REQUIRE(repo.remove("u"));
    REQUIRE_FALSE(repo.remove("u"));
    REQUIRE_FALSE(repo.exists("u"));
}

TEST_CASE("Run numbers are allocated per experiment", "[repository][runs]") {
    InMemoryExperimentRunRepository runs;
    ExperimentConfig config;

    REQUIRE(runs.create_next("r1", "e1", config).run_number == 1);
    REQUIRE(runs.create_next("r2", "e1", config).run_number == 2);
    REQUIRE(runs.create_next("r3", "e2", config).run_number == 1);
    REQUIRE(runs.run_count("e1") == 2);
    REQUIRE_THROWS_AS(runs.create_next("r1", "e1", config), StorageFailure);

    // Numbers are not reused after removal
    REQUIRE(runs.remove_by_experiment("e1") == 2);
    REQUIRE(runs.run_count("e1") == 0);
    REQUIRE(runs.create_next("r4", "e1", config).run_number == 3);
}

TEST_CASE("Concurrent create_next hands out distinct numbers", "[repository][runs]") {
    InMemoryExperimentRunRepository runs;
    const int kThreads = 8;
    const int kPerThread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&runs, t] {
            for (int i = 0; i < kPerThread; ++i) {
                runs.create_next("r" + std::to_string(t) + "-" + std::to_string(i), "e", {});
            }
        });
    }
    for (auto& th : threads) th.join();

    auto listed = runs.list_by_experiment("e");
    REQUIRE(listed.size() == static_cast<size_t>(kThreads * kPerThread));
    for (size_t i = 0; i < listed.size(); ++i) {
        REQUIRE(listed[i].run_number == static_cast<int>(i) + 1);
    }
}

TEST_CASE("Status transitions are compare-and-set", "[repository][runs]") {
    InMemoryExperimentRunRepository runs;
    runs.create_next("r", "e", {});

    REQUIRE_FALSE(runs.complete("r", {}));   // Still pending
    REQUIRE_FALSE(runs.transition("r", RunStatus::Running, RunStatus::Completed));

    // Terminal states are reachable only through complete() and fail()
    REQUIRE_FALSE(runs.transition("r", RunStatus::Pending, RunStatus::Completed));
    REQUIRE_FALSE(runs.transition("r", RunStatus::Pending, RunStatus::Failed));
    REQUIRE(runs.get("r")->status == RunStatus::Pending);
    REQUIRE_FALSE(runs.get("r")->completed_at.has_value());

    REQUIRE(runs.transition("r", RunStatus::Pending, RunStatus::Running));
    REQUIRE_FALSE(runs.transition("r", RunStatus::Pending, RunStatus::Running));

    auto running = runs.get("r");
    REQUIRE(running->status == RunStatus::Running);
    REQUIRE(running->started_at.has_value());
    REQUIRE_FALSE(running->completed_at.has_value());

    RunError error{"boom", "ComputationFailure", now()};
    REQUIRE(runs.fail("r", error));
    REQUIRE_FALSE(runs.complete("r", {}));
    REQUIRE_FALSE(runs.fail("r", error));

    auto failed = runs.get("r");
    REQUIRE(failed->status == RunStatus::Failed);
    REQUIRE(failed->error == error);
    REQUIRE(*failed->completed_at >= *failed->started_at);
    REQUIRE(is_terminal(failed->status));

    // Terminal states are final
    REQUIRE_FALSE(runs.transition("r", RunStatus::Failed, RunStatus::Pending));
    REQUIRE_FALSE(runs.transition("r", RunStatus::Failed, RunStatus::Running));
    REQUIRE(runs.get("r")->status == RunStatus::Failed);

    REQUIRE_FALSE(runs.transition("missing", RunStatus::Pending, RunStatus::Running));
    REQUIRE_FALSE(runs.get("missing"));
}

TEST_CASE("JSON file repositories reload what they wrote", "[repository][json]") {
    TempDir dir;
    const auto exp_path = dir.path / "experiments.json";
    const auto run_path = dir.path / "runs.json";

    {
        JsonFileExperimentRepository experiments(exp_path);
        JsonFileExperimentRunRepository runs(run_path);

        experiments.create(make_experiment("e1", {"persisted"}));
        runs.create_next("r1", "e1", {});
        runs.create_next("r2", "e1", {});
        REQUIRE(runs.transition("r1", RunStatus::Pending, RunStatus::Running));

        game::TournamentResult result;
        result.rankings = {{1, "Defector", 2.0, 0.0}, {2, "TitForTat", 1.5, 0.5}};
        result.total_matches = 2;
        result.winner = "Defector";
        result.cooperation_rates = {{"Defector", 0.0}, {"TitForTat", 0.5}};
        REQUIRE(runs.complete("r1", result));
        REQUIRE(runs.remove_by_experiment("missing") == 0);
    }

    REQUIRE(std::filesystem::exists(exp_path));
    REQUIRE(std::filesystem::exists(run_path));
    REQUIRE_FALSE(std::filesystem::exists(dir.path / "runs.json.tmp"));

    JsonFileExperimentRepository experiments(exp_path);
    JsonFileExperimentRunRepository runs(run_path);

    auto e = experiments.get("e1");
    REQUIRE(e);
    REQUIRE(e->tags == std::vector<std::string>{"persisted"});

    auto r1 = runs.get("r1");
    REQUIRE(r1);
    REQUIRE(r1->status == RunStatus::Completed);
    REQUIRE(r1->results->winner == "Defector");
    REQUIRE(r1->duration_seconds().has_value());

    // Counters survive the restart
    REQUIRE(runs.create_next("r3", "e1", {}).run_number == 3);
}

TEST_CASE("Removed runs do not bring their numbers back after a restart", "[repository][json]") {
    TempDir dir;
    const auto run_path = dir.path / "runs.json";
    {
        JsonFileExperimentRunRepository runs(run_path);
        runs.create_next("r1", "e1", {});
        runs.create_next("r2", "e1", {});
        runs.remove_by_experiment("e1");
    }
    JsonFileExperimentRunRepository runs(run_path);
    REQUIRE(runs.run_count("e1") == 0);
    REQUIRE(runs.create_next("r3", "e1", {}).run_number == 3);
}

TEST_CASE("Unreadable repository files are reported as storage failures", "[repository][json]") {
    TempDir dir;
    const auto path = dir.path / "experiments.json";
    {
        std::ofstream f(path);
        f << "{ not json";
    }
    REQUIRE_THROWS_AS(JsonFileExperimentRepository(path), StorageFailure);

    {
        std::ofstream f(path);
        f << R"({"version": 1, "experiments": [{"id": "x"}]})";
    }
    REQUIRE_THROWS_AS(JsonFileExperimentRepository(path), StorageFailure);
}
