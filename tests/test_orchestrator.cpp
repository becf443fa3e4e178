// Tests for the experiment service, the run worker and run analysis

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <algorithm>
#include <cstdint>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>

#include "experiment/ExperimentService.hpp"
#include "experiment/MemoryRepository.hpp"
#include "experiment/RunWorker.hpp"
#include "experiment/RunAnalysis.hpp"
#include "parallel/WorkerPool.hpp"
#include "game/Strategy.hpp"
#include "game/StrategyRegistry.hpp"
#include "core/Errors.hpp"

using namespace axiom;
using namespace axiom::experiment;
using Catch::Matchers::WithinAbs;

namespace {

ExperimentService make_service() {
    return ExperimentService(
        std::make_shared<InMemoryExperimentRepository>(),
        std::make_shared<InMemoryExperimentRunRepository>());
}

Experiment draft(const std::vector<std::string>& strategies, int turns = 10, int repetitions = 1) {
    Experiment e;
    e.name = "test";
    e.hypothesis = "Defection pays against unconditional cooperation";
    e.config.classical_strategies = strategies;
    e.config.turns = turns;
    e.config.repetitions = repetitions;
    return e;
}

// Runs dispatched tasks inline on the caller's thread
class InlineDispatcher : public parallel::Dispatcher {
public:
    void submit(std::function<void()> task) override {
        submitted++;
        task();
    }
    int submitted = 0;
};

// Throws a plain std::runtime_error on its third move
class FaultyStrategy : public game::Strategy {
public:
    game::Action next_action(const game::ActionHistory& history) override {
        if (history.size() >= 2) throw std::runtime_error("numeric blow-up");
        return game::Action::Cooperate;
    }
    std::string name() const override { return "Faulty"; }
    game::Classifier classifier() const override { return {-1, false}; }
};

// Deletes the experiment just before the run is stored, as a concurrent
// delete_experiment would
class RacingRunRepository : public InMemoryExperimentRunRepository {
public:
    explicit RacingRunRepository(std::shared_ptr<InMemoryExperimentRepository> experiments)
        : experiments_(std::move(experiments)) {}

    ExperimentRun create_next(
        const std::string& run_id,
        const std::string& experiment_id,
        const ExperimentConfig& config_snapshot) override {
        experiments_->remove(experiment_id);
        return InMemoryExperimentRunRepository::create_next(run_id, experiment_id, config_snapshot);
    }

private:
    std::shared_ptr<InMemoryExperimentRepository> experiments_;
};

} // namespace

TEST_CASE("Experiments are created as drafts with generated ids", "[service]") {
    auto service = make_service();
    auto e = service.create_experiment(draft({"Cooperator", "Defector"}));

    REQUIRE_FALSE(e.id.empty());
    REQUIRE(e.status == ExperimentStatus::Draft);
    REQUIRE(e.created_at == e.updated_at);
    REQUIRE(service.get_experiment(e.id).name == "test");

    REQUIRE_THROWS_AS(service.get_experiment("missing"), ExperimentNotFound);
    REQUIRE_THROWS_AS(service.create_experiment(draft({"Cooperator"}, 0)), InvalidTurnCount);
    REQUIRE_THROWS_AS(service.create_experiment(draft({"Cooperator"}, 10, 0)), InvalidTurnCount);
}

TEST_CASE("Runs snapshot the configuration at creation", "[service]") {
    auto service = make_service();
    auto e = service.create_experiment(draft({"Cooperator", "Defector"}));

    auto first = service.create_run(e.id);
    REQUIRE(first.run_number == 1);
    REQUIRE(first.status == RunStatus::Pending);
    REQUIRE(first.config_snapshot == e.config);

    ExperimentUpdate update;
    ExperimentConfig changed = e.config;
    changed.turns = 99;
    update.config = changed;
    service.update_experiment(e.id, update);

    auto second = service.create_run(e.id);
    REQUIRE(second.run_number == 2);
    REQUIRE(second.config_snapshot.turns == 99);
    REQUIRE(service.get_run(first.id).config_snapshot.turns == 10);

    REQUIRE_THROWS_AS(service.create_run("missing"), ExperimentNotFound);
    REQUIRE_THROWS_AS(service.get_run("missing"), RunNotFound);
    REQUIRE_THROWS_AS(service.list_runs("missing"), ExperimentNotFound);
    REQUIRE_THROWS_AS(service.create_runs(e.id, 0), std::invalid_argument);
}

TEST_CASE("Concurrent run creation numbers runs 1..N", "[service][concurrency]") {
    auto service = make_service();
    auto e = service.create_experiment(draft({"Cooperator", "Defector"}));

    const int kRuns = 32;
    std::vector<std::thread> threads;
    for (int i = 0; i < kRuns; ++i) {
        threads.emplace_back([&service, &e] { service.create_run(e.id); });
    }
    for (auto& t : threads) t.join();

    auto runs = service.list_runs(e.id);
    REQUIRE(runs.size() == static_cast<size_t>(kRuns));

    std::set<int> numbers;
    for (const auto& r : runs) numbers.insert(r.run_number);
    REQUIRE(numbers.size() == static_cast<size_t>(kRuns));
    REQUIRE(*numbers.begin() == 1);
    REQUIRE(*numbers.rbegin() == kRuns);
}

TEST_CASE("Executing a run stores the tournament result", "[worker]") {
    auto service = make_service();
    auto registry = game::StrategyRegistry::with_defaults();
    game::TournamentRunner runner(registry);
    InlineDispatcher dispatcher;
    RunWorker worker(service, runner, dispatcher);

    auto e = service.create_experiment(draft({"Cooperator", "Defector"}));
    auto run = service.create_run(e.id);

    auto done = worker.execute_run(run.id);
    REQUIRE(done.status == RunStatus::Completed);
    REQUIRE(done.results);
    REQUIRE(done.results->winner == "Defector");
    REQUIRE(done.results->total_matches == 2);
    REQUIRE_FALSE(done.error);
    REQUIRE(done.started_at);
    REQUIRE(done.completed_at);
    REQUIRE(*done.completed_at >= *done.started_at);

    // Terminal runs cannot be executed again
    REQUIRE_THROWS_AS(worker.execute_run(run.id), InvalidRunState);
    REQUIRE_THROWS_AS(worker.execute_run("missing"), RunNotFound);
}

TEST_CASE("A failing run ends failed with its error recorded", "[worker]") {
    auto service = make_service();
    auto registry = game::StrategyRegistry::with_defaults();
    game::TournamentRunner runner(registry);
    InlineDispatcher dispatcher;
    RunWorker worker(service, runner, dispatcher);

    auto e = service.create_experiment(draft({"Cooperator", "NoSuchStrategy"}));
    auto run = service.create_run(e.id);

    ExperimentRun failed;
    REQUIRE_NOTHROW(failed = worker.execute_run(run.id));

    REQUIRE(failed.status == RunStatus::Failed);
    REQUIRE_FALSE(failed.results);
    REQUIRE(failed.error);
    REQUIRE(failed.error->category == "StrategyNotFound");
    REQUIRE(failed.error->message.find("NoSuchStrategy") != std::string::npos);
    REQUIRE(failed.started_at);
    REQUIRE(failed.completed_at);
    REQUIRE(*failed.completed_at >= *failed.started_at);

    REQUIRE(service.get_run(run.id) == failed);
}

TEST_CASE("Unexpected exceptions are recorded as computation failures", "[worker]") {
    auto service = make_service();
    game::StrategyRegistry registry = game::StrategyRegistry::with_defaults();
    registry.add({"Faulty", "Throws mid-match", {-1, false}, false},
                 [](std::uint64_t) { return std::make_unique<FaultyStrategy>(); });
    game::TournamentRunner runner(registry);
    InlineDispatcher dispatcher;
    RunWorker worker(service, runner, dispatcher);

    auto e = service.create_experiment(draft({"Cooperator", "Faulty"}));
    auto run = service.create_run(e.id);

    ExperimentRun failed;
    REQUIRE_NOTHROW(failed = worker.execute_run(run.id));

    REQUIRE(failed.status == RunStatus::Failed);
    REQUIRE_FALSE(failed.results);
    REQUIRE(failed.error);
    REQUIRE(failed.error->category == "ComputationFailure");
    REQUIRE(failed.error->message == "numeric blow-up");
    REQUIRE(failed.started_at);
    REQUIRE(failed.completed_at);
    REQUIRE(*failed.completed_at >= *failed.started_at);
}

TEST_CASE("Runs created while their experiment is deleted are discarded", "[service][concurrency]") {
    auto experiments = std::make_shared<InMemoryExperimentRepository>();
    auto runs = std::make_shared<RacingRunRepository>(experiments);
    ExperimentService service(experiments, runs);

    auto single = service.create_experiment(draft({"Cooperator", "Defector"}));
    REQUIRE_THROWS_AS(service.create_run(single.id), ExperimentNotFound);
    REQUIRE(runs->run_count(single.id) == 0);

    auto batch = service.create_experiment(draft({"Cooperator", "Defector"}));
    REQUIRE_THROWS_AS(service.create_runs(batch.id, 3), ExperimentNotFound);
    REQUIRE(runs->run_count(batch.id) == 0);
    REQUIRE(runs->list_by_experiment(batch.id).empty());
}

TEST_CASE("A run without strategies fails as an invalid tournament", "[worker]") {
    auto service = make_service();
    auto registry = game::StrategyRegistry::with_defaults();
    game::TournamentRunner runner(registry);
    InlineDispatcher dispatcher;
    RunWorker worker(service, runner, dispatcher);

    auto e = service.create_experiment(draft({}));
    auto failed = worker.execute_run(service.create_run(e.id).id);
    REQUIRE(failed.status == RunStatus::Failed);
    REQUIRE(failed.error->category == "InvalidTournament");
}

TEST_CASE("Dispatch validates synchronously and executes later", "[worker]") {
    auto service = make_service();
    auto registry = game::StrategyRegistry::with_defaults();
    game::TournamentRunner runner(registry);
    InlineDispatcher dispatcher;
    RunWorker worker(service, runner, dispatcher);

    auto e = service.create_experiment(draft({"TitForTat", "Defector"}));
    auto run = service.create_run(e.id);

    worker.dispatch(run.id);
    REQUIRE(dispatcher.submitted == 1);
    REQUIRE(service.get_run(run.id).status == RunStatus::Completed);

    REQUIRE_THROWS_AS(worker.dispatch(run.id), InvalidRunState);
    REQUIRE_THROWS_AS(worker.dispatch("missing"), RunNotFound);
    REQUIRE(dispatcher.submitted == 1);
}

TEST_CASE("Runs on a worker pool fail independently", "[worker][concurrency]") {
    auto service = make_service();
    auto registry = game::StrategyRegistry::with_defaults();
    game::TournamentRunner runner(registry);
    parallel::WorkerPool pool(4);
    RunWorker worker(service, runner, pool);

    auto good = service.create_experiment(draft({"TitForTat", "Defector", "Random"}, 20, 2));
    auto bad = service.create_experiment(draft({"TitForTat", "Ghost"}));
    service.create_runs(good.id, 6);
    service.create_runs(bad.id, 2);

    REQUIRE(worker.dispatch_pending(good.id) == 6);
    REQUIRE(worker.dispatch_pending(bad.id) == 2);
    pool.wait_idle();

    for (const auto& r : service.list_runs(good.id)) {
        REQUIRE(r.status == RunStatus::Completed);
        REQUIRE(r.results->total_matches == 3 * 2 * 2);
    }
    for (const auto& r : service.list_runs(bad.id)) {
        REQUIRE(r.status == RunStatus::Failed);
        REQUIRE(r.error->category == "StrategyNotFound");
    }

    // Nothing left to dispatch
    REQUIRE(worker.dispatch_pending(good.id) == 0);

    auto metrics = pool.metrics();
    REQUIRE(metrics.tasks_submitted == 8);
    REQUIRE(metrics.tasks_failed == 0);
}

TEST_CASE("Deleting an experiment removes its runs", "[service]") {
    auto service = make_service();
    auto e = service.create_experiment(draft({"Cooperator", "Defector"}));
    auto runs = service.create_runs(e.id, 3);

    REQUIRE(service.delete_experiment(e.id) == 3);
    REQUIRE_THROWS_AS(service.get_experiment(e.id), ExperimentNotFound);
    REQUIRE_THROWS_AS(service.get_run(runs[0].id), RunNotFound);
    REQUIRE_THROWS_AS(service.delete_experiment(e.id), ExperimentNotFound);
}

TEST_CASE("Manual transitions reject the wrong state", "[service]") {
    auto service = make_service();
    auto e = service.create_experiment(draft({"Cooperator", "Defector"}));
    auto run = service.create_run(e.id);

    REQUIRE_THROWS_AS(service.complete_run(run.id, {}), InvalidRunState);
    auto running = service.start_run(run.id);
    REQUIRE(running.status == RunStatus::Running);
    REQUIRE_THROWS_AS(service.start_run(run.id), InvalidRunState);
    REQUIRE_THROWS_AS(service.start_run("missing"), RunNotFound);

    service.fail_run(run.id, {"stopped by hand", "ComputationFailure", now()});
    REQUIRE(service.get_run(run.id).status == RunStatus::Failed);
}

TEST_CASE("Experiment listing filters by status and tags", "[service]") {
    auto service = make_service();
    auto a = draft({"Cooperator", "Defector"});
    a.tags = {"baseline"};
    auto b = draft({"Cooperator", "Defector"});
    b.tags = {"noise"};
    auto created_a = service.create_experiment(a);
    service.create_experiment(b);

    ExperimentUpdate update;
    update.status = ExperimentStatus::Completed;
    service.update_experiment(created_a.id, update);

    REQUIRE(service.list_experiments().size() == 2);
    REQUIRE(service.list_experiments(ExperimentStatus::Completed).size() == 1);
    REQUIRE(service.list_experiments(std::nullopt, {"noise"}).size() == 1);
    REQUIRE(service.list_experiments(ExperimentStatus::Draft, {"baseline"}).empty());
}

TEST_CASE("Metric statistics use the sample standard deviation", "[analysis]") {
    auto s = MetricStats::from_samples({1.0, 2.0, 3.0, 4.0});
    REQUIRE(s.n == 4);
    REQUIRE_THAT(s.mean, WithinAbs(2.5, 1e-12));
    REQUIRE_THAT(s.stddev, WithinAbs(1.2909944487358056, 1e-12));
    REQUIRE_THAT(s.ci_lower, WithinAbs(2.5 - 1.96 * s.stddev / 2.0, 1e-12));
    REQUIRE_THAT(s.ci_upper, WithinAbs(2.5 + 1.96 * s.stddev / 2.0, 1e-12));

    auto single = MetricStats::from_samples({0.7});
    REQUIRE_THAT(single.stddev, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(single.ci_lower, WithinAbs(0.7, 1e-12));

    REQUIRE_THROWS_AS(MetricStats::from_samples({}), std::invalid_argument);
}

TEST_CASE("Experiment analysis aggregates completed runs", "[analysis]") {
    auto service = make_service();
    auto registry = game::StrategyRegistry::with_defaults();
    game::TournamentRunner runner(registry);
    InlineDispatcher dispatcher;
    RunWorker worker(service, runner, dispatcher);

    auto e = service.create_experiment(draft({"Cooperator", "Defector"}));

    auto empty = service.analyze_experiment(e.id);
    REQUIRE(empty.total_runs == 0);
    REQUIRE_FALSE(empty.cooperation_rate);
    REQUIRE(empty.to_json()["cooperation_rate"].is_null());

    service.create_runs(e.id, 3);
    REQUIRE(worker.dispatch_pending(e.id) == 3);

    // One more run left pending
    service.create_run(e.id);

    auto analysis = service.analyze_experiment(e.id);
    REQUIRE(analysis.total_runs == 4);
    REQUIRE(analysis.successful_runs == 3);
    REQUIRE(analysis.failed_runs == 0);

    REQUIRE(analysis.cooperation_rate);
    REQUIRE(analysis.cooperation_rate->n == 3);
    REQUIRE_THAT(analysis.cooperation_rate->mean, WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(analysis.cooperation_rate->stddev, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(analysis.average_score->mean, WithinAbs(25.0, 1e-12));

    const auto& defector = analysis.strategies.at("Defector");
    REQUIRE(defector.wins == 3);
    REQUIRE(defector.appearances == 3);
    REQUIRE_THAT(defector.mean_score, WithinAbs(50.0, 1e-12));
    REQUIRE(analysis.strategies.at("Cooperator").wins == 0);

    REQUIRE_THROWS_AS(service.analyze_experiment("missing"), ExperimentNotFound);
}
