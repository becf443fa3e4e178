// Axiom: equilibrium analysis and iterated prisoner's dilemma tournaments
//
// Usage:
//   ./axiom <command> [options]
//
// Commands:
//   strategies [--basic]                         List the strategy catalog
//   equilibrium --matrix "3,0;5,1"               Nash equilibria of a symmetric game
//   tournament --strategies A,B,C [--turns N] [--reps N]
//   analyze --strategy NAME [--turns N]          Play NAME against the three probes
//   experiment --name N --strategies A,B [--runs K] [--turns N] [--reps N]
//
// Global options:
//   --config <path>      JSON settings file
//   --data-dir <path>    Persist experiments as JSON under this directory
//   --output <path>      Also write the result as JSON
//   --log-level <level>  trace|debug|info|warn|error|off

#include <iostream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include <cstdlib>

#include "core/Errors.hpp"
#include "core/JsonFile.hpp"
#include "core/Logging.hpp"
#include "core/Settings.hpp"
#include "solver/Equilibrium.hpp"
#include "game/StrategyRegistry.hpp"
#include "game/Tournament.hpp"
#include "game/Analyzer.hpp"
#include "experiment/ExperimentService.hpp"
#include "experiment/MemoryRepository.hpp"
#include "experiment/JsonFileRepository.hpp"
#include "experiment/RunWorker.hpp"
#include "parallel/WorkerPool.hpp"

using namespace axiom;

// Command line arguments
struct Args {
    std::string command;
    std::string config_path;
    std::string data_dir;
    std::string output_path;
    std::string log_level;
    std::string matrix;
    std::string strategies;
    std::string strategy;
    std::string name;
    std::string hypothesis;
    std::optional<int> turns;
    std::optional<int> reps;
    int runs = 1;
    bool basic = false;
};

void print_usage() {
    std::cout << "Axiom: equilibrium analysis and iterated prisoner's dilemma tournaments\n\n"
              << "Usage: axiom <command> [options]\n\n"
              << "Commands:\n"
              << "  strategies [--basic]                 List available strategies\n"
              << "  equilibrium --matrix \"3,0;5,1\"       Nash equilibria (rows split by ';')\n"
              << "  tournament --strategies A,B,C        Round-robin tournament\n"
              << "             [--turns N] [--reps N]\n"
              << "  analyze --strategy NAME [--turns N]  Behaviour against canonical opponents\n"
              << "  experiment --name N --strategies A,B Create an experiment, execute its runs\n"
              << "             [--runs K] [--turns N] [--reps N] [--hypothesis TEXT]\n\n"
              << "Options:\n"
              << "  --config <path>      JSON settings file\n"
              << "  --data-dir <path>    Persist experiments under this directory\n"
              << "  --output <path>      Write the result as JSON\n"
              << "  --log-level <level>  trace|debug|info|warn|error|off\n"
              << "  --help               Show this help\n";
}

Args parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--data-dir" && i + 1 < argc) {
            args.data_dir = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--matrix" && i + 1 < argc) {
            args.matrix = argv[++i];
        } else if (arg == "--strategies" && i + 1 < argc) {
            args.strategies = argv[++i];
        } else if (arg == "--strategy" && i + 1 < argc) {
            args.strategy = argv[++i];
        } else if (arg == "--name" && i + 1 < argc) {
            args.name = argv[++i];
        } else if (arg == "--hypothesis" && i + 1 < argc) {
            args.hypothesis = argv[++i];
        } else if (arg == "--turns" && i + 1 < argc) {
            args.turns = std::stoi(argv[++i]);
        } else if (arg == "--reps" && i + 1 < argc) {
            args.reps = std::stoi(argv[++i]);
        } else if (arg == "--runs" && i + 1 < argc) {
            args.runs = std::stoi(argv[++i]);
        } else if (arg == "--basic") {
            args.basic = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (args.command.empty() && arg.rfind("--", 0) != 0) {
            args.command = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }
    return args;
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, sep)) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

// "3,0;5,1" -> {{3, 0}, {5, 1}}
solver::PayoffMatrix parse_matrix(const std::string& text) {
    solver::PayoffMatrix matrix;
    for (const auto& row : split(text, ';')) {
        std::vector<double> values;
        for (const auto& cell : split(row, ',')) {
            values.push_back(std::stod(cell));
        }
        matrix.push_back(values);
    }
    return matrix;
}

void emit(const Args& args, const nlohmann::json& result) {
    if (!args.output_path.empty()) {
        write_json_atomic(args.output_path, result);
        std::cout << "\nResult written to: " << args.output_path << std::endl;
    }
}

void print_vector(const Eigen::VectorXd& v) {
    std::cout << "[";
    for (int i = 0; i < v.size(); ++i) {
        std::cout << (i ? ", " : "") << std::fixed << std::setprecision(4) << v(i);
    }
    std::cout << "]";
}

void print_rankings(const game::TournamentResult& result) {
    std::cout << std::string(60, '-') << std::endl;
    std::cout << std::left << std::setw(6) << "Rank" << std::setw(24) << "Strategy"
              << std::right << std::setw(12) << "Score" << std::setw(14) << "Coop rate" << std::endl;
    for (const auto& r : result.rankings) {
        std::cout << std::left << std::setw(6) << r.rank << std::setw(24) << r.strategy
                  << std::right << std::setw(12) << std::fixed << std::setprecision(2) << r.score
                  << std::setw(14) << std::setprecision(4) << r.cooperation_rate << std::endl;
    }
    std::cout << std::string(60, '-') << std::endl;
    std::cout << "Winner: " << result.winner << " (" << result.total_matches << " matches)" << std::endl;
}

int cmd_strategies(const Args& args, const game::StrategyRegistry& registry) {
    auto infos = registry.list_strategies(args.basic);
    nlohmann::json out = nlohmann::json::array();
    for (const auto& info : infos) {
        std::cout << std::left << std::setw(22) << info.name << info.description << std::endl;
        out.push_back(info.to_json());
    }
    emit(args, out);
    return 0;
}

int cmd_equilibrium(const Args& args) {
    if (args.matrix.empty()) {
        std::cerr << "equilibrium requires --matrix" << std::endl;
        return 2;
    }
    solver::PayoffMatrix matrix = parse_matrix(args.matrix);

    solver::EquilibriumCalculator calculator;
    auto result = calculator.compute_equilibria(matrix);

    std::cout << "Pure equilibria: " << result.pure_equilibria.size() << std::endl;
    for (const auto& p : result.pure_equilibria) {
        std::cout << "  (" << p.row << ", " << p.col << ")" << std::endl;
    }
    std::cout << "Equilibria: " << result.num_equilibria()
              << (result.is_unique ? " (unique)" : "") << std::endl;
    for (const auto& profile : result.equilibria) {
        std::cout << "  row ";
        print_vector(profile.row);
        std::cout << "  col ";
        print_vector(profile.col);
        std::cout << "  payoff " << std::setprecision(4)
                  << calculator.compute_expected_payoff(matrix, profile) << std::endl;
    }
    std::cout << "Candidates examined: " << result.trace.candidates << std::endl;

    emit(args, result.to_json());
    return 0;
}

int cmd_tournament(const Args& args, const Settings& settings, const game::StrategyRegistry& registry) {
    game::TournamentOptions options;
    options.seed = settings.seed;
    options.max_strategies = settings.max_strategies_per_tournament;
    game::TournamentRunner runner(registry, options);

    auto result = runner.run_tournament(
        split(args.strategies, ','),
        args.turns.value_or(settings.default_turns),
        args.reps.value_or(settings.default_repetitions));

    print_rankings(result);
    emit(args, result.to_json());
    return 0;
}

int cmd_analyze(const Args& args, const Settings& settings, const game::StrategyRegistry& registry) {
    if (args.strategy.empty()) {
        std::cerr << "analyze requires --strategy" << std::endl;
        return 2;
    }
    game::StrategyAnalyzer analyzer(registry, settings.seed);
    auto result = analyzer.analyze_strategy(args.strategy, args.turns.value_or(settings.default_turns));

    std::cout << "Strategy: " << result.strategy_name << std::endl;
    for (const auto* probe : {&result.vs_cooperator, &result.vs_defector, &result.vs_tit_for_tat}) {
        std::cout << "  vs " << std::left << std::setw(14) << probe->opponent
                  << " score " << std::fixed << std::setprecision(2) << probe->score
                  << "  coop " << std::setprecision(4) << probe->cooperation_rate << std::endl;
    }
    std::cout << "Cooperation rate: " << result.cooperation_rate << std::endl;
    std::cout << "Average score: " << std::setprecision(2) << result.average_score << std::endl;

    emit(args, result.to_json());
    return 0;
}

int cmd_experiment(const Args& args, const Settings& settings, const game::StrategyRegistry& registry) {
    if (args.name.empty() || args.strategies.empty()) {
        std::cerr << "experiment requires --name and --strategies" << std::endl;
        return 2;
    }

    std::shared_ptr<experiment::ExperimentRepository> experiments;
    std::shared_ptr<experiment::ExperimentRunRepository> runs;
    if (settings.data_dir.empty()) {
        experiments = std::make_shared<experiment::InMemoryExperimentRepository>();
        runs = std::make_shared<experiment::InMemoryExperimentRunRepository>();
    } else {
        std::filesystem::path dir(settings.data_dir);
        experiments = std::make_shared<experiment::JsonFileExperimentRepository>(dir / "experiments.json");
        runs = std::make_shared<experiment::JsonFileExperimentRunRepository>(dir / "runs.json");
    }
    experiment::ExperimentService service(experiments, runs);

    experiment::Experiment draft;
    draft.name = args.name;
    draft.hypothesis = args.hypothesis;
    draft.config.classical_strategies = split(args.strategies, ',');
    draft.config.turns = args.turns.value_or(settings.default_turns);
    draft.config.repetitions = args.reps.value_or(settings.default_repetitions);
    draft.config.target_runs = args.runs;
    auto exp = service.create_experiment(draft);
    service.create_runs(exp.id, args.runs);

    std::cout << "Experiment: " << exp.name << " (" << exp.id << ")" << std::endl;

    game::TournamentOptions options;
    options.seed = settings.seed;
    options.max_strategies = settings.max_strategies_per_tournament;
    game::TournamentRunner runner(registry, options);

    parallel::WorkerPool pool(settings.worker_threads);
    experiment::RunWorker worker(service, runner, pool);
    int dispatched = worker.dispatch_pending(exp.id);
    std::cout << "Dispatched " << dispatched << " runs on " << pool.num_threads() << " workers\n\n";
    pool.wait_idle();

    nlohmann::json run_list = nlohmann::json::array();
    for (const auto& run : service.list_runs(exp.id)) {
        std::cout << "Run #" << run.run_number << ": " << experiment::to_string(run.status);
        if (run.results) {
            std::cout << ", winner " << run.results->winner;
        }
        if (run.error) {
            std::cout << ", " << run.error->category << ": " << run.error->message;
        }
        if (auto d = run.duration_seconds()) {
            std::cout << " (" << std::fixed << std::setprecision(3) << *d << "s)";
        }
        std::cout << std::endl;
        run_list.push_back(run.to_json());
    }

    auto analysis = service.analyze_experiment(exp.id);
    std::cout << "\nCompleted " << analysis.successful_runs << "/" << analysis.total_runs
              << ", failed " << analysis.failed_runs << std::endl;
    if (analysis.cooperation_rate) {
        const auto& c = *analysis.cooperation_rate;
        std::cout << "Cooperation rate: " << std::setprecision(4) << c.mean
                  << " (95% CI " << c.ci_lower << " .. " << c.ci_upper << ")" << std::endl;
    }
    if (analysis.average_score) {
        const auto& s = *analysis.average_score;
        std::cout << "Average score: " << std::setprecision(2) << s.mean
                  << " (95% CI " << s.ci_lower << " .. " << s.ci_upper << ")" << std::endl;
    }

    emit(args, {
        {"experiment", exp.to_json()},
        {"runs", run_list},
        {"analysis", analysis.to_json()}
    });
    return analysis.failed_runs == 0 ? 0 : 1;
}

int main(int argc, char* argv[]) {
    try {
        Args args = parse_args(argc, argv);
        if (args.command.empty()) {
            print_usage();
            return 2;
        }

        // defaults -> config file -> environment -> flags
        Settings settings;
        if (!args.config_path.empty()) {
            settings = Settings::load(args.config_path);
        }
        settings.apply_env();
        if (!args.data_dir.empty()) settings.data_dir = args.data_dir;
        if (!args.log_level.empty()) settings.log_level = args.log_level;

        logging::set_level(settings.log_level);

        auto registry = game::StrategyRegistry::with_defaults();

        if (args.command == "strategies") return cmd_strategies(args, registry);
        if (args.command == "equilibrium") return cmd_equilibrium(args);
        if (args.command == "tournament") return cmd_tournament(args, settings, registry);
        if (args.command == "analyze") return cmd_analyze(args, settings, registry);
        if (args.command == "experiment") return cmd_experiment(args, settings, registry);

        std::cerr << "Unknown command: " << args.command << std::endl;
        print_usage();
        return 2;
    } catch (const Error& e) {
        std::cerr << e.category() << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
