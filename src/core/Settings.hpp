#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace axiom {

// Process-wide settings
//
// Resolution order: built-in defaults, then a JSON file (load), then
// AXIOM_* environment variables (apply_env), then command line flags.
struct Settings {
    int default_turns = 200;                // Turns per match when a caller gives none
    int default_repetitions = 10;           // Repetitions per pairing
    int max_strategies_per_tournament = 20; // 0 disables the cap
    int worker_threads = 0;                 // Run workers, 0 = hardware concurrency
    std::string log_level = "info";
    std::string data_dir;                   // Empty keeps experiments in memory only
    std::uint64_t seed = 42;                // Base seed for stochastic strategies

    // Fields missing from j keep their defaults
    static Settings from_json(const nlohmann::json& j);

    // Load from a JSON file. Throws StorageFailure if unreadable.
    static Settings load(const std::string& path);

    // Override from AXIOM_DEFAULT_TURNS, AXIOM_DEFAULT_REPETITIONS,
    // AXIOM_MAX_STRATEGIES, AXIOM_WORKER_THREADS, AXIOM_LOG_LEVEL, AXIOM_DATA_DIR.
    // Throws std::invalid_argument if a numeric variable does not parse.
    void apply_env();

    nlohmann::json to_json() const;
};

} // namespace axiom
