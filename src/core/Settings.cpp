#include "Settings.hpp"
#include "JsonFile.hpp"

#include <cstdlib>
#include <stdexcept>

namespace axiom {

namespace {

int env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    try {
        std::size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument(
            std::string("Environment variable ") + name + " is not an integer: " + value);
    }
}

std::string env_string(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

} // namespace

Settings Settings::from_json(const nlohmann::json& j) {
    Settings s;
    s.default_turns = j.value("default_turns", s.default_turns);
    s.default_repetitions = j.value("default_repetitions", s.default_repetitions);
    s.max_strategies_per_tournament =
        j.value("max_strategies_per_tournament", s.max_strategies_per_tournament);
    s.worker_threads = j.value("worker_threads", s.worker_threads);
    s.log_level = j.value("log_level", s.log_level);
    s.data_dir = j.value("data_dir", s.data_dir);
    s.seed = j.value("seed", s.seed);
    return s;
}

Settings Settings::load(const std::string& path) {
    return from_json(read_json_file(path));
}

void Settings::apply_env() {
    default_turns = env_int("AXIOM_DEFAULT_TURNS", default_turns);
    default_repetitions = env_int("AXIOM_DEFAULT_REPETITIONS", default_repetitions);
    max_strategies_per_tournament =
        env_int("AXIOM_MAX_STRATEGIES", max_strategies_per_tournament);
    worker_threads = env_int("AXIOM_WORKER_THREADS", worker_threads);
    log_level = env_string("AXIOM_LOG_LEVEL", log_level);
    data_dir = env_string("AXIOM_DATA_DIR", data_dir);
}

nlohmann::json Settings::to_json() const {
    return {
        {"default_turns", default_turns},
        {"default_repetitions", default_repetitions},
        {"max_strategies_per_tournament", max_strategies_per_tournament},
        {"worker_threads", worker_threads},
        {"log_level", log_level},
        {"data_dir", data_dir},
        {"seed", seed}
    };
}

} // namespace axiom
