#pragma once

#include <filesystem>
#include "MemoryRepository.hpp"

namespace axiom::experiment {

// In-memory experiments mirrored to a single JSON file.
//
// The file is read once on construction and rewritten atomically after
// every mutation. Throws StorageFailure if an existing file cannot be read.
class JsonFileExperimentRepository : public InMemoryExperimentRepository {
public:
    explicit JsonFileExperimentRepository(std::filesystem::path path);

    const std::filesystem::path& path() const { return path_; }

protected:
    void persist_locked() override;

private:
    std::filesystem::path path_;
};

// In-memory runs mirrored to a single JSON file, including the per-experiment
// run number counters so numbers stay unique across restarts.
class JsonFileExperimentRunRepository : public InMemoryExperimentRunRepository {
public:
    explicit JsonFileExperimentRunRepository(std::filesystem::path path);

    const std::filesystem::path& path() const { return path_; }

protected:
    void persist_locked() override;

private:
    std::filesystem::path path_;
};

} // namespace axiom::experiment
