#pragma once

#include <stdexcept>
#include <string>

namespace axiom {

// Error categories. The name of a kind is what gets persisted onto a failed
// run record, so renaming one is a storage format change.
enum class ErrorKind {
    InvalidMatrix,
    InvalidTurnCount,
    InvalidTournament,
    StrategyNotFound,
    RunNotFound,
    ExperimentNotFound,
    InvalidRunState,
    ComputationFailure,
    StorageFailure
};

std::string error_kind_name(ErrorKind kind);

// Base of every error thrown by axiom
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    std::string category() const { return error_kind_name(kind_); }

private:
    ErrorKind kind_;
};

class InvalidMatrix : public Error {
public:
    explicit InvalidMatrix(const std::string& message)
        : Error(ErrorKind::InvalidMatrix, message) {}
};

class InvalidTurnCount : public Error {
public:
    explicit InvalidTurnCount(const std::string& message)
        : Error(ErrorKind::InvalidTurnCount, message) {}
};

class InvalidTournament : public Error {
public:
    explicit InvalidTournament(const std::string& message)
        : Error(ErrorKind::InvalidTournament, message) {}
};

class StrategyNotFound : public Error {
public:
    explicit StrategyNotFound(const std::string& name)
        : Error(ErrorKind::StrategyNotFound, "Strategy '" + name + "' not found"),
          name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class RunNotFound : public Error {
public:
    explicit RunNotFound(const std::string& run_id)
        : Error(ErrorKind::RunNotFound, "Run '" + run_id + "' not found") {}
};

class ExperimentNotFound : public Error {
public:
    explicit ExperimentNotFound(const std::string& experiment_id)
        : Error(ErrorKind::ExperimentNotFound,
                "Experiment '" + experiment_id + "' not found") {}
};

class InvalidRunState : public Error {
public:
    explicit InvalidRunState(const std::string& message)
        : Error(ErrorKind::InvalidRunState, message) {}
};

class ComputationFailure : public Error {
public:
    explicit ComputationFailure(const std::string& message)
        : Error(ErrorKind::ComputationFailure, message) {}
};

class StorageFailure : public Error {
public:
    explicit StorageFailure(const std::string& message)
        : Error(ErrorKind::StorageFailure, message) {}
};

} // namespace axiom
