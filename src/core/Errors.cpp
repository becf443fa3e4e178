#include "Errors.hpp"

namespace axiom {

std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidMatrix:      return "InvalidMatrix";
        case ErrorKind::InvalidTurnCount:   return "InvalidTurnCount";
        case ErrorKind::InvalidTournament:  return "InvalidTournament";
        case ErrorKind::StrategyNotFound:   return "StrategyNotFound";
        case ErrorKind::RunNotFound:        return "RunNotFound";
        case ErrorKind::ExperimentNotFound: return "ExperimentNotFound";
        case ErrorKind::InvalidRunState:    return "InvalidRunState";
        case ErrorKind::ComputationFailure: return "ComputationFailure";
        case ErrorKind::StorageFailure:     return "StorageFailure";
    }
    return "Unknown";
}

} // namespace axiom
