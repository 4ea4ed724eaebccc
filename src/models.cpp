#include "models.hpp"

const char* to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Running:   return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Cancelled: return "cancelled";
        case RunStatus::Failed:    return "failed";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:        return "none";
        case ErrorKind::Fetch:       return "fetch";
        case ErrorKind::Asset:       return "asset";
        case ErrorKind::Assembly:    return "assembly";
        case ErrorKind::EndOfSeries: return "end_of_series";
    }
    return "unknown";
}
