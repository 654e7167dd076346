#include "util/result.hpp"

namespace takeout {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::Io:                return "Io";
        case ErrorKind::Config:            return "Config";
        case ErrorKind::MissingDependency: return "MissingDependency";
        case ErrorKind::NoInputFound:      return "NoInputFound";
        case ErrorKind::ExtractionFailure: return "ExtractionFailure";
        case ErrorKind::PackagingFailure:  return "PackagingFailure";
        case ErrorKind::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

} // namespace takeout
