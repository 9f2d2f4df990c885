#include "util/result.hpp"

namespace peel {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                   return "ok";
        case ErrorKind::Usage:                  return "usage error";
        case ErrorKind::Io:                     return "I/O error";
        case ErrorKind::UnrecognizedFormat:     return "unrecognized format";
        case ErrorKind::MissingTool:            return "missing tool";
        case ErrorKind::UnsupportedMode:        return "unsupported mode";
        case ErrorKind::ExtractionTool:         return "extraction tool failed";
        case ErrorKind::PasswordProtected:      return "password protected";
        case ErrorKind::UnsupportedCompression: return "unsupported compression";
        case ErrorKind::DestinationCollision:   return "destination collision";
        case ErrorKind::Interrupted:            return "interrupted";
    }
    return "error";
}

} // namespace peel
