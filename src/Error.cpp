/**
 * Error.cpp - Error kinds and exit statuses
 */

#include "clai/Error.hpp"

namespace clai {

int exitCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::USAGE:            return 1;
        case ErrorKind::CONFIGURATION:    return 2;
        case ErrorKind::IO:               return 3;
        case ErrorKind::EXTERNAL_PROCESS: return 4;
        case ErrorKind::NETWORK:          return 5;
        case ErrorKind::HTTP:             return 6;
        case ErrorKind::DATA:             return 7;
    }
    return 1;
}

} // namespace clai
