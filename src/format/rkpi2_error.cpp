#include "format/rkpi2_error.hpp"

namespace rkpi2 {

const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::StartCode: return "invalid start code";
        case ErrorKind::Format:    return "reserved sample format";
        case ErrorKind::Rate:      return "unsupported sample rate";
        case ErrorKind::Channels:  return "unsupported channel count";
        case ErrorKind::IO:        return "I/O error";
    }
    return "unknown error";
}

} // namespace rkpi2
