#include "errors.h"

namespace kicadfile {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Parse:                    return "ParseError";
        case ErrorKind::NotFound:                 return "NotFoundError";
        case ErrorKind::AmbiguousConnectivity:    return "AmbiguousConnectivityError";
        case ErrorKind::InheritanceDepthExceeded: return "InheritanceDepthExceeded";
        case ErrorKind::GeometryUnresolved:       return "GeometryUnresolved";
        case ErrorKind::StructuralInvariant:      return "StructuralInvariantViolation";
        case ErrorKind::IOConflict:               return "IOConflict";
        case ErrorKind::InvalidArgument:          return "InvalidArgument";
        case ErrorKind::Io:                       return "IoError";
    }
    return "Error";
}

} // namespace kicadfile
