#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace kicadfile {

enum class ErrorKind {
    Parse,
    NotFound,
    AmbiguousConnectivity,
    InheritanceDepthExceeded,
    GeometryUnresolved,
    StructuralInvariant,
    IOConflict,
    InvalidArgument,
    Io,
};

// Stable name used in operation payloads ("ParseError", "NotFoundError", ...)
const char* error_kind_name(ErrorKind kind);

using ErrorDetails = std::map<std::string, std::string>;

// Base of every error raised by the file backend.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg, ErrorDetails details = {})
        : std::runtime_error(msg), kind_(kind), details_(std::move(details)) {}

    ErrorKind kind() const { return kind_; }
    const ErrorDetails& details() const { return details_; }

private:
    ErrorKind kind_;
    ErrorDetails details_;
};

class ParseError : public Error {
public:
    ParseError(const std::string& msg, size_t offset, int line, int column)
        : Error(ErrorKind::Parse, msg + " at line " + std::to_string(line)
                    + ", column " + std::to_string(column),
                {{"offset", std::to_string(offset)},
                 {"line", std::to_string(line)},
                 {"column", std::to_string(column)}}),
          offset_(offset), line_(line), column_(column) {}

    size_t offset() const { return offset_; }
    int line() const { return line_; }
    int column() const { return column_; }

private:
    size_t offset_;
    int line_;
    int column_;
};

class NotFoundError : public Error {
public:
    NotFoundError(const std::string& what, const std::string& id,
                  ErrorDetails details = {})
        : Error(ErrorKind::NotFound, what + " not found: " + id,
                with_id(std::move(details), id)) {}

private:
    static ErrorDetails with_id(ErrorDetails d, const std::string& id) {
        d["id"] = id;
        return d;
    }
};

class AmbiguousConnectivityError : public Error {
public:
    AmbiguousConnectivityError(const std::string& first, const std::string& second)
        : Error(ErrorKind::AmbiguousConnectivity,
                "net has conflicting names \"" + first + "\" and \"" + second + "\"",
                {{"name_a", first}, {"name_b", second}}) {}
};

class InheritanceDepthExceeded : public Error {
public:
    InheritanceDepthExceeded(const std::string& lib_id, const std::string& chain)
        : Error(ErrorKind::InheritanceDepthExceeded,
                "extends chain too deep or circular for " + lib_id + ": " + chain,
                {{"id", lib_id}, {"chain", chain}}) {}
};

class GeometryUnresolvedError : public Error {
public:
    GeometryUnresolvedError(const std::string& lib_id, const std::string& last)
        : Error(ErrorKind::GeometryUnresolved,
                "no pin geometry for " + lib_id + " (chain ends at " + last + ")",
                {{"id", lib_id}, {"last", last}}) {}
};

class StructuralInvariantViolation : public Error {
public:
    explicit StructuralInvariantViolation(const std::string& msg, ErrorDetails details = {})
        : Error(ErrorKind::StructuralInvariant, msg, std::move(details)) {}
};

class IOConflict : public Error {
public:
    IOConflict(const std::string& path, const std::string& msg)
        : Error(ErrorKind::IOConflict, path + ": " + msg, {{"path", path}}) {}
};

class InvalidArgument : public Error {
public:
    explicit InvalidArgument(const std::string& msg, ErrorDetails details = {})
        : Error(ErrorKind::InvalidArgument, msg, std::move(details)) {}
};

class IoError : public Error {
public:
    IoError(const std::string& path, const std::string& msg)
        : Error(ErrorKind::Io, path + ": " + msg, {{"path", path}}) {}
};

} // namespace kicadfile
