#pragma once

#include <iosfwd>
#include <string>

#include <aiomega/common/error_forward.h>
#include <aiomega/common/expected.h>

namespace aiomega
{
namespace common
{

#define DEFINE_ERROR_KINDS(expander) \
    expander(OK) \
    expander(REQUEST_FAILED) \
    expander(TRANSFER_FAILED) \
    expander(NODE_NOT_FOUND) \
    expander(INVALID_ARGUMENT)

enum ErrorKind : unsigned int
{
#define DEFINE_ERROR_KIND_ENUMERANT(name) EK_ ## name,
    DEFINE_ERROR_KINDS(DEFINE_ERROR_KIND_ENUMERANT)
#undef DEFINE_ERROR_KIND_ENUMERANT
}; // ErrorKind

// The code the engine reports when an operation succeeds.
constexpr int ENGINE_OK = 0;

// Describes how an operation ended.
//
// A default constructed error represents success.
class Error
{
    // What sort of failure this is.
    ErrorKind mKind;

    // The code reported by the engine.
    int mCode;

    // Human readable description of the failure.
    std::string mMessage;

public:
    Error();

    Error(ErrorKind kind, int code, std::string message);

    bool operator==(const Error& rhs) const;

    bool operator!=(const Error& rhs) const;

    int code() const;

    bool failed() const;

    ErrorKind kind() const;

    const std::string& message() const;

    bool ok() const;

    std::string toString() const;
}; // Error

std::ostream& operator<<(std::ostream& ostream, const Error& error);

const char* toString(ErrorKind kind);

// Convenience.
Error invalidArgument(int code, std::string message);

Error nodeNotFound(int code, std::string message);

Error requestFailed(int code, std::string message);

Error transferFailed(int code, std::string message);

} // common
} // aiomega

