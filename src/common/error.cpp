#include <ostream>
#include <utility>

#include <aiomega/common/error.h>
#include <aiomega/common/utility.h>

namespace aiomega
{
namespace common
{

Error::Error()
  : mKind(EK_OK)
  , mCode(ENGINE_OK)
  , mMessage()
{
}

Error::Error(ErrorKind kind, int code, std::string message)
  : mKind(kind)
  , mCode(code)
  , mMessage(std::move(message))
{
}

bool Error::operator==(const Error& rhs) const
{
    return mKind == rhs.mKind
           && mCode == rhs.mCode
           && mMessage == rhs.mMessage;
}

bool Error::operator!=(const Error& rhs) const
{
    return !(*this == rhs);
}

int Error::code() const
{
    return mCode;
}

bool Error::failed() const
{
    return mKind != EK_OK;
}

ErrorKind Error::kind() const
{
    return mKind;
}

const std::string& Error::message() const
{
    return mMessage;
}

bool Error::ok() const
{
    return mKind == EK_OK;
}

std::string Error::toString() const
{
    if (ok())
        return "OK";

    return format("%s (%d): %s",
                  common::toString(mKind),
                  mCode,
                  mMessage.c_str());
}

std::ostream& operator<<(std::ostream& ostream, const Error& error)
{
    return ostream << error.toString();
}

const char* toString(ErrorKind kind)
{
    switch (kind)
    {
#define DEFINE_ERROR_KIND_CASE(name) case EK_ ## name: return #name;
        DEFINE_ERROR_KINDS(DEFINE_ERROR_KIND_CASE)
#undef DEFINE_ERROR_KIND_CASE
    }

    return "N/A";
}

Error invalidArgument(int code, std::string message)
{
    return Error(EK_INVALID_ARGUMENT, code, std::move(message));
}

Error nodeNotFound(int code, std::string message)
{
    return Error(EK_NODE_NOT_FOUND, code, std::move(message));
}

Error requestFailed(int code, std::string message)
{
    return Error(EK_REQUEST_FAILED, code, std::move(message));
}

Error transferFailed(int code, std::string message)
{
    return Error(EK_TRANSFER_FAILED, code, std::move(message));
}

} // common
} // aiomega

