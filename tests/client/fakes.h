#pragma once

#include <string>

#include <megaapi.h>

namespace aiomega
{
namespace testing
{

// A node whose identity is under the test's control.
class FakeNode
  : public mega::MegaNode
{
    mega::MegaHandle mHandle;

public:
    explicit FakeNode(mega::MegaHandle handle)
      : MegaNode()
      , mHandle(handle)
    {
    }

    MegaNode* copy() override
    {
        return new FakeNode(mHandle);
    }

    mega::MegaHandle getHandle() override
    {
        return mHandle;
    }
}; // FakeNode

// A request whose content is under the test's control.
class FakeRequest
  : public mega::MegaRequest
{
    std::string mLink;
    mega::MegaHandle mNodeHandle;

public:
    FakeRequest(mega::MegaHandle nodeHandle, std::string link)
      : MegaRequest()
      , mLink(std::move(link))
      , mNodeHandle(nodeHandle)
    {
    }

    MegaRequest* copy() override
    {
        return new FakeRequest(mNodeHandle, mLink);
    }

    const char* getLink() const override
    {
        return mLink.c_str();
    }

    mega::MegaHandle getNodeHandle() const override
    {
        return mNodeHandle;
    }

    const char* getRequestString() const override
    {
        return "FAKE";
    }
}; // FakeRequest

// A transfer whose progress is under the test's control.
class FakeTransfer
  : public mega::MegaTransfer
{
    std::string mFileName;
    long long mSpeed;
    long long mTotal;
    long long mTransferred;

public:
    FakeTransfer(std::string fileName,
                 long long transferred,
                 long long total,
                 long long speed)
      : MegaTransfer()
      , mFileName(std::move(fileName))
      , mSpeed(speed)
      , mTotal(total)
      , mTransferred(transferred)
    {
    }

    MegaTransfer* copy() override
    {
        return new FakeTransfer(mFileName, mTransferred, mTotal, mSpeed);
    }

    const char* getFileName() const override
    {
        return mFileName.c_str();
    }

    long long getSpeed() const override
    {
        return mSpeed;
    }

    long long getTotalBytes() const override
    {
        return mTotal;
    }

    const char* getTransferString() const override
    {
        return "DOWNLOAD";
    }

    long long getTransferredBytes() const override
    {
        return mTransferred;
    }
}; // FakeTransfer

} // testing
} // aiomega

