/*
 *    Copyright (c) 2024, The OpenThread Authors.
 *    All rights reserved.
 *
 *    Redistribution and use in source and binary forms, with or without
 *    modification, are permitted provided that the following conditions are met:
 *    1. Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *    2. Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *    3. Neither the name of the copyright holder nor the
 *       names of its contributors may be used to endorse or promote products
 *       derived from this software without specific prior written permission.
 *
 *    THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 *    AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 *    IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 *    ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 *    LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 *    CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 *    SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 *    INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 *    CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 *    ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 *    POSSIBILITY OF SUCH DAMAGE.
 */

/**
 * @file
 *   This file implements the remote discovery service based on mDNSResponder.
 */

#define NSD_LOG_TAG "MDNS"

#include "mdns/remote_service_mdnssd.hpp"

#include <algorithm>

#include <arpa/inet.h>
#include <assert.h>
#include <inttypes.h>
#include <net/if.h>
#include <netinet/in.h>
#include <string.h>

#include "common/logging.hpp"

namespace nsd {

namespace Mdns {

static const char kDomain[] = NSD_CONFIG_DEFAULT_DOMAIN;

static const char *DNSErrorToString(DNSServiceErrorType aError)
{
    const char *str;

    switch (aError)
    {
    case kDNSServiceErr_NoError:
        str = "OK";
        break;
    case kDNSServiceErr_NoSuchName:
        str = "No Such Name";
        break;
    case kDNSServiceErr_NoMemory:
        str = "No Memory";
        break;
    case kDNSServiceErr_BadParam:
        str = "Bad Param";
        break;
    case kDNSServiceErr_BadReference:
        str = "Bad Reference";
        break;
    case kDNSServiceErr_BadState:
        str = "Bad State";
        break;
    case kDNSServiceErr_BadFlags:
        str = "Bad Flags";
        break;
    case kDNSServiceErr_Unsupported:
        str = "Unsupported";
        break;
    case kDNSServiceErr_NotInitialized:
        str = "Not Initialized";
        break;
    case kDNSServiceErr_AlreadyRegistered:
        str = "Already Registered";
        break;
    case kDNSServiceErr_NameConflict:
        str = "Name Conflict";
        break;
    case kDNSServiceErr_Invalid:
        str = "Invalid";
        break;
    case kDNSServiceErr_Incompatible:
        // client library incompatible with daemon
        str = "Incompatible";
        break;
    case kDNSServiceErr_BadInterfaceIndex:
        str = "Bad Interface Index";
        break;
    case kDNSServiceErr_Refused:
        str = "Refused";
        break;
    case kDNSServiceErr_NoSuchRecord:
        str = "No Such Record";
        break;
    case kDNSServiceErr_NoSuchKey:
        str = "No Such Key";
        break;
    case kDNSServiceErr_ServiceNotRunning:
        // Background daemon not running
        str = "Service Not Running";
        break;
    case kDNSServiceErr_Timeout:
        str = "Timeout";
        break;
    default:
        str = "Unknown";
        break;
    }

    return str;
}

MdnsSdRemoteService::~MdnsSdRemoteService(void)
{
    mOperations.clear();
    Disconnect();
}

nsdError MdnsSdRemoteService::DnsErrorToNsdError(DNSServiceErrorType aError)
{
    nsdError error;

    switch (aError)
    {
    case kDNSServiceErr_NoError:
        error = NSD_ERROR_NONE;
        break;

    case kDNSServiceErr_NoSuchKey:
    case kDNSServiceErr_NoSuchName:
    case kDNSServiceErr_NoSuchRecord:
        error = NSD_ERROR_NOT_FOUND;
        break;

    case kDNSServiceErr_Invalid:
    case kDNSServiceErr_BadParam:
    case kDNSServiceErr_BadFlags:
    case kDNSServiceErr_BadInterfaceIndex:
        error = NSD_ERROR_INVALID_ARGS;
        break;

    case kDNSServiceErr_AlreadyRegistered:
    case kDNSServiceErr_NameConflict:
        error = NSD_ERROR_DUPLICATED;
        break;

    case kDNSServiceErr_Unsupported:
        error = NSD_ERROR_NOT_IMPLEMENTED;
        break;

    case kDNSServiceErr_ServiceNotRunning:
        error = NSD_ERROR_REMOTE_UNAVAILABLE;
        break;

    default:
        error = NSD_ERROR_MDNS;
        break;
    }

    return error;
}

int32_t MdnsSdRemoteService::DnsErrorToFailureCode(DNSServiceErrorType aError)
{
    int32_t code;

    switch (aError)
    {
    case kDNSServiceErr_Invalid:
    case kDNSServiceErr_BadParam:
    case kDNSServiceErr_BadFlags:
    case kDNSServiceErr_BadInterfaceIndex:
        code = kFailureBadParameters;
        break;

    case kDNSServiceErr_AlreadyRegistered:
    case kDNSServiceErr_NameConflict:
        code = kFailureAlreadyActive;
        break;

    default:
        code = kFailureInternalError;
        break;
    }

    return code;
}

nsdError MdnsSdRemoteService::StartDaemon(void)
{
    nsdError            error    = NSD_ERROR_NONE;
    DNSServiceErrorType dnsError = kDNSServiceErr_NoError;

    VerifyOrExit(mConnectionRef == nullptr);

    dnsError = DNSServiceCreateConnection(&mConnectionRef);
    if (dnsError != kDNSServiceErr_NoError)
    {
        mConnectionRef = nullptr;
        error          = DnsErrorToNsdError(dnsError);
        ExitNow(nsdLogWarning("DNSServiceCreateConnection failed: %s", DNSErrorToString(dnsError)));
    }

    nsdLogDebug("Created new shared DNSServiceRef: %p", static_cast<void *>(mConnectionRef));
    mConnected.store(true);

exit:
    return error;
}

void MdnsSdRemoteService::Disconnect(void)
{
    if (mConnectionRef != nullptr)
    {
        HandleServiceRefDeallocating(mConnectionRef);
        DNSServiceRefDeallocate(mConnectionRef);
        nsdLogDebug("Deallocated shared DNSServiceRef: %p", static_cast<void *>(mConnectionRef));
        mConnectionRef = nullptr;
    }

    mConnected.store(false);
}

nsdError MdnsSdRemoteService::Send(Command aCommand, OperationId aId, const ServiceInfo &aInfo)
{
    nsdError error = NSD_ERROR_NONE;

    nsdLogInfo("%s %u: %s", CommandToString(aCommand), aId, aInfo.ToString().c_str());

    switch (aCommand)
    {
    case Command::kRegister:
        error = StartOperation(MakeUnique<Registration>(*this, aId, aInfo), aId);
        break;

    case Command::kDiscoverStart:
        error = StartOperation(MakeUnique<Discovery>(*this, aId, aInfo), aId);
        break;

    case Command::kResolveStart:
        error = StartOperation(MakeUnique<Resolution>(*this, aId, aInfo, /* aContinuous */ false), aId);
        break;

    case Command::kWatchStart:
        error = StartOperation(MakeUnique<Resolution>(*this, aId, aInfo, /* aContinuous */ true), aId);
        break;

    case Command::kUnregister:
        StopOperation(aId, ReplyKind::kUnregisterSucceeded, ReplyKind::kUnregisterFailed);
        break;

    case Command::kDiscoverStop:
        StopOperation(aId, ReplyKind::kDiscoveryStopped, ReplyKind::kStopDiscoveryFailed);
        break;

    case Command::kResolveStop:
        StopOperation(aId, ReplyKind::kResolutionStopped, ReplyKind::kStopResolutionFailed);
        break;

    case Command::kWatchStop:
        StopOperation(aId, ReplyKind::kCallbackUnregistered, ReplyKind::kCallbackUnregistered);
        break;
    }

    return error;
}

nsdError MdnsSdRemoteService::StartOperation(std::unique_ptr<Operation> aOperation, OperationId aId)
{
    nsdError            error = NSD_ERROR_NONE;
    DNSServiceErrorType dnsError;

    VerifyOrExit(IsConnected(), error = NSD_ERROR_REMOTE_UNAVAILABLE);
    VerifyOrExit(mOperations.find(aId) == mOperations.end(), error = NSD_ERROR_DUPLICATED);

    dnsError = aOperation->Start();
    if (dnsError != kDNSServiceErr_NoError)
    {
        nsdLogWarning("Failed to start operation %u: %s", aId, DNSErrorToString(dnsError));
        // The failure is reported as a reply, the operation is dropped here.
        aOperation->Fail(DnsErrorToFailureCode(dnsError));
        ExitNow();
    }

    mOperations[aId] = std::move(aOperation);

exit:
    return error;
}

void MdnsSdRemoteService::StopOperation(OperationId aId, ReplyKind aStopped, ReplyKind aStopFailed)
{
    auto it = mOperations.find(aId);

    if (it == mOperations.end())
    {
        nsdLogInfo("Operation %u is not running", aId);
        HandleReply(aStopped == aStopFailed ? Reply(aStopped, aId)
                                            : Reply(aStopFailed, aId, kFailureOperationNotRunning));
        ExitNow();
    }

    mOperations.erase(it);
    HandleReply(Reply(aStopped, aId));

exit:
    return;
}

void MdnsSdRemoteService::HandleReply(Reply aReply)
{
    nsdLogDebug("Reply %s for operation %u", ReplyKindToString(aReply.mKind).c_str(), aReply.mId);

    VerifyOrExit(mReplyHandler != nullptr, nsdLogWarning("No reply handler, dropped reply for %u", aReply.mId));
    mReplyHandler->HandleReply(std::move(aReply));

exit:
    return;
}

void MdnsSdRemoteService::Update(MainloopContext &aMainloop)
{
    if (mConnectionRef != nullptr)
    {
        int fd = DNSServiceRefSockFD(mConnectionRef);

        assert(fd != -1);
        aMainloop.AddFdToReadSet(fd);
    }

    for (const auto &kv : mOperations)
    {
        kv.second->Update(aMainloop);
    }
}

void MdnsSdRemoteService::Process(const MainloopContext &aMainloop)
{
    mServiceRefsToProcess.clear();

    if (mConnectionRef != nullptr && FD_ISSET(DNSServiceRefSockFD(mConnectionRef), &aMainloop.mReadFdSet))
    {
        mServiceRefsToProcess.push_back(mConnectionRef);
    }

    for (const auto &kv : mOperations)
    {
        kv.second->Process(aMainloop, mServiceRefsToProcess);
    }

    for (DNSServiceRef serviceRef : mServiceRefsToProcess)
    {
        DNSServiceErrorType error;

        // A callback may finish its operation and deallocate other refs in this
        // list; `HandleServiceRefDeallocating()` clears those entries.
        if (serviceRef == nullptr)
        {
            continue;
        }

        error = DNSServiceProcessResult(serviceRef);

        if (error != kDNSServiceErr_NoError)
        {
            nsdLogLevel logLevel = (error == kDNSServiceErr_BadReference) ? NSD_LOG_INFO : NSD_LOG_WARNING;
            nsdLog(logLevel, NSD_LOG_TAG, "DNSServiceProcessResult failed: %s (serviceRef = %p)",
                   DNSErrorToString(error), static_cast<void *>(serviceRef));
        }

        if (error == kDNSServiceErr_ServiceNotRunning)
        {
            HandleServiceNotRunning();
            ExitNow();
        }
    }

exit:
    EraseFinishedOperations();
}

void MdnsSdRemoteService::HandleServiceNotRunning(void)
{
    nsdLogWarning("The mDNS daemon is not running, failing %zu operations", mOperations.size());

    for (const auto &kv : mOperations)
    {
        kv.second->Fail(kFailureInternalError);
    }

    mOperations.clear();
    mFinishedOperations.clear();
    Disconnect();

    // Try to reconnect, later commands fail with REMOTE_UNAVAILABLE until it succeeds.
    if (StartDaemon() != NSD_ERROR_NONE)
    {
        nsdLogWarning("Failed to reconnect to the mDNS daemon");
    }
}

void MdnsSdRemoteService::HandleServiceRefDeallocating(const DNSServiceRef &aServiceRef)
{
    for (DNSServiceRef &entry : mServiceRefsToProcess)
    {
        if (entry == aServiceRef)
        {
            entry = nullptr;
        }
    }
}

void MdnsSdRemoteService::EraseFinishedOperations(void)
{
    std::vector<OperationId> finished;

    finished.swap(mFinishedOperations);

    for (OperationId id : finished)
    {
        mOperations.erase(id);
    }
}

std::string MdnsSdRemoteService::MakeRegType(const std::string &aType, const std::vector<std::string> &aSubTypes)
{
    std::string regType = aType;

    for (const std::string &subType : aSubTypes)
    {
        regType += "," + subType;
    }

    return regType;
}

std::string MdnsSdRemoteService::TrimType(const char *aType)
{
    std::string type = aType != nullptr ? aType : "";

    if (!type.empty() && type.back() == '.')
    {
        type.pop_back();
    }

    return type;
}

Network MdnsSdRemoteService::MakeNetwork(uint32_t aInterfaceIndex)
{
    Network network;
    char    name[IF_NAMESIZE];

    VerifyOrExit(aInterfaceIndex != kDNSServiceInterfaceIndexAny);

    network.mIndex = aInterfaceIndex;
    if (if_indextoname(aInterfaceIndex, name) != nullptr)
    {
        network.mName = name;
    }

exit:
    return network;
}

void MdnsSdRemoteService::ServiceRef::Release(void)
{
    if (mServiceRef != nullptr)
    {
        mOwner.HandleServiceRefDeallocating(mServiceRef);
        DNSServiceRefDeallocate(mServiceRef);
        mServiceRef = nullptr;
    }
}

void MdnsSdRemoteService::ServiceRef::Update(MainloopContext &aMainloop) const
{
    int fd;

    VerifyOrExit(mServiceRef != nullptr);

    fd = DNSServiceRefSockFD(mServiceRef);
    assert(fd != -1);
    aMainloop.AddFdToReadSet(fd);

exit:
    return;
}

void MdnsSdRemoteService::ServiceRef::Process(const MainloopContext      &aMainloop,
                                              std::vector<DNSServiceRef> &aReadyServices) const
{
    int fd;

    VerifyOrExit(mServiceRef != nullptr);

    fd = DNSServiceRefSockFD(mServiceRef);
    assert(fd != -1);
    if (FD_ISSET(fd, &aMainloop.mReadFdSet))
    {
        aReadyServices.push_back(mServiceRef);
    }

exit:
    return;
}

MdnsSdRemoteService::Operation::Operation(MdnsSdRemoteService &aOwner, OperationId aId, const ServiceInfo &aInfo)
    : mOwner(aOwner)
    , mId(aId)
    , mInfo(aInfo)
{
}

void MdnsSdRemoteService::Operation::Update(MainloopContext &aMainloop) const
{
    for (const ServiceRef *ref : mRefs)
    {
        ref->Update(aMainloop);
    }
}

void MdnsSdRemoteService::Operation::Process(const MainloopContext      &aMainloop,
                                             std::vector<DNSServiceRef> &aReadyServices) const
{
    for (const ServiceRef *ref : mRefs)
    {
        ref->Process(aMainloop, aReadyServices);
    }
}

void MdnsSdRemoteService::Operation::SendReply(ReplyKind aKind)
{
    mOwner.HandleReply(Reply(aKind, mId));
}

void MdnsSdRemoteService::Operation::SendReply(ReplyKind aKind, int32_t aErrorCode)
{
    mOwner.HandleReply(Reply(aKind, mId, aErrorCode));
}

void MdnsSdRemoteService::Operation::SendReply(ReplyKind aKind, const ServiceInfo &aInfo)
{
    mOwner.HandleReply(Reply(aKind, mId, aInfo));
}

void MdnsSdRemoteService::Operation::Finish(void)
{
    for (ServiceRef *ref : mRefs)
    {
        ref->Release();
    }

    mOwner.FinishOperation(mId);
}

MdnsSdRemoteService::Registration::Registration(MdnsSdRemoteService &aOwner,
                                                OperationId          aId,
                                                const ServiceInfo   &aInfo)
    : Operation(aOwner, aId, aInfo)
    , mRef(aOwner)
{
    mRefs.push_back(&mRef);
}

DNSServiceErrorType MdnsSdRemoteService::Registration::Start(void)
{
    DNSServiceErrorType dnsError = kDNSServiceErr_NoError;
    TXTRecordRef        txtRecord;
    std::string         regType = MakeRegType(mInfo.mServiceType, mInfo.mSubTypes);

    TXTRecordCreate(&txtRecord, 0, nullptr);

    for (const auto &attribute : mInfo.mAttributes)
    {
        VerifyOrExit(attribute.second.size() <= UINT8_MAX, dnsError = kDNSServiceErr_BadParam);
        dnsError = TXTRecordSetValue(&txtRecord, attribute.first.c_str(), static_cast<uint8_t>(attribute.second.size()),
                                     attribute.second.data());
        VerifyOrExit(dnsError == kDNSServiceErr_NoError);
    }

    nsdLogInfo("DNSServiceRegister %s %s port %u inf %" PRIu32, mInfo.mServiceName.c_str(), regType.c_str(),
               mInfo.mPort, mInfo.mNetwork.mIndex);

    dnsError = DNSServiceRegister(&mRef.mServiceRef, /* flags */ 0, mInfo.mNetwork.mIndex, mInfo.mServiceName.c_str(),
                                  regType.c_str(), /* domain */ nullptr,
                                  mInfo.mHostName.empty() ? nullptr : mInfo.mHostName.c_str(), htons(mInfo.mPort),
                                  TXTRecordGetLength(&txtRecord), TXTRecordGetBytesPtr(&txtRecord),
                                  HandleRegisterResult, this);

    if (dnsError != kDNSServiceErr_NoError)
    {
        mRef.mServiceRef = nullptr;
    }

exit:
    TXTRecordDeallocate(&txtRecord);
    return dnsError;
}

void MdnsSdRemoteService::Registration::Fail(int32_t aFailureCode)
{
    SendReply(ReplyKind::kRegisterFailed, aFailureCode);
}

void MdnsSdRemoteService::Registration::HandleRegisterResult(DNSServiceRef       aServiceRef,
                                                             DNSServiceFlags     aFlags,
                                                             DNSServiceErrorType aError,
                                                             const char         *aName,
                                                             const char         *aType,
                                                             const char         *aDomain,
                                                             void               *aContext)
{
    NSD_UNUSED_VARIABLE(aServiceRef);
    NSD_UNUSED_VARIABLE(aType);
    NSD_UNUSED_VARIABLE(aDomain);

    static_cast<Registration *>(aContext)->HandleRegisterResult(aFlags, aError, aName);
}

void MdnsSdRemoteService::Registration::HandleRegisterResult(DNSServiceFlags     aFlags,
                                                             DNSServiceErrorType aError,
                                                             const char         *aName)
{
    nsdLogInfo("DNSServiceRegister reply: %s, flags=%" PRIu32 ", error=%s", aName, aFlags, DNSErrorToString(aError));

    if (aError != kDNSServiceErr_NoError)
    {
        Fail(DnsErrorToFailureCode(aError));
        Finish();
    }
    else if (aFlags & kDNSServiceFlagsAdd)
    {
        ServiceInfo info = mInfo;

        // The daemon may have renamed the service to resolve a conflict.
        info.mServiceName = aName;
        SendReply(ReplyKind::kRegisterSucceeded, info);
    }
}

MdnsSdRemoteService::Discovery::Discovery(MdnsSdRemoteService &aOwner, OperationId aId, const ServiceInfo &aInfo)
    : Operation(aOwner, aId, aInfo)
    , mRef(aOwner)
{
    mRefs.push_back(&mRef);
}

DNSServiceErrorType MdnsSdRemoteService::Discovery::Start(void)
{
    DNSServiceErrorType dnsError;

    nsdLogInfo("DNSServiceBrowse %s inf %" PRIu32, mInfo.mServiceType.c_str(), mInfo.mNetwork.mIndex);

    dnsError = DNSServiceBrowse(&mRef.mServiceRef, /* flags */ 0, mInfo.mNetwork.mIndex, mInfo.mServiceType.c_str(),
                                /* domain */ nullptr, HandleBrowseResult, this);
    if (dnsError == kDNSServiceErr_NoError)
    {
        SendReply(ReplyKind::kDiscoveryStarted);
    }
    else
    {
        mRef.mServiceRef = nullptr;
    }

    return dnsError;
}

void MdnsSdRemoteService::Discovery::Fail(int32_t aFailureCode)
{
    SendReply(ReplyKind::kDiscoveryStartFailed, aFailureCode);
}

void MdnsSdRemoteService::Discovery::HandleBrowseResult(DNSServiceRef       aServiceRef,
                                                        DNSServiceFlags     aFlags,
                                                        uint32_t            aInterfaceIndex,
                                                        DNSServiceErrorType aErrorCode,
                                                        const char         *aInstanceName,
                                                        const char         *aType,
                                                        const char         *aDomain,
                                                        void               *aContext)
{
    NSD_UNUSED_VARIABLE(aServiceRef);
    NSD_UNUSED_VARIABLE(aDomain);

    static_cast<Discovery *>(aContext)->HandleBrowseResult(aFlags, aInterfaceIndex, aErrorCode, aInstanceName, aType);
}

void MdnsSdRemoteService::Discovery::HandleBrowseResult(DNSServiceFlags     aFlags,
                                                        uint32_t            aInterfaceIndex,
                                                        DNSServiceErrorType aErrorCode,
                                                        const char         *aInstanceName,
                                                        const char         *aType)
{
    ServiceInfo info;

    nsdLogInfo("DNSServiceBrowse reply: %s %s.%s inf %" PRIu32 ", flags=%" PRIu32 ", error=%" PRId32,
               aFlags & kDNSServiceFlagsAdd ? "add" : "remove", aInstanceName, aType, aInterfaceIndex, aFlags,
               aErrorCode);

    if (aErrorCode != kDNSServiceErr_NoError)
    {
        Fail(DnsErrorToFailureCode(aErrorCode));
        Finish();
        ExitNow();
    }

    info.mServiceName = aInstanceName;
    info.mServiceType = TrimType(aType);
    info.mNetwork     = MakeNetwork(aInterfaceIndex);

    SendReply((aFlags & kDNSServiceFlagsAdd) ? ReplyKind::kServiceFound : ReplyKind::kServiceLost, info);

exit:
    return;
}

MdnsSdRemoteService::Resolution::Resolution(MdnsSdRemoteService &aOwner,
                                            OperationId          aId,
                                            const ServiceInfo   &aInfo,
                                            bool                 aContinuous)
    : Operation(aOwner, aId, aInfo)
    , mContinuous(aContinuous)
    , mResolveRef(aOwner)
    , mAddrInfoRef(aOwner)
    , mBrowseRef(aOwner)
{
    mRefs.push_back(&mResolveRef);
    mRefs.push_back(&mAddrInfoRef);
    mRefs.push_back(&mBrowseRef);
}

DNSServiceErrorType MdnsSdRemoteService::Resolution::Start(void)
{
    DNSServiceErrorType dnsError;

    nsdLogInfo("DNSServiceResolve %s %s inf %" PRIu32 "%s", mInfo.mServiceName.c_str(), mInfo.mServiceType.c_str(),
               mInfo.mNetwork.mIndex, mContinuous ? " (continuous)" : "");

    dnsError = DNSServiceResolve(&mResolveRef.mServiceRef, mContinuous ? 0 : kDNSServiceFlagsTimeout,
                                 mInfo.mNetwork.mIndex, mInfo.mServiceName.c_str(), mInfo.mServiceType.c_str(),
                                 kDomain, HandleResolveResult, this);
    if (dnsError != kDNSServiceErr_NoError)
    {
        mResolveRef.mServiceRef = nullptr;
        ExitNow();
    }

    VerifyOrExit(mContinuous);

    // Watches the removal of the instance.
    dnsError = DNSServiceBrowse(&mBrowseRef.mServiceRef, /* flags */ 0, mInfo.mNetwork.mIndex,
                                mInfo.mServiceType.c_str(), /* domain */ nullptr, HandleBrowseResult, this);
    if (dnsError != kDNSServiceErr_NoError)
    {
        mBrowseRef.mServiceRef = nullptr;
    }

exit:
    return dnsError;
}

void MdnsSdRemoteService::Resolution::Fail(int32_t aFailureCode)
{
    SendReply(mContinuous ? ReplyKind::kCallbackRegistrationFailed : ReplyKind::kResolveFailed, aFailureCode);
}

void MdnsSdRemoteService::Resolution::HandleFailure(DNSServiceErrorType aError)
{
    if (mContinuous)
    {
        nsdLogWarning("Watch of %s failed: %s", mInfo.mServiceName.c_str(), DNSErrorToString(aError));
        Fail(DnsErrorToFailureCode(aError));
    }
    else if (aError == kDNSServiceErr_Timeout && !mResolved.mAddresses.empty())
    {
        SendReply(ReplyKind::kResolveSucceeded, mResolved);
    }
    else
    {
        nsdLogWarning("Failed to resolve %s: %s", mInfo.mServiceName.c_str(), DNSErrorToString(aError));
        Fail(DnsErrorToFailureCode(aError));
    }

    Finish();
}

void MdnsSdRemoteService::Resolution::HandleResolveResult(DNSServiceRef        aServiceRef,
                                                          DNSServiceFlags      aFlags,
                                                          uint32_t             aInterfaceIndex,
                                                          DNSServiceErrorType  aErrorCode,
                                                          const char          *aFullName,
                                                          const char          *aHostTarget,
                                                          uint16_t             aPort,
                                                          uint16_t             aTxtLen,
                                                          const unsigned char *aTxtRecord,
                                                          void                *aContext)
{
    NSD_UNUSED_VARIABLE(aServiceRef);

    nsdLogInfo("DNSServiceResolve reply: %s host %s:%d, TXT=%dB inf %" PRIu32 ", flags=%" PRIu32 ", error=%" PRId32,
               aFullName, aHostTarget, ntohs(aPort), aTxtLen, aInterfaceIndex, aFlags, aErrorCode);

    static_cast<Resolution *>(aContext)->HandleResolveResult(aFlags, aInterfaceIndex, aErrorCode, aHostTarget, aPort,
                                                             aTxtLen, aTxtRecord);
}

void MdnsSdRemoteService::Resolution::HandleResolveResult(DNSServiceFlags      aFlags,
                                                          uint32_t             aInterfaceIndex,
                                                          DNSServiceErrorType  aErrorCode,
                                                          const char          *aHostTarget,
                                                          uint16_t             aPort,
                                                          uint16_t             aTxtLen,
                                                          const unsigned char *aTxtRecord)
{
    NSD_UNUSED_VARIABLE(aFlags);

    DNSServiceErrorType error = aErrorCode;
    uint16_t            count;

    VerifyOrExit(error == kDNSServiceErr_NoError);

    mResolved           = mInfo;
    mResolved.mHostName = aHostTarget;
    mResolved.mPort     = ntohs(aPort);
    mResolved.mNetwork  = MakeNetwork(aInterfaceIndex);
    mResolved.mAttributes.clear();
    mResolved.mAddresses.clear();

    count = TXTRecordGetCount(aTxtLen, aTxtRecord);
    for (uint16_t i = 0; i < count; ++i)
    {
        char        key[256];
        uint8_t     valueLength = 0;
        const void *value       = nullptr;

        if (TXTRecordGetItemAtIndex(aTxtLen, aTxtRecord, i, sizeof(key), key, &valueLength, &value) !=
            kDNSServiceErr_NoError)
        {
            continue;
        }

        std::vector<uint8_t> &attribute = mResolved.mAttributes[key];
        const uint8_t        *bytes     = static_cast<const uint8_t *>(value);

        attribute.clear();
        if (bytes != nullptr)
        {
            attribute.assign(bytes, bytes + valueLength);
        }
    }

    mLost = false;

    if (!mContinuous)
    {
        mResolveRef.Release();
    }

    mAddrInfoRef.Release();
    error = GetAddrInfo(aInterfaceIndex);

exit:
    if (error != kDNSServiceErr_NoError)
    {
        HandleFailure(error);
    }
}

DNSServiceErrorType MdnsSdRemoteService::Resolution::GetAddrInfo(uint32_t aInterfaceIndex)
{
    DNSServiceErrorType dnsError;

    assert(mAddrInfoRef.mServiceRef == nullptr);

    nsdLogInfo("DNSServiceGetAddrInfo %s inf %" PRIu32, mResolved.mHostName.c_str(), aInterfaceIndex);

    dnsError = DNSServiceGetAddrInfo(&mAddrInfoRef.mServiceRef, mContinuous ? 0 : kDNSServiceFlagsTimeout,
                                     aInterfaceIndex, kDNSServiceProtocol_IPv6 | kDNSServiceProtocol_IPv4,
                                     mResolved.mHostName.c_str(), HandleGetAddrInfoResult, this);

    if (dnsError != kDNSServiceErr_NoError)
    {
        mAddrInfoRef.mServiceRef = nullptr;
        nsdLogWarning("DNSServiceGetAddrInfo failed: %s", DNSErrorToString(dnsError));
    }

    return dnsError;
}

void MdnsSdRemoteService::Resolution::HandleGetAddrInfoResult(DNSServiceRef          aServiceRef,
                                                              DNSServiceFlags        aFlags,
                                                              uint32_t               aInterfaceIndex,
                                                              DNSServiceErrorType    aErrorCode,
                                                              const char            *aHostName,
                                                              const struct sockaddr *aAddress,
                                                              uint32_t               aTtl,
                                                              void                  *aContext)
{
    NSD_UNUSED_VARIABLE(aServiceRef);
    NSD_UNUSED_VARIABLE(aInterfaceIndex);
    NSD_UNUSED_VARIABLE(aTtl);

    nsdLog(aErrorCode == kDNSServiceErr_NoError ? NSD_LOG_INFO : NSD_LOG_WARNING, NSD_LOG_TAG,
           "DNSServiceGetAddrInfo reply: flags=%" PRIu32 ", host=%s, error=%" PRId32, aFlags, aHostName, aErrorCode);

    static_cast<Resolution *>(aContext)->HandleGetAddrInfoResult(aFlags, aErrorCode, aAddress);
}

void MdnsSdRemoteService::Resolution::HandleGetAddrInfoResult(DNSServiceFlags        aFlags,
                                                              DNSServiceErrorType    aErrorCode,
                                                              const struct sockaddr *aAddress)
{
    char        buffer[INET6_ADDRSTRLEN];
    const char *address = nullptr;

    if (aErrorCode != kDNSServiceErr_NoError)
    {
        if (!mContinuous)
        {
            HandleFailure(aErrorCode);
        }
        ExitNow();
    }

    if (aAddress->sa_family == AF_INET6)
    {
        address = inet_ntop(AF_INET6, &reinterpret_cast<const struct sockaddr_in6 *>(aAddress)->sin6_addr, buffer,
                            sizeof(buffer));
    }
    else if (aAddress->sa_family == AF_INET)
    {
        address = inet_ntop(AF_INET, &reinterpret_cast<const struct sockaddr_in *>(aAddress)->sin_addr, buffer,
                            sizeof(buffer));
    }

    if (address != nullptr)
    {
        auto it = std::find(mResolved.mAddresses.begin(), mResolved.mAddresses.end(), address);

        if ((aFlags & kDNSServiceFlagsAdd) && it == mResolved.mAddresses.end())
        {
            mResolved.mAddresses.push_back(address);
        }
        else if (!(aFlags & kDNSServiceFlagsAdd) && it != mResolved.mAddresses.end())
        {
            mResolved.mAddresses.erase(it);
        }
    }

    VerifyOrExit(!(aFlags & kDNSServiceFlagsMoreComing));
    VerifyOrExit(!mResolved.mAddresses.empty());

    if (mContinuous)
    {
        SendReply(ReplyKind::kServiceUpdated, mResolved);
    }
    else
    {
        SendReply(ReplyKind::kResolveSucceeded, mResolved);
        Finish();
    }

exit:
    return;
}

void MdnsSdRemoteService::Resolution::HandleBrowseResult(DNSServiceRef       aServiceRef,
                                                         DNSServiceFlags     aFlags,
                                                         uint32_t            aInterfaceIndex,
                                                         DNSServiceErrorType aErrorCode,
                                                         const char         *aInstanceName,
                                                         const char         *aType,
                                                         const char         *aDomain,
                                                         void               *aContext)
{
    NSD_UNUSED_VARIABLE(aServiceRef);
    NSD_UNUSED_VARIABLE(aInterfaceIndex);
    NSD_UNUSED_VARIABLE(aType);
    NSD_UNUSED_VARIABLE(aDomain);

    static_cast<Resolution *>(aContext)->HandleBrowseResult(aFlags, aErrorCode, aInstanceName);
}

void MdnsSdRemoteService::Resolution::HandleBrowseResult(DNSServiceFlags     aFlags,
                                                         DNSServiceErrorType aErrorCode,
                                                         const char         *aInstanceName)
{
    VerifyOrExit(aErrorCode == kDNSServiceErr_NoError,
                 nsdLogWarning("Browse of watched %s failed: %s", mInfo.mServiceName.c_str(),
                               DNSErrorToString(aErrorCode)));
    VerifyOrExit(mInfo.mServiceName == aInstanceName);

    if (aFlags & kDNSServiceFlagsAdd)
    {
        // The continuous resolution reports the service again.
        mLost = false;
    }
    else if (!mLost)
    {
        mLost = true;
        mResolved.mAddresses.clear();
        SendReply(ReplyKind::kServiceUpdatedLost);
    }

exit:
    return;
}

} // namespace Mdns

} // namespace nsd
