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

#define NSD_LOG_TAG "DISPATCH"

#include "nsd/reply_dispatcher.hpp"

#include <utility>

#include "common/logging.hpp"

namespace nsd {

ReplyDispatcher::ReplyDispatcher(OperationRegistry &aRegistry, Executor &aFlow)
    : mRegistry(aRegistry)
    , mFlow(aFlow)
{
}

void ReplyDispatcher::HandleReply(Reply aReply)
{
    // The reply is copied into the task, the caller's object may be gone when it runs.
    mFlow.Execute([this, aReply]() { Dispatch(aReply); });
}

void ReplyDispatcher::Dispatch(const Reply &aReply)
{
    OperationRegistry::Entry entry;

    VerifyOrExit(aReply.mKind <= ReplyKind::kCallbackUnregistered,
                 nsdLogInfo("Ignored reply of unknown kind %s for operation %u",
                            ReplyKindToString(aReply.mKind).c_str(), aReply.mId));

    VerifyOrExit(mRegistry.Lookup(aReply.mId, entry), nsdLogDebug("Stale operation %u for %s", aReply.mId,
                                                                  ReplyKindToString(aReply.mKind).c_str()));

    nsdLogDebug("Received %s for operation %u, service %s", ReplyKindToString(aReply.mKind).c_str(), aReply.mId,
                entry.mInfo.ToString().c_str());

    VerifyOrExit(ListenerKindOfReply(aReply.mKind) == entry.mKind,
                 nsdLogWarning("Dropped %s for operation %u: it was started by a %s listener",
                               ReplyKindToString(aReply.mKind).c_str(), aReply.mId,
                               ListenerKindToString(entry.mKind)));

    if (IsTerminalReply(aReply.mKind))
    {
        mRegistry.Retire(aReply.mId);
    }

    Deliver(entry, aReply);

exit:
    return;
}

void ReplyDispatcher::Deliver(const OperationRegistry::Entry &aEntry, const Reply &aReply)
{
    Executor         &executor  = *aEntry.mExecutor;
    const int32_t     errorCode = aReply.mErrorCode;
    const ServiceInfo info      = aReply.mInfo;
    const ServiceInfo request   = aEntry.mInfo;

    switch (aReply.mKind)
    {
    case ReplyKind::kDiscoveryStarted:
    {
        DiscoveryListener *listener = static_cast<DiscoveryListener *>(aEntry.mListener);

        executor.Execute([listener, request]() { listener->OnDiscoveryStarted(request.mServiceType); });
        break;
    }

    case ReplyKind::kDiscoveryStartFailed:
    {
        DiscoveryListener *listener = static_cast<DiscoveryListener *>(aEntry.mListener);

        executor.Execute(
            [listener, request, errorCode]() { listener->OnStartDiscoveryFailed(request.mServiceType, errorCode); });
        break;
    }

    case ReplyKind::kServiceFound:
    {
        DiscoveryListener *listener = static_cast<DiscoveryListener *>(aEntry.mListener);

        executor.Execute([listener, info]() { listener->OnServiceFound(info); });
        break;
    }

    case ReplyKind::kServiceLost:
    {
        DiscoveryListener *listener = static_cast<DiscoveryListener *>(aEntry.mListener);

        executor.Execute([listener, info]() { listener->OnServiceLost(info); });
        break;
    }

    case ReplyKind::kDiscoveryStopped:
    {
        DiscoveryListener *listener = static_cast<DiscoveryListener *>(aEntry.mListener);

        executor.Execute([listener, request]() { listener->OnDiscoveryStopped(request.mServiceType); });
        break;
    }

    case ReplyKind::kStopDiscoveryFailed:
    {
        DiscoveryListener *listener = static_cast<DiscoveryListener *>(aEntry.mListener);

        executor.Execute(
            [listener, request, errorCode]() { listener->OnStopDiscoveryFailed(request.mServiceType, errorCode); });
        break;
    }

    case ReplyKind::kRegisterSucceeded:
    {
        RegistrationListener *listener = static_cast<RegistrationListener *>(aEntry.mListener);

        executor.Execute([listener, info]() { listener->OnServiceRegistered(info); });
        break;
    }

    case ReplyKind::kRegisterFailed:
    {
        RegistrationListener *listener = static_cast<RegistrationListener *>(aEntry.mListener);

        executor.Execute([listener, request, errorCode]() { listener->OnRegistrationFailed(request, errorCode); });
        break;
    }

    case ReplyKind::kUnregisterSucceeded:
    {
        RegistrationListener *listener = static_cast<RegistrationListener *>(aEntry.mListener);

        executor.Execute([listener, request]() { listener->OnServiceUnregistered(request); });
        break;
    }

    case ReplyKind::kUnregisterFailed:
    {
        RegistrationListener *listener = static_cast<RegistrationListener *>(aEntry.mListener);

        executor.Execute([listener, request, errorCode]() { listener->OnUnregistrationFailed(request, errorCode); });
        break;
    }

    case ReplyKind::kResolveSucceeded:
    {
        ResolveListener *listener = static_cast<ResolveListener *>(aEntry.mListener);

        executor.Execute([listener, info]() { listener->OnServiceResolved(info); });
        break;
    }

    case ReplyKind::kResolveFailed:
    {
        ResolveListener *listener = static_cast<ResolveListener *>(aEntry.mListener);

        executor.Execute([listener, request, errorCode]() { listener->OnResolveFailed(request, errorCode); });
        break;
    }

    case ReplyKind::kResolutionStopped:
    {
        ResolveListener *listener = static_cast<ResolveListener *>(aEntry.mListener);

        executor.Execute([listener, request]() { listener->OnResolutionStopped(request); });
        break;
    }

    case ReplyKind::kStopResolutionFailed:
    {
        ResolveListener *listener = static_cast<ResolveListener *>(aEntry.mListener);

        executor.Execute([listener, request, errorCode]() { listener->OnStopResolutionFailed(request, errorCode); });
        break;
    }

    case ReplyKind::kServiceUpdated:
    {
        ServiceInfoCallback *callback = static_cast<ServiceInfoCallback *>(aEntry.mListener);

        executor.Execute([callback, info]() { callback->OnServiceUpdated(info); });
        break;
    }

    case ReplyKind::kServiceUpdatedLost:
    {
        ServiceInfoCallback *callback = static_cast<ServiceInfoCallback *>(aEntry.mListener);

        executor.Execute([callback]() { callback->OnServiceLost(); });
        break;
    }

    case ReplyKind::kCallbackRegistrationFailed:
    {
        ServiceInfoCallback *callback = static_cast<ServiceInfoCallback *>(aEntry.mListener);

        executor.Execute([callback, errorCode]() { callback->OnServiceInfoCallbackRegistrationFailed(errorCode); });
        break;
    }

    case ReplyKind::kCallbackUnregistered:
    {
        ServiceInfoCallback *callback = static_cast<ServiceInfoCallback *>(aEntry.mListener);

        executor.Execute([callback]() { callback->OnServiceInfoCallbackUnregistered(); });
        break;
    }
    }
}

} // namespace nsd
