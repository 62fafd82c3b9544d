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
 *   This file implements the network service discovery manager.
 */

#define NSD_LOG_TAG "NSD"

#include "nsd/nsd_manager.hpp"

#include "common/logging.hpp"

namespace nsd {

NsdManager::NsdManager(RemoteService &aRemote, NetworkMonitor &aMonitor, Executor &aFlow)
    : mRemote(aRemote)
    , mMonitor(aMonitor)
    , mFlow(aFlow)
    , mDispatcher(mRegistry, aFlow)
    , mChannel(aRemote, mDispatcher)
{
    mRemote.SetReplyHandler(&mDispatcher);
}

NsdManager::~NsdManager(void)
{
    mRemote.SetReplyHandler(nullptr);
    mPerNetworkDiscoveries.clear();
}

nsdError NsdManager::StartDaemon(void)
{
    nsdError error = mRemote.StartDaemon();

    if (error != NSD_ERROR_NONE)
    {
        // The remote service can still be started on demand later.
        nsdLogWarning("Failed to proactively start the daemon: %s", nsdErrorString(error));
    }

    return error;
}

nsdError NsdManager::RegisterService(const ServiceInfo    &aInfo,
                                     int                   aProtocol,
                                     Executor             &aExecutor,
                                     RegistrationListener &aListener,
                                     OperationId          *aId)
{
    nsdError    error = NSD_ERROR_NONE;
    OperationId id = kInvalidOperationId;

    VerifyOrExit(aProtocol == kProtocolDnsSd, error = NSD_ERROR_INVALID_ARGS);
    SuccessOrExit(error = ValidateRegistrationInfo(aInfo));
    SuccessOrExit(error = StartOperation(ListenerKind::kRegistration, aListener, aExecutor, aInfo, id));

    PostCommand(Command::kRegister, id, aInfo);

    if (aId != nullptr)
    {
        *aId = id;
    }

exit:
    if (error != NSD_ERROR_NONE)
    {
        nsdLogWarning("Failed to register service %s: %s", aInfo.ToString().c_str(), nsdErrorString(error));
    }

    return error;
}

nsdError NsdManager::UnregisterService(RegistrationListener &aListener)
{
    return StopOperation(ListenerKind::kRegistration, aListener, Command::kUnregister);
}

nsdError NsdManager::DiscoverServices(const std::string &aServiceType,
                                      int                aProtocol,
                                      const Network     &aNetwork,
                                      Executor          &aExecutor,
                                      DiscoveryListener &aListener,
                                      OperationId       *aId)
{
    nsdError    error = NSD_ERROR_NONE;
    OperationId id = kInvalidOperationId;
    ServiceInfo info;

    SuccessOrExit(error = ValidateDiscoveryType(aServiceType, aProtocol));

    info.mServiceType = aServiceType;
    info.mNetwork     = aNetwork;
    SuccessOrExit(error = StartOperation(ListenerKind::kDiscovery, aListener, aExecutor, info, id));

    PostCommand(Command::kDiscoverStart, id, info);

    if (aId != nullptr)
    {
        *aId = id;
    }

exit:
    if (error != NSD_ERROR_NONE)
    {
        nsdLogWarning("Failed to discover %s on %s: %s", aServiceType.c_str(), aNetwork.ToString().c_str(),
                      nsdErrorString(error));
    }

    return error;
}

nsdError NsdManager::DiscoverServices(const std::string   &aServiceType,
                                      int                  aProtocol,
                                      const NetworkFilter &aFilter,
                                      Executor            &aExecutor,
                                      DiscoveryListener   &aListener,
                                      OperationId         *aId)
{
    nsdError    error = NSD_ERROR_NONE;
    OperationId id = kInvalidOperationId;
    ServiceInfo info;

    SuccessOrExit(error = ValidateDiscoveryType(aServiceType, aProtocol));

    info.mServiceType = aServiceType;
    SuccessOrExit(error = StartOperation(ListenerKind::kDiscovery, aListener, aExecutor, info, id));

    {
        DiscoveryListener *listener = &aListener;
        Executor          *executor = &aExecutor;
        std::string        type     = aServiceType;
        NetworkFilter      filter   = aFilter;

        mFlow.Execute([this, id, type, filter, listener, executor]() {
            StartPerNetworkDiscovery(id, type, filter, *listener, *executor);
        });
    }

    if (aId != nullptr)
    {
        *aId = id;
    }

exit:
    if (error != NSD_ERROR_NONE)
    {
        nsdLogWarning("Failed to discover %s on networks %s: %s", aServiceType.c_str(), aFilter.ToString().c_str(),
                      nsdErrorString(error));
    }

    return error;
}

nsdError NsdManager::StopServiceDiscovery(DiscoveryListener &aListener)
{
    return StopOperation(ListenerKind::kDiscovery, aListener, Command::kDiscoverStop);
}

nsdError NsdManager::ResolveService(const ServiceInfo &aInfo,
                                    Executor          &aExecutor,
                                    ResolveListener   &aListener,
                                    OperationId       *aId)
{
    nsdError    error = NSD_ERROR_NONE;
    OperationId id = kInvalidOperationId;

    SuccessOrExit(error = ValidateResolutionInfo(aInfo));
    SuccessOrExit(error = StartOperation(ListenerKind::kResolve, aListener, aExecutor, aInfo, id));

    PostCommand(Command::kResolveStart, id, aInfo);

    if (aId != nullptr)
    {
        *aId = id;
    }

exit:
    if (error != NSD_ERROR_NONE)
    {
        nsdLogWarning("Failed to resolve service %s: %s", aInfo.ToString().c_str(), nsdErrorString(error));
    }

    return error;
}

nsdError NsdManager::StopServiceResolution(ResolveListener &aListener)
{
    return StopOperation(ListenerKind::kResolve, aListener, Command::kResolveStop);
}

nsdError NsdManager::RegisterServiceInfoCallback(const ServiceInfo   &aInfo,
                                                 Executor            &aExecutor,
                                                 ServiceInfoCallback &aCallback,
                                                 OperationId         *aId)
{
    nsdError    error = NSD_ERROR_NONE;
    OperationId id = kInvalidOperationId;

    SuccessOrExit(error = ValidateResolutionInfo(aInfo));
    SuccessOrExit(error = StartOperation(ListenerKind::kServiceInfo, aCallback, aExecutor, aInfo, id));

    PostCommand(Command::kWatchStart, id, aInfo);

    if (aId != nullptr)
    {
        *aId = id;
    }

exit:
    if (error != NSD_ERROR_NONE)
    {
        nsdLogWarning("Failed to watch service %s: %s", aInfo.ToString().c_str(), nsdErrorString(error));
    }

    return error;
}

nsdError NsdManager::UnregisterServiceInfoCallback(ServiceInfoCallback &aCallback)
{
    return StopOperation(ListenerKind::kServiceInfo, aCallback, Command::kWatchStop);
}

nsdError NsdManager::StartOperation(ListenerKind       aKind,
                                    Listener          &aListener,
                                    Executor          &aExecutor,
                                    const ServiceInfo &aInfo,
                                    OperationId       &aId)
{
    nsdError error = NSD_ERROR_NONE;

    VerifyOrExit(mRemote.IsConnected(), error = NSD_ERROR_REMOTE_UNAVAILABLE);
    SuccessOrExit(error = mRegistry.Allocate(aKind, aListener, aExecutor, aInfo, aId));

    nsdLogInfo("Start %s operation %u: %s", ListenerKindToString(aKind), aId, aInfo.ToString().c_str());

exit:
    return error;
}

nsdError NsdManager::StopOperation(ListenerKind aKind, const Listener &aListener, Command aCommand)
{
    nsdError                 error = NSD_ERROR_NONE;
    OperationId              id = kInvalidOperationId;
    OperationRegistry::Entry entry;

    SuccessOrExit(error = mRegistry.KeyOf(aListener, id));
    VerifyOrExit(mRegistry.Lookup(id, entry) && entry.mKind == aKind, error = NSD_ERROR_NOT_FOUND);

    nsdLogInfo("Stop %s operation %u", ListenerKindToString(aKind), id);

    if (aCommand == Command::kDiscoverStop)
    {
        ServiceInfo info = entry.mInfo;

        mFlow.Execute([this, id, info]() { StopDiscovery(id, info); });
    }
    else
    {
        PostCommand(aCommand, id, entry.mInfo);
    }

exit:
    if (error != NSD_ERROR_NONE)
    {
        nsdLogInfo("Cannot stop %s operation: %s", ListenerKindToString(aKind), nsdErrorString(error));
    }

    return error;
}

void NsdManager::PostCommand(Command aCommand, OperationId aId, const ServiceInfo &aInfo)
{
    ServiceInfo info = aInfo;

    mFlow.Execute([this, aCommand, aId, info]() { mChannel.SendCommand(aCommand, aId, info); });
}

void NsdManager::StartPerNetworkDiscovery(OperationId          aBaseId,
                                          const std::string   &aServiceType,
                                          const NetworkFilter &aFilter,
                                          DiscoveryListener   &aListener,
                                          Executor            &aExecutor)
{
    PerNetworkDiscovery::Context         context{mRegistry, mChannel, mMonitor};
    std::unique_ptr<PerNetworkDiscovery> discovery;
    PerNetworkDiscovery                 *started;

    // The session is erased from a posted task, never from inside its own completion handler.
    discovery = MakeUnique<PerNetworkDiscovery>(context, aBaseId, aServiceType, aFilter, aListener, aExecutor,
                                                [this](OperationId aId) {
                                                    mFlow.Execute([this, aId]() { mPerNetworkDiscoveries.erase(aId); });
                                                });
    started   = discovery.get();

    mPerNetworkDiscoveries[aBaseId] = std::move(discovery);
    started->Start();
}

void NsdManager::StopDiscovery(OperationId aId, const ServiceInfo &aInfo)
{
    auto it = mPerNetworkDiscoveries.find(aId);

    if (it != mPerNetworkDiscoveries.end())
    {
        it->second->RequestStop();
    }
    else
    {
        mChannel.SendCommand(Command::kDiscoverStop, aId, aInfo);
    }
}

} // namespace nsd
