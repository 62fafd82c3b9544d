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

#define NSD_LOG_TAG "PERNET"

#include "nsd/per_network_discovery.hpp"

#include "common/logging.hpp"

namespace nsd {

PerNetworkDiscovery::PerNetworkDiscovery(const Context     &aContext,
                                         OperationId        aBaseId,
                                         std::string        aServiceType,
                                         NetworkFilter      aFilter,
                                         DiscoveryListener &aBaseListener,
                                         Executor          &aBaseExecutor,
                                         CompletionHandler  aOnComplete)
    : mRegistry(aContext.mRegistry)
    , mSender(aContext.mSender)
    , mMonitor(aContext.mMonitor)
    , mBaseId(aBaseId)
    , mServiceType(std::move(aServiceType))
    , mFilter(std::move(aFilter))
    , mBaseListener(aBaseListener)
    , mBaseExecutor(aBaseExecutor)
    , mOnComplete(std::move(aOnComplete))
{
}

PerNetworkDiscovery::~PerNetworkDiscovery(void)
{
    if (!mStopRequested && mSubscription != 0)
    {
        mMonitor.Unsubscribe(mSubscription);
    }

    for (const auto &kv : mActiveDelegates)
    {
        mRegistry.Retire(kv.second->GetId());
    }

    for (const auto &kv : mStoppingDelegates)
    {
        mRegistry.Retire(kv.first);
    }
}

void PerNetworkDiscovery::Start(void)
{
    DiscoveryListener *listener = &mBaseListener;
    std::string        type     = mServiceType;

    nsdLogInfo("Start discovery %u of %s on networks %s", mBaseId, mServiceType.c_str(), mFilter.ToString().c_str());

    mSubscription = mMonitor.Subscribe(mFilter, *this);
    mBaseExecutor.Execute([listener, type]() { listener->OnDiscoveryStarted(type); });
}

void PerNetworkDiscovery::RequestStop(void)
{
    std::map<Network, DelegatePtr> delegates;

    VerifyOrExit(!mStopRequested, nsdLogInfo("Discovery %u is already stopping", mBaseId));

    nsdLogInfo("Stop discovery %u of %s, %zu networks", mBaseId, mServiceType.c_str(), mActiveDelegates.size());

    mStopRequested = true;
    mMonitor.Unsubscribe(mSubscription);
    mSubscription = 0;

    delegates.swap(mActiveDelegates);
    for (auto &kv : delegates)
    {
        StopDelegate(std::move(kv.second));
    }

    CheckCompletion();

exit:
    return;
}

void PerNetworkDiscovery::HandleNetworkAvailable(const Network &aNetwork)
{
    nsdError    error = NSD_ERROR_NONE;
    DelegatePtr delegate;
    ServiceInfo info;
    OperationId id = kInvalidOperationId;

    VerifyOrExit(!mStopRequested);
    VerifyOrExit(mActiveDelegates.find(aNetwork) == mActiveDelegates.end(),
                 nsdLogDebug("Discovery %u already runs on %s", mBaseId, aNetwork.ToString().c_str()));

    delegate          = MakeUnique<DelegatingListener>(*this, aNetwork);
    info.mServiceType = mServiceType;
    info.mNetwork     = aNetwork;

    SuccessOrExit(error = mRegistry.Allocate(ListenerKind::kDiscovery, *delegate, mDelegateExecutor, info, id));
    delegate->SetId(id);
    mActiveDelegates[aNetwork] = std::move(delegate);

    nsdLogInfo("Discovery %u runs on %s as operation %u", mBaseId, aNetwork.ToString().c_str(), id);
    mSender.SendCommand(Command::kDiscoverStart, id, info);

exit:
    if (error != NSD_ERROR_NONE)
    {
        nsdLogWarning("Failed to start discovery %u on %s: %s", mBaseId, aNetwork.ToString().c_str(),
                      nsdErrorString(error));
    }
}

void PerNetworkDiscovery::HandleNetworkLost(const Network &aNetwork)
{
    auto        it = mActiveDelegates.find(aNetwork);
    DelegatePtr delegate;

    VerifyOrExit(it != mActiveDelegates.end());

    nsdLogInfo("Network %s of discovery %u is lost", aNetwork.ToString().c_str(), mBaseId);

    delegate = std::move(it->second);
    mActiveDelegates.erase(it);

    delegate->LoseAllServices();
    StopDelegate(std::move(delegate));

exit:
    return;
}

void PerNetworkDiscovery::StopDelegate(DelegatePtr aDelegate)
{
    OperationId id = aDelegate->GetId();
    ServiceInfo info;

    info.mServiceType = mServiceType;
    info.mNetwork     = aDelegate->GetNetwork();

    mStoppingDelegates[id] = std::move(aDelegate);
    mSender.SendCommand(Command::kDiscoverStop, id, info);
}

void PerNetworkDiscovery::HandleDelegateTerminated(OperationId aId)
{
    if (mStoppingDelegates.erase(aId) == 0)
    {
        for (auto it = mActiveDelegates.begin(); it != mActiveDelegates.end(); ++it)
        {
            if (it->second->GetId() == aId)
            {
                mActiveDelegates.erase(it);
                break;
            }
        }
    }

    CheckCompletion();
}

void PerNetworkDiscovery::ForwardFound(const ServiceInfo &aInfo)
{
    DiscoveryListener *listener = &mBaseListener;

    mBaseExecutor.Execute([listener, aInfo]() { listener->OnServiceFound(aInfo); });
}

void PerNetworkDiscovery::ForwardLost(const ServiceInfo &aInfo)
{
    DiscoveryListener *listener = &mBaseListener;

    mBaseExecutor.Execute([listener, aInfo]() { listener->OnServiceLost(aInfo); });
}

void PerNetworkDiscovery::CheckCompletion(void)
{
    DiscoveryListener *listener = &mBaseListener;
    std::string        type     = mServiceType;

    VerifyOrExit(mStopRequested && !mStopped && GetDelegateCount() == 0);

    mStopped = true;
    nsdLogInfo("Discovery %u of %s stopped", mBaseId, mServiceType.c_str());

    mRegistry.Retire(mBaseId);
    mBaseExecutor.Execute([listener, type]() { listener->OnDiscoveryStopped(type); });

    if (mOnComplete)
    {
        mOnComplete(mBaseId);
    }

exit:
    return;
}

PerNetworkDiscovery::DelegatingListener::DelegatingListener(PerNetworkDiscovery &aOwner, const Network &aNetwork)
    : mOwner(aOwner)
    , mNetwork(aNetwork)
{
}

void PerNetworkDiscovery::DelegatingListener::OnStartDiscoveryFailed(const std::string &aServiceType,
                                                                     int32_t            aErrorCode)
{
    nsdLogWarning("Failed to start discovery of %s on %s: %s", aServiceType.c_str(), mNetwork.ToString().c_str(),
                  FailureCodeToString(aErrorCode));

    // This object is destroyed by the call.
    mOwner.HandleDelegateTerminated(mId);
}

void PerNetworkDiscovery::DelegatingListener::OnStopDiscoveryFailed(const std::string &aServiceType,
                                                                    int32_t            aErrorCode)
{
    nsdLogWarning("Failed to stop discovery of %s on %s: %s", aServiceType.c_str(), mNetwork.ToString().c_str(),
                  FailureCodeToString(aErrorCode));

    // This object is destroyed by the call.
    mOwner.HandleDelegateTerminated(mId);
}

void PerNetworkDiscovery::DelegatingListener::OnDiscoveryStarted(const std::string &aServiceType)
{
    nsdLogDebug("Discovery of %s started on %s", aServiceType.c_str(), mNetwork.ToString().c_str());
}

void PerNetworkDiscovery::DelegatingListener::OnDiscoveryStopped(const std::string &aServiceType)
{
    nsdLogDebug("Discovery of %s stopped on %s", aServiceType.c_str(), mNetwork.ToString().c_str());

    // This object is destroyed by the call.
    mOwner.HandleDelegateTerminated(mId);
}

void PerNetworkDiscovery::DelegatingListener::OnServiceFound(const ServiceInfo &aInfo)
{
    ServiceInfo info = aInfo;

    VerifyOrExit(!mAllServicesLost);

    mServices.insert(TrackedService{aInfo.mServiceName, aInfo.mServiceType});
    info.mNetwork = mNetwork;
    mOwner.ForwardFound(info);

exit:
    return;
}

void PerNetworkDiscovery::DelegatingListener::OnServiceLost(const ServiceInfo &aInfo)
{
    ServiceInfo info = aInfo;

    VerifyOrExit(!mAllServicesLost);

    mServices.erase(TrackedService{aInfo.mServiceName, aInfo.mServiceType});
    info.mNetwork = mNetwork;
    mOwner.ForwardLost(info);

exit:
    return;
}

void PerNetworkDiscovery::DelegatingListener::LoseAllServices(void)
{
    mAllServicesLost = true;

    for (const TrackedService &service : mServices)
    {
        ServiceInfo info;

        info.mServiceName = service.mName;
        info.mServiceType = service.mType;
        info.mNetwork     = mNetwork;
        mOwner.ForwardLost(info);
    }

    mServices.clear();
}

} // namespace nsd
