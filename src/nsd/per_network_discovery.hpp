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
 *   This file includes definitions of the discovery spanning every network matching a filter.
 */

#ifndef NSD_NSD_PER_NETWORK_DISCOVERY_HPP_
#define NSD_NSD_PER_NETWORK_DISCOVERY_HPP_

#include "nsd-client/config.h"

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>

#include "common/code_utils.hpp"
#include "common/executor.hpp"
#include "nsd/listener.hpp"
#include "nsd/network_monitor.hpp"
#include "nsd/operation_registry.hpp"
#include "nsd/remote_service.hpp"

namespace nsd {

/**
 * This class implements one discovery on all current and future networks matching a filter.
 *
 * The discovery runs one single-network discovery per matching network and merges their
 * events into the stream of the base listener: one `OnDiscoveryStarted()` when the session
 * starts, found and lost events of every network, a lost event for each service of a network
 * that disappears, and one `OnDiscoveryStopped()` once stop was requested and every
 * single-network discovery has terminated.
 *
 * All methods, and the network callbacks, must run on the serialized flow.
 *
 */
class PerNetworkDiscovery : public NetworkCallback, private NonCopyable
{
public:
    /**
     * This type represents the handler called once the session terminated, with its base id.
     *
     * The session may be destroyed from a task posted by the handler, never from the handler itself.
     *
     */
    typedef std::function<void(OperationId)> CompletionHandler;

    /**
     * This structure groups the collaborators of a session.
     *
     */
    struct Context
    {
        OperationRegistry &mRegistry;
        CommandSender     &mSender;
        NetworkMonitor    &mMonitor;
    };

    /**
     * This constructor initializes the session.
     *
     * @param[in] aContext       The collaborators.
     * @param[in] aBaseId        The operation id allocated for @p aBaseListener.
     * @param[in] aServiceType   The service type to discover.
     * @param[in] aFilter        The network filter.
     * @param[in] aBaseListener  The listener of the caller.
     * @param[in] aBaseExecutor  The executor @p aBaseListener runs on.
     * @param[in] aOnComplete    The completion handler.
     *
     */
    PerNetworkDiscovery(const Context     &aContext,
                        OperationId        aBaseId,
                        std::string        aServiceType,
                        NetworkFilter      aFilter,
                        DiscoveryListener &aBaseListener,
                        Executor          &aBaseExecutor,
                        CompletionHandler  aOnComplete);

    ~PerNetworkDiscovery(void) override;

    /**
     * This method starts the session.
     *
     */
    void Start(void);

    /**
     * This method requests the session to stop. A repeated request is ignored.
     *
     */
    void RequestStop(void);

    OperationId        GetBaseId(void) const { return mBaseId; }
    const std::string &GetServiceType(void) const { return mServiceType; }
    bool               IsStopRequested(void) const { return mStopRequested; }

    /**
     * This method returns the number of single-network discoveries not yet terminated.
     *
     */
    size_t GetDelegateCount(void) const { return mActiveDelegates.size() + mStoppingDelegates.size(); }

    // Implementation of NetworkCallback.
    void HandleNetworkAvailable(const Network &aNetwork) override;
    void HandleNetworkLost(const Network &aNetwork) override;

private:
    /**
     * This structure identifies a service found on a network.
     *
     */
    struct TrackedService
    {
        std::string mName;
        std::string mType;

        bool operator<(const TrackedService &aOther) const
        {
            return mName < aOther.mName || (mName == aOther.mName && mType < aOther.mType);
        }
    };

    /**
     * This class is the listener of the single-network discovery on one network.
     *
     */
    class DelegatingListener : public DiscoveryListener
    {
    public:
        DelegatingListener(PerNetworkDiscovery &aOwner, const Network &aNetwork);

        void OnStartDiscoveryFailed(const std::string &aServiceType, int32_t aErrorCode) override;
        void OnStopDiscoveryFailed(const std::string &aServiceType, int32_t aErrorCode) override;
        void OnDiscoveryStarted(const std::string &aServiceType) override;
        void OnDiscoveryStopped(const std::string &aServiceType) override;
        void OnServiceFound(const ServiceInfo &aInfo) override;
        void OnServiceLost(const ServiceInfo &aInfo) override;

        /**
         * This method reports every tracked service as lost and ignores later events.
         *
         */
        void LoseAllServices(void);

        const Network &GetNetwork(void) const { return mNetwork; }
        OperationId    GetId(void) const { return mId; }
        void           SetId(OperationId aId) { mId = aId; }

    private:
        PerNetworkDiscovery     &mOwner;
        Network                  mNetwork;
        OperationId              mId = kInvalidOperationId;
        std::set<TrackedService> mServices;
        bool                     mAllServicesLost = false;
    };

    typedef std::unique_ptr<DelegatingListener> DelegatePtr;

    void StopDelegate(DelegatePtr aDelegate);
    void HandleDelegateTerminated(OperationId aId);
    void ForwardFound(const ServiceInfo &aInfo);
    void ForwardLost(const ServiceInfo &aInfo);
    void CheckCompletion(void);

    OperationRegistry &mRegistry;
    CommandSender     &mSender;
    NetworkMonitor    &mMonitor;
    OperationId        mBaseId;
    std::string        mServiceType;
    NetworkFilter      mFilter;
    DiscoveryListener &mBaseListener;
    Executor          &mBaseExecutor;
    CompletionHandler  mOnComplete;
    InlineExecutor     mDelegateExecutor;

    NetworkMonitor::SubscriptionId mSubscription = 0;
    bool                           mStopRequested = false;
    bool                           mStopped       = false;

    // Discoveries on networks currently available.
    std::map<Network, DelegatePtr> mActiveDelegates;
    // Discoveries asked to stop, waiting for their stop reply.
    std::map<OperationId, DelegatePtr> mStoppingDelegates;
};

} // namespace nsd

#endif // NSD_NSD_PER_NETWORK_DISCOVERY_HPP_
