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
 *   This file includes definitions of the network service discovery manager.
 */

#ifndef NSD_NSD_NSD_MANAGER_HPP_
#define NSD_NSD_NSD_MANAGER_HPP_

#include "nsd-client/config.h"

#include <map>
#include <memory>
#include <string>

#include "common/code_utils.hpp"
#include "common/executor.hpp"
#include "common/types.hpp"
#include "nsd/command_channel.hpp"
#include "nsd/listener.hpp"
#include "nsd/network_monitor.hpp"
#include "nsd/operation_registry.hpp"
#include "nsd/per_network_discovery.hpp"
#include "nsd/remote_service.hpp"
#include "nsd/reply_dispatcher.hpp"

namespace nsd {

/**
 * This class is the client session of network service discovery.
 *
 * It registers, discovers, resolves and watches services through a remote discovery service
 * and delivers every event to the listener the operation was started with, on the executor
 * given with it.
 *
 * Start and stop methods may be called from any thread. They validate their arguments and
 * return synchronously; the command itself is sent later on the serialized flow, so its effect
 * is visible only after the method returned. A listener instance can be used for one operation
 * at a time, it becomes available again once a terminal event was delivered.
 *
 * No timeout is applied: an operation whose stop is never answered by the remote service
 * stays outstanding, and its listener cannot be reused.
 *
 * The serialized flow must run on the thread the network monitor delivers its events on.
 * The manager must outlive every task it posted to the flow.
 *
 */
class NsdManager : private NonCopyable
{
public:
    /**
     * This constructor initializes the manager.
     *
     * @param[in] aRemote   The remote discovery service.
     * @param[in] aMonitor  The network monitor used by filter-based discoveries.
     * @param[in] aFlow     The serialized flow, normally the `TaskRunner` of the mainloop.
     *
     */
    NsdManager(RemoteService &aRemote, NetworkMonitor &aMonitor, Executor &aFlow);

    ~NsdManager(void);

    /**
     * This method asks the remote service to start proactively.
     *
     * A failure is not fatal, the remote service can still start on demand.
     *
     */
    nsdError StartDaemon(void);

    /**
     * This method registers a service.
     *
     * @param[in]  aInfo      The service, with a name, a type and a positive port.
     * @param[in]  aProtocol  The protocol, must be `kProtocolDnsSd`.
     * @param[in]  aExecutor  The executor @p aListener runs on.
     * @param[in]  aListener  The listener of the registration.
     * @param[out] aId        If not nullptr, the allocated operation id.
     *
     * @retval NSD_ERROR_NONE                Registration requested.
     * @retval NSD_ERROR_INVALID_ARGS        @p aInfo or @p aProtocol is not acceptable.
     * @retval NSD_ERROR_REMOTE_UNAVAILABLE  The remote service cannot be reached.
     * @retval NSD_ERROR_DUPLICATED          @p aListener is already in use.
     *
     */
    nsdError RegisterService(const ServiceInfo    &aInfo,
                             int                   aProtocol,
                             Executor             &aExecutor,
                             RegistrationListener &aListener,
                             OperationId          *aId = nullptr);

    /**
     * This method unregisters the service registered with @p aListener.
     *
     * @retval NSD_ERROR_NONE       Unregistration requested.
     * @retval NSD_ERROR_NOT_FOUND  @p aListener has no outstanding registration.
     *
     */
    nsdError UnregisterService(RegistrationListener &aListener);

    /**
     * This method discovers services on one network, or on all networks with `Network::Any()`.
     *
     * @param[in]  aServiceType  The service type, e.g. "_http._tcp".
     * @param[in]  aProtocol     The protocol, must be `kProtocolDnsSd`.
     * @param[in]  aNetwork      The network.
     * @param[in]  aExecutor     The executor @p aListener runs on.
     * @param[in]  aListener     The listener of the discovery.
     * @param[out] aId           If not nullptr, the allocated operation id.
     *
     * @retval NSD_ERROR_NONE                Discovery requested.
     * @retval NSD_ERROR_INVALID_ARGS        @p aServiceType or @p aProtocol is not acceptable.
     * @retval NSD_ERROR_REMOTE_UNAVAILABLE  The remote service cannot be reached.
     * @retval NSD_ERROR_DUPLICATED          @p aListener is already in use.
     *
     */
    nsdError DiscoverServices(const std::string &aServiceType,
                              int                aProtocol,
                              const Network     &aNetwork,
                              Executor          &aExecutor,
                              DiscoveryListener &aListener,
                              OperationId       *aId = nullptr);

    /**
     * This method discovers services on every current and future network matching @p aFilter.
     *
     * Found services carry the network they were found on. When a network disappears, every
     * service found on it is reported lost.
     *
     * @retval NSD_ERROR_NONE                Discovery requested.
     * @retval NSD_ERROR_INVALID_ARGS        @p aServiceType or @p aProtocol is not acceptable.
     * @retval NSD_ERROR_REMOTE_UNAVAILABLE  The remote service cannot be reached.
     * @retval NSD_ERROR_DUPLICATED          @p aListener is already in use.
     *
     */
    nsdError DiscoverServices(const std::string   &aServiceType,
                              int                  aProtocol,
                              const NetworkFilter &aFilter,
                              Executor            &aExecutor,
                              DiscoveryListener   &aListener,
                              OperationId         *aId = nullptr);

    /**
     * This method stops the discovery started with @p aListener.
     *
     * @retval NSD_ERROR_NONE       Stop requested.
     * @retval NSD_ERROR_NOT_FOUND  @p aListener has no outstanding discovery.
     *
     */
    nsdError StopServiceDiscovery(DiscoveryListener &aListener);

    /**
     * This method resolves a service to its host, port, TXT attributes and addresses.
     *
     * @retval NSD_ERROR_NONE                Resolution requested.
     * @retval NSD_ERROR_INVALID_ARGS        @p aInfo has no name or no type.
     * @retval NSD_ERROR_REMOTE_UNAVAILABLE  The remote service cannot be reached.
     * @retval NSD_ERROR_DUPLICATED          @p aListener is already in use.
     *
     */
    nsdError ResolveService(const ServiceInfo &aInfo,
                            Executor          &aExecutor,
                            ResolveListener   &aListener,
                            OperationId       *aId = nullptr);

    /**
     * This method stops the resolution started with @p aListener.
     *
     * @retval NSD_ERROR_NONE       Stop requested.
     * @retval NSD_ERROR_NOT_FOUND  @p aListener has no outstanding resolution.
     *
     */
    nsdError StopServiceResolution(ResolveListener &aListener);

    /**
     * This method watches a service and reports every update of it.
     *
     * @retval NSD_ERROR_NONE                Watch requested.
     * @retval NSD_ERROR_INVALID_ARGS        @p aInfo has no name or no type.
     * @retval NSD_ERROR_REMOTE_UNAVAILABLE  The remote service cannot be reached.
     * @retval NSD_ERROR_DUPLICATED          @p aCallback is already in use.
     *
     */
    nsdError RegisterServiceInfoCallback(const ServiceInfo   &aInfo,
                                         Executor            &aExecutor,
                                         ServiceInfoCallback &aCallback,
                                         OperationId         *aId = nullptr);

    /**
     * This method stops watching the service watched with @p aCallback.
     *
     * @retval NSD_ERROR_NONE       Stop requested.
     * @retval NSD_ERROR_NOT_FOUND  @p aCallback has no outstanding watch.
     *
     */
    nsdError UnregisterServiceInfoCallback(ServiceInfoCallback &aCallback);

    const OperationRegistry &GetRegistry(void) const { return mRegistry; }

    /**
     * This method returns the number of filter-based discoveries not yet terminated.
     *
     * It must be called on the serialized flow.
     *
     */
    size_t GetPerNetworkDiscoveryCount(void) const { return mPerNetworkDiscoveries.size(); }

private:
    nsdError StartOperation(ListenerKind       aKind,
                            Listener          &aListener,
                            Executor          &aExecutor,
                            const ServiceInfo &aInfo,
                            OperationId       &aId);
    nsdError StopOperation(ListenerKind aKind, const Listener &aListener, Command aCommand);
    void     PostCommand(Command aCommand, OperationId aId, const ServiceInfo &aInfo);
    void     StartPerNetworkDiscovery(OperationId          aBaseId,
                                      const std::string   &aServiceType,
                                      const NetworkFilter &aFilter,
                                      DiscoveryListener   &aListener,
                                      Executor            &aExecutor);
    void     StopDiscovery(OperationId aId, const ServiceInfo &aInfo);

    RemoteService    &mRemote;
    NetworkMonitor   &mMonitor;
    Executor         &mFlow;
    OperationRegistry mRegistry;
    ReplyDispatcher   mDispatcher;
    CommandChannel    mChannel;

    std::map<OperationId, std::unique_ptr<PerNetworkDiscovery>> mPerNetworkDiscoveries;
};

} // namespace nsd

#endif // NSD_NSD_NSD_MANAGER_HPP_
