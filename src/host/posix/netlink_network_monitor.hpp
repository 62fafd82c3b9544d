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
 *   This file includes definitions of the netlink based network monitor.
 */

#ifndef NSD_HOST_POSIX_NETLINK_NETWORK_MONITOR_HPP_
#define NSD_HOST_POSIX_NETLINK_NETWORK_MONITOR_HPP_

#include "nsd-client/config.h"

#include <map>
#include <set>
#include <vector>

#include "common/code_utils.hpp"
#include "common/mainloop.hpp"
#include "common/task_runner.hpp"
#include "common/types.hpp"
#include "nsd/network_monitor.hpp"

namespace nsd {
namespace Host {

/**
 * This class monitors the host interfaces with a NETLINK_ROUTE socket.
 *
 * Link and address events trigger a rescan of all interfaces, the result is compared
 * with what each subscription was told so far.
 *
 */
class NetlinkNetworkMonitor : public MainloopProcessor, public NetworkMonitor, private NonCopyable
{
public:
    /**
     * This structure represents the state of one host interface.
     *
     */
    struct Interface
    {
        Network      mNetwork;
        unsigned int mFlags;
    };

    explicit NetlinkNetworkMonitor(TaskRunner &aTaskRunner);
    ~NetlinkNetworkMonitor(void) override;

    /**
     * This method opens the netlink socket.
     *
     * @retval NSD_ERROR_NONE   Successfully opened the socket.
     * @retval NSD_ERROR_ERRNO  Failed to open or bind the socket, see `errno`.
     *
     */
    nsdError Init(void);

    void Deinit(void);

    // Implementation of NetworkMonitor.
    SubscriptionId Subscribe(const NetworkFilter &aFilter, NetworkCallback &aCallback) override;
    void           Unsubscribe(SubscriptionId aId) override;

    // Implementation of MainloopProcessor.
    void Update(MainloopContext &aMainloop) override;
    void Process(const MainloopContext &aMainloop) override;

    /**
     * This method lists the host interfaces with their flags.
     *
     */
    static std::vector<Interface> ScanInterfaces(void);

private:
    struct Subscription
    {
        NetworkFilter     mFilter;
        NetworkCallback  *mCallback;
        std::set<Network> mAnnounced;
    };

    void ReceiveNetlinkMessage(void);
    void Refresh(void);
    void Refresh(SubscriptionId aId, const std::vector<Interface> &aInterfaces);

    TaskRunner                            &mTaskRunner;
    int                                    mNetlinkSocket = -1;
    SubscriptionId                         mNextId        = 1;
    std::map<SubscriptionId, Subscription> mSubscriptions;
};

} // namespace Host
} // namespace nsd

#endif // NSD_HOST_POSIX_NETLINK_NETWORK_MONITOR_HPP_
