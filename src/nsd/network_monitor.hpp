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
 *   This file includes definitions of the network membership subsystem.
 */

#ifndef NSD_NSD_NETWORK_MONITOR_HPP_
#define NSD_NSD_NETWORK_MONITOR_HPP_

#include "nsd-client/config.h"

#include <string>
#include <vector>

#include <stdint.h>

#include "nsd/service_info.hpp"

namespace nsd {

/**
 * This structure describes which networks a filter-based discovery runs on.
 *
 */
struct NetworkFilter
{
    std::vector<std::string> mNamePatterns;            ///< Interface name glob patterns, empty matches any name.
    bool                     mRequireRunning   = true;  ///< Require IFF_UP and IFF_RUNNING.
    bool                     mRequireMulticast = true;  ///< Require IFF_MULTICAST.
    bool                     mIncludeLoopback  = false; ///< Accept loopback interfaces.

    /**
     * This method tells whether an interface matches the filter.
     *
     * @param[in] aName   The interface name.
     * @param[in] aFlags  The interface flags (IFF_*).
     *
     */
    bool Matches(const std::string &aName, unsigned int aFlags) const;

    std::string ToString(void) const;
};

/**
 * This interface receives network availability changes.
 *
 */
class NetworkCallback
{
public:
    virtual ~NetworkCallback(void) = default;

    virtual void HandleNetworkAvailable(const Network &aNetwork) = 0;
    virtual void HandleNetworkLost(const Network &aNetwork)      = 0;
};

/**
 * This interface represents the network membership subsystem.
 *
 * Callbacks are delivered on the mainloop thread and never from inside `Subscribe()`
 * or `Unsubscribe()`.
 *
 */
class NetworkMonitor
{
public:
    typedef uint64_t SubscriptionId;

    virtual ~NetworkMonitor(void) = default;

    /**
     * This method subscribes to the networks matching @p aFilter.
     *
     * Every matching network already available is announced with `HandleNetworkAvailable()`
     * shortly after this method returns.
     *
     * @param[in] aFilter    The network filter.
     * @param[in] aCallback  The callback, must stay valid until unsubscribed.
     *
     * @returns The subscription id, never zero.
     *
     */
    virtual SubscriptionId Subscribe(const NetworkFilter &aFilter, NetworkCallback &aCallback) = 0;

    /**
     * This method cancels a subscription. No callback is delivered for it afterwards.
     *
     * @param[in] aId  The subscription id.
     *
     */
    virtual void Unsubscribe(SubscriptionId aId) = 0;
};

} // namespace nsd

#endif // NSD_NSD_NETWORK_MONITOR_HPP_
