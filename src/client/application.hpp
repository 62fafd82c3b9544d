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
 *   This file includes definitions of the nsd-client application.
 */

#ifndef NSD_CLIENT_APPLICATION_HPP_
#define NSD_CLIENT_APPLICATION_HPP_

#include "nsd-client/config.h"

#include <atomic>
#include <memory>
#include <string>

#include "common/code_utils.hpp"
#include "common/task_runner.hpp"
#include "common/time.hpp"
#include "common/types.hpp"
#include "host/posix/netlink_network_monitor.hpp"
#include "mdns/remote_service_mdnssd.hpp"
#include "nsd/listener.hpp"
#include "nsd/nsd_manager.hpp"

namespace nsd {

/**
 * This class runs the operations requested on the command line until terminated.
 *
 */
class Application : private NonCopyable
{
public:
    struct Options
    {
        std::string   mServiceType = NSD_CONFIG_DEFAULT_SERVICE_TYPE;
        NetworkFilter mFilter;
        bool          mUseFilter = false;
        Network       mNetwork;
        std::string   mRegisterName;
        uint16_t      mPort = 0;
        std::string   mResolveName;
        std::string   mWatchName;
        bool          mDiscover = true;
        Seconds       mDuration{0}; ///< Zero runs until a signal arrives.
    };

    explicit Application(const Options &aOptions);
    ~Application(void);

    /**
     * This method initializes the application.
     *
     * @retval NSD_ERROR_NONE  Successfully initialized.
     * @retval ...             Failed to open the netlink socket or to reach the mDNS daemon.
     *
     */
    nsdError Init(void);

    void Deinit(void);

    /**
     * This method starts the requested operations, runs the mainloop and stops them on
     * SIGINT/SIGTERM or when the duration elapsed. It returns once every operation stopped
     * or the stop grace period expired.
     *
     * @retval NSD_ERROR_NONE   All operations were started and stopped.
     * @retval NSD_ERROR_ERRNO  The mainloop failed.
     * @retval ...              An operation could not be started.
     *
     */
    nsdError Run(void);

private:
    class DiscoveryPrinter;
    class RegistrationPrinter;
    class ResolvePrinter;
    class WatchPrinter;

    nsdError StartOperations(void);
    void     StopOperations(void);
    void     RequestStop(void);
    bool     HasOutstandingOperations(void) const { return mNsdManager.GetRegistry().GetSize() > 0; }

    static void HandleSignal(int aSignal);

    static std::atomic_bool sShouldTerminate;

    Options                              mOptions;
    TaskRunner                           mTaskRunner;
    Mdns::MdnsSdRemoteService            mRemoteService;
    Host::NetlinkNetworkMonitor          mNetworkMonitor;
    NsdManager                           mNsdManager;
    std::unique_ptr<DiscoveryPrinter>    mDiscoveryPrinter;
    std::unique_ptr<RegistrationPrinter> mRegistrationPrinter;
    std::unique_ptr<ResolvePrinter>      mResolvePrinter;
    std::unique_ptr<WatchPrinter>        mWatchPrinter;
    TaskRunner::TaskId                   mDurationTask       = 0;
    TaskRunner::TaskId                   mGracePeriodTask    = 0;
    bool                                 mStopping           = false;
    bool                                 mGracePeriodExpired = false;
};

} // namespace nsd

#endif // NSD_CLIENT_APPLICATION_HPP_
