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

#include <algorithm>
#include <vector>

#include <net/if.h>

#include <gtest/gtest.h>

#include "common/task_runner.hpp"
#include "host/posix/netlink_network_monitor.hpp"
#include "nsd/network_monitor.hpp"

using nsd::NetworkFilter;
using nsd::Host::NetlinkNetworkMonitor;

static const unsigned int kUsableFlags = IFF_UP | IFF_RUNNING | IFF_MULTICAST;

TEST(NetworkFilter, DefaultMatchesRunningMulticastInterfaces)
{
    NetworkFilter filter;

    EXPECT_TRUE(filter.Matches("eth0", kUsableFlags));
    EXPECT_TRUE(filter.Matches("wlan0", kUsableFlags | IFF_BROADCAST));
    EXPECT_FALSE(filter.Matches("eth0", IFF_UP | IFF_MULTICAST));
    EXPECT_FALSE(filter.Matches("eth0", IFF_UP | IFF_RUNNING));
    EXPECT_FALSE(filter.Matches("lo", kUsableFlags | IFF_LOOPBACK));
}

TEST(NetworkFilter, NamePatterns)
{
    NetworkFilter filter;

    filter.mNamePatterns.push_back("eth*");
    filter.mNamePatterns.push_back("wlan[01]");

    EXPECT_TRUE(filter.Matches("eth0", kUsableFlags));
    EXPECT_TRUE(filter.Matches("eth12", kUsableFlags));
    EXPECT_TRUE(filter.Matches("wlan1", kUsableFlags));
    EXPECT_FALSE(filter.Matches("wlan2", kUsableFlags));
    EXPECT_FALSE(filter.Matches("wpan0", kUsableFlags));

    // The name must match and the flags must be acceptable.
    EXPECT_FALSE(filter.Matches("eth0", IFF_UP));
}

TEST(NetworkFilter, RelaxedRequirements)
{
    NetworkFilter filter;

    filter.mRequireRunning   = false;
    filter.mRequireMulticast = false;
    filter.mIncludeLoopback  = true;

    EXPECT_TRUE(filter.Matches("lo", IFF_LOOPBACK));
    EXPECT_TRUE(filter.Matches("eth0", 0));
}

TEST(NetworkFilter, ToString)
{
    NetworkFilter filter;

    filter.mNamePatterns.push_back("eth*");
    filter.mNamePatterns.push_back("usb0");

    EXPECT_EQ("names=[eth*,usb0] running multicast", filter.ToString());
}

TEST(NetlinkNetworkMonitor, ScanInterfacesFindsLoopback)
{
    std::vector<NetlinkNetworkMonitor::Interface> interfaces = NetlinkNetworkMonitor::ScanInterfaces();
    auto                                          loopback   = std::find_if(
        interfaces.begin(), interfaces.end(),
        [](const NetlinkNetworkMonitor::Interface &aInterface) { return (aInterface.mFlags & IFF_LOOPBACK) != 0; });

    ASSERT_NE(interfaces.end(), loopback);
    EXPECT_NE(0u, loopback->mNetwork.mIndex);
    EXPECT_FALSE(loopback->mNetwork.mName.empty());
    EXPECT_FALSE(NetworkFilter().Matches(loopback->mNetwork.mName, loopback->mFlags));
}

namespace {

class RecordingCallback : public nsd::NetworkCallback
{
public:
    void HandleNetworkAvailable(const nsd::Network &aNetwork) override { mAvailable.push_back(aNetwork); }
    void HandleNetworkLost(const nsd::Network &aNetwork) override { mLost.push_back(aNetwork); }

    std::vector<nsd::Network> mAvailable;
    std::vector<nsd::Network> mLost;
};

void RunTasks(nsd::TaskRunner &aTaskRunner)
{
    nsd::MainloopContext mainloop;

    mainloop.Reset(nsd::Seconds(1));
    aTaskRunner.Update(mainloop);
    if (select(mainloop.mMaxFd + 1, &mainloop.mReadFdSet, &mainloop.mWriteFdSet, &mainloop.mErrorFdSet,
               &mainloop.mTimeout) >= 0)
    {
        aTaskRunner.Process(mainloop);
    }
}

NetworkFilter LoopbackFilter(void)
{
    NetworkFilter filter;

    filter.mNamePatterns.push_back("lo");
    filter.mRequireRunning   = false;
    filter.mRequireMulticast = false;
    filter.mIncludeLoopback  = true;

    return filter;
}

} // namespace

TEST(NetlinkNetworkMonitor, AnnouncesAfterSubscribe)
{
    nsd::TaskRunner                       taskRunner;
    NetlinkNetworkMonitor                 monitor(taskRunner);
    RecordingCallback                     callback;
    NetlinkNetworkMonitor::SubscriptionId id;

    id = monitor.Subscribe(LoopbackFilter(), callback);
    EXPECT_NE(0u, id);

    // Nothing is announced from inside Subscribe().
    EXPECT_TRUE(callback.mAvailable.empty());

    RunTasks(taskRunner);
    ASSERT_EQ(1u, callback.mAvailable.size());
    EXPECT_EQ("lo", callback.mAvailable[0].mName);
    EXPECT_TRUE(callback.mLost.empty());

    monitor.Unsubscribe(id);
}

TEST(NetlinkNetworkMonitor, NoAnnouncementAfterUnsubscribe)
{
    nsd::TaskRunner       taskRunner;
    NetlinkNetworkMonitor monitor(taskRunner);
    RecordingCallback     callback;

    monitor.Unsubscribe(monitor.Subscribe(LoopbackFilter(), callback));
    RunTasks(taskRunner);

    EXPECT_TRUE(callback.mAvailable.empty());
}
