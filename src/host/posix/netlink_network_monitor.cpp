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
 *   This file implements the netlink based network monitor.
 */

#define NSD_LOG_TAG "NETMON"

#include "host/posix/netlink_network_monitor.hpp"

#include <errno.h>
#include <inttypes.h>
#include <net/if.h>
#include <netinet/in.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <linux/netlink.h>
#include <linux/rtnetlink.h>

#include "common/logging.hpp"

namespace nsd {
namespace Host {

NetlinkNetworkMonitor::NetlinkNetworkMonitor(TaskRunner &aTaskRunner)
    : mTaskRunner(aTaskRunner)
{
}

NetlinkNetworkMonitor::~NetlinkNetworkMonitor(void)
{
    Deinit();
}

nsdError NetlinkNetworkMonitor::Init(void)
{
    nsdError           error = NSD_ERROR_NONE;
    struct sockaddr_nl addr;

    VerifyOrExit(mNetlinkSocket == -1);

    mNetlinkSocket = socket(AF_NETLINK, SOCK_DGRAM | SOCK_CLOEXEC | SOCK_NONBLOCK, NETLINK_ROUTE);
    VerifyOrExit(mNetlinkSocket != -1, error = NSD_ERROR_ERRNO);

    memset(&addr, 0, sizeof(addr));
    addr.nl_family = AF_NETLINK;
    addr.nl_groups = RTMGRP_LINK | RTMGRP_IPV4_IFADDR | RTMGRP_IPV6_IFADDR;

    if (bind(mNetlinkSocket, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) != 0)
    {
        error = NSD_ERROR_ERRNO;
        close(mNetlinkSocket);
        mNetlinkSocket = -1;
    }

exit:
    nsdLogResult(error, "Open netlink socket");
    return error;
}

void NetlinkNetworkMonitor::Deinit(void)
{
    if (mNetlinkSocket != -1)
    {
        close(mNetlinkSocket);
        mNetlinkSocket = -1;
    }
}

NetworkMonitor::SubscriptionId NetlinkNetworkMonitor::Subscribe(const NetworkFilter &aFilter,
                                                                NetworkCallback     &aCallback)
{
    SubscriptionId id = mNextId++;
    Subscription  &subscription(mSubscriptions[id]);

    subscription.mFilter   = aFilter;
    subscription.mCallback = &aCallback;

    nsdLogInfo("Subscription %" PRIu64 ": %s", id, aFilter.ToString().c_str());

    // Announces the current networks after the caller returned.
    mTaskRunner.Post([this, id]() { Refresh(id, ScanInterfaces()); });

    return id;
}

void NetlinkNetworkMonitor::Unsubscribe(SubscriptionId aId)
{
    if (mSubscriptions.erase(aId) > 0)
    {
        nsdLogInfo("Subscription %" PRIu64 " cancelled", aId);
    }
}

void NetlinkNetworkMonitor::Update(MainloopContext &aMainloop)
{
    VerifyOrExit(mNetlinkSocket != -1);
    aMainloop.AddFdToReadSet(mNetlinkSocket);

exit:
    return;
}

void NetlinkNetworkMonitor::Process(const MainloopContext &aMainloop)
{
    VerifyOrExit(mNetlinkSocket != -1);

    if (FD_ISSET(mNetlinkSocket, &aMainloop.mReadFdSet))
    {
        ReceiveNetlinkMessage();
    }

exit:
    return;
}

void NetlinkNetworkMonitor::ReceiveNetlinkMessage(void)
{
    const size_t kMaxNetlinkBufSize = 8192;
    bool         changed            = false;
    ssize_t      len;
    union
    {
        nlmsghdr mHeader;
        uint8_t  mBuffer[kMaxNetlinkBufSize];
    } msgBuffer;

    while ((len = recv(mNetlinkSocket, msgBuffer.mBuffer, sizeof(msgBuffer.mBuffer), /* flags */ 0)) > 0)
    {
        for (struct nlmsghdr *header = &msgBuffer.mHeader; NLMSG_OK(header, static_cast<size_t>(len));
             header                  = NLMSG_NEXT(header, len))
        {
            switch (header->nlmsg_type)
            {
            // Interface RUNNING changes are reported with link messages, address
            // changes usually come along with them.
            case RTM_NEWADDR:
            case RTM_DELADDR:
            case RTM_NEWLINK:
            case RTM_DELLINK:
                changed = true;
                break;
            case NLMSG_ERROR:
            {
                struct nlmsgerr *errMsg = reinterpret_cast<struct nlmsgerr *>(NLMSG_DATA(header));

                NSD_UNUSED_VARIABLE(errMsg);
                nsdLogWarning("netlink NLMSG_ERROR response: seq=%u, error=%d", header->nlmsg_seq, errMsg->error);
                break;
            }
            default:
                break;
            }
        }
    }

    if (len < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
    {
        // Events may have been dropped on overflow, rescanning covers them.
        nsdLogWarning("Failed to receive netlink message: %s", strerror(errno));
        changed = true;
    }

    if (changed)
    {
        Refresh();
    }
}

void NetlinkNetworkMonitor::Refresh(void)
{
    std::vector<Interface>      interfaces = ScanInterfaces();
    std::vector<SubscriptionId> ids;

    for (const auto &kv : mSubscriptions)
    {
        ids.push_back(kv.first);
    }

    for (SubscriptionId id : ids)
    {
        Refresh(id, interfaces);
    }
}

void NetlinkNetworkMonitor::Refresh(SubscriptionId aId, const std::vector<Interface> &aInterfaces)
{
    std::set<Network> matching;
    std::set<Network> lost;
    std::set<Network> available;
    auto              it = mSubscriptions.find(aId);

    VerifyOrExit(it != mSubscriptions.end());

    for (const Interface &interface : aInterfaces)
    {
        if (it->second.mFilter.Matches(interface.mNetwork.mName, interface.mFlags))
        {
            matching.insert(interface.mNetwork);
        }
    }

    for (const Network &network : it->second.mAnnounced)
    {
        if (matching.count(network) == 0)
        {
            lost.insert(network);
        }
    }

    for (const Network &network : matching)
    {
        if (it->second.mAnnounced.count(network) == 0)
        {
            available.insert(network);
        }
    }

    it->second.mAnnounced = matching;

    // A callback may cancel the subscription, look it up again before each call.
    for (const Network &network : lost)
    {
        it = mSubscriptions.find(aId);
        VerifyOrExit(it != mSubscriptions.end());
        nsdLogInfo("Network %s lost for subscription %" PRIu64, network.ToString().c_str(), aId);
        it->second.mCallback->HandleNetworkLost(network);
    }

    for (const Network &network : available)
    {
        it = mSubscriptions.find(aId);
        VerifyOrExit(it != mSubscriptions.end());
        nsdLogInfo("Network %s available for subscription %" PRIu64, network.ToString().c_str(), aId);
        it->second.mCallback->HandleNetworkAvailable(network);
    }

exit:
    return;
}

std::vector<NetlinkNetworkMonitor::Interface> NetlinkNetworkMonitor::ScanInterfaces(void)
{
    std::vector<Interface> interfaces;
    struct if_nameindex   *nameIndex = nullptr;
    int                    sock;

    sock = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_IP);
    VerifyOrExit(sock != -1, nsdLogWarning("Failed to create socket: %s", strerror(errno)));

    nameIndex = if_nameindex();
    VerifyOrExit(nameIndex != nullptr, nsdLogWarning("Failed to list interfaces: %s", strerror(errno)));

    for (struct if_nameindex *entry = nameIndex; entry->if_index != 0; ++entry)
    {
        struct ifreq ifReq;

        memset(&ifReq, 0, sizeof(ifReq));
        strncpy(ifReq.ifr_name, entry->if_name, sizeof(ifReq.ifr_name) - 1);

        if (ioctl(sock, SIOCGIFFLAGS, &ifReq) == -1)
        {
            nsdLogDebug("Failed to get flags of %s: %s", entry->if_name, strerror(errno));
            continue;
        }

        interfaces.push_back({Network(entry->if_index, entry->if_name), static_cast<uint16_t>(ifReq.ifr_flags)});
    }

exit:
    if (nameIndex != nullptr)
    {
        if_freenameindex(nameIndex);
    }

    if (sock != -1)
    {
        close(sock);
    }

    return interfaces;
}

} // namespace Host
} // namespace nsd
