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

#include <vector>

#include <gtest/gtest.h>

#include "mdns/remote_service_mdnssd.hpp"

using nsd::Command;
using nsd::Reply;
using nsd::ReplyKind;
using nsd::ServiceInfo;
using nsd::Mdns::MdnsSdRemoteService;

namespace {

class RecordingReplyHandler : public nsd::ReplyHandler
{
public:
    void HandleReply(Reply aReply) override { mReplies.push_back(aReply); }

    std::vector<Reply> mReplies;
};

ServiceInfo MakeInfo(void)
{
    ServiceInfo info;

    info.mServiceName = "printer";
    info.mServiceType = "_ipp._tcp";
    info.mPort        = 631;
    return info;
}

} // namespace

TEST(MdnsSdRemoteService, NotConnectedBeforeStartDaemon)
{
    MdnsSdRemoteService   service;
    RecordingReplyHandler handler;

    service.SetReplyHandler(&handler);

    EXPECT_FALSE(service.IsConnected());
    EXPECT_EQ(NSD_ERROR_REMOTE_UNAVAILABLE, service.Send(Command::kRegister, 1, MakeInfo()));
    EXPECT_EQ(NSD_ERROR_REMOTE_UNAVAILABLE, service.Send(Command::kDiscoverStart, 2, MakeInfo()));
    EXPECT_TRUE(handler.mReplies.empty());
}

TEST(MdnsSdRemoteService, StopOfUnknownOperationFails)
{
    MdnsSdRemoteService   service;
    RecordingReplyHandler handler;

    service.SetReplyHandler(&handler);

    EXPECT_EQ(NSD_ERROR_NONE, service.Send(Command::kDiscoverStop, 7, MakeInfo()));
    EXPECT_EQ(NSD_ERROR_NONE, service.Send(Command::kUnregister, 8, MakeInfo()));
    EXPECT_EQ(NSD_ERROR_NONE, service.Send(Command::kResolveStop, 9, MakeInfo()));
    EXPECT_EQ(NSD_ERROR_NONE, service.Send(Command::kWatchStop, 10, MakeInfo()));

    ASSERT_EQ(4u, handler.mReplies.size());

    EXPECT_EQ(ReplyKind::kStopDiscoveryFailed, handler.mReplies[0].mKind);
    EXPECT_EQ(7u, handler.mReplies[0].mId);
    EXPECT_EQ(nsd::kFailureOperationNotRunning, handler.mReplies[0].mErrorCode);

    EXPECT_EQ(ReplyKind::kUnregisterFailed, handler.mReplies[1].mKind);
    EXPECT_EQ(ReplyKind::kStopResolutionFailed, handler.mReplies[2].mKind);

    // A watch always ends as unregistered.
    EXPECT_EQ(ReplyKind::kCallbackUnregistered, handler.mReplies[3].mKind);
    EXPECT_EQ(10u, handler.mReplies[3].mId);
}

TEST(MdnsSdRemoteService, DnsErrorMapping)
{
    EXPECT_EQ(nsd::kFailureBadParameters, MdnsSdRemoteService::DnsErrorToFailureCode(kDNSServiceErr_BadParam));
    EXPECT_EQ(nsd::kFailureBadParameters,
              MdnsSdRemoteService::DnsErrorToFailureCode(kDNSServiceErr_BadInterfaceIndex));
    EXPECT_EQ(nsd::kFailureAlreadyActive, MdnsSdRemoteService::DnsErrorToFailureCode(kDNSServiceErr_NameConflict));
    EXPECT_EQ(nsd::kFailureInternalError, MdnsSdRemoteService::DnsErrorToFailureCode(kDNSServiceErr_Timeout));

    EXPECT_EQ(NSD_ERROR_NONE, MdnsSdRemoteService::DnsErrorToNsdError(kDNSServiceErr_NoError));
    EXPECT_EQ(NSD_ERROR_NOT_FOUND, MdnsSdRemoteService::DnsErrorToNsdError(kDNSServiceErr_NoSuchName));
    EXPECT_EQ(NSD_ERROR_DUPLICATED, MdnsSdRemoteService::DnsErrorToNsdError(kDNSServiceErr_AlreadyRegistered));
    EXPECT_EQ(NSD_ERROR_REMOTE_UNAVAILABLE,
              MdnsSdRemoteService::DnsErrorToNsdError(kDNSServiceErr_ServiceNotRunning));
    EXPECT_EQ(NSD_ERROR_MDNS, MdnsSdRemoteService::DnsErrorToNsdError(kDNSServiceErr_Unknown));
}
