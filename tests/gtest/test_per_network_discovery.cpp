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

#include <memory>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "nsd/operation_registry.hpp"
#include "nsd/per_network_discovery.hpp"
#include "nsd/reply_dispatcher.hpp"

#include "nsd_test_utils.hpp"

using namespace nsd;
using namespace nsd::test;
using testing::_;
using testing::AllOf;
using testing::Invoke;
using testing::NiceMock;
using testing::StrictMock;

namespace {

const char    kServiceType[] = "_http._tcp";
const Network kNetwork1(1, "eth0");
const Network kNetwork2(2, "wlan0");

struct SentCommand
{
    Command     mCommand;
    OperationId mId;
    ServiceInfo mInfo;
};

} // namespace

class PerNetworkDiscoveryTest : public testing::Test
{
protected:
    PerNetworkDiscoveryTest(void)
        : mDispatcher(mRegistry, mFlow)
    {
        ON_CALL(mSender, SendCommand(_, _, _))
            .WillByDefault(Invoke([this](Command aCommand, OperationId aId, const ServiceInfo &aInfo) {
                mSent.push_back(SentCommand{aCommand, aId, aInfo});
            }));
    }

    void StartSession(void)
    {
        ServiceInfo info;

        info.mServiceType = kServiceType;
        ASSERT_EQ(NSD_ERROR_NONE, mRegistry.Allocate(ListenerKind::kDiscovery, mListener, mExecutor, info, mBaseId));

        mSession.reset(new PerNetworkDiscovery(PerNetworkDiscovery::Context{mRegistry, mSender, mMonitor}, mBaseId,
                                               kServiceType, NetworkFilter(), mListener, mExecutor,
                                               [this](OperationId aId) { mCompleted.push_back(aId); }));
        mSession->Start();
    }

    void DeliverReply(const Reply &aReply)
    {
        mDispatcher.HandleReply(aReply);
        mFlow.RunAll();
    }

    // Returns the id of the last command of the given type sent on the network.
    OperationId LastSentId(Command aCommand, const Network &aNetwork) const
    {
        OperationId id = kInvalidOperationId;

        for (const SentCommand &sent : mSent)
        {
            if (sent.mCommand == aCommand && sent.mInfo.mNetwork == aNetwork)
            {
                id = sent.mId;
            }
        }

        return id;
    }

    size_t CountSent(Command aCommand) const
    {
        size_t count = 0;

        for (const SentCommand &sent : mSent)
        {
            count += (sent.mCommand == aCommand) ? 1 : 0;
        }

        return count;
    }

    static ServiceInfo MakeFound(const std::string &aName)
    {
        ServiceInfo info;

        info.mServiceName = aName;
        info.mServiceType = kServiceType;
        return info;
    }

    OperationRegistry                    mRegistry;
    FakeFlow                             mFlow;
    InlineExecutor                       mExecutor;
    ReplyDispatcher                      mDispatcher;
    NiceMock<MockCommandSender>          mSender;
    FakeNetworkMonitor                   mMonitor;
    StrictMock<MockDiscoveryListener>    mListener;
    OperationId                          mBaseId = kInvalidOperationId;
    std::unique_ptr<PerNetworkDiscovery> mSession;
    std::vector<SentCommand>             mSent;
    std::vector<OperationId>             mCompleted;
};

TEST_F(PerNetworkDiscoveryTest, StartsAndStopsExactlyOnce)
{
    OperationId id1;
    OperationId id2;

    EXPECT_CALL(mListener, OnDiscoveryStarted(kServiceType)).Times(1);
    StartSession();
    EXPECT_EQ(1u, mMonitor.GetSubscriptionCount());

    mMonitor.Announce(kNetwork1);
    mMonitor.Announce(kNetwork2);
    ASSERT_EQ(2u, CountSent(Command::kDiscoverStart));

    id1 = LastSentId(Command::kDiscoverStart, kNetwork1);
    id2 = LastSentId(Command::kDiscoverStart, kNetwork2);
    EXPECT_NE(id1, id2);
    EXPECT_NE(mBaseId, id1);
    EXPECT_EQ(2u, mSession->GetDelegateCount());

    // Started replies of the delegates are not forwarded.
    DeliverReply(Reply(ReplyKind::kDiscoveryStarted, id1));
    DeliverReply(Reply(ReplyKind::kDiscoveryStarted, id2));

    mSession->RequestStop();
    EXPECT_EQ(2u, CountSent(Command::kDiscoverStop));
    EXPECT_EQ(0u, mMonitor.GetSubscriptionCount());
    EXPECT_TRUE(mCompleted.empty());

    DeliverReply(Reply(ReplyKind::kDiscoveryStopped, id1));
    EXPECT_TRUE(mCompleted.empty());
    EXPECT_EQ(1u, mSession->GetDelegateCount());

    // A failed stop also ends the delegate, it is not reported to the caller.
    EXPECT_CALL(mListener, OnDiscoveryStopped(kServiceType)).Times(1);
    DeliverReply(Reply(ReplyKind::kStopDiscoveryFailed, id2, kFailureInternalError));

    ASSERT_EQ(1u, mCompleted.size());
    EXPECT_EQ(mBaseId, mCompleted[0]);
    EXPECT_EQ(0u, mRegistry.GetSize());

    // A repeated stop is ignored.
    mSession->RequestStop();
    EXPECT_EQ(2u, CountSent(Command::kDiscoverStop));
    EXPECT_EQ(1u, mCompleted.size());
}

TEST_F(PerNetworkDiscoveryTest, NetworkLossSynthesizesLostServices)
{
    OperationId id;

    EXPECT_CALL(mListener, OnDiscoveryStarted(kServiceType));
    StartSession();

    mMonitor.Announce(kNetwork1);
    id = LastSentId(Command::kDiscoverStart, kNetwork1);
    ASSERT_NE(kInvalidOperationId, id);

    DeliverReply(Reply(ReplyKind::kDiscoveryStarted, id));

    EXPECT_CALL(mListener, OnServiceFound(AllOf(HasServiceName("printer"), HasServiceType(kServiceType),
                                                IsOnNetwork(kNetwork1.mIndex))))
        .Times(1);
    DeliverReply(Reply(ReplyKind::kServiceFound, id, MakeFound("printer")));

    EXPECT_CALL(mListener, OnServiceLost(AllOf(HasServiceName("printer"), HasServiceType(kServiceType),
                                               IsOnNetwork(kNetwork1.mIndex))))
        .Times(1);
    mMonitor.Lose(kNetwork1);
    EXPECT_EQ(id, LastSentId(Command::kDiscoverStop, kNetwork1));

    // Late replies of the lost network are not forwarded.
    DeliverReply(Reply(ReplyKind::kServiceFound, id, MakeFound("scanner")));
    DeliverReply(Reply(ReplyKind::kServiceLost, id, MakeFound("printer")));

    // The stop reply arrives after the loss.
    DeliverReply(Reply(ReplyKind::kDiscoveryStopped, id));
    EXPECT_EQ(0u, mSession->GetDelegateCount());
    EXPECT_TRUE(mCompleted.empty());

    DeliverReply(Reply(ReplyKind::kServiceFound, id, MakeFound("printer")));
    EXPECT_EQ(1u, mRegistry.GetSize());
}

TEST_F(PerNetworkDiscoveryTest, LostServiceIsNotSynthesizedAgain)
{
    OperationId id;

    EXPECT_CALL(mListener, OnDiscoveryStarted(kServiceType));
    StartSession();

    mMonitor.Announce(kNetwork1);
    id = LastSentId(Command::kDiscoverStart, kNetwork1);

    EXPECT_CALL(mListener, OnServiceFound(HasServiceName("printer")));
    EXPECT_CALL(mListener, OnServiceFound(HasServiceName("scanner")));
    DeliverReply(Reply(ReplyKind::kServiceFound, id, MakeFound("printer")));
    DeliverReply(Reply(ReplyKind::kServiceFound, id, MakeFound("scanner")));

    EXPECT_CALL(mListener, OnServiceLost(HasServiceName("printer"))).Times(1);
    DeliverReply(Reply(ReplyKind::kServiceLost, id, MakeFound("printer")));

    EXPECT_CALL(mListener, OnServiceLost(HasServiceName("scanner"))).Times(1);
    mMonitor.Lose(kNetwork1);
}

TEST_F(PerNetworkDiscoveryTest, ReappearingNetworkGetsNewDiscovery)
{
    OperationId first;
    OperationId second;

    EXPECT_CALL(mListener, OnDiscoveryStarted(kServiceType));
    StartSession();

    mMonitor.Announce(kNetwork1);
    first = LastSentId(Command::kDiscoverStart, kNetwork1);

    mMonitor.Lose(kNetwork1);
    mMonitor.Announce(kNetwork1);
    second = LastSentId(Command::kDiscoverStart, kNetwork1);

    EXPECT_NE(first, second);
    EXPECT_EQ(2u, mSession->GetDelegateCount());

    DeliverReply(Reply(ReplyKind::kDiscoveryStopped, first));
    EXPECT_EQ(1u, mSession->GetDelegateCount());

    EXPECT_CALL(mListener, OnServiceFound(AllOf(HasServiceName("printer"), IsOnNetwork(kNetwork1.mIndex))));
    DeliverReply(Reply(ReplyKind::kServiceFound, second, MakeFound("printer")));
}

TEST_F(PerNetworkDiscoveryTest, AnnouncedNetworkStartsOnce)
{
    EXPECT_CALL(mListener, OnDiscoveryStarted(kServiceType));
    StartSession();

    mMonitor.Announce(kNetwork1);
    mMonitor.Announce(kNetwork1);

    EXPECT_EQ(1u, CountSent(Command::kDiscoverStart));
    EXPECT_EQ(1u, mSession->GetDelegateCount());
}

TEST_F(PerNetworkDiscoveryTest, FailedDelegateIsDropped)
{
    OperationId id;

    EXPECT_CALL(mListener, OnDiscoveryStarted(kServiceType));
    StartSession();

    mMonitor.Announce(kNetwork1);
    id = LastSentId(Command::kDiscoverStart, kNetwork1);

    // The failure is not reported to the caller, the session goes on.
    DeliverReply(Reply(ReplyKind::kDiscoveryStartFailed, id, kFailureInternalError));
    EXPECT_EQ(0u, mSession->GetDelegateCount());
    EXPECT_TRUE(mCompleted.empty());

    EXPECT_CALL(mListener, OnDiscoveryStopped(kServiceType));
    mSession->RequestStop();
    EXPECT_EQ(0u, CountSent(Command::kDiscoverStop));
    EXPECT_EQ(1u, mCompleted.size());
}

TEST_F(PerNetworkDiscoveryTest, StopWithoutNetworksCompletesImmediately)
{
    EXPECT_CALL(mListener, OnDiscoveryStarted(kServiceType));
    StartSession();

    EXPECT_CALL(mListener, OnDiscoveryStopped(kServiceType));
    mSession->RequestStop();

    EXPECT_EQ(1u, mCompleted.size());
    EXPECT_EQ(0u, mMonitor.GetSubscriptionCount());
    EXPECT_EQ(0u, mRegistry.GetSize());
    EXPECT_TRUE(mSession->IsStopRequested());

    // Networks announced after the stop are ignored.
    mMonitor.Announce(kNetwork1);
    EXPECT_EQ(0u, CountSent(Command::kDiscoverStart));
}

TEST_F(PerNetworkDiscoveryTest, DestructionRetiresDelegates)
{
    EXPECT_CALL(mListener, OnDiscoveryStarted(kServiceType));
    StartSession();

    mMonitor.Announce(kNetwork1);
    mMonitor.Announce(kNetwork2);
    EXPECT_EQ(3u, mRegistry.GetSize());

    mSession.reset();
    EXPECT_EQ(1u, mRegistry.GetSize());
    EXPECT_EQ(0u, mMonitor.GetSubscriptionCount());
}
