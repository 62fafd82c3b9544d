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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "nsd/operation_registry.hpp"
#include "nsd/reply.hpp"
#include "nsd/reply_dispatcher.hpp"

#include "nsd_test_utils.hpp"

using namespace nsd;
using namespace nsd::test;
using testing::_;
using testing::AllOf;
using testing::InSequence;
using testing::Invoke;
using testing::StrictMock;

class ReplyDispatcherTest : public testing::Test
{
protected:
    ReplyDispatcherTest(void)
        : mDispatcher(mRegistry, mFlow)
    {
    }

    OperationId Allocate(ListenerKind aKind, Listener &aListener, const ServiceInfo &aInfo)
    {
        OperationId id = kInvalidOperationId;

        EXPECT_EQ(NSD_ERROR_NONE, mRegistry.Allocate(aKind, aListener, mExecutor, aInfo, id));
        return id;
    }

    static ServiceInfo MakeInfo(const std::string &aName, const std::string &aType)
    {
        ServiceInfo info;

        info.mServiceName = aName;
        info.mServiceType = aType;
        return info;
    }

    OperationRegistry mRegistry;
    FakeFlow          mFlow;
    InlineExecutor    mExecutor;
    ReplyDispatcher   mDispatcher;
};

TEST_F(ReplyDispatcherTest, RepliesAreDispatchedOnTheFlow)
{
    StrictMock<MockDiscoveryListener> listener;
    OperationId                       id = Allocate(ListenerKind::kDiscovery, listener, MakeInfo("", "_http._tcp"));

    mDispatcher.HandleReply(Reply(ReplyKind::kDiscoveryStarted, id));

    // Nothing is delivered before the flow runs.
    EXPECT_EQ(1u, mFlow.GetPendingCount());

    EXPECT_CALL(listener, OnDiscoveryStarted("_http._tcp"));
    mFlow.RunAll();
}

TEST_F(ReplyDispatcherTest, StaleReplyIsDropped)
{
    StrictMock<MockDiscoveryListener> listener;
    OperationId                       id = Allocate(ListenerKind::kDiscovery, listener, MakeInfo("", "_http._tcp"));

    mRegistry.Retire(id);

    mDispatcher.HandleReply(Reply(ReplyKind::kServiceFound, id, MakeInfo("printer", "_http._tcp")));
    mDispatcher.HandleReply(Reply(ReplyKind::kDiscoveryStopped, id));
    mDispatcher.HandleReply(Reply(ReplyKind::kServiceFound, id + 42, MakeInfo("printer", "_http._tcp")));
    mFlow.RunAll();
}

TEST_F(ReplyDispatcherTest, UnknownKindIsIgnored)
{
    StrictMock<MockDiscoveryListener> listener;
    OperationId                       id = Allocate(ListenerKind::kDiscovery, listener, MakeInfo("", "_http._tcp"));

    mDispatcher.HandleReply(Reply(static_cast<ReplyKind>(200), id));
    mFlow.RunAll();

    EXPECT_EQ(1u, mRegistry.GetSize());
}

TEST_F(ReplyDispatcherTest, MismatchedKindIsDropped)
{
    StrictMock<MockDiscoveryListener> listener;
    OperationId                       id = Allocate(ListenerKind::kDiscovery, listener, MakeInfo("", "_http._tcp"));

    mDispatcher.HandleReply(Reply(ReplyKind::kResolveSucceeded, id, MakeInfo("printer", "_http._tcp")));
    mFlow.RunAll();

    EXPECT_EQ(1u, mRegistry.GetSize());
}

TEST_F(ReplyDispatcherTest, ProgressRepliesKeepTheOperation)
{
    StrictMock<MockDiscoveryListener> listener;
    OperationId                       id = Allocate(ListenerKind::kDiscovery, listener, MakeInfo("", "_http._tcp"));

    {
        InSequence sequence;

        EXPECT_CALL(listener, OnDiscoveryStarted("_http._tcp"));
        EXPECT_CALL(listener, OnServiceFound(AllOf(HasServiceName("printer"), HasServiceType("_http._tcp"))));
        EXPECT_CALL(listener, OnServiceLost(HasServiceName("printer")));
    }

    mDispatcher.HandleReply(Reply(ReplyKind::kDiscoveryStarted, id));
    mDispatcher.HandleReply(Reply(ReplyKind::kServiceFound, id, MakeInfo("printer", "_http._tcp")));
    mDispatcher.HandleReply(Reply(ReplyKind::kServiceLost, id, MakeInfo("printer", "_http._tcp")));
    mFlow.RunAll();

    EXPECT_EQ(1u, mRegistry.GetSize());
}

TEST_F(ReplyDispatcherTest, TerminalReplyRetiresBeforeCallback)
{
    StrictMock<MockDiscoveryListener> listener;
    OperationId                       id = Allocate(ListenerKind::kDiscovery, listener, MakeInfo("", "_http._tcp"));
    OperationRegistry::Entry          entry;

    EXPECT_CALL(listener, OnDiscoveryStopped("_http._tcp")).WillOnce(Invoke([&](const std::string &) {
        EXPECT_FALSE(mRegistry.Lookup(id, entry));
    }));

    mDispatcher.HandleReply(Reply(ReplyKind::kDiscoveryStopped, id));
    mFlow.RunAll();

    // A late progress reply for the retired operation is stale.
    mDispatcher.HandleReply(Reply(ReplyKind::kServiceFound, id, MakeInfo("printer", "_http._tcp")));
    mFlow.RunAll();
}

TEST_F(ReplyDispatcherTest, FailureRepliesCarryTheRequest)
{
    StrictMock<MockRegistrationListener> listener;
    ServiceInfo                          request = MakeInfo("printer", "_ipp._tcp");
    OperationId                          id;

    request.mPort = 631;
    id            = Allocate(ListenerKind::kRegistration, listener, request);

    EXPECT_CALL(listener, OnRegistrationFailed(HasServiceName("printer"), kFailureAlreadyActive));

    mDispatcher.HandleReply(Reply(ReplyKind::kRegisterFailed, id, kFailureAlreadyActive));
    mFlow.RunAll();

    EXPECT_EQ(0u, mRegistry.GetSize());
}

TEST_F(ReplyDispatcherTest, RegistrationReportsTheRegisteredName)
{
    StrictMock<MockRegistrationListener> listener;
    ServiceInfo                          request = MakeInfo("printer", "_ipp._tcp");
    OperationId                          id      = Allocate(ListenerKind::kRegistration, listener, request);

    {
        InSequence sequence;

        EXPECT_CALL(listener, OnServiceRegistered(HasServiceName("printer (2)")));
        EXPECT_CALL(listener, OnServiceUnregistered(HasServiceName("printer")));
    }

    mDispatcher.HandleReply(Reply(ReplyKind::kRegisterSucceeded, id, MakeInfo("printer (2)", "_ipp._tcp")));
    mDispatcher.HandleReply(Reply(ReplyKind::kUnregisterSucceeded, id));
    mFlow.RunAll();

    EXPECT_EQ(0u, mRegistry.GetSize());
}

TEST_F(ReplyDispatcherTest, ResolveAndWatchReplies)
{
    StrictMock<MockResolveListener>     resolver;
    StrictMock<MockServiceInfoCallback> watcher;
    OperationId resolveId = Allocate(ListenerKind::kResolve, resolver, MakeInfo("printer", "_ipp._tcp"));
    OperationId watchId   = Allocate(ListenerKind::kServiceInfo, watcher, MakeInfo("printer", "_ipp._tcp"));
    ServiceInfo resolved  = MakeInfo("printer", "_ipp._tcp");

    resolved.mHostName = "printer.local.";
    resolved.mPort     = 631;
    resolved.mAddresses.push_back("192.0.2.7");

    {
        InSequence sequence;

        EXPECT_CALL(resolver, OnServiceResolved(HasServiceName("printer")));
        EXPECT_CALL(watcher, OnServiceUpdated(HasServiceName("printer")));
        EXPECT_CALL(watcher, OnServiceLost());
        EXPECT_CALL(watcher, OnServiceInfoCallbackUnregistered());
    }

    mDispatcher.HandleReply(Reply(ReplyKind::kResolveSucceeded, resolveId, resolved));
    mDispatcher.HandleReply(Reply(ReplyKind::kServiceUpdated, watchId, resolved));
    mDispatcher.HandleReply(Reply(ReplyKind::kServiceUpdatedLost, watchId));
    mDispatcher.HandleReply(Reply(ReplyKind::kCallbackUnregistered, watchId));
    mFlow.RunAll();

    EXPECT_EQ(0u, mRegistry.GetSize());
}

TEST(ReplyKind, ClassifiesProgressAndTerminalReplies)
{
    EXPECT_FALSE(IsTerminalReply(ReplyKind::kDiscoveryStarted));
    EXPECT_FALSE(IsTerminalReply(ReplyKind::kServiceFound));
    EXPECT_FALSE(IsTerminalReply(ReplyKind::kServiceLost));
    EXPECT_FALSE(IsTerminalReply(ReplyKind::kRegisterSucceeded));
    EXPECT_FALSE(IsTerminalReply(ReplyKind::kServiceUpdated));
    EXPECT_FALSE(IsTerminalReply(ReplyKind::kServiceUpdatedLost));

    EXPECT_TRUE(IsTerminalReply(ReplyKind::kDiscoveryStartFailed));
    EXPECT_TRUE(IsTerminalReply(ReplyKind::kDiscoveryStopped));
    EXPECT_TRUE(IsTerminalReply(ReplyKind::kStopDiscoveryFailed));
    EXPECT_TRUE(IsTerminalReply(ReplyKind::kUnregisterSucceeded));
    EXPECT_TRUE(IsTerminalReply(ReplyKind::kResolveSucceeded));
    EXPECT_TRUE(IsTerminalReply(ReplyKind::kCallbackUnregistered));
}

TEST(ReplyKind, MapsToListenerKind)
{
    EXPECT_EQ(ListenerKind::kDiscovery, ListenerKindOfReply(ReplyKind::kServiceLost));
    EXPECT_EQ(ListenerKind::kRegistration, ListenerKindOfReply(ReplyKind::kUnregisterFailed));
    EXPECT_EQ(ListenerKind::kResolve, ListenerKindOfReply(ReplyKind::kResolutionStopped));
    EXPECT_EQ(ListenerKind::kServiceInfo, ListenerKindOfReply(ReplyKind::kServiceUpdatedLost));
}

TEST(ReplyKind, ToString)
{
    EXPECT_EQ("DISCOVER_SERVICES_STARTED", ReplyKindToString(ReplyKind::kDiscoveryStarted));
    EXPECT_EQ("UNREGISTER_SERVICE_CALLBACK_SUCCEEDED", ReplyKindToString(ReplyKind::kCallbackUnregistered));
    EXPECT_EQ("200", ReplyKindToString(static_cast<ReplyKind>(200)));
}
