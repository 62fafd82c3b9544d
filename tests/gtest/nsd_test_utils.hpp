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
 *   This file includes the fakes and mocks shared by the nsd tests.
 */

#ifndef NSD_TESTS_GTEST_NSD_TEST_UTILS_HPP_
#define NSD_TESTS_GTEST_NSD_TEST_UTILS_HPP_

#include <deque>
#include <map>
#include <string>

#include <gmock/gmock.h>

#include "common/executor.hpp"
#include "nsd/listener.hpp"
#include "nsd/network_monitor.hpp"
#include "nsd/remote_service.hpp"
#include "nsd/reply.hpp"

namespace nsd {
namespace test {

/**
 * This executor queues the tasks until the test runs them.
 *
 */
class FakeFlow : public Executor
{
public:
    void Execute(Task aTask) override { mTasks.push_back(std::move(aTask)); }

    // Runs the queued tasks, including the tasks they queue, and returns how many ran.
    size_t RunAll(void)
    {
        size_t count = 0;

        while (!mTasks.empty())
        {
            Task task = std::move(mTasks.front());

            mTasks.pop_front();
            task();
            ++count;
        }

        return count;
    }

    size_t GetPendingCount(void) const { return mTasks.size(); }

private:
    std::deque<Task> mTasks;
};

class MockRemoteService : public RemoteService
{
public:
    MockRemoteService(void)
    {
        ON_CALL(*this, SetReplyHandler(testing::_)).WillByDefault(testing::SaveArg<0>(&mReplyHandler));
        ON_CALL(*this, IsConnected()).WillByDefault(testing::Return(true));
        ON_CALL(*this, StartDaemon()).WillByDefault(testing::Return(NSD_ERROR_NONE));
        ON_CALL(*this, Send(testing::_, testing::_, testing::_)).WillByDefault(testing::Return(NSD_ERROR_NONE));
    }

    MOCK_METHOD(void, SetReplyHandler, (ReplyHandler * aHandler), (override));
    MOCK_METHOD(bool, IsConnected, (), (const, override));
    MOCK_METHOD(nsdError, StartDaemon, (), (override));
    MOCK_METHOD(nsdError, Send, (Command aCommand, OperationId aId, const ServiceInfo &aInfo), (override));

    // Delivers a reply as the remote service would.
    void DeliverReply(const Reply &aReply) { mReplyHandler->HandleReply(aReply); }

    ReplyHandler *mReplyHandler = nullptr;
};

class MockCommandSender : public CommandSender
{
public:
    MOCK_METHOD(void, SendCommand, (Command aCommand, OperationId aId, const ServiceInfo &aInfo), (override));
};

/**
 * This network monitor lets the test announce networks.
 *
 */
class FakeNetworkMonitor : public NetworkMonitor
{
public:
    SubscriptionId Subscribe(const NetworkFilter &aFilter, NetworkCallback &aCallback) override
    {
        SubscriptionId id = mNextId++;

        mSubscriptions[id] = Subscription{aFilter, &aCallback};
        return id;
    }

    void Unsubscribe(SubscriptionId aId) override { mSubscriptions.erase(aId); }

    void Announce(const Network &aNetwork)
    {
        std::map<SubscriptionId, Subscription> subscriptions = mSubscriptions;

        for (auto &kv : subscriptions)
        {
            kv.second.mCallback->HandleNetworkAvailable(aNetwork);
        }
    }

    void Lose(const Network &aNetwork)
    {
        std::map<SubscriptionId, Subscription> subscriptions = mSubscriptions;

        for (auto &kv : subscriptions)
        {
            kv.second.mCallback->HandleNetworkLost(aNetwork);
        }
    }

    size_t GetSubscriptionCount(void) const { return mSubscriptions.size(); }

private:
    struct Subscription
    {
        NetworkFilter    mFilter;
        NetworkCallback *mCallback;
    };

    SubscriptionId                         mNextId = 1;
    std::map<SubscriptionId, Subscription> mSubscriptions;
};

class MockDiscoveryListener : public DiscoveryListener
{
public:
    MOCK_METHOD(void, OnStartDiscoveryFailed, (const std::string &aServiceType, int32_t aErrorCode), (override));
    MOCK_METHOD(void, OnStopDiscoveryFailed, (const std::string &aServiceType, int32_t aErrorCode), (override));
    MOCK_METHOD(void, OnDiscoveryStarted, (const std::string &aServiceType), (override));
    MOCK_METHOD(void, OnDiscoveryStopped, (const std::string &aServiceType), (override));
    MOCK_METHOD(void, OnServiceFound, (const ServiceInfo &aInfo), (override));
    MOCK_METHOD(void, OnServiceLost, (const ServiceInfo &aInfo), (override));
};

class MockRegistrationListener : public RegistrationListener
{
public:
    MOCK_METHOD(void, OnRegistrationFailed, (const ServiceInfo &aInfo, int32_t aErrorCode), (override));
    MOCK_METHOD(void, OnUnregistrationFailed, (const ServiceInfo &aInfo, int32_t aErrorCode), (override));
    MOCK_METHOD(void, OnServiceRegistered, (const ServiceInfo &aInfo), (override));
    MOCK_METHOD(void, OnServiceUnregistered, (const ServiceInfo &aInfo), (override));
};

class MockResolveListener : public ResolveListener
{
public:
    MOCK_METHOD(void, OnResolveFailed, (const ServiceInfo &aInfo, int32_t aErrorCode), (override));
    MOCK_METHOD(void, OnServiceResolved, (const ServiceInfo &aInfo), (override));
    MOCK_METHOD(void, OnResolutionStopped, (const ServiceInfo &aInfo), (override));
    MOCK_METHOD(void, OnStopResolutionFailed, (const ServiceInfo &aInfo, int32_t aErrorCode), (override));
};

class MockServiceInfoCallback : public ServiceInfoCallback
{
public:
    MOCK_METHOD(void, OnServiceInfoCallbackRegistrationFailed, (int32_t aErrorCode), (override));
    MOCK_METHOD(void, OnServiceUpdated, (const ServiceInfo &aInfo), (override));
    MOCK_METHOD(void, OnServiceLost, (), (override));
    MOCK_METHOD(void, OnServiceInfoCallbackUnregistered, (), (override));
};

MATCHER_P(HasServiceName, aName, "")
{
    return arg.mServiceName == aName;
}

MATCHER_P(IsOnNetwork, aIndex, "")
{
    return arg.mNetwork.mIndex == static_cast<uint32_t>(aIndex);
}

MATCHER_P(HasServiceType, aType, "")
{
    return arg.mServiceType == aType;
}

} // namespace test
} // namespace nsd

#endif // NSD_TESTS_GTEST_NSD_TEST_UTILS_HPP_
