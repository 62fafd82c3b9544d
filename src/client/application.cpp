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
 *   This file implements the nsd-client application.
 */

#define NSD_LOG_TAG "APP"

#include "client/application.hpp"

#include <errno.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <sys/select.h>

#include "common/logging.hpp"
#include "common/mainloop_manager.hpp"

namespace nsd {

static void PrintEvent(const char *aEvent, const std::string &aDetail)
{
    printf("%-24s %s\n", aEvent, aDetail.c_str());
    fflush(stdout);
}

static void PrintFailure(const char *aEvent, const std::string &aDetail, int32_t aErrorCode)
{
    printf("%-24s %s: %s\n", aEvent, aDetail.c_str(), FailureCodeToString(aErrorCode));
    fflush(stdout);
}

class Application::DiscoveryPrinter : public DiscoveryListener
{
public:
    void OnStartDiscoveryFailed(const std::string &aServiceType, int32_t aErrorCode) override
    {
        PrintFailure("DISCOVERY START FAILED", aServiceType, aErrorCode);
    }

    void OnStopDiscoveryFailed(const std::string &aServiceType, int32_t aErrorCode) override
    {
        PrintFailure("DISCOVERY STOP FAILED", aServiceType, aErrorCode);
    }

    void OnDiscoveryStarted(const std::string &aServiceType) override { PrintEvent("DISCOVERY STARTED", aServiceType); }
    void OnDiscoveryStopped(const std::string &aServiceType) override { PrintEvent("DISCOVERY STOPPED", aServiceType); }
    void OnServiceFound(const ServiceInfo &aInfo) override { PrintEvent("SERVICE FOUND", aInfo.ToString()); }
    void OnServiceLost(const ServiceInfo &aInfo) override { PrintEvent("SERVICE LOST", aInfo.ToString()); }
};

class Application::RegistrationPrinter : public RegistrationListener
{
public:
    void OnRegistrationFailed(const ServiceInfo &aInfo, int32_t aErrorCode) override
    {
        PrintFailure("REGISTRATION FAILED", aInfo.mServiceName, aErrorCode);
    }

    void OnUnregistrationFailed(const ServiceInfo &aInfo, int32_t aErrorCode) override
    {
        PrintFailure("UNREGISTRATION FAILED", aInfo.mServiceName, aErrorCode);
    }

    void OnServiceRegistered(const ServiceInfo &aInfo) override { PrintEvent("SERVICE REGISTERED", aInfo.ToString()); }
    void OnServiceUnregistered(const ServiceInfo &aInfo) override
    {
        PrintEvent("SERVICE UNREGISTERED", aInfo.mServiceName);
    }
};

class Application::ResolvePrinter : public ResolveListener
{
public:
    void OnResolveFailed(const ServiceInfo &aInfo, int32_t aErrorCode) override
    {
        PrintFailure("RESOLVE FAILED", aInfo.mServiceName, aErrorCode);
    }

    void OnServiceResolved(const ServiceInfo &aInfo) override { PrintEvent("SERVICE RESOLVED", aInfo.ToString()); }
    void OnResolutionStopped(const ServiceInfo &aInfo) override { PrintEvent("RESOLUTION STOPPED", aInfo.mServiceName); }
};

class Application::WatchPrinter : public ServiceInfoCallback
{
public:
    void OnServiceInfoCallbackRegistrationFailed(int32_t aErrorCode) override
    {
        PrintFailure("WATCH FAILED", "", aErrorCode);
    }

    void OnServiceUpdated(const ServiceInfo &aInfo) override { PrintEvent("SERVICE UPDATED", aInfo.ToString()); }
    void OnServiceLost(void) override { PrintEvent("SERVICE UPDATED LOST", ""); }
    void OnServiceInfoCallbackUnregistered(void) override { PrintEvent("WATCH STOPPED", ""); }
};

std::atomic_bool Application::sShouldTerminate(false);

Application::Application(const Options &aOptions)
    : mOptions(aOptions)
    , mNetworkMonitor(mTaskRunner)
    , mNsdManager(mRemoteService, mNetworkMonitor, mTaskRunner)
    , mDiscoveryPrinter(MakeUnique<DiscoveryPrinter>())
    , mRegistrationPrinter(MakeUnique<RegistrationPrinter>())
    , mResolvePrinter(MakeUnique<ResolvePrinter>())
    , mWatchPrinter(MakeUnique<WatchPrinter>())
{
}

Application::~Application(void) = default;

nsdError Application::Init(void)
{
    nsdError error = NSD_ERROR_NONE;

    SuccessOrExit(error = mNetworkMonitor.Init());
    SuccessOrExit(error = mNsdManager.StartDaemon());

    MainloopManager::GetInstance().AddMainloopProcessor(&mTaskRunner);
    MainloopManager::GetInstance().AddMainloopProcessor(&mRemoteService);
    MainloopManager::GetInstance().AddMainloopProcessor(&mNetworkMonitor);

exit:
    nsdLogResult(error, "Initialize application");
    return error;
}

void Application::Deinit(void)
{
    MainloopManager::GetInstance().RemoveMainloopProcessor(&mNetworkMonitor);
    MainloopManager::GetInstance().RemoveMainloopProcessor(&mRemoteService);
    MainloopManager::GetInstance().RemoveMainloopProcessor(&mTaskRunner);

    mNetworkMonitor.Deinit();
}

nsdError Application::StartOperations(void)
{
    nsdError    error = NSD_ERROR_NONE;
    ServiceInfo info;

    info.mServiceType = mOptions.mServiceType;
    info.mNetwork     = mOptions.mNetwork;

    if (!mOptions.mRegisterName.empty())
    {
        ServiceInfo registration = info;

        registration.mServiceName = mOptions.mRegisterName;
        registration.mPort        = mOptions.mPort;
        SuccessOrExit(
            error = mNsdManager.RegisterService(registration, kProtocolDnsSd, mTaskRunner, *mRegistrationPrinter));
    }

    if (mOptions.mDiscover)
    {
        if (mOptions.mUseFilter)
        {
            error = mNsdManager.DiscoverServices(mOptions.mServiceType, kProtocolDnsSd, mOptions.mFilter, mTaskRunner,
                                                 *mDiscoveryPrinter);
        }
        else
        {
            error = mNsdManager.DiscoverServices(mOptions.mServiceType, kProtocolDnsSd, mOptions.mNetwork,
                                                 mTaskRunner, *mDiscoveryPrinter);
        }
        SuccessOrExit(error);
    }

    if (!mOptions.mResolveName.empty())
    {
        ServiceInfo resolution = info;

        resolution.mServiceName = mOptions.mResolveName;
        SuccessOrExit(error = mNsdManager.ResolveService(resolution, mTaskRunner, *mResolvePrinter));
    }

    if (!mOptions.mWatchName.empty())
    {
        ServiceInfo watch = info;

        watch.mServiceName = mOptions.mWatchName;
        SuccessOrExit(error = mNsdManager.RegisterServiceInfoCallback(watch, mTaskRunner, *mWatchPrinter));
    }

exit:
    nsdLogResult(error, "Start operations");
    return error;
}

void Application::StopOperations(void)
{
    nsdError error;

    // Operations which already ended, or were never started, are not registered anymore.
    if ((error = mNsdManager.UnregisterService(*mRegistrationPrinter)) != NSD_ERROR_NOT_FOUND)
    {
        nsdLogResult(error, "Unregister service");
    }

    if ((error = mNsdManager.StopServiceDiscovery(*mDiscoveryPrinter)) != NSD_ERROR_NOT_FOUND)
    {
        nsdLogResult(error, "Stop service discovery");
    }

    if ((error = mNsdManager.StopServiceResolution(*mResolvePrinter)) != NSD_ERROR_NOT_FOUND)
    {
        nsdLogResult(error, "Stop service resolution");
    }

    if ((error = mNsdManager.UnregisterServiceInfoCallback(*mWatchPrinter)) != NSD_ERROR_NOT_FOUND)
    {
        nsdLogResult(error, "Unregister service info callback");
    }
}

void Application::RequestStop(void)
{
    VerifyOrExit(!mStopping);

    nsdLogNotice("Stopping all operations");
    mStopping = true;
    mTaskRunner.Cancel(mDurationTask);
    StopOperations();

    mGracePeriodTask = mTaskRunner.Post(Seconds(NSD_CONFIG_STOP_GRACE_PERIOD), [this]() {
        mGracePeriodTask    = 0;
        mGracePeriodExpired = true;
        nsdLogWarning("%zu operations did not stop in time", mNsdManager.GetRegistry().GetSize());
    });

exit:
    return;
}

nsdError Application::Run(void)
{
    nsdError error = NSD_ERROR_NONE;

    // allow quitting elegantly
    signal(SIGTERM, HandleSignal);
    signal(SIGINT, HandleSignal);

    if (mOptions.mDuration.count() > 0)
    {
        mDurationTask = mTaskRunner.Post(mOptions.mDuration, [this]() {
            mDurationTask = 0;
            RequestStop();
        });
    }

    // Operations started before a failing one are still stopped gracefully.
    error = StartOperations();
    if (error != NSD_ERROR_NONE)
    {
        RequestStop();
    }

    while (!mStopping || (HasOutstandingOperations() && !mGracePeriodExpired))
    {
        MainloopContext mainloop;
        int             rval;

        mainloop.Reset(Seconds(NSD_CONFIG_MAX_POLL_TIMEOUT));
        MainloopManager::GetInstance().Update(mainloop);

        rval = select(mainloop.mMaxFd + 1, &mainloop.mReadFdSet, &mainloop.mWriteFdSet, &mainloop.mErrorFdSet,
                      &mainloop.mTimeout);

        if (rval >= 0)
        {
            MainloopManager::GetInstance().Process(mainloop);
        }
        else if (errno != EINTR)
        {
            error = NSD_ERROR_ERRNO;
            nsdLogCrit("select() failed: %s", strerror(errno));
            break;
        }

        if (sShouldTerminate)
        {
            RequestStop();
        }
    }

    mTaskRunner.Cancel(mDurationTask);
    mTaskRunner.Cancel(mGracePeriodTask);

    return error;
}

void Application::HandleSignal(int aSignal)
{
    sShouldTerminate = true;
    signal(aSignal, SIG_DFL);
}

} // namespace nsd
