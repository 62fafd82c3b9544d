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
 *   This file includes definitions of the listener interfaces callers implement.
 */

#ifndef NSD_NSD_LISTENER_HPP_
#define NSD_NSD_LISTENER_HPP_

#include "nsd-client/config.h"

#include <string>

#include <stdint.h>

#include "common/code_utils.hpp"
#include "nsd/service_info.hpp"

namespace nsd {

/**
 * Failure codes delivered to listener failure callbacks.
 *
 */
enum FailureCode : int32_t
{
    kFailureInternalError       = 0, ///< The operation failed due to an internal error.
    kFailureAlreadyActive       = 3, ///< The operation failed because it is already active.
    kFailureMaxLimit            = 4, ///< The operation failed because the maximum outstanding requests is reached.
    kFailureOperationNotRunning = 5, ///< The stop failed because the operation is not running.
    kFailureBadParameters       = 6, ///< The operation failed because of bad parameters.
};

/**
 * This function converts a failure code to a string.
 *
 */
const char *FailureCodeToString(int32_t aCode);

/**
 * The kinds of listeners an operation can be started with.
 *
 */
enum class ListenerKind : uint8_t
{
    kDiscovery,
    kRegistration,
    kResolve,
    kServiceInfo,
};

const char *ListenerKindToString(ListenerKind aKind);

/**
 * This class is the common base of all listener interfaces.
 *
 * A listener instance identifies at most one outstanding operation at a time.
 *
 */
class Listener
{
public:
    virtual ~Listener(void) = default;
};

/**
 * This interface receives the events of a service discovery.
 *
 */
class DiscoveryListener : public Listener
{
public:
    /**
     * This method is called when the discovery could not be started. No other event follows.
     *
     * @param[in] aServiceType  The service type of the discovery.
     * @param[in] aErrorCode    The failure code.
     *
     */
    virtual void OnStartDiscoveryFailed(const std::string &aServiceType, int32_t aErrorCode) = 0;

    /**
     * This method is called when stopping the discovery failed.
     *
     * @param[in] aServiceType  The service type of the discovery.
     * @param[in] aErrorCode    The failure code.
     *
     */
    virtual void OnStopDiscoveryFailed(const std::string &aServiceType, int32_t aErrorCode) = 0;

    /**
     * This method is called once the discovery is running.
     *
     * @param[in] aServiceType  The service type of the discovery.
     *
     */
    virtual void OnDiscoveryStarted(const std::string &aServiceType) = 0;

    /**
     * This method is called once the discovery stopped. It is the last event of the discovery.
     *
     * @param[in] aServiceType  The service type of the discovery.
     *
     */
    virtual void OnDiscoveryStopped(const std::string &aServiceType) = 0;

    /**
     * This method is called when a service instance appears.
     *
     * @param[in] aInfo  The service instance, with its name, type and network.
     *
     */
    virtual void OnServiceFound(const ServiceInfo &aInfo) = 0;

    /**
     * This method is called when a service instance disappears, or its network is lost.
     *
     * @param[in] aInfo  The service instance, with its name, type and network.
     *
     */
    virtual void OnServiceLost(const ServiceInfo &aInfo) = 0;
};

/**
 * This interface receives the events of a service registration.
 *
 */
class RegistrationListener : public Listener
{
public:
    /**
     * This method is called when the service could not be registered. No other event follows.
     *
     * @param[in] aInfo       The service requested to be registered.
     * @param[in] aErrorCode  The failure code.
     *
     */
    virtual void OnRegistrationFailed(const ServiceInfo &aInfo, int32_t aErrorCode) = 0;

    /**
     * This method is called when the service could not be unregistered.
     *
     * @param[in] aInfo       The registered service.
     * @param[in] aErrorCode  The failure code.
     *
     */
    virtual void OnUnregistrationFailed(const ServiceInfo &aInfo, int32_t aErrorCode) = 0;

    /**
     * This method is called once the service is registered.
     *
     * @param[in] aInfo  The registered service, its name may differ from the requested one after a conflict.
     *
     */
    virtual void OnServiceRegistered(const ServiceInfo &aInfo) = 0;

    /**
     * This method is called once the service is unregistered. It is the last event of the registration.
     *
     * @param[in] aInfo  The service requested to be registered.
     *
     */
    virtual void OnServiceUnregistered(const ServiceInfo &aInfo) = 0;
};

/**
 * This interface receives the result of a service resolution.
 *
 */
class ResolveListener : public Listener
{
public:
    /**
     * This method is called when the service could not be resolved.
     *
     * @param[in] aInfo       The service requested to be resolved.
     * @param[in] aErrorCode  The failure code.
     *
     */
    virtual void OnResolveFailed(const ServiceInfo &aInfo, int32_t aErrorCode) = 0;

    /**
     * This method is called when the service is resolved.
     *
     * @param[in] aInfo  The resolved service with its host, port, addresses and TXT attributes.
     *
     */
    virtual void OnServiceResolved(const ServiceInfo &aInfo) = 0;

    /**
     * This method is called when a resolution was stopped with `StopServiceResolution()`.
     *
     * @param[in] aInfo  The service requested to be resolved.
     *
     */
    virtual void OnResolutionStopped(const ServiceInfo &aInfo) { NSD_UNUSED_VARIABLE(aInfo); }

    /**
     * This method is called when stopping a resolution failed.
     *
     * @param[in] aInfo       The service requested to be resolved.
     * @param[in] aErrorCode  The failure code.
     *
     */
    virtual void OnStopResolutionFailed(const ServiceInfo &aInfo, int32_t aErrorCode)
    {
        NSD_UNUSED_VARIABLE(aInfo);
        NSD_UNUSED_VARIABLE(aErrorCode);
    }
};

/**
 * This interface receives the updates of a watched service.
 *
 */
class ServiceInfoCallback : public Listener
{
public:
    /**
     * This method is called when the watch could not be started, or failed later. No other event follows.
     *
     * @param[in] aErrorCode  The failure code.
     *
     */
    virtual void OnServiceInfoCallbackRegistrationFailed(int32_t aErrorCode) = 0;

    /**
     * This method is called whenever the watched service is resolved again with new data.
     *
     * @param[in] aInfo  The resolved service with its host, port, addresses and TXT attributes.
     *
     */
    virtual void OnServiceUpdated(const ServiceInfo &aInfo) = 0;

    /**
     * This method is called when the watched service disappears.
     *
     */
    virtual void OnServiceLost(void) = 0;

    /**
     * This method is called once the watch is stopped. It is the last event of the watch.
     *
     */
    virtual void OnServiceInfoCallbackUnregistered(void) = 0;
};

} // namespace nsd

#endif // NSD_NSD_LISTENER_HPP_
