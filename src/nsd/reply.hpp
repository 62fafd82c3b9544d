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
 *   This file includes definitions of the replies sent back by the remote service.
 */

#ifndef NSD_NSD_REPLY_HPP_
#define NSD_NSD_REPLY_HPP_

#include "nsd-client/config.h"

#include <string>
#include <utility>

#include <stdint.h>

#include "nsd/listener.hpp"
#include "nsd/service_info.hpp"

namespace nsd {

/**
 * The kinds of replies the remote service sends.
 *
 */
enum class ReplyKind : uint8_t
{
    kDiscoveryStarted,           ///< Discovery started.
    kDiscoveryStartFailed,       ///< Discovery failed to start.
    kServiceFound,               ///< A service was found.
    kServiceLost,                ///< A service was lost.
    kDiscoveryStopped,           ///< Discovery stopped.
    kStopDiscoveryFailed,        ///< Discovery failed to stop.
    kRegisterSucceeded,          ///< The service was registered.
    kRegisterFailed,             ///< The service failed to register.
    kUnregisterSucceeded,        ///< The service was unregistered.
    kUnregisterFailed,           ///< The service failed to unregister.
    kResolveSucceeded,           ///< The service was resolved.
    kResolveFailed,              ///< The service failed to resolve.
    kResolutionStopped,          ///< The resolution was stopped.
    kStopResolutionFailed,       ///< The resolution failed to stop.
    kServiceUpdated,             ///< The watched service was updated.
    kServiceUpdatedLost,         ///< The watched service was lost.
    kCallbackRegistrationFailed, ///< The watch failed to start.
    kCallbackUnregistered,       ///< The watch stopped.
};

/**
 * This structure represents one asynchronous reply.
 *
 */
struct Reply
{
    ReplyKind   mKind;          ///< The reply kind.
    OperationId mId;            ///< The operation the reply belongs to.
    int32_t     mErrorCode = 0; ///< The failure code, for failure kinds.
    ServiceInfo mInfo;          ///< The payload, for found/lost/registered/resolved/updated kinds.

    Reply(ReplyKind aKind, OperationId aId)
        : mKind(aKind)
        , mId(aId)
    {
    }

    Reply(ReplyKind aKind, OperationId aId, int32_t aErrorCode)
        : mKind(aKind)
        , mId(aId)
        , mErrorCode(aErrorCode)
    {
    }

    Reply(ReplyKind aKind, OperationId aId, ServiceInfo aInfo)
        : mKind(aKind)
        , mId(aId)
        , mInfo(std::move(aInfo))
    {
    }
};

/**
 * This interface receives the replies of the remote service, from any thread.
 *
 */
class ReplyHandler
{
public:
    virtual ~ReplyHandler(void) = default;

    /**
     * This method handles one reply.
     *
     * @param[in] aReply  The reply.
     *
     */
    virtual void HandleReply(Reply aReply) = 0;
};

/**
 * This function tells whether a reply kind ends the operation it belongs to.
 *
 * @param[in]  aKind  The reply kind.
 *
 * @returns TRUE for terminal kinds (success and failure), FALSE for progress kinds.
 *
 */
bool IsTerminalReply(ReplyKind aKind);

/**
 * This function returns the listener kind a reply kind is delivered to.
 *
 */
ListenerKind ListenerKindOfReply(ReplyKind aKind);

/**
 * This function returns the event name of a reply kind, or its numeric value if it is not known.
 *
 */
std::string ReplyKindToString(ReplyKind aKind);

} // namespace nsd

#endif // NSD_NSD_REPLY_HPP_
