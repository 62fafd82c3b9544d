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

#include "nsd/reply.hpp"

namespace nsd {

bool IsTerminalReply(ReplyKind aKind)
{
    bool terminal = true;

    switch (aKind)
    {
    case ReplyKind::kDiscoveryStarted:
    case ReplyKind::kServiceFound:
    case ReplyKind::kServiceLost:
    case ReplyKind::kRegisterSucceeded:
    case ReplyKind::kServiceUpdated:
    case ReplyKind::kServiceUpdatedLost:
        terminal = false;
        break;

    case ReplyKind::kDiscoveryStartFailed:
    case ReplyKind::kDiscoveryStopped:
    case ReplyKind::kStopDiscoveryFailed:
    case ReplyKind::kRegisterFailed:
    case ReplyKind::kUnregisterSucceeded:
    case ReplyKind::kUnregisterFailed:
    case ReplyKind::kResolveSucceeded:
    case ReplyKind::kResolveFailed:
    case ReplyKind::kResolutionStopped:
    case ReplyKind::kStopResolutionFailed:
    case ReplyKind::kCallbackRegistrationFailed:
    case ReplyKind::kCallbackUnregistered:
        terminal = true;
        break;
    }

    return terminal;
}

ListenerKind ListenerKindOfReply(ReplyKind aKind)
{
    ListenerKind kind = ListenerKind::kDiscovery;

    switch (aKind)
    {
    case ReplyKind::kDiscoveryStarted:
    case ReplyKind::kDiscoveryStartFailed:
    case ReplyKind::kServiceFound:
    case ReplyKind::kServiceLost:
    case ReplyKind::kDiscoveryStopped:
    case ReplyKind::kStopDiscoveryFailed:
        kind = ListenerKind::kDiscovery;
        break;

    case ReplyKind::kRegisterSucceeded:
    case ReplyKind::kRegisterFailed:
    case ReplyKind::kUnregisterSucceeded:
    case ReplyKind::kUnregisterFailed:
        kind = ListenerKind::kRegistration;
        break;

    case ReplyKind::kResolveSucceeded:
    case ReplyKind::kResolveFailed:
    case ReplyKind::kResolutionStopped:
    case ReplyKind::kStopResolutionFailed:
        kind = ListenerKind::kResolve;
        break;

    case ReplyKind::kServiceUpdated:
    case ReplyKind::kServiceUpdatedLost:
    case ReplyKind::kCallbackRegistrationFailed:
    case ReplyKind::kCallbackUnregistered:
        kind = ListenerKind::kServiceInfo;
        break;
    }

    return kind;
}

std::string ReplyKindToString(ReplyKind aKind)
{
    static const char *const kNames[] = {
        "DISCOVER_SERVICES_STARTED",             // kDiscoveryStarted
        "DISCOVER_SERVICES_FAILED",              // kDiscoveryStartFailed
        "SERVICE_FOUND",                         // kServiceFound
        "SERVICE_LOST",                          // kServiceLost
        "STOP_DISCOVERY_SUCCEEDED",              // kDiscoveryStopped
        "STOP_DISCOVERY_FAILED",                 // kStopDiscoveryFailed
        "REGISTER_SERVICE_SUCCEEDED",            // kRegisterSucceeded
        "REGISTER_SERVICE_FAILED",               // kRegisterFailed
        "UNREGISTER_SERVICE_SUCCEEDED",          // kUnregisterSucceeded
        "UNREGISTER_SERVICE_FAILED",             // kUnregisterFailed
        "RESOLVE_SERVICE_SUCCEEDED",             // kResolveSucceeded
        "RESOLVE_SERVICE_FAILED",                // kResolveFailed
        "STOP_RESOLUTION_SUCCEEDED",             // kResolutionStopped
        "STOP_RESOLUTION_FAILED",                // kStopResolutionFailed
        "SERVICE_UPDATED",                       // kServiceUpdated
        "SERVICE_UPDATED_LOST",                  // kServiceUpdatedLost
        "REGISTER_SERVICE_CALLBACK_FAILED",      // kCallbackRegistrationFailed
        "UNREGISTER_SERVICE_CALLBACK_SUCCEEDED", // kCallbackUnregistered
    };

    size_t index = static_cast<size_t>(aKind);

    return index < sizeof(kNames) / sizeof(kNames[0]) ? kNames[index] : std::to_string(index);
}

} // namespace nsd
