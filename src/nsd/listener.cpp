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

#include "nsd/listener.hpp"

namespace nsd {

const char *FailureCodeToString(int32_t aCode)
{
    const char *str;

    switch (aCode)
    {
    case kFailureInternalError:
        str = "INTERNAL_ERROR";
        break;
    case kFailureAlreadyActive:
        str = "ALREADY_ACTIVE";
        break;
    case kFailureMaxLimit:
        str = "MAX_LIMIT";
        break;
    case kFailureOperationNotRunning:
        str = "OPERATION_NOT_RUNNING";
        break;
    case kFailureBadParameters:
        str = "BAD_PARAMETERS";
        break;
    default:
        str = "UNKNOWN";
        break;
    }

    return str;
}

const char *ListenerKindToString(ListenerKind aKind)
{
    const char *str = "";

    switch (aKind)
    {
    case ListenerKind::kDiscovery:
        str = "discovery";
        break;
    case ListenerKind::kRegistration:
        str = "registration";
        break;
    case ListenerKind::kResolve:
        str = "resolve";
        break;
    case ListenerKind::kServiceInfo:
        str = "service-info";
        break;
    }

    return str;
}

} // namespace nsd
