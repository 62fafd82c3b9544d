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

#define NSD_LOG_TAG "COMMAND"

#include "nsd/command_channel.hpp"

#include "common/logging.hpp"

namespace nsd {

CommandChannel::CommandChannel(RemoteService &aRemote, ReplyHandler &aReplies)
    : mRemote(aRemote)
    , mReplies(aReplies)
{
}

void CommandChannel::SendCommand(Command aCommand, OperationId aId, const ServiceInfo &aInfo)
{
    nsdError error = mRemote.Send(aCommand, aId, aInfo);

    nsdLogResult(error, "Send %s for operation %u", CommandToString(aCommand), aId);
    VerifyOrExit(error != NSD_ERROR_NONE);

    // No reply will come from the remote service. A watch cannot fail to stop, it is
    // reported as unregistered.
    mReplies.HandleReply(Reply(FailureReplyOf(aCommand), aId, kFailureInternalError));

exit:
    return;
}

ReplyKind CommandChannel::FailureReplyOf(Command aCommand)
{
    ReplyKind kind = ReplyKind::kRegisterFailed;

    switch (aCommand)
    {
    case Command::kRegister:
        kind = ReplyKind::kRegisterFailed;
        break;
    case Command::kUnregister:
        kind = ReplyKind::kUnregisterFailed;
        break;
    case Command::kDiscoverStart:
        kind = ReplyKind::kDiscoveryStartFailed;
        break;
    case Command::kDiscoverStop:
        kind = ReplyKind::kStopDiscoveryFailed;
        break;
    case Command::kResolveStart:
        kind = ReplyKind::kResolveFailed;
        break;
    case Command::kResolveStop:
        kind = ReplyKind::kStopResolutionFailed;
        break;
    case Command::kWatchStart:
        kind = ReplyKind::kCallbackRegistrationFailed;
        break;
    case Command::kWatchStop:
        kind = ReplyKind::kCallbackUnregistered;
        break;
    }

    return kind;
}

} // namespace nsd
