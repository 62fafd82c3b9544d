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
 *   This file includes definitions of the channel sending commands to the remote service.
 */

#ifndef NSD_NSD_COMMAND_CHANNEL_HPP_
#define NSD_NSD_COMMAND_CHANNEL_HPP_

#include "nsd-client/config.h"

#include "common/code_utils.hpp"
#include "nsd/remote_service.hpp"

namespace nsd {

/**
 * This class sends commands to a remote service and turns send failures into failure replies.
 *
 */
class CommandChannel : public CommandSender, private NonCopyable
{
public:
    /**
     * This constructor initializes the channel.
     *
     * @param[in] aRemote   The remote service.
     * @param[in] aReplies  The handler synthesized replies are given to.
     *
     */
    CommandChannel(RemoteService &aRemote, ReplyHandler &aReplies);

    void SendCommand(Command aCommand, OperationId aId, const ServiceInfo &aInfo) override;

private:
    static ReplyKind FailureReplyOf(Command aCommand);

    RemoteService &mRemote;
    ReplyHandler  &mReplies;
};

} // namespace nsd

#endif // NSD_NSD_COMMAND_CHANNEL_HPP_
