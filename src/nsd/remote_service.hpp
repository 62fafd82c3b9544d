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
 *   This file includes definitions of the remote discovery service the client talks to.
 */

#ifndef NSD_NSD_REMOTE_SERVICE_HPP_
#define NSD_NSD_REMOTE_SERVICE_HPP_

#include "nsd-client/config.h"

#include <stdint.h>

#include "common/types.hpp"
#include "nsd/reply.hpp"
#include "nsd/service_info.hpp"

namespace nsd {

/**
 * The commands sent to the remote service.
 *
 */
enum class Command : uint8_t
{
    kRegister,
    kUnregister,
    kDiscoverStart,
    kDiscoverStop,
    kResolveStart,
    kResolveStop,
    kWatchStart,
    kWatchStop,
};

const char *CommandToString(Command aCommand);

/**
 * This interface represents the discovery daemon.
 *
 * Every command is answered asynchronously through the `ReplyHandler`, tagged with
 * the operation id the command was sent with.
 *
 */
class RemoteService
{
public:
    virtual ~RemoteService(void) = default;

    /**
     * This method sets the handler that receives every reply.
     *
     * @param[in] aHandler  The reply handler, nullptr to detach.
     *
     */
    virtual void SetReplyHandler(ReplyHandler *aHandler) = 0;

    /**
     * This method tells whether the remote service can currently be reached.
     *
     */
    virtual bool IsConnected(void) const = 0;

    /**
     * This method asks the remote service to start, if it is started on demand.
     *
     * @retval NSD_ERROR_NONE  Successfully requested.
     * @retval ...             The daemon could not be started.
     *
     */
    virtual nsdError StartDaemon(void) = 0;

    /**
     * This method sends one command.
     *
     * @param[in] aCommand  The command.
     * @param[in] aId       The operation the command belongs to.
     * @param[in] aInfo     The service descriptor of the operation.
     *
     * @retval NSD_ERROR_NONE  The command was accepted, a reply will follow.
     * @retval ...             The command could not be sent, no reply will follow.
     *
     */
    virtual nsdError Send(Command aCommand, OperationId aId, const ServiceInfo &aInfo) = 0;
};

/**
 * This interface sends commands on behalf of operations.
 *
 * A command that cannot be sent is answered with a synthesized failure reply, so every
 * operation still receives its asynchronous outcome.
 *
 */
class CommandSender
{
public:
    virtual ~CommandSender(void) = default;

    /**
     * This method sends one command, it must run on the serialized flow.
     *
     * @param[in] aCommand  The command.
     * @param[in] aId       The operation the command belongs to.
     * @param[in] aInfo     The service descriptor of the operation.
     *
     */
    virtual void SendCommand(Command aCommand, OperationId aId, const ServiceInfo &aInfo) = 0;
};

} // namespace nsd

#endif // NSD_NSD_REMOTE_SERVICE_HPP_
