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
 *   This file includes definitions of the dispatcher delivering replies to listeners.
 */

#ifndef NSD_NSD_REPLY_DISPATCHER_HPP_
#define NSD_NSD_REPLY_DISPATCHER_HPP_

#include "nsd-client/config.h"

#include "common/code_utils.hpp"
#include "common/executor.hpp"
#include "nsd/operation_registry.hpp"
#include "nsd/reply.hpp"

namespace nsd {

/**
 * This class delivers the replies of the remote service to the listeners of their operations.
 *
 * Replies may be handed over from any thread. They are processed one at a time, in arrival
 * order, on the serialized flow given at construction.
 *
 */
class ReplyDispatcher : public ReplyHandler, private NonCopyable
{
public:
    /**
     * This constructor initializes the dispatcher.
     *
     * @param[in] aRegistry  The operation registry.
     * @param[in] aFlow      The serialized flow replies are processed on.
     *
     */
    ReplyDispatcher(OperationRegistry &aRegistry, Executor &aFlow);

    /**
     * This method queues @p aReply for dispatching on the serialized flow.
     *
     * @param[in] aReply  The reply.
     *
     */
    void HandleReply(Reply aReply) override;

    /**
     * This method dispatches @p aReply, it must run on the serialized flow.
     *
     * Replies for unknown operations are dropped. Terminal replies retire their operation
     * before the listener callback is scheduled on the operation's executor.
     *
     * @param[in] aReply  The reply.
     *
     */
    void Dispatch(const Reply &aReply);

private:
    void Deliver(const OperationRegistry::Entry &aEntry, const Reply &aReply);

    OperationRegistry &mRegistry;
    Executor          &mFlow;
};

} // namespace nsd

#endif // NSD_NSD_REPLY_DISPATCHER_HPP_
