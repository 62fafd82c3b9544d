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
 *   This file includes definitions of the registry correlating operations with their listeners.
 */

#ifndef NSD_NSD_OPERATION_REGISTRY_HPP_
#define NSD_NSD_OPERATION_REGISTRY_HPP_

#include "nsd-client/config.h"

#include <map>
#include <mutex>

#include "common/code_utils.hpp"
#include "common/executor.hpp"
#include "common/types.hpp"
#include "nsd/listener.hpp"
#include "nsd/service_info.hpp"

class OperationRegistryTest;

namespace nsd {

/**
 * This class maps operation ids to the listener, the executor and the descriptor of pending operations.
 *
 * A listener instance has at most one outstanding entry. All methods are thread-safe.
 *
 */
class OperationRegistry : private NonCopyable
{
public:
    /**
     * This structure represents one outstanding operation.
     *
     */
    struct Entry
    {
        OperationId  mId       = kInvalidOperationId;
        ListenerKind mKind     = ListenerKind::kDiscovery;
        Listener    *mListener = nullptr;
        const void  *mIdentity = nullptr; ///< The listener instance, see `IdentityOf()`.
        Executor    *mExecutor = nullptr;
        ServiceInfo  mInfo;
    };

    /**
     * This function returns the identity of the listener instance @p aListener belongs to.
     *
     * An object implementing several listener interfaces has one identity for all of them.
     *
     */
    static const void *IdentityOf(const Listener &aListener) { return dynamic_cast<const void *>(&aListener); }

    /**
     * This method allocates an id and records a new entry.
     *
     * @param[in]  aKind      The listener kind.
     * @param[in]  aListener  The listener.
     * @param[in]  aExecutor  The executor callbacks of @p aListener run on.
     * @param[in]  aInfo      The service descriptor of the operation.
     * @param[out] aId        The allocated id.
     *
     * @retval NSD_ERROR_NONE        Successfully allocated.
     * @retval NSD_ERROR_DUPLICATED  @p aListener already has an outstanding operation.
     *
     */
    nsdError Allocate(ListenerKind       aKind,
                      Listener          &aListener,
                      Executor          &aExecutor,
                      const ServiceInfo &aInfo,
                      OperationId       &aId);

    /**
     * This method looks up an entry.
     *
     * @param[in]  aId     The operation id.
     * @param[out] aEntry  A copy of the entry when found.
     *
     * @returns TRUE if the entry exists, FALSE if it is unknown or already retired.
     *
     */
    bool Lookup(OperationId aId, Entry &aEntry) const;

    /**
     * This method removes an entry. Retiring an unknown id does nothing.
     *
     * @param[in] aId  The operation id.
     *
     */
    void Retire(OperationId aId);

    /**
     * This method finds the outstanding operation of a listener.
     *
     * @param[in]  aListener  The listener.
     * @param[out] aId        The operation id.
     *
     * @retval NSD_ERROR_NONE       Found.
     * @retval NSD_ERROR_NOT_FOUND  The listener has no outstanding operation.
     *
     */
    nsdError KeyOf(const Listener &aListener, OperationId &aId) const;

    /**
     * This method returns the number of outstanding entries.
     *
     */
    size_t GetSize(void) const;

private:
    friend class ::OperationRegistryTest;

    OperationId NextId(void);

    mutable std::mutex                  mMutex;
    OperationId                         mLastId = kInvalidOperationId;
    std::map<OperationId, Entry>        mEntries;
    std::map<const void *, OperationId> mListenerIds;
};

} // namespace nsd

#endif // NSD_NSD_OPERATION_REGISTRY_HPP_
