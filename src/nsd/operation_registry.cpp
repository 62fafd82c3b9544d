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

#define NSD_LOG_TAG "REGISTRY"

#include "nsd/operation_registry.hpp"

#include <algorithm>

#include "common/logging.hpp"

namespace nsd {

nsdError OperationRegistry::Allocate(ListenerKind       aKind,
                                     Listener          &aListener,
                                     Executor          &aExecutor,
                                     const ServiceInfo &aInfo,
                                     OperationId       &aId)
{
    nsdError                    error = NSD_ERROR_NONE;
    std::lock_guard<std::mutex> _(mMutex);
    Entry                       entry;

    VerifyOrExit(mListenerIds.find(IdentityOf(aListener)) == mListenerIds.end(), error = NSD_ERROR_DUPLICATED);

    entry.mId       = NextId();
    entry.mKind     = aKind;
    entry.mListener = &aListener;
    entry.mIdentity = IdentityOf(aListener);
    entry.mExecutor = &aExecutor;
    entry.mInfo     = aInfo;

    mEntries[entry.mId]           = entry;
    mListenerIds[entry.mIdentity] = entry.mId;
    aId                           = entry.mId;

    nsdLogDebug("Allocated %s operation %u for %s", ListenerKindToString(aKind), aId, aInfo.mServiceType.c_str());

exit:
    return error;
}

bool OperationRegistry::Lookup(OperationId aId, Entry &aEntry) const
{
    std::lock_guard<std::mutex> _(mMutex);
    auto                        it    = mEntries.find(aId);
    bool                        found = (it != mEntries.end());

    if (found)
    {
        aEntry = it->second;
    }

    return found;
}

void OperationRegistry::Retire(OperationId aId)
{
    std::lock_guard<std::mutex> _(mMutex);
    auto                        it = mEntries.find(aId);

    VerifyOrExit(it != mEntries.end());

    mListenerIds.erase(it->second.mIdentity);
    mEntries.erase(it);

    nsdLogDebug("Retired operation %u", aId);

exit:
    return;
}

nsdError OperationRegistry::KeyOf(const Listener &aListener, OperationId &aId) const
{
    nsdError                    error = NSD_ERROR_NONE;
    std::lock_guard<std::mutex> _(mMutex);
    auto                        it = mListenerIds.find(IdentityOf(aListener));

    VerifyOrExit(it != mListenerIds.end(), error = NSD_ERROR_NOT_FOUND);
    aId = it->second;

exit:
    return error;
}

size_t OperationRegistry::GetSize(void) const
{
    std::lock_guard<std::mutex> _(mMutex);

    return mEntries.size();
}

OperationId OperationRegistry::NextId(void)
{
    // Wraps around to `kFirstOperationId` and skips the ids still outstanding.
    do
    {
        mLastId = std::max(kFirstOperationId, static_cast<OperationId>(mLastId + 1));
    } while (mEntries.find(mLastId) != mEntries.end());

    return mLastId;
}

} // namespace nsd
