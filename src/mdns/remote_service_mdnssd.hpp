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
 *   This file includes definition for the remote discovery service based on mDNSResponder.
 */

#ifndef NSD_MDNS_REMOTE_SERVICE_MDNSSD_HPP_
#define NSD_MDNS_REMOTE_SERVICE_MDNSSD_HPP_

#include "nsd-client/config.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <dns_sd.h>

#include "common/code_utils.hpp"
#include "common/mainloop.hpp"
#include "common/types.hpp"
#include "nsd/remote_service.hpp"

namespace nsd {

namespace Mdns {

/**
 * This class implements the remote discovery service with the mDNSResponder client library.
 *
 * Every operation owns its own `DNSServiceRef`s, which are driven by the mainloop. `Send()`,
 * `Update()` and `Process()` must run on the mainloop thread. `IsConnected()` may be called
 * from any thread and is TRUE once `StartDaemon()` reached the daemon.
 *
 */
class MdnsSdRemoteService : public MainloopProcessor, public RemoteService, private NonCopyable
{
public:
    MdnsSdRemoteService(void) = default;
    ~MdnsSdRemoteService(void) override;

    // Implementation of RemoteService.
    void     SetReplyHandler(ReplyHandler *aHandler) override { mReplyHandler = aHandler; }
    bool     IsConnected(void) const override { return mConnected.load(); }
    nsdError StartDaemon(void) override;
    nsdError Send(Command aCommand, OperationId aId, const ServiceInfo &aInfo) override;

    // Implementation of MainloopProcessor.
    void Update(MainloopContext &aMainloop) override;
    void Process(const MainloopContext &aMainloop) override;

    /**
     * This method converts a DNS-SD error into a failure code.
     *
     */
    static int32_t DnsErrorToFailureCode(DNSServiceErrorType aError);

    /**
     * This method converts a DNS-SD error into an error code.
     *
     */
    static nsdError DnsErrorToNsdError(DNSServiceErrorType aError);

private:
    class ServiceRef : private NonCopyable
    {
    public:
        explicit ServiceRef(MdnsSdRemoteService &aOwner)
            : mOwner(aOwner)
        {
        }

        ~ServiceRef(void) { Release(); }

        void Release(void);
        void Update(MainloopContext &aMainloop) const;
        void Process(const MainloopContext &aMainloop, std::vector<DNSServiceRef> &aReadyServices) const;
        bool IsActive(void) const { return mServiceRef != nullptr; }

        DNSServiceRef mServiceRef = nullptr;

    private:
        MdnsSdRemoteService &mOwner;
    };

    class Operation : private NonCopyable
    {
    public:
        Operation(MdnsSdRemoteService &aOwner, OperationId aId, const ServiceInfo &aInfo);
        virtual ~Operation(void) = default;

        /**
         * This method starts the operation, the first reply is sent by the operation itself.
         *
         */
        virtual DNSServiceErrorType Start(void) = 0;

        /**
         * This method reports a failure of the whole operation and finishes it.
         *
         */
        virtual void Fail(int32_t aFailureCode) = 0;

        void Update(MainloopContext &aMainloop) const;
        void Process(const MainloopContext &aMainloop, std::vector<DNSServiceRef> &aReadyServices) const;

    protected:
        void SendReply(ReplyKind aKind);
        void SendReply(ReplyKind aKind, int32_t aErrorCode);
        void SendReply(ReplyKind aKind, const ServiceInfo &aInfo);
        void Finish(void);

        MdnsSdRemoteService      &mOwner;
        OperationId               mId;
        ServiceInfo               mInfo;
        std::vector<ServiceRef *> mRefs;
    };

    class Registration : public Operation
    {
    public:
        Registration(MdnsSdRemoteService &aOwner, OperationId aId, const ServiceInfo &aInfo);

        DNSServiceErrorType Start(void) override;
        void                Fail(int32_t aFailureCode) override;

    private:
        static void HandleRegisterResult(DNSServiceRef       aServiceRef,
                                         DNSServiceFlags     aFlags,
                                         DNSServiceErrorType aError,
                                         const char         *aName,
                                         const char         *aType,
                                         const char         *aDomain,
                                         void               *aContext);
        void        HandleRegisterResult(DNSServiceFlags aFlags, DNSServiceErrorType aError, const char *aName);

        ServiceRef mRef;
    };

    class Discovery : public Operation
    {
    public:
        Discovery(MdnsSdRemoteService &aOwner, OperationId aId, const ServiceInfo &aInfo);

        DNSServiceErrorType Start(void) override;
        void                Fail(int32_t aFailureCode) override;

    private:
        static void HandleBrowseResult(DNSServiceRef       aServiceRef,
                                       DNSServiceFlags     aFlags,
                                       uint32_t            aInterfaceIndex,
                                       DNSServiceErrorType aErrorCode,
                                       const char         *aInstanceName,
                                       const char         *aType,
                                       const char         *aDomain,
                                       void               *aContext);
        void        HandleBrowseResult(DNSServiceFlags     aFlags,
                                       uint32_t            aInterfaceIndex,
                                       DNSServiceErrorType aErrorCode,
                                       const char         *aInstanceName,
                                       const char         *aType);

        ServiceRef mRef;
    };

    /**
     * This class resolves a service once (resolution) or continuously (watch).
     *
     */
    class Resolution : public Operation
    {
    public:
        Resolution(MdnsSdRemoteService &aOwner, OperationId aId, const ServiceInfo &aInfo, bool aContinuous);

        DNSServiceErrorType Start(void) override;
        void                Fail(int32_t aFailureCode) override;

    private:
        static void         HandleResolveResult(DNSServiceRef        aServiceRef,
                                                DNSServiceFlags      aFlags,
                                                uint32_t             aInterfaceIndex,
                                                DNSServiceErrorType  aErrorCode,
                                                const char          *aFullName,
                                                const char          *aHostTarget,
                                                uint16_t             aPort,
                                                uint16_t             aTxtLen,
                                                const unsigned char *aTxtRecord,
                                                void                *aContext);
        void                HandleResolveResult(DNSServiceFlags      aFlags,
                                                uint32_t             aInterfaceIndex,
                                                DNSServiceErrorType  aErrorCode,
                                                const char          *aHostTarget,
                                                uint16_t             aPort,
                                                uint16_t             aTxtLen,
                                                const unsigned char *aTxtRecord);
        static void         HandleGetAddrInfoResult(DNSServiceRef          aServiceRef,
                                                    DNSServiceFlags        aFlags,
                                                    uint32_t               aInterfaceIndex,
                                                    DNSServiceErrorType    aErrorCode,
                                                    const char            *aHostName,
                                                    const struct sockaddr *aAddress,
                                                    uint32_t               aTtl,
                                                    void                  *aContext);
        void                HandleGetAddrInfoResult(DNSServiceFlags        aFlags,
                                                    DNSServiceErrorType    aErrorCode,
                                                    const struct sockaddr *aAddress);
        static void         HandleBrowseResult(DNSServiceRef       aServiceRef,
                                               DNSServiceFlags     aFlags,
                                               uint32_t            aInterfaceIndex,
                                               DNSServiceErrorType aErrorCode,
                                               const char         *aInstanceName,
                                               const char         *aType,
                                               const char         *aDomain,
                                               void               *aContext);
        void                HandleBrowseResult(DNSServiceFlags     aFlags,
                                               DNSServiceErrorType aErrorCode,
                                               const char         *aInstanceName);
        DNSServiceErrorType GetAddrInfo(uint32_t aInterfaceIndex);
        void                HandleFailure(DNSServiceErrorType aError);

        bool        mContinuous;
        bool        mLost = false;
        ServiceInfo mResolved;
        ServiceRef  mResolveRef;
        ServiceRef  mAddrInfoRef;
        ServiceRef  mBrowseRef;
    };

    typedef std::map<OperationId, std::unique_ptr<Operation>> OperationMap;

    nsdError StartOperation(std::unique_ptr<Operation> aOperation, OperationId aId);
    void     StopOperation(OperationId aId, ReplyKind aStopped, ReplyKind aStopFailed);
    void     HandleReply(Reply aReply);
    void     HandleServiceRefDeallocating(const DNSServiceRef &aServiceRef);
    void     HandleServiceNotRunning(void);
    void     FinishOperation(OperationId aId) { mFinishedOperations.push_back(aId); }
    void     EraseFinishedOperations(void);
    void     Disconnect(void);

    static std::string MakeRegType(const std::string &aType, const std::vector<std::string> &aSubTypes);
    static std::string TrimType(const char *aType);
    static Network     MakeNetwork(uint32_t aInterfaceIndex);

    ReplyHandler              *mReplyHandler  = nullptr;
    DNSServiceRef              mConnectionRef = nullptr;
    std::atomic<bool>          mConnected{false};
    OperationMap               mOperations;
    std::vector<OperationId>   mFinishedOperations;
    std::vector<DNSServiceRef> mServiceRefsToProcess;
};

} // namespace Mdns

} // namespace nsd

#endif // NSD_MDNS_REMOTE_SERVICE_MDNSSD_HPP_
