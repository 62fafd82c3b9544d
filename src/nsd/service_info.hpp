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
 *   This file includes definitions of the service descriptor and related value types.
 */

#ifndef NSD_NSD_SERVICE_INFO_HPP_
#define NSD_NSD_SERVICE_INFO_HPP_

#include "nsd-client/config.h"

#include <map>
#include <utility>
#include <string>
#include <vector>

#include <stdint.h>

#include "common/types.hpp"

namespace nsd {

/**
 * This type represents the identifier of an outstanding operation.
 *
 */
typedef uint32_t OperationId;

constexpr OperationId kInvalidOperationId = 0; ///< Never allocated.
constexpr OperationId kFirstOperationId   = 1; ///< The first identifier allocated in a session.

/**
 * The DNS-based service discovery protocol, the only supported one.
 *
 */
constexpr int kProtocolDnsSd = 1;

/**
 * This structure represents a network (an interface) operations can be scoped to.
 *
 */
struct Network
{
    uint32_t    mIndex = 0; ///< Interface index, 0 means any network.
    std::string mName;      ///< Interface name, may be empty.

    Network(void) = default;

    Network(uint32_t aIndex, std::string aName)
        : mIndex(aIndex)
        , mName(std::move(aName))
    {
    }

    /**
     * This method returns the network matching all interfaces.
     *
     */
    static Network Any(void) { return Network(); }

    bool IsAny(void) const { return mIndex == 0; }

    bool operator==(const Network &aOther) const { return mIndex == aOther.mIndex; }
    bool operator!=(const Network &aOther) const { return !(*this == aOther); }
    bool operator<(const Network &aOther) const { return mIndex < aOther.mIndex; }

    std::string ToString(void) const;
};

/**
 * This type represents TXT attributes, key to raw value.
 *
 */
typedef std::map<std::string, std::vector<uint8_t>> TxtAttributes;

/**
 * This structure represents a service descriptor.
 *
 */
struct ServiceInfo
{
    std::string              mServiceName; ///< The instance name, e.g. "printer".
    std::string              mServiceType; ///< The service type, e.g. "_http._tcp".
    std::vector<std::string> mSubTypes;    ///< The sub-types, without the "_sub" label.
    std::string              mHostName;    ///< The host name, filled by resolution.
    uint16_t                 mPort = 0;    ///< The port number.
    TxtAttributes            mAttributes;  ///< The TXT attributes.
    std::vector<std::string> mAddresses;   ///< Textual IPv4/IPv6 addresses, filled by resolution.
    Network                  mNetwork;     ///< The network the service was seen on or is scoped to.

    /**
     * This method sets a TXT attribute from a string value.
     *
     * @param[in] aKey    The attribute key.
     * @param[in] aValue  The attribute value.
     *
     */
    void SetAttribute(const std::string &aKey, const std::string &aValue);

    std::string ToString(void) const;
};

/**
 * This function validates a descriptor passed for registration.
 *
 * @param[in] aInfo  The service descriptor.
 *
 * @retval NSD_ERROR_NONE          The descriptor has a name, a type and a positive port.
 * @retval NSD_ERROR_INVALID_ARGS  The descriptor is not acceptable.
 *
 */
nsdError ValidateRegistrationInfo(const ServiceInfo &aInfo);

/**
 * This function validates a descriptor passed for resolution or watching.
 *
 * @param[in] aInfo  The service descriptor.
 *
 * @retval NSD_ERROR_NONE          The descriptor has a name and a type.
 * @retval NSD_ERROR_INVALID_ARGS  The descriptor is not acceptable.
 *
 */
nsdError ValidateResolutionInfo(const ServiceInfo &aInfo);

/**
 * This function validates a service type and protocol passed for discovery.
 *
 */
nsdError ValidateDiscoveryType(const std::string &aServiceType, int aProtocol);

} // namespace nsd

#endif // NSD_NSD_SERVICE_INFO_HPP_
