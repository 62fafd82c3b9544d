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

#include "nsd/service_info.hpp"

#include <sstream>

#include "common/code_utils.hpp"

namespace nsd {

std::string Network::ToString(void) const
{
    std::ostringstream out;

    if (IsAny())
    {
        out << "any";
    }
    else
    {
        out << (mName.empty() ? "?" : mName) << "#" << mIndex;
    }

    return out.str();
}

void ServiceInfo::SetAttribute(const std::string &aKey, const std::string &aValue)
{
    mAttributes[aKey].assign(aValue.begin(), aValue.end());
}

std::string ServiceInfo::ToString(void) const
{
    std::ostringstream out;

    out << "name=" << mServiceName << ", type=" << mServiceType;

    if (!mHostName.empty())
    {
        out << ", host=" << mHostName;
    }

    if (mPort != 0)
    {
        out << ", port=" << mPort;
    }

    if (!mAddresses.empty())
    {
        out << ", addresses=[";
        for (size_t i = 0; i < mAddresses.size(); ++i)
        {
            out << (i == 0 ? "" : ", ") << mAddresses[i];
        }
        out << "]";
    }

    if (!mAttributes.empty())
    {
        out << ", txt={";
        for (auto it = mAttributes.begin(); it != mAttributes.end(); ++it)
        {
            out << (it == mAttributes.begin() ? "" : ", ") << it->first << "="
                << std::string(it->second.begin(), it->second.end());
        }
        out << "}";
    }

    out << ", network=" << mNetwork.ToString();

    return out.str();
}

nsdError ValidateRegistrationInfo(const ServiceInfo &aInfo)
{
    nsdError error = NSD_ERROR_NONE;

    SuccessOrExit(error = ValidateResolutionInfo(aInfo));
    VerifyOrExit(aInfo.mPort > 0, error = NSD_ERROR_INVALID_ARGS);

exit:
    return error;
}

nsdError ValidateResolutionInfo(const ServiceInfo &aInfo)
{
    nsdError error = NSD_ERROR_NONE;

    VerifyOrExit(!aInfo.mServiceName.empty(), error = NSD_ERROR_INVALID_ARGS);
    VerifyOrExit(!aInfo.mServiceType.empty(), error = NSD_ERROR_INVALID_ARGS);

exit:
    return error;
}

nsdError ValidateDiscoveryType(const std::string &aServiceType, int aProtocol)
{
    nsdError error = NSD_ERROR_NONE;

    VerifyOrExit(!aServiceType.empty(), error = NSD_ERROR_INVALID_ARGS);
    VerifyOrExit(aProtocol == kProtocolDnsSd, error = NSD_ERROR_INVALID_ARGS);

exit:
    return error;
}

} // namespace nsd
