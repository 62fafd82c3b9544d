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

#include "nsd/network_monitor.hpp"

#include <sstream>

#include <fnmatch.h>
#include <net/if.h>

namespace nsd {

bool NetworkFilter::Matches(const std::string &aName, unsigned int aFlags) const
{
    bool matches = mNamePatterns.empty();

    for (const std::string &pattern : mNamePatterns)
    {
        if (fnmatch(pattern.c_str(), aName.c_str(), 0) == 0)
        {
            matches = true;
            break;
        }
    }

    if (mRequireRunning && (aFlags & (IFF_UP | IFF_RUNNING)) != (IFF_UP | IFF_RUNNING))
    {
        matches = false;
    }

    if (mRequireMulticast && !(aFlags & IFF_MULTICAST))
    {
        matches = false;
    }

    if (!mIncludeLoopback && (aFlags & IFF_LOOPBACK))
    {
        matches = false;
    }

    return matches;
}

std::string NetworkFilter::ToString(void) const
{
    std::ostringstream out;

    out << "names=[";
    for (size_t i = 0; i < mNamePatterns.size(); ++i)
    {
        out << (i == 0 ? "" : ",") << mNamePatterns[i];
    }
    out << "]";

    out << (mRequireRunning ? " running" : "") << (mRequireMulticast ? " multicast" : "")
        << (mIncludeLoopback ? " loopback" : "");

    return out.str();
}

} // namespace nsd
