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

#include <gtest/gtest.h>

#include "common/logging.hpp"
#include "common/types.hpp"
#include "nsd/listener.hpp"
#include "nsd/service_info.hpp"

using namespace nsd;

TEST(ServiceInfo, Validation)
{
    ServiceInfo info;

    EXPECT_EQ(NSD_ERROR_INVALID_ARGS, ValidateResolutionInfo(info));

    info.mServiceName = "printer";
    EXPECT_EQ(NSD_ERROR_INVALID_ARGS, ValidateResolutionInfo(info));

    info.mServiceType = "_ipp._tcp";
    EXPECT_EQ(NSD_ERROR_NONE, ValidateResolutionInfo(info));
    EXPECT_EQ(NSD_ERROR_INVALID_ARGS, ValidateRegistrationInfo(info));

    info.mPort = 631;
    EXPECT_EQ(NSD_ERROR_NONE, ValidateRegistrationInfo(info));

    EXPECT_EQ(NSD_ERROR_NONE, ValidateDiscoveryType("_http._tcp", kProtocolDnsSd));
    EXPECT_EQ(NSD_ERROR_INVALID_ARGS, ValidateDiscoveryType("", kProtocolDnsSd));
    EXPECT_EQ(NSD_ERROR_INVALID_ARGS, ValidateDiscoveryType("_http._tcp", kProtocolDnsSd + 1));
}

TEST(ServiceInfo, ToString)
{
    ServiceInfo info;

    info.mServiceName = "printer";
    info.mServiceType = "_ipp._tcp";
    info.mPort        = 631;
    info.mNetwork     = Network(2, "eth0");
    info.mAddresses.push_back("192.0.2.7");
    info.SetAttribute("rp", "ipp/print");

    EXPECT_EQ("name=printer, type=_ipp._tcp, port=631, addresses=[192.0.2.7], txt={rp=ipp/print}, network=eth0#2",
              info.ToString());
}

TEST(Network, AnyAndOrdering)
{
    EXPECT_TRUE(Network::Any().IsAny());
    EXPECT_EQ("any", Network::Any().ToString());
    EXPECT_FALSE(Network(1, "lo").IsAny());

    // Networks are identified by their index.
    EXPECT_EQ(Network(3, "eth0"), Network(3, ""));
    EXPECT_TRUE(Network(1, "z") < Network(2, "a"));
    EXPECT_EQ("?#4", Network(4, "").ToString());
}

TEST(CommonTypes, ErrorStrings)
{
    EXPECT_STREQ("OK", nsdErrorString(NSD_ERROR_NONE));
    EXPECT_STREQ("Invalid arguments", nsdErrorString(NSD_ERROR_INVALID_ARGS));
    EXPECT_STREQ("Not found", nsdErrorString(NSD_ERROR_NOT_FOUND));

    EXPECT_STREQ("INTERNAL_ERROR", FailureCodeToString(kFailureInternalError));
    EXPECT_STREQ("OPERATION_NOT_RUNNING", FailureCodeToString(kFailureOperationNotRunning));
    EXPECT_STREQ("UNKNOWN", FailureCodeToString(-1));
}
