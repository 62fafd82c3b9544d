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

#define NSD_LOG_TAG "MAIN"

#include "nsd-client/config.h"

#include <new>

#include <errno.h>
#include <getopt.h>
#include <net/if.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "client/application.hpp"
#include "common/code_utils.hpp"
#include "common/logging.hpp"
#include "common/types.hpp"

enum
{
    NSD_OPT_DEBUG_LEVEL    = 'd',
    NSD_OPT_HELP           = 'h',
    NSD_OPT_INTERFACE_NAME = 'I',
    NSD_OPT_INTERFACE      = 'i',
    NSD_OPT_SERVICE_TYPE   = 't',
    NSD_OPT_VERBOSE        = 'v',
    NSD_OPT_SYSLOG_DISABLE = 's',
    NSD_OPT_VERSION        = 'V',
    NSD_OPT_SHORTMAX       = 128,
    NSD_OPT_REGISTER,
    NSD_OPT_PORT,
    NSD_OPT_RESOLVE,
    NSD_OPT_WATCH,
    NSD_OPT_DURATION,
    NSD_OPT_NO_DISCOVER,
};

static const struct option kOptions[] = {{"debug-level", required_argument, nullptr, NSD_OPT_DEBUG_LEVEL},
                                         {"help", no_argument, nullptr, NSD_OPT_HELP},
                                         {"ifname", required_argument, nullptr, NSD_OPT_INTERFACE_NAME},
                                         {"ifindex", required_argument, nullptr, NSD_OPT_INTERFACE},
                                         {"type", required_argument, nullptr, NSD_OPT_SERVICE_TYPE},
                                         {"verbose", no_argument, nullptr, NSD_OPT_VERBOSE},
                                         {"syslog-disable", no_argument, nullptr, NSD_OPT_SYSLOG_DISABLE},
                                         {"version", no_argument, nullptr, NSD_OPT_VERSION},
                                         {"register", required_argument, nullptr, NSD_OPT_REGISTER},
                                         {"port", required_argument, nullptr, NSD_OPT_PORT},
                                         {"resolve", required_argument, nullptr, NSD_OPT_RESOLVE},
                                         {"watch", required_argument, nullptr, NSD_OPT_WATCH},
                                         {"duration", required_argument, nullptr, NSD_OPT_DURATION},
                                         {"no-discover", no_argument, nullptr, NSD_OPT_NO_DISCOVER},
                                         {0, 0, 0, 0}};

static bool ParseInteger(const char *aStr, long &aOutResult)
{
    bool  successful = true;
    char *strEnd;
    long  result;

    VerifyOrExit(aStr != nullptr, successful = false);
    errno  = 0;
    result = strtol(aStr, &strEnd, 0);
    VerifyOrExit(errno != ERANGE, successful = false);
    VerifyOrExit(aStr != strEnd && *strEnd == '\0', successful = false);

    aOutResult = result;

exit:
    return successful;
}

static void PrintHelp(const char *aProgramName)
{
    fprintf(stderr,
            "Usage: %s [-d DEBUG_LEVEL] [-v] [-s] [-t TYPE] [-I IFNAME_PATTERN]... [-i IFINDEX] "
            "[--register NAME --port PORT] [--resolve NAME] [--watch NAME] [--duration SECONDS] [--no-discover]\n"
            "     -d, --debug-level      The log level (EMERG=0, ALERT=1, CRIT=2, ERR=3, WARNING=4, NOTICE=5, INFO=6, "
            "DEBUG=7).\n"
            "     -v, --verbose          Enable verbose logging.\n"
            "     -s, --syslog-disable   Disable syslog and print to standard out.\n"
            "     -t, --type             The service type (default: " NSD_CONFIG_DEFAULT_SERVICE_TYPE ").\n"
            "     -I, --ifname           Discover on every interface matching the pattern (can be specified multiple "
            "times).\n"
            "     -i, --ifindex          Scope operations to one interface index (default: all interfaces).\n"
            "     --register             Register a service instance with the given name.\n"
            "     --port                 The port of the registered service.\n"
            "     --resolve              Resolve the service instance with the given name once.\n"
            "     --watch                Watch the service instance with the given name.\n"
            "     --duration             Stop all operations after the given number of seconds.\n"
            "     --no-discover          Do not discover services.\n"
            "     -h, --help             Show this help text.\n"
            "     -V, --version          Print the application's version and exit.\n"
            "\n",
            aProgramName);
}

static void PrintVersion(void)
{
    printf("%s\n", NSD_PACKAGE_VERSION);
}

static void OnAllocateFailed(void)
{
    nsdLogCrit("Allocate failure, exiting...");
    exit(1);
}

static int realmain(int argc, char *argv[])
{
    nsdLogLevel               logLevel = NSD_LOG_INFO;
    int                       opt;
    int                       ret           = EXIT_SUCCESS;
    bool                      verbose       = false;
    bool                      syslogDisable = false;
    long                      parseResult;
    nsd::Application::Options options;

    std::set_new_handler(OnAllocateFailed);

    while ((opt = getopt_long(argc, argv, "d:hI:i:t:vsV", kOptions, nullptr)) != -1)
    {
        switch (opt)
        {
        case NSD_OPT_DEBUG_LEVEL:
            VerifyOrExit(ParseInteger(optarg, parseResult), ret = EXIT_FAILURE);
            VerifyOrExit(NSD_LOG_EMERG <= parseResult && parseResult <= NSD_LOG_DEBUG, ret = EXIT_FAILURE);
            logLevel = static_cast<nsdLogLevel>(parseResult);
            break;

        case NSD_OPT_INTERFACE_NAME:
            options.mFilter.mNamePatterns.push_back(optarg);
            options.mUseFilter = true;
            break;

        case NSD_OPT_INTERFACE:
            VerifyOrExit(ParseInteger(optarg, parseResult), ret = EXIT_FAILURE);
            VerifyOrExit(0 <= parseResult && parseResult <= UINT32_MAX, ret = EXIT_FAILURE);
            options.mNetwork.mIndex = static_cast<uint32_t>(parseResult);
            {
                char name[IF_NAMESIZE];

                if (options.mNetwork.mIndex != 0 && if_indextoname(options.mNetwork.mIndex, name) != nullptr)
                {
                    options.mNetwork.mName = name;
                }
            }
            break;

        case NSD_OPT_SERVICE_TYPE:
            options.mServiceType = optarg;
            break;

        case NSD_OPT_VERBOSE:
            verbose = true;
            break;

        case NSD_OPT_SYSLOG_DISABLE:
            syslogDisable = true;
            break;

        case NSD_OPT_REGISTER:
            options.mRegisterName = optarg;
            break;

        case NSD_OPT_PORT:
            VerifyOrExit(ParseInteger(optarg, parseResult), ret = EXIT_FAILURE);
            VerifyOrExit(0 < parseResult && parseResult <= UINT16_MAX, ret = EXIT_FAILURE);
            options.mPort = static_cast<uint16_t>(parseResult);
            break;

        case NSD_OPT_RESOLVE:
            options.mResolveName = optarg;
            break;

        case NSD_OPT_WATCH:
            options.mWatchName = optarg;
            break;

        case NSD_OPT_DURATION:
            VerifyOrExit(ParseInteger(optarg, parseResult), ret = EXIT_FAILURE);
            VerifyOrExit(parseResult >= 0, ret = EXIT_FAILURE);
            options.mDuration = nsd::Seconds(parseResult);
            break;

        case NSD_OPT_NO_DISCOVER:
            options.mDiscover = false;
            break;

        case NSD_OPT_VERSION:
            PrintVersion();
            ExitNow();
            break;

        case NSD_OPT_HELP:
            PrintHelp(argv[0]);
            ExitNow(ret = EXIT_SUCCESS);
            break;

        default:
            PrintHelp(argv[0]);
            ExitNow(ret = EXIT_FAILURE);
            break;
        }
    }

    VerifyOrExit(options.mRegisterName.empty() || options.mPort != 0, PrintHelp(argv[0]), ret = EXIT_FAILURE);

    nsdLogInit(argv[0], logLevel, verbose, syslogDisable);
    nsdLogNotice("Running %s", NSD_PACKAGE_VERSION);

    {
        nsd::Application app(options);

        if (app.Init() != NSD_ERROR_NONE || app.Run() != NSD_ERROR_NONE)
        {
            ret = EXIT_FAILURE;
        }

        app.Deinit();
    }

    nsdLogDeinit();

exit:
    return ret;
}

int main(int argc, char *argv[])
{
    return realmain(argc, argv);
}
