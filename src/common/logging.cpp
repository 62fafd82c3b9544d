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
 *   This file implements the logging service.
 */

#define NSD_LOG_TAG "LOG"

#include "common/logging.hpp"

#include <assert.h>
#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <syslog.h>

static nsdLogLevel sLevel        = NSD_LOG_INFO;
static bool        sSyslogOpened = false;
static bool        sPrintStderr  = false;
static const char  kLevelChar[]  = "!ACEWNID";

nsdLogLevel nsdLogGetLevel(void)
{
    return sLevel;
}

void nsdLogSetLevel(nsdLogLevel aLevel)
{
    assert(aLevel >= NSD_LOG_EMERG && aLevel <= NSD_LOG_DEBUG);
    sLevel = aLevel;
}

/** Initialize logging */
void nsdLogInit(const char *aIdent, nsdLogLevel aLevel, bool aPrintStderr, bool aSyslogDisable)
{
    assert(aIdent);
    assert(aLevel >= NSD_LOG_EMERG && aLevel <= NSD_LOG_DEBUG);

    if (!aSyslogDisable)
    {
        openlog(aIdent, (LOG_CONS | LOG_PID) | (aPrintStderr ? LOG_PERROR : 0), LOG_USER);
        sSyslogOpened = true;
    }

    // When syslog is enabled it already copies every message to stderr with LOG_PERROR.
    sPrintStderr = aSyslogDisable && aPrintStderr;
    sLevel       = aLevel;
}

/** log to the syslog or stderr */
void nsdLog(nsdLogLevel aLevel, const char *aLogTag, const char *aFormat, ...)
{
    va_list ap;
    char    format[256];

    if (aLevel > sLevel)
    {
        return;
    }

    snprintf(format, sizeof(format), "[%s] %s", aLogTag, aFormat);

    va_start(ap, aFormat);
    nsdLogv(aLevel, format, ap);
    va_end(ap);
}

/** log to the syslog or stderr */
void nsdLogv(nsdLogLevel aLevel, const char *aFormat, va_list aArgList)
{
    assert(aFormat);

    if (aLevel > sLevel)
    {
        return;
    }

    if (sPrintStderr)
    {
        va_list copy;

        va_copy(copy, aArgList);
        fprintf(stderr, "%c ", kLevelChar[aLevel]);
        vfprintf(stderr, aFormat, copy);
        fputc('\n', stderr);
        va_end(copy);
    }

    if (sSyslogOpened)
    {
        vsyslog(static_cast<int>(aLevel), aFormat, aArgList);
    }
}

const char *nsdErrorString(nsdError aError)
{
    const char *error;

    switch (aError)
    {
    case NSD_ERROR_NONE:
        error = "OK";
        break;

    case NSD_ERROR_ERRNO:
        error = strerror(errno);
        break;

    case NSD_ERROR_MDNS:
        error = "MDNS error";
        break;

    case NSD_ERROR_NOT_FOUND:
        error = "Not found";
        break;

    case NSD_ERROR_PARSE:
        error = "Parse error";
        break;

    case NSD_ERROR_NOT_IMPLEMENTED:
        error = "Not implemented";
        break;

    case NSD_ERROR_INVALID_ARGS:
        error = "Invalid arguments";
        break;

    case NSD_ERROR_DUPLICATED:
        error = "Duplicated";
        break;

    case NSD_ERROR_ABORTED:
        error = "Aborted";
        break;

    case NSD_ERROR_INVALID_STATE:
        error = "Invalid state";
        break;

    case NSD_ERROR_REMOTE_UNAVAILABLE:
        error = "Remote service unavailable";
        break;

    default:
        error = "Unknown";
    }

    return error;
}

void nsdLogDeinit(void)
{
    if (sSyslogOpened)
    {
        closelog();
        sSyslogOpened = false;
    }

    sPrintStderr = false;
}
