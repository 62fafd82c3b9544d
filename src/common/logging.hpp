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
 * This file define logging interface.
 */
#ifndef NSD_COMMON_LOGGING_HPP_
#define NSD_COMMON_LOGGING_HPP_

#include "nsd-client/config.h"

#include <stdarg.h>
#include <stddef.h>

#include "common/types.hpp"

#ifndef NSD_LOG_TAG
#define NSD_LOG_TAG ""
#endif

/**
 * Logging level, the values are the same as syslog levels.
 *
 */
typedef enum
{
    NSD_LOG_EMERG,   ///< System is unusable.
    NSD_LOG_ALERT,   ///< Action must be taken immediately.
    NSD_LOG_CRIT,    ///< Critical conditions.
    NSD_LOG_ERR,     ///< Error conditions.
    NSD_LOG_WARNING, ///< Warning conditions.
    NSD_LOG_NOTICE,  ///< Normal but significant condition.
    NSD_LOG_INFO,    ///< Informational.
    NSD_LOG_DEBUG,   ///< Debug-level messages.
} nsdLogLevel;

/**
 * Get current log level.
 *
 */
nsdLogLevel nsdLogGetLevel(void);

/**
 * Set current log level.
 *
 */
void nsdLogSetLevel(nsdLogLevel aLevel);

/**
 * This function initialize the logging service.
 *
 * @param[in]   aIdent          Identity of the logger.
 * @param[in]   aLevel          Log level of the logger.
 * @param[in]   aPrintStderr    Whether to log to stderr.
 * @param[in]   aSyslogDisable  Whether to disable logging to syslog.
 *
 */
void nsdLogInit(const char *aIdent, nsdLogLevel aLevel, bool aPrintStderr, bool aSyslogDisable);

/**
 * This function log at level @p aLevel.
 *
 * @param[in]   aLevel         Log level of the logger.
 * @param[in]   aLogTag        Log tag.
 * @param[in]   aFormat        Format string as in printf.
 *
 */
void nsdLog(nsdLogLevel aLevel, const char *aLogTag, const char *aFormat, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

/**
 * This function log at level @p aLevel.
 *
 * @param[in]   aLevel  Log level of the logger.
 * @param[in]   aFormat Format string as in printf.
 *
 */
void nsdLogv(nsdLogLevel aLevel, const char *aFormat, va_list aArgList);

/**
 * This function converts error code to string.
 *
 * @param[in]   aError      The error code.
 *
 * @returns The string information of error.
 *
 */
const char *nsdErrorString(nsdError aError);

/**
 * This function deinitializes the logging service.
 *
 */
void nsdLogDeinit(void);

/**
 * This macro log a action result according to @p aError.
 *
 * If @p aError is NSD_ERROR_NONE, the log level will be NSD_LOG_INFO,
 * otherwise NSD_LOG_WARNING.
 *
 * @param[in]   aError    The action result.
 * @param[in]   aFormat   Format string as in printf.
 * @param[in]   ...       Arguments for the format specification.
 *
 */
#define nsdLogResult(aError, aFormat, ...)                                                                 \
    do                                                                                                     \
    {                                                                                                      \
        nsdError _err = (aError);                                                                          \
        nsdLog(_err == NSD_ERROR_NONE ? NSD_LOG_INFO : NSD_LOG_WARNING, NSD_LOG_TAG, aFormat ": %s",       \
               ##__VA_ARGS__, nsdErrorString(_err));                                                       \
    } while (0)

/**
 * @def nsdLogCrit
 *
 * Logging at log level critical.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */
/**
 * @def nsdLogWarning
 *
 * Logging at log level warning.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */
/**
 * @def nsdLogNotice
 *
 * Logging at log level notice.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */
/**
 * @def nsdLogInfo
 *
 * Logging at log level information.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */
/**
 * @def nsdLogDebug
 *
 * Logging at log level debug.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */
#define nsdLogCrit(...) nsdLog(NSD_LOG_CRIT, NSD_LOG_TAG, __VA_ARGS__)
#define nsdLogWarning(...) nsdLog(NSD_LOG_WARNING, NSD_LOG_TAG, __VA_ARGS__)
#define nsdLogNotice(...) nsdLog(NSD_LOG_NOTICE, NSD_LOG_TAG, __VA_ARGS__)
#define nsdLogInfo(...) nsdLog(NSD_LOG_INFO, NSD_LOG_TAG, __VA_ARGS__)
#define nsdLogDebug(...) nsdLog(NSD_LOG_DEBUG, NSD_LOG_TAG, __VA_ARGS__)

#endif // NSD_COMMON_LOGGING_HPP_
