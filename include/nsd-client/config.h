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
 *   This file includes compile-time configurations of the NSD client.
 */

#ifndef NSD_CONFIG_H_
#define NSD_CONFIG_H_

#ifdef NSD_CONFIG_FILE
#include NSD_CONFIG_FILE
#endif

/**
 * @def NSD_PACKAGE_NAME
 *
 * The package name.
 *
 */
#ifndef NSD_PACKAGE_NAME
#define NSD_PACKAGE_NAME "nsd-client"
#endif

/**
 * @def NSD_PACKAGE_VERSION
 *
 * The package version, normally given by the build system.
 *
 */
#ifndef NSD_PACKAGE_VERSION
#define NSD_PACKAGE_VERSION "0.1.0"
#endif

/**
 * @def NSD_CONFIG_DEFAULT_SERVICE_TYPE
 *
 * The service type the command line tool discovers when none is given.
 *
 */
#ifndef NSD_CONFIG_DEFAULT_SERVICE_TYPE
#define NSD_CONFIG_DEFAULT_SERVICE_TYPE "_http._tcp"
#endif

/**
 * @def NSD_CONFIG_DEFAULT_DOMAIN
 *
 * The domain used for every DNS-SD operation.
 *
 */
#ifndef NSD_CONFIG_DEFAULT_DOMAIN
#define NSD_CONFIG_DEFAULT_DOMAIN "local."
#endif

/**
 * @def NSD_CONFIG_MAX_POLL_TIMEOUT
 *
 * The maximum time in seconds one mainloop iteration blocks in select().
 *
 */
#ifndef NSD_CONFIG_MAX_POLL_TIMEOUT
#define NSD_CONFIG_MAX_POLL_TIMEOUT 10
#endif

/**
 * @def NSD_CONFIG_STOP_GRACE_PERIOD
 *
 * The time in seconds the command line tool waits for stopped callbacks before it exits.
 *
 */
#ifndef NSD_CONFIG_STOP_GRACE_PERIOD
#define NSD_CONFIG_STOP_GRACE_PERIOD 3
#endif

#endif // NSD_CONFIG_H_
