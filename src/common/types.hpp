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
 *   This file includes definition for data types used by the NSD client.
 */

#ifndef NSD_COMMON_TYPES_HPP_
#define NSD_COMMON_TYPES_HPP_

#include "nsd-client/config.h"

#include <stdint.h>

/**
 * This enumeration represents error codes used throughout the NSD client.
 *
 */
enum nsdError
{
    NSD_ERROR_NONE = 0, ///< No error.

    NSD_ERROR_ERRNO              = -1,  ///< Error defined by errno.
    NSD_ERROR_MDNS               = -2,  ///< DNS-SD library error.
    NSD_ERROR_NOT_FOUND          = -3,  ///< Not found (the listener has no outstanding operation).
    NSD_ERROR_PARSE              = -4,  ///< Parse error.
    NSD_ERROR_NOT_IMPLEMENTED    = -5,  ///< Not implemented error.
    NSD_ERROR_INVALID_ARGS       = -6,  ///< Invalid arguments error.
    NSD_ERROR_DUPLICATED         = -7,  ///< Duplicated operation (the listener is already in use).
    NSD_ERROR_ABORTED            = -8,  ///< The operation is aborted.
    NSD_ERROR_INVALID_STATE      = -9,  ///< The target isn't in a valid state.
    NSD_ERROR_REMOTE_UNAVAILABLE = -10, ///< The discovery daemon cannot be reached.
};

#endif // NSD_COMMON_TYPES_HPP_
