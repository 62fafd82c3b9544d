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
 *   This file includes definitions for time related types and helpers.
 */

#ifndef NSD_COMMON_TIME_HPP_
#define NSD_COMMON_TIME_HPP_

#include "nsd-client/config.h"

#include <chrono>

#include <stdint.h>

#include <sys/time.h>

namespace nsd {

using Clock        = std::chrono::steady_clock;
using Duration     = std::chrono::steady_clock::duration;
using TimePoint    = std::chrono::time_point<Clock>;
using MicroSeconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;
using Seconds      = std::chrono::seconds;

/**
 * This function converts a duration into a timeval.
 *
 * @param[in]  aDuration  The duration to convert, negative values are treated as zero.
 *
 * @returns The duration as a timeval.
 *
 */
template <typename D> inline struct timeval ToTimeval(D aDuration)
{
    struct timeval ret;
    int64_t        us = std::chrono::duration_cast<MicroSeconds>(aDuration).count();

    if (us < 0)
    {
        us = 0;
    }

    ret.tv_sec  = static_cast<time_t>(us / 1000000);
    ret.tv_usec = static_cast<suseconds_t>(us % 1000000);

    return ret;
}

/**
 * This function converts a timeval into microseconds.
 *
 * @param[in]  aTimeval  The timeval to convert.
 *
 * @returns The timeval in microseconds.
 *
 */
inline MicroSeconds FromTimeval(const struct timeval &aTimeval)
{
    return MicroSeconds{static_cast<int64_t>(aTimeval.tv_sec) * 1000000 + aTimeval.tv_usec};
}

} // namespace nsd

#endif // NSD_COMMON_TIME_HPP_
