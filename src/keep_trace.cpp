/*
 * Copyright (C) 2011-2017 Intel Corporation. All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions
 * are met:
 *
 *   * Redistributions of source code must retain the above copyright
 *     notice, this list of conditions and the following disclaimer.
 *   * Redistributions in binary form must reproduce the above copyright
 *     notice, this list of conditions and the following disclaimer in
 *     the documentation and/or other materials provided with the
 *     distribution.
 *   * Neither the name of Intel Corporation nor the names of its
 *     contributors may be used to endorse or promote products derived
 *     from this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 */

#include "keep/keep_trace.h"
#include "keep/keep_lock.hpp"

#include <stdlib.h>

static Mutex g_trace_mutex;
static int g_trace_level = KEEP_TRACE_WARNING;

static const char *level_names[] = {
    "error",
    "warning",
    "notice",
    "debug",
};

void keep_trace_set_level(int debug_level)
{
    if(debug_level < KEEP_TRACE_ERROR)
        debug_level = KEEP_TRACE_ERROR;
    if(debug_level > KEEP_TRACE_DEBUG)
        debug_level = KEEP_TRACE_DEBUG;
    LockGuard lock(&g_trace_mutex);
    g_trace_level = debug_level;
}

int keep_trace_get_level(void)
{
    LockGuard lock(&g_trace_mutex);
    return g_trace_level;
}

/* g_trace_mutex must be held */
static int keep_trace_vprint(int debug_level, const char *fmt, va_list args)
{
    int ret = fprintf(stderr, "keep-sgx %s: ", level_names[debug_level]);
    ret += vfprintf(stderr, fmt, args);
    fflush(stderr);
    return ret;
}

int keep_trace_internal(int debug_level, const char *fmt, ...)
{
    if(debug_level < KEEP_TRACE_ERROR)
        return 0;

    LockGuard lock(&g_trace_mutex);
    if(debug_level > g_trace_level)
        return 0;

    va_list args;
    va_start(args, fmt);
    int ret = keep_trace_vprint(debug_level, fmt, args);
    va_end(args);
    return ret;
}

void keep_abort(const char *fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    {
        LockGuard lock(&g_trace_mutex);
        keep_trace_vprint(KEEP_TRACE_ERROR, fmt, args);
    }
    va_end(args);
    abort();
}
