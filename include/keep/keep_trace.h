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

/*
 *This file wrapper some trace output.
*/

#ifndef _KEEP_TRACE_H_
#define _KEEP_TRACE_H_

#include <stdio.h>
#include <stdarg.h>

typedef enum
{
	KEEP_TRACE_ERROR,
	KEEP_TRACE_WARNING,
	KEEP_TRACE_NOTICE,
	KEEP_TRACE_DEBUG
} keep_trace_t;

#ifndef KEEP_DEBUG_LEVEL
/* Compile-time ceiling, the runtime threshold is set by keep_trace_set_level() */
#define KEEP_DEBUG_LEVEL KEEP_TRACE_DEBUG
#endif

#ifdef __cplusplus
extern "C" {
#endif
int keep_trace_internal(int debug_level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));
void keep_trace_set_level(int debug_level);
int keep_trace_get_level(void);

/* Trace the message at error level and abort the process. Used for broken invariants only. */
void keep_abort(const char *fmt, ...) __attribute__((format(printf, 1, 2), noreturn));
#ifdef __cplusplus
}
#endif

/* For libraries, we usually define DISABLE_TRACE to disable any trace. */
#ifdef DISABLE_TRACE
#define KEEP_TRACE(...)
#define keep_trace(...)
#else /* DISABLE_TRACE */
#define keep_trace(debug_level, fmt, ...)     \
    do {                                    \
        if(debug_level <= KEEP_DEBUG_LEVEL)   \
            keep_trace_internal(debug_level, fmt, ##__VA_ARGS__);       \
    }while(0)

#define KEEP_TRACE(debug_level, fmt, ...) \
	    keep_trace(debug_level, "[%s %s:%d] " fmt, __FUNCTION__, __FILE__, __LINE__, ##__VA_ARGS__)
#endif/* DISABLE_TRACE */

#define KEEP_ABORT(fmt, ...) \
        keep_abort("[%s %s:%d] " fmt, __FUNCTION__, __FILE__, __LINE__, ##__VA_ARGS__)

#endif
