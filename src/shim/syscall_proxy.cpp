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

#include "keep/shim/syscall_proxy.h"
#include "keep/util.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#define SHIM_LINE_SIZE  256

CSyscallProxy::CSyscallProxy(ShimGate *gate, keep_block_t *block, CEnclaveState *state)
    : m_gate(gate), m_block(block), m_state(state)
{
}

void CSyscallProxy::enter()
{
    if(m_state->is_crashed())
        m_gate->terminate(1);
}

void CSyscallProxy::proxy(const keep_request_t &req, keep_reply_t *rep)
{
    if(m_state->is_crashed())
        m_gate->terminate(1);

    m_block.publish_request(req);
    m_gate->raise_exit();
    m_block.collect_reply(rep);
}

void CSyscallProxy::attacked()
{
    m_state->crash();
    m_gate->terminate(1);
}

void CSyscallProxy::unknown_syscall(uint64_t a, uint64_t b, uint64_t c, uint64_t d, uint64_t e, uint64_t f, uint64_t nr)
{
    UNUSED(a);
    UNUSED(b);
    UNUSED(c);
    UNUSED(d);
    UNUSED(e);
    UNUSED(f);
    debugln("unsupported syscall: %lu", (unsigned long)nr);
}

void CSyscallProxy::trace(const char *name, size_t argc, const uint64_t *argv)
{
    char line[SHIM_LINE_SIZE];
    size_t used = 0;

    argc = MIN(argc, (size_t)SHIM_TRACE_ARGS);
    int n = snprintf(line, sizeof(line), "%s(", name);
    used = (n < 0) ? 0 : MIN((size_t)n, sizeof(line) - 1);

    for(size_t i = 0; i < argc && used < sizeof(line) - 1; i++)
    {
        n = snprintf(line + used, sizeof(line) - used, "%s0x%lx", i > 0 ? ", " : "", (unsigned long)argv[i]);
        if(n < 0)
            break;
        used = MIN(used + (size_t)n, sizeof(line) - 1);
    }

    debugln("%s)", line);
}

void CSyscallProxy::debugln(const char *fmt, ...)
{
    char line[SHIM_LINE_SIZE];
    va_list ap;
    va_start(ap, fmt);
    int n = vsnprintf(line, sizeof(line) - 1, fmt, ap);
    va_end(ap);
    if(n < 0)
        return;

    size_t len = MIN((size_t)n, sizeof(line) - 2);
    line[len++] = '\n';
    m_gate->debug_write(line, len);
}
