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

#ifndef _KEEP_SYSCALL_PROXY_H_
#define _KEEP_SYSCALL_PROXY_H_

#include "shim_gate.h"
#include "../block.h"
#include "../uncopyable.h"

#include <stdint.h>

#define SHIM_TRACE_ARGS     KEEP_REQUEST_ARGS

// In-enclave half of the syscall proxy. Requests go out through the
// shared block and the gate, replies come back the same way.
class CSyscallProxy: private Uncopyable
{
public:
    CSyscallProxy(ShimGate *gate, keep_block_t *block, CEnclaveState *state);

    // Checked first on every entry: a crashed enclave exits right away.
    void enter();

    void proxy(const keep_request_t &req, keep_reply_t *rep);

    // Trip the circuit breaker and leave. Any later entry exits at once.
    void attacked();

    void unknown_syscall(uint64_t a, uint64_t b, uint64_t c, uint64_t d, uint64_t e, uint64_t f, uint64_t nr);

    void trace(const char *name, size_t argc, const uint64_t *argv);

    void debugln(const char *fmt, ...) __attribute__((format(printf, 2, 3)));

private:
    ShimGate        *m_gate;
    CUntrustedBlock m_block;
    CEnclaveState   *m_state;
};

#endif
