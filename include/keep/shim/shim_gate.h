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

#ifndef _KEEP_SHIM_GATE_H_
#define _KEEP_SHIM_GATE_H_

#include "../block.h"
#include "../uncopyable.h"

#include <stddef.h>

/* Enclave crash state */
#define ENCLAVE_RUNNING     0
#define ENCLAVE_CRASHED     1

// One-way latch: once crashed, the enclave never runs again.
class CEnclaveState: private Uncopyable
{
public:
    CEnclaveState() : m_state(ENCLAVE_RUNNING) {}
    bool is_crashed() const { return m_state == ENCLAVE_CRASHED; }
    void crash() { m_state = ENCLAVE_CRASHED; }
private:
    volatile uint32_t m_state;
};

// How the shim leaves the enclave.
class ShimGate
{
public:
    virtual ~ShimGate() {}
    // Exit to the host so it services the block, returns once resumed.
    virtual void raise_exit() = 0;
    // Leave the enclave for good, never returns.
    virtual void terminate(int status) = 0;
    // Diagnostics, the enclave has no stderr of its own.
    virtual void debug_write(const char *msg, size_t len) = 0;
};

// The gate of a running enclave. `syscall' is illegal inside an enclave, so
// it raises #UD, the host sees an asynchronous exit and services the block
// before resuming the thread after the instruction.
class CHardwareShimGate : public ShimGate
{
public:
    explicit CHardwareShimGate(keep_block_t *block) : m_block(block) {}
    void raise_exit();
    void terminate(int status);
    void debug_write(const char *msg, size_t len);
private:
    uint64_t round_trip(const keep_request_t &req);

    CUntrustedBlock m_block;
};

#endif
