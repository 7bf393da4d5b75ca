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

#ifndef _KEEP_TCS_H_
#define _KEEP_TCS_H_

#include "block.h"
#include "enclave_entry.h"
#include "attestation.h"
#include "uncopyable.h"

#include <stdint.h>

/* What the caller has to do after an enter */
typedef enum _command_t
{
    CMD_CONTINUE,       /* enter again */
    CMD_SYSCALL,        /* service the request in get_block(), then enter again */
} command_t;

class CEnclave;

// A thread of the enclave, bound to one TCS.
//
// Drives the EENTER/ERESUME state machine: a clean exit means the next
// entry resumes, the proxy trap (#UD) means the next entry is a fresh one
// into the handler. cssa follows the hardware's SSA frame index.
class CTrustThread: private Uncopyable
{
public:
    CTrustThread(uint64_t tcs, CEnclave *enclave, EnclaveEntry *entry, Attester *attester);
    ~CTrustThread();

    int enter(command_t *cmd);

    uint64_t get_tcs() const { return m_tcs; }
    keep_block_t *get_block() { return &m_block; }
    entry_mode_t get_mode() const { return m_how; }
    int64_t get_cssa() const { return m_cssa; }

private:
    void cpuid();
    int attest();

    uint64_t            m_tcs;
    CEnclave            *m_enclave;
    EnclaveEntry        *m_entry;
    Attester            *m_attester;
    enclave_registers_t m_registers;
    keep_block_t        m_block;
    int64_t             m_cssa;
    entry_mode_t        m_how;
};

#endif
