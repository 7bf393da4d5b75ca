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

#include "keep/tcs.h"
#include "keep/enclave.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"
#include "keep/arch.h"

#include <errno.h>
#include <string.h>
#include <cpuid.h>

CTrustThread::CTrustThread(uint64_t tcs, CEnclave *enclave, EnclaveEntry *entry, Attester *attester)
    : m_tcs(tcs), m_enclave(enclave), m_entry(entry), m_attester(attester),
      m_cssa(0), m_how(ENTRY_ENTER)
{
    memset(&m_registers, 0, sizeof(m_registers));
    memset(&m_block, 0, sizeof(m_block));
}

CTrustThread::~CTrustThread()
{
    if(m_enclave)
        m_enclave->release_tcs(m_tcs);
}

void CTrustThread::cpuid()
{
    keep_request_t req;
    CUntrustedBlock block(&m_block);
    block.read_request(&req);

    unsigned int eax = 0, ebx = 0, ecx = 0, edx = 0;
    if(req.arg[0] > UINT32_MAX || req.arg[1] > UINT32_MAX)
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "cpuid leaf %#lx/%#lx out of range\n",
                   (unsigned long)req.arg[0], (unsigned long)req.arg[1]);
    }
    else
    {
        __cpuid_count((unsigned int)req.arg[0], (unsigned int)req.arg[1], eax, ebx, ecx, edx);
    }

    m_block.msg.req.arg[0] = eax;
    m_block.msg.req.arg[1] = ebx;
    m_block.msg.req.arg[2] = ecx;
    m_block.msg.req.arg[3] = edx;
}

int CTrustThread::attest()
{
    keep_request_t req;
    CUntrustedBlock block(&m_block);
    block.read_request(&req);

    // The nonce and the output buffer must both be inside the shared block.
    if(!block.in_buffer(req.arg[0], req.arg[1]) || !block.in_buffer(req.arg[2], req.arg[3]))
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "attestation buffers are outside of the block\n");
        block.reply_err(EFAULT);
        return KEEP_SUCCESS;
    }

    size_t written = 0;
    int ret = m_attester->get_attestation(reinterpret_cast<const uint8_t *>(req.arg[0]), (size_t)req.arg[1],
                                          reinterpret_cast<uint8_t *>(req.arg[2]), (size_t)req.arg[3], &written);
    if(ret != KEEP_SUCCESS)
        return ret;
    if(written > req.arg[3])
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "attester wrote %lu bytes into a buffer of %lu\n",
                   (unsigned long)written, (unsigned long)req.arg[3]);
        return KEEP_ERROR_ATTESTATION;
    }

    block.reply_ok(written, 0);
    return KEEP_SUCCESS;
}

int CTrustThread::enter(command_t *cmd)
{
    if(cmd == NULL)
        return KEEP_ERROR_INVALID_PARAMETER;

    entry_mode_t prev = m_how;
    m_registers.rdi = reinterpret_cast<uint64_t>(&m_block);

    exception_info_t info;
    memset(&info, 0, sizeof(info));
    int ret = m_entry->enter(m_tcs, prev, &m_registers, &info);

    if(ret == ENTER_SUCCESS)
        m_how = ENTRY_RESUME;
    else if(ret == ENTER_EXCEPTION && info.trap == SE_VECTOR_UD)
        m_how = ENTRY_ENTER;
    else
        KEEP_ABORT("unexpected AEX: last = %d, vector = %u, code = %#x, addr = %#lx\n",
                   info.last, info.trap, info.code, (unsigned long)info.addr);

    // Keep track of the CSSA
    if(m_how == ENTRY_ENTER)
    {
        m_cssa++;
    }
    else
    {
        if(m_cssa == 0)
            KEEP_ABORT("CSSA underflow on tcs %#lx\n", (unsigned long)m_tcs);
        m_cssa--;
    }

    // The handler just exited after a proxy trap, the block holds its request.
    if(prev == ENTRY_ENTER && m_how == ENTRY_RESUME)
    {
        uint64_t num = CUntrustedBlock(&m_block).request_number();
        switch(num)
        {
        case KEEP_SYS_CPUID:
            cpuid();
            break;
        case KEEP_SYS_GETATT:
            if((ret = attest()) != KEEP_SUCCESS)
                return ret;
            break;
        default:
            *cmd = CMD_SYSCALL;
            return KEEP_SUCCESS;
        }
    }

    *cmd = CMD_CONTINUE;
    return KEEP_SUCCESS;
}
