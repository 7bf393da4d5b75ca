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

#ifndef _KEEP_ENCLAVE_ENTRY_H_
#define _KEEP_ENCLAVE_ENTRY_H_

#include <stdint.h>

/* ENCLU leaves used to enter an enclave */
typedef enum _entry_mode_t
{
    ENTRY_ENTER     = 2,        /* EENTER, a fresh entry */
    ENTRY_RESUME    = 3,        /* ERESUME, after an asynchronous exit */
} entry_mode_t;

#define ENCLU_EEXIT     4

/* The registers passed to and from the enclave, in this order */
typedef struct _enclave_registers_t
{
    uint64_t    rdi;
    uint64_t    rsi;
    uint64_t    rdx;
    uint64_t    r8;
    uint64_t    r9;
} enclave_registers_t;

/* Filled in on an asynchronous exit */
typedef struct _exception_info_t
{
    entry_mode_t    last;       /* how the enclave was entered */
    uint16_t        trap;       /* exception vector */
    uint16_t        code;       /* exception error code */
    uint64_t        addr;       /* faulting address */
} exception_info_t;

#define ENTER_SUCCESS       0   /* the enclave exited with EEXIT */
#define ENTER_EXCEPTION     1   /* asynchronous exit, see exception_info_t */

// The hardware call boundary. Everything the enclave may clobber is handled
// by the implementation, callers only see the five registers.
class EnclaveEntry
{
public:
    virtual ~EnclaveEntry() {}
    virtual int enter(uint64_t tcs, entry_mode_t how, enclave_registers_t *regs, exception_info_t *info) = 0;
};

// Enters through the kernel's __vdso_sgx_enter_enclave.
class VdsoEntry : public EnclaveEntry
{
public:
    VdsoEntry();
    int resolve();
    int enter(uint64_t tcs, entry_mode_t how, enclave_registers_t *regs, exception_info_t *info);
private:
    void *m_fnc;
};

#endif
