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

#ifndef _KEEP_ENCLAVE_H_
#define _KEEP_ENCLAVE_H_

#include "enclave_entry.h"
#include "attestation.h"
#include "keep_lock.hpp"
#include "uncopyable.h"

#include <stdint.h>
#include <vector>

using std::vector;

class CTrustThread;

// An initialized enclave. Owns the enclave mapping; every thread spawned
// from it must be deleted before it is.
class CEnclave: private Uncopyable
{
public:
    CEnclave(uint64_t base, uint64_t size, const vector<uint64_t> &tcs, EnclaveEntry *entry, Attester *attester);
    ~CEnclave();

    // Bind a new thread to a free TCS, *thread is NULL if there is none.
    int spawn(CTrustThread **thread);
    void release_tcs(uint64_t tcs);

    uint64_t get_base() const { return m_base; }
    uint64_t get_size() const { return m_size; }
    size_t get_free_tcs_count();

private:
    uint64_t            m_base;
    uint64_t            m_size;
    vector<uint64_t>    m_free_tcs;
    Mutex               m_tcs_mutex;
    EnclaveEntry        *m_entry;
    Attester            *m_attester;
};

#endif
