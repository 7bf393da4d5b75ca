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

#include "keep/enclave.h"
#include "keep/tcs.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"

#include <errno.h>
#include <sys/mman.h>

CEnclave::CEnclave(uint64_t base, uint64_t size, const vector<uint64_t> &tcs, EnclaveEntry *entry, Attester *attester)
    : m_base(base), m_size(size), m_free_tcs(tcs), m_entry(entry), m_attester(attester)
{
}

CEnclave::~CEnclave()
{
    if(m_base != 0 && munmap(reinterpret_cast<void *>(m_base), (size_t)m_size) != 0)
        KEEP_TRACE(KEEP_TRACE_WARNING, "destroy SGX enclave failed, error = %d\n", errno);
}

int CEnclave::spawn(CTrustThread **thread)
{
    if(thread == NULL)
        return KEEP_ERROR_INVALID_PARAMETER;

    LockGuard lock(&m_tcs_mutex);
    if(m_free_tcs.empty())
    {
        *thread = NULL;
        return KEEP_SUCCESS;
    }

    uint64_t tcs = m_free_tcs.back();
    m_free_tcs.pop_back();
    *thread = new CTrustThread(tcs, this, m_entry, m_attester);
    return KEEP_SUCCESS;
}

void CEnclave::release_tcs(uint64_t tcs)
{
    LockGuard lock(&m_tcs_mutex);
    m_free_tcs.push_back(tcs);
}

size_t CEnclave::get_free_tcs_count()
{
    LockGuard lock(&m_tcs_mutex);
    return m_free_tcs.size();
}
