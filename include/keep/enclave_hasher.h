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

#ifndef _KEEP_ENCLAVE_HASHER_H_
#define _KEEP_ENCLAVE_HASHER_H_

#include "segment_sink.h"
#include <openssl/evp.h>

#define SIZE_NAMED_VALUE 8

// Computes MRENCLAVE by replaying ECREATE, EADD and EEXTEND into SHA-256.
class EnclaveHasher : public SegmentSink
{
public:
    EnclaveHasher();
    ~EnclaveHasher();
    int create_enclave(secs_t *secs);
    int add_pages(const uint8_t *src, uint64_t vpage, uint64_t count, const sec_info_t &sinfo, uint32_t flags);
    // Finalize the digest, no page can be added afterwards.
    int finish(sgx_measurement_t *mr_enclave);
    uint64_t get_quota() const { return m_quota; }
private:
    int add_page(const uint8_t *src, uint64_t offset, const sec_info_t &sinfo, uint32_t flags);
    EVP_MD_CTX *m_ctx;
    bool m_finished;
    uint64_t m_quota;
};

#endif
