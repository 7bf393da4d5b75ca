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

#ifndef _KEEP_ENCLAVE_BUILDER_H_
#define _KEEP_ENCLAVE_BUILDER_H_

#include "segment_sink.h"
#include "enclave_entry.h"
#include "attestation.h"
#include "keep_lock.hpp"

#include <string>
#include <vector>

using std::vector;

class CEnclave;

// Builds the enclave through the SGX driver.
class EnclaveBuilderHW : public SegmentSink
{
public:
    explicit EnclaveBuilderHW(const std::string &device);
    ~EnclaveBuilderHW();

    bool open_device();
    int create_enclave(secs_t *secs);
    int add_pages(const uint8_t *src, uint64_t vpage, uint64_t count, const sec_info_t &sinfo, uint32_t flags);
    // EINIT with the signature and map the enclave. On failure the enclave is destroyed.
    int build(const enclave_css_t &css, EnclaveEntry *entry, Attester *attester, CEnclave **enclave);

    static int error_driver2keep(int ret, int err);

private:
    typedef struct _region_t
    {
        uint64_t    vpage;
        uint64_t    count;
        int         prot;
    } region_t;

    void close_device();
    void destroy_enclave();

    std::string         m_device;
    int                 m_hdevice;
    Mutex               m_dev_mutex;
    uint64_t            m_base;
    uint64_t            m_size;
    bool                m_initialized;
    vector<region_t>    m_regions;
    vector<uint64_t>    m_tcs;
};

#endif
