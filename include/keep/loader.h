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

#ifndef _KEEP_LOADER_H_
#define _KEEP_LOADER_H_

#include "arch.h"
#include "component.h"
#include "segment.h"
#include "segment_sink.h"
#include "enclave_builder.h"
#include "uncopyable.h"

class CEnclave;

// Loads a shim and the code it hosts into one enclave.
//
// The shim's notes give the enclave geometry and its PT_KEEP_CODE header
// gives the slot the code is relocated into.
class CLoader: private Uncopyable
{
public:
    CLoader(const Component &shim, const Component &code);
    ~CLoader();

    int parse_layout();
    int translate();

    // Feed every segment to each sink, in one pass.
    int load_segments(secs_t *secs, SegmentSink **sinks, size_t count);

    // Hash the enclave without hardware and sign the result.
    int measure(const enclave_params_t &params, const enclave_author_t &author,
                sgx_measurement_t *mr_enclave, enclave_css_t *enclave_css);

    int load_enclave(EnclaveBuilderHW *builder, EnclaveEntry *entry, Attester *attester, CEnclave **enclave);

    uint64_t get_enclave_size() const { return m_enclave_size; }
    uint32_t get_ssa_frame_size() const { return m_ssa_frame_size; }
    uint64_t get_slot() const { return m_slot; }
    const CSegmentList& get_segments() const { return m_segments; }

private:
    int hash_and_sign(secs_t *secs, SegmentSink *extra, const enclave_params_t &params,
                      const enclave_author_t &author, sgx_measurement_t *mr_enclave, enclave_css_t *enclave_css);

    const Component     &m_shim;
    const Component     &m_code;
    uint64_t            m_enclave_size;
    uint32_t            m_ssa_frame_size;
    uint64_t            m_slot;
    bool                m_translated;
    CSegmentList        m_segments;
};

#endif
