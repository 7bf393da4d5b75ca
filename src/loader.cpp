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

#include "keep/loader.h"
#include "keep/enclave_hasher.h"
#include "keep/signer.h"
#include "keep/enclave.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"
#include "keep/util.h"

#include <string.h>

/* log2 bounds for the enclave size note */
#define MIN_ENCLAVE_SIZE_LOG2   12
#define MAX_ENCLAVE_SIZE_LOG2   47

void keep_init_secs(secs_t *secs, uint64_t size, uint32_t ssa_frame_size, const enclave_params_t &params)
{
    memset(secs, 0, sizeof(*secs));
    secs->size = size;
    secs->ssa_frame_size = ssa_frame_size;
    secs->misc_select = params.misc_select;
    secs->attributes = params.attributes;
    secs->isv_prod_id = params.isv_prod_id;
    secs->isv_svn = params.isv_svn;
}

CLoader::CLoader(const Component &shim, const Component &code)
    : m_shim(shim), m_code(code), m_enclave_size(0), m_ssa_frame_size(0), m_slot(0), m_translated(false)
{
}

CLoader::~CLoader()
{
}

int CLoader::parse_layout()
{
    uint32_t bits = 0;
    int ret = m_shim.read_note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SIZE, &bits, sizeof(bits));
    if(ret != KEEP_SUCCESS)
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "shim has no enclave size note\n");
        return ret;
    }
    if(bits < MIN_ENCLAVE_SIZE_LOG2 || bits > MAX_ENCLAVE_SIZE_LOG2)
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "enclave size 2^%u is out of range\n", bits);
        return KEEP_ERROR_INVALID_ENCLAVE;
    }

    uint32_t ssap = 0;
    ret = m_shim.read_note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SSAP, &ssap, sizeof(ssap));
    if(ret != KEEP_SUCCESS)
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "shim has no SSA frame note\n");
        return ret;
    }
    if(ssap == 0)
        return KEEP_ERROR_INVALID_ENCLAVE;

    const Elf64_Phdr *slot = m_shim.find_header(PT_KEEP_CODE);
    if(slot == NULL)
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "shim has no code slot\n");
        return KEEP_ERROR_HEADER_MISSING;
    }
    if(!IS_PAGE_ALIGNED(slot->p_vaddr))
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "code slot %#lx is not page aligned\n", (unsigned long)slot->p_vaddr);
        return KEEP_ERROR_INVALID_ENCLAVE;
    }

    // The code is linked at 0, all of it has to fit into the slot.
    uint64_t start = 0, end = 0;
    if(!m_code.get_region(&start, &end))
        return KEEP_ERROR_INVALID_ENCLAVE;
    if(end > slot->p_memsz)
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "code needs %#lx bytes, the slot has %#lx\n",
                   (unsigned long)end, (unsigned long)slot->p_memsz);
        return KEEP_ERROR_SLOT_TOO_SMALL;
    }

    m_enclave_size = 1ULL << bits;
    m_ssa_frame_size = ssap;
    m_slot = slot->p_vaddr;
    if(m_slot + slot->p_memsz > m_enclave_size)
        return KEEP_ERROR_INVALID_ENCLAVE;

    KEEP_TRACE(KEEP_TRACE_DEBUG, "enclave size %#lx, ssa %u pages, code slot %#lx\n",
               (unsigned long)m_enclave_size, m_ssa_frame_size, (unsigned long)m_slot);
    return KEEP_SUCCESS;
}

int CLoader::translate()
{
    if(m_translated)
        return KEEP_ERROR_INVALID_STATE;

    int ret = parse_layout();
    if(ret != KEEP_SUCCESS)
        return ret;

    if((ret = keep_translate_segments(m_shim, m_code, m_slot, m_enclave_size, m_segments)) != KEEP_SUCCESS)
        return ret;

    m_translated = true;
    return KEEP_SUCCESS;
}

int CLoader::load_segments(secs_t *secs, SegmentSink **sinks, size_t count)
{
    if(!m_translated)
        return KEEP_ERROR_INVALID_STATE;

    int ret = KEEP_SUCCESS;
    for(size_t s = 0; s < count; s++)
    {
        if((ret = sinks[s]->create_enclave(secs)) != KEEP_SUCCESS)
            return ret;
    }

    for(size_t i = 0; i < m_segments.size(); i++)
    {
        const CSegment *segment = m_segments[i];
        if(segment->get_page_count() == 0)
            continue;

        for(size_t s = 0; s < count; s++)
        {
            ret = sinks[s]->add_pages(segment->get_pages(), segment->get_vpage(), segment->get_page_count(),
                                      segment->get_sec_info(), segment->get_flags());
            if(ret != KEEP_SUCCESS)
                return ret;
        }
    }

    return KEEP_SUCCESS;
}

int CLoader::hash_and_sign(secs_t *secs, SegmentSink *extra, const enclave_params_t &params,
                           const enclave_author_t &author, sgx_measurement_t *mr_enclave, enclave_css_t *enclave_css)
{
    EnclaveHasher hasher;
    SegmentSink *sinks[2] = { extra, &hasher };
    size_t first = (extra == NULL) ? 1 : 0;

    int ret = load_segments(secs, sinks + first, 2 - first);
    if(ret != KEEP_SUCCESS)
        return ret;

    if((ret = hasher.finish(mr_enclave)) != KEEP_SUCCESS)
        return ret;

    CSigner signer;
    if((ret = signer.generate_key()) != KEEP_SUCCESS)
        return ret;
    return signer.sign(*mr_enclave, params, author, enclave_css);
}

int CLoader::measure(const enclave_params_t &params, const enclave_author_t &author,
                     sgx_measurement_t *mr_enclave, enclave_css_t *enclave_css)
{
    if(mr_enclave == NULL || enclave_css == NULL)
        return KEEP_ERROR_INVALID_PARAMETER;

    int ret = KEEP_SUCCESS;
    if(!m_translated && (ret = translate()) != KEEP_SUCCESS)
        return ret;

    secs_t secs;
    keep_init_secs(&secs, m_enclave_size, m_ssa_frame_size, params);
    return hash_and_sign(&secs, NULL, params, author, mr_enclave, enclave_css);
}

int CLoader::load_enclave(EnclaveBuilderHW *builder, EnclaveEntry *entry, Attester *attester, CEnclave **enclave)
{
    if(builder == NULL || entry == NULL || enclave == NULL)
        return KEEP_ERROR_INVALID_PARAMETER;

    int ret = KEEP_SUCCESS;
    if(!m_translated && (ret = translate()) != KEEP_SUCCESS)
        return ret;

    enclave_params_t params;
    keep_default_params(&params);
    enclave_author_t author;
    memset(&author, 0, sizeof(author));

    secs_t secs;
    keep_init_secs(&secs, m_enclave_size, m_ssa_frame_size, params);

    sgx_measurement_t mr_enclave;
    enclave_css_t css;
    if((ret = hash_and_sign(&secs, builder, params, author, &mr_enclave, &css)) != KEEP_SUCCESS)
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "loading the enclave failed: %s\n", keep_strerror(ret));
        return ret;
    }

    return builder->build(css, entry, attester, enclave);
}
