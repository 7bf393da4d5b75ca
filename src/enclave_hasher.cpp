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

/**
* File:
*     enclave_hasher.cpp
* Description:
*     Measure the necessary information of the enclave
* to calculate the HASH value using SHA256 algorithm.
*/

#include "keep/enclave_hasher.h"
#include "keep/segment.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"
#include "keep/util.h"

#include <string.h>
#include <openssl/err.h>

#define DATA_BLOCK_SIZE 64
#define EEXTEND_TIME    4

EnclaveHasher::EnclaveHasher()
    : m_ctx(NULL), m_finished(false), m_quota(0)
{
}

EnclaveHasher::~EnclaveHasher()
{
    if(m_ctx)
        EVP_MD_CTX_free(m_ctx);
}

int EnclaveHasher::create_enclave(secs_t *secs)
{
    if(!secs)
    {
        keep_trace(KEEP_TRACE_DEBUG, "ERROR: Bad pointer.\n");
        return KEEP_ERROR_INVALID_PARAMETER;
    }
    if(m_ctx != NULL)
        return KEEP_ERROR_INVALID_STATE;

    if((m_ctx = EVP_MD_CTX_new()) == NULL)
    {
        keep_trace(KEEP_TRACE_DEBUG, "ERROR - EVP_MD_CTX_new: %s.\n", ERR_error_string(ERR_get_error(), NULL));
        return KEEP_ERROR_CRYPTO;
    }
    if(EVP_DigestInit_ex(m_ctx, EVP_sha256(), NULL) != 1)
    {
        keep_trace(KEEP_TRACE_DEBUG, "ERROR - EVP_DigestInit_ex: %s.\n", ERR_error_string(ERR_get_error(), NULL));
        return KEEP_ERROR_CRYPTO;
    }

    uint8_t ecreat_val[SIZE_NAMED_VALUE] = "ECREATE";

    uint8_t data_block[DATA_BLOCK_SIZE];
    size_t offset = 0;
    memset(data_block, 0, DATA_BLOCK_SIZE);
    memcpy(data_block, ecreat_val, SIZE_NAMED_VALUE);
    offset += SIZE_NAMED_VALUE;
    memcpy(&data_block[offset], &secs->ssa_frame_size, sizeof(secs->ssa_frame_size));
    offset += sizeof(secs->ssa_frame_size);
    memcpy(&data_block[offset], &secs->size, sizeof(secs->size));

    if(EVP_DigestUpdate(m_ctx, &data_block, DATA_BLOCK_SIZE) != 1)
    {
        keep_trace(KEEP_TRACE_DEBUG, "ERROR - EVP_DigestUpdate: %s.\n", ERR_error_string(ERR_get_error(), NULL));
        return KEEP_ERROR_CRYPTO;
    }

    return KEEP_SUCCESS;
}

int EnclaveHasher::add_pages(const uint8_t *src, uint64_t vpage, uint64_t count, const sec_info_t &sinfo, uint32_t flags)
{
    if(m_ctx == NULL || m_finished)
        return KEEP_ERROR_INVALID_STATE;

    for(unsigned int i = 0; i < sizeof(sinfo.reserved)/sizeof(sinfo.reserved[0]); i++)
    {
        if(sinfo.reserved[i] != 0)
            return KEEP_ERROR_INVALID_PARAMETER;
    }
    /* sinfo.flags[64:16] should be 0 */
    if((sinfo.flags & (~SI_FLAGS_EXTERNAL)) != 0)
    {
        return KEEP_ERROR_INVALID_PARAMETER;
    }

    for(uint64_t i = 0; i < count; i++)
    {
        int ret = add_page(src + (i << SE_PAGE_SHIFT), (vpage + i) << SE_PAGE_SHIFT, sinfo, flags);
        if(ret != KEEP_SUCCESS)
            return ret;
    }
    return KEEP_SUCCESS;
}

int EnclaveHasher::add_page(const uint8_t *src, uint64_t offset, const sec_info_t &sinfo, uint32_t flags)
{
    uint64_t page_offset = offset;
    uint8_t eadd_val[SIZE_NAMED_VALUE] = "EADD\0\0\0";

    uint8_t data_block[DATA_BLOCK_SIZE];
    size_t db_offset = 0;
    memset(data_block, 0, DATA_BLOCK_SIZE);
    memcpy(data_block, eadd_val, SIZE_NAMED_VALUE);
    db_offset += SIZE_NAMED_VALUE;
    memcpy(data_block+db_offset, &page_offset, sizeof(page_offset));
    db_offset += sizeof(page_offset);
    memcpy(data_block+db_offset, &sinfo, sizeof(data_block)-db_offset);
    if(EVP_DigestUpdate(m_ctx, data_block, DATA_BLOCK_SIZE) != 1)
    {
        keep_trace(KEEP_TRACE_DEBUG, "ERROR - EVP_DigestUpdate: %s.\n", ERR_error_string(ERR_get_error(), NULL));
        return KEEP_ERROR_CRYPTO;
    }

    /* If the page need to eextend, do eextend. */
    if(flags & ADD_PAGE_MEASURE)
    {
        const uint8_t *pdata = src;
        uint8_t eextend_val[SIZE_NAMED_VALUE] = "EEXTEND";

        for(int i = 0; i < SE_PAGE_SIZE; i += (DATA_BLOCK_SIZE * EEXTEND_TIME))
        {
            db_offset = 0;
            memset(data_block, 0, DATA_BLOCK_SIZE);
            memcpy(data_block, eextend_val, SIZE_NAMED_VALUE);
            db_offset += SIZE_NAMED_VALUE;
            memcpy(data_block+db_offset, &page_offset, sizeof(page_offset));
            if(EVP_DigestUpdate(m_ctx, data_block, DATA_BLOCK_SIZE) != 1)
            {
                keep_trace(KEEP_TRACE_DEBUG, "ERROR - EVP_DigestUpdate: %s.\n", ERR_error_string(ERR_get_error(), NULL));
                return KEEP_ERROR_CRYPTO;
            }

            if(EVP_DigestUpdate(m_ctx, pdata, DATA_BLOCK_SIZE * EEXTEND_TIME) != 1)
            {
                keep_trace(KEEP_TRACE_DEBUG, "ERROR - EVP_DigestUpdate: %s.\n", ERR_error_string(ERR_get_error(), NULL));
                return KEEP_ERROR_CRYPTO;
            }
            pdata += DATA_BLOCK_SIZE * EEXTEND_TIME;
            page_offset += DATA_BLOCK_SIZE * EEXTEND_TIME;
        }
    }

    m_quota += SE_PAGE_SIZE;
    return KEEP_SUCCESS;
}

int EnclaveHasher::finish(sgx_measurement_t *mr_enclave)
{
    if(mr_enclave == NULL)
        return KEEP_ERROR_INVALID_PARAMETER;
    if(m_ctx == NULL || m_finished)
        return KEEP_ERROR_INVALID_STATE;

    unsigned int hash_len = 0;

    /* Complete computation of the SHA256 digest and store the result into the hash. */
    if(EVP_DigestFinal_ex(m_ctx, mr_enclave->m, &hash_len) != 1 || hash_len != SGX_HASH_SIZE)
    {
        keep_trace(KEEP_TRACE_DEBUG, "ERROR - EVP_DigestFinal_ex: %s.\n", ERR_error_string(ERR_get_error(), NULL));
        return KEEP_ERROR_CRYPTO;
    }

    m_finished = true;
    return KEEP_SUCCESS;
}
