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
*     signer.cpp
* Description:
*     Fill the enclave signature structure and sign it with an
* ephemeral RSA-3072 key.
*/

#include "keep/signer.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"

#include <string.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/param_build.h>
#include <openssl/rsa.h>

#define TRACE_OPENSSL(fn) \
    keep_trace(KEEP_TRACE_DEBUG, "ERROR - " fn ": %s.\n", ERR_error_string(ERR_get_error(), NULL))

void keep_default_params(enclave_params_t *params)
{
    memset(params, 0, sizeof(*params));
    params->misc_select = 0;
    params->misc_mask = 0xFFFFFFFF;
    params->attributes.flags = SGX_FLAGS_MODE64BIT;
    params->attributes.xfrm = SGX_XFRM_LEGACY;
    params->attribute_mask.flags = ~SGX_FLAGS_DEBUG;
    params->attribute_mask.xfrm = ~0ULL;
    params->isv_prod_id = 0;
    params->isv_svn = 0;
}

static void fill_enclave_css(const sgx_measurement_t &mr_enclave, const enclave_params_t &params,
                             const enclave_author_t &author, enclave_css_t *enclave_css)
{
    memset(enclave_css, 0, sizeof(*enclave_css));

    //*****fill the header*******************
    uint8_t header[12] = {6, 0, 0, 0, 0xE1, 0, 0, 0, 0, 0, 1, 0};
    uint8_t header2[16] = {1, 1, 0, 0, 0x60, 0, 0, 0, 0x60, 0, 0, 0, 1, 0, 0, 0};
    memcpy(&enclave_css->header.header, &header, sizeof(header));
    memcpy(&enclave_css->header.header2, &header2, sizeof(header2));

    enclave_css->header.type = 0;
    enclave_css->header.module_vendor = author.vendor;
    enclave_css->header.date = author.date;
    enclave_css->header.hw_version = author.swdefined;

    //*****fill the body*********************
    enclave_css->body.misc_select = params.misc_select;
    enclave_css->body.misc_mask = params.misc_mask;
    enclave_css->body.attributes = params.attributes;
    enclave_css->body.attribute_mask = params.attribute_mask;
    enclave_css->body.enclave_hash = mr_enclave;
    enclave_css->body.isv_prod_id = params.isv_prod_id;
    enclave_css->body.isv_svn = params.isv_svn;
}

static bool calc_RSAq1q2(int length_s, const uint8_t *data_s, int length_m, const uint8_t *data_m,
    uint8_t *data_q1, uint8_t *data_q2)
{
    bool ret = false;
    BIGNUM *ptemp1=NULL, *ptemp2=NULL, *pQ1=NULL, *pQ2=NULL, *pM=NULL, *pS = NULL;
    BN_CTX *ctx = NULL;

    do{
        if((ptemp1 = BN_new()) == NULL)
            break;
        if((ptemp2 = BN_new()) == NULL)
            break;
        if((pQ1 = BN_new()) == NULL)
            break;
        if((pQ2 = BN_new()) == NULL)
            break;
        if(BN_bin2bn(data_m, length_m, pM = BN_new()) == NULL)
            break;
        if(BN_bin2bn(data_s, length_s, pS = BN_new()) == NULL)
            break;
        if((ctx = BN_CTX_new()) == NULL)
            break;

        //q1 = floor(signature*signature/modulus)
        //q2 = floor((signature*signature.signature - q1*signature*Modulus)/Modulus)
        if(BN_mul(ptemp1, pS, pS, ctx) != 1)
            break;
        if(BN_div(pQ1, ptemp2, ptemp1, pM, ctx) !=1)
            break;
        if(BN_mul(ptemp1, pS, ptemp2, ctx) !=1)
            break;
        if(BN_div(pQ2, ptemp2, ptemp1, pM, ctx) !=1)
            break;

        // Both fit in the key size, stored little endian.
        if(BN_bn2lebinpad(pQ1, data_q1, SE_KEY_SIZE) != SE_KEY_SIZE)
            break;
        if(BN_bn2lebinpad(pQ2, data_q2, SE_KEY_SIZE) != SE_KEY_SIZE)
            break;
        ret = true;
    }while(0);

    BN_clear_free(ptemp1);
    BN_clear_free(ptemp2);
    BN_clear_free(pQ1);
    BN_clear_free(pQ2);
    BN_clear_free(pS);
    BN_clear_free(pM);
    BN_CTX_free(ctx);
    return ret;
}

static void signed_data(const enclave_css_t *enclave_css, uint8_t *buffer)
{
    memcpy(buffer, &enclave_css->header, sizeof(enclave_css->header));
    memcpy(buffer + sizeof(enclave_css->header), &enclave_css->body, sizeof(enclave_css->body));
}

CSigner::CSigner()
    : m_key(NULL)
{
}

CSigner::~CSigner()
{
    EVP_PKEY_free(m_key);
}

int CSigner::generate_key()
{
    if(m_key != NULL)
        return KEEP_ERROR_INVALID_STATE;

    int ret = KEEP_ERROR_CRYPTO;
    EVP_PKEY_CTX *ctx = NULL;
    BIGNUM *exponent = NULL;

    do{
        if((ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, NULL)) == NULL)
        {
            TRACE_OPENSSL("EVP_PKEY_CTX_new_id");
            break;
        }
        if(EVP_PKEY_keygen_init(ctx) != 1)
        {
            TRACE_OPENSSL("EVP_PKEY_keygen_init");
            break;
        }
        if(EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, SIGNER_KEY_BITS) != 1)
        {
            TRACE_OPENSSL("EVP_PKEY_CTX_set_rsa_keygen_bits");
            break;
        }
        if((exponent = BN_new()) == NULL || BN_set_word(exponent, SIGNER_EXPONENT) != 1)
        {
            TRACE_OPENSSL("BN_set_word");
            break;
        }
        if(EVP_PKEY_CTX_set1_rsa_keygen_pubexp(ctx, exponent) != 1)
        {
            TRACE_OPENSSL("EVP_PKEY_CTX_set1_rsa_keygen_pubexp");
            break;
        }
        if(EVP_PKEY_keygen(ctx, &m_key) != 1)
        {
            TRACE_OPENSSL("EVP_PKEY_keygen");
            break;
        }
        ret = KEEP_SUCCESS;
    }while(0);

    BN_free(exponent);
    EVP_PKEY_CTX_free(ctx);
    return ret;
}

int CSigner::sign(const sgx_measurement_t &mr_enclave, const enclave_params_t &params,
                  const enclave_author_t &author, enclave_css_t *enclave_css)
{
    if(enclave_css == NULL)
        return KEEP_ERROR_INVALID_PARAMETER;
    if(m_key == NULL)
        return KEEP_ERROR_INVALID_STATE;

    fill_enclave_css(mr_enclave, params, author, enclave_css);

    int ret = KEEP_ERROR_CRYPTO;
    BIGNUM *modulus = NULL;
    EVP_MD_CTX *mdctx = NULL;
    uint8_t signature[SIGNATURE_SIZE];    // keep the signature in big endian
    uint8_t modulus_be[SE_KEY_SIZE];
    uint8_t buffer[sizeof(css_header_t) + sizeof(css_body_t)];
    size_t siglen = sizeof(signature);

    do{
        //**********fill the key*****************
        if(EVP_PKEY_get_bn_param(m_key, OSSL_PKEY_PARAM_RSA_N, &modulus) != 1)
        {
            TRACE_OPENSSL("EVP_PKEY_get_bn_param");
            break;
        }
        if(BN_bn2lebinpad(modulus, enclave_css->key.modulus, SE_KEY_SIZE) != SE_KEY_SIZE
                || BN_bn2binpad(modulus, modulus_be, SE_KEY_SIZE) != SE_KEY_SIZE)
        {
            TRACE_OPENSSL("BN_bn2lebinpad");
            break;
        }
        uint32_t exponent = SIGNER_EXPONENT;
        memcpy(enclave_css->key.exponent, &exponent, sizeof(exponent));

        //**********get the signature*********
        signed_data(enclave_css, buffer);
        if((mdctx = EVP_MD_CTX_new()) == NULL)
        {
            TRACE_OPENSSL("EVP_MD_CTX_new");
            break;
        }
        if(EVP_DigestSignInit(mdctx, NULL, EVP_sha256(), NULL, m_key) != 1)
        {
            TRACE_OPENSSL("EVP_DigestSignInit");
            break;
        }
        if(EVP_DigestSign(mdctx, signature, &siglen, buffer, sizeof(buffer)) != 1 || siglen != SIGNATURE_SIZE)
        {
            TRACE_OPENSSL("EVP_DigestSign");
            break;
        }
        for(int i = 0; i<SIGNATURE_SIZE; i++)
        {
            (enclave_css->key.signature)[i] = signature[SIGNATURE_SIZE-1-i];
        }

        //************************calculate q1 and q2*********************
        if(!calc_RSAq1q2(SIGNATURE_SIZE, signature, SE_KEY_SIZE, modulus_be,
                         enclave_css->buffer.q1, enclave_css->buffer.q2))
        {
            TRACE_OPENSSL("calc_RSAq1q2");
            break;
        }
        ret = KEEP_SUCCESS;
    }while(0);

    EVP_MD_CTX_free(mdctx);
    BN_free(modulus);

    // One signature per key.
    EVP_PKEY_free(m_key);
    m_key = NULL;
    return ret;
}

static EVP_PKEY *load_public_key(const enclave_css_t *enclave_css)
{
    EVP_PKEY *pkey = NULL;
    BIGNUM *n = NULL, *e = NULL;
    OSSL_PARAM_BLD *bld = NULL;
    OSSL_PARAM *params = NULL;
    EVP_PKEY_CTX *ctx = NULL;

    do{
        if((n = BN_lebin2bn(enclave_css->key.modulus, SE_KEY_SIZE, NULL)) == NULL)
            break;
        if((e = BN_lebin2bn(enclave_css->key.exponent, SE_EXPONENT_SIZE, NULL)) == NULL)
            break;
        if((bld = OSSL_PARAM_BLD_new()) == NULL)
            break;
        if(OSSL_PARAM_BLD_push_BN(bld, OSSL_PKEY_PARAM_RSA_N, n) != 1
                || OSSL_PARAM_BLD_push_BN(bld, OSSL_PKEY_PARAM_RSA_E, e) != 1)
            break;
        if((params = OSSL_PARAM_BLD_to_param(bld)) == NULL)
            break;
        if((ctx = EVP_PKEY_CTX_new_from_name(NULL, "RSA", NULL)) == NULL)
            break;
        if(EVP_PKEY_fromdata_init(ctx) != 1 || EVP_PKEY_fromdata(ctx, &pkey, EVP_PKEY_PUBLIC_KEY, params) != 1)
        {
            pkey = NULL;
            break;
        }
    }while(0);

    if(pkey == NULL)
        TRACE_OPENSSL("load_public_key");

    EVP_PKEY_CTX_free(ctx);
    OSSL_PARAM_free(params);
    OSSL_PARAM_BLD_free(bld);
    BN_free(e);
    BN_free(n);
    return pkey;
}

int keep_verify_css(const enclave_css_t *enclave_css)
{
    if(enclave_css == NULL)
        return KEEP_ERROR_INVALID_PARAMETER;

    EVP_PKEY *pkey = load_public_key(enclave_css);
    if(pkey == NULL)
        return KEEP_ERROR_CRYPTO;

    uint8_t buffer[sizeof(css_header_t) + sizeof(css_body_t)];
    signed_data(enclave_css, buffer);

    uint8_t signature[SIGNATURE_SIZE];
    for(int i=0; i<SIGNATURE_SIZE; i++)
    {
        signature[i] = enclave_css->key.signature[SIGNATURE_SIZE-1-i];
    }

    int ret = KEEP_ERROR_INVALID_SIGNATURE;
    EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
    if(mdctx != NULL
            && EVP_DigestVerifyInit(mdctx, NULL, EVP_sha256(), NULL, pkey) == 1
            && EVP_DigestVerify(mdctx, signature, SIGNATURE_SIZE, buffer, sizeof(buffer)) == 1)
    {
        ret = KEEP_SUCCESS;
    }
    else
    {
        ERR_clear_error();
    }

    EVP_MD_CTX_free(mdctx);
    EVP_PKEY_free(pkey);
    return ret;
}

int keep_css_signer(const enclave_css_t *enclave_css, sgx_measurement_t *mr_signer)
{
    if(enclave_css == NULL || mr_signer == NULL)
        return KEEP_ERROR_INVALID_PARAMETER;

    unsigned int hash_size = SGX_HASH_SIZE;
    if(EVP_Digest(enclave_css->key.modulus, SE_KEY_SIZE, mr_signer->m, &hash_size, EVP_sha256(), NULL) != 1)
    {
        TRACE_OPENSSL("EVP_Digest");
        return KEEP_ERROR_CRYPTO;
    }
    return KEEP_SUCCESS;
}
