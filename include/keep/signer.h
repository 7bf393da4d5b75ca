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

#ifndef _KEEP_SIGNER_H_
#define _KEEP_SIGNER_H_

#include "arch.h"
#include "uncopyable.h"

#include <openssl/evp.h>

#define SIGNATURE_SIZE      SE_KEY_SIZE
#define SIGNER_KEY_BITS     3072
#define SIGNER_EXPONENT     3

// Signs the enclave with a key generated for this enclave alone. The key
// is dropped after the first signature.
class CSigner: private Uncopyable
{
public:
    CSigner();
    ~CSigner();

    int generate_key();
    int sign(const sgx_measurement_t &mr_enclave, const enclave_params_t &params,
             const enclave_author_t &author, enclave_css_t *enclave_css);

private:
    EVP_PKEY    *m_key;
};

int keep_verify_css(const enclave_css_t *enclave_css);

// MRSIGNER, the SHA-256 of the signing key's modulus.
int keep_css_signer(const enclave_css_t *enclave_css, sgx_measurement_t *mr_signer);

#endif
