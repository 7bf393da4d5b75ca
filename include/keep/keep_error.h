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

#ifndef _KEEP_ERROR_H_
#define _KEEP_ERROR_H_

#define KEEP_MK_ERROR(x)              (0x00000000|(x))

typedef enum _keep_status_t
{
    KEEP_SUCCESS                  = KEEP_MK_ERROR(0x0000),

    KEEP_ERROR_UNEXPECTED         = KEEP_MK_ERROR(0x0001),      /* Unexpected error */
    KEEP_ERROR_INVALID_PARAMETER  = KEEP_MK_ERROR(0x0002),      /* The parameter is incorrect */
    KEEP_ERROR_OUT_OF_MEMORY      = KEEP_MK_ERROR(0x0003),      /* Not enough memory is available to complete this operation */
    KEEP_ERROR_INVALID_STATE      = KEEP_MK_ERROR(0x0004),      /* The operation is not valid in the current state */

    KEEP_ERROR_INVALID_ENCLAVE    = KEEP_MK_ERROR(0x1001),      /* The enclave image is not correct */
    KEEP_ERROR_NOTE_MISSING       = KEEP_MK_ERROR(0x1002),      /* A required note is missing from the image */
    KEEP_ERROR_HEADER_MISSING     = KEEP_MK_ERROR(0x1003),      /* A required program header is missing from the image */
    KEEP_ERROR_SLOT_TOO_SMALL     = KEEP_MK_ERROR(0x1004),      /* The code image does not fit into the shim's code slot */

    KEEP_ERROR_NO_DEVICE          = KEEP_MK_ERROR(0x2001),      /* Can't open the SGX device */
    KEEP_ERROR_DEVICE_BUSY        = KEEP_MK_ERROR(0x2002),      /* SGX device was busy */
    KEEP_ERROR_INVALID_SIGNATURE  = KEEP_MK_ERROR(0x2003),      /* The signature of the enclave is rejected */
    KEEP_ERROR_INVALID_ATTRIBUTE  = KEEP_MK_ERROR(0x2004),      /* The enclave is not authorized to use these attributes */
    KEEP_ERROR_INVALID_MEASUREMENT= KEEP_MK_ERROR(0x2005),      /* The measurement does not match the signature */
    KEEP_ERROR_INVALID_CPUSVN     = KEEP_MK_ERROR(0x2006),      /* The cpu svn is beyond platform's cpu svn value */
    KEEP_ERROR_INVALID_ISVSVN     = KEEP_MK_ERROR(0x2007),      /* The isv svn is greater than the enclave's isv svn */
    KEEP_ERROR_NO_VDSO            = KEEP_MK_ERROR(0x2008),      /* The kernel does not export the enclave entry function */

    KEEP_ERROR_CRYPTO             = KEEP_MK_ERROR(0x3001),      /* A cryptographic operation failed */
    KEEP_ERROR_ATTESTATION        = KEEP_MK_ERROR(0x3002),      /* Attestation evidence could not be retrieved */
} keep_status_t;

#ifdef __cplusplus
extern "C" {
#endif
const char *keep_strerror(int status);
#ifdef __cplusplus
}
#endif

#endif
