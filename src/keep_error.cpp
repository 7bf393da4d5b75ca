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

#include "keep/keep_error.h"
#include "keep/util.h"

typedef struct _status_message_t
{
    int         status;
    const char *message;
} status_message_t;

static const status_message_t status_messages[] = {
    { KEEP_SUCCESS,                   "Success" },
    { KEEP_ERROR_UNEXPECTED,          "Unexpected error" },
    { KEEP_ERROR_INVALID_PARAMETER,   "Invalid parameter" },
    { KEEP_ERROR_OUT_OF_MEMORY,       "Unable to allocate memory" },
    { KEEP_ERROR_INVALID_STATE,       "Operation is not valid in the current state" },
    { KEEP_ERROR_INVALID_ENCLAVE,     "The enclave image is not valid" },
    { KEEP_ERROR_NOTE_MISSING,        "A required note is missing from the image" },
    { KEEP_ERROR_HEADER_MISSING,      "A required program header is missing from the image" },
    { KEEP_ERROR_SLOT_TOO_SMALL,      "The code does not fit into the code slot of the shim" },
    { KEEP_ERROR_NO_DEVICE,           "Unable to open the SGX device" },
    { KEEP_ERROR_DEVICE_BUSY,         "The SGX device is busy" },
    { KEEP_ERROR_INVALID_SIGNATURE,   "The enclave signature was rejected" },
    { KEEP_ERROR_INVALID_ATTRIBUTE,   "The enclave is not authorized to use its attributes" },
    { KEEP_ERROR_INVALID_MEASUREMENT, "The enclave measurement does not match its signature" },
    { KEEP_ERROR_INVALID_CPUSVN,      "Invalid CPU SVN" },
    { KEEP_ERROR_INVALID_ISVSVN,      "Invalid ISV SVN" },
    { KEEP_ERROR_NO_VDSO,             "The kernel does not provide __vdso_sgx_enter_enclave" },
    { KEEP_ERROR_CRYPTO,              "A cryptographic operation failed" },
    { KEEP_ERROR_ATTESTATION,         "Unable to retrieve attestation evidence" },
};

const char *keep_strerror(int status)
{
    for(size_t i = 0; i < ARRAY_LENGTH(status_messages); i++)
    {
        if(status_messages[i].status == status)
            return status_messages[i].message;
    }
    return "Unknown error";
}
