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

#ifndef _KEEP_BACKEND_H_
#define _KEEP_BACKEND_H_

#include "component.h"
#include "config.h"
#include "uncopyable.h"

#include <stdint.h>
#include <string>
#include <vector>

using std::vector;

class CEnclave;

/* One line of the platform capability report */
typedef struct _keep_datum_t
{
    std::string name;
    bool        pass;
    std::string info;       /* value, empty if there is none */
    std::string mesg;       /* explanation when the check fails */
} keep_datum_t;

// A trusted execution technology able to host a keep.
class Backend : private Uncopyable
{
public:
    virtual ~Backend() {}

    virtual const char *name() const = 0;
    // Whether the platform can run an enclave of this kind.
    virtual bool have() = 0;
    // Read the runtime image hosting the code.
    virtual int shim(vector<uint8_t> &bytes) = 0;
    virtual void data(vector<keep_datum_t> &list) = 0;
    virtual int build(const Component &shim, const Component &code, CEnclave **enclave) = 0;
};

class SgxBackend : public Backend
{
public:
    explicit SgxBackend(const keep_config_t &config);

    const char *name() const { return "sgx"; }
    bool have();
    int shim(vector<uint8_t> &bytes);
    void data(vector<keep_datum_t> &list);
    int build(const Component &shim, const Component &code, CEnclave **enclave);

private:
    keep_datum_t driver_datum() const;

    keep_config_t   m_config;
};

void keep_cpuid_data(vector<keep_datum_t> &list);

// Total EPC in bytes from the CPUID enumeration, 0 if SGX is not enumerated.
uint64_t keep_epc_size(void);

#endif
