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

#include "keep/backend.h"
#include "keep/loader.h"
#include "keep/elf_component.h"
#include "keep/enclave_builder.h"
#include "keep/enclave_entry.h"
#include "keep/attestation.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"
#include "keep/keep_lock.hpp"

#include <cpuid.h>
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#define CPUID_FEATURE_LEAF      0x07
#define CPUID_SGX_LEAF          0x12
#define CPUID_SGX_EPC_SUBLEAF   2

#define FEATURE_SGX_BIT         (1U << 2)       /* leaf 7, ebx */
#define FEATURE_SGX_LC_BIT      (1U << 30)      /* leaf 7, ecx */
#define SGX_CAP_SGX1_BIT        (1U << 0)       /* leaf 0x12, eax */
#define SGX_CAP_SGX2_BIT        (1U << 1)

#define EPC_SECTION_VALID       0x1

static keep_datum_t make_datum(const char *name, bool pass, const std::string &info, const char *mesg)
{
    keep_datum_t datum;
    datum.name = name;
    datum.pass = pass;
    datum.info = info;
    datum.mesg = pass ? "" : mesg;
    return datum;
}

static std::string to_string(uint64_t value)
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%llu", (unsigned long long)value);
    return buf;
}

void keep_cpuid_data(vector<keep_datum_t> &list)
{
    unsigned int eax = 0, ebx = 0, ecx = 0, edx = 0;
    unsigned int max_leaf = __get_cpuid_max(0, NULL);

    // The vendor string is ebx, edx, ecx in that order.
    char vendor[13];
    memset(vendor, 0, sizeof(vendor));
    __cpuid(0, eax, ebx, ecx, edx);
    memcpy(vendor, &ebx, 4);
    memcpy(vendor + 4, &edx, 4);
    memcpy(vendor + 8, &ecx, 4);
    list.push_back(make_datum("CPU Manufacturer", true, vendor, ""));

    bool sgx = false, lc = false;
    if(max_leaf >= CPUID_FEATURE_LEAF)
    {
        __cpuid_count(CPUID_FEATURE_LEAF, 0, eax, ebx, ecx, edx);
        sgx = (ebx & FEATURE_SGX_BIT) != 0;
        lc = (ecx & FEATURE_SGX_LC_BIT) != 0;
    }
    list.push_back(make_datum(" Intel SGX", sgx, "", "the CPU does not support SGX"));

    bool sgx1 = false, sgx2 = false;
    uint64_t max_size = 0;
    if(max_leaf >= CPUID_SGX_LEAF)
    {
        __cpuid_count(CPUID_SGX_LEAF, 0, eax, ebx, ecx, edx);
        sgx1 = (eax & SGX_CAP_SGX1_BIT) != 0;
        sgx2 = (eax & SGX_CAP_SGX2_BIT) != 0;
        unsigned int bits = (edx >> 8) & 0xFF;
        if(bits < 64)
            max_size = 1ULL << bits;
    }
    list.push_back(make_datum("  SGX1 Support", sgx1, "", "the CPU does not support SGX1"));
    list.push_back(make_datum("  SGX2 Support", sgx2, "", "the CPU does not support SGX2"));
    list.push_back(make_datum("  MaxEnclaveSize_64", max_size != 0, to_string(max_size), "no maximum enclave size reported"));
    list.push_back(make_datum(" Flexible Launch Control", lc, "", "the CPU does not support flexible launch control"));
}

uint64_t keep_epc_size(void)
{
    if(__get_cpuid_max(0, NULL) < CPUID_SGX_LEAF)
        return 0;

    uint64_t total = 0;
    for(unsigned int sub = CPUID_SGX_EPC_SUBLEAF; ; sub++)
    {
        unsigned int eax = 0, ebx = 0, ecx = 0, edx = 0;
        __cpuid_count(CPUID_SGX_LEAF, sub, eax, ebx, ecx, edx);
        if((eax & 0xF) != EPC_SECTION_VALID)
            break;

        // Bits 31:12 of ecx, then 51:32 from edx.
        uint64_t size = ((uint64_t)(edx & 0xFFFFF) << 32) | (uint64_t)(ecx & 0xFFFFF000);
        total += size;
    }
    return total;
}

SgxBackend::SgxBackend(const keep_config_t &config)
    : m_config(config)
{
}

keep_datum_t SgxBackend::driver_datum() const
{
    std::string name = "Driver: " + m_config.device;
    int fd = open(m_config.device.c_str(), O_RDWR | O_CLOEXEC);
    if(fd == -1)
    {
        KEEP_TRACE(KEEP_TRACE_NOTICE, "open %s failed, errno = %d\n", m_config.device.c_str(), errno);
        return make_datum(name.c_str(), false, "", "the SGX device can not be opened read-write");
    }
    close(fd);
    return make_datum(name.c_str(), true, "", "");
}

bool SgxBackend::have()
{
    return driver_datum().pass;
}

int SgxBackend::shim(vector<uint8_t> &bytes)
{
    if(m_config.shim_path.empty())
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "no shim configured, set %s\n", KEEP_ENV_SHIM);
        return KEEP_ERROR_INVALID_PARAMETER;
    }
    return keep_read_file(m_config.shim_path.c_str(), bytes);
}

void SgxBackend::data(vector<keep_datum_t> &list)
{
    list.push_back(driver_datum());
    keep_cpuid_data(list);

    if(__get_cpuid_max(0, NULL) >= CPUID_SGX_LEAF)
    {
        uint64_t epc = keep_epc_size();
        list.push_back(make_datum(" EPC Size", epc != 0, to_string(epc), "no EPC section enumerated"));
    }
}

int SgxBackend::build(const Component &shim, const Component &code, CEnclave **enclave)
{
    // One entry point for the process, resolved on first use.
    static VdsoEntry vdso;
    static Mutex vdso_mutex;

    int ret = KEEP_SUCCESS;
    {
        LockGuard lock(&vdso_mutex);
        ret = vdso.resolve();
    }
    if(ret != KEEP_SUCCESS)
        return ret;

    EnclaveBuilderHW builder(m_config.device);
    CLoader loader(shim, code);
    return loader.load_enclave(&builder, &vdso, get_default_attester(), enclave);
}
