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

#include "keep/enclave_builder.h"
#include "keep/enclave.h"
#include "keep/segment.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"
#include "keep/util.h"

#include <errno.h>
#include <fcntl.h>
#include <stddef.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <asm/sgx.h>

/* The page add descriptor layout the kernel expects */
se_static_assert(offsetof(struct sgx_enclave_add_pages, src) == 0);
se_static_assert(offsetof(struct sgx_enclave_add_pages, offset) == 8);
se_static_assert(offsetof(struct sgx_enclave_add_pages, length) == 16);
se_static_assert(offsetof(struct sgx_enclave_add_pages, secinfo) == 24);
se_static_assert(offsetof(struct sgx_enclave_add_pages, flags) == 32);
se_static_assert(offsetof(struct sgx_enclave_add_pages, count) == 40);
se_static_assert(SGX_PAGE_MEASURE == ADD_PAGE_MEASURE);

EnclaveBuilderHW::EnclaveBuilderHW(const std::string &device):
    m_device(device),
    m_hdevice(-1),
    m_base(0),
    m_size(0),
    m_initialized(false)
{
}

EnclaveBuilderHW::~EnclaveBuilderHW()
{
    destroy_enclave();
    close_device();
}

int EnclaveBuilderHW::error_driver2keep(int ret, int err)
{
    // The driver passes ENCLS leaf errors through as positive values.
    if(ret > 0)
    {
        switch(ret)
        {
        case SGX_INVALID_ATTRIBUTE:
            return KEEP_ERROR_INVALID_ATTRIBUTE;
        case SGX_INVALID_MEASUREMENT:
            return KEEP_ERROR_INVALID_MEASUREMENT;
        case SGX_INVALID_SIG_STRUCT:
        case SGX_INVALID_SIGNATURE:
            return KEEP_ERROR_INVALID_SIGNATURE;
        case SGX_INVALID_CPUSVN:
            return KEEP_ERROR_INVALID_CPUSVN;
        case SGX_INVALID_ISVSVN:
            return KEEP_ERROR_INVALID_ISVSVN;
        case SGX_UNMASKED_EVENT:
            return KEEP_ERROR_DEVICE_BUSY;
        default:
            KEEP_TRACE(KEEP_TRACE_WARNING, "unexpected error %#x from driver, should be keep/driver bug\n", ret);
            return KEEP_ERROR_UNEXPECTED;
        }
    }

    switch(err)
    {
    case EBUSY:
    case EINTR:
    case EAGAIN:
        return KEEP_ERROR_DEVICE_BUSY;
    case ENOMEM:
        return KEEP_ERROR_OUT_OF_MEMORY;
    case EPERM:
    case EACCES:
        return KEEP_ERROR_INVALID_ATTRIBUTE;
    case EINVAL:
        return KEEP_ERROR_INVALID_PARAMETER;
    case ENODEV:
    case ENOENT:
        return KEEP_ERROR_NO_DEVICE;
    default:
        KEEP_TRACE(KEEP_TRACE_WARNING, "unexpected errno %d from driver\n", err);
        return KEEP_ERROR_UNEXPECTED;
    }
}

bool EnclaveBuilderHW::open_device()
{
    LockGuard lock(&m_dev_mutex);

    if(-1 != m_hdevice)
    {
        return true;
    }

    int fd = open(m_device.c_str(), O_RDWR | O_CLOEXEC);
    if (-1 == fd) {
        KEEP_TRACE(KEEP_TRACE_WARNING, "open %s failed, errno = %d\n", m_device.c_str(), errno);
        return false;
    }

    m_hdevice = fd;
    return true;
}

void EnclaveBuilderHW::close_device()
{
    LockGuard lock(&m_dev_mutex);

    if (m_hdevice != -1)
    {
        close(m_hdevice);
        m_hdevice = -1;
    }
}

void EnclaveBuilderHW::destroy_enclave()
{
    if(m_base != 0 && munmap(reinterpret_cast<void *>(m_base), (size_t)m_size) != 0)
        KEEP_TRACE(KEEP_TRACE_WARNING, "destroy SGX enclave failed, error = %d\n", errno);
    m_base = 0;
}

int EnclaveBuilderHW::create_enclave(secs_t *secs)
{
    if(secs == NULL || !IS_POWER_OF_TWO(secs->size) || secs->size < SE_PAGE_SIZE || secs->ssa_frame_size == 0)
        return KEEP_ERROR_INVALID_PARAMETER;
    if(m_base != 0)
        return KEEP_ERROR_INVALID_STATE;

    if (false == open_device())
        return KEEP_ERROR_NO_DEVICE;

    KEEP_TRACE(KEEP_TRACE_DEBUG, "secs.attibutes.flags = %llx, secs.attributes.xfrm = %llx\n",
               (unsigned long long)secs->attributes.flags, (unsigned long long)secs->attributes.xfrm);

    // SECS.BASEADDR must be naturally aligned on a SECS.SIZE boundary, so
    // reserve twice the size and trim it down to an aligned range.
    size_t size = (size_t)secs->size;
    void *reserved = mmap(NULL, size * 2, PROT_NONE, MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
    if(reserved == MAP_FAILED)
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "create enclave: mmap failed, errno = %d\n", errno);
        return KEEP_ERROR_OUT_OF_MEMORY;
    }

    uint64_t start = reinterpret_cast<uint64_t>(reserved);
    uint64_t base = ROUND_TO(start, (uint64_t)size);
    if(base > start)
        munmap(reserved, (size_t)(base - start));
    if(start + size * 2 > base + size)
        munmap(reinterpret_cast<void *>(base + size), (size_t)(start + size * 2 - (base + size)));

    m_base = base;
    m_size = size;
    secs->base = base;

    struct sgx_enclave_create param;
    param.src = reinterpret_cast<__u64>(secs);
    int ret = ioctl(m_hdevice, SGX_IOC_ENCLAVE_CREATE, &param);
    if(ret)
    {
        int err = errno;
        KEEP_TRACE(KEEP_TRACE_WARNING, "SGX_IOC_ENCLAVE_CREATE failed: ret = %d, errno = %d\n", ret, err);
        destroy_enclave();
        return error_driver2keep(ret, err);
    }

    return KEEP_SUCCESS;
}

int EnclaveBuilderHW::add_pages(const uint8_t *src, uint64_t vpage, uint64_t count, const sec_info_t &sinfo, uint32_t flags)
{
    if(m_base == 0 || m_initialized)
        return KEEP_ERROR_INVALID_STATE;
    if(!IS_PAGE_ALIGNED(src) || ((vpage + count) << SE_PAGE_SHIFT) > m_size)
        return KEEP_ERROR_INVALID_PARAMETER;
    if(count == 0)
        return KEEP_SUCCESS;

    struct sgx_enclave_add_pages addp;
    addp.src = reinterpret_cast<__u64>(src);
    addp.offset = vpage << SE_PAGE_SHIFT;
    addp.length = count << SE_PAGE_SHIFT;
    addp.secinfo = reinterpret_cast<__u64>(&sinfo);
    addp.flags = (flags & ADD_PAGE_MEASURE) ? SGX_PAGE_MEASURE : 0;
    addp.count = 0;

    int ret = ioctl(m_hdevice, SGX_IOC_ENCLAVE_ADD_PAGES, &addp);
    if(ret || addp.count != addp.length)
    {
        int err = ret ? errno : EINTR;
        KEEP_TRACE(KEEP_TRACE_WARNING, "Add Pages - %p to %#lx, %lu of %lu bytes... FAIL\n",
                   src, (unsigned long)addp.offset, (unsigned long)addp.count, (unsigned long)addp.length);
        return error_driver2keep(ret, err);
    }

    region_t region;
    region.vpage = vpage;
    region.count = count;
    if((sinfo.flags & SI_FLAG_PT_MASK) == SI_FLAG_TCS)
    {
        region.prot = PROT_READ | PROT_WRITE;
        for(uint64_t i = 0; i < count; i++)
            m_tcs.push_back(m_base + ((vpage + i) << SE_PAGE_SHIFT));
    }
    else
    {
        region.prot = PROT_NONE;
        if(sinfo.flags & SI_FLAG_R)
            region.prot |= PROT_READ;
        if(sinfo.flags & SI_FLAG_W)
            region.prot |= PROT_WRITE;
        if(sinfo.flags & SI_FLAG_X)
            region.prot |= PROT_EXEC;
    }
    m_regions.push_back(region);

    return KEEP_SUCCESS;
}

int EnclaveBuilderHW::build(const enclave_css_t &css, EnclaveEntry *entry, Attester *attester, CEnclave **enclave)
{
    if(enclave == NULL || entry == NULL || attester == NULL)
        return KEEP_ERROR_INVALID_PARAMETER;
    if(m_base == 0 || m_initialized)
        return KEEP_ERROR_INVALID_STATE;

    struct sgx_enclave_init initp;
    initp.sigstruct = reinterpret_cast<__u64>(&css);
    int ret = ioctl(m_hdevice, SGX_IOC_ENCLAVE_INIT, &initp);
    if (ret) {
        int err = errno;
        KEEP_TRACE(KEEP_TRACE_WARNING, "SGX_IOC_ENCLAVE_INIT failed error = %d\n", ret);
        destroy_enclave();
        return error_driver2keep(ret, err);
    }
    m_initialized = true;

    for(size_t i = 0; i < m_regions.size(); i++)
    {
        const region_t &region = m_regions[i];
        void *addr = reinterpret_cast<void *>(m_base + (region.vpage << SE_PAGE_SHIFT));
        void *mapped = mmap(addr, (size_t)(region.count << SE_PAGE_SHIFT), region.prot,
                            MAP_SHARED | MAP_FIXED, m_hdevice, 0);
        if(mapped == MAP_FAILED)
        {
            int err = errno;
            KEEP_TRACE(KEEP_TRACE_WARNING, "mapping enclave pages at %p failed, errno = %d\n", addr, err);
            destroy_enclave();
            return error_driver2keep(-1, err);
        }
    }

    *enclave = new CEnclave(m_base, m_size, m_tcs, entry, attester);

    // The enclave owns the mapping from now on.
    m_base = 0;
    m_tcs.clear();
    m_regions.clear();
    return KEEP_SUCCESS;
}
