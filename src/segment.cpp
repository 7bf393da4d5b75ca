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

#include "keep/segment.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"
#include "keep/util.h"

#include <string.h>
#include <sys/mman.h>
#include <algorithm>

CSegment::CSegment()
    : m_file_start(0), m_file_end(0), m_mem_start(0), m_mem_end(0),
      m_pages(NULL), m_page_count(0), m_vpage(0), m_flags(0)
{
    memset(&m_sinfo, 0, sizeof(m_sinfo));
}

CSegment::~CSegment()
{
    if(m_pages != NULL)
        munmap(m_pages, (size_t)(m_page_count << SE_PAGE_SHIFT));
}

int CSegment::translate(const Component &component, const Elf64_Phdr &phdr, uint64_t relocate, uint64_t limit)
{
    if(!IS_PAGE_ALIGNED(relocate))
        KEEP_ABORT("relocation %#lx is not page aligned\n", (unsigned long)relocate);

    if(phdr.p_offset > component.get_size() || component.get_size() - phdr.p_offset < phdr.p_filesz
            || phdr.p_filesz > phdr.p_memsz)
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "segment at %#lx exceeds the image\n", (unsigned long)phdr.p_vaddr);
        return KEEP_ERROR_INVALID_ENCLAVE;
    }

    // The end, rounded up to a page, has to be addressable and below `limit'.
    uint64_t mem_start = phdr.p_vaddr + relocate;
    if(mem_start < phdr.p_vaddr || phdr.p_memsz > limit || mem_start > limit - phdr.p_memsz
            || mem_start + phdr.p_memsz > UINT64_MAX - (SE_PAGE_SIZE - 1))
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "segment at %#lx of %#lx bytes ends past %#lx\n",
                   (unsigned long)phdr.p_vaddr, (unsigned long)phdr.p_memsz, (unsigned long)limit);
        return KEEP_ERROR_INVALID_ENCLAVE;
    }

    m_file_start = phdr.p_offset;
    m_file_end = phdr.p_offset + phdr.p_filesz;
    m_mem_start = mem_start;
    m_mem_end = m_mem_start + phdr.p_memsz;

    // The first page may start part way in, the bytes before it stay zero.
    uint64_t skip = PAGE_OFFSET(m_mem_start);
    m_vpage = m_mem_start >> SE_PAGE_SHIFT;
    m_page_count = PAGE_COUNT(m_mem_end) - m_vpage;

    if(m_page_count != 0)
    {
        void *pages = mmap(NULL, (size_t)(m_page_count << SE_PAGE_SHIFT), PROT_READ | PROT_WRITE,
                           MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        if(pages == MAP_FAILED)
        {
            KEEP_TRACE(KEEP_TRACE_WARNING, "failed to allocate %lu pages\n", (unsigned long)m_page_count);
            return KEEP_ERROR_OUT_OF_MEMORY;
        }
        m_pages = reinterpret_cast<uint8_t *>(pages);
        if(phdr.p_filesz)
            memcpy(m_pages + skip, component.get_bytes() + phdr.p_offset, (size_t)phdr.p_filesz);
    }

    memset(&m_sinfo, 0, sizeof(m_sinfo));
    if(phdr.p_flags & PF_KEEP_SGX_TCS)
    {
        m_sinfo.flags = SI_FLAG_TCS;
    }
    else
    {
        m_sinfo.flags = SI_FLAG_REG;
        if(phdr.p_flags & PF_R)
            m_sinfo.flags |= SI_FLAG_R;
        if(phdr.p_flags & PF_W)
            m_sinfo.flags |= SI_FLAG_W;
        if(phdr.p_flags & PF_X)
            m_sinfo.flags |= SI_FLAG_X;
    }

    m_flags = (phdr.p_flags & PF_KEEP_SGX_UNMEASURED) ? 0 : ADD_PAGE_MEASURE;
    return KEEP_SUCCESS;
}

void CSegment::dump() const
{
    KEEP_TRACE(KEEP_TRACE_DEBUG, "segment %08lx:%08lx => %08lx:%08lx => %08lx:%08lx %c%c%c%c%c\n",
               (unsigned long)m_file_start, (unsigned long)m_file_end,
               (unsigned long)m_mem_start, (unsigned long)m_mem_end,
               (unsigned long)(m_vpage << SE_PAGE_SHIFT), (unsigned long)(get_end_vpage() << SE_PAGE_SHIFT),
               (m_sinfo.flags & SI_FLAG_R) ? 'r' : ' ',
               (m_sinfo.flags & SI_FLAG_W) ? 'w' : ' ',
               (m_sinfo.flags & SI_FLAG_X) ? 'x' : ' ',
               (m_sinfo.flags & SI_FLAG_PT_MASK) == SI_FLAG_TCS ? 't' : ' ',
               (m_flags & ADD_PAGE_MEASURE) ? 'm' : ' ');
}

CSegmentList::~CSegmentList()
{
    for(size_t i = 0; i < m_segments.size(); i++)
        delete m_segments[i];
}

static bool compare_vpage(const CSegment *a, const CSegment *b)
{
    return a->get_vpage() < b->get_vpage();
}

void CSegmentList::sort_and_check()
{
    std::sort(m_segments.begin(), m_segments.end(), compare_vpage);

    for(size_t i = 1; i < m_segments.size(); i++)
    {
        const CSegment *prev = m_segments[i - 1];
        const CSegment *next = m_segments[i];
        if(prev->get_end_vpage() > next->get_vpage())
        {
            KEEP_ABORT("segments overlap: pages [%#lx, %#lx) and [%#lx, %#lx)\n",
                       (unsigned long)prev->get_vpage(), (unsigned long)prev->get_end_vpage(),
                       (unsigned long)next->get_vpage(), (unsigned long)next->get_end_vpage());
        }
    }
}

int keep_translate_component(const Component &component, uint64_t relocate, uint64_t limit, CSegmentList &segments)
{
    vector<const Elf64_Phdr *> loads;
    component.filter_headers(PT_LOAD, loads);

    for(size_t i = 0; i < loads.size(); i++)
    {
        CSegment *segment = new CSegment();
        int ret = segment->translate(component, *loads[i], relocate, limit);
        if(ret != KEEP_SUCCESS)
        {
            delete segment;
            return ret;
        }
        segment->dump();
        segments.push_back(segment);
    }

    return KEEP_SUCCESS;
}

int keep_translate_segments(const Component &shim, const Component &code, uint64_t slot, uint64_t size,
                            CSegmentList &segments)
{
    int ret = keep_translate_component(shim, 0, size, segments);
    if(ret != KEEP_SUCCESS)
        return ret;

    if((ret = keep_translate_component(code, slot, size, segments)) != KEEP_SUCCESS)
        return ret;

    // Ensure no segments overlap in memory.
    segments.sort_and_check();
    return KEEP_SUCCESS;
}
