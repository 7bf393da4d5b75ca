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

#ifndef _KEEP_SEGMENT_H_
#define _KEEP_SEGMENT_H_

#include "arch.h"
#include "component.h"
#include "uncopyable.h"

#include <stdint.h>
#include <vector>

using std::vector;

/* Page add flags */
#define ADD_PAGE_MEASURE    0x1     /* extend the pages into the measurement */

// One loadable program header, translated into the enclave page frames it
// occupies. The page buffer is a private copy of the image bytes.
class CSegment : private Uncopyable
{
public:
    CSegment();
    ~CSegment();

    // Fails with KEEP_ERROR_INVALID_ENCLAVE when the segment does not fit
    // below `limit' once relocated.
    int translate(const Component &component, const Elf64_Phdr &phdr, uint64_t relocate,
                  uint64_t limit = UINT64_MAX);

    const uint8_t* get_pages() const { return m_pages; }
    uint64_t get_page_count() const { return m_page_count; }
    uint64_t get_vpage() const { return m_vpage; }
    uint64_t get_end_vpage() const { return m_vpage + m_page_count; }
    const sec_info_t& get_sec_info() const { return m_sinfo; }
    uint32_t get_flags() const { return m_flags; }

    void dump() const;

private:
    uint64_t    m_file_start;
    uint64_t    m_file_end;
    uint64_t    m_mem_start;
    uint64_t    m_mem_end;
    uint8_t     *m_pages;
    uint64_t    m_page_count;
    uint64_t    m_vpage;
    sec_info_t  m_sinfo;
    uint32_t    m_flags;
};

class CSegmentList : private Uncopyable
{
public:
    CSegmentList() {}
    ~CSegmentList();

    void push_back(CSegment *segment) { m_segments.push_back(segment); }
    size_t size() const { return m_segments.size(); }
    const CSegment* operator[](size_t idx) const { return m_segments[idx]; }

    // Order by virtual page and abort if any two segments overlap.
    void sort_and_check();

private:
    vector<CSegment *> m_segments;
};

// Translate the PT_LOAD headers of `component' at offset `relocate', each
// of which must end at or below `limit'.
int keep_translate_component(const Component &component, uint64_t relocate, uint64_t limit, CSegmentList &segments);

// Translate the shim at 0 and the code into `slot' of an enclave of `size'
// bytes, then order and check the result.
int keep_translate_segments(const Component &shim, const Component &code, uint64_t slot, uint64_t size,
                            CSegmentList &segments);

#endif
