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

#include "keep/component.h"

const Elf64_Phdr* Component::find_header(uint32_t type) const
{
    const vector<Elf64_Phdr>& headers = get_headers();
    for(size_t i = 0; i < headers.size(); i++)
    {
        if(headers[i].p_type == type)
            return &headers[i];
    }
    return NULL;
}

void Component::filter_headers(uint32_t type, vector<const Elf64_Phdr *>& headers) const
{
    const vector<Elf64_Phdr>& all = get_headers();
    for(size_t i = 0; i < all.size(); i++)
    {
        if(all[i].p_type == type)
            headers.push_back(&all[i]);
    }
}

bool Component::get_region(uint64_t *start, uint64_t *end) const
{
    vector<const Elf64_Phdr *> loads;
    filter_headers(PT_LOAD, loads);
    if(loads.empty())
        return false;

    uint64_t lo = loads[0]->p_vaddr;
    uint64_t hi = loads[0]->p_vaddr + loads[0]->p_memsz;
    for(size_t i = 1; i < loads.size(); i++)
    {
        if(loads[i]->p_vaddr < lo)
            lo = loads[i]->p_vaddr;
        if(loads[i]->p_vaddr + loads[i]->p_memsz > hi)
            hi = loads[i]->p_vaddr + loads[i]->p_memsz;
    }

    *start = lo;
    *end = hi;
    return true;
}
