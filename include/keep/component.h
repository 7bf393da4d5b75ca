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

#ifndef _KEEP_COMPONENT_H_
#define _KEEP_COMPONENT_H_

#include <elf.h>
#include <stdint.h>
#include <stddef.h>
#include <vector>

using std::vector;

/* Program header type marking the slot the code component is loaded into */
#define PT_KEEP_CODE            (PT_LOOS + 0x34a0003)

/* OS specific program header flags */
#define PF_KEEP_SGX_TCS         (1U << 20)      /* segment holds TCS pages */
#define PF_KEEP_SGX_UNMEASURED  (1U << 21)      /* segment is added but not extended */

/* Notes carried by the shim */
#define KEEP_NOTE_NAMESPACE     "keep"
#define NOTE_KEEP_SGX_SIZE      0x73780001      /* u32, log2 of the enclave size */
#define NOTE_KEEP_SGX_SSAP      0x73780002      /* u32, pages per SSA frame */

// A loadable image: its bytes, its program headers and its notes.
class Component
{
public:
    virtual ~Component() {}

    virtual const uint8_t* get_bytes() const = 0;

    virtual uint64_t get_size() const = 0;

    virtual const vector<Elf64_Phdr>& get_headers() const = 0;

    // Copy the descriptor of the note (name, type) into desc, which must be
    // exactly `size' bytes long.
    virtual int read_note(const char *name, uint32_t type, void *desc, size_t size) const = 0;

    // Get the first header of the given type, NULL if there is none.
    const Elf64_Phdr* find_header(uint32_t type) const;

    void filter_headers(uint32_t type, vector<const Elf64_Phdr *>& headers) const;

    // The virtual address range covered by the PT_LOAD headers.
    bool get_region(uint64_t *start, uint64_t *end) const;
};

#endif
