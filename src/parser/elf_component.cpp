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

#include "keep/elf_component.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"
#include "keep/util.h"

#include <string.h>
#include <fstream>

#define NOTE_ALIGN(x)   ROUND_TO(x, 4)

static bool validate_elf_header(const Elf64_Ehdr *elf_hdr)
{
    // validate magic number
    if (memcmp(&elf_hdr->e_ident, ELFMAG, SELFMAG))
        return false;

    if (ELFCLASS64 != elf_hdr->e_ident[EI_CLASS])
        return false;

    if (ELFDATA2LSB != elf_hdr->e_ident[EI_DATA])
        return false;

    if (EV_CURRENT != elf_hdr->e_ident[EI_VERSION])
        return false;

    if (ET_DYN != elf_hdr->e_type && ET_EXEC != elf_hdr->e_type)
        return false;

    if (EM_X86_64 != elf_hdr->e_machine)
        return false;

    if (sizeof(Elf64_Phdr) != elf_hdr->e_phentsize)
        return false;

    return true;
}

static bool validate_segment(const Elf64_Phdr *prg_hdr, uint64_t len)
{
    /* Validate the size of the buffer */
    if (prg_hdr->p_offset > len || len - prg_hdr->p_offset < prg_hdr->p_filesz)
        return false;

    if (PT_LOAD == prg_hdr->p_type)
    {
        if (prg_hdr->p_filesz > prg_hdr->p_memsz)
        {
            KEEP_TRACE(KEEP_TRACE_WARNING, "segment at %#lx has more file bytes than memory\n",
                       (unsigned long)prg_hdr->p_vaddr);
            return false;
        }

        if (prg_hdr->p_vaddr + prg_hdr->p_memsz < prg_hdr->p_vaddr)
            return false;
    }

    return true;
}

ElfComponent::ElfComponent(const uint8_t *start_addr, uint64_t len)
    : m_bytes(start_addr, start_addr + len), m_parsed(false)
{
}

ElfComponent::~ElfComponent()
{
}

int ElfComponent::run_parser()
{
    /* We only need to run the parser once. */
    if (m_parsed) return KEEP_SUCCESS;

    if (m_bytes.size() < sizeof(Elf64_Ehdr))
        return KEEP_ERROR_INVALID_ENCLAVE;

    const Elf64_Ehdr *elf_hdr = reinterpret_cast<const Elf64_Ehdr *>(&m_bytes[0]);
    if (!validate_elf_header(elf_hdr))
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "not a x86_64 ELF64 image\n");
        return KEEP_ERROR_INVALID_ENCLAVE;
    }

    uint64_t table_size = (uint64_t)elf_hdr->e_phnum * sizeof(Elf64_Phdr);
    if (elf_hdr->e_phoff > m_bytes.size() || m_bytes.size() - elf_hdr->e_phoff < table_size)
        return KEEP_ERROR_INVALID_ENCLAVE;

    vector<Elf64_Phdr> headers(elf_hdr->e_phnum);
    if (table_size)
        memcpy(&headers[0], &m_bytes[elf_hdr->e_phoff], (size_t)table_size);

    for (size_t idx = 0; idx < headers.size(); idx++)
    {
        if (!validate_segment(&headers[idx], m_bytes.size()))
            return KEEP_ERROR_INVALID_ENCLAVE;
    }

    m_headers.swap(headers);
    m_parsed = true;
    return KEEP_SUCCESS;
}

const uint8_t* ElfComponent::get_bytes() const
{
    return m_bytes.empty() ? NULL : &m_bytes[0];
}

uint64_t ElfComponent::get_size() const
{
    return m_bytes.size();
}

const vector<Elf64_Phdr>& ElfComponent::get_headers() const
{
    return m_headers;
}

int ElfComponent::read_note(const char *name, uint32_t type, void *desc, size_t size) const
{
    size_t name_size = strlen(name) + 1;

    for (size_t idx = 0; idx < m_headers.size(); idx++)
    {
        if (m_headers[idx].p_type != PT_NOTE || m_headers[idx].p_filesz == 0)
            continue;

        const uint8_t *cur = get_bytes() + m_headers[idx].p_offset;
        const uint8_t *end = cur + m_headers[idx].p_filesz;

        while ((size_t)(end - cur) >= sizeof(Elf64_Nhdr))
        {
            const Elf64_Nhdr *note = reinterpret_cast<const Elf64_Nhdr *>(cur);
            uint64_t name_len = NOTE_ALIGN((uint64_t)note->n_namesz);
            uint64_t desc_len = NOTE_ALIGN((uint64_t)note->n_descsz);
            if ((uint64_t)(end - cur) - sizeof(Elf64_Nhdr) < name_len + desc_len)
            {
                KEEP_TRACE(KEEP_TRACE_WARNING, "truncated note in segment %lu\n", (unsigned long)idx);
                return KEEP_ERROR_INVALID_ENCLAVE;
            }

            const char *note_name = reinterpret_cast<const char *>(cur + sizeof(Elf64_Nhdr));
            const uint8_t *note_desc = cur + sizeof(Elf64_Nhdr) + name_len;

            if (note->n_type == type && note->n_namesz == name_size && memcmp(note_name, name, name_size) == 0)
            {
                if (note->n_descsz != size)
                {
                    KEEP_TRACE(KEEP_TRACE_WARNING, "note %s:%#x has size %u, expected %lu\n",
                               name, type, note->n_descsz, (unsigned long)size);
                    return KEEP_ERROR_INVALID_ENCLAVE;
                }
                memcpy(desc, note_desc, size);
                return KEEP_SUCCESS;
            }

            cur += sizeof(Elf64_Nhdr) + name_len + desc_len;
        }
    }

    return KEEP_ERROR_NOTE_MISSING;
}

int keep_read_file(const char *path, vector<uint8_t>& bytes)
{
    if(path == NULL)
        return KEEP_ERROR_INVALID_PARAMETER;

    std::ifstream ifs(path, std::ios::binary|std::ios::in);
    if(!ifs.good())
    {
        keep_trace(KEEP_TRACE_ERROR, "Failed to open the file \"%s\".\n", path);
        return KEEP_ERROR_INVALID_PARAMETER;
    }

    ifs.seekg(0, std::ios::end);
    std::streamoff size = ifs.tellg();
    ifs.seekg(0, std::ios::beg);
    if(size <= 0)
        return KEEP_ERROR_INVALID_ENCLAVE;

    bytes.resize((size_t)size);
    ifs.read(reinterpret_cast<char *>(&bytes[0]), size);
    if(ifs.fail())
    {
        keep_trace(KEEP_TRACE_ERROR, "Failed to read the file \"%s\".\n", path);
        return KEEP_ERROR_UNEXPECTED;
    }
    return KEEP_SUCCESS;
}
