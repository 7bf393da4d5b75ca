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

#include "keep/enclave_entry.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"
#include "keep/util.h"

#include <elf.h>
#include <string.h>
#include <sys/auxv.h>
#include <asm/sgx.h>

#define VDSO_ENTER_SYMBOL "__vdso_sgx_enter_enclave"

extern "C" int keep_vdso_enter(enclave_registers_t *regs, uint32_t function, struct sgx_enclave_run *run, void *fnc);

// Called by the vDSO on every exit, records what the enclave left in the registers.
extern "C" int keep_vdso_handler(long rdi, long rsi, long rdx, long rsp, long r8, long r9, struct sgx_enclave_run *run)
{
    UNUSED(rsp);
    enclave_registers_t *regs = reinterpret_cast<enclave_registers_t *>(run->user_data);
    regs->rdi = rdi;
    regs->rsi = rsi;
    regs->rdx = rdx;
    regs->r8 = r8;
    regs->r9 = r9;
    return 0;
}

static void *find_vdso_symbol(const char *name)
{
    uintptr_t base = (uintptr_t)getauxval(AT_SYSINFO_EHDR);
    if(base == 0)
        return NULL;

    const Elf64_Ehdr *elf_hdr = reinterpret_cast<const Elf64_Ehdr *>(base);
    const Elf64_Phdr *prg_hdr = GET_PTR(const Elf64_Phdr, base, elf_hdr->e_phoff);
    const Elf64_Dyn *dyn = NULL;
    uintptr_t load_offset = 0;
    bool found_load = false;

    for(int i = 0; i < elf_hdr->e_phnum; i++)
    {
        if(prg_hdr[i].p_type == PT_LOAD && !found_load)
        {
            load_offset = base + prg_hdr[i].p_offset - prg_hdr[i].p_vaddr;
            found_load = true;
        }
        else if(prg_hdr[i].p_type == PT_DYNAMIC)
        {
            dyn = GET_PTR(const Elf64_Dyn, base, prg_hdr[i].p_offset);
        }
    }
    if(!found_load || dyn == NULL)
        return NULL;

    const Elf64_Sym *symtab = NULL;
    const char *strtab = NULL;
    const Elf32_Word *hash = NULL;
    for(; dyn->d_tag != DT_NULL; dyn++)
    {
        switch(dyn->d_tag)
        {
        case DT_SYMTAB:
            symtab = GET_PTR(const Elf64_Sym, load_offset, dyn->d_un.d_ptr);
            break;
        case DT_STRTAB:
            strtab = GET_PTR(const char, load_offset, dyn->d_un.d_ptr);
            break;
        case DT_HASH:
            hash = GET_PTR(const Elf32_Word, load_offset, dyn->d_un.d_ptr);
            break;
        default:
            break;
        }
    }
    if(symtab == NULL || strtab == NULL || hash == NULL)
        return NULL;

    /* the second word of the hash table is the number of symbols */
    Elf32_Word nsyms = hash[1];
    for(Elf32_Word i = 0; i < nsyms; i++)
    {
        if(ELF64_ST_TYPE(symtab[i].st_info) != STT_FUNC || symtab[i].st_shndx == SHN_UNDEF)
            continue;
        if(strcmp(strtab + symtab[i].st_name, name) == 0)
            return GET_PTR(void, load_offset, symtab[i].st_value);
    }
    return NULL;
}

VdsoEntry::VdsoEntry()
    : m_fnc(NULL)
{
}

int VdsoEntry::resolve()
{
    if(m_fnc != NULL)
        return KEEP_SUCCESS;

    m_fnc = find_vdso_symbol(VDSO_ENTER_SYMBOL);
    if(m_fnc == NULL)
    {
        KEEP_TRACE(KEEP_TRACE_WARNING, "%s is not exported by the vDSO\n", VDSO_ENTER_SYMBOL);
        return KEEP_ERROR_NO_VDSO;
    }
    return KEEP_SUCCESS;
}

int VdsoEntry::enter(uint64_t tcs, entry_mode_t how, enclave_registers_t *regs, exception_info_t *info)
{
    if(m_fnc == NULL)
        KEEP_ABORT("enclave entry used before the vDSO was resolved\n");

    struct sgx_enclave_run run;
    memset(&run, 0, sizeof(run));
    run.tcs = tcs;
    run.user_handler = reinterpret_cast<uint64_t>(keep_vdso_handler);
    run.user_data = reinterpret_cast<uint64_t>(regs);

    int rax = keep_vdso_enter(regs, (uint32_t)how, &run, m_fnc);

    if(rax == 0 && run.function == ENCLU_EEXIT)
        return ENTER_SUCCESS;

    if(rax != 0 || (run.function != ENTRY_ENTER && run.function != ENTRY_RESUME))
        KEEP_ABORT("unexpected return from the vDSO: rax = %d, function = %u\n", rax, run.function);

    info->last = (entry_mode_t)run.function;
    info->trap = run.exception_vector;
    info->code = run.exception_error_code;
    info->addr = run.exception_addr;
    return ENTER_EXCEPTION;
}
