#ifndef _KEEP_TEST_HELPERS_H_
#define _KEEP_TEST_HELPERS_H_

#include "keep/arch.h"
#include "keep/block.h"
#include "keep/component.h"
#include "keep/enclave_entry.h"
#include "keep/segment_sink.h"
#include "keep/shim/shim_gate.h"

#include <elf.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>
#include <sys/wait.h>

#include <deque>
#include <string>
#include <vector>

using std::vector;

// Writes a minimal x86_64 ELF image: an ELF header, the program headers,
// then the segment contents. All notes go into one PT_NOTE segment.
class ElfImage
{
public:
    ElfImage &load(uint64_t vaddr, uint64_t memsz, uint32_t flags, const vector<uint8_t> &data = vector<uint8_t>()) {
        segment_t seg = { PT_LOAD, vaddr, memsz, flags, data };
        m_segments.push_back(seg);
        return *this;
    }

    ElfImage &header(uint32_t type, uint64_t vaddr, uint64_t memsz) {
        segment_t seg = { type, vaddr, memsz, 0, vector<uint8_t>() };
        m_segments.push_back(seg);
        return *this;
    }

    ElfImage &note(const char *name, uint32_t type, uint32_t value) {
        Elf64_Nhdr nhdr;
        nhdr.n_namesz = (Elf64_Word)(strlen(name) + 1);
        nhdr.n_descsz = sizeof(value);
        nhdr.n_type = type;
        append(m_notes, &nhdr, sizeof(nhdr));
        append(m_notes, name, nhdr.n_namesz);
        m_notes.resize((m_notes.size() + 3) & ~(size_t)3, 0);
        append(m_notes, &value, sizeof(value));
        return *this;
    }

    ElfImage &type(uint16_t e_type) { m_type = e_type; return *this; }
    ElfImage &machine(uint16_t e_machine) { m_machine = e_machine; return *this; }

    vector<uint8_t> bytes() const {
        size_t phnum = m_segments.size() + (m_notes.empty() ? 0 : 1);
        size_t offset = sizeof(Elf64_Ehdr) + phnum * sizeof(Elf64_Phdr);
        offset = (offset + 15) & ~(size_t)15;

        vector<Elf64_Phdr> phdrs;
        vector<uint8_t> payload;
        for (size_t i = 0; i < m_segments.size(); i++) {
            const segment_t &seg = m_segments[i];
            Elf64_Phdr phdr;
            memset(&phdr, 0, sizeof(phdr));
            phdr.p_type = seg.type;
            phdr.p_flags = seg.flags;
            phdr.p_vaddr = seg.vaddr;
            phdr.p_paddr = seg.vaddr;
            phdr.p_memsz = seg.memsz;
            phdr.p_align = SE_PAGE_SIZE;
            if (!seg.data.empty()) {
                phdr.p_offset = offset + payload.size();
                phdr.p_filesz = seg.data.size();
                payload.insert(payload.end(), seg.data.begin(), seg.data.end());
            }
            phdrs.push_back(phdr);
        }
        if (!m_notes.empty()) {
            Elf64_Phdr phdr;
            memset(&phdr, 0, sizeof(phdr));
            phdr.p_type = PT_NOTE;
            phdr.p_offset = offset + payload.size();
            phdr.p_filesz = m_notes.size();
            phdr.p_align = 4;
            payload.insert(payload.end(), m_notes.begin(), m_notes.end());
            phdrs.push_back(phdr);
        }

        Elf64_Ehdr ehdr;
        memset(&ehdr, 0, sizeof(ehdr));
        memcpy(ehdr.e_ident, ELFMAG, SELFMAG);
        ehdr.e_ident[EI_CLASS] = ELFCLASS64;
        ehdr.e_ident[EI_DATA] = ELFDATA2LSB;
        ehdr.e_ident[EI_VERSION] = EV_CURRENT;
        ehdr.e_type = m_type;
        ehdr.e_machine = m_machine;
        ehdr.e_version = EV_CURRENT;
        ehdr.e_phoff = sizeof(Elf64_Ehdr);
        ehdr.e_ehsize = sizeof(Elf64_Ehdr);
        ehdr.e_phentsize = sizeof(Elf64_Phdr);
        ehdr.e_phnum = (Elf64_Half)phnum;

        vector<uint8_t> out;
        append(out, &ehdr, sizeof(ehdr));
        if (!phdrs.empty())
            append(out, &phdrs[0], phdrs.size() * sizeof(Elf64_Phdr));
        out.resize(offset, 0);
        out.insert(out.end(), payload.begin(), payload.end());
        return out;
    }

private:
    struct segment_t {
        uint32_t type;
        uint64_t vaddr;
        uint64_t memsz;
        uint32_t flags;
        vector<uint8_t> data;
    };

    static void append(vector<uint8_t> &out, const void *src, size_t len) {
        const uint8_t *p = static_cast<const uint8_t *>(src);
        out.insert(out.end(), p, p + len);
    }

    vector<segment_t> m_segments;
    vector<uint8_t> m_notes;
    uint16_t m_type = ET_DYN;
    uint16_t m_machine = EM_X86_64;
};

// A shim of 1 MiB with one SSA page, a code slot at 64 KiB of 64 KiB, a
// text page and a TCS page.
inline ElfImage test_shim_image() {
    ElfImage image;
    image.load(0x0, 0x1000, PF_R | PF_X, vector<uint8_t>(0x1000, 0xC3))
         .load(0x1000, 0x1000, PF_R | PF_W | PF_KEEP_SGX_TCS, vector<uint8_t>(0x48, 0x01))
         .load(0x2000, 0x2000, PF_R | PF_W | PF_KEEP_SGX_UNMEASURED)
         .header(PT_KEEP_CODE, 0x10000, 0x10000)
         .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SIZE, 20)
         .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SSAP, 1);
    return image;
}

inline ElfImage test_code_image() {
    ElfImage image;
    image.load(0x0, 0x1800, PF_R | PF_X, vector<uint8_t>(0x1234, 0x90))
         .load(0x2000, 0x1000, PF_R | PF_W, vector<uint8_t>(0x10, 0x42));
    return image;
}

// Remembers every call, in order.
class RecordingSink : public SegmentSink
{
public:
    struct call_t {
        uint64_t vpage;
        uint64_t count;
        uint64_t si_flags;
        uint32_t flags;
        vector<uint8_t> pages;
    };

    int create_enclave(secs_t *secs) {
        created++;
        size = secs->size;
        ssa_frame_size = secs->ssa_frame_size;
        return 0;
    }

    int add_pages(const uint8_t *src, uint64_t vpage, uint64_t count, const sec_info_t &sinfo, uint32_t flags) {
        call_t call = { vpage, count, sinfo.flags, flags, vector<uint8_t>(src, src + (count << SE_PAGE_SHIFT)) };
        calls.push_back(call);
        return fail_after >= 0 && (int)calls.size() > fail_after ? fail_status : 0;
    }

    int created = 0;
    uint64_t size = 0;
    uint32_t ssa_frame_size = 0;
    vector<call_t> calls;
    int fail_after = -1;
    int fail_status = 0;
};

inline bool operator==(const RecordingSink::call_t &a, const RecordingSink::call_t &b) {
    return a.vpage == b.vpage && a.count == b.count && a.si_flags == b.si_flags
        && a.flags == b.flags && a.pages == b.pages;
}

// Plays back a list of enclave exits. A step may leave a request in the
// block, as the enclave would before leaving.
class ScriptedEntry : public EnclaveEntry
{
public:
    struct step_t {
        int result;
        uint16_t trap;
        bool has_request;
        keep_request_t request;
    };

    ScriptedEntry &eexit() { return push(ENTER_SUCCESS, 0); }
    ScriptedEntry &aex(uint16_t trap) { return push(ENTER_EXCEPTION, trap); }
    ScriptedEntry &eexit_with(uint64_t num, uint64_t a0 = 0, uint64_t a1 = 0, uint64_t a2 = 0, uint64_t a3 = 0) {
        push(ENTER_SUCCESS, 0);
        step_t &step = m_steps.back();
        step.has_request = true;
        step.request.num = num;
        step.request.arg[0] = a0;
        step.request.arg[1] = a1;
        step.request.arg[2] = a2;
        step.request.arg[3] = a3;
        return *this;
    }

    int enter(uint64_t tcs, entry_mode_t how, enclave_registers_t *regs, exception_info_t *info) {
        modes.push_back(how);
        tcss.push_back(tcs);
        if (m_steps.empty())
            return ENTER_SUCCESS;

        step_t step = m_steps.front();
        m_steps.pop_front();
        if (step.has_request)
            memcpy(reinterpret_cast<void *>(regs->rdi), &step.request, sizeof(step.request));
        if (step.result == ENTER_EXCEPTION) {
            info->last = how;
            info->trap = step.trap;
            info->code = 0;
            info->addr = 0x1234;
        }
        return step.result;
    }

    vector<entry_mode_t> modes;
    vector<uint64_t> tcss;

private:
    ScriptedEntry &push(int result, uint16_t trap) {
        step_t step;
        memset(&step, 0, sizeof(step));
        step.result = result;
        step.trap = trap;
        m_steps.push_back(step);
        return *this;
    }

    std::deque<step_t> m_steps;
};

struct GateTerminated {
    int status;
};

// Plays the host: answers every request with ret0 = num + 1.
class ScriptedGate : public ShimGate
{
public:
    explicit ScriptedGate(keep_block_t *block) : m_block(block) {}

    void raise_exit() {
        keep_request_t req;
        m_block.read_request(&req);
        requests.push_back(req);
        m_block.reply_ok(req.num + 1, 0);
    }

    void terminate(int status) {
        terminations.push_back(status);
        throw GateTerminated{ status };
    }

    void debug_write(const char *msg, size_t len) {
        log.append(msg, len);
    }

    vector<keep_request_t> requests;
    vector<int> terminations;
    std::string log;

private:
    CUntrustedBlock m_block;
};

// Runs `fn' in a child process, true if it died of SIGABRT.
template <typename F>
bool aborts(F fn) {
    pid_t pid = fork();
    if (pid == 0) {
        fn();
        _exit(0);
    }
    int status = 0;
    if (pid < 0 || waitpid(pid, &status, 0) != pid)
        return false;
    return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
}

#endif
