#include <iostream>
#include <iomanip>
#include <cstddef>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <sys/syscall.h>

#include "keep/backend.h"
#include "keep/config.h"
#include "keep/elf_component.h"
#include "keep/enclave.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"
#include "keep/loader.h"
#include "keep/signer.h"
#include "keep/tcs.h"

using namespace std;

static void print_hex(const uint8_t *buffer, size_t len) {
    for (size_t i = 0; i < len; i++) {
        cout << setfill('0') << setw(2) << setbase(16) << static_cast<int>(buffer[i]);
    }
    cout << setbase(10) << endl;
}

static void usage(const char *name) {
    cout << "SGX Keep Loader" << endl;
    cout << "Usage: " << name << " info" << endl;
    cout << "       " << name << " measure [<shim>] <code>" << endl;
    cout << "       " << name << " exec [<shim>] <code>" << endl;
}

static int outcome(int status) {
    cout << "Outcome: " << keep_strerror(status) << endl;
    return status == KEEP_SUCCESS ? 0 : 1;
}

static int parse_component(vector<uint8_t> &bytes, ElfComponent **component) {
    ElfComponent *elf = new ElfComponent(&bytes[0], bytes.size());
    int ret = elf->run_parser();
    if (ret != KEEP_SUCCESS) {
        delete elf;
        return ret;
    }
    *component = elf;
    return KEEP_SUCCESS;
}

// Reads the shim from the command line when given, otherwise from the configuration.
static int load_images(Backend &backend, int argc, char *argv[], ElfComponent **shim, ElfComponent **code,
                       vector<uint8_t> &shim_bytes, vector<uint8_t> &code_bytes) {
    int ret = (argc == 4) ? keep_read_file(argv[2], shim_bytes) : backend.shim(shim_bytes);
    if (ret != KEEP_SUCCESS)
        return ret;
    if ((ret = keep_read_file(argv[argc - 1], code_bytes)) != KEEP_SUCCESS)
        return ret;

    if ((ret = parse_component(shim_bytes, shim)) != KEEP_SUCCESS)
        return ret;
    if ((ret = parse_component(code_bytes, code)) != KEEP_SUCCESS) {
        delete *shim;
        *shim = NULL;
        return ret;
    }
    return KEEP_SUCCESS;
}

static int command_info(Backend &backend) {
    vector<keep_datum_t> data;
    backend.data(data);

    cout << "Backend: " << backend.name() << endl;
    for (size_t i = 0; i < data.size(); i++) {
        const keep_datum_t &datum = data[i];
        cout << "  [" << (datum.pass ? " yes" : "  no") << "] " << datum.name;
        if (!datum.info.empty())
            cout << ": " << datum.info;
        cout << endl;
        if (!datum.pass && !datum.mesg.empty())
            cout << "         " << datum.mesg << endl;
    }
    return outcome(backend.have() ? KEEP_SUCCESS : KEEP_ERROR_NO_DEVICE);
}

static int command_measure(Backend &backend, int argc, char *argv[]) {
    vector<uint8_t> shim_bytes, code_bytes;
    ElfComponent *shim = NULL, *code = NULL;
    int ret = load_images(backend, argc, argv, &shim, &code, shim_bytes, code_bytes);
    if (ret != KEEP_SUCCESS)
        return outcome(ret);

    enclave_params_t params;
    keep_default_params(&params);
    enclave_author_t author;
    memset(&author, 0, sizeof(author));

    sgx_measurement_t mr_enclave, mr_signer;
    enclave_css_t css;
    {
        CLoader loader(*shim, *code);
        ret = loader.measure(params, author, &mr_enclave, &css);
        if (ret == KEEP_SUCCESS) {
            cout << "  Size      = 0x" << setbase(16) << loader.get_enclave_size() << setbase(10) << endl;
            cout << "  SSA pages = " << loader.get_ssa_frame_size() << endl;
            cout << "  Code slot = 0x" << setbase(16) << loader.get_slot() << setbase(10) << endl;
        }
    }
    if (ret == KEEP_SUCCESS)
        ret = keep_css_signer(&css, &mr_signer);
    if (ret == KEEP_SUCCESS) {
        cout << "  MRENCLAVE = ";
        print_hex(mr_enclave.m, sizeof(mr_enclave.m));
        cout << "  MRSIGNER  = ";
        print_hex(mr_signer.m, sizeof(mr_signer.m));
        int verified = keep_verify_css(&css);
        cout << "  Signature = " << (verified == KEEP_SUCCESS ? "valid" : "INVALID") << endl;
        ret = verified;
    }

    delete code;
    delete shim;
    return outcome(ret);
}

// Host side of the syscalls the enclave proxies out. Returns true when the
// enclave asked to exit.
static bool service(keep_block_t *block, int *status) {
    CUntrustedBlock untrusted(block);
    keep_request_t req;
    untrusted.read_request(&req);

    switch (req.num) {
    case SYS_exit:
    case SYS_exit_group:
        *status = (int)req.arg[0];
        return true;

    case SYS_write:
        if (req.arg[0] != STDOUT_FILENO && req.arg[0] != STDERR_FILENO) {
            untrusted.reply_err(EBADF);
        } else if (!untrusted.in_buffer(req.arg[1], req.arg[2])) {
            untrusted.reply_err(EFAULT);
        } else {
            ssize_t written = write((int)req.arg[0], reinterpret_cast<const void *>(req.arg[1]), (size_t)req.arg[2]);
            if (written < 0)
                untrusted.reply_err(errno);
            else
                untrusted.reply_ok((uint64_t)written, 0);
        }
        break;

    default:
        KEEP_TRACE(KEEP_TRACE_NOTICE, "host does not service syscall %lu\n", (unsigned long)req.num);
        untrusted.reply_err(ENOSYS);
        break;
    }
    return false;
}

static int command_exec(Backend &backend, int argc, char *argv[], int *status) {
    vector<uint8_t> shim_bytes, code_bytes;
    ElfComponent *shim = NULL, *code = NULL;
    int ret = load_images(backend, argc, argv, &shim, &code, shim_bytes, code_bytes);
    if (ret != KEEP_SUCCESS)
        return ret;

    CEnclave *enclave = NULL;
    ret = backend.build(*shim, *code, &enclave);
    delete code;
    delete shim;
    if (ret != KEEP_SUCCESS)
        return ret;

    CTrustThread *thread = NULL;
    if ((ret = enclave->spawn(&thread)) == KEEP_SUCCESS && thread == NULL)
        ret = KEEP_ERROR_INVALID_ENCLAVE;

    while (ret == KEEP_SUCCESS) {
        command_t cmd = CMD_CONTINUE;
        if ((ret = thread->enter(&cmd)) != KEEP_SUCCESS)
            break;
        if (cmd == CMD_SYSCALL && service(thread->get_block(), status))
            break;
    }

    delete thread;
    delete enclave;
    return ret;
}

int main(int argc, char *argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    keep_config_t config;
    int ret = keep_config_load(&config);
    if (ret != KEEP_SUCCESS)
        return outcome(ret);
    keep_trace_set_level(config.log_level);

    SgxBackend backend(config);
    const char *command = argv[1];

    if (strcmp(command, "info") == 0 && argc == 2)
        return command_info(backend);

    if (strcmp(command, "measure") == 0 && (argc == 3 || argc == 4))
        return command_measure(backend, argc, argv);

    if (strcmp(command, "exec") == 0 && (argc == 3 || argc == 4)) {
        int status = 0;
        ret = command_exec(backend, argc, argv, &status);
        if (ret != KEEP_SUCCESS)
            return outcome(ret);
        return status;
    }

    usage(argv[0]);
    return 1;
}
