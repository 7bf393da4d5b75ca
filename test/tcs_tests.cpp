#include <catch2/catch.hpp>

#include "helpers.h"
#include "keep/attestation.h"
#include "keep/keep_error.h"
#include "keep/tcs.h"

#include <errno.h>
#include <cpuid.h>

#define TEST_TCS 0x7000

// Writes a fixed evidence blob after checking the nonce.
class FixedAttester : public Attester
{
public:
    int get_attestation(const uint8_t *nonce, size_t nonce_len, uint8_t *buf, size_t buf_len, size_t *written) {
        calls++;
        if (fail)
            return KEEP_ERROR_ATTESTATION;
        seen_nonce.assign(nonce, nonce + nonce_len);
        size_t len = buf_len < 5 ? buf_len : 5;
        memcpy(buf, "QUOTE", len);
        *written = len + overstate;
        return KEEP_SUCCESS;
    }

    int calls = 0;
    bool fail = false;
    size_t overstate = 0;
    vector<uint8_t> seen_nonce;
};

SCENARIO(
    "threads follow the enter and resume state machine",
    "[tcs]"
) {

    GIVEN( "a fresh thread" ) {
        ScriptedEntry entry;
        NullAttester attester;
        CTrustThread thread(TEST_TCS, NULL, &entry, &attester);

        THEN( "it starts with a fresh entry at depth zero" ) {
            REQUIRE( thread.get_mode() == ENTRY_ENTER );
            REQUIRE( thread.get_cssa() == 0 );
        }

        WHEN( "the enclave traps into the proxy and the handler returns" ) {
            entry.aex(SE_VECTOR_UD).eexit_with(1, 2, 3);
            command_t cmd = CMD_CONTINUE;

            REQUIRE( thread.enter(&cmd) == KEEP_SUCCESS );

            THEN( "the trap enters the handler one frame deeper" ) {
                REQUIRE( cmd == CMD_CONTINUE );
                REQUIRE( thread.get_mode() == ENTRY_ENTER );
                REQUIRE( thread.get_cssa() == 1 );
            }

            AND_WHEN( "the handler leaves a request" ) {
                REQUIRE( thread.enter(&cmd) == KEEP_SUCCESS );

                THEN( "the caller is asked to service it and the next entry resumes" ) {
                    REQUIRE( cmd == CMD_SYSCALL );
                    REQUIRE( thread.get_mode() == ENTRY_RESUME );
                    REQUIRE( thread.get_cssa() == 0 );
                    REQUIRE( thread.get_block()->msg.req.num == 1 );
                    REQUIRE( thread.get_block()->msg.req.arg[0] == 2 );
                }

                THEN( "each entry used the mode the previous exit asked for" ) {
                    REQUIRE( entry.modes.size() == 2 );
                    REQUIRE( entry.modes[0] == ENTRY_ENTER );
                    REQUIRE( entry.modes[1] == ENTRY_ENTER );
                    REQUIRE( entry.tcss[1] == TEST_TCS );
                }

                AND_WHEN( "the thread is resumed and traps again" ) {
                    entry.aex(SE_VECTOR_UD);
                    REQUIRE( thread.enter(&cmd) == KEEP_SUCCESS );

                    THEN( "ERESUME was used and the handler is entered again" ) {
                        REQUIRE( entry.modes.back() == ENTRY_RESUME );
                        REQUIRE( thread.get_mode() == ENTRY_ENTER );
                        REQUIRE( thread.get_cssa() == 1 );
                        REQUIRE( cmd == CMD_CONTINUE );
                    }
                }
            }
        }

        WHEN( "the handler asks for CPUID" ) {
            entry.aex(SE_VECTOR_UD).eexit_with(KEEP_SYS_CPUID, 0, 0);
            command_t cmd = CMD_SYSCALL;
            REQUIRE( thread.enter(&cmd) == KEEP_SUCCESS );
            REQUIRE( thread.enter(&cmd) == KEEP_SUCCESS );

            THEN( "it is serviced without the caller" ) {
                REQUIRE( cmd == CMD_CONTINUE );
                unsigned int eax = 0, ebx = 0, ecx = 0, edx = 0;
                __cpuid_count(0, 0, eax, ebx, ecx, edx);
                const keep_request_t &req = thread.get_block()->msg.req;
                REQUIRE( req.arg[0] == eax );
                REQUIRE( req.arg[1] == ebx );
                REQUIRE( req.arg[2] == ecx );
                REQUIRE( req.arg[3] == edx );
            }
        }

        WHEN( "the first exit is a clean return" ) {
            entry.eexit();
            THEN( "the depth would go negative and the process aborts" ) {
                REQUIRE( aborts([&]() {
                    command_t cmd;
                    thread.enter(&cmd);
                }) );
            }
        }

        WHEN( "the enclave faults with anything but #UD" ) {
            entry.aex(SE_VECTOR_PF);
            THEN( "the process aborts" ) {
                REQUIRE( aborts([&]() {
                    command_t cmd;
                    thread.enter(&cmd);
                }) );
            }
        }

        WHEN( "the caller passes no command" ) {
            THEN( "the call is rejected" ) {
                REQUIRE( thread.enter(NULL) == KEEP_ERROR_INVALID_PARAMETER );
            }
        }
    }
}

SCENARIO(
    "attestation requests are serviced by the host",
    "[tcs]"
) {

    GIVEN( "a thread with an attester" ) {
        ScriptedEntry entry;
        FixedAttester attester;
        CTrustThread thread(TEST_TCS, NULL, &entry, &attester);
        keep_block_t *block = thread.get_block();
        uint64_t nonce = reinterpret_cast<uint64_t>(block->buf);
        uint64_t out = reinterpret_cast<uint64_t>(block->buf + 64);
        memcpy(block->buf, "nonce", 5);

        WHEN( "both buffers are inside the block" ) {
            entry.aex(SE_VECTOR_UD).eexit_with(KEEP_SYS_GETATT, nonce, 5, out, 128);
            command_t cmd;
            REQUIRE( thread.enter(&cmd) == KEEP_SUCCESS );
            REQUIRE( thread.enter(&cmd) == KEEP_SUCCESS );

            THEN( "the evidence is written and its length returned" ) {
                REQUIRE( cmd == CMD_CONTINUE );
                REQUIRE( attester.seen_nonce.size() == 5 );
                REQUIRE( block->msg.rep.ret[0] == 5 );
                REQUIRE( block->msg.rep.err == 0 );
                REQUIRE( memcmp(block->buf + 64, "QUOTE", 5) == 0 );
            }
        }

        WHEN( "the attester reports more bytes than the buffer holds" ) {
            attester.overstate = 1;
            entry.aex(SE_VECTOR_UD).eexit_with(KEEP_SYS_GETATT, nonce, 5, out, 5);
            command_t cmd;
            REQUIRE( thread.enter(&cmd) == KEEP_SUCCESS );

            THEN( "the request fails instead of replying with that length" ) {
                REQUIRE( thread.enter(&cmd) == KEEP_ERROR_ATTESTATION );
                REQUIRE( attester.calls == 1 );
            }
        }

        WHEN( "the output buffer points outside the block" ) {
            entry.aex(SE_VECTOR_UD).eexit_with(KEEP_SYS_GETATT, nonce, 5, 0x1000, 128);
            command_t cmd;
            REQUIRE( thread.enter(&cmd) == KEEP_SUCCESS );
            REQUIRE( thread.enter(&cmd) == KEEP_SUCCESS );

            THEN( "the attester is not called and EFAULT is returned" ) {
                REQUIRE( attester.calls == 0 );
                REQUIRE( block->msg.rep.err == EFAULT );
                REQUIRE( block->msg.rep.ret[0] == (uint64_t)-EFAULT );
            }
        }

        WHEN( "the attester fails" ) {
            attester.fail = true;
            entry.aex(SE_VECTOR_UD).eexit_with(KEEP_SYS_GETATT, nonce, 5, out, 128);
            command_t cmd;
            REQUIRE( thread.enter(&cmd) == KEEP_SUCCESS );

            THEN( "the error is returned from enter" ) {
                REQUIRE( thread.enter(&cmd) == KEEP_ERROR_ATTESTATION );
            }
        }
    }
}
