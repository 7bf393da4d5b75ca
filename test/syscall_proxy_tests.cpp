#include <catch2/catch.hpp>

#include "helpers.h"
#include "keep/shim/syscall_proxy.h"

#include <sys/syscall.h>

SCENARIO(
    "the shim proxies system calls through the shared block",
    "[proxy]"
) {

    GIVEN( "a proxy with a host behind the gate" ) {
        keep_block_t block;
        memset(&block, 0, sizeof(block));
        ScriptedGate gate(&block);
        CEnclaveState state;
        CSyscallProxy proxy(&gate, &block, &state);

        WHEN( "a request is proxied" ) {
            keep_request_t req = { SYS_getpid, { 9, 8, 7, 6, 5, 4 } };
            keep_reply_t rep;
            proxy.proxy(req, &rep);

            THEN( "the host saw the request" ) {
                REQUIRE( gate.requests.size() == 1 );
                REQUIRE( gate.requests[0].num == SYS_getpid );
                REQUIRE( gate.requests[0].arg[5] == 4 );
            }

            THEN( "the reply is returned" ) {
                REQUIRE( rep.ret[0] == SYS_getpid + 1 );
                REQUIRE( rep.err == 0 );
            }
        }

        WHEN( "the shim is attacked" ) {
            REQUIRE_THROWS_AS( proxy.attacked(), GateTerminated );

            THEN( "the enclave exits with status 1 and stays crashed" ) {
                REQUIRE( state.is_crashed() );
                REQUIRE( gate.terminations.size() == 1 );
                REQUIRE( gate.terminations[0] == 1 );
            }

            THEN( "every later entry exits at once" ) {
                REQUIRE_THROWS_AS( proxy.enter(), GateTerminated );
                REQUIRE_THROWS_AS( proxy.enter(), GateTerminated );
                REQUIRE( gate.terminations.size() == 3 );
                REQUIRE( state.is_crashed() );
            }

            THEN( "nothing more reaches the host" ) {
                keep_request_t req = { SYS_getpid, { 0, 0, 0, 0, 0, 0 } };
                keep_reply_t rep;
                REQUIRE_THROWS_AS( proxy.proxy(req, &rep), GateTerminated );
                REQUIRE( gate.requests.empty() );
            }
        }

        WHEN( "the enclave is entered normally" ) {
            proxy.enter();

            THEN( "it keeps running" ) {
                REQUIRE( gate.terminations.empty() );
                REQUIRE_FALSE( state.is_crashed() );
            }
        }

        WHEN( "an unknown system call is made" ) {
            proxy.unknown_syscall(1, 2, 3, 4, 5, 6, 999);

            THEN( "it is logged and ignored" ) {
                REQUIRE( gate.log == "unsupported syscall: 999\n" );
                REQUIRE( gate.requests.empty() );
            }
        }

        WHEN( "a call is traced" ) {
            const uint64_t argv[] = { 1, 0x2000, 0x10, 0, 0, 0 };
            proxy.trace("write", 3, argv);

            THEN( "the name and the used arguments are logged" ) {
                REQUIRE( gate.log == "write(0x1, 0x2000, 0x10)\n" );
            }
        }

        WHEN( "a call without arguments is traced" ) {
            proxy.trace("getpid", 0, NULL);

            THEN( "the argument list is empty" ) {
                REQUIRE( gate.log == "getpid()\n" );
            }
        }
    }
}
