#include <catch2/catch.hpp>

#include "keep/block.h"

#include <errno.h>
#include <string.h>

SCENARIO(
    "the shared block carries one request and its reply",
    "[block]"
) {

    GIVEN( "an empty block" ) {
        keep_block_t block;
        memset(&block, 0, sizeof(block));
        CUntrustedBlock untrusted(&block);

        WHEN( "a request is published" ) {
            keep_request_t req = { 1, { 2, 3, 4, 5, 6, 7 } };
            untrusted.publish_request(req);

            THEN( "the host reads it back" ) {
                keep_request_t seen;
                untrusted.read_request(&seen);
                REQUIRE( untrusted.request_number() == 1 );
                REQUIRE( memcmp(&seen, &req, sizeof(req)) == 0 );
            }

            AND_WHEN( "the host replies" ) {
                untrusted.reply_ok(42, 7);

                THEN( "the reply replaces the request" ) {
                    keep_reply_t rep;
                    untrusted.collect_reply(&rep);
                    REQUIRE( rep.ret[0] == 42 );
                    REQUIRE( rep.ret[1] == 7 );
                    REQUIRE( rep.err == 0 );
                }
            }

            AND_WHEN( "the host fails the request" ) {
                untrusted.reply_err(EBADF);

                THEN( "the reply carries the negated error and errno" ) {
                    keep_reply_t rep;
                    untrusted.collect_reply(&rep);
                    REQUIRE( (int64_t)rep.ret[0] == -EBADF );
                    REQUIRE( rep.err == EBADF );
                }
            }
        }

        THEN( "ranges are checked against the data buffer" ) {
            uint64_t start = reinterpret_cast<uint64_t>(block.buf);
            uint64_t size = sizeof(block.buf);

            REQUIRE( untrusted.in_buffer(start, size) );
            REQUIRE( untrusted.in_buffer(start + size, 0) );
            REQUIRE( untrusted.in_buffer(start + 16, 32) );
            REQUIRE_FALSE( untrusted.in_buffer(start, size + 1) );
            REQUIRE_FALSE( untrusted.in_buffer(start - 1, 1) );
            REQUIRE_FALSE( untrusted.in_buffer(start + 8, UINT64_MAX) );
            REQUIRE_FALSE( untrusted.in_buffer(reinterpret_cast<uint64_t>(&block.msg), 8) );
        }
    }
}
