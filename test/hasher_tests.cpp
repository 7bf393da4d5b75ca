#include <catch2/catch.hpp>

#include "helpers.h"
#include "keep/enclave_hasher.h"
#include "keep/keep_error.h"
#include "keep/segment.h"

static void pattern_page(vector<uint8_t> &page) {
    page.resize(SE_PAGE_SIZE);
    for (size_t i = 0; i < page.size(); i++)
        page[i] = static_cast<uint8_t>(i);
}

static sec_info_t make_sinfo(si_flags_t flags) {
    sec_info_t sinfo;
    memset(&sinfo, 0, sizeof(sinfo));
    sinfo.flags = flags;
    return sinfo;
}

static void small_secs(secs_t *secs) {
    memset(secs, 0, sizeof(*secs));
    secs->size = 0x2000;
    secs->ssa_frame_size = 1;
}

SCENARIO(
    "the enclave measurement is computed without hardware",
    "[hasher]"
) {

    GIVEN( "an enclave of two pages" ) {
        vector<uint8_t> text, tcs(SE_PAGE_SIZE, 0);
        pattern_page(text);
        secs_t secs;
        small_secs(&secs);

        WHEN( "a measured text page and an unmeasured TCS page are added" ) {
            EnclaveHasher hasher;
            REQUIRE( hasher.create_enclave(&secs) == KEEP_SUCCESS );
            REQUIRE( hasher.add_pages(&text[0], 0, 1, make_sinfo(SI_FLAG_REG | SI_FLAG_R | SI_FLAG_X), ADD_PAGE_MEASURE) == KEEP_SUCCESS );
            REQUIRE( hasher.add_pages(&tcs[0], 1, 1, make_sinfo(SI_FLAG_TCS), 0) == KEEP_SUCCESS );

            sgx_measurement_t mr;
            REQUIRE( hasher.finish(&mr) == KEEP_SUCCESS );

            THEN( "the measurement matches the ECREATE, EADD and EEXTEND replay" ) {
                const uint8_t expected[SGX_HASH_SIZE] = {
                    0x20, 0x45, 0xb4, 0xa6, 0xb9, 0x68, 0x61, 0xcf, 0x75, 0x30, 0x5e, 0x10, 0x95, 0xc1, 0x27, 0x39,
                    0x5b, 0x5c, 0xbb, 0x5f, 0x32, 0xd4, 0x1d, 0x3d, 0xbe, 0x12, 0xd8, 0x49, 0xe0, 0x2c, 0x61, 0x18,
                };
                REQUIRE( memcmp(mr.m, expected, sizeof(expected)) == 0 );
            }

            THEN( "both pages count against the quota" ) {
                REQUIRE( hasher.get_quota() == 2 * SE_PAGE_SIZE );
            }

            THEN( "the digest cannot be finished twice" ) {
                sgx_measurement_t again;
                REQUIRE( hasher.finish(&again) == KEEP_ERROR_INVALID_STATE );
            }

            THEN( "no page can be added after the digest is finished" ) {
                REQUIRE( hasher.add_pages(&text[0], 0, 1, make_sinfo(SI_FLAG_REG | SI_FLAG_R), ADD_PAGE_MEASURE) == KEEP_ERROR_INVALID_STATE );
            }
        }

        WHEN( "the same pages are added in another order" ) {
            sgx_measurement_t first, second;

            EnclaveHasher a;
            REQUIRE( a.create_enclave(&secs) == KEEP_SUCCESS );
            REQUIRE( a.add_pages(&text[0], 0, 1, make_sinfo(SI_FLAG_REG | SI_FLAG_R), ADD_PAGE_MEASURE) == KEEP_SUCCESS );
            REQUIRE( a.add_pages(&tcs[0], 1, 1, make_sinfo(SI_FLAG_TCS), ADD_PAGE_MEASURE) == KEEP_SUCCESS );
            REQUIRE( a.finish(&first) == KEEP_SUCCESS );

            EnclaveHasher b;
            REQUIRE( b.create_enclave(&secs) == KEEP_SUCCESS );
            REQUIRE( b.add_pages(&tcs[0], 1, 1, make_sinfo(SI_FLAG_TCS), ADD_PAGE_MEASURE) == KEEP_SUCCESS );
            REQUIRE( b.add_pages(&text[0], 0, 1, make_sinfo(SI_FLAG_REG | SI_FLAG_R), ADD_PAGE_MEASURE) == KEEP_SUCCESS );
            REQUIRE( b.finish(&second) == KEEP_SUCCESS );

            THEN( "the measurement differs" ) {
                REQUIRE( memcmp(first.m, second.m, SGX_HASH_SIZE) != 0 );
            }
        }

        WHEN( "the same sequence is replayed" ) {
            sgx_measurement_t first, second;
            EnclaveHasher *hashers[2] = { new EnclaveHasher(), new EnclaveHasher() };
            sgx_measurement_t *results[2] = { &first, &second };
            for (int i = 0; i < 2; i++) {
                REQUIRE( hashers[i]->create_enclave(&secs) == KEEP_SUCCESS );
                REQUIRE( hashers[i]->add_pages(&text[0], 0, 1, make_sinfo(SI_FLAG_REG | SI_FLAG_R), ADD_PAGE_MEASURE) == KEEP_SUCCESS );
                REQUIRE( hashers[i]->finish(results[i]) == KEEP_SUCCESS );
                delete hashers[i];
            }

            THEN( "the measurement is identical" ) {
                REQUIRE( memcmp(first.m, second.m, SGX_HASH_SIZE) == 0 );
            }
        }

        WHEN( "the SECINFO has bits outside of the architectural ones" ) {
            EnclaveHasher hasher;
            REQUIRE( hasher.create_enclave(&secs) == KEEP_SUCCESS );

            THEN( "the page is rejected" ) {
                REQUIRE( hasher.add_pages(&text[0], 0, 1, make_sinfo(SI_FLAG_REG | (1ULL << 20)), ADD_PAGE_MEASURE) == KEEP_ERROR_INVALID_PARAMETER );
            }
        }
    }

    GIVEN( "a hasher that was never created" ) {
        EnclaveHasher hasher;
        vector<uint8_t> page(SE_PAGE_SIZE, 0);

        THEN( "pages cannot be added" ) {
            REQUIRE( hasher.add_pages(&page[0], 0, 1, make_sinfo(SI_FLAG_REG), 0) == KEEP_ERROR_INVALID_STATE );
        }
    }
}
