#include <catch2/catch.hpp>

#include "helpers.h"
#include "keep/elf_component.h"
#include "keep/enclave_hasher.h"
#include "keep/keep_error.h"
#include "keep/loader.h"
#include "keep/signer.h"

SCENARIO(
    "the loader reads the enclave layout from the shim",
    "[loader]"
) {

    GIVEN( "a code image" ) {
        vector<uint8_t> code_bytes = test_code_image().bytes();
        ElfComponent code(&code_bytes[0], code_bytes.size());
        REQUIRE( code.run_parser() == KEEP_SUCCESS );

        WHEN( "the shim carries both notes and a code slot" ) {
            vector<uint8_t> shim_bytes = test_shim_image().bytes();
            ElfComponent shim(&shim_bytes[0], shim_bytes.size());
            REQUIRE( shim.run_parser() == KEEP_SUCCESS );
            CLoader loader(shim, code);

            THEN( "the geometry comes from the notes" ) {
                REQUIRE( loader.parse_layout() == KEEP_SUCCESS );
                REQUIRE( loader.get_enclave_size() == 0x100000 );
                REQUIRE( loader.get_ssa_frame_size() == 1 );
                REQUIRE( loader.get_slot() == 0x10000 );
            }

            THEN( "the code is relocated into the slot" ) {
                REQUIRE( loader.translate() == KEEP_SUCCESS );
                const CSegmentList &segments = loader.get_segments();
                REQUIRE( segments.size() == 5 );
                REQUIRE( segments[3]->get_vpage() == 0x10 );
                REQUIRE( segments[4]->get_vpage() == 0x12 );
            }

            THEN( "the segments can only be translated once" ) {
                REQUIRE( loader.translate() == KEEP_SUCCESS );
                REQUIRE( loader.translate() == KEEP_ERROR_INVALID_STATE );
            }
        }

        WHEN( "the shim has no size note" ) {
            vector<uint8_t> shim_bytes = ElfImage()
                .load(0x0, 0x1000, PF_R | PF_X)
                .header(PT_KEEP_CODE, 0x10000, 0x10000)
                .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SSAP, 1)
                .bytes();
            ElfComponent shim(&shim_bytes[0], shim_bytes.size());
            REQUIRE( shim.run_parser() == KEEP_SUCCESS );
            CLoader loader(shim, code);

            THEN( "the layout is rejected" ) {
                REQUIRE( loader.translate() == KEEP_ERROR_NOTE_MISSING );
            }
        }

        WHEN( "the shim has no code slot" ) {
            vector<uint8_t> shim_bytes = ElfImage()
                .load(0x0, 0x1000, PF_R | PF_X)
                .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SIZE, 20)
                .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SSAP, 1)
                .bytes();
            ElfComponent shim(&shim_bytes[0], shim_bytes.size());
            REQUIRE( shim.run_parser() == KEEP_SUCCESS );
            CLoader loader(shim, code);

            THEN( "the layout is rejected" ) {
                REQUIRE( loader.parse_layout() == KEEP_ERROR_HEADER_MISSING );
            }
        }

        WHEN( "the code slot is smaller than the code" ) {
            vector<uint8_t> shim_bytes = ElfImage()
                .load(0x0, 0x1000, PF_R | PF_X)
                .header(PT_KEEP_CODE, 0x10000, 0x2000)
                .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SIZE, 20)
                .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SSAP, 1)
                .bytes();
            ElfComponent shim(&shim_bytes[0], shim_bytes.size());
            REQUIRE( shim.run_parser() == KEEP_SUCCESS );
            CLoader loader(shim, code);

            THEN( "the layout is rejected" ) {
                REQUIRE( loader.parse_layout() == KEEP_ERROR_SLOT_TOO_SMALL );
            }
        }

        WHEN( "a shim segment wraps the address space" ) {
            vector<uint8_t> shim_bytes = ElfImage()
                .load(0x0, 0x1000, PF_R | PF_X, vector<uint8_t>(0x1000, 0xC3))
                .load(0x1000, 0x1000, PF_R | PF_W | PF_KEEP_SGX_TCS, vector<uint8_t>(0x48, 0x01))
                .load(0x0, 0xFFFFFFFFFFFFF001ULL, PF_R | PF_W, vector<uint8_t>(16, 0x55))
                .header(PT_KEEP_CODE, 0x10000, 0x10000)
                .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SIZE, 20)
                .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SSAP, 1)
                .bytes();
            ElfComponent shim(&shim_bytes[0], shim_bytes.size());
            REQUIRE( shim.run_parser() == KEEP_SUCCESS );
            CLoader loader(shim, code);

            THEN( "translation fails and no segment is kept" ) {
                REQUIRE( loader.translate() == KEEP_ERROR_INVALID_ENCLAVE );
                const CSegmentList &segments = loader.get_segments();
                for (size_t i = 0; i < segments.size(); i++)
                    REQUIRE( segments[i]->get_page_count() != 0 );
            }
        }

        WHEN( "a shim segment ends past the enclave" ) {
            vector<uint8_t> shim_bytes = ElfImage()
                .load(0x0, 0x1000, PF_R | PF_X, vector<uint8_t>(0x1000, 0xC3))
                .load(0xFF000, 0x2000, PF_R | PF_W)
                .header(PT_KEEP_CODE, 0x10000, 0x10000)
                .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SIZE, 20)
                .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SSAP, 1)
                .bytes();
            ElfComponent shim(&shim_bytes[0], shim_bytes.size());
            REQUIRE( shim.run_parser() == KEEP_SUCCESS );
            CLoader loader(shim, code);

            THEN( "translation fails" ) {
                REQUIRE( loader.translate() == KEEP_ERROR_INVALID_ENCLAVE );
            }
        }

        WHEN( "the SSA frame note is zero" ) {
            vector<uint8_t> shim_bytes = ElfImage()
                .load(0x0, 0x1000, PF_R | PF_X)
                .header(PT_KEEP_CODE, 0x10000, 0x10000)
                .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SIZE, 20)
                .note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SSAP, 0)
                .bytes();
            ElfComponent shim(&shim_bytes[0], shim_bytes.size());
            REQUIRE( shim.run_parser() == KEEP_SUCCESS );
            CLoader loader(shim, code);

            THEN( "the layout is rejected" ) {
                REQUIRE( loader.parse_layout() == KEEP_ERROR_INVALID_ENCLAVE );
            }
        }
    }
}

SCENARIO(
    "every sink sees the same pages from a single pass",
    "[loader]"
) {

    GIVEN( "a translated shim and code" ) {
        vector<uint8_t> shim_bytes = test_shim_image().bytes();
        vector<uint8_t> code_bytes = test_code_image().bytes();
        ElfComponent shim(&shim_bytes[0], shim_bytes.size());
        ElfComponent code(&code_bytes[0], code_bytes.size());
        REQUIRE( shim.run_parser() == KEEP_SUCCESS );
        REQUIRE( code.run_parser() == KEEP_SUCCESS );

        CLoader loader(shim, code);
        REQUIRE( loader.translate() == KEEP_SUCCESS );

        enclave_params_t params;
        keep_default_params(&params);
        secs_t secs;
        keep_init_secs(&secs, loader.get_enclave_size(), loader.get_ssa_frame_size(), params);

        WHEN( "two sinks are loaded together" ) {
            RecordingSink first, second;
            SegmentSink *sinks[2] = { &first, &second };
            REQUIRE( loader.load_segments(&secs, sinks, 2) == KEEP_SUCCESS );

            THEN( "both enclaves are created with the shim's geometry" ) {
                REQUIRE( first.created == 1 );
                REQUIRE( second.created == 1 );
                REQUIRE( first.size == 0x100000 );
                REQUIRE( first.ssa_frame_size == 1 );
            }

            THEN( "both sinks receive identical calls in identical order" ) {
                REQUIRE( first.calls.size() == 5 );
                REQUIRE( first.calls.size() == second.calls.size() );
                for (size_t i = 0; i < first.calls.size(); i++)
                    REQUIRE( first.calls[i] == second.calls[i] );
            }

            THEN( "the pages are added in ascending order with their attributes" ) {
                REQUIRE( first.calls[0].vpage == 0 );
                REQUIRE( first.calls[1].si_flags == SI_FLAG_TCS );
                REQUIRE( first.calls[2].flags == 0 );
                REQUIRE( first.calls[3].vpage == 0x10 );
                REQUIRE( first.calls[3].flags == ADD_PAGE_MEASURE );
            }
        }

        WHEN( "a sink fails part way" ) {
            RecordingSink first, second;
            second.fail_after = 1;
            second.fail_status = KEEP_ERROR_OUT_OF_MEMORY;
            SegmentSink *sinks[2] = { &first, &second };

            THEN( "the error is returned and the pass stops" ) {
                REQUIRE( loader.load_segments(&secs, sinks, 2) == KEEP_ERROR_OUT_OF_MEMORY );
                REQUIRE( first.calls.size() == 2 );
                REQUIRE( second.calls.size() == 2 );
            }
        }

        WHEN( "the enclave is measured" ) {
            enclave_author_t author = { 0, 0, 0 };
            sgx_measurement_t mr;
            enclave_css_t css;
            REQUIRE( loader.measure(params, author, &mr, &css) == KEEP_SUCCESS );

            THEN( "the measurement equals a replay of the recorded pass" ) {
                RecordingSink recorder;
                SegmentSink *sinks[1] = { &recorder };
                REQUIRE( loader.load_segments(&secs, sinks, 1) == KEEP_SUCCESS );

                EnclaveHasher hasher;
                REQUIRE( hasher.create_enclave(&secs) == KEEP_SUCCESS );
                for (size_t i = 0; i < recorder.calls.size(); i++) {
                    const RecordingSink::call_t &call = recorder.calls[i];
                    sec_info_t sinfo;
                    memset(&sinfo, 0, sizeof(sinfo));
                    sinfo.flags = call.si_flags;
                    REQUIRE( hasher.add_pages(&call.pages[0], call.vpage, call.count, sinfo, call.flags) == KEEP_SUCCESS );
                }
                sgx_measurement_t replay;
                REQUIRE( hasher.finish(&replay) == KEEP_SUCCESS );
                REQUIRE( memcmp(mr.m, replay.m, SGX_HASH_SIZE) == 0 );
            }

            THEN( "the signature covers the measurement" ) {
                REQUIRE( memcmp(css.body.enclave_hash.m, mr.m, SGX_HASH_SIZE) == 0 );
                REQUIRE( keep_verify_css(&css) == KEEP_SUCCESS );
            }
        }
    }
}
