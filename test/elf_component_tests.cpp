#include <catch2/catch.hpp>

#include "helpers.h"
#include "keep/elf_component.h"
#include "keep/keep_error.h"

SCENARIO(
    "images are parsed into program headers and notes",
    "[elf]"
) {

    GIVEN( "a well formed shim image" ) {
        vector<uint8_t> bytes = test_shim_image().bytes();
        ElfComponent component(&bytes[0], bytes.size());
        REQUIRE( component.run_parser() == KEEP_SUCCESS );

        THEN( "every program header is available" ) {
            REQUIRE( component.get_headers().size() == 5 );
        }

        THEN( "the code slot can be found" ) {
            const Elf64_Phdr *slot = component.find_header(PT_KEEP_CODE);
            REQUIRE( slot != NULL );
            REQUIRE( slot->p_vaddr == 0x10000 );
            REQUIRE( slot->p_memsz == 0x10000 );
        }

        THEN( "a header type that is not present is not found" ) {
            REQUIRE( component.find_header(PT_DYNAMIC) == NULL );
        }

        THEN( "only the loadable headers are selected" ) {
            vector<const Elf64_Phdr *> loads;
            component.filter_headers(PT_LOAD, loads);
            REQUIRE( loads.size() == 3 );
        }

        THEN( "the loaded region spans all loadable headers" ) {
            uint64_t start = 1, end = 0;
            REQUIRE( component.get_region(&start, &end) );
            REQUIRE( start == 0 );
            REQUIRE( end == 0x4000 );
        }

        THEN( "the notes can be read" ) {
            uint32_t bits = 0, ssap = 0;
            REQUIRE( component.read_note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SIZE, &bits, sizeof(bits)) == KEEP_SUCCESS );
            REQUIRE( component.read_note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SSAP, &ssap, sizeof(ssap)) == KEEP_SUCCESS );
            REQUIRE( bits == 20 );
            REQUIRE( ssap == 1 );
        }

        THEN( "a note of another namespace is not found" ) {
            uint32_t value = 0;
            REQUIRE( component.read_note("other", NOTE_KEEP_SGX_SIZE, &value, sizeof(value)) == KEEP_ERROR_NOTE_MISSING );
        }

        THEN( "a note read with the wrong size is rejected" ) {
            uint64_t value = 0;
            REQUIRE( component.read_note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SIZE, &value, sizeof(value)) == KEEP_ERROR_INVALID_ENCLAVE );
        }
    }

    GIVEN( "an image without notes" ) {
        vector<uint8_t> bytes = test_code_image().bytes();
        ElfComponent component(&bytes[0], bytes.size());
        REQUIRE( component.run_parser() == KEEP_SUCCESS );

        THEN( "reading a note reports it missing" ) {
            uint32_t value = 0;
            REQUIRE( component.read_note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SSAP, &value, sizeof(value)) == KEEP_ERROR_NOTE_MISSING );
        }
    }

    GIVEN( "an image with an empty note segment at the end of the file" ) {
        vector<uint8_t> bytes = test_code_image().header(PT_NOTE, 0x0, 0x0).bytes();
        Elf64_Ehdr ehdr;
        memcpy(&ehdr, &bytes[0], sizeof(ehdr));
        for (size_t i = 0; i < ehdr.e_phnum; i++) {
            Elf64_Phdr phdr;
            size_t at = ehdr.e_phoff + i * sizeof(phdr);
            memcpy(&phdr, &bytes[at], sizeof(phdr));
            if (phdr.p_type != PT_NOTE)
                continue;
            phdr.p_offset = bytes.size();
            memcpy(&bytes[at], &phdr, sizeof(phdr));
        }
        ElfComponent component(&bytes[0], bytes.size());
        REQUIRE( component.run_parser() == KEEP_SUCCESS );

        THEN( "the empty segment holds no notes" ) {
            uint32_t value = 0;
            REQUIRE( component.read_note(KEEP_NOTE_NAMESPACE, NOTE_KEEP_SGX_SIZE, &value, sizeof(value)) == KEEP_ERROR_NOTE_MISSING );
        }
    }

    GIVEN( "images that are not x86_64 ELF files" ) {
        WHEN( "the machine is not x86_64" ) {
            vector<uint8_t> bytes = test_code_image().machine(EM_AARCH64).bytes();
            ElfComponent component(&bytes[0], bytes.size());

            THEN( "the parser rejects it" ) {
                REQUIRE( component.run_parser() == KEEP_ERROR_INVALID_ENCLAVE );
            }
        }

        WHEN( "the image is a relocatable object" ) {
            vector<uint8_t> bytes = test_code_image().type(ET_REL).bytes();
            ElfComponent component(&bytes[0], bytes.size());

            THEN( "the parser rejects it" ) {
                REQUIRE( component.run_parser() == KEEP_ERROR_INVALID_ENCLAVE );
            }
        }

        WHEN( "the image is truncated" ) {
            vector<uint8_t> bytes = test_code_image().bytes();
            bytes.resize(bytes.size() - 0x100);
            ElfComponent component(&bytes[0], bytes.size());

            THEN( "the parser rejects it" ) {
                REQUIRE( component.run_parser() == KEEP_ERROR_INVALID_ENCLAVE );
            }
        }

        WHEN( "the image is shorter than an ELF header" ) {
            const uint8_t bytes[] = { 0x7f, 'E', 'L', 'F' };
            ElfComponent component(bytes, sizeof(bytes));

            THEN( "the parser rejects it" ) {
                REQUIRE( component.run_parser() == KEEP_ERROR_INVALID_ENCLAVE );
            }
        }
    }
}
