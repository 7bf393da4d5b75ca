#include <catch2/catch.hpp>

#include "keep/config.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"

#include <pthread.h>
#include <stdlib.h>
#include <string.h>

static void clear_environment() {
    unsetenv(KEEP_ENV_DEVICE);
    unsetenv(KEEP_ENV_SHIM);
    unsetenv(KEEP_ENV_LOG_LEVEL);
}

SCENARIO(
    "the configuration comes from defaults and the environment",
    "[config]"
) {

    GIVEN( "an empty environment" ) {
        clear_environment();
        keep_config_t config;
        REQUIRE( keep_config_load(&config) == KEEP_SUCCESS );

        THEN( "the defaults are used" ) {
            REQUIRE( config.device == KEEP_DEFAULT_DEVICE );
            REQUIRE( config.shim_path.empty() );
            REQUIRE( config.log_level == KEEP_TRACE_WARNING );
        }
    }

    GIVEN( "every variable set" ) {
        clear_environment();
        setenv(KEEP_ENV_DEVICE, "/dev/isgx", 1);
        setenv(KEEP_ENV_SHIM, "/usr/lib/keep/shim-sgx", 1);
        setenv(KEEP_ENV_LOG_LEVEL, "debug", 1);
        keep_config_t config;
        int ret = keep_config_load(&config);
        clear_environment();

        THEN( "the environment overrides the defaults" ) {
            REQUIRE( ret == KEEP_SUCCESS );
            REQUIRE( config.device == "/dev/isgx" );
            REQUIRE( config.shim_path == "/usr/lib/keep/shim-sgx" );
            REQUIRE( config.log_level == KEEP_TRACE_DEBUG );
        }
    }

    GIVEN( "an invalid log level" ) {
        clear_environment();
        setenv(KEEP_ENV_LOG_LEVEL, "loud", 1);
        keep_config_t config;
        int ret = keep_config_load(&config);
        clear_environment();

        THEN( "loading fails" ) {
            REQUIRE( ret == KEEP_ERROR_INVALID_PARAMETER );
        }
    }

    GIVEN( "an empty device" ) {
        clear_environment();
        setenv(KEEP_ENV_DEVICE, "", 1);
        keep_config_t config;
        int ret = keep_config_load(&config);
        clear_environment();

        THEN( "loading fails" ) {
            REQUIRE( ret == KEEP_ERROR_INVALID_PARAMETER );
        }
    }
}

SCENARIO(
    "log levels are parsed by name or number",
    "[config]"
) {
    int level = -1;

    REQUIRE( keep_parse_log_level("error", &level) == KEEP_SUCCESS );
    REQUIRE( level == KEEP_TRACE_ERROR );
    REQUIRE( keep_parse_log_level("NOTICE", &level) == KEEP_SUCCESS );
    REQUIRE( level == KEEP_TRACE_NOTICE );
    REQUIRE( keep_parse_log_level("1", &level) == KEEP_SUCCESS );
    REQUIRE( level == KEEP_TRACE_WARNING );
    REQUIRE( keep_parse_log_level("4", &level) == KEEP_ERROR_INVALID_PARAMETER );
    REQUIRE( keep_parse_log_level("", &level) == KEEP_ERROR_INVALID_PARAMETER );
    REQUIRE( keep_parse_log_level(NULL, &level) == KEEP_ERROR_INVALID_PARAMETER );
}

SCENARIO(
    "the trace threshold is clamped to the known levels",
    "[trace]"
) {
    int saved = keep_trace_get_level();

    keep_trace_set_level(KEEP_TRACE_NOTICE);
    REQUIRE( keep_trace_get_level() == KEEP_TRACE_NOTICE );
    keep_trace_set_level(42);
    REQUIRE( keep_trace_get_level() == KEEP_TRACE_DEBUG );
    keep_trace_set_level(-3);
    REQUIRE( keep_trace_get_level() == KEEP_TRACE_ERROR );

    keep_trace_set_level(saved);
}

static void *trace_below_threshold(void *)
{
    // Debug messages stay below every threshold the other thread sets.
    for (int i = 0; i < 10000; i++)
        keep_trace_internal(KEEP_TRACE_DEBUG, "%d\n", i);
    return NULL;
}

SCENARIO(
    "the trace threshold can change while other threads trace",
    "[trace]"
) {
    int saved = keep_trace_get_level();
    keep_trace_set_level(KEEP_TRACE_ERROR);

    pthread_t threads[4];
    for (size_t i = 0; i < 4; i++)
        REQUIRE( pthread_create(&threads[i], NULL, trace_below_threshold, NULL) == 0 );

    for (int i = 0; i < 10000; i++)
        keep_trace_set_level(i % 2 ? KEEP_TRACE_WARNING : KEEP_TRACE_NOTICE);

    for (size_t i = 0; i < 4; i++)
        REQUIRE( pthread_join(threads[i], NULL) == 0 );
    REQUIRE( keep_trace_get_level() == KEEP_TRACE_WARNING );

    keep_trace_set_level(saved);
}

SCENARIO(
    "status codes have messages",
    "[error]"
) {
    REQUIRE( strcmp(keep_strerror(KEEP_SUCCESS), "Success") == 0 );
    REQUIRE( strcmp(keep_strerror(KEEP_ERROR_SLOT_TOO_SMALL), keep_strerror(KEEP_ERROR_NOTE_MISSING)) != 0 );
    REQUIRE( strcmp(keep_strerror(-12345), "Unknown error") == 0 );
}
