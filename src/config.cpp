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

#include "keep/config.h"
#include "keep/keep_error.h"
#include "keep/keep_trace.h"
#include "keep/util.h"

#include <stdlib.h>
#include <string.h>
#include <strings.h>

static const char *level_names[] = { "error", "warning", "notice", "debug" };

void keep_config_defaults(keep_config_t *config)
{
    config->device = KEEP_DEFAULT_DEVICE;
    config->shim_path.clear();
    config->log_level = KEEP_TRACE_WARNING;
}

int keep_parse_log_level(const char *value, int *level)
{
    if(value == NULL || level == NULL)
        return KEEP_ERROR_INVALID_PARAMETER;

    for(int i = 0; i < (int)ARRAY_LENGTH(level_names); i++)
    {
        if(strcasecmp(value, level_names[i]) == 0)
        {
            *level = i;
            return KEEP_SUCCESS;
        }
    }

    if(value[0] >= '0' && value[0] <= '3' && value[1] == '\0')
    {
        *level = value[0] - '0';
        return KEEP_SUCCESS;
    }

    return KEEP_ERROR_INVALID_PARAMETER;
}

int keep_config_load(keep_config_t *config)
{
    if(config == NULL)
        return KEEP_ERROR_INVALID_PARAMETER;

    keep_config_defaults(config);

    const char *device = getenv(KEEP_ENV_DEVICE);
    if(device != NULL)
    {
        if(device[0] == '\0')
        {
            KEEP_TRACE(KEEP_TRACE_ERROR, "%s is set but empty\n", KEEP_ENV_DEVICE);
            return KEEP_ERROR_INVALID_PARAMETER;
        }
        config->device = device;
    }

    const char *shim = getenv(KEEP_ENV_SHIM);
    if(shim != NULL)
        config->shim_path = shim;

    const char *level = getenv(KEEP_ENV_LOG_LEVEL);
    if(level != NULL && keep_parse_log_level(level, &config->log_level) != KEEP_SUCCESS)
    {
        KEEP_TRACE(KEEP_TRACE_ERROR, "invalid %s value \"%s\"\n", KEEP_ENV_LOG_LEVEL, level);
        return KEEP_ERROR_INVALID_PARAMETER;
    }

    return KEEP_SUCCESS;
}
