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

#include "keep/shim/shim_gate.h"
#include "keep/util.h"

#include <string.h>
#include <sys/syscall.h>

void CHardwareShimGate::raise_exit()
{
    __asm__ __volatile__("syscall" ::: "rcx", "r11", "memory");
}

uint64_t CHardwareShimGate::round_trip(const keep_request_t &req)
{
    keep_reply_t rep;
    m_block.publish_request(req);
    raise_exit();
    m_block.collect_reply(&rep);
    return rep.ret[0];
}

void CHardwareShimGate::terminate(int status)
{
    keep_request_t req;
    memset(&req, 0, sizeof(req));
    req.num = SYS_exit_group;
    req.arg[0] = (uint64_t)(int64_t)status;

    // A host that resumes us anyway gets asked again.
    for(;;)
        round_trip(req);
}

void CHardwareShimGate::debug_write(const char *msg, size_t len)
{
    keep_block_t *block = m_block.get();
    len = MIN(len, sizeof(block->buf));
    memcpy(block->buf, msg, len);

    keep_request_t req;
    memset(&req, 0, sizeof(req));
    req.num = SYS_write;
    req.arg[0] = 2;
    req.arg[1] = reinterpret_cast<uint64_t>(block->buf);
    req.arg[2] = len;

    // Diagnostics are best effort, a short write is not retried.
    round_trip(req);
}
