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

#ifndef _KEEP_BLOCK_H_
#define _KEEP_BLOCK_H_

#include "arch.h"
#include <stdint.h>

#define KEEP_BLOCK_SIZE     SE_PAGE_SIZE

/* Requests serviced by the host runtime itself */
#define KEEP_SYS_GETATT     0xEA01
#define KEEP_SYS_CPUID      0xEA02

#define KEEP_REQUEST_ARGS   6

typedef struct _keep_request_t
{
    uint64_t    num;
    uint64_t    arg[KEEP_REQUEST_ARGS];
} keep_request_t;

typedef struct _keep_reply_t
{
    uint64_t    ret[2];
    uint64_t    err;        /* errno, 0 on success */
} keep_reply_t;

/* The request is replaced by its reply in place */
typedef union _keep_message_t
{
    keep_request_t  req;
    keep_reply_t    rep;
} keep_message_t;

typedef struct _keep_block_t
{
    keep_message_t  msg;
    uint8_t         buf[KEEP_BLOCK_SIZE - sizeof(keep_message_t)];
} keep_block_t;

se_static_assert(sizeof(keep_block_t) == KEEP_BLOCK_SIZE);

// Accessors for the block shared with the other side of the enclave
// boundary. Nothing read from it is trusted, and the two fence points of the
// proxy protocol live here.
class CUntrustedBlock
{
public:
    explicit CUntrustedBlock(keep_block_t *block) : m_block(block) {}

    keep_block_t *get() const { return m_block; }

    /* in-enclave side */

    // Store the request, then fence so it is visible before the enclave exits.
    void publish_request(const keep_request_t &req);
    // Fence so no read of the reply is done before the host wrote it, then copy it out.
    void collect_reply(keep_reply_t *rep) const;

    /* host side */

    uint64_t request_number() const;
    void read_request(keep_request_t *req) const;
    void write_reply(const keep_reply_t &rep);
    void reply_ok(uint64_t ret0, uint64_t ret1);
    void reply_err(int error);

    // Check that [addr, addr + len) is inside the data buffer of the block.
    bool in_buffer(uint64_t addr, uint64_t len) const;

private:
    keep_block_t *m_block;
};

#endif
