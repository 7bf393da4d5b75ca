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

#include "keep/block.h"

#include <string.h>
#include <atomic>

void CUntrustedBlock::publish_request(const keep_request_t &req)
{
    memcpy(&m_block->msg.req, &req, sizeof(req));

    // prevent earlier writes from being moved beyond this point
    std::atomic_thread_fence(std::memory_order_release);
}

void CUntrustedBlock::collect_reply(keep_reply_t *rep) const
{
    // prevent later reads from being moved before this point
    std::atomic_thread_fence(std::memory_order_acquire);

    memcpy(rep, &m_block->msg.rep, sizeof(*rep));
}

uint64_t CUntrustedBlock::request_number() const
{
    return m_block->msg.req.num;
}

void CUntrustedBlock::read_request(keep_request_t *req) const
{
    memcpy(req, &m_block->msg.req, sizeof(*req));
}

void CUntrustedBlock::write_reply(const keep_reply_t &rep)
{
    memcpy(&m_block->msg.rep, &rep, sizeof(rep));
}

void CUntrustedBlock::reply_ok(uint64_t ret0, uint64_t ret1)
{
    keep_reply_t rep;
    rep.ret[0] = ret0;
    rep.ret[1] = ret1;
    rep.err = 0;
    write_reply(rep);
}

void CUntrustedBlock::reply_err(int error)
{
    keep_reply_t rep;
    rep.ret[0] = (uint64_t)(-(int64_t)error);
    rep.ret[1] = 0;
    rep.err = (uint64_t)error;
    write_reply(rep);
}

bool CUntrustedBlock::in_buffer(uint64_t addr, uint64_t len) const
{
    uint64_t start = reinterpret_cast<uint64_t>(m_block->buf);
    uint64_t end = start + sizeof(m_block->buf);

    if(addr < start || addr > end)
        return false;
    return len <= end - addr;
}
