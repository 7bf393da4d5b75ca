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

/**
 * File: segment_sink.h
 * Description: the interface the loader feeds the enclave pages into.
 *
 *   Building the hardware enclave and measuring it are both sinks. The
 *   loader drives every sink from a single pass over the segments, so each
 *   sink sees the same pages with the same SECINFO and flags in the same
 *   order.
 */

#ifndef _KEEP_SEGMENT_SINK_H_
#define _KEEP_SEGMENT_SINK_H_

#include "arch.h"
#include "uncopyable.h"

class SegmentSink : private Uncopyable
{
public:
    /*
    @secs   size and ssa_frame_size must be set; a hardware sink fills in base.
    */
    virtual int create_enclave(secs_t *secs) = 0;
    /*
    @src    `count' pages, page aligned;
    @vpage  destination page number, relative to the enclave base;
    @flags  ADD_PAGE_MEASURE to extend the pages into the measurement;
    */
    virtual int add_pages(const uint8_t *src, uint64_t vpage, uint64_t count, const sec_info_t &sinfo, uint32_t flags) = 0;
    // destructor
    virtual ~SegmentSink() {};
};

void keep_init_secs(secs_t *secs, uint64_t size, uint32_t ssa_frame_size, const enclave_params_t &params);

#endif
