/*
 *      Shared fixtures for the lcrf unit tests.
 *
 * Copyright (c) 2007-2010, Naoaki Okazaki
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *     * Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *     * Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *     * Neither the names of the authors nor the names of its contributors
 *       may be used to endorse or promote products derived from this
 *       software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef __LCRF_TEST_UTIL_H__
#define __LCRF_TEST_UTIL_H__

#include <stdarg.h>
#include <stdio.h>

#include <string>
#include <vector>

#include <lcrf.h>

/*
 * A two-label model (N, V) over one attribute column.
 *
 *  U00:dog   -> N: 2, V: 0
 *  U00:runs  -> N: 0, V: 1
 *  B         -> N>N: -1, N>V: -3, V>N: 0, V>V: -0.5
 *  U01:_B-1  -> N: 0, V: 0
 *
 * For "dog runs" the paths score NN = 1, NV = 0, VN = 0, VV = 0.5.
 */
inline std::vector<std::string> sample_head(const char *maxid = "10")
{
    const char *head[] = {
        "maxid:", maxid,
        "cost-factor:", "1",
        "xsize:", "1",
        "Labels:", "N", "V",
        "UGrams:", "U00:%x[0,0]", "U01:%x[-1,0]",
        "BGrams:", "B",
    };
    return std::vector<std::string>(head, head + sizeof(head) / sizeof(head[0]));
}

inline std::vector<lcrf_feature_entry_t> sample_dic()
{
    std::vector<lcrf_feature_entry_t> dic;
    dic.push_back(lcrf_feature_entry_t("U00:dog", 0));
    dic.push_back(lcrf_feature_entry_t("U00:runs", 2));
    dic.push_back(lcrf_feature_entry_t("B", 4));
    dic.push_back(lcrf_feature_entry_t("U01:_B-1", 8));
    return dic;
}

inline std::vector<floatval_t> sample_alpha()
{
    const floatval_t alpha[] = {2., 0., 0., 1., -1., -3., 0., -0.5, 0., 0.};
    return std::vector<floatval_t>(alpha, alpha + sizeof(alpha) / sizeof(alpha[0]));
}

inline lcrf_model_t sample_model()
{
    return lcrf_model_t(sample_head(), sample_dic(), sample_alpha());
}

inline lcrf_sequence_t make_sequence(const std::vector<std::string>& words)
{
    std::vector<lcrf_token_t> tokens;
    for (size_t i = 0;i < words.size();++i) {
        tokens.push_back(lcrf_token_t::put(std::vector<std::string>(1, words[i])));
    }
    return lcrf_sequence_t(tokens);
}

inline std::vector<std::string> labels_of(const lcrf_sequence_t& seq)
{
    std::vector<std::string> labels;
    for (size_t i = 0;i < seq.num_tokens();++i) {
        labels.push_back(seq[i].label());
    }
    return labels;
}

/* Logging callback that appends the messages to a std::string. */
inline int capture_message(void *user, const char *format, va_list args)
{
    char buffer[1024];
    vsnprintf(buffer, sizeof(buffer), format, args);
    static_cast<std::string*>(user)->append(buffer);
    return 0;
}

#endif/*__LCRF_TEST_UTIL_H__*/
