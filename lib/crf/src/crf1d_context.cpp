/*
 *      CRF1d context (lattice scores, viterbi).
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

/* $Id$ */

#include <float.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>

#include <algorithm>

#include <lcrf.h>

#include "crf1d.h"



crf1d_context_t::crf1d_context_t(int L, int T)
    : num_labels(L), num_items(0), cap_items(0)
{
    crf1dc_set_num_items(T);
    /* T gives the 'hint' for maximum length of items. */
    this->num_items = 0;
}

void crf1d_context_t::crf1dc_set_num_items(int T)
{
    const int L = this->num_labels;

    this->num_items = T;

    if (this->cap_items < T) {
        this->state.resize((size_t)T * L);
        this->trans.resize((size_t)T * L * L);
        this->alpha_score.resize((size_t)T * L);
        this->backward_edge.resize((size_t)T * L);
        this->cap_items = T;
    }
}

void crf1d_context_t::crf1dc_reset()
{
    const int T = this->num_items;
    const int L = this->num_labels;

    std::fill_n(this->state.begin(), (size_t)T * L, 0.0);
    std::fill_n(this->trans.begin(), (size_t)T * L * L, 0.0);
}

floatval_t crf1d_context_t::crf1dc_score(const std::vector<int>& labels) const
{
    int i, j, t;
    floatval_t ret = 0;
    const floatval_t *state = NULL, *trans = NULL;
    const int T = this->num_items;

    if (T <= 0) {
        return 0.;
    }

    /* Stay at (0, labels[0]). */
    i = labels[0];
    state = STATE_SCORE(this, 0);
    ret = state[i];

    /* Loop over the rest of items. */
    for (t = 1;t < T;++t) {
        j = labels[t];
        trans = TRANS_SCORE(this, t, i);
        state = STATE_SCORE(this, t);

        /* Transit from (t-1, i) to (t, j). */
        ret += trans[j];
        ret += state[j];
        i = j;
    }
    return ret;
}

floatval_t crf1d_context_t::crf1dc_viterbi(std::vector<int>& labels)
{
    int i, j, t;
    int *back = NULL;
    floatval_t max_score, score, *cur = NULL;
    int argmax_score;
    const floatval_t *prev = NULL, *state = NULL;
    const int T = this->num_items;
    const int L = this->num_labels;

    labels.resize(T);
    if (T <= 0) {
        return 0.;
    }

    /* Compute the scores at (0, *). */
    cur = ALPHA_SCORE(this, 0);
    state = STATE_SCORE(this, 0);
    for (j = 0;j < L;++j) {
        cur[j] = state[j];
    }

    /* Compute the scores at (t, *). */
    for (t = 1;t < T;++t) {
        prev = ALPHA_SCORE(this, t-1);
        cur = ALPHA_SCORE(this, t);
        state = STATE_SCORE(this, t);
        back = BACKWARD_EDGE_AT(this, t);

        /* Compute the score of (t, j). */
        for (j = 0;j < L;++j) {
            /* Start from the transition from (t-1, 0); a later label
               replaces it only with a strictly greater score. */
            max_score = prev[0] + TRANS_SCORE(this, t, 0)[j];
            argmax_score = 0;
            for (i = 1;i < L;++i) {
                /* Transit from (t-1, i) to (t, j). */
                score = prev[i] + TRANS_SCORE(this, t, i)[j];

                /* Store this path if it has the maximum score. */
                if (max_score < score) {
                    max_score = score;
                    argmax_score = i;
                }
            }
            /* Backward link (#t, #j) -> (#t-1, #i). */
            back[j] = argmax_score;
            /* Add the state score on (t, j). */
            cur[j] = max_score + state[j];
        }
    }

    /* Find the node (#T, #i) that reaches EOS with the maximum score. */
    prev = ALPHA_SCORE(this, T-1);
    max_score = prev[0];
    labels[T-1] = 0;
    for (i = 1;i < L;++i) {
        if (max_score < prev[i]) {
            max_score = prev[i];
            labels[T-1] = i;        /* Tag the item #T. */
        }
    }

    /* Tag labels by tracing the backward links. */
    for (t = T-2;0 <= t;--t) {
        back = BACKWARD_EDGE_AT(this, t+1);
        labels[t] = back[labels[t+1]];
    }

    return max_score;
}
