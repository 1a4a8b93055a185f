/*
 *      CRF1d tagger (implementation of the Viterbi tagger for one instance).
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

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <cmath>

#include <lcrf.h>

#include "crf1d.h"

static const char *state_name(int state)
{
    switch (state) {
    case TS_UNINITIALIZED:
        return "uninitialized";
    case TS_READ:
        return "read";
    case TS_FEATURES_BUILT:
        return "features-built";
    case TS_PARSED:
        return "parsed";
    }
    return "unknown";
}

crf1dt_t::crf1dt_t(int num_labels)
    : num_labels(num_labels),
      state(TS_UNINITIALIZED),
      cost_factor(1.0),
      inst(NULL),
      ctx(num_labels < 1 ? 1 : num_labels, 0),
      path_score(0.)
{
    if (num_labels < 1) {
        throw std::invalid_argument("a tagger needs at least one label");
    }
}

void crf1dt_t::crf1dt_check_state(int expected, const char *op) const
{
    if (this->state != expected) {
        throw lcrf_illegal_state_error(
            std::string(op) + "() is not allowed in the " + state_name(this->state) + " state");
    }
}

void crf1dt_t::set_cost_factor(floatval_t c)
{
    if (!std::isfinite(c) || c < 0.) {
        throw std::invalid_argument("cost factor must be a non-negative finite number");
    }
    if (this->state == TS_PARSED) {
        throw lcrf_illegal_state_error("set_cost_factor() is not allowed in the parsed state");
    }
    this->cost_factor = c;
}

void crf1dt_t::read(const lcrf_sequence_t& inst, const crf1d_feature_index_t& fi)
{
    this->crf1dt_check_state(TS_UNINITIALIZED, "read");
    if (fi.num_labels() != this->num_labels) {
        throw std::invalid_argument("the tagger and the feature index disagree on the number of labels");
    }

    const int T = (int)inst.num_tokens();
    this->inst = &inst;
    this->ctx.crf1dc_set_num_items(T);
    this->ctx.crf1dc_reset();
    this->node_refs.assign(T, feature_refs_t());
    this->edge_refs.assign(T, feature_refs_t());
    this->path.clear();
    this->path_score = 0.;
    this->state = TS_READ;
}

void crf1dt_t::crf1dt_state_score(const std::vector<floatval_t>& alpha)
{
    crf1d_context_t* ctx = &this->ctx;
    const int T = ctx->num_items;
    const int L = this->num_labels;

    /* Loop over the items in the sequence. */
    for (int t = 0;t < T;++t) {
        const feature_refs_t& node = this->node_refs[t];
        floatval_t* state = STATE_SCORE(ctx, t);

        /* The state feature #fid owns the weights [fid, fid+L). */
        for (size_t r = 0;r < node.fids.size();++r) {
            const int fid = node.fids[r];
            if (fid < 0 || alpha.size() < (size_t)fid + L) {
                throw lcrf_model_format_error("state feature out of the weight vector");
            }
            const floatval_t *w = &alpha[fid];
            for (int l = 0;l < L;++l) {
                state[l] += w[l];
            }
        }
    }
}

void crf1dt_t::crf1dt_transition_score(const std::vector<floatval_t>& alpha)
{
    crf1d_context_t* ctx = &this->ctx;
    const int T = ctx->num_items;
    const int L = this->num_labels;

    for (int t = 1;t < T;++t) {
        const feature_refs_t& edge = this->edge_refs[t];
        if (edge.fids.empty()) {
            continue;
        }

        /* The transition feature #fid owns [fid, fid+L*L); the weight of
           the transition #i -> #j is at fid + i*L + j. */
        for (size_t r = 0;r < edge.fids.size();++r) {
            const int fid = edge.fids[r];
            if (fid < 0 || alpha.size() < (size_t)fid + (size_t)L * L) {
                throw lcrf_model_format_error("transition feature out of the weight vector");
            }
            for (int i = 0;i < L;++i) {
                floatval_t *trans = TRANS_SCORE(ctx, t, i);
                const floatval_t *w = &alpha[fid + i * L];
                for (int j = 0;j < L;++j) {
                    trans[j] += w[j];
                }
            }
        }

        if (this->cost_factor != 1.0) {
            for (int i = 0;i < L;++i) {
                floatval_t *trans = TRANS_SCORE(ctx, t, i);
                for (int j = 0;j < L;++j) {
                    trans[j] *= this->cost_factor;
                }
            }
        }
    }
}

void crf1dt_t::parse(const std::vector<floatval_t>& alpha)
{
    this->crf1dt_check_state(TS_FEATURES_BUILT, "parse");

    this->crf1dt_state_score(alpha);
    this->crf1dt_transition_score(alpha);
    this->path_score = this->ctx.crf1dc_viterbi(this->path);
    this->state = TS_PARSED;
}

int crf1dt_t::result(int t) const
{
    this->crf1dt_check_state(TS_PARSED, "result");
    if (t < 0 || this->length() <= t) {
        throw std::out_of_range("result(): position out of the instance");
    }
    return this->path[t];
}

floatval_t crf1dt_t::score() const
{
    this->crf1dt_check_state(TS_PARSED, "score");
    return this->path_score;
}

lcrf_sequence_t crf1dt_tag(const crf1dm_t* model, const lcrf_sequence_t& inst, floatval_t cost_factor)
{
    crf1d_feature_index_t fi;
    fi.read_model(model);

    crf1dt_t tagger(fi.num_labels());
    tagger.set_cost_factor(cost_factor);
    tagger.read(inst, fi);
    fi.build_features(tagger);
    tagger.parse(fi.alpha());

    const std::vector<std::string>& labels = fi.labels();
    std::vector<lcrf_token_t> tokens;
    tokens.reserve(inst.num_tokens());
    for (int t = 0;t < tagger.length();++t) {
        tokens.push_back(lcrf_token_t::put(labels[tagger.result(t)], inst[t].tags()));
    }
    return lcrf_sequence_t(std::move(tokens));
}
