/*
 *      CRF1d feature templates and feature index.
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

#include <ctype.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <lcrf.h>

#include "crf1d.h"

/* Pseudo attributes of the items before and after an instance. */
static const char *BOS[CRF1D_MAX_CONTEXT] = {
    "_B-1", "_B-2", "_B-3", "_B-4", "_B-5", "_B-6", "_B-7", "_B-8"
};
static const char *EOS[CRF1D_MAX_CONTEXT] = {
    "_B+1", "_B+2", "_B+3", "_B+4", "_B+5", "_B+6", "_B+7", "_B+8"
};

static int read_offset(const char **pp, int *value)
{
    const char *p = *pp;
    char *end = NULL;
    long v;

    if (!(isdigit((unsigned char)*p) || ((*p == '-' || *p == '+') && isdigit((unsigned char)p[1])))) {
        return 1;
    }
    errno = 0;
    v = strtol(p, &end, 10);
    if (errno != 0 || v < -1000000 || 1000000 < v) {
        return 1;
    }
    *value = (int)v;
    *pp = end;
    return 0;
}

int crf1d_template_compile(crf1d_template_t* templ, const std::string& source, int xsize, std::string& error)
{
    const char *p = source.c_str();
    std::string text;

    templ->source = source;
    templ->texts.clear();
    templ->rows.clear();
    templ->cols.clear();

    if (source.empty() || (source[0] != 'U' && source[0] != 'B')) {
        error = "template must begin with 'U' or 'B': " + source;
        return 1;
    }

    while (*p) {
        if (*p != '%') {
            text += *p++;
            continue;
        }

        /* Parse %x[row,col]. */
        int row = 0, col = 0;
        ++p;
        if (p[0] != 'x' || p[1] != '[') {
            error = "unknown macro in template: " + source;
            return 1;
        }
        p += 2;
        if (read_offset(&p, &row) != 0 || *p != ',') {
            error = "invalid row in template: " + source;
            return 1;
        }
        ++p;
        if (read_offset(&p, &col) != 0 || *p != ']') {
            error = "invalid column in template: " + source;
            return 1;
        }
        ++p;

        if (row < -CRF1D_MAX_CONTEXT || CRF1D_MAX_CONTEXT < row) {
            error = "row out of context range in template: " + source;
            return 1;
        }
        if (col < 0 || xsize <= col) {
            error = "column exceeds xsize in template: " + source;
            return 1;
        }

        templ->texts.push_back(text);
        templ->rows.push_back(row);
        templ->cols.push_back(col);
        text.clear();
    }
    templ->texts.push_back(text);
    return 0;
}



void crf1d_feature_index_t::read_model(const lcrf_model_t& model)
{
    this->read_model(model.internal());
}

void crf1d_feature_index_t::read_model(const crf1dm_t* model)
{
    if (model == NULL) {
        throw std::invalid_argument("read_model() requires a model");
    }
    if (!model->error.empty()) {
        throw lcrf_model_format_error(model->error);
    }
    this->model = model;
}

int crf1d_feature_index_t::num_labels() const
{
    return (int)this->labels().size();
}

const std::vector<std::string>& crf1d_feature_index_t::labels() const
{
    if (this->model == NULL) {
        throw lcrf_illegal_state_error("feature index is not bound to a model");
    }
    return this->model->header.labels;
}

const std::vector<floatval_t>& crf1d_feature_index_t::alpha() const
{
    if (this->model == NULL) {
        throw lcrf_illegal_state_error("feature index is not bound to a model");
    }
    return this->model->alpha;
}

const char *crf1d_feature_index_t::get_index(int row, int col, int pos, const crf1dt_t& tagger) const
{
    const int T = tagger.length();
    const int idx = pos + row;

    if (idx < 0) {
        return BOS[-idx - 1];
    }
    if (idx >= T) {
        return EOS[idx - T];
    }

    const lcrf_token_t& token = tagger.token(idx);
    if ((size_t)col >= token.num_tags()) {
        return NULL;
    }
    return token.tag((size_t)col).c_str();
}

bool crf1d_feature_index_t::apply_rule(std::string& os, const crf1d_template_t& templ, int pos, const crf1dt_t& tagger) const
{
    os.clear();
    for (size_t i = 0;i < templ.rows.size();++i) {
        const char *r = this->get_index(templ.rows[i], templ.cols[i], pos, tagger);
        if (r == NULL) {
            return false;
        }
        os += templ.texts[i];
        os += r;
    }
    os += templ.texts.back();
    return true;
}

void crf1d_feature_index_t::build_features(crf1dt_t& tagger) const
{
    int t;
    size_t k;
    std::string key;

    if (this->model == NULL) {
        throw lcrf_illegal_state_error("build_features() called before read_model()");
    }
    if (tagger.state != TS_READ) {
        throw lcrf_illegal_state_error("build_features() requires a tagger that has just read an instance");
    }

    const crf1dm_header_t& header = this->model->header;
    const int T = tagger.length();

    for (t = 0;t < T;++t) {
        feature_refs_t& node = tagger.node_refs[t];
        feature_refs_t& edge = tagger.edge_refs[t];
        node.fids.clear();
        edge.fids.clear();

        /* State features at #t. Keys not in the model are ignored. */
        for (k = 0;k < header.unigram_templs.size();++k) {
            if (this->apply_rule(key, header.unigram_templs[k], t, tagger)) {
                int fid = this->model->crf1dm_to_fid(key.c_str());
                if (0 <= fid) {
                    node.fids.push_back(fid);
                }
            }
        }

        /* Transition features into #t. */
        if (0 < t) {
            for (k = 0;k < header.bigram_templs.size();++k) {
                if (this->apply_rule(key, header.bigram_templs[k], t, tagger)) {
                    int fid = this->model->crf1dm_to_fid(key.c_str());
                    if (0 <= fid) {
                        edge.fids.push_back(fid);
                    }
                }
            }
        }
    }

    tagger.state = TS_FEATURES_BUILT;
}
