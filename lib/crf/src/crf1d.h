/*
 *      The 1st-order linear-chain CRF with template features (CRF1d).
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

#ifndef    __CRF1D_H__
#define    __CRF1D_H__

#include <lcrf.h>
#include "lcrf_internal.h"
#include <string>
#include <vector>


/**
 * \defgroup crf1d_context.cpp
 */
/** @{ */

/**
 * Lattice structure.
 *  This structure maintains the scores of one instance. All matrices are
 *  flat arrays that grow with the number of items and are reused.
 */
struct crf1d_context_t {
    /**
     * The total number of distinct labels (L).
     */
    int num_labels;

    /**
     * The number of items (T) in the instance.
     */
    int num_items;

    /**
     * The maximum number of items the matrices can hold.
     */
    int cap_items;

    /**
     * State scores.
     *  This is a [T][L] matrix whose element [t][l] presents total score
     *  of state features associating label #l at #t.
     */
    std::vector<floatval_t> state;

    /**
     * Transition scores.
     *  This is a [T][L][L] matrix whose element [t][i][j] represents the
     *  total score of transition features associating label #i at #(t-1)
     *  and label #j at #t. The slice at t = 0 is unused.
     */
    std::vector<floatval_t> trans;

    /**
     * Viterbi score matrix.
     *  This is a [T][L] matrix whose element [t][l] presents the maximum
     *  score of paths starting at BOS and arraiving at (t, l).
     */
    std::vector<floatval_t> alpha_score;

    /**
     * Backward edges.
     *  This is a [T][L] matrix whose element [t][j] represents the label #i
     *  that yields the maximum score to arrive at (t, j).
     */
    std::vector<int> backward_edge;

public:
    crf1d_context_t(int L, int T);
    void crf1dc_set_num_items(int T);
    void crf1dc_reset();
    floatval_t crf1dc_score(const std::vector<int>& labels) const;
    floatval_t crf1dc_viterbi(std::vector<int>& labels);
};

#define    MATRIX(p, xl, x, y)        ((p)[(xl) * (y) + (x)])

#define    ALPHA_SCORE(ctx, t) \
    (&MATRIX((ctx)->alpha_score, (ctx)->num_labels, 0, t))
#define    STATE_SCORE(ctx, t) \
    (&MATRIX((ctx)->state, (ctx)->num_labels, 0, t))
#define    TRANS_SCORE(ctx, t, i) \
    (&MATRIX((ctx)->trans, (ctx)->num_labels, 0, (t) * (ctx)->num_labels + (i)))
#define    BACKWARD_EDGE_AT(ctx, t) \
    (&MATRIX((ctx)->backward_edge, (ctx)->num_labels, 0, t))

/** @} */



/**
 * \defgroup crf1d_feature.cpp
 */
/** @{ */

/** Maximum distance between the current item and an item referred by %x. */
#define    CRF1D_MAX_CONTEXT    8

/**
 * A compiled feature template.
 *  "U01:%x[-1,0]/%x[0,0]" is stored as the texts {"U01:", "/", ""} and the
 *  macros {(-1, 0), (0, 0)}; texts[i] precedes macro #i.
 */
struct crf1d_template_t {
    std::string source;
    std::vector<std::string> texts;
    std::vector<int> rows;
    std::vector<int> cols;
};

int crf1d_template_compile(crf1d_template_t* templ, const std::string& source, int xsize, std::string& error);

/**
 * Feature references.
 *    This is a collection of feature ids (offsets of weight blocks) fired
 *    at one position.
 */
struct feature_refs_t {
    std::vector<int> fids;
};

struct crf1dt_t;

/**
 * Feature index.
 *  Binds to the dictionary and the header of one model and resolves the
 *  features fired at every node and edge of a tagger lattice. An instance
 *  is created for every decode and holds no state besides the binding.
 */
struct crf1d_feature_index_t {
    const crf1dm_t *model;

public:
    crf1d_feature_index_t() : model(NULL) {}

    void read_model(const lcrf_model_t& model);
    void read_model(const crf1dm_t* model);
    void build_features(crf1dt_t& tagger) const;

    int num_labels() const;
    const std::vector<std::string>& labels() const;
    const std::vector<floatval_t>& alpha() const;

private:
    const char *get_index(int row, int col, int pos, const crf1dt_t& tagger) const;
    bool apply_rule(std::string& os, const crf1d_template_t& templ, int pos, const crf1dt_t& tagger) const;
};

/** @} */



/**
 * \defgroup crf1d_model.cpp
 */
/** @{ */

/**
 * Header sections.
 */
#define    HEAD_VERSION        "version:"
#define    HEAD_MAXID          "maxid:"
#define    HEAD_COSTFACTOR     "cost-factor:"
#define    HEAD_XSIZE          "xsize:"
#define    HEAD_LABELS         "Labels:"
#define    HEAD_UGRAMS         "UGrams:"
#define    HEAD_BGRAMS         "BGrams:"

/**
 * The header of a model, parsed from the head strings.
 */
struct crf1dm_header_t {
    std::string     version;        /* Format version (optional). */
    int             max_id;         /* Number of weights. */
    floatval_t      cost_factor;    /* Cost factor used for training. */
    int             xsize;          /* Number of attributes of an item. */
    std::vector<std::string> labels;
    std::vector<crf1d_template_t> unigram_templs;
    std::vector<crf1d_template_t> bigram_templs;
public:
    crf1dm_header_t() : max_id(0), cost_factor(1.0), xsize(0) {}
};

/*
 *    Immutable state of a model.
 *    This object is shared by all copies of lcrf_model_t.
 */
struct tag_crf1dm {
    std::vector<std::string>            head;
    std::vector<lcrf_feature_entry_t>   dic;
    std::vector<floatval_t>             alpha;
    crf1dm_header_t                     header;
    /* Reason why the model cannot be used for decoding (empty if none). */
    std::string                         error;
    frozen_dictionary                   attrs;

public:
    tag_crf1dm(
        const std::vector<std::string>& head,
        const std::vector<lcrf_feature_entry_t>& dic,
        const std::vector<floatval_t>& alpha
        );

    int crf1dm_get_num_labels() const { return (int)this->header.labels.size(); }
    int crf1dm_to_fid(const char *key) const { return this->attrs.to_id(key); }
    void crf1dm_dump(FILE *fp) const;

private:
    tag_crf1dm(const tag_crf1dm&);
    tag_crf1dm& operator=(const tag_crf1dm&);
};

/** @} */



/**
 * \defgroup crf1d_tag.cpp
 */
/** @{ */

/**
 * Tagger states.
 *  The operations of crf1dt_t must be called in this order.
 */
enum {
    TS_UNINITIALIZED = 0,   /**< Constructed. */
    TS_READ,                /**< An instance is set by read(). */
    TS_FEATURES_BUILT,      /**< Features are attached by build_features(). */
    TS_PARSED,              /**< The Viterbi path is available. */
};

/**
 * Tagger for one instance.
 */
struct crf1dt_t {
    int num_labels;                     /**< Number of distinct output labels (L). */
    int state;                          /**< TS_* */
    floatval_t cost_factor;             /**< Factor applied to transition scores. */
    const lcrf_sequence_t *inst;        /**< The instance (not owned). */
    std::vector<feature_refs_t> node_refs;  /**< State features at #t [T]. */
    std::vector<feature_refs_t> edge_refs;  /**< Transition features into #t [T]. */
    crf1d_context_t ctx;                /**< Lattice. */
    std::vector<int> path;              /**< Viterbi labels [T]. */
    floatval_t path_score;              /**< Score of the Viterbi labels. */

public:
    explicit crf1dt_t(int num_labels);

    void set_cost_factor(floatval_t c);
    void read(const lcrf_sequence_t& inst, const crf1d_feature_index_t& fi);
    void parse(const std::vector<floatval_t>& alpha);
    int result(int t) const;
    floatval_t score() const;

    int length() const { return this->ctx.num_items; }
    const lcrf_token_t& token(int t) const { return (*this->inst)[t]; }

private:
    void crf1dt_state_score(const std::vector<floatval_t>& alpha);
    void crf1dt_transition_score(const std::vector<floatval_t>& alpha);
    void crf1dt_check_state(int expected, const char *op) const;
};

/**
 * Tags one instance with a model.
 *  @param  model       The model (must have passed read_model()).
 *  @param  inst        The instance.
 *  @param  cost_factor The factor applied to transition scores.
 *  @return             The instance with the Viterbi labels.
 */
lcrf_sequence_t crf1dt_tag(const crf1dm_t* model, const lcrf_sequence_t& inst, floatval_t cost_factor);

/** @} */

#endif/*__CRF1D_H__*/
