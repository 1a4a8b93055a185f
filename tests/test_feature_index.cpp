/*
 *      Tests of feature templates and the feature index.
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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "crf1d.h"
#include "lcrf_test_util.h"

namespace {

std::vector<int> fids(int a)
{
    return std::vector<int>(1, a);
}

std::vector<int> fids(int a, int b)
{
    std::vector<int> v;
    v.push_back(a);
    v.push_back(b);
    return v;
}

/* Builds a single-label model whose features are given as keys. */
lcrf_model_t single_label_model(
    const std::vector<std::string>& ugrams,
    const std::vector<std::string>& keys,
    int xsize
    )
{
    std::vector<std::string> head;
    head.push_back("maxid:");
    head.push_back(std::to_string(keys.size()));
    head.push_back("xsize:");
    head.push_back(std::to_string(xsize));
    head.push_back("Labels:");
    head.push_back("A");
    head.push_back("UGrams:");
    head.insert(head.end(), ugrams.begin(), ugrams.end());

    std::vector<lcrf_feature_entry_t> dic;
    for (size_t i = 0;i < keys.size();++i) {
        dic.push_back(lcrf_feature_entry_t(keys[i], (int)i));
    }
    return lcrf_model_t(head, dic, std::vector<floatval_t>(keys.size(), 1.0));
}

}  // namespace

TEST(TemplateTest, CompilesMacrosAndLiterals)
{
    crf1d_template_t templ;
    std::string error;

    ASSERT_EQ(0, crf1d_template_compile(&templ, "U05:%x[-1,0]/%x[2,1]", 2, error));
    ASSERT_EQ(3u, templ.texts.size());
    EXPECT_EQ("U05:", templ.texts[0]);
    EXPECT_EQ("/", templ.texts[1]);
    EXPECT_EQ("", templ.texts[2]);
    EXPECT_EQ(fids(-1, 2), templ.rows);
    EXPECT_EQ(fids(0, 1), templ.cols);
}

TEST(TemplateTest, BigramWithoutMacro)
{
    crf1d_template_t templ;
    std::string error;

    ASSERT_EQ(0, crf1d_template_compile(&templ, "B", 1, error));
    EXPECT_TRUE(templ.rows.empty());
    ASSERT_EQ(1u, templ.texts.size());
    EXPECT_EQ("B", templ.texts[0]);
}

TEST(TemplateTest, RejectsMalformedTemplates)
{
    crf1d_template_t templ;
    std::string error;

    EXPECT_NE(0, crf1d_template_compile(&templ, "X00:%x[0,0]", 1, error));
    EXPECT_NE(0, crf1d_template_compile(&templ, "U00:%y[0,0]", 1, error));
    EXPECT_NE(0, crf1d_template_compile(&templ, "U00:%x[0 ,0]", 1, error));
    EXPECT_NE(0, crf1d_template_compile(&templ, "U00:%x[0,0", 1, error));
    EXPECT_NE(0, crf1d_template_compile(&templ, "U00:%x[9,0]", 1, error));
    EXPECT_NE(0, crf1d_template_compile(&templ, "U00:%x[-9,0]", 1, error));
    EXPECT_NE(0, crf1d_template_compile(&templ, "U00:%x[0,1]", 1, error));
    EXPECT_NE(0, crf1d_template_compile(&templ, "", 1, error));
    EXPECT_FALSE(error.empty());

    EXPECT_EQ(0, crf1d_template_compile(&templ, "U00:%x[8,0]", 1, error));
    EXPECT_EQ(0, crf1d_template_compile(&templ, "U00:%x[-8,0]", 1, error));
}

TEST(FeatureIndexTest, ResolvesNodeAndEdgeFeatures)
{
    lcrf_model_t model = sample_model();
    lcrf_sequence_t seq = make_sequence({"dog", "runs"});

    crf1d_feature_index_t fi;
    fi.read_model(model);
    ASSERT_EQ(2, fi.num_labels());

    crf1dt_t tagger(fi.num_labels());
    tagger.read(seq, fi);
    fi.build_features(tagger);

    EXPECT_EQ(TS_FEATURES_BUILT, tagger.state);
    /* U00:dog and U01:_B-1 fire at #0; U01:dog is not in the model. */
    EXPECT_EQ(fids(0, 8), tagger.node_refs[0].fids);
    EXPECT_EQ(fids(2), tagger.node_refs[1].fids);
    EXPECT_TRUE(tagger.edge_refs[0].fids.empty());
    EXPECT_EQ(fids(4), tagger.edge_refs[1].fids);
}

TEST(FeatureIndexTest, ExpandsPositionsOutsideTheSequence)
{
    std::vector<std::string> ugrams;
    ugrams.push_back("U02:%x[1,0]");
    ugrams.push_back("U03:%x[-2,0]/%x[2,0]");
    std::vector<std::string> keys;
    keys.push_back("U02:_B+1");
    keys.push_back("U03:_B-2/_B+2");
    lcrf_model_t model = single_label_model(ugrams, keys, 1);

    lcrf_sequence_t seq = make_sequence({"x"});
    crf1d_feature_index_t fi;
    fi.read_model(model);
    crf1dt_t tagger(1);
    tagger.read(seq, fi);
    fi.build_features(tagger);

    EXPECT_EQ(fids(0, 1), tagger.node_refs[0].fids);
}

TEST(FeatureIndexTest, SkipsColumnsMissingFromToken)
{
    std::vector<std::string> ugrams;
    ugrams.push_back("U00:%x[0,1]");
    std::vector<std::string> keys;
    keys.push_back("U00:NN");
    lcrf_model_t model = single_label_model(ugrams, keys, 2);

    std::vector<lcrf_token_t> tokens;
    tokens.push_back(lcrf_token_t::put(std::vector<std::string>(1, "dog")));
    std::vector<std::string> tags;
    tags.push_back("cat");
    tags.push_back("NN");
    tokens.push_back(lcrf_token_t::put(tags));
    lcrf_sequence_t seq(tokens);

    crf1d_feature_index_t fi;
    fi.read_model(model);
    crf1dt_t tagger(1);
    tagger.read(seq, fi);
    fi.build_features(tagger);

    EXPECT_TRUE(tagger.node_refs[0].fids.empty());
    EXPECT_EQ(fids(0), tagger.node_refs[1].fids);
}

TEST(FeatureIndexTest, UnknownKeysContributeNothing)
{
    lcrf_model_t model = sample_model();
    lcrf_sequence_t seq = make_sequence({"cat", "sleeps", "soundly"});

    crf1d_feature_index_t fi;
    fi.read_model(model);
    crf1dt_t tagger(fi.num_labels());
    tagger.read(seq, fi);
    fi.build_features(tagger);

    EXPECT_EQ(fids(8), tagger.node_refs[0].fids);
    EXPECT_TRUE(tagger.node_refs[1].fids.empty());
    EXPECT_TRUE(tagger.node_refs[2].fids.empty());
    EXPECT_EQ(fids(4), tagger.edge_refs[2].fids);
}

TEST(FeatureIndexTest, BuildBeforeReadModelIsIllegal)
{
    lcrf_model_t model = sample_model();
    lcrf_sequence_t seq = make_sequence({"dog"});

    crf1d_feature_index_t bound;
    bound.read_model(model);
    crf1dt_t tagger(2);
    tagger.read(seq, bound);

    crf1d_feature_index_t unbound;
    EXPECT_THROW(unbound.build_features(tagger), lcrf_illegal_state_error);
    EXPECT_THROW(unbound.labels(), lcrf_illegal_state_error);
}

TEST(FeatureIndexTest, ReadModelRejectsInconsistentModels)
{
    std::vector<std::string> head;
    crf1d_feature_index_t fi;

    /* maxid differs from the number of weights. */
    lcrf_model_t m1(sample_head("12"), sample_dic(), sample_alpha());
    EXPECT_THROW(fi.read_model(m1), lcrf_model_format_error);

    /* A gap between feature blocks. */
    std::vector<lcrf_feature_entry_t> gap = sample_dic();
    gap[1].second = 3;
    lcrf_model_t m2(sample_head(), gap, sample_alpha());
    EXPECT_THROW(fi.read_model(m2), lcrf_model_format_error);

    /* A duplicated key. */
    std::vector<lcrf_feature_entry_t> dup = sample_dic();
    dup[3].first = "U00:dog";
    lcrf_model_t m3(sample_head(), dup, sample_alpha());
    EXPECT_THROW(fi.read_model(m3), lcrf_model_format_error);

    /* A malformed template. */
    head = sample_head();
    head[10] = "U00:%x[0,3]";
    lcrf_model_t m4(head, sample_dic(), sample_alpha());
    EXPECT_THROW(fi.read_model(m4), lcrf_model_format_error);

    /* No labels. */
    head = sample_head();
    head.erase(head.begin() + 7, head.begin() + 9);
    lcrf_model_t m5(head, sample_dic(), sample_alpha());
    EXPECT_THROW(fi.read_model(m5), lcrf_model_format_error);

    /* A key that is neither unigram nor bigram. */
    std::vector<lcrf_feature_entry_t> odd = sample_dic();
    odd[3].first = "X01:_B-1";
    lcrf_model_t m6(sample_head(), odd, sample_alpha());
    EXPECT_THROW(fi.read_model(m6), lcrf_model_format_error);

    EXPECT_TRUE(fi.model == NULL);
}

TEST(FeatureIndexTest, VersionSectionIsAccepted)
{
    std::vector<std::string> head = sample_head();
    head.push_back("version:");
    head.push_back(LCRF_MODEL_FORMAT_VERSION);
    lcrf_model_t model(head, sample_dic(), sample_alpha());

    crf1d_feature_index_t fi;
    fi.read_model(model);
    EXPECT_EQ(LCRF_MODEL_FORMAT_VERSION, model.internal()->header.version);
}

TEST(FeatureIndexTest, UnknownVersionIsRejected)
{
    std::vector<std::string> head = sample_head();
    head.push_back("version:");
    head.push_back("0.9");
    lcrf_model_t model(head, sample_dic(), sample_alpha());

    crf1d_feature_index_t fi;
    EXPECT_THROW(fi.read_model(model), lcrf_model_format_error);
}
