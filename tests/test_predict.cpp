/*
 *      Tests of model prediction and the predictor interface.
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


#include <limits>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "lcrf_test_util.h"

namespace {

std::vector<lcrf_sequence_t> random_sequences(int n, unsigned int seed)
{
    const char *words[] = {"dog", "runs", "cat", "sleeps", "the"};
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> length(0, 12);
    std::uniform_int_distribution<int> word(0, 4);
    std::vector<lcrf_sequence_t> seqs;

    for (int i = 0;i < n;++i) {
        std::vector<std::string> sentence;
        const int T = length(gen);
        for (int t = 0;t < T;++t) {
            sentence.push_back(words[word(gen)]);
        }
        seqs.push_back(make_sequence(sentence));
    }
    return seqs;
}

std::vector<lcrf_sequence_t> run_predictor(const char *iid, const std::vector<lcrf_sequence_t>& tests, std::string *log)
{
    lcrf_predictor_t *predictor = NULL;
    std::vector<lcrf_sequence_t> results;

    EXPECT_EQ(0, lcrf_create_predictor(iid, sample_model(), &predictor));
    if (predictor == NULL) return results;

    lcrf_params_t *params = predictor->params();
    EXPECT_EQ(0, params->set("num_threads", "2"));
    EXPECT_EQ(0, params->set("progress", "0"));
    if (log != NULL) {
        predictor->set_message_callback(log, capture_message);
    }
    results = predictor->predict(tests);
    delete predictor;
    return results;
}

}  // namespace

TEST(PredictTest, ReplacesLabelsAndKeepsAttributes)
{
    std::vector<lcrf_token_t> tokens;
    tokens.push_back(lcrf_token_t::put("V", std::vector<std::string>(1, "dog")));
    tokens.push_back(lcrf_token_t::put(std::vector<std::string>(1, "runs")));
    lcrf_sequence_t seq(tokens);

    lcrf_sequence_t out = sample_model().predict(seq);
    ASSERT_EQ(2u, out.num_tokens());
    EXPECT_EQ("N", out[0].label());
    EXPECT_EQ("N", out[1].label());
    EXPECT_EQ("dog", out[0].tag(0));
    EXPECT_EQ("runs", out[1].tag(0));
}

TEST(PredictTest, CostFactorScalesTransitions)
{
    lcrf_sequence_t seq = make_sequence({"dog", "runs"});
    std::vector<std::string> nv;
    nv.push_back("N");
    nv.push_back("V");

    EXPECT_EQ(nv, labels_of(sample_model().predict(seq, 0.)));
    EXPECT_EQ(std::vector<std::string>(2, "N"), labels_of(sample_model().predict(seq, 0.5)));
    EXPECT_THROW(sample_model().predict(seq, -1.), std::invalid_argument);
    EXPECT_THROW(sample_model().predict(seq, std::numeric_limits<floatval_t>::quiet_NaN()), std::invalid_argument);
}

TEST(PredictTest, PreservesOrderAndLength)
{
    std::vector<lcrf_sequence_t> tests = random_sequences(50, 11);
    std::vector<lcrf_sequence_t> results = sample_model().predict(tests);

    ASSERT_EQ(tests.size(), results.size());
    for (size_t i = 0;i < tests.size();++i) {
        ASSERT_EQ(tests[i].num_tokens(), results[i].num_tokens());
        for (size_t t = 0;t < tests[i].num_tokens();++t) {
            EXPECT_EQ(tests[i][t].tags(), results[i][t].tags());
            EXPECT_TRUE(results[i][t].has_label());
        }
    }
}

TEST(PredictTest, UnknownWordsStillGetLabels)
{
    lcrf_sequence_t out = sample_model().predict(make_sequence({"zebra", "quietly", "grazes"}));
    ASSERT_EQ(3u, out.num_tokens());
    for (size_t t = 0;t < out.num_tokens();++t) {
        EXPECT_TRUE(out[t].label() == "N" || out[t].label() == "V");
    }
}

TEST(PredictTest, EmptyInputs)
{
    EXPECT_TRUE(sample_model().predict(std::vector<lcrf_sequence_t>()).empty());
    EXPECT_EQ(0u, sample_model().predict(lcrf_sequence_t()).num_tokens());
}

TEST(PredictTest, InconsistentModelTagsNothing)
{
    lcrf_model_t model(sample_head("9"), sample_dic(), sample_alpha());
    EXPECT_THROW(model.predict(std::vector<lcrf_sequence_t>()), lcrf_model_format_error);
    EXPECT_THROW(model.predict(make_sequence({"dog"})), lcrf_model_format_error);

    lcrf_predictor_t *predictor = NULL;
    ASSERT_EQ(0, lcrf_create_predictor("predict/parallel", model, &predictor));
    EXPECT_THROW(predictor->predict(random_sequences(3, 5)), lcrf_model_format_error);
    delete predictor;
}

TEST(PredictorTest, SerialAndParallelAgree)
{
    std::vector<lcrf_sequence_t> tests = random_sequences(200, 20101);
    std::vector<lcrf_sequence_t> expected = sample_model().predict(tests);

    EXPECT_EQ(expected, run_predictor("predict/serial", tests, NULL));
    EXPECT_EQ(expected, run_predictor("predict/parallel", tests, NULL));
}

TEST(PredictorTest, LogsStatistics)
{
    std::string log;
    run_predictor("predict/parallel", random_sequences(4, 3), &log);

    EXPECT_NE(std::string::npos, log.find("Number of sequences: 4"));
    EXPECT_NE(std::string::npos, log.find("Number of labels: 2"));
    EXPECT_NE(std::string::npos, log.find("Number of threads: 2"));
    EXPECT_NE(std::string::npos, log.find("Seconds required"));
}

TEST(PredictorTest, CostFactorParameter)
{
    lcrf_predictor_t *predictor = NULL;
    ASSERT_EQ(0, lcrf_create_predictor("predict/serial", sample_model(), &predictor));

    lcrf_params_t *params = predictor->params();
    EXPECT_EQ(0, params->set("progress", "0"));
    EXPECT_EQ(0, params->set("cost_factor", "0"));

    std::vector<lcrf_sequence_t> tests(1, make_sequence({"dog", "runs"}));
    std::vector<lcrf_sequence_t> results = predictor->predict(tests);
    ASSERT_EQ(1u, results.size());
    EXPECT_EQ("V", results[0][1].label());

    EXPECT_EQ(0, params->set("cost_factor", "-2"));
    EXPECT_THROW(predictor->predict(tests), std::invalid_argument);
    delete predictor;
}

TEST(PredictorTest, UnknownInterface)
{
    lcrf_predictor_t *existing = NULL;
    ASSERT_EQ(0, lcrf_create_predictor("predict/serial", sample_model(), &existing));

    /* A failed creation clears the pointer it was given. */
    lcrf_predictor_t *predictor = existing;
    EXPECT_EQ(1, lcrf_create_predictor("predict/gpu", sample_model(), &predictor));
    EXPECT_TRUE(predictor == NULL);
    predictor = existing;
    EXPECT_EQ(1, lcrf_create_predictor("train/lbfgs", sample_model(), &predictor));
    EXPECT_TRUE(predictor == NULL);
    delete existing;
}

TEST(PredictorTest, DeclaresOptionsWithDefaults)
{
    for (int i = 0;i < 2;++i) {
        lcrf_predictor_t *predictor = NULL;
        ASSERT_EQ(0, lcrf_create_predictor(i ? "predict/parallel" : "predict/serial", sample_model(), &predictor));

        lcrf_params_t *params = predictor->params();
        floatval_t cost_factor = 0.;
        int num_threads = -1, progress = -1;
        EXPECT_EQ(3, params->num());
        EXPECT_EQ(0, params->get_float("cost_factor", &cost_factor));
        EXPECT_EQ(0, params->get_int("num_threads", &num_threads));
        EXPECT_EQ(0, params->get_int("progress", &progress));
        EXPECT_DOUBLE_EQ(1.0, cost_factor);
        EXPECT_EQ(0, num_threads);
        EXPECT_EQ(1, progress);
        delete predictor;
    }
}
