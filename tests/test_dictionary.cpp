/*
 *      Tests of the frozen feature dictionary.
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

#include <stdio.h>

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "lcrf_internal.h"
#include "lcrf_test_util.h"

TEST(FrozenDictionaryTest, ResolvesEveryStoredKey)
{
    std::vector<lcrf_feature_entry_t> entries;
    char key[32];
    for (int i = 0;i < 500;++i) {
        snprintf(key, sizeof(key), "U%02d:w%d", i % 7, i);
        entries.push_back(lcrf_feature_entry_t(key, i * 3));
    }

    frozen_dictionary dic;
    std::string error;
    dic.build(entries, error);
    EXPECT_TRUE(error.empty());
    EXPECT_EQ(500, dic.num());
    for (size_t i = 0;i < entries.size();++i) {
        EXPECT_EQ(entries[i].second, dic.to_id(entries[i].first.c_str()));
    }
}

TEST(FrozenDictionaryTest, UnknownKeyIsNegative)
{
    std::vector<lcrf_feature_entry_t> entries;
    entries.push_back(lcrf_feature_entry_t("U00:dog", 0));
    entries.push_back(lcrf_feature_entry_t("B", 2));

    frozen_dictionary dic;
    std::string error;
    dic.build(entries, error);
    ASSERT_TRUE(error.empty());
    EXPECT_LT(dic.to_id("U00:cat"), 0);
    EXPECT_LT(dic.to_id(""), 0);
    EXPECT_LT(dic.to_id("U00:do"), 0);
    EXPECT_EQ(2, dic.to_id("B"));
}

TEST(FrozenDictionaryTest, EmptyDictionaryHasNoKeys)
{
    frozen_dictionary dic;
    std::string error;
    dic.build(std::vector<lcrf_feature_entry_t>(), error);
    EXPECT_TRUE(error.empty());
    EXPECT_EQ(0, dic.num());
    EXPECT_LT(dic.to_id("U00:dog"), 0);
}

TEST(FrozenDictionaryTest, UnstorableEntryReportsError)
{
    std::vector<lcrf_feature_entry_t> entries;
    entries.push_back(lcrf_feature_entry_t("U00:dog", 0));
    entries.push_back(lcrf_feature_entry_t("U00:cat", -2));

    frozen_dictionary dic;
    std::string error;
    EXPECT_NO_THROW(dic.build(entries, error));
    EXPECT_NE(std::string::npos, error.find("U00:cat"));
    EXPECT_EQ(0, dic.num());
    EXPECT_LT(dic.to_id("U00:dog"), 0);
}

TEST(FrozenDictionaryTest, ModelWithNegativeIdConstructs)
{
    std::vector<lcrf_feature_entry_t> dic = sample_dic();
    dic[1].second = -2;

    std::unique_ptr<lcrf_model_t> model;
    ASSERT_NO_THROW(model.reset(new lcrf_model_t(sample_head(), dic, sample_alpha())));
    EXPECT_THROW(model->predict(make_sequence({"dog"})), lcrf_model_format_error);
}
