/*
 *      CRF1d model.
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
#include <inttypes.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <cmath>
#include <set>

#include <lcrf.h>
#include "crf1d.h"

#define SECTION_SEP     "|--|"
#define ENTRY_SEP       "|-|"
#define FIELD_SEP       "\t"
#define FORMAT_ERROR    "Incompatible formats in Model file"

enum {
    SEC_NONE = 0,
    SEC_VERSION,
    SEC_MAXID,
    SEC_COSTFACTOR,
    SEC_XSIZE,
    SEC_LABELS,
    SEC_UGRAMS,
    SEC_BGRAMS,
    NUM_SECTIONS,
};

static int write_float(FILE *fp, float value)
{
    uint32_t iv;
    uint8_t buffer[4];
    memcpy(&iv, &value, sizeof(iv));
    /* Most significant byte first. */
    buffer[0] = (uint8_t)(iv >> 24);
    buffer[1] = (uint8_t)(iv >> 16);
    buffer[2] = (uint8_t)(iv >> 8);
    buffer[3] = (uint8_t)(iv & 0xFF);
    return fwrite(buffer, sizeof(uint8_t), 4, fp) == 4 ? 0 : 1;
}

static int read_float(const uint8_t* buffer, float* value)
{
    uint32_t iv;
    iv  = ((uint32_t)buffer[0] << 24);
    iv |= ((uint32_t)buffer[1] << 16);
    iv |= ((uint32_t)buffer[2] << 8);
    iv |= ((uint32_t)buffer[3]);
    memcpy(value, &iv, sizeof(*value));
    return sizeof(*value);
}

static void split(std::vector<std::string>& out, const std::string& str, const char *sep)
{
    const size_t n = strlen(sep);
    size_t begin = 0;

    out.clear();
    for (;;) {
        size_t pos = str.find(sep, begin);
        if (pos == std::string::npos) {
            out.push_back(str.substr(begin));
            break;
        }
        out.push_back(str.substr(begin, pos - begin));
        begin = pos + n;
    }
}

/* An empty section holds no fields. */
static void split_fields(std::vector<std::string>& out, const std::string& str)
{
    if (str.empty()) {
        out.clear();
    } else {
        split(out, str, FIELD_SEP);
    }
}

static int to_int(const std::string& str, int *value)
{
    const char *p = str.c_str();
    char *end = NULL;
    long v;

    if (str.empty() || isspace((unsigned char)*p)) {
        return 1;
    }
    errno = 0;
    v = strtol(p, &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || INT_MAX < v) {
        return 1;
    }
    *value = (int)v;
    return 0;
}

static int to_float(const std::string& str, floatval_t *value)
{
    const char *p = str.c_str();
    char *end = NULL;
    double v;

    if (str.empty() || isspace((unsigned char)*p)) {
        return 1;
    }
    errno = 0;
    v = strtod(p, &end);
    if (*end != '\0' || (errno != 0 && std::isinf(v))) {
        return 1;
    }
    *value = v;
    return 0;
}

/* The shortest decimal that reads back as the same single-precision value. */
static std::string format_weight(floatval_t value)
{
    char buffer[64];
    const float f = (float)value;

    for (int precision = 1;precision <= 9;++precision) {
        snprintf(buffer, sizeof(buffer), "%.*g", precision, (double)f);
        if (strtof(buffer, NULL) == f) {
            break;
        }
    }
    return buffer;
}

static int section_of(const std::string& str)
{
    if (str == HEAD_VERSION) return SEC_VERSION;
    if (str == HEAD_MAXID) return SEC_MAXID;
    if (str == HEAD_COSTFACTOR) return SEC_COSTFACTOR;
    if (str == HEAD_XSIZE) return SEC_XSIZE;
    if (str == HEAD_LABELS) return SEC_LABELS;
    if (str == HEAD_UGRAMS) return SEC_UGRAMS;
    if (str == HEAD_BGRAMS) return SEC_BGRAMS;
    return SEC_NONE;
}

static std::string crf1dm_read_header(crf1dm_header_t* header, const std::vector<std::string>& head)
{
    std::vector<std::string> values[NUM_SECTIONS];
    bool seen[NUM_SECTIONS] = {false};
    int sec = SEC_NONE;
    std::string error;

    /* The binary format reads the number of weights from head[1]. */
    if (head.empty() || head[0] != HEAD_MAXID) {
        return "the header must begin with " HEAD_MAXID;
    }

    for (size_t i = 0;i < head.size();++i) {
        int s = section_of(head[i]);
        if (s != SEC_NONE) {
            if (seen[s]) {
                return "duplicated header section: " + head[i];
            }
            seen[s] = true;
            sec = s;
        } else if (sec == SEC_NONE) {
            return "header value outside any section: " + head[i];
        } else {
            values[sec].push_back(head[i]);
        }
    }

    /* version: (optional) */
    if (1 < values[SEC_VERSION].size()) {
        return "more than one format version in the header";
    }
    if (!values[SEC_VERSION].empty()) {
        header->version = values[SEC_VERSION][0];
        if (header->version != LCRF_MODEL_FORMAT_VERSION) {
            return "unsupported model format version: " + header->version;
        }
    }

    /* maxid: */
    if (values[SEC_MAXID].size() != 1) {
        return "the header must declare exactly one maxid";
    }
    if (to_int(values[SEC_MAXID][0], &header->max_id) != 0 || header->max_id < 0) {
        return "invalid maxid: " + values[SEC_MAXID][0];
    }

    /* cost-factor: (optional) */
    if (1 < values[SEC_COSTFACTOR].size()) {
        return "more than one cost factor in the header";
    }
    if (!values[SEC_COSTFACTOR].empty()) {
        if (to_float(values[SEC_COSTFACTOR][0], &header->cost_factor) != 0) {
            return "invalid cost-factor: " + values[SEC_COSTFACTOR][0];
        }
    }

    /* xsize: */
    if (values[SEC_XSIZE].size() != 1) {
        return "the header must declare exactly one xsize";
    }
    if (to_int(values[SEC_XSIZE][0], &header->xsize) != 0 || header->xsize < 0) {
        return "invalid xsize: " + values[SEC_XSIZE][0];
    }

    /* Labels: */
    header->labels = values[SEC_LABELS];
    if (header->labels.empty()) {
        return "the model has no labels";
    }
    std::set<std::string> uniq(header->labels.begin(), header->labels.end());
    if (uniq.size() != header->labels.size()) {
        return "duplicated label in the header";
    }

    /* UGrams: and BGrams: */
    header->unigram_templs.resize(values[SEC_UGRAMS].size());
    for (size_t i = 0;i < values[SEC_UGRAMS].size();++i) {
        const std::string& src = values[SEC_UGRAMS][i];
        if (src.empty() || src[0] != 'U') {
            return "unigram template must begin with 'U': " + src;
        }
        if (crf1d_template_compile(&header->unigram_templs[i], src, header->xsize, error) != 0) {
            return error;
        }
    }
    header->bigram_templs.resize(values[SEC_BGRAMS].size());
    for (size_t i = 0;i < values[SEC_BGRAMS].size();++i) {
        const std::string& src = values[SEC_BGRAMS][i];
        if (src.empty() || src[0] != 'B') {
            return "bigram template must begin with 'B': " + src;
        }
        if (crf1d_template_compile(&header->bigram_templs[i], src, header->xsize, error) != 0) {
            return error;
        }
    }

    return std::string();
}

/*
 *    Checks that the dictionary blocks tile the weight vector [0, maxid).
 */
static std::string crf1dm_check_features(
    const crf1dm_header_t* header,
    const std::vector<lcrf_feature_entry_t>& dic,
    const std::vector<floatval_t>& alpha
    )
{
    const long long L = (long long)header->labels.size();
    std::vector<std::pair<long long, long long> > blocks;
    std::set<std::string> keys;
    long long expected = 0;
    char buffer[128];

    if ((size_t)header->max_id != alpha.size()) {
        snprintf(buffer, sizeof(buffer),
            "maxid (%d) differs from the number of weights (%zu)",
            header->max_id, alpha.size());
        return buffer;
    }

    blocks.reserve(dic.size());
    for (size_t i = 0;i < dic.size();++i) {
        const std::string& key = dic[i].first;
        const int fid = dic[i].second;
        if (key.empty() || (key[0] != 'U' && key[0] != 'B')) {
            return "feature key must begin with 'U' or 'B': " + key;
        }
        if (fid < 0) {
            return "negative feature id: " + key;
        }
        if (!keys.insert(key).second) {
            return "duplicated feature key: " + key;
        }
        blocks.push_back(std::make_pair((long long)fid, key[0] == 'U' ? L : L * L));
    }

    std::sort(blocks.begin(), blocks.end());
    for (size_t i = 0;i < blocks.size();++i) {
        if (blocks[i].first != expected) {
            snprintf(buffer, sizeof(buffer),
                "feature blocks do not tile the weights at offset %lld", expected);
            return buffer;
        }
        expected += blocks[i].second;
    }
    if (expected != (long long)header->max_id) {
        snprintf(buffer, sizeof(buffer),
            "feature blocks cover %lld weights but maxid is %d",
            expected, header->max_id);
        return buffer;
    }
    return std::string();
}

static std::string crf1dm_check(
    crf1dm_header_t* header,
    const std::vector<std::string>& head,
    const std::vector<lcrf_feature_entry_t>& dic,
    const std::vector<floatval_t>& alpha
    )
{
    std::string error = crf1dm_read_header(header, head);
    if (error.empty()) {
        error = crf1dm_check_features(header, dic, alpha);
    }
    return error;
}

tag_crf1dm::tag_crf1dm(
    const std::vector<std::string>& head,
    const std::vector<lcrf_feature_entry_t>& dic,
    const std::vector<floatval_t>& alpha
    )
    : head(head), dic(dic), alpha(alpha),
      error(crf1dm_check(&this->header, head, dic, alpha))
{
    if (this->error.empty()) {
        this->attrs.build(dic, this->error);
    }
}

void tag_crf1dm::crf1dm_dump(FILE *fp) const
{
    const crf1dm_header_t* header = &this->header;
    const int L = this->crf1dm_get_num_labels();

    /* Dump the header. */
    fprintf(fp, "HEADER = {\n");
    fprintf(fp, "  version: %s\n", header->version.c_str());
    fprintf(fp, "  maxid: %d\n", header->max_id);
    fprintf(fp, "  cost-factor: %f\n", header->cost_factor);
    fprintf(fp, "  xsize: %d\n", header->xsize);
    fprintf(fp, "  num_features: %zu\n", this->dic.size());
    fprintf(fp, "  num_weights: %zu\n", this->alpha.size());
    fprintf(fp, "}\n");
    fprintf(fp, "\n");

    if (!this->error.empty()) {
        fprintf(fp, "ERROR = %s\n", this->error.c_str());
        fprintf(fp, "\n");
        return;
    }

    /* Dump the labels. */
    fprintf(fp, "LABELS = {\n");
    for (int i = 0;i < L;++i) {
        fprintf(fp, "  %5d: %s\n", i, header->labels[i].c_str());
    }
    fprintf(fp, "}\n");
    fprintf(fp, "\n");

    /* Dump the templates. */
    fprintf(fp, "TEMPLATES = {\n");
    for (size_t i = 0;i < header->unigram_templs.size();++i) {
        fprintf(fp, "  (U) %s\n", header->unigram_templs[i].source.c_str());
    }
    for (size_t i = 0;i < header->bigram_templs.size();++i) {
        fprintf(fp, "  (B) %s\n", header->bigram_templs[i].source.c_str());
    }
    fprintf(fp, "}\n");
    fprintf(fp, "\n");

    /* Dump the state features. */
    fprintf(fp, "STATE_FEATURES = {\n");
    for (size_t k = 0;k < this->dic.size();++k) {
        const lcrf_feature_entry_t& e = this->dic[k];
        if (e.first[0] != 'U') continue;
        for (int j = 0;j < L;++j) {
            fprintf(fp, "  (%d) %s --> %s: %f\n",
                e.second, e.first.c_str(), header->labels[j].c_str(),
                this->alpha[e.second + j]);
        }
    }
    fprintf(fp, "}\n");
    fprintf(fp, "\n");

    /* Dump the transition features. */
    fprintf(fp, "TRANSITIONS = {\n");
    for (size_t k = 0;k < this->dic.size();++k) {
        const lcrf_feature_entry_t& e = this->dic[k];
        if (e.first[0] != 'B') continue;
        for (int i = 0;i < L;++i) {
            for (int j = 0;j < L;++j) {
                fprintf(fp, "  (%d) %s: %s --> %s: %f\n",
                    e.second, e.first.c_str(),
                    header->labels[i].c_str(), header->labels[j].c_str(),
                    this->alpha[e.second + i * L + j]);
            }
        }
    }
    fprintf(fp, "}\n");
    fprintf(fp, "\n");
}



/*
 *    Implementation of lcrf_model_t.
 */

lcrf_model_t::lcrf_model_t(
    const std::vector<std::string>& head,
    const std::vector<lcrf_feature_entry_t>& dic,
    const std::vector<floatval_t>& alpha
    )
    : m_impl(std::make_shared<crf1dm_t>(head, dic, alpha))
{
}

const std::vector<std::string>& lcrf_model_t::head() const
{
    return this->m_impl->head;
}

const std::vector<lcrf_feature_entry_t>& lcrf_model_t::dic() const
{
    return this->m_impl->dic;
}

const std::vector<floatval_t>& lcrf_model_t::alpha() const
{
    return this->m_impl->alpha;
}

const std::vector<std::string>& lcrf_model_t::labels() const
{
    return this->m_impl->header.labels;
}

static void check_cost_factor(floatval_t cost_factor)
{
    if (!std::isfinite(cost_factor) || cost_factor < 0.) {
        throw std::invalid_argument("cost factor must be a non-negative finite number");
    }
}

std::vector<lcrf_sequence_t> lcrf_model_t::predict(const std::vector<lcrf_sequence_t>& tests, floatval_t cost_factor) const
{
    /* Reject an inconsistent model before tagging anything. */
    crf1d_feature_index_t fi;
    fi.read_model(*this);
    check_cost_factor(cost_factor);

    std::vector<lcrf_sequence_t> results;
    results.reserve(tests.size());
    for (size_t i = 0;i < tests.size();++i) {
        results.push_back(crf1dt_tag(this->internal(), tests[i], cost_factor));
    }
    return results;
}

std::vector<lcrf_sequence_t> lcrf_model_t::predict(const std::vector<lcrf_sequence_t>& tests) const
{
    return this->predict(tests, 1.0);
}

lcrf_sequence_t lcrf_model_t::predict(const lcrf_sequence_t& test, floatval_t cost_factor) const
{
    crf1d_feature_index_t fi;
    fi.read_model(*this);
    check_cost_factor(cost_factor);
    return crf1dt_tag(this->internal(), test, cost_factor);
}

std::string lcrf_model_t::to_string_head() const
{
    std::string str;
    const std::vector<std::string>& head = this->head();
    const std::vector<lcrf_feature_entry_t>& dic = this->dic();
    char buffer[32];

    for (size_t i = 0;i < head.size();++i) {
        if (i) str += FIELD_SEP;
        str += head[i];
    }
    str += SECTION_SEP;
    for (size_t i = 0;i < dic.size();++i) {
        if (i) str += FIELD_SEP;
        snprintf(buffer, sizeof(buffer), "%d", dic[i].second);
        str += dic[i].first;
        str += ENTRY_SEP;
        str += buffer;
    }
    return str;
}

std::string lcrf_model_t::to_string() const
{
    std::string str = this->to_string_head();
    const std::vector<floatval_t>& alpha = this->alpha();

    str += SECTION_SEP;
    for (size_t i = 0;i < alpha.size();++i) {
        if (i) str += FIELD_SEP;
        str += format_weight(alpha[i]);
    }
    return str;
}

void lcrf_model_t::dump(FILE *fpo) const
{
    this->m_impl->crf1dm_dump(fpo);
}

static void parse_head(std::vector<std::string>& head, const std::string& section)
{
    split_fields(head, section);
}

static void parse_dic(std::vector<lcrf_feature_entry_t>& dic, const std::string& section)
{
    std::vector<std::string> entries, parts;

    split_fields(entries, section);
    dic.clear();
    dic.reserve(entries.size());
    for (size_t i = 0;i < entries.size();++i) {
        int fid = 0;
        split(parts, entries[i], ENTRY_SEP);
        if (parts.size() != 2) {
            throw lcrf_format_error(FORMAT_ERROR);
        }
        if (to_int(parts[1], &fid) != 0) {
            throw lcrf_format_error(FORMAT_ERROR ": invalid feature id '" + parts[1] + "'");
        }
        dic.push_back(lcrf_feature_entry_t(parts[0], fid));
    }
}

static void parse_alpha(std::vector<floatval_t>& alpha, const std::string& section)
{
    std::vector<std::string> values;

    split_fields(values, section);
    alpha.clear();
    alpha.reserve(values.size());
    for (size_t i = 0;i < values.size();++i) {
        floatval_t v = 0.;
        if (to_float(values[i], &v) != 0) {
            throw lcrf_format_error(FORMAT_ERROR ": invalid weight '" + values[i] + "'");
        }
        alpha.push_back(v);
    }
}

lcrf_model_t lcrf_model_t::load(const std::string& source)
{
    std::vector<std::string> components;
    std::vector<std::string> head;
    std::vector<lcrf_feature_entry_t> dic;
    std::vector<floatval_t> alpha;

    split(components, source, SECTION_SEP);
    if (components.size() != 3) {
        throw lcrf_format_error(FORMAT_ERROR);
    }
    parse_head(head, components[0]);
    parse_dic(dic, components[1]);
    parse_alpha(alpha, components[2]);
    return lcrf_model_t(head, dic, alpha);
}

std::string lcrf_model_t::save(const lcrf_model_t& model)
{
    return model.to_string();
}

static void read_file(std::vector<uint8_t>& buffer, const std::string& filename)
{
    FILE *fp = NULL;
    long size = 0;

    fp = fopen(filename.c_str(), "rb");
    if (fp == NULL) {
        throw lcrf_io_error("cannot open " + filename);
    }

    fseek(fp, 0, SEEK_END);
    size = ftell(fp);
    fseek(fp, 0, SEEK_SET);
    if (size < 0) {
        fclose(fp);
        throw lcrf_io_error("cannot determine the size of " + filename);
    }

    buffer.resize((size_t)size);
    if (0 < size && fread(&buffer[0], 1, (size_t)size, fp) != (size_t)size) {
        fclose(fp);
        throw lcrf_io_error("cannot read " + filename);
    }
    fclose(fp);
}

void lcrf_model_t::save_binary_file(const lcrf_model_t& model, const std::string& path)
{
    FILE *fp = NULL;
    int ret = 0;
    const std::string head_file = path + "/head";
    const std::string alpha_file = path + "/alpha";
    const std::string head = model.to_string_head();
    const std::vector<floatval_t>& alpha = model.alpha();

    /* The header and the dictionary in one line. */
    fp = fopen(head_file.c_str(), "wb");
    if (fp == NULL) {
        throw lcrf_io_error("cannot open " + head_file);
    }
    if (!head.empty() && fwrite(head.data(), 1, head.size(), fp) != head.size()) {
        ret = 1;
    }
    if (fclose(fp) != 0 || ret) {
        throw lcrf_io_error("cannot write " + head_file);
    }

    /* The weights in single precision. */
    fp = fopen(alpha_file.c_str(), "wb");
    if (fp == NULL) {
        throw lcrf_io_error("cannot open " + alpha_file);
    }
    for (size_t i = 0;i < alpha.size();++i) {
        ret |= write_float(fp, (float)alpha[i]);
    }
    if (fclose(fp) != 0 || ret) {
        throw lcrf_io_error("cannot write " + alpha_file);
    }
}

lcrf_model_t lcrf_model_t::load_binary_file(const std::string& path)
{
    std::vector<uint8_t> buffer;
    std::vector<std::string> components;
    std::vector<std::string> head;
    std::vector<lcrf_feature_entry_t> dic;
    std::vector<floatval_t> alpha;
    int num_weights = 0;

    /* Only the first line of the head file is used. */
    read_file(buffer, path + "/head");
    if (buffer.empty()) {
        throw lcrf_format_error(FORMAT_ERROR ": empty head file");
    }
    std::string line(buffer.begin(), std::find(buffer.begin(), buffer.end(), (uint8_t)'\n'));
    if (!line.empty() && line[line.size()-1] == '\r') {
        line.erase(line.size()-1);
    }

    split(components, line, SECTION_SEP);
    if (components.size() != 2) {
        throw lcrf_format_error(FORMAT_ERROR);
    }
    parse_head(head, components[0]);
    parse_dic(dic, components[1]);

    /* The second header field declares the number of weights. */
    if (head.size() < 2 || to_int(head[1], &num_weights) != 0 || num_weights < 0) {
        throw lcrf_format_error(FORMAT_ERROR ": no weight count in the header");
    }

    read_file(buffer, path + "/alpha");
    if (buffer.size() / 4 < (size_t)num_weights) {
        throw lcrf_format_error(FORMAT_ERROR ": alpha file holds fewer weights than declared");
    }

    const uint8_t *p = buffer.empty() ? NULL : &buffer[0];
    alpha.resize((size_t)num_weights);
    for (int i = 0;i < num_weights;++i) {
        float v = 0.f;
        p += read_float(p, &v);
        alpha[i] = v;
    }

    return lcrf_model_t(head, dic, alpha);
}
