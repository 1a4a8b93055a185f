/*
 *      lcrf library.
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

#ifndef    __LCRF_H__
#define    __LCRF_H__

#include <float.h>
#include <stdio.h>
#include <stdarg.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * \addtogroup lcrf_api lcrf API
 * @{
 *
 *  The lcrf API decodes label sequences with a trained linear-chain CRF
 *  model (CRF++ style feature templates) and reads/writes the model in
 *  its text and split binary formats.
 */

/**
 * \addtogroup lcrf_misc Miscellaneous definitions and functions
 * @{
 */

/** Version number of lcrf library. */
#define LCRF_VERSION    "1.0.0"

/** The only model format version accepted in a "version:" header section. */
#define LCRF_MODEL_FORMAT_VERSION   "1.0"

/** Type of a float value. */
typedef double floatval_t;

/** Maximum value of a float value. */
#define    FLOAT_MAX    DBL_MAX

/**
 * Malformed model artifact (text or binary).
 */
class lcrf_format_error : public std::runtime_error {
public:
    explicit lcrf_format_error(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Model header inconsistent with its dictionary or weight vector.
 */
class lcrf_model_format_error : public lcrf_format_error {
public:
    explicit lcrf_model_format_error(const std::string& msg) : lcrf_format_error(msg) {}
};

/**
 * Tagger operation invoked out of order.
 */
class lcrf_illegal_state_error : public std::logic_error {
public:
    explicit lcrf_illegal_state_error(const std::string& msg) : std::logic_error(msg) {}
};

/**
 * Model file that cannot be opened, read or written.
 */
class lcrf_io_error : public std::runtime_error {
public:
    explicit lcrf_io_error(const std::string& msg) : std::runtime_error(msg) {}
};

/**@}*/



/**
 * \addtogroup lcrf_object Object interfaces and utilities.
 * @{
 */

struct tag_crf1dm;
/** Immutable model state shared by all copies of lcrf_model_t. */
typedef struct tag_crf1dm crf1dm_t;

struct tag_lcrf_predictor;
/** lcrf predictor interface. */
typedef struct tag_lcrf_predictor lcrf_predictor_t;

struct tag_lcrf_params;
/** lcrf parameter interface. */
typedef struct tag_lcrf_params lcrf_params_t;

/**@}*/



/**
 * \addtogroup lcrf_data Data (token, sequence)
 * @{
 */

/**
 * A token.
 *  A token is an ordered list of attributes (e.g., word, part-of-speech)
 *  observed at one position, optionally with a label. Tokens are never
 *  modified; put() creates a new token with a label attached.
 */
class lcrf_token_t {
public:
    lcrf_token_t() : m_has_label(false) {}

    explicit lcrf_token_t(const std::vector<std::string>& tags)
        : m_has_label(false), m_tags(tags) {}

    lcrf_token_t(const std::string& label, const std::vector<std::string>& tags)
        : m_has_label(true), m_label(label), m_tags(tags) {}

    static lcrf_token_t put(const std::string& label, const std::vector<std::string>& tags)
    {
        return lcrf_token_t(label, tags);
    }

    static lcrf_token_t put(const std::vector<std::string>& tags)
    {
        return lcrf_token_t(tags);
    }

    /** Whether the token carries a label. */
    bool has_label() const { return this->m_has_label; }
    /** The label (empty when has_label() is false). */
    const std::string& label() const { return this->m_label; }
    /** Number of attributes. */
    size_t num_tags() const { return this->m_tags.size(); }
    /** Attribute #i. */
    const std::string& tag(size_t i) const { return this->m_tags[i]; }
    /** Array of the attributes. */
    const std::vector<std::string>& tags() const { return this->m_tags; }

    bool operator==(const lcrf_token_t& other) const
    {
        return this->m_has_label == other.m_has_label &&
            this->m_label == other.m_label &&
            this->m_tags == other.m_tags;
    }
    bool operator!=(const lcrf_token_t& other) const { return !(*this == other); }

private:
    bool                        m_has_label;
    std::string                 m_label;
    std::vector<std::string>    m_tags;
};

/**
 * A sequence (sentence) of tokens.
 *  The order of the tokens defines the chain.
 */
class lcrf_sequence_t {
public:
    typedef std::vector<lcrf_token_t>::const_iterator const_iterator;

    lcrf_sequence_t() {}
    explicit lcrf_sequence_t(const std::vector<lcrf_token_t>& tokens) : m_tokens(tokens) {}
    explicit lcrf_sequence_t(std::vector<lcrf_token_t>&& tokens) : m_tokens(std::move(tokens)) {}

    /** Number of tokens in the sequence. */
    size_t num_tokens() const { return this->m_tokens.size(); }
    bool empty() const { return this->m_tokens.empty(); }
    const lcrf_token_t& operator[](size_t t) const { return this->m_tokens[t]; }
    const std::vector<lcrf_token_t>& tokens() const { return this->m_tokens; }
    const_iterator begin() const { return this->m_tokens.begin(); }
    const_iterator end() const { return this->m_tokens.end(); }

    bool operator==(const lcrf_sequence_t& other) const { return this->m_tokens == other.m_tokens; }
    bool operator!=(const lcrf_sequence_t& other) const { return !(*this == other); }

private:
    std::vector<lcrf_token_t>   m_tokens;
};

/**@}*/



/**
 * \addtogroup lcrf_model Model
 * @{
 */

/** A dictionary entry: feature key and the offset of its weight block. */
typedef std::pair<std::string, int> lcrf_feature_entry_t;

/**
 * A trained linear-chain CRF model.
 *  The model consists of the header strings, the feature dictionary and
 *  the weight vector. Copies share the same immutable state, so a model
 *  can be handed to any number of threads that decode concurrently.
 */
class lcrf_model_t {
public:
    /**
     * Constructs a model from its three components.
     *  The dictionary is frozen here; consistency between the header, the
     *  dictionary and the weights is checked when the model is bound for
     *  decoding (see predict()).
     *  @param  head        The header strings.
     *  @param  dic         The feature dictionary.
     *  @param  alpha       The feature weights.
     */
    lcrf_model_t(
        const std::vector<std::string>& head,
        const std::vector<lcrf_feature_entry_t>& dic,
        const std::vector<floatval_t>& alpha
        );

    const std::vector<std::string>& head() const;
    const std::vector<lcrf_feature_entry_t>& dic() const;
    const std::vector<floatval_t>& alpha() const;

    /** The label strings declared in the header. */
    const std::vector<std::string>& labels() const;

    /**
     * Tags sequences.
     *  @param  tests       The sequences to be tagged.
     *  @param  cost_factor The factor applied to transition potentials.
     *  @return             The sequences with the predicted labels, in the
     *                      order of \c tests.
     *  @throw  lcrf_model_format_error if the model is inconsistent; no
     *                      sequence is tagged in that case.
     */
    std::vector<lcrf_sequence_t> predict(const std::vector<lcrf_sequence_t>& tests, floatval_t cost_factor) const;
    std::vector<lcrf_sequence_t> predict(const std::vector<lcrf_sequence_t>& tests) const;

    /**
     * Tags a single sequence.
     */
    lcrf_sequence_t predict(const lcrf_sequence_t& test, floatval_t cost_factor = 1.0) const;

    /** Text serialization (header, dictionary and weights). */
    std::string to_string() const;
    /** Header and dictionary sections only. */
    std::string to_string_head() const;

    /**
     * Prints the model in human-readable format.
     */
    void dump(FILE *fpo) const;

    /** Internal state (used by the decoder). */
    const crf1dm_t* internal() const { return this->m_impl.get(); }

    static lcrf_model_t load(const std::string& source);
    static std::string save(const lcrf_model_t& model);
    static void save_binary_file(const lcrf_model_t& model, const std::string& path);
    static lcrf_model_t load_binary_file(const std::string& path);

private:
    std::shared_ptr<const crf1dm_t> m_impl;
};

/**@}*/



/**
 * \addtogroup lcrf_object
 * @{
 */

/**
 * Type of callback function for logging.
 *  @param  user        Pointer to the user-defined data.
 *  @param  format      Format string (compatible with prinf()).
 *  @param  args        Optional arguments for the format string.
 *  @return int         \c 0 always (the return value is ignored).
 */
typedef int (*lcrf_logging_callback)(void *user, const char *format, va_list args);

/**
 * lcrf predictor interface.
 */
struct tag_lcrf_predictor {
    virtual ~tag_lcrf_predictor() {}

    /**
     * Obtain the parameter interface of this predictor.
     *  The object is owned by the predictor.
     *  @return lcrf_params_t*  The pointer to lcrf_params_t.
     */
    virtual lcrf_params_t* params() = 0;

    /**
     * Set the callback function and user-defined data.
     *  @param  user        The pointer to the user-defined data.
     *  @param  cbm         The pointer to the callback function.
     */
    virtual void set_message_callback(void *user, lcrf_logging_callback cbm) = 0;

    /**
     * Tag sequences with the current parameters.
     *  @param  tests       The sequences to be tagged.
     *  @return             The sequences with the predicted labels, in the
     *                      order of \c tests.
     */
    virtual std::vector<lcrf_sequence_t> predict(const std::vector<lcrf_sequence_t>& tests) = 0;
};

/**
 * lcrf parameter interface.
 */
struct tag_lcrf_params {
    virtual ~tag_lcrf_params() {}

    /**
     * Obtain the number of available parameters.
     *  @return int         The number of parameters maintained by this object.
     */
    virtual int num() const = 0;

    /**
     * Obtain the name of a parameter.
     *  @param  i           The parameter index.
     *  @param  name        Receives the parameter name.
     *  @return int         \c 0 if the index is valid, \c -1 otherwise.
     */
    virtual int name(int i, std::string& name) const = 0;

    /**
     * Set a parameter value.
     *  @param  name        The parameter name.
     *  @param  value       The parameter value in string format.
     *  @return int         \c 0 if the parameter is found, \c -1 otherwise.
     *  @throw  std::invalid_argument if the value cannot be converted to
     *                      the type of the parameter.
     */
    virtual int set(const char *name, const char *value) = 0;

    /**
     * Get a parameter value.
     *  @param  name        The parameter name.
     *  @param  value       Receives the parameter value in string format.
     *  @return int         \c 0 if the parameter is found, \c -1 otherwise.
     */
    virtual int get(const char *name, std::string& value) const = 0;

    virtual int set_int(const char *name, int value) = 0;
    virtual int set_float(const char *name, floatval_t value) = 0;
    virtual int set_string(const char *name, const char *value) = 0;
    virtual int get_int(const char *name, int *value) const = 0;
    virtual int get_float(const char *name, floatval_t *value) const = 0;
    virtual int get_string(const char *name, std::string& value) const = 0;

    /**
     * Get the help message of a parameter.
     *  @param  name        The parameter name.
     *  @param  type        Receives the type of the parameter.
     *  @param  help        Receives the help message of the parameter.
     *  @return int         \c 0 if the parameter is found, \c -1 otherwise.
     */
    virtual int help(const char *name, std::string& type, std::string& help) const = 0;
};

/**
 * Create a predictor by an interface identifier.
 *  @param  iid         "predict/serial" or "predict/parallel".
 *  @param  model       The model; the predictor shares its state.
 *  @param  ptr         Receives the predictor if successful, \c NULL
 *                      otherwise. The caller owns the object.
 *  @return int         \c 0 if this function creates an object successfully,
 *                      \c 1 otherwise.
 */
int lcrf_create_predictor(const char *iid, const lcrf_model_t& model, lcrf_predictor_t** ptr);

/**@}*/

/**@}*/

/**
@mainpage lcrf: Viterbi decoding with linear-chain Conditional Random Fields

@section intro Introduction

lcrf tags token sequences with a trained first-order linear-chain CRF whose
features are generated by CRF++ style templates. The library provides:
- @link lcrf_model Model @endlink: the immutable trained artifact, its text
  and binary formats, and the predict API.
- @link lcrf_object Predictor @endlink: configurable serial or data-parallel
  tagging of sequence collections with progress logging.

*/

#endif/*__LCRF_H__*/
