/*
 *      lcrf internal interfaces.
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

#ifndef __LCRF_INTERNAL_H__
#define __LCRF_INTERNAL_H__

#include <stdint.h>
#include <lcrf.h>
#include <cqdb.h>
#include "logging.h"

enum {
    PREDICT_NONE = 0,           /**< Unselected. */
    PREDICT_SERIAL,             /**< One sequence after another. */
    PREDICT_PARALLEL,           /**< Sequences distributed over threads. */
};

/**
 * Feature dictionary frozen into a constant quark database.
 *  The database is written once into a memory image and only read
 *  afterwards, so lookups may run concurrently.
 */
class frozen_dictionary {
public:
    frozen_dictionary() : m_db(NULL), m_num(0) {}
    ~frozen_dictionary();

    /**
     * Freezes the entries into the database.
     *  An entry that cannot be stored leaves the dictionary empty and
     *  sets \c error; a failure of the temporary storage throws
     *  lcrf_io_error.
     */
    void build(const std::vector<lcrf_feature_entry_t>& entries, std::string& error);

    /**
     * Looks up a feature key.
     *  @return     The feature id, or a negative value if the key is unknown.
     */
    int to_id(const char *str) const;

    int num() const { return this->m_num; }

private:
    frozen_dictionary(const frozen_dictionary&);
    frozen_dictionary& operator=(const frozen_dictionary&);

    std::vector<uint8_t>    m_buffer;
    cqdb_t*                 m_db;
    int                     m_num;
};

/**
 * Internal data structure for predictors.
 */
struct tag_lcrf_predict_internal : public tag_lcrf_predictor {
    lcrf_model_t model;         /**< The model (shared state). */
    lcrf_params_t *m_params;    /**< Parameter interface. */
    logging_t* lg;              /**< Logging interface. */
    int algorithm;              /**< PREDICT_* */

    tag_lcrf_predict_internal(const lcrf_model_t& model, int algorithm);
    ~tag_lcrf_predict_internal();

    lcrf_params_t* params();
    void set_message_callback(void *instance, lcrf_logging_callback cbm);
    std::vector<lcrf_sequence_t> predict(const std::vector<lcrf_sequence_t>& tests);

private:
    tag_lcrf_predict_internal(const tag_lcrf_predict_internal&);
    tag_lcrf_predict_internal& operator=(const tag_lcrf_predict_internal&);
};

int crf1dp_create_instance(const char *iid, const lcrf_model_t& model, void **ptr);

#endif/*__LCRF_INTERNAL_H__*/
