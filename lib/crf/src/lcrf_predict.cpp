/*
 *      Predictors (serial and data-parallel tagging of instances).
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

#include <stdlib.h>
#include <string.h>

#include <cmath>
#include <exception>

#include <omp.h>

#include <lcrf.h>
#include "lcrf_internal.h"
#include "params.h"
#include "logging.h"
#include "crf1d.h"

/**
 * Predictor options.
 */
typedef struct {
    floatval_t  cost_factor;
    int         num_threads;
    int         progress;
} predict_option_t;

static void exchange_options(lcrf_params_t* params, predict_option_t* opt, int mode)
{
    BEGIN_PARAM_MAP(params, mode)
        DDX_PARAM_FLOAT(
            "cost_factor", opt->cost_factor, 1.0,
            "The factor applied to transition scores."
            )
        DDX_PARAM_INT(
            "num_threads", opt->num_threads, 0,
            "The number of threads for parallel tagging (0: OpenMP default)."
            )
        DDX_PARAM_INT(
            "progress", opt->progress, 1,
            "Report the progress of tagging (0: off)."
            )
    END_PARAM_MAP()
}

tag_lcrf_predict_internal::tag_lcrf_predict_internal(const lcrf_model_t& model, int algorithm)
    : model(model), m_params(NULL), lg(NULL), algorithm(algorithm)
{
    predict_option_t opt = predict_option_t();

    this->m_params = params_create_instance();
    try {
        exchange_options(this->m_params, &opt, -1);
        this->lg = new logging_t();
    } catch (...) {
        delete this->m_params;
        throw;
    }
}

tag_lcrf_predict_internal::~tag_lcrf_predict_internal()
{
    delete this->m_params;
    delete this->lg;
}

void tag_lcrf_predict_internal::set_message_callback(void *instance, lcrf_logging_callback cbm)
{
    this->lg->func = cbm;
    this->lg->instance = instance;
}

lcrf_params_t* tag_lcrf_predict_internal::params()
{
    return this->m_params;
}

std::vector<lcrf_sequence_t> tag_lcrf_predict_internal::predict(const std::vector<lcrf_sequence_t>& tests)
{
    predict_option_t opt = predict_option_t();
    logging_t *lg = this->lg;
    crf1d_feature_index_t fi;
    const int N = (int)tests.size();
    const crf1dm_t* crf1dm = this->model.internal();

    exchange_options(this->m_params, &opt, 1);

    /* Reject an inconsistent model before tagging anything. */
    fi.read_model(crf1dm);
    if (!std::isfinite(opt.cost_factor) || opt.cost_factor < 0.) {
        throw std::invalid_argument("cost factor must be a non-negative finite number");
    }

    logging(lg, "Number of sequences: %d\n", N);
    logging(lg, "Number of labels: %d\n", fi.num_labels());
    logging(lg, "Number of features: %d\n", (int)this->model.dic().size());
    logging(lg, "Number of weights: %d\n", (int)fi.alpha().size());
    logging(lg, "Cost factor: %f\n", opt.cost_factor);

    std::vector<lcrf_sequence_t> results(N);
    const double begin = omp_get_wtime();

    if (this->algorithm == PREDICT_PARALLEL) {
        int done = 0;
        const int num_threads = (0 < opt.num_threads) ? opt.num_threads : omp_get_max_threads();
        std::vector<std::exception_ptr> errors(N);

        logging(lg, "Number of threads: %d\n", num_threads);
        if (opt.progress) logging_progress_start(lg);

        #pragma omp parallel for schedule(dynamic) num_threads(num_threads)
        for (int i = 0;i < N;++i) {
            /* An exception must not leave the parallel region. */
            try {
                results[i] = crf1dt_tag(crf1dm, tests[i], opt.cost_factor);
            } catch (...) {
                errors[i] = std::current_exception();
            }

            if (opt.progress) {
                #pragma omp critical(lcrf_predict_progress)
                {
                    ++done;
                    logging_progress(lg, (int)((long long)done * 100 / N));
                }
            }
        }

        for (int i = 0;i < N;++i) {
            if (errors[i]) {
                logging(lg, "\nFailed to tag the sequence #%d\n", i);
                std::rethrow_exception(errors[i]);
            }
        }
    } else {
        if (opt.progress) logging_progress_start(lg);

        for (int i = 0;i < N;++i) {
            results[i] = crf1dt_tag(crf1dm, tests[i], opt.cost_factor);
            if (opt.progress) {
                logging_progress(lg, (int)((long long)(i+1) * 100 / N));
            }
        }
    }

    if (opt.progress) logging_progress_end(lg);
    logging(lg, "Seconds required: %.3f\n", omp_get_wtime() - begin);
    logging(lg, "\n");

    return results;
}

int crf1dp_create_instance(const char *iid, const lcrf_model_t& model, void **ptr)
{
    int algorithm = PREDICT_NONE;

    /* Check if the interface name begins with "predict/". */
    if (iid == NULL || strncmp(iid, "predict/", 8) != 0) {
        return 1;
    }
    iid += 8;

    /* Obtain the tagging strategy. */
    if (strcmp(iid, "serial") == 0) {
        algorithm = PREDICT_SERIAL;
    } else if (strcmp(iid, "parallel") == 0) {
        algorithm = PREDICT_PARALLEL;
    } else {
        return 1;
    }

    *ptr = new tag_lcrf_predict_internal(model, algorithm);
    return 0;
}
