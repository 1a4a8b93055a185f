/*
 *      Parameter exchange.
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

#ifndef __PARAMS_H__
#define __PARAMS_H__

#include <stdexcept>
#include <lcrf.h>

lcrf_params_t* params_create_instance();

int params_add_int(lcrf_params_t* params, const char *name, int value, const char *help);
int params_add_float(lcrf_params_t* params, const char *name, floatval_t value, const char *help);
int params_add_string(lcrf_params_t* params, const char *name, const char *value, const char *help);

/*
 * Exchange of an option structure with a parameter object.
 *  mode < 0:   declare the parameters with their default values.
 *  mode > 0:   read the parameter values into the option variables.
 *  mode == 0:  write the option variables into the parameters.
 */

#define BEGIN_PARAM_MAP(params, mode) \
    do { \
        int ddx_ret = 0; \
        lcrf_params_t* ddx_params = (params); \
        const int ddx_mode = (mode);

#define END_PARAM_MAP() \
        if (ddx_ret != 0) { \
            throw std::logic_error("inconsistent parameter map"); \
        } \
    } while (0);

#define DDX_PARAM_INT(name, var, defval, help) \
    if (ddx_mode < 0) { \
        ddx_ret |= params_add_int(ddx_params, name, defval, help); \
    } else if (ddx_mode > 0) { \
        ddx_ret |= ddx_params->get_int(name, &var); \
    } else { \
        ddx_ret |= ddx_params->set_int(name, var); \
    }

#define DDX_PARAM_FLOAT(name, var, defval, help) \
    if (ddx_mode < 0) { \
        ddx_ret |= params_add_float(ddx_params, name, defval, help); \
    } else if (ddx_mode > 0) { \
        ddx_ret |= ddx_params->get_float(name, &var); \
    } else { \
        ddx_ret |= ddx_params->set_float(name, var); \
    }

#endif/*__PARAMS_H__*/
