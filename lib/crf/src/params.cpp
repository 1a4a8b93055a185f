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

#include <errno.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <string>
#include <vector>

#include <lcrf.h>
#include "params.h"

enum {
    PT_NONE = 0,
    PT_INT,
    PT_FLOAT,
    PT_STRING,
};

typedef struct {
    std::string name;
    int type;
    int val_i;
    floatval_t val_f;
    std::string val_s;
    std::string help;
} param_t;

static int parse_int(const char *value, int *out)
{
    char *end = NULL;
    long v;

    if (*value == '\0' || *value == ' ' || *value == '\t') {
        return 1;
    }
    errno = 0;
    v = strtol(value, &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || INT_MAX < v) {
        return 1;
    }
    *out = (int)v;
    return 0;
}

static int parse_float(const char *value, floatval_t *out)
{
    char *end = NULL;
    double v;

    if (*value == '\0' || *value == ' ' || *value == '\t') {
        return 1;
    }
    errno = 0;
    v = strtod(value, &end);
    if (errno != 0 || *end != '\0') {
        return 1;
    }
    *out = (floatval_t)v;
    return 0;
}

class params_impl : public tag_lcrf_params {
public:
    params_impl() {}

    int num() const
    {
        return (int)this->m_params.size();
    }

    int name(int i, std::string& name) const
    {
        if (i < 0 || this->num() <= i) {
            return -1;
        }
        name = this->m_params[i].name;
        return 0;
    }

    int set(const char *name, const char *value)
    {
        param_t* par = this->find_param(name);
        if (par == NULL) return -1;
        switch (par->type) {
        case PT_INT:
            if (parse_int(value, &par->val_i) != 0) {
                throw std::invalid_argument(
                    std::string("parameter ") + name + " expects an integer: " + value);
            }
            break;
        case PT_FLOAT:
            if (parse_float(value, &par->val_f) != 0) {
                throw std::invalid_argument(
                    std::string("parameter ") + name + " expects a number: " + value);
            }
            break;
        case PT_STRING:
            par->val_s = value;
            break;
        }
        return 0;
    }

    int get(const char *name, std::string& value) const
    {
        char buffer[128];
        const param_t* par = this->find_param(name);
        if (par == NULL) return -1;
        switch (par->type) {
        case PT_INT:
            snprintf(buffer, sizeof(buffer), "%d", par->val_i);
            value = buffer;
            break;
        case PT_FLOAT:
            snprintf(buffer, sizeof(buffer), "%f", par->val_f);
            value = buffer;
            break;
        case PT_STRING:
            value = par->val_s;
            break;
        }
        return 0;
    }

    int set_int(const char *name, int value)
    {
        param_t* par = this->find_param(name);
        if (par == NULL || par->type != PT_INT) return -1;
        par->val_i = value;
        return 0;
    }

    int set_float(const char *name, floatval_t value)
    {
        param_t* par = this->find_param(name);
        if (par == NULL || par->type != PT_FLOAT) return -1;
        par->val_f = value;
        return 0;
    }

    int set_string(const char *name, const char *value)
    {
        param_t* par = this->find_param(name);
        if (par == NULL || par->type != PT_STRING) return -1;
        par->val_s = value;
        return 0;
    }

    int get_int(const char *name, int *value) const
    {
        const param_t* par = this->find_param(name);
        if (par == NULL || par->type != PT_INT) return -1;
        *value = par->val_i;
        return 0;
    }

    int get_float(const char *name, floatval_t *value) const
    {
        const param_t* par = this->find_param(name);
        if (par == NULL || par->type != PT_FLOAT) return -1;
        *value = par->val_f;
        return 0;
    }

    int get_string(const char *name, std::string& value) const
    {
        const param_t* par = this->find_param(name);
        if (par == NULL || par->type != PT_STRING) return -1;
        value = par->val_s;
        return 0;
    }

    int help(const char *name, std::string& type, std::string& help) const
    {
        const param_t* par = this->find_param(name);
        if (par == NULL) return -1;
        switch (par->type) {
        case PT_INT:
            type = "int";
            break;
        case PT_FLOAT:
            type = "float";
            break;
        case PT_STRING:
            type = "string";
            break;
        default:
            type = "unknown";
            break;
        }
        help = par->help;
        return 0;
    }

    int add(const param_t& par)
    {
        if (this->find_param(par.name.c_str()) != NULL) {
            return -1;
        }
        this->m_params.push_back(par);
        return 0;
    }

private:
    param_t* find_param(const char *name)
    {
        for (size_t i = 0;i < this->m_params.size();++i) {
            if (strcmp(this->m_params[i].name.c_str(), name) == 0) {
                return &this->m_params[i];
            }
        }
        return NULL;
    }

    const param_t* find_param(const char *name) const
    {
        return const_cast<params_impl*>(this)->find_param(name);
    }

    std::vector<param_t> m_params;
};

lcrf_params_t* params_create_instance()
{
    return new params_impl();
}

static param_t make_param(const char *name, int type, const char *help)
{
    param_t par;
    par.name = name;
    par.type = type;
    par.val_i = 0;
    par.val_f = 0.;
    par.help = (help != NULL) ? help : "";
    return par;
}

int params_add_int(lcrf_params_t* params, const char *name, int value, const char *help)
{
    param_t par = make_param(name, PT_INT, help);
    par.val_i = value;
    return static_cast<params_impl*>(params)->add(par);
}

int params_add_float(lcrf_params_t* params, const char *name, floatval_t value, const char *help)
{
    param_t par = make_param(name, PT_FLOAT, help);
    par.val_f = value;
    return static_cast<params_impl*>(params)->add(par);
}

int params_add_string(lcrf_params_t* params, const char *name, const char *value, const char *help)
{
    param_t par = make_param(name, PT_STRING, help);
    par.val_s = value;
    return static_cast<params_impl*>(params)->add(par);
}
