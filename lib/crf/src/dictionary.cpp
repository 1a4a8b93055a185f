/*
 *      Frozen feature dictionary.
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

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <cqdb.h>

#include <lcrf.h>
#include "lcrf_internal.h"

void frozen_dictionary::build(const std::vector<lcrf_feature_entry_t>& entries, std::string& error)
{
    FILE *fp = NULL;
    cqdb_writer_t* dbw = NULL;
    long size = 0;

    if (this->m_db != NULL || entries.empty()) {
        return;
    }

    /* Write a CQDB chunk into an anonymous file. */
    fp = tmpfile();
    if (fp == NULL) {
        throw lcrf_io_error("cannot create a temporary file for the feature dictionary");
    }

    dbw = cqdb_writer(fp, CQDB_ONEWAY);
    if (dbw == NULL) {
        fclose(fp);
        throw lcrf_io_error("cannot open the feature dictionary writer");
    }

    for (size_t i = 0;i < entries.size();++i) {
        if (entries[i].second < 0 ||
            cqdb_writer_put(dbw, entries[i].first.c_str(), entries[i].second) != 0) {
            cqdb_writer_close(dbw);
            fclose(fp);
            error = "cannot store the feature '" + entries[i].first + "' in the dictionary";
            return;
        }
    }

    if (cqdb_writer_close(dbw)) {
        fclose(fp);
        throw lcrf_io_error("cannot write the feature dictionary");
    }

    /* Read the chunk back into memory. */
    fseek(fp, 0, SEEK_END);
    size = ftell(fp);
    fseek(fp, 0, SEEK_SET);
    if (size <= 0) {
        fclose(fp);
        throw lcrf_io_error("empty feature dictionary image");
    }

    this->m_buffer.resize((size_t)size);
    if (fread(&this->m_buffer[0], 1, (size_t)size, fp) != (size_t)size) {
        fclose(fp);
        throw lcrf_io_error("cannot read the feature dictionary image");
    }
    fclose(fp);

    this->m_db = cqdb_reader(&this->m_buffer[0], this->m_buffer.size());
    if (this->m_db == NULL) {
        throw lcrf_io_error("broken feature dictionary image");
    }
    this->m_num = (int)entries.size();
}

frozen_dictionary::~frozen_dictionary()
{
    if (this->m_db != NULL) {
        cqdb_delete(this->m_db);
    }
}

int frozen_dictionary::to_id(const char *str) const
{
    if (this->m_db != NULL) {
        return cqdb_to_id(this->m_db, str);
    } else {
        return -1;
    }
}
