/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef _EMDU_TABLE_H
#define _EMDU_TABLE_H

#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "biom_interface.hpp"

namespace emdu {
    /* A whitespace delimited sample-feature table.
     *
     * The first line holds the sample names after a leading token which is
     * ignored. Every other line is a taxon name followed by one abundance
     * per sample. Abundances which do not parse are read as 0.
     */
    class table : public biom_interface {
        public:
            /* read a table from a file
             *
             * @param filename The path to the table
             *
             * Throws input_format_error if the file cannot be read, has no
             * header or has a row without a taxon.
             */
            table(const std::string &filename);

            /* read a table from a stream */
            table(std::istream &input);

            virtual ~table();

            void get_obs_data(uint32_t idx, double* out) const;

        private:
            std::vector<double> obs_data;  // n_obs x n_samples, row major

            void parse(std::istream &input);
    };

    /* open a table, either BIOM 2.x (HDF5) or text
     *
     * @param filename The path to the table
     */
    std::unique_ptr<biom_interface> load_table(const std::string &filename);
}

#endif /* _EMDU_TABLE_H */
