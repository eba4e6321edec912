/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */


#ifndef _EMDU_BIOM_H
#define _EMDU_BIOM_H

#include <H5Cpp.h>
#include <vector>
#include <string>

#include "biom_interface.hpp"

namespace emdu {
    /* A BIOM 2.x table, read through HDF5 */
    class biom : public biom_interface {
        public:
            /* default constructor
             *
             * @param filename The path to the BIOM table to read
             *
             * Throws input_format_error if the file is not a readable BIOM
             * 2.x table.
             */
            biom(const std::string &filename);

            /* default destructor */
            virtual ~biom();

            void get_obs_data(uint32_t idx, double* out) const;

            // CSR index pointer of the observation axis
            std::vector<uint32_t> obs_indptr;
            uint32_t nnz;        // the total number of nonzero entries

        private:
            std::vector<uint32_t> obs_indices;
            std::vector<double> obs_data;

            /* load ids from an axis
             *
             * @param file The open BIOM file
             * @param path The dataset path to the ID dataset to load
             * @param ids The variable representing the IDs to load into
             */
            void load_ids(H5::H5File &file, const char *path, std::vector<std::string> &ids);

            /* load a one dimensional dataset, converting to the native type */
            template<class T>
            void load_vector(H5::H5File &file, const char *path, const H5::PredType &native, std::vector<T> &out);
    };
}

#endif /* _EMDU_BIOM_H */
