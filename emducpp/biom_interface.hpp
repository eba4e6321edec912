/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */


#ifndef _EMDU_BIOM_INTERFACE_H
#define _EMDU_BIOM_INTERFACE_H

#include <stdint.h>
#include <vector>
#include <string>

namespace emdu {
    class biom_interface {
        public:
            // cache the IDs contained within the table
            std::vector<std::string> sample_ids;
            std::vector<std::string> obs_ids;

            uint32_t n_samples;  // the number of samples
            uint32_t n_obs;      // the number of observations

            /* default constructor
             *
             * All other initialization happens in children constructors.
             */
            biom_interface() : n_samples(0), n_obs(0) {}

            /* default destructor */
            virtual ~biom_interface() {}

            /* get a dense vector of observation data
             *
             * @param idx The row of the observation to fetch
             * @param out An allocated array of at least size n_samples.
             *      Values of an index position [0, n_samples) which do not
             *      have data will be zero'd.
             */
            virtual void get_obs_data(uint32_t idx, double* out) const = 0;
    };
}

#endif /* _EMDU_BIOM_INTERFACE_H */
