/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef __EMDU_PRESENCE_H
#define __EMDU_PRESENCE_H 1

#include <stdint.h>
#include <string>
#include <vector>

#include "biom_interface.hpp"

namespace emdu {
    /* Presence/absence of every taxon in every sample, normalized so each
     * sample is a probability distribution over its observed taxa.
     *
     * Immutable once built; shared read-only between threads.
     */
    class PresenceMatrix {
        public:
            std::vector<std::string> obs_ids;
            std::vector<std::string> sample_ids;
            uint32_t n_obs;
            uint32_t n_samples;

            /* binarize and normalize a table
             *
             * @param table The raw abundances
             */
            PresenceMatrix(const biom_interface &table);

            /* as above, keeping only the rows flagged in keep
             *
             * @param table The raw abundances
             * @param keep One flag per table row
             */
            PresenceMatrix(const biom_interface &table, const std::vector<bool> &keep);

            /* normalized value of a taxon in a sample */
            double get(uint32_t obs, uint32_t sample) const {
                return data[(uint64_t)obs * n_samples + sample];
            }

            /* normalized values of a taxon across samples */
            const double *row(uint32_t obs) const {
                return data.data() + (uint64_t)obs * n_samples;
            }

        private:
            std::vector<double> data;  // n_obs x n_samples, row major

            void load(const biom_interface &table, const std::vector<bool> &keep);
    };

    /* convert abundances to presence/absence in place
     *
     * Values > 0 become 1, everything else (including NaN) becomes 0.
     */
    void binarize(std::vector<double> &values);

    /* divide every column of a row major matrix by its sum, in place
     *
     * @param values The n_obs x n_samples matrix
     * @param n_obs The number of rows
     * @param n_samples The number of columns
     *
     * Columns summing to 0 are left untouched.
     */
    void normalize_columns(std::vector<double> &values, uint32_t n_obs, uint32_t n_samples);
}

#endif /* __EMDU_PRESENCE_H */
