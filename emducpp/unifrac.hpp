/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <stdint.h>
#include <utility>
#include <vector>
#include <thread>

#ifndef __EMDU_UNIFRAC

#include "task_parameters.hpp"
#include "flat_tree.hpp"
#include "presence.hpp"

    namespace emdu {
        /* differences at or below this are floating point noise */
        const double DIFF_TOLERANCE = 1e-14;

        typedef std::pair<uint32_t, uint32_t> SamplePair;

        inline uint64_t comb_2(uint64_t N) {
            // based off of _comb_int_long
            // https://github.com/scipy/scipy/blob/v0.19.1/scipy/special/_comb.pyx
            //
            // overflow is disregarded as it would require in excess of
            // 4 billion samples
            if(N < 2)
                return 0;
            return (N * (N - 1)) / 2;
        }

        /* every unordered pair (i, j), i < j, in row order */
        std::vector<SamplePair> make_pairs(uint32_t n_samples);

        /* Unweighted UniFrac between two samples, as an Earth Mover's Distance
         *
         * The signed difference in mass between the samples is placed at the
         * tips and propagated towards the root; every edge contributes its
         * length times the absolute mass crossing it.
         *
         * @param tree The flattened tree
         * @param leaves Leaf position of every table row, -1 when unmatched
         * @param presence The normalized table
         * @param i The first sample
         * @param j The second sample
         * @param partial Scratch space of at least tree.n_nodes(), overwritten
         */
        double unweighted_pair(const FlatTree &tree,
                               const std::vector<int64_t> &leaves,
                               const PresenceMatrix &presence,
                               uint32_t i, uint32_t j,
                               double * __restrict__ partial);

        /* as above, with its own scratch space */
        double unweighted_pair(const FlatTree &tree,
                               const std::vector<int64_t> &leaves,
                               const PresenceMatrix &presence,
                               uint32_t i, uint32_t j);

        /* compute the pairs [task_p->start, task_p->stop)
         *
         * Results are written to both dm[i][j] and dm[j][i] of the row major
         * n_samples x n_samples matrix. Tasks with disjoint ranges write
         * disjoint cells.
         */
        void unifrac_pairs(const FlatTree &tree,
                           const std::vector<int64_t> &leaves,
                           const PresenceMatrix &presence,
                           const std::vector<SamplePair> &pairs,
                           double * dm,
                           const task_parameters* task_p);

        // process the pairs described by tasks, one thread per task
        void process_pairs(const FlatTree &tree,
                           const std::vector<int64_t> &leaves,
                           const PresenceMatrix &presence,
                           const std::vector<SamplePair> &pairs,
                           double * dm,
                           std::vector<std::thread> &threads,
                           std::vector<emdu::task_parameters> &tasks);
    }
#define __EMDU_UNIFRAC 1
#endif
