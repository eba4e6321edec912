/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <cmath>
#include <functional>

#include "unifrac.hpp"
#include "unifrac_internal.hpp"

using namespace emdu;

std::vector<SamplePair> emdu::make_pairs(uint32_t n_samples) {
    std::vector<SamplePair> pairs;
    pairs.reserve(comb_2(n_samples));

    for(uint32_t i = 0; i < n_samples; i++) {
        for(uint32_t j = i + 1; j < n_samples; j++)
            pairs.push_back(SamplePair(i, j));
    }
    return pairs;
}

double emdu::unweighted_pair(const FlatTree &tree,
                             const std::vector<int64_t> &leaves,
                             const PresenceMatrix &presence,
                             uint32_t i, uint32_t j,
                             double * __restrict__ partial) {
    const uint32_t n_nodes = tree.n_nodes();
    const uint32_t * const tint = tree.tint.data();
    const double * const lint = tree.lint.data();

    for(uint32_t p = 0; p < n_nodes; p++)
        partial[p] = 0.0;

    // mass difference at the tips; unmatched taxa carry no mass
    for(uint32_t t = 0; t < presence.n_obs; t++) {
        const int64_t leaf = leaves[t];
        if(leaf < 0)
            continue;

        const double * const row = presence.row(t);
        const double diff = row[i] - row[j];
        if(std::fabs(diff) > DIFF_TOLERANCE)
            partial[leaf] = diff;
    }

    // postorder, so a node is final by the time it is pushed to its parent
    double Z = 0.0;
    for(uint32_t p = 0; p < n_nodes; p++) {
        if(tint[p] == p)
            continue;  // root

        const double val = partial[p];
        partial[tint[p]] += val;
        Z += lint[p] * std::fabs(val);
    }

    return Z;
}

double emdu::unweighted_pair(const FlatTree &tree,
                             const std::vector<int64_t> &leaves,
                             const PresenceMatrix &presence,
                             uint32_t i, uint32_t j) {
    std::vector<double> partial(tree.n_nodes());
    return unweighted_pair(tree, leaves, presence, i, j, partial.data());
}

void emdu::unifrac_pairs(const FlatTree &tree,
                         const std::vector<int64_t> &leaves,
                         const PresenceMatrix &presence,
                         const std::vector<SamplePair> &pairs,
                         double * dm,
                         const emdu::task_parameters* task_p) {
    const uint64_t n_samples = task_p->n_samples;
    const uint64_t n_pairs = task_p->stop - task_p->start;

    // scratch is per worker, reused between pairs
    std::vector<double> partial(tree.n_nodes());

    const double total_length = task_p->normalized ? task_p->total_length : 0.0;

    for(uint64_t k = task_p->start; k < task_p->stop; k++) {
        const uint32_t i = pairs[k].first;
        const uint32_t j = pairs[k].second;

        double d = unweighted_pair(tree, leaves, presence, i, j, partial.data());
        if(total_length > 0.0)
            d /= total_length;

        dm[i * n_samples + j] = d;
        dm[j * n_samples + i] = d;

        try_report(task_p, k - task_p->start + 1, n_pairs);
    }
}

void emdu::process_pairs(const FlatTree &tree,
                         const std::vector<int64_t> &leaves,
                         const PresenceMatrix &presence,
                         const std::vector<SamplePair> &pairs,
                         double * dm,
                         std::vector<std::thread> &threads,
                         std::vector<emdu::task_parameters> &tasks) {
    const uint64_t n_samples = presence.n_samples;

    // a sample is always at distance 0 of itself
    for(uint64_t i = 0; i < n_samples; i++)
        dm[i * n_samples + i] = 0.0;

    // register a signal handler so we can ask the master thread for its
    // progress
    register_report_status(tasks.size());

    for(unsigned int tid = 0; tid < threads.size(); tid++) {
        threads[tid] = std::thread(emdu::unifrac_pairs,
                                   std::cref(tree),
                                   std::cref(leaves),
                                   std::cref(presence),
                                   std::cref(pairs),
                                   dm,
                                   &tasks[tid]);
    }
    for(unsigned int tid = 0; tid < threads.size(); tid++) {
        threads[tid].join();
    }

    remove_report_status();
}
