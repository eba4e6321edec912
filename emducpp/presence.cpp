/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <stdexcept>
#include "presence.hpp"

using namespace emdu;

PresenceMatrix::PresenceMatrix(const biom_interface &table)
: sample_ids(table.sample_ids)
, n_obs(0)
, n_samples(table.n_samples)
{
    load(table, std::vector<bool>(table.n_obs, true));
}

PresenceMatrix::PresenceMatrix(const biom_interface &table, const std::vector<bool> &keep)
: sample_ids(table.sample_ids)
, n_obs(0)
, n_samples(table.n_samples)
{
    load(table, keep);
}

void PresenceMatrix::load(const biom_interface &table, const std::vector<bool> &keep) {
    if(keep.size() != table.n_obs)
        throw std::invalid_argument("row filter does not match the table");

    for(uint32_t i = 0; i < table.n_obs; i++) {
        if(keep[i])
            obs_ids.push_back(table.obs_ids[i]);
    }
    n_obs = obs_ids.size();
    data.resize((uint64_t)n_obs * n_samples);

    uint32_t row = 0;
    for(uint32_t i = 0; i < table.n_obs; i++) {
        if(keep[i])
            table.get_obs_data(i, data.data() + (uint64_t)(row++) * n_samples);
    }

    binarize(data);
    normalize_columns(data, n_obs, n_samples);
}

void emdu::binarize(std::vector<double> &values) {
    const int64_t n = values.size();
    double * const __restrict__ buf = values.data();

#pragma omp parallel for schedule(static)
    for(int64_t i = 0; i < n; i++)
        buf[i] = buf[i] > 0.0 ? 1.0 : 0.0;
}

void emdu::normalize_columns(std::vector<double> &values, uint32_t n_obs, uint32_t n_samples) {
    const uint64_t n_samples_64 = n_samples; // 64-bit to avoid overflow
    double * const __restrict__ buf = values.data();

    // every column is owned by exactly one thread
#pragma omp parallel for schedule(static)
    for(int64_t s = 0; s < (int64_t)n_samples; s++) {
        double sum = 0.0;
        for(uint64_t i = 0; i < n_obs; i++)
            sum += buf[i * n_samples_64 + s];

        if(sum > 0.0) {
            for(uint64_t i = 0; i < n_obs; i++)
                buf[i * n_samples_64 + s] /= sum;
        }
    }
}
