/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <H5Cpp.h>

#include "table.hpp"
#include "biom.hpp"
#include "errors.hpp"

using namespace emdu;

// malformed abundances are absorbed as 0
static double parse_abundance(const std::string &token) {
    const char *begin = token.c_str();
    char *end = NULL;
    double value = strtod(begin, &end);
    if(end == begin || *end != '\0')
        return 0.0;
    return value;
}

table::table(const std::string &filename) {
    std::ifstream input(filename.c_str());
    if(!input.good())
        throw input_format_error("unable to open table: " + filename);

    parse(input);
}

table::table(std::istream &input) {
    parse(input);
}

table::~table() {
}

void table::parse(std::istream &input) {
    std::string line;
    std::string token;

    if(!std::getline(input, line))
        throw input_format_error("table has no header");

    std::istringstream header(line);
    header >> token;  // the first header token names the taxon column
    while(header >> token)
        sample_ids.push_back(token);
    n_samples = sample_ids.size();

    uint64_t lineno = 1;
    uint64_t pending_blank = 0;
    std::vector<double> row(n_samples);

    while(std::getline(input, line)) {
        lineno++;

        std::istringstream fields(line);
        if(!(fields >> token)) {
            // tolerated at the end of the file only
            if(pending_blank == 0)
                pending_blank = lineno;
            continue;
        }

        if(pending_blank != 0) {
            std::ostringstream msg;
            msg << "table line " << pending_blank << " has no taxon";
            throw input_format_error(msg.str());
        }

        obs_ids.push_back(token);

        // short rows are zero filled, surplus values are ignored
        std::fill(row.begin(), row.end(), 0.0);
        for(uint32_t s = 0; s < n_samples && (fields >> token); s++)
            row[s] = parse_abundance(token);

        obs_data.insert(obs_data.end(), row.begin(), row.end());
    }

    if(input.bad())
        throw input_format_error("error while reading the table");

    n_obs = obs_ids.size();
}

void table::get_obs_data(uint32_t idx, double* out) const {
    const double *row = obs_data.data() + (uint64_t)idx * n_samples;
    for(uint32_t i = 0; i < n_samples; i++)
        out[i] = row[i];
}

std::unique_ptr<biom_interface> emdu::load_table(const std::string &filename) {
    {
        std::ifstream check(filename.c_str());
        if(!check.good())
            throw input_format_error("unable to open table: " + filename);
    }

    bool is_hdf5 = false;
    try {
        is_hdf5 = H5::H5File::isHdf5(filename.c_str());
    } catch(const H5::Exception &) {
        throw input_format_error("unable to inspect table: " + filename);
    }

    if(is_hdf5)
        return std::unique_ptr<biom_interface>(new biom(filename));
    else
        return std::unique_ptr<biom_interface>(new table(filename));
}
