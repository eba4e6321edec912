/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <cstdlib>
#include <sstream>
#include "biom.hpp"
#include "errors.hpp"

using namespace H5;
using namespace emdu;

/* datasets of the BIOM 2.x format */
const std::string OBS_INDPTR = std::string("/observation/matrix/indptr");
const std::string OBS_INDICES = std::string("/observation/matrix/indices");
const std::string OBS_DATA = std::string("/observation/matrix/data");
const std::string OBS_IDS = std::string("/observation/ids");
const std::string SAMPLE_IDS = std::string("/sample/ids");

biom::biom(const std::string &filename) {
    try {
        H5File file(filename.c_str(), H5F_ACC_RDONLY);

        /* cache IDs and the CSR representation of the observations */
        load_ids(file, OBS_IDS.c_str(), obs_ids);
        load_ids(file, SAMPLE_IDS.c_str(), sample_ids);
        load_vector(file, OBS_INDPTR.c_str(), PredType::NATIVE_UINT32, obs_indptr);
        load_vector(file, OBS_INDICES.c_str(), PredType::NATIVE_UINT32, obs_indices);
        load_vector(file, OBS_DATA.c_str(), PredType::NATIVE_DOUBLE, obs_data);
    } catch(const H5::Exception &e) {
        throw input_format_error("unable to read BIOM table " + filename + ": " + e.getDetailMsg());
    }

    /* cache shape and nnz info */
    n_samples = sample_ids.size();
    n_obs = obs_ids.size();
    nnz = obs_data.size();

    if(obs_indptr.size() != (size_t)n_obs + 1 || obs_indices.size() != nnz)
        throw input_format_error("BIOM table " + filename + " has an inconsistent observation matrix");

    for(uint32_t i = 0; i < n_obs; i++) {
        if(obs_indptr[i] > obs_indptr[i + 1] || obs_indptr[i + 1] > nnz)
            throw input_format_error("BIOM table " + filename + " has an invalid index pointer");
    }
    for(uint32_t i = 0; i < nnz; i++) {
        if(obs_indices[i] >= n_samples) {
            std::ostringstream msg;
            msg << "BIOM table " << filename << " references sample " << obs_indices[i]
                << " of " << n_samples;
            throw input_format_error(msg.str());
        }
    }
}

biom::~biom() {
}

void biom::load_ids(H5File &file, const char *path, std::vector<std::string> &ids) {
    DataSet ds_ids = file.openDataSet(path);
    StrType dtype = ds_ids.getStrType();
    DataSpace dataspace = ds_ids.getSpace();

    if(dataspace.getSimpleExtentNdims() != 1)
        throw input_format_error(std::string("BIOM dataset is not one dimensional: ") + path);

    hsize_t dims[1];
    dataspace.getSimpleExtentDims(dims, NULL);
    ids.reserve(dims[0]);

    if(dims[0] == 0)
        return;

    if(dtype.isVariableStr()) {
        /* the IDs are a dataset of variable length strings */
        std::vector<char*> dataout(dims[0]);
        ds_ids.read((void*)dataout.data(), dtype);

        for(hsize_t i = 0; i < dims[0]; i++) {
            ids.push_back(dataout[i] == NULL ? std::string() : std::string(dataout[i]));
            free(dataout[i]);
        }
    } else {
        size_t width = dtype.getSize();
        std::vector<char> dataout(dims[0] * width);
        ds_ids.read((void*)dataout.data(), dtype);

        for(hsize_t i = 0; i < dims[0]; i++) {
            const char *start = dataout.data() + i * width;
            size_t len = 0;
            while(len < width && start[len] != '\0')
                len++;
            ids.push_back(std::string(start, len));
        }
    }
}

template<class T>
void biom::load_vector(H5File &file, const char *path, const PredType &native, std::vector<T> &out) {
    DataSet ds = file.openDataSet(path);
    DataSpace dataspace = ds.getSpace();

    if(dataspace.getSimpleExtentNdims() != 1)
        throw input_format_error(std::string("BIOM dataset is not one dimensional: ") + path);

    hsize_t dims[1];
    dataspace.getSimpleExtentDims(dims, NULL);

    out.resize(dims[0]);
    if(dims[0] > 0)
        ds.read((void*)out.data(), native);
}

void biom::get_obs_data(uint32_t idx, double* out) const {
    // reset our output buffer
    for(uint32_t i = 0; i < n_samples; i++)
        out[i] = 0.0;

    for(uint32_t k = obs_indptr[idx]; k < obs_indptr[idx + 1]; k++)
        out[obs_indices[k]] = obs_data[k];
}
