#include "api.hpp"
#include "tree.hpp"
#include "flat_tree.hpp"
#include "table.hpp"
#include "presence.hpp"
#include "unifrac.hpp"
#include "errors.hpp"
#include <fstream>
#include <iomanip>
#include <iterator>
#include <memory>
#include <thread>
#include <cstring>
#include <stdlib.h>
#include <stdio.h>

#include <H5Cpp.h>


#define CHECK_FILE(filename, err) if(!is_file_exists(filename)) { \
                                      return err;                 \
                                  }

using namespace emdu;

// https://stackoverflow.com/a/19841704/19741
bool is_file_exists(const char *fileName) {
    std::ifstream infile(fileName);
        return infile.good();
}

void destroy_mat_full_fp64(mat_full_fp64_t** result) {
    if(*result == NULL)
        return;

    if((*result)->sample_ids != NULL) {
        for(unsigned int i = 0; i < (*result)->n_samples; i++) {
            free((*result)->sample_ids[i]);
        }
        free((*result)->sample_ids);
    }
    if((*result)->matrix != NULL)
        free((*result)->matrix);

    free(*result);
    *result = NULL;
}

void initialize_mat_full(mat_full_fp64_t* &result, const PresenceMatrix &presence) {
    const uint64_t n_samples_64 = presence.n_samples; // 64-bit to avoid overflow

    result = (mat_full_fp64_t*)malloc(sizeof(mat_full_fp64_t));
    if(result == NULL) {
        fprintf(stderr, "Failed to allocate %zd bytes; [%s]:%d\n",
                sizeof(mat_full_fp64_t), __FILE__, __LINE__);
        exit(EXIT_FAILURE);
    }
    result->n_samples = presence.n_samples;
    result->flags = 0;
    result->n_unmatched = 0;
    result->total_length = 0.0;

    result->matrix = (double*)calloc(n_samples_64 * n_samples_64, sizeof(double));
    result->sample_ids = (char**)malloc(sizeof(char*) * result->n_samples);
    if(result->matrix == NULL || result->sample_ids == NULL) {
        fprintf(stderr, "Failed to allocate %zd bytes; [%s]:%d\n",
                sizeof(double) * n_samples_64 * n_samples_64, __FILE__, __LINE__);
        exit(EXIT_FAILURE);
    }

    for(unsigned int i = 0; i < result->n_samples; i++) {
        size_t len = presence.sample_ids[i].length();
        result->sample_ids[i] = (char*)malloc(sizeof(char) * len + 1);
        presence.sample_ids[i].copy(result->sample_ids[i], len);
        result->sample_ids[i][len] = '\0';
    }
}

void set_tasks(std::vector<emdu::task_parameters> &tasks,
               uint32_t n_samples,
               uint64_t n_pairs,
               bool normalized,
               double total_length,
               unsigned int nthreads) {

    /* chunking strategy is to balance as much as possible. eg if there are 15 pairs
     * and 4 threads, our goal is to assign 4 pairs to 3 threads, and 3 pairs to one thread.
     *
     * we use the remaining the chunksize for bins which cannot be full maximally
     */
    uint64_t fullchunk = (n_pairs + nthreads - 1) / nthreads;  // this computes the ceiling
    uint64_t smallchunk = n_pairs / nthreads;

    unsigned int n_fullbins = n_pairs % nthreads;
    if(n_fullbins == 0)
        n_fullbins = nthreads;

    uint64_t start = 0;

    for(unsigned int tid = 0; tid < nthreads; tid++) {
        tasks[tid].tid = tid;
        tasks[tid].start = start; // pair start

        if(tid < n_fullbins) {
            tasks[tid].stop = start + fullchunk;  // pair end
            start = start + fullchunk;
        } else {
            tasks[tid].stop = start + smallchunk;  // pair end
            start = start + smallchunk;
        }

        tasks[tid].n_samples = n_samples;
        tasks[tid].normalized = normalized;
        tasks[tid].total_length = total_length;
    }
}

compute_status one_off(const char* table_filename, const char* tree_filename,
                       bool normalized, unsigned int nthreads, mat_full_fp64_t** result) {

    CHECK_FILE(table_filename, table_missing)
    CHECK_FILE(tree_filename, tree_missing)

    *result = NULL;

    try {
        std::ifstream ifs(tree_filename);
        std::string content = std::string(std::istreambuf_iterator<char>(ifs),
                                          std::istreambuf_iterator<char>());
        emdu::BPTree tree = emdu::BPTree(content);
        emdu::FlatTree flat = emdu::FlatTree(tree);

        std::unique_ptr<emdu::biom_interface> table = emdu::load_table(table_filename);
        if(table->n_samples == 0 || table->n_obs == 0) {
            return table_empty;
        }

        uint32_t n_unmatched = 0;
        emdu::LeafIndex index = emdu::build_leaf_index(tree, flat);
        std::vector<int64_t> table_leaves = emdu::resolve_taxa(index, table->obs_ids, n_unmatched);
        if(n_unmatched > 0) {
            fprintf(stderr, "WARNING (emdu): %u of %u table taxa are not tips of the tree and are ignored\n",
                    n_unmatched, table->n_obs);
        }

        // unmatched rows are dropped before normalization
        std::vector<bool> keep(table_leaves.size());
        for(size_t i = 0; i < table_leaves.size(); i++)
            keep[i] = table_leaves[i] >= 0;

        emdu::PresenceMatrix presence = emdu::PresenceMatrix(*table, keep);
        uint32_t n_dropped = 0;
        std::vector<int64_t> leaves = emdu::resolve_taxa(index, presence.obs_ids, n_dropped);

        std::vector<emdu::SamplePair> pairs = emdu::make_pairs(presence.n_samples);

        if(nthreads == 0)
            nthreads = 1;
        if(nthreads > pairs.size()) {
            if(pairs.size() > 0)
                fprintf(stderr, "More threads were requested than pairs. Using %zu threads.\n", pairs.size());
            nthreads = pairs.size() > 0 ? pairs.size() : 1;
        }

        std::vector<emdu::task_parameters> tasks(nthreads);
        std::vector<std::thread> threads(nthreads);

        const double total_length = flat.total_length();
        set_tasks(tasks, presence.n_samples, pairs.size(), normalized, total_length, nthreads);

        initialize_mat_full(*result, presence);
        (*result)->n_unmatched = n_unmatched;
        (*result)->total_length = total_length;

        emdu::process_pairs(flat, leaves, presence, pairs, (*result)->matrix, threads, tasks);
    } catch(const emdu::tree_structure_error &e) {
        fprintf(stderr, "ERROR (emdu): %s\n", e.what());
        destroy_mat_full_fp64(result);
        return tree_format_error;
    } catch(const emdu::input_format_error &e) {
        fprintf(stderr, "ERROR (emdu): %s\n", e.what());
        destroy_mat_full_fp64(result);
        return table_format_error;
    }

    return okay;
}

compute_status unifrac_to_file(const char* table_filename, const char* tree_filename, const char* out_filename,
                               bool normalized, unsigned int nthreads, const char* format) {
    bool use_hdf5;
    if(format == NULL || format[0] == '\0' || std::strcmp(format, "ascii") == 0) {
        use_hdf5 = false;
    } else if(std::strcmp(format, "hdf5") == 0 || std::strcmp(format, "hdf5_fp64") == 0) {
        use_hdf5 = true;
    } else {
        return unknown_format;
    }

    mat_full_fp64_t *result = NULL;
    compute_status rc = one_off(table_filename, tree_filename, normalized, nthreads, &result);
    if(rc != okay)
        return rc;

    IOStatus iostatus;
    if(use_hdf5)
        iostatus = write_mat_from_matrix_hdf5(out_filename, result);
    else
        iostatus = write_mat_from_matrix(out_filename, result);
    destroy_mat_full_fp64(&result);

    return (iostatus == write_okay) ? okay : output_error;
}

IOStatus write_mat_from_matrix(const char* output_filename, mat_full_fp64_t* result) {
    const double *buf2d = result->matrix;

    std::ofstream output;
    output.open(output_filename);
    if(!output.is_open())
        return open_error;

    const uint64_t n_samples_64 = result->n_samples; // 64-bit to avoid overflow

    output << "Sample";
    for(unsigned int i = 0; i < result->n_samples; i++)
        output << "\t" << result->sample_ids[i];
    output << "\n";

    output << std::fixed << std::setprecision(6);
    for(unsigned int i = 0; i < result->n_samples; i++) {
        output << result->sample_ids[i];
        for(unsigned int j = 0; j < result->n_samples; j++) {
            output << "\t" << buf2d[i * n_samples_64 + j];
        }
        output << "\n";
    }
    output.close();

    return output.fail() ? write_error : write_okay;
}

herr_t write_hdf5_string(hid_t output_file_id, const char *dname, const char *str)
{
  // this is the convoluted way to store a string
  // use the FORTRAN form, so readers do not depend on null termination
  hid_t filetype_id = H5Tcopy (H5T_FORTRAN_S1);
  H5Tset_size(filetype_id, strlen(str));
  hid_t memtype_id = H5Tcopy (H5T_C_S1);
  H5Tset_size(memtype_id, strlen(str)+1);

  hsize_t  dims[1] = {1};
  hid_t dataspace_id = H5Screate_simple (1, dims, NULL);

  hid_t dataset_id = H5Dcreate2(output_file_id, dname, filetype_id, dataspace_id, H5P_DEFAULT, H5P_DEFAULT,
                                H5P_DEFAULT);
  herr_t status = (dataset_id < 0) ? -1 :
                  H5Dwrite(dataset_id, memtype_id, H5S_ALL, H5S_ALL, H5P_DEFAULT, str);

  if (dataset_id >= 0) H5Dclose(dataset_id);
  H5Sclose(dataspace_id);
  H5Tclose(memtype_id);
  H5Tclose(filetype_id);

  return status;
}

IOStatus write_mat_from_matrix_hdf5(const char* output_filename, mat_full_fp64_t* result) {
   /* Create a new file using default properties. */
   hid_t output_file_id = H5Fcreate(output_filename, H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
   if (output_file_id<0) return write_error;

   // simple header
   if (write_hdf5_string(output_file_id,"format","BDSM")<0) {
       H5Fclose (output_file_id);
       return write_error;
   }
   if (write_hdf5_string(output_file_id,"version","2020.12")<0) {
       H5Fclose (output_file_id);
       return write_error;
   }

   // save the ids
   {
     hsize_t     dims[1];
     dims[0] = result->n_samples;
     hid_t dataspace_id = H5Screate_simple(1, dims, NULL);

     // this is the convoluted way to store an array of strings
     hid_t datatype_id = H5Tcopy(H5T_C_S1);
     H5Tset_size(datatype_id,H5T_VARIABLE);

     hid_t dataset_id = H5Dcreate2(output_file_id, "order", datatype_id, dataspace_id,
                                   H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);

     herr_t status = (dataset_id < 0) ? -1 :
                     H5Dwrite(dataset_id, datatype_id, H5S_ALL, H5S_ALL,
                              H5P_DEFAULT, result->sample_ids);

     if (dataset_id >= 0) H5Dclose(dataset_id);
     H5Tclose(datatype_id);
     H5Sclose(dataspace_id);

     // check status after cleanup, for simplicity
     if (status<0) {
       H5Fclose (output_file_id);
       return write_error;
     }
   }

   // save the matrix
   {
     hsize_t     dims[2];
     dims[0] = result->n_samples;
     dims[1] = result->n_samples;
     hid_t dataspace_id = H5Screate_simple(2, dims, NULL);

     hid_t dataset_id = H5Dcreate2(output_file_id, "matrix", H5T_IEEE_F64LE, dataspace_id,
                                   H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
     herr_t status = (dataset_id < 0) ? -1 :
                     H5Dwrite(dataset_id, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT,
                              result->matrix);

     if (dataset_id >= 0) H5Dclose(dataset_id);
     H5Sclose(dataspace_id);

     // check status after cleanup, for simplicity
     if (status<0) {
       H5Fclose (output_file_id);
       return write_error;
     }
   }

   H5Fclose (output_file_id);
   return write_okay;
}
