#include "task_parameters.hpp"

#ifdef __cplusplus
#include <vector>
#define EXTERN extern "C"


#else
#include <stdbool.h>
#define EXTERN
#endif


typedef enum compute_status {okay=0, tree_missing, table_missing, table_empty, unknown_format, table_format_error, tree_format_error, output_error} ComputeStatus;
typedef enum io_status {read_okay=0, write_okay, open_error, read_error, write_error} IOStatus;

/* a result matrix, full, fp64
 *
 * n_samples <uint> the number of samples.
 * flags <uint> opaque, 0 for default behavior.
 * n_unmatched <uint> the number of table taxa which are not tips of the tree.
 * total_length <double> the total branch length of the tree.
 * matrix <double*> the matrix values, n_sample**2 size, row major.
 * sample_ids <char**> the sample IDs of length n_samples.
 */
typedef struct mat_full_fp64 {
    uint32_t n_samples;
    uint32_t flags; //opaque, 0 for default behavior
    uint32_t n_unmatched;
    double total_length;
    double* matrix;
    char** sample_ids;
} mat_full_fp64_t;


EXTERN void destroy_mat_full_fp64(mat_full_fp64_t** result);

/* Compute Unweighted UniFrac - full matrix
 *
 * table_filename <const char*> the filename to the table, text or BIOM.
 * tree_filename <const char*> the filename to the corresponding tree.
 * normalized <bool> divide every distance by the total branch length.
 * nthreads <uint> the number of threads to use.
 * result <mat_full_fp64_t**> the resulting distance matrix in full form, this is initialized in the method so using **
 *
 * one_off returns the following error codes:
 *
 * okay               : no problems encountered
 * table_missing      : the filename for the table does not exist
 * tree_missing       : the filename for the tree does not exist
 * table_empty        : the table does not have any samples or taxa
 * table_format_error : the table could not be parsed
 * tree_format_error  : the tree could not be parsed or rooted
 */
EXTERN ComputeStatus one_off(const char* table_filename, const char* tree_filename,
                             bool normalized, unsigned int nthreads, mat_full_fp64_t** result);

/* Compute Unweighted UniFrac and save to file
 *
 * table_filename <const char*> the filename to the table, text or BIOM.
 * tree_filename <const char*> the filename to the corresponding tree.
 * out_filename <const char*> the filename of the output file.
 * normalized <bool> divide every distance by the total branch length.
 * nthreads <uint> the number of threads to use.
 * format <const char*> output format to use, one of ascii, hdf5, hdf5_fp64.
 *
 * unifrac_to_file returns the same error codes as one_off, plus:
 *
 * unknown_format     : the requested output format is not known
 * output_error       : failed to properly write the output file
 */
EXTERN ComputeStatus unifrac_to_file(const char* table_filename, const char* tree_filename, const char* out_filename,
                                     bool normalized, unsigned int nthreads, const char* format);

/* Write a matrix object
 *
 * filename <const char*> the file to write into
 * result <mat_full_fp64_t*> the result object
 *
 * The output is tab delimited with a "Sample" header row, each distance
 * printed with six decimal digits.
 *
 * This method can return the write_okay, open_error or write_error status.
 */
EXTERN IOStatus write_mat_from_matrix(const char* filename, mat_full_fp64_t* result);

/* Write a matrix object using hdf5 format
 *
 * filename <const char*> the file to write into
 * result <mat_full_fp64_t*> the result object
 *
 * This method can return the write_okay or write_error status.
 */
EXTERN IOStatus write_mat_from_matrix_hdf5(const char* filename, mat_full_fp64_t* result);

#ifdef __cplusplus
// balanced split of the pair list over nthreads workers, exposed for testing
void set_tasks(std::vector<emdu::task_parameters> &tasks,
               uint32_t n_samples,
               uint64_t n_pairs,
               bool normalized,
               double total_length,
               unsigned int nthreads);
#endif
