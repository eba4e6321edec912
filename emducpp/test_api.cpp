#include <iostream>
#include <fstream>
#include <sstream>
#include <cmath>
#include <string.h>
#include <H5Cpp.h>

#include "api.hpp"

/*
 * test harness adapted from
 * https://github.com/noporpoise/BitArray/blob/master/dev/bit_array_test.c
 */
const char *suite_name;
char suite_pass;
int suites_run = 0, suites_failed = 0, suites_empty = 0;
int tests_in_suite = 0, tests_run = 0, tests_failed = 0;

#define QUOTE(str) #str
#define ASSERT(x) {tests_run++; tests_in_suite++; if(!(x)) \
    { fprintf(stderr, "failed assert [%s:%i] %s\n", __FILE__, __LINE__, QUOTE(x)); \
      suite_pass = 0; tests_failed++; }}

void SUITE_START(const char *name) {
  suite_pass = 1;
  suite_name = name;
  suites_run++;
  tests_in_suite = 0;
}

void SUITE_END() {
  printf("Testing %s ", suite_name);
  size_t suite_i;
  for(suite_i = strlen(suite_name); suite_i < 80-8-5; suite_i++) printf(".");
  printf("%s\n", suite_pass ? " pass" : " fail");
  if(!suite_pass) suites_failed++;
  if(!tests_in_suite) suites_empty++;
}
/*
 *  End adapted code
 */

// expected distances of test.txt over test.tre, row major
const double TEST_EXP[] = {0.0,   2.125, 0.875, 1.75,
                           2.125, 0.0,   1.5,   0.5,
                           0.875, 1.5,   0.0,   1.0,
                           1.75,  0.5,   1.0,   0.0};

const char *TEST_SAMPLES[] = {"S1", "S2", "S3", "S4"};

void write_file(const char *filename, const std::string &content) {
    std::ofstream out(filename);
    out << content;
}

std::string read_file(const char *filename) {
    std::ifstream in(filename);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void test_one_off() {
    SUITE_START("test one_off");
    mat_full_fp64_t *result = NULL;
    ComputeStatus status = one_off("test.txt", "test.tre", false, 1, &result);

    ASSERT(status == okay);
    ASSERT(result != NULL);
    ASSERT(result->n_samples == 4);
    ASSERT(result->flags == 0);
    ASSERT(result->n_unmatched == 1);
    ASSERT(std::fabs(result->total_length - 4.75) < 0.000001);

    for(unsigned int i = 0; i < 4; i++)
        ASSERT(strcmp(result->sample_ids[i], TEST_SAMPLES[i]) == 0);

    for(unsigned int i = 0; i < 16; i++)
        ASSERT(std::fabs(result->matrix[i] - TEST_EXP[i]) < 0.000001);

    destroy_mat_full_fp64(&result);
    ASSERT(result == NULL);
    SUITE_END();
}

void test_one_off_threads() {
    SUITE_START("test one_off threads");
    mat_full_fp64_t *single = NULL;
    mat_full_fp64_t *multi = NULL;
    mat_full_fp64_t *excess = NULL;

    ASSERT(one_off("test.txt", "test.tre", false, 1, &single) == okay);
    ASSERT(one_off("test.txt", "test.tre", false, 4, &multi) == okay);

    // more threads than pairs
    ASSERT(one_off("test.txt", "test.tre", false, 64, &excess) == okay);

    for(unsigned int i = 0; i < 16; i++) {
        ASSERT(single->matrix[i] == multi->matrix[i]);
        ASSERT(single->matrix[i] == excess->matrix[i]);
    }

    destroy_mat_full_fp64(&single);
    destroy_mat_full_fp64(&multi);
    destroy_mat_full_fp64(&excess);

    ASSERT(one_off("test.txt", "test.tre", false, 0, &single) == okay);
    ASSERT(std::fabs(single->matrix[1] - TEST_EXP[1]) < 0.000001);
    destroy_mat_full_fp64(&single);
    SUITE_END();
}

void test_one_off_normalized() {
    SUITE_START("test one_off normalized");
    mat_full_fp64_t *result = NULL;
    ASSERT(one_off("test.txt", "test.tre", true, 2, &result) == okay);

    for(unsigned int i = 0; i < 16; i++)
        ASSERT(std::fabs(result->matrix[i] - TEST_EXP[i] / 4.75) < 0.000001);

    destroy_mat_full_fp64(&result);
    SUITE_END();
}

void test_one_off_single_sample() {
    SUITE_START("test one_off single sample");
    write_file("/tmp/emdu_single.txt", "#OTUID\tS1\nA\t1\nB\t1\n");

    mat_full_fp64_t *result = NULL;
    ASSERT(one_off("/tmp/emdu_single.txt", "test.tre", false, 4, &result) == okay);
    ASSERT(result->n_samples == 1);
    ASSERT(result->matrix[0] == 0.0);
    destroy_mat_full_fp64(&result);
    SUITE_END();
}

void test_one_off_duplicate_tip_names() {
    SUITE_START("test one_off duplicate tip names");
    write_file("/tmp/emdu_duplicate.tre", "((A:1,B:1):1,A:2);");
    write_file("/tmp/emdu_duplicate.txt", "#OTUID\tS1\tS2\nA\t1\t0\nB\t0\t1\n");

    // the right hand A carries the taxon: 2 + 1 + 1
    mat_full_fp64_t *result = NULL;
    ASSERT(one_off("/tmp/emdu_duplicate.txt", "/tmp/emdu_duplicate.tre", false, 1, &result) == okay);
    ASSERT(result->n_unmatched == 0);
    ASSERT(result->matrix[1] == 4.0);
    ASSERT(result->matrix[2] == 4.0);
    destroy_mat_full_fp64(&result);
    SUITE_END();
}

void test_one_off_single_tip_tree() {
    SUITE_START("test one_off single tip tree");
    write_file("/tmp/emdu_single_tip.tre", "A;\n");
    write_file("/tmp/emdu_single_tip.txt", "#OTUID\tS1\tS2\nA\t1\t0\nB\t3\t1\n");

    mat_full_fp64_t *result = NULL;
    ASSERT(one_off("/tmp/emdu_single_tip.txt", "/tmp/emdu_single_tip.tre", true, 2, &result) == okay);
    ASSERT(result->n_samples == 2);
    ASSERT(result->n_unmatched == 1);
    ASSERT(result->total_length == 0.0);
    for(unsigned int i = 0; i < 4; i++)
        ASSERT(result->matrix[i] == 0.0);
    destroy_mat_full_fp64(&result);
    SUITE_END();
}

void test_one_off_errors() {
    SUITE_START("test one_off errors");
    mat_full_fp64_t *result = NULL;

    ASSERT(one_off("/tmp/emdu_does_not_exist.txt", "test.tre", false, 1, &result) == table_missing);
    ASSERT(one_off("test.txt", "/tmp/emdu_does_not_exist.tre", false, 1, &result) == tree_missing);

    write_file("/tmp/emdu_empty_obs.txt", "#OTUID\tS1\tS2\n");
    ASSERT(one_off("/tmp/emdu_empty_obs.txt", "test.tre", false, 1, &result) == table_empty);

    write_file("/tmp/emdu_empty_samples.txt", "#OTUID\nA\nB\n");
    ASSERT(one_off("/tmp/emdu_empty_samples.txt", "test.tre", false, 1, &result) == table_empty);

    write_file("/tmp/emdu_no_header.txt", "");
    ASSERT(one_off("/tmp/emdu_no_header.txt", "test.tre", false, 1, &result) == table_format_error);

    write_file("/tmp/emdu_blank_line.txt", "#OTUID\tS1\tS2\nA\t1\t0\n\nB\t0\t1\n");
    ASSERT(one_off("/tmp/emdu_blank_line.txt", "test.tre", false, 1, &result) == table_format_error);

    write_file("/tmp/emdu_unbalanced.tre", "((A:1,B:1):1,C:2;");
    ASSERT(one_off("test.txt", "/tmp/emdu_unbalanced.tre", false, 1, &result) == tree_format_error);

    write_file("/tmp/emdu_bad_length.tre", "((A:1,B:one):1,C:2);");
    ASSERT(one_off("test.txt", "/tmp/emdu_bad_length.tre", false, 1, &result) == tree_format_error);

    write_file("/tmp/emdu_empty.tre", "");
    ASSERT(one_off("test.txt", "/tmp/emdu_empty.tre", false, 1, &result) == tree_format_error);

    ASSERT(result == NULL);
    SUITE_END();
}

void test_unmatched_taxa_match_deleted_rows() {
    SUITE_START("test unmatched taxa match deleted rows");
    write_file("/tmp/emdu_control.txt",
               "#OTUID\tS1\tS2\tS3\tS4\n"
               "A\t1\t0\t3\t1\n"
               "B\t0\t2\t0\t1\n"
               "C\t5\t0\t1\t0\n"
               "D\t0\t1\t0\t1\n"
               "E\t0\t0\t2\t1\n");

    mat_full_fp64_t *control = NULL;
    mat_full_fp64_t *with_unmatched = NULL;
    ASSERT(one_off("/tmp/emdu_control.txt", "test.tre", false, 1, &control) == okay);
    ASSERT(one_off("test.txt", "test.tre", false, 1, &with_unmatched) == okay);

    ASSERT(control->n_unmatched == 0);
    ASSERT(with_unmatched->n_unmatched == 1);
    for(unsigned int i = 0; i < 16; i++)
        ASSERT(control->matrix[i] == with_unmatched->matrix[i]);

    destroy_mat_full_fp64(&control);
    destroy_mat_full_fp64(&with_unmatched);
    SUITE_END();
}

void test_write_mat_ascii() {
    SUITE_START("test write mat ascii");
    mat_full_fp64_t *result = NULL;
    ASSERT(one_off("test.txt", "test.tre", false, 1, &result) == okay);
    ASSERT(write_mat_from_matrix("/tmp/emdu_test.dm", result) == write_okay);

    std::string exp = "Sample\tS1\tS2\tS3\tS4\n"
                      "S1\t0.000000\t2.125000\t0.875000\t1.750000\n"
                      "S2\t2.125000\t0.000000\t1.500000\t0.500000\n"
                      "S3\t0.875000\t1.500000\t0.000000\t1.000000\n"
                      "S4\t1.750000\t0.500000\t1.000000\t0.000000\n";
    ASSERT(read_file("/tmp/emdu_test.dm") == exp);

    ASSERT(write_mat_from_matrix("/tmp/emdu_no_such_dir/out.dm", result) == open_error);
    destroy_mat_full_fp64(&result);
    SUITE_END();
}

void test_write_mat_hdf5() {
    SUITE_START("test write mat hdf5");
    mat_full_fp64_t *result = NULL;
    ASSERT(one_off("test.txt", "test.tre", false, 1, &result) == okay);
    ASSERT(write_mat_from_matrix_hdf5("/tmp/emdu_test.h5", result) == write_okay);
    destroy_mat_full_fp64(&result);

    H5::H5File file("/tmp/emdu_test.h5", H5F_ACC_RDONLY);

    H5::DataSet format_ds = file.openDataSet("format");
    H5std_string format;
    format_ds.read(format, format_ds.getStrType());
    ASSERT(format == "BDSM");

    H5::DataSet order_ds = file.openDataSet("order");
    hsize_t order_dims[1];
    order_ds.getSpace().getSimpleExtentDims(order_dims, NULL);
    ASSERT(order_dims[0] == 4);

    H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
    std::vector<char*> order(4);
    order_ds.read((void*)order.data(), str_type);
    for(unsigned int i = 0; i < 4; i++) {
        ASSERT(strcmp(order[i], TEST_SAMPLES[i]) == 0);
        free(order[i]);
    }

    H5::DataSet matrix_ds = file.openDataSet("matrix");
    H5::DataSpace matrix_space = matrix_ds.getSpace();
    hsize_t matrix_dims[2];
    ASSERT(matrix_space.getSimpleExtentNdims() == 2);
    matrix_space.getSimpleExtentDims(matrix_dims, NULL);
    ASSERT(matrix_dims[0] == 4);
    ASSERT(matrix_dims[1] == 4);

    std::vector<double> matrix(16);
    matrix_ds.read((void*)matrix.data(), H5::PredType::NATIVE_DOUBLE);
    for(unsigned int i = 0; i < 16; i++)
        ASSERT(std::fabs(matrix[i] - TEST_EXP[i]) < 0.000001);
    SUITE_END();
}

void test_unifrac_to_file() {
    SUITE_START("test unifrac_to_file");
    ASSERT(unifrac_to_file("test.txt", "test.tre", "/tmp/emdu_to_file.dm", false, 2, "ascii") == okay);
    ASSERT(read_file("/tmp/emdu_to_file.dm").compare(0, 18, "Sample\tS1\tS2\tS3\tS4") == 0);

    ASSERT(unifrac_to_file("test.txt", "test.tre", "/tmp/emdu_to_file_default.dm", false, 2, NULL) == okay);
    ASSERT(read_file("/tmp/emdu_to_file_default.dm") == read_file("/tmp/emdu_to_file.dm"));

    ASSERT(unifrac_to_file("test.txt", "test.tre", "/tmp/emdu_to_file.h5", true, 2, "hdf5") == okay);
    {
        H5::H5File file("/tmp/emdu_to_file.h5", H5F_ACC_RDONLY);
        std::vector<double> matrix(16);
        file.openDataSet("matrix").read((void*)matrix.data(), H5::PredType::NATIVE_DOUBLE);
        ASSERT(std::fabs(matrix[1] - TEST_EXP[1] / 4.75) < 0.000001);
    }

    ASSERT(unifrac_to_file("test.txt", "test.tre", "/tmp/emdu_to_file.x", false, 1, "parquet") == unknown_format);
    ASSERT(unifrac_to_file("/tmp/emdu_does_not_exist.txt", "test.tre", "/tmp/emdu_to_file.x", false, 1, "ascii") == table_missing);
    ASSERT(unifrac_to_file("test.txt", "test.tre", "/tmp/emdu_no_such_dir/out.dm", false, 1, "ascii") == output_error);
    SUITE_END();
}

int main(int argc, char** argv) {
    test_one_off();
    test_one_off_threads();
    test_one_off_normalized();
    test_one_off_single_sample();
    test_one_off_duplicate_tip_names();
    test_one_off_single_tip_tree();
    test_one_off_errors();
    test_unmatched_taxa_match_deleted_rows();
    test_write_mat_ascii();
    test_write_mat_hdf5();
    test_unifrac_to_file();

    printf("\n");
    printf(" %i / %i suites failed\n", suites_failed, suites_run);
    printf(" %i / %i suites empty\n", suites_empty, suites_run);
    printf(" %i / %i tests failed\n", tests_failed, tests_run);

    printf("\n THE END.\n");

    return tests_failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
