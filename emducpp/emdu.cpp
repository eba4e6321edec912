#include <iostream>
#include <string>
#include <cstdlib>
#include <stdio.h>
#include <signal.h>
#include "api.hpp"
#include "cmd.hpp"

enum Format {format_invalid, format_ascii, format_hdf5};

void usage() {
    std::cout << "usage: emdu -i <table> -o <out.dm> -t <newick> [-n threads] [--normalized] [--format|-r out-mode]" << std::endl;
    std::cout << std::endl;
    std::cout << "    -i|--input\tThe input table, tab delimited text or BIOM." << std::endl;
    std::cout << "    -t|--tree\tThe input phylogeny in newick." << std::endl;
    std::cout << "    -o|--output\tThe output distance matrix." << std::endl;
    std::cout << "    -n\t\t[OPTIONAL] The number of threads, default is 1." << std::endl;
    std::cout << "    --normalized\t[OPTIONAL] Divide distances by the total branch length of the tree." << std::endl;
    std::cout << "    --format|-r\t[OPTIONAL]  Output format:" << std::endl;
    std::cout << "    \t\t    ascii : [DEFAULT] Tab delimited text." << std::endl;
    std::cout << "    \t\t    hdf5 : HDF5 format, fp64." << std::endl;
    std::cout << std::endl;
    std::cout << "Text tables have a header line naming the samples after a leading token," << std::endl;
    std::cout << "followed by one line per taxon: its name, then one abundance per sample." << std::endl;
    std::cout << "Abundances are reduced to presence/absence. Taxa which are not tips of the" << std::endl;
    std::cout << "tree are ignored." << std::endl;
    std::cout << std::endl;
    std::cout << "Citations: " << std::endl;
    std::cout << "    For UniFrac, please see:" << std::endl;
    std::cout << "        Lozupone and Knight Appl Environ Microbiol 2005; DOI: 10.1128/AEM.71.12.8228-8235.2005" << std::endl;
    std::cout << "    For EMDUnifrac, please see:" << std::endl;
    std::cout << "        McClelland and Koslicki J Math Biol 2018" << std::endl;
    std::cout << std::endl;
    std::cout << "Runtime progress can be obtained by issuing a SIGUSR1 signal. The report will" << std::endl;
    std::cout << "yield the following information: " << std::endl;
    std::cout << std::endl;
    std::cout << "tid:<thread ID> start:<starting pair> stop:<stopping pair> k:<pairs done> total:<pairs assigned>" << std::endl;
    std::cout << std::endl;
}

const char* compute_status_messages[8] = {"No error.",
                                          "The tree file cannot be found.",
                                          "The table file cannot be found.",
                                          "The table file contains an empty table.",
                                          "An unknown output format was requested.",
                                          "The table file could not be parsed.",
                                          "The tree file could not be parsed or rooted.",
                                          "Error creating the output."};

void err(std::string msg) {
    std::cerr << "ERROR: " << msg << std::endl << std::endl;
    usage();
}

Format get_format(const std::string &format_string) {
    Format format_val = format_invalid;
    if (format_string.empty() || format_string == "ascii") {
        format_val = format_ascii;
    } else if (format_string == "hdf5" || format_string == "hdf5_fp64") {
        format_val = format_hdf5;
    }

    return format_val;
}

int mode_one_off(const std::string &table_filename, const std::string &tree_filename,
                 const std::string &output_filename, Format format_val,
                 bool normalized, unsigned int nthreads) {
    if(output_filename.empty()) {
        err("output filename missing");
        return EXIT_FAILURE;
    }

    if(table_filename.empty()) {
        err("table filename missing");
        return EXIT_FAILURE;
    }

    if(tree_filename.empty()) {
        err("tree filename missing");
        return EXIT_FAILURE;
    }

    mat_full_fp64_t *result = NULL;
    compute_status status = one_off(table_filename.c_str(), tree_filename.c_str(),
                                    normalized, nthreads, &result);
    if(status != okay || result == NULL) {
        fprintf(stderr, "Compute failed in one_off: %s\n", compute_status_messages[status]);
        return EXIT_FAILURE;
    }

    printf("INFO (emdu): %u samples, total branch length %f%s\n",
           result->n_samples, result->total_length,
           normalized ? ", distances normalized" : "");

    IOStatus iostatus;
    if(format_val == format_hdf5)
        iostatus = write_mat_from_matrix_hdf5(output_filename.c_str(), result);
    else
        iostatus = write_mat_from_matrix(output_filename.c_str(), result);
    destroy_mat_full_fp64(&result);

    if(iostatus != write_okay) {
        fprintf(stderr, "Write failed: %s\n", iostatus == open_error ? "could not open output" : compute_status_messages[output_error]);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

void emdu_sig_handler(int signo) {
    if (signo == SIGUSR1) {
        printf("Status cannot be reported.\n");
    }
}

int main(int argc, char **argv){
    signal(SIGUSR1, emdu_sig_handler);
    InputParser input(argc, argv);
    if(input.cmdOptionExists("-h") || input.cmdOptionExists("--help") || argc == 1) {
        usage();
        return EXIT_SUCCESS;
    }

    unsigned int nthreads;
    std::string table_filename = input.getCmdOption("-i");
    std::string tree_filename = input.getCmdOption("-t");
    std::string output_filename = input.getCmdOption("-o");
    std::string nthreads_arg = input.getCmdOption("-n");
    std::string format_arg = input.getCmdOption("--format");
    std::string sformat_arg = input.getCmdOption("-r");

    // long spellings of the required inputs
    if(table_filename.empty())
        table_filename = input.getCmdOption("--input");
    if(tree_filename.empty())
        tree_filename = input.getCmdOption("--tree");
    if(output_filename.empty())
        output_filename = input.getCmdOption("--output");

    if(nthreads_arg.empty()) {
        nthreads = 1;
    } else {
        int requested = atoi(nthreads_arg.c_str());
        if(requested < 1) {
            err("-n must be a positive number of threads");
            return EXIT_FAILURE;
        }
        nthreads = requested;
    }

    bool normalized = input.cmdOptionExists("--normalized");

    if(format_arg.empty())
        format_arg = sformat_arg; // easier to use a single variable
    Format format_val = get_format(format_arg);
    if(format_val == format_invalid) {
        err("Invalid format, must be one of ascii|hdf5");
        return EXIT_FAILURE;
    }

    return mode_one_off(table_filename, tree_filename, output_filename, format_val, normalized, nthreads);
}
