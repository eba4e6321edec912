#include <stdint.h>
#include <stdbool.h>

#ifndef __emdu_task_parameters
    #ifdef __cplusplus
    namespace emdu {
    #endif

        /* task specific compute parameters
         *
         * n_samples <int> the number of samples being processed
         * start <uint> the first pair to process
         * stop <uint> one past the last pair to process
         * tid <uint> the thread identifier
         * normalized <bool> divide distances by the total branch length
         * total_length <double> the total branch length of the tree
         */
        struct task_parameters {
           uint32_t n_samples;          // number of samples
           uint64_t start;              // starting pair
           uint64_t stop;               // stopping pair
           unsigned int tid;            // thread ID

           // task specific arguments below
           bool normalized;             // scale into [0, 1]
           double total_length;         // computed once, before any task starts
        };

    #ifdef __cplusplus
    }
    #endif

#define __emdu_task_parameters
#endif
