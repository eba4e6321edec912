/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef __EMDU_UNIFRAC_INTERNAL
#define __EMDU_UNIFRAC_INTERNAL 1

#include <stdint.h>
#include "task_parameters.hpp"

namespace emdu {
 // helper reporting functions

 /* install the SIGUSR1 progress handler for n_tasks workers */
 void register_report_status(unsigned int n_tasks);
 void remove_report_status();

 /* print progress of a worker if it was requested since the last report
  *
  * @param task_p The worker
  * @param k Pairs completed by the worker
  * @param max_k Pairs assigned to the worker
  */
 void try_report(const emdu::task_parameters* task_p, uint64_t k, uint64_t max_k);
}

#endif
