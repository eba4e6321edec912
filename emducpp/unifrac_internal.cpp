/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <cstdlib>
#include <signal.h>
#include <stdarg.h>
#include <stdio.h>
#include <pthread.h>

#include "unifrac_internal.hpp"

static pthread_mutex_t printf_mutex = PTHREAD_MUTEX_INITIALIZER;
static volatile bool* report_status = NULL;
static volatile unsigned int report_n_tasks = 0;

static void sync_printf(const char *format, ...) {
    // https://stackoverflow.com/a/23587285/19741
    va_list args;
    va_start(args, format);

    pthread_mutex_lock(&printf_mutex);
    vprintf(format, args);
    fflush(stdout);
    pthread_mutex_unlock(&printf_mutex);

    va_end(args);
}

static void sig_handler(int signo) {
    // http://www.thegeekstuff.com/2012/03/catch-signals-sample-c-code
    if (signo == SIGUSR1) {
        if(report_status == NULL)
            return;

        for(unsigned int i = 0; i < report_n_tasks; i++) {
            report_status[i] = true;
        }
    }
}

void emdu::try_report(const emdu::task_parameters* task_p, uint64_t k, uint64_t max_k) {
    if(report_status == NULL || task_p->tid >= report_n_tasks)
        return;

    if(__builtin_expect(report_status[task_p->tid], false)) {
        sync_printf("tid:%u\tstart:%llu\tstop:%llu\tk:%llu\ttotal:%llu\n",
                    task_p->tid,
                    (unsigned long long)task_p->start,
                    (unsigned long long)task_p->stop,
                    (unsigned long long)k,
                    (unsigned long long)max_k);
        report_status[task_p->tid] = false;
    }
}

void emdu::register_report_status(unsigned int n_tasks) {
    report_status = (volatile bool*)calloc(sizeof(bool), n_tasks == 0 ? 1 : n_tasks);
    if(report_status == NULL) {
        fprintf(stderr, "Failed to allocate %zd bytes; [%s]:%d\n",
                sizeof(bool) * n_tasks, __FILE__, __LINE__);
        exit(EXIT_FAILURE);
    }
    report_n_tasks = n_tasks;

    // register a signal handler so we can ask the master thread for its
    // progress
    if (signal(SIGUSR1, sig_handler) == SIG_ERR)
        fprintf(stderr, "Can't catch SIGUSR1\n");
}

void emdu::remove_report_status() {
    if(report_status != NULL) {
        report_n_tasks = 0;
        free((void*)report_status);
        report_status = NULL;
    }
}
