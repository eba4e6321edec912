/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef __EMDU_ERRORS_H
#define __EMDU_ERRORS_H 1

#include <stdexcept>
#include <string>

namespace emdu {
    /* raised when a table cannot be read: unreadable file, missing header,
     * a row without a taxon token or an invalid BIOM container
     */
    class input_format_error : public std::runtime_error {
        public:
            explicit input_format_error(const std::string &msg) : std::runtime_error(msg) {}
    };

    /* raised when a tree cannot be rooted or flattened: empty or
     * unbalanced newick, a non-root node without a parent, bad lengths
     */
    class tree_structure_error : public std::runtime_error {
        public:
            explicit tree_structure_error(const std::string &msg) : std::runtime_error(msg) {}
    };
}

#endif /* __EMDU_ERRORS_H */
