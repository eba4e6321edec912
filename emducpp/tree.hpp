/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef __EMDU_TREE_H
#define __EMDU_TREE_H 1

#include <stdint.h>
#include <string>
#include <vector>

namespace emdu {
    /* A rooted tree encoded as balanced parentheses.
     *
     * Every node is a pair of parentheses; the node is identified by the
     * index of its opening parenthesis. The root is always index 0.
     */
    class BPTree {
        public:
            /* tracked attributes, indexed by opening parenthesis */
            std::vector<double> lengths;
            std::vector<std::string> names;

            /* total number of parentheses */
            uint32_t nparens;

            /* default constructor
             *
             * @param newick A newick string
             *
             * Throws tree_structure_error if the string does not describe a
             * rooted tree (empty, unbalanced parentheses, bad branch length).
             */
            BPTree(std::string newick);
            ~BPTree();

            /* number of nodes in the tree */
            uint32_t n_nodes() const { return nparens / 2; }

            /* postorder tree traversal
             *
             * Get the index position of the ith node in a postorder tree
             * traversal.
             *
             * @param i The ith node in a postorder traversal
             */
            uint32_t postorderselect(uint32_t i) const;

            /* Test if the node at an index position is a leaf
             *
             * @param i The node to evaluate
             */
            bool isleaf(uint32_t i) const;

            /* Get the parent of a node
             *
             * @param i The node to obtain the parent of
             *
             * Returns -1 for the root.
             */
            int32_t parent(uint32_t i) const;

        private:
            std::vector<bool> structure;          // the topology
            std::vector<uint32_t> openclose;      // cache'd mapping between parentheses
            std::vector<uint32_t> select_0_index; // cache of select 0
            std::vector<int32_t> parents;         // cache of the enclosing node, -1 at the root

            void index_and_cache();  // construct the select cache
            void newick_to_bp(const std::string &newick);  // convert a newick string to parentheses
            void newick_to_metadata(std::string newick);  // convert newick to attributes
            void structure_to_openclose();  // set the parenthesis pairs and the parent cache
            void set_node_metadata(uint32_t open_idx, const std::string &token); // set attributes for a node
            bool is_structure_character(char c) const;  // test if a character is a newick structure
            inline uint32_t open(uint32_t i) const;  // obtain the index of the opening for a given parenthesis
            inline uint32_t close(uint32_t i) const;  // obtain the index of the closing for a given parenthesis
            std::string tokenize(std::string::iterator &start, const std::string::iterator &end);  // newick -> tokens
    };
}

#endif /* __EMDU_TREE_H */
