/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef __EMDU_FLAT_TREE_H
#define __EMDU_FLAT_TREE_H 1

#include <stdint.h>
#include <string>
#include <vector>
#include <unordered_map>

#include "tree.hpp"

namespace emdu {
    /* taxon name -> postorder position of the tip carrying it */
    typedef std::unordered_map<std::string, uint32_t> LeafIndex;

    /* A tree flattened into index aligned arrays keyed by postorder rank.
     *
     * Children always precede their parent, so a single ascending pass
     * over the positions visits every subtree before its root. The tree
     * root is the last position and is its own parent.
     */
    class FlatTree {
        public:
            std::vector<uint32_t> tint;        // parent position, tint[root] == root
            std::vector<double> lint;          // length of the edge to the parent, 0 at the root
            std::vector<std::string> names;    // node name, empty when unnamed
            std::vector<uint32_t> postorder;   // BPTree node visited at each position
            uint32_t root;                     // position of the root

            /* flatten a tree
             *
             * @param tree The tree to flatten
             *
             * Throws tree_structure_error if the root cannot be resolved or
             * a non-root node has no parent.
             */
            FlatTree(const BPTree &tree);

            uint32_t n_nodes() const { return tint.size(); }

            /* sum of every branch length in the tree */
            double total_length() const;
    };

    /* map the names of the tips in a tree to their flattened positions
     *
     * @param tree The tree the flattened tree was built from
     * @param flat The flattened tree
     *
     * Unnamed tips are not indexed. When a name is carried by more than
     * one tip, the last in postorder wins.
     */
    LeafIndex build_leaf_index(const BPTree &tree, const FlatTree &flat);

    /* resolve a list of taxa against a leaf index
     *
     * @param index The leaf index
     * @param obs_ids The taxa, in table row order
     * @param n_unmatched Output, the number of taxa absent from the index
     *
     * Returns the leaf position for each taxon, or -1 if the taxon is not
     * a tip of the tree.
     */
    std::vector<int64_t> resolve_taxa(const LeafIndex &index,
                                      const std::vector<std::string> &obs_ids,
                                      uint32_t &n_unmatched);
}

#endif /* __EMDU_FLAT_TREE_H */
