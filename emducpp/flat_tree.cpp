/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include "flat_tree.hpp"
#include "errors.hpp"
#include <sstream>

using namespace emdu;

FlatTree::FlatTree(const BPTree &tree) {
    const uint32_t n_nodes = tree.n_nodes();
    if(n_nodes == 0)
        throw tree_structure_error("tree has no root");

    tint.resize(n_nodes);
    lint.resize(n_nodes);
    names.resize(n_nodes);
    postorder.resize(n_nodes);

    // BP node -> postorder rank. parents close after their children, so
    // every rank has to be known before any parent can be translated.
    std::vector<uint32_t> pos(tree.nparens);
    for(uint32_t k = 0; k < n_nodes; k++) {
        uint32_t node = tree.postorderselect(k);
        postorder[k] = node;
        pos[node] = k;
    }

    // the root is the opening parenthesis at index 0, last in postorder
    root = pos[0];
    if(root != n_nodes - 1)
        throw tree_structure_error("tree root is not the last node in postorder");

    for(uint32_t k = 0; k < n_nodes; k++) {
        uint32_t node = postorder[k];
        names[k] = tree.names[node];

        if(k == root) {
            tint[k] = k;
            lint[k] = 0.0;
            continue;
        }

        int32_t p = tree.parent(node);
        if(p < 0) {
            std::ostringstream msg;
            msg << "node " << node << " has no parent but is not root";
            throw tree_structure_error(msg.str());
        }
        tint[k] = pos[p];
        lint[k] = tree.lengths[node];
    }
}

double FlatTree::total_length() const {
    double total = 0.0;
    for(auto it = lint.begin(); it != lint.end(); it++)
        total += *it;
    return total;
}

LeafIndex emdu::build_leaf_index(const BPTree &tree, const FlatTree &flat) {
    LeafIndex index;
    index.reserve(flat.n_nodes() / 2 + 1);

    for(uint32_t k = 0; k < flat.n_nodes(); k++) {
        uint32_t node = flat.postorder[k];
        if(tree.isleaf(node) && !flat.names[k].empty()) {
            // later tips overwrite, so duplicated names keep their last tip
            index[flat.names[k]] = k;
        }
    }

    return index;
}

std::vector<int64_t> emdu::resolve_taxa(const LeafIndex &index,
                                        const std::vector<std::string> &obs_ids,
                                        uint32_t &n_unmatched) {
    std::vector<int64_t> leaves(obs_ids.size(), -1);
    n_unmatched = 0;

    for(size_t i = 0; i < obs_ids.size(); i++) {
        LeafIndex::const_iterator hit = index.find(obs_ids[i]);
        if(hit == index.end())
            n_unmatched++;
        else
            leaves[i] = hit->second;
    }

    return leaves;
}
