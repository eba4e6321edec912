/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include "tree.hpp"
#include "errors.hpp"
#include <stack>
#include <cstdlib>
#include <cerrno>

using namespace emdu;

static const char WHITESPACE[] = " \t\r\n";

BPTree::BPTree(std::string newick) {
    openclose = std::vector<uint32_t>();
    lengths = std::vector<double>();
    names = std::vector<std::string>();
    select_0_index = std::vector<uint32_t>();
    parents = std::vector<int32_t>();
    structure = std::vector<bool>();
    structure.reserve(500000);  // a fair sized tree... avoid reallocs, and its not _that_ much waste if this is wrong

    // three pass for parse: topology, parenthesis pairs, then labels
    newick_to_bp(newick);

    // resize is correct here as we are not performing a push_back
    openclose.resize(nparens);
    parents.resize(nparens);
    lengths.resize(nparens);
    names.resize(nparens);
    select_0_index.resize(nparens / 2);

    structure_to_openclose();
    newick_to_metadata(newick);
    index_and_cache();
}

BPTree::~BPTree() {
}

void BPTree::index_and_cache() {
    uint32_t idx = 0;
    auto k0 = select_0_index.begin();

    for(auto i = structure.begin(); i != structure.end(); i++, idx++) {
        if(!*i)
            *(k0++) = idx;
    }
}

uint32_t BPTree::postorderselect(uint32_t k) const {
    return open(select_0_index[k]);
}

inline uint32_t BPTree::open(uint32_t i) const {
    return structure[i] ? i : openclose[i];
}

inline uint32_t BPTree::close(uint32_t i) const {
    return structure[i] ? openclose[i] : i;
}

bool BPTree::isleaf(uint32_t idx) const {
    return (structure[idx] && !structure[idx + 1]);
}

int32_t BPTree::parent(uint32_t i) const {
    return parents[open(i)];
}

void BPTree::newick_to_bp(const std::string &newick) {
    char last_structure = '\0';
    bool potential_single_descendent = false;
    bool in_quote = false;
    int64_t depth = 0;

    for(auto c = newick.begin(); c != newick.end(); c++) {
        if(*c == '\'')
            in_quote = !in_quote;

        if(in_quote)
            continue;

        switch(*c) {
            case '(':
                // opening of a node
                depth++;
                structure.push_back(true);
                last_structure = *c;
                potential_single_descendent = true;
                break;
            case ')':
                // closing of a node
                if(--depth < 0)
                    throw tree_structure_error("newick has an unmatched ')'");

                if(potential_single_descendent || (last_structure == ',')) {
                    // we have a single descendent or a last child (i.e. ",)" scenario)
                    structure.push_back(true);
                    structure.push_back(false);
                    structure.push_back(false);
                    potential_single_descendent = false;
                } else {
                    // it is possible still to have a single descendent in the case of
                    // multiple single descendents (e.g., (...()...) )
                    structure.push_back(false);
                }
                last_structure = *c;
                break;
            case ',':
                if(depth == 0)
                    throw tree_structure_error("newick has a sibling outside of the root");

                if(last_structure != ')') {
                    // we have a new tip
                    structure.push_back(true);
                    structure.push_back(false);
                }
                potential_single_descendent = false;
                last_structure = *c;
                break;
            default:
                break;
        }
    }

    if(in_quote)
        throw tree_structure_error("newick has an unterminated quote");
    if(depth != 0)
        throw tree_structure_error("newick has an unmatched '('");
    if(structure.empty()) {
        // a lone label is a single tip which is also the root
        if(newick.find_first_not_of(" \t\r\n;") == std::string::npos)
            throw tree_structure_error("newick does not describe a rooted tree");
        structure.push_back(true);
        structure.push_back(false);
    }

    nparens = structure.size();
}

void BPTree::structure_to_openclose() {
    std::stack<uint32_t> oc;
    uint32_t open_idx;
    uint32_t i = 0;

    for(auto it = structure.begin(); it != structure.end(); it++, i++) {
        if(*it) {
            parents[i] = oc.empty() ? -1 : (int32_t)oc.top();
            if(parents[i] == -1 && i != 0)
                throw tree_structure_error("newick describes more than one root");
            oc.push(i);
        } else {
            open_idx = oc.top();
            oc.pop();
            openclose[i] = open_idx;
            openclose[open_idx] = i;
            parents[i] = parents[open_idx];
        }
    }
}

void BPTree::newick_to_metadata(std::string newick) {
    // trailing newlines would otherwise be tokenized as a label
    newick.erase(newick.find_last_not_of(WHITESPACE) + 1);

    std::string::iterator start = newick.begin();
    std::string::iterator end = newick.end();
    std::string token;
    char last_structure = '\0';

    uint32_t structure_idx = 0;
    uint32_t lag = 0;
    uint32_t open_idx;

    while(start != end) {
        token = tokenize(start, end);
        if(token.empty())
            continue;

        if(token.length() == 1 && is_structure_character(token[0])) {
            switch(token[0]) {
                case '(':
                    structure_idx++;
                    break;
                case ')':
                case ',':
                    structure_idx++;
                    if(last_structure == ')')
                        lag++;
                    break;
            }
        } else {
            // puts us on the corresponding closing parenthesis
            structure_idx += lag;
            lag = 0;

            if(structure_idx >= nparens)
                throw tree_structure_error("newick label does not belong to a node: " + token);

            open_idx = open(structure_idx);
            set_node_metadata(open_idx, token);

            // a leaf is by definition a 10, so advance past both parentheses
            // to keep the structure to token mapping in sync
            if(isleaf(open_idx))
                structure_idx += 2;
            else
                structure_idx += 1;
        }
        last_structure = token[0];
    }
}

void BPTree::set_node_metadata(uint32_t open_idx, const std::string &raw) {
    std::string token = raw;
    token.erase(0, token.find_first_not_of(WHITESPACE));
    token.erase(token.find_last_not_of(WHITESPACE) + 1);

    double length = 0.0;
    std::string name = std::string();
    std::string::size_type colon_idx = token.find_last_of(':');

    if(colon_idx == std::string::npos) {
        name = token;
    } else {
        name = token.substr(0, colon_idx);
        std::string length_str = token.substr(colon_idx + 1);

        const char *begin = length_str.c_str();
        char *parsed_end = NULL;
        errno = 0;
        length = strtod(begin, &parsed_end);
        if(parsed_end == begin || *parsed_end != '\0' || errno == ERANGE)
            throw tree_structure_error("invalid branch length: " + raw);
        if(length < 0.0)
            throw tree_structure_error("negative branch length: " + raw);
    }

    names[open_idx] = name;
    lengths[open_idx] = length;
}

inline bool BPTree::is_structure_character(char c) const {
    return (c == '(' || c == ')' || c == ',' || c == ';');
}

std::string BPTree::tokenize(std::string::iterator &start, const std::string::iterator &end) {
    bool inquote = false;
    bool isquote = false;
    char c;
    std::string token;

    do {
        c = *start;
        start++;

        if(c == '\n') {
            continue;
        }

        isquote = c == '\'';

        if(inquote && isquote) {
            inquote = false;
            continue;
        } else if(!inquote && isquote) {
            inquote = true;
            continue;
        }

        if(is_structure_character(c) && !inquote) {
            // a label swallows the structure character which closes it
            if(token.length() == 0)
                token.push_back(c);
            break;
        }

        token.push_back(c);

    } while(start != end);

    return token;
}
