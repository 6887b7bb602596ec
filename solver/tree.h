/**
 * Header File for the offline decision tree builder
 * #include "tree.h"
*/

#ifndef TREE_H
#define TREE_H

#include <csignal>
#include <map>
#include <string>
#include <vector>
#include "word.h"
#include "utils.h"
#include "entropy.h"
#include "checkpoint.h"

#define TREE_MAX_DEPTH 4
#define TREE_MIN_CANDIDATES 15
#define CHECKPOINT_EVERY 10
#define MIN_CHUNK_SIZE 50

struct tree_args_t {
    int max_depth = TREE_MAX_DEPTH;
    // Children with this many candidates or fewer are left to the live engine
    size_t min_candidates = TREE_MIN_CANDIDATES;
    // 0 uses omp_get_max_threads()
    int num_threads = 0;
    // Mid depth checkpoint throttle (completed nodes per write)
    size_t checkpoint_every = CHECKPOINT_EVERY;
    // Stop once this depth is complete, -1 to run to the end
    int stop_after_depth = -1;
    // Empty keeps the tree in memory only
    std::string checkpoint_path;
    // Checked between batches, set from a signal handler
    const volatile std::sig_atomic_t *stop_flag = NULL;
    bool verbose = false;
};

typedef enum build_status {
    BUILD_COMPLETE,
    BUILD_STOPPED
} build_status_t;

/** A node still waiting for its guess */
struct pending_node_t {
    tree_path_t path;
    wordlist_t candidates;
};

/**
 * Groups candidates by the coloring each would produce against guess.
 * Candidate order is preserved inside every group.
*/
std::map<coloring_t, wordlist_t> partition_candidates(const wordlist_t &candidates,
    const word_t &guess);

/**
 * Walks the tree from the root and lists every node still to be computed.
 * A node present in the tree is expanded into its children (unless it sits
 * at max_depth), a reached node missing from the tree is pending, nodes with
 * one candidate or less are leaves, and children with min_candidates
 * candidates or fewer are not visited.
 * @returns pending nodes sorted by (depth, path)
*/
std::vector<pending_node_t> build_pending(const decision_tree_t &tree,
    const wordlist_t &vocabulary, int max_depth, size_t min_candidates);

/**
 * Root node: the whole vocabulary is both guess pool and candidate set.
 * The pool is split into contiguous chunks scored in parallel, and chunk
 * winners are reduced in chunk order.
 * @param stop_flag Polled before every chunk
 * @returns an invalid score if the stop flag was raised before all chunks ran
*/
guess_score_t compute_root(const lexicon_t &lex, int num_threads, bool verbose,
    const volatile std::sig_atomic_t *stop_flag = NULL);

/**
 * Deeper node: exact entropy over the node's own candidates, guess pool
 * restricted to the same candidates.
*/
guess_score_t compute_node(const lexicon_t &lex, const wordlist_t &candidates);

/**
 * Breadth first construction of the path -> guess map for one lexicon.
 * If args.checkpoint_path is set the checkpoint is loaded first (resume) and
 * rewritten after the root, after every checkpoint_every nodes and at the end
 * of every depth.
 * @param tree [out] The tree as far as it got
 * @throws checkpoint_error if the checkpoint cannot be read or written
*/
build_status_t build_tree(const lexicon_t &lex, const tree_args_t &args,
    decision_tree_t &tree);

/**
 * Writes the final tree artifact and removes the checkpoint, marking the
 * configuration as done.
*/
void finalize_tree(const decision_tree_t &tree, const std::string &tree_path,
    const std::string &checkpoint_path, int word_length, prob_mode_t mode);

#endif /* TREE_H */
