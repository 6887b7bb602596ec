/**
 * Header File for entropy based guess selection
 * #include "entropy.h"
*/

#ifndef ENTROPY_H
#define ENTROPY_H

#include <random>
#include <unordered_set>
#include <cstdint>
#include "word.h"
#include "utils.h"
#include "mathutils.h"
#include "checkpoint.h"

#define MAX_GUESS_POOL 200      // max guesses evaluated per live turn
#define MAX_EVAL_CANDIDATES 500 // max candidates entropy is measured against
#define ENTROPY_SEED 42

/**
 * Result of scoring one guess (or the winner of a range of guesses).
*/
struct guess_score_t {
    word_t guess;
    double entropy = -1.0;
    bool is_candidate = false;
    bool valid = false;
};

/**
 * The selection rule shared by the live engine and the tree builder:
 * higher entropy wins, and on an exactly equal entropy a guess that is
 * itself a surviving candidate beats one that is not. Earlier entries win
 * any remaining tie, so scanning in order is deterministic.
 * @returns true if challenger should replace best
*/
bool better_guess(const guess_score_t &challenger, const guess_score_t &best);

/**
 * Shannon entropy of the feedback partition a guess induces on the
 * evaluation set, each candidate weighted by its probability.
 * @param weights weights[i] belongs to eval[i], need not sum to 1
*/
double guess_entropy(const word_t &guess, const wordlist_t &eval,
    const priors_t &weights, pattern_scratch_t &scratch);

/**
 * Scores pool[begin, end) against the evaluation set and returns the winner
 * under better_guess. Returns an invalid score for an empty range.
*/
guess_score_t best_guess_in_range(const wordlist_t &pool, size_t begin, size_t end,
    const wordlist_t &eval, const priors_t &weights,
    const std::unordered_set<word_t> &candidate_set, pattern_scratch_t &scratch);

/**
 * Probabilities of words, looked up in the lexicon.
*/
priors_t weights_of(const lexicon_t &lex, const wordlist_t &words);

struct entropy_args_t {
    size_t max_guess_pool = MAX_GUESS_POOL;
    size_t max_eval_candidates = MAX_EVAL_CANDIDATES;
    uint64_t seed = ENTROPY_SEED;
};

/**
 * Greedy one step lookahead: picks the guess that maximizes the expected
 * information of the next board. Work per turn is bounded by the pool and
 * evaluation caps regardless of vocabulary size.
 *
 * The lexicon and the optional tree are borrowed and must outlive the engine.
*/
class EntropyEngine {
public:
    EntropyEngine(const lexicon_t &lex, const entropy_args_t &args = entropy_args_t(),
        const decision_tree_t *tree = NULL);

    /**
     * Next guess for a game with the given history.
     * A tree entry for the exact pattern path is returned directly.
    */
    word_t next_guess(const history_t &history);

    /** Whether the last next_guess() was answered by the tree */
    bool last_from_tree() const { return last_from_tree_; }
    /** Entropy of the last live pick, -1 for tree hits and trivial picks */
    double last_entropy() const { return last_entropy_; }

private:
    wordlist_t sample(const wordlist_t &words, size_t cap);

    const lexicon_t *lex_;
    entropy_args_t args_;
    const decision_tree_t *tree_;
    std::mt19937_64 rng_;
    pattern_scratch_t scratch_;
    bool last_from_tree_;
    double last_entropy_;
};

#endif /* ENTROPY_H */
