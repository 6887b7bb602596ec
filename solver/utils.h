/**
 * Header File for I/O Functions and the vocabulary / probability model
 * #include "utils.h"
*/

#ifndef UTILS_H
#define UTILS_H

#include <vector>
#include <string>
#include <unordered_map>
#include <cstdint>
#include <chrono>
#include "word.h"

// Macros for Timing Measurements
#define timestamp std::chrono::steady_clock::now()
#define TIME(start, end) std::chrono::duration_cast<std::chrono::duration<double>>(end - start).count()

// The prior probabilities associated with the list of words
typedef std::vector<double> priors_t;

// Raw corpus counts, parallel to a word list
typedef std::vector<long long> counts_t;

#define DEFAULT_DATA_DIR "data"
#define PROB_TOLERANCE 1e-6
#define SIGMOID_STEEPNESS 1.5
#define MIN_PERTURBED_PROB 1e-12

typedef enum prob_mode {
    MODE_UNIFORM,
    MODE_FREQUENCY
} prob_mode_t;

/**
 * A vocabulary with its probability distribution.
 * words is sorted and duplicate free, probs[i] belongs to words[i].
*/
struct lexicon_t {
    int word_length = 0;
    wordlist_t words;
    priors_t probs;
    prob_mode_t mode = MODE_UNIFORM;
    std::unordered_map<word_t, size_t> index;

    /** Rebuild the word -> position lookup after words changed. */
    void build_index();
    bool contains(const word_t &word) const;
    /** Probability of a word, 0 for words outside the vocabulary. */
    double prob(const word_t &word) const;
};

const char *mode_name(prob_mode_t mode);

/**
 * @throws validation_error for anything but "uniform" / "frequency"
*/
prob_mode_t parse_mode(const std::string &name);


/**
 * Folds UTF-8 Latin-1 accented letters to their base letter ("Árbol" ->
 * "arbol", "ñ" -> "n") and drops combining diacritical marks. Other bytes
 * are kept as they are.
*/
std::string strip_accents(const std::string &text);

/**
 * Loads a word list. Two formats are understood:
 *   <name>.csv  - header "word,count", one word and corpus count per row
 *   otherwise   - one word per line, every count is 1
 * Words are lower cased and accent stripped, anything that is not [a-z]{word_length} or has a
 * non positive count is dropped, duplicates keep their first occurrence,
 * and the result is sorted.
 * @throws std::runtime_error if the file cannot be opened or has no words
*/
void read_words_from_file(const std::string &input_filename, int word_length,
    wordlist_t &words, counts_t &counts);

/**
 * Word list for one length inside a data directory:
 * <dir>/words_<L>.csv if present, else <dir>/words_<L>.txt
 * @throws std::runtime_error if neither exists
*/
std::string words_filename(const std::string &data_dir, int word_length);

/**
 * Build a lexicon from words and counts under the requested mode.
*/
lexicon_t make_lexicon(const wordlist_t &words, const counts_t &counts,
    int word_length, prob_mode_t mode);

/**
 * read_words_from_file + make_lexicon.
*/
lexicon_t load_lexicon(const std::string &input_filename, int word_length,
    prob_mode_t mode);

/**
 * Generate a uniform prior: every word gets 1/size.
*/
priors_t generate_uniform_priors(unsigned long size);

/**
 * Sigmoid of the centred log count, normalized to sum 1.
 * w_i = sigmoid(steepness * (log(c_i + 1) - mean_j log(c_j + 1)))
*/
priors_t sigmoid_weights(const counts_t &counts,
    double steepness = SIGMOID_STEEPNESS);

/**
 * Multiply every probability by (1 + e_i), e_i ~ U(-noise_scale, noise_scale),
 * clamp at MIN_PERTURBED_PROB and renormalize.
 * @param seed Seeds the generator, equal seeds give equal results
*/
priors_t perturb_probabilities(const priors_t &probs, double noise_scale,
    uint64_t seed);

/**
 * Sum of a prior vector.
*/
double prior_sum(const priors_t &priors);

/**
 * Checks the lexicon invariants the core relies on: every word has the
 * configured length, no duplicates, one probability per word and a total
 * probability of 1 within PROB_TOLERANCE.
 * @throws validation_error naming the first violation
*/
void validate_lexicon(const lexicon_t &lex);

#endif /* UTILS_H */
