/**
 * Header File for a single Wordle game (configuration and session state)
 * #include "game.h"
*/

#ifndef GAME_H
#define GAME_H

#include <random>
#include <cstdint>
#include <string>
#include "word.h"
#include "utils.h"

#define MAX_GUESSES 6

/**
 * Everything a strategy is told at the start of a game.
 * word_length, vocabulary, mode and probabilities all come from lexicon.
*/
struct game_config_t {
    lexicon_t lexicon;
    int max_guesses = MAX_GUESSES;
    bool allow_non_words = true;

    int word_length() const { return lexicon.word_length; }
    const wordlist_t &vocabulary() const { return lexicon.words; }
    prob_mode_t mode() const { return lexicon.mode; }
};

/**
 * Outcome of one game played by one strategy
*/
struct game_result_t {
    std::string strategy;
    word_t secret;
    int num_guesses = 0;
    bool solved = false;
    bool timed_out = false;
};

typedef enum game_state {
    GAME_NOT_STARTED,
    GAME_ACTIVE,
    GAME_SOLVED,
    GAME_EXHAUSTED
} game_state_t;

const char *state_name(game_state_t state);

/**
 * One game: NotStarted -> Active -> {Solved, Exhausted}.
 * The session keeps a pointer to the configuration, which must outlive it.
*/
class GameSession {
public:
    explicit GameSession(const game_config_t &config, uint64_t seed = 0);

    /**
     * Start a new game.
     * @param secret Must be a vocabulary word. Empty draws one uniformly.
     * @throws validation_error if secret is not in the vocabulary
    */
    void reset(const word_t &secret = word_t());

    /**
     * Submit a guess and receive feedback.
     * @throws state_error if the game is not active
     * @throws validation_error on a wrong length, or a non word while
     *         allow_non_words is off
    */
    coloring_t guess(const word_t &word);

    /**
     * The secret, only once the game reached a terminal state.
     * @throws state_error otherwise
    */
    const word_t &secret() const;

    const history_t &history() const { return history_; }
    game_state_t state() const { return state_; }
    bool is_solved() const { return state_ == GAME_SOLVED; }
    bool game_over() const {
        return state_ == GAME_SOLVED || state_ == GAME_EXHAUSTED;
    }
    int num_guesses() const { return static_cast<int>(history_.size()); }
    int remaining_guesses() const;

private:
    const game_config_t *config_;
    std::mt19937_64 rng_;
    word_t secret_;
    history_t history_;
    game_state_t state_;
};

#endif /* GAME_H */
