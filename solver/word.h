/**
 * Header File for Word Data Structure and Word wise Operations
 * #include "word.h"
*/

#ifndef WORD_H
#define WORD_H

#include <iostream>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>

#define MAXLEN 10 // Longest supported word (3^10 patterns fit in coloring_t)
#define NUMCOLORS 3 // Number of Board Colors
#define PTN_DEFAULT 0

#define GRAY 0
#define YELLOW_HIT 1
#define GREEN_HIT 2

typedef std::string word_t;
typedef std::vector<word_t> wordlist_t;

typedef uint32_t coloring_t;

/** One turn of a game: the guessed word and the board it produced */
typedef std::pair<word_t, coloring_t> turn_t;
typedef std::vector<turn_t> history_t;

/**
 * Obtain the number of coloring patterns for a given word length.
*/
unsigned long get_num_patterns(int wordlen);

/**
 * The all green coloring for a given word length.
*/
coloring_t all_green(int wordlen);

/**
 * Determines if a specific pattern corresponds to a correct guess.
*/
bool is_correct_guess(coloring_t c, int wordlen);

/**
 * Wordle comparison. Greens are claimed first, then yellows are handed out
 * while the guessed letter still has uncredited copies in the secret.
 * @param secret The underlying answer
 * @param guess The query word you would input into the wordle board
 * @returns The coloring of the board. See the documentation below for details.
 * @throws validation_error if the two words differ in length
*/
coloring_t feedback(const word_t &secret, const word_t &guess);

/**
 * Keep the candidates w for which feedback(w, guess) == pattern.
 * Candidate order is preserved.
*/
wordlist_t filter_candidates(const wordlist_t &candidates,
    const word_t &guess, coloring_t pattern);

/**
 * Filter the full vocabulary through every (guess, pattern) pair in order.
*/
wordlist_t filter_history(const wordlist_t &vocabulary, const history_t &history);

/**
 * Value of position i of a coloring (GRAY, YELLOW_HIT or GREEN_HIT).
*/
int pattern_at(coloring_t c, int i);

/**
 * Text form of a coloring, one digit per position: "20100".
*/
std::string pattern_to_string(coloring_t c, int wordlen);

/**
 * Parse the text form produced by pattern_to_string.
 * @throws validation_error on characters other than 0/1/2 or bad length
*/
coloring_t pattern_from_string(const std::string &text);

/**
 * Pack a per position list of colors into a coloring.
*/
coloring_t pattern_from_digits(const std::vector<int> &digits);

/**
 * Lower case copy of a word.
*/
word_t to_lower(const word_t &word);

void word_print(const word_t &word, coloring_t coloring = PTN_DEFAULT,
    char delim = '\n', std::ostream &out = std::cout);

/**
 * Coloring is coded by a base-3 representation of an integer.
 * The right most 3-digit represent the coloring of the 0th letter
 * Digit 0: Represents Grey in Wordle
 * Digit 1: Represents Yellow in Wordle
 * Digit 2: Represents Green in Wrodle
*/


#endif /* WORD_H */
