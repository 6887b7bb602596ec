/**
 * Header File for the exception types shared by the solver components
 * #include "errors.h"
*/

#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

/**
 * Bad input to a single call: wrong word length, a word outside the
 * vocabulary when guesses are restricted, a secret that is not a word.
*/
class validation_error : public std::invalid_argument {
public:
    explicit validation_error(const std::string &what)
        : std::invalid_argument(what) {}
};

/**
 * Call made in the wrong game state (guessing before reset, guessing after
 * the game ended, reading the secret mid game).
*/
class state_error : public std::logic_error {
public:
    explicit state_error(const std::string &what)
        : std::logic_error(what) {}
};

/**
 * Unreadable or inconsistent checkpoint / tree file. Fatal to a precompute run.
*/
class checkpoint_error : public std::runtime_error {
public:
    explicit checkpoint_error(const std::string &what)
        : std::runtime_error(what) {}
};

/**
 * A strategy could not be constructed. The tournament skips it.
*/
class strategy_load_error : public std::runtime_error {
public:
    explicit strategy_load_error(const std::string &what)
        : std::runtime_error(what) {}
};

#endif /* ERRORS_H */
