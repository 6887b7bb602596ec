/**
 * Header File for the strategy interface, the built in strategies and the
 * registry the tournament draws them from
 * #include "strategy.h"
*/

#ifndef STRATEGY_H
#define STRATEGY_H

#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include "word.h"
#include "game.h"
#include "entropy.h"
#include "checkpoint.h"

#define COVERAGE_SMALL_SET 5
#define COVERAGE_POOL 200

/**
 * Interface every guessing strategy implements.
 *
 * begin_game is called exactly once before the first guess of a game and
 * end_game exactly once after the game reached a terminal state (it is
 * skipped for games that timed out). The config passed to begin_game stays
 * alive until end_game returns.
*/
class Strategy {
public:
    virtual ~Strategy() {}

    /** Human readable strategy name (used in reports) */
    virtual std::string name() const = 0;

    virtual void begin_game(const game_config_t &config) { (void)config; }

    /** Next guess given the (guess, coloring) pairs so far */
    virtual word_t guess(const history_t &history) = 0;

    virtual void end_game(const word_t &secret, bool solved, int num_guesses){
        (void)secret; (void)solved; (void)num_guesses;
    }
};

typedef std::unique_ptr<Strategy> strategy_ptr;
typedef std::function<strategy_ptr()> strategy_factory_t;

/**
 * Always guesses the most probable remaining candidate, alphabetically
 * first among equals (so under uniform mode it is plain alphabetical).
*/
class MaxProbStrategy : public Strategy {
public:
    std::string name() const override { return "MaxProb"; }
    void begin_game(const game_config_t &config) override;
    word_t guess(const history_t &history) override;

private:
    wordlist_t ranked_;
};

/**
 * Guesses a uniformly random remaining candidate.
*/
class RandomStrategy : public Strategy {
public:
    explicit RandomStrategy(uint64_t seed = 0) : rng_(seed) {}
    std::string name() const override { return "Random"; }
    void begin_game(const game_config_t &config) override;
    word_t guess(const history_t &history) override;

private:
    const wordlist_t *vocab_ = NULL;
    std::mt19937_64 rng_;
};

/**
 * EntropyEngine with precomputed trees. Trees are read from
 * <tree_dir>/tree_<L>_<mode>.txt the first time a configuration is played.
*/
class EntropyStrategy : public Strategy {
public:
    explicit EntropyStrategy(const std::string &tree_dir = DEFAULT_TREE_DIR,
        const entropy_args_t &args = entropy_args_t());
    std::string name() const override { return "Entropy"; }
    void begin_game(const game_config_t &config) override;
    word_t guess(const history_t &history) override;

private:
    const decision_tree_t *tree_for(int word_length, prob_mode_t mode);

    std::string tree_dir_;
    entropy_args_t args_;
    std::map<std::pair<int, prob_mode_t>, decision_tree_t> trees_;
    std::unique_ptr<EntropyEngine> engine_;
};

/**
 * Opens with the word covering the most frequent letters, then plays the
 * best weighted entropy guess among the first COVERAGE_POOL candidates.
 * Small candidate sets go straight to the most probable word.
*/
class CoverageStrategy : public Strategy {
public:
    std::string name() const override { return "Coverage"; }
    void begin_game(const game_config_t &config) override;
    word_t guess(const history_t &history) override;

private:
    word_t best_cover_word(const wordlist_t &words) const;
    double weight(const word_t &word) const;

    const game_config_t *config_ = NULL;
};

/**
 * Explicit list of strategies known at compile time. Names are unique;
 * adding a name twice replaces the factory.
*/
class StrategyRegistry {
public:
    void add(const std::string &name, strategy_factory_t factory);
    bool contains(const std::string &name) const;
    std::vector<std::string> names() const;

    /**
     * Build one instance.
     * @throws strategy_load_error if the name is unknown or the factory fails
    */
    strategy_ptr create(const std::string &name) const;

    /**
     * Instantiates every strategy whose name contains filter (all if empty)
     * once. Strategies that fail are reported on err and left out.
     * @returns the names that loaded
    */
    std::vector<std::string> load(const std::string &filter, std::ostream &err) const;

private:
    std::vector<std::pair<std::string, strategy_factory_t>> entries_;
};

/**
 * Registers MaxProb, Random, Entropy and Coverage.
*/
void register_builtin_strategies(StrategyRegistry &registry,
    const std::string &tree_dir = DEFAULT_TREE_DIR);

#endif /* STRATEGY_H */
