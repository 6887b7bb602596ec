#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include "strategy.h"
#include "checkpoint.h"
#include "errors.h"
#include "test_helpers.h"

static game_config_t small_config(prob_mode_t mode = MODE_UNIFORM){
    game_config_t config;
    config.lexicon = test_lexicon({"aabb", "abab", "abcd", "dcba"}, mode, {1, 5, 2, 9});
    config.max_guesses = 6;
    return config;
}

/**
 * Plays one game to the end and returns its history
*/
static history_t play(Strategy &strategy, const game_config_t &config, const word_t &secret){
    GameSession session(config);
    session.reset(secret);
    strategy.begin_game(config);
    while(!session.game_over()) session.guess(strategy.guess(session.history()));
    strategy.end_game(session.secret(), session.is_solved(), session.num_guesses());
    EXPECT_TRUE(session.is_solved()) << strategy.name() << " on " << secret;
    return session.history();
}

TEST(MaxProb, EndToEndScenario){
    game_config_t config = small_config();
    MaxProbStrategy strategy;
    history_t history = play(strategy, config, "abcd");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].first, "aabb");
    EXPECT_EQ(history[0].second, pattern_from_digits({2, 0, 1, 0}));
    EXPECT_EQ(filter_candidates(config.vocabulary(), "aabb", history[0].second),
        wordlist_t({"abcd"}));
    EXPECT_EQ(history[1].first, "abcd");
}

TEST(MaxProb, FrequencyModeOpensWithMostProbable){
    game_config_t config = small_config(MODE_FREQUENCY);
    MaxProbStrategy strategy;
    strategy.begin_game(config);
    EXPECT_EQ(strategy.guess(history_t()), "dcba");
}

TEST(RandomStrategy, OnlyGuessesCandidates){
    game_config_t config = small_config();
    RandomStrategy strategy(3);
    for(const word_t &secret : config.vocabulary()){
        history_t history = play(strategy, config, secret);
        for(size_t i = 1; i < history.size(); i++){
            history_t before(history.begin(), history.begin() + i);
            wordlist_t left = filter_history(config.vocabulary(), before);
            EXPECT_NE(std::find(left.begin(), left.end(), history[i].first), left.end());
        }
    }
}

TEST(Coverage, SolvesSmallVocabulary){
    game_config_t config;
    config.lexicon = test_lexicon(all_words("abc", 3));
    CoverageStrategy strategy;
    for(const word_t &secret : {word_t("abc"), word_t("ccc"), word_t("bab")}){
        play(strategy, config, secret);
    }
    EXPECT_THROW(CoverageStrategy().guess(history_t()), state_error);
}

TEST(EntropyStrategy, UsesTreeFromDirectory){
    TempDir dir;
    game_config_t config = small_config();
    decision_tree_t tree;
    tree[tree_path_t()] = "dcba";
    save_tree(tree, tree_filename(dir.path(), 4, MODE_UNIFORM), 4, MODE_UNIFORM);

    EntropyStrategy strategy(dir.path());
    history_t history = play(strategy, config, "abcd");
    EXPECT_EQ(history[0].first, "dcba");
}

TEST(EntropyStrategy, BrokenTreeIsIgnored){
    TempDir dir;
    dir.write("tree_4_uniform.txt", "garbage\n");
    game_config_t config = small_config();
    EntropyStrategy strategy(dir.path());
    for(const word_t &secret : config.vocabulary()) play(strategy, config, secret);
}

TEST(EntropyStrategy, GuessBeforeBeginGame){
    EntropyStrategy strategy("/nonexistent");
    EXPECT_THROW(strategy.guess(history_t()), state_error);
}

TEST(Registry, BuiltinsAreRegistered){
    StrategyRegistry registry;
    register_builtin_strategies(registry, "/nonexistent");
    EXPECT_EQ(registry.names(), std::vector<std::string>({"MaxProb", "Random", "Entropy", "Coverage"}));
    EXPECT_TRUE(registry.contains("Entropy"));
    EXPECT_EQ(registry.create("Coverage")->name(), "Coverage");
    EXPECT_THROW(registry.create("Oracle"), strategy_load_error);
}

TEST(Registry, FailingStrategyIsSkippedWithDiagnostic){
    StrategyRegistry registry;
    register_builtin_strategies(registry, "/nonexistent");
    registry.add("Broken", []() -> strategy_ptr { throw std::runtime_error("missing model file"); });
    registry.add("Null", []() { return strategy_ptr(); });
    std::ostringstream err;
    std::vector<std::string> loaded = registry.load("", err);
    EXPECT_EQ(loaded, std::vector<std::string>({"MaxProb", "Random", "Entropy", "Coverage"}));
    EXPECT_NE(err.str().find("missing model file"), std::string::npos);
    EXPECT_NE(err.str().find("Null"), std::string::npos);
}

TEST(Registry, FilterBySubstring){
    StrategyRegistry registry;
    register_builtin_strategies(registry, "/nonexistent");
    std::ostringstream err;
    EXPECT_EQ(registry.load("Prob", err), std::vector<std::string>({"MaxProb"}));
    EXPECT_TRUE(registry.load("nobody", err).empty());
    EXPECT_TRUE(err.str().empty());
}
