#include <gtest/gtest.h>
#include <algorithm>
#include "word.h"
#include "errors.h"
#include "test_helpers.h"

TEST(Feedback, SelfGuessIsAllGreen){
    for(const word_t &w : all_words("abc", 4)){
        EXPECT_EQ(feedback(w, w), all_green(4)) << w;
        EXPECT_TRUE(is_correct_guess(feedback(w, w), 4));
    }
    EXPECT_EQ(feedback("arbol", "arbol"), all_green(5));
}

TEST(Feedback, GreensClaimedBeforeYellows){
    EXPECT_EQ(feedback("aabb", "abab"), pattern_from_digits({2, 1, 1, 2}));
    EXPECT_EQ(pattern_to_string(feedback("aabb", "abab"), 4), "2112");
}

TEST(Feedback, RotationIsAllYellow){
    EXPECT_EQ(feedback("abcde", "eabcd"), pattern_from_string("11111"));
}

TEST(Feedback, RepeatedLetterNotDoubleCredited){
    // one 'a' in the secret: only the first unmatched 'a' of the guess is yellow
    EXPECT_EQ(pattern_to_string(feedback("bcad", "aaxx"), 4), "1000");
    // the green 'a' consumes the only 'a'
    EXPECT_EQ(pattern_to_string(feedback("abcd", "aaaa"), 4), "2000");
    EXPECT_EQ(pattern_to_string(feedback("abcd", "aabb"), 4), "2010");
}

TEST(Feedback, LengthMismatchThrows){
    EXPECT_THROW(feedback("abcd", "abc"), validation_error);
    EXPECT_THROW(feedback("abc", "abcd"), validation_error);
}

TEST(Feedback, PatternLengthMatchesSecret){
    coloring_t c = feedback("casas", "sacos");
    EXPECT_LT(c, get_num_patterns(5));
    EXPECT_EQ(pattern_to_string(c, 5).size(), 5u);
    EXPECT_EQ(pattern_at(c, 1), GREEN_HIT);
}

TEST(Pattern, TextForm){
    EXPECT_EQ(pattern_from_string("20100"), pattern_from_digits({2, 0, 1, 0, 0}));
    EXPECT_EQ(pattern_to_string(pattern_from_string("0212"), 4), "0212");
    EXPECT_THROW(pattern_from_string("0130"), validation_error);
    EXPECT_THROW(pattern_from_string(""), validation_error);
}

TEST(Filter, KeepsConsistentWordsInOrder){
    wordlist_t vocab = {"aabb", "abab", "abcd", "dcba"};
    EXPECT_EQ(filter_candidates(vocab, "aabb", pattern_from_digits({2, 0, 1, 0})),
        wordlist_t({"abcd"}));
    EXPECT_TRUE(filter_candidates(vocab, "aabb", pattern_from_string("1111")).empty());
}

TEST(Filter, Idempotent){
    wordlist_t vocab = all_words("abcd", 4);
    for(const word_t &guess : {word_t("abcd"), word_t("aabb"), word_t("dddd")}){
        for(const word_t &secret : {word_t("badc"), word_t("cccc"), word_t("abab")}){
            coloring_t p = feedback(secret, guess);
            wordlist_t once = filter_candidates(vocab, guess, p);
            EXPECT_EQ(filter_candidates(once, guess, p), once);
            EXPECT_NE(std::find(once.begin(), once.end(), secret), once.end());
        }
    }
}

TEST(Filter, HistoryAppliesEveryTurn){
    wordlist_t vocab = all_words("abc", 3);
    history_t history;
    history.emplace_back("abc", feedback("cab", "abc"));
    history.emplace_back("aaa", feedback("cab", "aaa"));
    wordlist_t left = filter_history(vocab, history);
    wordlist_t manual = filter_candidates(filter_candidates(vocab, "abc", history[0].second),
        "aaa", history[1].second);
    EXPECT_EQ(left, manual);
    EXPECT_NE(std::find(left.begin(), left.end(), "cab"), left.end());
}

TEST(Word, ToLower){
    EXPECT_EQ(to_lower("HoLa"), "hola");
}
