#include <gtest/gtest.h>
#include <csignal>
#include "tree.h"
#include "checkpoint.h"
#include "errors.h"
#include "entropy.h"
#include "test_helpers.h"

class TreeBuildTest : public ::testing::Test {
protected:
    void SetUp() override {
        lex = test_lexicon(all_words("abcd", 4));
        args.max_depth = 3;
        args.min_candidates = 2;
        args.checkpoint_every = 4;
    }
    lexicon_t lex;
    tree_args_t args;
};

TEST_F(TreeBuildTest, PendingStartsAtRoot){
    std::vector<pending_node_t> pending = build_pending(decision_tree_t(), lex.words,
        args.max_depth, args.min_candidates);
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_TRUE(pending[0].path.empty());
    EXPECT_EQ(pending[0].candidates.size(), lex.words.size());
}

TEST_F(TreeBuildTest, PendingExpandsKnownNodes){
    decision_tree_t tree;
    tree[tree_path_t()] = "abcd";
    std::map<coloring_t, wordlist_t> children = partition_candidates(lex.words, "abcd");
    size_t expected = 0;
    for(const auto &child : children){
        if(child.second.size() > args.min_candidates) expected++;
    }
    std::vector<pending_node_t> pending = build_pending(tree, lex.words,
        args.max_depth, args.min_candidates);
    EXPECT_EQ(pending.size(), expected);
    for(const pending_node_t &node : pending){
        ASSERT_EQ(node.path.size(), 1u);
        EXPECT_EQ(node.candidates, children[node.path[0]]);
    }
}

TEST_F(TreeBuildTest, PartitionCoversEveryCandidate){
    std::map<coloring_t, wordlist_t> children = partition_candidates(lex.words, "aabc");
    size_t total = 0;
    for(const auto &child : children){
        total += child.second.size();
        for(const word_t &w : child.second) EXPECT_EQ(feedback(w, "aabc"), child.first);
    }
    EXPECT_EQ(total, lex.words.size());
}

TEST_F(TreeBuildTest, RootMatchesSerialScan){
    guess_score_t parallel = compute_root(lex, 4, false);
    guess_score_t serial = compute_node(lex, lex.words);
    EXPECT_EQ(parallel.guess, serial.guess);
    EXPECT_DOUBLE_EQ(parallel.entropy, serial.entropy);
}

TEST_F(TreeBuildTest, RootHonoursStopFlag){
    volatile std::sig_atomic_t stop = 1;
    EXPECT_FALSE(compute_root(lex, 4, false, &stop).valid);
    stop = 0;
    guess_score_t root = compute_root(lex, 4, false, &stop);
    EXPECT_TRUE(root.valid);
    EXPECT_EQ(root.guess, compute_node(lex, lex.words).guess);
}

TEST_F(TreeBuildTest, CompleteTreeRespectsBounds){
    decision_tree_t tree;
    EXPECT_EQ(build_tree(lex, args, tree), BUILD_COMPLETE);
    ASSERT_TRUE(tree.count(tree_path_t()));
    for(const auto &node : tree){
        EXPECT_LE(static_cast<int>(node.first.size()), args.max_depth);
        EXPECT_TRUE(lex.contains(node.second));
    }
    EXPECT_TRUE(build_pending(tree, lex.words, args.max_depth, args.min_candidates).empty());
}

TEST_F(TreeBuildTest, ResumeAfterFirstDepthGivesSameTree){
    decision_tree_t uninterrupted;
    args.num_threads = 1;
    ASSERT_EQ(build_tree(lex, args, uninterrupted), BUILD_COMPLETE);

    TempDir dir;
    tree_args_t staged = args;
    staged.num_threads = 3;
    staged.checkpoint_path = checkpoint_filename(dir.path(), 4, MODE_UNIFORM);
    staged.stop_after_depth = 0;
    decision_tree_t first;
    EXPECT_EQ(build_tree(lex, staged, first), BUILD_STOPPED);
    EXPECT_EQ(first.size(), 1u);
    EXPECT_EQ(load_tree(staged.checkpoint_path, 4, MODE_UNIFORM), first);

    // fresh process: everything comes from the checkpoint
    staged.stop_after_depth = -1;
    decision_tree_t resumed;
    EXPECT_EQ(build_tree(lex, staged, resumed), BUILD_COMPLETE);
    EXPECT_EQ(resumed, uninterrupted);
    EXPECT_EQ(load_tree(staged.checkpoint_path, 4, MODE_UNIFORM), uninterrupted);

    std::string tree_file = tree_filename(dir.path(), 4, MODE_UNIFORM);
    finalize_tree(resumed, tree_file, staged.checkpoint_path, 4, MODE_UNIFORM);
    EXPECT_FALSE(file_exists(staged.checkpoint_path));
    EXPECT_EQ(load_tree(tree_file, 4, MODE_UNIFORM), uninterrupted);
}

TEST_F(TreeBuildTest, StopFlagKeepsCheckpoint){
    TempDir dir;
    volatile std::sig_atomic_t stop = 1;
    args.stop_flag = &stop;
    args.checkpoint_path = dir.file("checkpoint.txt");
    decision_tree_t tree;
    EXPECT_EQ(build_tree(lex, args, tree), BUILD_STOPPED);
    EXPECT_TRUE(tree.empty());

    stop = 0;
    EXPECT_EQ(build_tree(lex, args, tree), BUILD_COMPLETE);
    EXPECT_FALSE(tree.empty());
}

TEST_F(TreeBuildTest, CheckpointForAnotherModeIsFatal){
    TempDir dir;
    args.checkpoint_path = dir.file("checkpoint.txt");
    decision_tree_t other;
    other[tree_path_t()] = "abcd";
    save_tree(other, args.checkpoint_path, 4, MODE_FREQUENCY);
    decision_tree_t tree;
    EXPECT_THROW(build_tree(lex, args, tree), checkpoint_error);
}

TEST(TreeBuild, RootAgreesWithLiveEngineOnSmallVocabulary){
    // 27 words fit in the live caps, so the engine scores exactly like the builder
    lexicon_t small = test_lexicon(all_words("abc", 3));
    tree_args_t args;
    args.max_depth = 0;
    decision_tree_t tree;
    ASSERT_EQ(build_tree(small, args, tree), BUILD_COMPLETE);
    ASSERT_EQ(tree.size(), 1u);
    EntropyEngine engine(small);
    EXPECT_EQ(engine.next_guess(history_t()), tree[tree_path_t()]);
}
