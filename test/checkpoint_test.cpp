#include <gtest/gtest.h>
#include <dirent.h>
#include "checkpoint.h"
#include "errors.h"
#include "test_helpers.h"

static std::vector<std::string> list_dir(const std::string &path){
    std::vector<std::string> out;
    DIR *dir = opendir(path.c_str());
    if(dir == NULL) return out;
    while(struct dirent *entry = readdir(dir)){
        std::string name = entry->d_name;
        if(name != "." && name != "..") out.push_back(name);
    }
    closedir(dir);
    return out;
}

static decision_tree_t sample_tree(){
    decision_tree_t tree;
    tree[tree_path_t()] = "abcd";
    tree[tree_path_t{pattern_from_string("2010")}] = "abdc";
    tree[tree_path_t{pattern_from_string("2010"), pattern_from_string("0000")}] = "dcba";
    return tree;
}

TEST(TreePath, TextForm){
    tree_path_t path = {pattern_from_string("2010"), pattern_from_string("0001")};
    EXPECT_EQ(path_to_string(path, 4), "2010,0001");
    EXPECT_EQ(path_from_string("2010,0001"), path);
    EXPECT_EQ(path_to_string(tree_path_t(), 4), "-");
    EXPECT_TRUE(path_from_string("-").empty());
    EXPECT_THROW(path_from_string("20x0"), validation_error);
}

TEST(Checkpoint, Filenames){
    EXPECT_EQ(tree_filename("data/trees", 5, MODE_FREQUENCY), "data/trees/tree_5_frequency.txt");
    EXPECT_EQ(checkpoint_filename("t", 4, MODE_UNIFORM), "t/checkpoint_4_uniform.txt");
}

TEST(Checkpoint, MissingFileLoadsEmpty){
    TempDir dir;
    EXPECT_TRUE(load_tree(dir.file("nothing.txt"), 4, MODE_UNIFORM).empty());
}

TEST(Checkpoint, SaveThenLoad){
    TempDir dir;
    std::string file = dir.file("sub/checkpoint_4_uniform.txt");
    save_tree(sample_tree(), file, 4, MODE_UNIFORM);
    EXPECT_EQ(load_tree(file, 4, MODE_UNIFORM), sample_tree());

    // replace in place, no temporary files left behind
    decision_tree_t smaller;
    smaller[tree_path_t()] = "aaaa";
    save_tree(smaller, file, 4, MODE_UNIFORM);
    EXPECT_EQ(load_tree(file, 4, MODE_UNIFORM), smaller);
    EXPECT_EQ(list_dir(dir.file("sub")), std::vector<std::string>({"checkpoint_4_uniform.txt"}));
}

TEST(Checkpoint, OtherConfigurationIsRejected){
    TempDir dir;
    std::string file = dir.file("tree.txt");
    save_tree(sample_tree(), file, 4, MODE_UNIFORM);
    EXPECT_THROW(load_tree(file, 4, MODE_FREQUENCY), checkpoint_error);
    EXPECT_THROW(load_tree(file, 5, MODE_UNIFORM), checkpoint_error);
}

TEST(Checkpoint, CorruptionIsFatal){
    TempDir dir;
    dir.write("garbage.txt", "not a tree\n");
    EXPECT_THROW(load_tree(dir.file("garbage.txt"), 4, MODE_UNIFORM), checkpoint_error);

    dir.write("bad_path.txt", "wordle-tree 4 uniform 1\n2x10 abcd\n");
    EXPECT_THROW(load_tree(dir.file("bad_path.txt"), 4, MODE_UNIFORM), checkpoint_error);

    dir.write("short_pattern.txt", "wordle-tree 4 uniform 2\n- abcd\n2 abdc\n");
    EXPECT_THROW(load_tree(dir.file("short_pattern.txt"), 4, MODE_UNIFORM), checkpoint_error);

    dir.write("long_pattern.txt", "wordle-tree 4 uniform 2\n- abcd\n2010,00000 abdc\n");
    EXPECT_THROW(load_tree(dir.file("long_pattern.txt"), 4, MODE_UNIFORM), checkpoint_error);

    dir.write("bad_guess.txt", "wordle-tree 4 uniform 1\n- abc\n");
    EXPECT_THROW(load_tree(dir.file("bad_guess.txt"), 4, MODE_UNIFORM), checkpoint_error);

    // a truncated file lost nodes
    dir.write("short.txt", "wordle-tree 4 uniform 3\n- abcd\n2010 abdc\n");
    EXPECT_THROW(load_tree(dir.file("short.txt"), 4, MODE_UNIFORM), checkpoint_error);

    dir.write("empty.txt", "");
    EXPECT_THROW(load_tree(dir.file("empty.txt"), 4, MODE_UNIFORM), checkpoint_error);
}
