/**
 * Header File for decision tree storage: path keys and the atomic
 * checkpoint / tree file format
 * #include "checkpoint.h"
*/

#ifndef CHECKPOINT_H
#define CHECKPOINT_H

#include <map>
#include <string>
#include <vector>
#include "word.h"
#include "utils.h"

/**
 * Sequence of colorings seen so far in a game. The empty path is the root.
*/
typedef std::vector<coloring_t> tree_path_t;

/**
 * path -> guess to play at that node
*/
typedef std::map<tree_path_t, word_t> decision_tree_t;

#define TREE_MAGIC "wordle-tree"
#define DEFAULT_TREE_DIR "data/trees"

/**
 * "-" for the root, otherwise comma separated pattern strings "20100,00211".
*/
std::string path_to_string(const tree_path_t &path, int wordlen);

/**
 * Inverse of path_to_string.
 * @throws validation_error on malformed text
*/
tree_path_t path_from_string(const std::string &text);

/**
 * <dir>/tree_<L>_<mode>.txt
*/
std::string tree_filename(const std::string &dir, int word_length, prob_mode_t mode);

/**
 * <dir>/checkpoint_<L>_<mode>.txt
*/
std::string checkpoint_filename(const std::string &dir, int word_length, prob_mode_t mode);

bool file_exists(const std::string &filename);

/**
 * Creates a directory and its parents (mkdir -p).
 * @throws std::runtime_error if a component cannot be created
*/
void make_dirs(const std::string &dir);

/**
 * File Formatting:
 * <Header> - wordle-tree <word length> <mode> <node count>
 * <Content> - one "<path> <guess>" line per node
 *
 * Load-if-exists-else-empty.
 * @throws checkpoint_error if the file exists but is malformed or belongs to
 *         another (word length, mode) configuration
*/
decision_tree_t load_tree(const std::string &filename, int word_length,
    prob_mode_t mode);

/**
 * Atomic full replace: the map is written to a temporary file in the same
 * directory, flushed to disk and renamed over filename. Readers only ever see
 * the previous complete file or the new complete file.
 * @throws checkpoint_error if the temporary file cannot be written or renamed
*/
void save_tree(const decision_tree_t &tree, const std::string &filename,
    int word_length, prob_mode_t mode);

#endif /* CHECKPOINT_H */
