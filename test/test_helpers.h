/**
 * Shared fixtures for the unit tests
 * #include "test_helpers.h"
*/

#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#include <ftw.h>
#include <unistd.h>
#include "word.h"
#include "utils.h"

/**
 * Uniform (or count weighted) lexicon over words, which must already be
 * sorted and duplicate free.
*/
inline lexicon_t test_lexicon(const wordlist_t &words, prob_mode_t mode = MODE_UNIFORM,
    const counts_t &counts = counts_t()){
    counts_t c = counts.empty() ? counts_t(words.size(), 1) : counts;
    return make_lexicon(words, c, static_cast<int>(words.front().size()), mode);
}

/**
 * Every word of the given length over a small alphabet, in sorted order.
*/
inline wordlist_t all_words(const std::string &alphabet, int length){
    wordlist_t out(1, word_t());
    for(int i = 0; i < length; i++){
        wordlist_t next;
        for(const word_t &prefix : out){
            for(char ch : alphabet) next.push_back(prefix + ch);
        }
        out = next;
    }
    return out;
}

/**
 * A fresh directory under /tmp, removed with its files when the fixture dies.
*/
class TempDir {
public:
    TempDir(){
        char tmpl[] = "/tmp/wordle_test_XXXXXX";
        char *dir = mkdtemp(tmpl);
        path_ = dir ? dir : "";
    }
    ~TempDir(){
        if(!path_.empty()) nftw(path_.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
    }
    const std::string &path() const { return path_; }
    std::string file(const std::string &name) const { return path_ + "/" + name; }

    void write(const std::string &name, const std::string &content) const {
        std::ofstream out(file(name));
        out << content;
    }

private:
    static int remove_entry(const char *path, const struct stat *st, int flag, struct FTW *ftw){
        (void)st; (void)flag; (void)ftw;
        return remove(path);
    }

    std::string path_;
};

#endif /* TEST_HELPERS_H */
