#include "checkpoint.h"
#include "errors.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

std::string path_to_string(const tree_path_t &path, int wordlen){
    if(path.empty()) return "-";
    std::string out;
    for(size_t i = 0; i < path.size(); i++){
        if(i > 0) out += ',';
        out += pattern_to_string(path[i], wordlen);
    }
    return out;
}

tree_path_t path_from_string(const std::string &text){
    tree_path_t out;
    if(text == "-") return out;
    std::stringstream ss(text);
    std::string item;
    while(getline(ss, item, ',')){
        out.push_back(pattern_from_string(item));
    }
    if(out.empty())
        throw validation_error("empty tree path");
    return out;
}

std::string tree_filename(const std::string &dir, int word_length, prob_mode_t mode){
    return dir + "/tree_" + std::to_string(word_length) + "_" + mode_name(mode) + ".txt";
}

std::string checkpoint_filename(const std::string &dir, int word_length, prob_mode_t mode){
    return dir + "/checkpoint_" + std::to_string(word_length) + "_" + mode_name(mode) + ".txt";
}

bool file_exists(const std::string &filename){
    struct stat st;
    return stat(filename.c_str(), &st) == 0;
}

void make_dirs(const std::string &dir){
    if(dir.empty()) return;
    std::string partial;
    std::stringstream ss(dir);
    std::string item;
    if(dir[0] == '/') partial = "/";
    while(getline(ss, item, '/')){
        if(item.empty()) continue;
        partial += item;
        if(mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST){
            throw std::runtime_error("Unable to create directory " + partial
                + ": " + std::strerror(errno));
        }
        partial += "/";
    }
}

static std::string parent_dir(const std::string &filename){
    size_t slash = filename.find_last_of('/');
    if(slash == std::string::npos) return ".";
    if(slash == 0) return "/";
    return filename.substr(0, slash);
}

decision_tree_t load_tree(const std::string &filename, int word_length,
    prob_mode_t mode){
    decision_tree_t tree;
    if(!file_exists(filename)) return tree;

    std::ifstream file(filename);
    if(!file.is_open())
        throw checkpoint_error("Unable to open file: " + filename);

    std::string line;
    if(!getline(file, line))
        throw checkpoint_error("Corrupt tree file " + filename + " [Err: Missing Header]");
    std::stringstream header(line);
    std::string magic, mode_text;
    int file_length = 0;
    unsigned long count = 0;
    if(!(header >> magic >> file_length >> mode_text >> count) || magic != TREE_MAGIC)
        throw checkpoint_error("Corrupt tree file " + filename + " [Err: Header]");
    if(file_length != word_length || mode_text != mode_name(mode)){
        throw checkpoint_error("Tree file " + filename + " belongs to "
            + std::to_string(file_length) + "-letter " + mode_text);
    }

    unsigned long line_no = 1;
    while(getline(file, line)){
        line_no++;
        if(line.empty()) continue;
        std::stringstream row(line);
        std::string path_text, guess;
        if(!(row >> path_text >> guess)){
            throw checkpoint_error("Corrupt tree file " + filename + " line "
                + std::to_string(line_no));
        }
        if(path_text != "-"){
            std::stringstream parts(path_text);
            std::string part;
            while(getline(parts, part, ',')){
                if(static_cast<int>(part.size()) != word_length){
                    throw checkpoint_error("Corrupt tree file " + filename + " line "
                        + std::to_string(line_no) + ": pattern '" + part + "'");
                }
            }
        }
        tree_path_t path;
        try{
            path = path_from_string(path_text);
        }
        catch(const validation_error &e){
            throw checkpoint_error("Corrupt tree file " + filename + " line "
                + std::to_string(line_no) + ": " + e.what());
        }
        if(static_cast<int>(guess.size()) != word_length){
            throw checkpoint_error("Corrupt tree file " + filename + " line "
                + std::to_string(line_no) + ": guess '" + guess + "'");
        }
        tree[path] = guess;
    }
    if(tree.size() != count){
        throw checkpoint_error("Corrupt tree file " + filename + ": header says "
            + std::to_string(count) + " nodes, found " + std::to_string(tree.size()));
    }
    return tree;
}

void save_tree(const decision_tree_t &tree, const std::string &filename,
    int word_length, prob_mode_t mode){
    std::string dir = parent_dir(filename);
    make_dirs(dir);

    std::string tmp_name = filename + ".XXXXXX";
    std::vector<char> tmp_buf(tmp_name.begin(), tmp_name.end());
    tmp_buf.push_back('\0');
    int fd = mkstemp(tmp_buf.data());
    if(fd < 0){
        throw checkpoint_error("Unable to create temporary file for " + filename
            + ": " + std::strerror(errno));
    }
    std::string tmp(tmp_buf.data());
    // mkstemp creates 0600
    if(fchmod(fd, 0644) != 0){
        int err = errno;
        close(fd);
        unlink(tmp.c_str());
        throw checkpoint_error("Unable to set mode on " + tmp + ": " + std::strerror(err));
    }

    FILE *out = fdopen(fd, "w");
    if(out == NULL){
        close(fd);
        unlink(tmp.c_str());
        throw checkpoint_error("Unable to write " + tmp);
    }
    bool ok = fprintf(out, "%s %d %s %lu\n", TREE_MAGIC, word_length,
        mode_name(mode), static_cast<unsigned long>(tree.size())) > 0;
    for(auto it = tree.begin(); ok && it != tree.end(); ++it){
        ok = fprintf(out, "%s %s\n", path_to_string(it->first, word_length).c_str(),
            it->second.c_str()) > 0;
    }
    ok = ok && fflush(out) == 0 && fsync(fileno(out)) == 0;
    if(fclose(out) != 0) ok = false;
    if(!ok){
        unlink(tmp.c_str());
        throw checkpoint_error("Unable to write " + tmp + ": " + std::strerror(errno));
    }
    if(rename(tmp.c_str(), filename.c_str()) != 0){
        int err = errno;
        unlink(tmp.c_str());
        throw checkpoint_error("Unable to replace " + filename + ": " + std::strerror(err));
    }
}
