#include "word.h"
#include "utils.h"
#include "checkpoint.h"
#include "tree.h"
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>
#include <omp.h>

// Raised by SIGINT / SIGTERM, polled by the builder between batches
static volatile std::sig_atomic_t stop_requested = 0;

static void stop_handler(int signal){
    (void)signal;
    stop_requested = 1;
}

void usage(char *exec_name){
    std::cout << "Usage:\n" << exec_name << " [-d <data dir> -o <tree dir> -l <lengths> -m <modes> -x <max depth> -c <min candidates> -n <thread count> -k <checkpoint every> -s <stop after depth> -f -v]\n";
    std::cout << "-d: directory holding words_<L>.csv or words_<L>.txt (default: " << DEFAULT_DATA_DIR << ")\n";
    std::cout << "-o: output directory for trees and checkpoints (default: " << DEFAULT_TREE_DIR << ")\n";
    std::cout << "-l: comma separated word lengths (default: 4,5,6)\n";
    std::cout << "-m: comma separated modes, uniform and/or frequency (default: both)\n";
    std::cout << "-x: maximum tree depth (default: " << TREE_MAX_DEPTH << ")\n";
    std::cout << "-c: stop expanding nodes with this many candidates or fewer (default: " << TREE_MIN_CANDIDATES << ")\n";
    std::cout << "-n: OpenMP threads (default: all)\n";
    std::cout << "-k: completed nodes between mid depth checkpoints (default: " << CHECKPOINT_EVERY << ")\n";
    std::cout << "-s: stop once this depth is complete, the checkpoint is kept\n";
    std::cout << "-f: rebuild even if the tree already exists\n";
    std::cout << "-v: verbose mode\n";
    std::cout << "Interrupting (Ctrl+C) saves a checkpoint; re-run to resume.\n";
}

static std::vector<std::string> split_list(const std::string &text){
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while(std::getline(ss, item, ',')){
        if(!item.empty()) out.push_back(item);
    }
    return out;
}

/**
 * Builds (or resumes) one configuration.
 * @returns false if the build was stopped before completion
*/
static bool precompute_one(const std::string &data_dir, const std::string &tree_dir,
    int word_length, prob_mode_t mode, tree_args_t args, bool force){
    std::string tree_file = tree_filename(tree_dir, word_length, mode);
    if(!force && file_exists(tree_file)){
        std::cout << "  " << tree_file << " exists, skipping (-f to rebuild)\n";
        return true;
    }
    lexicon_t lex = load_lexicon(words_filename(data_dir, word_length), word_length, mode);
    validate_lexicon(lex);

    std::cout << "\n" << std::string(60, '=') << "\n  " << word_length << "-letter "
        << mode_name(mode) << " (" << lex.words.size() << " words)\n"
        << std::string(60, '=') << "\n";

    args.checkpoint_path = checkpoint_filename(tree_dir, word_length, mode);
    decision_tree_t tree;
    auto start = timestamp;
    build_status_t status = build_tree(lex, args, tree);
    auto end = timestamp;

    if(status == BUILD_STOPPED){
        std::cout << "\n  Stopped after " << TIME(start, end) << "s, " << tree.size()
            << " nodes saved at " << args.checkpoint_path << "\n";
        std::cout << "  Re-run to continue from where it left off.\n";
        return false;
    }
    finalize_tree(tree, tree_file, args.checkpoint_path, word_length, mode);
    std::cout << "  Final tree: " << tree_file << " (" << tree.size() << " nodes, "
        << TIME(start, end) << "s)\n";
    return true;
}

int main(int argc, char *argv[]){
    std::string data_dir = DEFAULT_DATA_DIR;
    std::string tree_dir = DEFAULT_TREE_DIR;
    std::vector<int> lengths = {4, 5, 6};
    std::vector<prob_mode_t> modes = {MODE_UNIFORM, MODE_FREQUENCY};
    tree_args_t args;
    bool force = false;

    try{
        int opt;
        while((opt = getopt(argc, argv, "d:o:l:m:x:c:n:k:s:fv")) != -1){
            switch(opt){
            case 'd':
                data_dir = optarg;
                break;
            case 'o':
                tree_dir = optarg;
                break;
            case 'l':
                lengths.clear();
                for(const std::string &item : split_list(optarg)) lengths.push_back(atoi(item.c_str()));
                break;
            case 'm':
                modes.clear();
                for(const std::string &item : split_list(optarg)) modes.push_back(parse_mode(item));
                break;
            case 'x':
                args.max_depth = atoi(optarg);
                break;
            case 'c':
                args.min_candidates = static_cast<size_t>(atol(optarg));
                break;
            case 'n':
                args.num_threads = atoi(optarg);
                break;
            case 'k':
                args.checkpoint_every = static_cast<size_t>(atol(optarg));
                break;
            case 's':
                args.stop_after_depth = atoi(optarg);
                break;
            case 'f':
                force = true;
                break;
            case 'v':
                args.verbose = true;
                break;
            default:
                usage(argv[0]);
                exit(1);
            }
        }
        if(lengths.empty() || modes.empty() || args.max_depth < 0 || args.checkpoint_every == 0){
            usage(argv[0]);
            exit(1);
        }
        for(int length : lengths){
            if(length < 1 || length > MAXLEN){
                std::cerr << "Word length must be in between 1 and " << MAXLEN << "\n";
                exit(1);
            }
        }

        std::signal(SIGINT, stop_handler);
        std::signal(SIGTERM, stop_handler);
        args.stop_flag = &stop_requested;

        make_dirs(tree_dir);
        std::cout << "Precomputing " << lengths.size() * modes.size() << " decision tree(s)\n";
        std::cout << "Output: " << tree_dir << "\n";
        std::cout << "Threads: " << (args.num_threads > 0 ? args.num_threads : omp_get_max_threads()) << "\n";

        for(int length : lengths){
            for(prob_mode_t mode : modes){
                if(!precompute_one(data_dir, tree_dir, length, mode, args, force)) return 0;
            }
        }
        std::cout << "\nAll done! Trees in " << tree_dir << "\n";
    }
    catch(const std::exception &e){
        std::cerr << "precompute: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
