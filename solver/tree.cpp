#include "tree.h"
#include "errors.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_set>
#include <unistd.h>
#include <omp.h>

std::map<coloring_t, wordlist_t> partition_candidates(const wordlist_t &candidates,
    const word_t &guess){
    std::map<coloring_t, wordlist_t> children;
    for(const word_t &c : candidates){
        children[feedback(c, guess)].push_back(c);
    }
    return children;
}

static void visit(const decision_tree_t &tree, const tree_path_t &path,
    const wordlist_t &candidates, int max_depth, size_t min_candidates,
    std::vector<pending_node_t> &pending){
    if(candidates.size() <= 1) return;
    auto it = tree.find(path);
    if(it == tree.end()){
        // can't expand children without knowing this node's guess
        pending_node_t node;
        node.path = path;
        node.candidates = candidates;
        pending.push_back(node);
        return;
    }
    if(static_cast<int>(path.size()) >= max_depth) return;
    std::map<coloring_t, wordlist_t> children = partition_candidates(candidates, it->second);
    for(const auto &child : children){
        if(child.second.size() > min_candidates){
            tree_path_t next = path;
            next.push_back(child.first);
            visit(tree, next, child.second, max_depth, min_candidates, pending);
        }
    }
}

std::vector<pending_node_t> build_pending(const decision_tree_t &tree,
    const wordlist_t &vocabulary, int max_depth, size_t min_candidates){
    std::vector<pending_node_t> pending;
    visit(tree, tree_path_t(), vocabulary, max_depth, min_candidates, pending);
    std::sort(pending.begin(), pending.end(),
        [](const pending_node_t &a, const pending_node_t &b){
            if(a.path.size() != b.path.size()) return a.path.size() < b.path.size();
            return a.path < b.path;
        });
    return pending;
}

static int resolve_threads(int num_threads){
    return (num_threads > 0) ? num_threads : omp_get_max_threads();
}

guess_score_t compute_root(const lexicon_t &lex, int num_threads, bool verbose,
    const volatile std::sig_atomic_t *stop_flag){
    int threads = resolve_threads(num_threads);
    const wordlist_t &pool = lex.words;
    size_t chunk_size = std::max<size_t>(MIN_CHUNK_SIZE,
        pool.size() / (static_cast<size_t>(threads) * 4));
    int num_chunks = static_cast<int>(ceil_xdivy(pool.size(), chunk_size));
    std::unordered_set<word_t> candidate_set(pool.begin(), pool.end());
    std::vector<guess_score_t> winners(num_chunks);

    if(verbose){
        std::cout << "  Evaluating " << pool.size() << " guesses x "
            << pool.size() << " candidates in " << num_chunks << " chunks ...\n";
    }

    auto start = timestamp;
    int done = 0;
    int skipped = 0;
    std::exception_ptr error;
    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for(int c = 0; c < num_chunks; c++){
        if(stop_flag != NULL && *stop_flag != 0){
            #pragma omp atomic
            skipped++;
            continue;
        }
        try{
            pattern_scratch_t scratch(lex.word_length);
            size_t begin = static_cast<size_t>(c) * chunk_size;
            winners[c] = best_guess_in_range(pool, begin, begin + chunk_size,
                lex.words, lex.probs, candidate_set, scratch);
        }
        catch(...){
            #pragma omp critical
            {
                if(!error) error = std::current_exception();
            }
        }
        if(verbose){
            #pragma omp critical
            {
                done++;
                std::ostringstream line;
                line << "\r  [" << done << "/" << num_chunks << "] "
                    << std::fixed << std::setprecision(0)
                    << TIME(start, timestamp) << "s elapsed   ";
                std::cout << line.str() << std::flush;
            }
        }
    }
    if(error) std::rethrow_exception(error);
    if(skipped > 0){
        if(verbose) std::cout << "\n  Root stopped, " << skipped << " chunk(s) left\n";
        return guess_score_t();
    }

    // Reduce in chunk order, which matches a serial scan of the pool
    guess_score_t best;
    for(const guess_score_t &w : winners){
        if(better_guess(w, best)) best = w;
    }
    if(verbose){
        std::ostringstream line;
        line << "\n  -> " << best.guess << std::fixed << " (H=" << std::setprecision(4)
            << best.entropy << ") [" << std::setprecision(0)
            << TIME(start, timestamp) << "s]\n";
        std::cout << line.str();
    }
    return best;
}

guess_score_t compute_node(const lexicon_t &lex, const wordlist_t &candidates){
    pattern_scratch_t scratch(lex.word_length);
    std::unordered_set<word_t> candidate_set(candidates.begin(), candidates.end());
    priors_t weights = weights_of(lex, candidates);
    return best_guess_in_range(candidates, 0, candidates.size(),
        candidates, weights, candidate_set, scratch);
}

static void save_checkpoint(const decision_tree_t &tree, const lexicon_t &lex,
    const tree_args_t &args){
    if(args.checkpoint_path.empty()) return;
    save_tree(tree, args.checkpoint_path, lex.word_length, lex.mode);
}

static bool stop_requested(const tree_args_t &args){
    return args.stop_flag != NULL && *args.stop_flag != 0;
}

/**
 * Depth 1+: parallelize across nodes in batches, checkpointing after each
 * batch. @returns false if a stop was requested before the level finished.
*/
static bool compute_level(const std::vector<pending_node_t> &level,
    const lexicon_t &lex, const tree_args_t &args, decision_tree_t &tree){
    int threads = resolve_threads(args.num_threads);
    size_t batch = std::max(args.checkpoint_every, static_cast<size_t>(threads));
    auto start = timestamp;

    for(size_t lo = 0; lo < level.size(); lo += batch){
        size_t hi = std::min(lo + batch, level.size());
        int count = static_cast<int>(hi - lo);
        std::vector<guess_score_t> results(count);
        std::exception_ptr error;
        #pragma omp parallel for schedule(dynamic) num_threads(threads)
        for(int i = 0; i < count; i++){
            try{
                results[i] = compute_node(lex, level[lo + i].candidates);
            }
            catch(...){
                #pragma omp critical
                {
                    if(!error) error = std::current_exception();
                }
            }
        }
        if(error) std::rethrow_exception(error);

        for(int i = 0; i < count; i++){
            tree[level[lo + i].path] = results[i].guess;
        }
        save_checkpoint(tree, lex, args);

        if(args.verbose){
            const guess_score_t &last = results[count - 1];
            std::ostringstream line;
            line << "\r  [" << hi << "/" << level.size() << "] cands="
                << level[hi - 1].candidates.size() << " -> " << last.guess
                << " H=" << std::fixed << std::setprecision(3) << last.entropy
                << "  " << std::setprecision(0) << TIME(start, timestamp) << "s";
            std::cout << line.str() << std::flush;
        }
        if(hi < level.size() && stop_requested(args)) return false;
    }
    if(args.verbose){
        std::cout << "\n  Depth done: " << level.size() << " nodes in "
            << TIME(start, timestamp) << "s\n";
    }
    return true;
}

build_status_t build_tree(const lexicon_t &lex, const tree_args_t &args,
    decision_tree_t &tree){
    if(!args.checkpoint_path.empty())
        tree = load_tree(args.checkpoint_path, lex.word_length, lex.mode);

    if(args.verbose){
        std::cout << "\n  Config: " << lex.word_length << "-letter " << mode_name(lex.mode) << "\n"
            << "  Vocabulary: " << lex.words.size() << " words\n"
            << "  Checkpoint: " << tree.size() << " nodes already computed\n"
            << "  Max depth: " << args.max_depth << ", min candidates: "
            << args.min_candidates << "\n"
            << "  Workers: " << resolve_threads(args.num_threads) << "\n";
    }

    while(true){
        if(stop_requested(args)) return BUILD_STOPPED;

        std::vector<pending_node_t> pending = build_pending(tree, lex.words,
            args.max_depth, args.min_candidates);
        if(pending.empty()) break;

        int depth = static_cast<int>(pending.front().path.size());
        std::vector<pending_node_t> level;
        for(pending_node_t &node : pending){
            if(static_cast<int>(node.path.size()) == depth) level.push_back(node);
        }
        if(args.verbose){
            std::cout << "\n  --- Depth " << depth << ": " << level.size() << " node(s) ---\n";
        }

        if(depth == 0){
            guess_score_t root = compute_root(lex, args.num_threads, args.verbose,
                args.stop_flag);
            if(!root.valid) return BUILD_STOPPED;
            tree[level.front().path] = root.guess;
            save_checkpoint(tree, lex, args);
        }
        else if(!compute_level(level, lex, args, tree)){
            return BUILD_STOPPED;
        }

        if(args.stop_after_depth >= 0 && depth >= args.stop_after_depth)
            return BUILD_STOPPED;
    }

    if(args.verbose)
        std::cout << "\n  Tree complete: " << tree.size() << " nodes\n";
    return BUILD_COMPLETE;
}

void finalize_tree(const decision_tree_t &tree, const std::string &tree_path,
    const std::string &checkpoint_path, int word_length, prob_mode_t mode){
    save_tree(tree, tree_path, word_length, mode);
    if(!checkpoint_path.empty() && unlink(checkpoint_path.c_str()) != 0 && errno != ENOENT){
        throw checkpoint_error("Unable to remove checkpoint " + checkpoint_path
            + ": " + std::strerror(errno));
    }
}
