#include "entropy.h"
#include <algorithm>
#include <iterator>

bool better_guess(const guess_score_t &challenger, const guess_score_t &best){
    if(!challenger.valid) return false;
    if(!best.valid) return true;
    if(challenger.entropy > best.entropy) return true;
    return challenger.entropy == best.entropy &&
        challenger.is_candidate && !best.is_candidate;
}

double guess_entropy(const word_t &guess, const wordlist_t &eval,
    const priors_t &weights, pattern_scratch_t &scratch){
    scratch.clear();
    size_t n = eval.size();
    for(size_t i = 0; i < n; i++){
        scratch.add(feedback(eval[i], guess), weights[i]);
    }
    double h = scratch.entropy();
    scratch.clear();
    return h;
}

guess_score_t best_guess_in_range(const wordlist_t &pool, size_t begin, size_t end,
    const wordlist_t &eval, const priors_t &weights,
    const std::unordered_set<word_t> &candidate_set, pattern_scratch_t &scratch){
    guess_score_t best;
    for(size_t i = begin; i < end && i < pool.size(); i++){
        guess_score_t score;
        score.guess = pool[i];
        score.entropy = guess_entropy(pool[i], eval, weights, scratch);
        score.is_candidate = candidate_set.count(pool[i]) > 0;
        score.valid = true;
        if(better_guess(score, best)) best = score;
    }
    return best;
}

priors_t weights_of(const lexicon_t &lex, const wordlist_t &words){
    priors_t out(words.size());
    for(size_t i = 0; i < words.size(); i++)
        out[i] = lex.prob(words[i]);
    return out;
}

EntropyEngine::EntropyEngine(const lexicon_t &lex, const entropy_args_t &args,
    const decision_tree_t *tree)
    : lex_(&lex), args_(args), tree_(tree), rng_(args.seed),
      scratch_(lex.word_length), last_from_tree_(false), last_entropy_(-1.0) {}

wordlist_t EntropyEngine::sample(const wordlist_t &words, size_t cap){
    if(words.size() <= cap) return words;
    wordlist_t out;
    out.reserve(cap);
    std::sample(words.begin(), words.end(), std::back_inserter(out), cap, rng_);
    return out;
}

word_t EntropyEngine::next_guess(const history_t &history){
    last_from_tree_ = false;
    last_entropy_ = -1.0;

    // Precomputed tree first (instant lookup)
    if(tree_ != NULL && !tree_->empty()){
        tree_path_t path;
        for(const turn_t &turn : history) path.push_back(turn.second);
        auto it = tree_->find(path);
        if(it != tree_->end()){
            last_from_tree_ = true;
            return it->second;
        }
    }

    // Live computation
    wordlist_t candidates = filter_history(lex_->words, history);
    if(candidates.empty()) return lex_->words.front();
    if(candidates.size() <= 2) return candidates.front();

    std::unordered_set<word_t> candidate_set(candidates.begin(), candidates.end());
    wordlist_t guess_pool = sample(candidates, args_.max_guess_pool);
    wordlist_t eval = sample(candidates, args_.max_eval_candidates);
    priors_t weights = weights_of(*lex_, eval);

    guess_score_t best = best_guess_in_range(guess_pool, 0, guess_pool.size(),
        eval, weights, candidate_set, scratch_);
    if(!best.valid) return candidates.front();
    last_entropy_ = best.entropy;
    return best.guess;
}
