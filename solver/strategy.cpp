#include "strategy.h"
#include "errors.h"
#include <algorithm>
#include <iostream>
#include <set>
#include <unordered_set>

/*******************************
 * MaxProb
********************************/

void MaxProbStrategy::begin_game(const game_config_t &config){
    const lexicon_t &lex = config.lexicon;
    ranked_ = lex.words;
    // Descending probability, then alphabetical for ties
    std::sort(ranked_.begin(), ranked_.end(), [&lex](const word_t &a, const word_t &b){
        double pa = lex.prob(a), pb = lex.prob(b);
        if(pa != pb) return pa > pb;
        return a < b;
    });
}

word_t MaxProbStrategy::guess(const history_t &history){
    wordlist_t candidates = filter_history(ranked_, history);
    if(candidates.empty()) return ranked_.front();
    return candidates.front();
}

/*******************************
 * Random
********************************/

void RandomStrategy::begin_game(const game_config_t &config){
    vocab_ = &config.vocabulary();
}

word_t RandomStrategy::guess(const history_t &history){
    // Re-filter from scratch (simple & correct)
    wordlist_t candidates = filter_history(*vocab_, history);
    if(candidates.empty()) return vocab_->front();
    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
    return candidates[pick(rng_)];
}

/*******************************
 * Entropy
********************************/

EntropyStrategy::EntropyStrategy(const std::string &tree_dir, const entropy_args_t &args)
    : tree_dir_(tree_dir), args_(args) {}

const decision_tree_t *EntropyStrategy::tree_for(int word_length, prob_mode_t mode){
    std::pair<int, prob_mode_t> key(word_length, mode);
    auto it = trees_.find(key);
    if(it != trees_.end()) return &it->second;

    decision_tree_t tree;
    std::string filename = tree_filename(tree_dir_, word_length, mode);
    try{
        tree = load_tree(filename, word_length, mode);
    }
    catch(const checkpoint_error &e){
        // Play without the tree rather than refuse the game
        std::cerr << "[Entropy] ignoring tree " << filename << ": " << e.what() << "\n";
        tree.clear();
    }
    return &(trees_[key] = tree);
}

void EntropyStrategy::begin_game(const game_config_t &config){
    const decision_tree_t *tree = tree_for(config.word_length(), config.mode());
    engine_ = std::make_unique<EntropyEngine>(config.lexicon, args_, tree);
}

word_t EntropyStrategy::guess(const history_t &history){
    if(!engine_) throw state_error("Entropy: guess() before begin_game()");
    return engine_->next_guess(history);
}

/*******************************
 * Coverage
********************************/

void CoverageStrategy::begin_game(const game_config_t &config){
    config_ = &config;
}

double CoverageStrategy::weight(const word_t &word) const {
    if(config_->mode() == MODE_FREQUENCY) return config_->lexicon.prob(word);
    return 1.0;
}

word_t CoverageStrategy::best_cover_word(const wordlist_t &words) const {
    // Number of words each letter appears in
    int letter_counts[256] = { 0 };
    for(const word_t &w : words){
        std::set<unsigned char> letters(w.begin(), w.end());
        for(unsigned char ch : letters) letter_counts[ch]++;
    }
    word_t best = words.front();
    long best_score = -1;
    for(const word_t &w : words){
        std::set<unsigned char> letters(w.begin(), w.end());
        long score = 0;
        for(unsigned char ch : letters) score += letter_counts[ch];
        if(score > best_score){
            best_score = score;
            best = w;
        }
    }
    return best;
}

word_t CoverageStrategy::guess(const history_t &history){
    if(config_ == NULL) throw state_error("Coverage: guess() before begin_game()");
    wordlist_t candidates = filter_history(config_->vocabulary(), history);
    if(candidates.empty()) return config_->vocabulary().front();

    if(history.empty()) return best_cover_word(candidates);

    if(candidates.size() <= COVERAGE_SMALL_SET){
        word_t best = candidates.front();
        for(const word_t &w : candidates){
            if(weight(w) > weight(best)) best = w;
        }
        return best;
    }

    priors_t weights(candidates.size());
    for(size_t i = 0; i < candidates.size(); i++) weights[i] = weight(candidates[i]);

    pattern_scratch_t scratch(config_->word_length());
    word_t best = candidates.front();
    double best_entropy = -1.0;
    size_t pool = std::min<size_t>(COVERAGE_POOL, candidates.size());
    for(size_t i = 0; i < pool; i++){
        double h = guess_entropy(candidates[i], candidates, weights, scratch);
        if(h > best_entropy){
            best_entropy = h;
            best = candidates[i];
        }
    }
    return best;
}

/*******************************
 * Registry
********************************/

void StrategyRegistry::add(const std::string &name, strategy_factory_t factory){
    for(auto &entry : entries_){
        if(entry.first == name){
            entry.second = factory;
            return;
        }
    }
    entries_.emplace_back(name, factory);
}

bool StrategyRegistry::contains(const std::string &name) const {
    for(const auto &entry : entries_){
        if(entry.first == name) return true;
    }
    return false;
}

std::vector<std::string> StrategyRegistry::names() const {
    std::vector<std::string> out;
    for(const auto &entry : entries_) out.push_back(entry.first);
    return out;
}

strategy_ptr StrategyRegistry::create(const std::string &name) const {
    for(const auto &entry : entries_){
        if(entry.first != name) continue;
        strategy_ptr out;
        try{
            out = entry.second();
        }
        catch(const std::exception &e){
            throw strategy_load_error("failed to load strategy " + name + ": " + e.what());
        }
        if(!out) throw strategy_load_error("factory for " + name + " returned nothing");
        return out;
    }
    throw strategy_load_error("unknown strategy " + name);
}

std::vector<std::string> StrategyRegistry::load(const std::string &filter,
    std::ostream &err) const {
    std::vector<std::string> loaded;
    for(const auto &entry : entries_){
        if(!filter.empty() && entry.first.find(filter) == std::string::npos) continue;
        try{
            strategy_ptr probe = create(entry.first);
            loaded.push_back(entry.first);
        }
        catch(const strategy_load_error &e){
            err << "  [warn] " << e.what() << "\n";
        }
    }
    return loaded;
}

void register_builtin_strategies(StrategyRegistry &registry, const std::string &tree_dir){
    registry.add("MaxProb", []() -> strategy_ptr { return std::make_unique<MaxProbStrategy>(); });
    registry.add("Random", []() -> strategy_ptr { return std::make_unique<RandomStrategy>(); });
    registry.add("Entropy", [tree_dir]() -> strategy_ptr { return std::make_unique<EntropyStrategy>(tree_dir); });
    registry.add("Coverage", []() -> strategy_ptr { return std::make_unique<CoverageStrategy>(); });
}
