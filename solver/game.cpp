#include "game.h"
#include "errors.h"

const char *state_name(game_state_t state){
    switch(state){
    case GAME_NOT_STARTED: return "not_started";
    case GAME_ACTIVE: return "active";
    case GAME_SOLVED: return "solved";
    case GAME_EXHAUSTED: return "exhausted";
    }
    return "unknown";
}

GameSession::GameSession(const game_config_t &config, uint64_t seed)
    : config_(&config), rng_(seed), state_(GAME_NOT_STARTED) {}

void GameSession::reset(const word_t &secret){
    const lexicon_t &lex = config_->lexicon;
    if(!secret.empty()){
        word_t s = to_lower(secret);
        if(!lex.contains(s))
            throw validation_error("secret '" + secret + "' is not in vocabulary");
        secret_ = s;
    }
    else{
        if(lex.words.empty())
            throw validation_error("cannot draw a secret from an empty vocabulary");
        std::uniform_int_distribution<size_t> pick(0, lex.words.size() - 1);
        secret_ = lex.words[pick(rng_)];
    }
    history_.clear();
    state_ = GAME_ACTIVE;
}

coloring_t GameSession::guess(const word_t &word){
    if(state_ == GAME_NOT_STARTED)
        throw state_error("Call reset() before guessing");
    if(state_ != GAME_ACTIVE)
        throw state_error(std::string("Game is already over (") + state_name(state_) + ")");

    word_t w = to_lower(word);
    int wordlen = config_->word_length();
    if(static_cast<int>(w.size()) != wordlen){
        throw validation_error("Guess length (" + std::to_string(w.size())
            + ") != word_length (" + std::to_string(wordlen) + ")");
    }
    if(!config_->allow_non_words && !config_->lexicon.contains(w))
        throw validation_error("'" + w + "' is not in the vocabulary");

    coloring_t pattern = feedback(secret_, w);
    history_.emplace_back(w, pattern);
    if(w == secret_)
        state_ = GAME_SOLVED;
    else if(num_guesses() >= config_->max_guesses)
        state_ = GAME_EXHAUSTED;
    return pattern;
}

const word_t &GameSession::secret() const {
    if(state_ == GAME_NOT_STARTED)
        throw state_error("No game in progress");
    if(!game_over())
        throw state_error("Game is still in progress");
    return secret_;
}

int GameSession::remaining_guesses() const {
    return config_->max_guesses - num_guesses();
}
