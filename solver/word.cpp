#include "word.h"
#include "errors.h"
#include <cctype>

// Printing Color Codes: https://stackoverflow.com/questions/9158150/colored-output-in-c/9158263
#define RESET   "\033[0m"
#define BLACK   "\033[30m"
#define GREEN   "\033[32m"
#define YELLOW  "\033[33m"

unsigned long get_num_patterns(int wordlen){
    unsigned long out = 1;
    for(int i = 0; i < wordlen; i++)
        out *= NUMCOLORS;
    return out;
}

coloring_t all_green(int wordlen){
    return static_cast<coloring_t>(get_num_patterns(wordlen) - 1);
}

bool is_correct_guess(coloring_t c, int wordlen){
    return (c == all_green(wordlen));
}

coloring_t feedback(const word_t &secret, const word_t &guess){
    int wordlen = static_cast<int>(secret.size());
    if(static_cast<int>(guess.size()) != wordlen){
        throw validation_error("guess length (" + std::to_string(guess.size())
            + ") != secret length (" + std::to_string(secret.size()) + ")");
    }
    if(wordlen > MAXLEN){
        throw validation_error("word length " + std::to_string(wordlen)
            + " exceeds MAXLEN");
    }
    // Letters of the secret not yet credited to the guess
    int remaining[256] = { 0 };
    bool green[MAXLEN] = { 0 };
    for(int i = 0; i < wordlen; i++)
        remaining[static_cast<unsigned char>(secret[i])]++;

    coloring_t out = 0;
    coloring_t mult = 1;
    // Check for green boxes first
    for(int i = 0; i < wordlen; i++){
        if(guess[i] == secret[i]){
            out += (GREEN_HIT * mult);
            green[i] = true;
            remaining[static_cast<unsigned char>(guess[i])]--;
        }
        mult *= NUMCOLORS;
    }

    // reset multiplier
    mult = 1;
    // Check for yellow boxes
    for(int i = 0; i < wordlen; i++){
        unsigned char letter = static_cast<unsigned char>(guess[i]);
        if(!green[i] && remaining[letter] > 0){
            out += (YELLOW_HIT * mult);
            remaining[letter]--;
        }
        mult *= NUMCOLORS;
    }
    return out;
}

wordlist_t filter_candidates(const wordlist_t &candidates,
    const word_t &guess, coloring_t pattern){
    wordlist_t out;
    for(const word_t &w : candidates){
        if(w.size() == guess.size() && feedback(w, guess) == pattern)
            out.push_back(w);
    }
    return out;
}

wordlist_t filter_history(const wordlist_t &vocabulary, const history_t &history){
    wordlist_t out = vocabulary;
    for(const turn_t &turn : history){
        out = filter_candidates(out, turn.first, turn.second);
    }
    return out;
}

int pattern_at(coloring_t c, int i){
    for(int k = 0; k < i; k++)
        c /= NUMCOLORS;
    return static_cast<int>(c % NUMCOLORS);
}

std::string pattern_to_string(coloring_t c, int wordlen){
    std::string out(wordlen, '0');
    for(int i = 0; i < wordlen; i++){
        out[i] = static_cast<char>('0' + (c % NUMCOLORS));
        c /= NUMCOLORS;
    }
    return out;
}

coloring_t pattern_from_string(const std::string &text){
    if(text.empty() || text.size() > MAXLEN)
        throw validation_error("bad pattern length: '" + text + "'");
    std::vector<int> digits;
    for(char ch : text){
        if(ch < '0' || ch > '2')
            throw validation_error("bad pattern symbol in '" + text + "'");
        digits.push_back(ch - '0');
    }
    return pattern_from_digits(digits);
}

coloring_t pattern_from_digits(const std::vector<int> &digits){
    coloring_t out = 0;
    coloring_t mult = 1;
    for(int d : digits){
        out += static_cast<coloring_t>(d) * mult;
        mult *= NUMCOLORS;
    }
    return out;
}

word_t to_lower(const word_t &word){
    word_t out = word;
    for(char &ch : out)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return out;
}

void word_print(const word_t &word, coloring_t coloring, char delim,
    std::ostream &out){
    for(size_t i = 0; i < word.size(); i ++){
        if(coloring % 3 == GREEN_HIT)
            out << GREEN << word[i] << RESET;
        else if (coloring % 3 == YELLOW_HIT)
            out << YELLOW << word[i] << RESET;
        else
            out << BLACK << word[i] << RESET;
        coloring = coloring / NUMCOLORS;
    }
    out << delim;
}
