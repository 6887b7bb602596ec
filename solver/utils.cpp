#include "utils.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

void lexicon_t::build_index(){
    index.clear();
    for(size_t i = 0; i < words.size(); i++)
        index[words[i]] = i;
}

bool lexicon_t::contains(const word_t &word) const {
    return index.find(word) != index.end();
}

double lexicon_t::prob(const word_t &word) const {
    auto it = index.find(word);
    if(it == index.end()) return 0.0;
    return probs[it->second];
}

const char *mode_name(prob_mode_t mode){
    return (mode == MODE_FREQUENCY) ? "frequency" : "uniform";
}

prob_mode_t parse_mode(const std::string &name){
    if(name == "uniform") return MODE_UNIFORM;
    if(name == "frequency") return MODE_FREQUENCY;
    throw validation_error("mode must be 'uniform' or 'frequency', got '" + name + "'");
}

/*******************************
 * File I/O Functions
********************************/

// Base letters of U+00C0..U+00FF, '?' where there is none
static const char LATIN1_BASE[] =
    "aaaaaa?ceeeeiiii?nooooo??uuuuy??"
    "aaaaaa?ceeeeiiii?nooooo??uuuuy?y";

std::string strip_accents(const std::string &text){
    std::string out;
    out.reserve(text.size());
    size_t n = text.size();
    for(size_t i = 0; i < n; i++){
        unsigned char c = text[i];
        unsigned char next = (i + 1 < n) ? text[i + 1] : 0;
        if(c == 0xC3 && next >= 0x80 && next <= 0xBF && LATIN1_BASE[next - 0x80] != '?'){
            out += LATIN1_BASE[next - 0x80];
            i++;
        }
        else if((c == 0xCC && next >= 0x80 && next <= 0xBF) ||
            (c == 0xCD && next >= 0x80 && next <= 0xAF)){
            // combining mark U+0300..U+036F
            i++;
        }
        else{
            out += text[i];
        }
    }
    return out;
}

static bool is_plain_word(const word_t &w, int word_length){
    if(static_cast<int>(w.size()) != word_length) return false;
    for(char ch : w){
        if(ch < 'a' || ch > 'z') return false;
    }
    return true;
}

static std::string trim(const std::string &s){
    size_t lo = s.find_first_not_of(" \t\r\n");
    if(lo == std::string::npos) return "";
    size_t hi = s.find_last_not_of(" \t\r\n");
    return s.substr(lo, hi - lo + 1);
}

static bool ends_with(const std::string &s, const std::string &suffix){
    return s.size() >= suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void read_words_from_file(const std::string &input_filename, int word_length,
    wordlist_t &words, counts_t &counts){
    std::ifstream file(input_filename);
    if(!file.is_open()){
        throw std::runtime_error("Unable to open file: " + input_filename);
    }
    bool csv = ends_with(input_filename, ".csv");
    std::string line;
    std::vector<std::pair<word_t, long long>> rows;
    std::unordered_set<word_t> seen;

    int word_col = 0, count_col = -1;
    if(csv){
        if(!getline(file, line)){
            throw std::runtime_error("Unsupported File Format: " + input_filename
                + " [Err: Missing Header]");
        }
        std::stringstream header(trim(line));
        std::string field;
        int col = 0;
        word_col = -1;
        while(getline(header, field, ',')){
            field = trim(field);
            if(field == "word") word_col = col;
            else if(field == "count") count_col = col;
            col++;
        }
        if(word_col < 0 || count_col < 0){
            throw std::runtime_error("Unsupported File Format: " + input_filename
                + " [Err: Header must name word,count]");
        }
    }

    while(getline(file, line)){
        line = trim(line);
        if(line.empty()) continue;
        word_t w;
        long long c = 1;
        if(csv){
            std::stringstream row(line);
            std::string field;
            int col = 0;
            std::string count_text;
            while(getline(row, field, ',')){
                if(col == word_col) w = trim(field);
                else if(col == count_col) count_text = trim(field);
                col++;
            }
            try{
                c = std::stoll(count_text);
            }
            catch(const std::exception& e){
                throw std::runtime_error("Unsupported File Format: " + input_filename
                    + " [Err: Invalid Count '" + count_text + "']");
            }
        }
        else{
            w = line;
        }
        w = strip_accents(to_lower(w));
        if(c <= 0 || !is_plain_word(w, word_length)) continue;
        if(!seen.insert(w).second) continue;
        rows.emplace_back(w, c);
    }
    file.close();

    if(rows.empty()){
        throw std::runtime_error("No " + std::to_string(word_length)
            + "-letter words found in " + input_filename);
    }
    std::sort(rows.begin(), rows.end());
    words.clear();
    counts.clear();
    for(auto &row : rows){
        words.push_back(row.first);
        counts.push_back(row.second);
    }
}

std::string words_filename(const std::string &data_dir, int word_length){
    std::string base = data_dir + "/words_" + std::to_string(word_length);
    const char *suffixes[] = {".csv", ".txt"};
    for(const char *suffix : suffixes){
        std::ifstream probe(base + suffix);
        if(probe.good()) return base + suffix;
    }
    throw std::runtime_error("no word list for length " + std::to_string(word_length)
        + " (looked for " + base + ".csv and " + base + ".txt)");
}

lexicon_t make_lexicon(const wordlist_t &words, const counts_t &counts,
    int word_length, prob_mode_t mode){
    lexicon_t lex;
    lex.word_length = word_length;
    lex.words = words;
    lex.mode = mode;
    if(mode == MODE_UNIFORM)
        lex.probs = generate_uniform_priors(words.size());
    else
        lex.probs = sigmoid_weights(counts);
    lex.build_index();
    return lex;
}

lexicon_t load_lexicon(const std::string &input_filename, int word_length,
    prob_mode_t mode){
    wordlist_t words;
    counts_t counts;
    read_words_from_file(input_filename, word_length, words, counts);
    return make_lexicon(words, counts, word_length, mode);
}

/*******************************
 * Probability Model
********************************/

priors_t generate_uniform_priors(unsigned long size){
    if(size == 0) return priors_t();
    return priors_t(size, 1.0 / static_cast<double>(size));
}

static double sigmoid(double x){
    if(x >= 0) return 1.0 / (1.0 + std::exp(-x));
    double ex = std::exp(x);
    return ex / (1.0 + ex);
}

priors_t sigmoid_weights(const counts_t &counts, double steepness){
    size_t n = counts.size();
    priors_t out(n, 0.0);
    if(n == 0) return out;
    std::vector<double> log_counts(n);
    double mu = 0.0;
    for(size_t i = 0; i < n; i++){
        log_counts[i] = std::log(static_cast<double>(counts[i]) + 1.0);
        mu += log_counts[i];
    }
    mu /= static_cast<double>(n);
    double total = 0.0;
    for(size_t i = 0; i < n; i++){
        out[i] = sigmoid(steepness * (log_counts[i] - mu));
        total += out[i];
    }
    for(double &p : out) p /= total;
    return out;
}

priors_t perturb_probabilities(const priors_t &probs, double noise_scale,
    uint64_t seed){
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> noise(-noise_scale, noise_scale);
    priors_t out(probs.size());
    double total = 0.0;
    for(size_t i = 0; i < probs.size(); i++){
        double factor = 1.0 + noise(rng);
        out[i] = std::max(probs[i] * factor, MIN_PERTURBED_PROB);
        total += out[i];
    }
    for(double &p : out) p /= total;
    return out;
}

double prior_sum(const priors_t &priors){
    double sum = 0.0;
    for(double p : priors) sum += p;
    return sum;
}

void validate_lexicon(const lexicon_t &lex){
    if(lex.word_length <= 0 || lex.word_length > MAXLEN){
        throw validation_error("word length " + std::to_string(lex.word_length)
            + " outside 1.." + std::to_string(MAXLEN));
    }
    if(lex.words.empty()){
        throw validation_error("vocabulary is empty");
    }
    if(lex.probs.size() != lex.words.size()){
        throw validation_error("probability count differs from word count");
    }
    std::unordered_set<word_t> seen;
    for(const word_t &w : lex.words){
        if(static_cast<int>(w.size()) != lex.word_length){
            throw validation_error("word '" + w + "' has wrong length (expected "
                + std::to_string(lex.word_length) + ")");
        }
        if(!seen.insert(w).second){
            throw validation_error("duplicate word '" + w + "'");
        }
    }
    double sum = prior_sum(lex.probs);
    if(std::fabs(sum - 1.0) > PROB_TOLERANCE){
        std::ostringstream msg;
        msg << "probabilities sum to " << sum << ", expected 1";
        throw validation_error(msg.str());
    }
}
