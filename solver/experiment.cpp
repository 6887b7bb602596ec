#include "word.h"
#include "utils.h"
#include "game.h"
#include "strategy.h"
#include "tournament.h"
#include "report.h"
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>
#include <unistd.h>

struct step_log_t {
    word_t guess;
    coloring_t pattern;
    size_t remaining;
    double entropy_bits;
};

struct game_log_t {
    word_t secret;
    bool solved;
    int num_guesses;
    std::vector<step_log_t> steps;
};

void usage(char *exec_name){
    std::cout << "Usage:\n" << exec_name << " -S <strategy> [-d <data dir> -e <tree dir> -l <length> -m <mode> -g <num games> -s <seed> -G <max guesses> -j <json path> -V -v]\n";
    std::cout << "-S: strategy name (case insensitive)\n";
    std::cout << "-l: word length (default: 5)\n";
    std::cout << "-m: uniform or frequency (default: uniform)\n";
    std::cout << "-g: number of games (default: 10)\n";
    std::cout << "-s: seed of the secret sample (default: " << DEFAULT_SEED << ")\n";
    std::cout << "-j: write the per game log as JSON\n";
    std::cout << "-V: restrict guesses to vocabulary words\n";
    std::cout << "-v: print every guess\n";
}

/**
 * log2 of the candidate count, the uncertainty left in bits
*/
static double entropy_bits(size_t n){
    return n > 1 ? std::log2(static_cast<double>(n)) : 0.0;
}

static game_log_t play_one(Strategy &strategy, const game_config_t &config,
    GameSession &session, const word_t &secret, bool verbose){
    game_log_t log;
    log.secret = secret;
    session.reset(secret);
    strategy.begin_game(config);
    wordlist_t candidates = config.vocabulary();
    while(!session.game_over()){
        word_t word = strategy.guess(session.history());
        coloring_t pattern = session.guess(word);
        candidates = filter_candidates(candidates, to_lower(word), pattern);
        step_log_t step{to_lower(word), pattern, candidates.size(), entropy_bits(candidates.size())};
        log.steps.push_back(step);
        if(verbose){
            std::cout << "  Guess " << log.steps.size() << ": ";
            word_print(step.guess, pattern, ' ');
            std::cout << " remaining=" << step.remaining << "  H=" << std::fixed
                << std::setprecision(2) << step.entropy_bits << std::defaultfloat << " bits\n";
        }
    }
    strategy.end_game(session.secret(), session.is_solved(), session.num_guesses());
    log.solved = session.is_solved();
    log.num_guesses = session.num_guesses();
    if(verbose){
        std::cout << "  -> " << (log.solved ? "SOLVED" : "FAILED") << " in "
            << log.num_guesses << " guesses\n";
    }
    return log;
}

static ordered_json logs_json(const std::string &strategy, const game_config_t &config,
    const std::vector<game_log_t> &logs){
    ordered_json games = ordered_json::array();
    for(size_t i = 0; i < logs.size(); i++){
        const game_log_t &g = logs[i];
        ordered_json steps = ordered_json::array();
        for(const step_log_t &step : g.steps){
            steps.push_back(ordered_json{
                {"guess", step.guess},
                {"feedback", pattern_to_string(step.pattern, config.word_length())},
                {"remaining", step.remaining},
                {"entropy_bits", std::round(step.entropy_bits * 1000) / 1000}
            });
        }
        games.push_back(ordered_json{
            {"game", i + 1},
            {"secret", g.secret},
            {"solved", g.solved},
            {"num_guesses", g.num_guesses},
            {"steps", steps}
        });
    }
    ordered_json doc;
    doc["strategy"] = strategy;
    doc["word_length"] = config.word_length();
    doc["mode"] = mode_name(config.mode());
    doc["games"] = games;
    return doc;
}

int main(int argc, char *argv[]){
    std::string strategy_name;
    std::string data_dir = DEFAULT_DATA_DIR;
    std::string tree_dir = DEFAULT_TREE_DIR;
    std::string json_path;
    std::string mode_text = "uniform";
    int word_length = 5;
    int num_games = 10;
    uint64_t seed = DEFAULT_SEED;
    game_config_t config;
    bool verbose = false;

    try{
        int opt;
        while((opt = getopt(argc, argv, "S:d:e:l:m:g:s:G:j:Vv")) != -1){
            switch(opt){
            case 'S':
                strategy_name = optarg;
                break;
            case 'd':
                data_dir = optarg;
                break;
            case 'e':
                tree_dir = optarg;
                break;
            case 'l':
                word_length = atoi(optarg);
                break;
            case 'm':
                mode_text = optarg;
                break;
            case 'g':
                num_games = atoi(optarg);
                break;
            case 's':
                seed = strtoull(optarg, NULL, 10);
                break;
            case 'G':
                config.max_guesses = atoi(optarg);
                break;
            case 'j':
                json_path = optarg;
                break;
            case 'V':
                config.allow_non_words = false;
                break;
            case 'v':
                verbose = true;
                break;
            default:
                usage(argv[0]);
                exit(1);
            }
        }
        if(strategy_name.empty() || num_games < 1 || config.max_guesses < 1
            || word_length < 1 || word_length > MAXLEN){
            usage(argv[0]);
            exit(1);
        }

        StrategyRegistry registry;
        register_builtin_strategies(registry, tree_dir);
        std::string resolved;
        for(const std::string &name : registry.names()){
            if(to_lower(name) == to_lower(strategy_name)) resolved = name;
        }
        if(resolved.empty()){
            std::cerr << "Strategy '" << strategy_name << "' not found. Available:";
            for(const std::string &name : registry.names()) std::cerr << " " << name;
            std::cerr << "\n";
            return 1;
        }
        strategy_ptr strategy = registry.create(resolved);

        config.lexicon = load_lexicon(words_filename(data_dir, word_length), word_length,
            parse_mode(mode_text));
        validate_lexicon(config.lexicon);
        wordlist_t secrets = sample_secrets(config.vocabulary(), num_games, seed);

        GameSession session(config, seed);
        std::vector<game_log_t> logs;
        std::vector<game_result_t> results;
        auto start = timestamp;
        for(size_t i = 0; i < secrets.size(); i++){
            if(verbose){
                std::cout << "\n--- Game " << i + 1 << "/" << secrets.size()
                    << " | Secret: " << secrets[i] << " ---\n";
            }
            logs.push_back(play_one(*strategy, config, session, secrets[i], verbose));
            game_result_t r;
            r.strategy = resolved;
            r.secret = secrets[i];
            r.num_guesses = logs.back().num_guesses;
            r.solved = logs.back().solved;
            results.push_back(r);
        }
        auto end = timestamp;

        strategy_stats_t stats = summarize_games(resolved, results, config.max_guesses);
        std::cout << "\n=== " << resolved << " | " << stats.games_played << " games ===\n" << std::fixed;
        std::cout << "  Solved: " << stats.games_solved << "/" << stats.games_played << " ("
            << std::setprecision(1) << stats.solve_rate * 100 << "%)\n";
        std::cout << "  Guesses: mean " << std::setprecision(2) << stats.mean_guesses << ", median "
            << std::setprecision(1) << stats.median_guesses << ", max " << stats.max_guesses << "\n";
        std::cout << "  Distribution:";
        for(const auto &bucket : stats.guess_distribution)
            std::cout << " " << bucket.first << "=" << bucket.second;
        std::cout << "\n  Time: " << std::setprecision(3) << TIME(start, end) << "s\n";

        if(!json_path.empty()){
            save_json(json_path, logs_json(resolved, config, logs));
            std::cout << "JSON saved to " << json_path << "\n";
        }
    }
    catch(const std::exception &e){
        std::cerr << "experiment: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
