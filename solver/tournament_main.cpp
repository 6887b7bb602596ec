#include "word.h"
#include "utils.h"
#include "strategy.h"
#include "tournament.h"
#include "report.h"
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <unistd.h>

// Raised by SIGINT / SIGTERM, the coordinator kills its workers and gives up
static volatile std::sig_atomic_t stop_requested = 0;

static void stop_handler(int signal){
    (void)signal;
    stop_requested = 1;
}

void usage(char *exec_name){
    std::cout << "Usage:\n" << exec_name << " [-O | -l <length> -m <mode>] [-d <data dir> -e <tree dir> -o <results dir> -r <repetitions> -g <num games> -s <seed> -G <max guesses> -w <workers> -t <game timeout> -M <memory MB> -k <shock> -T <name filter> -j <json path> -N <name> -V -v]\n";
    std::cout << "-O: official tournament, rounds {4,5,6} x {uniform,frequency}\n";
    std::cout << "-l: word length of a custom run (default: 5)\n";
    std::cout << "-m: uniform, frequency or both for a custom run (default: uniform)\n";
    std::cout << "-d: directory holding words_<L>.csv or words_<L>.txt (default: " << DEFAULT_DATA_DIR << ")\n";
    std::cout << "-e: decision tree directory for the Entropy strategy (default: " << DEFAULT_TREE_DIR << ")\n";
    std::cout << "-o: results directory (default: " << RESULTS_DIR << ")\n";
    std::cout << "-r: repetitions of every round (default: 1)\n";
    std::cout << "-g: secrets sampled per round (default: whole vocabulary)\n";
    std::cout << "-s: master seed (default: random for official runs, " << DEFAULT_SEED << " otherwise)\n";
    std::cout << "-G: maximum guesses per game (default: " << MAX_GUESSES << ")\n";
    std::cout << "-w: parallel workers (default: available CPUs)\n";
    std::cout << "-t: seconds per game before it is abandoned (default: " << GAME_TIMEOUT << ")\n";
    std::cout << "-M: virtual memory cap per worker in MB (default: " << MEMORY_LIMIT_MB << ")\n";
    std::cout << "-k: noise scale applied to frequency rounds (default: 0)\n";
    std::cout << "-T: run only strategies whose name contains this\n";
    std::cout << "-j: write the JSON results here\n";
    std::cout << "-N: human readable tournament name\n";
    std::cout << "-V: restrict guesses to vocabulary words\n";
    std::cout << "-v: verbose mode\n";
}

int main(int argc, char *argv[]){
    tournament_args_t args;
    std::string data_dir = DEFAULT_DATA_DIR;
    std::string tree_dir = DEFAULT_TREE_DIR;
    std::string results_dir = RESULTS_DIR;
    std::string json_path;
    std::string name;
    std::string mode_text = "uniform";
    int word_length = 5;
    bool official = false;
    bool seed_given = false;

    try{
        int opt;
        while((opt = getopt(argc, argv, "Ol:m:d:e:o:r:g:s:G:w:t:M:k:T:j:N:Vv")) != -1){
            switch(opt){
            case 'O':
                official = true;
                break;
            case 'l':
                word_length = atoi(optarg);
                break;
            case 'm':
                mode_text = optarg;
                break;
            case 'd':
                data_dir = optarg;
                break;
            case 'e':
                tree_dir = optarg;
                break;
            case 'o':
                results_dir = optarg;
                break;
            case 'r':
                args.repetitions = atoi(optarg);
                break;
            case 'g':
                args.num_games = atoi(optarg);
                break;
            case 's':
                args.seed = strtoull(optarg, NULL, 10);
                seed_given = true;
                break;
            case 'G':
                args.max_guesses = atoi(optarg);
                break;
            case 'w':
                args.limits.num_workers = atoi(optarg);
                break;
            case 't':
                args.limits.game_timeout = atof(optarg);
                break;
            case 'M':
                args.limits.memory_limit_mb = atol(optarg);
                break;
            case 'k':
                args.shock = atof(optarg);
                break;
            case 'T':
                args.filter = optarg;
                break;
            case 'j':
                json_path = optarg;
                break;
            case 'N':
                name = optarg;
                break;
            case 'V':
                args.allow_non_words = false;
                break;
            case 'v':
                args.verbose = true;
                break;
            default:
                usage(argv[0]);
                exit(1);
            }
        }
        if(args.repetitions < 1 || args.max_guesses < 1 || args.limits.game_timeout <= 0
            || args.shock < 0 || word_length < 1 || word_length > MAXLEN){
            usage(argv[0]);
            exit(1);
        }

        if(official){
            args.rounds = canonical_rounds();
            if(!seed_given) args.seed = std::random_device()() % (1ULL << 31);
        }
        else{
            args.rounds.clear();
            if(mode_text == "both"){
                args.rounds.push_back(round_spec_t{word_length, MODE_UNIFORM});
                args.rounds.push_back(round_spec_t{word_length, MODE_FREQUENCY});
            }
            else{
                args.rounds.push_back(round_spec_t{word_length, parse_mode(mode_text)});
            }
        }

        std::signal(SIGINT, stop_handler);
        std::signal(SIGTERM, stop_handler);
        args.limits.stop_flag = &stop_requested;

        // Each word list is read once, lexicons are rebuilt per mode
        std::map<int, std::pair<wordlist_t, counts_t>> corpora;
        lexicon_source_t source = [&corpora, &data_dir](int length, prob_mode_t mode){
            auto it = corpora.find(length);
            if(it == corpora.end()){
                std::pair<wordlist_t, counts_t> corpus;
                read_words_from_file(words_filename(data_dir, length), length,
                    corpus.first, corpus.second);
                it = corpora.insert(std::make_pair(length, corpus)).first;
            }
            return make_lexicon(it->second.first, it->second.second, length, mode);
        };

        StrategyRegistry registry;
        register_builtin_strategies(registry, tree_dir);

        if(official){
            std::cout << std::string(60, '#') << "\n  OFFICIAL TOURNAMENT\n"
                << "  Master seed: " << args.seed << "\n" << std::string(60, '#') << "\n";
        }
        Tournament tournament(registry, source, args);
        tournament_result_t result = tournament.run(std::cout);
        if(result.rounds.size() > 1 || official) print_leaderboard(result.leaderboard, std::cout);

        report_config_t config;
        config.tournament_id = make_run_id();
        config.name = name;
        config.official = official;
        config.words_dir = data_dir;
        config.args = args;
        std::string stamp = iso_timestamp();

        if(official){
            std::string run_file = json_path.empty()
                ? results_dir + "/runs/" + config.tournament_id + "/tournament_results.json"
                : json_path;
            save_tournament_json(run_file, config, result, stamp);
            std::cout << "JSON saved to " << run_file << "\n";
            std::string latest = results_dir + "/latest.json";
            save_tournament_json(latest, config, result, stamp);
            std::cout << "Latest copy: " << latest << "\n";
        }
        else if(!json_path.empty()){
            save_tournament_json(json_path, config, result, stamp);
            std::cout << "JSON saved to " << json_path << "\n";
        }
    }
    catch(const std::exception &e){
        std::cerr << "tournament: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
