#include "tournament.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <sstream>
#include <stdexcept>

static double round_to(double x, int decimals){
    double scale = std::pow(10.0, decimals);
    return std::round(x * scale) / scale;
}

strategy_stats_t summarize_games(const std::string &name,
    const std::vector<game_result_t> &games, int max_guesses){
    strategy_stats_t stats;
    stats.name = name;
    for(int g = 1; g <= max_guesses; g++){
        stats.guess_distribution.push_back(std::make_pair(std::to_string(g), 0));
    }
    stats.guess_distribution.push_back(std::make_pair(std::string(FAILED_BUCKET), 0));

    int n = static_cast<int>(games.size());
    stats.games_played = n;
    if(n == 0) return stats;

    std::vector<int> guesses;
    guesses.reserve(n);
    long total = 0;
    for(const game_result_t &game : games){
        if(game.solved){
            stats.games_solved++;
            if(game.num_guesses >= 1 && game.num_guesses <= max_guesses)
                stats.guess_distribution[game.num_guesses - 1].second++;
        }
        else{
            stats.guess_distribution.back().second++;
        }
        if(game.timed_out) stats.timed_out++;
        guesses.push_back(game.num_guesses);
        total += game.num_guesses;
    }
    std::sort(guesses.begin(), guesses.end());
    stats.solve_rate = round_to(static_cast<double>(stats.games_solved) / n, 4);
    stats.mean_guesses = round_to(static_cast<double>(total) / n, 3);
    if(n % 2 == 1) stats.median_guesses = guesses[n / 2];
    else stats.median_guesses = (guesses[n / 2 - 1] + guesses[n / 2]) / 2.0;
    stats.max_guesses = guesses.back();
    return stats;
}

std::vector<leaderboard_entry_t> compute_leaderboard(const std::vector<round_result_t> &rounds){
    std::map<std::string, leaderboard_entry_t> board;
    std::map<std::string, std::vector<double>> rates, means;

    for(const round_result_t &round : rounds){
        std::vector<const strategy_stats_t *> ranked;
        for(const strategy_stats_t &s : round.strategies) ranked.push_back(&s);
        std::stable_sort(ranked.begin(), ranked.end(),
            [](const strategy_stats_t *a, const strategy_stats_t *b){
                return a->mean_guesses < b->mean_guesses;
            });

        size_t n = ranked.size();
        size_t i = 0;
        while(i < n){
            size_t j = i;
            while(j < n && ranked[j]->mean_guesses == ranked[i]->mean_guesses) j++;
            // Positions i..j-1 share the points of the block
            double points = 0.0;
            for(size_t k = i; k < j; k++) points += static_cast<double>(n - k);
            points /= static_cast<double>(j - i);
            for(size_t k = i; k < j; k++){
                leaderboard_entry_t &entry = board[ranked[k]->name];
                entry.strategy = ranked[k]->name;
                entry.total_points += points;
                entry.round_points.push_back(std::make_pair(round.round_id, points));
            }
            i = j;
        }
        for(const strategy_stats_t &s : round.strategies){
            rates[s.name].push_back(s.solve_rate);
            means[s.name].push_back(s.mean_guesses);
        }
    }

    std::vector<leaderboard_entry_t> entries;
    for(auto &kv : board){
        leaderboard_entry_t entry = kv.second;
        const std::vector<double> &r = rates[kv.first];
        const std::vector<double> &m = means[kv.first];
        double rate_sum = 0.0, mean_sum = 0.0;
        for(double x : r) rate_sum += x;
        for(double x : m) mean_sum += x;
        entry.total_points = round_to(entry.total_points, 2);
        entry.overall_solve_rate = r.empty() ? 0.0 : round_to(rate_sum / r.size(), 4);
        entry.overall_mean_guesses = m.empty() ? 0.0 : round_to(mean_sum / m.size(), 3);
        entries.push_back(entry);
    }
    std::stable_sort(entries.begin(), entries.end(),
        [](const leaderboard_entry_t &a, const leaderboard_entry_t &b){
            if(a.total_points != b.total_points) return a.total_points > b.total_points;
            return a.strategy < b.strategy;
        });
    for(size_t k = 0; k < entries.size(); k++) entries[k].rank = static_cast<int>(k) + 1;
    return entries;
}

wordlist_t sample_secrets(const wordlist_t &vocabulary, int num_games, uint64_t seed){
    if(num_games <= 0 || static_cast<size_t>(num_games) >= vocabulary.size()) return vocabulary;
    wordlist_t out;
    std::mt19937_64 rng(seed);
    std::sample(vocabulary.begin(), vocabulary.end(), std::back_inserter(out),
        static_cast<size_t>(num_games), rng);
    return out;
}

std::vector<round_spec_t> canonical_rounds(){
    std::vector<round_spec_t> rounds;
    for(int length = 4; length <= 6; length++){
        rounds.push_back(round_spec_t{length, MODE_UNIFORM});
        rounds.push_back(round_spec_t{length, MODE_FREQUENCY});
    }
    return rounds;
}

std::string make_round_id(const round_spec_t &spec, int repetition, int repetitions){
    std::string id = std::to_string(spec.word_length) + "_" + mode_name(spec.mode);
    if(repetitions > 1) id += "_r" + std::to_string(repetition);
    return id;
}

void print_round_summary(const round_result_t &round, std::ostream &out){
    std::vector<strategy_stats_t> ranked = round.strategies;
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const strategy_stats_t &a, const strategy_stats_t &b){
            return a.mean_guesses < b.mean_guesses;
        });
    std::ostringstream table;
    table << "\n" << std::left << std::setw(25) << "Strategy" << std::right
        << std::setw(7) << "Games" << std::setw(8) << "Solved" << std::setw(8) << "Rate"
        << std::setw(8) << "Mean" << std::setw(8) << "Median" << std::setw(6) << "Max"
        << std::setw(6) << "T/O" << "\n";
    table << std::string(76, '-') << "\n";
    table << std::fixed;
    for(const strategy_stats_t &s : ranked){
        table << std::left << std::setw(25) << s.name << std::right
            << std::setw(7) << s.games_played << std::setw(8) << s.games_solved
            << std::setw(7) << std::setprecision(1) << s.solve_rate * 100 << "%"
            << std::setw(8) << std::setprecision(2) << s.mean_guesses
            << std::setw(8) << std::setprecision(1) << s.median_guesses
            << std::setw(6) << s.max_guesses << std::setw(6) << s.timed_out << "\n";
    }
    for(const strategy_failure_t &f : round.failed){
        table << std::left << std::setw(25) << f.name << " FAILED: " << f.reason << "\n";
    }
    out << table.str() << std::endl;
}

void print_leaderboard(const std::vector<leaderboard_entry_t> &entries, std::ostream &out){
    std::ostringstream table;
    table << "\n" << std::string(72, '=') << "\n  LEADERBOARD\n" << std::string(72, '=') << "\n";
    table << "  " << std::left << std::setw(6) << "Rank" << std::setw(25) << "Strategy"
        << std::right << std::setw(8) << "Points" << std::setw(8) << "Solve%"
        << std::setw(8) << "MeanG" << "\n";
    table << "  " << std::string(55, '-') << "\n" << std::fixed;
    for(const leaderboard_entry_t &e : entries){
        table << "  " << std::left << std::setw(6) << e.rank << std::setw(25) << e.strategy
            << std::right << std::setw(8) << std::setprecision(1) << e.total_points
            << std::setw(7) << e.overall_solve_rate * 100 << "%"
            << std::setw(8) << std::setprecision(2) << e.overall_mean_guesses << "\n";
    }
    out << table.str() << std::endl;
}

/*******************************
 * Run status
********************************/

const char *phase_name(run_phase_t phase){
    switch(phase){
    case PHASE_IDLE: return "idle";
    case PHASE_LOADING: return "loading";
    case PHASE_RUNNING: return "running";
    case PHASE_DONE: return "done";
    case PHASE_FAILED: return "failed";
    }
    return "unknown";
}

void RunStatus::set_phase(run_phase_t phase, const std::string &message){
    std::lock_guard<std::mutex> lock(mutex_);
    state_.phase = phase;
    state_.message = message;
}

void RunStatus::begin_run(int rounds_total){
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = run_snapshot_t();
    state_.phase = PHASE_RUNNING;
    state_.rounds_total = rounds_total;
}

void RunStatus::begin_round(const std::string &round_id, int jobs_total){
    std::lock_guard<std::mutex> lock(mutex_);
    state_.round_id = round_id;
    state_.jobs_done = 0;
    state_.jobs_total = jobs_total;
}

void RunStatus::job_done(){
    std::lock_guard<std::mutex> lock(mutex_);
    state_.jobs_done++;
}

void RunStatus::round_done(){
    std::lock_guard<std::mutex> lock(mutex_);
    state_.rounds_done++;
}

run_snapshot_t RunStatus::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

/*******************************
 * Tournament
********************************/

Tournament::Tournament(const StrategyRegistry &registry, lexicon_source_t source,
    const tournament_args_t &args)
    : registry_(&registry), source_(source), args_(args) {}

round_result_t Tournament::play_round(const round_spec_t &spec, int repetition,
    uint64_t seed, const std::vector<std::string> &strategies, std::ostream &out){
    round_result_t round;
    round.round_id = make_round_id(spec, repetition, args_.repetitions);
    round.word_length = spec.word_length;
    round.mode = spec.mode;
    round.repetition = repetition;
    round.seed = seed;

    out << "\n" << std::string(60, '=') << "\n  ROUND: " << spec.word_length << "-letter "
        << mode_name(spec.mode);
    if(args_.repetitions > 1) out << "  (rep " << repetition << ")";
    out << "\n" << std::string(60, '=') << std::endl;

    status_.set_phase(PHASE_LOADING, round.round_id);
    game_config_t config;
    config.lexicon = source_(spec.word_length, spec.mode);
    config.max_guesses = args_.max_guesses;
    config.allow_non_words = args_.allow_non_words;
    if(args_.shock > 0 && spec.mode == MODE_FREQUENCY){
        config.lexicon.probs = perturb_probabilities(config.lexicon.probs, args_.shock, seed);
    }
    validate_lexicon(config.lexicon);

    wordlist_t secrets = sample_secrets(config.vocabulary(), args_.num_games, seed);
    round.num_games = static_cast<int>(secrets.size());
    out << "Vocabulary: " << config.vocabulary().size() << " words of length "
        << spec.word_length << " (mode: " << mode_name(spec.mode) << "), "
        << secrets.size() << " games" << std::endl;
    if(args_.verbose){
        out << "Round seed: " << seed << ", workers: "
            << (args_.limits.num_workers > 0 ? args_.limits.num_workers
                : static_cast<int>(available_cpus().size()))
            << ", memory cap: " << args_.limits.memory_limit_mb << " MB" << std::endl;
    }

    status_.begin_round(round.round_id, static_cast<int>(strategies.size()));
    status_.set_phase(PHASE_RUNNING, round.round_id);
    auto start = timestamp;
    std::vector<worker_outcome_t> outcomes = run_worker_pool(*registry_, strategies,
        config, secrets, args_.limits, [&](const worker_outcome_t &outcome){
            status_.job_done();
            if(outcome.failed){
                std::cerr << "  " << std::left << std::setw(25) << outcome.strategy
                    << " FAILED: " << outcome.reason << std::right << std::endl;
                return;
            }
            int solved = 0, timeouts = 0;
            long total = 0;
            for(const game_result_t &game : outcome.games){
                solved += game.solved;
                timeouts += game.timed_out;
                total += game.num_guesses;
            }
            std::ostringstream line;
            line << "  " << std::left << std::setw(25) << outcome.strategy << " done, "
                << solved << "/" << outcome.games.size() << " solved, mean "
                << std::fixed << std::setprecision(2)
                << (outcome.games.empty() ? 0.0 : static_cast<double>(total) / outcome.games.size());
            if(timeouts > 0) line << ", timeouts: " << timeouts;
            out << line.str() << std::endl;
        });
    round.elapsed = TIME(start, timestamp);

    for(const worker_outcome_t &outcome : outcomes){
        if(outcome.failed){
            round.failed.push_back(strategy_failure_t{outcome.strategy, outcome.reason});
        }
        else{
            round.strategies.push_back(summarize_games(outcome.strategy,
                outcome.games, args_.max_guesses));
        }
    }
    return round;
}

tournament_result_t Tournament::run(std::ostream &out){
    tournament_result_t result;
    status_.set_phase(PHASE_LOADING, "strategies");
    result.strategies = registry_->load(args_.filter, std::cerr);
    if(result.strategies.empty()){
        status_.set_phase(PHASE_FAILED, "no strategies");
        throw std::runtime_error("no strategies to run");
    }
    int repetitions = std::max(1, args_.repetitions);
    status_.begin_run(repetitions * static_cast<int>(args_.rounds.size()));

    out << "Strategies (" << result.strategies.size() << "):";
    for(const std::string &name : result.strategies) out << " " << name;
    out << "\nRounds: " << args_.rounds.size() << " configs x " << repetitions
        << " repetition(s) | Timeout: " << args_.limits.game_timeout
        << "s/game | Shock: " << args_.shock << std::endl;

    std::mt19937_64 master(args_.seed);
    try{
        for(int rep = 1; rep <= repetitions; rep++){
            for(const round_spec_t &spec : args_.rounds){
                uint64_t round_seed = master() % (1ULL << 31);
                round_result_t round = play_round(spec, rep, round_seed, result.strategies, out);
                print_round_summary(round, out);
                std::ostringstream line;
                line << "Elapsed: " << std::fixed << std::setprecision(1) << round.elapsed << "s";
                out << line.str() << std::endl;
                result.rounds.push_back(round);
                status_.round_done();
            }
        }
    }
    catch(const std::exception &e){
        status_.set_phase(PHASE_FAILED, e.what());
        throw;
    }
    result.leaderboard = compute_leaderboard(result.rounds);
    status_.set_phase(PHASE_DONE);
    return result;
}
