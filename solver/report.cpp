#include "report.h"
#include "checkpoint.h"
#include <ctime>
#include <fstream>
#include <stdexcept>

static std::string format_time(const char *format){
    std::time_t now = std::time(NULL);
    std::tm local;
    localtime_r(&now, &local);
    char buf[64];
    if(std::strftime(buf, sizeof(buf), format, &local) == 0) return std::string();
    return buf;
}

std::string make_run_id(){
    return format_time("%Y%m%d_%H%M%S");
}

std::string iso_timestamp(){
    return format_time("%Y-%m-%dT%H:%M:%S");
}

static ordered_json config_json(const report_config_t &config){
    const tournament_args_t &args = config.args;
    ordered_json doc;
    doc["tournament_id"] = config.tournament_id;
    doc["name"] = config.name.empty() ? ordered_json(nullptr) : ordered_json(config.name);
    doc["official"] = config.official;
    doc["words_dir"] = config.words_dir;
    doc["master_seed"] = args.seed;
    doc["num_games"] = args.num_games > 0 ? ordered_json(args.num_games) : ordered_json(nullptr);
    doc["repetitions"] = args.repetitions;
    doc["shock_scale"] = args.shock;
    doc["game_timeout"] = args.limits.game_timeout;
    doc["memory_limit_mb"] = args.limits.memory_limit_mb;
    doc["workers"] = args.limits.num_workers;
    doc["max_guesses"] = args.max_guesses;
    doc["allow_non_words"] = args.allow_non_words;
    doc["filter"] = args.filter;
    ordered_json rounds = ordered_json::array();
    for(const round_spec_t &spec : args.rounds){
        rounds.push_back(ordered_json{{"word_length", spec.word_length}, {"mode", mode_name(spec.mode)}});
    }
    doc["rounds"] = rounds;
    return doc;
}

static ordered_json stats_json(const strategy_stats_t &s){
    ordered_json distribution = ordered_json::object();
    for(const auto &bucket : s.guess_distribution) distribution[bucket.first] = bucket.second;
    return {
        {"name", s.name},
        {"games_played", s.games_played},
        {"games_solved", s.games_solved},
        {"solve_rate", s.solve_rate},
        {"mean_guesses", s.mean_guesses},
        {"median_guesses", s.median_guesses},
        {"max_guesses", s.max_guesses},
        {"timed_out", s.timed_out},
        {"guess_distribution", distribution}
    };
}

static ordered_json round_json(const round_result_t &round){
    ordered_json strategies = ordered_json::array();
    for(const strategy_stats_t &s : round.strategies) strategies.push_back(stats_json(s));
    ordered_json failed = ordered_json::array();
    for(const strategy_failure_t &f : round.failed){
        failed.push_back(ordered_json{{"name", f.name}, {"reason", f.reason}});
    }
    return {
        {"round_id", round.round_id},
        {"word_length", round.word_length},
        {"mode", mode_name(round.mode)},
        {"repetition", round.repetition},
        {"seed", round.seed},
        {"num_games", round.num_games},
        {"elapsed", round.elapsed},
        {"strategies", strategies},
        {"failed", failed}
    };
}

static ordered_json entry_json(const leaderboard_entry_t &e){
    ordered_json points = ordered_json::object();
    for(const auto &rp : e.round_points) points[rp.first] = rp.second;
    return {
        {"rank", e.rank},
        {"strategy", e.strategy},
        {"total_points", e.total_points},
        {"round_points", points},
        {"overall_solve_rate", e.overall_solve_rate},
        {"overall_mean_guesses", e.overall_mean_guesses}
    };
}

ordered_json tournament_json(const report_config_t &config,
    const tournament_result_t &result, const std::string &stamp){
    ordered_json rounds = ordered_json::array();
    for(const round_result_t &round : result.rounds) rounds.push_back(round_json(round));
    ordered_json leaderboard = ordered_json::array();
    for(const leaderboard_entry_t &e : result.leaderboard) leaderboard.push_back(entry_json(e));

    ordered_json doc;
    doc["tournament_id"] = config.tournament_id;
    doc["timestamp"] = stamp;
    doc["config"] = config_json(config);
    doc["rounds"] = rounds;
    doc["leaderboard"] = leaderboard;
    return doc;
}

void save_json(const std::string &filename, const ordered_json &doc){
    size_t slash = filename.find_last_of('/');
    if(slash != std::string::npos && slash > 0) make_dirs(filename.substr(0, slash));
    std::ofstream out(filename);
    if(!out) throw std::runtime_error("cannot open " + filename + " for writing");
    out << doc.dump(2) << "\n";
    out.flush();
    if(!out) throw std::runtime_error("failed writing " + filename);
}

void save_tournament_json(const std::string &filename, const report_config_t &config,
    const tournament_result_t &result, const std::string &stamp){
    save_json(filename, tournament_json(config, result, stamp));
}
