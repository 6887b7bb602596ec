/**
 * Header File for the tournament result artifact (JSON)
 * #include "report.h"
*/

#ifndef REPORT_H
#define REPORT_H

#include <string>
#include <nlohmann/json.hpp>
#include "tournament.h"

#define RESULTS_DIR "results"

// Keeps keys in insertion order
typedef nlohmann::ordered_json ordered_json;

/**
 * What the run was asked to do, echoed into the artifact
*/
struct report_config_t {
    std::string tournament_id;
    std::string name;
    bool official = true;
    std::string words_dir;
    tournament_args_t args;
};

/**
 * Local time as YYYYmmdd_HHMMSS, used as the run id
*/
std::string make_run_id();

/**
 * Local time in ISO 8601
*/
std::string iso_timestamp();

/**
 * Document layout:
 * {tournament_id, timestamp, config, rounds: [{round_id, word_length, mode,
 *  repetition, seed, num_games, elapsed, strategies: [...], failed: [...]}],
 *  leaderboard: [{rank, strategy, total_points, round_points,
 *  overall_solve_rate, overall_mean_guesses}]}
*/
ordered_json tournament_json(const report_config_t &config,
    const tournament_result_t &result, const std::string &stamp);

/**
 * Writes doc indented by two spaces, creating parent directories.
 * @throws std::runtime_error if the file cannot be written
*/
void save_json(const std::string &filename, const ordered_json &doc);

/**
 * tournament_json into a file.
*/
void save_tournament_json(const std::string &filename, const report_config_t &config,
    const tournament_result_t &result, const std::string &stamp);

#endif /* REPORT_H */
