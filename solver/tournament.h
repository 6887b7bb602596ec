/**
 * Header File for the tournament: rounds, aggregation and the leaderboard
 * #include "tournament.h"
*/

#ifndef TOURNAMENT_H
#define TOURNAMENT_H

#include <cstdint>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "word.h"
#include "utils.h"
#include "game.h"
#include "strategy.h"
#include "worker.h"

#define DEFAULT_SEED 42
#define FAILED_BUCKET "failed"

/**
 * Aggregated stats of one strategy in one round
*/
struct strategy_stats_t {
    std::string name;
    int games_played = 0;
    int games_solved = 0;
    double solve_rate = 0.0;   // rounded to 4 decimals
    double mean_guesses = 0.0; // rounded to 3 decimals
    double median_guesses = 0.0;
    int max_guesses = 0;
    int timed_out = 0;
    // "1".."max_guesses" then "failed"
    std::vector<std::pair<std::string, int>> guess_distribution;
};

struct strategy_failure_t {
    std::string name;
    std::string reason;
};

struct round_spec_t {
    int word_length;
    prob_mode_t mode;
};

struct round_result_t {
    std::string round_id;
    int word_length = 0;
    prob_mode_t mode = MODE_UNIFORM;
    int repetition = 1;
    uint64_t seed = 0;
    int num_games = 0;
    double elapsed = 0.0;
    std::vector<strategy_stats_t> strategies;
    std::vector<strategy_failure_t> failed;
};

struct leaderboard_entry_t {
    int rank = 0;
    std::string strategy;
    double total_points = 0.0;
    // round_id -> points, in round order
    std::vector<std::pair<std::string, double>> round_points;
    double overall_solve_rate = 0.0;
    double overall_mean_guesses = 0.0;
};

/**
 * Per strategy aggregation of one round. Unsolved and timed out games land
 * in the "failed" bucket with their recorded guess count.
*/
strategy_stats_t summarize_games(const std::string &name,
    const std::vector<game_result_t> &games, int max_guesses);

/**
 * Points per round: strategies ranked by ascending mean guesses get N - rank + 1,
 * a tied block shares the mean of the points it spans. Entries are sorted
 * by total points, best first, ranks start at 1.
*/
std::vector<leaderboard_entry_t> compute_leaderboard(const std::vector<round_result_t> &rounds);

/**
 * Seeded sample of num_games secrets in vocabulary order. num_games <= 0 or
 * at least the vocabulary size returns the whole vocabulary.
*/
wordlist_t sample_secrets(const wordlist_t &vocabulary, int num_games, uint64_t seed);

/**
 * {4, 5, 6} x {uniform, frequency}
*/
std::vector<round_spec_t> canonical_rounds();

/**
 * <L>_<mode>, with _r<rep> appended when there is more than one repetition.
*/
std::string make_round_id(const round_spec_t &spec, int repetition, int repetitions);

void print_round_summary(const round_result_t &round, std::ostream &out);
void print_leaderboard(const std::vector<leaderboard_entry_t> &entries, std::ostream &out);

/**
 * Where the tournament gets its vocabularies from.
*/
typedef std::function<lexicon_t(int word_length, prob_mode_t mode)> lexicon_source_t;

struct tournament_args_t {
    std::vector<round_spec_t> rounds = canonical_rounds();
    int repetitions = 1;
    // <= 0 plays every vocabulary word
    int num_games = 0;
    uint64_t seed = DEFAULT_SEED;
    int max_guesses = MAX_GUESSES;
    bool allow_non_words = true;
    // Noise scale applied to frequency rounds, 0 for none
    double shock = 0.0;
    worker_limits_t limits;
    // Only strategies whose name contains this
    std::string filter;
    bool verbose = false;
};

struct tournament_result_t {
    std::vector<std::string> strategies;
    std::vector<round_result_t> rounds;
    std::vector<leaderboard_entry_t> leaderboard;
};

typedef enum run_phase {
    PHASE_IDLE,
    PHASE_LOADING,
    PHASE_RUNNING,
    PHASE_DONE,
    PHASE_FAILED
} run_phase_t;

const char *phase_name(run_phase_t phase);

struct run_snapshot_t {
    run_phase_t phase = PHASE_IDLE;
    std::string round_id;
    int rounds_done = 0;
    int rounds_total = 0;
    int jobs_done = 0;
    int jobs_total = 0;
    std::string message;
};

/**
 * Progress of one tournament run. Every accessor takes the lock, so other
 * threads may poll snapshot() while the run is going.
*/
class RunStatus {
public:
    void set_phase(run_phase_t phase, const std::string &message = std::string());
    void begin_run(int rounds_total);
    void begin_round(const std::string &round_id, int jobs_total);
    void job_done();
    void round_done();
    run_snapshot_t snapshot() const;

private:
    mutable std::mutex mutex_;
    run_snapshot_t state_;
};

/**
 * Runs every loaded strategy through every round and repetition.
 * Round seeds are drawn in order from a generator seeded with args.seed, so
 * equal seeds replay the same secrets and perturbations.
*/
class Tournament {
public:
    Tournament(const StrategyRegistry &registry, lexicon_source_t source,
        const tournament_args_t &args);

    /**
     * @param out Progress and summaries
     * @throws std::runtime_error if no strategy loads or the run is stopped
    */
    tournament_result_t run(std::ostream &out);

    const RunStatus &status() const { return status_; }

private:
    round_result_t play_round(const round_spec_t &spec, int repetition,
        uint64_t seed, const std::vector<std::string> &strategies, std::ostream &out);

    const StrategyRegistry *registry_;
    lexicon_source_t source_;
    tournament_args_t args_;
    RunStatus status_;
};

#endif /* TOURNAMENT_H */
