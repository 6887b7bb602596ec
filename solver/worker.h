/**
 * Header File for isolated strategy workers: one forked process per
 * (strategy, round), pinned to one CPU, under a virtual memory cap, with a
 * hard per game deadline
 * #include "worker.h"
*/

#ifndef WORKER_H
#define WORKER_H

#include <csignal>
#include <functional>
#include <string>
#include <vector>
#include "game.h"
#include "strategy.h"

#define GAME_TIMEOUT 5.0     // seconds per game
#define MEMORY_LIMIT_MB 2048 // virtual memory per worker

struct worker_limits_t {
    double game_timeout = GAME_TIMEOUT;
    long memory_limit_mb = MEMORY_LIMIT_MB;
    // 0 sizes the pool to the available CPUs
    int num_workers = 0;
    // Checked by the coordinator, set from a signal handler
    const volatile std::sig_atomic_t *stop_flag = NULL;
};

/**
 * Everything one strategy produced in one round. A failed outcome carries
 * the reason and no games.
*/
struct worker_outcome_t {
    std::string strategy;
    bool failed = false;
    std::string reason;
    std::vector<game_result_t> games;
};

typedef std::function<void(const worker_outcome_t &)> outcome_callback_t;

/**
 * CPUs this process may run on.
*/
std::vector<int> available_cpus();

/**
 * Pin the calling process to cpu (if >= 0) and cap its address space.
 * Failures are reported on stderr; the worker still runs.
*/
void apply_resource_limits(int cpu, long memory_limit_mb);

/**
 * Plays secrets[first..] with one strategy instance, strictly in order.
 * Progress is reported as text lines on out_fd:
 *   S <i>                     game i started
 *   R <i> <guesses> <solved>  game i finished
 * end_game is called for every finished game.
 * @throws whatever the strategy or the session throws
*/
void play_games(Strategy &strategy, const game_config_t &config,
    const wordlist_t &secrets, size_t first, int out_fd);

/**
 * Runs every strategy against the same secrets, each in its own worker
 * process, at most limits.num_workers at a time. A game that runs past the
 * deadline is scored unsolved with max_guesses + 1 guesses and timed_out set;
 * its worker is killed and a fresh one continues at the next secret. A worker
 * that dies any other way fails only its own strategy.
 * @param on_done Called in completion order as each strategy finishes
 * @returns one outcome per strategy, in the order given
 * @throws std::runtime_error if the stop flag is raised (workers are killed)
*/
std::vector<worker_outcome_t> run_worker_pool(const StrategyRegistry &registry,
    const std::vector<std::string> &strategies, const game_config_t &config,
    const wordlist_t &secrets, const worker_limits_t &limits,
    const outcome_callback_t &on_done = outcome_callback_t());

#endif /* WORKER_H */
