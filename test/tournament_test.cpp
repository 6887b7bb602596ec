#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include "tournament.h"
#include "report.h"
#include "test_helpers.h"

static strategy_stats_t stats_with_mean(const std::string &name, double mean, double rate = 1.0){
    strategy_stats_t s;
    s.name = name;
    s.mean_guesses = mean;
    s.solve_rate = rate;
    return s;
}

static double points_of(const leaderboard_entry_t &e, const std::string &round_id){
    for(const auto &rp : e.round_points){
        if(rp.first == round_id) return rp.second;
    }
    return -1.0;
}

static const leaderboard_entry_t &entry_for(const std::vector<leaderboard_entry_t> &board,
    const std::string &name){
    for(const leaderboard_entry_t &e : board){
        if(e.strategy == name) return e;
    }
    throw std::runtime_error("no leaderboard entry for " + name);
}

TEST(Summary, AggregatesOneRound){
    std::vector<game_result_t> games(3);
    games[0].num_guesses = 3;
    games[0].solved = true;
    games[1].num_guesses = 4;
    games[1].solved = true;
    games[2].num_guesses = 7;
    games[2].timed_out = true;
    strategy_stats_t s = summarize_games("X", games, 6);
    EXPECT_EQ(s.games_played, 3);
    EXPECT_EQ(s.games_solved, 2);
    EXPECT_DOUBLE_EQ(s.solve_rate, 0.6667);
    EXPECT_DOUBLE_EQ(s.mean_guesses, 4.667);
    EXPECT_DOUBLE_EQ(s.median_guesses, 4.0);
    EXPECT_EQ(s.max_guesses, 7);
    EXPECT_EQ(s.timed_out, 1);
    ASSERT_EQ(s.guess_distribution.size(), 7u);
    EXPECT_EQ(s.guess_distribution[2], std::make_pair(std::string("3"), 1));
    EXPECT_EQ(s.guess_distribution[3], std::make_pair(std::string("4"), 1));
    EXPECT_EQ(s.guess_distribution[6], std::make_pair(std::string(FAILED_BUCKET), 1));
}

TEST(Summary, EvenCountMedian){
    std::vector<game_result_t> games(4);
    int guesses[] = {2, 5, 3, 4};
    for(int i = 0; i < 4; i++){
        games[i].num_guesses = guesses[i];
        games[i].solved = true;
    }
    EXPECT_DOUBLE_EQ(summarize_games("X", games, 6).median_guesses, 3.5);
}

TEST(Leaderboard, TiedStrategiesSharePoints){
    round_result_t round;
    round.round_id = "5_uniform";
    round.strategies = {stats_with_mean("C", 4.0), stats_with_mean("A", 3.5),
        stats_with_mean("E", 5.0), stats_with_mean("B", 3.5), stats_with_mean("D", 4.2)};
    std::vector<leaderboard_entry_t> board = compute_leaderboard({round});

    ASSERT_EQ(board.size(), 5u);
    EXPECT_DOUBLE_EQ(points_of(entry_for(board, "A"), "5_uniform"), 4.5);
    EXPECT_DOUBLE_EQ(points_of(entry_for(board, "B"), "5_uniform"), 4.5);
    EXPECT_DOUBLE_EQ(points_of(entry_for(board, "C"), "5_uniform"), 3.0);
    EXPECT_DOUBLE_EQ(points_of(entry_for(board, "D"), "5_uniform"), 2.0);
    EXPECT_DOUBLE_EQ(points_of(entry_for(board, "E"), "5_uniform"), 1.0);
    double total = 0.0;
    for(const leaderboard_entry_t &e : board) total += e.total_points;
    EXPECT_DOUBLE_EQ(total, 5 * 6 / 2.0);
    // equal points rank by name
    EXPECT_EQ(board[0].strategy, "A");
    EXPECT_EQ(board[1].strategy, "B");
    EXPECT_EQ(board[0].rank, 1);
    EXPECT_EQ(board[4].rank, 5);
}

TEST(Leaderboard, FullTieAndSumAcrossRounds){
    round_result_t r1, r2;
    r1.round_id = "4_uniform";
    r1.strategies = {stats_with_mean("A", 4.0, 1.0), stats_with_mean("B", 4.0, 0.5),
        stats_with_mean("C", 4.0, 0.0)};
    r2.round_id = "4_frequency";
    r2.strategies = {stats_with_mean("A", 3.0, 1.0), stats_with_mean("B", 5.0, 1.0)};
    std::vector<leaderboard_entry_t> board = compute_leaderboard({r1, r2});

    EXPECT_DOUBLE_EQ(points_of(entry_for(board, "C"), "4_uniform"), 2.0);
    EXPECT_DOUBLE_EQ(entry_for(board, "A").total_points, 4.0);
    EXPECT_DOUBLE_EQ(entry_for(board, "B").total_points, 3.0);
    EXPECT_DOUBLE_EQ(entry_for(board, "C").total_points, 2.0);
    EXPECT_DOUBLE_EQ(entry_for(board, "B").overall_solve_rate, 0.75);
    EXPECT_DOUBLE_EQ(entry_for(board, "B").overall_mean_guesses, 4.5);
    EXPECT_EQ(board.front().strategy, "A");
    EXPECT_EQ(entry_for(board, "C").round_points.size(), 1u);
}

TEST(Rounds, CanonicalMatrixAndIds){
    std::vector<round_spec_t> rounds = canonical_rounds();
    ASSERT_EQ(rounds.size(), 6u);
    EXPECT_EQ(make_round_id(rounds[0], 1, 1), "4_uniform");
    EXPECT_EQ(make_round_id(rounds[5], 2, 3), "6_frequency_r2");
}

TEST(Rounds, SecretSampleIsSeeded){
    wordlist_t vocab = all_words("abc", 3);
    wordlist_t a = sample_secrets(vocab, 5, 11);
    EXPECT_EQ(a.size(), 5u);
    EXPECT_EQ(a, sample_secrets(vocab, 5, 11));
    EXPECT_TRUE(std::is_sorted(a.begin(), a.end()));
    EXPECT_EQ(sample_secrets(vocab, 0, 11), vocab);
    EXPECT_EQ(sample_secrets(vocab, 100, 11), vocab);
}

TEST(RunStatus, SnapshotsWhileRunning){
    RunStatus status;
    EXPECT_EQ(status.snapshot().phase, PHASE_IDLE);
    status.begin_run(2);
    status.begin_round("4_uniform", 100);
    std::thread worker([&status](){
        for(int i = 0; i < 100; i++) status.job_done();
    });
    for(int i = 0; i < 50; i++){
        run_snapshot_t snap = status.snapshot();
        EXPECT_LE(snap.jobs_done, 100);
    }
    worker.join();
    status.round_done();
    run_snapshot_t snap = status.snapshot();
    EXPECT_EQ(snap.phase, PHASE_RUNNING);
    EXPECT_EQ(snap.jobs_done, 100);
    EXPECT_EQ(snap.rounds_done, 1);
    EXPECT_EQ(snap.round_id, "4_uniform");
    EXPECT_STREQ(phase_name(snap.phase), "running");
}

namespace {

/**
 * Throws on its first guess of every game
*/
class ThrowingStrategy : public Strategy {
public:
    std::string name() const override { return "Throwing"; }
    word_t guess(const history_t &history) override {
        (void)history;
        throw std::runtime_error("guess exploded");
    }
};

}

class TournamentTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.add("MaxProb", []() -> strategy_ptr { return std::make_unique<MaxProbStrategy>(); });
        registry.add("Random", []() -> strategy_ptr { return std::make_unique<RandomStrategy>(5); });
        registry.add("Throwing", []() -> strategy_ptr { return std::make_unique<ThrowingStrategy>(); });
        source = [](int length, prob_mode_t mode){
            EXPECT_EQ(length, 4);
            return test_lexicon({"aabb", "abab", "abcd", "dcba"}, mode, {1, 5, 2, 9});
        };
        args.rounds = {round_spec_t{4, MODE_UNIFORM}, round_spec_t{4, MODE_FREQUENCY}};
        args.repetitions = 2;
        args.seed = 123;
        args.shock = 0.1;
        args.limits.num_workers = 2;
        args.limits.game_timeout = 10.0;
    }
    StrategyRegistry registry;
    lexicon_source_t source;
    tournament_args_t args;
};

TEST_F(TournamentTest, FailingStrategyIsIsolated){
    Tournament tournament(registry, source, args);
    std::ostringstream out;
    tournament_result_t result = tournament.run(out);

    ASSERT_EQ(result.rounds.size(), 4u);
    EXPECT_EQ(result.rounds[0].round_id, "4_uniform_r1");
    EXPECT_EQ(result.rounds[3].round_id, "4_frequency_r2");
    for(const round_result_t &round : result.rounds){
        EXPECT_EQ(round.num_games, 4);
        ASSERT_EQ(round.strategies.size(), 2u);
        ASSERT_EQ(round.failed.size(), 1u);
        EXPECT_EQ(round.failed[0].name, "Throwing");
        EXPECT_NE(round.failed[0].reason.find("guess exploded"), std::string::npos);
        for(const strategy_stats_t &s : round.strategies){
            EXPECT_EQ(s.games_played, 4);
            EXPECT_EQ(s.games_solved, 4);
        }
    }
    ASSERT_EQ(result.leaderboard.size(), 2u);
    double total = 0.0;
    for(const leaderboard_entry_t &e : result.leaderboard) total += e.total_points;
    EXPECT_DOUBLE_EQ(total, 4 * 3.0);

    run_snapshot_t snap = tournament.status().snapshot();
    EXPECT_EQ(snap.phase, PHASE_DONE);
    EXPECT_EQ(snap.rounds_done, 4);
    EXPECT_EQ(snap.rounds_total, 4);
}

TEST_F(TournamentTest, SeedReplaysRounds){
    args.repetitions = 1;
    args.num_games = 2;
    args.filter = "MaxProb";
    std::ostringstream out;
    tournament_result_t a = Tournament(registry, source, args).run(out);
    tournament_result_t b = Tournament(registry, source, args).run(out);
    ASSERT_EQ(a.rounds.size(), 2u);
    EXPECT_EQ(a.strategies, std::vector<std::string>({"MaxProb"}));
    for(size_t i = 0; i < a.rounds.size(); i++){
        EXPECT_EQ(a.rounds[i].seed, b.rounds[i].seed);
        EXPECT_LT(a.rounds[i].seed, 1ULL << 31);
        EXPECT_EQ(a.rounds[i].num_games, 2);
        EXPECT_EQ(a.rounds[i].strategies[0].mean_guesses, b.rounds[i].strategies[0].mean_guesses);
    }
    EXPECT_NE(a.rounds[0].seed, a.rounds[1].seed);
}

TEST_F(TournamentTest, NothingToRun){
    args.filter = "Nobody";
    Tournament tournament(registry, source, args);
    std::ostringstream out;
    EXPECT_THROW(tournament.run(out), std::runtime_error);
    EXPECT_EQ(tournament.status().snapshot().phase, PHASE_FAILED);
}

TEST_F(TournamentTest, ResultDocument){
    args.repetitions = 1;
    std::ostringstream out;
    tournament_result_t result = Tournament(registry, source, args).run(out);
    report_config_t config;
    config.tournament_id = "20260101_000000";
    config.name = "nightly \"run\"";
    config.args = args;
    ordered_json doc = tournament_json(config, result, "2026-01-01T00:00:00");

    std::vector<std::string> keys;
    for(auto it = doc.begin(); it != doc.end(); ++it) keys.push_back(it.key());
    EXPECT_EQ(keys, std::vector<std::string>({"tournament_id", "timestamp", "config",
        "rounds", "leaderboard"}));
    EXPECT_EQ(doc["config"]["name"], "nightly \"run\"");
    EXPECT_TRUE(doc["config"]["num_games"].is_null());
    EXPECT_EQ(doc["config"]["rounds"].size(), 2u);

    const ordered_json &round = doc["rounds"][1];
    EXPECT_EQ(round["round_id"], "4_frequency");
    EXPECT_EQ(round["seed"].get<uint64_t>(), result.rounds[1].seed);
    ASSERT_EQ(round["failed"].size(), 1u);
    EXPECT_EQ(round["failed"][0]["name"], "Throwing");
    EXPECT_EQ(round["failed"][0]["reason"], "guess exploded");
    const ordered_json &hist = round["strategies"][0]["guess_distribution"];
    EXPECT_EQ(hist.begin().key(), "1");
    EXPECT_TRUE(hist.contains(FAILED_BUCKET));

    ASSERT_EQ(doc["leaderboard"].size(), 2u);
    EXPECT_EQ(doc["leaderboard"][0]["rank"], 1);
    EXPECT_TRUE(doc["leaderboard"][0]["round_points"].contains("4_uniform"));
}

TEST(Report, SaveCreatesDirectories){
    TempDir dir;
    report_config_t config;
    config.tournament_id = "x";
    config.name = "line\nbreak";
    std::string file = dir.file("runs/x/tournament_results.json");
    save_tournament_json(file, config, tournament_result_t(), "now");
    std::ifstream in(file);
    ASSERT_TRUE(in.good());
    nlohmann::json doc = nlohmann::json::parse(in);
    EXPECT_EQ(doc["tournament_id"], "x");
    EXPECT_EQ(doc["config"]["name"], "line\nbreak");
    EXPECT_TRUE(doc["rounds"].empty());
    EXPECT_TRUE(doc["leaderboard"].empty());
}
