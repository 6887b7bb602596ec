#include "worker.h"
#include "errors.h"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <new>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

// Worker exit codes
#define EXIT_STRATEGY_ERROR 2
#define EXIT_OUT_OF_MEMORY 3
#define EXIT_PIPE_CLOSED 4
#define EXIT_ORPHANED 5

#define POLL_INTERVAL_MS 1000

typedef std::chrono::steady_clock clock_type;

std::vector<int> available_cpus(){
    std::vector<int> out;
    cpu_set_t set;
    CPU_ZERO(&set);
    if(sched_getaffinity(0, sizeof(set), &set) == 0){
        for(int i = 0; i < CPU_SETSIZE; i++){
            if(CPU_ISSET(i, &set)) out.push_back(i);
        }
    }
    if(out.empty()){
        long n = sysconf(_SC_NPROCESSORS_ONLN);
        for(long i = 0; i < std::max(n, 1L); i++) out.push_back(static_cast<int>(i));
    }
    return out;
}

void apply_resource_limits(int cpu, long memory_limit_mb){
    if(cpu >= 0){
        cpu_set_t set;
        CPU_ZERO(&set);
        CPU_SET(cpu, &set);
        if(sched_setaffinity(0, sizeof(set), &set) != 0){
            std::cerr << "  [warn] worker " << getpid() << " cannot pin to cpu "
                << cpu << ": " << std::strerror(errno) << "\n";
        }
    }
    if(memory_limit_mb > 0){
        struct rlimit lim;
        lim.rlim_cur = static_cast<rlim_t>(memory_limit_mb) * 1024 * 1024;
        lim.rlim_max = lim.rlim_cur;
        // Fallback: data segment limit
        if(setrlimit(RLIMIT_AS, &lim) != 0 && setrlimit(RLIMIT_DATA, &lim) != 0){
            std::cerr << "  [warn] worker " << getpid() << " cannot cap memory: "
                << std::strerror(errno) << "\n";
        }
    }
}

static bool write_line(int fd, const std::string &text){
    std::string line = text + "\n";
    size_t off = 0;
    while(off < line.size()){
        ssize_t n = write(fd, line.data() + off, line.size() - off);
        if(n < 0){
            if(errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

void play_games(Strategy &strategy, const game_config_t &config,
    const wordlist_t &secrets, size_t first, int out_fd){
    GameSession session(config);
    for(size_t i = first; i < secrets.size(); i++){
        if(!write_line(out_fd, "S " + std::to_string(i)))
            throw std::runtime_error("result pipe closed");
        session.reset(secrets[i]);
        strategy.begin_game(config);
        while(!session.game_over()){
            word_t word = strategy.guess(session.history());
            session.guess(word);
        }
        strategy.end_game(session.secret(), session.is_solved(), session.num_guesses());
        std::ostringstream msg;
        msg << "R " << i << " " << session.num_guesses() << " " << (session.is_solved() ? 1 : 0);
        if(!write_line(out_fd, msg.str()))
            throw std::runtime_error("result pipe closed");
    }
}

/**
 * Body of a worker process. Never returns into the caller's stack frames
 * above fork(), the exit code is handed to _exit.
*/
static int run_child(const StrategyRegistry &registry, const std::string &name,
    const game_config_t &config, const wordlist_t &secrets, size_t first, int fd){
    std::string failure;
    int code = 0;
    try{
        strategy_ptr strategy = registry.create(name);
        play_games(*strategy, config, secrets, first, fd);
    }
    catch(const std::bad_alloc &){
        failure = "memory limit exceeded";
        code = EXIT_OUT_OF_MEMORY;
    }
    catch(const std::exception &e){
        failure = e.what();
        code = EXIT_STRATEGY_ERROR;
    }
    if(code != 0){
        std::replace(failure.begin(), failure.end(), '\n', ' ');
        if(!write_line(fd, "F " + failure)) return EXIT_PIPE_CLOSED;
        return code;
    }
    if(!write_line(fd, "D")) return EXIT_PIPE_CLOSED;
    return 0;
}

static pid_t spawn_worker(const StrategyRegistry &registry, const std::string &name,
    const game_config_t &config, const wordlist_t &secrets, size_t first,
    int cpu, long memory_limit_mb, int &read_fd){
    int fds[2];
    if(pipe(fds) != 0)
        throw std::runtime_error(std::string("pipe: ") + std::strerror(errno));
    pid_t parent = getpid();
    std::cout.flush();
    std::cerr.flush();
    pid_t pid = fork();
    if(pid < 0){
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        throw std::runtime_error(std::string("fork: ") + std::strerror(err));
    }
    if(pid == 0){
        close(fds[0]);
        // Die with the coordinator instead of running on as an orphan
        if(prctl(PR_SET_PDEATHSIG, SIGKILL) != 0 || getppid() != parent)
            _exit(EXIT_ORPHANED);
        apply_resource_limits(cpu, memory_limit_mb);
        _exit(run_child(registry, name, config, secrets, first, fds[1]));
    }
    close(fds[1]);
    if(fcntl(fds[0], F_SETFL, O_NONBLOCK) != 0){
        int err = errno;
        close(fds[0]);
        kill(pid, SIGKILL);
        waitpid(pid, NULL, 0);
        throw std::runtime_error(std::string("fcntl: ") + std::strerror(err));
    }
    read_fd = fds[0];
    return pid;
}

namespace {

struct active_worker_t {
    size_t job = 0;
    int slot = 0;
    pid_t pid = -1;
    int fd = -1;
    bool in_game = false;
    size_t current = 0;
    bool done = false;
    std::string failure;
    std::string buffer;
    clock_type::time_point started;
};

}

static void handle_line(active_worker_t &w, const std::string &line,
    worker_outcome_t &outcome, const wordlist_t &secrets){
    if(line.empty()) return;
    std::istringstream ss(line.substr(1));
    switch(line[0]){
    case 'S':
        ss >> w.current;
        w.in_game = true;
        w.started = clock_type::now();
        break;
    case 'R': {
        size_t index = 0;
        int guesses = 0, solved = 0;
        ss >> index >> guesses >> solved;
        game_result_t r;
        r.strategy = outcome.strategy;
        r.secret = (index < secrets.size()) ? secrets[index] : word_t();
        r.num_guesses = guesses;
        r.solved = solved != 0;
        outcome.games.push_back(r);
        w.in_game = false;
        break;
    }
    case 'F':
        w.failure = (line.size() > 2) ? line.substr(2) : "unknown failure";
        break;
    case 'D':
        w.done = true;
        break;
    default:
        break;
    }
}

/**
 * Reads whatever the worker wrote so far. @returns true at end of stream
*/
static bool drain(active_worker_t &w, worker_outcome_t &outcome, const wordlist_t &secrets){
    char buf[4096];
    while(true){
        ssize_t n = read(w.fd, buf, sizeof(buf));
        if(n > 0){
            w.buffer.append(buf, static_cast<size_t>(n));
            size_t nl;
            while((nl = w.buffer.find('\n')) != std::string::npos){
                handle_line(w, w.buffer.substr(0, nl), outcome, secrets);
                w.buffer.erase(0, nl + 1);
            }
            continue;
        }
        if(n == 0) return true;
        if(errno == EINTR) continue;
        if(errno == EAGAIN || errno == EWOULDBLOCK) return false;
        return true;
    }
}

static int reap(pid_t pid){
    int status = 0;
    while(waitpid(pid, &status, 0) < 0){
        if(errno != EINTR) return -1;
    }
    return status;
}

static std::string describe_status(int status){
    std::ostringstream out;
    if(status < 0) out << "worker vanished";
    else if(WIFSIGNALED(status))
        out << "worker killed by signal " << WTERMSIG(status) << " (" << strsignal(WTERMSIG(status)) << ")";
    else if(WIFEXITED(status))
        out << "worker exited with code " << WEXITSTATUS(status);
    else
        out << "worker stopped";
    return out.str();
}

static void kill_worker(active_worker_t &w){
    if(kill(w.pid, SIGKILL) != 0 && errno != ESRCH){
        std::cerr << "  [warn] cannot kill worker " << w.pid << ": " << std::strerror(errno) << "\n";
    }
    reap(w.pid);
    close(w.fd);
    w.fd = -1;
}

std::vector<worker_outcome_t> run_worker_pool(const StrategyRegistry &registry,
    const std::vector<std::string> &strategies, const game_config_t &config,
    const wordlist_t &secrets, const worker_limits_t &limits,
    const outcome_callback_t &on_done){
    std::vector<worker_outcome_t> outcomes(strategies.size());
    for(size_t i = 0; i < strategies.size(); i++) outcomes[i].strategy = strategies[i];
    if(strategies.empty()) return outcomes;

    std::vector<int> cpus = available_cpus();
    size_t pool = (limits.num_workers > 0) ? static_cast<size_t>(limits.num_workers) : cpus.size();
    pool = std::max<size_t>(1, std::min(pool, strategies.size()));
    std::vector<bool> slot_busy(pool, false);
    auto deadline = std::chrono::duration_cast<clock_type::duration>(
        std::chrono::duration<double>(limits.game_timeout));

    std::vector<active_worker_t> active;
    size_t next_job = 0;

    auto launch = [&](size_t job, size_t first, int slot){
        active_worker_t w;
        w.job = job;
        w.slot = slot;
        w.current = first;
        w.pid = spawn_worker(registry, strategies[job], config, secrets, first,
            cpus[slot % cpus.size()], limits.memory_limit_mb, w.fd);
        return w;
    };

    auto finish = [&](active_worker_t &w, int status){
        worker_outcome_t &outcome = outcomes[w.job];
        if(!w.failure.empty() || !w.done || !WIFEXITED(status) || WEXITSTATUS(status) != 0){
            outcome.failed = true;
            outcome.reason = w.failure.empty() ? describe_status(status) : w.failure;
            outcome.games.clear();
        }
        slot_busy[w.slot] = false;
        if(on_done) on_done(outcome);
    };

    while(next_job < strategies.size() || !active.empty()){
        if(limits.stop_flag != NULL && *limits.stop_flag){
            for(active_worker_t &w : active) kill_worker(w);
            throw std::runtime_error("tournament interrupted");
        }
        while(active.size() < pool && next_job < strategies.size()){
            int slot = static_cast<int>(std::find(slot_busy.begin(), slot_busy.end(), false) - slot_busy.begin());
            slot_busy[slot] = true;
            active.push_back(launch(next_job++, 0, slot));
        }

        // Sleep until output arrives or the nearest game deadline passes
        clock_type::time_point now = clock_type::now();
        long timeout_ms = POLL_INTERVAL_MS;
        std::vector<pollfd> fds(active.size());
        for(size_t k = 0; k < active.size(); k++){
            fds[k].fd = active[k].fd;
            fds[k].events = POLLIN;
            fds[k].revents = 0;
            if(active[k].in_game){
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    active[k].started + deadline - now).count() + 1;
                timeout_ms = std::max(0L, std::min<long>(timeout_ms, left));
            }
        }
        if(poll(fds.data(), fds.size(), static_cast<int>(timeout_ms)) < 0){
            if(errno == EINTR) continue;
            throw std::runtime_error(std::string("poll: ") + std::strerror(errno));
        }

        now = clock_type::now();
        for(size_t k = active.size(); k-- > 0;){
            active_worker_t &w = active[k];
            worker_outcome_t &outcome = outcomes[w.job];
            bool eof = false;
            if(fds[k].revents != 0) eof = drain(w, outcome, secrets);
            else if(w.in_game && now - w.started > deadline) eof = drain(w, outcome, secrets);

            if(eof){
                close(w.fd);
                finish(w, reap(w.pid));
                active.erase(active.begin() + k);
                continue;
            }
            if(!w.in_game || now - w.started <= deadline) continue;

            // Deadline passed: abandon the game and the process running it
            kill_worker(w);
            game_result_t r;
            r.strategy = outcome.strategy;
            r.secret = secrets[w.current];
            r.num_guesses = config.max_guesses + 1;
            r.solved = false;
            r.timed_out = true;
            outcome.games.push_back(r);

            if(w.current + 1 < secrets.size()){
                active[k] = launch(w.job, w.current + 1, w.slot);
            }
            else{
                w.done = true;
                slot_busy[w.slot] = false;
                if(on_done) on_done(outcome);
                active.erase(active.begin() + k);
            }
        }
    }
    return outcomes;
}
