#include "./log.hpp"

#include <atomic>
#include <csignal>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <unistd.h>

static std::atomic_int sink = ATOMIC_VAR_INIT(STDERR_FILENO);

static void write_all(std::queue<std::string>& q) {
    while (!q.empty()) {
        const std::string& s = q.front();
        std::size_t done = 0;
        while (done < s.size()) {
            ssize_t r = ::write(sink.load(std::memory_order_acquire),
                                s.data() + done, s.size() - done);
            if (r <= 0) {
                break;
            }
            done += static_cast<std::size_t>(r);
        }
        q.pop();
    }
}

struct ring {
    std::queue<std::string> collect;

    alignas(64) std::mutex mu;
    alignas(64) std::atomic_flag flag = ATOMIC_FLAG_INIT;
    std::atomic_flag quit = ATOMIC_FLAG_INIT;

    void push(std::string&& str) {
        {
            std::lock_guard lg(mu);
            collect.emplace(std::move(str));
            flag.test_and_set(std::memory_order_relaxed);
        }
        flag.notify_all();
    }
    std::queue<std::string> pop() {
        flag.wait(false);
        std::queue<std::string> r;
        {
            std::lock_guard lg(mu);
            r = std::move(collect);
            flag.clear(std::memory_order_relaxed);
        }
        return r;
    }
    void stop() noexcept(true) {
        quit.test_and_set();
        flag.test_and_set();
        flag.notify_all();
    }

    static std::jthread worker;
} static ring;

// stop requested by ~jthread also wakes the writer
std::jthread ring::worker([](std::stop_token token) {
    std::stop_callback cb(token, []() noexcept { ::ring.stop(); });
    sigset_t sig = {};
    sigaddset(&sig, SIGINT);
    pthread_sigmask(SIG_BLOCK, &sig, nullptr);
    while (!::ring.quit.test()) {
        auto&& q = ::ring.pop();
        write_all(q);
    }
    std::queue<std::string> rest;
    {
        std::lock_guard lg(::ring.mu);
        rest = std::move(::ring.collect);
    }
    write_all(rest);
});

void log_backend(std::string&& s) { ring.push(std::move(s)); }
void terminate_log_backend() noexcept(true) {
    ring.stop();
    if (ring::worker.joinable()) {
        ring::worker.join();
    }
}

void set_log_sink(int fd) noexcept(true) {
    int old = sink.exchange(fd, std::memory_order_acq_rel);
    if (old >= 3) {
        ::close(old);
    }
}
