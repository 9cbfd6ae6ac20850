// census_core.h - Core functionality for the directory census browser
#ifndef CENSUS_CORE_H
#define CENSUS_CORE_H

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// Constants for performance tuning
constexpr size_t THREAD_POOL_SIZE = 0;  // 0 = auto-detect
constexpr size_t FALLBACK_THREAD_COUNT = 4;
constexpr size_t CACHE_SHARDS = 16;
constexpr int DEFAULT_POLL_INTERVAL_MS = 100;
constexpr int MAX_POLL_INTERVAL_MS = 60000;
constexpr size_t MAX_THREAD_COUNT = 256;

// Configuration structure
struct Config {
    size_t thread_count = THREAD_POOL_SIZE;
    int poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;
    bool no_colors = false;
    bool no_mouse = false;
    fs::path log_path;
    fs::path start_dir;
};

// Diagnostics go to stderr unless a log file has been opened.
bool open_log_file(const fs::path& path);
void close_log_file();
// While held, stderr lines are queued instead of written (curses owns the
// terminal). Releasing prints the queued lines in order.
void hold_console_log();
void release_console_log();
void log_warning(const std::string& message);
void log_error(const std::string& message);

// Parses a whole-string integer in [min_value, max_value]. Anything else is
// reported through log_error and leaves `value` unspecified.
bool parse_number(const std::string& option, const std::string& text, long min_value, long max_value,
                  long& value);

// Recursive file count. Symlinked directories are followed once per canonical
// target; unreadable entries and directories contribute nothing.
size_t count_files(const fs::path& root);

// Same traversal, but gives up between directories once `stop` is set.
// Returns std::nullopt when the traversal was interrupted.
std::optional<size_t> count_files_until(const fs::path& root, const std::atomic<bool>& stop);

enum class CountState {
    Absent,
    InFlight,
    Ready
};

// Concurrent path -> file count table, sharded by path hash.
// Slots are never evicted and never revalidated against the filesystem.
class CensusCache {
private:
    struct Slot {
        CountState state = CountState::Absent;
        size_t count = 0;
    };

    struct Shard {
        std::unordered_map<std::string, Slot> slots;
        mutable std::mutex mutex;
    };

    std::array<Shard, CACHE_SHARDS> shards;

    Shard& shard_for(const std::string& key);
    const Shard& shard_for(const std::string& key) const;

public:
    CensusCache() = default;
    CensusCache(const CensusCache&) = delete;
    CensusCache& operator=(const CensusCache&) = delete;

    std::optional<size_t> get(const fs::path& path) const;
    void insert(const fs::path& path, size_t count);

    // Absent -> InFlight. Only the caller that gets true may compute the count.
    bool try_claim(const fs::path& path);

    // InFlight -> Absent, for a job that stopped before it had a result.
    void release(const fs::path& path);

    CountState state(const fs::path& path) const;
    size_t size() const;
};

struct CountResult {
    fs::path path;
    size_t count = 0;
};

// Many producers (workers), one consumer (the navigation engine).
class ResultChannel {
private:
    std::deque<CountResult> messages;
    mutable std::mutex mutex;
    bool closed = false;

public:
    // Returns false once the channel has been closed.
    bool send(CountResult result);
    std::optional<CountResult> try_receive();
    void close();
    bool is_closed() const;
    size_t pending() const;
};

// Fixed-size thread pool. Jobs queue without limit; on destruction the
// queued jobs are dropped and running ones are joined.
class ThreadPool {
private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex queue_mutex;
    std::condition_variable condition;
    std::condition_variable finished;
    bool stop = false;
    size_t active_tasks = 0;
    size_t num_threads;

    void worker_thread();

public:
    explicit ThreadPool(size_t threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<class F>
    void enqueue(F&& f);

    void wait_all();
    size_t size() const { return num_threads; }
};

// Runs counting jobs on the pool, publishing each result to the cache
// and then to the result channel.
class CensusDispatcher {
private:
    std::shared_ptr<CensusCache> cache;
    std::shared_ptr<ResultChannel> channel;
    std::shared_ptr<std::atomic<bool>> stopping;
    std::atomic<size_t> submitted{0};
    ThreadPool pool;  // last member: joined before the rest is torn down

public:
    CensusDispatcher(std::shared_ptr<CensusCache> census_cache,
                     std::shared_ptr<ResultChannel> result_channel,
                     size_t threads = THREAD_POOL_SIZE);
    ~CensusDispatcher();

    // Fire-and-forget. The job always runs to completion unless the
    // dispatcher itself is being destroyed.
    void submit(const fs::path& path);

    // Cached count if ready; otherwise submits a job unless one is in flight.
    std::optional<size_t> request(const fs::path& path);

    void wait_idle();
    size_t submitted_jobs() const { return submitted.load(); }
    size_t thread_count() const { return pool.size(); }
};

// Text helpers
// Decodes one UTF-8 sequence at `pos` and advances past it. Returns false
// (leaving `pos` unchanged) on malformed input.
bool decode_utf8(const std::string& text, size_t& pos, char32_t& code_point);
void append_utf8(std::string& out, char32_t code_point);
bool is_valid_utf8(const std::string& text);
std::string display_name(const fs::path& path);
size_t display_width(const std::string& text);
int wrapped_height(const std::string& text, int max_width);
std::string fit_to_width(const std::string& text, size_t max_width);
fs::path normalize_start_dir(const fs::path& path);

// Template implementation for ThreadPool
template<class F>
void ThreadPool::enqueue(F&& f) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stop) return;
        tasks.emplace(std::forward<F>(f));
    }
    condition.notify_one();
}

#endif // CENSUS_CORE_H
