// census_core.cpp - Core functionality implementation
#include "census_core.h"

#include <cwchar>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace {

std::mutex log_mutex;
std::ofstream log_file;
bool console_held = false;
std::vector<std::string> held_messages;

void write_log(const char* prefix, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        std::time_t now = std::time(nullptr);
        char time_buffer[20];
        std::tm* tm = std::localtime(&now);
        if (tm) {
            std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%d %H:%M:%S", tm);
        } else {
            time_buffer[0] = '\0';
        }
        log_file << time_buffer << " " << prefix << message << "\n" << std::flush;
        return;
    }
    if (console_held) {
        held_messages.push_back(prefix + message);
        return;
    }
    std::cerr << prefix << message << "\n";
}

} // namespace

bool open_log_file(const fs::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_file.open(path, std::ios::out | std::ios::app);
    return log_file.is_open();
}

void close_log_file() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
}

void hold_console_log() {
    std::lock_guard<std::mutex> lock(log_mutex);
    console_held = true;
}

void release_console_log() {
    std::lock_guard<std::mutex> lock(log_mutex);
    console_held = false;
    for (const auto& line : held_messages) {
        std::cerr << line << "\n";
    }
    held_messages.clear();
}

void log_warning(const std::string& message) {
    write_log("Warning: ", message);
}

void log_error(const std::string& message) {
    write_log("Error: ", message);
}

bool parse_number(const std::string& option, const std::string& text, long min_value, long max_value,
                  long& value) {
    try {
        size_t consumed = 0;
        value = std::stol(text, &consumed);
        if (consumed == text.size() && value >= min_value && value <= max_value) {
            return true;
        }
    } catch (const std::exception&) {
        // reported below
    }
    log_error("Invalid value for " + option + ": " + text + " (expected " + std::to_string(min_value) +
              "-" + std::to_string(max_value) + ")");
    return false;
}

// Iterative traversal with an explicit stack; directories are resolved to
// their canonical form only when they are visited.
std::optional<size_t> count_files_until(const fs::path& root, const std::atomic<bool>& stop) {
    size_t count = 0;
    std::vector<fs::path> dirs_to_visit;
    std::unordered_set<std::string> visited;

    dirs_to_visit.push_back(root);

    while (!dirs_to_visit.empty()) {
        if (stop.load(std::memory_order_relaxed)) {
            return std::nullopt;
        }

        fs::path current_dir = std::move(dirs_to_visit.back());
        dirs_to_visit.pop_back();

        std::error_code ec;
        fs::path real_dir = fs::canonical(current_dir, ec);
        if (ec) {
            continue;
        }

        if (!visited.insert(real_dir.string()).second) {
            continue;
        }

        const fs::directory_iterator end;
        for (fs::directory_iterator it(real_dir, fs::directory_options::skip_permission_denied, ec);
             !ec && it != end; it.increment(ec)) {
            std::error_code status_ec;
            if (it->is_regular_file(status_ec)) {
                count++;
            } else if (!status_ec && it->is_directory(status_ec)) {
                dirs_to_visit.push_back(it->path());
            }
        }
    }

    return count;
}

size_t count_files(const fs::path& root) {
    const std::atomic<bool> never_stop{false};
    return count_files_until(root, never_stop).value_or(0);
}

// CensusCache implementation
CensusCache::Shard& CensusCache::shard_for(const std::string& key) {
    return shards[std::hash<std::string>()(key) % CACHE_SHARDS];
}

const CensusCache::Shard& CensusCache::shard_for(const std::string& key) const {
    return shards[std::hash<std::string>()(key) % CACHE_SHARDS];
}

std::optional<size_t> CensusCache::get(const fs::path& path) const {
    const std::string& key = path.native();
    const Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.slots.find(key);
    if (it == shard.slots.end() || it->second.state != CountState::Ready) {
        return std::nullopt;
    }
    return it->second.count;
}

void CensusCache::insert(const fs::path& path, size_t count) {
    const std::string& key = path.native();
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    Slot& slot = shard.slots[key];
    slot.state = CountState::Ready;
    slot.count = count;
}

bool CensusCache::try_claim(const fs::path& path) {
    const std::string& key = path.native();
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    Slot& slot = shard.slots[key];
    if (slot.state != CountState::Absent) {
        return false;
    }
    slot.state = CountState::InFlight;
    return true;
}

void CensusCache::release(const fs::path& path) {
    const std::string& key = path.native();
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.slots.find(key);
    if (it != shard.slots.end() && it->second.state == CountState::InFlight) {
        it->second.state = CountState::Absent;
    }
}

CountState CensusCache::state(const fs::path& path) const {
    const std::string& key = path.native();
    const Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.slots.find(key);
    return it == shard.slots.end() ? CountState::Absent : it->second.state;
}

size_t CensusCache::size() const {
    size_t ready = 0;
    for (const Shard& shard : shards) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& kv : shard.slots) {
            if (kv.second.state == CountState::Ready) {
                ready++;
            }
        }
    }
    return ready;
}

// ResultChannel implementation
bool ResultChannel::send(CountResult result) {
    std::lock_guard<std::mutex> lock(mutex);
    if (closed) {
        return false;
    }
    messages.push_back(std::move(result));
    return true;
}

std::optional<CountResult> ResultChannel::try_receive() {
    std::lock_guard<std::mutex> lock(mutex);
    if (messages.empty()) {
        return std::nullopt;
    }
    CountResult result = std::move(messages.front());
    messages.pop_front();
    return result;
}

void ResultChannel::close() {
    std::lock_guard<std::mutex> lock(mutex);
    closed = true;
    messages.clear();
}

bool ResultChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

size_t ResultChannel::pending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return messages.size();
}

// ThreadPool implementation
ThreadPool::ThreadPool(size_t threads) : num_threads(threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = FALLBACK_THREAD_COUNT;
    }

    workers.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back(&ThreadPool::worker_thread, this);
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        stop = true;
        std::queue<std::function<void()>>().swap(tasks);
    }
    condition.notify_all();
    finished.notify_all();
    for (auto& worker : workers) {
        worker.join();
    }
}

void ThreadPool::worker_thread() {
    for (;;) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            condition.wait(lock, [this] { return stop || !tasks.empty(); });

            if (stop) return;

            task = std::move(tasks.front());
            tasks.pop();
            active_tasks++;
        }

        task();

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            active_tasks--;
        }
        finished.notify_all();
    }
}

void ThreadPool::wait_all() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    finished.wait(lock, [this] { return stop || (tasks.empty() && active_tasks == 0); });
}

// CensusDispatcher implementation
CensusDispatcher::CensusDispatcher(std::shared_ptr<CensusCache> census_cache,
                                   std::shared_ptr<ResultChannel> result_channel,
                                   size_t threads)
    : cache(std::move(census_cache)),
      channel(std::move(result_channel)),
      stopping(std::make_shared<std::atomic<bool>>(false)),
      pool(threads) {}

CensusDispatcher::~CensusDispatcher() {
    stopping->store(true);
}

void CensusDispatcher::submit(const fs::path& path) {
    submitted++;

    auto job_cache = cache;
    auto job_channel = channel;
    auto stop = stopping;
    pool.enqueue([job_cache, job_channel, stop, path]() {
        auto count = count_files_until(path, *stop);
        if (!count) {
            job_cache->release(path);
            return;
        }

        job_cache->insert(path, *count);

        // A closed channel only means nobody is listening any more.
        static_cast<void>(job_channel->send(CountResult{path, *count}));
    });
}

std::optional<size_t> CensusDispatcher::request(const fs::path& path) {
    if (auto count = cache->get(path)) {
        return count;
    }
    if (cache->try_claim(path)) {
        submit(path);
        return std::nullopt;
    }
    // Lost the claim: either in flight, or it became ready in between.
    return cache->get(path);
}

void CensusDispatcher::wait_idle() {
    pool.wait_all();
}

// Text helpers
bool decode_utf8(const std::string& text, size_t& pos, char32_t& code_point) {
    const size_t n = text.size();
    if (pos >= n) return false;

    unsigned char c = static_cast<unsigned char>(text[pos]);
    size_t extra = 0;
    char32_t value = 0;
    if (c < 0x80) {
        code_point = c;
        pos++;
        return true;
    } else if ((c & 0xE0) == 0xC0) {
        extra = 1;
        value = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        extra = 2;
        value = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        extra = 3;
        value = c & 0x07;
    } else {
        return false;
    }

    if (pos + extra >= n) {
        return false;
    }
    for (size_t k = 1; k <= extra; ++k) {
        unsigned char cc = static_cast<unsigned char>(text[pos + k]);
        if ((cc & 0xC0) != 0x80) return false;
        value = (value << 6) | (cc & 0x3F);
    }

    // Overlong forms, surrogates and values past U+10FFFF
    if ((extra == 1 && value < 0x80) ||
        (extra == 2 && value < 0x800) ||
        (extra == 3 && value < 0x10000) ||
        (value >= 0xD800 && value <= 0xDFFF) ||
        value > 0x10FFFF) {
        return false;
    }
    code_point = value;
    pos += extra + 1;
    return true;
}

void append_utf8(std::string& out, char32_t code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

bool is_valid_utf8(const std::string& text) {
    size_t pos = 0;
    char32_t code_point = 0;
    while (pos < text.size()) {
        if (!decode_utf8(text, pos, code_point)) {
            return false;
        }
    }
    return true;
}

std::string display_name(const fs::path& path) {
    std::string name = path.filename().string();
    if (name.empty()) name = path.string();
    if (!is_valid_utf8(name)) {
        return "Unknown";
    }
    return name;
}

// Terminal columns taken by `text` in the current locale. Bytes that do not
// decode take one column each.
size_t display_width(const std::string& text) {
    std::mbstate_t state{};
    size_t width = 0;
    const char* p = text.data();
    const char* end = p + text.size();

    while (p < end) {
        wchar_t wc = 0;
        size_t len = std::mbrtowc(&wc, p, static_cast<size_t>(end - p), &state);
        if (len == static_cast<size_t>(-1) || len == static_cast<size_t>(-2)) {
            state = std::mbstate_t{};
            width++;
            p++;
            continue;
        }
        if (len == 0) {
            len = 1;
        }
        int w = wcwidth(wc);
        width += w > 0 ? static_cast<size_t>(w) : 0;
        p += len;
    }
    return width;
}

int wrapped_height(const std::string& text, int max_width) {
    if (max_width < 1) max_width = 1;

    int height = 0;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        size_t width = display_width(line);
        height += width == 0 ? 1 : static_cast<int>((width - 1) / static_cast<size_t>(max_width) + 1);
    }
    return height == 0 ? 1 : height;
}

// Cuts `text` to at most `max_width` columns, marking the cut with "...".
std::string fit_to_width(const std::string& text, size_t max_width) {
    if (display_width(text) <= max_width) {
        return text;
    }
    const std::string ellipsis = "...";
    if (max_width <= ellipsis.size()) {
        return ellipsis.substr(0, max_width);
    }

    const size_t budget = max_width - ellipsis.size();
    std::mbstate_t state{};
    size_t width = 0;
    size_t cut = 0;
    while (cut < text.size()) {
        wchar_t wc = 0;
        size_t len = std::mbrtowc(&wc, text.data() + cut, text.size() - cut, &state);
        size_t w = 1;
        if (len == static_cast<size_t>(-1) || len == static_cast<size_t>(-2)) {
            state = std::mbstate_t{};
            len = 1;
        } else {
            if (len == 0) len = 1;
            int cw = wcwidth(wc);
            w = cw > 0 ? static_cast<size_t>(cw) : 0;
        }
        if (width + w > budget) break;
        width += w;
        cut += len;
    }
    return text.substr(0, cut) + ellipsis;
}

fs::path normalize_start_dir(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }

    fs::path normal = absolute.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}
