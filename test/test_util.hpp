#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>

/// Database file under the temp directory, removed with its WAL companions on scope exit
class temp_db
{
public:
    explicit temp_db(const std::string& name)
    {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
            ("sqlitexx_" + name + "_" + std::to_string(stamp) + "_" + std::to_string(counter++) + ".db");
        remove_files();
    }

    temp_db(const temp_db&) = delete;
    temp_db& operator=(const temp_db&) = delete;

    ~temp_db()
    {
        remove_files();
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void remove_files() noexcept
    {
        for (const char* suffix : {"", "-wal", "-shm", "-journal"})
        {
            std::error_code ec;
            std::filesystem::remove(std::filesystem::path(path_.string() + suffix), ec);
        }
    }

    std::filesystem::path path_;
};

/// Tracks how many closures run at the same time
class overlap_guard
{
public:
    class scope
    {
    public:
        explicit scope(overlap_guard& guard) : guard_(guard)
        {
            const int now = ++guard_.active_;
            int seen = guard_.peak_.load();
            while (now > seen && !guard_.peak_.compare_exchange_weak(seen, now))
            {
            }
        }

        ~scope() { --guard_.active_; }

        scope(const scope&) = delete;
        scope& operator=(const scope&) = delete;

    private:
        overlap_guard& guard_;
    };

    [[nodiscard]] int peak() const noexcept { return peak_.load(); }

private:
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
};

/// Threads of the current process (Linux /proc), 0 when unavailable
inline std::size_t running_thread_count()
{
    std::error_code ec;
    std::size_t count = 0;
    for (std::filesystem::directory_iterator it("/proc/self/task", ec), end; !ec && it != end; it.increment(ec))
        ++count;
    return count;
}
