#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace ctf::ledger {

/**
 * @brief 排行榜和统计的读缓存
 * 缓存项以 "查询类型:参数" 为键，在 ttl 之后过期，或者在账本被写入时通过
 * invalidate 全部失效。
 *
 * 加载过程不持有锁。如果加载期间发生了 invalidate，加载结果只返回给
 * 调用方，不会写入缓存，避免把写入之前的结果缓存下来。
 *
 * @param <V> 缓存值的类型
 */
template <typename V>
struct read_cache {
    using clock_type = std::function<std::chrono::steady_clock::time_point()>;

    explicit read_cache(std::chrono::milliseconds ttl, bool enabled = true,
                        clock_type clock = [] { return std::chrono::steady_clock::now(); })
        : ttl(ttl), enabled(enabled), clock(std::move(clock)) {}

    /**
     * @brief 读取缓存项，缓存不存在或者已过期时调用 loader 加载
     */
    V get_or_load(const std::string &key, const std::function<V()> &loader) {
        if (!enabled) return loader();

        std::uint64_t gen;
        {
            std::scoped_lock guard(mut);
            auto it = entries.find(key);
            if (it != entries.end() && clock() < it->second.expires_at)
                return it->second.value;
            gen = generation;
        }

        V value = loader();

        std::scoped_lock guard(mut);
        if (gen == generation)
            entries.insert_or_assign(key, entry{value, clock() + ttl});
        return value;
    }

    /**
     * @brief 让所有缓存项失效
     */
    void invalidate() {
        std::scoped_lock guard(mut);
        ++generation;
        entries.clear();
    }

    std::size_t size() {
        std::scoped_lock guard(mut);
        return entries.size();
    }

private:
    struct entry {
        V value;
        std::chrono::steady_clock::time_point expires_at;
    };

    std::chrono::milliseconds ttl;
    bool enabled;
    clock_type clock;

    std::mutex mut;
    std::uint64_t generation = 0;
    std::map<std::string, entry> entries;
};

}  // namespace ctf::ledger
