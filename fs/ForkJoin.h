#pragma once
#include <atomic>
#include <future>
#include <iterator>
#include <system_error>
#include <utility>
#include <vector>

namespace notox {

// Bounded fork-join: maps items to result vectors and concatenates them in item
// order. With a budget of zero every item runs inline on the calling thread.
class ForkJoin {
public:
    explicit ForkJoin(unsigned jobs) : budget_(jobs > 1 ? jobs - 1 : 0) {}
    ForkJoin(const ForkJoin&) = delete;
    ForkJoin& operator=(const ForkJoin&) = delete;

    bool parallel() const noexcept { return budget_ > 0; }

    template <typename Item, typename Fn>
    auto map_concat(const std::vector<Item>& items, Fn fn) const
        -> decltype(fn(items.front())) {
        using Out = decltype(fn(items.front()));
        Out all;

        if (!parallel() || items.size() < 2) {
            for (const auto& it : items) append(all, fn(it));
            return all;
        }

        std::vector<std::future<Out>> pending;
        pending.reserve(items.size());
        for (const auto& it : items) {
            if (try_acquire()) {
                try {
                    pending.push_back(std::async(std::launch::async, [this, &fn, &it] {
                        Slot slot(in_flight_);
                        return fn(it);
                    }));
                    continue;
                } catch (const std::system_error&) {
                    // no thread available, run on join instead
                    in_flight_.fetch_sub(1, std::memory_order_acq_rel);
                }
            }
            pending.push_back(std::async(std::launch::deferred, [&fn, &it] { return fn(it); }));
        }
        for (auto& f : pending) append(all, f.get());
        return all;
    }

private:
    struct Slot {
        explicit Slot(std::atomic<unsigned>& n) : n_(n) {}
        ~Slot() { n_.fetch_sub(1, std::memory_order_acq_rel); }
        std::atomic<unsigned>& n_;
    };

    bool try_acquire() const {
        unsigned cur = in_flight_.load(std::memory_order_acquire);
        while (cur < budget_) {
            if (in_flight_.compare_exchange_weak(cur, cur + 1, std::memory_order_acq_rel))
                return true;
        }
        return false;
    }

    template <typename Out>
    static void append(Out& all, Out part) {
        if (all.empty()) { all = std::move(part); return; }
        all.insert(all.end(), std::make_move_iterator(part.begin()),
                   std::make_move_iterator(part.end()));
    }

    unsigned budget_;
    mutable std::atomic<unsigned> in_flight_{0};
};

} // namespace notox
