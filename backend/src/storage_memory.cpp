#include "storage.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace
{
    // One lock per stripe so writers of different symbols rarely contend
    struct Stripe
    {
        mutable std::shared_mutex mtx;
        std::unordered_map<std::string, Summary> entries;
    };
}

class MemoryStore final : public ISummaryStore
{
    std::unique_ptr<Stripe[]> stripes_;
    std::size_t count_;

    Stripe &stripe_for(const std::string &symbol) const
    {
        return stripes_[std::hash<std::string>{}(symbol) % count_];
    }

public:
    explicit MemoryStore(std::size_t stripes)
        : stripes_(new Stripe[stripes == 0 ? 1 : stripes]), count_(stripes == 0 ? 1 : stripes) {}

    std::optional<Summary> get(const std::string &symbol) const override
    {
        const Stripe &st = stripe_for(symbol);
        std::shared_lock lk(st.mtx);
        auto it = st.entries.find(symbol);
        if (it == st.entries.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<Summary> set(const std::string &symbol, Summary s) override
    {
        Stripe &st = stripe_for(symbol);
        std::unique_lock lk(st.mtx);
        auto it = st.entries.find(symbol);
        if (it == st.entries.end())
        {
            st.entries.emplace(symbol, std::move(s));
            return std::nullopt;
        }
        std::optional<Summary> prev = std::move(it->second);
        it->second = std::move(s);
        return prev;
    }

    std::variant<std::vector<Summary>, SummaryError> get_all() const override
    {
        std::vector<Summary> out;
        for (std::size_t i = 0; i < count_; ++i)
        {
            std::shared_lock lk(stripes_[i].mtx);
            for (const auto &kv : stripes_[i].entries)
                out.push_back(kv.second);
        }
        if (out.empty())
            return SummaryError{SummaryErrorCode::EmptyCache, "no data present"};
        return out;
    }

    std::size_t size() const override
    {
        std::size_t n = 0;
        for (std::size_t i = 0; i < count_; ++i)
        {
            std::shared_lock lk(stripes_[i].mtx);
            n += stripes_[i].entries.size();
        }
        return n;
    }
};

ISummaryStore *make_memory_store(std::size_t stripes) { return new MemoryStore(stripes); }
