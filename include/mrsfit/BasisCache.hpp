/* ===================================================================== *
 *  include/mrsfit/BasisCache.hpp   ––  bounded L-R-U cache of resampled
 *                                      basis sets (thread-safe)
 * ===================================================================== */
#pragma once
#include "BasisSet.hpp"

#include <ankerl/unordered_dense.h>
#include <list>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace mrsfit {

using ResampledBasisPtr = std::shared_ptr<const ResampledBasis>;

/*
 * Key = (basis fingerprint, target geometry, number of points).
 * Entries are shared: an evicted basis stays alive for whoever still
 * holds the pointer.
 */
class BasisCache
{
public:
    static BasisCache& instance();

    static std::size_t key(const BasisSet& basis,
                           const AcquisitionInfo& target,
                           int n_points);

    ResampledBasisPtr try_get(std::size_t key) const;

    template<typename Producer>
    ResampledBasisPtr insert_if_absent(std::size_t key, Producer&& make);

    /*  resample_basis() through the cache                                   */
    ResampledBasisPtr resampled(const BasisSet& basis,
                                const AcquisitionInfo& target,
                                int n_points);

    void        set_capacity(std::size_t n);
    std::size_t capacity() const;
    std::size_t size() const;
    void        clear();

private:
    BasisCache() = default;

    using LruList = std::list<std::size_t>;
    struct Node {
        ResampledBasisPtr ptr;
        LruList::iterator lru_pos;
    };
    using Map = ankerl::unordered_dense::map<std::size_t, Node>;

    void touch_(typename Map::iterator it) const;
    void evict_if_needed_();

    mutable std::shared_mutex mtx_;
    mutable Map     cache_;
    mutable LruList lru_;
    std::size_t     max_entries_ = 64;
};

/* ===================================================================== *
 *  template implementation
 * ===================================================================== */
template<typename Producer>
ResampledBasisPtr BasisCache::insert_if_absent(std::size_t key, Producer&& make)
{
    {
        std::unique_lock lk(mtx_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            touch_(it);
            return it->second.ptr;
        }
    }

    /* ---------- build outside any lock ------------------------------ */
    ResampledBasisPtr fresh = std::make_shared<ResampledBasis>(
                                  std::forward<Producer>(make)() );

    std::unique_lock lk(mtx_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {              // another thread was faster
        touch_(it);
        return it->second.ptr;
    }

    auto lru_it = lru_.insert(lru_.begin(), key);
    cache_.try_emplace(key, Node{fresh, lru_it});
    evict_if_needed_();
    return fresh;
}

} // namespace mrsfit
