/* ===================================================================== *
 *  src/BasisCache.cpp
 * ===================================================================== */
#include "mrsfit/BasisCache.hpp"
#include "mrsfit/Hashing.hpp"

namespace mrsfit {

BasisCache& BasisCache::instance()
{
    static BasisCache inst;
    return inst;
}

std::size_t BasisCache::key(const BasisSet& basis,
                            const AcquisitionInfo& target,
                            int n_points)
{
    std::size_t k = basis.fingerprint();
    k = hash_combine(k, hash_double(target.dwell_time));
    k = hash_combine(k, hash_double(target.txfrq_mhz));
    k = hash_combine(k, hash_double(target.center_ppm));
    k = hash_combine(k, static_cast<std::size_t>(target.n_samples));
    k = hash_combine(k, static_cast<std::size_t>(n_points));
    return k;
}

ResampledBasisPtr BasisCache::resampled(const BasisSet& basis,
                                        const AcquisitionInfo& target,
                                        int n_points)
{
    return insert_if_absent(key(basis, target, n_points), [&] {
        return resample_basis(basis, target, n_points);
    });
}

/* -------- house-keeping ---------------------------------------------- */
void BasisCache::set_capacity(std::size_t n)
{
    std::unique_lock lk(mtx_);
    max_entries_ = (n == 0) ? 1 : n;
    evict_if_needed_();
}

std::size_t BasisCache::capacity() const
{
    std::shared_lock lk(mtx_);
    return max_entries_;
}

std::size_t BasisCache::size() const
{
    std::shared_lock lk(mtx_);
    return cache_.size();
}

void BasisCache::clear()
{
    std::unique_lock lk(mtx_);
    cache_.clear();
    lru_.clear();
}

ResampledBasisPtr BasisCache::try_get(std::size_t key) const
{
    std::unique_lock lk(mtx_);
    auto it = cache_.find(key);
    if (it == cache_.end()) return nullptr;
    touch_(it);
    return it->second.ptr;
}

/* ===================================================================== *
 *            internal L-R-U helpers
 * ===================================================================== */
void BasisCache::touch_(typename Map::iterator it) const
{
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
}

void BasisCache::evict_if_needed_()
{
    while (cache_.size() > max_entries_) {
        std::size_t victim = lru_.back();
        lru_.pop_back();
        cache_.erase(victim);
    }
}

} // namespace mrsfit
