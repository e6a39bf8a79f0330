#pragma once
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace mrsfit {

/* ------------------------------------------------------------------------- */
/*  Bounded retry with a shrinking model.                                    */
/*                                                                           */
/*  `op(param)` returns std::optional<T>; nullopt marks a numerically        */
/*  unusable result.  Parameters are tried in order and the first usable     */
/*  result wins.  An empty `value` after the call is the typed failure.      */
/* ------------------------------------------------------------------------- */
template<typename T, typename P>
struct RetryOutcome {
    std::optional<T> value;
    P                parameter{};     // parameter of the winning (or last) try
    int              attempts = 0;

    explicit operator bool() const { return value.has_value(); }
};

template<typename P, typename Op>
auto retry_with_degradation(Op&& op, const std::vector<P>& sequence)
{
    using Result = std::invoke_result_t<Op&, const P&>;
    using T      = typename Result::value_type;

    RetryOutcome<T, P> out;
    for (const P& p : sequence) {
        ++out.attempts;
        out.parameter = p;
        Result r = op(p);
        if (r) {
            out.value = std::move(*r);
            break;
        }
    }
    return out;
}

/*  start, start-1, …, floor                                                  */
inline std::vector<int> descending_orders(int start, int floor)
{
    std::vector<int> seq;
    for (int k = start; k >= floor; --k) seq.push_back(k);
    return seq;
}

} // namespace mrsfit
