/*
================================================================================

                             PUBLIC DOMAIN NOTICE
                 National Center for Biotechnology Information

  This software is a "United States Government Work" under the terms of the
  United States Copyright Act.  It was written as part of the author's official
  duties as a United States Government employees and thus cannot be copyrighted.
  This software is freely available to the public for use. The National Library
  of Medicine and the U.S. Government have not placed any restriction on its use
  or reproduction.

  Although all reasonable efforts have been taken to ensure the accuracy and
  reliability of this software, the NLM and the U.S. Government do not and
  cannot warrant the performance or results that may be obtained by using this
  software. The NLM and the U.S. Government disclaim all warranties, expressed
  or implied, including warranties of performance, merchantability or fitness
  for any particular purpose.

  Please cite NCBI in any work or product based on this material.

================================================================================

  Author: Alex Astashyn

*/
#ifndef RANGEFUL_FALLIBLE_HPP_
#define RANGEFUL_FALLIBLE_HPP_

#include <deque>
#include <memory>

#include "fn.hpp"

/////////////////////////////////////////////////////////////////////////////

namespace rangeful
{

namespace fn
{
    /// @defgroup fallible Fallible traversal
    /// @{

    /// @brief How a `try_foldl` traversal ended.
    enum class fold_status
    {
        ran_to_exhaustion,  ///< every element was folded
        stopped_by_success, ///< the step-function returned fn::stop(acc)
        stopped_by_error    ///< the step-function returned fn::fail(err)
    };

namespace impl
{
    template<typename Acc> struct step_proceed { Acc acc; };
    template<typename Acc> struct step_stop    { Acc acc; };
    template<typename Err> struct step_fail    { Err err; };

    template<typename Acc, typename F> struct try_foldl;
}

    /////////////////////////////////////////////////////////////////////////
    /// @brief Return-type of the step-function of `fn::try_foldl`.
    ///
    /// Implicitly constructible from `fn::proceed(acc)`, `fn::stop(acc)`,
    /// and `fn::fail(err)`, so the step-function just declares it as its return-type.
    template<typename Acc, typename Err>
    class fold_step
    {
    public:
        using acc_type = Acc;
        using err_type = Err;

        fold_step(impl::step_proceed<Acc> s)
            : m_status{ fold_status::ran_to_exhaustion }
            , m_acc{ std::move(s.acc) }
        {}

        fold_step(impl::step_stop<Acc> s)
            : m_status{ fold_status::stopped_by_success }
            , m_acc{ std::move(s.acc) }
        {}

        fold_step(impl::step_fail<Err> f)
            : m_status{ fold_status::stopped_by_error }
            , m_err{ std::move(f.err) }
        {}

        /// ran_to_exhaustion here means "keep going".
        fold_status status() const noexcept
        {
            return m_status;
        }

    private:
        template<typename A, typename F> friend struct impl::try_foldl;

               fold_status m_status;
        impl::maybe<Acc>   m_acc = {};
        impl::maybe<Err>   m_err = {};
    };

    /////////////////////////////////////////////////////////////////////////
    /// @brief Outcome of `fn::try_foldl`.
    template<typename Acc, typename Err>
    class fold_result
    {
    public:
        fold_result(fold_status st, impl::maybe<Acc> acc, impl::maybe<Err> err)
            : m_status{ st }
            , m_acc{ std::move(acc) }
            , m_err{ std::move(err) }
        {}

        fold_status status() const noexcept
        {
            return m_status;
        }

        /// false iff stopped by error.
        bool ok() const noexcept
        {
            return m_status != fold_status::stopped_by_error;
        }

        explicit operator bool() const noexcept
        {
            return ok();
        }

        /// The final accumulator.
        const Acc& value() const &
        {
            if(!m_acc) {
                RANGEFUL_FN_THROW("fold_result::value(): the fold was stopped by error.");
            }
            return *m_acc;
        }

        Acc value() &&
        {
            if(!m_acc) {
                RANGEFUL_FN_THROW("fold_result::value(): the fold was stopped by error.");
            }
            return std::move(*m_acc);
        }

        const Err& error() const
        {
            if(!m_err) {
                RANGEFUL_FN_THROW("fold_result::error(): the fold was not stopped by error.");
            }
            return *m_err;
        }

    private:
             fold_status m_status;
        impl::maybe<Acc> m_acc;
        impl::maybe<Err> m_err;
    };

namespace impl
{
    template<typename Step>
    struct is_fold_step : std::false_type
    {};

    template<typename Acc, typename Err>
    struct is_fold_step<fold_step<Acc, Err>> : std::true_type
    {};

    /////////////////////////////////////////////////////////////////////
    template<typename Acc, typename F>
    struct try_foldl
    {
        Acc init;
          F step_fn;

        template<typename Gen>
        using step_t = decltype(std::declval<F&>()(std::declval<Acc>(),
                                                   std::declval<typename get_value_type<Gen>::type>()));

        template<typename Gen>
        using result_t = fold_result<Acc, typename step_t<Gen>::err_type>;

        template<typename Gen>
        auto operator()(seq<Gen> src) && -> result_t<Gen> // rvalue-specific because init will be moved-from
        {
            using step_type = step_t<Gen>;

            static_assert(is_fold_step<step_type>::value,
                          "The step-function must return fn::fold_step<Acc, Err>.");

            static_assert(std::is_same<Acc, typename step_type::acc_type>::value,
                          "Type of Init must be the same as the accumulator-type of the step-function's fold_step.");

            using res_t = result_t<Gen>;

            auto& gen = src.get_gen();

            // NB: one pull per step; nothing is pulled after stop or fail.
            for(auto x = gen(); x; x = gen()) {
                auto step = step_fn(std::move(init), std::move(*x));

                if(step.m_status == fold_status::stopped_by_error) {
                    return res_t{ fold_status::stopped_by_error, {}, std::move(step.m_err) };
                }

                init = std::move(*step.m_acc);

                if(step.m_status == fold_status::stopped_by_success) {
                    return res_t{ fold_status::stopped_by_success, { std::move(init) }, {} };
                }
            }

            return res_t{ fold_status::ran_to_exhaustion, { std::move(init) }, {} };
        }

        template<typename Iterable>
        auto operator()(Iterable src) && -> result_t<to_seq::gen<Iterable>>
        {
            return std::move(*this)(to_seq{}(std::move(src)));
        }
    };

    /////////////////////////////////////////////////////////////////////
    template<typename Pred, typename Pipeline>
    struct with_filtered
    {
            Pred pred;
        Pipeline pipeline;

        template<typename InGen>
        struct gen_state
        {
            using value_type = typename get_value_type<InGen>::type;

                           InGen gen;
                            Pred pred;
            std::deque<value_type> bypassed; // elements routed around the pipeline, in order
        };

        // Feeds the pipeline with elements satisfying pred, parking the rest.
        template<typename InGen>
        struct filtered_gen
        {
            using value_type = typename get_value_type<InGen>::type;

            std::shared_ptr<gen_state<InGen>> state;

            maybe<value_type> operator()()
            {
                auto& st = *state;
                auto x = st.gen();
                while(x && !st.pred(*x)) {
                    st.bypassed.push_back(std::move(*x));
                    x = st.gen();
                }
                return x;
            }
        };

        template<typename InGen, typename OutGen>
        struct gen
        {
            using value_type = typename get_value_type<InGen>::type;

            static_assert(std::is_same<value_type, typename get_value_type<OutGen>::type>::value,
                          "The pipeline must yield elements of the same type as its inputs.");

            std::shared_ptr<gen_state<InGen>> state;
                                       OutGen out_gen;
                                         bool out_ended;

            maybe<value_type> pop_bypassed()
            {
                maybe<value_type> ret{ std::move(state->bypassed.front()) };
                state->bypassed.pop_front();
                return ret;
            }

            maybe<value_type> operator()()
            {
                auto& bypassed = state->bypassed;

                if(!bypassed.empty()) {
                    return pop_bypassed();
                }

                if(out_ended) {
                    return { };
                }

                auto y = out_gen();

                if(!y) {
                    out_ended = true;
                } else if(!bypassed.empty()) {
                    // elements skipped while the pipeline was pulling for y precede it
                    bypassed.push_back(std::move(*y));
                } else {
                    return y;
                }

                if(bypassed.empty()) {
                    return { };
                }
                return pop_bypassed();
            }
        };

        template<typename InGen>
        using out_gen_t = gen_of_t<decltype(std::declval<const Pipeline&>()(
                                                std::declval<seq<filtered_gen<InGen>>>()))>;

        template<typename InGen>
        auto operator()(seq<InGen> in) const -> seq<gen<InGen, out_gen_t<InGen>>>
        {
            using OutGen = out_gen_t<InGen>;

            auto st = std::make_shared<gen_state<InGen>>(
                          gen_state<InGen>{ std::move(in.get_gen()), pred, {} });

            auto out = to_seq{}(pipeline(seq<filtered_gen<InGen>>{ filtered_gen<InGen>{ st } }));

            return { gen<InGen, OutGen>{ std::move(st), std::move(out.get_gen()), false } };
        }

        template<typename Cont>
        auto operator()(Cont cont) const -> seq<gen<to_seq::gen<Cont>, out_gen_t<to_seq::gen<Cont>>>>
        {
            return this->operator()(to_seq{}(std::move(cont)));
        }
    };

}   // namespace impl

    /////////////////////////////////////////////////////////////////////////
    /// @brief Keep folding with this accumulator.
    template<typename Acc>
    impl::step_proceed<Acc> proceed(Acc acc)
    {
        return { std::move(acc) };
    }

    /// @brief Stop the fold successfully with this accumulator.
    template<typename Acc>
    impl::step_stop<Acc> stop(Acc acc)
    {
        return { std::move(acc) };
    }

    /// @brief Stop the fold with an error.
    template<typename Err>
    impl::step_fail<Err> fail(Err err)
    {
        return { std::move(err) };
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Short-circuiting left-fold.
    ///
    /// `step_fn(Acc, T) -> fn::fold_step<Acc, Err>` returns `fn::proceed(acc)` to
    /// continue, `fn::stop(acc)` to finish early with a value, or `fn::fail(err)`
    /// to finish early with an error. The input is pulled exactly once per
    /// step: stopping at the k-th element (0-based) pulls k+1 elements.
    ///
    /// An exception thrown by the input propagates as-is. The error returned
    /// via `fn::fail` is never thrown; it is carried in the `fn::fold_result`.
    /*!
    @code
        auto res = fn::seq(...)
        % fn::try_foldl(0L, [](long acc, std::string s) -> fn::fold_step<long, std::string>
          {
              if(s.empty() || !std::all_of(s.begin(), s.end(), ::isdigit)) {
                  return fn::fail("not a number: '" + s + "'");
              }
              return fn::proceed(acc + std::stol(s));
          });

        if(!res.ok()) {
            std::cerr << res.error() << "\n";
        }
    @endcode
    */
    template<typename Acc, typename F>
    impl::try_foldl<Acc, F> try_foldl(Acc init, F step_fn)
    {
        return { std::move(init), std::move(step_fn) };
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Apply `pipeline` only to the elements satisfying `pred`; the rest pass through untouched.
    ///
    /// `pipeline` is a unary callable taking a `seq` of the selected elements and
    /// returning a `seq` (or a range) of the same value-type, e.g. a composition
    /// of other stages. Bypassed elements are re-interleaved into the output
    /// before the pipeline-output for which they were skipped, so with a 1:1
    /// pipeline the input positions are preserved.
    ///
    /// Only the bypassed elements are buffered, and only until the pipeline
    /// yields its next output.
    /*!
    @code
        // Uppercase the words, leaving punctuation as is.
        auto res = tokens
        % fn::with_filtered(is_word, [](auto words)
          {
              return std::move(words) % fn::transform(to_upper);
          })
        % fn::to_vector();
    @endcode
    */
    template<typename Pred, typename Pipeline>
    impl::with_filtered<Pred, Pipeline> with_filtered(Pred pred, Pipeline pipeline)
    {
        return { std::move(pred), std::move(pipeline) };
    }

    /// @}

} // namespace fn
} // namespace rangeful




#if RANGEFUL_FALLIBLE_ENABLE_RUN_TESTS
#include <string>
#include <iostream>
#include <cctype>

#ifndef VERIFY
#define VERIFY(expr) if(!(expr)) RANGEFUL_FN_THROW("Assertion failed: ( "#expr" ).");
#endif

namespace rangeful
{
namespace fn
{
namespace impl
{

static void run_fallible_tests()
{
    using fn::operators::operator%;
    using vec_t = std::vector<int>;
    using step_t = fn::fold_step<int, std::string>;

    // sums the elements, failing on a negative one and stopping once the sum reaches 100
    const auto checked_sum = [](int acc, int x) -> step_t
    {
        if(x < 0) {
            return fn::fail("negative: " + std::to_string(x));
        }
        acc += x;
        if(acc >= 100) {
            return fn::stop(acc);
        }
        return fn::proceed(acc);
    };

    {{
        auto res = vec_t{{1, 2, 3}} % fn::try_foldl(0, checked_sum);
        VERIFY(res.status() == fold_status::ran_to_exhaustion);
        VERIFY(res.ok());
        VERIFY(res.value() == 6);

        bool threw = false;
        try {
            res.error();
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);
    }}

    {{
        // empty input
        auto res = vec_t{} % fn::try_foldl(42, checked_sum);
        VERIFY(res.status() == fold_status::ran_to_exhaustion);
        VERIFY(res.value() == 42);
    }}

    {{
        auto res = vec_t{{1, -2, 3}} % fn::try_foldl(0, checked_sum);
        VERIFY(res.status() == fold_status::stopped_by_error);
        VERIFY(!res);
        VERIFY(res.error() == "negative: -2");

        bool threw = false;
        try {
            res.value();
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);
    }}

    {{
        auto res = vec_t{{60, 50, -1}} % fn::try_foldl(0, checked_sum);
        VERIFY(res.status() == fold_status::stopped_by_success);
        VERIFY(res.ok());
        VERIFY(res.value() == 110);
    }}

    {{
        // stopping at the k-th element pulls exactly k+1 elements
        for(int k = 0; k < 5; ++k) {
            size_t num_pulls = 0;
            int i = 0;

            auto res = fn::seq([&]
            {
                ++num_pulls;
                return i++;
            })
            % fn::try_foldl(0, [k](int acc, int x) -> fn::fold_step<int, int>
            {
                if(x == k) {
                    return fn::fail(x);
                }
                return fn::proceed(acc + x);
            });

            VERIFY(res.error() == k);
            VERIFY(num_pulls == size_t(k + 1));
        }
    }}

    {{
        // same for a lookahead-wrapped source: it never pulls ahead on its own
        size_t num_pulls = 0;
        int i = 0;
        auto xs = fn::seq([&]
        {
            ++num_pulls;
            return i < 100 ? i++ : fn::end_seq();
        })
        % fn::peekable(8);

        auto res = std::move(xs) % fn::try_foldl(0, [](int acc, int x) -> step_t
        {
            return x == 3 ? step_t(fn::stop(acc)) : step_t(fn::proceed(acc + x));
        });

        VERIFY(res.value() == 0 + 1 + 2);
        VERIFY(num_pulls == 4);
    }}

    {{
        // move-only accumulator
        auto res = vec_t{{1, 2, 3}}
        % fn::try_foldl(std::unique_ptr<int>(new int(0)),
            [](std::unique_ptr<int> acc, int x) -> fn::fold_step<std::unique_ptr<int>, std::string>
            {
                *acc += x;
                return fn::proceed(std::move(acc));
            });

        VERIFY(*res.value() == 6);
    }}

    {{
        // source errors propagate as-is
        int i = 0;
        bool threw = false;
        try {
            fn::seq([&]
            {
                if(i == 2) {
                    throw std::runtime_error("boom");
                }
                return i++;
            })
            % fn::try_foldl(0, checked_sum);
        } catch(const std::runtime_error& e) {
            threw = std::string(e.what()) == "boom";
        }
        VERIFY(threw);
    }}

    /////////////////////////////////////////////////////////////////////////

    {{
        const auto is_even = [](int x) { return x % 2 == 0; };

        auto res = vec_t{{1, 2, 3, 4, 5}}
        % fn::with_filtered(is_even, [](fn::any_seq_t<int> evens)
          {
              return std::move(evens) % fn::transform([](int x) { return x * 10; });
          })
        % fn::to_vector();

        VERIFY((res == vec_t{{1, 20, 3, 40, 5}}));
    }}

    {{
        // runs of bypassed elements, and a pipeline that never sees any input
        const auto is_even = [](int x) { return x % 2 == 0; };
        const auto times_10 = [](fn::any_seq_t<int> evens)
        {
            return std::move(evens) % fn::transform([](int x) { return x * 10; });
        };

        auto res = vec_t{{1, 3, 2, 4, 5, 7, 9, 6}} % fn::with_filtered(is_even, times_10) % fn::to_vector();
        VERIFY((res == vec_t{{1, 3, 20, 40, 5, 7, 9, 60}}));

        auto res2 = vec_t{{1, 3, 5}} % fn::with_filtered(is_even, times_10) % fn::to_vector();
        VERIFY((res2 == vec_t{{1, 3, 5}}));

        auto res3 = vec_t{} % fn::with_filtered(is_even, times_10) % fn::to_vector();
        VERIFY(res3.empty());
    }}

    {{
        // a stateful pipeline: deduplicate adjacent equal elements among the selected ones
        auto res = vec_t{{-1, 1, 1, -2, 2, 3, 3, -3}}
        % fn::with_filtered([](int x) { return x > 0; }, [](fn::any_seq_t<int> xs)
          {
              return std::move(xs)
                   % fn::group_adjacent_as_subseqs_by(fn::by::identity{})
                        .on_unfinished(fn::unfinished_group::auto_drain)
                   % fn::transform([](fn::any_seq_t<int> group)
                     {
                         return *group.begin();
                     });
          })
        % fn::to_vector();

        // bypassed elements are emitted before the pipeline-output that pulled past them
        VERIFY((res == vec_t{{-1, 1, -2, 2, 3, -3}}));
    }}

    std::cerr << "Ran fallible tests - OK\n";
}

} // namespace impl
} // namespace fn
} // namespace rangeful

#endif // RANGEFUL_FALLIBLE_ENABLE_RUN_TESTS

#endif // RANGEFUL_FALLIBLE_HPP_
