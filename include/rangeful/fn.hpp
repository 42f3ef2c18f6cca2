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
#ifndef RANGEFUL_FN_HPP_
#define RANGEFUL_FN_HPP_

#include <stdexcept> // std::logic_error, std::out_of_range
#include <algorithm>
#include <functional>
#include <memory>    // std::shared_ptr, std::weak_ptr for group cursors
#include <vector>
#include <string>    // for to_string
#include <iterator>
#include <cstdint>
#include <cassert>

#if defined(_MSC_VER)
#   pragma warning(push)
#   pragma warning(disable: 4068) // unknown pragmas (for GCC diagnostic push)
#endif


#define RANGEFUL_FN_THROW(msg) throw std::logic_error( std::string{} + __FILE__ + ":" + std::to_string(__LINE__) + ": "#msg );

namespace rangeful
{

/// @brief Lazy stateful combinators over single-pass sequences: lookahead, grouping, windowing, k-way merge.
namespace fn
{

    /// @defgroup errors Errors
    /// @{

    /// @brief Thrown by `peek`/`consume` when fewer elements remain than requested.
    ///
    /// Within pipelines end-of-inputs is an ordinary empty `maybe`; this is only
    /// thrown from the explicit lookahead API.
    struct exhausted_error : std::out_of_range
    {
        using std::out_of_range::out_of_range;
    };

    /// @brief Thrown when the next group is requested while the current one still has elements.
    struct unfinished_group_error : std::logic_error
    {
        using std::logic_error::logic_error;
    };

    /// @brief Thrown when reading a group after its parent has moved on to the next group (or was destroyed).
    struct stale_group_error : std::logic_error
    {
        using std::logic_error::logic_error;
    };

    /// @brief What to do when the next group is requested while the current one still has elements.
    enum class unfinished_group
    {
        error,      ///< throw fn::unfinished_group_error
        auto_drain  ///< skip the remaining elements of the current group
    };

    /// @brief What to do with the trailing elements that do not fill a whole window.
    enum class window_tail
    {
        drop,         ///< discard them
        emit_partial, ///< yield them as one shorter window
        emit_padded   ///< yield them as one window padded with the fill-value
    };

    /// @}

namespace impl
{
    /////////////////////////////////////////////////////////////////////////
    /// Bare-bones optional with rebinding assignment semantics.
    ///
    /// An empty maybe is how every generator signals end-of-inputs.
    template<class T>
    class maybe
    {
       struct sentinel{};
       union
       {
           sentinel m_sentinel;
                  T m_value;
       };

       bool m_empty = true;

    public:
        using value_type = T;

        static_assert(!std::is_same<value_type, void>::value, "Can't have void as value_type - did you perhaps forget a return-statement in your transform-function?");

        maybe() : m_sentinel{}
        {}

        maybe(const maybe&) = delete;
        maybe& operator=(const maybe&) = delete;

        maybe(T val)
        {
            reset(std::move(val));
        }

        maybe(maybe&& other) noexcept
        {
            if(!other.m_empty) {
                reset(std::move(*other));
                other.reset();
            }
        }

        // NB: unlike std::optional, assigning never assigns through
        // to the held value; the old value is destroyed and the new one
        // is placement-constructed, so T need not be move-assignable
        // (e.g. a closure, or a tuple of references).
        maybe& operator=(maybe&& other) noexcept
        {
            if(this == &other) {
                ;
            } else if(!other.m_empty) {
                reset(std::move(*other));
                other.reset();
            } else {
                reset();
            }
            return *this;
        }

        void reset(T val)
        {
            reset();
            new (&m_value) T(std::move(val));
            m_empty = false;
        }

        void reset()
        {
            if(!m_empty) {
                this->operator*().~T();
                m_empty = true;
            }
        }

        explicit operator bool() const noexcept
        {
            return !m_empty;
        }

        T& operator*() noexcept
        {
            assert(!m_empty);

#if __cplusplus >= 201703L
            return *std::launder(&m_value);
#else
            return m_value;
#endif
        }

        const T& operator*() const noexcept
        {
            assert(!m_empty);

#if __cplusplus >= 201703L
            return *std::launder(&m_value);
#else
            return m_value;
#endif
        }

        ~maybe()
        {
            reset();
        }
    };

}   // namespace impl


    /// @defgroup io Inputs and Outputs
    ///
    /*!
    @code
      fn::seq([]{ ... }) % ... // as input-range from a nullary invokable
          std::move(vec) % ... // pass by-move
                    vec  % ... // pass by-copy
    @endcode
    */
    /// @{

    /////////////////////////////////////////////////////////////////////////
    /// @brief Return fn::end_seq() from input-range generator function to signal end-of-inputs.
    ///
    /// This throws fn::end_seq::exception on construction, which is caught by
    /// the wrapper around the user's generator and turned into an empty maybe.
    /// It does not propagate outside of the API's boundaries.
    struct end_seq
    {
        struct exception
        {};

        end_seq()
        {
            throw exception{};
        }

        template<typename T>
        operator T() const
        {
            throw exception{};
            return std::move(*impl::maybe<T>{});
        }
    };

namespace impl
{
    // Adapts an exception-signaling user generator to the empty-maybe protocol
    // that all internal generators speak.
    template<typename Gen>
    struct catch_end
    {
        Gen gen;
        bool ended; // once set, gen is never invoked again

        using value_type = decltype(gen());

        auto operator()() -> maybe<value_type>
        {
            if(ended) {
                return { };
            }

            try {
                return { gen() };
            } catch( const end_seq::exception& ) {
                ended = true;
                return { };
            }
        }
    };

    /////////////////////////////////////////////////////////////////////////
    template<typename Gen>
    struct get_value_type
    {
        using type = typename Gen::value_type;
    };

    template<typename T>
    struct get_value_type<std::function<impl::maybe<T>()>>
    {
        using type = T;
    };


    /////////////////////////////////////////////////////////////////////////
    /// Single-pass InputRange-adapter for nullary generators.
    ///
    /// This is the Sequence Source every combinator below consumes and produces.
    /// A generator is any type with `value_type` and `maybe<value_type> operator()()`.
    /// The iterator yields rvalue-references: the element is owned by the seq
    /// until the next increment.
    template<typename Gen>
    class seq
    {
    public:
        using value_type = typename get_value_type<Gen>::type;
        static_assert(!std::is_reference<value_type>::value, "The type returned by the generator-function must be a value-type. Use std::ref if necessary.");

        seq(Gen gen)
            : m_gen( std::move(gen) ) // NB: must use parentheses here!
        {}

        // Conversion to any_seq_t (Gen is a std::function, OtherGen is some lambda-based gen).
        template<typename OtherGen>
        seq(seq<OtherGen> other)
            :   m_current{ std::move(other.m_current) }
            ,       m_gen{ std::move(other.m_gen) }
            ,   m_started{ other.m_started }
            ,   m_ended{ other.m_ended }
        {
            other.m_started = true;
            other.m_ended   = true;
        }

                   seq(const seq&) = delete;
        seq& operator=(const seq&) = delete;

                        seq(seq&&) = default;
             seq& operator=(seq&&) = default;

        /////////////////////////////////////////////////////////////////////
        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using   difference_type = void;
            using        value_type = seq::value_type;
            using           pointer = value_type*;
            using         reference = value_type&&; // NB: rvalue-reference

            iterator(seq* p = nullptr) : m_parent{ p }
            {}

            iterator& operator++()
            {
                if(!m_parent || m_parent->m_ended) {
                    m_parent = nullptr;
                    return *this;
                }

                auto& p = *m_parent;

                p.m_current = p.m_gen();

                if(!p.m_current) {
                    p.m_ended = true;
                    m_parent = nullptr; // reached end
                }
                return *this;
            }

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Weffc++" // insists operator++(int) should be returning iterator
            maybe<value_type> operator++(int) // to support *it++ usage
            {
                auto ret = std::move(m_parent->m_current);
                this->operator++();
                return ret;
            }
#pragma GCC diagnostic pop

            reference operator*() const { return static_cast<reference>(*m_parent->m_current); }

            pointer operator->() const { return &*m_parent->m_current; }

            bool operator==(const iterator& other) const
            {
                return m_parent == other.m_parent;
            }

            bool operator!=(const iterator& other) const
            {
                return m_parent != other.m_parent;
            }

        private:

            friend seq;

            seq* m_parent;
        };

        iterator begin() // NB: non-const, advances to the first element, (calls m_gen)
        {
            if(m_started) {
                RANGEFUL_FN_THROW("seq::begin() can only be called once per instance.");
            }

            auto it = iterator{ m_ended ? nullptr : this };

            if(!m_started && !m_ended) {
                m_started = true; // advance to the first element (or end)
                ++it;
            }
            return it;
        }

        static iterator end()
        {
            return {};
        }

        Gen& get_gen()
        {
            return m_gen;
        }

        const Gen& get_gen() const
        {
            return m_gen;
        }

        operator std::vector<value_type>() && // rvalue-specific because after conversion
        {                                     // the seq will be consumed (m_ended)
            assert(!m_ended);

            std::vector<value_type> ret{};

            if(m_current) {
                ret.push_back(std::move(*m_current));
                m_current.reset();
            }

            for(auto x = m_gen(); x; x = m_gen()) {
                ret.push_back(std::move(*x));
            }

            m_started = true;
            m_ended = true;

            return ret;
        }


    private:
       friend class iterator;

       template<typename U>
       friend class seq;

       impl::maybe<value_type> m_current = {};
                             // Last value returned by m_gen.

            Gen m_gen;               // nullary generator
           bool m_started   = false; // false iff did not advance to begin()
           bool m_ended     = false;
    };

}   // namespace impl

    /////////////////////////////////////////////////////////////////////////
    /// @brief Adapt a generator function as `InputRange`.
    /*!
    @code
        int i = 0;
        auto xs = fn::seq([&i]
        {
            return i < 5 ? i++ : fn::end_seq();
        }); // 0, 1, 2, 3, 4
    @endcode
    */
    template<typename NullaryInvokable>
    impl::seq<impl::catch_end<NullaryInvokable>> seq(NullaryInvokable gen_fn)
    {
        static_assert(!std::is_reference<decltype(gen_fn())>::value, "The type returned by gen_fn must be a value-type.");
        static_assert(!std::is_same<decltype(gen_fn()), void>::value, "You forgot a return-statement in your gen-function.");
        return { { std::move(gen_fn), false } };
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Type-erased `seq`.
    ///
    /// Implicitly constructible from any `seq`. Handy as the element type of
    /// a collection of heterogeneous inputs, e.g. for `fn::merge_sorted`.
    template<typename T>
    using any_seq_t = impl::seq<std::function<impl::maybe<T>()>>;
    /// @}


namespace impl
{
    /////////////////////////////////////////////////////////////////////
    // Key-functions may return a std::reference_wrapper<...>,
    // so keys are compared with lt or eq, which unwrap those.

    struct lt
    {
        template<typename T>
        bool operator()(const T& a, const T& b) const
        {
            return std::less<T>{}(a, b);
        }

        template<typename T>
        bool operator()(const std::reference_wrapper<T>& a,
                        const std::reference_wrapper<T>& b) const
        {
            return std::less<T>{}(a.get(), b.get());
        }
    };

    struct eq
    {
        template<typename T>
        bool operator()(const T& a, const T& b) const
        {
            return a == b;
        }

        template<typename T>
        bool operator()(const std::reference_wrapper<T>& a,
                        const std::reference_wrapper<T>& b) const
        {
            return a.get() == b.get();
        }
    };

    // binary comparator composed over key_fn
    template<typename F>
    struct comp
    {
        F key_fn;

        template<typename A, typename B>
        bool operator()(const A& a, const B& b) const
        {
            return lt{}(key_fn(a), key_fn(b));
        }
    };

    /////////////////////////////////////////////////////////////////////
    // A group's key is stored by value, because the element it was computed
    // from is handed over to the caller. A key returned as reference_wrapper
    // is stored as the referenced type.
    template<typename K>
    struct stored_key
    {
        using type = K;
    };

    template<typename T>
    struct stored_key<std::reference_wrapper<T>>
    {
        using type = typename std::remove_cv<T>::type;
    };

    template<typename T>
    const T& unwrap_key(const T& key)
    {
        return key;
    }

    template<typename T>
    const T& unwrap_key(const std::reference_wrapper<T>& key)
    {
        return key.get();
    }

}   // namespace impl


/// @brief Common key-functions to use with group_adjacent_as_subseqs_by/merge_sorted_by
namespace by
{
    struct identity
    {
        template<typename T>
        auto operator()(const T& x) const -> const T&
        {
            return x;
        }
    };

    struct first
    {
        template<typename T>
        auto operator()(const T& x) const -> decltype(*&x.first) // *& so that decltype computes a reference
        {
            return x.first;
        }
    };

    /// @brief Make binary comparison predicate from a key-function
    template<typename F>
    impl::comp<F> make_comp(F key_fn)
    {
        return { std::move(key_fn) };
    }
}   // namespace by


/////////////////////////////////////////////////////////////////////////
/// @brief Implementations for corresponding static functions in fn::
namespace impl
{
    // Wrap an Iterable as gen-callable, yielding elements by move.
    struct to_seq
    {
        // Stages compose by yanking the gen out of the input seq, wrapping it
        // in their own gen, and wrapping that back in a seq (see
        // RANGEFUL_FN_OVERLOAD_FOR_SEQ). A container is first adapted
        // with this gen so it can be treated the same way.
        template<typename Iterable>
        struct gen
        {
            using value_type = typename Iterable::value_type;
            using iterator   = typename Iterable::iterator;

            Iterable src_range;
            iterator it;
                bool started;

            auto operator()() -> maybe<value_type>
            {
                if(!started) {
                    started = true;
                    it = src_range.begin();
                        // deferred until the first call, since begin()
                        // of an input-range may be non-const.
                } else if(it == src_range.end()) {
                    ; // repeated calls after the end
                } else {
                    ++it;
                }

                if(it == src_range.end()) {
                    return { };
                } else {
                    return { std::move(*it) };
                }
            }
        };

        // pass-through if already a seq
        template<typename Gen>
        seq<Gen> operator()(seq<Gen> seq) const
        {
            return seq;
        }

        /// @brief Wrap a range (e.g. a container or a view) as seq.
        template<typename Iterable>
        seq<gen<Iterable>> operator()(Iterable src) const
        {
            return { { std::move(src) , {}, false } };
        }
    };

    // Type of the generator a source is composed through:
    // the seq's own gen, or to_seq::gen for containers.
    template<typename Src>
    using gen_of_t = typename std::decay<decltype(to_seq{}(std::declval<Src>()).get_gen())>::type;


    /////////////////////////////////////////////////////////////////////
    struct to_vector
    {
        // passthrough overload
        template<typename T>
        std::vector<T> operator()(std::vector<T> vec) const
        {
            return vec;
        }

        // overload for a seq - invoke rvalue-specific implicit conversion
        template<typename Gen,
                 typename Vec = std::vector<typename seq<Gen>::value_type>>
        Vec operator()(seq<Gen> r) const
        {
            return static_cast<Vec>(std::move(r));
        }

        // overload for other iterable: move-insert elements into vec
        template<typename Iterable,
                 typename Vec = std::vector<typename Iterable::value_type> >
        Vec operator()(Iterable src) const
        {
            return this->operator()( Vec{
                    std::make_move_iterator(src.begin()),
                    std::make_move_iterator(src.end()) });
        }
    };

    // NB[3]: for_each, foldl, foldl_d also accept any Iterable, but the seq
    // overloads drive the underlying gen directly, bypassing the iterator layer.

    /////////////////////////////////////////////////////////////////////
    template<typename F>
    struct for_each
    {
        F fn; // may be non-const, hence operator()s are also non-const.

        template<typename Iterable>
        void operator()(Iterable&& src)
        {
            for(auto it = src.begin(); it != src.end(); ++it) {
                fn(*it);
            }
        }

        // See NB[3]
        template<typename Gen>
        void operator()(seq<Gen> src)
        {
            for(auto x = src.get_gen()(); x; x = src.get_gen()()) {
                fn(std::move(*x));
            }
        }
    };

    /////////////////////////////////////////////////////////////////////
    template<typename Ret, typename Op>
    struct foldl
    {
        Ret init;
        Op fold_op;

        template<typename Iterable>
        Ret operator()(Iterable&& src) && // rvalue-specific because init will be moved-from
        {
            static_assert(std::is_same<Ret, decltype(fold_op(std::move(init), *src.begin()))>::value,
                         "Type of Init must be the same as the return-type of F");

            for(auto it = src.begin(); it != src.end(); ++it) {
                init = fold_op(std::move(init), *it);
            }

            return std::move(init);
        }

        // See NB[3]
        template<typename Gen>
        Ret operator()(seq<Gen> src) &&
        {
            for(auto x = src.get_gen()(); x; x = src.get_gen()()) {
                init = fold_op(std::move(init), std::move(*x));
            }
            return std::move(init);
        }
    };

    /////////////////////////////////////////////////////////////////////
    template<typename Op>
    struct foldl_d
    {
        Op fold_op;

        struct any
        {
            template<typename T>
            operator T() const;
        };

        template<typename Iterable>
        auto operator()(Iterable&& src) const -> decltype(fold_op(any(), *src.begin()))
        {
            using ret_t = decltype(fold_op(any(), *src.begin()));
            auto ret = ret_t{};

            for(auto it = src.begin(); it != src.end(); ++it) {
                ret = fold_op(std::move(ret), *it);
            }

            return ret;
        }

        // See NB[3]
        template<typename Gen>
        auto operator()(seq<Gen> src) const -> decltype(fold_op(any(), std::move(*src.get_gen()())))
        {
            using ret_t = decltype(fold_op(any(), std::move(*src.get_gen()())));
            auto ret = ret_t{};

            for(auto x = src.get_gen()(); x; x = src.get_gen()()) {
                ret = fold_op(std::move(ret), std::move(*x));
            }

            return ret;
        }
    };

    /////////////////////////////////////////////////////////////////////////

    // Compose over an input-seq: yank its gen, wrap it in our gen (which
    // is presumed to take it as the first field) and wrap back into seq.
#define RANGEFUL_FN_OVERLOAD_FOR_SEQ(...)                                  \
    template<typename InGen>                                               \
    auto operator()(seq<InGen> in) const -> seq<gen<InGen>>                \
    {                                                                      \
        return { { std::move(in.get_gen()), __VA_ARGS__ } };               \
    }

    // Treat a container the same as a seq by wrapping it in to_seq::gen.
#define RANGEFUL_FN_OVERLOAD_FOR_CONT(...)                                 \
    template<typename Cont>                                                \
    auto operator()(Cont cont) const -> seq<gen<to_seq::gen<Cont>>>        \
    {                                                                      \
        return { { { std::move(cont), { }, false }, __VA_ARGS__ } };       \
    }                                                                      \

    /////////////////////////////////////////////////////////////////////
    template<typename F>
    struct transform
    {
        F map_fn;

        template<typename InGen>
        struct gen
        {
            InGen gen;
                F map_fn;

            using value_type = decltype(map_fn(std::move(*gen())));

            static_assert(!std::is_same<value_type, void>::value, "You forgot a return-statement in your transform-function.");

            auto operator()() -> maybe<value_type>
            {
                auto x = gen();
                if(!x) {
                    return { };
                }

                return { map_fn(std::move(*x)) };
            }
        };

        RANGEFUL_FN_OVERLOAD_FOR_SEQ( map_fn )
        RANGEFUL_FN_OVERLOAD_FOR_CONT( map_fn )
    };

    /////////////////////////////////////////////////////////////////////
    template<typename Pred>
    struct where
    {
        Pred pred;

        template<typename InGen>
        struct gen
        {
            InGen gen;
             Pred pred;

            using value_type = typename get_value_type<InGen>::type;

            auto operator()() -> maybe<value_type>
            {
                auto x = gen();
                while(x && !pred(*x)) {
                    x = gen();
                }

                return x;
            }
        };

        RANGEFUL_FN_OVERLOAD_FOR_SEQ( pred )
        RANGEFUL_FN_OVERLOAD_FOR_CONT( pred )
    };

    // Never pulls past the n-th element.
    struct take_first
    {
        const size_t cap;

        template<typename InGen>
        struct gen
        {
            InGen gen;
            size_t remaining;

            using value_type = typename get_value_type<InGen>::type;

            auto operator()() -> maybe<value_type>
            {
                if(remaining == 0) {
                    return { };
                }
                --remaining;
                return gen();
            }
        };

        RANGEFUL_FN_OVERLOAD_FOR_SEQ( cap )
        RANGEFUL_FN_OVERLOAD_FOR_CONT( cap )
    };

    /////////////////////////////////////////////////////////////////////
    struct concat
    {
        template<typename InGen>
        struct gen
        {
            InGen gen;

            using gen_value_t = typename get_value_type<InGen>::type;
            using group_t     = maybe<gen_value_t>;
                               // via maybe, because might not be default-constructible

            using iterator    = typename gen_value_t::iterator;
            using value_type  = typename gen_value_t::value_type;

             group_t current_group;
            iterator it;

            auto operator()() -> maybe<value_type>
            {
                // get next group if !started or reached end-of-current
                while(!current_group || it == (*current_group).end()) {
                    current_group = gen();

                    if(!current_group) {
                        return { };
                    }

                    it = (*current_group).begin();
                }

                value_type ret = std::move(*it);
                ++it;
                return { std::move(ret) };
            }
        };

        RANGEFUL_FN_OVERLOAD_FOR_SEQ( {}, typename gen<InGen>::iterator() )
        RANGEFUL_FN_OVERLOAD_FOR_CONT( {}, typename gen<to_seq::gen<Cont>>::iterator() )
    };


    /////////////////////////////////////////////////////////////////////
    /// Bounded lookahead over a generator.
    ///
    /// Elements are pulled one at a time, only when a position that is not
    /// yet buffered is requested, and are kept in a ring in source order
    /// until consumed. The ring grows with the number of buffered elements,
    /// up to the capacity. The source is invoked exactly once per
    /// buffered element, and never again after it signalled the end.
    template<typename Gen>
    class lookahead
    {
    public:
        using value_type = typename get_value_type<Gen>::type;

        lookahead(Gen gen, size_t capacity)
            : m_gen( std::move(gen) )
            , m_slots{}
            , m_capacity{ capacity }
        {
            if(capacity < 1) {
                RANGEFUL_FN_THROW("Lookahead capacity must be at least 1.");
            }
        }

        lookahead(lookahead&&) = default;
        lookahead& operator=(lookahead&&) = default;

        /// Buffer one more element. Returns false if the source is exhausted
        /// or the buffer is full.
        bool try_pull()
        {
            if(m_source_ended || m_size == m_capacity) {
                return false;
            }

            auto x = m_gen();

            if(!x) {
                m_source_ended = true;
                return false;
            }

            if(m_size < m_slots.size()) {
                m_slots[slot(m_size)] = std::move(x);
            } else {
                // all slots taken: unwrap the ring so that it can be appended to
                std::rotate(m_slots.begin(), m_slots.begin() + std::ptrdiff_t(m_head), m_slots.end());
                m_head = 0;
                m_slots.push_back(std::move(x));
            }
            ++m_size;
            ++m_num_pulled;
            return true;
        }

        /// Pointer to the n-th unconsumed element, or nullptr if the
        /// source ends before it.
        value_type* try_peek(size_t n)
        {
            if(n >= m_capacity) {
                RANGEFUL_FN_THROW("Peek position exceeds lookahead capacity.");
            }

            while(m_size <= n) {
                if(!try_pull()) {
                    return nullptr;
                }
            }
            return &*m_slots[slot(n)];
        }

        /// The n-th unconsumed element.
        /// Throws exhausted_error if fewer than n+1 elements remain.
        value_type& peek(size_t n = 0)
        {
            auto p = try_peek(n);
            if(!p) {
                throw exhausted_error{ "lookahead::peek(" + std::to_string(n) + "): only "
                                     + std::to_string(m_size) + " element(s) remain." };
            }
            return *p;
        }

        /// Discard the first n buffered elements.
        /// They must have been pulled already (e.g. via peek); consume never
        /// pulls from the source.
        void consume(size_t n = 1)
        {
            if(n > m_size) {
                throw exhausted_error{ "lookahead::consume(" + std::to_string(n) + "): only "
                                     + std::to_string(m_size) + " element(s) buffered." };
            }

            for(size_t i = 0; i < n; ++i) {
                m_slots[m_head].reset();
                m_head = (m_head + 1) % m_slots.size();
            }
            m_size -= n;
        }

        /// Remove and return the front element, pulling it if necessary.
        maybe<value_type> pop()
        {
            if(m_size == 0 && !try_pull()) {
                return { };
            }

            maybe<value_type> ret = std::move(m_slots[m_head]);
            m_head = (m_head + 1) % m_slots.size();
            --m_size;
            return ret;
        }

        /// Makes the lookahead itself a generator.
        maybe<value_type> operator()()
        {
            return pop();
        }

        size_t size()     const noexcept { return m_size; }
        size_t capacity() const noexcept { return m_capacity; }
        bool   empty()    const noexcept { return m_size == 0; }

        /// True once the source signalled end-of-inputs.
        bool exhausted() const noexcept { return m_source_ended; }

        /// Number of elements pulled from the source so far.
        size_t num_pulled() const noexcept { return m_num_pulled; }

    private:
        size_t slot(size_t n) const
        {
            return (m_head + n) % m_slots.size();
        }

                                   Gen m_gen;
        std::vector<maybe<value_type>> m_slots;
                                size_t m_capacity;
                                size_t m_head         = 0;
                                size_t m_size         = 0;
                                size_t m_num_pulled   = 0;
                                  bool m_source_ended = false;
    };

    /////////////////////////////////////////////////////////////////////
    struct peekable
    {
        const size_t capacity;

        template<typename InGen>
        auto operator()(seq<InGen> in) const -> seq<lookahead<InGen>>
        {
            return { lookahead<InGen>{ std::move(in.get_gen()), capacity } };
        }

        template<typename Cont>
        auto operator()(Cont cont) const -> seq<lookahead<to_seq::gen<Cont>>>
        {
            return this->operator()(to_seq{}(std::move(cont)));
        }
    };


    /////////////////////////////////////////////////////////////////////
    template<typename F, typename BinaryPred = impl::eq>
    struct group_adjacent_as_subseqs_by
    {
                 F key_fn;
        BinaryPred pred2;   // true iff two keys belong to the same group
        fn::unfinished_group policy;

        group_adjacent_as_subseqs_by& on_unfinished(fn::unfinished_group p)
        {
            policy = p;
            return *this;
        }

        template<typename InGen>
        struct gen
        {
            using element_type = typename get_value_type<InGen>::type;
            using key_type     = typename stored_key<
                                    typename std::decay<
                                        decltype(std::declval<const F&>()(std::declval<const element_type&>()))
                                    >::type>::type;

            // Shared between the engine and the group cursors it hands out.
            // Each group remembers the generation it was opened in; opening the
            // next group bumps the generation, making older cursors stale.
            struct state
            {
                lookahead<InGen> buf; // capacity 1: the element at the group boundary
                         const F key_fn;
                const BinaryPred pred2;
                const fn::unfinished_group policy;
                 maybe<key_type> key;            // key of the current group
                        uint64_t generation;
                            bool group_open;     // false once the group's boundary was observed
                            bool at_opening;     // the buffered front element is the one the key was computed from

                state(InGen in_gen, F key_fn_, BinaryPred pred2_, fn::unfinished_group policy_)
                    : buf{ std::move(in_gen), 1 }
                    , key_fn( std::move(key_fn_) )
                    , pred2( std::move(pred2_) )
                    , policy{ policy_ }
                    , key{}
                    , generation{ 0 }
                    , group_open{ false }
                    , at_opening{ false }
                {}

                // whether x belongs to the current group
                bool in_group(const element_type& x) const
                {
                    return pred2(*key, unwrap_key(key_fn(x)));
                }

                maybe<element_type> next_in_group()
                {
                    if(!group_open) {
                        return { };
                    }

                    if(at_opening) {
                        at_opening = false;
                        return buf.pop();
                    }

                    const element_type* x = buf.try_peek(0);

                    if(!x || !in_group(*x)) {
                        group_open = false; // x, if any, stays buffered to start the next group
                        return { };
                    }

                    return buf.pop();
                }
            };

            // gen for a group's subseq
            struct subgen
            {
                using value_type = element_type;

                std::weak_ptr<state> parent;
                           uint64_t generation;

                maybe<value_type> operator()()
                {
                    auto p = parent.lock();

                    if(!p) {
                        throw fn::stale_group_error{ "Group read after its grouping seq was destroyed." };
                    }

                    if(p->generation != generation) {
                        throw fn::stale_group_error{ "Group read after the grouping seq advanced to group #"
                                                   + std::to_string(p->generation) + "." };
                    }

                    return p->next_in_group();
                }
            };

            using value_type = seq<subgen>;

            std::shared_ptr<state> m_state;

            maybe<value_type> operator()() // return seq for next group
            {
                auto& st = *m_state;

                if(st.group_open) {
                    // The caller may have read all elements of the group without
                    // observing its end; that counts as drained.
                    const element_type* x = st.buf.try_peek(0);

                    if(x && (st.at_opening || st.in_group(*x))) {
                        if(st.policy == fn::unfinished_group::error) {
                            throw fn::unfinished_group_error{ "Next group requested before group #"
                                                            + std::to_string(st.generation) + " was drained." };
                        }
                        st.at_opening = false;
                        st.buf.pop(); // already known to be in the group
                        while(st.next_in_group()) {
                            ;
                        }
                    }
                    st.group_open = false;
                }

                ++st.generation; // invalidates previously handed-out groups

                const element_type* x = st.buf.try_peek(0);

                if(!x) { // reached final end
                    st.key.reset();
                    return { };
                }

                st.key.reset(unwrap_key(st.key_fn(*x)));
                st.group_open = true;
                st.at_opening = true;

                return { value_type{ subgen{ m_state, st.generation } } };
            }
        };

        template<typename InGen>
        auto operator()(seq<InGen> in) const -> seq<gen<InGen>>
        {
            using state_t = typename gen<InGen>::state;
            return { gen<InGen>{ std::make_shared<state_t>(std::move(in.get_gen()), key_fn, pred2, policy) } };
        }

        template<typename Cont>
        auto operator()(Cont cont) const -> seq<gen<to_seq::gen<Cont>>>
        {
            return this->operator()(to_seq{}(std::move(cont)));
        }
    };


    /////////////////////////////////////////////////////////////////////
    struct no_fill {};

    template<typename T, typename Fill>
    void pad_window(std::vector<T>& win, size_t win_size, const Fill& fill)
    {
        while(win.size() < win_size) {
            win.push_back(T(fill));
        }
    }

    template<typename T>
    void pad_window(std::vector<T>&, size_t, const no_fill&)
    {
        RANGEFUL_FN_THROW("emit_padded tail-policy requires a fill value; use padded_with(...).");
    }

    // Elements that stay buffered for the next (overlapping) window are copied,
    // the ones about to be consumed are moved.
    template<typename T>
    T take_or_copy(T& x, bool take, std::true_type /*copyable*/)
    {
        return take ? std::move(x) : T(x);
    }

    template<typename T>
    T take_or_copy(T& x, bool take, std::false_type)
    {
        if(!take) {
            RANGEFUL_FN_THROW("Overlapping windows require copy-constructible elements.");
        }
        return std::move(x);
    }

    template<typename Fill = no_fill>
    struct windows
    {
              size_t win_size;
              size_t stride;
        window_tail  tail_policy;
                Fill fill;

        windows& tail(window_tail t)
        {
            if(t == window_tail::emit_padded && std::is_same<Fill, no_fill>::value) {
                RANGEFUL_FN_THROW("emit_padded tail-policy requires a fill value; use padded_with(...).");
            }
            tail_policy = t;
            return *this;
        }

        template<typename T>
        windows<T> padded_with(T fill_value) const
        {
            return { win_size, stride, window_tail::emit_padded, std::move(fill_value) };
        }

        template<typename InGen>
        struct gen
        {
            using element_type = typename get_value_type<InGen>::type;
            using value_type   = std::vector<element_type>;

            lookahead<InGen> buf;
            const size_t win_size;
            const size_t stride;
            const window_tail tail_policy;
            const Fill fill;
            size_t num_seen; // number of buffered front elements that were part of the last window
            bool started;
            bool ended;

            // drop the elements of the previous window that are not shared with the next one
            void advance()
            {
                const size_t n = std::min(stride, buf.size());
                buf.consume(n);

                for(size_t i = n; i < stride; ++i) { // stride > win_size: skip the gap
                    if(!buf.pop()) {
                        break;
                    }
                }
                num_seen = num_seen > stride ? num_seen - stride : 0;
            }

            value_type make_window(size_t n, bool last)
            {
                value_type ret;
                ret.reserve(n);
                for(size_t i = 0; i < n; ++i) {
                    ret.push_back(take_or_copy(buf.peek(i), last || i < stride,
                                               std::is_copy_constructible<element_type>{}));
                }
                return ret;
            }

            auto operator()() -> maybe<value_type>
            {
                if(ended) {
                    return { };
                }

                if(started) {
                    advance();
                }
                started = true;

                size_t n = 0;
                while(n < win_size && buf.try_peek(n)) {
                    ++n;
                }

                if(n == win_size) {
                    num_seen = win_size;
                    return { make_window(win_size, false) };
                }

                // fewer than win_size elements remain
                ended = true;

                if(tail_policy == window_tail::drop || n <= num_seen) {
                    return { };
                }

                auto ret = make_window(n, true);
                if(tail_policy == window_tail::emit_padded) {
                    pad_window(ret, win_size, fill);
                }
                return { std::move(ret) };
            }
        };

        template<typename InGen>
        auto operator()(seq<InGen> in) const -> seq<gen<InGen>>
        {
            return { gen<InGen>{ { std::move(in.get_gen()), win_size },
                                 win_size, stride, tail_policy, fill,
                                 0, false, false } };
        }

        template<typename Cont>
        auto operator()(Cont cont) const -> seq<gen<to_seq::gen<Cont>>>
        {
            return this->operator()(to_seq{}(std::move(cont)));
        }
    };


    /////////////////////////////////////////////////////////////////////
    template<typename Less>
    struct merge_sorted_with
    {
        Less less;

        template<typename SrcGen>
        struct gen
        {
            using value_type = typename get_value_type<SrcGen>::type;

            struct head_t
            {
                maybe<value_type> head;
                           size_t src_idx;
            };

            std::vector<SrcGen> srcs;
                           Less less;
            std::vector<head_t> heap;    // at most one head per live source
                         size_t pending; // source to refill before the next extraction
                           bool started;
                           bool ended;

            // Heap-order for std::*_heap (a max-heap), so "a after b" puts
            // the smallest head on top; equal heads are taken in source-order.
            bool after(const head_t& a, const head_t& b) const
            {
                return less(*b.head, *a.head)
                    || (!less(*a.head, *b.head) && a.src_idx > b.src_idx);
            }

            void push_head(size_t i)
            {
                auto x = srcs[i]();
                if(!x) {
                    return; // exhausted source leaves the heap for good
                }

                heap.push_back(head_t{ std::move(x), i });
                std::push_heap(heap.begin(), heap.end(), [this](const head_t& a, const head_t& b)
                {
                    return after(a, b);
                });
            }

            auto operator()() -> maybe<value_type>
            {
                if(ended) {
                    return { };
                }

                ended = true; // stays set if a source throws below: no retrying

                if(!started) {
                    started = true;
                    for(size_t i = 0; i < srcs.size(); ++i) {
                        push_head(i);
                    }
                } else if(pending < srcs.size()) {
                    push_head(pending);
                }

                pending = srcs.size();

                if(heap.empty()) {
                    return { };
                }

                std::pop_heap(heap.begin(), heap.end(), [this](const head_t& a, const head_t& b)
                {
                    return after(a, b);
                });

                maybe<value_type> ret = std::move(heap.back().head);
                pending = heap.back().src_idx;
                heap.pop_back();

                ended = false;
                return ret;
            }
        };

        // Srcs is a collection of seqs or containers, e.g. std::vector<any_seq_t<T>>.
        template<typename Srcs,
                 typename SrcGen = gen_of_t<typename Srcs::value_type>>
        auto operator()(Srcs srcs) const -> seq<gen<SrcGen>>
        {
            std::vector<SrcGen> gens;

            for(auto&& src : srcs) {
                gens.push_back(std::move(to_seq{}(std::move(src)).get_gen()));
            }

            if(gens.empty()) {
                RANGEFUL_FN_THROW("merge_sorted requires at least one input.");
            }

            return { gen<SrcGen>{ std::move(gens), less, {}, 0, false, false } };
        }
    };

}   // namespace impl


    /// @defgroup to_vec to_vector/to_seq
    /// @{

    /// @brief Move elements of an `Iterable` to std::vector.
    inline impl::to_vector to_vector()
    {
        return {};
    }

    /// @brief Wrap an `Iterable`, taken by value, as `seq` yielding elements by-move.
    inline impl::to_seq to_seq()
    {
        return {};
    }

    /// @}
    /// @defgroup transform Transform, filter, fold
    /// @{

    /// @brief Create a `seq` yielding results of applying map_fn to input-elements.
    template<typename F>
    impl::transform<F> transform(F map_fn)
    {
        return { std::move(map_fn) };
    }

    /// @brief Filter elements.
    template<typename P>
    impl::where<P> where(P pred)
    {
        return { std::move(pred) };
    }

    /// @brief Yield first `n` elements. Never pulls the element after the n-th.
    inline impl::take_first take_first(size_t n = 1)
    {
        return { n };
    }

    /// @brief Flatten a seq of iterables (e.g. of vectors, or of group subseqs converted with to_vector).
    inline impl::concat concat()
    {
        return {};
    }

    /// @brief Invoke `fn` on each element.
    template<typename F>
    impl::for_each<F> for_each(F fn)
    {
        return { std::move(fn) };
    }

    /// @brief Left-fold with initial value.
    template<typename Ret, typename Op>
    impl::foldl<Ret, Op> foldl(Ret init, Op fold_op)
    {
        return { std::move(init), std::move(fold_op) };
    }

    /// @brief Left-fold with default-constructed initial value of fold_op's return type.
    template<typename Op>
    impl::foldl_d<Op> foldl_d(Op fold_op)
    {
        return { std::move(fold_op) };
    }

    /// @}
    /// @defgroup lookahead Lookahead
    /// @{

    /// @brief Wrap a seq in a lookahead buffer of capacity `k`.
    ///
    /// The resulting seq yields the same elements; its gen, reachable via
    /// `get_gen()`, additionally offers `peek(n)`, `try_peek(n)`, `consume(n)`,
    /// `try_pull()` and `pop()`. Peeking is lazy: only as many elements as the
    /// deepest requested position are ever pulled.
    /*!
    @code
        auto xs = fn::seq(...) % fn::peekable(2);
        auto& buf = xs.get_gen();

        if(buf.try_peek(1) && buf.peek(0) == buf.peek(1)) {
            buf.consume(1); // drop a duplicate
        }
    @endcode
    */
    inline impl::peekable peekable(size_t k = 1)
    {
        if(k < 1) {
            RANGEFUL_FN_THROW("Lookahead capacity must be at least 1.");
        }
        return { k };
    }

    /// @}
    /// @defgroup grouping Grouping
    /// @{

    /// @brief Yield each run of adjacent elements having equivalent keys as a lazy subseq.
    ///
    /// Groups are cursors into the grouping seq's own lookahead buffer rather
    /// than copies: elements are pulled from the input only as the group is read,
    /// and each group, and each element in it, can be accessed only once and in order.
    ///
    /// Only the most recently yielded group is readable. Once the next group is
    /// requested, reading an earlier one throws `fn::stale_group_error`.
    ///
    /// By default requesting the next group while the current one still has
    /// elements throws `fn::unfinished_group_error`; use
    /// `.on_unfinished(fn::unfinished_group::auto_drain)` to skip the rest instead.
    ///
    /// The key is computed once per element, plus once more for each element that
    /// ends a group (it is compared with the closing group's key, then seeds the next one).
    /// The group's key is stored by value; keys are compared for equivalence only, so they need not be orderable.
    /*!
    @code
        fn::seq(...)
      % fn::group_adjacent_as_subseqs_by([](const rec_t& r) { return r.id; })
      % fn::for_each([&](auto group)
        {
            for(auto rec : group) {
                // ...
            }
        });
    @endcode
    */
    template<typename F>
    impl::group_adjacent_as_subseqs_by<F> group_adjacent_as_subseqs_by(F key_fn)
    {
        return { std::move(key_fn), {}, unfinished_group::error };
    }

    /// @brief Same as above, with a caller-supplied equivalence over keys.
    template<typename F, typename BinaryPred>
    impl::group_adjacent_as_subseqs_by<F, BinaryPred> group_adjacent_as_subseqs_by(F key_fn, BinaryPred equivalent)
    {
        return { std::move(key_fn), std::move(equivalent), unfinished_group::error };
    }

    /// @brief Group adjacent elements equivalent to the first element of the group.
    template<typename BinaryPred>
    impl::group_adjacent_as_subseqs_by<by::identity, BinaryPred> group_adjacent_as_subseqs_if(BinaryPred equivalent)
    {
        return { {}, std::move(equivalent), unfinished_group::error };
    }

    /// @}
    /// @defgroup windowing Windowing
    /// @{

    /// @brief Yield windows of `win_size` consecutive elements, advancing by `stride`.
    ///
    /// Each window is a `std::vector` - a frozen copy, independent of later windows.
    /// With `stride < win_size` windows overlap and the shared elements are
    /// copied; with `stride > win_size` the elements in between are skipped.
    ///
    /// Tail-policy (default `window_tail::drop`) governs the trailing
    /// `n < win_size` elements: `drop` discards them, `emit_partial` yields them as
    /// one shorter window, and `padded_with(fill)` yields them padded to `win_size`.
    /// A trailing window is yielded only if it has elements that no earlier
    /// window included.
    ///
    /// Buffering space requirements: `O(win_size)`.
    /*!
    @code
        vec_t{{1,2,3,4,5}} % fn::windows(3)    // [1,2,3] [2,3,4] [3,4,5]
        vec_t{{1,2,3,4,5}} % fn::windows(2, 2) // [1,2] [3,4]
        vec_t{{1,2,3,4,5}} % fn::windows(2, 2).tail(fn::window_tail::emit_partial) // [1,2] [3,4] [5]
        vec_t{{1,2,3,4,5}} % fn::windows(2, 2).padded_with(0) // [1,2] [3,4] [5,0]
    @endcode
    */
    inline impl::windows<> windows(size_t win_size, size_t stride = 1)
    {
        if(win_size < 1 || stride < 1) {
            RANGEFUL_FN_THROW("Window size and stride must be at least 1.");
        }
        return { win_size, stride, window_tail::drop, {} };
    }

    /// @brief `windows(win_size, 1)`
    inline impl::windows<> sliding_window(size_t win_size)
    {
        return windows(win_size, 1);
    }

    /// @brief Group adjacent elements into chunks of specified size; the last one may be shorter.
    inline impl::windows<> in_groups_of(size_t n)
    {
        if(n < 1) {
            RANGEFUL_FN_THROW("Batch size must be at least 1.");
        }
        auto ret = windows(n, n);
        ret.tail(window_tail::emit_partial);
        return ret;
    }

    /// @}
    /// @defgroup merging Merging
    /// @{

    /// @brief Merge a collection of sorted inputs into a single sorted seq, under `less`.
    ///
    /// The argument is a non-empty collection (e.g. `std::vector`) of seqs or containers,
    /// each sorted under `less`. One head per input is buffered; inputs are
    /// pulled lazily, one element per element yielded.
    ///
    /// Equivalent elements from different inputs are yielded in input-order;
    /// elements of the same input keep their relative order.
    ///
    /// An exception thrown by an input propagates as-is, and the merged seq
    /// ends there.
    ///
    /// The input whose head was just yielded is refilled at the start of the
    /// following call, not eagerly, so an exception thrown by that refill
    /// surfaces from the next call rather than from the one that yielded the head.
    ///
    /// NB: if an input is not actually sorted the merge still terminates and
    /// yields every element exactly once, but the output-order of the
    /// affected region is unspecified.
    /*!
    @code
        std::vector<std::vector<int>> inputs{ {1,3,5}, {2,3,6} };
        auto res = std::move(inputs) % fn::merge_sorted() % fn::to_vector(); // 1,2,3,3,5,6
    @endcode
    */
    template<typename Less>
    impl::merge_sorted_with<Less> merge_sorted_with(Less less)
    {
        return { std::move(less) };
    }

    /// @brief `merge_sorted_with(by::make_comp(key_fn))`
    template<typename F>
    impl::merge_sorted_with<impl::comp<F>> merge_sorted_by(F key_fn)
    {
        return { by::make_comp(std::move(key_fn)) };
    }

    /// @brief Merge under `operator<`.
    inline impl::merge_sorted_with<impl::lt> merge_sorted()
    {
        return { {} };
    }

    /// @}


namespace operators
{
    /// @brief `return std::forward<F>(fn)(std::forward<Arg>(arg))`
    ///
    /// Similar to F#'s `|>`.
    template<typename Arg, typename F>
    auto operator % (Arg&& arg, F&& fn) -> decltype( std::forward<F>(fn)(std::forward<Arg>(arg)) )
    {
        // NB: forwarding fn too because it may have rvalue-specific overloads
        return std::forward<F>(fn)(std::forward<Arg>(arg));
    }

} // namespace operators

} // namespace fn

} // namespace rangeful



#if RANGEFUL_FN_ENABLE_RUN_TESTS
#include <map>
#include <string>
#include <iostream>
#include <sstream>

#ifndef VERIFY
#define VERIFY(expr) if(!(expr)) RANGEFUL_FN_THROW("Assertion failed: ( "#expr" ).");
#endif

namespace rangeful
{
namespace fn
{
namespace impl
{

// move-only non-default-constructible type wrapping an int,
// to verify that the engines never copy unless windows overlap.
struct X
{
    int value;

    X(int i) : value{ i }
    {}

               X(X&&) = default;
    X& operator=(X&&) = default;

               X(const X&) = delete;
    X& operator=(const X&) = delete;

    operator int&()
    {
        return value;
    }

    operator const int& () const
    {
        return value;
    }
};
using Xs = std::vector<X>;

// render a range of ranges as e.g. "[1,2][3]"
template<typename Ranges>
std::string show(Ranges&& rs)
{
    std::ostringstream ostr;
    for(auto&& r : rs) {
        ostr << "[";
        bool first = true;
        for(const auto& x : r) {
            ostr << (first ? "" : ",") << int(x);
            first = false;
        }
        ostr << "]";
    }
    return ostr.str();
}

// Generator yielding 0..n-1 and counting how many times it was invoked
// successfully; throws std::runtime_error at element throw_at (if < n).
struct counted_ints
{
    using value_type = int;

    int i;
    int n;
    int throw_at;
    size_t* num_pulls;

    maybe<int> operator()()
    {
        if(i >= n) {
            return { };
        }
        if(i == throw_at) {
            throw std::runtime_error("source failed at " + std::to_string(i));
        }
        ++*num_pulls;
        return { i++ };
    }
};

inline seq<counted_ints> count_to(int n, size_t& num_pulls, int throw_at = -1)
{
    return { counted_ints{ 0, n, throw_at, &num_pulls } };
}

// The same battery is run with container-inputs and with seq-inputs.
template<typename UnaryCallable>
auto make_tests(UnaryCallable make_inputs) -> std::map<std::string, std::function<void()>>
{
    std::map<std::string, std::function<void()>> tests{};
    using fn::operators::operator%;

    auto fold = fn::foldl_d([](int64_t out, int64_t in)
    {
        return out*10 + in;
    });

    auto by_value = [](const X& x) { return int(x); };

    /////////////////////////////////////////////////////////////////////////

    tests["peekable"] = [=]
    {
        auto xs = make_inputs({1,2,3,4}) % fn::peekable(2);
        auto& buf = xs.get_gen();

        VERIFY(buf.peek(1) == 2);
        VERIFY(buf.peek(0) == 1);
        VERIFY(buf.size() == 2);

        buf.consume(1);
        VERIFY(buf.peek(0) == 2);
        VERIFY(buf.num_pulled() == 2);

        // the rest is yielded through the seq
        auto res = std::move(xs) % fold;
        VERIFY(res == 234);
    };

    tests["peekable exhausted"] = [=]
    {
        auto xs = make_inputs({1}) % fn::peekable(3);
        auto& buf = xs.get_gen();

        VERIFY(buf.try_peek(1) == nullptr);
        VERIFY(buf.exhausted());

        bool threw = false;
        try {
            buf.peek(2);
        } catch(const fn::exhausted_error&) {
            threw = true;
        }
        VERIFY(threw);

        threw = false;
        try {
            buf.consume(2);
        } catch(const fn::exhausted_error&) {
            threw = true;
        }
        VERIFY(threw);

        VERIFY(*buf.pop() == 1);
        VERIFY(!buf.pop());
    };

    tests["group_adjacent_as_subseqs_by"] = [=]
    {
        auto res = make_inputs({1,1,2,2,2,3})
        % fn::group_adjacent_as_subseqs_by(by_value)
        % fn::transform([](auto group)
        {
            return std::move(group) % fn::to_vector();
        })
        % fn::to_vector();

        VERIFY(show(res) == "[1,1][2,2,2][3]");
    };

    tests["group_adjacent_as_subseqs_by concat"] = [=]
    {
        // concatenating the groups reproduces the inputs
        auto res = make_inputs({1,2,2,3,3,3,2,2,1})
        % fn::group_adjacent_as_subseqs_by(by_value)
        % fn::transform([](auto group)
        {
            return std::move(group) % fn::to_vector();
        })
        % fn::concat()
        % fold;

        VERIFY(res == 122333221);
    };

    tests["group_adjacent_as_subseqs_by empty"] = [=]
    {
        size_t num_groups = 0;
        make_inputs({})
        % fn::group_adjacent_as_subseqs_by(by_value)
        % fn::for_each([&](auto)
        {
            ++num_groups;
        });
        VERIFY(num_groups == 0);
    };

    tests["group_adjacent_as_subseqs_by unfinished"] = [=]
    {
        bool threw = false;
        try {
            make_inputs({1,1,2})
            % fn::group_adjacent_as_subseqs_by(by_value)
            % fn::for_each([&](auto group)
            {
                auto it = group.begin(); // read only the first element
                VERIFY(*it == 1);
            });
        } catch(const fn::unfinished_group_error&) {
            threw = true;
        }
        VERIFY(threw);
    };

    tests["group_adjacent_as_subseqs_by auto_drain"] = [=]
    {
        auto res = make_inputs({1,1,2,3,3})
        % fn::group_adjacent_as_subseqs_by(by_value)
            .on_unfinished(fn::unfinished_group::auto_drain)
        % fn::transform([](auto group)
        {
            return int(*group.begin()); // first element only
        })
        % fold;

        VERIFY(res == 123);
    };

    tests["windows non-overlapping"] = [=]
    {
        // move-only elements are fine as long as windows do not overlap
        auto res = make_inputs({1,2,3,4,5}) % fn::windows(2, 2) % fn::to_vector();
        VERIFY(show(res) == "[1,2][3,4]");

        auto res2 = make_inputs({1,2,3,4,5}) % fn::in_groups_of(2) % fn::to_vector();
        VERIFY(show(res2) == "[1,2][3,4][5]");

        auto res3 = make_inputs({1,2,3,4,5,6,7}) % fn::windows(2, 3) % fn::to_vector();
        VERIFY(show(res3) == "[1,2][4,5]");
    };

    tests["merge_sorted"] = [=]
    {
        std::vector<decltype(make_inputs({}))> inputs;
        inputs.push_back(make_inputs({1,3,5}));
        inputs.push_back(make_inputs({}));
        inputs.push_back(make_inputs({2,3,6}));

        auto res = std::move(inputs) % fn::merge_sorted_by(by_value) % fold;
        VERIFY(res == 123356);
    };

    tests["take_first"] = [=]
    {
        auto res = make_inputs({1,2,3}) % fn::take_first(2) % fold;
        VERIFY(res == 12);
    };

    tests["where"] = [=]
    {
        auto res = make_inputs({1,2,3}) % fn::where([](const X& x) { return x != 2; }) % fold;
        VERIFY(res == 13);
    };

    return tests;
}

static void run_tests()
{
    using fn::operators::operator%;
    using vec_t = std::vector<int>;

    std::map<std::string, std::function<void()>>
        test_cont{}, test_seq{}, test_other{};

    // make battery of tests where input is a container (Xs)
    test_cont = make_tests([](std::initializer_list<int> xs)
    {
        Xs ret;
        for(auto x : xs) {
            ret.push_back(X(x));
        }
        return ret;
    });

    // make battery of tests where input is an input-range
    test_seq = make_tests([](std::initializer_list<int> xs)
    {
        Xs ret;
        for(auto x : xs) {
            ret.push_back(X(x));
        }
        return fn::to_seq()(std::move(ret));
    });

    /////////////////////////////////////////////////////////////////////////

    test_other["lookahead does not over-pull"] = [&]
    {
        size_t num_pulls = 0;
        auto xs = count_to(10, num_pulls) % fn::peekable(4);
        auto& buf = xs.get_gen();

        VERIFY(num_pulls == 0); // nothing is pulled on construction

        buf.peek(0);
        VERIFY(num_pulls == 1);

        buf.peek(2);
        VERIFY(num_pulls == 3);

        buf.peek(1); // already buffered
        VERIFY(num_pulls == 3);

        buf.consume(2);
        buf.peek(0); // position 2
        VERIFY(num_pulls == 3);

        buf.peek(3); // position 5: max depth 3 + consumed 2
        VERIFY(num_pulls == 6);
        VERIFY(num_pulls == buf.num_pulled());

        VERIFY(!buf.try_pull()); // full
        VERIFY(num_pulls == 6);

        buf.consume(1);
        VERIFY(buf.try_pull()); // position 6
        VERIFY(num_pulls == 7);
    };

    test_other["lookahead capacity"] = [&]
    {
        bool threw = false;
        try {
            auto xs = vec_t{{1,2,3}} % fn::peekable(2);
            xs.get_gen().peek(2);
        } catch(const fn::exhausted_error&) {
            threw = false; // must not be reported as exhaustion
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);

        threw = false;
        try {
            fn::peekable(0);
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);
    };

    test_other["lookahead storage grows with demand"] = [&]
    {
        // capacity is an upper bound, not an up-front allocation
        const size_t huge = size_t(1) << 40;
        auto xs = vec_t{{1,2,3}} % fn::peekable(huge);
        auto& buf = xs.get_gen();

        VERIFY(buf.capacity() == huge);
        VERIFY(buf.peek(0) == 1);
        VERIFY(buf.try_peek(3) == nullptr);
        VERIFY(buf.exhausted());
        VERIFY(buf.size() == 3);

        auto res = std::move(xs) % fn::to_vector();
        VERIFY((res == vec_t{{1,2,3}}));
    };

    test_other["lookahead grows across a wrapped ring"] = [&]
    {
        auto xs = vec_t{{1,2,3,4,5,6,7}} % fn::peekable(3);
        auto& buf = xs.get_gen();

        VERIFY(buf.peek(1) == 2);
        buf.consume(1);           // the front is now in the middle of the storage
        VERIFY(buf.peek(1) == 3); // reuses the freed slot
        VERIFY(buf.peek(2) == 4); // grows
        VERIFY(buf.peek(0) == 2);

        buf.consume(2);
        VERIFY(buf.peek(2) == 6);

        auto res = std::move(xs) % fn::to_vector();
        VERIFY((res == vec_t{{4,5,6,7}}));
    };

    test_other["lookahead ring wraps around"] = [&]
    {
        auto xs = vec_t{{1,2,3,4,5,6,7}} % fn::peekable(3);
        auto& buf = xs.get_gen();

        std::string res;
        while(buf.try_peek(0)) {
            const bool has_next = buf.try_peek(1) != nullptr;
            res += std::to_string(buf.peek(0)) + (has_next ? "<" + std::to_string(buf.peek(1)) + " " : ".");
            buf.consume(1);
        }
        VERIFY(res == "1<2 2<3 3<4 4<5 5<6 6<7 7.");
    };

    test_other["lookahead propagates source errors"] = [&]
    {
        size_t num_pulls = 0;
        auto xs = count_to(5, num_pulls, 2) % fn::peekable(3);
        auto& buf = xs.get_gen();

        VERIFY(buf.peek(1) == 1);

        bool threw = false;
        try {
            buf.peek(2);
        } catch(const std::runtime_error&) {
            threw = true;
        }
        VERIFY(threw);
        VERIFY(buf.size() == 2); // buffered elements are unaffected
        VERIFY(buf.peek(0) == 0);
    };

    /////////////////////////////////////////////////////////////////////////

    test_other["group completeness"] = [&]
    {
        // one group per maximal run of adjacent equivalent keys
        size_t num_groups = 0;
        size_t num_elems = 0;

        vec_t{{ 3, 5, 7, 2, 4, 9, 9, 6, 1, 8 }}
        % fn::group_adjacent_as_subseqs_by([](int x) { return x % 2 == 1; })
        % fn::for_each([&](fn::any_seq_t<int> group)
        {
            ++num_groups;
            for(auto x : group) {
                (void)x;
                ++num_elems;
            }
        });

        VERIFY(num_groups == 6);
        VERIFY(num_elems == 10);
    };

    test_other["group keys are compared by equivalence"] = [&]
    {
        // keys need not be orderable
        struct key_t
        {
            int id;
            bool operator==(const key_t& other) const { return id == other.id; }
        };

        auto res = vec_t{{10, 11, 20, 30, 31, 32}}
        % fn::group_adjacent_as_subseqs_by([](int x) { return key_t{ x / 10 }; })
        % fn::transform([](auto group) { return std::move(group) % fn::to_vector(); })
        % fn::to_vector();
        VERIFY(show(res) == "[10,11][20][30,31,32]");

        // custom equivalence: same parity
        auto res2 = vec_t{{1, 3, 2, 4, 6, 5}}
        % fn::group_adjacent_as_subseqs_if([](int a, int b) { return a % 2 == b % 2; })
        % fn::transform([](auto group) { return std::move(group) % fn::to_vector(); })
        % fn::to_vector();
        VERIFY(show(res2) == "[1,3][2,4,6][5]");
    };

    test_other["group key is computed once per element"] = [&]
    {
        size_t num_calls = 0;
        const auto counted_key = [&num_calls](int x)
        {
            ++num_calls;
            return x;
        };

        auto res = vec_t{{1,1,2,2,2,3}}
        % fn::group_adjacent_as_subseqs_by(counted_key)
        % fn::transform([](fn::any_seq_t<int> group) { return std::move(group) % fn::to_vector(); })
        % fn::to_vector();

        VERIFY(show(res) == "[1,1][2,2,2][3]");
        VERIFY(num_calls == 6 + 2); // plus the two elements that end a group

        // same when the rest of a group is skipped
        num_calls = 0;
        auto firsts = vec_t{{1,1,1,2}}
        % fn::group_adjacent_as_subseqs_by(counted_key)
            .on_unfinished(fn::unfinished_group::auto_drain)
        % fn::transform([](fn::any_seq_t<int> group) { return *group.begin(); })
        % fn::to_vector();

        VERIFY((firsts == vec_t{{1,2}}));
        VERIFY(num_calls == 4 + 1);
    };

    test_other["group is lazy"] = [&]
    {
        size_t num_pulls = 0;
        auto groups = count_to(10, num_pulls)
                    % fn::group_adjacent_as_subseqs_by([](int x) { return x / 4; });

        auto it = groups.begin(); // opens the first group: peeks its first element
        VERIFY(num_pulls == 1);

        auto group = std::move(*it);
        auto git = group.begin();
        VERIFY(*git == 0);
        VERIFY(num_pulls == 1);

        ++git;
        ++git;
        VERIFY(*git == 2);
        VERIFY(num_pulls == 3);
    };

    test_other["stale group"] = [&]
    {
        auto groups = vec_t{{1,1,2,2}}
            % fn::group_adjacent_as_subseqs_by(fn::by::identity{})
                .on_unfinished(fn::unfinished_group::auto_drain);

        auto it = groups.begin();
        auto g1 = std::move(*it);
        ++it; // yields the second group, invalidating g1

        bool threw = false;
        try {
            for(auto x : g1) {
                (void)x;
            }
        } catch(const fn::stale_group_error&) {
            threw = true;
        }
        VERIFY(threw);

        // the current group is unaffected
        auto g2 = std::move(*it);
        auto res = std::move(g2) % fn::to_vector();
        VERIFY((res == vec_t{{2,2}}));

        ++it;
        VERIFY(it == groups.end());
    };

    test_other["stale group after the grouping seq is destroyed"] = [&]
    {
        std::vector<fn::any_seq_t<int>> kept;

        {
            auto groups = vec_t{{1,1,2}} % fn::group_adjacent_as_subseqs_by(fn::by::identity{});
            kept.push_back(std::move(*groups.begin()));
        }

        bool threw = false;
        try {
            for(auto x : kept.front()) {
                (void)x;
            }
        } catch(const fn::stale_group_error&) {
            threw = true;
        }
        VERIFY(threw);
    };

    test_other["drained group without observing its end"] = [&]
    {
        // reading exactly the group's elements (without reading past its end)
        // counts as drained under the default error-policy.
        std::string res;
        vec_t{{1,1,2}}
        % fn::group_adjacent_as_subseqs_by(fn::by::identity{})
        % fn::for_each([&](fn::any_seq_t<int> group)
        {
            auto it = group.begin();
            res += std::to_string(*it);
            if(*it == 1) {
                ++it;
                res += std::to_string(*it);
            }
            res += ";";
        });
        VERIFY(res == "11;2;");
    };

    test_other["group propagates source errors"] = [&]
    {
        size_t num_pulls = 0;
        std::string res;
        bool threw = false;
        try {
            count_to(10, num_pulls, 5)
            % fn::group_adjacent_as_subseqs_by([](int x) { return x / 2; })
            % fn::for_each([&](fn::any_seq_t<int> group)
            {
                for(auto x : group) {
                    res += std::to_string(x);
                }
                res += ";";
            });
        } catch(const std::runtime_error&) {
            threw = true;
        }
        VERIFY(threw);
        VERIFY(res == "01;23;4");
        VERIFY(num_pulls == 5);
    };

    /////////////////////////////////////////////////////////////////////////

    test_other["windows"] = [&]
    {
        VERIFY(show(vec_t{{1,2,3,4,5}} % fn::windows(3, 1) % fn::to_vector()) == "[1,2,3][2,3,4][3,4,5]");
        VERIFY(show(vec_t{{1,2,3,4,5}} % fn::windows(2, 2) % fn::to_vector()) == "[1,2][3,4]");
        VERIFY(show(vec_t{{1,2,3,4,5}} % fn::sliding_window(2) % fn::to_vector()) == "[1,2][2,3][3,4][4,5]");
        VERIFY(show(vec_t{{1,2,3,4,5}} % fn::windows(1) % fn::to_vector()) == "[1][2][3][4][5]");
        VERIFY(show(vec_t{{1,2}}       % fn::windows(3) % fn::to_vector()) == "");
        VERIFY(show(vec_t{}            % fn::windows(3) % fn::to_vector()) == "");
    };

    test_other["windows tail-policy"] = [&]
    {
        using fn::window_tail;

        // default is drop
        VERIFY(show(vec_t{{1,2,3,4,5}} % fn::windows(2, 2) % fn::to_vector()) == "[1,2][3,4]");
        VERIFY(show(vec_t{{1,2,3,4,5}} % fn::windows(2, 2).tail(window_tail::drop) % fn::to_vector()) == "[1,2][3,4]");

        VERIFY(show(vec_t{{1,2,3,4,5}} % fn::windows(2, 2).tail(window_tail::emit_partial) % fn::to_vector()) == "[1,2][3,4][5]");
        VERIFY(show(vec_t{{1,2,3,4,5}} % fn::windows(2, 2).padded_with(0) % fn::to_vector()) == "[1,2][3,4][5,0]");
        VERIFY(show(vec_t{{1,2,3,4,5,6}} % fn::windows(3, 2).tail(window_tail::emit_partial) % fn::to_vector()) == "[1,2,3][3,4,5][5,6]");

        // the trailing window is emitted only if it has elements not seen in an earlier window
        VERIFY(show(vec_t{{1,2,3,4,5}} % fn::windows(3, 1).tail(window_tail::emit_partial) % fn::to_vector()) == "[1,2,3][2,3,4][3,4,5]");
        VERIFY(show(vec_t{{1,2,3,4,5}} % fn::windows(3, 2).tail(window_tail::emit_partial) % fn::to_vector()) == "[1,2,3][3,4,5]");

        // shorter than a single window
        VERIFY(show(vec_t{{1,2}} % fn::windows(3).tail(window_tail::emit_partial) % fn::to_vector()) == "[1,2]");
        VERIFY(show(vec_t{{1,2}} % fn::windows(3).padded_with(9) % fn::to_vector()) == "[1,2,9]");
        VERIFY(show(vec_t{} % fn::windows(3).padded_with(9) % fn::to_vector()) == "");

        // with stride > size the skipped elements do not count as unseen...
        VERIFY(show(vec_t{{1,2,3,4,5,6}} % fn::windows(2, 3).tail(window_tail::emit_partial) % fn::to_vector()) == "[1,2][4,5]");
        // ...but the ones after the gap do
        VERIFY(show(vec_t{{1,2,3,4,5,6,7}} % fn::windows(2, 3).tail(window_tail::emit_partial) % fn::to_vector()) == "[1,2][4,5][7]");

        bool threw = false;
        try {
            fn::windows(2).tail(window_tail::emit_padded);
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);
    };

    test_other["windows bad config"] = [&]
    {
        bool threw = false;
        try {
            fn::windows(0);
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);

        threw = false;
        try {
            fn::windows(2, 0);
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);
    };

    test_other["windows larger than the input"] = [&]
    {
        const size_t huge = size_t(1) << 40;

        VERIFY(show(vec_t{{1,2,3}} % fn::windows(huge).tail(fn::window_tail::emit_partial) % fn::to_vector()) == "[1,2,3]");
        VERIFY(show(vec_t{{1,2,3}} % fn::windows(huge) % fn::to_vector()) == "");
    };

    test_other["windows are lazy"] = [&]
    {
        size_t num_pulls = 0;
        auto wins = count_to(100, num_pulls) % fn::windows(3, 5);

        auto it = wins.begin();
        VERIFY(num_pulls == 3);
        VERIFY(show(std::vector<std::vector<int>>{ *it }) == "[0,1,2]");

        ++it; // skips 3,4 and reads 5,6,7
        VERIFY(num_pulls == 8);
        VERIFY(show(std::vector<std::vector<int>>{ *it }) == "[5,6,7]");
    };

    test_other["windows are frozen"] = [&]
    {
        auto wins = vec_t{{1,2,3,4}} % fn::sliding_window(3) % fn::to_vector();
        wins[0][1] = 20;
        VERIFY(show(wins) == "[1,20,3][2,3,4]");
    };

    test_other["windows over groups"] = [&]
    {
        // a group is a seq like any other
        auto res = vec_t{{1,1,1,2,3,3,3,3}}
        % fn::group_adjacent_as_subseqs_by(fn::by::identity{})
        % fn::transform([](fn::any_seq_t<int> group)
        {
            return std::move(group) % fn::windows(2, 2).tail(fn::window_tail::emit_partial) % fn::to_vector();
        })
        % fn::transform([](std::vector<std::vector<int>> wins) { return show(wins); })
        % fn::to_vector();

        VERIFY((res == std::vector<std::string>{{ "[1,1][1]", "[2]", "[3,3][3,3]" }}));
    };

    test_other["overlapping windows of move-only elements"] = [&]
    {
        bool threw = false;
        try {
            Xs xs;
            xs.push_back(X(1));
            xs.push_back(X(2));
            xs.push_back(X(3));
            std::move(xs) % fn::sliding_window(2) % fn::to_vector();
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);
    };

    /////////////////////////////////////////////////////////////////////////

    test_other["merge_sorted"] = [&]
    {
        std::vector<vec_t> inputs{ vec_t{{1,3,5}}, vec_t{{2,3,6}} };
        auto res = std::move(inputs) % fn::merge_sorted() % fn::to_vector();
        VERIFY((res == vec_t{{1,2,3,3,5,6}}));
    };

    test_other["merge_sorted tie-break"] = [&]
    {
        using pair_t = std::pair<int, char>; // (value, source-tag)
        using pairs_t = std::vector<pair_t>;

        std::vector<pairs_t> inputs{
            pairs_t{{ {1,'a'}, {3,'a'}, {3,'A'}, {5,'a'} }},
            pairs_t{{ {2,'b'}, {3,'b'}, {6,'b'} }},
            pairs_t{{ {3,'c'} }} };

        std::string res;
        std::move(inputs)
        % fn::merge_sorted_by(fn::by::first{})
        % fn::for_each([&](const pair_t& p)
        {
            res += std::to_string(p.first) + p.second;
        });

        // equal elements: source-order across inputs, stable within an input
        VERIFY(res == "1a2b3a3A3b3c5a6b");
    };

    test_other["merge_sorted_with"] = [&]
    {
        std::vector<vec_t> inputs{ vec_t{{5,3,1}}, vec_t{{6,3,2}}, vec_t{{4}} };
        auto res = std::move(inputs)
                 % fn::merge_sorted_with(std::greater<int>{})
                 % fn::to_vector();
        VERIFY((res == vec_t{{6,5,4,3,3,2,1}}));
    };

    test_other["merge_sorted multiset-union"] = [&]
    {
        // a deterministic pseudo-random battery
        uint32_t state = 42;
        auto rnd = [&state](uint32_t n)
        {
            state = state * 1103515245u + 12345u;
            return (state >> 16) % n;
        };

        for(size_t round = 0; round < 50; ++round) {
            std::vector<vec_t> inputs(1 + rnd(5));
            vec_t expected;

            for(auto& input : inputs) {
                const auto len = rnd(8);
                for(size_t i = 0; i < len; ++i) {
                    input.push_back(int(rnd(10)));
                }
                std::sort(input.begin(), input.end());
                expected.insert(expected.end(), input.begin(), input.end());
            }
            std::sort(expected.begin(), expected.end());

            auto res = std::move(inputs) % fn::merge_sorted() % fn::to_vector();
            VERIFY(res == expected);
        }
    };

    test_other["merge_sorted of seqs is lazy"] = [&]
    {
        size_t pulls_a = 0;
        size_t pulls_b = 0;

        std::vector<fn::any_seq_t<int>> inputs;
        inputs.emplace_back(count_to(100, pulls_a));
        inputs.emplace_back(count_to(100, pulls_b));

        auto merged = std::move(inputs) % fn::merge_sorted();
        VERIFY(pulls_a == 0 && pulls_b == 0);

        auto res = std::move(merged) % fn::take_first(3) % fn::to_vector();
        VERIFY((res == vec_t{{0,0,1}}));

        // one head per input, plus the refill after the first yield
        VERIFY(pulls_a == 2);
        VERIFY(pulls_b == 2);
    };

    test_other["merge_sorted propagates source errors"] = [&]
    {
        size_t pulls_a = 0;
        size_t pulls_b = 0;

        std::vector<fn::any_seq_t<int>> inputs;
        inputs.emplace_back(count_to(10, pulls_a));
        inputs.emplace_back(count_to(10, pulls_b, 2));

        auto merged = std::move(inputs) % fn::merge_sorted();
        vec_t res;
        bool threw = false;
        try {
            for(auto x : merged) {
                res.push_back(x);
            }
        } catch(const std::runtime_error&) {
            threw = true;
        }
        VERIFY(threw);
        VERIFY((res == vec_t{{0,0,1,1}}));

        // the merge does not resume after the failure
        VERIFY(!merged.get_gen()());
        VERIFY(pulls_b == 2);
    };

    test_other["merge_sorted unsorted input"] = [&]
    {
        // well-defined but unspecified order: every element is yielded exactly once
        std::vector<vec_t> inputs{ vec_t{{5,1,4}}, vec_t{{2,3}} };
        auto res = std::move(inputs) % fn::merge_sorted() % fn::to_vector();
        std::sort(res.begin(), res.end());
        VERIFY((res == vec_t{{1,2,3,4,5}}));
    };

    test_other["merge_sorted empty collection"] = [&]
    {
        bool threw = false;
        try {
            std::vector<vec_t>{} % fn::merge_sorted();
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);
    };

    test_other["merge then group"] = [&]
    {
        std::vector<vec_t> inputs{ vec_t{{1,2,2,4}}, vec_t{{1,2,3}} };
        auto res = std::move(inputs)
        % fn::merge_sorted()
        % fn::group_adjacent_as_subseqs_by(fn::by::identity{})
        % fn::transform([](fn::any_seq_t<int> group)
        {
            return std::move(group) % fn::to_vector();
        })
        % fn::to_vector();

        VERIFY(show(res) == "[1,1][2,2,2][3][4]");
    };

    /////////////////////////////////////////////////////////////////////////

    test_other["guard against multiple iterations of input range"] = [&]
    {
        auto xs = vec_t{{1,2,3}} % fn::windows(1);
        bool threw = false;
        try {
            for(size_t i = 0; i < 2; i++) {
                for(auto x : xs) {
                    (void)x;
                }
            }
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);
    };

    /////////////////////////////////////////////////////////////////////////
    size_t num_failed = 0;
    size_t num_ok = 0;
    for(auto&& tests : { test_cont, test_seq, test_other })
        for(const auto& kv : tests)
    {
        try{
            kv.second();
            num_ok++;
        } catch(const std::exception& e) {
            num_failed++;
            std::cerr << "Failed test '" << kv.first << "' :" << e.what() << "\n";
        }
    }
    if(num_failed == 0) {
        std::cerr << "Ran " << num_ok << " tests - OK\n";
    } else {
        throw std::runtime_error(std::to_string(num_failed) + " tests failed.");
    }
}

} // namespace impl
} // namespace fn
} // namespace rangeful


#endif //RANGEFUL_FN_ENABLE_RUN_TESTS

#if defined(_MSC_VER)
#   pragma warning(pop)
#endif

#endif // #ifndef RANGEFUL_FN_HPP_
