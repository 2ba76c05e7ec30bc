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

  Based on rangeless fn.hpp by Alex Astashyn.

*/
#ifndef PSEUDOENUM_ENUMERABLE_HPP_
#define PSEUDOENUM_ENUMERABLE_HPP_

#include <stdexcept>
#include <algorithm>
#include <functional>
#include <memory>
#include <vector>
#include <string> // for to_string
#include <limits>
#include <new>
#include <typeinfo> // std::bad_cast
#include <type_traits>
#include <iterator>
#include <cassert>

#include <boost/any.hpp>

#define PSEUDOENUM_FN_THROW(exception_type, msg) \
    throw exception_type( std::string{} + __FILE__ + ":" + std::to_string(__LINE__) + ": " + (msg) )

namespace pseudoenum
{

/// @brief Lazy, composable sequence operators: filter, transform, sort_by, cast_to, for_all, generator.
namespace fn
{

namespace impl
{
    /////////////////////////////////////////////////////////////////////////
    /// Bare-bones optional with rebinding assignment.
    ///
    /// Every generator in this library returns maybe<T>; an empty maybe means end-of-sequence.
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

        static_assert(!std::is_same<value_type, void>::value, "Can't have void as value_type - did you forget a return-statement in your transform-function?");

        maybe() : m_sentinel{}
        {}

        maybe(const maybe&) = delete;
        maybe& operator=(const maybe&) = delete;

        maybe(T val) : m_sentinel{}
        {
            reset(std::move(val));
        }

        maybe(maybe&& other) noexcept : m_sentinel{}
        {
            if(!other.m_empty) {
                reset(std::move(*other));
                other.reset();
            }
        }

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

        // Destroy and placement-new rather than move-assign: T may be
        // move-constructible but not move-assignable (e.g. holding a closure).
        void reset(T val)
        {
            reset();
            new (&m_value) T(std::move(val));
            m_empty = false;
        }

        void reset()
        {
            if(!m_empty) {
                m_value.~T();
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
            return m_value;
        }

        const T& operator*() const noexcept
        {
            assert(!m_empty);
            return m_value;
        }

        ~maybe()
        {
            reset();
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // Used to control SFINAE priority of otherwise ambiguous overloads.
    struct pr_lowest {};
    struct pr_low     : pr_lowest {};
    struct pr_high    : pr_low    {};
    struct pr_highest : pr_high   {};

    using resolve_overload = pr_highest;

    /////////////////////////////////////////////////////////////////////////
    // Absence checks. Only pointers (including function pointers),
    // std::function and std::shared_ptr can be null; everything else
    // (lambdas, function objects, containers) is always present.
    template<typename T>
    bool is_absent(T* ptr) noexcept
    {
        return ptr == nullptr;
    }

    template<typename Sig>
    bool is_absent(const std::function<Sig>& fn) noexcept
    {
        return !fn;
    }

    template<typename T>
    bool is_absent(const std::shared_ptr<T>& ptr) noexcept
    {
        return !ptr;
    }

    template<typename T>
    bool is_absent(const T&) noexcept
    {
        return false;
    }

    template<typename T>
    void require_present(const T& arg, const char* arg_name)
    {
        if(is_absent(arg)) {
            PSEUDOENUM_FN_THROW(std::invalid_argument, std::string{ arg_name } + " must not be null.");
        }
    }

}   // namespace impl


    /// @defgroup io Inputs and Outputs
    ///
    /*!
    @code
                      vec  % ... // view: yields copies, vec must outlive the traversal
           std::move(vec)  % ... // owned: moved into shared immutable storage
                     &vec  % ... // view through a pointer; nullptr is rejected
           fn::from(b, e)  % ... // view over an iterator pair
       fn::seq([]{ ... })  % ... // single-pass, from a nullary invokable
fn::restartable([]{ ... }) % ... // restartable, each traversal runs a fresh copy of the invokable
    @endcode
    */
    /// @{

    /////////////////////////////////////////////////////////////////////////
    /// @brief Return fn::end_seq() from a generator function to signal end-of-inputs.
    ///
    /// This throws fn::end_seq::exception on construction, which is caught internally
    /// and converted to end-of-sequence. It never propagates outside of the API.
    struct end_seq
    {
        struct exception
        {};

        end_seq()
        {
            throw exception{};
        }

        // Makes `cond ? value : fn::end_seq()` well-typed.
        template<typename T>
        operator T() const
        {
            throw exception{};
        }
    };

namespace impl
{
    /////////////////////////////////////////////////////////////////////////
    // Adapts an end_seq-throwing user generator to the maybe<T>-returning protocol.
    template<typename Gen>
    struct catch_end
    {
        Gen gen;
        bool ended; // don't re-invoke gen after the first end_seq::exception

        using value_type = decltype(gen());

        auto operator()() -> maybe<value_type>
        {
            if(ended) {
                return { };
            }

            try {
                return { gen() };
            } catch(const end_seq::exception&) {
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
    /// Single-pass InputRange over a nullary generator.
    ///
    /// begin() may be called once; the second call throws std::logic_error.
    template<typename Gen>
    class seq
    {
    public:
        using value_type = typename get_value_type<Gen>::type;
        static_assert(!std::is_reference<value_type>::value, "The type returned by the generator-function must be a value-type. Use std::ref if necessary.");

        seq(Gen gen)
            : m_gen( std::move(gen) ) // NB: must use parentheses here!
        {}

                   seq(const seq&) = delete;
        seq& operator=(const seq&) = delete;

                        seq(seq&&) = default;
             seq& operator=(seq&&) = default;

        /////////////////////////////////////////////////////////////////////
        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using   difference_type = std::ptrdiff_t;
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
                    m_parent = nullptr;
                }
                return *this;
            }

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
            seq* m_parent;
        };

        iterator begin() // NB: non-const, advances to the first element
        {
            if(m_started) {
                PSEUDOENUM_FN_THROW(std::logic_error, "seq::begin() can only be called once per instance.");
            }
            m_started = true;

            auto it = iterator{ m_ended ? nullptr : this };
            ++it;
            return it;
        }

        static iterator end()
        {
            return {};
        }

        /// Move the generator out, e.g. to compose another stage over it.
        /// The seq is consumed afterwards.
        Gen yank_gen()
        {
            if(m_started) {
                PSEUDOENUM_FN_THROW(std::logic_error, "seq has already been iterated; it can't be used as an input again.");
            }
            m_started = true;
            m_ended   = true;
            return std::move(m_gen);
        }

    private:
        impl::maybe<value_type> m_current = {};
                            Gen m_gen;
                           bool m_started = false;
                           bool m_ended   = false;
    };

    /////////////////////////////////////////////////////////////////////////
    /// Restartable lazy sequence.
    ///
    /// Holds a pristine copy of the generator; every begin() copies it,
    /// so every traversal starts over and is independent of the others.
    template<typename Gen>
    class enumerable
    {
    public:
        using value_type = typename get_value_type<Gen>::type;
        static_assert(!std::is_reference<value_type>::value, "The type returned by the generator-function must be a value-type. Use std::ref if necessary.");

        enumerable(Gen gen)
            : m_gen( std::move(gen) )
        {}

        // To support conversion to any_enumerable_t
        // (i.e. Gen is a std::function, and OtherGen is some gen-type).
        template<typename OtherGen>
        enumerable(enumerable<OtherGen> other)
            : m_gen( std::move(other.get_gen()) )
        {}

        /////////////////////////////////////////////////////////////////////
        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using   difference_type = std::ptrdiff_t;
            using        value_type = enumerable::value_type;
            using           pointer = value_type*;
            using         reference = value_type&&; // NB: rvalue-reference; the element belongs to this traversal

        private:
            // State of one traversal, shared by copies of the iterator.
            struct cursor
            {
                Gen gen;
                impl::maybe<value_type> current;

                explicit cursor(Gen g)
                    : gen( std::move(g) )
                    , current{}
                {}
            };

        public:

            iterator() = default;

            explicit iterator(Gen gen)
                : m_cursor{ std::make_shared<cursor>(std::move(gen)) }
            {
                ++*this;
            }

            iterator& operator++()
            {
                if(!m_cursor) {
                    return *this;
                }

                m_cursor->current = m_cursor->gen();

                if(!m_cursor->current) {
                    m_cursor.reset(); // reached end
                }
                return *this;
            }

            reference operator*() const { return static_cast<reference>(*m_cursor->current); }

            pointer operator->() const { return &*m_cursor->current; }

            bool operator==(const iterator& other) const
            {
                return m_cursor == other.m_cursor;
            }

            bool operator!=(const iterator& other) const
            {
                return m_cursor != other.m_cursor;
            }

        private:
            std::shared_ptr<cursor> m_cursor;
        };

        iterator begin() const
        {
            return iterator{ m_gen };
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

        operator std::vector<value_type>() const
        {
            std::vector<value_type> ret{};
            auto gen = m_gen;
            for(auto x = gen(); x; x = gen()) {
                ret.push_back(std::move(*x));
            }
            return ret;
        }

    private:
        Gen m_gen;
    };

    /////////////////////////////////////////////////////////////////////////
    // Yields copies of [it, it_end). Copying the gen before the first call
    // restarts the traversal.
    template<typename Iterator>
    struct view_gen
    {
        using value_type = typename std::iterator_traits<Iterator>::value_type;

        Iterator it;
        Iterator it_end;

        auto operator()() -> maybe<value_type>
        {
            if(it == it_end) {
                return { };
            }
            return { *it++ };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // Yields copies of the elements of a shared immutable container.
    template<typename Cont>
    struct shared_gen
    {
        using value_type = typename Cont::value_type;
        using iterator   = typename Cont::const_iterator;

        std::shared_ptr<const Cont> cont;
                           iterator it;
                               bool started;

        auto operator()() -> maybe<value_type>
        {
            if(!started) {
                started = true;
                it = cont->begin();
            }

            if(it == cont->end()) {
                return { };
            }
            return { *it++ };
        }
    };

    template<typename Cont>
    shared_gen<Cont> make_shared_gen(std::shared_ptr<const Cont> cont)
    {
        return { std::move(cont), {}, false };
    }

    /////////////////////////////////////////////////////////////////////////
    // source_traits<Source> says how an operator obtains the input generator
    // from whatever it was given (take), and what it wraps its own
    // generator into (wrap): a seq stays single-pass, everything else
    // becomes a restartable enumerable.

    template<typename Cont, bool IsLvalue>
    struct container_source;

    // Lvalue container: caller-owned, viewed in place.
    template<typename Cont>
    struct container_source<Cont, true>
    {
        using gen_type = view_gen<typename Cont::const_iterator>;

        template<typename G>
        using wrap = enumerable<G>;

        static gen_type take(const Cont& cont)
        {
            return { cont.begin(), cont.end() };
        }
    };

    // Rvalue container: moved into storage owned by the result.
    template<typename Cont>
    struct container_source<Cont, false>
    {
        using gen_type = shared_gen<Cont>;

        template<typename G>
        using wrap = enumerable<G>;

        template<typename C>
        static gen_type take(C&& cont)
        {
            return make_shared_gen(std::shared_ptr<const Cont>(std::make_shared<Cont>(std::forward<C>(cont))));
        }
    };

    template<typename Source,
             typename Decayed = typename std::decay<Source>::type>
    struct source_traits
        : container_source<Decayed, std::is_lvalue_reference<Source>::value>
    {};

    template<typename Source, typename Cont>
    struct source_traits<Source, Cont*>
    {
        using gen_type = view_gen<typename Cont::const_iterator>;

        template<typename G>
        using wrap = enumerable<G>;

        static gen_type take(const Cont* cont)
        {
            require_present(cont, "source");
            return { cont->begin(), cont->end() };
        }
    };

    template<typename Source, typename Cont>
    struct source_traits<Source, std::shared_ptr<Cont>>
    {
        using cont_type = typename std::remove_const<Cont>::type;
        using  gen_type = shared_gen<cont_type>;

        template<typename G>
        using wrap = enumerable<G>;

        static gen_type take(std::shared_ptr<Cont> cont)
        {
            require_present(cont, "source");
            return make_shared_gen(std::shared_ptr<const cont_type>(std::move(cont)));
        }
    };

    template<typename Source, typename Gen>
    struct source_traits<Source, seq<Gen>>
    {
        static_assert(!std::is_lvalue_reference<Source>::value, "seq is a single-pass range - pass it by std::move.");

        using gen_type = Gen;

        template<typename G>
        using wrap = seq<G>;

        static gen_type take(seq<Gen>&& s)
        {
            return s.yank_gen();
        }
    };

    template<typename Source, typename Gen>
    struct source_traits<Source, enumerable<Gen>>
    {
        using gen_type = Gen;

        template<typename G>
        using wrap = enumerable<G>;

        static gen_type take(const enumerable<Gen>& e)
        {
            return e.get_gen();
        }

        static gen_type take(enumerable<Gen>&& e)
        {
            return std::move(e.get_gen());
        }
    };

    template<typename Source>
    using source_value_t = typename get_value_type<typename source_traits<Source>::gen_type>::type;

}   // namespace impl

    /////////////////////////////////////////////////////////////////////////
    /// @brief Adapt a generator function as a single-pass `seq`.
    /*!
    @code
        int i = 0;
        auto xs = fn::seq([&i]
        {
            return i < 5 ? i++ : fn::end_seq();
        }); // 0,1,2,3,4
    @endcode
    */
    template<typename NullaryInvokable>
    impl::seq<impl::catch_end<NullaryInvokable>> seq(NullaryInvokable gen_fn)
    {
        static_assert(!std::is_reference<decltype(gen_fn())>::value, "The type returned by gen_fn must be a value-type.");
        static_assert(!std::is_same<decltype(gen_fn()), void>::value, "You forgot a return-statement in your gen-function.");
        impl::require_present(gen_fn, "gen_fn");
        return { { std::move(gen_fn), false } };
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Adapt a copyable generator function as a restartable `enumerable`.
    ///
    /// Every traversal runs on a fresh copy of `gen_fn`, so state must live
    /// in the closure (e.g. init-captures), not be referenced from outside.
    /*!
    @code
        auto xs = fn::restartable([i = 0]() mutable
        {
            return i < 5 ? i++ : fn::end_seq();
        }); // 0,1,2,3,4 on every traversal
    @endcode
    */
    template<typename NullaryInvokable>
    impl::enumerable<impl::catch_end<NullaryInvokable>> restartable(NullaryInvokable gen_fn)
    {
        static_assert(!std::is_reference<decltype(gen_fn())>::value, "The type returned by gen_fn must be a value-type.");
        static_assert(!std::is_same<decltype(gen_fn()), void>::value, "You forgot a return-statement in your gen-function.");
        impl::require_present(gen_fn, "gen_fn");
        return { { std::move(gen_fn), false } };
    }

    /// @brief Create a restartable view over `[it_beg, it_end)`.
    template<typename Iterator>
    impl::enumerable<impl::view_gen<Iterator>> from(Iterator it_beg, Iterator it_end)
    {
        return { { std::move(it_beg), std::move(it_end) } };
    }

    /// @brief Create a restartable view over a container. The container must outlive the traversals.
    template<typename Iterable,
             typename Iterator = typename Iterable::const_iterator>
    impl::enumerable<impl::view_gen<Iterator>> from(const Iterable& src)
    {
        return { { src.begin(), src.end() } };
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Type-erased `enumerable` yielding `T`.
    ///
    /// Implicitly constructible from any `enumerable` with the same value_type.
    /// Useful for declaring a function returning a sequence without
    /// spelling out the composed generator type.
    /*!
    @code
    fn::any_enumerable_t<int> evens =
        fn::generator(10, 0)
      % fn::filter([](int x)
        {
            return x % 2 == 0;
        });
    @endcode
    */
    template<typename T>
    using any_enumerable_t = impl::enumerable<std::function<impl::maybe<T>()>>;
    /// @}


namespace impl
{
    /////////////////////////////////////////////////////////////////////
    // User-provided key_fn may be returning a std::reference_wrapper<...>.
    // So we'll be comparing keys using lt, equipped to deal with that.
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

    template<typename T>
    int compare(const T& a, const T&b)
    {
        return ( lt{}(a, b) ? -1
               : lt{}(b, a) ?  1
               :               0);
    }

    /////////////////////////////////////////////////////////////////////
    template<typename T>
    struct unwrap_ref
    {
        using type = T;
    };

    template<typename T>
    struct unwrap_ref<std::reference_wrapper<T>>
    {
        using type = typename std::remove_const<T>::type;
    };

    template<typename T, typename = void>
    struct has_natural_order_impl : std::false_type
    {};

    template<typename T>
    struct has_natural_order_impl<T, decltype(void( std::declval<const T&>() < std::declval<const T&>() ))>
        : std::true_type
    {};

    /// true iff keys of type T can be ordered without an explicit comparer.
    template<typename T>
    struct has_natural_order : has_natural_order_impl<typename unwrap_ref<T>::type>
    {};

    /// Three-way comparer over the natural order of the key type.
    struct natural_order
    {
        template<typename T>
        int operator()(const T& a, const T& b) const
        {
            return compare(a, b);
        }
    };

}   // namespace impl


/// @brief Common key-functions to use with sort_by / sort_by_descending.
/// @code
/// std::move(pairs) % fn::sort_by(fn::by::second{});
/// @endcode
namespace by
{
    // sort() is simply sort_by<identity>
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

    struct second
    {
        template<typename T>
        auto operator()(const T& x) const -> decltype(*&x.second)
        {
            return x.second;
        }
    };
}   // namespace by


/////////////////////////////////////////////////////////////////////////
/// @brief Implementations for corresponding static functions in fn::
namespace impl
{
    /////////////////////////////////////////////////////////////////////
    struct to_vector
    {
        // passthrough overload
        template<typename T>
        std::vector<T> operator()(std::vector<T> vec) const
        {
            return vec;
        }

        template<typename Source,
                 typename Traits = source_traits<Source>,
                 typename Vec = std::vector<source_value_t<Source>>>
        Vec operator()(Source&& src) const
        {
            auto gen = Traits::take(std::forward<Source>(src));

            Vec ret{};
            for(auto x = gen(); x; x = gen()) {
                ret.push_back(std::move(*x));
            }
            return ret;
        }
    };

    /////////////////////////////////////////////////////////////////////
    template<typename F>
    struct for_each
    {
        F fn; // may be non-const, hence operator() is also non-const.

        template<typename Source,
                 typename Traits = source_traits<Source>>
        void operator()(Source&& src)
        {
            auto gen = Traits::take(std::forward<Source>(src));
            for(auto x = gen(); x; x = gen()) {
                fn(std::move(*x));
            }
        }
    };

    /////////////////////////////////////////////////////////////////////////

    // Define operator() composing this stage's gen over the source's gen.
    // We yank the gen from the input (see source_traits::take),
    // wrap it into our nullary gen that does the additional work
    // (filter, transform, etc.) and wrap it back as seq or enumerable.
    // Nothing is evaluated here: the first element is computed
    // only when the result is iterated.
#define PSEUDOENUM_FN_COMPOSE_OVER_SOURCE(...)                                 \
    template<typename Source,                                                  \
             typename Traits = source_traits<Source>>                          \
    auto operator()(Source&& src) const                                        \
        -> typename Traits::template wrap<gen<typename Traits::gen_type>>      \
    {                                                                          \
        return { { Traits::take(std::forward<Source>(src)), __VA_ARGS__ } };   \
    }

    /////////////////////////////////////////////////////////////////////
    template<typename Pred>
    struct filter
    {
        Pred pred;

        template<typename InGen>
        struct gen
        {
            InGen gen;
             Pred pred;

            using value_type = typename get_value_type<InGen>::type;

            static_assert(std::is_same<decltype(pred(*gen())), bool>::value, "The return value of predicate must be bool.");

            auto operator()() -> maybe<value_type>
            {
                auto x = gen();
                while(x && !pred(*x)) {
                    x = gen();
                }
                return x;
            }
        };

        PSEUDOENUM_FN_COMPOSE_OVER_SOURCE( pred )
    };

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

            using value_type = typename std::decay<decltype(map_fn(std::move(*gen())))>::type;

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

        PSEUDOENUM_FN_COMPOSE_OVER_SOURCE( map_fn )
    };

    /////////////////////////////////////////////////////////////////////
    template<typename T>
    struct cast_to
    {
        static_assert(!std::is_reference<T>::value, "Can only cast to a value-type.");

        template<typename InGen>
        struct gen
        {
            InGen gen;

            using value_type = T;

            auto operator()() -> maybe<value_type>
            {
                auto x = gen();
                if(!x) {
                    return { };
                }
                return { s_convert(std::move(*x), resolve_overload{}) };
            }
        };

        // If the source already yields T, pass it through as-is;
        // otherwise convert each element when it is consumed.
        template<typename Source,
                 typename Traits = source_traits<Source>,
                 typename InGen  = typename Traits::gen_type,
                 typename IsSame = std::is_same<typename get_value_type<InGen>::type, T>>
        auto operator()(Source&& src) const
            -> typename Traits::template wrap<typename std::conditional<IsSame::value, InGen, gen<InGen>>::type>
        {
            return { x_Compose(Traits::take(std::forward<Source>(src)), IsSame{}) };
        }

    private:
        template<typename InGen>
        static InGen x_Compose(InGen in, std::true_type)
        {
            return in;
        }

        template<typename InGen>
        static gen<InGen> x_Compose(InGen in, std::false_type)
        {
            return { std::move(in) };
        }

        // Untyped element: unbox. Throws boost::bad_any_cast (a std::bad_cast) on type mismatch.
        template<typename U>
        static auto s_convert(U&& x, pr_highest)
            -> typename std::enable_if<std::is_same<typename std::decay<U>::type, boost::any>::value, T>::type
        {
            return boost::any_cast<T>(x);
        }

        // Pointer to polymorphic type: checked downcast.
        template<typename U>
        static auto s_convert(U* x, pr_high)
            -> typename std::enable_if<std::is_pointer<T>::value && std::is_polymorphic<U>::value, T>::type
        {
            if(!x) {
                return nullptr;
            }

            T ret = dynamic_cast<T>(x);
            if(!ret) {
                throw std::bad_cast{};
            }
            return ret;
        }

        // Explicit value conversion, e.g. double -> int.
        template<typename U>
        static auto s_convert(U&& x, pr_low)
            -> typename std::enable_if<!std::is_pointer<typename std::decay<U>::type>::value,
                                       decltype(static_cast<T>(std::forward<U>(x)))>::type
        {
            return static_cast<T>(std::forward<U>(x));
        }

        template<typename U>
        static T s_convert(U&&, pr_lowest)
        {
            static_assert(sizeof(U) == 0, "The element type can't be converted to the type requested in fn::cast_to<T>().");
            throw std::bad_cast{};
        }
    };

    /////////////////////////////////////////////////////////////////////
    // Note: the predicate is evaluated for every element, even after
    // the first false; the whole source is consumed exactly once.
    template<typename Pred>
    struct for_all
    {
        Pred pred;

        template<typename Source,
                 typename Traits = source_traits<Source>>
        bool operator()(Source&& src) const
        {
            auto gen = Traits::take(std::forward<Source>(src));
            auto pred_copy = pred; // may be a mutable lambda

            static_assert(std::is_same<decltype(pred_copy(*gen())), bool>::value, "The return value of predicate must be bool.");

            bool ret = true;
            for(auto x = gen(); x; x = gen()) {
                if(!pred_copy(*x)) {
                    ret = false;
                }
            }
            return ret;
        }
    };

    /////////////////////////////////////////////////////////////////////
    struct ascending_tag {};
    struct descending_tag {};

    // Eager: the source is traversed exactly once, at the call,
    // and the keys are extracted once per element. The sort is stable
    // in both directions, i.e. elements with equivalent keys keep their
    // original relative order. The result is a restartable enumerable
    // owning the sorted elements.
    template<typename F, typename Comparer, typename Direction>
    struct sort_by
    {
        const F key_fn;
        const Comparer comparer;

        template<typename Source,
                 typename Traits = source_traits<Source>,
                 typename Value  = source_value_t<Source>>
        auto operator()(Source&& src) const -> enumerable<shared_gen<std::vector<Value>>>
        {
            using key_t = typename std::decay<decltype(key_fn(std::declval<const Value&>()))>::type;

            static_assert(!std::is_same<Comparer, natural_order>::value || has_natural_order<key_t>::value,
                          "The key type has no natural ordering - pass a comparer explicitly, e.g. fn::sort_by(key_fn, comparer).");

            static_assert(!std::is_same<decltype(comparer(std::declval<const key_t&>(), std::declval<const key_t&>())), bool>::value,
                          "The comparer must return a negative, zero, or positive int rather than bool.");

            auto gen = Traits::take(std::forward<Source>(src));

            std::vector<Value> elems{};
            for(auto x = gen(); x; x = gen()) {
                elems.push_back(std::move(*x));
            }

            std::vector<key_t> keys{};
            keys.reserve(elems.size());
            for(const auto& x : elems) {
                keys.push_back(key_fn(x));
            }

            std::vector<size_t> order(elems.size());
            for(size_t i = 0; i < order.size(); i++) {
                order[i] = i;
            }

            std::stable_sort(order.begin(), order.end(), [this, &keys](size_t a, size_t b)
            {
                return s_precedes(comparer(keys[a], keys[b]), Direction{});
            });

            std::vector<Value> sorted{};
            sorted.reserve(elems.size());
            for(const size_t i : order) {
                sorted.push_back(std::move(elems[i]));
            }

            return { make_shared_gen(std::shared_ptr<const std::vector<Value>>(
                         std::make_shared<std::vector<Value>>(std::move(sorted)))) };
        }

    private:
        static bool s_precedes(int cmp, ascending_tag)
        {
            return cmp < 0;
        }

        static bool s_precedes(int cmp, descending_tag)
        {
            return cmp > 0;
        }
    };

    /////////////////////////////////////////////////////////////////////
    // Yields count consecutive ints from start.
    // Counts in unsigned, so stepping past INT_MAX wraps to INT_MIN.
    struct iota_gen
    {
        using value_type = int;

        unsigned next;
        int remaining;

        auto operator()() -> maybe<value_type>
        {
            if(remaining <= 0) {
                return { };
            }

            const int ret = s_to_int(next);
            --remaining;
            ++next;
            return { ret };
        }

    private:
        // Two's-complement reinterpretation without implementation-defined narrowing.
        static int s_to_int(unsigned u)
        {
            return u <= unsigned(std::numeric_limits<int>::max())
                 ? int(u)
                 : -int(~u) - 1;
        }
    };

}   // namespace impl

    /////////////////////////////////////////////////////////////////////////

    /// @defgroup to_vec to_vector/for_each
    /// @{

    /// @brief Copy or move the elements of any source to std::vector.
    inline impl::to_vector to_vector()
    {
        return {};
    }

    /// @brief Invoke `fn` on every element of the source.
    template<typename F>
    impl::for_each<F> for_each(F fn)
    {
        impl::require_present(fn, "fn");
        return { std::move(fn) };
    }

    /// @}
    /// @defgroup filter Filtering and Mapping
    /// @{

    ///////////////////////////////////////////////////////////////////////////
    /// @brief Create a lazy sequence of the elements satisfying `pred`, in their original order.
    ///
    /// `pred` is checked immediately; the source when the stage is applied.
    /// Neither is evaluated against any element until the result is iterated.
    /*!
    @code
        using fn::operators::operator%;

        auto evens = std::vector<int>{{ 1, 2, 3, 4 }}
          % fn::filter([](int x)
            {
                return x % 2 == 0;
            })
          % fn::to_vector();

        VERIFY((evens == std::vector<int>{{ 2, 4 }}));
    @endcode
    */
    template<typename P>
    impl::filter<P> filter(P pred)
    {
        impl::require_present(pred, "predicate");
        return { std::move(pred) };
    }

    ///////////////////////////////////////////////////////////////////////////
    /// @brief Create a lazy sequence yielding results of applying `map_fn` to each element.
    ///
    /// `map_fn` is applied at most once per element per traversal, when the element is consumed.
    template<typename F>
    impl::transform<F> transform(F map_fn)
    {
        impl::require_present(map_fn, "transformer");
        return { std::move(map_fn) };
    }

    /// @}
    /// @defgroup cast Casting
    /// @{

    ///////////////////////////////////////////////////////////////////////////
    /// @brief Lazily convert each element to `T`.
    ///
    /// A source already yielding `T` is returned as-is. Otherwise `boost::any` elements
    /// are unboxed with `boost::any_cast`, pointers to polymorphic types are downcast with
    /// `dynamic_cast` (throwing `std::bad_cast` on mismatch), and other types use `static_cast`.
    /// Conversion failures are thrown when the offending element is consumed.
    /*!
    @code
        const std::vector<boost::any> untyped{ 1, 2, std::string{ "3" } };

        auto ints = untyped % fn::cast_to<int>(); // does not throw
        auto it = ints.begin();                   // 1
        ++it;                                     // 2
        ++it;                                     // throws boost::bad_any_cast
    @endcode
    */
    template<typename T>
    impl::cast_to<T> cast_to()
    {
        return {};
    }

    /// @}
    /// @defgroup quantifiers Quantifiers
    /// @{

    /// @brief true iff every element satisfies `pred`; true for an empty source.
    template<typename P>
    impl::for_all<P> for_all(P pred)
    {
        impl::require_present(pred, "predicate");
        return { std::move(pred) };
    }

    /// @}
    /// @defgroup sort Sorting
    /// @{

    ///////////////////////////////////////////////////////////////////////////
    /// @brief Stable-sort by key, ascending, using the natural order of the key.
    ///
    /// The source is traversed once, eagerly; the result is a restartable sequence
    /// over the sorted elements.
    /*!
    @code
    {{
        // sort words by length; words of equal length keep their original order.

        const auto inp      = std::vector<std::string>{ "333", "2", "1", "222", "3" };
        const auto expected = std::vector<std::string>{ "2", "1", "3", "333", "222" };

        std::vector<std::string> ret = inp % fn::sort_by([](const std::string& s)
        {
            return s.size();
        });
        VERIFY(ret == expected);
    }}
    @endcode
    */
    template<typename F>
    impl::sort_by<F, impl::natural_order, impl::ascending_tag> sort_by(F key_fn)
    {
        impl::require_present(key_fn, "key_fn");
        return { std::move(key_fn), {} };
    }

    /// @brief Stable-sort by key, ascending, using a three-way `comparer(k1, k2) -> int`.
    template<typename F, typename Comparer>
    impl::sort_by<F, Comparer, impl::ascending_tag> sort_by(F key_fn, Comparer comparer)
    {
        impl::require_present(key_fn, "key_fn");
        impl::require_present(comparer, "comparer");
        return { std::move(key_fn), std::move(comparer) };
    }

    /// @brief Stable-sort by key, descending, using the natural order of the key.
    template<typename F>
    impl::sort_by<F, impl::natural_order, impl::descending_tag> sort_by_descending(F key_fn)
    {
        impl::require_present(key_fn, "key_fn");
        return { std::move(key_fn), {} };
    }

    /// @brief Stable-sort by key, descending, using a three-way `comparer(k1, k2) -> int`.
    template<typename F, typename Comparer>
    impl::sort_by<F, Comparer, impl::descending_tag> sort_by_descending(F key_fn, Comparer comparer)
    {
        impl::require_present(key_fn, "key_fn");
        impl::require_present(comparer, "comparer");
        return { std::move(key_fn), std::move(comparer) };
    }

    inline impl::sort_by<by::identity, impl::natural_order, impl::ascending_tag> sort()
    {
        return { {}, {} };
    }

    inline impl::sort_by<by::identity, impl::natural_order, impl::descending_tag> sort_descending()
    {
        return { {}, {} };
    }

    /// @}
    /// @defgroup gen Generators
    /// @{

    /// @brief Restartable sequence of `count` consecutive ints: `start, start+1, ..., start+count-1`.
    ///
    /// Throws std::invalid_argument if `count <= 0`. Any `start` is valid;
    /// values past INT_MAX wrap around to INT_MIN.
    inline impl::enumerable<impl::iota_gen> generator(int count, int start)
    {
        if(count <= 0) {
            PSEUDOENUM_FN_THROW(std::invalid_argument, "count must be positive, got " + std::to_string(count) + ".");
        }

        return { { unsigned(start), count } };
    }

    /// @}


namespace operators
{
    /// @brief `return std::forward<F>(fn)(std::forward<Arg>(arg))`
    ///
    /// This is similar to Haskell's operator `(&) :: a -> (a -> b) -> b |infix 1|` or F#'s operator `|>`
    template<typename Arg, typename F>
    auto operator % (Arg&& arg, F&& fn) -> decltype( std::forward<F>(fn)(std::forward<Arg>(arg)) )
    {
        // NB: forwarding fn too because it may have rvalue-specific overloads
        return std::forward<F>(fn)(std::forward<Arg>(arg));
    }

} // namespace operators

} // namespace fn

} // namespace pseudoenum

#if PSEUDOENUM_FN_ENABLE_RUN_TESTS
#include <list>
#include <map>
#include <string>
#include <iostream>
#include <cstdint>

#ifndef VERIFY
#define VERIFY(expr) if(!(expr)) PSEUDOENUM_FN_THROW(std::logic_error, "Assertion failed: ( "#expr" ).");
#endif

namespace pseudoenum
{
namespace fn
{
namespace impl
{

// true iff fn() throws Exception; anything else thrown propagates.
template<typename Exception, typename F>
bool throws(F fn)
{
    try {
        fn();
    } catch(const Exception&) {
        return true;
    }
    return false;
}

struct shape
{
    virtual ~shape() = default;
};

struct circle : shape
{
    int radius;
    explicit circle(int r) : radius{ r }
    {}
};

struct square : shape
{};

// a key type without operator<
struct version_key
{
    int major;
};

static_assert( has_natural_order<int>::value, "");
static_assert( has_natural_order<std::string>::value, "");
static_assert( has_natural_order<std::reference_wrapper<const std::string>>::value, "");
static_assert(!has_natural_order<version_key>::value, "");
static_assert(!has_natural_order<std::reference_wrapper<const version_key>>::value, "");

// This is templated to unary-callable, because
// we want to reuse the same battery of tests when
// the input is a container, a single-pass seq,
// or a restartable enumerable.
template<typename UnaryCallable>
auto make_tests(UnaryCallable make_inputs) -> std::map<std::string, std::function<void()>>
{
    std::map<std::string, std::function<void()>> tests{};
    using fn::operators::operator%;
    using vec_t = std::vector<int>;

    tests["filter"] = [make_inputs]
    {
        auto res = make_inputs({1, 2, 3, 4})
          % fn::filter([](int x) { return x % 2 == 0; })
          % fn::to_vector();
        VERIFY((res == vec_t{{2, 4}}));

        auto none = make_inputs({1, 3, 5})
          % fn::filter([](int x) { return x % 2 == 0; })
          % fn::to_vector();
        VERIFY(none.empty());
    };

    tests["transform"] = [make_inputs]
    {
        auto res = make_inputs({1, 2, 3})
          % fn::transform([](int x) { return std::to_string(x * 10); })
          % fn::to_vector();
        VERIFY((res == std::vector<std::string>{ "10", "20", "30" }));
    };

    tests["sort_by"] = [make_inputs]
    {
        auto res = make_inputs({3, 1, 2})
          % fn::sort_by(by::identity{})
          % fn::to_vector();
        VERIFY((res == vec_t{{1, 2, 3}}));
    };

    tests["sort_by_descending"] = [make_inputs]
    {
        auto res = make_inputs({3, 1, 2})
          % fn::sort_by_descending(by::identity{})
          % fn::to_vector();
        VERIFY((res == vec_t{{3, 2, 1}}));
    };

    tests["sort_by with comparer"] = [make_inputs]
    {
        // order by last decimal digit, then ascending
        auto res = make_inputs({21, 13, 42, 11, 3})
          % fn::sort_by([](int x) { return x; },
                        [](int a, int b)
                        {
                            return a % 10 != b % 10 ? a % 10 - b % 10
                                                    : impl::compare(a, b);
                        })
          % fn::to_vector();
        VERIFY((res == vec_t{{11, 21, 42, 3, 13}}));
    };

    tests["sort_by is stable"] = [make_inputs]
    {
        // key: tens; 12, 15, 11 share a key and keep their order in both directions.
        auto asc = make_inputs({12, 25, 15, 3, 11})
          % fn::sort_by([](int x) { return x / 10; })
          % fn::to_vector();
        VERIFY((asc == vec_t{{3, 12, 15, 11, 25}}));

        auto desc = make_inputs({12, 25, 15, 3, 11})
          % fn::sort_by_descending([](int x) { return x / 10; })
          % fn::to_vector();
        VERIFY((desc == vec_t{{25, 12, 15, 11, 3}}));
    };

    tests["for_all"] = [make_inputs]
    {
        VERIFY( (make_inputs({2, 4, 6}) % fn::for_all([](int x) { return x % 2 == 0; })));
        VERIFY(!(make_inputs({2, 3, 6}) % fn::for_all([](int x) { return x % 2 == 0; })));
        VERIFY( (make_inputs({})        % fn::for_all([](int)   { return false; })));
    };

    tests["for_all evaluates every element"] = [make_inputs]
    {
        size_t num_calls = 0;
        const bool res = make_inputs({1, 2, 3, 4})
          % fn::for_all([&num_calls](int x)
            {
                num_calls++;
                return x > 1;
            });
        VERIFY(!res);
        VERIFY(num_calls == 4);
    };

    tests["cast_to same type"] = [make_inputs]
    {
        auto res = make_inputs({1, 2, 3})
          % fn::cast_to<int>()
          % fn::to_vector();
        VERIFY((res == vec_t{{1, 2, 3}}));
    };

    tests["cast_to numeric"] = [make_inputs]
    {
        auto res = make_inputs({1, 2, 3})
          % fn::transform([](int x) { return x + 0.75; })
          % fn::cast_to<int>()
          % fn::to_vector();
        VERIFY((res == vec_t{{1, 2, 3}}));
    };

    tests["for_each"] = [make_inputs]
    {
        int64_t res = 0;
        make_inputs({1, 2, 3})
          % fn::for_each([&res](int x)
            {
                res = res * 10 + x;
            });
        VERIFY(res == 123);
    };

    tests["pipeline"] = [make_inputs]
    {
        auto res = make_inputs({5, 8, 1, 4, 7, 2})
          % fn::filter([](int x) { return x > 1; })
          % fn::transform([](int x) { return x * x; })
          % fn::sort_by_descending(by::identity{})
          % fn::transform([](int x) { return std::to_string(x); })
          % fn::to_vector();
        VERIFY((res == std::vector<std::string>{ "64", "49", "25", "16", "4" }));
    };

    return tests;
}

static void run_tests()
{
    using fn::operators::operator%;
    using vec_t = std::vector<int>;

    auto test_cont = make_tests([](vec_t v)
    {
        return v;
    });

    auto test_seq = make_tests([](vec_t v)
    {
        return fn::seq([v, i = size_t(0)]() mutable
        {
            return i < v.size() ? v[i++] : fn::end_seq();
        });
    });

    auto test_enumerable = make_tests([](vec_t v)
    {
        return fn::restartable([v, i = size_t(0)]() mutable
        {
            return i < v.size() ? v[i++] : fn::end_seq();
        });
    });

    std::map<std::string, std::function<void()>> test_other{};

    test_other["generator"] = [&]
    {
        const vec_t res = fn::generator(5, 10);
        VERIFY((res == vec_t{{10, 11, 12, 13, 14}}));

        const vec_t negative = fn::generator(3, -1);
        VERIFY((negative == vec_t{{-1, 0, 1}}));

        const vec_t last = fn::generator(2, std::numeric_limits<int>::max() - 1);
        VERIFY(last.back() == std::numeric_limits<int>::max());
    };

    test_other["generator is restartable"] = [&]
    {
        const auto ints = fn::generator(3, 7);

        int64_t res = 0;
        for(size_t i = 0; i < 2; i++) {
            for(const int x : ints) {
                res = res * 10 + (x - 6);
            }
        }
        VERIFY(res == 123123);
    };

    test_other["generator rejects non-positive count"] = [&]
    {
        VERIFY(throws<std::invalid_argument>([]{ fn::generator(0, 1); }));
        VERIFY(throws<std::invalid_argument>([]{ fn::generator(-5, 1); }));
    };

    test_other["generator wraps past INT_MAX"] = [&]
    {
        const int int_max = std::numeric_limits<int>::max();
        const int int_min = std::numeric_limits<int>::min();

        const vec_t res = fn::generator(2, int_max);
        VERIFY((res == vec_t{{int_max, int_min}}));

        const vec_t from_min = fn::generator(2, int_min);
        VERIFY((from_min == vec_t{{int_min, int_min + 1}}));
    };

    test_other["seq converts to vector"] = [&]
    {
        auto xs = fn::seq([i = 0]() mutable
        {
            return i < 3 ? i++ : fn::end_seq();
        });

        const vec_t res = std::move(xs) % fn::to_vector();
        VERIFY((res == vec_t{{0, 1, 2}}));

        // the seq was consumed as an input
        VERIFY(throws<std::logic_error>([&]{ xs.begin(); }));
    };

    test_other["lazy results are restartable"] = [&]
    {
        const vec_t src{{1, 2, 3, 4}};
        size_t num_calls = 0;

        auto evens = src % fn::filter([&num_calls](int x)
        {
            num_calls++;
            return x % 2 == 0;
        });

        const vec_t first = evens;
        const vec_t second = evens;
        VERIFY((first == vec_t{{2, 4}}));
        VERIFY(first == second);
        VERIFY(num_calls == 8); // each element visited once per traversal
    };

    test_other["filter and transform are lazy"] = [&]
    {
        const vec_t src{{1, 2, 3}};

        auto throw_on_call = [](int) -> bool
        {
            throw std::runtime_error("predicate invoked");
        };

        // constructing the pipeline must not invoke anything
        auto xs = src % fn::filter(throw_on_call);
        auto ys = src % fn::transform([](int) -> int { throw std::runtime_error("transformer invoked"); });
        auto zs = fn::generator(3, 0) % fn::cast_to<long>() % fn::filter(throw_on_call);

        VERIFY(throws<std::runtime_error>([&]{ xs.begin(); }));
        VERIFY(throws<std::runtime_error>([&]{ ys.begin(); }));
        VERIFY(throws<std::runtime_error>([&]{ zs.begin(); }));
    };

    test_other["transform applies fn once per consumed element"] = [&]
    {
        size_t num_calls = 0;
        auto xs = fn::generator(100, 0)
          % fn::transform([&num_calls](int x)
            {
                num_calls++;
                return x * 2;
            });

        auto it = xs.begin();
        VERIFY(*it == 0);
        ++it;
        VERIFY(*it == 2);
        VERIFY(num_calls == 2); // consumer stopped; nothing else was computed
    };

    test_other["absent arguments are rejected immediately"] = [&]
    {
        using pred_fn_t = bool(*)(int);
        const vec_t* null_src = nullptr;
        const std::shared_ptr<const vec_t> null_shared{};
        const pred_fn_t null_pred = nullptr;
        const std::function<int(int)> null_map_fn{};
        const std::function<int(int, int)> null_comparer{};
        const auto is_even = [](int x) { return x % 2 == 0; };

        VERIFY(throws<std::invalid_argument>([&]{ fn::filter(null_pred); }));
        VERIFY(throws<std::invalid_argument>([&]{ fn::transform(null_map_fn); }));
        VERIFY(throws<std::invalid_argument>([&]{ fn::for_all(null_pred); }));
        VERIFY(throws<std::invalid_argument>([&]{ fn::sort_by(null_map_fn); }));
        VERIFY(throws<std::invalid_argument>([&]{ fn::sort_by_descending(null_map_fn); }));
        VERIFY(throws<std::invalid_argument>([&]{ fn::sort_by(by::identity{}, null_comparer); }));
        VERIFY(throws<std::invalid_argument>([&]{ fn::sort_by_descending(by::identity{}, null_comparer); }));

        VERIFY(throws<std::invalid_argument>([&]{ null_src    % fn::filter(is_even); }));
        VERIFY(throws<std::invalid_argument>([&]{ null_shared % fn::transform(by::identity{}); }));
        VERIFY(throws<std::invalid_argument>([&]{ null_src    % fn::sort(); }));
        VERIFY(throws<std::invalid_argument>([&]{ null_src    % fn::for_all(is_even); }));
        VERIFY(throws<std::invalid_argument>([&]{ null_src    % fn::cast_to<long>(); }));

        // present pointers work as sources
        const vec_t src{{4, 1, 2}};
        VERIFY(((&src % fn::sort() % fn::to_vector()) == vec_t{{1, 2, 4}}));
        const std::shared_ptr<const vec_t> shared_src = std::make_shared<vec_t>(src);
        VERIFY(((shared_src % fn::filter(is_even) % fn::to_vector()) == vec_t{{4, 2}}));
    };

    test_other["sort_by consumes the source once, eagerly"] = [&]
    {
        size_t num_pulls = 0;
        auto sorted = fn::seq([&num_pulls, i = 3]() mutable
        {
            num_pulls++;
            return i > 0 ? i-- : fn::end_seq();
        })
      % fn::sort();

        // three elements plus end-of-sequence, pulled at the call
        VERIFY(num_pulls == 4);

        const vec_t first = sorted;
        const vec_t second = sorted;
        VERIFY((first == vec_t{{1, 2, 3}}));
        VERIFY(first == second);
        VERIFY(num_pulls == 4);
    };

    test_other["sort_by extracts each key once"] = [&]
    {
        size_t num_calls = 0;
        auto res = vec_t{{5, 3, 9, 1, 7, 2}}
          % fn::sort_by([&num_calls](int x)
            {
                num_calls++;
                return -x;
            })
          % fn::to_vector();
        VERIFY((res == vec_t{{9, 7, 5, 3, 2, 1}}));
        VERIFY(num_calls == 6);
    };

    test_other["sort_by uses the supplied comparer"] = [&]
    {
        // a reversing comparer turns sort_by into descending order
        const std::function<int(const int&, const int&)> reversed = [](const int& a, const int& b)
        {
            return impl::compare(b, a);
        };

        auto res = vec_t{{3, 1, 2}} % fn::sort_by(by::identity{}, reversed) % fn::to_vector();
        VERIFY((res == vec_t{{3, 2, 1}}));

        auto res2 = vec_t{{3, 1, 2}} % fn::sort_by_descending(by::identity{}, reversed) % fn::to_vector();
        VERIFY((res2 == vec_t{{1, 2, 3}}));
    };

    test_other["sort_by key without natural order"] = [&]
    {
        using item_t = std::pair<std::string, version_key>;

        const std::vector<item_t> items{ {"b", {2}}, {"a", {1}}, {"c", {2}}, {"d", {0}} };

        // version_key has no operator<, so a comparer must be passed explicitly.
        auto res = items
          % fn::sort_by_descending(by::second{}, [](const version_key& a, const version_key& b)
            {
                return a.major - b.major;
            })
          % fn::transform(by::first{})
          % fn::to_vector();
        VERIFY((res == std::vector<std::string>{ "b", "c", "a", "d" }));
    };

    test_other["sort_by and sort_by_descending are reverses"] = [&]
    {
        const vec_t src{{17, 4, 99, -3, 25, 0}};

        auto asc  = src % fn::sort_by(by::identity{}) % fn::to_vector();
        auto desc = src % fn::sort_by_descending(by::identity{}) % fn::to_vector();
        std::reverse(desc.begin(), desc.end());
        VERIFY(asc == desc);

        // already sorted input is unchanged
        auto again = asc % fn::sort() % fn::to_vector();
        VERIFY(again == asc);
    };

    test_other["sort_by reference keys"] = [&]
    {
        const std::vector<std::string> words{ "pear", "fig", "apple", "kiwi" };

        auto res = words
          % fn::sort_by([](const std::string& s) { return std::cref(s); })
          % fn::to_vector();
        VERIFY((res == std::vector<std::string>{ "apple", "fig", "kiwi", "pear" }));
    };

    test_other["sort_by map entries"] = [&]
    {
        const std::map<std::string, int> stock{ {"apples", 3}, {"kiwis", 12}, {"pears", 7} };

        auto res = stock
          % fn::sort_by_descending(by::second{})
          % fn::transform(by::first{})
          % fn::to_vector();
        VERIFY((res == std::vector<std::string>{ "kiwis", "pears", "apples" }));
    };

    test_other["cast_to untyped sequence"] = [&]
    {
        const std::vector<boost::any> untyped{ 1, 2, 3 };

        const vec_t res = untyped % fn::cast_to<int>();
        VERIFY((res == vec_t{{1, 2, 3}}));
    };

    test_other["cast_to fails lazily, at the offending element"] = [&]
    {
        const std::vector<boost::any> untyped{ 1, 2, std::string{"3"}, 4 };

        auto ints = untyped % fn::cast_to<int>(); // must not throw

        vec_t res{};
        const bool threw = throws<std::bad_cast>([&]
        {
            for(auto it = ints.begin(); it != ints.end(); ++it) {
                res.push_back(*it);
            }
        });
        VERIFY(threw);
        VERIFY((res == vec_t{{1, 2}}));
    };

    test_other["cast_to same type is a pass-through"] = [&]
    {
        const std::list<std::string> src{ "x", "y" };

        auto res = src % fn::cast_to<std::string>();
        static_assert(std::is_same<decltype(res), decltype(fn::from(src))>::value, "expected pass-through");
        VERIFY((res % fn::to_vector() == std::vector<std::string>{ "x", "y" }));
    };

    test_other["cast_to polymorphic pointers"] = [&]
    {
        circle c1{ 1 };
        circle c2{ 2 };
        square sq{};

        const std::vector<shape*> circles{ &c1, &c2, nullptr };
        auto radii = circles
          % fn::cast_to<circle*>()
          % fn::transform([](circle* c) { return c ? c->radius : 0; })
          % fn::to_vector();
        VERIFY((radii == vec_t{{1, 2, 0}}));

        const std::vector<shape*> mixed{ &c1, &sq };
        auto xs = mixed % fn::cast_to<circle*>();
        auto it = xs.begin();
        VERIFY((*it)->radius == 1);
        VERIFY(throws<std::bad_cast>([&]{ ++it; }));
    };

    test_other["guard_against_multiple_iterations_of_input_range"] = [&]
    {
        auto xs = fn::seq([i = 0]() mutable
        {
            return i < 3 ? i++ : fn::end_seq();
        });

        int64_t res = 0;
        const bool threw = throws<std::logic_error>([&]
        {
            // xs is a seq, so iterating it a second time shall throw.
            for(size_t i = 0; i < 2; i++) {
                for(auto x : xs) {
                    res = res * 10 + x;
                }
            }
        });
        VERIFY(threw);
        VERIFY(res == 12);
    };

    test_other["rvalue containers are owned by the result"] = [&]
    {
        auto make_evens = []
        {
            return vec_t{{1, 2, 3, 4, 5, 6}} % fn::filter([](int x) { return x % 2 == 0; });
        };

        auto evens = make_evens(); // the temporary vector is gone by now
        const vec_t res = evens;
        VERIFY((res == vec_t{{2, 4, 6}}));
    };

    test_other["any_enumerable_t"] = [&]
    {
        fn::any_enumerable_t<int> evens =
            fn::generator(10, 0)
          % fn::filter([](int x)
            {
                return x % 2 == 0;
            });

        const auto res = evens % fn::transform([](int x) { return x / 2; }) % fn::to_vector();
        VERIFY((res == vec_t{{0, 1, 2, 3, 4}}));
    };

    test_other["from iterator pair"] = [&]
    {
        const int arr[] = { 4, 8, 15, 16, 23, 42 };

        auto res = fn::from(std::begin(arr) + 1, std::end(arr) - 1)
          % fn::for_all([](int x) { return x > 4 && x < 42; });
        VERIFY(res);
    };

    test_other["maybe rebinding"] = [&]
    {
        struct S
        {
            const int n;
            const int& r;
        };
        const int x1 = 1;
        const int x2 = 2;

        impl::maybe<S> m{};
        VERIFY(!m);

        m.reset(S{42, x1});
        VERIFY((*m).n == 42);
        VERIFY((*m).r == 1);

        m.reset(S{420, x2});
        VERIFY((*m).n == 420);
        VERIFY((*m).r == 2);
    };

    /////////////////////////////////////////////////////////////////////////
    size_t num_failed = 0;
    size_t num_ok = 0;
    for(auto&& tests : { test_cont, test_seq, test_enumerable, test_other })
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
} // namespace pseudoenum

#endif // PSEUDOENUM_FN_ENABLE_RUN_TESTS

#endif // #ifndef PSEUDOENUM_ENUMERABLE_HPP_
