////////////////////////////////////////////////////////////////////////////////
/// prioq::priority_queue: mutable binary-heap priority queue with multiset
/// algebra
///
/// Architecture:
///   order<Value, Key, Compare> (order.hpp): wraps values into heap items
///     (caching key( value ) for keyed queues) and defines the item order for
///     the four configurations (natural, reversed, keyed, keyed + reversed).
///   heap:: (heap.hpp): array-backed binary heap primitives.
///   detail:: (sorted_algebra.hpp): merge-style walks over sorted snapshots.
///   priority_queue: owns the order and the heap array; queue interface,
///     membership, sorted iteration and the set operators.
///
/// Semantics:
///   - front (peek/pop) is the smallest value (largest when reversed) by
///     key( value ) under Compare.
///   - two values match when their priorities are equivalent and they compare
///     equal with ==; removal, membership and all set operators use this.
///   - set operators follow multiset semantics and build new queues carrying
///     the left operand's key, comparator and direction; the in-place forms
///     replace the heap array only once the result is complete.
///   - reads never reorder the heap array: iteration sorts a snapshot.
///
/// Extensions:
///   - operator<=> yields std::partial_ordering (sub-/super-multiset)
///   - print() / format_values() (priority_queue_print.hpp)
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include "heap.hpp"
#include "order.hpp"
#include "sorted_algebra.hpp"

#include <prioq/error/error.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdio>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace prioq
{
//------------------------------------------------------------------------------

namespace detail
{
    inline constexpr bool assert_heap_invariant{ true }; // BOOST_ASSERT the heap property after every mutation (debug builds)
} // namespace detail

/// Key types a queue may value-initialize on its own: null function pointers
/// would only fail at the first comparison.
template <typename Key>
concept default_key = std::default_initializable<Key> && !std::is_pointer_v<Key> && !std::is_member_pointer_v<Key>;


template
<
    typename Value,
    typename Key     = std::identity,
    typename Compare = std::less<>
>
class priority_queue
{
    using order_type = order<Value, Key, Compare>;

public:
    using value_type      = Value;
    using key_type        = Key;
    using key_compare     = Compare;
    using item_type       = typename order_type::item_type;
    using priority_type   = typename order_type::priority_type;
    using container_type  = std::vector<item_type>;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using reference       = Value const &;
    using const_reference = Value const &;

    static constexpr bool keyed{ order_type::keyed };

    //--------------------------------------------------------------------------
    // Iterator: walks a sorted snapshot shared between its copies, so the
    // sequence stays valid (and unchanged) if the queue is modified or
    // destroyed mid-iteration. Every begin() takes a fresh snapshot; end()
    // is the snapshot-less iterator, equal to every exhausted one.
    //--------------------------------------------------------------------------
    class const_iterator
    {
    public:
        using iterator_concept  = std::forward_iterator_tag;
        using iterator_category = std::forward_iterator_tag;
        using value_type        = Value;
        using difference_type   = std::ptrdiff_t;
        using reference         = Value const &;
        using pointer           = Value const *;

        constexpr const_iterator() = default;

        reference operator* () const noexcept { BOOST_ASSERT( !at_end() ); return (*values_)[ pos_ ]; }
        pointer   operator->() const noexcept { return std::addressof( **this ); }

        const_iterator & operator++(    ) noexcept { ++pos_; return *this; }
        const_iterator   operator++( int ) noexcept { auto const previous{ *this }; ++pos_; return previous; }

        friend bool operator==( const_iterator const & left, const_iterator const & right ) noexcept
        {
            if ( left.at_end() )
                return right.at_end();
            return left.values_ == right.values_ && left.pos_ == right.pos_;
        }

    private:
        friend class priority_queue;

        explicit const_iterator( std::shared_ptr<std::vector<Value> const> values ) noexcept : values_{ std::move( values ) } {}

        [[ nodiscard ]] bool at_end() const noexcept { return !values_ || pos_ == values_->size(); }

        std::shared_ptr<std::vector<Value> const> values_;
        size_type                                 pos_{ 0 };
    }; // class const_iterator
    using iterator = const_iterator;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    constexpr priority_queue() requires default_key<Key> && std::default_initializable<Compare> = default;

    // The direction flag only binds to an actual bool: integers, pointers
    // and the like do not silently select a reversed queue.
    constexpr explicit priority_queue( std::same_as<bool> auto const reverse ) requires default_key<Key>
        : order_{ Key{}, reverse } {}

    constexpr explicit priority_queue( Key key )
        : order_{ std::move( key ) } {}

    constexpr priority_queue( Key key, std::same_as<bool> auto const reverse, Compare const & comp = Compare{} )
        : order_{ std::move( key ), reverse, comp } {}

    template <std::input_iterator InputIt>
    priority_queue( InputIt const first, InputIt const last ) requires default_key<Key>
        : priority_queue( first, last, false ) {}

    template <std::input_iterator InputIt>
    priority_queue( InputIt const first, InputIt const last, std::same_as<bool> auto const reverse ) requires default_key<Key>
        : order_{ Key{}, reverse } { assign_heap( first, last ); }

    template <std::input_iterator InputIt>
    priority_queue( InputIt const first, InputIt const last, Key key )
        : priority_queue( first, last, std::move( key ), false ) {}

    template <std::input_iterator InputIt>
    priority_queue( InputIt const first, InputIt const last, Key key, std::same_as<bool> auto const reverse, Compare const & comp = Compare{} )
        : order_{ std::move( key ), reverse, comp } { assign_heap( first, last ); }

    priority_queue( std::initializer_list<Value> const il ) requires default_key<Key>
        : priority_queue( il.begin(), il.end(), false ) {}

    priority_queue( std::initializer_list<Value> const il, std::same_as<bool> auto const reverse ) requires default_key<Key>
        : priority_queue( il.begin(), il.end(), reverse ) {}

    priority_queue( std::initializer_list<Value> const il, Key key )
        : priority_queue( il.begin(), il.end(), std::move( key ), false ) {}

    priority_queue( std::initializer_list<Value> const il, Key key, std::same_as<bool> auto const reverse, Compare const & comp = Compare{} )
        : priority_queue( il.begin(), il.end(), std::move( key ), reverse, comp ) {}

    priority_queue( priority_queue const & ) = default;
    priority_queue( priority_queue && )      = default;

    priority_queue & operator=( priority_queue const & ) = default;
    priority_queue & operator=( priority_queue && )      = default;

    //--------------------------------------------------------------------------
    // Capacity & observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type size () const noexcept { return items_.size();  }
    [[ nodiscard ]] bool      empty() const noexcept { return items_.empty(); }

    [[ nodiscard ]] Key     const & key     () const noexcept { return order_.key();     }
    [[ nodiscard ]] bool             reverse () const noexcept { return order_.reverse(); }
    [[ nodiscard ]] Compare          key_comp() const          { return order_.comp();    }

    void reserve( size_type const n ) { items_.reserve( n ); }

    //--------------------------------------------------------------------------
    // Lookup (linear: priority is the only indexed dimension)
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool contains( Value const & value ) const { return find_pos( value ) != size(); }

    [[ nodiscard ]] size_type count( Value const & value ) const
    {
        auto const item{ order_.wrap( value ) };
        return static_cast<size_type>( std::ranges::count_if( items_, [&]( item_type const & stored ) { return order_.matches( stored, item ); } ) );
    }

    //--------------------------------------------------------------------------
    // Queue interface
    //--------------------------------------------------------------------------
    [[ nodiscard ]] Value peek() const
    {
        if ( empty() ) [[ unlikely ]]
            detail::throw_empty_queue();
        return heap::front( items_ ).value();
    }

    Value pop()
    {
        if ( empty() ) [[ unlikely ]]
            detail::throw_empty_queue();
        auto value{ order_type::unwrap( heap::pop( items_, order_ ) ) };
        verify();
        return value;
    }

    void push( Value value )
    {
        heap::push( items_, order_.wrap( std::move( value ) ), order_ );
        verify();
    }

    // Set-like alias of push()
    void add( Value value ) { push( std::move( value ) ); }

    template <typename... Args>
    void emplace( Args &&... args ) requires std::constructible_from<Value, Args...>
    {
        Value value( std::forward<Args>( args )... );
        push( std::move( value ) );
    }

    /// Removes one matching value or throws value_not_found.
    void remove( Value const & value )
    {
        if ( !discard( value ) )
            detail::throw_value_not_found();
    }

    /// Removes one matching value if there is one; returns whether it did.
    bool discard( Value const & value )
    {
        auto const pos{ find_pos( value ) };
        if ( pos == size() )
            return false;
        heap::erase_at( items_, pos, order_ );
        verify();
        return true;
    }

    void clear() noexcept { items_.clear(); }

    void swap( priority_queue & other ) noexcept
    {
        order_.swap( other.order_ );
        items_.swap( other.items_ );
    }
    friend void swap( priority_queue & left, priority_queue & right ) noexcept { left.swap( right ); }

    //--------------------------------------------------------------------------
    // Sorted access
    //--------------------------------------------------------------------------
    [[ nodiscard ]] std::vector<Value> values() const
    {
        auto sorted{ detail::sorted_items( items_, order_ ) };
        std::vector<Value> result;
        result.reserve( sorted.size() );
        for ( auto & item : sorted )
            result.push_back( order_type::unwrap( std::move( item ) ) );
        return result;
    }

    [[ nodiscard ]] const_iterator begin() const { return const_iterator{ std::make_shared<std::vector<Value> const>( values() ) }; }
    [[ nodiscard ]] const_iterator end  () const noexcept { return {}; }

    //--------------------------------------------------------------------------
    // Multiset algebra
    //--------------------------------------------------------------------------
    friend priority_queue operator&( priority_queue const & left, priority_queue const & right )
    {
        auto const mine  { left.sorted_snapshot() };
        auto const theirs{ left.sorted_snapshot_of( right ) };
        return { left.order_, detail::intersect<item_type>( mine, theirs, left.order_ ) };
    }

    friend priority_queue operator|( priority_queue const & left, priority_queue const & right )
    {
        bool const same_key{ detail::reuse_operand_priorities && left.order_.same_key( right.order_ ) };
        container_type items;
        items.reserve( left.size() + right.size() );
        items.insert( items.end(), left.items_.begin(), left.items_.end() );
        for ( auto const & item : right.items_ )
            items.push_back( left.order_.rewrap( item, same_key ) );
        return { left.order_, std::move( items ) };
    }

    friend priority_queue operator-( priority_queue const & left, priority_queue const & right )
    {
        if ( left.empty() || right.empty() )
            return left;
        auto const mine  { left.sorted_snapshot() };
        auto const theirs{ left.sorted_snapshot_of( right ) };
        return { left.order_, detail::subtract<item_type>( mine, theirs, left.order_ ) };
    }

    /// ( left - right ) | ( right - left ), computed in a single walk.
    friend priority_queue operator^( priority_queue const & left, priority_queue const & right )
    {
        if ( right.empty() )
            return left;
        if ( left.empty() )
            return left | right;
        auto const mine  { left.sorted_snapshot() };
        auto const theirs{ left.sorted_snapshot_of( right ) };
        container_type items;
        auto const keep{ [&]( item_type const & item ) { items.push_back( item ); } };
        detail::merge_sorted<item_type>( mine, theirs, left.order_, keep, []( item_type const & ) { return true; }, keep );
        return { left.order_, std::move( items ) };
    }

    priority_queue & operator&=( priority_queue const & other ) { return replace_items( *this & other ); }
    priority_queue & operator|=( priority_queue const & other ) { return replace_items( *this | other ); }
    priority_queue & operator-=( priority_queue const & other ) { return replace_items( *this - other ); }
    priority_queue & operator^=( priority_queue const & other ) { return replace_items( *this ^ other ); }

    [[ nodiscard ]] bool isdisjoint( priority_queue const & other ) const
    {
        if ( empty() || other.empty() )
            return true;
        auto const mine  { sorted_snapshot() };
        auto const theirs{ sorted_snapshot_of( other ) };
        return detail::disjoint<item_type>( mine, theirs, order_ );
    }

    //--------------------------------------------------------------------------
    // Comparison: equality of contents (direction and key do not take part),
    // ordering by multiset inclusion.
    //--------------------------------------------------------------------------
    friend bool operator==( priority_queue const & left, priority_queue const & right )
    {
        if ( &left == &right )
            return true;
        return left.size() == right.size() && left.common_count( right ) == left.size();
    }

    friend std::partial_ordering operator<=>( priority_queue const & left, priority_queue const & right )
    {
        if ( &left == &right )
            return std::partial_ordering::equivalent;
        auto const common   { left.common_count( right ) };
        bool const left_in  { common == left .size() };
        bool const right_in { common == right.size() };
        if ( left_in && right_in ) return std::partial_ordering::equivalent;
        if ( left_in  )            return std::partial_ordering::less;
        if ( right_in )            return std::partial_ordering::greater;
        return std::partial_ordering::unordered;
    }

    //--------------------------------------------------------------------------
    // Diagnostics (defined in priority_queue_print.hpp)
    //--------------------------------------------------------------------------
    void        print( std::FILE * out = stdout ) const;
    std::string format_values() const;

private:
    priority_queue( order_type ord, container_type items )
        : order_{ std::move( ord ) }, items_{ std::move( items ) }
    {
        heap::make( items_, order_ );
    }

    template <typename InputIt>
    void assign_heap( InputIt first, InputIt const last )
    {
        if constexpr ( std::forward_iterator<InputIt> )
            items_.reserve( static_cast<size_type>( std::distance( first, last ) ) );
        for ( ; first != last; ++first )
            items_.push_back( order_.wrap( *first ) );
        heap::make( items_, order_ );
    }

    [[ nodiscard ]] size_type find_pos( Value const & value ) const
    {
        return heap::find( items_, order_.wrap( value ), order_ );
    }

    [[ nodiscard ]] container_type sorted_snapshot() const { return detail::sorted_items( items_, order_ ); }

    // The other queue's items in this queue's order.
    [[ nodiscard ]] container_type sorted_snapshot_of( priority_queue const & other ) const
    {
        return detail::sorted_items_as( other.items_, other.order_, order_ );
    }

    [[ nodiscard ]] size_type common_count( priority_queue const & other ) const
    {
        if ( empty() || other.empty() )
            return 0;
        auto const mine  { sorted_snapshot() };
        auto const theirs{ sorted_snapshot_of( other ) };
        return detail::common_count<item_type>( mine, theirs, order_ );
    }

    priority_queue & replace_items( priority_queue && result ) noexcept
    {
        items_.swap( result.items_ );
        verify();
        return *this;
    }

    void verify() const
    {
        if constexpr ( detail::assert_heap_invariant )
            BOOST_ASSERT( heap::is_heap( items_, order_ ) );
    }

    order_type     order_;
    container_type items_;
}; // class priority_queue

//------------------------------------------------------------------------------
} // namespace prioq
//------------------------------------------------------------------------------
