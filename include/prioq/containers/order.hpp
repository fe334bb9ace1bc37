////////////////////////////////////////////////////////////////////////////////
/// Ordering adapter for prioq::priority_queue.
///
/// Contents:
///   - is_simple_comparator<T>      : trait: can == replace double-negation test?
///   - comp_eq(comp, a, b)          : optimised equivalence from strict-weak comparator
///   - simple_item<Value>           : heap item whose value is its own priority
///   - keyed_item<Value, Priority>  : heap item caching key( value )
///   - order<Value, Key, Compare>   : wrap/unwrap + item order + sort
///
/// One heap implementation serves all four configurations (natural, reversed,
/// keyed, keyed + reversed): keyed-ness is selected at compile time through
/// the Key type (std::identity meaning 'no key'), direction is a flag fixed
/// at construction.
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

#include <boost/sort/pdqsort/pdqsort.hpp>

#include <concepts>
#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace prioq
{
//------------------------------------------------------------------------------

//==============================================================================
// Comparator traits
//==============================================================================

/// Is this a "simple" comparator where operator== can be used instead of
/// the two-comparison equivalence test?  User specializations are intended.
template <typename T> constexpr bool is_simple_comparator{ false };
template <typename T> constexpr bool is_simple_comparator<std::less   <T>>{ std::is_fundamental_v<T> };
template <typename T> constexpr bool is_simple_comparator<std::greater<T>>{ std::is_fundamental_v<T> };
template <> inline constexpr bool is_simple_comparator<std::less   <void>>{ true };
template <> inline constexpr bool is_simple_comparator<std::greater<void>>{ true };
template <> inline constexpr bool is_simple_comparator<std::ranges::less   >{ true };
template <> inline constexpr bool is_simple_comparator<std::ranges::greater>{ true };

/// Three-tier dispatch:
///   1. Custom comp.eq() if available
///   2. Direct == for simple comparators
///   3. Standard two-comparison equivalence (!comp(a,b) && !comp(b,a))
template <typename Comp>
[[ nodiscard ]] constexpr bool comp_eq( Comp const & comp, auto const & left, auto const & right )
{
    if constexpr ( requires{ comp.eq( left, right ); } )
        return comp.eq( left, right );
    else if constexpr ( is_simple_comparator<Comp> && requires{ left == right; } )
        return left == right;
    else
        return !comp( left, right ) && !comp( right, left );
}


//==============================================================================
// Heap items
//
// Items are never modified through their interface: the heap replaces them
// wholesale (move assignment) while restructuring.
//==============================================================================

template <typename Value>
class simple_item
{
public:
    using value_type    = Value;
    using priority_type = Value;

    constexpr explicit simple_item( Value value ) noexcept( std::is_nothrow_move_constructible_v<Value> )
        : value_{ std::move( value ) } {}

    [[ nodiscard ]] constexpr Value const & priority() const noexcept { return value_; }
    [[ nodiscard ]] constexpr Value const & value   () const noexcept { return value_; }

    [[ nodiscard ]] constexpr Value extract() && noexcept( std::is_nothrow_move_constructible_v<Value> ) { return std::move( value_ ); }

private:
    Value value_;
}; // class simple_item

template <typename Value, typename Priority>
class keyed_item
{
public:
    using value_type    = Value;
    using priority_type = Priority;

    constexpr keyed_item( Priority priority, Value value )
        : priority_{ std::move( priority ) }, value_{ std::move( value ) } {}

    [[ nodiscard ]] constexpr Priority const & priority() const noexcept { return priority_; }
    [[ nodiscard ]] constexpr Value    const & value   () const noexcept { return value_;    }

    [[ nodiscard ]] constexpr Value extract() && noexcept( std::is_nothrow_move_constructible_v<Value> ) { return std::move( value_ ); }

private:
    Priority priority_;
    Value    value_;
}; // class keyed_item


template <typename Key, typename Value>
using priority_t = std::remove_cvref_t<std::invoke_result_t<Key const &, Value const &>>;

template <typename Key>
constexpr bool is_keyed{ !std::is_same_v<Key, std::identity> };


//==============================================================================
// order: the strategy object shared by the heap engine and the set algebra
//
// Holds the comparator (EBO through private inheritance, as Komparator does),
// the key function and the direction. le() is the strict 'comes before'
// relation of the heap: the front of the queue is the item no other item
// comes before.
//==============================================================================

template <typename Value, typename Key = std::identity, typename Compare = std::less<>>
class order : private Compare
{
public:
    static constexpr bool keyed{ is_keyed<Key> };

    using value_type    = Value;
    using key_type      = Key;
    using key_compare   = Compare;
    using priority_type = std::conditional_t<keyed, priority_t<Key, Value>, Value>;
    using item_type     = std::conditional_t<keyed, keyed_item<Value, priority_type>, simple_item<Value>>;

    constexpr order() requires std::default_initializable<Key> && std::default_initializable<Compare> = default;

    constexpr explicit order( Key key, bool const reverse = false, Compare const & comp = Compare{} )
        : Compare{ comp }, key_{ std::move( key ) }, reverse_{ reverse } {}

    [[ nodiscard ]] constexpr Compare const & comp   () const noexcept { return *this; }
    [[ nodiscard ]] constexpr Key     const & key    () const noexcept { return key_; }
    [[ nodiscard ]] constexpr bool            reverse() const noexcept { return reverse_; }

    //--------------------------------------------------------------------------
    // value <-> item
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr item_type wrap( Value value ) const
    {
        if constexpr ( keyed )
        {
            auto priority{ std::invoke( key_, std::as_const( value ) ) };
            return item_type{ std::move( priority ), std::move( value ) };
        }
        else
        {
            return item_type{ std::move( value ) };
        }
    }

    [[ nodiscard ]] static constexpr Value unwrap( item_type && item ) { return std::move( item ).extract(); }

    // Re-derives the priority of an item built by another order: a no-op
    // for key-less orders and for orders sharing this order's key.
    [[ nodiscard ]] constexpr item_type rewrap( item_type const & item, bool const same_key ) const
    {
        if ( !keyed || same_key )
            return item;
        return wrap( item.value() );
    }

    //--------------------------------------------------------------------------
    // Item order
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr bool before( priority_type const & left, priority_type const & right ) const
    {
        return reverse_ ? comp()( right, left ) : comp()( left, right );
    }

    [[ nodiscard ]] constexpr bool le ( item_type const & left, item_type const & right ) const { return before( left.priority(), right.priority() ); }
    [[ nodiscard ]] constexpr bool ge ( item_type const & left, item_type const & right ) const { return before( right.priority(), left.priority() ); }
    [[ nodiscard ]] constexpr bool leq( item_type const & left, item_type const & right ) const { return !ge( left, right ); }

    // Equivalence does not depend on the direction.
    [[ nodiscard ]] constexpr bool eq( item_type const & left, item_type const & right ) const
    {
        return comp_eq( comp(), left.priority(), right.priority() );
    }

    // Item identity used by removal, membership and the set algebra:
    // equivalent priorities *and* equal values.
    [[ nodiscard ]] constexpr bool matches( item_type const & left, item_type const & right ) const
    requires std::equality_comparable<Value>
    {
        if constexpr ( keyed )
            return eq( left, right ) && left.value() == right.value();
        else
            return left.value() == right.value();
    }

    /// Sort a range of items 'front first':
    ///   1. Comparator's own sort() if provided
    ///   2. pdqsort (default)
    template <std::random_access_iterator It>
    constexpr void sort( It const first, It const last ) const
    {
        auto const pred{ [this]( item_type const & left, item_type const & right ) { return le( left, right ); } };
        if constexpr ( requires{ comp().sort( first, last, pred ); } )
            comp().sort( first, last, pred );
        else
            boost::sort::pdqsort( first, last, pred );
    }

    /// Do both orders derive identical priorities from identical values?
    /// Stateless key types always do; otherwise the key objects themselves
    /// have to compare equal (e.g. function pointers).
    [[ nodiscard ]] constexpr bool same_key( order const & other ) const noexcept
    {
        if constexpr ( !keyed || std::is_empty_v<Key> )
            return true;
        else if constexpr ( std::equality_comparable<Key> )
            return key_ == other.key_;
        else
            return false;
    }

    constexpr void swap( order & other ) noexcept( std::is_nothrow_swappable_v<Key> && std::is_nothrow_swappable_v<Compare> )
    {
        using std::swap;
        swap( static_cast<Compare &>( *this ), static_cast<Compare &>( other ) );
        swap( key_    , other.key_     );
        swap( reverse_, other.reverse_ );
    }

private:
    [[ no_unique_address ]] Key key_{};
    bool reverse_{ false };
}; // class order

//------------------------------------------------------------------------------
} // namespace prioq
//------------------------------------------------------------------------------
