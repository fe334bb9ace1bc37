////////////////////////////////////////////////////////////////////////////////
/// Multiset algebra over item sequences sorted by an order (order.hpp).
///
/// Contents:
///   - strategy switch                  (reuse_operand_priorities)
///   - sorted snapshots                 (sorted_items, sorted_items_as)
///   - merge_sorted                     (lockstep walk with run matching)
///   - intersect / subtract / common_count / disjoint
///
/// Two items match when their priorities are equivalent and their values
/// compare equal. Equivalent priorities are not enough on their own (distinct
/// values may share a priority), so the walk collects the runs of equivalent
/// items on both sides and pairs them up by value: every match consumes one
/// item from each side (multiset semantics).
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

#include <boost/assert.hpp>
#include <boost/container/small_vector.hpp>

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>
//------------------------------------------------------------------------------
namespace prioq::detail
{
//------------------------------------------------------------------------------

//==============================================================================
// Strategy switch (constexpr, for experimentation)
//==============================================================================
inline constexpr bool reuse_operand_priorities{ true }; // copy the right operand's items instead of re-applying the key when both keys are the same


//==============================================================================
// Sorted snapshots
//==============================================================================

template <typename Item, typename Order>
[[ nodiscard ]] std::vector<Item> sorted_items( std::vector<Item> const & items, Order const & ord )
{
    std::vector<Item> sorted{ items };
    ord.sort( sorted.begin(), sorted.end() );
    return sorted;
}

/// The items of another queue, re-keyed for and sorted by 'ord'.
template <typename Item, typename Order>
[[ nodiscard ]] std::vector<Item> sorted_items_as( std::vector<Item> const & items, Order const & source, Order const & ord )
{
    bool const same_key{ reuse_operand_priorities && ord.same_key( source ) };
    std::vector<Item> sorted;
    sorted.reserve( items.size() );
    for ( auto const & item : items )
        sorted.push_back( ord.rewrap( item, same_key ) );
    ord.sort( sorted.begin(), sorted.end() );
    return sorted;
}


//==============================================================================
// merge_sorted: the lockstep walk all operations are built on
//
// Calls left_only( item ) / right_only( item ) for unmatched items and
// both( left_item ) for matched pairs; both() returns false to stop the walk.
//==============================================================================

template <typename Item, typename Order>
[[ nodiscard ]] std::size_t run_end( std::span<Item const> const items, std::size_t const first, Order const & ord )
{
    auto last{ first + 1 };
    while ( last < items.size() && !ord.le( items[ first ], items[ last ] ) )
        ++last;
    return last;
}

template <typename Item, typename Order, typename LeftOnly, typename Both, typename RightOnly>
void merge_sorted
(
    std::span<Item const> const left,
    std::span<Item const> const right,
    Order const & ord,
    LeftOnly  && left_only,
    Both      && both,
    RightOnly && right_only
)
{
    std::size_t l{ 0 };
    std::size_t r{ 0 };
    while ( l < left.size() && r < right.size() )
    {
        if ( ord.le( left[ l ], right[ r ] ) ) { left_only ( left [ l++ ] ); continue; }
        if ( ord.le( right[ r ], left[ l ] ) ) { right_only( right[ r++ ] ); continue; }

        // equivalent runs on both sides
        auto const left_end { run_end( left , l, ord ) };
        auto const right_end{ run_end( right, r, ord ) };
        boost::container::small_vector<bool, 16> taken( right_end - r, false );
        for ( ; l < left_end; ++l )
        {
            bool matched{ false };
            for ( auto k{ r }; k < right_end; ++k )
            {
                if ( !taken[ k - r ] && left[ l ].value() == right[ k ].value() )
                {
                    taken[ k - r ] = true;
                    matched        = true;
                    break;
                }
            }
            if ( !matched )
                left_only( left[ l ] );
            else if ( !both( left[ l ] ) )
                return;
        }
        for ( auto k{ r }; k < right_end; ++k )
        {
            if ( !taken[ k - r ] )
                right_only( right[ k ] );
        }
        r = right_end;
    }
    for ( ; l < left .size(); ++l ) left_only ( left [ l ] );
    for ( ; r < right.size(); ++r ) right_only( right[ r ] );
}


//==============================================================================
// Operations (inputs sorted by 'ord', outputs keep that order)
//==============================================================================

template <typename Item, typename Order>
[[ nodiscard ]] std::vector<Item> intersect( std::span<Item const> const left, std::span<Item const> const right, Order const & ord )
{
    std::vector<Item> result;
    result.reserve( std::min( left.size(), right.size() ) );
    merge_sorted
    (
        left, right, ord,
        []( Item const & ) {},
        [&]( Item const & item ) { result.push_back( item ); return true; },
        []( Item const & ) {}
    );
    return result;
}

template <typename Item, typename Order>
[[ nodiscard ]] std::vector<Item> subtract( std::span<Item const> const left, std::span<Item const> const right, Order const & ord )
{
    std::vector<Item> result;
    result.reserve( left.size() );
    merge_sorted
    (
        left, right, ord,
        [&]( Item const & item ) { result.push_back( item ); },
        []( Item const & ) { return true; },
        []( Item const & ) {}
    );
    return result;
}

/// Size of the multiset intersection.
template <typename Item, typename Order>
[[ nodiscard ]] std::size_t common_count( std::span<Item const> const left, std::span<Item const> const right, Order const & ord )
{
    std::size_t count{ 0 };
    merge_sorted
    (
        left, right, ord,
        []( Item const & ) {},
        [&]( Item const & ) { ++count; return true; },
        []( Item const & ) {}
    );
    BOOST_ASSERT( count <= std::min( left.size(), right.size() ) );
    return count;
}

template <typename Item, typename Order>
[[ nodiscard ]] bool disjoint( std::span<Item const> const left, std::span<Item const> const right, Order const & ord )
{
    bool found{ false };
    merge_sorted
    (
        left, right, ord,
        []( Item const & ) {},
        [&]( Item const & ) { found = true; return false; },
        []( Item const & ) {}
    );
    return !found;
}

//------------------------------------------------------------------------------
} // namespace prioq::detail
//------------------------------------------------------------------------------
