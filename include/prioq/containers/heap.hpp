////////////////////////////////////////////////////////////////////////////////
/// Array-backed binary heap primitives for prioq::priority_queue.
///
/// All functions take the backing container and the order (order.hpp)
/// explicitly. The front of the heap is the item no other item comes before
/// (order::le), i.e. items[ parent( i ) ] never comes after items[ i ].
///
/// Every restructuring runs in two phases: the final position of the moving
/// item is determined first (comparisons only, the container is untouched),
/// then the items along the path are shifted (moves only). A throwing
/// comparator or key function therefore never leaves a half-sifted heap
/// behind. Moves of items are assumed not to throw.
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

#include <bit>
#include <cstddef>
#include <utility>
//------------------------------------------------------------------------------
namespace prioq::heap
{
//------------------------------------------------------------------------------

using size_type = std::size_t;

namespace detail
{
    [[ nodiscard ]] constexpr size_type parent    ( size_type const pos ) noexcept { return ( pos - 1 ) / 2; }
    [[ nodiscard ]] constexpr size_type left_child( size_type const pos ) noexcept { return 2 * pos + 1; }
    [[ nodiscard ]] constexpr size_type depth     ( size_type const pos ) noexcept { return static_cast<size_type>( std::bit_width( pos + 1 ) ) - 1; }

    // Where an item starting at 'hole' ends up when bubbled towards the root.
    template <typename Items, typename Order>
    [[ nodiscard ]] constexpr size_type sift_up_target( Items const & items, size_type hole, typename Order::item_type const & item, Order const & ord )
    {
        while ( hole > 0 )
        {
            auto const up{ parent( hole ) };
            if ( !ord.le( item, items[ up ] ) )
                break;
            hole = up;
        }
        return hole;
    }

    // Where an item starting at 'hole' ends up when sunk through the first
    // 'size' items.
    template <typename Items, typename Order>
    [[ nodiscard ]] constexpr size_type sift_down_target( Items const & items, size_type const size, size_type hole, typename Order::item_type const & item, Order const & ord )
    {
        for ( ; ; )
        {
            auto child{ left_child( hole ) };
            if ( child >= size )
                break;
            if ( child + 1 < size && ord.le( items[ child + 1 ], items[ child ] ) )
                ++child;
            if ( !ord.le( items[ child ], item ) )
                break;
            hole = child;
        }
        return hole;
    }

    // Shifts the ancestors of 'from' (up to and excluding 'target') one level
    // down and stores 'item' at 'target'. The item at 'from' is overwritten.
    template <typename Items>
    constexpr void rotate_up( Items & items, size_type from, size_type const target, typename Items::value_type && item ) noexcept
    {
        while ( from > target )
        {
            auto const up{ parent( from ) };
            items[ from ] = std::move( items[ up ] );
            from = up;
        }
        items[ target ] = std::move( item );
    }

    // Shifts the items on the path from 'from' to its descendant 'target' one
    // level up and stores 'item' at 'target'. The item at 'from' is
    // overwritten. The path is read off the bits of the (1-based) target
    // index below the depth of 'from'.
    template <typename Items>
    constexpr void rotate_down( Items & items, size_type from, size_type const target, typename Items::value_type && item ) noexcept
    {
        auto const levels{ depth( target ) - depth( from ) };
        auto const path  { target + 1 };
        BOOST_ASSERT_MSG( ( path >> levels ) == from + 1, "target is not a descendant" );
        for ( auto level{ levels }; level-- > 0; )
        {
            auto const child{ left_child( from ) + ( ( path >> level ) & 1 ) };
            items[ from ] = std::move( items[ child ] );
            from = child;
        }
        items[ from ] = std::move( item );
    }
} // namespace detail


template <typename Items, typename Order>
[[ nodiscard ]] constexpr bool is_heap( Items const & items, Order const & ord )
{
    for ( size_type pos{ 1 }; pos < items.size(); ++pos )
    {
        if ( ord.le( items[ pos ], items[ detail::parent( pos ) ] ) )
            return false;
    }
    return true;
}

/// Reorders arbitrary items into heap order, O(n).
template <typename Items, typename Order>
constexpr void make( Items & items, Order const & ord )
{
    auto const size{ items.size() };
    for ( auto pos{ size / 2 }; pos-- > 0; )
    {
        auto const target{ detail::sift_down_target( items, size, pos, items[ pos ], ord ) };
        if ( target != pos )
        {
            auto item{ std::move( items[ pos ] ) };
            detail::rotate_down( items, pos, target, std::move( item ) );
        }
    }
    BOOST_ASSERT( heap::is_heap( items, ord ) );
}

template <typename Items>
[[ nodiscard ]] constexpr auto const & front( Items const & items ) noexcept
{
    BOOST_ASSERT_MSG( !items.empty(), "front() of an empty heap" );
    return items.front();
}

/// Appends then sifts up, O(log n).
template <typename Items, typename Order>
constexpr void push( Items & items, typename Items::value_type item, Order const & ord )
{
    auto const hole  { items.size() };
    auto const target{ detail::sift_up_target( items, hole, item, ord ) };
    items.push_back( std::move( item ) );
    if ( target != hole )
    {
        auto pushed{ std::move( items[ hole ] ) };
        detail::rotate_up( items, hole, target, std::move( pushed ) );
    }
}

/// Removes and returns the front item, O(log n). Precondition: not empty.
template <typename Items, typename Order>
constexpr typename Items::value_type pop( Items & items, Order const & ord )
{
    BOOST_ASSERT_MSG( !items.empty(), "pop() from an empty heap" );
    auto const last{ items.size() - 1 };
    if ( last == 0 )
    {
        auto top{ std::move( items.front() ) };
        items.pop_back();
        return top;
    }
    auto const target{ detail::sift_down_target( items, last, 0, items[ last ], ord ) };
    auto top{ std::move( items.front() ) };
    auto tail{ std::move( items[ last ] ) };
    detail::rotate_down( items, 0, target, std::move( tail ) );
    items.pop_back();
    return top;
}

/// Position of the first item matching 'item' (equivalent priority, equal
/// value) or items.size() if there is none, O(n).
template <typename Items, typename Order>
[[ nodiscard ]] constexpr size_type find( Items const & items, typename Items::value_type const & item, Order const & ord )
{
    for ( size_type pos{ 0 }; pos < items.size(); ++pos )
    {
        if ( ord.matches( items[ pos ], item ) )
            return pos;
    }
    return items.size();
}

/// Removes and returns the item at 'pos': the last item takes its place and
/// is sifted in whichever direction restores the invariant, O(log n).
template <typename Items, typename Order>
constexpr typename Items::value_type erase_at( Items & items, size_type const pos, Order const & ord )
{
    BOOST_ASSERT_MSG( pos < items.size(), "erase_at() out of range" );
    auto const last{ items.size() - 1 };
    if ( pos == last )
    {
        auto removed{ std::move( items[ last ] ) };
        items.pop_back();
        return removed;
    }

    auto const & tail{ items[ last ] };
    auto target{ detail::sift_up_target( items, pos, tail, ord ) };
    bool const up{ target != pos };
    if ( !up )
        target = detail::sift_down_target( items, last, pos, tail, ord );

    auto removed{ std::move( items[ pos  ] ) };
    auto moved  { std::move( items[ last ] ) };
    if ( up )
        detail::rotate_up  ( items, pos, target, std::move( moved ) );
    else
        detail::rotate_down( items, pos, target, std::move( moved ) );
    items.pop_back();
    return removed;
}

//------------------------------------------------------------------------------
} // namespace prioq::heap
//------------------------------------------------------------------------------
