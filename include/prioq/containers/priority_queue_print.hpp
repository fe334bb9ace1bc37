////////////////////////////////////////////////////////////////////////////////
/// Debug output for prioq::priority_queue: level-by-level heap dump and a
/// one-line rendering of the sorted contents. Requires formattable values.
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

#include "priority_queue.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <string>
//------------------------------------------------------------------------------
namespace prioq
{
//------------------------------------------------------------------------------

template <typename Value, typename Key, typename Compare>
void priority_queue<Value, Key, Compare>::print( std::FILE * const out ) const
{
    if ( empty() )
    {
        std::fputs( "The queue is empty.\n", out );
        return;
    }

    // Level k of the heap spans [2^k - 1, 2^(k+1) - 1).
    size_type first{ 0 };
    for ( std::uint16_t level{ 0 }; first < items_.size(); ++level )
    {
        auto const last{ std::min( 2 * first + 1, items_.size() ) };
        fmt::print( out, "Level {}:\t<", level );
        for ( auto i{ first }; i < last; ++i )
        {
            fmt::print( out, "{}", items_[ i ].value() );
            if ( i < last - 1 )
                fmt::print( out, ", " );
        }
        fmt::print( out, "> [{} values]\n", last - first );
        first = last;
    }
}

template <typename Value, typename Key, typename Compare>
std::string priority_queue<Value, Key, Compare>::format_values() const
{
    auto const sorted{ values() };
    return fmt::format( "priority_queue({}{}reverse={})", fmt::join( sorted, ", " ), sorted.empty() ? "" : ", ", reverse() );
}

//------------------------------------------------------------------------------
} // namespace prioq
//------------------------------------------------------------------------------
