////////////////////////////////////////////////////////////////////////////////
///
/// \file error.hpp
/// ---------------
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

#include <stdexcept>
//------------------------------------------------------------------------------
namespace prioq
{
//------------------------------------------------------------------------------

/// Thrown by peek() and pop() on an empty queue.
struct empty_queue : std::out_of_range
{
    using std::out_of_range::out_of_range;
};

/// Thrown by remove() when no matching value is stored.
struct value_not_found : std::out_of_range
{
    using std::out_of_range::out_of_range;
};

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_empty_queue    ();
    [[ noreturn, gnu::cold ]] void throw_value_not_found();
} // namespace detail

//------------------------------------------------------------------------------
} // namespace prioq
//------------------------------------------------------------------------------
