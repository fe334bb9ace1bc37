////////////////////////////////////////////////////////////////////////////////
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
#include <prioq/containers/priority_queue.hpp>
#include <prioq/error/error.hpp>
//------------------------------------------------------------------------------
namespace prioq
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_empty_queue    () { throw empty_queue    ( "prioq::priority_queue is empty" ); }
    [[ noreturn, gnu::cold ]] void throw_value_not_found() { throw value_not_found( "value is not in prioq::priority_queue" ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace prioq
//------------------------------------------------------------------------------
