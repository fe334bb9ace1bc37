////////////////////////////////////////////////////////////////////////////////
/// prioq::priority_queue multiset algebra test suite
////////////////////////////////////////////////////////////////////////////////

#include <prioq/containers/priority_queue.hpp>

#include <fmt/core.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <compare>
#include <cstdlib>
#include <random>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace prioq
{
//------------------------------------------------------------------------------

namespace
{
    using int_queue = priority_queue<int>;

    struct string_length
    {
        std::size_t operator()( std::string const & s ) const noexcept { return s.size(); }
    };

    int absolute( int const & x ) { return std::abs( x ); }
    int negate  ( int const & x ) { return -x; }

    // Contents in ascending value order, regardless of the queue direction.
    template <typename Queue>
    auto ascending( Queue const & q )
    {
        auto values{ q.values() };
        std::ranges::sort( values );
        return values;
    }

    int_queue random_queue( std::mt19937 & rng )
    {
        std::uniform_int_distribution<int> size_dist { 0, 12 };
        std::uniform_int_distribution<int> value_dist{ 0, 9 };
        int_queue q( ( rng() % 2 ) != 0 );
        for ( auto n{ size_dist( rng ) }; n > 0; --n )
            q.push( value_dist( rng ) );
        return q;
    }
} // anonymous namespace

//==============================================================================
// Binary operators
//==============================================================================

TEST( set_algebra, intersection )
{
    int_queue const a{ 1, 2, 3 };
    int_queue const b{ 2, 3, 4 };
    auto const c{ a & b };
    EXPECT_EQ( c.values(), ( std::vector<int>{ 2, 3 } ) );
    EXPECT_EQ( a.size(), 3 );
    EXPECT_EQ( b.size(), 3 );
}

TEST( set_algebra, intersection_multiplicity )
{
    int_queue const a{ 1, 1, 1, 2 };
    int_queue const b{ 1, 1, 2, 2 };
    EXPECT_EQ( ( a & b ).values(), ( std::vector<int>{ 1, 1, 2 } ) );
}

TEST( set_algebra, union_keeps_duplicates )
{
    int_queue const a{ 1, 2 };
    int_queue const b{ 2, 3 };
    auto u{ a | b };
    EXPECT_EQ( u.size(), 4 );
    EXPECT_EQ( u.values(), ( std::vector<int>{ 1, 2, 2, 3 } ) );
    EXPECT_EQ( u.pop(), 1 );
}

TEST( set_algebra, difference_multiplicity )
{
    int_queue const a{ 1, 1, 2, 3 };
    int_queue const b{ 1, 3, 5 };
    EXPECT_EQ( ( a - b ).values(), ( std::vector<int>{ 1, 2 } ) );
    EXPECT_EQ( ( b - a ).values(), ( std::vector<int>{ 5 } ) );
}

TEST( set_algebra, difference_with_empty )
{
    int_queue const a{ 4, 2 };
    int_queue const none{};
    EXPECT_TRUE( ( a - none ) == a );
    EXPECT_TRUE( ( none - a ).empty() );
}

TEST( set_algebra, symmetric_difference )
{
    int_queue const a{ 1, 2, 2, 3 };
    int_queue const b{ 2, 4 };
    EXPECT_EQ( ( a ^ b ).values(), ( std::vector<int>{ 1, 2, 3, 4 } ) );
    EXPECT_TRUE( ( a ^ b ) == ( b ^ a ) );
}

TEST( set_algebra, symmetric_difference_is_self_inverse )
{
    int_queue const a{ 3, 1, 3, 7 };
    int_queue const none{};
    EXPECT_TRUE( ( a ^ a ).empty() );
    EXPECT_TRUE( ( a ^ none ) == a );
    EXPECT_TRUE( ( none ^ a ) == a );
}

TEST( set_algebra, results_take_the_left_configuration )
{
    int_queue const up  ( { 3, 1, 2 } );
    int_queue const down( { 2, 3, 4 }, true );

    auto left_up{ up & down };
    EXPECT_FALSE( left_up.reverse() );
    EXPECT_EQ( left_up.pop(), 2 );

    auto left_down{ down & up };
    EXPECT_TRUE( left_down.reverse() );
    EXPECT_EQ( left_down.pop(), 3 );

    EXPECT_TRUE ( ( down | up ).reverse() );
    EXPECT_EQ   ( ( down | up ).peek(), 4 );
    EXPECT_FALSE( ( up ^ down ).reverse() );
    EXPECT_EQ   ( ( up ^ down ).values(), ( std::vector<int>{ 1, 4 } ) );
    EXPECT_TRUE ( ( down - up ).reverse() );
    EXPECT_EQ   ( ( down - up ).values(), ( std::vector<int>{ 4 } ) );
}

//==============================================================================
// In-place forms
//==============================================================================

TEST( set_algebra, in_place )
{
    int_queue const b{ 2, 3, 4 };

    int_queue a( { 1, 2, 3 }, true );
    a &= b;
    EXPECT_EQ  ( a.values(), ( std::vector<int>{ 3, 2 } ) );
    EXPECT_TRUE( a.reverse() );

    a |= b;
    EXPECT_EQ( ascending( a ), ( std::vector<int>{ 2, 2, 3, 3, 4 } ) );
    EXPECT_EQ( a.peek(), 4 );

    a -= b;
    EXPECT_EQ( ascending( a ), ( std::vector<int>{ 2, 3 } ) );

    a ^= b;
    EXPECT_EQ  ( ascending( a ), ( std::vector<int>{ 4 } ) );
    EXPECT_TRUE( a.reverse() );
}

TEST( set_algebra, in_place_with_self )
{
    int_queue a{ 1, 2 };
    a &= a;
    EXPECT_EQ( a.values(), ( std::vector<int>{ 1, 2 } ) );
    a |= a;
    EXPECT_EQ( a.values(), ( std::vector<int>{ 1, 1, 2, 2 } ) );
    a ^= a;
    EXPECT_TRUE( a.empty() );

    int_queue b{ 5 };
    b -= b;
    EXPECT_TRUE( b.empty() );
}

//==============================================================================
// Relations
//==============================================================================

TEST( set_algebra, equality_ignores_direction_and_order )
{
    int_queue const a{ 1, 2, 2 };
    int_queue const b( { 2, 1, 2 }, true );
    EXPECT_TRUE ( a == b );
    EXPECT_TRUE ( b == a );
    EXPECT_FALSE( a == int_queue( { 1, 2 } ) );
    EXPECT_FALSE( a == int_queue( { 1, 1, 2 } ) );
    EXPECT_TRUE ( int_queue{} == int_queue( true ) );
}

TEST( set_algebra, subset_relations )
{
    int_queue const small{ 1, 2 };
    int_queue const big  { 1, 2, 3 };
    EXPECT_TRUE ( small <= big );
    EXPECT_TRUE ( small <  big );
    EXPECT_TRUE ( big   >= small );
    EXPECT_TRUE ( big   >  small );
    EXPECT_FALSE( big   <= small );
    EXPECT_FALSE( small >  big );

    EXPECT_TRUE ( small <= small );
    EXPECT_FALSE( small <  small );
    EXPECT_TRUE ( small >= small );
    EXPECT_FALSE( small >  small );
}

TEST( set_algebra, subset_counts_multiplicity )
{
    int_queue const twice{ 1, 1 };
    int_queue const once { 1 };
    EXPECT_FALSE( twice <= once );
    EXPECT_TRUE ( once  <  twice );
}

TEST( set_algebra, incomparable )
{
    int_queue const a{ 1, 4 };
    int_queue const b{ 1, 2 };
    EXPECT_EQ   ( a <=> b, std::partial_ordering::unordered );
    EXPECT_FALSE( a <= b );
    EXPECT_FALSE( a >= b );
    EXPECT_FALSE( a <  b );
    EXPECT_FALSE( a >  b );
    EXPECT_FALSE( a == b );
}

TEST( set_algebra, empty_is_a_subset_of_everything )
{
    int_queue const none{};
    int_queue const a{ 3 };
    EXPECT_TRUE( none <= a );
    EXPECT_TRUE( none <  a );
    EXPECT_TRUE( none <= none );
}

TEST( set_algebra, isdisjoint )
{
    int_queue const a{ 1, 2 };
    int_queue const b{ 3, 4 };
    int_queue const c{ 2 };
    int_queue const none{};
    EXPECT_TRUE ( a.isdisjoint( b ) );
    EXPECT_TRUE ( b.isdisjoint( a ) );
    EXPECT_FALSE( a.isdisjoint( c ) );
    EXPECT_TRUE ( a.isdisjoint( none ) );
    EXPECT_TRUE ( none.isdisjoint( none ) );
    EXPECT_EQ   ( a.isdisjoint( c ), ( a & c ).empty() );
}

//==============================================================================
// Keyed queues
//==============================================================================

TEST( set_algebra, keyed_match_needs_equal_value )
{
    using string_queue = priority_queue<std::string, string_length>;
    string_queue const a{ "ab", "cd", "xyz" };
    string_queue const b{ "cd", "ef" };
    EXPECT_EQ   ( ( a & b ).values(), ( std::vector<std::string>{ "cd" } ) );
    EXPECT_EQ   ( ascending( a - b ), ( std::vector<std::string>{ "ab", "xyz" } ) );
    EXPECT_EQ   ( ascending( a ^ b ), ( std::vector<std::string>{ "ab", "ef", "xyz" } ) );
    EXPECT_FALSE( a.isdisjoint( b ) );
    EXPECT_TRUE ( string_queue{ "ab" }.isdisjoint( string_queue{ "cd" } ) );
    EXPECT_FALSE( string_queue{ "ab" } == string_queue{ "cd" } );
}

TEST( set_algebra, operands_with_different_keys )
{
    using fn_queue = priority_queue<int, int(*)( int const & )>;
    fn_queue const by_abs ( { -3, 1, 2 }, &absolute );
    fn_queue const negated( { 3, -3, 2 }, &negate   );

    auto common{ by_abs & negated };
    EXPECT_EQ( common.key(), &absolute );
    EXPECT_EQ( common.pop(),  2 );
    EXPECT_EQ( common.pop(), -3 );

    auto all{ by_abs | negated };
    EXPECT_EQ( all.size(), 6 );
    EXPECT_EQ( all.pop(), 1 );
    EXPECT_EQ( all.pop(), 2 );
    EXPECT_EQ( all.pop(), 2 );
    EXPECT_EQ( absolute( all.pop() ), 3 );

    EXPECT_EQ( ascending( negated - by_abs ), ( std::vector<int>{ 3 } ) );
    EXPECT_TRUE( fn_queue( { 2, 1, -3 }, &negate ) == by_abs );
}

//==============================================================================
// Randomized algebraic laws
//==============================================================================

TEST( set_algebra, randomized_laws )
{
    auto const seed{ std::random_device{}() };
    fmt::print( "Seed {}\n", seed );
    std::mt19937 rng{ seed };

    for ( int round{ 0 }; round < 300; ++round )
    {
        auto const a{ random_queue( rng ) };
        auto const b{ random_queue( rng ) };
        auto const c{ random_queue( rng ) };

        ASSERT_TRUE( a == a );
        ASSERT_EQ  ( a == b, b == a );
        if ( a == b && b == c )
            ASSERT_TRUE( a == c );
        if ( a <= b && b <= c )
            ASSERT_TRUE( a <= c );
        ASSERT_EQ( a <= b, b >= a );
        ASSERT_EQ( a <  b, b >  a );

        ASSERT_TRUE( ( a & b ) <= a );
        ASSERT_TRUE( ( a & b ) <= b );
        ASSERT_TRUE( a <= ( a | b ) );
        ASSERT_TRUE( ( a & a ) == a );
        ASSERT_TRUE( ( a & b ) == ( b & a ) );
        ASSERT_TRUE( ( a | b ) == ( b | a ) );
        ASSERT_EQ  ( ( a | b ).size(), a.size() + b.size() );
        ASSERT_EQ  ( ( a & b ).size() + ( a - b ).size(), a.size() );
        ASSERT_TRUE( ( ( a - b ) | ( a & b ) ) == a );
        ASSERT_TRUE( ( a ^ b ) == ( ( a - b ) | ( b - a ) ) );
        ASSERT_TRUE( ( a ^ a ).empty() );
        ASSERT_EQ  ( a.isdisjoint( b ), ( a & b ).empty() );
        ASSERT_EQ  ( ascending( a & b ), ascending( b & a ) );
    }
}

//------------------------------------------------------------------------------
} // namespace prioq
//------------------------------------------------------------------------------
