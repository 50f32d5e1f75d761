////////////////////////////////////////////////////////////////////////////////
/// ordo fallible reservation test suite
////////////////////////////////////////////////////////////////////////////////

#include <ordo/containers/ordered_map.hpp>
#include <ordo/containers/ordered_set.hpp>
#include <ordo/error.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <new>
#include <string_view>
#include <utility>

namespace
{
    // refuses any single request for more than `limit` objects
    template <typename T>
    struct limited_allocator
    {
        using value_type = T;

        std::size_t limit{ std::numeric_limits<std::size_t>::max() };

        limited_allocator() = default;
        explicit limited_allocator( std::size_t const max_objects ) noexcept : limit{ max_objects } {}
        template <typename U>
        limited_allocator( limited_allocator<U> const & other ) noexcept : limit{ other.limit } {}

        T * allocate( std::size_t const n )
        {
            if ( n > limit )
                throw std::bad_alloc();
            return std::allocator<T>{}.allocate( n );
        }

        void deallocate( T * const p, std::size_t const n ) noexcept { std::allocator<T>{}.deallocate( p, n ); }

        friend bool operator==( limited_allocator const & a, limited_allocator const & b ) noexcept { return a.limit == b.limit; }
    }; // struct limited_allocator

    using OM         = ordo::ordered_map<int, int>;
    using limited_om = ordo::ordered_map<int, int, std::hash<int>, std::equal_to<int>, limited_allocator<std::pair<int, int>>>;

    auto constexpr huge{ std::numeric_limits<std::size_t>::max() };
} // anonymous namespace

TEST( try_reserve, success )
{
    OM m{ { 1, 1 } };
    auto result{ m.try_reserve( 100 ).as_result_or_error() };
    ASSERT_TRUE( result );
    EXPECT_GE( m.capacity(), 100 );

    auto exact{ m.try_reserve_exact( 150 ).as_result_or_error() };
    ASSERT_TRUE( exact );
    EXPECT_GE( m.capacity(), 150 );
    EXPECT_EQ( m.at( 1 ), 1 );
}

TEST( try_reserve, within_capacity_is_a_no_op )
{
    OM m( 32 );
    auto const buckets{ m.bucket_count() };
    auto result{ m.try_reserve( 10 ).as_result_or_error() };
    EXPECT_TRUE( result );
    EXPECT_EQ( m.bucket_count(), buckets );
}

TEST( try_reserve, capacity_overflow )
{
    OM m{ { 1, 1 }, { 2, 2 } };
    auto const capacity{ m.capacity() };

    auto result{ m.try_reserve( huge ).as_result_or_error() };
    ASSERT_FALSE( result );
    EXPECT_EQ( result.error().reason   , ordo::try_reserve_error::kind::capacity_overflow );
    EXPECT_EQ( result.error().requested, huge );

    auto exact{ m.try_reserve_exact( huge ).as_result_or_error() };
    ASSERT_FALSE( exact );
    EXPECT_EQ( exact.error().reason, ordo::try_reserve_error::kind::capacity_overflow );

    EXPECT_EQ( m.capacity(), capacity );
    EXPECT_EQ( m.size(), 2 );
    m.insert( 3, 3 );
    EXPECT_EQ( m.get_index_of( 3 ), 2 );
}

TEST( try_reserve, set_capacity_overflow )
{
    ordo::ordered_set<int> s;
    auto result{ s.try_reserve( huge ).as_result_or_error() };
    ASSERT_FALSE( result );
    EXPECT_EQ( result.error(), ( ordo::try_reserve_error{ ordo::try_reserve_error::kind::capacity_overflow, huge } ) );
    EXPECT_TRUE( s.empty() );
}

TEST( try_reserve, allocation_failure )
{
    limited_om m( limited_om::allocator_type{ 16 } );
    auto result{ m.try_reserve( 1000 ).as_result_or_error() };
    ASSERT_FALSE( result );
    EXPECT_EQ( result.error().reason   , ordo::try_reserve_error::kind::allocation_failure );
    EXPECT_EQ( result.error().requested, 1000 );

    // small growth still works
    m.insert( 1, 10 );
    m.insert( 2, 20 );
    EXPECT_EQ( m.at( 2 ), 20 );
}

TEST( try_reserve, infallible_reserve_throws_bad_alloc )
{
    limited_om m( limited_om::allocator_type{ 16 } );
    m.insert( 1, 10 );
    EXPECT_THROW( m.reserve( 1000 ), std::bad_alloc );
    EXPECT_EQ( m.size(), 1 );
    EXPECT_EQ( m.at( 1 ), 10 );

    OM unlimited;
    EXPECT_THROW( unlimited.reserve( huge ), std::bad_alloc );
    EXPECT_TRUE( unlimited.empty() );
}

TEST( try_reserve, error_descriptions )
{
    using error = ordo::try_reserve_error;
    EXPECT_EQ( std::string_view{ ( error{ error::kind::capacity_overflow , 1 } ).what() }, "ordo: requested capacity exceeds the maximum size" );
    EXPECT_EQ( std::string_view{ ( error{ error::kind::allocation_failure, 1 } ).what() }, "ordo: memory allocation failed" );
}
