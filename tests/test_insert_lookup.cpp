#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <vtree/vec_tree.hpp>
#include "test_helpers.hpp"

using vtree::nid;

class InsertLookupTest : public ::testing::Test {
    protected:
    vtree::vec_tree<int> tree;
};

TEST_F ( InsertLookupTest, EmptyTree ) {
    EXPECT_TRUE ( tree.empty ( ) );
    EXPECT_EQ ( tree.size ( ), 0u );
    EXPECT_EQ ( tree.capacity ( ), 4u );
    EXPECT_FALSE ( tree.root ( ) );
}

TEST_F ( InsertLookupTest, InsertThenGet ) {
    nid const root = tree.insert_root ( 1 );
    nid const a    = tree.insert ( 10, root );
    nid const b    = tree.insert ( 11, root );

    ASSERT_NE ( tree.get ( a ), nullptr );
    EXPECT_EQ ( *tree.get ( a ), 10 );
    EXPECT_EQ ( tree[ b ], 11 );
    EXPECT_EQ ( tree.at ( root ), 1 );
    EXPECT_EQ ( tree.root ( ), root );
    EXPECT_EQ ( tree.parent ( a ), root );
    EXPECT_FALSE ( tree.parent ( root ) );
    EXPECT_EQ ( tree.size ( ), 3u );
    EXPECT_EQ ( tree.fan ( root ), 2 );
    EXPECT_TRUE ( test_helpers::is_consistent ( tree, root ) );
}

TEST_F ( InsertLookupTest, GetMutChangesData ) {
    nid const root = tree.insert_root ( 42 );
    *tree.get_mut ( root ) += 1;
    tree[ root ] += 1;
    EXPECT_EQ ( tree.remove ( root ), 44 );
    EXPECT_EQ ( tree.get_mut ( root ), nullptr );
    EXPECT_FALSE ( tree.remove ( root ) );
}

TEST_F ( InsertLookupTest, SecondRootIsRejected ) {
    tree.insert_root ( 1 );
    EXPECT_THROW ( tree.insert_root ( 2 ), std::logic_error );
    EXPECT_THROW ( static_cast<void> ( tree.try_insert_root ( 2 ) ), std::logic_error );
    EXPECT_EQ ( tree.size ( ), 1u );
}

TEST_F ( InsertLookupTest, RootCanBeReplacedAfterRemoval ) {
    nid const first = tree.insert_root ( 1 );
    tree.remove ( first );
    EXPECT_FALSE ( tree.root ( ) );
    nid const second = tree.insert_root ( 2 );
    EXPECT_EQ ( tree.root ( ), second );
}

TEST_F ( InsertLookupTest, StaleParentThrowsAndAllocatesNothing ) {
    nid const root = tree.insert_root ( 1 );
    nid const gone = tree.insert ( 2, root );
    tree.remove ( gone );
    EXPECT_THROW ( tree.insert ( 3, gone ), std::runtime_error );
    EXPECT_THROW ( static_cast<void> ( tree.try_insert ( 3, gone ) ), std::runtime_error );
    EXPECT_EQ ( tree.size ( ), 1u );
    EXPECT_EQ ( tree.fan ( root ), 0 );
}

TEST_F ( InsertLookupTest, StaleIndexThrows ) {
    nid const root = tree.insert_root ( 1 );
    tree.remove ( root );
    EXPECT_THROW ( static_cast<void> ( tree[ root ] ), std::runtime_error );
    EXPECT_THROW ( static_cast<void> ( tree.at ( root ) ), std::runtime_error );
    EXPECT_EQ ( tree.get ( root ), nullptr );
}

TEST_F ( InsertLookupTest, RemovedIdStaysStaleAfterSlotReuse ) {
    nid const root = tree.insert_root ( 0 );
    nid const a    = tree.insert ( 1, root );
    tree.remove ( a );
    nid const b = tree.insert ( 2, root );

    EXPECT_EQ ( a.slot, b.slot );
    EXPECT_NE ( a, b );
    EXPECT_FALSE ( tree.contains ( a ) );
    EXPECT_EQ ( tree.get ( a ), nullptr );
    EXPECT_EQ ( tree[ b ], 2 );
}

TEST ( TryInsertTest, FailsAtCapacityAndReturnsData ) {
    auto tree        = vtree::vec_tree<int>::with_capacity ( 10 );
    auto root_result = tree.try_insert_root ( 0 );
    ASSERT_TRUE ( root_result );
    nid const root = root_result.value ( );

    for ( int i = 1; i < 10; ++i ) {
        EXPECT_TRUE ( tree.try_insert ( i, root ) );
        EXPECT_EQ ( tree.capacity ( ), 10u );
    }

    auto r = tree.try_insert ( 99, root );
    ASSERT_FALSE ( r );
    EXPECT_EQ ( r.rejected ( ), 99 );
    EXPECT_EQ ( tree.fan ( root ), 9 );

    tree.reserve ( 5 );
    EXPECT_EQ ( tree.capacity ( ), 15u );
    auto retry = tree.try_insert ( r.rejected ( ), root );
    ASSERT_TRUE ( retry );
    EXPECT_EQ ( tree[ retry.value ( ) ], 99 );
}

TEST ( TryInsertTest, TryInsertRootOnFullTree ) {
    vtree::vec_tree<std::string> tree ( 0 );
    auto r = tree.try_insert_root ( "root" );
    ASSERT_FALSE ( r );
    EXPECT_EQ ( r.rejected ( ), "root" );
    EXPECT_FALSE ( tree.root ( ) );
}

TEST ( GrowthTest, InsertDoublesCapacity ) {
    auto tree = vtree::vec_tree<int>::with_capacity ( 1 );
    nid const root = tree.insert_root ( 0 );
    nid const idx  = tree.insert ( 42, root );
    EXPECT_EQ ( tree[ idx ], 42 );
    EXPECT_EQ ( tree.capacity ( ), 2u );
}

TEST ( GrowthTest, GrowthKeepsEveryIdValid ) {
    auto tree = vtree::vec_tree<int>::with_capacity ( 8 );
    std::vector<nid> ids{ tree.insert_root ( 0 ) };
    for ( int i = 1; i < 8; ++i )
        ids.push_back ( tree.insert ( i, ids[ ( i - 1 ) / 2 ] ) );
    ASSERT_EQ ( tree.capacity ( ), 8u );

    ids.push_back ( tree.insert ( 8, ids.back ( ) ) );
    EXPECT_GT ( tree.capacity ( ), 8u );
    for ( int i = 0; i < 9; ++i )
        EXPECT_EQ ( tree[ ids[ i ] ], i );
    EXPECT_TRUE ( test_helpers::is_consistent ( tree, ids.front ( ) ) );
}

TEST ( ClearTest, ClearKeepsCapacityAndInvalidatesIds ) {
    auto tree = vtree::vec_tree<int>::with_capacity ( 1 );
    nid const root = tree.insert_root ( 42 );
    nid const child = tree.insert ( 43, root );

    tree.clear ( );
    EXPECT_EQ ( tree.capacity ( ), 2u );
    EXPECT_TRUE ( tree.empty ( ) );
    EXPECT_FALSE ( tree.root ( ) );
    EXPECT_FALSE ( tree.contains ( root ) );
    EXPECT_FALSE ( tree.contains ( child ) );

    nid const new_root = tree.insert_root ( 1 );
    EXPECT_FALSE ( tree.contains ( root ) );
    EXPECT_EQ ( tree[ new_root ], 1 );
}

TEST ( ForestTest, DetachedNodesAndNoRoot ) {
    vtree::vec_forest<std::string> forest;
    nid const a = forest.insert ( "a" );
    nid const b = forest.insert ( "b" );
    nid const c = forest.insert ( "c", a );

    EXPECT_FALSE ( forest.parent ( a ) );
    EXPECT_FALSE ( forest.parent ( b ) );
    EXPECT_EQ ( forest.parent ( c ), a );
    EXPECT_EQ ( forest.size ( ), 3u );
    EXPECT_TRUE ( forest.append_child ( b, a ) );
    EXPECT_EQ ( test_helpers::values ( forest, forest.descendants ( b ) ), ( std::vector<std::string>{ "b", "a", "c" } ) );
}

TEST ( MoveOnlyDataTest, UniquePtrPayload ) {
    vtree::vec_tree<std::unique_ptr<int>> tree;
    nid const root = tree.insert_root ( std::make_unique<int> ( 5 ) );
    nid const a    = tree.insert ( std::make_unique<int> ( 6 ), root );
    EXPECT_EQ ( *tree[ a ], 6 );
    std::optional<std::unique_ptr<int>> removed = tree.remove ( root );
    ASSERT_TRUE ( removed );
    EXPECT_EQ ( **removed, 5 );
    EXPECT_FALSE ( tree.contains ( a ) );
}
