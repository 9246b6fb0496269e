
// MIT License
//
// Copyright (c) 2020 degski
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include <cstddef>
#include <cstdint>
#include <cstdlib>

#include <array>
#include <memory>
#include <random>
#include <type_traits>
#include <vector>

#include <plf/plf_nanotimer.h>

#include <sax/iostream.hpp>
#include <sax/prng_sfc.hpp>
#include <sax/uniform_int_distribution.hpp>

#include <vtree/vec_tree.hpp>

#if defined( _DEBUG )
#    define RANDOM 0
#else
#    define RANDOM 1
#endif

namespace Rng {
// Thread local instance of a C++ implementation of Chris Doty-Humphrey's Small Fast Chaotic Prng.
[[nodiscard]] inline sax::Rng & generator ( ) noexcept {
    if constexpr ( RANDOM ) {
        static thread_local sax::Rng generator ( sax::os_seed ( ), sax::os_seed ( ), sax::os_seed ( ), sax::os_seed ( ) );
        return generator;
    }
    else {
        static thread_local sax::Rng generator ( sax::fixed_seed ( ) );
        return generator;
    }
}
} // namespace Rng

#undef RANDOM

sax::Rng & rng = Rng::generator ( );

using Tree = vtree::vec_tree<int>;

template<typename Tree>
void add_nodes_high_workload ( Tree & tree_, std::vector<vtree::nid> & ids_, int n_ ) {
    for ( int i = 1; i < n_; ++i ) {
        // Some piecewise distibution, simulating more 'normal' use case, where new nodes are added more often at
        // the bottom.
        auto back = ids_.size ( );
        int n     = 0;
        if ( back > 3 ) {
            std::array<float, 4> ai           = { 0.0f, back / 2.0f, 2 * back / 3.0f, static_cast<float> ( back - 1 ) };
            constexpr std::array<float, 3> aw = { 1, 3, 9 };
            n = static_cast<int> ( std::piecewise_constant_distribution<float> ( ai.begin ( ), ai.end ( ), aw.begin ( ) ) ( rng ) );
        }
        ids_.push_back ( tree_.insert ( i, ids_[ n ] ) );
    }
}

template<typename Tree>
void add_nodes_low_workload ( Tree & tree_, std::vector<vtree::nid> & ids_, int n_ ) {
    for ( int i = 1; i < n_; ++i )
        ids_.push_back (
            tree_.insert ( i, ids_[ sax::uniform_int_distribution<int> ( 0, static_cast<int> ( ids_.size ( ) ) - 1 ) ( rng ) ] ) );
}

// Removes random subtrees, returns the number of calls that hit a live node.
template<typename Tree>
[[nodiscard]] int remove_nodes ( Tree & tree_, std::vector<vtree::nid> const & ids_, int n_ ) {
    int hits = 0;
    for ( int i = 0; i < n_; ++i )
        if ( tree_.remove ( ids_[ sax::uniform_int_distribution<int> ( 1, static_cast<int> ( ids_.size ( ) ) - 1 ) ( rng ) ] ) )
            hits += 1;
    return hits;
}

template<typename Workload>
void run ( char const * name_, Workload workload_, int n_ ) {
    std::cout << name_ << nl;
    Tree tree;
    std::vector<vtree::nid> ids{ tree.insert_root ( 0 ) };
    plf::nanotimer timer;
    timer.start ( );
    workload_ ( tree, ids, n_ );
    std::uint64_t duration = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
    std::cout << duration << "ms" << sp << tree.size ( ) << nl;
    timer.start ( );
    int sum1 = 0;
    for ( vtree::nid const id : tree.breadth_first ( ids.front ( ) ) )
        sum1 += tree[ id ] >= 0;
    duration = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
    std::cout << duration << "ms" << sp << sum1 << nl;
    timer.start ( );
    int sum2 = 0;
    for ( vtree::nid const id : tree.descendants ( ids.front ( ) ) )
        sum2 += tree[ id ] >= 0;
    duration = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
    std::cout << duration << "ms" << sp << sum2 << nl;
    timer.start ( );
    std::size_t wid, hei = tree.height ( ids.front ( ), std::addressof ( wid ) );
    duration = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
    std::cout << duration << "ms" << sp << hei << sp << wid << nl;
    timer.start ( );
    int hits = remove_nodes ( tree, ids, 1'000 );
    duration = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
    std::cout << duration << "ms" << sp << hits << sp << tree.size ( ) << nl;
}

int main ( ) {
    run ( "sequential tree lw", add_nodes_low_workload<Tree>, 4'000'001 );
    run ( "sequential tree hw", add_nodes_high_workload<Tree>, 400'001 );
    return EXIT_SUCCESS;
}
