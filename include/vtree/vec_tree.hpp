
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

#pragma once

#ifndef VTREE_USE_IO
#    define VTREE_USE_IO true
#endif

#include <cassert>
#include <cstddef>
#include <cstdint>

#if VTREE_USE_IO
#    include <iostream>
#endif

#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#if ( defined( __clang__ ) or defined( __GNUC__ ) ) and not defined( _MSC_VER )
#    include <deque>
#else
#    include <boost/container/deque.hpp>
#endif

#include <tbb/tbb_allocator.h>

#include "generational_arena.hpp"
#include "nid.hpp"

namespace vtree {

namespace detail {

using id_vector = std::vector<nid, tbb::tbb_allocator<nid>>;

#if ( defined( __clang__ ) or defined( __GNUC__ ) ) and not defined( _MSC_VER )
using id_deque = std::deque<std::pair<nid, int>, tbb::tbb_allocator<std::pair<nid, int>>>;
#else
using id_deque = boost::container::deque<std::pair<nid, int>, tbb::tbb_allocator<std::pair<nid, int>>>;
#endif

// De-queue.
[[nodiscard]] inline std::pair<nid, int> de ( id_deque & deq_ ) noexcept {
    assert ( deq_.size ( ) );
    std::pair<nid, int> v = deq_.front ( );
    deq_.pop_front ( );
    return v;
}

// En-queue.
[[maybe_unused]] inline void en ( id_deque & deq_, nid const id_, int const depth_ ) { deq_.emplace_back ( id_, depth_ ); }

inline constexpr std::size_t default_capacity = 4;

// Hooks.

struct vec_tree_hook {
    nid up, prev, next, head, tail;
    int fan = 0; // Number of children.

#if VTREE_USE_IO
    template<typename Stream>
    [[maybe_unused]] friend Stream & operator<< ( Stream & out_, vec_tree_hook const & hook_ ) noexcept {
        if constexpr ( std::is_same<typename Stream::char_type, wchar_t>::value ) {
            out_ << L'<' << hook_.up << L' ' << hook_.prev << L' ' << hook_.next << L' ' << hook_.head << L' ' << hook_.tail
                 << L' ' << hook_.fan << L'>';
        }
        else {
            out_ << '<' << hook_.up << ' ' << hook_.prev << ' ' << hook_.next << ' ' << hook_.head << ' ' << hook_.tail << ' '
                 << hook_.fan << '>';
        }
        return out_;
    }
#endif
};

template<typename ValueType>
struct vec_tree_node : public vec_tree_hook {
    ValueType data;
};

enum class edge_kind : char { start, end };

// A step of the depth-first walk. Start edges come before a node's descendants, end edges after.
struct node_edge {
    edge_kind kind;
    nid node;
    int depth;

    [[nodiscard]] bool operator== ( node_edge const & rhs_ ) const noexcept {
        return kind == rhs_.kind and node == rhs_.node and depth == rhs_.depth;
    }
    [[nodiscard]] bool operator!= ( node_edge const & rhs_ ) const noexcept { return not operator== ( rhs_ ); }
};

// Follows one link of the hook from node to node. A default constructed iterator is the end.
template<typename Tree, nid vec_tree_hook::*Link>
class link_iterator {
    Tree const * tree = nullptr;
    nid node;

    public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = nid;
    using difference_type   = std::ptrdiff_t;
    using pointer           = nid const *;
    using reference         = nid;

    link_iterator ( ) noexcept = default;
    link_iterator ( Tree const & tree_, nid nid_ ) noexcept : tree{ std::addressof ( tree_ ) }, node{ nid_ } {}

    [[maybe_unused]] link_iterator & operator++ ( ) noexcept {
        if ( vec_tree_hook const * h = tree->hook ( node ); h )
            node = h->*Link;
        else
            node = nid::invalid;
        return *this;
    }
    [[maybe_unused]] link_iterator operator++ ( int ) noexcept {
        link_iterator tmp = *this;
        ++*this;
        return tmp;
    }
    [[nodiscard]] reference operator* ( ) const noexcept { return node; }
    [[nodiscard]] bool operator== ( link_iterator const & rhs_ ) const noexcept { return node == rhs_.node; }
    [[nodiscard]] bool operator!= ( link_iterator const & rhs_ ) const noexcept { return node != rhs_.node; }
    [[nodiscard]] bool is_valid ( ) const noexcept { return node.is_valid ( ); }
    [[nodiscard]] nid id ( ) const noexcept { return node; }
};

// Pre-order depth-first walk over start and end edges, bounded by the node it started from.
template<typename Tree>
class traverse_iterator {
    Tree const * tree = nullptr;
    nid root;
    std::optional<node_edge> next;

    public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = node_edge;
    using difference_type   = std::ptrdiff_t;
    using pointer           = node_edge const *;
    using reference         = node_edge const &;

    traverse_iterator ( ) noexcept = default;
    traverse_iterator ( Tree const & tree_, nid nid_ ) noexcept : tree{ std::addressof ( tree_ ) }, root{ nid_ } {
        if ( tree->contains ( root ) )
            next = node_edge{ edge_kind::start, root, 0 };
    }

    [[maybe_unused]] traverse_iterator & operator++ ( ) noexcept {
        next = successor ( *next );
        return *this;
    }
    [[maybe_unused]] traverse_iterator operator++ ( int ) noexcept {
        traverse_iterator tmp = *this;
        ++*this;
        return tmp;
    }
    [[nodiscard]] reference operator* ( ) const noexcept { return *next; }
    [[nodiscard]] pointer operator-> ( ) const noexcept { return std::addressof ( *next ); }
    [[nodiscard]] bool operator== ( traverse_iterator const & rhs_ ) const noexcept { return next == rhs_.next; }
    [[nodiscard]] bool operator!= ( traverse_iterator const & rhs_ ) const noexcept { return not operator== ( rhs_ ); }
    [[nodiscard]] bool is_valid ( ) const noexcept { return next.has_value ( ); }
    [[nodiscard]] nid id ( ) const noexcept { return next ? next->node : nid::invalid; }

    private:
    // A link that has gone missing (the tree was modified while walking it) ends the walk.
    [[nodiscard]] std::optional<node_edge> successor ( node_edge const & edge_ ) const noexcept {
        vec_tree_hook const * h = tree->hook ( edge_.node );
        if ( not h )
            return std::nullopt;
        if ( edge_kind::start == edge_.kind ) {
            if ( h->head.is_valid ( ) )
                return node_edge{ edge_kind::start, h->head, edge_.depth + 1 };
            return node_edge{ edge_kind::end, edge_.node, edge_.depth };
        }
        if ( edge_.node == root )
            return std::nullopt;
        if ( h->next.is_valid ( ) )
            return node_edge{ edge_kind::start, h->next, edge_.depth };
        if ( h->up.is_valid ( ) )
            return node_edge{ edge_kind::end, h->up, edge_.depth - 1 };
        return std::nullopt;
    }
};

struct project_id {
    [[nodiscard]] nid operator( ) ( node_edge const & edge_ ) const noexcept { return edge_.node; }
};

struct project_id_depth {
    [[nodiscard]] std::pair<nid, int> operator( ) ( node_edge const & edge_ ) const noexcept { return { edge_.node, edge_.depth }; }
};

// The start edges of a traverse_iterator, projected.
template<typename Tree, typename Projection>
class descendants_iterator {
    traverse_iterator<Tree> it;

    public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = std::invoke_result_t<Projection, node_edge const &>;
    using difference_type   = std::ptrdiff_t;
    using pointer           = value_type const *;
    using reference         = value_type;

    descendants_iterator ( ) noexcept = default;
    descendants_iterator ( Tree const & tree_, nid nid_ ) noexcept : it{ tree_, nid_ } {}

    [[maybe_unused]] descendants_iterator & operator++ ( ) noexcept {
        do
            ++it;
        while ( it.is_valid ( ) and edge_kind::end == it->kind );
        return *this;
    }
    [[maybe_unused]] descendants_iterator operator++ ( int ) noexcept {
        descendants_iterator tmp = *this;
        ++*this;
        return tmp;
    }
    [[nodiscard]] reference operator* ( ) const noexcept { return Projection{ }( *it ); }
    [[nodiscard]] bool operator== ( descendants_iterator const & rhs_ ) const noexcept { return it == rhs_.it; }
    [[nodiscard]] bool operator!= ( descendants_iterator const & rhs_ ) const noexcept { return it != rhs_.it; }
    [[nodiscard]] bool is_valid ( ) const noexcept { return it.is_valid ( ); }
    [[nodiscard]] nid id ( ) const noexcept { return it.id ( ); }
    [[nodiscard]] int depth ( ) const noexcept { return it->depth; }
};

// Level order, starting with the node itself. Note: breadth_iterator is a (rather) heavy object.
template<typename Tree>
class breadth_iterator {
    Tree const * tree = nullptr;
    id_deque queue;
    nid node;
    int level = 0;

    public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = nid;
    using difference_type   = std::ptrdiff_t;
    using pointer           = nid const *;
    using reference         = nid;

    breadth_iterator ( ) = default;
    breadth_iterator ( Tree const & tree_, nid nid_ ) : tree{ std::addressof ( tree_ ) } {
        if ( tree->contains ( nid_ ) )
            node = nid_;
    }

    [[maybe_unused]] breadth_iterator & operator++ ( ) {
        if ( vec_tree_hook const * h = tree->hook ( node ); h ) {
            for ( nid child = h->head; child.is_valid ( ); ) {
                en ( queue, child, level + 1 );
                vec_tree_hook const * c = tree->hook ( child );
                child                   = c ? c->next : nid::invalid;
            }
        }
        if ( queue.size ( ) ) {
            std::tie ( node, level ) = de ( queue );
        }
        else {
            node  = nid::invalid;
            level = 0;
        }
        return *this;
    }
    [[nodiscard]] reference operator* ( ) const noexcept { return node; }
    [[nodiscard]] bool operator== ( breadth_iterator const & rhs_ ) const noexcept { return node == rhs_.node; }
    [[nodiscard]] bool operator!= ( breadth_iterator const & rhs_ ) const noexcept { return node != rhs_.node; }
    [[nodiscard]] bool is_valid ( ) const noexcept { return node.is_valid ( ); }
    [[nodiscard]] nid id ( ) const noexcept { return node; }
    [[nodiscard]] int depth ( ) const noexcept { return level; }
};

// Restartable: every call to begin ( ) walks from the start again.
template<typename Iterator>
class node_range {
    Iterator first;

    public:
    using iterator = Iterator;

    explicit node_range ( Iterator first_ ) : first{ std::move ( first_ ) } {}

    [[nodiscard]] Iterator begin ( ) const { return first; }
    [[nodiscard]] Iterator end ( ) const { return Iterator{ }; }
    [[nodiscard]] bool empty ( ) const noexcept { return not first.is_valid ( ); }
};

template<typename ValueType, bool RootAware>
class vec_tree_base {

    public:
    using is_root_aware = std::integral_constant<bool, RootAware>;

    using value_type      = ValueType;
    using node_type       = vec_tree_node<value_type>;
    using hook_type       = vec_tree_hook;
    using size_type       = std::size_t;
    using reference       = value_type &;
    using const_reference = value_type const &;
    using pointer         = value_type *;
    using const_pointer   = value_type const *;

    using children_range               = node_range<link_iterator<vec_tree_base, &hook_type::next>>;
    using preceding_siblings_range     = node_range<link_iterator<vec_tree_base, &hook_type::prev>>;
    using following_siblings_range     = node_range<link_iterator<vec_tree_base, &hook_type::next>>;
    using ancestors_range              = node_range<link_iterator<vec_tree_base, &hook_type::up>>;
    using traverse_range               = node_range<traverse_iterator<vec_tree_base>>;
    using descendants_range            = node_range<descendants_iterator<vec_tree_base, project_id>>;
    using descendants_with_depth_range = node_range<descendants_iterator<vec_tree_base, project_id_depth>>;
    using breadth_first_range          = node_range<breadth_iterator<vec_tree_base>>;

    vec_tree_base ( ) : vec_tree_base ( default_capacity ) {}
    explicit vec_tree_base ( size_type capacity_ ) : nodes{ capacity_ } {}

    [[nodiscard]] static vec_tree_base with_capacity ( size_type capacity_ ) { return vec_tree_base ( capacity_ ); }

    void reserve ( size_type additional_ ) { nodes.reserve ( additional_ ); }
    [[nodiscard]] size_type capacity ( ) const noexcept { return nodes.capacity ( ); }
    [[nodiscard]] size_type size ( ) const noexcept { return nodes.size ( ); }
    [[nodiscard]] bool empty ( ) const noexcept { return nodes.empty ( ); }

    // Drops every node, keeps the allocation. All ids handed out so far become stale.
    void clear ( ) noexcept {
        nodes.clear ( );
        root_id = nid::invalid;
    }

    // Add a node without a parent.
    [[maybe_unused]] nid insert ( value_type data_ ) { return nodes.insert ( make_node ( std::move ( data_ ) ) ); }
    // Add a node as the last child of pid_.
    [[maybe_unused]] nid insert ( value_type data_, nid pid_ ) {
        require_live ( pid_ );
        nid const cid = nodes.insert ( make_node ( std::move ( data_ ) ) );
        link_last ( pid_, cid );
        return cid;
    }

    // As insert, without allocating. On failure the data is handed back, reserve ( ) and retry.
    [[nodiscard]] insert_result<value_type> try_insert ( value_type data_ ) { return try_create ( std::move ( data_ ) ); }
    [[nodiscard]] insert_result<value_type> try_insert ( value_type data_, nid pid_ ) {
        require_live ( pid_ );
        insert_result<value_type> r = try_create ( std::move ( data_ ) );
        if ( r )
            link_last ( pid_, r.value ( ) );
        return r;
    }

    template<typename This = is_root_aware>
    [[maybe_unused]] std::enable_if_t<This::value, nid> insert_root ( value_type data_ ) {
        require_no_root ( );
        root_id = nodes.insert ( make_node ( std::move ( data_ ) ) );
        return root_id;
    }
    template<typename This = is_root_aware>
    [[nodiscard]] std::enable_if_t<This::value, insert_result<value_type>> try_insert_root ( value_type data_ ) {
        require_no_root ( );
        insert_result<value_type> r = try_create ( std::move ( data_ ) );
        if ( r )
            root_id = r.value ( );
        return r;
    }
    template<typename This = is_root_aware>
    [[nodiscard]] std::enable_if_t<This::value, std::optional<nid>> root ( ) const noexcept {
        return as_optional ( root_id );
    }

    // Make cid_ (and its subtree) the last child of pid_, moving it if it is attached elsewhere. Fails without
    // changing anything if either id is stale, if pid_ == cid_, if pid_ lies in the subtree of cid_, or if cid_
    // is the root.
    [[maybe_unused]] bool append_child ( nid pid_, nid cid_ ) {
        if ( pid_ == cid_ or not contains ( pid_ ) or not contains ( cid_ ) )
            return false;
        if constexpr ( is_root_aware::value ) {
            if ( cid_ == root_id )
                return false;
        }
        for ( nid a = pid_; a.is_valid ( ); a = hook ( a )->up )
            if ( a == cid_ )
                return false;
        detach ( cid_ );
        link_last ( pid_, cid_ );
        return true;
    }

    // Unlink nid_ from its parent and siblings. Its own children stay with it.
    void detach ( nid nid_ ) noexcept {
        if ( node_type * n = nodes.get_mut ( nid_ ); n )
            unlink ( std::exchange ( n->up, nid::invalid ), std::exchange ( n->prev, nid::invalid ),
                     std::exchange ( n->next, nid::invalid ) );
    }

    // Remove nid_ and its whole subtree, returns the data of nid_.
    [[maybe_unused]] std::optional<value_type> remove ( nid nid_ ) {
        if ( not contains ( nid_ ) )
            return std::nullopt;
        // Collect first, nothing has changed if this throws.
        id_vector subtree;
        for ( descendants_iterator<vec_tree_base, project_id> it{ *this, nid_ }; ( ++it ).is_valid ( ); )
            subtree.push_back ( *it );
        node_type node = std::move ( *nodes.remove ( nid_ ) );
        unlink ( node.up, node.prev, node.next );
        for ( nid const id : subtree )
            nodes.remove ( id );
        if ( nid_ == root_id )
            root_id = nid::invalid;
        return std::optional<value_type>{ std::move ( node.data ) };
    }

    [[nodiscard]] bool contains ( nid nid_ ) const noexcept { return nodes.contains ( nid_ ); }

    [[nodiscard]] const_pointer get ( nid nid_ ) const noexcept {
        if ( node_type const * n = nodes.get ( nid_ ); n )
            return std::addressof ( n->data );
        return nullptr;
    }
    [[nodiscard]] pointer get_mut ( nid nid_ ) noexcept { return const_cast<pointer> ( std::as_const ( *this ).get ( nid_ ) ); }

    // Throw on a stale id.
    [[nodiscard]] const_reference at ( nid nid_ ) const { return nodes.at ( nid_ ).data; }
    [[nodiscard]] reference at ( nid nid_ ) { return nodes.at ( nid_ ).data; }
    [[nodiscard]] const_reference operator[] ( nid nid_ ) const { return at ( nid_ ); }
    [[nodiscard]] reference operator[] ( nid nid_ ) { return at ( nid_ ); }

    [[nodiscard]] hook_type const * hook ( nid nid_ ) const noexcept { return nodes.get ( nid_ ); }

    [[nodiscard]] std::optional<nid> parent ( nid nid_ ) const noexcept { return link ( nid_, &hook_type::up ); }
    [[nodiscard]] std::optional<nid> previous_sibling ( nid nid_ ) const noexcept { return link ( nid_, &hook_type::prev ); }
    [[nodiscard]] std::optional<nid> next_sibling ( nid nid_ ) const noexcept { return link ( nid_, &hook_type::next ); }
    [[nodiscard]] std::optional<nid> first_child ( nid nid_ ) const noexcept { return link ( nid_, &hook_type::head ); }
    [[nodiscard]] std::optional<nid> last_child ( nid nid_ ) const noexcept { return link ( nid_, &hook_type::tail ); }

    [[nodiscard]] int fan ( nid nid_ ) const noexcept {
        if ( hook_type const * h = hook ( nid_ ); h )
            return h->fan;
        return 0;
    }

    [[nodiscard]] children_range children ( nid nid_ ) const noexcept {
        hook_type const * h = hook ( nid_ );
        return children_range{ { *this, h ? h->head : nid::invalid } };
    }

    // The sequence starts with nid_ itself, skip the first element for the strictly preceding siblings.
    [[nodiscard]] preceding_siblings_range preceding_siblings ( nid nid_ ) const noexcept {
        return preceding_siblings_range{ { *this, live_or_invalid ( nid_ ) } };
    }
    // The sequence starts with nid_ itself, skip the first element for the strictly following siblings.
    [[nodiscard]] following_siblings_range following_siblings ( nid nid_ ) const noexcept {
        return following_siblings_range{ { *this, live_or_invalid ( nid_ ) } };
    }
    // The sequence starts with nid_ itself, skip the first element for the strict ancestors.
    [[nodiscard]] ancestors_range ancestors ( nid nid_ ) const noexcept { return ancestors_range{ { *this, live_or_invalid ( nid_ ) } }; }

    [[nodiscard]] traverse_range traverse ( nid nid_ ) const noexcept { return traverse_range{ { *this, nid_ } }; }
    // Pre-order, nid_ first (at depth 0).
    [[nodiscard]] descendants_range descendants ( nid nid_ ) const noexcept { return descendants_range{ { *this, nid_ } }; }
    [[nodiscard]] descendants_with_depth_range descendants_with_depth ( nid nid_ ) const noexcept {
        return descendants_with_depth_range{ { *this, nid_ } };
    }
    [[nodiscard]] breadth_first_range breadth_first ( nid nid_ ) const { return breadth_first_range{ { *this, nid_ } }; }

    // The (maximum) depth (or height) is the number of nodes along the longest path from the node down to the
    // farthest leaf node. It returns (optionally) the width_ through an out-pointer.
    [[nodiscard]] size_type height ( nid rid_, size_type * width_ = nullptr ) const {
        size_type max_width = 0, depth = 0;
        if ( contains ( rid_ ) ) {
            id_deque queue;
            en ( queue, rid_, 0 );
            size_type count = 1;
            while ( count ) {
                if ( count > max_width )
                    max_width = count;
                while ( count-- ) {
                    nid const parent = de ( queue ).first;
                    for ( nid child = hook ( parent )->head; child.is_valid ( ); child = hook ( child )->next )
                        en ( queue, child, 0 );
                }
                count = queue.size ( );
                depth += 1;
            }
        }
        if ( width_ )
            *width_ = max_width;
        return depth;
    }

#if VTREE_USE_IO
    // Indented outline of the subtree below (and including) nid_, one node per line.
    template<typename Stream>
    [[maybe_unused]] Stream & print ( Stream & out_, nid nid_ ) const {
        for ( auto const [ id, depth ] : descendants_with_depth ( nid_ ) ) {
            for ( int i = 0; i < depth; ++i )
                out_ << "  ";
            out_ << at ( id ) << '\n';
        }
        return out_;
    }
#endif

    private:
    [[nodiscard]] static node_type make_node ( value_type && data_ ) { return node_type{ hook_type{ }, std::move ( data_ ) }; }

    [[nodiscard]] static std::optional<nid> as_optional ( nid id_ ) noexcept {
        if ( id_.is_valid ( ) )
            return id_;
        return std::nullopt;
    }

    [[nodiscard]] nid live_or_invalid ( nid nid_ ) const noexcept { return contains ( nid_ ) ? nid_ : nid::invalid; }

    [[nodiscard]] std::optional<nid> link ( nid nid_, nid hook_type::*link_ ) const noexcept {
        if ( hook_type const * h = hook ( nid_ ); h )
            return as_optional ( h->*link_ );
        return std::nullopt;
    }

    // Only for ids known to be live.
    [[nodiscard]] node_type & node_at ( nid nid_ ) noexcept {
        node_type * n = nodes.get_mut ( nid_ );
        assert ( n );
        return *n;
    }

    void require_live ( nid nid_ ) const {
        if ( not contains ( nid_ ) )
            throw std::runtime_error ( "stale or foreign node id" );
    }

    void require_no_root ( ) const {
        if ( root_id.is_valid ( ) )
            throw std::logic_error ( "a root node already exists" );
    }

    [[nodiscard]] insert_result<value_type> try_create ( value_type && data_ ) {
        insert_result<node_type> r = nodes.try_insert ( make_node ( std::move ( data_ ) ) );
        if ( r )
            return insert_result<value_type>::success ( r.value ( ) );
        return insert_result<value_type>::failure ( std::move ( r.rejected ( ).data ) );
    }

    // pid_ and cid_ are live, distinct, and cid_ is unattached.
    void link_last ( nid pid_, nid cid_ ) {
        auto [ parent, child ] = nodes.get_pair_mut ( pid_, cid_ );
        assert ( parent and child );
        assert ( child->up.is_invalid ( ) and child->prev.is_invalid ( ) and child->next.is_invalid ( ) );
        child->up           = pid_;
        nid const last_child = std::exchange ( parent->tail, cid_ );
        if ( last_child.is_valid ( ) ) {
            child->prev = last_child;
            assert ( node_at ( last_child ).next.is_invalid ( ) );
            node_at ( last_child ).next = cid_;
        }
        else {
            assert ( parent->head.is_invalid ( ) );
            parent->head = cid_;
        }
        parent->fan += 1;
    }

    // Re-link the neighbours of a node that used to sit between prev_ and next_ below pid_.
    void unlink ( nid pid_, nid prev_, nid next_ ) noexcept {
        if ( next_.is_valid ( ) )
            node_at ( next_ ).prev = prev_;
        else if ( pid_.is_valid ( ) )
            node_at ( pid_ ).tail = prev_;
        if ( prev_.is_valid ( ) )
            node_at ( prev_ ).next = next_;
        else if ( pid_.is_valid ( ) )
            node_at ( pid_ ).head = next_;
        if ( pid_.is_valid ( ) )
            node_at ( pid_ ).fan -= 1;
    }

    generational_arena<node_type> nodes;
    nid root_id;
};

} // namespace detail

using edge_kind     = detail::edge_kind;
using node_edge     = detail::node_edge;
using vec_tree_hook = detail::vec_tree_hook;
template<typename ValueType>
using vec_tree = detail::vec_tree_base<ValueType, true>;
template<typename ValueType>
using vec_forest = detail::vec_tree_base<ValueType, false>;
} // namespace vtree
