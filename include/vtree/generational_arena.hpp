
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

#include <cassert>
#include <cstddef>
#include <cstdint>

#include <algorithm>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <tbb/tbb_allocator.h>

#include "nid.hpp"

namespace vtree {

// Outcome of a non-growing insertion: either the id of the new element, or the value that did not fit.
template<typename T>
class insert_result {

    public:
    [[nodiscard]] static insert_result success ( nid id_ ) noexcept { return insert_result{ id_ }; }
    [[nodiscard]] static insert_result failure ( T && rejected_ ) {
        insert_result r{ nid::invalid };
        r.m_rejected.emplace ( std::move ( rejected_ ) );
        return r;
    }

    [[nodiscard]] bool has_value ( ) const noexcept { return m_id.is_valid ( ); }
    [[nodiscard]] explicit operator bool ( ) const noexcept { return has_value ( ); }

    [[nodiscard]] nid value ( ) const {
        if ( not has_value ( ) )
            throw std::runtime_error ( "insertion failed, the container is at capacity" );
        return m_id;
    }

    [[nodiscard]] T & rejected ( ) {
        if ( has_value ( ) )
            throw std::runtime_error ( "insertion succeeded, there is no rejected value" );
        return *m_rejected;
    }

    private:
    explicit insert_result ( nid id_ ) noexcept : m_id{ id_ } {}

    nid m_id;
    std::optional<T> m_rejected;
};

// Slot storage with generation-checked ids. Removing an element bumps the arena generation, so an id issued
// before the removal never validates again, even after its slot has been recycled.
template<typename ValueType>
class generational_arena {

    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max ( );

    struct entry {
        std::optional<ValueType> value;
        std::uint64_t generation = 0;
        std::size_t next_free    = npos;
    };

    using data = std::vector<entry, tbb::tbb_allocator<entry>>;

    public:
    using value_type      = ValueType;
    using size_type       = std::size_t;
    using reference       = value_type &;
    using const_reference = value_type const &;
    using pointer         = value_type *;
    using const_pointer   = value_type const *;

    generational_arena ( ) = default;
    explicit generational_arena ( size_type capacity_ ) { reserve ( capacity_ ); }

    // Never allocates. Hands the value back if there is no free slot.
    [[nodiscard]] insert_result<value_type> try_insert ( value_type && value_ ) {
        if ( npos == m_free_head )
            return insert_result<value_type>::failure ( std::move ( value_ ) );
        size_type const slot = m_free_head;
        entry & e            = m_entries[ slot ];
        e.value.emplace ( std::move ( value_ ) );
        m_free_head  = std::exchange ( e.next_free, npos );
        e.generation = m_generation;
        m_size += 1;
        return insert_result<value_type>::success ( nid{ slot, e.generation } );
    }

    // Doubles the capacity when full.
    [[maybe_unused]] nid insert ( value_type && value_ ) {
        if ( npos == m_free_head )
            reserve ( std::max<size_type> ( capacity ( ), 1 ) );
        return try_insert ( std::move ( value_ ) ).value ( );
    }
    [[maybe_unused]] nid insert ( value_type const & value_ ) { return insert ( value_type{ value_ } ); }

    [[maybe_unused]] std::optional<value_type> remove ( nid id_ ) {
        if ( not contains ( id_ ) )
            return std::nullopt;
        entry & e = m_entries[ id_.slot ];
        std::optional<value_type> value{ std::move ( e.value ) };
        e.value.reset ( );
        e.next_free = std::exchange ( m_free_head, id_.slot );
        m_generation += 1;
        m_size -= 1;
        return value;
    }

    [[nodiscard]] bool contains ( nid id_ ) const noexcept { return nullptr != get ( id_ ); }

    [[nodiscard]] const_pointer get ( nid id_ ) const noexcept {
        if ( id_.slot >= m_entries.size ( ) )
            return nullptr;
        entry const & e = m_entries[ id_.slot ];
        if ( e.value and e.generation == id_.generation )
            return std::addressof ( *e.value );
        return nullptr;
    }
    [[nodiscard]] pointer get_mut ( nid id_ ) noexcept { return const_cast<pointer> ( std::as_const ( *this ).get ( id_ ) ); }

    // Two distinct slots at once. Either pointer is null if its id is stale.
    [[nodiscard]] std::pair<pointer, pointer> get_pair_mut ( nid a_, nid b_ ) {
        if ( a_.slot == b_.slot )
            throw std::invalid_argument ( "get_pair_mut requires two distinct slots" );
        return { get_mut ( a_ ), get_mut ( b_ ) };
    }

    [[nodiscard]] const_reference at ( nid id_ ) const {
        if ( const_pointer p = get ( id_ ); p )
            return *p;
        throw std::runtime_error ( "stale or foreign id" );
    }
    [[nodiscard]] reference at ( nid id_ ) { return const_cast<reference> ( std::as_const ( *this ).at ( id_ ) ); }

    [[nodiscard]] size_type size ( ) const noexcept { return m_size; }
    [[nodiscard]] bool empty ( ) const noexcept { return not m_size; }
    [[nodiscard]] size_type capacity ( ) const noexcept { return m_entries.size ( ); }

    // Adds additional_ free slots. Ids already handed out stay valid, they do not depend on addresses.
    void reserve ( size_type additional_ ) {
        if ( not additional_ )
            return;
        size_type const start = m_entries.size ( );
        size_type const end   = start + additional_;
        m_entries.resize ( end );
        for ( size_type i = start; i < end - 1; ++i )
            m_entries[ i ].next_free = i + 1;
        m_entries[ end - 1 ].next_free = m_free_head;
        m_free_head                    = start;
    }

    // Drops all values, keeps the slots.
    void clear ( ) noexcept {
        size_type const end = m_entries.size ( );
        for ( size_type i = 0; i < end; ++i ) {
            m_entries[ i ].value.reset ( );
            m_entries[ i ].next_free = i + 1 < end ? i + 1 : npos;
        }
        m_free_head = end ? 0 : npos;
        m_generation += 1;
        m_size = 0;
    }

    private:
    data m_entries;
    size_type m_free_head      = npos;
    size_type m_size           = 0;
    std::uint64_t m_generation = 0;
};

} // namespace vtree
