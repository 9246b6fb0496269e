
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

#include <cstddef>
#include <cstdint>

#if VTREE_USE_IO
#    include <iostream>
#endif

#include <functional>
#include <limits>
#include <type_traits>

namespace vtree {

// A (slot, generation) pair. Only meaningful to the arena (or tree) that issued it.
struct nid {

    std::size_t slot;
    std::uint64_t generation;

    constexpr nid ( ) noexcept : slot{ invalid_slot_v }, generation{ 0 } {}
    constexpr nid ( std::size_t slot_, std::uint64_t generation_ ) noexcept : slot{ slot_ }, generation{ generation_ } {}

    [[nodiscard]] constexpr bool operator== ( nid const rhs_ ) const noexcept {
        return slot == rhs_.slot and generation == rhs_.generation;
    }
    [[nodiscard]] constexpr bool operator!= ( nid const rhs_ ) const noexcept { return not operator== ( rhs_ ); }

    [[nodiscard]] constexpr bool is_valid ( ) const noexcept { return invalid_slot_v != slot; }
    [[nodiscard]] constexpr bool is_invalid ( ) const noexcept { return not is_valid ( ); }

#if VTREE_USE_IO
    template<typename Stream>
    [[maybe_unused]] friend Stream & operator<< ( Stream & out_, nid const id_ ) noexcept {
        if ( id_.is_invalid ( ) ) {
            if constexpr ( std::is_same<typename Stream::char_type, wchar_t>::value ) {
                out_ << L'*';
            }
            else {
                out_ << '*';
            }
        }
        else {
            if constexpr ( std::is_same<typename Stream::char_type, wchar_t>::value ) {
                out_ << id_.slot << L':' << id_.generation;
            }
            else {
                out_ << id_.slot << ':' << id_.generation;
            }
        }
        return out_;
    }
#endif

    static constexpr std::size_t invalid_slot_v = std::numeric_limits<std::size_t>::max ( );

    static const nid invalid;
};

inline constexpr nid nid::invalid = nid{ };

} // namespace vtree

namespace std {
template<>
struct hash<vtree::nid> {
    [[nodiscard]] std::size_t operator( ) ( vtree::nid const id_ ) const noexcept {
        constexpr std::size_t golden_v = sizeof ( std::size_t ) >= 8 ? static_cast<std::size_t> ( 0x9e3779b97f4a7c15ull ) : 0x9e3779b9u;
        std::size_t const h            = std::hash<std::uint64_t>{ }( id_.generation );
        return std::hash<std::size_t>{ }( id_.slot ) ^ ( h + golden_v + ( h << 6 ) + ( h >> 2 ) );
    }
};
} // namespace std
