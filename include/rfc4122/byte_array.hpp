#ifndef RFC4122_BYTE_ARRAY_HPP
#define RFC4122_BYTE_ARRAY_HPP

/*
 *
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 *
 */

#include "./internal/comparable.hpp"
#include "./types_fwd.hpp"

#include <algorithm>
#include <iterator>

/// @file
/// @copybrief rfc4122::byte_array

namespace rfc4122 {

/// Fixed-size array of bytes, the storage of a uuid.
///
/// Ordering is unsigned lexicographic over the bytes in index order.
template <size_t N> class byte_array : private internal::comparable<byte_array<N> > {
  public:
    ///@name Sequence container typedefs
    ///@{
    typedef uint8_t                                   value_type;
    typedef value_type*                               pointer;
    typedef const value_type*                         const_pointer;
    typedef value_type&                               reference;
    typedef const value_type&                         const_reference;
    typedef value_type*                               iterator;
    typedef const value_type*                         const_iterator;
    typedef std::size_t                               size_type;
    typedef std::ptrdiff_t                            difference_type;
    typedef std::reverse_iterator<iterator>           reverse_iterator;
    typedef std::reverse_iterator<const_iterator>     const_reverse_iterator;
    ///@}

    /// 0-initialized byte array
    byte_array() { std::fill(bytes_, bytes_+N, 0); }

    /// Every byte set to x
    explicit byte_array(value_type x) { std::fill(bytes_, bytes_+N, x); }

    /// Copy N bytes starting at p
    explicit byte_array(const value_type* p) { std::copy(p, p+N, bytes_); }

    /// Size of the array
    static size_t size() { return N; }

    ///@name Array operators
    ///@{
    value_type* begin() { return bytes_; }
    value_type* end() { return bytes_+N; }
    value_type& operator[](size_t i) { return bytes_[i]; }

    const value_type* begin() const { return bytes_; }
    const value_type* end() const { return bytes_+N; }
    const value_type& operator[](size_t i) const { return bytes_[i]; }
    ///@}

    /// Three-way unsigned comparison: -1, 0 or 1 from the first differing byte.
    static int compare(const byte_array& x, const byte_array& y) {
        for (size_t i = 0; i < N; ++i) {
            if (x.bytes_[i] != y.bytes_[i])
                return x.bytes_[i] < y.bytes_[i] ? -1 : 1;
        }
        return 0;
    }

  private:
    value_type bytes_[N];
};

} // rfc4122

#endif // RFC4122_BYTE_ARRAY_HPP
