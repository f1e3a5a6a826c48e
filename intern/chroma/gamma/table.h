/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <utility>

#include "util/array.h"
#include "util/log.h"
#include "util/types.h"

CHROMA_NAMESPACE_BEGIN

/* Table Storage
 *
 * Lookup tables are templated over their storage, which is anything with
 * contiguous `data()` and `size()`: an owned `array` built at run time, a
 * `std::array` constant written by the code generator, or one of the
 * borrowing types below. Borrows must not outlive the table they point to. */

/* Borrow of a whole table, keeps its storage type. */
template<typename Table> class LutRef {
 public:
  constexpr explicit LutRef(const Table &table) : table_(&table) {}

  constexpr auto data() const
  {
    return table_->data();
  }

  constexpr size_t size() const
  {
    return table_->size();
  }

 private:
  const Table *table_;
};

/* Borrow of contiguous values, independent of the storage they came from. */
template<typename T> class LutSlice {
 public:
  constexpr LutSlice(const T *data, const size_t size) : data_(data), size_(size) {}

  constexpr const T *data() const
  {
    return data_;
  }

  constexpr size_t size() const
  {
    return size_;
  }

 private:
  const T *data_;
  size_t size_;
};

/* Lookup Table
 *
 * Direct table from an encoded integer to a value, used for decoding. The
 * table has one value per encoded integer: 256 entries for 8 bit and 65536
 * for 16 bit. */
template<typename V, typename Table = array<V>> class Lut {
 public:
  using value_type = V;

  constexpr explicit Lut(Table table) : table_(std::move(table)) {}

  const V &lookup(const uint8_t index) const
  {
    DCHECK_LT(size_t(index), size());
    return data()[index];
  }

  const V &lookup(const uint16_t index) const
  {
    DCHECK_LT(size_t(index), size());
    return data()[index];
  }

  Lut<V, LutRef<Table>> get_ref() const
  {
    return Lut<V, LutRef<Table>>(LutRef<Table>(table_));
  }

  Lut<V, LutSlice<V>> get_slice() const
  {
    return Lut<V, LutSlice<V>>(LutSlice<V>(data(), size()));
  }

  const V *data() const
  {
    return table_.data();
  }

  size_t size() const
  {
    return table_.size();
  }

  const Table &table() const
  {
    return table_;
  }

 private:
  Table table_;
};

CHROMA_NAMESPACE_END
