/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <cstring>
#include <new>

#include "util/aligned_malloc.h"
#include "util/log.h"
#include "util/vector.h"

CHROMA_NAMESPACE_BEGIN

/* Fixed size aligned heap array, the storage of tables built at run time.
 *
 * Unlike vector it does not clear memory on allocation and does not run
 * constructors, the builder writes every element. Only trivially copyable
 * element types are supported. */

template<typename T, const size_t alignment = MIN_ALIGNMENT_LUT_TABLE> class array {
 public:
  using value_type = T;

  array() : data_(nullptr), datasize_(0) {}

  explicit array(const size_t newsize)
  {
    data_ = mem_allocate(newsize);
    datasize_ = newsize;
  }

  explicit array(const vector<T> &from)
  {
    data_ = mem_allocate(from.size());
    datasize_ = from.size();
    if (datasize_ > 0) {
      mem_copy(data_, from.data(), datasize_);
    }
  }

  array(const array &from)
  {
    data_ = mem_allocate(from.datasize_);
    datasize_ = from.datasize_;
    if (datasize_ > 0) {
      mem_copy(data_, from.data_, datasize_);
    }
  }

  array(array &&from) noexcept
  {
    data_ = from.data_;
    datasize_ = from.datasize_;

    from.data_ = nullptr;
    from.datasize_ = 0;
  }

  array &operator=(const array &from)
  {
    if (this != &from) {
      array copy(from);
      swap(copy);
    }
    return *this;
  }

  array &operator=(array &&from) noexcept
  {
    if (this != &from) {
      clear();
      swap(from);
    }
    return *this;
  }

  ~array()
  {
    mem_free(data_);
  }

  bool operator==(const array &other) const
  {
    if (datasize_ != other.datasize_) {
      return false;
    }
    if (datasize_ == 0) {
      return true;
    }

    return memcmp(data_, other.data_, datasize_ * sizeof(T)) == 0;
  }

  bool operator!=(const array &other) const
  {
    return !(*this == other);
  }

  void swap(array &other) noexcept
  {
    T *data = data_;
    const size_t datasize = datasize_;
    data_ = other.data_;
    datasize_ = other.datasize_;
    other.data_ = data;
    other.datasize_ = datasize;
  }

  void clear()
  {
    mem_free(data_);
    data_ = nullptr;
    datasize_ = 0;
  }

  bool empty() const
  {
    return datasize_ == 0;
  }

  size_t size() const
  {
    return datasize_;
  }

  T *data()
  {
    return data_;
  }

  const T *data() const
  {
    return data_;
  }

  T &operator[](size_t i)
  {
    DCHECK_LT(i, datasize_);
    return data_[i];
  }

  const T &operator[](size_t i) const
  {
    DCHECK_LT(i, datasize_);
    return data_[i];
  }

  T *begin()
  {
    return data_;
  }

  const T *begin() const
  {
    return data_;
  }

  T *end()
  {
    return data_ + datasize_;
  }

  const T *end() const
  {
    return data_ + datasize_;
  }

 protected:
  T *mem_allocate(const size_t N)
  {
    if (N == 0) {
      return nullptr;
    }
    T *mem = (T *)util_aligned_malloc(sizeof(T) * N, alignment);
    if (mem == nullptr) {
      throw std::bad_alloc();
    }
    return mem;
  }

  void mem_free(T *mem)
  {
    if (mem != nullptr) {
      util_aligned_free(mem);
    }
  }

  void mem_copy(T *mem_to, const T *mem_from, const size_t N)
  {
    memcpy((void *)mem_to, mem_from, sizeof(T) * N);
  }

  T *data_;
  size_t datasize_;
};

CHROMA_NAMESPACE_END
