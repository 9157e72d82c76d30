// Copyright (c) 2023 wolmibo
// SPDX-License-Identifier: MIT

#ifndef IMGSNIFF_UTILS_CAST_HPP_INCLUDED
#define IMGSNIFF_UTILS_CAST_HPP_INCLUDED

#include <cstddef>
#include <type_traits>



namespace imgsniff::utils {

template<typename T>
struct const_qualified_byte { using byte = std::byte; };

template<typename T> requires (std::is_const_v<T>)
struct const_qualified_byte<T> { using byte = const std::byte;};




// view a byte buffer through the byte type a C library expects
template<typename T> requires (sizeof(T) == 1)
[[nodiscard]] T* byte_pointer_cast(typename const_qualified_byte<T>::byte* ptr) {
  return reinterpret_cast<T*>(ptr); // NOLINT(*reinterpret-cast)
}

}

#endif // IMGSNIFF_UTILS_CAST_HPP_INCLUDED
