#pragma once

#include <cstddef>
#include <cstdint>


namespace cd
{

//
// Primitives
//

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// signed size type
// conversion from std:: container sizes happens at the storage boundary
using isize = i64;

//
// Normalization
//

struct normalizer_info;
struct case_fold_normalizer;
struct ascii_normalizer;

template <class K>
struct key_traits;

//
// Storage and type identity
//

struct base_kind_info;
struct type_descriptor;

struct hashed_base;
struct ordered_base;

template <class K, class V, class NK>
struct entry;

template <class NK, class E>
struct hashed_storage;
template <class NK, class E>
struct ordered_storage;

//
// Mappings
//

template <class K, class V, class Base, class Normalizer>
struct basic_dicti;

} // namespace cd
