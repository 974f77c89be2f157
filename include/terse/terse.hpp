#pragma once

// ============================================================================
// terse - compact binary encoding for C++20
// ============================================================================
//
// A concept-based encoding library with:
// - Dense, non-self-describing binary layout (fields in declaration order)
// - Optional string deduplication (string table + indices)
// - Optional varint encoding of fixed-width integers
// - Automatic encoding for types with an ADL fields() function
// - In-place decoding that reuses the target's storage
//
// Basic usage:
//
//   #include "terse/terse.hpp"
//
//   struct asset_t {
//       std::string path;
//       std::vector<std::string> tags;
//       std::optional<uint32_t> size;
//       int load_count = 0;   // runtime only
//   };
//
//   auto fields(asset_t& a) {
//       return std::make_tuple(
//           terse::field(a.path),
//           terse::field(a.tags),
//           terse::field(a.size),
//           terse::skip(a.load_count)
//       );
//   }
//   auto fields(const asset_t& a) {
//       return std::make_tuple(
//           terse::field(a.path),
//           terse::field(a.tags),
//           terse::field(a.size),
//           terse::skip(a.load_count)
//       );
//   }
//
//   // Buffer
//   auto bytes = terse::encode(asset, terse::mode::dedup());
//   auto copy = terse::decode<asset_t>(bytes, terse::mode::dedup());
//
//   // Stream
//   std::ofstream out("assets.bin", std::ios::binary);
//   terse::encode_to(out, assets);
//
//   std::ifstream in("assets.bin", std::ios::binary);
//   auto loaded = terse::decode_from<std::vector<asset_t>>(in);
//
// Decoding must use the mode the data was encoded with. Failures throw
// terse::error.
//
// ============================================================================

#include "codec.hpp"
#include "dedup.hpp"
#include "error.hpp"
#include "format.hpp"
#include "mode.hpp"
#include "protocol.hpp"
#include "sequence.hpp"
#include "sink.hpp"
#include "source.hpp"
#include "varint.hpp"
