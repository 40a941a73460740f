#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/content.hpp"
#include "internal/model/persistence_diagram.hpp"

namespace trajectory::db::codec {

/*
  Binary column encodings shared by the storage backends.

  All integers and floats are little-endian regardless of host order.

    vector   : float32 * n
    strings  : u32 count, then (u32 length, bytes) per string
    image    : u32 width, u32 height, u8 channels, raw pixels
    diagram  : u32 dimensions, then per dimension
               i32 dimension, u8 has_entropy, f64 entropy,
               u32 generators, (f64 birth, f64 death) per generator

  Decoders throw std::runtime_error on truncated or inconsistent input.
*/

using Bytes = std::vector<std::uint8_t>;

Bytes              EncodeVector(const std::vector<float>& vector);
std::vector<float> DecodeVector(const std::uint8_t* data, std::size_t size);

Bytes                    EncodeStrings(const std::vector<std::string>& strings);
std::vector<std::string> DecodeStrings(const std::uint8_t* data, std::size_t size);

Bytes        EncodeImage(const model::Image& image);
model::Image DecodeImage(const std::uint8_t* data, std::size_t size);

Bytes                                EncodeDiagram(const std::vector<model::DimensionDiagram>& dimensions);
std::vector<model::DimensionDiagram> DecodeDiagram(const std::uint8_t* data, std::size_t size);

} // namespace trajectory::db::codec
