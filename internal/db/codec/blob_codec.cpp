#include "internal/db/codec/blob_codec.hpp"

#include <bit>
#include <stdexcept>

namespace trajectory::db::codec {
namespace {

class Writer {
 public:
  void U8(std::uint8_t v) {
    out_.push_back(v);
  }
  void U32(std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
  }
  void U64(std::uint64_t v) {
    for (int i = 0; i < 8; ++i) out_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
  }
  void F32(float v) {
    U32(std::bit_cast<std::uint32_t>(v));
  }
  void F64(double v) {
    U64(std::bit_cast<std::uint64_t>(v));
  }
  void Raw(const std::uint8_t* data, std::size_t size) {
    out_.insert(out_.end(), data, data + size);
  }

  Bytes Take() {
    return std::move(out_);
  }

 private:
  Bytes out_;
};

class Reader {
 public:
  Reader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {
  }

  std::uint8_t U8() {
    Need(1);
    return data_[pos_++];
  }
  std::uint32_t U32() {
    Need(4);
    std::uint32_t v = 0;
    for (int i = 0; i < 4; ++i) v |= static_cast<std::uint32_t>(data_[pos_++]) << (8 * i);
    return v;
  }
  std::uint64_t U64() {
    Need(8);
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v |= static_cast<std::uint64_t>(data_[pos_++]) << (8 * i);
    return v;
  }
  float F32() {
    return std::bit_cast<float>(U32());
  }
  double F64() {
    return std::bit_cast<double>(U64());
  }
  const std::uint8_t* Raw(std::size_t size) {
    Need(size);
    const auto* p = data_ + pos_;
    pos_ += size;
    return p;
  }

  std::size_t remaining() const {
    return size_ - pos_;
  }

  void ExpectEnd() const {
    if (pos_ != size_) {
      throw std::runtime_error("trailing bytes in blob");
    }
  }

 private:
  void Need(std::size_t n) const {
    if (size_ - pos_ < n) {
      throw std::runtime_error("truncated blob");
    }
  }

  const std::uint8_t* data_;
  std::size_t         size_;
  std::size_t         pos_ = 0;
};

} // namespace

Bytes EncodeVector(const std::vector<float>& vector) {
  Writer w;
  for (float v : vector) w.F32(v);
  return w.Take();
}

std::vector<float> DecodeVector(const std::uint8_t* data, std::size_t size) {
  if (size % 4 != 0) {
    throw std::runtime_error("vector blob size is not a multiple of 4");
  }
  Reader             r(data, size);
  std::vector<float> vector(size / 4);
  for (auto& v : vector) v = r.F32();
  return vector;
}

Bytes EncodeStrings(const std::vector<std::string>& strings) {
  Writer w;
  w.U32(static_cast<std::uint32_t>(strings.size()));
  for (const auto& s : strings) {
    w.U32(static_cast<std::uint32_t>(s.size()));
    w.Raw(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
  }
  return w.Take();
}

std::vector<std::string> DecodeStrings(const std::uint8_t* data, std::size_t size) {
  Reader                   r(data, size);
  const auto               count = r.U32();
  std::vector<std::string> strings;
  for (std::uint32_t i = 0; i < count; ++i) {
    const auto  length = r.U32();
    const auto* bytes  = r.Raw(length);
    strings.emplace_back(reinterpret_cast<const char*>(bytes), length);
  }
  r.ExpectEnd();
  return strings;
}

Bytes EncodeImage(const model::Image& image) {
  Writer w;
  w.U32(image.width);
  w.U32(image.height);
  w.U8(image.channels);
  w.Raw(image.pixels.data(), image.pixels.size());
  return w.Take();
}

model::Image DecodeImage(const std::uint8_t* data, std::size_t size) {
  Reader       r(data, size);
  model::Image image;
  image.width    = r.U32();
  image.height   = r.U32();
  image.channels = r.U8();

  const auto expected = static_cast<std::size_t>(image.width) * image.height * image.channels;
  if (r.remaining() != expected) {
    throw std::runtime_error("image blob pixel count mismatch");
  }
  const auto* pixels = r.Raw(expected);
  image.pixels.assign(pixels, pixels + expected);
  return image;
}

Bytes EncodeDiagram(const std::vector<model::DimensionDiagram>& dimensions) {
  Writer w;
  w.U32(static_cast<std::uint32_t>(dimensions.size()));
  for (const auto& d : dimensions) {
    w.U32(static_cast<std::uint32_t>(d.dimension));
    w.U8(d.entropy.has_value() ? 1 : 0);
    w.F64(d.entropy.value_or(0.0));
    w.U32(static_cast<std::uint32_t>(d.generators.size()));
    for (const auto& g : d.generators) {
      w.F64(g.birth);
      w.F64(g.death);
    }
  }
  return w.Take();
}

std::vector<model::DimensionDiagram> DecodeDiagram(const std::uint8_t* data, std::size_t size) {
  Reader     r(data, size);
  const auto count = r.U32();

  std::vector<model::DimensionDiagram> dimensions;
  for (std::uint32_t i = 0; i < count; ++i) {
    model::DimensionDiagram d;
    d.dimension             = static_cast<std::int32_t>(r.U32());
    const bool has_entropy  = r.U8() != 0;
    const double entropy    = r.F64();
    if (has_entropy) d.entropy = entropy;

    const auto generators = r.U32();
    for (std::uint32_t g = 0; g < generators; ++g) {
      model::Generator generator;
      generator.birth = r.F64();
      generator.death = r.F64();
      d.generators.push_back(generator);
    }
    dimensions.push_back(std::move(d));
  }
  r.ExpectEnd();
  return dimensions;
}

} // namespace trajectory::db::codec
