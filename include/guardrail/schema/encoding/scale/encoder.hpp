#pragma once
#include <guardrail/common/critical.hpp>
#include <guardrail/schema/encoding/encoder.hpp>
#include <guardrail/schema/encoding/scale/audit_entry.hpp>
#include <guardrail/schema/encoding/scale/compliance_record.hpp>
#include <guardrail/schema/encoding/scale/operation_type.hpp>
#include <iterator>
#include <optional>
#include <utility>
#include <scale/scale.hpp>

namespace guardrail::schema::encoding {

struct scale_encoder_tag {};

// Codec failures on encode are fatal. On decode, `decode` is for bytes this
// process wrote itself and `try_decode` for anything else.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  guardrail::schema::bytes_t encode(const T& obj) {
    auto out = guardrail::schema::bytes_t{};
    encode(obj, out);
    return out;
  }

  template <typename T>
  void encode(const T& obj, guardrail::schema::bytes_t& out) {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      guardrail::common::critical("failed to encode SCALE object",
                                  encoded.error().message());
    }
    if (out.empty()) {
      out = std::move(encoded.value());
      return;
    }
    out.insert(std::end(out), std::begin(encoded.value()),
               std::end(encoded.value()));
  }

  template <typename T>
  T decode(const guardrail::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      guardrail::common::critical("failed to decode SCALE bytes",
                                  decoded.error().message());
    }
    return std::move(decoded.value());
  }

  template <typename T>
  std::optional<T> try_decode(const guardrail::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }
};

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace guardrail::schema::encoding
