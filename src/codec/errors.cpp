#include "ubj/codec/errors.hpp"

#include <string>

namespace ubj::codec {
namespace {

class ubj_encode_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "ubj.encode"; }

  std::string message(int ev) const override {
    switch (static_cast<encode_errc>(ev)) {
      case encode_errc::ok:
        return "ok";
      case encode_errc::unsupported_type:
        return "cannot encode value of this type";
      case encode_errc::invalid_key:
        return "mapping keys can only be strings";
      case encode_errc::invalid_text:
        return "string is not valid utf-8";
      case encode_errc::circular_reference:
        return "circular reference detected";
      case encode_errc::fallback_failed:
        return "fallback function failed";
      default:
        return "unknown ubj.encode error";
    }
  }
};

class ubj_decode_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "ubj.decode"; }

  std::string message(int ev) const override {
    switch (static_cast<decode_errc>(ev)) {
      case decode_errc::ok:
        return "ok";
      case decode_errc::no_input:
        return "no input";
      case decode_errc::insufficient_input:
        return "insufficient input";
      case decode_errc::invalid_marker:
        return "invalid marker";
      case decode_errc::invalid_container_marker:
        return "invalid marker within object/array";
      case decode_errc::integer_marker_expected:
        return "integer marker expected";
      case decode_errc::negative_length:
        return "negative count/length unexpected";
      case decode_errc::invalid_utf8:
        return "failed to decode utf-8";
      case decode_errc::invalid_decimal:
        return "failed to decode decimal";
      case decode_errc::invalid_container_type:
        return "invalid container type";
      case decode_errc::type_without_count:
        return "container type without count";
      case decode_errc::noop_in_typed_container:
        return "no-op marker not allowed in typed/counted container";
      case decode_errc::hook_failed:
        return "object hook failed";
      default:
        return "unknown ubj.decode error";
    }
  }
};

}  // namespace

const std::error_category& encode_category() noexcept {
  static ubj_encode_error_category category;
  return category;
}

const std::error_category& decode_category() noexcept {
  static ubj_decode_error_category category;
  return category;
}

std::error_code make_error_code(encode_errc e) noexcept {
  return {static_cast<int>(e), encode_category()};
}

std::error_code make_error_code(decode_errc e) noexcept {
  return {static_cast<int>(e), decode_category()};
}

}  // namespace ubj::codec
