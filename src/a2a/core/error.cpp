#include "a2a/core/error.hpp"

namespace a2a {

namespace {

class A2AErrorCategory final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "a2a";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<Error>(ev)) {
      case Error::Success: return "success";
      case Error::FileNotFound: return "file not found";
      case Error::ParseError: return "parse error";
      case Error::InvalidArgument: return "invalid argument";
      case Error::Timeout: return "timed out";
      case Error::Cancelled: return "cancelled";
      case Error::ConnectionFailed: return "connection failed";
      case Error::ConnectionClosed: return "connection closed";
      case Error::ProtocolError: return "protocol error";
      case Error::Unknown: break;
    }
    return "unknown error";
  }
};

}  // namespace

auto error_category() noexcept -> const std::error_category& {
  static const A2AErrorCategory instance;
  return instance;
}

}  // namespace a2a
