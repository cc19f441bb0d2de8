#pragma once

#include <functional>
#include <memory>
#include <stop_token>
#include <utility>

namespace a2a {

class CancellationToken;

using CancellationCallback = std::stop_callback<std::function<void()>>;

class CancellationSource {
public:
  CancellationSource() = default;

  [[nodiscard]] auto token() const noexcept -> CancellationToken;

  auto cancel() noexcept -> void {
    source_.request_stop();
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return source_.stop_requested();
  }

private:
  std::stop_source source_;
};

class CancellationToken {
public:
  CancellationToken() = default;

  explicit CancellationToken(std::stop_token token) noexcept
      : token_(std::move(token)) {
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return token_.stop_requested();
  }

  [[nodiscard]] explicit operator bool() const noexcept {
    return !is_cancelled();
  }

  [[nodiscard]] auto can_be_cancelled() const noexcept -> bool {
    return token_.stop_possible();
  }

  [[nodiscard]] auto stop_token() const noexcept -> const std::stop_token& {
    return token_;
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  std::stop_token token_;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{source_.get_token()};
}

// Runs fn once when token is cancelled (immediately if it already is).
// The callback is unregistered when the returned handle is destroyed.
[[nodiscard]] inline auto on_cancel(const CancellationToken& token,
                                    std::function<void()> fn)
    -> std::unique_ptr<CancellationCallback> {
  return std::make_unique<CancellationCallback>(token.stop_token(),
                                                std::move(fn));
}

// Cancels `source` when `token` is cancelled.
[[nodiscard]] inline auto link(const CancellationToken& token,
                               CancellationSource& source)
    -> std::unique_ptr<CancellationCallback> {
  return on_cancel(token, [&source] { source.cancel(); });
}

}  // namespace a2a
