#pragma once

namespace hostlink::util {

/// 복사를 금지하는 베이스 클래스입니다.
///
/// - 소켓/epoll fd/파일 핸들처럼 "소유자가 정확히 하나"여야 하는 타입이 상속합니다.
/// - 이동은 기본 허용이며, 필요하면 파생 클래스에서 삭제합니다.
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &) = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&) = default;
    NonCopyable &operator=(NonCopyable &&) = default;
};

} // namespace hostlink::util
