#pragma once

#include <hostlink/protocol/Errors.hpp>
#include <hostlink/protocol/FrameCodec.hpp>
#include <hostlink/util/NonCopyable.hpp>

#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <utility>

namespace hostlink::protocol
{

/// 한 번의 교환(파일 1개, identity 1회)을 담당하는 payload 핸들러입니다.
///
/// 연결 상태머신은 다음 규약으로만 이 객체를 다룹니다.
/// - read()    : 다음 송신 바이트. 빈 결과는 "지금은 더 없음" (스트림 끝과 같지 않을 수 있음)
/// - receive() : 수신 payload 바이트를 도착 순서대로, 각 바이트를 정확히 한 번 전달
/// - complete(): 교환이 끝났을 때. 두 번째 호출부터는 아무 일도 하지 않음
/// - fail()    : 교환이 실패했을 때. complete()/fail() 중 먼저 호출된 쪽만 유효
///
/// 스레딩: 인스턴스는 한 번에 한 스레드(루프 스레드 또는 SimpleClient 스레드)만 다룹니다.
/// 리스너도 그 스레드에서 동기 호출됩니다.
class PayloadProtocol : private hostlink::util::NonCopyable
{
  public:
    using CompletionListener = std::function<void()>;
    using FailureListener = std::function<void(const TransferError &)>;

    virtual ~PayloadProtocol() = default;

    /// 레지스트리 등록 이름과 같은 content-protocol 값
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual Bytes read() = 0;
    virtual void receive(std::span<const std::uint8_t> data) = 0;

    /// 수신 단계가 끝난 뒤 응답을 보내야 하는지 여부
    [[nodiscard]] virtual bool hasResponse() const noexcept = 0;

    /// 자원을 해제하고 완료 리스너를 호출합니다. idempotent.
    ///
    /// 마무리 중 TransferError가 나면 failure 리스너에 알린 뒤 다시 던집니다.
    void complete();

    /// 자원을 해제하고 failure 리스너를 호출합니다. 이미 끝났으면 무시합니다.
    void fail(const TransferError &error) noexcept;

    [[nodiscard]] bool isFinished() const noexcept { return finished_; }
    [[nodiscard]] bool isCompleted() const noexcept { return finished_ && !failed_; }
    [[nodiscard]] bool isFailed() const noexcept { return failed_; }

    void setCompletionListener(CompletionListener listener) { onComplete_ = std::move(listener); }
    void setFailureListener(FailureListener listener) { onFailure_ = std::move(listener); }

  protected:
    PayloadProtocol() = default;

    /// complete() 최초 1회에만 호출됩니다.
    virtual void finish_() = 0;

    /// fail() 최초 1회에만 호출됩니다. 파일 핸들 등을 닫습니다.
    virtual void abort_() noexcept {}

  private:
    bool finished_{false};
    bool failed_{false};
    CompletionListener onComplete_;
    FailureListener onFailure_;

    void notifyFailure_(const TransferError &error) noexcept;
};

} // namespace hostlink::protocol
