#include <hostlink/protocol/PayloadProtocol.hpp>

#include <hostlink/core/Logger.hpp>

#include <exception>
#include <string>

namespace hostlink::protocol
{

void PayloadProtocol::complete()
{
    if (finished_)
    {
        return;
    }
    finished_ = true;

    try
    {
        finish_();
    }
    catch (const TransferError &e)
    {
        failed_ = true;
        abort_();
        notifyFailure_(e);
        throw;
    }
    catch (const std::exception &e)
    {
        // listener 등에서 올라온 일반 예외도 실패로 확정한다.
        failed_ = true;
        abort_();
        const TransferIoError wrapped("complete", std::string(e.what()));
        notifyFailure_(wrapped);
        throw wrapped;
    }

    if (onComplete_)
    {
        onComplete_();
    }
}

void PayloadProtocol::fail(const TransferError &error) noexcept
{
    if (finished_)
    {
        return;
    }
    finished_ = true;
    failed_ = true;

    abort_();
    notifyFailure_(error);
}

void PayloadProtocol::notifyFailure_(const TransferError &error) noexcept
{
    if (!onFailure_)
    {
        return;
    }

    // 리스너 예외가 연결 정리 경로를 끊지 않도록 여기서 멈춘다.
    try
    {
        onFailure_(error);
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("PayloadProtocol", "FailureListenerThrew", "protocol={} what='{}'", name(),
                   e.what());
    }
}

} // namespace hostlink::protocol
