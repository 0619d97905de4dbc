#include <hostlink/protocol/Errors.hpp>

#include <cstring>
#include <format>
#include <utility>

namespace hostlink::protocol
{

namespace
{
std::string joinFields(const std::vector<std::string> &fields)
{
    std::string out;
    for (const auto &f : fields)
    {
        if (!out.empty())
            out += ", ";
        out += f;
    }
    return out;
}
} // namespace

const char *toString(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::Encoding:
        return "encoding";
    case ErrorKind::MalformedHeader:
        return "malformed_header";
    case ErrorKind::MissingHeaderField:
        return "missing_header_field";
    case ErrorKind::UnknownProtocol:
        return "unknown_protocol";
    case ErrorKind::MalformedPayload:
        return "malformed_payload";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Incomplete:
        return "incomplete";
    case ErrorKind::Io:
        return "io";
    }
    return "unknown";
}

TransferError::TransferError(ErrorKind kind, const std::string &what)
    : std::runtime_error(what), kind_(kind)
{
}

EncodingError::EncodingError(const std::string &detail)
    : TransferError(ErrorKind::Encoding, "encoding error: " + detail)
{
}

MalformedHeaderError::MalformedHeaderError(const std::string &detail)
    : TransferError(ErrorKind::MalformedHeader, "malformed header: " + detail)
{
}

MissingHeaderFieldError::MissingHeaderFieldError(std::vector<std::string> fields)
    : TransferError(ErrorKind::MissingHeaderField,
                    "missing required header field(s): " + joinFields(fields)),
      fields_(std::move(fields))
{
}

UnknownProtocolError::UnknownProtocolError(std::string protocolName)
    : TransferError(ErrorKind::UnknownProtocol,
                    std::format("protocol '{}' is not registered", protocolName)),
      protocolName_(std::move(protocolName))
{
}

MalformedPayloadError::MalformedPayloadError(const std::string &detail)
    : TransferError(ErrorKind::MalformedPayload, "malformed payload: " + detail)
{
}

TransferTimeoutError::TransferTimeoutError(std::chrono::milliseconds idleFor)
    : TransferError(ErrorKind::Timeout,
                    std::format("no activity for {} ms", idleFor.count())),
      idleFor_(idleFor)
{
}

TransferCancelledError::TransferCancelledError()
    : TransferError(ErrorKind::Cancelled, "transfer cancelled")
{
}

TransferIncompleteError::TransferIncompleteError(std::uint64_t received, std::uint64_t expected)
    : TransferError(ErrorKind::Incomplete,
                    std::format("peer closed after {} of {} payload bytes", received, expected)),
      received_(received), expected_(expected)
{
}

TransferIoError::TransferIoError(std::string operation, int errorCode)
    : TransferError(ErrorKind::Io, std::format("{} failed: errno={} ({})", operation, errorCode,
                                               errorCode != 0 ? std::strerror(errorCode) : "n/a")),
      operation_(std::move(operation)), errorCode_(errorCode)
{
}

TransferIoError::TransferIoError(std::string operation, const std::string &detail)
    : TransferError(ErrorKind::Io, std::format("{} failed: {}", operation, detail)),
      operation_(std::move(operation))
{
}

} // namespace hostlink::protocol
