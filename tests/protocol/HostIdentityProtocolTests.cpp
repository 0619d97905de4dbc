#include <hostlink/core/Logger.hpp>
#include <hostlink/protocol/Errors.hpp>
#include <hostlink/protocol/FrameCodec.hpp>
#include <hostlink/protocol/HostIdentityProtocol.hpp>

#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

using namespace hostlink::protocol;

namespace {

HostIdentity sampleIdentity() {
    HostIdentity id;
    id.computerName = "build-box";
    id.userName = "ops";
    id.osName = "Ubuntu";
    id.osPlatform = "linux";
    id.osRelease = "6.8.0";
    return id;
}

Bytes toBytes(const std::string &s) { return Bytes(s.begin(), s.end()); }

bool test_system_identity_is_populated() {
    const HostIdentity self = systemIdentity();
    if (self.computerName.empty() || self.osName.empty()) {
        std::cerr << "[system] computer-name / os-name empty\n";
        return false;
    }
    if (self.osPlatform != std::optional<std::string>("linux") || !self.osRelease) {
        std::cerr << "[system] platform/release missing\n";
        return false;
    }
    return true;
}

bool test_json_keeps_unknown_fields() {
    const auto j = nlohmann::json::parse(
        R"({"computer-name":"WIN-01","user-name":"kim","os-name":"Windows",)"
        R"("os-version":"10.0.19045","windows-build":19045})");
    const HostIdentity id = HostIdentity::fromJson(j);

    if (id.computerName != "WIN-01" || id.osPlatform || id.osRelease) {
        std::cerr << "[json] known fields wrong\n";
        return false;
    }
    if (id.extras.value("windows-build", 0) != 19045 ||
        id.extras.value("os-version", "") != "10.0.19045") {
        std::cerr << "[json] extras lost\n";
        return false;
    }
    if (id.toJson() != j) {
        std::cerr << "[json] toJson does not reproduce input: " << id.toJson().dump() << "\n";
        return false;
    }
    return true;
}

bool test_malformed_payloads() {
    for (const char *bad : {"[1,2,3]", "not json", R"({"computer-name": 7})", ""}) {
        try {
            (void)decodeIdentity(toBytes(bad));
            std::cerr << "[malformed] accepted '" << bad << "'\n";
            return false;
        } catch (const MalformedPayloadError &e) {
            if (e.kind() != ErrorKind::MalformedPayload) {
                return false;
            }
        }
    }

    // 필수 문자열이 빠진 객체는 빈 문자열로 받는다.
    const HostIdentity sparse = decodeIdentity(toBytes(R"({"os-name":"BSD"})"));
    return sparse.osName == "BSD" && sparse.computerName.empty() && sparse.userName.empty();
}

bool test_request_frame_layout() {
    const HostIdentity self = sampleIdentity();
    auto requester = HostIdentityProtocol::forRequest(self);

    const Bytes frame = requester->read();
    if (!requester->read().empty()) {
        std::cerr << "[request] second read() should be empty\n";
        return false;
    }

    const std::size_t headerLen = (static_cast<std::size_t>(frame[0]) << 8) | frame[1];
    std::span<const std::uint8_t> all(frame);
    const Header header = decodeHeader(all.subspan(kLengthPrefixSize, headerLen));
    requireHeaderFields(header);

    const auto payload = all.subspan(kLengthPrefixSize + headerLen);
    if (contentProtocol(header) != "HostIdentity" || contentSize(header) != payload.size()) {
        std::cerr << "[request] header does not describe payload\n";
        return false;
    }
    if (decodeIdentity(payload) != self) {
        std::cerr << "[request] payload is not our identity\n";
        return false;
    }
    return requester->hasResponse();
}

/// 응답 측 / 요청 측을 메모리에서 맞물려 본다.
bool test_exchange_in_memory() {
    const HostIdentity client = sampleIdentity();
    HostIdentity server = sampleIdentity();
    server.computerName = "server-box";

    auto requester = HostIdentityProtocol::forRequest(client);
    const Bytes frame = requester->read();
    const std::size_t headerLen = (static_cast<std::size_t>(frame[0]) << 8) | frame[1];
    const Header header =
        decodeHeader(std::span<const std::uint8_t>(frame).subspan(kLengthPrefixSize, headerLen));

    auto responder = HostIdentityProtocol::fromHeader(header, server);
    responder->receive(std::span<const std::uint8_t>(frame).subspan(kLengthPrefixSize + headerLen));

    const Bytes response = responder->read();
    responder->complete();

    int calls = 0;
    HostIdentity seen;
    requester->setIdentityListener([&](const HostIdentity &peer) {
        ++calls;
        seen = peer;
    });
    requester->receive(response);
    requester->complete();
    requester->complete();

    if (calls != 1 || seen != server || requester->peer() != std::optional<HostIdentity>(server)) {
        std::cerr << "[exchange] requester did not learn the server identity\n";
        return false;
    }
    if (responder->peer() != std::optional<HostIdentity>(client)) {
        std::cerr << "[exchange] responder did not decode the request identity\n";
        return false;
    }
    return true;
}

bool test_bad_response_fails_protocol() {
    auto requester = HostIdentityProtocol::forRequest(sampleIdentity());
    (void)requester->read();

    int failures = 0;
    requester->setFailureListener([&](const TransferError &e) {
        if (e.kind() == ErrorKind::MalformedPayload) {
            ++failures;
        }
    });
    requester->receive(toBytes("\"just a string\""));

    try {
        requester->complete();
        std::cerr << "[bad] complete() did not throw\n";
        return false;
    } catch (const MalformedPayloadError &) {
    }

    return failures == 1 && requester->isFailed() && !requester->peer();
}

/// identity 리스너가 던진 일반 예외도 Io 실패로 확정되어야 한다.
bool test_throwing_listener_fails_protocol() {
    auto requester = HostIdentityProtocol::forRequest(sampleIdentity());
    (void)requester->read();

    int failures = 0;
    std::optional<ErrorKind> failure;
    requester->setFailureListener([&](const TransferError &e) {
        ++failures;
        failure = e.kind();
    });
    requester->setIdentityListener(
        [](const HostIdentity &) { throw std::runtime_error("listener rejected peer"); });
    requester->receive(encodeIdentity(sampleIdentity()));

    try {
        requester->complete();
        std::cerr << "[listener] complete() did not throw\n";
        return false;
    } catch (const TransferIoError &e) {
        if (std::string(e.what()).find("listener rejected peer") == std::string::npos) {
            std::cerr << "[listener] cause lost: " << e.what() << "\n";
            return false;
        }
    }

    // 한 번 실패로 확정된 뒤에는 fail()도 다시 통보하지 않는다.
    requester->fail(TransferCancelledError());
    if (failures != 1 || failure != ErrorKind::Io || !requester->isFailed()) {
        std::cerr << "[listener] expected a single Io failure\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    hostlink::core::detail::fastMinLevel().store(
        static_cast<int>(hostlink::core::LogLevel::Fatal));

    bool ok = true;

    ok = ok && test_system_identity_is_populated();
    ok = ok && test_json_keeps_unknown_fields();
    ok = ok && test_malformed_payloads();
    ok = ok && test_request_frame_layout();
    ok = ok && test_exchange_in_memory();
    ok = ok && test_bad_response_fails_protocol();
    ok = ok && test_throwing_listener_fails_protocol();

    hostlink::core::shutdownLogger();

    if (!ok) {
        std::cerr << "HostIdentityProtocol tests FAILED\n";
        return 1;
    }

    std::cout << "HostIdentityProtocol tests PASSED\n";
    return 0;
}
