#include <hostlink/core/Logger.hpp>
#include <hostlink/protocol/Errors.hpp>
#include <hostlink/protocol/FileTransferProtocol.hpp>
#include <hostlink/protocol/HostIdentityProtocol.hpp>
#include <hostlink/protocol/ProtocolRegistry.hpp>

#include "../common/TestSupport.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace hostlink::protocol;

namespace {

class NullProtocol final : public PayloadProtocol {
  public:
    explicit NullProtocol(int tag) : tag(tag) {}

    int tag;

    [[nodiscard]] std::string_view name() const noexcept override { return "Null"; }
    [[nodiscard]] Bytes read() override { return {}; }
    void receive(std::span<const std::uint8_t>) override {}
    [[nodiscard]] bool hasResponse() const noexcept override { return false; }

  protected:
    void finish_() override {}
};

Header headerFor(const std::string &protocolName, std::uint64_t size = 0) {
    return Header{{"byteorder", "little"},
                  {"content-encoding", "utf-8"},
                  {"content-protocol", protocolName},
                  {"content-size", size}};
}

bool test_register_and_resolve() {
    ProtocolRegistry registry;
    if (registry.size() != 0 || registry.contains("Null")) {
        std::cerr << "[register] new registry is not empty\n";
        return false;
    }

    registry.registerProtocol("Null", [](const Header &) { return std::make_shared<NullProtocol>(1); });

    if (!registry.contains("Null") || registry.size() != 1) {
        std::cerr << "[register] entry missing\n";
        return false;
    }

    auto created = registry.create(headerFor("Null"));
    auto *null = dynamic_cast<NullProtocol *>(created.get());
    if (!null || null->tag != 1) {
        std::cerr << "[register] create() returned wrong instance\n";
        return false;
    }

    // 매번 새 인스턴스
    if (registry.create(headerFor("Null")) == created) {
        std::cerr << "[register] create() reused an instance\n";
        return false;
    }
    return true;
}

bool test_replace_keeps_single_entry() {
    ProtocolRegistry registry;
    registry.registerProtocol("Null", [](const Header &) { return std::make_shared<NullProtocol>(1); });
    registry.registerProtocol("Null", [](const Header &) { return std::make_shared<NullProtocol>(2); });

    if (registry.size() != 1) {
        std::cerr << "[replace] size=" << registry.size() << "\n";
        return false;
    }
    auto created = registry.create(headerFor("Null"));
    if (dynamic_cast<NullProtocol &>(*created).tag != 2) {
        std::cerr << "[replace] old factory still active\n";
        return false;
    }
    return true;
}

bool test_unknown_name() {
    ProtocolRegistry registry;
    try {
        (void)registry.resolve("Nope");
        std::cerr << "[unknown] resolve did not throw\n";
        return false;
    } catch (const UnknownProtocolError &e) {
        if (e.protocolName() != "Nope") {
            std::cerr << "[unknown] wrong name\n";
            return false;
        }
    }

    try {
        (void)registry.create(headerFor("Nope"));
        std::cerr << "[unknown] create did not throw\n";
        return false;
    } catch (const UnknownProtocolError &) {
    }
    return true;
}

bool test_rejects_empty_and_null_factories() {
    ProtocolRegistry registry;
    try {
        registry.registerProtocol("Empty", ProtocolRegistry::Factory{});
        std::cerr << "[empty] empty factory accepted\n";
        return false;
    } catch (const std::invalid_argument &) {
    }

    registry.registerProtocol("Null", [](const Header &) { return std::shared_ptr<PayloadProtocol>{}; });
    try {
        (void)registry.create(headerFor("Null"));
        std::cerr << "[empty] null protocol accepted\n";
        return false;
    } catch (const MalformedHeaderError &) {
    }
    return true;
}

bool test_defaults_cover_builtin_protocols() {
    hostlink::test::TempDir dir("registry");
    auto registry = ProtocolRegistry::withDefaults(dir.path(), 1024);

    const auto names = registry.names();
    if (names != std::vector<std::string>{"FileTransfer", "HostIdentity"}) {
        std::cerr << "[defaults] unexpected names\n";
        return false;
    }

    Header fileHeader = headerFor("FileTransfer", 3);
    fileHeader["file-name"] = "incoming.bin";
    auto file = registry.create(fileHeader);
    auto *ft = dynamic_cast<FileTransferProtocol *>(file.get());
    if (!ft || ft->mode() != FileTransferProtocol::Mode::Receive ||
        ft->filePath() != dir.path() / "incoming.bin") {
        std::cerr << "[defaults] FileTransfer factory misconfigured\n";
        return false;
    }
    file->complete();

    auto identity = registry.create(headerFor("HostIdentity", 2));
    if (!dynamic_cast<HostIdentityProtocol *>(identity.get()) || !identity->hasResponse()) {
        std::cerr << "[defaults] HostIdentity factory misconfigured\n";
        return false;
    }

    // 응답 모드는 헤더 없이 identity JSON만 보낸다.
    const Bytes response = identity->read();
    if (decodeIdentity(response) != systemIdentity()) {
        std::cerr << "[defaults] HostIdentity response is not the local identity\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    hostlink::core::detail::fastMinLevel().store(
        static_cast<int>(hostlink::core::LogLevel::Fatal));

    bool ok = true;

    ok = ok && test_register_and_resolve();
    ok = ok && test_replace_keeps_single_entry();
    ok = ok && test_unknown_name();
    ok = ok && test_rejects_empty_and_null_factories();
    ok = ok && test_defaults_cover_builtin_protocols();

    hostlink::core::shutdownLogger();

    if (!ok) {
        std::cerr << "ProtocolRegistry tests FAILED\n";
        return 1;
    }

    std::cout << "ProtocolRegistry tests PASSED\n";
    return 0;
}
