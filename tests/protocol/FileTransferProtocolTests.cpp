#include <hostlink/core/Logger.hpp>
#include <hostlink/protocol/Errors.hpp>
#include <hostlink/protocol/FileTransferProtocol.hpp>
#include <hostlink/protocol/FrameCodec.hpp>

#include "../common/TestSupport.hpp"

#include <cmath>
#include <iostream>
#include <span>
#include <vector>

using namespace hostlink::protocol;
using hostlink::test::TempDir;

namespace {

Header receiveHeader(const std::string &fileName, std::uint64_t size) {
    return Header{{"byteorder", "little"},
                  {"content-encoding", "utf-8"},
                  {"content-protocol", "FileTransfer"},
                  {"content-size", size},
                  {"file-name", fileName},
                  {"file-size", size}};
}

/// 송신 모드 read()를 끝까지 돌려 [헤더 프레임, 내용]으로 나눈다.
Bytes drain(FileTransferProtocol &sender, std::vector<std::size_t> &chunkSizes) {
    Bytes all;
    for (Bytes chunk = sender.read(); !chunk.empty(); chunk = sender.read()) {
        chunkSizes.push_back(chunk.size());
        all.insert(all.end(), chunk.begin(), chunk.end());
    }
    return all;
}

bool test_send_mode_emits_header_then_chunks() {
    TempDir dir("ft_send");
    const auto data = hostlink::test::makePattern(10000, 7);
    hostlink::test::writeFile(dir.path() / "payload.bin", data);

    auto sender = FileTransferProtocol::forFile(dir.path() / "payload.bin", 4096);
    std::vector<double> progress;
    sender->setProgressListener([&](double f) { progress.push_back(f); });

    std::vector<std::size_t> chunks;
    const Bytes wire = drain(*sender, chunks);

    // 첫 read()는 헤더 프레임 전체
    const std::size_t headerLen = (static_cast<std::size_t>(wire[0]) << 8) | wire[1];
    if (chunks.empty() || chunks[0] != kLengthPrefixSize + headerLen) {
        std::cerr << "[send] first read() is not the header frame\n";
        return false;
    }

    const Header header = decodeHeader(std::span<const std::uint8_t>(wire).subspan(2, headerLen));
    if (contentProtocol(header) != "FileTransfer" || contentSize(header) != data.size() ||
        header.at("file-name") != "payload.bin" || header.at("file-size") != data.size()) {
        std::cerr << "[send] header fields wrong: " << header.dump() << "\n";
        return false;
    }

    const Bytes body(wire.begin() + static_cast<std::ptrdiff_t>(kLengthPrefixSize + headerLen),
                     wire.end());
    if (body != data) {
        std::cerr << "[send] body differs from file\n";
        return false;
    }
    if (chunks.size() != 4 || chunks[1] != 4096 || chunks[3] != 10000 - 2 * 4096) {
        std::cerr << "[send] chunking not bounded by chunk size\n";
        return false;
    }
    if (progress.empty() || progress.back() != 1.0 || !sender->hasResponse()) {
        std::cerr << "[send] final progress not 1.0\n";
        return false;
    }
    for (std::size_t i = 1; i < progress.size(); ++i) {
        if (progress[i] < progress[i - 1]) {
            std::cerr << "[send] progress went backwards\n";
            return false;
        }
    }
    return true;
}

bool test_missing_file_is_io_error() {
    TempDir dir("ft_missing");
    try {
        (void)FileTransferProtocol::forFile(dir.path() / "nope.bin");
        std::cerr << "[missing] no exception\n";
        return false;
    } catch (const TransferIoError &e) {
        return e.kind() == ErrorKind::Io;
    }
}

bool test_receive_mode_writes_and_appends() {
    TempDir dir("ft_recv");
    const Bytes existing{'o', 'l', 'd'};
    hostlink::test::writeFile(dir.path() / "log.txt", existing);

    const Bytes incoming{'n', 'e', 'w', '!'};
    auto receiver = FileTransferProtocol::fromHeader(receiveHeader("log.txt", incoming.size()),
                                                     dir.path());
    std::vector<double> progress;
    receiver->setProgressListener([&](double f) { progress.push_back(f); });

    if (receiver->hasResponse() || !receiver->read().empty()) {
        std::cerr << "[recv] receive mode must not respond\n";
        return false;
    }

    receiver->receive(std::span<const std::uint8_t>(incoming).first(1));
    receiver->receive(std::span<const std::uint8_t>(incoming).subspan(1));
    receiver->complete();

    const Bytes expected{'o', 'l', 'd', 'n', 'e', 'w', '!'};
    if (hostlink::test::readFile(dir.path() / "log.txt") != expected) {
        std::cerr << "[recv] file content wrong (append expected)\n";
        return false;
    }
    if (progress.size() != 2 || std::fabs(progress[0] - 0.25) > 1e-9 || progress[1] != 1.0) {
        std::cerr << "[recv] progress values wrong\n";
        return false;
    }
    return receiver->isCompleted();
}

bool test_rejects_path_components() {
    TempDir dir("ft_path");

    for (const char *bad : {"../escape.txt", "sub/file.txt", "..", ".", "", "a\\b"}) {
        try {
            (void)FileTransferProtocol::fromHeader(receiveHeader(bad, 1), dir.path());
            std::cerr << "[path] accepted '" << bad << "'\n";
            return false;
        } catch (const MalformedHeaderError &) {
        }
    }

    Header noName = receiveHeader("x", 1);
    noName.erase("file-name");
    try {
        (void)FileTransferProtocol::fromHeader(noName, dir.path());
        std::cerr << "[path] missing file-name accepted\n";
        return false;
    } catch (const MissingHeaderFieldError &e) {
        if (e.fields() != std::vector<std::string>{"file-name"}) {
            return false;
        }
    }

    Header numeric = receiveHeader("x", 1);
    numeric["file-name"] = 42;
    try {
        (void)FileTransferProtocol::fromHeader(numeric, dir.path());
        std::cerr << "[path] numeric file-name accepted\n";
        return false;
    } catch (const MalformedHeaderError &) {
    }

    if (!isPlainFileName("report.final.pdf") || isPlainFileName("/etc/passwd")) {
        std::cerr << "[path] isPlainFileName wrong\n";
        return false;
    }
    return !std::filesystem::exists(dir.path().parent_path() / "escape.txt");
}

bool test_zero_size_reports_full_progress_on_complete() {
    TempDir dir("ft_zero");
    auto receiver = FileTransferProtocol::fromHeader(receiveHeader("empty.bin", 0), dir.path());

    std::vector<double> progress;
    receiver->setProgressListener([&](double f) { progress.push_back(f); });

    if (receiver->progress() != 0.0) {
        std::cerr << "[zero] progress before completion should be 0\n";
        return false;
    }
    receiver->complete();

    if (progress != std::vector<double>{1.0} || receiver->progress() != 1.0) {
        std::cerr << "[zero] expected exactly one 1.0 notification\n";
        return false;
    }
    if (!std::filesystem::exists(dir.path() / "empty.bin") ||
        std::filesystem::file_size(dir.path() / "empty.bin") != 0) {
        std::cerr << "[zero] empty file not created\n";
        return false;
    }
    return true;
}

bool test_file_size_falls_back_to_content_size() {
    TempDir dir("ft_size");

    Header h = receiveHeader("a.bin", 12);
    h.erase("file-size");
    if (FileTransferProtocol::fromHeader(h, dir.path())->fileSize() != 12) {
        std::cerr << "[size] missing file-size did not fall back\n";
        return false;
    }

    h["file-size"] = "twelve";
    if (FileTransferProtocol::fromHeader(h, dir.path())->fileSize() != 12) {
        std::cerr << "[size] non-integer file-size did not fall back\n";
        return false;
    }

    h["file-size"] = 100;
    if (FileTransferProtocol::fromHeader(h, dir.path())->fileSize() != 100) {
        std::cerr << "[size] explicit file-size ignored\n";
        return false;
    }
    return true;
}

bool test_complete_and_fail_are_idempotent() {
    TempDir dir("ft_idem");
    auto receiver = FileTransferProtocol::fromHeader(receiveHeader("i.bin", 1), dir.path());

    int completions = 0;
    int failures = 0;
    receiver->setCompletionListener([&] { ++completions; });
    receiver->setFailureListener([&](const TransferError &) { ++failures; });

    receiver->complete();
    receiver->complete();
    receiver->fail(TransferCancelledError());

    if (completions != 1 || failures != 0 || !receiver->isCompleted()) {
        std::cerr << "[idem] completions=" << completions << " failures=" << failures << "\n";
        return false;
    }

    auto other = FileTransferProtocol::fromHeader(receiveHeader("j.bin", 1), dir.path());
    other->setCompletionListener([&] { ++completions; });
    other->setFailureListener([&](const TransferError &e) {
        if (e.kind() == ErrorKind::Cancelled) {
            ++failures;
        }
    });
    other->fail(TransferCancelledError());
    other->fail(TransferCancelledError());
    other->complete();

    if (completions != 1 || failures != 1 || !other->isFailed() || other->isCompleted()) {
        std::cerr << "[idem] fail path not idempotent\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    hostlink::core::detail::fastMinLevel().store(
        static_cast<int>(hostlink::core::LogLevel::Fatal));

    bool ok = true;

    ok = ok && test_send_mode_emits_header_then_chunks();
    ok = ok && test_missing_file_is_io_error();
    ok = ok && test_receive_mode_writes_and_appends();
    ok = ok && test_rejects_path_components();
    ok = ok && test_zero_size_reports_full_progress_on_complete();
    ok = ok && test_file_size_falls_back_to_content_size();
    ok = ok && test_complete_and_fail_are_idempotent();

    hostlink::core::shutdownLogger();

    if (!ok) {
        std::cerr << "FileTransferProtocol tests FAILED\n";
        return 1;
    }

    std::cout << "FileTransferProtocol tests PASSED\n";
    return 0;
}
