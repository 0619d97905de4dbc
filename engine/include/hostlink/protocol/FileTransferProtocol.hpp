#pragma once

#include <hostlink/core/Defaults.hpp>
#include <hostlink/protocol/PayloadProtocol.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace hostlink::protocol
{

/// 파일 1개를 프레임 1개로 보내거나 받습니다.
///
/// - 송신 모드: read()가 [프레임 헤더] -> [파일 내용 chunk...] 순서로 돌려준다. 응답을 기다린다.
/// - 수신 모드: receive()가 receiveDir/file-name 에 append 한다. 응답 없음.
/// - progress 리스너는 누적 바이트 / 파일 크기 (0~1)를 받는다. 빈 파일은 완료 시 1.0 한 번.
class FileTransferProtocol final : public PayloadProtocol
{
  public:
    static constexpr std::string_view kName = "FileTransfer";

    enum class Mode : std::uint8_t
    {
        Send = 0,
        Receive,
    };

    using ProgressListener = std::function<void(double fraction)>;

  private:
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    FileTransferProtocol(PrivateTag, Mode mode, std::size_t chunkSize);
    ~FileTransferProtocol() override;

    /// 송신 모드. 파일을 열고 크기/이름으로 헤더를 미리 만든다.
    ///
    /// @throws TransferIoError 파일을 열 수 없음
    [[nodiscard]] static std::shared_ptr<FileTransferProtocol>
    forFile(const std::filesystem::path &path,
            std::size_t chunkSize = core::defaults::kFileChunkSize);

    /// 수신 모드. file-name은 디렉터리 성분이 없는 이름이어야 한다.
    ///
    /// @throws MissingHeaderFieldError file-name 없음
    /// @throws MalformedHeaderError    file-name이 문자열이 아니거나 경로를 포함
    /// @throws TransferIoError         대상 파일을 열 수 없음
    [[nodiscard]] static std::shared_ptr<FileTransferProtocol>
    fromHeader(const Header &header, const std::filesystem::path &receiveDir,
               std::size_t chunkSize = core::defaults::kFileChunkSize);

    /// forFile() 인스턴스를 SimpleClient(분리된 스레드)로 보내고 바로 돌려준다.
    ///
    /// 리스너는 전송 스레드에서 호출된다.
    [[nodiscard]] static std::shared_ptr<FileTransferProtocol>
    send(const std::filesystem::path &path, const std::string &host, std::uint16_t port,
         ProgressListener onProgress, FailureListener onFailure = {},
         CompletionListener onComplete = {});

    void setProgressListener(ProgressListener listener) { onProgress_ = std::move(listener); }

    [[nodiscard]] Mode mode() const noexcept { return mode_; }
    [[nodiscard]] const std::string &fileName() const noexcept { return fileName_; }
    [[nodiscard]] const std::filesystem::path &filePath() const noexcept { return filePath_; }
    [[nodiscard]] std::uint64_t fileSize() const noexcept { return fileSize_; }
    [[nodiscard]] std::uint64_t transferred() const noexcept { return transferred_; }
    [[nodiscard]] double progress() const noexcept;

    // ===== PayloadProtocol =====
    [[nodiscard]] std::string_view name() const noexcept override { return kName; }
    [[nodiscard]] Bytes read() override;
    void receive(std::span<const std::uint8_t> data) override;
    [[nodiscard]] bool hasResponse() const noexcept override { return mode_ == Mode::Send; }

  protected:
    void finish_() override;
    void abort_() noexcept override;

  private:
    Mode mode_;
    std::size_t chunkSize_;

    std::string fileName_;
    std::filesystem::path filePath_;
    std::uint64_t fileSize_{0};
    std::uint64_t transferred_{0};

    std::ifstream in_;
    std::ofstream out_;
    Bytes pendingHeader_;

    ProgressListener onProgress_;

    void advance_(std::size_t bytes);
    void notifyProgress_(double fraction);
};

/// 경로 성분이 없는 파일 이름인지 ('/', '\\', ".", "..", 빈 문자열 거부)
[[nodiscard]] bool isPlainFileName(std::string_view name) noexcept;

} // namespace hostlink::protocol
