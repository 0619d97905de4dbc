#include <hostlink/protocol/FileTransferProtocol.hpp>

#include <hostlink/core/Logger.hpp>
#include <hostlink/transfer/SimpleClient.hpp>

#include <algorithm>
#include <cerrno>
#include <system_error>

namespace hostlink::protocol
{

bool isPlainFileName(std::string_view name) noexcept
{
    if (name.empty() || name == "." || name == "..")
    {
        return false;
    }
    return name.find('/') == std::string_view::npos && name.find('\\') == std::string_view::npos &&
           name.find('\0') == std::string_view::npos;
}

FileTransferProtocol::FileTransferProtocol(PrivateTag, Mode mode, std::size_t chunkSize)
    : mode_(mode), chunkSize_(chunkSize == 0 ? core::defaults::kFileChunkSize : chunkSize)
{
}

FileTransferProtocol::~FileTransferProtocol() = default;

std::shared_ptr<FileTransferProtocol>
FileTransferProtocol::forFile(const std::filesystem::path &path, std::size_t chunkSize)
{
    auto self = std::make_shared<FileTransferProtocol>(PrivateTag{}, Mode::Send, chunkSize);

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        throw TransferIoError("stat " + path.string(), ec.value());
    }

    self->in_.open(path, std::ios::in | std::ios::binary);
    if (!self->in_.is_open())
    {
        throw TransferIoError("open " + path.string(), errno);
    }

    self->filePath_ = path;
    self->fileName_ = path.filename().string();
    self->fileSize_ = size;

    Header header = {
        {header_keys::kContentProtocol, std::string(kName)},
        {header_keys::kContentSize, self->fileSize_},
        {header_keys::kFileName, self->fileName_},
        {header_keys::kFileSize, self->fileSize_},
    };
    self->pendingHeader_ = encodeHeader(std::move(header));

    SLOG_DEBUG("FileTransfer", "SendOpened", "file={} size={} chunk={}", self->fileName_,
               self->fileSize_, self->chunkSize_);
    return self;
}

std::shared_ptr<FileTransferProtocol>
FileTransferProtocol::fromHeader(const Header &header, const std::filesystem::path &receiveDir,
                                 std::size_t chunkSize)
{
    auto it = header.find(header_keys::kFileName);
    if (it == header.end())
    {
        throw MissingHeaderFieldError({header_keys::kFileName});
    }
    if (!it->is_string())
    {
        throw MalformedHeaderError("file-name must be a string");
    }

    const std::string name = it->get<std::string>();
    if (!isPlainFileName(name))
    {
        throw MalformedHeaderError("file-name '" + name + "' is not a plain file name");
    }

    auto self = std::make_shared<FileTransferProtocol>(PrivateTag{}, Mode::Receive, chunkSize);
    self->fileName_ = name;

    // file-size가 없거나 정수가 아니면 content-size를 쓴다.
    auto sizeIt = header.find(header_keys::kFileSize);
    if (sizeIt != header.end() && sizeIt->is_number_unsigned())
    {
        self->fileSize_ = sizeIt->get<std::uint64_t>();
    }
    else if (sizeIt != header.end() && sizeIt->is_number_integer() &&
             sizeIt->get<std::int64_t>() >= 0)
    {
        self->fileSize_ = static_cast<std::uint64_t>(sizeIt->get<std::int64_t>());
    }
    else
    {
        self->fileSize_ = contentSize(header);
    }

    std::error_code ec;
    std::filesystem::create_directories(receiveDir, ec);
    if (ec)
    {
        throw TransferIoError("mkdir " + receiveDir.string(), ec.value());
    }

    self->filePath_ = receiveDir / name;
    self->out_.open(self->filePath_, std::ios::out | std::ios::binary | std::ios::app);
    if (!self->out_.is_open())
    {
        throw TransferIoError("open " + self->filePath_.string(), errno);
    }

    SLOG_DEBUG("FileTransfer", "ReceiveOpened", "path={} declaredSize={}",
               self->filePath_.string(), self->fileSize_);
    return self;
}

std::shared_ptr<FileTransferProtocol>
FileTransferProtocol::send(const std::filesystem::path &path, const std::string &host,
                           std::uint16_t port, ProgressListener onProgress,
                           FailureListener onFailure, CompletionListener onComplete)
{
    auto self = forFile(path);
    self->setProgressListener(std::move(onProgress));
    self->setFailureListener(std::move(onFailure));
    self->setCompletionListener(std::move(onComplete));

    transfer::SimpleClient::runDetached(host, port, self);
    return self;
}

double FileTransferProtocol::progress() const noexcept
{
    if (fileSize_ == 0)
    {
        return isCompleted() ? 1.0 : 0.0;
    }
    return std::min(1.0, static_cast<double>(transferred_) / static_cast<double>(fileSize_));
}

Bytes FileTransferProtocol::read()
{
    if (mode_ != Mode::Send || isFinished())
    {
        return {};
    }

    if (!pendingHeader_.empty())
    {
        Bytes out;
        out.swap(pendingHeader_);
        return out;
    }

    if (!in_.is_open() || transferred_ >= fileSize_)
    {
        return {};
    }

    const std::size_t want =
        static_cast<std::size_t>(std::min<std::uint64_t>(chunkSize_, fileSize_ - transferred_));
    Bytes chunk(want);
    in_.read(reinterpret_cast<char *>(chunk.data()), static_cast<std::streamsize>(want));
    const auto got = static_cast<std::size_t>(in_.gcount());
    if (got == 0)
    {
        // 헤더에 적은 크기보다 파일이 짧아졌다. 이대로면 상대는 영원히 기다린다.
        throw TransferIoError("read " + filePath_.string(),
                              "file shrank to " + std::to_string(transferred_) + " of " +
                                  std::to_string(fileSize_) + " bytes");
    }
    chunk.resize(got);

    advance_(got);
    return chunk;
}

void FileTransferProtocol::receive(std::span<const std::uint8_t> data)
{
    if (mode_ != Mode::Receive || data.empty())
    {
        return;
    }

    out_.write(reinterpret_cast<const char *>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!out_)
    {
        throw TransferIoError("write " + filePath_.string(), errno);
    }

    advance_(data.size());
}

void FileTransferProtocol::finish_()
{
    if (in_.is_open())
    {
        in_.close();
    }
    if (out_.is_open())
    {
        out_.close();
        if (out_.fail())
        {
            throw TransferIoError("close " + filePath_.string(), errno);
        }
    }

    if (fileSize_ == 0)
    {
        notifyProgress_(1.0);
    }

    SLOG_INFO("FileTransfer", "Completed", "mode={} file={} bytes={}",
              mode_ == Mode::Send ? "send" : "receive", fileName_, transferred_);
}

void FileTransferProtocol::abort_() noexcept
{
    if (in_.is_open())
    {
        in_.close();
    }
    if (out_.is_open())
    {
        out_.close();
    }
}

void FileTransferProtocol::advance_(std::size_t bytes)
{
    transferred_ += bytes;
    if (fileSize_ != 0)
    {
        notifyProgress_(progress());
    }
}

void FileTransferProtocol::notifyProgress_(double fraction)
{
    if (onProgress_)
    {
        onProgress_(fraction);
    }
}

} // namespace hostlink::protocol
