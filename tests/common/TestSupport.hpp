#pragma once

// 테스트 전용 헬퍼 (임시 디렉터리, 파일 I/O, 폴링 대기)

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace hostlink::test {

/// temp_directory_path() 아래 프로세스/호출마다 다른 디렉터리. 소멸 시 통째로 지운다.
class TempDir {
  public:
    explicit TempDir(const std::string &tag) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("hostlink_" + tag + "_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter.fetch_add(1)));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
};

inline std::vector<std::uint8_t> makePattern(std::size_t size, std::uint32_t seed) {
    std::vector<std::uint8_t> out(size);
    std::mt19937 rng(seed);
    for (auto &b : out) {
        b = static_cast<std::uint8_t>(rng() & 0xFF);
    }
    return out;
}

inline void writeFile(const std::filesystem::path &path, const std::vector<std::uint8_t> &data) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::vector<std::uint8_t> readFile(const std::filesystem::path &path) {
    std::ifstream is(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(is),
                                     std::istreambuf_iterator<char>());
}

/// pred가 참이 될 때까지 최대 timeout 동안 폴링한다.
template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace hostlink::test
