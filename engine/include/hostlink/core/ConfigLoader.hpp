#pragma once

#include <hostlink/core/GlobalConfig.hpp>

#include <string>
#include <vector>

namespace hostlink::core
{

/// argv에서 --config 쌍을 걷어낸 결과
struct CommandLine
{
    std::string configPath;              // 비어 있으면 기본값 사용
    std::vector<std::string> positional; // 나머지 인자 (명령 + 피연산자)
    bool helpRequested{false};
};

class ConfigLoader
{
  public:
    /// "--config <path>" / "-c <path>" / "--help" 만 해석하고 나머지는 positional로 남긴다.
    static CommandLine parseCommandLine(int argc, char **argv);

    /// --config가 있으면 TOML을 읽고, 없으면 기본값. 어느 쪽이든 검증까지 마친다.
    static GlobalConfig load(int argc, char **argv);

    /// TOML 파일 하나를 읽어 검증된 설정을 만든다.
    static GlobalConfig loadFile(const std::string &path);
};

} // namespace hostlink::core
