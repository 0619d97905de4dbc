#pragma once

#include <hostlink/EngineConfig.hpp>

namespace hostlink::core
{

// 프로세스 전체 설정 ([engine] + [transfer])
struct GlobalConfig
{
    EngineConfig engine{};
    TransferConfig transfer{};
};

} // namespace hostlink::core
