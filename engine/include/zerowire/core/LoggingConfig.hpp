#pragma once

#include <zerowire/EngineConfig.hpp>

namespace zerowire::core
{

/// EngineConfig 의 logLevel/logFilePath 를 프로세스 전역 Logger 에 반영합니다.
void applyLoggingConfig(const zerowire::EngineConfig &cfg);

} // namespace zerowire::core
