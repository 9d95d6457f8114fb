#pragma once

#include <zerowire/core/GlobalConfig.hpp>

#include <string>

namespace zerowire::core
{

class ConfigLoader
{
  public:
    // --config/-c <path.toml>, --help/-h
    static GlobalConfig load(int argc, char **argv);

    // 경로를 이미 알고 있을 때 (테스트, 임베딩)
    static GlobalConfig loadFile(const std::string &configPath);
};

} // namespace zerowire::core
