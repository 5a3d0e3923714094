#pragma once

#include <string>

namespace hsdsync {

// Installs the default spdlog logger: colored console output and, when
// `directory` is not empty, a rotating file at <directory>/hsdsync.log.
void initLogging(const std::string& level, const std::string& directory = "");

void shutdownLogging();

} // namespace hsdsync
