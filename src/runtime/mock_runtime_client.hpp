#pragma once

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "runtime/runtime_client.hpp"

namespace runbox::runtime {

class MockRuntimeClient : public RuntimeClient {
public:
    MOCK_METHOD(SandboxHandle, Create, (const CreateOptions& options), (override));
    MOCK_METHOD(void, InjectArchive,
                (const SandboxHandle& sandbox, const std::string& path, const std::string& archive),
                (override));
    MOCK_METHOD(ExecOutput, Exec,
                (const SandboxHandle& sandbox,
                 const std::vector<std::string>& command,
                 const std::string& working_dir,
                 bool detached),
                (override));
    MOCK_METHOD(int, Wait, (const SandboxHandle& sandbox), (override));
    MOCK_METHOD(SandboxState, Status, (const SandboxHandle& sandbox), (override));
    MOCK_METHOD(std::string, Logs, (const SandboxHandle& sandbox), (override));
    MOCK_METHOD(void, Stop, (const SandboxHandle& sandbox), (override));
    MOCK_METHOD(void, Remove, (const SandboxHandle& sandbox), (override));
};

}  // namespace runbox::runtime
