#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "runner/i_daemon_runner.hpp"

namespace daemon_runner::tests {

using namespace daemon_runner;
using namespace testing;

class MockDaemonRunner : public runner::IDaemonRunner {
public:
    MOCK_METHOD(runner::Result, start, (), (override));
    MOCK_METHOD(runner::Result, restart, (), (override));
    MOCK_METHOD(runner::Result, stop, (), (override));

    MOCK_METHOD(runner::Result, status, (runner::DaemonStatus &), (override));
    MOCK_METHOD((std::optional<pid_t>), pid, (), (const, override));
    MOCK_METHOD(std::string, display_name, (), (const, override));
};

}  // namespace daemon_runner::tests
