#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "session/identity_store.hpp"

namespace tether::tests {

class MockKeyValueStore : public session::IKeyValueStore {
public:
    MOCK_METHOD(std::optional<std::string>, get, (const std::string &), (const, override));
    MOCK_METHOD(bool, set, (const std::string &, const std::string &), (override));
};

}  // namespace tether::tests
