#pragma once

#include "application/projections/IProjection.hpp"
#include <gmock/gmock.h>

namespace campaign::tests {

/**
 * @brief GMock реализация IProjection
 */
class MockProjection : public application::IProjection {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(bool, handles, (const std::string& eventType), (const, override));
    MOCK_METHOD(void, apply, (const domain::StoredEvent& event), (override));
    MOCK_METHOD(void, reset, (), (override));
};

} // namespace campaign::tests
