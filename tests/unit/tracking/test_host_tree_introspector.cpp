/**
 * @file test_host_tree_introspector.cpp
 * @brief Unit tests for the host tree introspectors
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "../test_helpers.hpp"
#include "shade/tracking/HostTreeIntrospector.hpp"

using namespace SHADE;
using namespace SHADE::Tracking;
using SHADE::Util::Error;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

TEST(UnsupportedIntrospectorTest, AlwaysReportsUnsupported) {
  UnsupportedIntrospector introspector("no renderer access");

  EXPECT_FALSE(introspector.IsSupported());
  auto result = introspector.IntrospectTree();
  ASSERT_FALSE(Util::isOk(result));
  EXPECT_EQ(Util::getError(result).code, Error::INTROSPECTION_UNSUPPORTED);
  EXPECT_EQ(Util::getError(result).message, "no renderer access");
}

TEST(HostRuntimeIntrospectorTest, NullRuntimeIsUnsupported) {
  HostRuntimeIntrospector introspector(nullptr);
  EXPECT_FALSE(introspector.IsSupported());
}

TEST(HostRuntimeIntrospectorTest, BuildsSnapshotFromComponentStates) {
  auto runtime = std::make_shared<NiceMock<test::MockHostRuntime>>();
  auto root = test::MakeComponent("root");
  auto child = test::MakeComponent("child");

  HostComponentState rootState;
  rootState.id = 1;
  rootState.instance = root;
  rootState.type = ComponentTypeInfo::FromFullName("App.Root");
  HostComponentState childState;
  childState.id = 2;
  childState.parent_id = 1;
  childState.instance = child;
  childState.type = ComponentTypeInfo::FromFullName("App.Child");

  ON_CALL(*runtime, ExposesComponentTree()).WillByDefault(Return(true));
  ON_CALL(*runtime, GetInternalsVersion()).WillByDefault(Return("8.0"));
  EXPECT_CALL(*runtime, ReadComponentStates())
      .WillOnce(Return(std::vector<HostComponentState>{rootState, childState}));

  HostRuntimeIntrospector introspector(runtime, {"8.0", "9.0"});
  ASSERT_TRUE(introspector.IsSupported());

  auto result = introspector.IntrospectTree();
  ASSERT_TRUE(Util::isOk(result));
  const auto &snapshot = Util::getValue(result);
  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot.at(1).instance.get(), root.get());
  EXPECT_FALSE(snapshot.at(1).parent_id.has_value());
  EXPECT_EQ(snapshot.at(2).parent_id, std::optional<ComponentId>(1));
  EXPECT_EQ(snapshot.at(2).type.name, "Child");
}

TEST(HostRuntimeIntrospectorTest, UnknownVersionIsUnsupported) {
  auto runtime = std::make_shared<NiceMock<test::MockHostRuntime>>();
  ON_CALL(*runtime, ExposesComponentTree()).WillByDefault(Return(true));
  ON_CALL(*runtime, GetInternalsVersion()).WillByDefault(Return("10.0"));
  EXPECT_CALL(*runtime, ReadComponentStates()).Times(0);

  HostRuntimeIntrospector introspector(runtime, {"8.0"});

  EXPECT_FALSE(introspector.IsSupported());
  auto result = introspector.IntrospectTree();
  ASSERT_FALSE(Util::isOk(result));
  EXPECT_EQ(Util::getError(result).code, Error::INTROSPECTION_UNSUPPORTED);
}

TEST(HostRuntimeIntrospectorTest, SupportIsProbedOnce) {
  auto runtime = std::make_shared<NiceMock<test::MockHostRuntime>>();
  EXPECT_CALL(*runtime, ExposesComponentTree()).Times(1).WillOnce(Return(false));

  HostRuntimeIntrospector introspector(runtime);

  EXPECT_FALSE(introspector.IsSupported());
  EXPECT_FALSE(introspector.IsSupported());
  EXPECT_FALSE(Util::isOk(introspector.IntrospectTree()));
}

TEST(HostRuntimeIntrospectorTest, ReadFailureBecomesIntrospectionFailed) {
  auto runtime = std::make_shared<NiceMock<test::MockHostRuntime>>();
  ON_CALL(*runtime, ExposesComponentTree()).WillByDefault(Return(true));
  ON_CALL(*runtime, GetInternalsVersion()).WillByDefault(Return("8.0"));
  EXPECT_CALL(*runtime, ReadComponentStates())
      .WillOnce(Throw(std::runtime_error("field layout changed")));

  HostRuntimeIntrospector introspector(runtime);
  auto result = introspector.IntrospectTree();

  ASSERT_FALSE(Util::isOk(result));
  EXPECT_EQ(Util::getError(result).code, Error::INTROSPECTION_FAILED);
  EXPECT_NE(Util::getError(result).message.find("field layout changed"),
            std::string::npos);
}
