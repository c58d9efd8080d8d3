#include <limits>
#include <stdexcept>
#include <gtest/gtest.h>
#include "ballsim/components/basic.hpp"
#include "ballsim/entities/entity_factory.hpp"

class EntityFactoryTest : public ::testing::Test {
protected:
    entt::registry registry;
};

TEST_F(EntityFactoryTest, CreatesFullComponentSet) {
    auto e = Entities::EntityFactory::createBody(registry,
                                                 Components::Position(1.0, 2.0),
                                                 Components::Velocity(3.0, 4.0),
                                                 2.5, 7.0,
                                                 Components::Color(10, 20, 30));

    ASSERT_TRUE((registry.all_of<Components::Position, Components::Velocity,
                                 Components::Acceleration, Components::Mass,
                                 Components::Radius, Components::Fixed,
                                 Components::Color>(e)));

    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(e).x, 1.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(e).y, 4.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Acceleration>(e).x, 0.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Mass>(e).value, 2.5);
    EXPECT_DOUBLE_EQ(registry.get<Components::Radius>(e).value, 7.0);
    EXPECT_FALSE(registry.get<Components::Fixed>(e).value);
    EXPECT_EQ(registry.get<Components::Color>(e).b, 30);
}

TEST_F(EntityFactoryTest, DefaultBodyIsUnitMassGreenBall) {
    auto e = Entities::EntityFactory::createBody(registry, Components::Position(0.0, 0.0));

    EXPECT_DOUBLE_EQ(registry.get<Components::Mass>(e).value, 1.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Radius>(e).value, 10.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(e).x, 0.0);
    EXPECT_EQ(registry.get<Components::Color>(e).g, 255);
}

TEST_F(EntityFactoryTest, RejectsNonPositiveMassOrRadius) {
    const Components::Position origin(0.0, 0.0);
    const Components::Velocity still(0.0, 0.0);

    EXPECT_THROW(Entities::EntityFactory::createBody(registry, origin, still, 0.0, 10.0),
                 std::invalid_argument);
    EXPECT_THROW(Entities::EntityFactory::createBody(registry, origin, still, -1.0, 10.0),
                 std::invalid_argument);
    EXPECT_THROW(Entities::EntityFactory::createBody(registry, origin, still, 1.0, 0.0),
                 std::invalid_argument);
    EXPECT_THROW(Entities::EntityFactory::createBody(registry, origin, still,
                                                     std::numeric_limits<double>::quiet_NaN(), 10.0),
                 std::invalid_argument);

    // Nothing is created on failure
    EXPECT_EQ(registry.view<Components::Position>().size(), 0u);
}
