#include <sysdoc_connect/service_connector.hpp>
#include <gtest/gtest.h>

using namespace sysdoc_connect;

class ServiceConnectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        orders_.tag = "orders";
        orders_.project_name = "Orders";
        orders_.provided_apis = {
            { "com.y.orders.api", "GET", "/orders/{id}" },
            { "com.y.orders.api", "POST", "/orders" },
        };

        shop_.tag = "shop";
        shop_.project_name = "Shop";
        shop_.provided_apis = { { "com.x.shop.api", "GET", "/cart" } };
    }

    sysdoc_model::ApiMetadata orders_;
    sysdoc_model::ApiMetadata shop_;
    const std::string default_service_ = "[default-service]";
};

// Path matching
TEST(PathMatchesTest, Placeholders) {
    EXPECT_TRUE(path_matches("/orders/{id}", "/orders/42"));
    EXPECT_TRUE(path_matches("/orders/42", "/orders/{orderId}"));
    EXPECT_FALSE(path_matches("/orders/{id}", "/orders/42/items"));
    EXPECT_FALSE(path_matches("/orders/{id}", "/invoices/42"));
}

TEST(PathMatchesTest, IgnoresSlashesAndQuery) {
    EXPECT_TRUE(path_matches("/orders/", "orders"));
    EXPECT_TRUE(path_matches("/orders", "/orders?page=2"));
    EXPECT_TRUE(path_matches("/", ""));
    EXPECT_FALSE(path_matches("/Orders", "/orders"));
}

// Connecting services
TEST_F(ServiceConnectorTest, NamedServiceIsMatched) {
    shop_.consumed_apis = { { "com.x.shop.client", "orders", "get", "/orders/42" } };

    const auto deps = connect_services({ orders_, shop_ }, default_service_);

    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0].service_package, "com.x.shop.client");
    EXPECT_EQ(deps[0].depends_on_package, "com.y.orders.api");
    EXPECT_EQ(deps[0].service, "Shop");
    EXPECT_EQ(deps[0].depends_on, "Orders");
    EXPECT_EQ(deps[0].method, "get");
    EXPECT_EQ(deps[0].path, "/orders/42");
}

TEST_F(ServiceConnectorTest, UnnamedServiceSearchesOtherUnits) {
    shop_.consumed_apis = {
        { "com.x.shop.client", "", "POST", "/orders" },
        { "com.x.shop.client", default_service_, "GET", "/cart" },
    };

    const auto deps = connect_services({ orders_, shop_ }, default_service_);

    ASSERT_EQ(deps.size(), 2u);
    EXPECT_EQ(deps[0].depends_on, "Orders");
    // its own endpoint is not a provider for an unnamed call
    EXPECT_EQ(deps[1].depends_on, default_service_);
    EXPECT_EQ(deps[1].depends_on_package, default_service_);
}

TEST_F(ServiceConnectorTest, UnknownNamedServiceIsExternal) {
    shop_.consumed_apis = { { "com.x.shop.weather", "Weather", "GET", "/forecast" } };

    const auto deps = connect_services({ orders_, shop_ }, default_service_);

    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0].depends_on, sysdoc_model::external_service);
    EXPECT_EQ(deps[0].depends_on_package, sysdoc_model::external_service);
    EXPECT_EQ(deps[0].service, "Shop");
}

TEST_F(ServiceConnectorTest, MethodMustMatch) {
    shop_.consumed_apis = { { "com.x.shop.client", "Orders", "DELETE", "/orders/1" } };

    const auto deps = connect_services({ orders_, shop_ }, default_service_);

    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0].depends_on, sysdoc_model::external_service);
}

TEST_F(ServiceConnectorTest, NoConsumedApisNoDependencies) {
    EXPECT_TRUE(connect_services({ orders_, shop_ }, default_service_).empty());
    EXPECT_TRUE(connect_services({}, default_service_).empty());
}
