#include "test_support.hpp"
#include <sysdoc_diagrams/diagram_builder.hpp>
#include <sysdoc_diagrams/plantuml_format.hpp>
#include <gtest/gtest.h>

using namespace sysdoc_diagrams;
using sysdoc_test::call;
using sysdoc_test::count_occurrences;
using sysdoc_test::project;

namespace {

const char* default_service = "[default-service]";

} // namespace

class SystemServiceDiagramTest : public ::testing::Test {
protected:
    std::vector<sysdoc_model::ProjectMetadata> projects_ = {
        project("p1", "Cart", "Shop", "Sales"),
        project("p2", "Billing", "Shop", "Finance"),
        project("p3", "Ledger", "Shop", "Finance"),
        project("p4", "Auth", "Platform", "Security"),
    };

    const std::string services_body_ =
        "package \"Platform\" {\n"
        "package \"Security\" {\n"
        "package \"Auth\" {}\n"
        "}\n"
        "}\n\n"
        "package \"Shop\" {\n"
        "package \"Finance\" {\n"
        "package \"Billing\" {}\n"
        "package \"Ledger\" {}\n"
        "}\n"
        "package \"Sales\" {\n"
        "package \"Cart\" {}\n"
        "}\n"
        "}\n\n";
};

// System diagram
TEST_F(SystemServiceDiagramTest, SystemsListDistinctSubsystems) {
    const auto texts = create_system_diagram(projects_);

    ASSERT_EQ(texts.size(), 1u);
    EXPECT_EQ(texts.at("systems.txt"), wrap_diagram(
        "package \"Platform\" {\n"
        "package \"Security\" {}\n"
        "}\n\n"
        "package \"Shop\" {\n"
        "package \"Finance\" {}\n"
        "package \"Sales\" {}\n"
        "}\n\n"));
}

TEST_F(SystemServiceDiagramTest, EmptyInputGivesEmptySystemDiagram) {
    EXPECT_EQ(create_system_diagram({}).at("systems.txt"), wrap_diagram(""));
}

// Service diagram
TEST_F(SystemServiceDiagramTest, ServicesNestedBySystemAndSubsystem) {
    const auto texts = create_service_diagram(projects_, {}, default_service);

    ASSERT_EQ(texts.size(), 1u);
    EXPECT_EQ(texts.at("services.txt"), wrap_diagram(services_body_));
}

TEST_F(SystemServiceDiagramTest, CallsBecomeLabelledEdges) {
    const auto texts = create_service_diagram(projects_, {
        call("com.cart", "com.billing", "Cart", "Billing", "GET", "/invoices/{id}"),
        call("com.billing", "com.ledger", "Billing", "Ledger", "POST", "/entries"),
    }, default_service);

    EXPECT_EQ(texts.at("services.txt"), wrap_diagram(services_body_
        + "\"Cart\"-->\"Billing\" : \"GET : /invoices/{id}\"\n"
        + "\"Billing\"-->\"Ledger\" : \"POST : /entries\"\n"));
}

TEST_F(SystemServiceDiagramTest, ExternalPackageDeclaredOnce) {
    const auto texts = create_service_diagram(projects_, {
        call("com.cart", default_service, "Cart", default_service, "POST", "/notify"),
        call("com.cart", "EXTERNAL", "Cart", "EXTERNAL", "GET", "/rates"),
        call("com.billing", default_service, "Billing", default_service, "GET", "/weather"),
    }, default_service);

    const std::string& services = texts.at("services.txt");
    EXPECT_EQ(count_occurrences(services, "package \"external\" {}\n"), 1u);
    EXPECT_NE(services.find(services_body_ + "package \"external\" {}\n\"Cart\"-->"), std::string::npos);
    EXPECT_EQ(count_occurrences(services, "-->"), 3u);
}

TEST_F(SystemServiceDiagramTest, DefaultMarkerIsConfigurable) {
    const auto dependencies = std::vector<sysdoc_model::CallDependency>{
        call("com.cart", "unknown", "Cart", "somewhere", "GET", "/x") };

    EXPECT_EQ(count_occurrences(create_service_diagram(projects_, dependencies, default_service).at("services.txt"),
        "package \"external\""), 0u);
    EXPECT_EQ(count_occurrences(create_service_diagram(projects_, dependencies, "SOMEWHERE").at("services.txt"),
        "package \"external\""), 1u);
}

TEST_F(SystemServiceDiagramTest, ProjectsKeepInputOrderWithinSubsystem) {
    std::vector<sysdoc_model::ProjectMetadata> reversed(projects_.rbegin(), projects_.rend());
    const std::string services = create_service_diagram(reversed, {}, default_service).at("services.txt");

    EXPECT_LT(services.find("package \"Ledger\" {}"), services.find("package \"Billing\" {}"));
}
