#include "test_support.hpp"
#include <sysdoc_diagrams/diagram_builder.hpp>
#include <sysdoc_diagrams/plantuml_format.hpp>
#include <gtest/gtest.h>

using namespace sysdoc_diagrams;
using sysdoc_test::call;
using sysdoc_test::component;
using sysdoc_test::count_occurrences;
using sysdoc_test::module_components;

class ComponentDiagramTest : public ::testing::Test {
protected:
    void SetUp() override {
        shop_ = sysdoc_test::project("s", "Shop");
        shop_.components = { module_components("shop-core", {
            component("com.x.svc", { "com.x.svc.util" }),
            component("com.x.svc.util") }) };

        orders_ = sysdoc_test::project("o", "Orders");
        orders_.components = { module_components("orders", { component("com.y.orders") }) };
    }

    sysdoc_model::ProjectMetadata shop_;
    sysdoc_model::ProjectMetadata orders_;

    const std::string shop_body_ =
        "package \"shop-core\" { \n"
        "[\"com.x.svc\"] \n"
        "[\"com.x.svc.util\"] \n"
        "}\n\n"
        "\n"
        "[\"com.x.svc\"] ..> [\"com.x.svc.util\"] : use \n"
        "\n";
};

TEST_F(ComponentDiagramTest, PerUnitDiagram) {
    const auto texts = create_component_diagrams({ shop_, orders_ }, {});

    ASSERT_TRUE(texts.count("s_plantUML_components.txt"));
    EXPECT_EQ(texts.at("s_plantUML_components.txt"), wrap_diagram(shop_body_));
    ASSERT_TRUE(texts.count("o_plantUML_components.txt"));
    EXPECT_EQ(texts.size(), 3u);
}

TEST_F(ComponentDiagramTest, UnitsWithoutModuleDependencyDataAreIncluded) {
    ASSERT_FALSE(orders_.module_dependencies);
    const auto texts = create_component_diagrams({ orders_ }, {});

    EXPECT_EQ(texts.at("o_plantUML_components.txt"),
        wrap_diagram("package \"orders\" { \n[\"com.y.orders\"] \n}\n\n\n\n"));
}

TEST_F(ComponentDiagramTest, AllComponentsWithoutCallsHasNoCallEdges) {
    const auto texts = create_component_diagrams({ shop_, orders_ }, {});

    const std::string& all = texts.at("all_components.txt");
    EXPECT_EQ(all.rfind("@startuml\n skinparam componentStyle uml2\n\npackage \"service: Shop\" { \n", 0), 0u);
    EXPECT_NE(all.find("package \"service: Orders\" { \n"), std::string::npos);
    EXPECT_EQ(count_occurrences(all, " : call "), 0u);
}

TEST_F(ComponentDiagramTest, AllComponentsAppendsResolvedCalls) {
    const auto texts = create_component_diagrams({ shop_, orders_ }, {
        call("com.y.orders.api.Client", "com.x.svc.util.Helper"),
        call("com.y.orders.api.Client", "com.x.svc.util.Helper"),
        call("com.z.unknown.Caller", "com.x.svc.Service"),
        call("com.y.orders.Sync", "org.other.Lib"),
    });

    const std::string trailer =
        "[\"com.y.orders\"] ..> [\"com.x.svc.util\"] : call \n"
        "[\"com.y.orders\"] ..> [\"EXTERN\"] : call \n";
    const std::string expected_end = "}\n\n" + trailer + end_diagram;

    const std::string& all = texts.at("all_components.txt");
    ASSERT_GE(all.size(), expected_end.size());
    EXPECT_EQ(all.substr(all.size() - expected_end.size()), expected_end);
    EXPECT_EQ(count_occurrences(all, " : call "), 2u);
}

TEST_F(ComponentDiagramTest, CallEdgesOnlyInAllComponents) {
    const auto texts = create_component_diagrams({ shop_, orders_ }, {
        call("com.y.orders.api.Client", "com.x.svc.Service") });

    EXPECT_EQ(count_occurrences(texts.at("s_plantUML_components.txt"), " : call "), 0u);
    EXPECT_EQ(count_occurrences(texts.at("o_plantUML_components.txt"), " : call "), 0u);
    EXPECT_EQ(count_occurrences(texts.at("all_components.txt"), " : call "), 1u);
}

TEST_F(ComponentDiagramTest, ServiceNameFallsBackToTag) {
    auto nameless = sysdoc_test::project("n", "");
    const auto texts = create_component_diagrams({ nameless }, {});

    // registered but empty project name
    EXPECT_NE(texts.at("all_components.txt").find("package \"service: \" { \n"), std::string::npos);

    const auto names = project_names({});
    const std::string nested = nest_in_services({ { "ghost", wrap_diagram("x\n") } }, names);
    EXPECT_EQ(nested, wrap_diagram("package \"service: ghost\" { \nx\n}\n\n"));
}
