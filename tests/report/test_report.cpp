/**
 * @file test_report.cpp
 * @brief Tests for report rows, table rendering and JSON output
 */

#include "cpaudit/report.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace cpaudit::report::test {

namespace {

using catalog::Catalog;

Catalog make_objects()
{
    auto objects = Catalog::load(nlohmann::json::array({
        {{"uid", "h1"},
         {"name", "web-01"},
         {"type", "host"},
         {"ipv4-address", "10.0.0.5"},
         {"comments", "  public web \n"}},
        {{"uid", "n1"},
         {"name", "dmz"},
         {"type", "network"},
         {"subnet4", "10.0.0.0"},
         {"mask-length4", 24}},
        {{"uid", "g1"}, {"name", "web-servers"}, {"type", "group"}, {"members", {"h1", "n1"}}},
        {{"uid", "any"}, {"name", "Any"}, {"type", "CpmiAnyObject"}},
        {{"uid", "accept"}, {"name", "Accept"}, {"type", "RulebaseAction"}},
        {{"uid", "https"}, {"name", "https"}, {"type", "tcp"}, {"port", "443"}},
        {{"uid", "echo"}, {"name", "echo-request"}, {"type", "icmp"}},
        {{"uid", "dns"}, {"name", "domain-udp"}, {"type", "service-udp"}, {"port", "53"}},
        {{"uid", "web"}, {"name", "web-services"}, {"type", "service-group"}, {"members", {"https", "echo"}}},
        {{"uid", "all"}, {"name", "all-services"}, {"type", "service-group"}, {"members", {"web", "dns", "web"}}}
    }));
    EXPECT_TRUE(objects) << objects.error().message;
    return std::move(*objects);
}

const catalog::Entity& entity(const Catalog& objects, const std::string& uid)
{
    return objects.at(*objects.find(uid));
}

}  // namespace

TEST(ReportTest, ObjectRowExtraColumnPerKind)
{
    auto objects = make_objects();

    auto host = object_row(entity(objects, "h1"));
    EXPECT_EQ(host.name, "web-01");
    EXPECT_EQ(host.type, "host");
    EXPECT_EQ(host.extra, "10.0.0.5");
    EXPECT_EQ(host.comment, "public web");
    EXPECT_EQ(host.uid, "h1");

    EXPECT_EQ(object_row(entity(objects, "n1")).extra, "10.0.0.0/24");
    EXPECT_EQ(object_row(entity(objects, "g1")).extra, "Members 2");
    EXPECT_EQ(object_row(entity(objects, "web")).extra, "");
    EXPECT_EQ(object_row(entity(objects, "any")).extra, "");
}

TEST(ReportTest, EndpointNamesCarryNegationMarker)
{
    auto objects = make_objects();
    std::vector<std::string> uids{"h1", "n1"};

    auto plain = endpoint_names(uids, false, objects);
    ASSERT_TRUE(plain);
    EXPECT_EQ(*plain, (std::vector<std::string>{"web-01", "dmz"}));

    auto negated = endpoint_names(uids, true, objects);
    ASSERT_TRUE(negated);
    EXPECT_EQ(*negated, (std::vector<std::string>{"!web-01", "!dmz"}));
}

TEST(ReportTest, ServiceGroupExpandsToMembers)
{
    auto objects = make_objects();
    std::vector<std::string> uids{"web"};
    auto lines = service_descriptions(uids, objects);
    ASSERT_TRUE(lines) << lines.error().message;
    EXPECT_EQ(*lines, (std::vector<std::string>{"https:tcp:443", "echo-request:icmp"}));
}

TEST(ReportTest, NestedServiceGroupsExpandedOnce)
{
    auto objects = make_objects();
    std::vector<std::string> uids{"all"};
    auto lines = service_descriptions(uids, objects);
    ASSERT_TRUE(lines);
    EXPECT_EQ(*lines,
              (std::vector<std::string>{"https:tcp:443",
                                        "echo-request:icmp",
                                        "domain-udp:service-udp:53"}));
}

TEST(ReportTest, UnknownServiceIsError)
{
    auto objects = make_objects();
    std::vector<std::string> uids{"https", "ghost"};
    auto lines = service_descriptions(uids, objects);
    ASSERT_FALSE(lines);
    EXPECT_EQ(lines.error().code, "UnknownReference");
}

TEST(ReportTest, RuleRowResolvesEveryColumn)
{
    auto objects = make_objects();
    acl::AclRule rule;
    rule.number = 12;
    rule.source = {"h1"};
    rule.source_negate = true;
    rule.destination = {"any"};
    rule.service = {"web"};

    auto row = rule_row(rule, objects);
    ASSERT_TRUE(row);
    EXPECT_EQ(row->number, 12);
    EXPECT_EQ(row->source, std::vector<std::string>{"!web-01"});
    EXPECT_EQ(row->destination, std::vector<std::string>{"Any"});
    EXPECT_EQ(row->service.size(), 2U);
}

TEST(ReportTest, RenderTableSplitsMultiLineCells)
{
    Table table{.title = "Rules",
                .headings = {"No.", "Service"},
                .rows = {{"1", "https:tcp:443\necho-request:icmp"}}};
    auto lines = render_table(table);

    std::vector<std::string> expected{
        "Rules",
        "+-----+-------------------+",
        "| No. | Service           |",
        "+-----+-------------------+",
        "| 1   | https:tcp:443     |",
        "|     | echo-request:icmp |",
        "+-----+-------------------+",
    };
    EXPECT_EQ(lines, expected);
}

TEST(ReportTest, RenderTableAlignsUtf8Cells)
{
    Table table{.title = "Sites",
                .headings = {"Name", "Comment"},
                .rows = {{"Zürich-gw", "ok"}, {"core", "Genève"}}};
    auto lines = render_table(table);

    std::vector<std::string> expected{
        "Sites",
        "+-----------+---------+",
        "| Name      | Comment |",
        "+-----------+---------+",
        "| Zürich-gw | ok      |",
        "+-----------+---------+",
        "| core      | Genève  |",
        "+-----------+---------+",
    };
    EXPECT_EQ(lines, expected);
}

TEST(ReportTest, RenderTextHasThreeTitledTables)
{
    AuditReport report{.target = "web-01",
                       .associated = {ObjectRow{.name = "web-01",
                                                .type = "host",
                                                .extra = "10.0.0.5",
                                                .comment = "",
                                                .uid = "h1"}},
                       .outbound = {RuleRow{.number = 3,
                                            .source = {"web-01"},
                                            .destination = {"Any"},
                                            .service = {"https:tcp:443"}}},
                       .inbound = {}};
    auto lines = render_text(report);

    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.front(), "web-01 Belongs To");
    EXPECT_NE(std::ranges::find(lines, std::string{"web-01->Target"}), lines.end());
    EXPECT_NE(std::ranges::find(lines, std::string{"Target->web-01"}), lines.end());
    EXPECT_EQ(std::ranges::count(lines, std::string{}), 2);
    const std::string rule_line = "| 3   | web-01 | Any | https:tcp:443 |";
    EXPECT_NE(std::ranges::find(lines, rule_line), lines.end());
}

TEST(ReportTest, BuildReportFollowsAssociatedOrder)
{
    auto objects = make_objects();
    analyzer::AssociatedSet associated(
        {*objects.find("h1"), *objects.find("n1"), *objects.find("g1")}, objects.size());

    auto report = build_report("web-01", objects, associated, analyzer::Classification{});
    ASSERT_TRUE(report);
    ASSERT_EQ(report->associated.size(), 3U);
    EXPECT_EQ(report->associated[0].uid, "h1");
    EXPECT_EQ(report->associated[1].uid, "n1");
    EXPECT_EQ(report->associated[2].uid, "g1");
    EXPECT_TRUE(report->outbound.empty());
    EXPECT_TRUE(report->inbound.empty());
}

TEST(ReportTest, JsonOutputMirrorsRows)
{
    AuditReport report{.target = "dmz",
                       .associated = {ObjectRow{.name = "dmz",
                                                .type = "network",
                                                .extra = "10.0.0.0/24",
                                                .comment = "perimeter",
                                                .uid = "n1"}},
                       .outbound = {},
                       .inbound = {RuleRow{.number = 7,
                                           .source = {"Any"},
                                           .destination = {"dmz"},
                                           .service = {"echo-request:icmp"}}}};
    auto json = to_json(report);

    EXPECT_EQ(json.at("target"), "dmz");
    ASSERT_EQ(json.at("associated").size(), 1U);
    EXPECT_EQ(json.at("associated").at(0).at("extra"), "10.0.0.0/24");
    EXPECT_TRUE(json.at("outbound").is_array());
    EXPECT_TRUE(json.at("outbound").empty());
    ASSERT_EQ(json.at("inbound").size(), 1U);
    EXPECT_EQ(json.at("inbound").at(0).at("rule_number"), 7);
    EXPECT_EQ(json.at("inbound").at(0).at("service").at(0), "echo-request:icmp");
}

}  // namespace cpaudit::report::test
