#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "plan.hpp"

using namespace std;
using namespace fwtrust;

static AddressSet
make_set(const string& name, const string& member)
{
    AddressSet set(name, AddressSet::HOST, Network::IPV4);
    string err;

    set.add_member(Network(member), err);
    return set;
}

static Service
make_service(const string& name, const string& port)
{
    vector<Port> ports;

    ports.push_back(Port(port, "tcp"));
    return Service(name, ports);
}

static size_t
position(const vector<Plan::Ref>& refs, const Plan::Ref& ref)
{
    size_t i;

    for (i = 0; i < refs.size(); i++) {
        if (refs[i] == ref)
            break;
    }
    return i;
}

TEST(PlanTest, SameObjectIsRequestedOnce)
{
    Plan plan;
    string err;

    EXPECT_TRUE(plan.add_set(make_set("s1", "10.0.0.1"), err));
    EXPECT_TRUE(plan.add_set(make_set("s1", "10.0.0.1"), err));
    EXPECT_TRUE(plan.add_service(make_service("svc", "80"), err));
    EXPECT_TRUE(plan.add_service(make_service("svc", "80"), err));

    EXPECT_EQ(1u, plan.count(Plan::IPSET));
    EXPECT_EQ(1u, plan.count(Plan::SERVICE));
    EXPECT_EQ(2u, plan.get_refs().size());
}

TEST(PlanTest, ConflictingObjectsAreRejected)
{
    Plan plan;
    string err;

    EXPECT_TRUE(plan.add_set(make_set("s1", "10.0.0.1"), err));
    EXPECT_FALSE(plan.add_set(make_set("s1", "10.0.0.2"), err));
    EXPECT_NE(string::npos, err.find("s1"));

    err.clear();
    EXPECT_TRUE(plan.add_service(make_service("svc", "80"), err));
    EXPECT_FALSE(plan.add_service(make_service("svc", "443"), err));
    EXPECT_FALSE(err.empty());
}

TEST(PlanTest, ZoneBoundServiceType)
{
    Plan plan;
    Service service = make_service("svc", "22");
    string err;

    service.set_zone("public");
    EXPECT_TRUE(plan.add_service(service, err));
    EXPECT_EQ(1u, plan.count(Plan::ZONE_SERVICE));
    EXPECT_EQ(0u, plan.count(Plan::SERVICE));
    EXPECT_EQ("zone-service", Plan::type_string(Plan::ZONE_SERVICE));
}

TEST(PlanTest, OrderFollowsEdges)
{
    Plan plan;
    Rule rule("r1", Rule::TCP, Network::IPV4, "trusted");
    vector<Plan::Ref> refs;
    string err;

    rule.set_source("s1");
    rule.set_service("svc");

    // the rule is added first on purpose
    ASSERT_TRUE(plan.add_rule(rule, err));
    ASSERT_TRUE(plan.add_set(make_set("s1", "10.0.0.1"), err));
    ASSERT_TRUE(plan.add_service(make_service("svc", "80"), err));
    plan.add_edge(Plan::Ref(Plan::IPSET, "s1"), Plan::Ref(Plan::RICH_RULE, "r1"));
    plan.add_edge(Plan::Ref(Plan::SERVICE, "svc"),
                  Plan::Ref(Plan::RICH_RULE, "r1"));
    plan.add_edge(Plan::Ref(Plan::SERVICE, "svc"),
                  Plan::Ref(Plan::RICH_RULE, "r1"));
    EXPECT_EQ(2u, plan.get_edges().size());

    ASSERT_TRUE(plan.ordered(refs, err)) << err;
    ASSERT_EQ(3u, refs.size());
    EXPECT_EQ(Plan::IPSET, refs[0].type);
    EXPECT_EQ(Plan::SERVICE, refs[1].type);
    EXPECT_EQ(Plan::RICH_RULE, refs[2].type);
    EXPECT_TRUE(plan.is_before(Plan::Ref(Plan::SERVICE, "svc"),
                               Plan::Ref(Plan::RICH_RULE, "r1")));
    EXPECT_FALSE(plan.is_before(Plan::Ref(Plan::RICH_RULE, "r1"),
                                Plan::Ref(Plan::IPSET, "s1")));
}

TEST(PlanTest, UnrelatedRequestsKeepInsertionOrder)
{
    Plan plan;
    vector<Plan::Ref> refs;
    string err;

    ASSERT_TRUE(plan.add_set(make_set("b", "10.0.0.2"), err));
    ASSERT_TRUE(plan.add_set(make_set("a", "10.0.0.1"), err));
    ASSERT_TRUE(plan.add_service(make_service("svc", "80"), err));

    ASSERT_TRUE(plan.ordered(refs, err)) << err;
    ASSERT_EQ(3u, refs.size());
    EXPECT_EQ("b", refs[0].name);
    EXPECT_EQ("a", refs[1].name);
    EXPECT_EQ("svc", refs[2].name);
}

TEST(PlanTest, CycleIsReported)
{
    Plan plan;
    vector<Plan::Ref> refs;
    string err;

    ASSERT_TRUE(plan.add_set(make_set("a", "10.0.0.1"), err));
    ASSERT_TRUE(plan.add_set(make_set("b", "10.0.0.2"), err));
    plan.add_edge(Plan::Ref(Plan::IPSET, "a"), Plan::Ref(Plan::IPSET, "b"));
    plan.add_edge(Plan::Ref(Plan::IPSET, "b"), Plan::Ref(Plan::IPSET, "a"));

    EXPECT_FALSE(plan.ordered(refs, err));
    EXPECT_NE(string::npos, err.find("cycle"));
}

TEST(PlanTest, MergeCarriesEverything)
{
    Plan a, b;
    vector<Plan::Ref> refs;
    string err;
    Rule rule("r1", Rule::UDP, Network::IPV4, "trusted");

    rule.set_source("s1");
    ASSERT_TRUE(a.add_set(make_set("s1", "10.0.0.1"), err));
    a.add_warning("first");

    ASSERT_TRUE(b.add_set(make_set("s1", "10.0.0.1"), err));
    ASSERT_TRUE(b.add_rule(rule, err));
    b.add_edge(Plan::Ref(Plan::IPSET, "s1"), Plan::Ref(Plan::RICH_RULE, "r1"));
    b.add_warning("second");

    ASSERT_TRUE(a.merge(b, err)) << err;
    EXPECT_EQ(1u, a.count(Plan::IPSET));
    EXPECT_EQ(1u, a.count(Plan::RICH_RULE));
    EXPECT_EQ(1u, a.get_edges().size());
    ASSERT_EQ(2u, a.get_warnings().size());
    EXPECT_EQ("second", a.get_warnings()[1]);

    ASSERT_TRUE(a.ordered(refs, err)) << err;
    EXPECT_LT(position(refs, Plan::Ref(Plan::IPSET, "s1")),
              position(refs, Plan::Ref(Plan::RICH_RULE, "r1")));
}

TEST(PlanTest, MergeConflictFails)
{
    Plan a, b;
    string err;

    ASSERT_TRUE(a.add_set(make_set("s1", "10.0.0.1"), err));
    ASSERT_TRUE(b.add_set(make_set("s1", "10.0.0.9"), err));
    EXPECT_FALSE(a.merge(b, err));
    EXPECT_FALSE(err.empty());
}

TEST(PlanTest, FailedMergeLeavesPlanUntouched)
{
    Plan a, b;
    string err;

    ASSERT_TRUE(a.add_set(make_set("s1", "10.0.0.1"), err));
    a.add_warning("first");

    ASSERT_TRUE(b.add_set(make_set("s2", "10.0.0.2"), err));
    ASSERT_TRUE(b.add_set(make_set("s1", "10.0.0.9"), err));
    b.add_edge(Plan::Ref(Plan::IPSET, "s2"), Plan::Ref(Plan::IPSET, "s1"));
    b.add_warning("second");

    EXPECT_FALSE(a.merge(b, err));
    EXPECT_EQ(1u, a.count(Plan::IPSET));
    EXPECT_TRUE(a.find_set("s2") == NULL);
    EXPECT_TRUE(a.get_edges().empty());
    EXPECT_EQ(1u, a.get_warnings().size());
}

TEST(PlanTest, ConflictNamesBothRules)
{
    Plan plan;
    Rule first("rule_11_allow_ssh_ipv4", Rule::TCP, Network::IPV4, "trusted");
    Rule second("rule_11_allow_ssh_ipv4", Rule::UDP, Network::IPV4, "trusted");
    string err;

    first.set_origin("allow ssh");
    second.set_origin("allow_ssh");
    ASSERT_TRUE(plan.add_rule(first, err));
    EXPECT_FALSE(plan.add_rule(second, err));
    EXPECT_NE(string::npos, err.find("rules [allow ssh] and [allow_ssh]"));

    second.set_origin("allow ssh");
    EXPECT_FALSE(plan.add_rule(second, err));
    EXPECT_NE(string::npos, err.find("defined twice"));
}
