#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "address_set.hpp"

using namespace std;
using namespace fwtrust;

TEST(AddressSetTest, HostAndNetDoNotMix)
{
    AddressSet hosts("h", AddressSet::HOST, Network::IPV4);
    AddressSet nets("n", AddressSet::NET, Network::IPV4);
    string err;

    EXPECT_TRUE(hosts.add_member(Network("10.0.0.1"), err));
    EXPECT_FALSE(hosts.add_member(Network("10.0.0.0/24"), err));
    EXPECT_FALSE(err.empty());
    EXPECT_TRUE(nets.add_member(Network("10.0.0.0/24"), err));
    EXPECT_FALSE(nets.add_member(Network("10.0.0.2"), err));
    EXPECT_EQ(1u, hosts.get_members().size());
    EXPECT_EQ(1u, nets.get_members().size());
}

TEST(AddressSetTest, FamilyMustMatch)
{
    AddressSet set("h", AddressSet::HOST, Network::IPV4);
    string err;

    EXPECT_FALSE(set.add_member(Network("2001:db8::1"), err));
    EXPECT_FALSE(set.add_member(Network("host.example.com"), err));
    EXPECT_TRUE(set.empty());
}

TEST(AddressSetTest, IpsetTypes)
{
    AddressSet hosts("h", AddressSet::HOST, Network::IPV4);
    AddressSet nets("n", AddressSet::NET, Network::IPV6);

    EXPECT_EQ("hash:ip", hosts.get_type_string());
    EXPECT_EQ("inet", hosts.get_family_option());
    EXPECT_EQ("hash:net", nets.get_type_string());
    EXPECT_EQ("inet6", nets.get_family_option());
}

class PartitionTest : public ::testing::Test
{
protected:
    virtual void SetUp() {
        vector<string> input;

        input.push_back("10.0.0.1");
        input.push_back("10.0.0.0/24");
        input.push_back("10.0.0.2/32");
        input.push_back("2001:db8::/64");
        input.push_back("host.example.com");
        groups.classify(input);
    }

    NetworkGroups groups;
};

TEST_F(PartitionTest, SplitsHostsFromNets)
{
    vector<AddressSet> sets;

    partition_networks(groups, Network::IPV4, "trust", sets);
    ASSERT_EQ(2u, sets.size());

    EXPECT_EQ(AddressSet::HOST, sets[0].get_kind());
    EXPECT_EQ(2u, sets[0].get_members().size());
    EXPECT_EQ(1u, sets[0].get_members().count("10.0.0.1"));
    EXPECT_EQ(1u, sets[0].get_members().count("10.0.0.2"));

    EXPECT_EQ(AddressSet::NET, sets[1].get_kind());
    EXPECT_EQ(1u, sets[1].get_members().size());
    EXPECT_EQ(1u, sets[1].get_members().count("10.0.0.0/24"));

    EXPECT_NE(sets[0].get_name(), sets[1].get_name());
}

TEST_F(PartitionTest, EmptyKindsAreSkipped)
{
    vector<AddressSet> sets;

    partition_networks(groups, Network::IPV6, "trust", sets);
    ASSERT_EQ(1u, sets.size());
    EXPECT_EQ(AddressSet::NET, sets[0].get_kind());
    EXPECT_EQ(Network::IPV6, sets[0].get_family());
}

TEST_F(PartitionTest, HostnamesNeverBecomeMembers)
{
    vector<AddressSet> sets;

    partition_networks(groups, Network::UNKNOWN, "trust", sets);
    EXPECT_TRUE(sets.empty());

    partition_networks(groups, Network::IPV4, "trust", sets);
    partition_networks(groups, Network::IPV6, "trust", sets);
    for (size_t i = 0; i < sets.size(); i++) {
        EXPECT_EQ(0u, sets[i].get_members().count("host.example.com"));
    }
}

TEST(PartitionOpenTest, OpenFamilyHasNoSets)
{
    vector<string> input;
    vector<AddressSet> sets;
    NetworkGroups groups;

    input.push_back("10.0.0.1");
    input.push_back("any");
    groups.classify(input);

    partition_networks(groups, Network::IPV4, "trust", sets);
    partition_networks(groups, Network::IPV6, "trust", sets);
    EXPECT_TRUE(sets.empty());
}
