#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "network.hpp"

using namespace std;
using namespace fwtrust;

TEST(NetworkTest, ParsesIpv4Host)
{
    Network net("10.0.0.1");

    EXPECT_EQ(Network::IPV4, net.get_family());
    EXPECT_TRUE(net.is_host());
    EXPECT_EQ(-1, net.get_cidr());
    EXPECT_EQ("10.0.0.1", net.get_member());
}

TEST(NetworkTest, FullMaskIsHost)
{
    Network v4("10.0.0.1/32");
    Network v6("fe80::1/128");

    EXPECT_TRUE(v4.is_host());
    EXPECT_EQ("10.0.0.1", v4.get_member());
    EXPECT_TRUE(v6.is_host());
    EXPECT_EQ("fe80::1", v6.get_member());
}

TEST(NetworkTest, NetworkIsCanonicalized)
{
    Network net("10.0.0.5/24");

    EXPECT_EQ(Network::IPV4, net.get_family());
    EXPECT_FALSE(net.is_host());
    EXPECT_EQ(24, net.get_cidr());
    EXPECT_EQ("10.0.0.0/24", net.get_member());
    EXPECT_EQ("10.0.0.5/24", net.get_original());
}

TEST(NetworkTest, DottedNetmask)
{
    Network net("192.168.7.9/255.255.255.0");
    Network bad("192.168.7.9/255.0.255.0");

    EXPECT_EQ("192.168.7.0/24", net.get_member());
    EXPECT_EQ(Network::UNKNOWN, bad.get_family());
}

TEST(NetworkTest, Ipv6Network)
{
    Network net("2001:DB8::1/32");

    EXPECT_EQ(Network::IPV6, net.get_family());
    EXPECT_FALSE(net.is_host());
    EXPECT_EQ("2001:db8::/32", net.get_member());
}

TEST(NetworkTest, HostnamesAreUnknown)
{
    Network net;

    EXPECT_FALSE(net.parse("www.example.com"));
    EXPECT_EQ(Network::UNKNOWN, net.get_family());
    EXPECT_FALSE(net.is_host());
    EXPECT_EQ("www.example.com", net.get_member());
}

TEST(NetworkTest, BadPrefixIsUnknown)
{
    EXPECT_EQ(Network::UNKNOWN, Network("10.0.0.0/33").get_family());
    EXPECT_EQ(Network::UNKNOWN, Network("10.0.0.0/").get_family());
    EXPECT_EQ(Network::UNKNOWN, Network("2001:db8::/129").get_family());
}

TEST(NetworkTest, AnySentinels)
{
    bool ipv4, ipv6;

    EXPECT_TRUE(Network::is_any_sentinel("ANY", ipv4, ipv6));
    EXPECT_TRUE(ipv4);
    EXPECT_TRUE(ipv6);
    EXPECT_TRUE(Network::is_any_sentinel("all", ipv4, ipv6));
    EXPECT_TRUE(ipv4);
    EXPECT_TRUE(ipv6);
    EXPECT_TRUE(Network::is_any_sentinel("0.0.0.0/0", ipv4, ipv6));
    EXPECT_TRUE(ipv4);
    EXPECT_FALSE(ipv6);
    EXPECT_TRUE(Network::is_any_sentinel("::/0", ipv4, ipv6));
    EXPECT_FALSE(ipv4);
    EXPECT_TRUE(ipv6);
    EXPECT_FALSE(Network::is_any_sentinel("10.0.0.0/8", ipv4, ipv6));
}

TEST(NetworkTest, NormalizeSplitsAndDeduplicates)
{
    vector<string> input, output;

    input.push_back("10.0.0.1, 10.0.0.2");
    input.push_back("10.0.0.1");
    input.push_back(" 192.168.1.0/24 ");

    normalize_networks(input, output);
    ASSERT_EQ(3u, output.size());
    EXPECT_EQ("10.0.0.1", output[0]);
    EXPECT_EQ("10.0.0.2", output[1]);
    EXPECT_EQ("192.168.1.0/24", output[2]);
}

TEST(NetworkGroupsTest, ClassifiesByFamily)
{
    vector<string> input;
    NetworkGroups groups;

    input.push_back("10.0.0.1 10.0.0.0/24");
    input.push_back("2001:db8::/64");
    input.push_back("host.example.com");

    groups.classify(input);
    EXPECT_FALSE(groups.is_open());
    EXPECT_EQ(2u, groups.get(Network::IPV4).size());
    EXPECT_EQ(1u, groups.get(Network::IPV6).size());
    ASSERT_EQ(1u, groups.get(Network::UNKNOWN).size());
    EXPECT_EQ("host.example.com",
              groups.get(Network::UNKNOWN)[0].get_original());
    EXPECT_EQ(4u, groups.get_originals().size());
}

TEST(NetworkGroupsTest, SameMemberOnlyOnce)
{
    vector<string> input;
    NetworkGroups groups;

    input.push_back("10.0.0.1");
    input.push_back("10.0.0.1/32");

    groups.classify(input);
    EXPECT_EQ(1u, groups.get(Network::IPV4).size());
}

TEST(NetworkGroupsTest, SentinelOpensRule)
{
    vector<string> input;
    NetworkGroups groups;

    input.push_back("10.0.0.1");
    input.push_back("0.0.0.0/0");

    groups.classify(input);
    EXPECT_TRUE(groups.is_open());
    EXPECT_TRUE(groups.is_open(Network::IPV4));
    EXPECT_FALSE(groups.is_open(Network::IPV6));
    EXPECT_TRUE(groups.empty(Network::IPV4));
}

TEST(NetworkGroupsTest, ZeroPrefixOpensFamily)
{
    vector<string> input;
    NetworkGroups groups;

    input.push_back("2001:db8::/0");

    groups.classify(input);
    EXPECT_TRUE(groups.is_open(Network::IPV6));
    EXPECT_FALSE(groups.is_open(Network::IPV4));
}

TEST(NetworkGroupsTest, OpenRuleKeepsHostnames)
{
    vector<string> input;
    NetworkGroups groups;

    input.push_back("any, 10.0.0.1, host.example.com");

    groups.classify(input);
    EXPECT_TRUE(groups.is_open());
    EXPECT_TRUE(groups.empty(Network::IPV4));
    ASSERT_EQ(1u, groups.get(Network::UNKNOWN).size());
    EXPECT_EQ("host.example.com",
              groups.get(Network::UNKNOWN)[0].get_original());
}

TEST(NetworkGroupsTest, OpenFamilyIgnoresOtherFamilyEntries)
{
    vector<string> input;
    NetworkGroups groups;

    input.push_back("0.0.0.0/0 10.1.1.1 2001:db8::/32");

    groups.classify(input);
    EXPECT_TRUE(groups.is_open(Network::IPV4));
    EXPECT_FALSE(groups.is_open(Network::IPV6));
    EXPECT_TRUE(groups.empty(Network::IPV6));
    ASSERT_EQ(1u, groups.get_ignored().size());
    EXPECT_EQ("2001:db8::/32", groups.get_ignored()[0].get_original());
}
