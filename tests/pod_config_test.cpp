#include "pod_config.hpp"
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <cstring>
#include <stdexcept>

namespace tproxy {
namespace {

TEST(PodConfigTest, RecordLayout) {
    PodConfig config;
    EXPECT_EQ(sizeof(PodConfig), 244u);
    EXPECT_EQ(config.toBytes().size(), 244u);
}

TEST(PodConfigTest, DefaultRecordIsZero) {
    std::vector<uint8_t> bytes = PodConfig{}.toBytes();
    for (uint8_t byte : bytes) {
        EXPECT_EQ(byte, 0);
    }
}

TEST(PodConfigTest, ParseCidr) {
    Cidr cidr = parseCidr("10.0.0.0/8");
    EXPECT_EQ(cidr.net, htonl(0x0a000000));
    EXPECT_EQ(cidr.mask, 8);

    Cidr host = parseCidr("192.168.1.1");
    EXPECT_EQ(host.net, htonl(0xc0a80101));
    EXPECT_EQ(host.mask, 32);

    EXPECT_THROW(parseCidr("10.0.0.0/33"), std::invalid_argument);
    EXPECT_THROW(parseCidr("10.0.0.0/"), std::invalid_argument);
    EXPECT_THROW(parseCidr("10.0.0/8"), std::invalid_argument);
    EXPECT_THROW(parseCidr("fd00::/8"), std::invalid_argument);
}

TEST(PodConfigTest, BuilderFillsFieldsInOrder) {
    PodConfig config = PodConfigBuilder()
                           .statusPort(9901)
                           .excludeOutRanges({"10.0.0.0/8"})
                           .includeInPorts({80, 443})
                           .excludeOutPorts({22})
                           .build();

    EXPECT_EQ(config.status_port, 9901);
    EXPECT_EQ(config.exclude_out_ranges[0].mask, 8);
    EXPECT_EQ(config.exclude_out_ranges[1].mask, 0);
    EXPECT_EQ(config.include_in_ports[0], 80);
    EXPECT_EQ(config.include_in_ports[1], 443);
    EXPECT_EQ(config.include_in_ports[2], 0);
    EXPECT_EQ(config.exclude_out_ports[0], 22);

    std::vector<uint8_t> bytes = config.toBytes();
    uint16_t status_port = 0;
    std::memcpy(&status_port, bytes.data(), sizeof(status_port));
    EXPECT_EQ(status_port, 9901);

    uint8_t mask = bytes[4 + 4];
    EXPECT_EQ(mask, 8);

    uint16_t first_in_port = 0;
    std::memcpy(&first_in_port, bytes.data() + 164, sizeof(first_in_port));
    EXPECT_EQ(first_in_port, 80);

    uint16_t first_excluded_out_port = 0;
    std::memcpy(&first_excluded_out_port, bytes.data() + 224, sizeof(first_excluded_out_port));
    EXPECT_EQ(first_excluded_out_port, 22);
}

TEST(PodConfigTest, BuilderRejectsTooManyItems) {
    std::vector<uint16_t> ports(kMaxItemLen + 1, 80);
    EXPECT_THROW(PodConfigBuilder().includeOutPorts(ports), std::length_error);

    std::vector<std::string> ranges(kMaxItemLen + 1, "10.0.0.0/8");
    EXPECT_THROW(PodConfigBuilder().includeOutRanges(ranges), std::length_error);

    std::vector<uint16_t> max_ports(kMaxItemLen, 80);
    EXPECT_NO_THROW(PodConfigBuilder().includeOutPorts(max_ports));
}

TEST(PodConfigTest, IpToMapKey) {
    IpMapKey v4 = ipToMapKey("10.1.2.3");
    IpMapKey expected_v4{};
    expected_v4[12] = 10;
    expected_v4[13] = 1;
    expected_v4[14] = 2;
    expected_v4[15] = 3;
    EXPECT_EQ(v4, expected_v4);

    EXPECT_EQ(ipToMapKey("::ffff:10.1.2.3"), expected_v4);

    IpMapKey v6 = ipToMapKey("fd00::1");
    EXPECT_EQ(v6[0], 0xfd);
    EXPECT_EQ(v6[15], 0x01);

    try {
        ipToMapKey("not-an-ip");
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "error parse ip: not-an-ip");
    }
}

TEST(PodConfigTest, PinnedMapPaths) {
    EXPECT_EQ(pinnedMapPath("/run/kuma/bpf", PinnedMap::LocalPodIps),
              "/run/kuma/bpf/tc/globals/local_pod_ips");
    EXPECT_EQ(pinnedMapPath("/run/kuma/bpf/", PinnedMap::MarkPodIps), "/run/kuma/bpf/mark_pod_ips");
    EXPECT_EQ(pinnedMapPath("/", PinnedMap::MarkPodIps), "/mark_pod_ips");

    EbpfConfig config;
    config.bpffs_path = "/sys/fs/bpf/";
    EXPECT_EQ(pinnedMapPath(config, PinnedMap::LocalPodIps), "/sys/fs/bpf/tc/globals/local_pod_ips");
}

} // namespace
} // namespace tproxy
