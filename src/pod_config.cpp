#include "pod_config.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstring>
#include <stdexcept>

namespace tproxy {

namespace {

template<typename T, typename Source, typename Convert>
void fillItems(T (&items)[kMaxItemLen], const std::vector<Source>& values,
               const std::string& what, Convert convert) {
    if (values.size() > kMaxItemLen) {
        throw std::length_error("Too many " + what + ": " + std::to_string(values.size()) +
                                " (maximum " + std::to_string(kMaxItemLen) + ")");
    }
    for (std::size_t i = 0; i < kMaxItemLen; ++i) {
        items[i] = i < values.size() ? convert(values[i]) : T{};
    }
}

uint16_t identity(uint16_t port) {
    return port;
}

} // namespace

std::vector<uint8_t> PodConfig::toBytes() const {
    std::vector<uint8_t> bytes(sizeof(PodConfig));
    std::memcpy(bytes.data(), this, sizeof(PodConfig));
    return bytes;
}

Cidr parseCidr(const std::string& text) {
    std::string address = text;
    int prefix = 32;

    // A bare address is a single host
    size_t slash_pos = text.find('/');
    if (slash_pos != std::string::npos) {
        address = text.substr(0, slash_pos);
        std::string prefix_str = text.substr(slash_pos + 1);
        if (prefix_str.empty() || prefix_str.size() > 2 ||
            prefix_str.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Invalid prefix length in range: " + text);
        }
        prefix = std::stoi(prefix_str);
        if (prefix > 32) {
            throw std::invalid_argument("Prefix length must be between 0-32: " + text);
        }
    }

    in_addr parsed{};
    if (inet_pton(AF_INET, address.c_str(), &parsed) != 1) {
        throw std::invalid_argument("Invalid IPv4 address in range: " + text);
    }

    Cidr cidr;
    cidr.net = parsed.s_addr;  // already in network byte order
    cidr.mask = static_cast<uint8_t>(prefix);
    return cidr;
}

PodConfigBuilder& PodConfigBuilder::statusPort(uint16_t port) {
    config_.status_port = port;
    return *this;
}

PodConfigBuilder& PodConfigBuilder::excludeOutRanges(const std::vector<std::string>& ranges) {
    fillItems(config_.exclude_out_ranges, ranges, "excluded outbound ranges", parseCidr);
    return *this;
}

PodConfigBuilder& PodConfigBuilder::includeOutRanges(const std::vector<std::string>& ranges) {
    fillItems(config_.include_out_ranges, ranges, "included outbound ranges", parseCidr);
    return *this;
}

PodConfigBuilder& PodConfigBuilder::includeInPorts(const std::vector<uint16_t>& ports) {
    fillItems(config_.include_in_ports, ports, "included inbound ports", identity);
    return *this;
}

PodConfigBuilder& PodConfigBuilder::includeOutPorts(const std::vector<uint16_t>& ports) {
    fillItems(config_.include_out_ports, ports, "included outbound ports", identity);
    return *this;
}

PodConfigBuilder& PodConfigBuilder::excludeInPorts(const std::vector<uint16_t>& ports) {
    fillItems(config_.exclude_in_ports, ports, "excluded inbound ports", identity);
    return *this;
}

PodConfigBuilder& PodConfigBuilder::excludeOutPorts(const std::vector<uint16_t>& ports) {
    fillItems(config_.exclude_out_ports, ports, "excluded outbound ports", identity);
    return *this;
}

IpMapKey ipToMapKey(const std::string& ip) {
    IpMapKey key{};

    // IPv4 goes into the last four bytes, like an IPv4-mapped address without the ffff marker
    in_addr v4{};
    if (inet_pton(AF_INET, ip.c_str(), &v4) == 1) {
        std::memcpy(key.data() + 12, &v4.s_addr, 4);
        return key;
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, ip.c_str(), &v6) == 1) {
        std::memcpy(key.data(), v6.s6_addr, 16);
        // IPv4-mapped addresses are stored like plain IPv4 addresses
        if (IN6_IS_ADDR_V4MAPPED(&v6)) {
            std::memset(key.data(), 0, 12);
        }
        return key;
    }

    throw std::invalid_argument("error parse ip: " + ip);
}

std::string pinnedMapRelativePath(PinnedMap map) {
    switch (map) {
        case PinnedMap::LocalPodIps:
            return "/tc/globals/local_pod_ips";
        case PinnedMap::MarkPodIps:
            return "/mark_pod_ips";
        default:
            throw std::runtime_error("Unknown pinned map");
    }
}

std::string pinnedMapPath(const std::string& bpffs_path, PinnedMap map) {
    std::string root = bpffs_path;
    while (root.size() > 1 && root.back() == '/') {
        root.pop_back();
    }
    if (root == "/") {
        root.clear();
    }
    return root + pinnedMapRelativePath(map);
}

std::string pinnedMapPath(const EbpfConfig& config, PinnedMap map) {
    return pinnedMapPath(config.bpffs_path, map);
}

} // namespace tproxy
