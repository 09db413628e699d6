/**
 * @file pod_config.hpp
 * @brief Per-pod redirection record exchanged with the BPF loader programs
 * @author tproxy-compose Development Team
 * @date 2024
 *
 * The layout below is a compatibility contract with the external loader
 * programs, which reserve exactly 244 bytes per map value:
 *
 *   Cidr:                                        8 bytes
 *     net  (network byte order)                  4 bytes
 *     mask                                       1 byte
 *     pad                                        3 bytes
 *
 *   PodConfig:                                 244 bytes
 *     status_port                                2 bytes
 *     pad                                        2 bytes
 *     exclude_out_ranges (10 x Cidr)            80 bytes
 *     include_out_ranges (10 x Cidr)            80 bytes
 *     include_in_ports   (10 x 2 bytes)         20 bytes
 *     include_out_ports  (10 x 2 bytes)         20 bytes
 *     exclude_in_ports   (10 x 2 bytes)         20 bytes
 *     exclude_out_ports  (10 x 2 bytes)         20 bytes
 *
 * Do not change the field order, the padding or kMaxItemLen independently
 * of the loader programs.
 */

#pragma once

#include "config.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tproxy {

/// Maximal amount of ranges or ports per category
constexpr std::size_t kMaxItemLen = 10;

/**
 * @struct Cidr
 * @brief IPv4 address range
 */
struct Cidr {
    uint32_t net = 0;    ///< Network address in network byte order
    uint8_t mask = 0;    ///< Prefix length
    uint8_t pad[3] = {0, 0, 0};
};

/**
 * @struct PodConfig
 * @brief Map value describing which traffic of a pod is intercepted
 *
 * Unused entries are zero. Ports are stored in host byte order.
 */
struct PodConfig {
    uint16_t status_port = 0;
    uint16_t pad = 0;
    Cidr exclude_out_ranges[kMaxItemLen] = {};
    Cidr include_out_ranges[kMaxItemLen] = {};
    uint16_t include_in_ports[kMaxItemLen] = {};
    uint16_t include_out_ports[kMaxItemLen] = {};
    uint16_t exclude_in_ports[kMaxItemLen] = {};
    uint16_t exclude_out_ports[kMaxItemLen] = {};

    /**
     * @brief Serialize the record in field order
     * @return Exactly sizeof(PodConfig) bytes
     */
    std::vector<uint8_t> toBytes() const;
};

static_assert(sizeof(Cidr) == 8, "Cidr must be 8 bytes");
static_assert(offsetof(Cidr, mask) == 4, "Cidr.mask must follow the 4 byte address");
static_assert(sizeof(PodConfig) == 244, "PodConfig must be 244 bytes");
static_assert(offsetof(PodConfig, exclude_out_ranges) == 4, "unexpected PodConfig layout");
static_assert(offsetof(PodConfig, include_out_ranges) == 84, "unexpected PodConfig layout");
static_assert(offsetof(PodConfig, include_in_ports) == 164, "unexpected PodConfig layout");
static_assert(offsetof(PodConfig, include_out_ports) == 184, "unexpected PodConfig layout");
static_assert(offsetof(PodConfig, exclude_in_ports) == 204, "unexpected PodConfig layout");
static_assert(offsetof(PodConfig, exclude_out_ports) == 224, "unexpected PodConfig layout");

/**
 * @brief Parse an IPv4 range such as "10.0.0.0/8"
 * @param text Address with optional prefix length; a bare address means /32
 * @return The parsed range
 * @throws std::invalid_argument if the address or prefix length is malformed
 */
Cidr parseCidr(const std::string& text);

/**
 * @class PodConfigBuilder
 * @brief Fills a PodConfig from lists, enforcing kMaxItemLen
 */
class PodConfigBuilder {
public:
    PodConfigBuilder& statusPort(uint16_t port);

    /**
     * @throws std::invalid_argument for malformed ranges
     * @throws std::length_error for more than kMaxItemLen ranges
     */
    PodConfigBuilder& excludeOutRanges(const std::vector<std::string>& ranges);
    PodConfigBuilder& includeOutRanges(const std::vector<std::string>& ranges);

    /**
     * @throws std::length_error for more than kMaxItemLen ports
     */
    PodConfigBuilder& includeInPorts(const std::vector<uint16_t>& ports);
    PodConfigBuilder& includeOutPorts(const std::vector<uint16_t>& ports);
    PodConfigBuilder& excludeInPorts(const std::vector<uint16_t>& ports);
    PodConfigBuilder& excludeOutPorts(const std::vector<uint16_t>& ports);

    const PodConfig& build() const { return config_; }

private:
    PodConfig config_;
};

/// 16 byte key of the local pod IPs map
using IpMapKey = std::array<uint8_t, 16>;

/**
 * @brief Convert an IP address to the key of the local pod IPs map
 *
 * IPv6 addresses are used as-is; IPv4 addresses occupy the last four bytes
 * and the first twelve bytes are zero.
 *
 * @throws std::invalid_argument("error parse ip: <ip>") for malformed input
 */
IpMapKey ipToMapKey(const std::string& ip);

/**
 * @enum PinnedMap
 * @brief Maps pinned on the BPF filesystem
 */
enum class PinnedMap {
    LocalPodIps,  ///< <bpffs>/tc/globals/local_pod_ips
    MarkPodIps    ///< <bpffs>/mark_pod_ips
};

/**
 * @brief Get the pin path of a map relative to the BPF filesystem root
 *
 * The loader programs hard-code these locations as well.
 */
std::string pinnedMapRelativePath(PinnedMap map);

/**
 * @brief Get the absolute pin path of a map
 * @param bpffs_path BPF filesystem mount point
 */
std::string pinnedMapPath(const std::string& bpffs_path, PinnedMap map);

/**
 * @brief Absolute path of a pinned map below the configured BPF filesystem
 */
std::string pinnedMapPath(const EbpfConfig& config, PinnedMap map);

} // namespace tproxy
