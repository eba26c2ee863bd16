#pragma once

#include "providers/hypervisor_provider.hpp"
#include <optional>
#include <string>

namespace cloudvm {
namespace domain_xml {

/// Namespace of the OS hint element stored in <metadata>
extern const char* const METADATA_NS;

/**
 * libvirt domain XML for a definition
 */
std::string build_domain(const DomainDefinition& definition);

/**
 * <disk> device XML, as used for hot/cold attach
 */
std::string build_disk(const DiskDevice& disk);

/**
 * <disk device='cdrom'> without a source, used to eject media
 */
std::string build_empty_cdrom(const std::string& target, const std::string& bus);

/**
 * Transient directory pool XML
 */
std::string build_dir_pool(const std::string& name, const std::string& target_dir);

/**
 * MAC address of the first <interface> in a domain XML document
 * @return Lower-case MAC, nullopt when absent or the XML does not parse
 */
std::optional<std::string> find_mac_address(const std::string& xml);

/**
 * Bus of the cdrom device with the given target, if present
 */
std::optional<std::string> find_cdrom_bus(const std::string& xml, const std::string& target);

} // namespace domain_xml
} // namespace cloudvm
