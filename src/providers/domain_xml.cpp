#include "providers/domain_xml.hpp"
#include <algorithm>
#include <cctype>
#include <libxml/parser.h>
#include <libxml/xmlwriter.h>
#include <libxml/xpath.h>
#include <memory>
#include <stdexcept>

namespace cloudvm {
namespace domain_xml {

const char* const METADATA_NS = "http://cloudvm.dev/xmlns/domain/1.0";

namespace {

const xmlChar* X(const std::string& s) {
    return reinterpret_cast<const xmlChar*>(s.c_str());
}

/**
 * XmlWriter - Thin wrapper over an xmlTextWriter writing to memory
 */
class XmlWriter {
public:
    XmlWriter() : buffer_(xmlBufferCreate()) {
        if (!buffer_) {
            throw std::runtime_error("xml: cannot allocate buffer");
        }
        writer_ = xmlNewTextWriterMemory(buffer_, 0);
        if (!writer_) {
            xmlBufferFree(buffer_);
            throw std::runtime_error("xml: cannot create writer");
        }
        xmlTextWriterSetIndent(writer_, 1);
        xmlTextWriterSetIndentString(writer_, X("  "));
    }

    ~XmlWriter() {
        if (writer_) xmlFreeTextWriter(writer_);
        if (buffer_) xmlBufferFree(buffer_);
    }

    XmlWriter(const XmlWriter&) = delete;
    XmlWriter& operator=(const XmlWriter&) = delete;

    XmlWriter& start(const std::string& name) {
        check(xmlTextWriterStartElement(writer_, X(name)), name);
        return *this;
    }

    XmlWriter& start_ns(const std::string& prefix, const std::string& name,
                        const std::string& ns_uri) {
        check(xmlTextWriterStartElementNS(writer_, X(prefix), X(name),
                                          ns_uri.empty() ? nullptr : X(ns_uri)),
              name);
        return *this;
    }

    XmlWriter& attr(const std::string& key, const std::string& value) {
        check(xmlTextWriterWriteAttribute(writer_, X(key), X(value)), key);
        return *this;
    }

    XmlWriter& text(const std::string& value) {
        check(xmlTextWriterWriteString(writer_, X(value)), "text");
        return *this;
    }

    XmlWriter& element(const std::string& name, const std::string& value) {
        check(xmlTextWriterWriteElement(writer_, X(name), X(value)), name);
        return *this;
    }

    XmlWriter& end() {
        check(xmlTextWriterEndElement(writer_), "end");
        return *this;
    }

    std::string str() {
        check(xmlTextWriterFlush(writer_), "flush");
        const xmlChar* content = xmlBufferContent(buffer_);
        return content ? std::string(reinterpret_cast<const char*>(content)) : "";
    }

private:
    static void check(int rc, const std::string& what) {
        if (rc < 0) {
            throw std::runtime_error("xml: failed writing " + what);
        }
    }

    xmlBufferPtr buffer_ = nullptr;
    xmlTextWriterPtr writer_ = nullptr;
};

struct DocDeleter {
    void operator()(xmlDocPtr doc) const { xmlFreeDoc(doc); }
};
struct XPathContextDeleter {
    void operator()(xmlXPathContextPtr ctx) const { xmlXPathFreeContext(ctx); }
};
struct XPathObjectDeleter {
    void operator()(xmlXPathObjectPtr obj) const { xmlXPathFreeObject(obj); }
};

// Evaluate an XPath string() expression against a document
std::optional<std::string> xpath_string(const std::string& xml, const std::string& expr) {
    std::unique_ptr<xmlDoc, DocDeleter> doc(
        xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "domain.xml", nullptr,
                      XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        return std::nullopt;
    }

    std::unique_ptr<xmlXPathContext, XPathContextDeleter> ctx(xmlXPathNewContext(doc.get()));
    if (!ctx) {
        return std::nullopt;
    }

    std::unique_ptr<xmlXPathObject, XPathObjectDeleter> result(
        xmlXPathEvalExpression(X(expr), ctx.get()));
    if (!result || result->type != XPATH_STRING || !result->stringval) {
        return std::nullopt;
    }

    std::string value(reinterpret_cast<const char*>(result->stringval));
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

void write_disk(XmlWriter& w, const DiskDevice& disk) {
    w.start("disk")
        .attr("type", "file")
        .attr("device", disk.cdrom ? "cdrom" : "disk");

    w.start("driver").attr("name", "qemu").attr("type", disk.format);
    if (!disk.cache.empty()) {
        w.attr("cache", disk.cache);
    }
    w.end();

    if (!disk.path.empty()) {
        w.start("source").attr("file", disk.path).end();
    }
    w.start("target").attr("dev", disk.target).attr("bus", disk.bus).end();
    if (disk.cdrom) {
        w.start("readonly").end();
    }
    w.end();  // disk
}

void write_cpu(XmlWriter& w, const std::string& cpu_model) {
    w.start("cpu");
    if (cpu_model == "host-passthrough" || cpu_model == "host-model") {
        w.attr("mode", cpu_model);
    } else {
        w.attr("mode", "custom").attr("match", "exact");
        w.start("model").attr("fallback", "allow").text(cpu_model).end();
    }
    w.end();
}

}  // anonymous namespace

std::string build_domain(const DomainDefinition& def) {
    XmlWriter w;

    w.start("domain").attr("type", def.virt_type);
    w.element("name", def.name);

    // OS hints, kept where tools such as virt-manager ignore them safely
    w.start("metadata");
    w.start_ns("cloudvm", "instance", METADATA_NS);
    w.start_ns("cloudvm", "os", "")
        .attr("type", def.os_type)
        .attr("variant", def.os_variant)
        .end();
    w.end();  // instance
    w.end();  // metadata

    w.start("memory").attr("unit", "MiB").text(std::to_string(def.memory_mb)).end();
    w.element("vcpu", std::to_string(def.vcpus));

    w.start("os");
    w.start("type").attr("arch", "x86_64").text("hvm").end();
    w.start("boot").attr("dev", "hd").end();
    w.end();

    w.start("features");
    w.start("acpi").end();
    w.start("apic").end();
    w.end();

    write_cpu(w, def.cpu_model);

    w.element("on_poweroff", "destroy");
    w.element("on_reboot", "restart");
    w.element("on_crash", "destroy");

    w.start("devices");
    for (const auto& disk : def.disks) {
        write_disk(w, disk);
    }

    w.start("interface").attr("type", "bridge");
    w.start("source").attr("bridge", def.network.bridge).end();
    if (!def.network.mac_address.empty()) {
        w.start("mac").attr("address", def.network.mac_address).end();
    }
    w.start("model").attr("type", def.network.model).end();
    w.end();  // interface

    w.start("serial").attr("type", "pty").end();
    w.start("console").attr("type", "pty").end();

    if (!def.graphics.empty() && def.graphics != "none") {
        w.start("graphics").attr("type", def.graphics).attr("autoport", "yes").end();
        w.start("video");
        w.start("model").attr("type", "virtio").end();
        w.end();
    }
    w.end();  // devices

    w.end();  // domain
    return w.str();
}

std::string build_disk(const DiskDevice& disk) {
    XmlWriter w;
    write_disk(w, disk);
    return w.str();
}

std::string build_empty_cdrom(const std::string& target, const std::string& bus) {
    DiskDevice cdrom;
    cdrom.cdrom = true;
    cdrom.format = "raw";
    cdrom.target = target;
    cdrom.bus = bus;
    return build_disk(cdrom);
}

std::string build_dir_pool(const std::string& name, const std::string& target_dir) {
    XmlWriter w;
    w.start("pool").attr("type", "dir");
    w.element("name", name);
    w.start("target");
    w.element("path", target_dir);
    w.end();
    w.end();
    return w.str();
}

std::optional<std::string> find_mac_address(const std::string& xml) {
    auto mac = xpath_string(xml, "string(/domain/devices/interface[1]/mac/@address)");
    if (!mac) {
        return std::nullopt;
    }
    std::string lower = *mac;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::optional<std::string> find_cdrom_bus(const std::string& xml, const std::string& target) {
    return xpath_string(xml,
                        "string(/domain/devices/disk[@device='cdrom'][target/@dev='" +
                        target + "']/target/@bus)");
}

} // namespace domain_xml
} // namespace cloudvm
