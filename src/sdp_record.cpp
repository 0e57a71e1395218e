#include "sdp_record.hpp"

#include "hid_report.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>

namespace {

constexpr uint16_t kHidServiceClass = 0x1124;
constexpr uint16_t kL2capUuid = 0x0100;
constexpr uint16_t kHidpUuid = 0x0011;
constexpr uint16_t kPublicBrowseGroup = 0x1002;
constexpr uint16_t kHidProfileVersion = 0x0100;
constexpr uint8_t kReportDescriptorType = 0x22;
constexpr uint8_t kPointingDeviceSubclass = 0x80;

std::string hex(unsigned value, int width)
{
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(width) << std::setfill('0') << value;
    return oss.str();
}

std::string escapeXml(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&':
            out.append("&amp;");
            break;
        case '<':
            out.append("&lt;");
            break;
        case '>':
            out.append("&gt;");
            break;
        case '"':
            out.append("&quot;");
            break;
        default:
            out.push_back(ch);
            break;
        }
    }
    return out;
}

std::string descriptorHex()
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : kMouseReportDescriptor) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

class RecordWriter {
public:
    RecordWriter& open(const std::string& tag)
    {
        indent();
        out_ << "<" << tag << ">\n";
        ++depth_;
        return *this;
    }

    RecordWriter& close(const std::string& tag)
    {
        --depth_;
        indent();
        out_ << "</" << tag << ">\n";
        return *this;
    }

    RecordWriter& attribute(uint16_t id)
    {
        indent();
        out_ << "<attribute id=\"" << hex(id, 4) << "\">\n";
        ++depth_;
        return *this;
    }

    RecordWriter& value(const std::string& type, const std::string& value)
    {
        indent();
        out_ << "<" << type << " value=\"" << value << "\"/>\n";
        return *this;
    }

    RecordWriter& hexText(const std::string& value)
    {
        indent();
        out_ << "<text encoding=\"hex\" value=\"" << value << "\"/>\n";
        return *this;
    }

    std::string str() const { return out_.str(); }

private:
    void indent()
    {
        for (int i = 0; i < depth_; ++i) {
            out_ << "  ";
        }
    }

    std::ostringstream out_;
    int depth_{0};
};

void protocolDescriptor(RecordWriter& writer, uint16_t psm)
{
    writer.open("sequence");
    writer.open("sequence").value("uuid", hex(kL2capUuid, 4)).value("uint16", hex(psm, 4)).close("sequence");
    writer.open("sequence").value("uuid", hex(kHidpUuid, 4)).close("sequence");
    writer.close("sequence");
}

void boolAttribute(RecordWriter& writer, uint16_t id, bool value)
{
    writer.attribute(id).value("boolean", value ? "true" : "false").close("attribute");
}

} // namespace

std::string buildSdpRecord(const ServiceIdentity& identity, const DeviceConfig& device, const TransportConfig& transport)
{
    RecordWriter writer;
    writer.open("record");

    // service class: the HID class followed by this instance's UUID
    writer.attribute(0x0001).open("sequence");
    writer.value("uuid", hex(kHidServiceClass, 4)).value("uuid", identity.serviceUuid);
    writer.close("sequence").close("attribute");

    writer.attribute(0x0004);
    protocolDescriptor(writer, transport.controlPsm);
    writer.close("attribute");

    writer.attribute(0x0005).open("sequence").value("uuid", hex(kPublicBrowseGroup, 4)).close("sequence").close("attribute");

    writer.attribute(0x0006).open("sequence");
    writer.value("uint16", hex(0x656e, 4)).value("uint16", hex(0x006a, 4)).value("uint16", hex(0x0100, 4));
    writer.close("sequence").close("attribute");

    writer.attribute(0x0009).open("sequence").open("sequence");
    writer.value("uuid", hex(kHidServiceClass, 4)).value("uint16", hex(kHidProfileVersion, 4));
    writer.close("sequence").close("sequence").close("attribute");

    writer.attribute(0x000d).open("sequence");
    protocolDescriptor(writer, transport.interruptPsm);
    writer.close("sequence").close("attribute");

    writer.attribute(0x0100).value("text", escapeXml(device.deviceName)).close("attribute");
    writer.attribute(0x0101).value("text", escapeXml(device.description)).close("attribute");
    writer.attribute(0x0102).value("text", escapeXml(device.provider)).close("attribute");

    writer.attribute(0x0200).value("uint16", hex(0x0100, 4)).close("attribute"); // device release number
    writer.attribute(0x0201).value("uint16", hex(0x0111, 4)).close("attribute"); // parser version
    writer.attribute(0x0202).value("uint8", hex(kPointingDeviceSubclass, 2)).close("attribute");
    writer.attribute(0x0203).value("uint8", hex(0x00, 2)).close("attribute"); // country code
    boolAttribute(writer, 0x0204, true);  // virtual cable
    boolAttribute(writer, 0x0205, true);  // reconnect initiate

    writer.attribute(0x0206).open("sequence").open("sequence");
    writer.value("uint8", hex(kReportDescriptorType, 2)).hexText(descriptorHex());
    writer.close("sequence").close("sequence").close("attribute");

    writer.attribute(0x0207).open("sequence").open("sequence");
    writer.value("uint16", hex(0x0409, 4)).value("uint16", hex(0x0100, 4));
    writer.close("sequence").close("sequence").close("attribute");

    boolAttribute(writer, 0x0209, true);  // battery power
    boolAttribute(writer, 0x020a, true);  // remote wakeup
    writer.attribute(0x020b).value("uint16", hex(kHidProfileVersion, 4)).close("attribute");
    writer.attribute(0x020c).value("uint16", hex(0x0c80, 4)).close("attribute"); // supervision timeout
    boolAttribute(writer, 0x020d, false); // normally connectable
    boolAttribute(writer, 0x020e, true);  // boot device

    writer.close("record");
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n" + writer.str();
}
