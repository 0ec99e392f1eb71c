#include <usbshare/error.hpp>
#include <usbshare/parser.hpp>

#include <boost/spirit/include/qi.hpp>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <boost/regex.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace usbshare {

namespace {

// Error messages quote at most this much of the offending output.
const std::string::size_type kMaxQuoted = 200;

std::string excerpt (const std::string& text) {
    auto s = boost::algorithm::trim_copy(text);
    return s.size() > kMaxQuoted ? s.substr(0, kMaxQuoted) + "..." : s;
}

// Connected table row: BUSID VID:PID DEVICE STATE, where DEVICE may contain spaces and columns
// are padded to whatever width the tool chose. Older tools report "Not attached" for a shared
// device and append " - <client>" to "Attached".
const boost::regex& connectedRow () {
    static const boost::regex re{
        R"(^(\d+-\d+(?:\.\d+)*)\s+([[:xdigit:]]{4}:[[:xdigit:]]{4})\s+(.*\S)\s+)"
        R"((Not shared|Not attached|Shared|Attached)(\s+\(forced\))?(?:\s+-\s+(\S.*))?$)"};
    return re;
}

const boost::regex& persistedRow () {
    static const boost::regex re{
        R"(^([[:xdigit:]]{8}-[[:xdigit:]]{4}-[[:xdigit:]]{4}-[[:xdigit:]]{4}-[[:xdigit:]]{12}))"
        R"((?:\s+(\S.*))?$)"};
    return re;
}

// USB\VID_xxxx&PID_xxxx\serial
void applyInstanceId (UsbDevice& device, const std::string& instanceId) {
    static const boost::regex vidPid{R"(VID_([[:xdigit:]]{4})&PID_([[:xdigit:]]{4}))",
        boost::regex::icase};

    std::vector<std::string> parts;
    boost::split(parts, instanceId, [] (char c) { return c == '\\'; });

    boost::smatch m;
    if (parts.size() > 1 && boost::regex_search(parts[1], m, vidPid)) {
        device.hardwareId(boost::algorithm::to_lower_copy(m.str(1) + ":" + m.str(2)));
    }
    // Windows makes up an instance-specific id, containing ampersands, for devices without a
    // serial number. It changes on every reconnection so it is not reported.
    if (parts.size() > 2 && parts[2].size() && parts[2].find('&') == std::string::npos) {
        device.serial(parts[2]);
    }
}

// Rows describing the same device in different sections become one device.
void merge (DeviceList& devices, const UsbDevice& row) {
    for (auto& d : devices) {
        if (d.locator() == row.locator()) {
            d.bound(d.bound() || row.bound());
            d.attached(d.attached() || row.attached());
            d.persisted(d.persisted() || row.persisted());
            d.forced(d.forced() || row.forced());
            if (d.hardwareId().empty()) { d.hardwareId(row.hardwareId()); }
            if (d.description().empty()) { d.description(row.description()); }
            if (d.persistedGuid().empty()) { d.persistedGuid(row.persistedGuid()); }
            if (d.clientAddress().empty()) { d.clientAddress(row.clientAddress()); }
            return;
        }
    }
    devices.push_back(row);
}

} // <anonymous>

Version parseVersion (const std::string& text) {
    namespace qi = boost::spirit::qi;

    for (auto it = text.cbegin(); it != text.cend(); ++it) {
        auto c = static_cast<unsigned char>(*it);
        if (!std::isdigit(c)
            || (it != text.cbegin() && std::isdigit(static_cast<unsigned char>(*(it - 1))))) {
            continue;
        }
        auto first = it;
        auto v = Version{};
        if (qi::parse(first, text.cend(),
                qi::uint_ >> '.' >> qi::uint_ >> '.' >> qi::uint_,
                v.major, v.minor, v.patch)) {
            return v;
        }
    }
    throw ParseError{"Expected a major.minor.patch version", excerpt(text)};
}

ParseResult parseState (const std::string& json) {
    namespace pt = boost::property_tree;

    auto root = pt::ptree{};
    try {
        std::istringstream is{json};
        pt::read_json(is, root);
    }
    catch (const pt::json_parser_error& e) {
        throw ParseError{"Malformed device state (" + e.message() + ")", excerpt(json)};
    }

    // A ptree array has only unnamed children. JSON null or a string shows up as node data.
    auto rows = root.get_child_optional("Devices");
    auto isArray = rows && rows->data().empty()
        && std::all_of(rows->begin(), rows->end(), [] (const pt::ptree::value_type& child) {
            return child.first.empty();
        });
    if (!isArray) {
        throw ParseError{"Device state has no Devices array", excerpt(json)};
    }

    auto result = ParseResult{};
    auto index = 0;
    for (const auto& row : *rows) {
        const auto& node = row.second;
        // JSON null is read back as the string "null"
        auto text = [&node] (const char* key) {
            auto v = node.get_optional<std::string>(key);
            return !v || *v == "null" ? std::string{} : *v;
        };

        auto device = UsbDevice{};
        device.busId(text("BusId"));
        device.persistedGuid(text("PersistedGuid"));
        device.description(text("Description"));
        device.clientAddress(text("ClientIPAddress"));
        device.forced(node.get("IsForced", false));
        applyInstanceId(device, text("InstanceId"));

        device.persisted(!device.persistedGuid().empty());
        device.bound(device.connected() && device.persisted());
        device.attached(device.connected() && !device.clientAddress().empty());

        if (device.locator().empty()) {
            result.warnings.push_back("Device " + std::to_string(index)
                + " has neither a bus id nor a persisted GUID: '" + device.description() + "'");
        }
        else if (device.attached() && !device.bound()) {
            result.warnings.push_back("Device " + device.locator()
                + " is attached to " + device.clientAddress() + " but not shared");
        }
        else {
            merge(result.devices, device);
        }
        ++index;
    }
    return result;
}

ParseResult parseList (const std::string& table) {
    enum class Section { NONE, CONNECTED, PERSISTED };

    auto result = ParseResult{};
    auto section = Section::NONE;
    auto expectHeader = false;
    auto sawConnected = false;

    std::istringstream is{table};
    std::string line;
    while (std::getline(is, line)) {
        boost::algorithm::trim(line);
        if (line.empty()) {
            continue;
        }
        if (line == "Connected:") {
            section = Section::CONNECTED;
            expectHeader = sawConnected = true;
            continue;
        }
        if (line == "Persisted:") {
            section = Section::PERSISTED;
            expectHeader = true;
            continue;
        }
        if (expectHeader) {
            expectHeader = false;
            if (boost::algorithm::starts_with(line, "BUSID")
                || boost::algorithm::starts_with(line, "GUID")) {
                continue;
            }
        }

        boost::smatch m;
        auto device = UsbDevice{};
        if (section == Section::CONNECTED && boost::regex_match(line, m, connectedRow())) {
            device.busId(m.str(1));
            device.hardwareId(boost::algorithm::to_lower_copy(m.str(2)));
            device.description(m.str(3));
            auto state = m.str(4);
            device.bound(state != "Not shared");
            device.attached(state == "Attached");
            device.persisted(device.bound());
            device.forced(m[5].matched);
            if (m[6].matched) {
                device.clientAddress(m.str(6));
            }
            merge(result.devices, device);
        }
        else if (section == Section::PERSISTED && boost::regex_match(line, m, persistedRow())) {
            device.persistedGuid(m.str(1));
            device.description(m.str(2));
            device.persisted(true);
            merge(result.devices, device);
        }
        else {
            result.warnings.push_back("Unrecognized device row: '" + line + "'");
        }
    }

    if (!sawConnected) {
        throw ParseError{"Device list has no Connected section", excerpt(table)};
    }
    return result;
}

} // namespace usbshare
