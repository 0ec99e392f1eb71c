#include <usbshare/hotplug.hpp>
#include <usbshare/log.hpp>

#include <boost/spirit/include/phoenix_operator.hpp>
#include <boost/spirit/include/phoenix_fusion.hpp>
#include <boost/spirit/include/phoenix_stl.hpp>
#include <boost/spirit/include/qi.hpp>

#include <boost/fusion/adapted.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/find_format.hpp>
#include <boost/algorithm/string/regex_find_format.hpp>
#include <boost/algorithm/hex.hpp>

#include <boost/regex.hpp>

#include <map>
#include <string>

namespace usbshare {

namespace {
namespace qi = boost::spirit::qi;

template <class Iter>
struct UdevadmGrammar : qi::grammar<Iter, std::map<std::string, std::string>()> {
    qi::rule<Iter, std::map<std::string, std::string>()> start;
    qi::rule<Iter> nonProperty;
    qi::rule<Iter, std::pair<std::string, std::string>()> property;
    qi::rule<Iter, std::string()> key;
    qi::rule<Iter, std::string()> value;

    UdevadmGrammar () : UdevadmGrammar::base_type(start, "udevadm") {
        using qi::_1;
        using qi::_val;
        using boost::phoenix::at_c;
        using boost::phoenix::insert;

        start.name("start");
        start = *(property[insert(_val, _1)] | nonProperty)
            >> qi::eol
            > qi::eoi;

        nonProperty.name("nonProperty");
        nonProperty = +(qi::char_ - qi::eol) >> qi::eol;

        property.name("property");
        property %= key >> '=' >> value >> qi::eol;

        key.name("key");
        key %= +(qi::char_ - qi::eol - '=');

        value.name("value");
        value %= +(qi::char_ - qi::eol);

        using ErrorHandlerArgs = boost::fusion::vector<
            Iter&, const Iter&, const Iter&, const qi::info&>;

        auto logError = [](ErrorHandlerArgs args, auto&, qi::error_handler_result&) {
            log::Logger lg;
            BOOST_LOG_SEV(lg, log::debug) << "Expected '" << at_c<3>(args) << "' here: '"
                << std::string(at_c<2>(args), at_c<1>(args)) << "'";
        };

        qi::on_error<qi::fail>(start, logError);
    }
};

std::string decodeModelString (std::string input) {
    // udev encodes some characters, such as spaces, to an escaped character sequence of the form
    // `\xhh` where `h` is a hexadecimal digit. Decode all such instances.
    boost::algorithm::find_format_all(
        input,
        boost::algorithm::regex_finder(boost::regex(R"(\\x[0-9a-fA-F]{2})")),
        [](const auto& result) {
            char c;
            // The regex only matches 4-character substrings, so the latter two characters always
            // decode to a single char.
            boost::algorithm::unhex(result.begin() + 2, result.end(), &c);
            return std::string{c};
        }
    );
    return input;
}

std::string value (const std::map<std::string, std::string>& properties, const std::string& key) {
    auto it = properties.find(key);
    return it == properties.end() ? std::string{} : it->second;
}

} // <anonymous>

bool parseUdevadm (const std::string& block, HotplugEvent& event) {
    auto properties = std::map<std::string, std::string>{};
    auto begin = block.cbegin();
    UdevadmGrammar<std::string::const_iterator> grammar;
    auto success = qi::parse(begin, block.cend(), grammar, properties);

    // Interfaces of a device come through the usb subsystem too; only whole devices matter.
    if (!success || properties.empty() || value(properties, "DEVTYPE") != "usb_device") {
        return false;
    }

    auto action = value(properties, "ACTION");
    if (action == "add") {
        event.type = HotplugEvent::ADD;
    }
    else if (action == "remove") {
        event.type = HotplugEvent::REMOVE;
    }
    else {
        return false;
    }

    event.path = value(properties, "DEVPATH");
    auto vendor = value(properties, "ID_VENDOR_ID");
    auto model = value(properties, "ID_MODEL_ID");
    event.hardwareId = vendor.size() && model.size()
        ? boost::algorithm::to_lower_copy(vendor + ":" + model)
        : std::string{};
    event.description = decodeModelString(value(properties, "ID_MODEL_ENC"));
    return true;
}

} // namespace usbshare
