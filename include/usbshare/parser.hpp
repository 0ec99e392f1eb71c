#ifndef USBSHARE_PARSER_HPP
#define USBSHARE_PARSER_HPP

#include <usbshare/devices.hpp>
#include <usbshare/version.hpp>

#include <string>
#include <vector>

namespace usbshare {

struct ParseResult {
    DeviceList devices;
    std::vector<std::string> warnings;
    // One entry per dropped row.
};

Version parseVersion (const std::string& text);
// Extract the first major.minor.patch group in `text`. Throws ParseError if there is none.

ParseResult parseState (const std::string& json);
// Parse the JSON document printed by `usbipd state`. Throws ParseError if the document is not
// JSON or has no device array.

ParseResult parseList (const std::string& table);
// Parse the Connected/Persisted tables printed by `usbipd list`. Throws ParseError if there is
// no Connected section.

} // namespace usbshare

#endif
