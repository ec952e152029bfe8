#include "nestar/index_list.hpp"

#include <sstream>

namespace nestar {

namespace {

bool next_line(std::istringstream& in, std::string& line) {
    if (!std::getline(in, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

} // namespace

IndexParseResult parse_index_list(const std::string& text) {
    IndexParseResult result;
    std::istringstream in(text);
    std::string line;

    if (!next_line(in, line)) {
        result.error = "empty index document";
        return result;
    }
    if (line != INDEX_VERSION_LINE) {
        result.warnings.push_back("unrecognized index version line: " + line);
        result.ok = true;
        return result;
    }

    // Blank line after the version header
    if (next_line(in, line) && !line.empty()) {
        result.warnings.push_back("expected blank line after index version");
    }

    // Blocks: locator line, then prefixes until a blank line
    while (next_line(in, line)) {
        if (line.empty()) {
            break;  // an empty block terminates the document
        }

        std::string locator = line;
        if (locator == INDEX_CURRENT_ARCHIVE) {
            locator.clear();
        } else {
            locator += '/';
        }

        while (next_line(in, line) && !line.empty()) {
            std::string prefix = line;
            if (!prefix.empty() && prefix[0] == '/') {
                prefix.erase(0, 1);
            }
            result.mappings.push_back({locator, prefix});
        }
    }

    result.ok = true;
    return result;
}

} // namespace nestar
