#include "installer/release_parser.hpp"

#include <nlohmann/json.hpp>

namespace wdi {

using json = nlohmann::json;

std::expected<std::string, std::string> ParseLatestReleaseTag(const std::string& json_input) {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        auto it = j.find("tag_name");
        if (it == j.end() || !it->is_string()) {
            return std::unexpected("'tag_name' missing or not a string");
        }
        std::string tag = it->get<std::string>();
        if (tag.empty()) {
            return std::unexpected("'tag_name' is empty");
        }
        return tag;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

} // namespace wdi
