#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace duelnet::core::cfg {

struct KeyValueLine final {
    std::string key;
    std::string value;
    int line_number = 0;
};

bool ParseFile(
    const std::filesystem::path& file_path,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error);

bool ParseText(
    std::string_view text,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error);

std::string Trim(std::string_view text);

bool ParseQuotedString(std::string_view value, std::string& out_text);
bool ParseBool(std::string_view value, bool& out_value);
bool ParseInt(std::string_view value, int& out_value);
bool ParseIntInRange(std::string_view value, int min_value, int max_value, int& out_value);
bool ParsePort(std::string_view value, std::uint16_t& out_port);

}  // namespace duelnet::core::cfg
