#include "core/cfg_parser.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace duelnet::core::cfg {
namespace {

std::string StripComment(std::string line) {
    bool in_quotes = false;
    for (std::string::size_type index = 0; index < line.size(); ++index) {
        if (line[index] == '"') {
            in_quotes = !in_quotes;
            continue;
        }
        if (line[index] == '#' && !in_quotes) {
            line.erase(index);
            break;
        }
    }
    return line;
}

bool ParseStream(
    std::istream& stream,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error) {
    out_lines.clear();

    std::string line;
    int line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        line = Trim(StripComment(std::move(line)));
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            continue;
        }

        const std::string::size_type equal_pos = line.find('=');
        if (equal_pos == std::string::npos) {
            out_error = "Invalid config line (missing '='): line " + std::to_string(line_number);
            return false;
        }

        KeyValueLine parsed{};
        parsed.key = Trim(std::string_view(line).substr(0, equal_pos));
        parsed.value = Trim(std::string_view(line).substr(equal_pos + 1));
        parsed.line_number = line_number;
        if (parsed.key.empty()) {
            out_error = "Invalid config line (empty key): line " + std::to_string(line_number);
            return false;
        }

        out_lines.push_back(std::move(parsed));
    }

    out_error.clear();
    return true;
}

}  // namespace

std::string Trim(std::string_view text) {
    auto is_space = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };

    std::size_t start = 0;
    while (start < text.size() && is_space(text[start])) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && is_space(text[end - 1])) {
        --end;
    }

    return std::string(text.substr(start, end - start));
}

bool ParseFile(
    const std::filesystem::path& file_path,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        out_error = "Cannot open config file: " + file_path.string();
        return false;
    }

    return ParseStream(file, out_lines, out_error);
}

bool ParseText(
    std::string_view text,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error) {
    std::istringstream stream{std::string(text)};
    return ParseStream(stream, out_lines, out_error);
}

bool ParseBool(std::string_view value, bool& out_value) {
    const std::string trimmed = Trim(value);
    if (trimmed == "true") {
        out_value = true;
        return true;
    }
    if (trimmed == "false") {
        out_value = false;
        return true;
    }
    return false;
}

bool ParseInt(std::string_view value, int& out_value) {
    const std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        return false;
    }

    int parsed = 0;
    const char* begin = trimmed.data();
    const char* end = trimmed.data() + trimmed.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end) {
        return false;
    }

    out_value = parsed;
    return true;
}

bool ParseIntInRange(std::string_view value, int min_value, int max_value, int& out_value) {
    int parsed = 0;
    if (!ParseInt(value, parsed)) {
        return false;
    }
    if (parsed < min_value || parsed > max_value) {
        return false;
    }

    out_value = parsed;
    return true;
}

bool ParsePort(std::string_view value, std::uint16_t& out_port) {
    int parsed = 0;
    if (!ParseIntInRange(value, 0, 65535, parsed)) {
        return false;
    }

    out_port = static_cast<std::uint16_t>(parsed);
    return true;
}

bool ParseQuotedString(std::string_view value, std::string& out_text) {
    const std::string trimmed = Trim(value);
    if (trimmed.size() < 2 || trimmed.front() != '"' || trimmed.back() != '"') {
        return false;
    }
    out_text = trimmed.substr(1, trimmed.size() - 2);
    return true;
}

}  // namespace duelnet::core::cfg
