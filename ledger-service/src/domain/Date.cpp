#include "domain/Date.hpp"

#include <cctype>
#include <cstdio>
#include <vector>

namespace ledger::domain {

namespace {

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::vector<std::string> splitBy(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == sep) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::optional<Date> Date::parse(const std::string& raw) {
    std::string text = trim(raw);

    // Компактный YYYYMMDD
    if (text.size() == 8 && allDigits(text)) {
        int y = std::stoi(text.substr(0, 4));
        int m = std::stoi(text.substr(4, 2));
        int d = std::stoi(text.substr(6, 2));
        if (!isValid(y, m, d)) return std::nullopt;
        return Date(y, m, d);
    }

    char separator = 0;
    for (char c : {'-', '/', '.'}) {
        if (text.find(c) != std::string::npos) {
            separator = c;
            break;
        }
    }
    if (separator == 0) return std::nullopt;

    auto parts = splitBy(text, separator);
    if (parts.size() != 3) return std::nullopt;
    for (const auto& p : parts) {
        if (!allDigits(p) || p.size() > 4) return std::nullopt;
    }

    int y, m, d;
    if (parts[0].size() == 4) {
        y = std::stoi(parts[0]);
        m = std::stoi(parts[1]);
        d = std::stoi(parts[2]);
    } else if (parts[2].size() == 4 && separator != '.') {
        d = std::stoi(parts[0]);
        m = std::stoi(parts[1]);
        y = std::stoi(parts[2]);
    } else {
        return std::nullopt;
    }

    if (parts[1].size() > 2 || (parts[0].size() != 4 && parts[0].size() > 2)) {
        return std::nullopt;
    }
    if (!isValid(y, m, d)) return std::nullopt;
    return Date(y, m, d);
}

std::string Date::toString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

} // namespace ledger::domain
