// src/TCAT/Helpers.cpp
#include "TCAT/Helpers.h"
#include "TCAT/RegisterIo.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cstring>

namespace TCAT {

std::string Helpers::formatHexBytes(const std::vector<uint8_t>& bytes)
{
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (const auto& byte : bytes) {
        oss << "0x" << std::setw(2) << static_cast<int>(byte) << " ";
    }
    return oss.str();
}

std::optional<std::string> Helpers::parseLabel(const uint8_t* raw, size_t size)
{
    std::vector<uint8_t> data(raw, raw + size);
    swapQuadletBytes(data.data(), data.size());

    auto end = std::find(data.begin(), data.end(), 0);
    if (end == data.end())
        return std::nullopt;
    return std::string(data.begin(), end);
}

bool Helpers::buildLabel(const std::string& label, uint8_t* raw, size_t size)
{
    if (label.size() >= size)
        return false;

    std::memset(raw, 0, size);
    std::memcpy(raw, label.data(), label.size());
    swapQuadletBytes(raw, size);
    return true;
}

std::vector<std::string> Helpers::parseLabels(const uint8_t* raw, size_t size)
{
    std::vector<uint8_t> data(raw, raw + size);
    swapQuadletBytes(data.data(), data.size());

    // A double backslash terminates the list, i.e. the first empty chunk
    std::vector<std::string> labels;
    std::string current;
    for (uint8_t byte : data) {
        if (byte == '\\') {
            if (current.empty())
                break;
            labels.push_back(current);
            current.clear();
        } else if (byte == 0) {
            break;
        } else {
            current.push_back(static_cast<char>(byte));
        }
    }
    if (!current.empty())
        labels.push_back(current);
    return labels;
}

bool Helpers::buildLabels(const std::vector<std::string>& labels, uint8_t* raw, size_t size)
{
    std::memset(raw, 0, size);

    size_t pos = 0;
    for (const auto& label : labels) {
        if (pos + label.size() + 1 >= size)
            return false;
        std::memcpy(raw + pos, label.data(), label.size());
        pos += label.size();
        raw[pos++] = '\\';
    }
    if (pos + 1 >= size)
        return false;
    raw[pos] = '\\';

    swapQuadletBytes(raw, size);
    return true;
}

} // namespace TCAT
