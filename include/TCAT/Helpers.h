// include/TCAT/Helpers.h
#ifndef TCAT_HELPERS_H
#define TCAT_HELPERS_H

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>

namespace TCAT {

class Helpers {
public:
    static std::string formatHexBytes(const std::vector<uint8_t>& bytes);

    /**
     * @brief Decode a NUL-terminated text field stored with byte-swapped quadlets
     * @return Text up to the terminator, or nullopt when no terminator is present
     */
    static std::optional<std::string> parseLabel(const uint8_t* raw, size_t size);

    /**
     * @brief Encode text into a byte-swapped field; the text must leave room for a terminator
     * @return false when the text does not fit
     */
    static bool buildLabel(const std::string& label, uint8_t* raw, size_t size);

    /**
     * @brief Decode a backslash-separated label list terminated by a double backslash
     */
    static std::vector<std::string> parseLabels(const uint8_t* raw, size_t size);

    /**
     * @brief Encode a label list; fails when labels plus separators overflow the field
     */
    static bool buildLabels(const std::vector<std::string>& labels, uint8_t* raw, size_t size);
};

} // namespace TCAT

#endif // TCAT_HELPERS_H
