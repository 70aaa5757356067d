// src/TCAT/StandaloneSection.cpp
#include "TCAT/StandaloneSection.hpp"
#include "TCAT/TcatDefines.hpp"
#include <spdlog/spdlog.h>

namespace TCAT {

StandaloneSection::StandaloneSection(RegisterIo& io, const ExtensionSections& sections, uint32_t timeoutMs)
    : io_(io),
      sections_(sections),
      timeoutMs_(timeoutMs)
{
}

std::expected<StandaloneParameters, ProtocolError> StandaloneSection::read()
{
    if (sections_.standalone.size < TCAT_STANDALONE_SIZE) {
        spdlog::error("Standalone section too small: {} bytes", sections_.standalone.size);
        return std::unexpected(makeError(ExtensionError::StandaloneSection));
    }

    auto raw = io_.readBlock(extensionOffset(sections_.standalone, 0), TCAT_STANDALONE_SIZE, timeoutMs_);
    if (!raw) {
        spdlog::error("Failed to read standalone parameters");
        return std::unexpected(makeTransportError(ExtensionError::StandaloneSection, raw.error()));
    }

    const uint8_t* data = raw->data();
    StandaloneParameters params;
    params.clockSource = readBe32(data);
    params.aes = readBe32(data + 4);
    params.adat = readBe32(data + 8);
    params.wordClock = readBe32(data + 12);
    params.internal = readBe32(data + 16);
    return params;
}

std::expected<void, ProtocolError> StandaloneSection::write(const StandaloneParameters& params)
{
    if (sections_.standalone.size < TCAT_STANDALONE_SIZE) {
        spdlog::error("Standalone section too small: {} bytes", sections_.standalone.size);
        return std::unexpected(makeError(ExtensionError::StandaloneSection));
    }

    std::vector<uint8_t> raw(TCAT_STANDALONE_SIZE);
    writeBe32(raw.data(), params.clockSource);
    writeBe32(raw.data() + 4, params.aes);
    writeBe32(raw.data() + 8, params.adat);
    writeBe32(raw.data() + 12, params.wordClock);
    writeBe32(raw.data() + 16, params.internal);

    auto res = io_.writeBlock(extensionOffset(sections_.standalone, 0), raw, timeoutMs_);
    if (!res) {
        spdlog::error("Failed to write standalone parameters");
        return std::unexpected(makeTransportError(ExtensionError::StandaloneSection, res.error()));
    }
    return {};
}

} // namespace TCAT
