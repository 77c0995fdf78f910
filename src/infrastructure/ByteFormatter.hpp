// ByteFormatter Header
#pragma once
#include <cstdint>
#include <string>

namespace nodewastage::infrastructure {

class ByteFormatter {
public:
    /**
     * @brief Human-readable size in SI units ("0 B", "1.0 kB", "340 MB").
     */
    static std::string Humanize(std::uint64_t bytes);
};

} // namespace nodewastage::infrastructure
